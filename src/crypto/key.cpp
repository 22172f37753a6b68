#include "paramvault/crypto/key.hpp"

#include <openssl/crypto.h>

namespace paramvault::crypto {

void wipe(SecretKey &key) { OPENSSL_cleanse(key.data(), key.size()); }

void wipe(Bytes &bytes) {
  if (!bytes.empty()) {
    OPENSSL_cleanse(bytes.data(), bytes.size());
  }
  bytes.clear();
}

void wipe(std::string &text) {
  if (!text.empty()) {
    OPENSSL_cleanse(text.data(), text.size());
  }
  text.clear();
}

Bytes to_bytes(const std::string &text) { return Bytes(text.begin(), text.end()); }

std::string to_string(const Bytes &bytes) {
  return std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size());
}

} // namespace paramvault::crypto
