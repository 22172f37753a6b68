#include "paramvault/crypto/random.hpp"

#include <openssl/rand.h>

namespace paramvault::crypto {

common::Result<Bytes> random_bytes(const std::size_t count) {
  Bytes out(count);
  if (count > 0 && RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    return common::Result<Bytes>::failure("system random generator failed");
  }
  return common::Result<Bytes>::success(std::move(out));
}

common::Result<SecretKey> generate_key() {
  SecretKey key{};
  if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
    return common::Result<SecretKey>::failure("system random generator failed");
  }
  return common::Result<SecretKey>::success(key);
}

} // namespace paramvault::crypto
