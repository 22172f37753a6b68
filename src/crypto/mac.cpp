#include "paramvault/crypto/mac.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>

namespace paramvault::crypto {

common::Result<Bytes> blake2b_mac(const SecretKey &key, const std::string &message,
                                  const std::size_t digest_size) {
  EVP_MAC *mac = EVP_MAC_fetch(nullptr, "BLAKE2BMAC", nullptr);
  if (mac == nullptr) {
    return common::Result<Bytes>::failure("BLAKE2b MAC is not available in this OpenSSL build");
  }
  EVP_MAC_CTX *ctx = EVP_MAC_CTX_new(mac);
  EVP_MAC_free(mac);
  if (ctx == nullptr) {
    return common::Result<Bytes>::failure("Failed to create MAC context");
  }

  std::size_t size = digest_size;
  OSSL_PARAM params[] = {
      OSSL_PARAM_construct_size_t(OSSL_MAC_PARAM_SIZE, &size),
      OSSL_PARAM_construct_end(),
  };

  Bytes out(digest_size);
  std::size_t out_len = 0;
  const bool ok =
      EVP_MAC_init(ctx, key.data(), key.size(), params) == 1 &&
      EVP_MAC_update(ctx, reinterpret_cast<const unsigned char *>(message.data()), message.size()) ==
          1 &&
      EVP_MAC_final(ctx, out.data(), &out_len, out.size()) == 1;
  EVP_MAC_CTX_free(ctx);
  if (!ok || out_len != digest_size) {
    return common::Result<Bytes>::failure("BLAKE2b MAC computation failed");
  }
  return common::Result<Bytes>::success(std::move(out));
}

} // namespace paramvault::crypto
