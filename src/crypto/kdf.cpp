#include "paramvault/crypto/kdf.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

namespace paramvault::crypto {

namespace {

constexpr std::uint64_t MAXMEM_SLACK = 1ULL << 20U;

// Parameter names of the OpenSSL 3.2 ARGON2 KDFs.
constexpr const char *ARGON2_LANES = "lanes";
constexpr const char *ARGON2_MEMCOST = "memcost";
constexpr std::uint32_t ARGON2_LANE_COUNT = 1;

// OSSL_PARAM needs a valid pointer even for an empty password or salt.
unsigned char *octets(const Bytes &bytes) {
  static unsigned char empty = 0;
  return bytes.empty() ? &empty : const_cast<unsigned char *>(bytes.data());
}

common::Result<SecretKey> run_kdf(const char *name, OSSL_PARAM *params) {
  EVP_KDF *kdf = EVP_KDF_fetch(nullptr, name, nullptr);
  if (kdf == nullptr) {
    return common::Result<SecretKey>::failure(std::string(name) +
                                              " is not available in this OpenSSL build");
  }
  EVP_KDF_CTX *ctx = EVP_KDF_CTX_new(kdf);
  EVP_KDF_free(kdf);
  if (ctx == nullptr) {
    return common::Result<SecretKey>::failure("Failed to create KDF context");
  }

  SecretKey key{};
  const int rc = EVP_KDF_derive(ctx, key.data(), key.size(), params);
  EVP_KDF_CTX_free(ctx);
  if (rc != 1) {
    wipe(key);
    return common::Result<SecretKey>::failure(std::string(name) + " derivation failed");
  }
  return common::Result<SecretKey>::success(key);
}

common::Result<SecretKey> scrypt_derive(const Bytes &secret, const Bytes &salt,
                                        const KdfParams &params) {
  std::uint64_t n = 1ULL << params.memory_cost;
  std::uint32_t r = params.block_size;
  std::uint32_t p = params.time_cost;
  // OpenSSL refuses to run when 128*r*(N+2) + 128*r*p exceeds maxmem.
  std::uint64_t maxmem = 128ULL * r * (n + 2) + 128ULL * r * p + MAXMEM_SLACK;

  OSSL_PARAM ossl_params[] = {
      OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, octets(secret), secret.size()),
      OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, octets(salt), salt.size()),
      OSSL_PARAM_construct_uint64(OSSL_KDF_PARAM_SCRYPT_N, &n),
      OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_SCRYPT_R, &r),
      OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_SCRYPT_P, &p),
      OSSL_PARAM_construct_uint64(OSSL_KDF_PARAM_SCRYPT_MAXMEM, &maxmem),
      OSSL_PARAM_construct_end(),
  };
  return run_kdf("SCRYPT", ossl_params);
}

common::Result<SecretKey> argon2id_derive(const Bytes &secret, const Bytes &salt,
                                          const KdfParams &params) {
  std::uint32_t passes = params.time_cost;
  std::uint32_t memory_kib = 1U << params.memory_cost;
  std::uint32_t lanes = ARGON2_LANE_COUNT;

  OSSL_PARAM ossl_params[] = {
      OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, octets(secret), secret.size()),
      OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, octets(salt), salt.size()),
      OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &passes),
      OSSL_PARAM_construct_uint32(ARGON2_MEMCOST, &memory_kib),
      OSSL_PARAM_construct_uint32(ARGON2_LANES, &lanes),
      OSSL_PARAM_construct_end(),
  };
  return run_kdf("ARGON2ID", ossl_params);
}

} // namespace

std::string_view kdf_algorithm_name(const KdfAlgorithm algorithm) {
  switch (algorithm) {
  case KdfAlgorithm::Argon2id:
    return "argon2id";
  case KdfAlgorithm::Scrypt:
    return "scrypt";
  }
  return "unknown";
}

std::optional<KdfAlgorithm> parse_kdf_algorithm(const std::string_view name) {
  if (name == "argon2id") {
    return KdfAlgorithm::Argon2id;
  }
  if (name == "scrypt") {
    return KdfAlgorithm::Scrypt;
  }
  return std::nullopt;
}

bool argon2id_available() {
  static const bool available = [] {
    EVP_KDF *kdf = EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr);
    const bool found = kdf != nullptr;
    EVP_KDF_free(kdf);
    return found;
  }();
  return available;
}

KdfAlgorithm default_kdf_algorithm() {
  return argon2id_available() ? KdfAlgorithm::Argon2id : KdfAlgorithm::Scrypt;
}

KdfParams sensitive_params(const KdfAlgorithm algorithm) {
  if (algorithm == KdfAlgorithm::Argon2id) {
    return KdfParams{.algorithm = algorithm, .memory_cost = 20, .time_cost = 4, .block_size = 8};
  }
  return KdfParams{.algorithm = algorithm, .memory_cost = 20, .time_cost = 1, .block_size = 8};
}

KdfParams interactive_params(const KdfAlgorithm algorithm) {
  if (algorithm == KdfAlgorithm::Argon2id) {
    return KdfParams{.algorithm = algorithm, .memory_cost = 16, .time_cost = 2, .block_size = 8};
  }
  return KdfParams{.algorithm = algorithm, .memory_cost = 14, .time_cost = 1, .block_size = 8};
}

bool params_in_range(const KdfParams &params) {
  const std::uint32_t min_memory =
      params.algorithm == KdfAlgorithm::Argon2id ? MIN_ARGON2_MEMORY_COST : MIN_MEMORY_COST;
  return params.memory_cost >= min_memory && params.memory_cost <= MAX_MEMORY_COST &&
         params.time_cost >= MIN_TIME_COST && params.time_cost <= MAX_TIME_COST &&
         params.block_size >= MIN_BLOCK_SIZE && params.block_size <= MAX_BLOCK_SIZE;
}

common::Result<SecretKey> derive_key(const Bytes &secret, const Bytes &salt,
                                     const KdfParams &params) {
  if (!params_in_range(params)) {
    return common::Result<SecretKey>::failure("kdf parameters out of range",
                                              common::ErrorCode::InvalidArgument);
  }
  if (params.algorithm == KdfAlgorithm::Argon2id) {
    return argon2id_derive(secret, salt, params);
  }
  return scrypt_derive(secret, salt, params);
}

} // namespace paramvault::crypto
