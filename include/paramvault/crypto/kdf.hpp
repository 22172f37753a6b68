#pragma once

#include "paramvault/common/result.hpp"
#include "paramvault/crypto/key.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace paramvault::crypto {

enum class KdfAlgorithm {
  Argon2id,
  Scrypt,
};

// memory_cost is log2-encoded for both algorithms.
//   argon2id: 2^memory_cost KiB, time_cost passes, one lane (block_size unused).
//   scrypt:   N = 2^memory_cost, p = time_cost, r = block_size.
struct KdfParams {
  KdfAlgorithm algorithm = KdfAlgorithm::Scrypt;
  std::uint32_t memory_cost = 20;
  std::uint32_t time_cost = 1;
  std::uint32_t block_size = 8;
};

constexpr std::uint32_t MIN_MEMORY_COST = 1;
constexpr std::uint32_t MIN_ARGON2_MEMORY_COST = 3;
constexpr std::uint32_t MAX_MEMORY_COST = 30;
constexpr std::uint32_t MIN_TIME_COST = 1;
constexpr std::uint32_t MAX_TIME_COST = 16;
constexpr std::uint32_t MIN_BLOCK_SIZE = 1;
constexpr std::uint32_t MAX_BLOCK_SIZE = 32;

[[nodiscard]] std::string_view kdf_algorithm_name(KdfAlgorithm algorithm);
[[nodiscard]] std::optional<KdfAlgorithm> parse_kdf_algorithm(std::string_view name);

/// Whether the loaded OpenSSL providers offer ARGON2ID (OpenSSL 3.2 and later).
[[nodiscard]] bool argon2id_available();
/// argon2id when available, scrypt otherwise.
[[nodiscard]] KdfAlgorithm default_kdf_algorithm();

/// About 1 GiB: argon2id 4 passes, scrypt N = 2^20 r = 8.
[[nodiscard]] KdfParams sensitive_params(KdfAlgorithm algorithm = default_kdf_algorithm());
/// argon2id 64 MiB 2 passes, scrypt N = 2^14 r = 8.
[[nodiscard]] KdfParams interactive_params(KdfAlgorithm algorithm = default_kdf_algorithm());

[[nodiscard]] bool params_in_range(const KdfParams &params);

[[nodiscard]] common::Result<SecretKey> derive_key(const Bytes &secret, const Bytes &salt,
                                                   const KdfParams &params);

} // namespace paramvault::crypto
