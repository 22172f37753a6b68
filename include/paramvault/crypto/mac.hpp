#pragma once

#include "paramvault/common/result.hpp"
#include "paramvault/crypto/key.hpp"

#include <string>

namespace paramvault::crypto {

constexpr std::size_t BLAKE2B_256_SIZE = 32;

[[nodiscard]] common::Result<Bytes> blake2b_mac(const SecretKey &key, const std::string &message,
                                                std::size_t digest_size = BLAKE2B_256_SIZE);

} // namespace paramvault::crypto
