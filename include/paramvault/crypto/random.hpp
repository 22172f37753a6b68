#pragma once

#include "paramvault/common/result.hpp"
#include "paramvault/crypto/key.hpp"

namespace paramvault::crypto {

[[nodiscard]] common::Result<Bytes> random_bytes(std::size_t count);
[[nodiscard]] common::Result<SecretKey> generate_key();

} // namespace paramvault::crypto
