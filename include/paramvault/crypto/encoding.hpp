#pragma once

#include "paramvault/common/result.hpp"
#include "paramvault/crypto/key.hpp"

#include <string>

namespace paramvault::crypto {

[[nodiscard]] std::string base64_encode(const unsigned char *data, std::size_t size);
[[nodiscard]] std::string base64_encode(const Bytes &bytes);
[[nodiscard]] common::Result<Bytes> base64_decode(const std::string &text);

[[nodiscard]] std::string hex_encode(const Bytes &bytes);
[[nodiscard]] common::Result<Bytes> hex_decode(const std::string &text);

} // namespace paramvault::crypto
