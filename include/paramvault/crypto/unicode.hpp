#pragma once

#include "paramvault/common/result.hpp"

#include <string>

namespace paramvault::crypto {

// Compatibility composition (NFKC) of a UTF-8 string. Invalid UTF-8 is rejected.
[[nodiscard]] common::Result<std::string> normalize_nfkc(const std::string &utf8);

} // namespace paramvault::crypto
