#pragma once

#include "paramvault/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace paramvault::common {

[[nodiscard]] std::string trim(std::string_view input);
[[nodiscard]] bool starts_with(std::string_view value, std::string_view prefix);
[[nodiscard]] std::string to_lower(std::string value);

/// $HOME, or the passwd entry of the current user when HOME is unset.
[[nodiscard]] Result<std::filesystem::path> home_dir();

/// Creates path and any missing parents. A leaf created by this call is made
/// owner-only (0700); an existing directory keeps its mode.
[[nodiscard]] Status ensure_private_dir(const std::filesystem::path &path);

/// Expands a leading "~" and $VAR / ${VAR} references. Unset variables expand to
/// nothing; an unterminated "${" is kept literally.
[[nodiscard]] std::string expand_path(std::string_view value);

} // namespace paramvault::common
