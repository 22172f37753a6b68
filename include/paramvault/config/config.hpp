#pragma once

#include "paramvault/common/result.hpp"
#include "paramvault/config/schema.hpp"
#include "paramvault/crypto/kdf.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace paramvault::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// $XDG_DATA_HOME/paramvault/params.db, or the platform fallback under $HOME.
[[nodiscard]] common::Result<std::filesystem::path> default_db_path();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// "auto" (or empty) resolves to the best algorithm the OpenSSL providers offer.
[[nodiscard]] common::Result<crypto::KdfAlgorithm> kdf_algorithm(const std::string &name);

/// Algorithm and cost for new records, from the configured profile.
[[nodiscard]] common::Result<crypto::KdfParams> kdf_params(const KdfConfig &kdf);

void apply_env_overrides(Config &config);

} // namespace paramvault::config
