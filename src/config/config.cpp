#include "paramvault/config/config.hpp"

#include "paramvault/common/fs.hpp"
#include "paramvault/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace paramvault::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".paramvault";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *DATA_FOLDER = "paramvault";
constexpr const char *DB_FILENAME = "params.db";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("PARAMVAULT_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

bool env_flag_set(const char *value) {
  if (value == nullptr || *value == '\0') {
    return false;
  }
  const std::string flag = common::to_lower(common::trim(value));
  return flag != "0" && flag != "false" && flag != "no" && flag != "off";
}

template <typename T> common::Status assign(common::Result<T> value, T &out) {
  if (!value.ok()) {
    return common::Status::error(value.error(), value.code());
  }
  out = std::move(value.value());
  return common::Status::success();
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::Result<std::filesystem::path>::success(candidate);
    }
    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error(), home.code());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error(), cfg_dir.code());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<std::filesystem::path> default_db_path() {
  if (const char *xdg = std::getenv("XDG_DATA_HOME"); xdg != nullptr && *xdg != '\0') {
    return common::Result<std::filesystem::path>::success(std::filesystem::path(xdg) / DATA_FOLDER /
                                                          DB_FILENAME);
  }
  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error(), home.code());
  }
#if defined(__APPLE__)
  return common::Result<std::filesystem::path>::success(home.value() / "Library" / "Paramvault" /
                                                        DB_FILENAME);
#else
  return common::Result<std::filesystem::path>::success(home.value() / ".local" / "share" /
                                                        DATA_FOLDER / DB_FILENAME);
#endif
}

void apply_env_overrides(Config &config) {
  if (const char *db = std::getenv("PARAMVAULT_PARAMETER_DB"); db != nullptr && *db != '\0') {
    config.store.path = common::expand_path(db);
  }
  if (const char *password = std::getenv("PARAMVAULT_PARAMETER_DB_PASSWORD"); password != nullptr) {
    config.store.password = std::string(password);
  }
  if (const char *driver = std::getenv("PARAMVAULT_PARAMETER_DRIVER");
      driver != nullptr && *driver != '\0') {
    config.store.driver = driver;
  }
  if (env_flag_set(std::getenv("PARAMVAULT_DEBUG"))) {
    config.observability.level = "debug";
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error(), parsed.code());
  }
  const auto &doc = parsed.value();

  Config config;
  const common::Status reads[] = {
      assign(doc.get_string("store.driver", config.store.driver), config.store.driver),
      assign(doc.get_string("store.path", config.store.path), config.store.path),
      assign(doc.get_bool("store.read_only", config.store.read_only), config.store.read_only),
      assign(doc.get_string("store.open_method", config.store.open_method),
             config.store.open_method),
      assign(doc.get_string("kdf.algorithm", config.kdf.algorithm), config.kdf.algorithm),
      assign(doc.get_string("kdf.profile", config.kdf.profile), config.kdf.profile),
      assign(doc.get_u32("kdf.memory_cost", config.kdf.memory_cost), config.kdf.memory_cost),
      assign(doc.get_u32("kdf.time_cost", config.kdf.time_cost), config.kdf.time_cost),
      assign(doc.get_u32("kdf.block_size", config.kdf.block_size), config.kdf.block_size),
      assign(doc.get_string("keyring.service", config.keyring.service), config.keyring.service),
      assign(doc.get_string("keyring.account", config.keyring.account), config.keyring.account),
      assign(doc.get_string("keyring.tool", config.keyring.tool), config.keyring.tool),
      assign(doc.get_u32("hardware_token.slot", config.hardware_token.slot),
             config.hardware_token.slot),
      assign(doc.get_string("hardware_token.tool", config.hardware_token.tool),
             config.hardware_token.tool),
      assign(doc.get_string("observability.backend", config.observability.backend),
             config.observability.backend),
      assign(doc.get_string("observability.level", config.observability.level),
             config.observability.level),
  };
  for (const auto &status : reads) {
    if (!status.ok()) {
      return common::Result<Config>::failure(status.error(), status.code());
    }
  }

  config.store.path = expand_config_value(config.store.path);
  config.kdf.algorithm = common::to_lower(config.kdf.algorithm);
  config.kdf.profile = common::to_lower(config.kdf.profile);
  config.keyring.tool = expand_config_value(config.keyring.tool);
  config.hardware_token.tool = expand_config_value(config.hardware_token.tool);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  Config config;

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error(), cfg_path_result.code());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    std::ifstream file(path);
    if (!file) {
      return common::Result<Config>::failure("Unable to open config file: " + path.string(),
                                             common::ErrorCode::InvalidArgument);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto parsed = parse_config(buffer.str());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(path.string() + ": " + parsed.error(), parsed.code());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);

  if (common::trim(config.store.path).empty()) {
    const auto db_path = default_db_path();
    if (!db_path.ok()) {
      return common::Result<Config>::failure(db_path.error(), db_path.code());
    }
    config.store.path = db_path.value().string();
  }
  return common::Result<Config>::success(std::move(config));
}

common::Result<crypto::KdfAlgorithm> kdf_algorithm(const std::string &name) {
  const std::string algorithm = common::to_lower(common::trim(name));
  if (algorithm.empty() || algorithm == "auto") {
    return common::Result<crypto::KdfAlgorithm>::success(crypto::default_kdf_algorithm());
  }
  const auto parsed = crypto::parse_kdf_algorithm(algorithm);
  if (!parsed) {
    return common::Result<crypto::KdfAlgorithm>::failure("Invalid kdf.algorithm: " + name,
                                                         common::ErrorCode::InvalidArgument);
  }
  if (*parsed == crypto::KdfAlgorithm::Argon2id && !crypto::argon2id_available()) {
    return common::Result<crypto::KdfAlgorithm>::failure(
        "kdf.algorithm argon2id needs OpenSSL 3.2 or newer", common::ErrorCode::InvalidArgument);
  }
  return common::Result<crypto::KdfAlgorithm>::success(*parsed);
}

common::Result<crypto::KdfParams> kdf_params(const KdfConfig &kdf) {
  const auto algorithm = kdf_algorithm(kdf.algorithm);
  if (!algorithm.ok()) {
    return common::Result<crypto::KdfParams>::failure(algorithm.error(), algorithm.code());
  }
  const std::string profile = common::to_lower(common::trim(kdf.profile));
  if (profile.empty() || profile == "sensitive") {
    return common::Result<crypto::KdfParams>::success(crypto::sensitive_params(algorithm.value()));
  }
  if (profile == "interactive") {
    return common::Result<crypto::KdfParams>::success(
        crypto::interactive_params(algorithm.value()));
  }
  if (profile == "custom") {
    const crypto::KdfParams params{.algorithm = algorithm.value(),
                                   .memory_cost = kdf.memory_cost,
                                   .time_cost = kdf.time_cost,
                                   .block_size = kdf.block_size};
    if (!crypto::params_in_range(params)) {
      return common::Result<crypto::KdfParams>::failure(
          "kdf costs out of range (memory_cost " +
              std::to_string(algorithm.value() == crypto::KdfAlgorithm::Argon2id
                                 ? crypto::MIN_ARGON2_MEMORY_COST
                                 : crypto::MIN_MEMORY_COST) +
              "-30, time_cost 1-16, block_size 1-32)",
          common::ErrorCode::InvalidArgument);
    }
    return common::Result<crypto::KdfParams>::success(params);
  }
  return common::Result<crypto::KdfParams>::failure("Invalid kdf.profile: " + kdf.profile,
                                                    common::ErrorCode::InvalidArgument);
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  const std::string driver = common::to_lower(common::trim(config.store.driver));
  if (driver != "local") {
    return common::Result<std::vector<std::string>>::failure(
        "Unsupported store.driver: " + config.store.driver + " (only \"local\" is available)",
        common::ErrorCode::InvalidArgument);
  }

  const auto params = kdf_params(config.kdf);
  if (!params.ok()) {
    return common::Result<std::vector<std::string>>::failure(params.error(), params.code());
  }
  if (common::to_lower(config.kdf.profile) == "custom" && params.value().memory_cost < 14) {
    warnings.push_back("kdf.memory_cost below 14 gives weak protection for passwords");
  }

  if (config.hardware_token.slot != 1 && config.hardware_token.slot != 2) {
    return common::Result<std::vector<std::string>>::failure("hardware_token.slot must be 1 or 2",
                                                              common::ErrorCode::InvalidArgument);
  }

  if (common::trim(config.keyring.service).empty() || common::trim(config.keyring.account).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "keyring.service and keyring.account must not be empty", common::ErrorCode::InvalidArgument);
  }

  const std::string method = common::trim(config.store.open_method);
  if (!method.empty() && method != "password" && method != "keyring" && method != "yubikey" &&
      !common::starts_with(method, "yubikey:")) {
    return common::Result<std::vector<std::string>>::failure("Invalid store.open_method: " + method,
                                                              common::ErrorCode::InvalidArgument);
  }

  const std::string level = common::to_lower(common::trim(config.observability.level));
  if (level != "debug" && level != "info" && level != "warn" && level != "error") {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.level: " +
                                                                  config.observability.level,
                                                              common::ErrorCode::InvalidArgument);
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace paramvault::config
