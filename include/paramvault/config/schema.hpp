#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace paramvault::config {

struct StoreConfig {
  std::string driver = "local";
  std::string path;
  bool read_only = true;
  /// Empty means use the store's default-open-method.
  std::string open_method;
  /// Only ever taken from the environment, never from the config file.
  std::optional<std::string> password;
};

struct KdfConfig {
  /// "auto" picks argon2id when OpenSSL offers it, scrypt otherwise.
  std::string algorithm = "auto";
  std::string profile = "sensitive";
  std::uint32_t memory_cost = 20;
  std::uint32_t time_cost = 1;
  std::uint32_t block_size = 8;
};

struct KeyringConfig {
  std::string service = "paramvault";
  std::string account = "paramvault";
  std::string tool = "secret-tool";
};

struct HardwareTokenConfig {
  std::uint32_t slot = 2;
  std::string tool = "ykman";
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string level = "warn";
};

struct Config {
  StoreConfig store;
  KdfConfig kdf;
  KeyringConfig keyring;
  HardwareTokenConfig hardware_token;
  ObservabilityConfig observability;
};

} // namespace paramvault::config
