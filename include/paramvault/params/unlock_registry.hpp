#pragma once

#include "paramvault/common/result.hpp"
#include "paramvault/crypto/kdf.hpp"
#include "paramvault/params/hardware_token.hpp"
#include "paramvault/params/key_wrap.hpp"
#include "paramvault/params/keyring.hpp"
#include "paramvault/params/password_prompt.hpp"
#include "paramvault/params/unlock_record.hpp"
#include "paramvault/storage/kv_store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace paramvault::params {

constexpr const char *CONFIG_TABLE = "config";
constexpr const char *DEFAULT_METHOD_KEY = "default-open-method";
constexpr const char *PASSWORD_METHOD = "password";
constexpr const char *KEYRING_METHOD = "keyring";
constexpr const char *HARDWARE_TOKEN_METHOD = "yubikey";
constexpr std::uint32_t DEFAULT_TOKEN_SLOT = 2;

struct RegistryOptions {
  /// Cost for records created by this registry. Existing records keep their own.
  crypto::KdfParams kdf_params = crypto::sensitive_params();
  std::string keyring_service = "paramvault";
  std::string keyring_account = "paramvault";
  /// Used instead of prompting, for both copies at init time.
  std::optional<std::string> password;
};

class UnlockRegistry;

/// NameKey and ValueKey after a successful unlock. Only UnlockRegistry can make
/// one, so holding it proves the keys came from a registered method.
class UnlockedKeys {
public:
  [[nodiscard]] const crypto::SecretKey &name_key() const { return keys_.name_key; }
  [[nodiscard]] const crypto::SecretKey &value_key() const { return keys_.value_key; }
  /// Record name of the method that produced these keys.
  [[nodiscard]] const std::string &method() const { return method_; }

private:
  friend class UnlockRegistry;
  UnlockedKeys(KeyPair keys, std::string method);

  KeyPair keys_;
  std::string method_;
};

class UnlockRegistry {
public:
  UnlockRegistry(storage::IKvStore &store, IPasswordPrompt &prompt, IKeyring &keyring,
                 IHardwareToken &token, RegistryOptions options = {});

  [[nodiscard]] common::Result<bool> is_initialized();

  /// Creates NameKey/ValueKey and the password record. Fails with AlreadyInitialized,
  /// InputMismatch or InvalidArgument (empty password) without writing anything.
  [[nodiscard]] common::Result<UnlockedKeys> initialize(const std::string &password,
                                                        const std::string &confirmation);
  [[nodiscard]] common::Result<UnlockedKeys> initialize_interactive();

  /// Unlocks with the named method, or the default-open-method when none is given.
  /// Accepts "password", "keyring", "yubikey" (the attached device) and "yubikey:<serial>".
  [[nodiscard]] common::Result<UnlockedKeys>
  resolve(const std::optional<std::string> &method = std::nullopt);

  [[nodiscard]] common::Status register_keyring(const UnlockedKeys &keys);
  /// Returns the record name, "yubikey:<serial>".
  [[nodiscard]] common::Result<std::string>
  register_hardware_token(const UnlockedKeys &keys, std::uint32_t slot = DEFAULT_TOKEN_SLOT);

  [[nodiscard]] common::Result<std::string> default_method();
  [[nodiscard]] common::Result<std::vector<std::string>> methods();

  [[nodiscard]] const RegistryOptions &options() const { return options_; }

private:
  [[nodiscard]] common::Result<UnlockRecord> load_record(const std::string &record_name);
  [[nodiscard]] common::Status write_record(const std::string &record_name,
                                            const UnlockRecord &record,
                                            const std::string &default_method);
  [[nodiscard]] common::Result<std::string> obtain_password(const std::string &prompt);

  [[nodiscard]] common::Result<KeyPair> unlock_password(const UnlockRecord &record);
  [[nodiscard]] common::Result<KeyPair> unlock_keyring(const UnlockRecord &record);
  [[nodiscard]] common::Result<KeyPair> unlock_token(const std::string &serial,
                                                     const UnlockRecord &record);

  storage::IKvStore &store_;
  IPasswordPrompt &prompt_;
  IKeyring &keyring_;
  IHardwareToken &token_;
  RegistryOptions options_;
};

} // namespace paramvault::params
