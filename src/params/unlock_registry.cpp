#include "paramvault/params/unlock_registry.hpp"

#include "paramvault/common/fs.hpp"
#include "paramvault/crypto/encoding.hpp"
#include "paramvault/crypto/random.hpp"
#include "paramvault/observability/global.hpp"
#include "paramvault/params/key_derivation.hpp"

#include <algorithm>
#include <chrono>

namespace paramvault::params {

namespace {

constexpr const char *KEYRING_LABEL = "paramvault parameter store key";
const std::string TOKEN_PREFIX = std::string(HARDWARE_TOKEN_METHOD) + ":";

template <typename T> common::Result<T> auth_failure() {
  return common::Result<T>::failure("authentication failed",
                                    common::ErrorCode::AuthenticationFailed);
}

template <typename T> common::Result<T> not_initialized() {
  return common::Result<T>::failure("parameter store is not initialized; run `paramvault init`",
                                    common::ErrorCode::NotInitialized);
}

bool is_record_name(const std::string &key) {
  return key == PASSWORD_METHOD || key == KEYRING_METHOD ||
         (common::starts_with(key, TOKEN_PREFIX) && key.size() > TOKEN_PREFIX.size());
}

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               started);
}

} // namespace

UnlockedKeys::UnlockedKeys(KeyPair keys, std::string method)
    : keys_(std::move(keys)), method_(std::move(method)) {}

UnlockRegistry::UnlockRegistry(storage::IKvStore &store, IPasswordPrompt &prompt,
                               IKeyring &keyring, IHardwareToken &token, RegistryOptions options)
    : store_(store), prompt_(prompt), keyring_(keyring), token_(token),
      options_(std::move(options)) {}

common::Result<bool> UnlockRegistry::is_initialized() {
  return store_.contains(CONFIG_TABLE, PASSWORD_METHOD);
}

common::Result<UnlockRecord> UnlockRegistry::load_record(const std::string &record_name) {
  auto raw = store_.get(CONFIG_TABLE, record_name);
  if (!raw.ok()) {
    if (raw.code() == common::ErrorCode::NotFound) {
      return common::Result<UnlockRecord>::failure("no unlock record for method " + record_name,
                                                   common::ErrorCode::NotInitialized);
    }
    return common::Result<UnlockRecord>::failure(raw.error(), raw.code());
  }
  return parse_record(raw.value());
}

common::Status UnlockRegistry::write_record(const std::string &record_name,
                                            const UnlockRecord &record,
                                            const std::string &default_method) {
  return store_.set_batch(CONFIG_TABLE, {{record_name, serialize_record(record)},
                                         {DEFAULT_METHOD_KEY, default_method}});
}

common::Result<std::string> UnlockRegistry::obtain_password(const std::string &prompt) {
  if (options_.password.has_value()) {
    return common::Result<std::string>::success(*options_.password);
  }
  return prompt_.read_password(prompt);
}

common::Result<UnlockedKeys> UnlockRegistry::initialize(const std::string &password,
                                                        const std::string &confirmation) {
  const auto initialized = is_initialized();
  if (!initialized.ok()) {
    return common::Result<UnlockedKeys>::failure(initialized.error(), initialized.code());
  }
  if (initialized.value()) {
    return common::Result<UnlockedKeys>::failure("parameter store is already initialized",
                                                 common::ErrorCode::AlreadyInitialized);
  }
  if (password != confirmation) {
    return common::Result<UnlockedKeys>::failure("passwords do not match",
                                                 common::ErrorCode::InputMismatch);
  }
  if (password.empty()) {
    return common::Result<UnlockedKeys>::failure("password must not be empty",
                                                 common::ErrorCode::InvalidArgument);
  }

  auto keys = generate_key_pair();
  if (!keys.ok()) {
    return common::Result<UnlockedKeys>::failure(keys.error(), keys.code());
  }
  auto salt = crypto::random_bytes(SALT_SIZE);
  if (!salt.ok()) {
    return common::Result<UnlockedKeys>::failure(salt.error(), salt.code());
  }
  auto kek = derive_password_kek(password, salt.value(), options_.kdf_params);
  if (!kek.ok()) {
    return common::Result<UnlockedKeys>::failure(kek.error(), kek.code());
  }
  auto wrapped = wrap_keys(kek.value(), keys.value());
  crypto::wipe(kek.value());
  if (!wrapped.ok()) {
    return common::Result<UnlockedKeys>::failure(wrapped.error(), wrapped.code());
  }

  UnlockRecord record;
  record.kdf = crypto::kdf_algorithm_name(options_.kdf_params.algorithm);
  record.salt = std::move(salt.value());
  record.kdf_params = options_.kdf_params;
  record.keys = std::move(wrapped.value());

  const auto written = write_record(PASSWORD_METHOD, record, PASSWORD_METHOD);
  if (!written.ok()) {
    return common::Result<UnlockedKeys>::failure(written.error(), written.code());
  }

  observability::record_store_initialized();
  observability::record_method_registered(PASSWORD_METHOD);
  return common::Result<UnlockedKeys>::success(UnlockedKeys(keys.value(), PASSWORD_METHOD));
}

common::Result<UnlockedKeys> UnlockRegistry::initialize_interactive() {
  const auto initialized = is_initialized();
  if (!initialized.ok()) {
    return common::Result<UnlockedKeys>::failure(initialized.error(), initialized.code());
  }
  if (initialized.value()) {
    return common::Result<UnlockedKeys>::failure("parameter store is already initialized",
                                                 common::ErrorCode::AlreadyInitialized);
  }

  if (options_.password.has_value()) {
    return initialize(*options_.password, *options_.password);
  }

  auto password = prompt_.read_password("Password: ");
  if (!password.ok()) {
    return common::Result<UnlockedKeys>::failure(password.error(), password.code());
  }
  auto confirmation = prompt_.read_password("Repeat password: ");
  if (!confirmation.ok()) {
    crypto::wipe(password.value());
    return common::Result<UnlockedKeys>::failure(confirmation.error(), confirmation.code());
  }
  auto result = initialize(password.value(), confirmation.value());
  crypto::wipe(password.value());
  crypto::wipe(confirmation.value());
  return result;
}

common::Result<KeyPair> UnlockRegistry::unlock_password(const UnlockRecord &record) {
  if (record.kdf == KDF_NONE) {
    return auth_failure<KeyPair>();
  }
  auto password = obtain_password("Password: ");
  if (!password.ok()) {
    return common::Result<KeyPair>::failure(password.error(), password.code());
  }
  auto kek = derive_password_kek(password.value(), record.salt, record.kdf_params);
  crypto::wipe(password.value());
  if (!kek.ok()) {
    return auth_failure<KeyPair>();
  }
  auto keys = unwrap_keys(kek.value(), record.keys);
  crypto::wipe(kek.value());
  return keys;
}

common::Result<KeyPair> UnlockRegistry::unlock_keyring(const UnlockRecord &record) {
  if (record.kdf != KDF_NONE) {
    return auth_failure<KeyPair>();
  }
  auto stored = keyring_.lookup(options_.keyring_service, options_.keyring_account);
  if (!stored.ok()) {
    if (stored.code() == common::ErrorCode::NotFound) {
      return auth_failure<KeyPair>();
    }
    return common::Result<KeyPair>::failure(stored.error(), stored.code());
  }
  auto secret = crypto::base64_decode(stored.value());
  crypto::wipe(stored.value());
  if (!secret.ok()) {
    return auth_failure<KeyPair>();
  }
  auto kek = keyring_kek(secret.value());
  crypto::wipe(secret.value());
  if (!kek.ok()) {
    return auth_failure<KeyPair>();
  }
  auto keys = unwrap_keys(kek.value(), record.keys);
  crypto::wipe(kek.value());
  return keys;
}

common::Result<KeyPair> UnlockRegistry::unlock_token(const std::string &serial,
                                                     const UnlockRecord &record) {
  if (record.kdf == KDF_NONE || !record.challenge.has_value()) {
    return auth_failure<KeyPair>();
  }
  auto response =
      token_.challenge_response(serial, record.slot.value_or(DEFAULT_TOKEN_SLOT), *record.challenge);
  if (!response.ok()) {
    return common::Result<KeyPair>::failure(response.error(), response.code());
  }
  auto kek = derive_token_kek(response.value(), record.salt, record.kdf_params);
  crypto::wipe(response.value());
  if (!kek.ok()) {
    return auth_failure<KeyPair>();
  }
  auto keys = unwrap_keys(kek.value(), record.keys);
  crypto::wipe(kek.value());
  return keys;
}

common::Result<UnlockedKeys> UnlockRegistry::resolve(const std::optional<std::string> &method) {
  std::string requested;
  if (method.has_value() && !common::trim(*method).empty()) {
    requested = common::trim(*method);
  } else {
    auto fallback = default_method();
    if (!fallback.ok()) {
      return common::Result<UnlockedKeys>::failure(fallback.error(), fallback.code());
    }
    requested = fallback.value();
  }

  std::string record_name = requested;
  std::string serial;
  if (requested == HARDWARE_TOKEN_METHOD) {
    auto attached = token_.serial();
    if (!attached.ok()) {
      return common::Result<UnlockedKeys>::failure(attached.error(), attached.code());
    }
    serial = attached.value();
    record_name = TOKEN_PREFIX + serial;
  } else if (common::starts_with(requested, TOKEN_PREFIX) &&
             requested.size() > TOKEN_PREFIX.size()) {
    serial = requested.substr(TOKEN_PREFIX.size());
  } else if (requested != PASSWORD_METHOD && requested != KEYRING_METHOD) {
    return common::Result<UnlockedKeys>::failure("unknown unlock method: " + requested,
                                                 common::ErrorCode::InvalidMethod);
  }

  auto record = load_record(record_name);
  if (!record.ok()) {
    return common::Result<UnlockedKeys>::failure(record.error(), record.code());
  }

  const auto started = std::chrono::steady_clock::now();
  common::Result<KeyPair> keys = auth_failure<KeyPair>();
  if (record_name == PASSWORD_METHOD) {
    keys = unlock_password(record.value());
  } else if (record_name == KEYRING_METHOD) {
    keys = unlock_keyring(record.value());
  } else {
    keys = unlock_token(serial, record.value());
  }
  observability::record_unlock_attempt(record_name, keys.ok(), elapsed_since(started));

  if (!keys.ok()) {
    return common::Result<UnlockedKeys>::failure(keys.error(), keys.code());
  }
  return common::Result<UnlockedKeys>::success(UnlockedKeys(keys.value(), record_name));
}

common::Status UnlockRegistry::register_keyring(const UnlockedKeys &keys) {
  auto secret = crypto::random_bytes(crypto::KEY_SIZE);
  if (!secret.ok()) {
    return common::Status::error(secret.error(), secret.code());
  }
  auto kek = keyring_kek(secret.value());
  if (!kek.ok()) {
    crypto::wipe(secret.value());
    return common::Status::error(kek.error(), kek.code());
  }
  auto wrapped = wrap_keys(kek.value(), keys.keys_);
  crypto::wipe(kek.value());
  if (!wrapped.ok()) {
    crypto::wipe(secret.value());
    return common::Status::error(wrapped.error(), wrapped.code());
  }

  UnlockRecord record;
  record.kdf = KDF_NONE;
  record.keys = std::move(wrapped.value());

  // An existing keyring record stays wrapped under the previous secret until the new
  // record lands, so that secret has to come back if the write fails.
  auto previous = keyring_.lookup(options_.keyring_service, options_.keyring_account);
  if (!previous.ok() && previous.code() != common::ErrorCode::NotFound) {
    crypto::wipe(secret.value());
    return common::Status::error(previous.error(), previous.code());
  }

  std::string encoded = crypto::base64_encode(secret.value());
  crypto::wipe(secret.value());
  const auto stored =
      keyring_.store(options_.keyring_service, options_.keyring_account, KEYRING_LABEL, encoded);
  crypto::wipe(encoded);
  if (!stored.ok()) {
    if (previous.ok()) {
      crypto::wipe(previous.value());
    }
    return stored;
  }

  const auto written = write_record(KEYRING_METHOD, record, KEYRING_METHOD);
  if (!written.ok()) {
    if (previous.ok()) {
      const auto restored = keyring_.store(options_.keyring_service, options_.keyring_account,
                                           KEYRING_LABEL, previous.value());
      crypto::wipe(previous.value());
      if (!restored.ok()) {
        return common::Status::error(written.error() +
                                         "; restoring the previous keyring secret failed: " +
                                         restored.error(),
                                     written.code());
      }
    }
    return written;
  }
  if (previous.ok()) {
    crypto::wipe(previous.value());
  }
  observability::record_method_registered(KEYRING_METHOD);
  return common::Status::success();
}

common::Result<std::string> UnlockRegistry::register_hardware_token(const UnlockedKeys &keys,
                                                                    const std::uint32_t slot) {
  if (slot != 1 && slot != 2) {
    return common::Result<std::string>::failure("OTP slot must be 1 or 2",
                                                common::ErrorCode::InvalidArgument);
  }
  auto serial = token_.serial();
  if (!serial.ok()) {
    return common::Result<std::string>::failure(serial.error(), serial.code());
  }
  auto challenge = crypto::random_bytes(CHALLENGE_SIZE);
  if (!challenge.ok()) {
    return common::Result<std::string>::failure(challenge.error(), challenge.code());
  }
  auto response = token_.challenge_response(serial.value(), slot, challenge.value());
  if (!response.ok()) {
    return common::Result<std::string>::failure(response.error(), response.code());
  }
  auto salt = crypto::random_bytes(SALT_SIZE);
  if (!salt.ok()) {
    crypto::wipe(response.value());
    return common::Result<std::string>::failure(salt.error(), salt.code());
  }
  auto kek = derive_token_kek(response.value(), salt.value(), options_.kdf_params);
  crypto::wipe(response.value());
  if (!kek.ok()) {
    return common::Result<std::string>::failure(kek.error(), kek.code());
  }
  auto wrapped = wrap_keys(kek.value(), keys.keys_);
  crypto::wipe(kek.value());
  if (!wrapped.ok()) {
    return common::Result<std::string>::failure(wrapped.error(), wrapped.code());
  }

  UnlockRecord record;
  record.kdf = crypto::kdf_algorithm_name(options_.kdf_params.algorithm);
  record.salt = std::move(salt.value());
  record.kdf_params = options_.kdf_params;
  record.keys = std::move(wrapped.value());
  record.challenge = std::move(challenge.value());
  record.slot = slot;

  const std::string record_name = TOKEN_PREFIX + serial.value();
  const auto written = write_record(record_name, record, HARDWARE_TOKEN_METHOD);
  if (!written.ok()) {
    return common::Result<std::string>::failure(written.error(), written.code());
  }
  observability::record_method_registered(record_name);
  return common::Result<std::string>::success(record_name);
}

common::Result<std::string> UnlockRegistry::default_method() {
  auto method = store_.get(CONFIG_TABLE, DEFAULT_METHOD_KEY);
  if (!method.ok() && method.code() == common::ErrorCode::NotFound) {
    return not_initialized<std::string>();
  }
  return method;
}

common::Result<std::vector<std::string>> UnlockRegistry::methods() {
  std::vector<std::string> names;
  const auto status = store_.for_each(CONFIG_TABLE, [&names](const std::string &key,
                                                             const std::string &) {
    if (is_record_name(key)) {
      names.push_back(key);
    }
    return true;
  });
  if (!status.ok()) {
    return common::Result<std::vector<std::string>>::failure(status.error(), status.code());
  }
  std::sort(names.begin(), names.end());
  return common::Result<std::vector<std::string>>::success(std::move(names));
}

} // namespace paramvault::params
