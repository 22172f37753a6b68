#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "paramvault/params/key_derivation.hpp"
#include "paramvault/params/unlock_record.hpp"

void register_registry_tests(std::vector<paramvault::tests::TestCase> &tests) {
  using paramvault::tests::require;
  using paramvault::tests::require_code;
  namespace common = paramvault::common;
  namespace params = paramvault::params;
  namespace pt = paramvault::testing;

  tests.push_back({"registry_initialize_writes_password_record_and_default", [] {
                     pt::VaultFixture vault;
                     require(!vault.registry.is_initialized().value(), "fresh store");
                     const auto keys = vault.registry.initialize("pw", "pw");
                     require(keys.ok(), keys.error());
                     require(keys.value().method() == params::PASSWORD_METHOD, "method");
                     require(vault.registry.is_initialized().value(), "initialized");
                     require(vault.registry.default_method().value() == params::PASSWORD_METHOD,
                             "default is password");
                     const auto raw = vault.store.get(params::CONFIG_TABLE, params::PASSWORD_METHOD);
                     require(raw.ok(), raw.error());
                     const auto record = params::parse_record(raw.value());
                     require(record.ok(), record.error());
                     require(record.value().kdf == params::KDF_SCRYPT, "scrypt record");
                     require(record.value().kdf_params.memory_cost == 10,
                             "record carries the configured cost");
                   }});

  tests.push_back({"registry_initialize_refuses_second_init", [] {
                     pt::VaultFixture vault;
                     pt::initialize_vault(vault, "pw");
                     const auto before =
                         vault.store.get(params::CONFIG_TABLE, params::PASSWORD_METHOD).value();
                     const auto again = vault.registry.initialize("other", "other");
                     require_code(again, common::ErrorCode::AlreadyInitialized,
                                  "second init rejected");
                     require(vault.store.get(params::CONFIG_TABLE, params::PASSWORD_METHOD).value() ==
                                 before,
                             "existing record untouched");
                   }});

  tests.push_back({"registry_initialize_rejects_mismatch_and_empty", [] {
                     pt::VaultFixture vault;
                     require_code(vault.registry.initialize("a", "b"),
                                  common::ErrorCode::InputMismatch, "mismatch");
                     require_code(vault.registry.initialize("", ""),
                                  common::ErrorCode::InvalidArgument, "empty password");
                     require(!vault.registry.is_initialized().value(), "nothing written");
                     require_code(vault.registry.default_method(),
                                  common::ErrorCode::NotInitialized, "no default");
                   }});

  tests.push_back({"registry_interactive_init_prompts_twice", [] {
                     pt::VaultFixture vault;
                     vault.prompt.push("secret");
                     vault.prompt.push("secret");
                     const auto keys = vault.registry.initialize_interactive();
                     require(keys.ok(), keys.error());
                     require(vault.prompt.prompts.size() == 2, "two prompts");
                     require(vault.prompt.prompts[0] == "Password: ", "first prompt");
                     require(vault.prompt.prompts[1] == "Repeat password: ", "second prompt");

                     vault.prompt.push("secret");
                     const auto unlocked = vault.registry.resolve();
                     require(unlocked.ok(), unlocked.error());
                     require(unlocked.value().value_key() == keys.value().value_key(),
                             "same keys after unlock");
                   }});

  tests.push_back({"registry_interactive_init_mismatch", [] {
                     pt::VaultFixture vault;
                     vault.prompt.push("one");
                     vault.prompt.push("two");
                     require_code(vault.registry.initialize_interactive(),
                                  common::ErrorCode::InputMismatch, "mismatch");
                     require(!vault.registry.is_initialized().value(), "nothing written");
                   }});

  tests.push_back({"registry_presupplied_password_skips_prompt", [] {
                     auto options = pt::fast_registry_options();
                     options.password = "from-env";
                     pt::VaultFixture vault(options);
                     require(vault.registry.initialize_interactive().ok(), "init");
                     require(vault.registry.resolve().ok(), "unlock");
                     require(vault.prompt.prompts.empty(), "never prompted");
                   }});

  tests.push_back({"registry_resolve_wrong_password", [] {
                     pt::VaultFixture vault;
                     pt::initialize_vault(vault, "right");
                     vault.prompt.push("wrong");
                     require_code(vault.registry.resolve(), common::ErrorCode::AuthenticationFailed,
                                  "wrong password rejected");
                     vault.prompt.push("right");
                     require(vault.registry.resolve().ok(), "right password accepted");
                   }});

  tests.push_back({"registry_resolve_uninitialized_and_unknown_method", [] {
                     pt::VaultFixture vault;
                     require_code(vault.registry.resolve(), common::ErrorCode::NotInitialized,
                                  "no default method");
                     require_code(vault.registry.resolve(std::string("password")),
                                  common::ErrorCode::NotInitialized, "no password record");
                     pt::initialize_vault(vault, "pw");
                     require_code(vault.registry.resolve(std::string("fingerprint")),
                                  common::ErrorCode::InvalidMethod, "unknown method");
                     require_code(vault.registry.resolve(std::string("keyring")),
                                  common::ErrorCode::NotInitialized, "keyring not registered");
                   }});

  tests.push_back({"registry_keyring_becomes_default", [] {
                     pt::VaultFixture vault;
                     const auto keys = pt::initialize_vault(vault, "pw");
                     const auto status = vault.registry.register_keyring(keys);
                     require(status.ok(), status.error());
                     require(vault.keyring.secrets.size() == 1, "secret stored in keyring");
                     require(vault.keyring.secrets.contains({"paramvault", "paramvault"}),
                             "default service and account");
                     require(vault.registry.default_method().value() == params::KEYRING_METHOD,
                             "keyring is default");

                     const auto unlocked = vault.registry.resolve();
                     require(unlocked.ok(), unlocked.error());
                     require(unlocked.value().method() == params::KEYRING_METHOD, "via keyring");
                     require(unlocked.value().name_key() == keys.name_key() &&
                                 unlocked.value().value_key() == keys.value_key(),
                             "same keys as the password method");
                     require(vault.prompt.prompts.empty(), "no password prompt");

                     vault.prompt.push("pw");
                     require(vault.registry.resolve(std::string("password")).ok(),
                             "password still works");
                   }});

  tests.push_back({"registry_keyring_missing_entry_fails_authentication", [] {
                     pt::VaultFixture vault;
                     const auto keys = pt::initialize_vault(vault, "pw");
                     require(vault.registry.register_keyring(keys).ok(), "register");
                     vault.keyring.secrets.clear();
                     require_code(vault.registry.resolve(), common::ErrorCode::AuthenticationFailed,
                                  "missing keyring entry");
                     vault.keyring.unavailable = true;
                     require_code(vault.registry.resolve(), common::ErrorCode::DeviceUnavailable,
                                  "unreachable keyring");
                   }});

  tests.push_back({"registry_failed_keyring_store_leaves_config_untouched", [] {
                     pt::VaultFixture vault;
                     const auto keys = pt::initialize_vault(vault, "pw");
                     vault.keyring.fail_store = true;
                     require(!vault.registry.register_keyring(keys).ok(), "registration fails");
                     require(vault.registry.default_method().value() == params::PASSWORD_METHOD,
                             "default unchanged");
                     require(!vault.store.contains(params::CONFIG_TABLE, params::KEYRING_METHOD)
                                  .value(),
                             "no keyring record");
                   }});

  tests.push_back({"registry_argon2id_records_unlock", [] {
                     if (!paramvault::crypto::argon2id_available()) {
                       return;
                     }
                     auto options = pt::fast_registry_options();
                     options.kdf_params.algorithm = paramvault::crypto::KdfAlgorithm::Argon2id;
                     pt::VaultFixture vault(options);
                     const auto keys = pt::initialize_vault(vault, "pw");
                     const auto raw = vault.store.get(params::CONFIG_TABLE, params::PASSWORD_METHOD);
                     require(raw.ok(), raw.error());
                     require(params::parse_record(raw.value()).value().kdf == params::KDF_ARGON2ID,
                             "argon2id record");

                     vault.prompt.push("pw");
                     const auto unlocked = vault.registry.resolve();
                     require(unlocked.ok(), unlocked.error());
                     require(unlocked.value().value_key() == keys.value_key(), "same keys");
                   }});

  tests.push_back({"registry_failed_keyring_rewrite_keeps_old_secret", [] {
                     pt::VaultFixture vault;
                     pt::FlakyKvStore flaky(vault.store);
                     params::UnlockRegistry registry(flaky, vault.prompt, vault.keyring,
                                                     vault.token, pt::fast_registry_options());
                     auto initialized = registry.initialize("pw", "pw");
                     require(initialized.ok(), initialized.error());
                     require(registry.register_keyring(initialized.value()).ok(), "first");
                     const auto secret_before =
                         vault.keyring.secrets.at({"paramvault", "paramvault"});

                     flaky.fail_batch = true;
                     require_code(registry.register_keyring(initialized.value()),
                                  common::ErrorCode::StorageError, "second registration fails");
                     require(vault.keyring.secrets.at({"paramvault", "paramvault"}) == secret_before,
                             "previous secret restored");
                     require(registry.default_method().value() == params::KEYRING_METHOD,
                             "default unchanged");

                     flaky.fail_batch = false;
                     const auto unlocked = registry.resolve();
                     require(unlocked.ok(), unlocked.error());
                     require(unlocked.value().method() == params::KEYRING_METHOD, "via keyring");
                     require(unlocked.value().name_key() == initialized.value().name_key() &&
                                 unlocked.value().value_key() == initialized.value().value_key(),
                             "keyring still opens the store");
                   }});

  tests.push_back({"registry_hardware_token_register_and_resolve", [] {
                     pt::VaultFixture vault;
                     const auto keys = pt::initialize_vault(vault, "pw");
                     const auto name = vault.registry.register_hardware_token(keys);
                     require(name.ok(), name.error());
                     require(name.value() == "yubikey:12345678", "record name");
                     require(vault.registry.default_method().value() ==
                                 params::HARDWARE_TOKEN_METHOD,
                             "token is default");
                     require(vault.token.slots_used == std::vector<std::uint32_t>{2},
                             "default slot 2");

                     const auto by_default = vault.registry.resolve();
                     require(by_default.ok(), by_default.error());
                     require(by_default.value().method() == "yubikey:12345678", "attached device");
                     require(by_default.value().value_key() == keys.value_key(), "same keys");

                     const auto by_serial = vault.registry.resolve(std::string("yubikey:12345678"));
                     require(by_serial.ok(), by_serial.error());
                     require(vault.prompt.prompts.empty(), "no password prompt");
                   }});

  tests.push_back({"registry_hardware_token_slot_and_device_errors", [] {
                     pt::VaultFixture vault;
                     const auto keys = pt::initialize_vault(vault, "pw");
                     require_code(vault.registry.register_hardware_token(keys, 3),
                                  common::ErrorCode::InvalidArgument, "slot 3 rejected");
                     require(vault.registry.register_hardware_token(keys, 1).ok(), "slot 1");

                     vault.token.slot_secrets[1] = paramvault::crypto::Bytes(20, 0x99);
                     require_code(vault.registry.resolve(), common::ErrorCode::AuthenticationFailed,
                                  "reprogrammed slot cannot unlock");

                     vault.token.attached = false;
                     require_code(vault.registry.resolve(), common::ErrorCode::DeviceUnavailable,
                                  "detached token");
                     require_code(vault.registry.resolve(std::string("yubikey:87654321")),
                                  common::ErrorCode::NotInitialized, "unregistered serial");
                   }});

  tests.push_back({"registry_methods_lists_records_sorted", [] {
                     pt::VaultFixture vault;
                     const auto keys = pt::initialize_vault(vault, "pw");
                     require(vault.registry.register_hardware_token(keys).ok(), "token");
                     require(vault.registry.register_keyring(keys).ok(), "keyring");
                     const auto methods = vault.registry.methods();
                     require(methods.ok(), methods.error());
                     require(methods.value() == std::vector<std::string>{"keyring", "password",
                                                                         "yubikey:12345678"},
                             "records only, sorted");
                     require(vault.registry.default_method().value() == params::KEYRING_METHOD,
                             "last registration wins");
                   }});

  tests.push_back({"registry_same_password_gives_distinct_records", [] {
                     pt::VaultFixture first;
                     pt::VaultFixture second;
                     pt::initialize_vault(first, "shared");
                     pt::initialize_vault(second, "shared");
                     const auto a = first.store.get(params::CONFIG_TABLE, params::PASSWORD_METHOD);
                     const auto b = second.store.get(params::CONFIG_TABLE, params::PASSWORD_METHOD);
                     require(a.ok() && b.ok(), "records present");
                     require(a.value() != b.value(), "independent salts and keys");
                     first.prompt.push("shared");
                     second.prompt.push("shared");
                     require(first.registry.resolve().ok() && second.registry.resolve().ok(),
                             "both unlock");
                   }});
}
