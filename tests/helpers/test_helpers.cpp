#include "tests/helpers/test_helpers.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cstdlib>
#include <fstream>
#include <random>
#include <stdexcept>

namespace paramvault::testing {

common::Result<crypto::Bytes> hmac_sha1(const crypto::Bytes &key,
                                        const crypto::Bytes &message) {
  crypto::Bytes out(EVP_MAX_MD_SIZE);
  unsigned int out_len = 0;
  static const unsigned char empty = 0;
  const unsigned char *key_data = key.empty() ? &empty : key.data();
  if (HMAC(EVP_sha1(), key_data, static_cast<int>(key.size()), message.data(), message.size(),
           out.data(), &out_len) == nullptr) {
    return common::Result<crypto::Bytes>::failure("HMAC-SHA1 computation failed");
  }
  out.resize(out_len);
  return common::Result<crypto::Bytes>::success(std::move(out));
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("paramvault-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

StreamCapture::StreamCapture(std::ostream &stream)
    : stream_(stream), saved_(stream.rdbuf(buffer_.rdbuf())) {}

StreamCapture::~StreamCapture() { stream_.rdbuf(saved_); }

params::RegistryOptions fast_registry_options() {
  params::RegistryOptions options;
  options.kdf_params = crypto::KdfParams{.memory_cost = 10, .time_cost = 1, .block_size = 8};
  return options;
}

common::Result<std::string> ScriptedPasswordPrompt::read_password(const std::string &prompt) {
  prompts.push_back(prompt);
  if (answers.empty()) {
    return common::Result<std::string>::failure("no password entered",
                                                common::ErrorCode::InvalidArgument);
  }
  std::string answer = answers.front();
  answers.pop_front();
  return common::Result<std::string>::success(std::move(answer));
}

common::Result<std::string> FakeKeyring::lookup(const std::string &service,
                                                const std::string &account) {
  if (unavailable) {
    return common::Result<std::string>::failure("secret-tool is not installed or not on PATH",
                                                common::ErrorCode::DeviceUnavailable);
  }
  const auto it = secrets.find({service, account});
  if (it == secrets.end()) {
    return common::Result<std::string>::failure("no keyring entry",
                                                common::ErrorCode::NotFound);
  }
  return common::Result<std::string>::success(it->second);
}

common::Status FakeKeyring::store(const std::string &service, const std::string &account,
                                  const std::string &, const std::string &secret) {
  ++store_calls;
  if (unavailable || fail_store) {
    return common::Status::error("keyring refused the secret",
                                 common::ErrorCode::DeviceUnavailable);
  }
  secrets[{service, account}] = secret;
  return common::Status::success();
}

FakeHardwareToken::FakeHardwareToken() {
  slot_secrets[1] = crypto::Bytes(20, 0x11);
  slot_secrets[2] = crypto::Bytes(20, 0x22);
}

common::Result<std::string> FakeHardwareToken::serial() {
  if (!attached) {
    return common::Result<std::string>::failure("no YubiKey detected",
                                                common::ErrorCode::DeviceUnavailable);
  }
  return common::Result<std::string>::success(serial_number);
}

common::Result<crypto::Bytes> FakeHardwareToken::challenge_response(
    const std::string &device_serial, const std::uint32_t slot, const crypto::Bytes &challenge) {
  if (!attached || device_serial != serial_number) {
    return common::Result<crypto::Bytes>::failure("device " + device_serial + " not attached",
                                                  common::ErrorCode::DeviceUnavailable);
  }
  slots_used.push_back(slot);
  const auto it = slot_secrets.find(slot);
  if (it == slot_secrets.end()) {
    return common::Result<crypto::Bytes>::failure("slot not programmed",
                                                  common::ErrorCode::DeviceUnavailable);
  }
  return hmac_sha1(it->second, challenge);
}

common::Result<common::ProcessResult>
FakeProcessRunner::run(const std::vector<std::string> &argv,
                       const common::ProcessOptions &options) {
  commands.push_back(argv);
  options_seen.push_back(options);
  if (results.empty()) {
    return common::Result<common::ProcessResult>::success(common::ProcessResult{});
  }
  auto result = results.front();
  results.pop_front();
  return result;
}

void FakeProcessRunner::push_result(const int exit_code, std::string stdout_text) {
  results.push_back(common::Result<common::ProcessResult>::success(
      common::ProcessResult{.exit_code = exit_code, .stdout_text = std::move(stdout_text)}));
}

void FakeProcessRunner::push_failure(std::string message, const common::ErrorCode code) {
  results.push_back(common::Result<common::ProcessResult>::failure(std::move(message), code));
}

common::Result<std::string> FlakyKvStore::get(const std::string &table, const std::string &key) {
  return inner_.get(table, key);
}

common::Status FlakyKvStore::set(const std::string &table, const std::string &key,
                                 const std::string &value) {
  return inner_.set(table, key, value);
}

common::Status FlakyKvStore::set_batch(const std::string &table,
                                       const std::vector<storage::KvEntry> &entries) {
  if (fail_batch) {
    return common::Status::error("disk full", common::ErrorCode::StorageError);
  }
  return inner_.set_batch(table, entries);
}

common::Result<bool> FlakyKvStore::remove(const std::string &table, const std::string &key) {
  return inner_.remove(table, key);
}

common::Result<bool> FlakyKvStore::contains(const std::string &table, const std::string &key) {
  return inner_.contains(table, key);
}

common::Status FlakyKvStore::for_each(const std::string &table,
                                      const storage::KvVisitor &visitor) {
  return inner_.for_each(table, visitor);
}

common::Result<std::vector<std::string>> FlakyKvStore::keys(const std::string &table) {
  return inner_.keys(table);
}

VaultFixture::VaultFixture(params::RegistryOptions options)
    : store(workspace.path() / "params.db"),
      registry(store, prompt, keyring, token, std::move(options)) {}

params::UnlockedKeys initialize_vault(VaultFixture &vault, const std::string &password) {
  auto keys = vault.registry.initialize(password, password);
  if (!keys.ok()) {
    throw std::runtime_error("initialize failed: " + keys.error());
  }
  return keys.value();
}

} // namespace paramvault::testing
