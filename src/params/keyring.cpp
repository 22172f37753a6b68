#include "paramvault/params/keyring.hpp"

#include "paramvault/common/fs.hpp"

namespace paramvault::params {

SecretToolKeyring::SecretToolKeyring(common::IProcessRunner &runner, std::string tool)
    : runner_(runner), tool_(std::move(tool)) {}

common::Result<std::string> SecretToolKeyring::lookup(const std::string &service,
                                                      const std::string &account) {
  common::ProcessOptions options;
  options.allow_failure = true;
  options.stdin_text = "";
  auto result = runner_.run({tool_, "lookup", "service", service, "account", account}, options);
  if (!result.ok()) {
    return common::Result<std::string>::failure(result.error(), result.code());
  }
  const auto &output = result.value();
  if (output.exit_code == 127) {
    return common::Result<std::string>::failure(tool_ + " is not installed or not on PATH",
                                                common::ErrorCode::DeviceUnavailable);
  }
  std::string secret = common::trim(output.stdout_text);
  if (output.exit_code != 0 || secret.empty()) {
    return common::Result<std::string>::failure("no keyring entry for service " + service,
                                                common::ErrorCode::NotFound);
  }
  return common::Result<std::string>::success(std::move(secret));
}

common::Status SecretToolKeyring::store(const std::string &service, const std::string &account,
                                        const std::string &label, const std::string &secret) {
  common::ProcessOptions options;
  options.stdin_text = secret;
  auto result = runner_.run(
      {tool_, "store", "--label=" + label, "service", service, "account", account}, options);
  if (!result.ok()) {
    return common::Status::error(result.error(), result.code());
  }
  return common::Status::success();
}

} // namespace paramvault::params
