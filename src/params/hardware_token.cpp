#include "paramvault/params/hardware_token.hpp"

#include "paramvault/common/fs.hpp"
#include "paramvault/crypto/encoding.hpp"

#include <sstream>

namespace paramvault::params {

YkmanToken::YkmanToken(common::IProcessRunner &runner, std::string tool)
    : runner_(runner), tool_(std::move(tool)) {}

common::Result<std::string> YkmanToken::serial() {
  auto result = runner_.run({tool_, "list", "--serials"});
  if (!result.ok()) {
    return common::Result<std::string>::failure(result.error(), result.code());
  }
  std::istringstream lines(result.value().stdout_text);
  std::string line;
  while (std::getline(lines, line)) {
    line = common::trim(line);
    if (!line.empty()) {
      return common::Result<std::string>::success(line);
    }
  }
  return common::Result<std::string>::failure("no YubiKey detected",
                                              common::ErrorCode::DeviceUnavailable);
}

common::Result<crypto::Bytes> YkmanToken::challenge_response(const std::string &device_serial,
                                                             const std::uint32_t slot,
                                                             const crypto::Bytes &challenge) {
  if (slot != 1 && slot != 2) {
    return common::Result<crypto::Bytes>::failure("OTP slot must be 1 or 2",
                                                  common::ErrorCode::InvalidArgument);
  }
  common::ProcessOptions options;
  // ykman asks for a touch on stderr when the slot requires it.
  options.inherit_stderr = true;
  auto result = runner_.run({tool_, "--device", device_serial, "otp", "calculate",
                             std::to_string(slot), crypto::hex_encode(challenge)},
                            options);
  if (!result.ok()) {
    return common::Result<crypto::Bytes>::failure(result.error(), result.code());
  }
  auto response = crypto::hex_decode(common::trim(result.value().stdout_text));
  if (!response.ok() || response.value().empty()) {
    return common::Result<crypto::Bytes>::failure("unexpected response from " + tool_,
                                                  common::ErrorCode::DeviceUnavailable);
  }
  return common::Result<crypto::Bytes>::success(std::move(response.value()));
}

} // namespace paramvault::params
