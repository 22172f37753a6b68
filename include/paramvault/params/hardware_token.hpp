#pragma once

#include "paramvault/common/process.hpp"
#include "paramvault/common/result.hpp"
#include "paramvault/crypto/key.hpp"

#include <cstdint>
#include <string>

namespace paramvault::params {

/// A YubiKey-style device answering HMAC-SHA1 challenges on an OTP slot.
class IHardwareToken {
public:
  virtual ~IHardwareToken() = default;

  /// Serial number of the connected device. DeviceUnavailable when none is attached.
  [[nodiscard]] virtual common::Result<std::string> serial() = 0;
  [[nodiscard]] virtual common::Result<crypto::Bytes>
  challenge_response(const std::string &device_serial, std::uint32_t slot,
                     const crypto::Bytes &challenge) = 0;
};

/// Drives the device through the ykman command line tool.
class YkmanToken final : public IHardwareToken {
public:
  explicit YkmanToken(common::IProcessRunner &runner, std::string tool = "ykman");

  [[nodiscard]] common::Result<std::string> serial() override;
  [[nodiscard]] common::Result<crypto::Bytes>
  challenge_response(const std::string &device_serial, std::uint32_t slot,
                     const crypto::Bytes &challenge) override;

private:
  common::IProcessRunner &runner_;
  std::string tool_;
};

} // namespace paramvault::params
