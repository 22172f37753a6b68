#pragma once

#include "paramvault/common/process.hpp"
#include "paramvault/common/result.hpp"

#include <string>

namespace paramvault::params {

/// OS credential store holding a single secret per (service, account).
class IKeyring {
public:
  virtual ~IKeyring() = default;

  /// NotFound when no secret is stored; DeviceUnavailable when the store cannot be reached.
  [[nodiscard]] virtual common::Result<std::string> lookup(const std::string &service,
                                                           const std::string &account) = 0;
  [[nodiscard]] virtual common::Status store(const std::string &service,
                                             const std::string &account, const std::string &label,
                                             const std::string &secret) = 0;
};

/// libsecret through its secret-tool command line client.
class SecretToolKeyring final : public IKeyring {
public:
  explicit SecretToolKeyring(common::IProcessRunner &runner, std::string tool = "secret-tool");

  [[nodiscard]] common::Result<std::string> lookup(const std::string &service,
                                                   const std::string &account) override;
  [[nodiscard]] common::Status store(const std::string &service, const std::string &account,
                                     const std::string &label, const std::string &secret) override;

private:
  common::IProcessRunner &runner_;
  std::string tool_;
};

} // namespace paramvault::params
