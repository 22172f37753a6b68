#pragma once

#include "paramvault/common/result.hpp"

#include <iosfwd>
#include <string>

namespace paramvault::params {

class IPasswordPrompt {
public:
  virtual ~IPasswordPrompt() = default;

  /// One line of input without its terminator. Cancelled input (EOF) is InvalidArgument.
  [[nodiscard]] virtual common::Result<std::string> read_password(const std::string &prompt) = 0;
};

/// Reads from stdin with echo disabled when stdin is a terminal. Prompts go to stderr.
class TerminalPasswordPrompt final : public IPasswordPrompt {
public:
  [[nodiscard]] common::Result<std::string> read_password(const std::string &prompt) override;
};

} // namespace paramvault::params
