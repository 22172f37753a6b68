#pragma once

#include "paramvault/common/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace paramvault::common {

struct ProcessOptions {
  bool allow_failure = false;
  /// Unset means wait for as long as the child runs (operator or device interaction).
  std::optional<std::chrono::milliseconds> timeout;
  /// Written to the child's stdin, which is then closed. Unset inherits our stdin.
  std::optional<std::string> stdin_text;
  /// Let the child talk to our stderr directly (touch prompts and the like).
  bool inherit_stderr = false;
};

struct ProcessResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  /// argv[0] is looked up on PATH.
  [[nodiscard]] virtual Result<ProcessResult> run(const std::vector<std::string> &argv,
                                                  const ProcessOptions &options = {}) = 0;
};

class SubprocessRunner final : public IProcessRunner {
public:
  [[nodiscard]] Result<ProcessResult> run(const std::vector<std::string> &argv,
                                          const ProcessOptions &options = {}) override;
};

} // namespace paramvault::common
