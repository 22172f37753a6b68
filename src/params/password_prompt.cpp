#include "paramvault/params/password_prompt.hpp"

#include <iostream>

#include <termios.h>
#include <unistd.h>

namespace paramvault::params {

common::Result<std::string> TerminalPasswordPrompt::read_password(const std::string &prompt) {
  std::cerr << prompt << std::flush;

  const bool tty = isatty(STDIN_FILENO) == 1;
  termios saved{};
  bool echo_disabled = false;
  if (tty && tcgetattr(STDIN_FILENO, &saved) == 0) {
    termios quiet = saved;
    quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    echo_disabled = tcsetattr(STDIN_FILENO, TCSANOW, &quiet) == 0;
  }

  std::string password;
  const bool got_line = static_cast<bool>(std::getline(std::cin, password));

  if (echo_disabled) {
    tcsetattr(STDIN_FILENO, TCSANOW, &saved);
  }
  if (tty) {
    std::cerr << "\n";
  }

  if (!got_line) {
    return common::Result<std::string>::failure("no password entered",
                                                common::ErrorCode::InvalidArgument);
  }
  if (!password.empty() && password.back() == '\r') {
    password.pop_back();
  }
  return common::Result<std::string>::success(std::move(password));
}

} // namespace paramvault::params
