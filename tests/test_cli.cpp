#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "paramvault/cli/commands.hpp"
#include "paramvault/common/fs.hpp"
#include "paramvault/config/config.hpp"
#include "paramvault/crypto/encoding.hpp"
#include "paramvault/observability/global.hpp"
#include "paramvault/params/hardware_token.hpp"
#include "paramvault/params/keyring.hpp"

#include <iostream>

namespace {

namespace pt = paramvault::testing;

constexpr const char *FAST_CONFIG = "[kdf]\n"
                                    "profile = \"custom\"\n"
                                    "memory_cost = 10\n"
                                    "\n"
                                    "[observability]\n"
                                    "backend = \"none\"\n";

/// Isolated HOME, config file and database for one CLI run.
struct CliEnvironment {
  CliEnvironment()
      : home("HOME", workspace.path().string()),
        config_path("PARAMVAULT_CONFIG_PATH", (workspace.path() / "config.toml").string()),
        db("PARAMVAULT_PARAMETER_DB", (workspace.path() / "data" / "params.db").string()),
        password("PARAMVAULT_PARAMETER_DB_PASSWORD", "pw"),
        driver("PARAMVAULT_PARAMETER_DRIVER", std::nullopt),
        debug("PARAMVAULT_DEBUG", std::nullopt) {
    workspace.create_file("config.toml", FAST_CONFIG);
  }

  ~CliEnvironment() {
    paramvault::config::clear_config_path_override();
    paramvault::observability::set_global_observer(nullptr);
  }

  pt::TempWorkspace workspace;
  pt::EnvGuard home;
  pt::EnvGuard config_path;
  pt::EnvGuard db;
  pt::EnvGuard password;
  pt::EnvGuard driver;
  pt::EnvGuard debug;
};

struct CliOutput {
  int code = 0;
  std::string out;
  std::string err;
};

CliOutput run_command(std::vector<std::string> args) {
  args.insert(args.begin(), "paramvault");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  CliOutput output;
  pt::StreamCapture out(std::cout);
  pt::StreamCapture err(std::cerr);
  output.code = paramvault::cli::run_cli(static_cast<int>(args.size()), argv.data());
  output.out = out.text();
  output.err = err.text();
  return output;
}

} // namespace

void register_cli_tests(std::vector<paramvault::tests::TestCase> &tests) {
  using paramvault::tests::require;
  using paramvault::tests::require_code;
  namespace common = paramvault::common;
  namespace params = paramvault::params;

  tests.push_back({"cli_version_and_help", [] {
                     const auto version = run_command({"version"});
                     require(version.code == 0, "version exit code");
                     require(common::starts_with(version.out, "paramvault "), "version text");
                     const auto help = run_command({"--help"});
                     require(help.code == 0, "help exit code");
                     require(help.out.find("register-yubikey") != std::string::npos, "help text");
                   }});

  tests.push_back({"cli_unknown_command", [] {
                     const auto result = run_command({"frobnicate"});
                     require(result.code == 1, "non-zero exit");
                     require(result.err.find("Unknown command: frobnicate") != std::string::npos,
                             "message");
                   }});

  tests.push_back({"cli_init_set_get_list_rm", [] {
                     CliEnvironment env;
                     const auto init = run_command({"init"});
                     require(init.code == 0, "init: " + init.err);
                     require(std::filesystem::exists(env.workspace.path() / "data" / "params.db"),
                             "database created");

                     require(run_command({"set", "token", "abc123"}).code == 0, "set");
                     require(run_command({"set", "other", "x"}).code == 0, "set other");

                     const auto get = run_command({"get", "token"});
                     require(get.code == 0, "get: " + get.err);
                     require(get.out == "abc123\n", "get output: " + get.out);

                     const auto list = run_command({"list"});
                     require(list.code == 0, "list");
                     require(list.out == "other\ntoken\n", "sorted names: " + list.out);

                     require(run_command({"rm", "token"}).code == 0, "rm");
                     require(run_command({"rm", "token"}).code == 0, "rm is idempotent");
                     const auto missing = run_command({"get", "token"});
                     require(missing.code == 1, "get after rm fails");
                     require(missing.err.find("parameter not found") != std::string::npos,
                             "not found message");
                   }});

  tests.push_back({"cli_methods_marks_default", [] {
                     CliEnvironment env;
                     require(run_command({"init"}).code == 0, "init");
                     const auto methods = run_command({"methods"});
                     require(methods.code == 0, "methods");
                     require(methods.out == "* password\n", "methods output: " + methods.out);
                   }});

  tests.push_back({"cli_errors", [] {
                     CliEnvironment env;
                     const auto uninitialized = run_command({"get", "token"});
                     require(uninitialized.code == 1, "get before init");
                     require(uninitialized.err.find("not initialized") != std::string::npos,
                             "not initialized message: " + uninitialized.err);

                     require(run_command({"init"}).code == 0, "init");
                     const auto again = run_command({"init"});
                     require(again.code == 1, "second init");
                     require(again.err.find("already initialized") != std::string::npos,
                             "already initialized message");

                     require(run_command({"get"}).code == 1, "get without name");
                     require(run_command({"--method", "fingerprint", "get", "token"}).code == 1,
                             "unknown method");
                   }});

  tests.push_back({"cli_wrong_password", [] {
                     CliEnvironment env;
                     require(run_command({"init"}).code == 0, "init");
                     require(run_command({"set", "token", "abc123"}).code == 0, "set");
                     pt::EnvGuard wrong("PARAMVAULT_PARAMETER_DB_PASSWORD", "wrong");
                     const auto get = run_command({"get", "token"});
                     require(get.code == 1, "wrong password rejected");
                     require(get.out.empty(), "nothing printed");
                     require(get.err.find("authentication failed") != std::string::npos,
                             "auth message: " + get.err);
                   }});

  tests.push_back({"cli_rejects_remote_driver", [] {
                     CliEnvironment env;
                     pt::EnvGuard driver("PARAMVAULT_PARAMETER_DRIVER", "vault");
                     const auto result = run_command({"list"});
                     require(result.code == 1, "driver rejected");
                     require(result.err.find("Unsupported store.driver") != std::string::npos,
                             "driver message");
                   }});

  tests.push_back({"cli_config_flag", [] {
                     CliEnvironment env;
                     env.workspace.create_file("alt/config.toml",
                                               std::string(FAST_CONFIG) +
                                                   "\n[hardware_token]\nslot = 7\n");
                     const auto alt = (env.workspace.path() / "alt" / "config.toml").string();
                     const auto result = run_command({"--config=" + alt, "list"});
                     require(result.code == 1, "invalid slot from --config file");
                     require(result.err.find("hardware_token.slot") != std::string::npos,
                             "slot message");
                   }});

  tests.push_back({"cli_options_after_command_belong_to_it", [] {
                     CliEnvironment env;
                     require(run_command({"init"}).code == 0, "init");
                     require(run_command({"set", "flag", "--method=password"}).code == 0,
                             "value that looks like an option");
                     require(run_command({"set", "--config", "x"}).code == 0,
                             "name that looks like an option");
                     require(run_command({"get", "flag"}).out == "--method=password\n",
                             "value stored verbatim");
                     require(run_command({"get", "--config"}).out == "x\n", "name stored verbatim");
                     require(run_command({"--method", "password", "get", "flag"}).code == 0,
                             "leading option still parsed");
                     const auto dangling = run_command({"--config"});
                     require(dangling.code == 1, "leading option without value");
                     require(dangling.err.find("missing value for --config") != std::string::npos,
                             dangling.err);
                   }});

  tests.push_back({"secret_tool_keyring_commands", [] {
                     pt::FakeProcessRunner runner;
                     params::SecretToolKeyring keyring(runner, "secret-tool");
                     require(keyring.store("svc", "acct", "label", "c2VjcmV0").ok(), "store");
                     require(runner.commands.back() ==
                                 std::vector<std::string>{"secret-tool", "store", "--label=label",
                                                          "service", "svc", "account", "acct"},
                             "store argv");
                     require(runner.options_seen.back().stdin_text ==
                                 std::optional<std::string>("c2VjcmV0"),
                             "secret on stdin, not argv");

                     runner.push_result(0, "c2VjcmV0\n");
                     const auto found = keyring.lookup("svc", "acct");
                     require(found.ok(), found.error());
                     require(found.value() == "c2VjcmV0", "trimmed secret");
                     require(runner.commands.back() ==
                                 std::vector<std::string>{"secret-tool", "lookup", "service", "svc",
                                                          "account", "acct"},
                             "lookup argv");

                     runner.push_result(1, "");
                     require_code(keyring.lookup("svc", "acct"), common::ErrorCode::NotFound,
                                  "missing entry");
                     runner.push_result(127, "");
                     require_code(keyring.lookup("svc", "acct"),
                                  common::ErrorCode::DeviceUnavailable, "tool missing");
                     runner.push_failure("timed out", common::ErrorCode::DeviceUnavailable);
                     require(!keyring.store("svc", "acct", "label", "x").ok(), "store failure");
                   }});

  tests.push_back({"ykman_token_commands", [] {
                     pt::FakeProcessRunner runner;
                     params::YkmanToken token(runner, "ykman");

                     runner.push_result(0, "\n  9876543\n1234\n");
                     const auto serial = token.serial();
                     require(serial.ok(), serial.error());
                     require(serial.value() == "9876543", "first serial");
                     require(runner.commands.back() ==
                                 std::vector<std::string>{"ykman", "list", "--serials"},
                             "list argv");

                     runner.push_result(0, "");
                     require_code(token.serial(), common::ErrorCode::DeviceUnavailable,
                                  "no device");

                     runner.push_result(0, "a1b2c3\n");
                     const auto response =
                         token.challenge_response("9876543", 2, paramvault::crypto::Bytes{0xde, 0xad});
                     require(response.ok(), response.error());
                     require(response.value() == paramvault::crypto::Bytes{0xa1, 0xb2, 0xc3},
                             "decoded response");
                     require(runner.commands.back() ==
                                 std::vector<std::string>{"ykman", "--device", "9876543", "otp",
                                                          "calculate", "2", "dead"},
                             "calculate argv");
                     require(runner.options_seen.back().inherit_stderr, "touch prompt visible");

                     runner.push_result(0, "not hex");
                     require_code(token.challenge_response("9876543", 2, {0x01}),
                                  common::ErrorCode::DeviceUnavailable, "garbage response");
                     const auto calls = runner.commands.size();
                     require_code(token.challenge_response("9876543", 3, {0x01}),
                                  common::ErrorCode::InvalidArgument, "slot 3");
                     require(runner.commands.size() == calls, "slot checked before running ykman");
                   }});
}
