#include "paramvault/cli/commands.hpp"

#include "paramvault/common/fs.hpp"
#include "paramvault/common/process.hpp"
#include "paramvault/config/config.hpp"
#include "paramvault/observability/factory.hpp"
#include "paramvault/observability/global.hpp"
#include "paramvault/params/hardware_token.hpp"
#include "paramvault/params/keyring.hpp"
#include "paramvault/params/parameter_store.hpp"
#include "paramvault/params/password_prompt.hpp"
#include "paramvault/params/unlock_registry.hpp"
#include "paramvault/storage/sqlite_kv_store.hpp"

#include <algorithm>
#include <charconv>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace paramvault::cli {

namespace {

struct GlobalOptions {
  std::optional<std::string> method;
};

/// Everything one command needs, wired from the loaded configuration.
struct Session {
  explicit Session(const config::Config &cfg, const crypto::KdfParams &kdf,
                   const GlobalOptions &globals)
      : config(cfg), store(cfg.store.path), keyring(runner, cfg.keyring.tool),
        token(runner, cfg.hardware_token.tool),
        registry(store, prompt, keyring, token,
                 params::RegistryOptions{.kdf_params = kdf,
                                         .keyring_service = cfg.keyring.service,
                                         .keyring_account = cfg.keyring.account,
                                         .password = cfg.store.password}) {
    options.read_only = cfg.store.read_only;
    if (globals.method.has_value()) {
      options.open_method = globals.method;
    } else if (!common::trim(cfg.store.open_method).empty()) {
      options.open_method = common::trim(cfg.store.open_method);
    }
  }

  [[nodiscard]] params::ParameterStore parameters() {
    return params::ParameterStore(store, registry, options);
  }

  config::Config config;
  common::SubprocessRunner runner;
  params::TerminalPasswordPrompt prompt;
  storage::SqliteKvStore store;
  params::SecretToolKeyring keyring;
  params::YkmanToken token;
  params::UnlockRegistry registry;
  params::SessionOptions options;
};

std::string version_string() {
#ifdef PARAMVAULT_VERSION
  std::string version = PARAMVAULT_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "paramvault " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
    if (common::starts_with(args[i], long_name + "=")) {
      out_value = args[i].substr(long_name.size() + 1);
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

// Global options come before the command; everything from the command on is left alone.
bool apply_global_options(std::vector<std::string> &args, GlobalOptions &globals,
                          std::string &error) {
  std::size_t consumed = 0;
  while (consumed < args.size()) {
    const std::string &arg = args[consumed];
    std::string name;
    std::string value;
    if (arg == "--config" || arg == "--method") {
      if (consumed + 1 >= args.size()) {
        error = "missing value for " + arg;
        return false;
      }
      name = arg;
      value = args[consumed + 1];
      consumed += 2;
    } else if (common::starts_with(arg, "--config=") || common::starts_with(arg, "--method=")) {
      const auto eq = arg.find('=');
      name = arg.substr(0, eq);
      value = arg.substr(eq + 1);
      consumed += 1;
    } else {
      break;
    }

    if (value.empty()) {
      error = "missing value for " + name;
      return false;
    }
    if (name == "--config") {
      config::set_config_path_override(value);
    } else {
      globals.method = value;
    }
  }
  args.erase(args.begin(), args.begin() + static_cast<long>(consumed));
  return true;
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

int fail(const std::string &message) {
  observability::record_error("cli", message);
  std::cerr << "error: " << message << "\n";
  return 1;
}

int fail(const common::Status &status) { return fail(status.error()); }

void print_help() {
  std::cout << version_string() << ": local encrypted parameter store\n\n";
  std::cout << "Usage: paramvault [--config PATH] [--method NAME] <command> [args]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  init                      Create the store, protected by a password\n";
  std::cout << "  register-keyring          Add an unlock method backed by the OS keyring\n";
  std::cout << "  register-yubikey [--slot N]\n";
  std::cout << "                            Add an unlock method backed by a YubiKey OTP slot\n";
  std::cout << "  methods                   List registered unlock methods\n";
  std::cout << "  list                      List parameter names\n";
  std::cout << "  get NAME                  Print a parameter value\n";
  std::cout << "  set NAME [VALUE|-]        Store a parameter (reads stdin without VALUE)\n";
  std::cout << "  rm NAME                   Remove a parameter\n";
  std::cout << "  version                   Show version\n\n";
  std::cout << "Unlock methods: password, keyring, yubikey, yubikey:<serial>\n";
}

int run_init(Session &session) {
  auto keys = session.registry.initialize_interactive();
  if (!keys.ok()) {
    return fail(keys.error());
  }
  std::cout << "Initialized parameter store at " << session.store.path().string() << "\n";
  return 0;
}

int run_register_keyring(Session &session) {
  auto keys = session.registry.resolve(session.options.open_method);
  if (!keys.ok()) {
    return fail(keys.error());
  }
  const auto status = session.registry.register_keyring(keys.value());
  if (!status.ok()) {
    return fail(status);
  }
  std::cout << "Registered keyring unlock method (now the default)\n";
  return 0;
}

int run_register_yubikey(Session &session, std::vector<std::string> args) {
  std::uint32_t slot = session.config.hardware_token.slot;
  std::string slot_raw;
  if (take_option(args, "--slot", "", slot_raw)) {
    const auto [ptr, ec] = std::from_chars(slot_raw.data(), slot_raw.data() + slot_raw.size(), slot);
    if (ec != std::errc() || ptr != slot_raw.data() + slot_raw.size()) {
      return fail("invalid --slot value: " + slot_raw);
    }
  }
  if (!args.empty()) {
    return fail("unexpected argument: " + args.front());
  }

  auto keys = session.registry.resolve(session.options.open_method);
  if (!keys.ok()) {
    return fail(keys.error());
  }
  std::cerr << "Touch your YubiKey if it blinks...\n";
  const auto record = session.registry.register_hardware_token(keys.value(), slot);
  if (!record.ok()) {
    return fail(record.error());
  }
  std::cout << "Registered " << record.value() << " (now the default)\n";
  return 0;
}

int run_methods(Session &session) {
  const auto methods = session.registry.methods();
  if (!methods.ok()) {
    return fail(methods.error());
  }
  const auto fallback = session.registry.default_method();
  if (!fallback.ok()) {
    return fail(fallback.error());
  }
  for (const auto &method : methods.value()) {
    const bool is_default =
        method == fallback.value() ||
        (fallback.value() == params::HARDWARE_TOKEN_METHOD &&
         common::starts_with(method, std::string(params::HARDWARE_TOKEN_METHOD) + ":"));
    std::cout << (is_default ? "* " : "  ") << method << "\n";
  }
  return 0;
}

int run_list(Session &session) {
  auto store = session.parameters();
  auto names = store.keys();
  if (!names.ok()) {
    return fail(names.error());
  }
  std::sort(names.value().begin(), names.value().end());
  for (const auto &name : names.value()) {
    std::cout << name << "\n";
  }
  return 0;
}

int run_get(Session &session, const std::vector<std::string> &args) {
  if (args.size() != 1) {
    return fail("usage: paramvault get NAME");
  }
  auto store = session.parameters();
  const auto value = store.get(args[0]);
  if (!value.ok()) {
    return fail(value.error());
  }
  std::cout << value.value() << "\n";
  return 0;
}

int run_set(Session &session, const std::vector<std::string> &args) {
  if (args.empty() || args.size() > 2) {
    return fail("usage: paramvault set NAME [VALUE|-]");
  }
  std::string value;
  if (args.size() == 2 && args[1] != "-") {
    value = args[1];
  } else {
    if (isatty(STDIN_FILENO) == 1) {
      std::cerr << "Tell me your secrets (type ^D when done)...\n";
    }
    value = read_stdin_all();
  }

  auto store = session.parameters();
  store.set_read_only(false);
  const auto status = store.set(args[0], value);
  if (!status.ok()) {
    return fail(status);
  }
  return 0;
}

int run_rm(Session &session, const std::vector<std::string> &args) {
  if (args.size() != 1) {
    return fail("usage: paramvault rm NAME");
  }
  auto store = session.parameters();
  store.set_read_only(false);
  const auto status = store.remove(args[0]);
  if (!status.ok()) {
    return fail(status);
  }
  return 0;
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + 1);
  GlobalOptions globals;
  std::string global_error;
  if (!apply_global_options(args, globals, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }

  const bool known = subcommand == "init" || subcommand == "register-keyring" ||
                     subcommand == "register-yubikey" || subcommand == "methods" ||
                     subcommand == "list" || subcommand == "get" || subcommand == "set" ||
                     subcommand == "rm";
  if (!known) {
    std::cerr << "Unknown command: " << subcommand << "\n";
    print_help();
    return 1;
  }

  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return fail(loaded.error());
  }
  const auto &cfg = loaded.value();
  const auto warnings = config::validate_config(cfg);
  if (!warnings.ok()) {
    return fail(warnings.error());
  }
  const auto kdf = config::kdf_params(cfg.kdf);
  if (!kdf.ok()) {
    return fail(kdf.error());
  }

  auto observer = observability::create_observer(cfg);
  if (!observer.ok()) {
    return fail(observer.error());
  }
  observability::set_global_observer(std::move(observer.value()));
  for (const auto &warning : warnings.value()) {
    std::cerr << "warning: " << warning << "\n";
  }

  Session session(cfg, kdf.value(), globals);
  if (!session.store.status().ok()) {
    return fail(session.store.status());
  }
  observability::record_store_opened(cfg.store.driver, session.store.path().string());

  int code = 1;
  if (subcommand == "init") {
    code = run_init(session);
  } else if (subcommand == "register-keyring") {
    code = run_register_keyring(session);
  } else if (subcommand == "register-yubikey") {
    code = run_register_yubikey(session, std::move(args));
  } else if (subcommand == "methods") {
    code = run_methods(session);
  } else if (subcommand == "list") {
    code = run_list(session);
  } else if (subcommand == "get") {
    code = run_get(session, args);
  } else if (subcommand == "set") {
    code = run_set(session, args);
  } else if (subcommand == "rm") {
    code = run_rm(session, args);
  }

  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return code;
}

} // namespace paramvault::cli
