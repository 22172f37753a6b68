#pragma once

namespace paramvault::cli {

/// Entry point for the paramvault executable. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace paramvault::cli
