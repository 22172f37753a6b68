#include "paramvault/cli/commands.hpp"

int main(int argc, char **argv) { return paramvault::cli::run_cli(argc, argv); }
