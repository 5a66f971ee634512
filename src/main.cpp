#include "mcpguard/cli/commands.hpp"

int main(int argc, char **argv) { return mcpguard::cli::run_cli(argc, argv); }
