#pragma once

namespace mcpguard::cli {

/// Entry point of the `mcpguard` tool. Returns the process exit status.
int run_cli(int argc, char **argv);

} // namespace mcpguard::cli
