#pragma once

namespace sessionrelay::cli {

/// Entry point for the `sessionrelay` binary. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace sessionrelay::cli
