#pragma once

namespace sessionflow::cli {

/// Entry point for the sessionflow binary. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace sessionflow::cli
