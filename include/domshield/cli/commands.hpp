#pragma once

namespace domshield::cli {

/// Entry point for the `domshield` executable. Returns the process exit code.
int run_cli(int argc, char **argv);

} // namespace domshield::cli
