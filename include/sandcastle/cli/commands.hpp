#pragma once

namespace sandcastle::cli {

/// Entry point for the `sandcastle` executable. Returns the process exit code.
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace sandcastle::cli
