#pragma once

#include "sandcastle/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace sandcastle::common {

struct ProcessResult {
  int exit_code = 0;
  bool timed_out = false;
  std::string stdout_text;
  std::string stderr_text;
};

/// Run `command` through `/bin/sh -c` with `cwd` as working directory.
/// A non-zero exit is reported in the result, not as a failure. Failure means
/// the process could not be spawned; a timeout kills the child's whole process group and sets
/// `timed_out` with exit_code -1.
[[nodiscard]] Result<ProcessResult> run_shell_command(const std::string &command,
                                                      const std::filesystem::path &cwd,
                                                      std::chrono::milliseconds timeout);

} // namespace sandcastle::common
