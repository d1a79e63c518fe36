#pragma once

#include <string>
#include <utility>
#include <vector>

namespace cargo3ds::proc {

/// Variables set (or replaced) in the child's environment.
using EnvOverrides = std::vector<std::pair<std::string, std::string>>;

/// Spawns argv with inherited stdio and waits. Returns the child's exit code,
/// 128+signal when it was killed, and 127 when it could not be started.
int run_argv(const std::vector<std::string>& argv,
             const EnvOverrides& env = {},
             std::string* spawn_err = nullptr);

bool run_argv_capture_stdout(const std::vector<std::string>& argv, std::string& out, int& exit_code);

/// Shell-like rendering used for dry runs and failure details.
std::string format_command(const std::vector<std::string>& argv, const EnvOverrides& env = {});

} // namespace cargo3ds::proc
