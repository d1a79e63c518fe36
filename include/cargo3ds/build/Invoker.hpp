#pragma once

#include <cargo3ds/build/Artifact.hpp>
#include <cargo3ds/build/Environment.hpp>
#include <cargo3ds/cli/Options.hpp>
#include <cargo3ds/diag/Error.hpp>
#include <cargo3ds/proc/Process.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cargo3ds::build {

struct BuildResult {
    int exit_code = 0;
    std::vector<Artifact> artifacts{};
};

struct InvokeOptions {
    bool dry_run = false;
    // Relative target dirs resolve against this.
    std::filesystem::path base{};
    std::string cargo_target_dir_env{};
};

/// `cargo build|test --no-run --target armv6k-nintendo-3ds [-Z build-std] <build_args...>`
std::vector<std::string> make_cargo_argv(const Environment& env,
                                         cli::Command command,
                                         const std::vector<std::string>& build_args);

proc::EnvOverrides make_cargo_env(const Environment& env);

/// Runs cargo and scans its output directory. A non-zero exit is `B_BUILD_FAILED`
/// carrying the child's code; a dry run returns an empty result without scanning.
std::optional<BuildResult> invoke(const Environment& env,
                                  cli::Command command,
                                  const std::vector<std::string>& build_args,
                                  const InvokeOptions& opt,
                                  diag::Error& err);

} // namespace cargo3ds::build
