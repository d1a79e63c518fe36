#include <cargo3ds/build/Invoker.hpp>

#include <algorithm>
#include <iostream>

namespace cargo3ds::build {

std::vector<std::string> make_cargo_argv(const Environment& env,
                                         cli::Command command,
                                         const std::vector<std::string>& build_args) {
    std::vector<std::string> argv{env.cargo};
    if (command == cli::Command::kTest) {
        argv.push_back("test");
        if (std::find(build_args.begin(), build_args.end(), "--no-run") == build_args.end()) {
            argv.push_back("--no-run");
        }
    } else {
        // cargo cannot run a 3DS binary on the host, so `run` builds too.
        argv.push_back("build");
    }
    argv.push_back("--target");
    argv.push_back(env.target_triple);
    if (env.build_std) {
        argv.push_back("-Z");
        argv.push_back("build-std");
    }
    argv.insert(argv.end(), build_args.begin(), build_args.end());
    return argv;
}

proc::EnvOverrides make_cargo_env(const Environment& env) {
    return {{"RUSTFLAGS", env.compiler_flags}};
}

std::optional<BuildResult> invoke(const Environment& env,
                                  cli::Command command,
                                  const std::vector<std::string>& build_args,
                                  const InvokeOptions& opt,
                                  diag::Error& err) {
    const auto argv = make_cargo_argv(env, command, build_args);
    const auto cargo_env = make_cargo_env(env);

    if (opt.dry_run) {
        std::cout << proc::format_command(argv, cargo_env) << "\n";
        return BuildResult{};
    }

    const auto build_start = std::filesystem::file_time_type::clock::now();
    std::string spawn_err{};
    const int rc = proc::run_argv(argv, cargo_env, &spawn_err);
    if (rc != 0) {
        err = diag::make_child_error(diag::Code::B_BUILD_FAILED, rc,
                                     "Build failed (cargo exited with " + std::to_string(rc) + ")",
                                     spawn_err);
        return std::nullopt;
    }

    BuildResult out{};
    out.exit_code = rc;
    const OutputLayout layout = derive_layout(build_args, opt.cargo_target_dir_env, opt.base);
    out.artifacts = scan_artifacts(layout.dir(), build_start);
    return out;
}

} // namespace cargo3ds::build
