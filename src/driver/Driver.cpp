#include <cargo3ds/driver/Driver.hpp>

#include <cargo3ds/build/Artifact.hpp>
#include <cargo3ds/build/Environment.hpp>
#include <cargo3ds/build/Invoker.hpp>
#include <cargo3ds/build/Manifest.hpp>
#include <cargo3ds/build/Package.hpp>
#include <cargo3ds/config/Config.hpp>
#include <cargo3ds/deploy/Cancel.hpp>
#include <cargo3ds/deploy/Deployer.hpp>
#include <cargo3ds/deploy/LinkTransport.hpp>
#include <cargo3ds/proc/Process.hpp>
#include <cargo3ds/toolchain/Resolver.hpp>
#include <cargo3ds/ui/Log.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cargo3ds::driver {

namespace {

namespace fs = std::filesystem;

struct RuntimeConfig {
    config::LoadedConfig loaded{};
    config::EffectiveSettings settings{};
    fs::path cwd{};
};

std::string getenv_string(const char* key) {
    const char* p = std::getenv(key);
    if (p == nullptr) return {};
    return std::string(p);
}

RuntimeConfig load_runtime_config() {
    RuntimeConfig cfg{};
    std::error_code ec{};
    cfg.cwd = fs::current_path(ec);
    if (ec) cfg.cwd = ".";
    cfg.loaded = config::load(cfg.cwd);
    cfg.settings = config::materialize(cfg.loaded, &cfg.loaded.warnings);
    return cfg;
}

std::string resolve_tool_with_config(std::string_view tool_name,
                                     const config::EffectiveSettings& settings,
                                     const std::string& toolchain_root) {
    toolchain::ResolveOptions ro{};
    ro.devkitpro = toolchain_root;
    if (tool_name == "smdhtool") ro.configured_path = settings.toolchain_smdhtool_path;
    else if (tool_name == "3dsxtool") ro.configured_path = settings.toolchain_3dsxtool_path;
    else if (tool_name == "3dslink") ro.configured_path = settings.toolchain_link_path;
    return toolchain::resolve_tool(tool_name, ro);
}

int report(const diag::Error& err) {
    ui::fail(err);
    return err.exit_code;
}

int run_passthrough(const cli::Options& opt, const config::EffectiveSettings& settings) {
    std::vector<std::string> argv{settings.toolchain_cargo_path.empty() ? "cargo" : settings.toolchain_cargo_path};
    argv.push_back(opt.passthrough_name);
    argv.insert(argv.end(), opt.build_args.begin(), opt.build_args.end());

    if (opt.dry_run) {
        std::cout << proc::format_command(argv) << "\n";
        return 0;
    }

    std::string spawn_err{};
    const int rc = proc::run_argv(argv, {}, &spawn_err);
    if (!spawn_err.empty()) ui::fail(spawn_err);
    return rc;
}

bool load_package_manifest(const fs::path& cwd, build::Manifest& manifest, diag::Error& err) {
    const auto path = build::find_manifest(cwd);
    if (!path.has_value()) {
        err = diag::make_error(diag::Code::B_PACKAGE_FAILED, "could not find Cargo.toml in " + cwd.string() + " or any parent");
        return false;
    }

    std::vector<std::string> warnings{};
    std::string load_err{};
    if (!build::load_manifest(*path, manifest, warnings, load_err)) {
        err = diag::make_error(diag::Code::B_PACKAGE_FAILED, "could not read the Cargo manifest", load_err);
        return false;
    }
    // Skipped dependency tables are expected here.
    for (const auto& w : warnings) {
        if (w.find("cargo-3ds metadata") != std::string::npos) ui::warn(w);
    }
    return true;
}

bool package_artifact(const build::Manifest& manifest,
                      const build::Artifact& artifact,
                      const build::Environment& env,
                      const build::PackageTools& tools,
                      build::PackageConfig& out,
                      diag::Error& err) {
    std::vector<std::string> warnings{};
    out = build::package_config_for(manifest, artifact, env.toolchain_root, &warnings);
    for (const auto& w : warnings) ui::warn(w);
    return build::package(out, tools, false, err);
}

int run_pipeline(const cli::Options& opt, const RuntimeConfig& runtime) {
    const auto& settings = runtime.settings;

    ui::progress(10, "Configuring the armv6k-nintendo-3ds toolchain");
    diag::Error err{};
    const auto env = build::configure(build::inputs_from(settings), err);
    if (!env.has_value()) return report(err);

    ui::progress(30, std::string("Running cargo for ") + cli::command_name(opt.command));
    build::InvokeOptions invoke_opt{};
    invoke_opt.dry_run = opt.dry_run;
    invoke_opt.base = runtime.loaded.paths.project_root.value_or(runtime.cwd);
    invoke_opt.cargo_target_dir_env = getenv_string("CARGO_TARGET_DIR");
    const auto result = build::invoke(*env, opt.command, opt.build_args, invoke_opt, err);
    if (!result.has_value()) return report(err);
    if (opt.dry_run) return 0;

    build::Manifest manifest{};
    if (!load_package_manifest(runtime.cwd, manifest, err)) return report(err);

    build::PackageTools tools{};
    tools.smdhtool = resolve_tool_with_config("smdhtool", settings, env->toolchain_root);
    tools.tool_3dsx = resolve_tool_with_config("3dsxtool", settings, env->toolchain_root);

    if (opt.command == cli::Command::kBuild) {
        const auto binaries = build::keep_kinds(result->artifacts, {build::Kind::kBinary});
        if (binaries.empty()) {
            ui::note("no executables to package");
        }
        for (const auto& artifact : binaries) {
            ui::progress(60, "Packaging " + artifact.path.filename().string());
            build::PackageConfig cfg{};
            if (!package_artifact(manifest, artifact, *env, tools, cfg, err)) return report(err);
        }
        ui::progress(100, "Build completed");
        ui::done("Build completed successfully");
        return 0;
    }

    const auto candidates = build::deploy_candidates(result->artifacts, opt.command,
                                                     build::parse_target_filter(opt.build_args));
    const auto selected = build::select_latest(candidates, err);
    if (!selected.has_value()) return report(err);

    ui::progress(60, "Packaging " + selected->path.filename().string() + " (" + build::kind_name(selected->kind) + ")");
    build::PackageConfig cfg{};
    if (!package_artifact(manifest, *selected, *env, tools, cfg, err)) return report(err);

    if (cli::skips_deploy(opt)) {
        ui::progress(100, "Packaged " + cfg.path_3dsx().string());
        ui::done("Test executable built, not sending it (--no-run)");
        return 0;
    }

    cli::DeployOptions deploy_opts = opt.deploy;
    if (!deploy_opts.address.has_value() && !settings.deploy_address.empty()) {
        deploy_opts.address = settings.deploy_address;
    }

    deploy::DeployPolicy policy{};
    policy.retries = deploy_opts.retries.value_or(static_cast<uint32_t>(settings.deploy_retries));
    policy.retry_delay = std::chrono::milliseconds(settings.deploy_retry_delay_ms);
    policy.discovery_timeout = std::chrono::milliseconds(settings.deploy_discovery_timeout_ms);

    deploy::LinkSettings link{};
    link.link_tool = resolve_tool_with_config("3dslink", settings, env->toolchain_root);
    link.connect_timeout = std::chrono::milliseconds(settings.deploy_connect_timeout_ms);

    deploy::LinkTransport transport(link);
    deploy::Deployer deployer(transport, deploy::install_interrupt_handler(), policy);

    deploy::TransferRequest req{};
    req.file = cfg.path_3dsx();
    req.argv0 = deploy_opts.argv0;
    req.exec_args = opt.exec_args;
    if (!deployer.deploy(req, deploy_opts, err)) return report(err);

    ui::progress(100, "Deployed to " + deployer.address());
    ui::done(deploy_opts.server ? std::string("Server stopped") : "Sent " + req.file.filename().string());
    return 0;
}

} // namespace

int run(const cli::Options& opt) {
    const auto runtime = load_runtime_config();
    ui::configure(ui::LogSettings{runtime.settings.ui_progress, runtime.settings.diag_color});
    for (const auto& w : runtime.loaded.warnings) {
        ui::warn(w);
    }

    switch (opt.command) {
        case cli::Command::kPassthrough:
            return run_passthrough(opt, runtime.settings);
        case cli::Command::kBuild:
        case cli::Command::kRun:
        case cli::Command::kTest:
            return run_pipeline(opt, runtime);
        case cli::Command::kNone:
            break;
    }
    cli::print_usage(std::cout);
    return 0;
}

} // namespace cargo3ds::driver
