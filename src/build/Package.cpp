#include <cargo3ds/build/Package.hpp>

#include <cargo3ds/proc/Process.hpp>
#include <cargo3ds/ui/Log.hpp>

#include <algorithm>
#include <iostream>

namespace cargo3ds::build {

namespace {

namespace fs = std::filesystem;

std::string lib_target_name(std::string package_name) {
    std::replace(package_name.begin(), package_name.end(), '-', '_');
    return package_name;
}

TargetMetadata resolve_metadata(const Manifest& manifest, const Artifact& artifact) {
    TargetMetadata meta{};
    if (manifest.description.has_value()) meta.description = manifest.description;
    meta.merge(manifest.defaults);

    switch (artifact.kind) {
        case Kind::kExample:
            if (const auto it = manifest.examples.find(artifact.name); it != manifest.examples.end()) {
                meta.merge(it->second);
            }
            break;
        case Kind::kTest:
            if (const auto it = manifest.tests.find(artifact.name); it != manifest.tests.end()) {
                meta.merge(it->second);
            } else if (manifest.lib.has_value() && artifact.name == lib_target_name(manifest.package_name)) {
                meta.merge(*manifest.lib);
            }
            break;
        case Kind::kDoctest:
            if (manifest.lib.has_value()) meta.merge(*manifest.lib);
            break;
        case Kind::kBinary:
            break;
    }
    return meta;
}

std::string title_for(const Manifest& manifest, const Artifact& artifact) {
    switch (artifact.kind) {
        case Kind::kTest:
        case Kind::kDoctest:
            return artifact.name + " tests";
        case Kind::kExample:
            return artifact.name + " - " + manifest.package_name + " example";
        case Kind::kBinary:
            break;
    }
    return artifact.name;
}

bool run_tool(const std::vector<std::string>& argv, bool dry_run, const char* what, diag::Error& err) {
    if (dry_run) {
        std::cout << proc::format_command(argv) << "\n";
        return true;
    }
    std::string spawn_err{};
    const int rc = proc::run_argv(argv, {}, &spawn_err);
    if (rc == 0) return true;
    err = diag::make_child_error(diag::Code::B_PACKAGE_FAILED, rc,
                                 std::string(what) + " failed",
                                 spawn_err.empty() ? proc::format_command(argv) : spawn_err);
    return false;
}

} // namespace

fs::path PackageConfig::path_3dsx() const {
    return fs::path(elf_path).replace_extension("3dsx");
}

fs::path PackageConfig::path_smdh() const {
    return fs::path(elf_path).replace_extension("smdh");
}

PackageConfig package_config_for(const Manifest& manifest,
                                 const Artifact& artifact,
                                 const std::string& toolchain_root,
                                 std::vector<std::string>* warnings) {
    const TargetMetadata meta = resolve_metadata(manifest, artifact);
    const fs::path base = manifest.dir();

    PackageConfig cfg{};
    cfg.elf_path = artifact.path;
    cfg.name = title_for(manifest, artifact);
    cfg.author = manifest.authors.empty() ? k_default_author : manifest.authors.front();
    cfg.description = meta.description.value_or(k_default_description);

    std::error_code ec{};
    const fs::path default_icon = fs::path(toolchain_root) / "libctru" / "default_icon.png";
    const fs::path icon = base / meta.icon.value_or("icon.png");
    if (fs::exists(icon, ec)) {
        cfg.icon = icon;
    } else {
        if (meta.icon.has_value() && warnings != nullptr) {
            warnings->push_back("configured icon not found: " + icon.string() + ", using the libctru default");
        }
        cfg.icon = default_icon;
    }

    cfg.romfs_is_default = !meta.romfs_dir.has_value();
    cfg.romfs_dir = base / meta.romfs_dir.value_or("romfs");
    return cfg;
}

std::vector<std::string> smdh_argv(const PackageConfig& cfg, const PackageTools& tools) {
    return {
        tools.smdhtool,
        "--create",
        cfg.name,
        cfg.description,
        cfg.author,
        cfg.icon.string(),
        cfg.path_smdh().string(),
    };
}

std::vector<std::string> tdsx_argv(const PackageConfig& cfg, const PackageTools& tools, bool with_romfs) {
    std::vector<std::string> argv{
        tools.tool_3dsx,
        cfg.elf_path.string(),
        cfg.path_3dsx().string(),
        "--smdh=" + cfg.path_smdh().string(),
    };
    if (with_romfs) argv.push_back("--romfs=" + cfg.romfs_dir.string());
    return argv;
}

bool package(const PackageConfig& cfg, const PackageTools& tools, bool dry_run, diag::Error& err) {
    std::error_code ec{};
    const bool has_romfs = fs::is_directory(cfg.romfs_dir, ec);
    if (!has_romfs && !cfg.romfs_is_default) {
        err = diag::make_error(diag::Code::B_PACKAGE_FAILED,
                               "could not find configured RomFS dir",
                               cfg.romfs_dir.string());
        return false;
    }

    if (!run_tool(smdh_argv(cfg, tools), dry_run, "smdhtool", err)) return false;
    if (has_romfs) ui::note("adding RomFS from " + cfg.romfs_dir.string());
    return run_tool(tdsx_argv(cfg, tools, has_romfs), dry_run, "3dsxtool", err);
}

} // namespace cargo3ds::build
