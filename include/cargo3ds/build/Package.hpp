#pragma once

#include <cargo3ds/build/Artifact.hpp>
#include <cargo3ds/build/Manifest.hpp>
#include <cargo3ds/diag/Error.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace cargo3ds::build {

inline constexpr const char* k_default_author = "Unspecified Author";
inline constexpr const char* k_default_description = "Homebrew Application";

struct PackageConfig {
    std::string name{};
    std::string author{};
    std::string description{};
    std::filesystem::path icon{};
    std::filesystem::path romfs_dir{};
    bool romfs_is_default = true;
    std::filesystem::path elf_path{};

    std::filesystem::path path_3dsx() const;
    std::filesystem::path path_smdh() const;
};

struct PackageTools {
    std::string smdhtool{"smdhtool"};
    std::string tool_3dsx{"3dsxtool"};
};

/// Title, author, description, icon and romfs for one artifact, with
/// `[package.metadata.cargo-3ds]` overrides applied.
PackageConfig package_config_for(const Manifest& manifest,
                                 const Artifact& artifact,
                                 const std::string& toolchain_root,
                                 std::vector<std::string>* warnings = nullptr);

std::vector<std::string> smdh_argv(const PackageConfig& cfg, const PackageTools& tools);
std::vector<std::string> tdsx_argv(const PackageConfig& cfg, const PackageTools& tools, bool with_romfs);

/// Runs smdhtool then 3dsxtool. With `dry_run` the commands are printed instead.
bool package(const PackageConfig& cfg, const PackageTools& tools, bool dry_run, diag::Error& err);

} // namespace cargo3ds::build
