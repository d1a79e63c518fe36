#pragma once

#include <filesystem>
#include <map>
#include <string_view>
#include <optional>
#include <string>
#include <vector>

namespace cargo3ds::build {

/// One `[package.metadata.cargo-3ds]` target table.
struct TargetMetadata {
    std::optional<std::string> icon{};
    std::optional<std::string> romfs_dir{};
    std::optional<std::string> description{};

    /// Fields set in `other` win.
    void merge(const TargetMetadata& other);
};

struct Manifest {
    std::filesystem::path path{};
    std::string package_name{};
    std::vector<std::string> authors{};
    std::optional<std::string> description{};

    TargetMetadata defaults{};
    std::map<std::string, TargetMetadata> examples{};
    std::map<std::string, TargetMetadata> tests{};
    std::optional<TargetMetadata> lib{};

    std::filesystem::path dir() const { return path.parent_path(); }
};

inline constexpr const char* k_metadata_prefix = "package.metadata.cargo-3ds.";

/// Nearest `Cargo.toml` at or above `start`.
std::optional<std::filesystem::path> find_manifest(const std::filesystem::path& start);

bool load_manifest(const std::filesystem::path& path,
                   Manifest& out,
                   std::vector<std::string>& warnings,
                   std::string& err);

bool parse_manifest_text(std::string_view text,
                         const std::filesystem::path& path,
                         Manifest& out,
                         std::vector<std::string>& warnings,
                         std::string& err);

} // namespace cargo3ds::build
