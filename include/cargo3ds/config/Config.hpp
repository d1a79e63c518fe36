#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cargo3ds::config {

using Value = std::variant<std::string, int64_t, bool, std::vector<std::string>, std::vector<int64_t>>;
using FlatMap = std::map<std::string, Value>;

struct Paths {
    std::filesystem::path global_config{};
    std::filesystem::path project_config{};
    std::optional<std::filesystem::path> project_root{};
};

struct LoadedConfig {
    Paths paths{};
    FlatMap global_values{};
    FlatMap project_values{};
    FlatMap effective_values{};
    std::vector<std::string> warnings{};
};

struct EffectiveSettings {
    std::string toolchain_devkitpro{};
    std::string toolchain_cargo_path{};
    std::string toolchain_rustc_path{};
    std::string toolchain_link_path{};
    std::string toolchain_smdhtool_path{};
    std::string toolchain_3dsxtool_path{};

    std::string deploy_address{};
    int64_t deploy_retries = 3;
    int64_t deploy_retry_delay_ms = 1000;
    int64_t deploy_discovery_timeout_ms = 10000;
    int64_t deploy_connect_timeout_ms = 3000;

    std::string diag_color = "auto";
    bool ui_progress = true;
};

std::optional<std::filesystem::path> find_project_root(std::filesystem::path start);
Paths resolve_paths(const std::optional<std::filesystem::path>& anchor);

LoadedConfig load(const std::optional<std::filesystem::path>& anchor);
EffectiveSettings materialize(const LoadedConfig& cfg, std::vector<std::string>* warnings = nullptr);

bool is_known_key(std::string_view key);

const std::string* get_string(const FlatMap& values, std::string_view key);
const std::vector<std::string>* get_string_array(const FlatMap& values, std::string_view key);

} // namespace cargo3ds::config
