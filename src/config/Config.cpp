#include <cargo3ds/config/Config.hpp>

#include <cargo3ds/config/TomlLite.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <unordered_set>

namespace cargo3ds::config {

namespace {

std::string getenv_string(const char* key) {
    if (key == nullptr) return {};
    const char* p = std::getenv(key);
    if (p == nullptr) return {};
    return std::string(p);
}

std::filesystem::path home_dir() {
    const std::string home = getenv_string("HOME");
    if (!home.empty()) return std::filesystem::path(home);
    std::error_code ec{};
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
}

std::filesystem::path compute_global_config_path() {
    const std::string xdg = getenv_string("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        return std::filesystem::path(xdg) / "cargo-3ds" / "config.toml";
    }

#if defined(__APPLE__)
    return home_dir() / "Library" / "Application Support" / "cargo-3ds" / "config.toml";
#else
    return home_dir() / ".config" / "cargo-3ds" / "config.toml";
#endif
}

const std::unordered_set<std::string>& known_keys_() {
    static const std::unordered_set<std::string> k{
        "toolchain.devkitpro",
        "toolchain.cargo_path",
        "toolchain.rustc_path",
        "toolchain.link_path",
        "toolchain.smdhtool_path",
        "toolchain.3dsxtool_path",

        "deploy.address",
        "deploy.retries",
        "deploy.retry_delay_ms",
        "deploy.discovery_timeout_ms",
        "deploy.connect_timeout_ms",

        "diag.color",
        "ui.progress",
    };
    return k;
}

template <typename T>
const T* as_ptr(const Value* v) {
    if (v == nullptr) return nullptr;
    return std::get_if<T>(v);
}

void merge_into(FlatMap& base, const FlatMap& override_map) {
    for (const auto& [k, v] : override_map) {
        base[k] = v;
    }
}

void filter_unknown_keys(FlatMap& values, std::vector<std::string>& warnings, std::string_view source_name) {
    std::vector<std::string> to_erase{};
    for (const auto& [k, _] : values) {
        if (!is_known_key(k)) {
            warnings.push_back(std::string(source_name) + ": unknown key '" + k + "' ignored");
            to_erase.push_back(k);
        }
    }
    for (const auto& k : to_erase) {
        values.erase(k);
    }
}

void apply_env_string(std::string& dst, const char* key) {
    const auto v = getenv_string(key);
    if (!v.empty()) dst = v;
}

std::string normalize_color(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "auto" || value == "always" || value == "never") return value;
    return "auto";
}

} // namespace

bool is_known_key(std::string_view key) {
    return known_keys_().contains(std::string(key));
}

std::optional<std::filesystem::path> find_project_root(std::filesystem::path start) {
    std::error_code ec{};
    if (start.empty()) start = std::filesystem::current_path(ec);
    if (ec) return std::nullopt;

    if (!std::filesystem::exists(start, ec)) return std::nullopt;
    if (!std::filesystem::is_directory(start, ec)) {
        start = start.parent_path();
    }
    start = std::filesystem::absolute(start, ec);
    if (ec) return std::nullopt;

    for (std::filesystem::path cur = start; !cur.empty(); cur = cur.parent_path()) {
        if (std::filesystem::exists(cur / "Cargo.toml", ec) ||
            std::filesystem::exists(cur / ".git", ec)) {
            return cur;
        }
        const auto parent = cur.parent_path();
        if (parent == cur) break;
    }
    return std::nullopt;
}

Paths resolve_paths(const std::optional<std::filesystem::path>& anchor) {
    std::filesystem::path start{};
    if (anchor.has_value()) {
        start = *anchor;
    } else {
        std::error_code ec{};
        start = std::filesystem::current_path(ec);
        if (ec) start = ".";
    }

    Paths out{};
    out.global_config = compute_global_config_path();
    out.project_root = find_project_root(start);
    if (out.project_root.has_value()) {
        out.project_config = *out.project_root / ".cargo-3ds" / "config.toml";
    }
    return out;
}

LoadedConfig load(const std::optional<std::filesystem::path>& anchor) {
    LoadedConfig out{};
    out.paths = resolve_paths(anchor);

    {
        std::string err{};
        if (!toml_lite::parse_file(out.paths.global_config, out.global_values, out.warnings, err)) {
            out.warnings.push_back("failed to load global config: " + err);
        }
    }
    filter_unknown_keys(out.global_values, out.warnings, out.paths.global_config.string());
    if (!out.paths.project_config.empty()) {
        std::string err{};
        if (!toml_lite::parse_file(out.paths.project_config, out.project_values, out.warnings, err)) {
            out.warnings.push_back("failed to load project config: " + err);
        }
        filter_unknown_keys(out.project_values, out.warnings, out.paths.project_config.string());
    }

    out.effective_values = out.global_values;
    merge_into(out.effective_values, out.project_values);
    return out;
}

EffectiveSettings materialize(const LoadedConfig& cfg, std::vector<std::string>* warnings) {
    EffectiveSettings s{};
    const FlatMap& v = cfg.effective_values;

    auto read_string = [&](std::string_view key, std::string& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return;
        if (const auto* p = as_ptr<std::string>(&it->second); p != nullptr) {
            dst = *p;
            return;
        }
        if (warnings != nullptr) warnings->push_back("config key '" + std::string(key) + "' has wrong type (expected string)");
    };
    auto read_int = [&](std::string_view key, int64_t& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return;
        if (const auto* p = as_ptr<int64_t>(&it->second); p != nullptr) {
            dst = *p;
            return;
        }
        if (warnings != nullptr) warnings->push_back("config key '" + std::string(key) + "' has wrong type (expected int)");
    };
    auto read_bool = [&](std::string_view key, bool& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return;
        if (const auto* p = as_ptr<bool>(&it->second); p != nullptr) {
            dst = *p;
            return;
        }
        if (warnings != nullptr) warnings->push_back("config key '" + std::string(key) + "' has wrong type (expected bool)");
    };

    read_string("toolchain.devkitpro", s.toolchain_devkitpro);
    read_string("toolchain.cargo_path", s.toolchain_cargo_path);
    read_string("toolchain.rustc_path", s.toolchain_rustc_path);
    read_string("toolchain.link_path", s.toolchain_link_path);
    read_string("toolchain.smdhtool_path", s.toolchain_smdhtool_path);
    read_string("toolchain.3dsxtool_path", s.toolchain_3dsxtool_path);

    read_string("deploy.address", s.deploy_address);
    read_int("deploy.retries", s.deploy_retries);
    read_int("deploy.retry_delay_ms", s.deploy_retry_delay_ms);
    read_int("deploy.discovery_timeout_ms", s.deploy_discovery_timeout_ms);
    read_int("deploy.connect_timeout_ms", s.deploy_connect_timeout_ms);

    read_string("diag.color", s.diag_color);
    read_bool("ui.progress", s.ui_progress);

    s.diag_color = normalize_color(s.diag_color);

    apply_env_string(s.toolchain_devkitpro, "DEVKITPRO");
    apply_env_string(s.toolchain_cargo_path, "CARGO");
    apply_env_string(s.toolchain_rustc_path, "RUSTC");

    if (s.deploy_retries < 0) s.deploy_retries = 3;
    if (s.deploy_retry_delay_ms < 0) s.deploy_retry_delay_ms = 1000;
    if (s.deploy_discovery_timeout_ms < 1) s.deploy_discovery_timeout_ms = 10000;
    if (s.deploy_connect_timeout_ms < 1) s.deploy_connect_timeout_ms = 3000;

    return s;
}

const std::string* get_string(const FlatMap& values, std::string_view key) {
    const auto it = values.find(std::string(key));
    if (it == values.end()) return nullptr;
    return as_ptr<std::string>(&it->second);
}

const std::vector<std::string>* get_string_array(const FlatMap& values, std::string_view key) {
    const auto it = values.find(std::string(key));
    if (it == values.end()) return nullptr;
    return as_ptr<std::vector<std::string>>(&it->second);
}

} // namespace cargo3ds::config
