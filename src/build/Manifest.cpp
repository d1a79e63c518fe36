#include <cargo3ds/build/Manifest.hpp>

#include <cargo3ds/config/Config.hpp>
#include <cargo3ds/config/TomlLite.hpp>

#include <fstream>
#include <iterator>
#include <string_view>

namespace cargo3ds::build {

namespace {

namespace fs = std::filesystem;

// Sets one field by its manifest spelling; false for unknown fields.
bool assign_field(TargetMetadata& meta, std::string_view field, const std::string& value) {
    if (field == "icon") {
        meta.icon = value;
    } else if (field == "romfs_dir" || field == "romfs-dir") {
        meta.romfs_dir = value;
    } else if (field == "description") {
        meta.description = value;
    } else {
        return false;
    }
    return true;
}

bool split_target_key(std::string_view rest, std::string& target, std::string& field) {
    const auto last = rest.rfind('.');
    if (last == std::string_view::npos || last == 0) return false;
    target = std::string(rest.substr(0, last));
    field = std::string(rest.substr(last + 1));
    return !target.empty() && !field.empty();
}

} // namespace

void TargetMetadata::merge(const TargetMetadata& other) {
    if (other.icon.has_value()) icon = other.icon;
    if (other.romfs_dir.has_value()) romfs_dir = other.romfs_dir;
    if (other.description.has_value()) description = other.description;
}

std::optional<fs::path> find_manifest(const fs::path& start) {
    std::error_code ec{};
    fs::path cur = start.empty() ? fs::current_path(ec) : fs::absolute(start, ec);
    if (ec) return std::nullopt;

    for (; !cur.empty(); cur = cur.parent_path()) {
        const fs::path candidate = cur / "Cargo.toml";
        if (fs::is_regular_file(candidate, ec)) return candidate;
        if (cur.parent_path() == cur) break;
    }
    return std::nullopt;
}

bool parse_manifest_text(std::string_view text,
                         const fs::path& path,
                         Manifest& out,
                         std::vector<std::string>& warnings,
                         std::string& err) {
    out = Manifest{};
    out.path = path;

    config::FlatMap values{};
    if (!config::toml_lite::parse_text(text, path.string(), values, warnings, err,
                                       config::toml_lite::Strictness::kTolerant)) {
        return false;
    }

    if (const auto* name = config::get_string(values, "package.name"); name != nullptr) {
        out.package_name = *name;
    } else {
        err = path.string() + ": missing package.name";
        return false;
    }
    if (const auto* authors = config::get_string_array(values, "package.authors"); authors != nullptr) {
        out.authors = *authors;
    }
    if (const auto* desc = config::get_string(values, "package.description"); desc != nullptr) {
        out.description = *desc;
    }

    const std::string_view prefix{k_metadata_prefix};
    for (const auto& [key, value] : values) {
        if (!key.starts_with(prefix)) continue;
        const std::string_view rest = std::string_view(key).substr(prefix.size());

        const auto* str = std::get_if<std::string>(&value);
        if (str == nullptr) {
            warnings.push_back(path.string() + ": cargo-3ds metadata '" + std::string(rest) + "' must be a string, ignored");
            continue;
        }

        bool known = false;
        std::string target{};
        std::string field{};
        if (rest.starts_with("examples.")) {
            if (split_target_key(rest.substr(9), target, field)) {
                known = assign_field(out.examples[target], field, *str);
            }
        } else if (rest.starts_with("tests.")) {
            if (split_target_key(rest.substr(6), target, field)) {
                known = assign_field(out.tests[target], field, *str);
            }
        } else if (rest.starts_with("lib.")) {
            if (!out.lib.has_value()) out.lib = TargetMetadata{};
            known = assign_field(*out.lib, rest.substr(4), *str);
        } else {
            known = assign_field(out.defaults, rest, *str);
        }

        if (!known) {
            warnings.push_back(path.string() + ": unknown cargo-3ds metadata '" + std::string(rest) + "' ignored");
        }
    }
    return true;
}

bool load_manifest(const fs::path& path,
                   Manifest& out,
                   std::vector<std::string>& warnings,
                   std::string& err) {
    std::error_code ec{};
    if (!fs::is_regular_file(path, ec)) {
        err = "Cargo manifest not found: " + path.string();
        return false;
    }

    std::string text{};
    {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs) {
            err = "failed to open file: " + path.string();
            return false;
        }
        text.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    }
    return parse_manifest_text(text, path, out, warnings, err);
}

} // namespace cargo3ds::build
