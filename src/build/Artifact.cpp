#include <cargo3ds/build/Artifact.hpp>

#include <cargo3ds/build/Environment.hpp>

#include <algorithm>
#include <cctype>

namespace cargo3ds::build {

namespace {

namespace fs = std::filesystem;

bool is_elf(const fs::path& p) {
    return p.extension() == ".elf";
}

void collect(const fs::path& dir,
             Kind kind,
             bool recursive,
             std::vector<Artifact>& out) {
    std::error_code ec{};
    if (!fs::is_directory(dir, ec)) return;

    std::vector<fs::path> files{};
    if (recursive) {
        for (auto it = fs::recursive_directory_iterator(dir, ec);
             !ec && it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            if (it->is_regular_file(ec) && is_elf(it->path())) files.push_back(it->path());
        }
    } else {
        for (auto it = fs::directory_iterator(dir, ec);
             !ec && it != fs::directory_iterator();
             it.increment(ec)) {
            if (it->is_regular_file(ec) && is_elf(it->path())) files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());

    for (const auto& f : files) {
        Artifact a{};
        a.path = f;
        a.kind = kind;
        a.modified_time = fs::last_write_time(f, ec);
        if (ec) {
            ec.clear();
            continue;
        }
        a.name = strip_hash(f.stem().string());
        out.push_back(std::move(a));
    }
}

std::string normalize_target(std::string_view name) {
    std::string out(name);
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

bool names_contain(const std::vector<std::string>& names, std::string_view name) {
    const std::string want = normalize_target(name);
    for (const auto& n : names) {
        if (normalize_target(n) == want) return true;
    }
    return false;
}

// `--key value` or `--key=value`; advances `i` past a consumed value.
bool take_target_value(const std::vector<std::string>& args,
                       size_t& i,
                       std::string_view key,
                       std::vector<std::string>& out) {
    const std::string_view a = args[i];
    if (a == key) {
        if (i + 1 < args.size()) out.push_back(args[++i]);
        return true;
    }
    if (a.size() > key.size() && a.starts_with(key) && a[key.size()] == '=') {
        out.emplace_back(a.substr(key.size() + 1));
        return true;
    }
    return false;
}

} // namespace

const char* kind_name(Kind k) {
    switch (k) {
        case Kind::kBinary: return "binary";
        case Kind::kTest: return "test";
        case Kind::kExample: return "example";
        case Kind::kDoctest: return "doctest";
    }
    return "binary";
}

fs::path OutputLayout::dir() const {
    return target_dir / std::string(k_target_triple) / profile;
}

OutputLayout derive_layout(const std::vector<std::string>& build_args,
                           std::string_view cargo_target_dir_env,
                           const fs::path& base) {
    OutputLayout out{};
    std::optional<std::string> target_dir{};
    std::optional<std::string> profile{};
    bool release = false;

    for (size_t i = 0; i < build_args.size(); ++i) {
        const std::string_view a = build_args[i];
        if (a == "--release" || a == "-r") {
            release = true;
        } else if (a == "--target-dir" && i + 1 < build_args.size()) {
            target_dir = build_args[++i];
        } else if (a.starts_with("--target-dir=")) {
            target_dir = std::string(a.substr(13));
        } else if (a == "--profile" && i + 1 < build_args.size()) {
            profile = build_args[++i];
        } else if (a.starts_with("--profile=")) {
            profile = std::string(a.substr(10));
        }
    }

    if (target_dir.has_value()) out.target_dir = *target_dir;
    else if (!cargo_target_dir_env.empty()) out.target_dir = std::string(cargo_target_dir_env);
    else out.target_dir = "target";
    if (out.target_dir.is_relative()) out.target_dir = base / out.target_dir;

    if (profile.has_value()) {
        if (*profile == "dev") out.profile = "debug";
        else out.profile = *profile;
    } else if (release) {
        out.profile = "release";
    } else {
        out.profile = "debug";
    }
    return out;
}

std::string strip_hash(std::string_view stem) {
    constexpr size_t k_hash_len = 16;
    if (stem.size() <= k_hash_len + 1) return std::string(stem);
    const size_t dash = stem.size() - k_hash_len - 1;
    if (stem[dash] != '-') return std::string(stem);
    for (size_t i = dash + 1; i < stem.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(stem[i]))) return std::string(stem);
    }
    return std::string(stem.substr(0, dash));
}

std::vector<Artifact> scan_artifacts(const fs::path& out_dir, fs::file_time_type build_start) {
    std::vector<Artifact> all{};
    collect(out_dir, Kind::kBinary, false, all);
    collect(out_dir / "examples", Kind::kExample, false, all);
    collect(out_dir / "deps", Kind::kTest, false, all);
    collect(out_dir / "doctests", Kind::kDoctest, true, all);

    std::vector<Artifact> fresh{};
    for (auto& a : all) {
        a.fresh = a.modified_time >= build_start;
        if (a.fresh) fresh.push_back(a);
    }
    if (fresh.empty()) return all;
    return fresh;
}

std::vector<Artifact> keep_kinds(const std::vector<Artifact>& artifacts, std::initializer_list<Kind> kinds) {
    std::vector<Artifact> out{};
    for (const auto& a : artifacts) {
        if (std::find(kinds.begin(), kinds.end(), a.kind) != kinds.end()) out.push_back(a);
    }
    return out;
}

bool TargetFilter::empty() const {
    return bins.empty() && examples.empty() && tests.empty() &&
           !all_bins && !all_examples && !all_tests && !doc;
}

TargetFilter parse_target_filter(const std::vector<std::string>& build_args) {
    TargetFilter out{};
    for (size_t i = 0; i < build_args.size(); ++i) {
        const std::string_view a = build_args[i];
        if (a == "--bins") out.all_bins = true;
        else if (a == "--examples") out.all_examples = true;
        else if (a == "--tests") out.all_tests = true;
        else if (a == "--doc") out.doc = true;
        else if (!take_target_value(build_args, i, "--bin", out.bins) &&
                 !take_target_value(build_args, i, "--example", out.examples)) {
            (void)take_target_value(build_args, i, "--test", out.tests);
        }
    }
    return out;
}

std::vector<Artifact> deploy_candidates(const std::vector<Artifact>& artifacts,
                                        cli::Command command,
                                        const TargetFilter& filter) {
    if (command == cli::Command::kTest) {
        if (filter.empty()) return keep_kinds(artifacts, {Kind::kTest, Kind::kDoctest});

        std::vector<Artifact> out{};
        for (const auto& a : artifacts) {
            bool keep = false;
            if (a.kind == Kind::kDoctest) {
                keep = filter.doc;
            } else if (a.kind == Kind::kTest) {
                // Unit tests of a bin or example land in deps/ under the target's name.
                keep = filter.all_tests || filter.all_bins || filter.all_examples ||
                       names_contain(filter.tests, a.name) || names_contain(filter.bins, a.name) ||
                       names_contain(filter.examples, a.name);
            }
            if (keep) out.push_back(a);
        }
        return out;
    }

    if (command != cli::Command::kRun) return {};
    if (filter.bins.empty() && filter.examples.empty() && !filter.all_bins && !filter.all_examples) {
        return keep_kinds(artifacts, {Kind::kBinary});
    }

    std::vector<Artifact> out{};
    for (const auto& a : artifacts) {
        bool keep = false;
        if (a.kind == Kind::kBinary) keep = filter.all_bins || names_contain(filter.bins, a.name);
        else if (a.kind == Kind::kExample) keep = filter.all_examples || names_contain(filter.examples, a.name);
        if (keep) out.push_back(a);
    }
    return out;
}

std::optional<Artifact> select_latest(const std::vector<Artifact>& artifacts, diag::Error& err) {
    if (artifacts.empty()) {
        err = diag::make_error(diag::Code::B_NO_ARTIFACT_PRODUCED,
                               "Build produced no executable to deploy",
                               "filter the build with --bin, --example or --test");
        return std::nullopt;
    }

    const Artifact* best = &artifacts.front();
    for (const auto& a : artifacts) {
        if (a.modified_time >= best->modified_time) best = &a;
    }
    return *best;
}

} // namespace cargo3ds::build
