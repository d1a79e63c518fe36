#include <cargo3ds/toolchain/Resolver.hpp>

#include <cargo3ds/proc/Process.hpp>

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <vector>

namespace cargo3ds::toolchain {

namespace {

std::string getenv_string(const char* key) {
    if (key == nullptr) return {};
    const char* p = std::getenv(key);
    if (p == nullptr) return {};
    return std::string(p);
}

bool is_executable_file(const std::filesystem::path& p) {
    std::error_code ec{};
    return std::filesystem::exists(p, ec) && std::filesystem::is_regular_file(p, ec);
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r' || s[e - 1] == '\n')) --e;
    return std::string(s.substr(b, e - b));
}

bool parse_number(std::string_view s, int& out) {
    if (s.empty() || s.front() < '0' || s.front() > '9') return false;
    int v = 0;
    const auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || end != s.data() + s.size()) return false;
    out = v;
    return true;
}

// "1.66.0-nightly" -> numbers + channel
bool parse_release(std::string_view release, RustcVersion& out) {
    std::string_view pre{};
    const auto dash = release.find('-');
    if (dash != std::string_view::npos) {
        pre = release.substr(dash + 1);
        release = release.substr(0, dash);
    }

    int parts[3] = {0, 0, 0};
    size_t idx = 0;
    while (idx < 3) {
        const auto dot = release.find('.');
        if (!parse_number(release.substr(0, dot), parts[idx])) return false;
        ++idx;
        if (dot == std::string_view::npos) break;
        release = release.substr(dot + 1);
    }
    if (idx != 3) return false;

    out.major = parts[0];
    out.minor = parts[1];
    out.patch = parts[2];
    if (pre.empty()) out.channel = Channel::kStable;
    else if (pre.starts_with("nightly")) out.channel = Channel::kNightly;
    else if (pre.starts_with("dev")) out.channel = Channel::kDev;
    else if (pre.starts_with("beta")) out.channel = Channel::kBeta;
    else return false;
    return true;
}

} // namespace

std::string resolve_tool(std::string_view tool_name, const ResolveOptions& opt) {
    namespace fs = std::filesystem;

    if (!opt.configured_path.empty()) return opt.configured_path;

    if (!opt.devkitpro.empty()) {
        const fs::path bundled = fs::path(opt.devkitpro) / "tools" / "bin" / std::string(tool_name);
        if (is_executable_file(bundled)) return bundled.string();
    }

    return std::string(tool_name);
}

bool parse_rustc_version(std::string_view verbose_version, RustcVersion& out, std::string& err) {
    out = RustcVersion{};
    bool saw_release = false;

    std::istringstream iss{std::string(verbose_version)};
    std::string line{};
    while (std::getline(iss, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        const std::string key = trim(std::string_view(line).substr(0, colon));
        const std::string value = trim(std::string_view(line).substr(colon + 1));
        if (key == "release") {
            if (!parse_release(value, out)) {
                err = "unrecognized rustc release '" + value + "'";
                return false;
            }
            saw_release = true;
        } else if (key == "commit-date" && value != "unknown") {
            out.commit_date = value;
        }
    }

    if (!saw_release) {
        err = "rustc -vV did not report a release";
        return false;
    }
    return true;
}

bool is_supported(const RustcVersion& v, diag::Error& err) {
    if (v.channel > Channel::kNightly) {
        err = diag::make_error(diag::Code::T_COMPILER_UNSUPPORTED,
                               "cargo-3ds requires a nightly rustc version",
                               "run `rustup override set nightly` to use nightly in the current directory");
        return false;
    }

    const bool old_version =
        v.major != k_min_rustc_major ? v.major < k_min_rustc_major
        : v.minor != k_min_rustc_minor ? v.minor < k_min_rustc_minor
        : v.patch < k_min_rustc_patch;
    // ISO dates compare lexicographically.
    const bool old_commit = v.commit_date.has_value() && *v.commit_date < k_min_commit_date;

    if (old_version || old_commit) {
        err = diag::make_error(diag::Code::T_COMPILER_UNSUPPORTED,
                               "cargo-3ds requires rustc nightly version >= " + std::string(k_min_commit_date),
                               "run `rustup update nightly` to upgrade your nightly version");
        return false;
    }
    return true;
}

bool check_rustc(const std::string& rustc, diag::Error& err) {
    std::string out{};
    int exit_code = 1;
    if (!proc::run_argv_capture_stdout({rustc, "-vV"}, out, exit_code) || exit_code != 0) {
        err = diag::make_error(diag::Code::T_COMPILER_UNSUPPORTED,
                               "failed to query the rust compiler version",
                               proc::format_command({rustc, "-vV"}));
        return false;
    }

    RustcVersion v{};
    std::string parse_err{};
    if (!parse_rustc_version(out, v, parse_err)) {
        err = diag::make_error(diag::Code::T_COMPILER_UNSUPPORTED, parse_err);
        return false;
    }
    return is_supported(v, err);
}

std::optional<std::string> query_sysroot(const std::string& rustc) {
    const std::string env = getenv_string("SYSROOT");
    if (!env.empty()) return env;

    std::string out{};
    int exit_code = 1;
    if (!proc::run_argv_capture_stdout({rustc, "--print", "sysroot"}, out, exit_code) || exit_code != 0) {
        return std::nullopt;
    }
    std::string sysroot = trim(out);
    if (sysroot.empty()) return std::nullopt;
    return sysroot;
}

} // namespace cargo3ds::toolchain
