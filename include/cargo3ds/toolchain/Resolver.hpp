#pragma once

#include <cargo3ds/diag/Error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cargo3ds::toolchain {

struct ResolveOptions {
    std::string configured_path{};
    std::string devkitpro{};
};

/// configured path, then `$DEVKITPRO/tools/bin/<tool>`, then the bare name (PATH lookup at spawn).
std::string resolve_tool(std::string_view tool_name, const ResolveOptions& opt);

enum class Channel : uint8_t {
    kDev,
    kNightly,
    kBeta,
    kStable,
};

struct RustcVersion {
    int major = 0;
    int minor = 0;
    int patch = 0;
    Channel channel = Channel::kStable;
    std::optional<std::string> commit_date{};
};

inline constexpr int k_min_rustc_major = 1;
inline constexpr int k_min_rustc_minor = 63;
inline constexpr int k_min_rustc_patch = 0;
inline constexpr std::string_view k_min_commit_date = "2022-06-15";

/// Parses the `rustc -vV` report (`release:` and `commit-date:` lines).
bool parse_rustc_version(std::string_view verbose_version, RustcVersion& out, std::string& err);

bool is_supported(const RustcVersion& v, diag::Error& err);

/// Runs `<rustc> -vV` and validates it.
bool check_rustc(const std::string& rustc, diag::Error& err);

/// `SYSROOT` from the environment, else `<rustc> --print sysroot`.
std::optional<std::string> query_sysroot(const std::string& rustc);

} // namespace cargo3ds::toolchain
