#pragma once

#include <cargo3ds/cli/Options.hpp>
#include <cargo3ds/diag/Error.hpp>

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cargo3ds::build {

enum class Kind : uint8_t {
    kBinary,
    kTest,
    kExample,
    kDoctest,
};

const char* kind_name(Kind k);

struct Artifact {
    std::filesystem::path path{};
    Kind kind = Kind::kBinary;
    std::filesystem::file_time_type modified_time{};
    std::string name{};
    bool fresh = false;
};

/// `<target_dir>/armv6k-nintendo-3ds/<profile>`
struct OutputLayout {
    std::filesystem::path target_dir{"target"};
    std::string profile{"debug"};

    std::filesystem::path dir() const;
};

/// Target dir from `--target-dir`, else `cargo_target_dir_env`, else `<base>/target`;
/// profile from `--release`/`-r`/`--profile`.
OutputLayout derive_layout(const std::vector<std::string>& build_args,
                           std::string_view cargo_target_dir_env,
                           const std::filesystem::path& base);

/// Drops cargo's `-<16 hex>` disambiguation suffix.
std::string strip_hash(std::string_view stem);

/// Every `.elf` under the layout directory tagged by location. If none is newer than
/// `build_start`, all of them are returned (up-to-date rebuild).
std::vector<Artifact> scan_artifacts(const std::filesystem::path& out_dir,
                                     std::filesystem::file_time_type build_start);

std::vector<Artifact> keep_kinds(const std::vector<Artifact>& artifacts, std::initializer_list<Kind> kinds);

/// Target selection found in cargo arguments: `--bin`, `--example`, `--test`
/// (`--name value` or `--name=value`), `--bins`, `--examples`, `--tests`, `--doc`.
struct TargetFilter {
    std::vector<std::string> bins{};
    std::vector<std::string> examples{};
    std::vector<std::string> tests{};
    bool all_bins = false;
    bool all_examples = false;
    bool all_tests = false;
    bool doc = false;

    bool empty() const;
};

TargetFilter parse_target_filter(const std::vector<std::string>& build_args);

/// Executables `command` may deploy. `run` keeps binaries and examples named by
/// the filter, or every binary without one; `test` keeps the named test
/// executables, or tests and doctests without a filter. Names compare with `-`
/// and `_` treated alike.
std::vector<Artifact> deploy_candidates(const std::vector<Artifact>& artifacts,
                                        cli::Command command,
                                        const TargetFilter& filter);

/// Latest modification time wins; equal times resolve to the later one in scan order.
std::optional<Artifact> select_latest(const std::vector<Artifact>& artifacts, diag::Error& err);

} // namespace cargo3ds::build
