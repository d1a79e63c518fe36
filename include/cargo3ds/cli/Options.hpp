#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cargo3ds::cli {

inline constexpr uint32_t k_default_retries = 3;

enum class Mode : uint8_t {
    kUsage,
    kVersion,
    kCommand,
};

enum class Command : uint8_t {
    kNone,
    kBuild,
    kRun,
    kTest,
    kPassthrough,
};

/// Lexical role of a token after the subcommand name.
enum class TokenClass : uint8_t {
    kOrchestrator,
    kBoundary,
    kUnclassified,
};

struct DeployOptions {
    std::optional<std::string> address{};
    std::optional<std::string> argv0{};
    bool server = false;
    std::optional<uint32_t> retries{};
};

struct Options {
    Mode mode = Mode::kUsage;
    Command command = Command::kNone;
    std::string passthrough_name{};

    DeployOptions deploy{};
    std::vector<std::string> build_args{};
    std::vector<std::string> exec_args{};

    bool no_run = false;
    bool dry_run = false;

    bool ok = true;
    std::string error{};
};

const char* command_name(Command c);
bool takes_deploy_flags(Command c);

/// `test` stops after packaging when `--no-run` was claimed or forwarded to cargo.
bool skips_deploy(const Options& opt);

void print_usage(std::ostream& os);
Options parse_options(int argc, char** argv);
Options parse_args(const std::vector<std::string>& args);

} // namespace cargo3ds::cli
