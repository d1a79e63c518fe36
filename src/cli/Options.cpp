#include <cargo3ds/cli/Options.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <limits>
#include <string>
#include <string_view>

namespace cargo3ds::cli {

namespace {

bool is_command(std::string_view s) {
    return s == "build" || s == "run" || s == "test" || s == "help";
}

Command to_command(std::string_view s) {
    if (s == "build") return Command::kBuild;
    if (s == "run") return Command::kRun;
    if (s == "test") return Command::kTest;
    return Command::kNone;
}

bool has_value_prefix(std::string_view a, std::string_view key) {
    return a.size() > key.size() && a.starts_with(key) && a[key.size()] == '=';
}

bool is_value_flag(std::string_view a, std::string_view long_key, std::string_view short_key) {
    if (a == long_key || has_value_prefix(a, long_key)) return true;
    return !short_key.empty() && a == short_key;
}

bool is_orchestrator_flag(std::string_view a, Command cmd) {
    if (a == "-h" || a == "--help" || a == "-V" || a == "--version" || a == "--dry-run") return true;
    if (!takes_deploy_flags(cmd)) return false;
    if (is_value_flag(a, "--address", "-a")) return true;
    if (is_value_flag(a, "--argv0", "-0")) return true;
    if (is_value_flag(a, "--retries", "")) return true;
    if (a == "-s" || a == "--server") return true;
    return cmd == Command::kTest && a == "--no-run";
}

TokenClass classify(std::string_view a, Command cmd) {
    if (a == "--") return TokenClass::kBoundary;
    if (is_orchestrator_flag(a, cmd)) return TokenClass::kOrchestrator;
    return TokenClass::kUnclassified;
}

bool parse_opt_value(const std::vector<std::string>& args,
                     size_t& i,
                     std::string_view key,
                     std::string& out,
                     std::string& err) {
    const std::string_view a = args[i];
    if (has_value_prefix(a, key)) {
        out = std::string(a.substr(key.size() + 1));
        if (out.empty()) {
            err = std::string(key) + " requires a value";
            return false;
        }
        return true;
    }

    if (i + 1 >= args.size() || args[i + 1] == "--") {
        err = std::string(key) + " requires a value";
        return false;
    }
    ++i;
    out = args[i];
    if (out.empty()) {
        err = std::string(key) + " requires a value";
        return false;
    }
    return true;
}

bool parse_u32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    for (const char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    try {
        const unsigned long long v = std::stoull(s);
        if (v > static_cast<unsigned long long>(std::numeric_limits<uint32_t>::max())) return false;
        out = static_cast<uint32_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

const char* command_name(Command c) {
    switch (c) {
        case Command::kBuild: return "build";
        case Command::kRun: return "run";
        case Command::kTest: return "test";
        case Command::kPassthrough: return "passthrough";
        case Command::kNone: return "none";
    }
    return "none";
}

bool takes_deploy_flags(Command c) {
    return c == Command::kRun || c == Command::kTest;
}

bool skips_deploy(const Options& opt) {
    if (opt.command != Command::kTest) return false;
    if (opt.no_run) return true;
    return std::find(opt.build_args.begin(), opt.build_args.end(), "--no-run") != opt.build_args.end();
}

void print_usage(std::ostream& os) {
    os
        << "cargo-3ds [3ds] <command> [options] [cargo-args] [-- [-- exe-args]]\n"
        << "\n"
        << "Commands:\n"
        << "  build                 build the package for armv6k-nintendo-3ds and create 3dsx files\n"
        << "  run                   build, then send the executable to a device with 3dslink\n"
        << "  test                  build a test executable, then send it to a device with 3dslink\n"
        << "  help                  print this message\n"
        << "  <other>               forwarded to cargo unmodified\n"
        << "\n"
        << "Options (run, test):\n"
        << "  -a, --address <ip>    device address (default: discover on the local network)\n"
        << "  -0, --argv0 <arg>     set the 0th argument of the executable\n"
        << "  -s, --server          keep the 3dslink server running after sending\n"
        << "      --retries <N>     extra connection attempts before giving up (default: "
        << k_default_retries << ")\n"
        << "      --no-run          (test) build and package, but do not send\n"
        << "\n"
        << "Global options:\n"
        << "  -h, --help\n"
        << "  -V, --version\n"
        << "\n"
        << "Options are only recognized before the first cargo argument. Everything after\n"
        << "the first '--' that follows cargo arguments is passed to the executable:\n"
        << "  cargo 3ds run --release -- -- arg1 arg2\n";
}

Options parse_options(int argc, char** argv) {
    std::vector<std::string> args{};
    if (argc > 1) args.reserve(static_cast<size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parse_args(args);
}

Options parse_args(const std::vector<std::string>& args) {
    Options out{};

    size_t i = 0;
    // `cargo 3ds ...` invokes us as `cargo-3ds 3ds ...`.
    if (i < args.size() && args[i] == "3ds") ++i;

    if (i >= args.size()) {
        out.mode = Mode::kUsage;
        return out;
    }

    for (; i < args.size(); ++i) {
        const std::string_view a = args[i];
        if (a == "-h" || a == "--help") {
            out.mode = Mode::kUsage;
            return out;
        }
        if (a == "-V" || a == "--version") {
            out.mode = Mode::kVersion;
            return out;
        }
        if (a == "help") {
            out.mode = Mode::kUsage;
            return out;
        }
        if (a == "--dry-run") {
            out.dry_run = true;
            continue;
        }
        if (is_command(a)) {
            out.command = to_command(a);
            out.mode = Mode::kCommand;
            ++i;
            break;
        }
        if (!a.empty() && a[0] == '-') {
            out.ok = false;
            out.error = "unknown option before command: " + std::string(a);
            return out;
        }

        out.command = Command::kPassthrough;
        out.passthrough_name = std::string(a);
        out.mode = Mode::kCommand;
        ++i;
        for (; i < args.size(); ++i) out.build_args.push_back(args[i]);
        return out;
    }

    // Orchestrator flags are claimed only up to the first boundary or unclassified token.
    for (; i < args.size(); ++i) {
        const std::string_view a = args[i];
        const TokenClass cls = classify(a, out.command);
        if (cls == TokenClass::kBoundary) {
            ++i;
            break;
        }
        if (cls == TokenClass::kUnclassified) break;

        if (a == "-h" || a == "--help") {
            out.mode = Mode::kUsage;
            return out;
        }
        if (a == "-V" || a == "--version") {
            out.mode = Mode::kVersion;
            return out;
        }
        if (a == "--dry-run") {
            out.dry_run = true;
            continue;
        }
        if (a == "--no-run") {
            out.no_run = true;
            continue;
        }
        if (a == "-s" || a == "--server") {
            out.deploy.server = true;
            continue;
        }
        if (is_value_flag(a, "--address", "-a")) {
            std::string v;
            if (!parse_opt_value(args, i, a.starts_with("--") ? "--address" : "-a", v, out.error)) {
                out.ok = false;
                return out;
            }
            out.deploy.address = std::move(v);
            continue;
        }
        if (is_value_flag(a, "--argv0", "-0")) {
            std::string v;
            if (!parse_opt_value(args, i, a.starts_with("--") ? "--argv0" : "-0", v, out.error)) {
                out.ok = false;
                return out;
            }
            out.deploy.argv0 = std::move(v);
            continue;
        }
        if (is_value_flag(a, "--retries", "")) {
            std::string v;
            if (!parse_opt_value(args, i, "--retries", v, out.error)) {
                out.ok = false;
                return out;
            }
            uint32_t parsed = 0;
            if (!parse_u32(v, parsed)) {
                out.ok = false;
                out.error = "--retries requires a non-negative integer";
                return out;
            }
            out.deploy.retries = parsed;
            continue;
        }

        out.ok = false;
        out.error = "unreachable option parse state: " + std::string(a);
        return out;
    }

    bool saw_exec_separator = false;
    for (; i < args.size(); ++i) {
        if (!saw_exec_separator && args[i] == "--") {
            saw_exec_separator = true;
            continue;
        }
        if (saw_exec_separator) {
            out.exec_args.push_back(args[i]);
        } else {
            out.build_args.push_back(args[i]);
        }
    }

    if (saw_exec_separator && !takes_deploy_flags(out.command)) {
        out.ok = false;
        out.error = "executable arguments after a second '--' are only accepted by 'run' and 'test'";
        return out;
    }

    return out;
}

} // namespace cargo3ds::cli
