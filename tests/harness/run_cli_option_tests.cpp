#include <cargo3ds/cli/Options.hpp>

#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

    using cargo3ds::cli::Command;
    using cargo3ds::cli::Mode;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static cargo3ds::cli::Options parse_(std::initializer_list<std::string_view> args) {
        std::vector<std::string> storage{};
        storage.reserve(args.size() + 1);
        storage.emplace_back("cargo-3ds");
        for (const auto a : args) {
            storage.emplace_back(a);
        }

        std::vector<char*> argv{};
        argv.reserve(storage.size());
        for (auto& s : storage) {
            argv.push_back(s.data());
        }

        return cargo3ds::cli::parse_options(static_cast<int>(argv.size()), argv.data());
    }

    static bool same_(const std::vector<std::string>& got, std::initializer_list<std::string_view> want) {
        if (got.size() != want.size()) return false;
        size_t i = 0;
        for (const auto w : want) {
            if (got[i++] != w) return false;
        }
        return true;
    }

    static bool test_usage_and_version_() {
        bool ok = true;
        ok &= require_(parse_({}).mode == Mode::kUsage, "no tokens must print usage");
        ok &= require_(parse_({"3ds"}).mode == Mode::kUsage, "bare cargo subcommand name must print usage");
        ok &= require_(parse_({"help"}).mode == Mode::kUsage, "help must print usage");
        ok &= require_(parse_({"3ds", "--help"}).mode == Mode::kUsage, "--help must print usage");
        ok &= require_(parse_({"-V"}).mode == Mode::kVersion, "-V must print version");
        ok &= require_(parse_({"run", "--version"}).mode == Mode::kVersion, "run --version must print version");

        const auto late = parse_({"run", "--release", "--help"});
        ok &= require_(late.mode == Mode::kCommand, "--help after a cargo flag belongs to cargo");
        ok &= require_(same_(late.build_args, {"--release", "--help"}), "--help must be forwarded to cargo");
        return ok;
    }

    static bool test_cargo_prefix_is_skipped_() {
        const auto opt = parse_({"3ds", "build", "--release"});

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(opt.command == Command::kBuild, "command must be build");
        ok &= require_(same_(opt.build_args, {"--release"}), "build args must be [--release]");
        return ok;
    }

    static bool test_no_separator_means_no_exec_args_() {
        const auto opt = parse_({"run", "--release", "--example", "hello", "--features", "x"});

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(opt.exec_args.empty(), "exec args must be empty without a separator");
        ok &= require_(same_(opt.build_args, {"--release", "--example", "hello", "--features", "x"}),
                       "every token must reach cargo");
        return ok;
    }

    static bool test_two_separators_split_build_and_exec_() {
        const auto opt = parse_({"run", "--address", "10.0.0.5", "--retries", "2", "--", "--verbose", "--", "xyz"});

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(opt.command == Command::kRun, "command must be run");
        ok &= require_(opt.deploy.address.has_value() && *opt.deploy.address == "10.0.0.5", "address must be claimed");
        ok &= require_(opt.deploy.retries.has_value() && *opt.deploy.retries == 2, "retries must be 2");
        ok &= require_(same_(opt.build_args, {"--verbose"}), "build args must be [--verbose]");
        ok &= require_(same_(opt.exec_args, {"xyz"}), "exec args must be [xyz]");
        return ok;
    }

    static bool test_passthrough_flag_then_single_separator_() {
        const auto opt = parse_({"test", "--address", "10.0.0.5", "--verbose", "--", "--test-arg", "1"});

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(opt.command == Command::kTest, "command must be test");
        ok &= require_(opt.deploy.address.has_value() && *opt.deploy.address == "10.0.0.5", "address must be claimed");
        ok &= require_(same_(opt.build_args, {"--verbose"}), "build args must be [--verbose]");
        ok &= require_(same_(opt.exec_args, {"--test-arg", "1"}), "exec args must be [--test-arg, 1]");
        return ok;
    }

    static bool test_single_separator_after_flags_goes_to_cargo_() {
        const auto opt = parse_({"run", "-a", "192.168.1.9", "--", "--release", "-p", "app"});

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(same_(opt.build_args, {"--release", "-p", "app"}), "tokens after one separator are build args");
        ok &= require_(opt.exec_args.empty(), "exec args must be empty");
        return ok;
    }

    static bool test_extra_separators_are_exec_content_() {
        const auto opt = parse_({"run", "--", "--release", "--", "a", "--", "b", "--"});

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(same_(opt.build_args, {"--release"}), "build args must be [--release]");
        ok &= require_(same_(opt.exec_args, {"a", "--", "b", "--"}), "later separators must stay in exec args");
        return ok;
    }

    static bool test_flags_after_boundary_not_reclaimed_() {
        const auto opt = parse_({"run", "--release", "--address", "1.2.3.4", "-s", "--retries", "9"});

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(!opt.deploy.address.has_value(), "address after cargo flag must not be claimed");
        ok &= require_(!opt.deploy.server, "server after cargo flag must not be claimed");
        ok &= require_(!opt.deploy.retries.has_value(), "retries after cargo flag must not be claimed");
        ok &= require_(same_(opt.build_args, {"--release", "--address", "1.2.3.4", "-s", "--retries", "9"}),
                       "orchestrator spellings must be forwarded verbatim");
        return ok;
    }

    static bool test_value_forms_and_server_() {
        const auto opt = parse_({"test", "--address=10.0.0.7", "-0", "sdmc:/app.3dsx", "--retries=0", "--server", "--no-run"});

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(opt.deploy.address.has_value() && *opt.deploy.address == "10.0.0.7", "--address= form must parse");
        ok &= require_(opt.deploy.argv0.has_value() && *opt.deploy.argv0 == "sdmc:/app.3dsx", "-0 must parse");
        ok &= require_(opt.deploy.retries.has_value() && *opt.deploy.retries == 0, "--retries=0 must parse");
        ok &= require_(opt.deploy.server, "--server must set server mode");
        ok &= require_(opt.no_run, "--no-run must be claimed by test");
        ok &= require_(opt.build_args.empty() && opt.exec_args.empty(), "nothing must be left for cargo");
        return ok;
    }

    static bool test_no_run_is_test_only_() {
        const auto opt = parse_({"run", "--no-run"});

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(!opt.no_run, "run must not claim --no-run");
        ok &= require_(same_(opt.build_args, {"--no-run"}), "--no-run must be forwarded for run");
        ok &= require_(!cargo3ds::cli::skips_deploy(opt), "run always deploys");
        return ok;
    }

    static bool test_forwarded_no_run_skips_deploy_() {
        const auto claimed = parse_({"test", "--no-run", "--lib"});
        const auto forwarded = parse_({"test", "--lib", "--no-run"});
        const auto plain = parse_({"test", "--lib"});

        bool ok = true;
        ok &= require_(claimed.no_run && cargo3ds::cli::skips_deploy(claimed), "claimed --no-run must skip deploy");
        ok &= require_(!forwarded.no_run, "--no-run after a cargo argument is not claimed");
        ok &= require_(same_(forwarded.build_args, {"--lib", "--no-run"}), "--no-run must reach cargo");
        ok &= require_(cargo3ds::cli::skips_deploy(forwarded), "forwarded --no-run must still skip deploy");
        ok &= require_(!cargo3ds::cli::skips_deploy(plain), "test without --no-run deploys");
        return ok;
    }

    static bool test_dry_run_before_command_() {
        const auto opt = parse_({"3ds", "--dry-run", "build", "--release"});

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(opt.dry_run, "--dry-run before the command must be claimed");
        ok &= require_(opt.command == Command::kBuild, "command must be build");
        ok &= require_(same_(opt.build_args, {"--release"}), "build args must be [--release]");

        const auto pass = parse_({"--dry-run", "clippy", "--all"});
        ok &= require_(pass.ok && pass.dry_run && pass.command == Command::kPassthrough,
                       "--dry-run must also apply to passthrough commands");
        ok &= require_(same_(pass.build_args, {"--all"}), "passthrough args must follow the name");
        return ok;
    }

    static bool test_build_ignores_deploy_flags_() {
        const auto opt = parse_({"build", "--address", "1.2.3.4", "--dry-run"});

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(!opt.deploy.address.has_value(), "build has no deploy stage");
        ok &= require_(same_(opt.build_args, {"--address", "1.2.3.4", "--dry-run"}),
                       "unknown flags end orchestrator scanning for build");

        const auto dry = parse_({"build", "--dry-run", "--release"});
        ok &= require_(dry.dry_run, "leading --dry-run must be claimed");
        ok &= require_(same_(dry.build_args, {"--release"}), "build args must be [--release]");
        return ok;
    }

    static bool test_argument_ambiguity_() {
        bool ok = true;
        ok &= require_(!parse_({"run", "--address"}).ok, "missing address value must fail");
        ok &= require_(!parse_({"run", "--address", "--", "x"}).ok, "separator as address value must fail");
        ok &= require_(!parse_({"run", "--argv0="}).ok, "empty argv0 value must fail");
        ok &= require_(!parse_({"test", "--retries", "many"}).ok, "non-numeric retries must fail");
        ok &= require_(!parse_({"test", "--retries", "-1"}).ok, "negative retries must fail");
        ok &= require_(!parse_({"build", "--", "--release", "--", "arg"}).ok, "exec args for build must fail");
        ok &= require_(!parse_({"--frobnicate", "run"}).ok, "unknown flag before the command must fail");

        const auto err = parse_({"run", "-a"});
        ok &= require_(err.error.find("-a") != std::string::npos, "error must name the flag");
        return ok;
    }

    static bool test_passthrough_is_verbatim_() {
        const auto opt = parse_({"clippy", "--address", "x", "--", "-D", "warnings", "--", "y"});

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(opt.command == Command::kPassthrough, "command must be passthrough");
        ok &= require_(opt.passthrough_name == "clippy", "passthrough name must be clippy");
        ok &= require_(same_(opt.build_args, {"--address", "x", "--", "-D", "warnings", "--", "y"}),
                       "passthrough tokens must be forwarded unchanged");
        ok &= require_(opt.exec_args.empty(), "passthrough has no exec args");
        return ok;
    }

    static bool test_tokens_are_partitioned_() {
        const std::vector<std::string> tail{"-a", "1.1.1.1", "-s", "--", "--lib", "--", "x", "y"};
        const auto opt = cargo3ds::cli::parse_args([&] {
            std::vector<std::string> all{"run"};
            all.insert(all.end(), tail.begin(), tail.end());
            return all;
        }());

        // 3 deploy tokens + 2 separators + build + exec
        const size_t accounted = 3 + 2 + opt.build_args.size() + opt.exec_args.size();

        bool ok = true;
        ok &= require_(opt.ok, "option parse must succeed");
        ok &= require_(accounted == tail.size(), "every tail token must land in exactly one group");
        ok &= require_(same_(opt.build_args, {"--lib"}), "build args must be [--lib]");
        ok &= require_(same_(opt.exec_args, {"x", "y"}), "exec args must be [x, y]");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"usage_and_version", test_usage_and_version_},
        {"cargo_prefix_is_skipped", test_cargo_prefix_is_skipped_},
        {"no_separator_means_no_exec_args", test_no_separator_means_no_exec_args_},
        {"two_separators_split_build_and_exec", test_two_separators_split_build_and_exec_},
        {"passthrough_flag_then_single_separator", test_passthrough_flag_then_single_separator_},
        {"single_separator_after_flags_goes_to_cargo", test_single_separator_after_flags_goes_to_cargo_},
        {"extra_separators_are_exec_content", test_extra_separators_are_exec_content_},
        {"flags_after_boundary_not_reclaimed", test_flags_after_boundary_not_reclaimed_},
        {"value_forms_and_server", test_value_forms_and_server_},
        {"no_run_is_test_only", test_no_run_is_test_only_},
        {"forwarded_no_run_skips_deploy", test_forwarded_no_run_skips_deploy_},
        {"dry_run_before_command", test_dry_run_before_command_},
        {"build_ignores_deploy_flags", test_build_ignores_deploy_flags_},
        {"argument_ambiguity", test_argument_ambiguity_},
        {"passthrough_is_verbatim", test_passthrough_is_verbatim_},
        {"tokens_are_partitioned", test_tokens_are_partitioned_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
