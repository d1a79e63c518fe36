#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

namespace fs = std::filesystem;

std::pair<int, std::string> run_capture(const std::string& command) {
    const std::string tmp = "/tmp/cargo3ds_cli_capture_" + std::to_string(::getpid()) + ".txt";
    const std::string full = command + " > " + tmp + " 2>&1";
    const int status = std::system(full.c_str());
    const int rc = WIFEXITED(status) ? WEXITSTATUS(status) : -1;

    std::ifstream ifs(tmp, std::ios::binary);
    std::string out;
    if (ifs) {
        out.assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    }
    std::remove(tmp.c_str());
    return {rc, out};
}

bool contains(const std::string& s, const std::string& needle) {
    return s.find(needle) != std::string::npos;
}

bool write_text(const fs::path& path, const std::string& text) {
    std::error_code ec{};
    fs::create_directories(path.parent_path(), ec);
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) return false;
    ofs << text;
    return ofs.good();
}

std::string read_text(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    std::string out;
    if (ifs) out.assign((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return out;
}

bool write_script(const fs::path& path, const std::string& body) {
    if (!write_text(path, "#!/bin/sh\n" + body)) return false;
    std::error_code ec{};
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                              fs::perms::others_read | fs::perms::others_exec, ec);
    return !ec;
}

// A throwaway crate plus stand-ins for cargo, rustc and the devkitPro tools.
struct Sandbox {
    fs::path root{};
    fs::path bin{};
    fs::path dkp{};
    fs::path proj{};
    fs::path logs{};
    fs::path xdg{};

    ~Sandbox() {
        std::error_code ec{};
        if (!root.empty()) fs::remove_all(root, ec);
    }

    // Environment prefix for every cargo-3ds invocation in this sandbox.
    std::string env(const std::string& extra = {}) const {
        return "cd \"" + proj.string() + "\" && env -u RUSTFLAGS -u CARGO_TARGET_DIR"
               " NO_COLOR=1"
               " XDG_CONFIG_HOME=\"" + xdg.string() + "\""
               " DEVKITPRO=\"" + dkp.string() + "\""
               " SYSROOT=\"" + dkp.string() + "/sysroot\""
               " CARGO=\"" + (bin / "cargo").string() + "\""
               " RUSTC=\"" + (bin / "rustc").string() + "\""
               " LOG_DIR=\"" + logs.string() + "\" " +
               extra + " ";
    }
};

bool make_sandbox(Sandbox& sb, const char* tag) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    sb.root = fs::temp_directory_path() /
        ("cargo3ds-cli-" + std::string(tag) + "-" + std::to_string(::getpid()) + "-" + std::to_string(stamp));
    sb.bin = sb.root / "bin";
    sb.dkp = sb.root / "devkitpro";
    sb.proj = sb.root / "app";
    sb.logs = sb.root / "logs";
    sb.xdg = sb.root / "xdg";

    std::error_code ec{};
    fs::create_directories(sb.logs, ec);
    fs::create_directories(sb.xdg, ec);
    fs::create_directories(sb.dkp / "libctru" / "lib", ec);
    fs::create_directories(sb.dkp / "sysroot" / "lib" / "rustlib" / "armv6k-nintendo-3ds", ec);
    if (ec) return false;

    bool ok = true;
    ok &= write_text(sb.dkp / "libctru" / "default_icon.png", "png");
    ok &= write_text(sb.proj / "Cargo.toml",
                     "[package]\n"
                     "name = \"app\"\n"
                     "version = \"0.1.0\"\n"
                     "authors = [\"Tester\"]\n"
                     "\n"
                     "[dependencies]\n"
                     "ctru-rs = { git = \"https://github.com/rust3ds/ctru-rs\" }\n");

    ok &= write_script(sb.bin / "rustc",
                       "if [ \"$1\" = \"-vV\" ]; then\n"
                       "  echo \"rustc 1.74.0-nightly (0000000 2023-09-01)\"\n"
                       "  echo \"release: ${FAKE_RUSTC_RELEASE:-1.74.0-nightly}\"\n"
                       "  echo \"commit-date: 2023-09-01\"\n"
                       "fi\n");
    ok &= write_script(sb.bin / "cargo",
                       "echo \"$@\" > \"$LOG_DIR/cargo.args\"\n"
                       "echo \"$RUSTFLAGS\" > \"$LOG_DIR/rustflags\"\n"
                       "if [ -n \"$FAKE_CARGO_EXIT\" ]; then exit \"$FAKE_CARGO_EXIT\"; fi\n"
                       "out=target/armv6k-nintendo-3ds/debug\n"
                       "for a in \"$@\"; do\n"
                       "  if [ \"$a\" = \"--release\" ]; then out=target/armv6k-nintendo-3ds/release; fi\n"
                       "done\n"
                       "mkdir -p \"$out/deps\"\n"
                       "case \"$1\" in\n"
                       "  test) : > \"$out/deps/app-0123456789abcdef.elf\" ;;\n"
                       "  build) : > \"$out/app.elf\" ;;\n"
                       "esac\n"
                       "exit 0\n");
    ok &= write_script(sb.dkp / "tools" / "bin" / "smdhtool",
                       "echo \"$@\" > \"$LOG_DIR/smdhtool.args\"\n"
                       ": > \"$6\"\n");
    ok &= write_script(sb.dkp / "tools" / "bin" / "3dsxtool",
                       "echo \"$@\" > \"$LOG_DIR/3dsxtool.args\"\n"
                       ": > \"$2\"\n");
    ok &= write_script(sb.dkp / "tools" / "bin" / "3dslink",
                       "echo \"$@\" > \"$LOG_DIR/3dslink.args\"\n"
                       "exit ${FAKE_LINK_EXIT:-0}\n");
    return ok;
}

// Accepts TCP connections on the loopback link port without ever reading.
class FakeConsole {
public:
    FakeConsole() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) return;
        int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(17491);
        ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd_, 8) != 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }
    ~FakeConsole() {
        if (fd_ >= 0) ::close(fd_);
    }
    FakeConsole(const FakeConsole&) = delete;
    FakeConsole& operator=(const FakeConsole&) = delete;

    bool ok() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

bool test_help_and_version() {
    const std::string bin = CARGO3DS_BUILD_BIN;

    auto [rc_help, out_help] = run_capture("\"" + bin + "\" 3ds --help");
    if (rc_help != 0 || !contains(out_help, "cargo-3ds [3ds] <command>")) {
        std::cerr << "help failed\n" << out_help;
        return false;
    }

    auto [rc_ver, out_ver] = run_capture("\"" + bin + "\" -V");
    if (rc_ver != 0 || !contains(out_ver, "cargo-3ds v")) {
        std::cerr << "version failed\n" << out_ver;
        return false;
    }
    return true;
}

bool test_argument_ambiguity_exit() {
    const std::string bin = CARGO3DS_BUILD_BIN;

    auto [rc, out] = run_capture("\"" + bin + "\" run --address");
    if (rc != 2 || !contains(out, "A_ARGUMENT_AMBIGUITY")) {
        std::cerr << "missing flag value must exit 2 (rc=" << rc << ")\n" << out;
        return false;
    }

    auto [rc_build, out_build] = run_capture("\"" + bin + "\" build -- --release -- arg");
    if (rc_build != 2) {
        std::cerr << "exec args for build must exit 2 (rc=" << rc_build << ")\n" << out_build;
        return false;
    }
    return true;
}

bool test_passthrough_forwards_verbatim() {
    Sandbox sb{};
    if (!make_sandbox(sb, "pass")) return false;
    const std::string bin = CARGO3DS_BUILD_BIN;

    auto [rc, out] = run_capture(sb.env("FAKE_CARGO_EXIT=5") + "\"" + bin + "\" 3ds clippy --all -- -D warnings");
    const std::string args = read_text(sb.logs / "cargo.args");
    if (rc != 5 || !contains(args, "clippy --all -- -D warnings")) {
        std::cerr << "passthrough failed (rc=" << rc << ", args=" << args << ")\n" << out;
        return false;
    }
    return true;
}

bool test_missing_toolchain_exit() {
    Sandbox sb{};
    if (!make_sandbox(sb, "dkp")) return false;
    const std::string bin = CARGO3DS_BUILD_BIN;

    auto [rc, out] = run_capture(sb.env("DEVKITPRO=") + "\"" + bin + "\" build");
    if (rc != 3 || !contains(out, "DEVKITPRO is not set")) {
        std::cerr << "missing DEVKITPRO must exit 3 (rc=" << rc << ")\n" << out;
        return false;
    }
    if (fs::exists(sb.logs / "cargo.args")) {
        std::cerr << "cargo must not run without a toolchain\n";
        return false;
    }
    return true;
}

bool test_stable_compiler_rejected() {
    Sandbox sb{};
    if (!make_sandbox(sb, "stable")) return false;
    const std::string bin = CARGO3DS_BUILD_BIN;

    auto [rc, out] = run_capture(sb.env("FAKE_RUSTC_RELEASE=1.74.0") + "\"" + bin + "\" build");
    if (rc == 0 || !contains(out, "requires a nightly rustc")) {
        std::cerr << "stable rustc must be rejected (rc=" << rc << ")\n" << out;
        return false;
    }
    return true;
}

bool test_build_failure_keeps_cargo_exit() {
    Sandbox sb{};
    if (!make_sandbox(sb, "fail")) return false;
    const std::string bin = CARGO3DS_BUILD_BIN;

    auto [rc, out] = run_capture(sb.env("FAKE_CARGO_EXIT=101") + "\"" + bin + "\" build --release");
    if (rc != 101 || !contains(out, "B_BUILD_FAILED")) {
        std::cerr << "cargo exit code must propagate (rc=" << rc << ")\n" << out;
        return false;
    }
    if (fs::exists(sb.logs / "smdhtool.args")) {
        std::cerr << "nothing must be packaged after a failed build\n";
        return false;
    }
    return true;
}

bool test_dry_run_prints_cargo_command() {
    Sandbox sb{};
    if (!make_sandbox(sb, "dry")) return false;
    const std::string bin = CARGO3DS_BUILD_BIN;

    auto [rc, out] = run_capture(sb.env() + "\"" + bin + "\" build --dry-run --release");
    if (rc != 0 ||
        !contains(out, "build --target armv6k-nintendo-3ds --release") ||
        !contains(out, "RUSTFLAGS=") ||
        !contains(out, "/libctru/lib -lctru")) {
        std::cerr << "dry run output mismatch (rc=" << rc << ")\n" << out;
        return false;
    }
    if (fs::exists(sb.logs / "cargo.args")) {
        std::cerr << "dry run must not spawn cargo\n";
        return false;
    }
    return true;
}

bool test_build_packages_binary() {
    Sandbox sb{};
    if (!make_sandbox(sb, "build")) return false;
    const std::string bin = CARGO3DS_BUILD_BIN;

    auto [rc, out] = run_capture(sb.env() + "\"" + bin + "\" build");
    const std::string cargo_args = read_text(sb.logs / "cargo.args");
    const std::string rustflags = read_text(sb.logs / "rustflags");
    const std::string smdh = read_text(sb.logs / "smdhtool.args");
    const std::string tdsx = read_text(sb.logs / "3dsxtool.args");

    if (rc != 0) {
        std::cerr << "build failed (rc=" << rc << ")\n" << out;
        return false;
    }
    if (!contains(cargo_args, "build --target armv6k-nintendo-3ds") ||
        !contains(rustflags, "-L" + sb.dkp.string() + "/libctru/lib -lctru")) {
        std::cerr << "cargo invocation mismatch: " << cargo_args << " / " << rustflags << "\n";
        return false;
    }
    if (!contains(smdh, "--create app Homebrew Application Tester") || !contains(smdh, "default_icon.png")) {
        std::cerr << "smdhtool args mismatch: " << smdh << "\n";
        return false;
    }
    if (!contains(tdsx, "app.elf") || !contains(tdsx, "--smdh=") || contains(tdsx, "--romfs=")) {
        std::cerr << "3dsxtool args mismatch: " << tdsx << "\n";
        return false;
    }
    if (!fs::exists(sb.proj / "target" / "armv6k-nintendo-3ds" / "debug" / "app.3dsx")) {
        std::cerr << "3dsx must be written beside the elf\n";
        return false;
    }
    return true;
}

bool test_no_run_packages_test_only() {
    Sandbox sb{};
    if (!make_sandbox(sb, "norun")) return false;
    const std::string bin = CARGO3DS_BUILD_BIN;

    auto [rc, out] = run_capture(sb.env() + "\"" + bin + "\" test --no-run");
    const std::string cargo_args = read_text(sb.logs / "cargo.args");
    const std::string smdh = read_text(sb.logs / "smdhtool.args");

    if (rc != 0 || !contains(cargo_args, "test --no-run --target armv6k-nintendo-3ds") ||
        !contains(smdh, "--create app tests")) {
        std::cerr << "test --no-run failed (rc=" << rc << ")\n" << out << cargo_args << smdh;
        return false;
    }
    if (fs::exists(sb.logs / "3dslink.args")) {
        std::cerr << "--no-run must not deploy\n";
        return false;
    }
    return true;
}

bool test_run_sends_to_console() {
    FakeConsole console{};
    if (!console.ok()) {
        std::cerr << "note: loopback link port busy, skipping\n";
        return true;
    }

    Sandbox sb{};
    if (!make_sandbox(sb, "run")) return false;
    const std::string bin = CARGO3DS_BUILD_BIN;

    auto [rc, out] = run_capture(sb.env() + "\"" + bin + "\" run -a 127.0.0.1 -0 sdmc:/app.3dsx -- --release -- --verbose");
    const std::string cargo_args = read_text(sb.logs / "cargo.args");
    const std::string link = read_text(sb.logs / "3dslink.args");

    if (rc != 0) {
        std::cerr << "run failed (rc=" << rc << ")\n" << out;
        return false;
    }
    if (!contains(cargo_args, "--release") || contains(cargo_args, "--verbose")) {
        std::cerr << "build args mismatch: " << cargo_args << "\n";
        return false;
    }
    if (!contains(link, "--address 127.0.0.1") || !contains(link, "--argv0 sdmc:/app.3dsx") ||
        !contains(link, "release/app.3dsx -- --verbose")) {
        std::cerr << "3dslink args mismatch: " << link << "\n";
        return false;
    }
    return true;
}

bool test_forwarded_no_run_does_not_deploy() {
    Sandbox sb{};
    if (!make_sandbox(sb, "fwdnorun")) return false;
    const std::string bin = CARGO3DS_BUILD_BIN;

    auto [rc, out] = run_capture(sb.env() + "\"" + bin + "\" test --lib --no-run");
    const std::string cargo_args = read_text(sb.logs / "cargo.args");

    if (rc != 0 || !contains(cargo_args, "--lib --no-run") || contains(cargo_args, "--no-run --target")) {
        std::cerr << "test --lib --no-run failed (rc=" << rc << ", args=" << cargo_args << ")\n" << out;
        return false;
    }
    if (!fs::exists(sb.logs / "smdhtool.args")) {
        std::cerr << "the test executable must still be packaged\n";
        return false;
    }
    if (fs::exists(sb.logs / "3dslink.args")) {
        std::cerr << "--no-run forwarded to cargo must not deploy\n";
        return false;
    }
    return true;
}

bool test_dry_run_before_command() {
    Sandbox sb{};
    if (!make_sandbox(sb, "drypre")) return false;
    const std::string bin = CARGO3DS_BUILD_BIN;

    auto [rc, out] = run_capture(sb.env() + "\"" + bin + "\" 3ds --dry-run build --release");
    if (rc != 0 || !contains(out, "build --target armv6k-nintendo-3ds --release")) {
        std::cerr << "leading --dry-run failed (rc=" << rc << ")\n" << out;
        return false;
    }
    if (fs::exists(sb.logs / "cargo.args")) {
        std::cerr << "dry run must not spawn cargo\n";
        return false;
    }
    return true;
}

bool test_transfer_failure_keeps_link_exit() {
    FakeConsole console{};
    if (!console.ok()) {
        std::cerr << "note: loopback link port busy, skipping\n";
        return true;
    }

    Sandbox sb{};
    if (!make_sandbox(sb, "xfer")) return false;
    const std::string bin = CARGO3DS_BUILD_BIN;

    auto [rc, out] = run_capture(sb.env("FAKE_LINK_EXIT=42") + "\"" + bin + "\" run --address 127.0.0.1 --retries 0");
    if (rc != 42 || !contains(out, "D_TRANSFER_ABORTED")) {
        std::cerr << "transfer failure must keep the link exit (rc=" << rc << ")\n" << out;
        return false;
    }
    return true;
}

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"help_and_version", test_help_and_version},
        {"argument_ambiguity_exit", test_argument_ambiguity_exit},
        {"passthrough_forwards_verbatim", test_passthrough_forwards_verbatim},
        {"missing_toolchain_exit", test_missing_toolchain_exit},
        {"stable_compiler_rejected", test_stable_compiler_rejected},
        {"build_failure_keeps_cargo_exit", test_build_failure_keeps_cargo_exit},
        {"dry_run_prints_cargo_command", test_dry_run_prints_cargo_command},
        {"build_packages_binary", test_build_packages_binary},
        {"no_run_packages_test_only", test_no_run_packages_test_only},
        {"run_sends_to_console", test_run_sends_to_console},
        {"forwarded_no_run_does_not_deploy", test_forwarded_no_run_does_not_deploy},
        {"dry_run_before_command", test_dry_run_before_command},
        {"transfer_failure_keeps_link_exit", test_transfer_failure_keeps_link_exit},
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
