#include <cargo3ds/ui/Log.hpp>

#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <unistd.h>

namespace cargo3ds::ui {

namespace {

constexpr const char* kAnsiReset = "\033[0m";
constexpr const char* kAnsiGreen = "\033[32m";
constexpr const char* kAnsiRed = "\033[31m";
constexpr const char* kAnsiOrange = "\033[38;5;208m";
constexpr const char* kAnsiCyan = "\033[36m";

LogSettings& mutable_settings() {
    static LogSettings s{};
    return s;
}

std::string paint(std::string_view text, const char* ansi) {
    if (!use_stderr_color(settings().color)) return std::string(text);
    return std::string(ansi) + std::string(text) + kAnsiReset;
}

std::string tag(std::string_view text, const char* ansi) {
    if (!use_stderr_color(settings().color)) {
        return "[" + std::string(text) + "]";
    }
    return "[" + std::string(ansi) + std::string(text) + kAnsiReset + "]";
}

} // namespace

void configure(const LogSettings& s) {
    mutable_settings() = s;
}

const LogSettings& settings() {
    return mutable_settings();
}

bool use_stderr_color(std::string_view mode) {
    if (mode == "never") return false;
    if (mode == "always") return true;
    if (std::getenv("NO_COLOR") != nullptr) return false;
    return isatty(fileno(stderr)) != 0;
}

void progress(int pct, std::string_view message) {
    if (!settings().progress) return;
    std::ostringstream oss;
    oss << "[" << std::setw(3) << pct << "%]";
    std::cerr << paint(oss.str(), kAnsiGreen) << " " << message << "\n";
}

void note(std::string_view message) {
    std::cerr << tag("NOTE", kAnsiCyan) << " " << message << "\n";
}

void warn(std::string_view message) {
    std::cerr << tag("WARN", kAnsiOrange) << " " << message << "\n";
}

void fail(std::string_view message) {
    std::cerr << tag("FAIL", kAnsiRed) << " " << message << "\n";
}

void fail(const diag::Error& err) {
    fail(err.message);
    std::cerr << "  = error[" << diag::code_name(err.code) << "] (exit=" << err.exit_code << ")\n";
    if (!err.detail.empty()) std::cerr << "  --> " << err.detail << "\n";
}

void done(std::string_view message) {
    if (!settings().progress) return;
    std::cerr << tag("DONE", kAnsiGreen) << " " << message << "\n";
}

} // namespace cargo3ds::ui
