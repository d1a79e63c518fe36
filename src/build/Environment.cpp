#include <cargo3ds/build/Environment.hpp>

#include <cargo3ds/toolchain/Resolver.hpp>
#include <cargo3ds/ui/Log.hpp>

#include <cstdlib>
#include <filesystem>

namespace cargo3ds::build {

namespace {

std::string getenv_string(const char* key) {
    const char* p = std::getenv(key);
    if (p == nullptr) return {};
    return std::string(p);
}

} // namespace

ConfigureInputs inputs_from(const config::EffectiveSettings& settings) {
    ConfigureInputs in{};
    in.devkitpro = settings.toolchain_devkitpro;
    in.user_rustflags = getenv_string("RUSTFLAGS");
    in.cargo = settings.toolchain_cargo_path.empty() ? "cargo" : settings.toolchain_cargo_path;
    in.rustc = settings.toolchain_rustc_path.empty() ? "rustc" : settings.toolchain_rustc_path;
    return in;
}

std::string compose_compiler_flags(std::string_view toolchain_root, std::string_view user_rustflags) {
    std::string flags = "-L" + std::string(toolchain_root) + "/libctru/lib -lctru";
    if (!user_rustflags.empty()) {
        flags.push_back(' ');
        flags += user_rustflags;
    }
    return flags;
}

std::optional<Environment> configure(const ConfigureInputs& in, diag::Error& err) {
    namespace fs = std::filesystem;

    if (in.devkitpro.empty()) {
        err = diag::make_error(diag::Code::T_TOOLCHAIN_NOT_FOUND,
                               "DEVKITPRO is not set",
                               "export DEVKITPRO or set toolchain.devkitpro in the cargo-3ds config");
        return std::nullopt;
    }
    std::error_code ec{};
    if (!fs::is_directory(in.devkitpro, ec)) {
        err = diag::make_error(diag::Code::T_TOOLCHAIN_NOT_FOUND,
                               "devkitPro toolchain root is not a directory",
                               in.devkitpro);
        return std::nullopt;
    }

    Environment env{};
    env.toolchain_root = in.devkitpro;
    env.compiler_flags = compose_compiler_flags(in.devkitpro, in.user_rustflags);
    env.cargo = in.cargo.empty() ? "cargo" : in.cargo;
    env.rustc = in.rustc.empty() ? "rustc" : in.rustc;

    if (!in.probe_compiler) return env;

    if (!toolchain::check_rustc(env.rustc, err)) return std::nullopt;

    // Without a prebuilt std for the target, cargo has to build it.
    const auto sysroot = toolchain::query_sysroot(env.rustc);
    const bool has_std = sysroot.has_value() &&
        fs::exists(fs::path(*sysroot) / "lib" / "rustlib" / std::string(k_target_triple), ec);
    if (!has_std) {
        env.build_std = true;
        ui::note("no pre-built std found, using build-std");
    }
    return env;
}

} // namespace cargo3ds::build
