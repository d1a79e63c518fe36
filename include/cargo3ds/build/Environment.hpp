#pragma once

#include <cargo3ds/config/Config.hpp>
#include <cargo3ds/diag/Error.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace cargo3ds::build {

inline constexpr std::string_view k_target_triple = "armv6k-nintendo-3ds";

/// Cross-compilation environment of one invocation. Read-only after configure().
struct Environment {
    std::string target_triple{k_target_triple};
    std::string compiler_flags{};
    std::string toolchain_root{};
    std::string cargo{"cargo"};
    std::string rustc{"rustc"};
    bool build_std = false;
};

struct ConfigureInputs {
    std::string devkitpro{};
    std::string user_rustflags{};
    std::string cargo{};
    std::string rustc{};

    // rustc -vV check and sysroot probe; off for callers that only need flags.
    bool probe_compiler = true;
};

/// Inputs from effective settings plus `RUSTFLAGS`.
ConfigureInputs inputs_from(const config::EffectiveSettings& settings);

/// `-L<root>/libctru/lib -lctru`, then the user's flags.
std::string compose_compiler_flags(std::string_view toolchain_root, std::string_view user_rustflags);

std::optional<Environment> configure(const ConfigureInputs& in, diag::Error& err);

} // namespace cargo3ds::build
