#pragma once
#include <string_view>


namespace cargo3ds {

    inline constexpr int k_version_major = 0;
    inline constexpr int k_version_minor = 3;
    inline constexpr int k_version_patch = 0;

    inline constexpr std::string_view k_version_string = "cargo-3ds v0.3.0";

} // namespace cargo3ds
