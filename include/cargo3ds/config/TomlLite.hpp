#pragma once

#include <cargo3ds/config/Config.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace cargo3ds::config::toml_lite {

enum class Strictness : unsigned char {
    kStrict,
    // Skip values the flat model cannot hold (inline tables, nested arrays) with a warning.
    kTolerant,
};

bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err,
                Strictness strictness = Strictness::kStrict);

bool parse_text(std::string_view text,
                std::string_view origin,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err,
                Strictness strictness = Strictness::kStrict);

} // namespace cargo3ds::config::toml_lite
