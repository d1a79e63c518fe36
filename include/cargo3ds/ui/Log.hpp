#pragma once

#include <cargo3ds/diag/Error.hpp>

#include <string>
#include <string_view>

namespace cargo3ds::ui {

struct LogSettings {
    bool progress = true;
    std::string color{"auto"};
};

void configure(const LogSettings& settings);
const LogSettings& settings();

bool use_stderr_color(std::string_view mode);

void progress(int pct, std::string_view message);
void note(std::string_view message);
void warn(std::string_view message);
void fail(std::string_view message);
void fail(const diag::Error& err);
void done(std::string_view message);

} // namespace cargo3ds::ui
