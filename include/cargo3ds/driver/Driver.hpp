#pragma once

#include <cargo3ds/cli/Options.hpp>

namespace cargo3ds::driver {

/// Routes a classified command line through the build and deploy stages.
/// Returns the process exit code.
int run(const cli::Options& opt);

} // namespace cargo3ds::driver
