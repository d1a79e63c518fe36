#include <cargo3ds/Version.hpp>
#include <cargo3ds/cli/Options.hpp>
#include <cargo3ds/diag/Error.hpp>
#include <cargo3ds/driver/Driver.hpp>
#include <cargo3ds/ui/Log.hpp>

#include <iostream>

int main(int argc, char** argv) {
    const auto opt = cargo3ds::cli::parse_options(argc, argv);

    if (!opt.ok) {
        cargo3ds::ui::fail(cargo3ds::diag::make_error(cargo3ds::diag::Code::A_ARGUMENT_AMBIGUITY, opt.error));
        cargo3ds::cli::print_usage(std::cerr);
        return cargo3ds::diag::default_exit_code(cargo3ds::diag::Code::A_ARGUMENT_AMBIGUITY);
    }

    if (opt.mode == cargo3ds::cli::Mode::kVersion) {
        std::cout << cargo3ds::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == cargo3ds::cli::Mode::kUsage) {
        cargo3ds::cli::print_usage(std::cout);
        return 0;
    }

    return cargo3ds::driver::run(opt);
}
