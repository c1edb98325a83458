// tools/simplangc/src/main.cpp
#include <simplangc/cli/Options.hpp>
#include <simplangc/driver/Runner.hpp>
#include <simplang/Version.hpp>

#include <iostream>


int main(int argc, char** argv) {
    if (argc <= 1) {
        std::cout << simplang::k_version_string << "\n";
        simplangc::cli::print_usage(std::cout);
        return 0;
    }

    const auto opt = simplangc::cli::parse_options(argc, argv);

    if (!opt.ok) {
        std::cerr << "error: " << opt.error << "\n";
        simplangc::cli::print_usage(std::cerr);
        return 1;
    }

    if (opt.mode == simplangc::cli::Mode::kVersion) {
        std::cout << simplang::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == simplangc::cli::Mode::kUsage) {
        simplangc::cli::print_usage(std::cout);
        return 0;
    }

    return simplangc::driver::run(opt);
}
