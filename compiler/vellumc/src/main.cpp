// compiler/vellumc/src/main.cpp
#include <vellumc/cli/Options.hpp>
#include <vellumc/driver/Driver.hpp>
#include <vellum/Version.hpp>

#include <iostream>


int main(int argc, char** argv) {
    if (argc <= 1) {
        std::cout << vellum::k_version_string << "\n";
        vellumc::cli::print_usage(std::cout);
        return 0;
    }

    const auto opt = vellumc::cli::parse_options(argc, argv);

    if (!opt.ok) {
        std::cerr << "error: " << opt.error << "\n";
        vellumc::cli::print_usage(std::cerr);
        return 1;
    }

    if (opt.mode == vellumc::cli::Mode::kVersion) {
        std::cout << vellum::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == vellumc::cli::Mode::kUsage) {
        vellumc::cli::print_usage(std::cout);
        return 0;
    }

    return vellumc::driver::run(opt);
}
