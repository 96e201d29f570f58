#include "tokensnap/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        tokensnap::startup_config cfg{};
        tokensnap::cli::command_request request{};
        if (auto cli_result = tokensnap::cli::parse_cli(argc, argv, cfg, request)) {
            return *cli_result;
        }

        return tokensnap::cli::run_command(cfg, request, std::cout, std::cerr);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
