#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        systree::startup_config cfg{};
        systree::cli::command_request request{};
        if (auto cli_result = systree::cli::parse_cli(argc, argv, cfg, request)) {
            return *cli_result;
        }

        return systree::cli::run_command(cfg, request);
    } catch (const systree::error& e) {
        std::cerr << "error[" << to_string(e.kind()) << "]: " << e.what() << '\n';
        return systree::cli::exit_code_for(e.kind());
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
