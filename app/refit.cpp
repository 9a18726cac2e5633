#include "refit/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        refit::session_config cfg{};
        std::string script{};
        if (auto cli_result = refit::cli::parse_cli(argc, argv, cfg, script)) {
            return *cli_result;
        }

        return refit::cli::run(cfg, script, std::cout, std::cerr);
    } catch (std::exception& e) {
        std::cerr << "refit: " << e.what() << '\n';
        return refit::cli::failure_exit_code;
    } catch (...) {
        std::cerr << "refit: unknown exception\n";
        return refit::cli::failure_exit_code;
    }
}
