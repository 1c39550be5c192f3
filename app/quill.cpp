#include "quill/cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        quill::startup_config cfg{};
        if (auto cli_result = quill::cli::parse_cli(argc, argv, cfg)) {
            return *cli_result;
        }

        quill::cli::run_repl(cfg);
        return 0;
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
