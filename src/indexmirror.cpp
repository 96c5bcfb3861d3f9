/**
 * @file indexmirror.cpp
 * @brief CLI entry point for the package index mirror.
 */

#include <iostream>

#include "git_utils.hpp"
#include "help_text.hpp"
#include "options.hpp"
#include "server_process.hpp"
#include "version.hpp"

#ifndef INDEXMIRROR_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << INDEXMIRROR_VERSION << "\n";
            return 0;
        }
        validate_options(opts);
        return cli::run_server(opts);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
#endif // INDEXMIRROR_NO_MAIN
