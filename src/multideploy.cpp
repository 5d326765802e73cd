/**
 * @file multideploy.cpp
 * @brief CLI entry point for managing and deploying checkouts.
 *
 * Loads the configuration, starts logging and libgit2, then runs one
 * subcommand against the managed root and prints the result as JSON.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "repo_manager.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return Zero on success or when printing help/version; the command's exit
 *         code otherwise; 1 on invalid usage or unexpected errors.
 */
#ifndef MULTIDEPLOY_NO_MAIN
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << MULTIDEPLOY_VERSION << "\n";
            return 0;
        }
        ConfigStore cfg = cli::load_config(opts);
        cli::setup_logging(cfg);
        long long timeout = cfg.get_int("git.timeout", 0);
        if (timeout > 0)
            git::set_libgit_timeout(static_cast<unsigned int>(timeout));

        multideploy::RepoManager manager(cfg);
        int rc = cli::run_command(opts, manager, std::cout);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        shutdown_logger();
        return 1;
    }
}
#endif // MULTIDEPLOY_NO_MAIN
