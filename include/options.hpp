#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <string>
#include <vector>

/// Parsed command line of the `multideploy` executable.
struct Options {
    std::string config_file;
    std::string root;      ///< Overrides `managed_root`
    std::string log_file;  ///< Overrides `log.file`
    std::string log_level; ///< Overrides `log.level`
    std::string key_file;  ///< Private key for `provision-ssh`
    bool show_help = false;
    bool print_version = false;
    std::string command;
    std::vector<std::string> args; ///< Positional arguments after the command
};

/**
 * @brief Parse command line arguments into an Options structure.
 *
 * @throws std::runtime_error on unknown flags, unknown commands or a wrong
 *         number of command arguments.
 */
Options parse_options(int argc, char* argv[]);

/**
 * @brief Print usage information to stdout.
 */
void print_help(const char* prog);

#endif // OPTIONS_HPP
