#include <iomanip>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "options.hpp"

namespace {

struct CommandInfo {
    const char* name;
    const char* args;
    size_t arg_count;
    const char* desc;
};

const std::vector<CommandInfo>& commands() {
    static const std::vector<CommandInfo> cmds = {
        {"list", "", 0, "List checkouts under the managed root"},
        {"status", "<folder>", 1, "Fetch remotes and show a checkout's state"},
        {"deploy", "<folder> <remote/branch>", 2, "Hard reset a checkout to a remote branch"},
        {"provision-ssh", "<folder> <url>", 2, "Clone using the key given by --key-file"},
        {"provision-app", "<folder> <owner/name|url>", 2, "Clone using the installation app"},
        {"cleanup", "<folder>", 1, "Delete every local branch except the active one"},
        {"app-repos", "", 0, "List repositories visible to the installation"},
        {"token", "", 0, "Print a current installation access token"},
    };
    return cmds;
}

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
};

} // namespace

void print_help(const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--config", "-c", "<file>", "YAML or JSON configuration file"},
        {"--root", "-r", "<path>", "Managed root directory"},
        {"--key-file", "-k", "<file>", "SSH private key for provision-ssh"},
        {"--log-file", "", "<file>", "Write logs to file"},
        {"--log-level", "", "<level>", "DEBUG, INFO, WARNING or ERROR"},
        {"--version", "-v", "", "Show program version"},
        {"--help", "-h", "", "Show this message"},
    };
    std::cout << "Usage: " << prog << " [options] <command> [args]\n\n";
    std::cout << "Commands:\n";
    for (const auto& c : commands()) {
        std::string left = std::string(c.name) + (c.args[0] ? " " : "") + c.args;
        std::cout << "  " << std::left << std::setw(40) << left << c.desc << "\n";
    }
    std::cout << "\nOptions:\n";
    for (const auto& o : opts) {
        std::string left = std::string(o.short_flag[0] ? o.short_flag : "  ") +
                           (o.short_flag[0] ? ", " : "  ") + o.long_flag;
        if (o.arg[0])
            left += std::string(" ") + o.arg;
        std::cout << "  " << std::left << std::setw(40) << left << o.desc << "\n";
    }
}

Options parse_options(int argc, char* argv[]) {
    const std::set<std::string> known{"--config", "--root", "--key-file", "--log-file",
                                      "--log-level"};
    const std::set<std::string> switches{"--help", "--version"};
    const std::map<char, std::string> short_map{{'c', "--config"},   {'r', "--root"},
                                                {'k', "--key-file"}, {'v', "--version"},
                                                {'h', "--help"}};
    ArgParser parser(argc, argv, known, switches, short_map);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    opts.config_file = parser.get_option("--config");
    opts.root = parser.get_option("--root");
    opts.key_file = parser.get_option("--key-file");
    opts.log_file = parser.get_option("--log-file");
    opts.log_level = parser.get_option("--log-level");
    for (const char* flag : {"--config", "--root", "--key-file", "--log-file", "--log-level"}) {
        if (parser.has_flag(flag) && parser.get_option(flag).empty())
            throw std::runtime_error(std::string(flag) + " requires a value");
    }
    if (opts.show_help || opts.print_version)
        return opts;

    const auto& pos = parser.positional();
    if (pos.empty())
        throw std::runtime_error("No command given (try --help)");
    opts.command = pos.front();
    opts.args.assign(pos.begin() + 1, pos.end());

    const CommandInfo* info = nullptr;
    for (const auto& c : commands()) {
        if (opts.command == c.name)
            info = &c;
    }
    if (!info)
        throw std::runtime_error("Unknown command: " + opts.command);
    if (opts.args.size() != info->arg_count)
        throw std::runtime_error("Usage: " + opts.command + " " + info->args);
    if (opts.command == "provision-ssh" && opts.key_file.empty())
        throw std::runtime_error("provision-ssh requires --key-file");
    return opts;
}
