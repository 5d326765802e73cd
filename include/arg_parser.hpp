#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Simple command line argument parser.
 *
 * The parser recognizes long style options (e.g. `--flag` or `--opt value`)
 * and the `--opt=value` form. Flags listed as switches never consume the
 * following argument, so `--help deploy` keeps `deploy` as a positional.
 * A list of known flags can be provided so that unknown flags are collected
 * and reported separately. Single character options (like `-h`) are mapped
 * to their long counterparts through @a short_map.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::set<std::string> known_flags_;          ///< List of accepted flags
    std::set<std::string> switches_;             ///< Flags that never take a value
    std::map<char, std::string> short_map_;      ///< Mapping of short to long flags

    void record(const std::string& key, const std::string* val) {
        if (!known_flags_.empty() && !known_flags_.count(key) && !switches_.count(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        if (val)
            options_[key] = *val;
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Flags that take a value. If empty together with
     *        @a switches, all flags are treated as known.
     * @param switches Flags that are accepted and never take a value.
     * @param short_map Mapping from single character options (e.g. '-h') to
     *        their long form (e.g. '--help').
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::set<std::string>& switches = {},
              const std::map<char, std::string>& short_map = {})
        : known_flags_(known_flags), switches_(switches), short_map_(short_map) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--") {
                for (++i; i < argc; ++i)
                    positional_.push_back(argv[i]);
                break;
            }
            std::string key;
            if (arg.rfind("--", 0) == 0) {
                key = arg;
            } else if (arg.size() >= 2 && arg[0] == '-' && short_map_.count(arg[1])) {
                key = short_map_.at(arg[1]);
                std::string rest = arg.substr(2);
                if (!rest.empty() && rest[0] == '=')
                    rest.erase(0, 1);
                if (!rest.empty()) {
                    record(key, &rest);
                    continue;
                }
            } else {
                positional_.push_back(arg);
                continue;
            }
            size_t eq = key.find('=');
            if (eq != std::string::npos) {
                std::string val = key.substr(eq + 1);
                record(key.substr(0, eq), &val);
            } else if (!switches_.count(key) && i + 1 < argc &&
                       std::string(argv[i + 1]).rfind("-", 0) != 0) {
                std::string val = argv[++i];
                record(key, &val);
            } else {
                record(key, nullptr);
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     * @return `true` if the flag was present, otherwise `false`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * If the option was not provided, an empty string is returned.
     *
     * @param opt Option name including the leading `--`.
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
};

#endif // ARG_PARSER_HPP
