#ifndef CONFIG_STORE_HPP
#define CONFIG_STORE_HPP
#include <map>
#include <optional>
#include <string>

/**
 * @brief Flat key/value configuration lookup.
 *
 * Values are loaded from a YAML or JSON file in which nested maps are
 * flattened into dotted keys, so
 *
 * @code
 * github_app:
 *   app_id: 1234
 * @endcode
 *
 * is stored as `github_app.app_id = "1234"`. An environment variable named
 * `MULTIDEPLOY_<KEY>` (upper case, dots replaced by underscores) takes
 * precedence over the file value.
 */
class ConfigStore {
  public:
    ConfigStore() = default;
    explicit ConfigStore(std::map<std::string, std::string> values);

    /**
     * @brief Load a configuration file, picking the parser by extension.
     *
     * `.json` files are parsed as JSON, everything else as YAML. Values
     * already present are overwritten by the file.
     *
     * @param path  Filesystem path to the configuration file.
     * @param error Receives a human-readable message on failure.
     * @return `true` if the file was loaded.
     */
    bool load_file(const std::string& path, std::string& error);
    bool load_yaml(const std::string& path, std::string& error);
    bool load_json(const std::string& path, std::string& error);

    /**
     * @brief Look up @a key, consulting the environment override first.
     *
     * Empty values are reported as unset.
     */
    std::optional<std::string> get(const std::string& key) const;
    std::string get_or(const std::string& key, const std::string& fallback) const;
    bool get_bool(const std::string& key, bool fallback) const;
    long long get_int(const std::string& key, long long fallback) const;

    void set(const std::string& key, const std::string& value);

    const std::map<std::string, std::string>& values() const { return values_; }

    /// Environment variable consulted for @a key.
    static std::string env_name(const std::string& key);

  private:
    std::map<std::string, std::string> values_;
};

#endif // CONFIG_STORE_HPP
