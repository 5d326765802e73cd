#include "config_store.hpp"
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

// Scalar conversions follow the same order as the option loader: booleans,
// integers, floats, then plain strings.
static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) {
        out = b ? "true" : "false";
        return true;
    }
    long long i = 0;
    if (YAML::convert<long long>::decode(node, i)) {
        out = std::to_string(i);
        return true;
    }
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) {
        std::ostringstream oss;
        oss << d;
        out = oss.str();
        return true;
    }
    out = node.Scalar();
    return true;
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

static void flatten_yaml(const YAML::Node& node, const std::string& prefix,
                         std::map<std::string, std::string>& out) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (!it->first.IsScalar())
            continue;
        std::string key = prefix.empty() ? it->first.as<std::string>()
                                         : prefix + "." + it->first.as<std::string>();
        const YAML::Node& val = it->second;
        if (val.IsMap()) {
            flatten_yaml(val, key, out);
        } else if (val.IsSequence()) {
            // Lists become comma separated values (allowed_branches: [main, staging]).
            std::string joined;
            for (const auto& item : val) {
                std::string s;
                if (!to_string_value(item, s))
                    continue;
                if (!joined.empty())
                    joined += ",";
                joined += s;
            }
            out[key] = joined;
        } else {
            std::string s;
            if (to_string_value(val, s))
                out[key] = s;
        }
    }
}

static void flatten_json(const nlohmann::json& node, const std::string& prefix,
                         std::map<std::string, std::string>& out) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        const auto& val = it.value();
        if (val.is_object()) {
            flatten_json(val, key, out);
        } else if (val.is_array()) {
            std::string joined;
            for (const auto& item : val) {
                std::string s;
                if (!to_string_value(item, s))
                    continue;
                if (!joined.empty())
                    joined += ",";
                joined += s;
            }
            out[key] = joined;
        } else {
            std::string s;
            if (to_string_value(val, s))
                out[key] = s;
        }
    }
}

ConfigStore::ConfigStore(std::map<std::string, std::string> values) : values_(std::move(values)) {}

bool ConfigStore::load_file(const std::string& path, std::string& error) {
    std::string ext;
    auto pos = path.find_last_of('.');
    if (pos != std::string::npos)
        ext = path.substr(pos + 1);
    for (auto& c : ext)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (ext == "json")
        return load_json(path, error);
    return load_yaml(path, error);
}

bool ConfigStore::load_yaml(const std::string& path, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        flatten_yaml(root, "", values_);
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

bool ConfigStore::load_json(const std::string& path, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        flatten_json(root, "", values_);
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
}

std::string ConfigStore::env_name(const std::string& key) {
    std::string name = "MULTIDEPLOY_";
    for (char c : key) {
        if (c == '.' || c == '-')
            name += '_';
        else
            name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

std::optional<std::string> ConfigStore::get(const std::string& key) const {
    if (const char* env = std::getenv(env_name(key).c_str())) {
        if (*env)
            return std::string(env);
    }
    auto it = values_.find(key);
    if (it == values_.end() || it->second.empty())
        return std::nullopt;
    return it->second;
}

std::string ConfigStore::get_or(const std::string& key, const std::string& fallback) const {
    return get(key).value_or(fallback);
}

bool ConfigStore::get_bool(const std::string& key, bool fallback) const {
    auto v = get(key);
    if (!v)
        return fallback;
    std::string s = *v;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "true" || s == "1" || s == "yes" || s == "on")
        return true;
    if (s == "false" || s == "0" || s == "no" || s == "off")
        return false;
    return fallback;
}

long long ConfigStore::get_int(const std::string& key, long long fallback) const {
    auto v = get(key);
    if (!v)
        return fallback;
    try {
        std::size_t used = 0;
        long long n = std::stoll(*v, &used);
        if (used != v->size())
            return fallback;
        return n;
    } catch (const std::logic_error&) {
        return fallback;
    }
}

void ConfigStore::set(const std::string& key, const std::string& value) { values_[key] = value; }
