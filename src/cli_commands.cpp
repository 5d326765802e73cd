#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "cli_commands.hpp"
#include "errors.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;
using nlohmann::json;
using namespace multideploy;

namespace cli {

namespace {

constexpr const char* kDefaultConfigFile = "multideploy.yaml";

std::string read_key_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("Unable to read key file " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

json error_json(const std::string& type, const std::string& what) {
    return {{"error", what}, {"type", type}};
}

int dispatch(const Options& opts, RepoManager& manager, json& out) {
    const auto& a = opts.args;
    if (opts.command == "list") {
        out = json::array();
        for (const auto& snap : manager.list())
            out.push_back(to_json(snap));
        return 0;
    }
    if (opts.command == "status") {
        out = to_json(manager.status(a[0]));
        return 0;
    }
    if (opts.command == "deploy") {
        DeploymentResult res = manager.deploy(a[0], a[1]);
        out = to_json(res);
        if (res.outcome == DeployOutcome::PartialFailure)
            return 2;
        return res.succeeded() ? 0 : 1;
    }
    if (opts.command == "provision-ssh") {
        manager.provision(a[0], a[1], SshAuth{read_key_file(opts.key_file)});
        out = {{"folder", a[0]}, {"auth", to_string(AuthMode::SshKeyFile)}, {"ok", true}};
        return 0;
    }
    if (opts.command == "provision-app") {
        manager.provision(a[0], a[1], AppAuth{});
        out = {{"folder", a[0]}, {"auth", to_string(AuthMode::InstallationApp)}, {"ok", true}};
        return 0;
    }
    if (opts.command == "cleanup") {
        out = to_json(manager.cleanup_branches(a[0]));
        return 0;
    }
    if (opts.command == "app-repos") {
        out = json::array();
        for (const auto& r : manager.installation_repositories())
            out.push_back(
                {{"name", r.name}, {"full_name", r.full_name}, {"description", r.description}});
        return 0;
    }
    if (opts.command == "token") {
        out = {{"token", manager.installation_token()}};
        return 0;
    }
    throw std::runtime_error("Unknown command: " + opts.command);
}

} // namespace

ConfigStore load_config(const Options& opts) {
    ConfigStore cfg;
    std::string path = opts.config_file;
    std::error_code ec;
    if (path.empty() && fs::exists(kDefaultConfigFile, ec))
        path = kDefaultConfigFile;
    if (!path.empty()) {
        std::string err;
        if (!cfg.load_file(path, err))
            throw std::runtime_error("Failed to load config " + path + ": " + err);
    }
    if (!opts.root.empty())
        cfg.set("managed_root", opts.root);
    if (!opts.log_file.empty())
        cfg.set("log.file", opts.log_file);
    if (!opts.log_level.empty())
        cfg.set("log.level", opts.log_level);
    return cfg;
}

void setup_logging(const ConfigStore& cfg) {
    auto file = cfg.get("log.file");
    if (!file)
        return;
    LogLevel level = LogLevel::INFO;
    std::string name = cfg.get_or("log.level", "INFO");
    if (!parse_log_level(name, level))
        std::cerr << "Unknown log level '" << name << "', using INFO\n";
    long long max_size = cfg.get_int("log.max_size", 0);
    long long max_files = cfg.get_int("log.max_files", 1);
    init_logger(*file, level, max_size > 0 ? static_cast<size_t>(max_size) : 0,
                max_files > 0 ? static_cast<size_t>(max_files) : 1);
    set_json_logging(cfg.get_bool("log.json", false));
    if (cfg.get_bool("log.syslog", false))
        init_syslog();
}

json to_json(const RepositorySnapshot& snap) {
    json j;
    j["folder"] = snap.folder;
    j["path"] = snap.path.string();
    j["remotes"] = json::array();
    for (const auto& r : snap.remotes)
        j["remotes"].push_back({{"name", r.first}, {"url", r.second}});
    j["active_branch"] = snap.active_branch ? json(*snap.active_branch) : json(nullptr);
    if (snap.head) {
        j["head"] = {{"hash", snap.head->hash},
                     {"message", snap.head->message},
                     {"author", snap.head->author},
                     {"committed_at", static_cast<long long>(snap.head->committed_at)},
                     {"committed_at_str", snap.head->committed_at_str()}};
    } else {
        j["head"] = nullptr;
    }
    j["local_branches"] = snap.local_branches;
    j["remote_branches"] = snap.remote_branches;
    return j;
}

json to_json(const StatusReport& report) {
    json j = to_json(report.snapshot);
    j["branch_choices"] = report.branch_choices;
    j["fetch_errors"] = report.fetch_errors;
    return j;
}

json to_json(const DeploymentResult& result) {
    json j;
    j["repo"] = result.repo;
    j["previous_branch"] =
        result.previous_branch ? json(*result.previous_branch) : json(nullptr);
    j["target_branch"] = result.target_branch;
    j["target_ref"] = result.target_ref;
    j["outcome"] = to_string(result.outcome);
    j["errors"] = result.errors;
    j["message"] = result.message;
    if (result.post_hook.invoked)
        j["post_hook"] = {{"ok", result.post_hook.ok}, {"output", result.post_hook.output}};
    else
        j["post_hook"] = nullptr;
    return j;
}

json to_json(const CleanupResult& result) {
    return {{"active_branch", result.active_branch}, {"deleted", result.deleted}};
}

int run_command(const Options& opts, RepoManager& manager, std::ostream& out) {
    json j;
    int rc = 1;
    try {
        rc = dispatch(opts, manager, j);
    } catch (const NotARepository& e) {
        j = error_json("not_a_repository", e.what());
    } catch (const ConfigurationError& e) {
        j = error_json("configuration", e.what());
    } catch (const TokenExchangeError& e) {
        j = error_json("token_exchange", e.what());
        j["status"] = e.status();
        j["body"] = e.body();
    } catch (const VersionControlError& e) {
        j = error_json("version_control", e.what());
        j["step"] = e.step();
    } catch (const AlreadyExists& e) {
        j = error_json("already_exists", e.what());
    } catch (const std::invalid_argument& e) {
        j = error_json("invalid_argument", e.what());
    }
    if (j.contains("error"))
        log_error(opts.command + " failed", j["error"].get<std::string>());
    out << j.dump(2) << "\n";
    return rc;
}

} // namespace cli
