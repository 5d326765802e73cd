#include "repo_manager.hpp"

#include <algorithm>
#include <sstream>

#include "config_store.hpp"
#include "errors.hpp"
#include "git_utils.hpp"
#include "http_client.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace multideploy {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos)
        return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

fs::path root_from_config(const ConfigStore& cfg) {
    auto root = cfg.get("managed_root");
    std::error_code ec;
    fs::path p = root ? fs::path(*root) : fs::current_path(ec);
    fs::path abs = fs::absolute(p, ec);
    return ec ? p : abs;
}

PostDeployHook hook_from_config(const ConfigStore& cfg) {
    auto hook = cfg.get("deploy.post_hook");
    if (!hook)
        return nullptr;
    return make_executable_hook(*hook);
}

std::unique_ptr<HttpClient> default_http(std::unique_ptr<HttpClient> http) {
    if (http)
        return http;
    return std::make_unique<CurlHttpClient>();
}

} // namespace

std::vector<std::string> filter_branches(const std::set<std::string>& branches,
                                         const std::optional<std::string>& allowed) {
    std::set<std::string> allow;
    if (allowed) {
        std::stringstream ss(*allowed);
        std::string item;
        const std::string prefix = std::string(kPrimaryRemote) + "/";
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            if (item.compare(0, prefix.size(), prefix) == 0)
                item = item.substr(prefix.size());
            if (!item.empty())
                allow.insert(item);
        }
    }
    std::vector<std::string> out;
    for (const auto& b : branches) {
        if (allow.empty() || allow.count(b))
            out.push_back(b);
    }
    return out;
}

RepoManager::RepoManager(const ConfigStore& cfg, std::unique_ptr<HttpClient> http)
    : root_(root_from_config(cfg)), allowed_(cfg.get("deploy.allowed_branches")),
      http_(default_http(std::move(http))),
      tokens_(AppSettings::from_config(cfg), token_cache_, *http_),
      resolver_(tokens_.configured() ? &tokens_ : nullptr),
      deployer_(root_, resolver_, locks_, hook_from_config(cfg)),
      provisioner_(root_, tokens_.configured() ? &tokens_ : nullptr, locks_) {}

RepoManager::~RepoManager() = default;

fs::path RepoManager::checkout_path(const std::string& folder) const {
    validate_folder_name(folder);
    return root_ / folder;
}

std::vector<RepositorySnapshot> RepoManager::list() const { return list_snapshots(root_); }

StatusReport RepoManager::status(const std::string& folder) {
    const fs::path path = checkout_path(folder);
    auto lock = locks_.acquire(folder);
    if (!git::is_git_repo(path))
        throw NotARepository(path);

    StatusReport report;
    const CredentialOverlay overlay = resolver_.resolve(root_, folder);
    std::string err;
    auto remotes = git::list_remotes(path, &err);
    if (!remotes)
        throw VersionControlError("read remotes", err);
    for (const auto& remote : *remotes) {
        err.clear();
        if (!git::fetch_remote(path, remote.first, overlay.credentials, true, &err)) {
            report.fetch_errors.push_back(remote.first + ": " + err);
            log_warning("Fetch of " + remote.first + " failed for " + folder, err);
        }
    }
    report.snapshot = extract_snapshot(path, folder);
    report.branch_choices = filter_branches(report.snapshot.remote_branches, allowed_);
    return report;
}

DeploymentResult RepoManager::deploy(const std::string& folder, const std::string& target_ref) {
    validate_folder_name(folder);
    return deployer_.deploy(folder, target_ref);
}

void RepoManager::provision(const std::string& folder, const std::string& source,
                            const ProvisionAuth& auth) {
    provisioner_.provision(folder, source, auth);
}

CleanupResult RepoManager::cleanup_branches(const std::string& folder) {
    const fs::path path = checkout_path(folder);
    auto lock = locks_.acquire(folder);
    if (!git::is_git_repo(path))
        throw NotARepository(path);

    std::string err;
    auto active = git::get_current_branch(path, &err);
    if (!active)
        throw VersionControlError("cleanup", err.empty() ? "HEAD is detached or unborn" : err);
    auto branches = git::list_local_branches(path, &err);
    if (!branches)
        throw VersionControlError("list branches", err);

    CleanupResult result;
    result.active_branch = *active;
    for (const auto& b : *branches) {
        if (b == *active)
            continue;
        err.clear();
        if (!git::delete_branch(path, b, &err))
            throw VersionControlError("delete branch " + b, err);
        result.deleted.push_back(b);
    }
    log_info("Cleaned up branches in " + folder,
             {{"active", result.active_branch},
              {"deleted", std::to_string(result.deleted.size())}});
    return result;
}

std::vector<InstallationRepository> RepoManager::installation_repositories() {
    return tokens_.list_repositories();
}

} // namespace multideploy
