#ifndef REPO_MANAGER_HPP
#define REPO_MANAGER_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "credential_resolver.hpp"
#include "deployer.hpp"
#include "folder_locks.hpp"
#include "installation_token.hpp"
#include "provisioner.hpp"
#include "snapshot.hpp"

class ConfigStore;

namespace multideploy {

class HttpClient;

struct StatusReport {
    RepositorySnapshot snapshot;
    std::vector<std::string> branch_choices; ///< Origin branches passing the allow list
    std::vector<std::string> fetch_errors;
};

struct CleanupResult {
    std::string active_branch;
    std::vector<std::string> deleted;
};

/**
 * @brief Apply the comma separated allow list @a allowed to @a branches.
 *
 * Entries are trimmed and may carry an `origin/` prefix. An unset or blank
 * list lets every branch through.
 */
std::vector<std::string> filter_branches(const std::set<std::string>& branches,
                                         const std::optional<std::string>& allowed);

/**
 * @brief Entry point for every operation on the managed root.
 *
 * Owns the token cache, per-folder locks and the components built on them;
 * one instance is meant to live for the whole process.
 */
class RepoManager {
  public:
    /**
     * @param cfg  Configuration consulted once at construction.
     * @param http HTTP client for the token authority; a CurlHttpClient is
     *             created when `nullptr`.
     */
    explicit RepoManager(const ConfigStore& cfg, std::unique_ptr<HttpClient> http = nullptr);
    ~RepoManager();

    RepoManager(const RepoManager&) = delete;
    RepoManager& operator=(const RepoManager&) = delete;

    std::vector<RepositorySnapshot> list() const;

    /**
     * @brief Fetch every remote of @a folder and report its state.
     *
     * Fetch failures are collected in the report instead of thrown.
     * @throws NotARepository if @a folder is not a checkout.
     */
    StatusReport status(const std::string& folder);

    DeploymentResult deploy(const std::string& folder, const std::string& target_ref);

    void provision(const std::string& folder, const std::string& source,
                   const ProvisionAuth& auth);

    /**
     * @brief Delete every local branch except the checked out one.
     *
     * @throws VersionControlError when HEAD is detached or unborn, or a
     *         branch cannot be deleted.
     */
    CleanupResult cleanup_branches(const std::string& folder);

    bool app_available() const { return tokens_.configured(); }
    std::vector<InstallationRepository> installation_repositories();
    std::string installation_token() { return tokens_.get_token(); }

    const std::filesystem::path& managed_root() const { return root_; }

  private:
    std::filesystem::path checkout_path(const std::string& folder) const;

    std::filesystem::path root_;
    std::optional<std::string> allowed_;
    std::unique_ptr<HttpClient> http_;
    TokenCache token_cache_;
    InstallationTokenService tokens_;
    CredentialResolver resolver_;
    FolderLocks locks_;
    Deployer deployer_;
    Provisioner provisioner_;
};

} // namespace multideploy

#endif // REPO_MANAGER_HPP
