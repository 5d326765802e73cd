#ifndef DEPLOYER_HPP
#define DEPLOYER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "post_hook.hpp"

namespace multideploy {

class CredentialResolver;
class FolderLocks;

enum class DeployOutcome { Success, PartialFailure, Fatal };

const char* to_string(DeployOutcome outcome);

struct HookResult {
    bool invoked = false;
    bool ok = false;
    std::string output; ///< Hook output, or the error text when it failed
};

struct DeploymentResult {
    std::string repo;
    std::optional<std::string> previous_branch;
    std::string target_branch;
    std::string target_ref;
    DeployOutcome outcome = DeployOutcome::Fatal;
    std::vector<std::string> errors;
    std::string message;
    HookResult post_hook;

    bool succeeded() const { return outcome == DeployOutcome::Success; }
};

/// `<remote>/<branch>` split on the first slash.
struct TargetRef {
    std::string remote;
    std::string branch;
};

/**
 * @brief Split @a ref into remote and branch, keeping slashes in the branch.
 *
 * `origin/feature/x` yields remote `origin` and branch `feature/x`.
 *
 * @throws std::invalid_argument when either part would be empty.
 */
TargetRef split_target_ref(const std::string& ref);

/**
 * @brief Moves a checkout onto the exact tip of a remote branch.
 *
 * Steps run in order under the folder lock: checkout (creating the local
 * branch from the remote one when needed), fetch, hard reset, then the
 * optional post-deploy hook. A failing step ends the deployment with a
 * `Fatal` outcome and leaves the checkout as it is. The fetch prunes, so a
 * branch deleted upstream fails the reset instead of deploying a stale tip.
 *
 * The hook runs while the folder lock is still held and the lock is not
 * recursive: a hook must not deploy, provision or clean up the same folder
 * through this process, or it deadlocks.
 */
class Deployer {
  public:
    Deployer(std::filesystem::path root, const CredentialResolver& resolver, FolderLocks& locks,
             PostDeployHook hook = nullptr);

    /**
     * @throws NotARepository if @a folder is not a checkout.
     * @throws std::invalid_argument if @a target_ref is malformed.
     */
    DeploymentResult deploy(const std::string& folder, const std::string& target_ref);

    void set_post_hook(PostDeployHook hook) { hook_ = std::move(hook); }

  private:
    std::filesystem::path root_;
    const CredentialResolver& resolver_;
    FolderLocks& locks_;
    PostDeployHook hook_;
};

} // namespace multideploy

#endif // DEPLOYER_HPP
