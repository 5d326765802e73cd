#include "deployer.hpp"

#include <stdexcept>

#include "credential_resolver.hpp"
#include "errors.hpp"
#include "folder_locks.hpp"
#include "git_utils.hpp"
#include "logger.hpp"
#include "snapshot.hpp"

namespace fs = std::filesystem;

namespace multideploy {

const char* to_string(DeployOutcome outcome) {
    switch (outcome) {
    case DeployOutcome::Success:
        return "success";
    case DeployOutcome::PartialFailure:
        return "partial_failure";
    case DeployOutcome::Fatal:
        break;
    }
    return "fatal";
}

TargetRef split_target_ref(const std::string& ref) {
    auto pos = ref.find('/');
    if (pos == std::string::npos || pos == 0 || pos + 1 == ref.size())
        throw std::invalid_argument("target ref must look like <remote>/<branch>: " + ref);
    return {ref.substr(0, pos), ref.substr(pos + 1)};
}

Deployer::Deployer(fs::path root, const CredentialResolver& resolver, FolderLocks& locks,
                   PostDeployHook hook)
    : root_(std::move(root)), resolver_(resolver), locks_(locks), hook_(std::move(hook)) {}

DeploymentResult Deployer::deploy(const std::string& folder, const std::string& target_ref) {
    TargetRef target = split_target_ref(target_ref);
    const fs::path path = root_ / folder;

    auto lock = locks_.acquire(folder);
    if (!git::is_git_repo(path))
        throw NotARepository(path);

    DeploymentResult result;
    result.repo = folder;
    result.target_ref = target_ref;
    result.target_branch = target.branch;
    std::string err;
    result.previous_branch = git::get_current_branch(path, &err);

    const CredentialOverlay overlay = resolver_.resolve(root_, folder);
    log_info("Deploying " + folder,
             {{"target", target_ref},
              {"previous", result.previous_branch.value_or("")},
              {"auth", to_string(overlay.mode)}});

    auto fail = [&](const std::string& step, const std::string& msg) {
        result.outcome = DeployOutcome::Fatal;
        result.errors.push_back(VersionControlError(step, msg).what());
        result.message = result.errors.back();
        log_error("Deployment of " + folder + " aborted", result.message);
        return result;
    };

    err.clear();
    if (!git::checkout_branch(path, target.remote, target.branch, &err))
        return fail("checkout", err);
    err.clear();
    // Prune so a branch deleted upstream loses its tracking ref and the reset fails.
    if (!git::fetch_remote(path, target.remote, overlay.credentials, true, &err))
        return fail("fetch", err);
    err.clear();
    if (!git::reset_hard(path, target.remote, target.branch, &err))
        return fail("reset", err);

    // Confirm the checkout really sits on the remote tip before calling it done.
    err.clear();
    auto branch_now = git::get_current_branch(path, &err);
    auto head = git::get_local_hash(path, &err);
    auto tip = git::get_remote_branch_hash(path, target.remote, target.branch, &err);
    if (!branch_now || *branch_now != target.branch)
        result.errors.push_back("checkout is not on branch " + target.branch);
    if (!head || !tip || *head != *tip)
        result.errors.push_back("HEAD does not match " + target_ref +
                                (err.empty() ? "" : ": " + err));

    if (result.errors.empty()) {
        result.outcome = DeployOutcome::Success;
        result.message = result.previous_branch == target.branch
                             ? "Successfully updated branch: " + target.branch
                             : "Successfully changed to branch: " + target.branch;
        log_info(result.message, {{"repo", folder}, {"commit", head.value_or("")}});
    } else {
        result.outcome = DeployOutcome::PartialFailure;
        result.message = "Deployment of " + target_ref + " could not be verified";
        log_warning(result.message, {{"repo", folder}, {"errors", result.errors.front()}});
    }

    if (hook_) {
        result.post_hook.invoked = true;
        std::error_code ec;
        fs::path abs = fs::absolute(path, ec);
        try {
            result.post_hook.output = hook_(ec ? path : abs);
            result.post_hook.ok = true;
        } catch (const std::exception& e) {
            result.post_hook.output = e.what();
            log_warning("Post-deploy hook failed for " + folder, e.what());
        }
    }
    return result;
}

} // namespace multideploy
