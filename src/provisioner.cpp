#include "provisioner.hpp"

#include <stdexcept>
#include <system_error>
#include <vector>

#include "credential_resolver.hpp"
#include "errors.hpp"
#include "folder_locks.hpp"
#include "git_utils.hpp"
#include "installation_token.hpp"
#include "logger.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;

namespace multideploy {

namespace {

/// Removes the registered paths unless commit() was called.
class ProvisionRollback {
  public:
    ~ProvisionRollback() {
        if (committed_)
            return;
        for (auto it = paths_.rbegin(); it != paths_.rend(); ++it) {
            std::error_code ec;
            fs::remove_all(*it, ec);
            if (ec)
                log_error("Unable to remove " + it->string() + ": " + ec.message());
        }
    }
    void track(const fs::path& p) { paths_.push_back(p); }
    void commit() { committed_ = true; }

  private:
    std::vector<fs::path> paths_;
    bool committed_ = false;
};

void require_absent(const fs::path& p) {
    std::error_code ec;
    if (fs::exists(fs::symlink_status(p, ec)))
        throw AlreadyExists(p);
}

} // namespace

void validate_folder_name(const std::string& folder) {
    if (folder.empty() || folder == "." || folder == ".." ||
        folder.find('/') != std::string::npos || folder.find('\0') != std::string::npos)
        throw std::invalid_argument("invalid folder name: '" + folder + "'");
}

std::string app_clone_url(const std::string& source) {
    if (source.find("://") != std::string::npos)
        return source;
    std::string name = source;
    if (name.size() > 4 && name.compare(name.size() - 4, 4, ".git") == 0)
        name.resize(name.size() - 4);
    return "https://github.com/" + name + ".git";
}

Provisioner::Provisioner(fs::path root, TokenSource* tokens, FolderLocks& locks)
    : root_(std::move(root)), tokens_(tokens), locks_(locks) {}

void Provisioner::provision(const std::string& folder, const std::string& source,
                            const ProvisionAuth& auth) {
    validate_folder_name(folder);
    if (source.empty())
        throw std::invalid_argument("clone source must not be empty");
    auto lock = locks_.acquire(folder);
    require_absent(root_ / folder);
    if (const auto* ssh = std::get_if<SshAuth>(&auth))
        provision_ssh(folder, source, *ssh);
    else
        provision_app(folder, source);
}

void Provisioner::provision_ssh(const std::string& folder, const std::string& source,
                                const SshAuth& auth) {
    const fs::path dest = root_ / folder;
    const fs::path key = key_file_path(root_, folder);
    require_absent(key);

    ProvisionRollback rollback;
    std::string err;
    rollback.track(key);
    if (!procutil::write_new_file(key, auth.key_bytes, 0600, &err))
        throw VersionControlError("write key file", key.string() + ": " + err);

    log_info("Cloning " + source + " into " + folder, {{"auth", "ssh_key"}});
    rollback.track(dest);
    const CredentialOverlay overlay = CredentialResolver::for_key_file(key);
    if (!git::clone_repo(dest, source, overlay.credentials, &err)) {
        log_error("Clone of " + source + " failed", err);
        throw VersionControlError("clone", err);
    }
    rollback.commit();
}

void Provisioner::provision_app(const std::string& folder, const std::string& source) {
    const fs::path dest = root_ / folder;
    const fs::path marker = app_marker_path(root_, folder);
    require_absent(marker);
    if (!tokens_)
        throw ConfigurationError("installation app is not configured");
    const std::string token = tokens_->get_token();
    const std::string url = app_clone_url(source);

    ProvisionRollback rollback;
    std::string err;
    log_info("Cloning " + url + " into " + folder, {{"auth", "github_app"}});
    rollback.track(dest);
    const CredentialOverlay overlay = CredentialResolver::for_installation_app(token);
    if (!git::clone_repo(dest, url, overlay.credentials, &err)) {
        log_error("Clone of " + url + " failed", err);
        throw VersionControlError("clone", err);
    }
    rollback.track(marker);
    if (!procutil::write_new_file(marker, "", 0644, &err))
        throw VersionControlError("write marker", marker.string() + ": " + err);
    rollback.commit();
}

} // namespace multideploy
