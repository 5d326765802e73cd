#ifndef PROVISIONER_HPP
#define PROVISIONER_HPP

#include <filesystem>
#include <string>
#include <variant>

namespace multideploy {

class FolderLocks;
class TokenSource;

/// Clone over SSH using the supplied private key.
struct SshAuth {
    std::string key_bytes;
};

/// Clone using an installation access token.
struct AppAuth {};

using ProvisionAuth = std::variant<SshAuth, AppAuth>;

/**
 * @brief Reject folder names that are not a single plain path component.
 *
 * @throws std::invalid_argument for empty names, `.`, `..` or names
 *         containing a path separator.
 */
void validate_folder_name(const std::string& folder);

/// Clone URL used for an installation-app source (`owner/name` or a URL).
std::string app_clone_url(const std::string& source);

/**
 * @brief Creates new checkouts under the managed root.
 *
 * Provisioning is all or nothing: when the clone fails the destination and
 * any credential file written by the same call are removed before the error
 * propagates.
 */
class Provisioner {
  public:
    Provisioner(std::filesystem::path root, TokenSource* tokens, FolderLocks& locks);

    /**
     * @brief Clone @a source into `<root>/<folder>`.
     *
     * @throws AlreadyExists if the folder or its credential file is present.
     * @throws ConfigurationError if app auth is requested but not configured.
     * @throws TokenExchangeError if no installation token can be obtained.
     * @throws VersionControlError if the clone fails.
     */
    void provision(const std::string& folder, const std::string& source,
                   const ProvisionAuth& auth);

  private:
    void provision_ssh(const std::string& folder, const std::string& source, const SshAuth& auth);
    void provision_app(const std::string& folder, const std::string& source);

    std::filesystem::path root_;
    TokenSource* tokens_;
    FolderLocks& locks_;
};

} // namespace multideploy

#endif // PROVISIONER_HPP
