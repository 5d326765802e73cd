#ifndef CREDENTIAL_RESOLVER_HPP
#define CREDENTIAL_RESOLVER_HPP

#include <filesystem>
#include <string>

#include "git_utils.hpp"

namespace multideploy {

class TokenSource;

enum class AuthMode { None, SshKeyFile, InstallationApp };

const char* to_string(AuthMode mode);

/// Username presented together with an installation token.
constexpr const char* kTokenUsername = "x-access-token";

/// `<root>/<folder>.key`: SSH private key used for that checkout.
std::filesystem::path key_file_path(const std::filesystem::path& root, const std::string& folder);

/// `<root>/<folder>.github`: marks a checkout authenticated through the app.
std::filesystem::path app_marker_path(const std::filesystem::path& root,
                                      const std::string& folder);

/**
 * @brief Decide how the checkout @a folder authenticates.
 *
 * The key file is checked first, so a folder with both files uses SSH.
 */
AuthMode detect_auth_mode(const std::filesystem::path& root, const std::string& folder);

/// Credentials for one version-control operation.
struct CredentialOverlay {
    AuthMode mode = AuthMode::None;
    git::Credentials credentials;

    bool empty() const { return mode == AuthMode::None; }
};

/**
 * @brief Builds the credentials a remote operation on a checkout needs.
 *
 * The resolver holds no state between calls; installation tokens come from
 * the TokenSource, which does its own caching.
 */
class CredentialResolver {
  public:
    /// @param tokens Token source, or `nullptr` when the app is unavailable.
    explicit CredentialResolver(TokenSource* tokens) : tokens_(tokens) {}

    /**
     * @brief Credentials for @a folder under @a root.
     *
     * A failure to obtain an installation token is logged and yields an
     * empty overlay; the remote operation then fails with its own error.
     */
    CredentialOverlay resolve(const std::filesystem::path& root, const std::string& folder) const;

    static CredentialOverlay for_key_file(const std::filesystem::path& key_file);
    static CredentialOverlay for_installation_app(const std::string& token);

  private:
    TokenSource* tokens_;
};

} // namespace multideploy

#endif // CREDENTIAL_RESOLVER_HPP
