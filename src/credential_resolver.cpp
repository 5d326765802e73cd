#include "credential_resolver.hpp"

#include <system_error>

#include "installation_token.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace multideploy {

const char* to_string(AuthMode mode) {
    switch (mode) {
    case AuthMode::SshKeyFile:
        return "ssh_key";
    case AuthMode::InstallationApp:
        return "github_app";
    case AuthMode::None:
        break;
    }
    return "none";
}

fs::path key_file_path(const fs::path& root, const std::string& folder) {
    return root / (folder + ".key");
}

fs::path app_marker_path(const fs::path& root, const std::string& folder) {
    return root / (folder + ".github");
}

AuthMode detect_auth_mode(const fs::path& root, const std::string& folder) {
    std::error_code ec;
    if (fs::exists(key_file_path(root, folder), ec))
        return AuthMode::SshKeyFile;
    if (fs::exists(app_marker_path(root, folder), ec))
        return AuthMode::InstallationApp;
    return AuthMode::None;
}

CredentialOverlay CredentialResolver::for_key_file(const fs::path& key_file) {
    CredentialOverlay o;
    o.mode = AuthMode::SshKeyFile;
    std::error_code ec;
    o.credentials.identity_file = fs::absolute(key_file, ec);
    if (ec)
        o.credentials.identity_file = key_file;
    o.credentials.verify_host_key = false;
    return o;
}

CredentialOverlay CredentialResolver::for_installation_app(const std::string& token) {
    CredentialOverlay o;
    o.mode = AuthMode::InstallationApp;
    o.credentials.username = kTokenUsername;
    o.credentials.secret = token;
    return o;
}

CredentialOverlay CredentialResolver::resolve(const fs::path& root,
                                              const std::string& folder) const {
    switch (detect_auth_mode(root, folder)) {
    case AuthMode::SshKeyFile:
        log_debug("Using SSH key for " + folder);
        return for_key_file(key_file_path(root, folder));
    case AuthMode::InstallationApp:
        if (!tokens_) {
            log_warning("Installation app not configured; " + folder + " uses no credentials");
            return {};
        }
        try {
            return for_installation_app(tokens_->get_token());
        } catch (const std::exception& e) {
            log_warning("Unable to obtain installation token for " + folder + ": " + e.what());
            return {};
        }
    case AuthMode::None:
        break;
    }
    return {};
}

} // namespace multideploy
