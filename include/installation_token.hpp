#ifndef INSTALLATION_TOKEN_HPP
#define INSTALLATION_TOKEN_HPP

#include <ctime>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class ConfigStore;

namespace multideploy {

class HttpClient;

/// Default API endpoint of the token authority.
constexpr const char* kDefaultApiUrl = "https://api.github.com";
/// A cached token is reused only while it has at least this long to live.
constexpr std::time_t kTokenRefreshBuffer = 300;
/// Lifetime assumed when the authority omits `expires_at`.
constexpr std::time_t kDefaultTokenLifetime = 3600;

struct InstallationToken {
    std::string value;
    std::time_t expires_at = 0;
};

/**
 * @brief Process-wide cache holding at most one installation token.
 *
 * Only get and store are serialized; two callers that both miss may each
 * perform an exchange and the later store wins.
 */
class TokenCache {
  public:
    std::optional<InstallationToken> get() const;
    void store(InstallationToken token);
    void clear();

  private:
    mutable std::mutex mtx_;
    std::optional<InstallationToken> token_;
};

struct AppSettings {
    std::string app_id;
    std::string private_key; ///< Base64-encoded PEM (raw PEM accepted)
    std::string installation_id;
    std::string api_url = kDefaultApiUrl;

    bool complete() const {
        return !app_id.empty() && !private_key.empty() && !installation_id.empty();
    }

    /// Read the `github_app.*` keys.
    static AppSettings from_config(const ConfigStore& cfg);
};

/// Anything able to hand out a currently valid access token.
class TokenSource {
  public:
    virtual ~TokenSource() = default;
    /**
     * @throws ConfigurationError when the app is not configured.
     * @throws TokenExchangeError when the authority refuses the exchange.
     */
    virtual std::string get_token() = 0;
};

struct InstallationRepository {
    std::string name;
    std::string full_name;
    std::string description;
};

/**
 * @brief Exchanges a signed app assertion for an installation access token.
 *
 * Tokens are cached in the supplied TokenCache and reused until they are
 * within kTokenRefreshBuffer seconds of expiring.
 */
class InstallationTokenService : public TokenSource {
  public:
    using Clock = std::function<std::time_t()>;

    InstallationTokenService(AppSettings settings, TokenCache& cache, HttpClient& http,
                             Clock clock = nullptr);

    std::string get_token() override;

    /// `true` when all three app settings are present.
    bool configured() const { return settings_.complete(); }

    /**
     * @brief Repositories visible to the installation, following pagination.
     *
     * @throws TokenExchangeError if a listing request fails.
     */
    std::vector<InstallationRepository> list_repositories();

  private:
    InstallationToken exchange(std::time_t now);
    std::vector<std::string> api_headers(const std::string& auth) const;
    std::string api_base() const;

    AppSettings settings_;
    TokenCache& cache_;
    HttpClient& http_;
    Clock clock_;
};

} // namespace multideploy

#endif // INSTALLATION_TOKEN_HPP
