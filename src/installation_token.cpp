#include "installation_token.hpp"

#include <nlohmann/json.hpp>

#include "app_jwt.hpp"
#include "config_store.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "logger.hpp"
#include "time_utils.hpp"
#include "version.hpp"

namespace multideploy {

namespace {

constexpr int kReposPerPage = 100;

bool is_success(long status) { return status >= 200 && status < 300; }

} // namespace

std::optional<InstallationToken> TokenCache::get() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return token_;
}

void TokenCache::store(InstallationToken token) {
    std::lock_guard<std::mutex> lk(mtx_);
    token_ = std::move(token);
}

void TokenCache::clear() {
    std::lock_guard<std::mutex> lk(mtx_);
    token_.reset();
}

AppSettings AppSettings::from_config(const ConfigStore& cfg) {
    AppSettings s;
    s.app_id = cfg.get_or("github_app.app_id", "");
    s.private_key = cfg.get_or("github_app.private_key", "");
    s.installation_id = cfg.get_or("github_app.installation_id", "");
    s.api_url = cfg.get_or("github_app.api_url", kDefaultApiUrl);
    return s;
}

InstallationTokenService::InstallationTokenService(AppSettings settings, TokenCache& cache,
                                                   HttpClient& http, Clock clock)
    : settings_(std::move(settings)), cache_(cache), http_(http), clock_(std::move(clock)) {
    if (!clock_)
        clock_ = unix_now;
}

std::string InstallationTokenService::api_base() const {
    std::string base = settings_.api_url.empty() ? kDefaultApiUrl : settings_.api_url;
    while (!base.empty() && base.back() == '/')
        base.pop_back();
    return base;
}

std::vector<std::string> InstallationTokenService::api_headers(const std::string& auth) const {
    return {"Authorization: " + auth, "Accept: application/vnd.github+json",
            std::string("User-Agent: multideploy/") + MULTIDEPLOY_VERSION,
            "X-GitHub-Api-Version: 2022-11-28"};
}

std::string InstallationTokenService::get_token() {
    if (!configured())
        throw ConfigurationError(
            "github_app.app_id, github_app.private_key and github_app.installation_id must be set");
    std::time_t now = clock_();
    if (auto cached = cache_.get()) {
        if (cached->expires_at - now > kTokenRefreshBuffer)
            return cached->value;
        log_debug("Installation token expires soon; refreshing");
    }
    InstallationToken token = exchange(now);
    cache_.store(token);
    return token.value;
}

InstallationToken InstallationTokenService::exchange(std::time_t now) {
    const std::string assertion =
        make_app_assertion(settings_.app_id, private_key_pem(settings_.private_key), now);
    const std::string url =
        api_base() + "/app/installations/" + settings_.installation_id + "/access_tokens";
    HttpResponse resp;
    try {
        resp = http_.request("POST", url, api_headers("Bearer " + assertion), "");
    } catch (const std::runtime_error& e) {
        throw TokenExchangeError(0, "", e.what());
    }
    if (!is_success(resp.status))
        throw TokenExchangeError(resp.status, resp.body);

    nlohmann::json j = nlohmann::json::parse(resp.body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("token") || !j["token"].is_string())
        throw TokenExchangeError(resp.status, resp.body, "response carries no token");

    InstallationToken token;
    token.value = j["token"].get<std::string>();
    token.expires_at = now + kDefaultTokenLifetime;
    if (j.contains("expires_at") && j["expires_at"].is_string()) {
        if (auto t = parse_iso8601_utc(j["expires_at"].get<std::string>()))
            token.expires_at = *t;
        else
            log_warning("Unparseable token expiry", j["expires_at"].get<std::string>());
    }
    log_info("Obtained installation token",
             {{"installation", settings_.installation_id},
              {"expires_at", format_local_time(token.expires_at)}});
    return token;
}

std::vector<InstallationRepository> InstallationTokenService::list_repositories() {
    std::vector<InstallationRepository> out;
    const std::string token = get_token();
    for (int page = 1;; ++page) {
        const std::string url = api_base() + "/installation/repositories?per_page=" +
                                std::to_string(kReposPerPage) + "&page=" + std::to_string(page);
        HttpResponse resp;
        try {
            resp = http_.request("GET", url, api_headers("token " + token), "");
        } catch (const std::runtime_error& e) {
            throw TokenExchangeError(0, "", e.what());
        }
        if (!is_success(resp.status))
            throw TokenExchangeError(resp.status, resp.body, "repository listing failed");
        nlohmann::json j = nlohmann::json::parse(resp.body, nullptr, false);
        if (j.is_discarded() || !j.contains("repositories") || !j["repositories"].is_array())
            throw TokenExchangeError(resp.status, resp.body, "unexpected repository listing");
        const auto& repos = j["repositories"];
        for (const auto& r : repos) {
            InstallationRepository repo;
            repo.name = r.value("name", "");
            repo.full_name = r.value("full_name", "");
            if (r.contains("description") && r["description"].is_string())
                repo.description = r["description"].get<std::string>();
            out.push_back(std::move(repo));
        }
        if (repos.size() < static_cast<size_t>(kReposPerPage))
            break;
    }
    return out;
}

} // namespace multideploy
