#ifndef MULTIDEPLOY_ERRORS_HPP
#define MULTIDEPLOY_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>

namespace multideploy {

/// The path is not a usable working copy. Listings skip such folders.
class NotARepository : public std::runtime_error {
  public:
    explicit NotARepository(const std::filesystem::path& path, const std::string& detail = "");
    const std::filesystem::path& path() const { return path_; }

  private:
    std::filesystem::path path_;
};

/// Required installation-app settings are missing or unusable.
class ConfigurationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// The token authority rejected the exchange. Retrying may succeed.
class TokenExchangeError : public std::runtime_error {
  public:
    TokenExchangeError(long status, std::string body, const std::string& detail = "");
    long status() const { return status_; }
    const std::string& body() const { return body_; }

  private:
    long status_;
    std::string body_;
};

/// libgit2 reported a failure; the message is passed through verbatim.
class VersionControlError : public std::runtime_error {
  public:
    VersionControlError(std::string step, const std::string& message);
    const std::string& step() const { return step_; }

  private:
    std::string step_;
};

/// Provisioning target (checkout or credential file) is already present.
class AlreadyExists : public std::runtime_error {
  public:
    explicit AlreadyExists(const std::filesystem::path& path);
    const std::filesystem::path& path() const { return path_; }

  private:
    std::filesystem::path path_;
};

} // namespace multideploy

#endif // MULTIDEPLOY_ERRORS_HPP
