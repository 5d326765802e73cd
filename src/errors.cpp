#include "errors.hpp"

#include <utility>

namespace multideploy {

NotARepository::NotARepository(const std::filesystem::path& path, const std::string& detail)
    : std::runtime_error(path.string() + " is not a git repository" +
                         (detail.empty() ? "" : ": " + detail)),
      path_(path) {}

TokenExchangeError::TokenExchangeError(long status, std::string body, const std::string& detail)
    : std::runtime_error("Installation token request failed (HTTP " + std::to_string(status) +
                         ")" + (detail.empty() ? "" : ": " + detail)),
      status_(status), body_(std::move(body)) {}

VersionControlError::VersionControlError(std::string step, const std::string& message)
    : std::runtime_error(step + " failed: " + message), step_(std::move(step)) {}

AlreadyExists::AlreadyExists(const std::filesystem::path& path)
    : std::runtime_error(path.string() + " already exists"), path_(path) {}

} // namespace multideploy
