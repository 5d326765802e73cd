#ifndef APP_JWT_HPP
#define APP_JWT_HPP

#include <ctime>
#include <string>

namespace multideploy {

/// Lifetime of a signed app assertion.
constexpr std::time_t kAssertionLifetime = 600;

std::string base64url_encode(const std::string& input);

/**
 * @brief Decode standard base64, ignoring embedded whitespace.
 *
 * @throws ConfigurationError if @a input is not valid base64.
 */
std::string base64_decode(const std::string& input);

/**
 * @brief Turn the configured private key setting into PEM text.
 *
 * The setting is normally base64-encoded PEM; a value that already starts
 * with a PEM header is used as-is.
 */
std::string private_key_pem(const std::string& configured);

/**
 * @brief Build an RS256-signed assertion identifying the app.
 *
 * Claims: `iat = now`, `exp = now + kAssertionLifetime`, `iss = app_id`.
 *
 * @param app_id  App identifier placed in `iss`.
 * @param pem     RSA private key in PEM form.
 * @param now     Issue time (Unix seconds).
 * @throws ConfigurationError if the key cannot be loaded or used.
 */
std::string make_app_assertion(const std::string& app_id, const std::string& pem, std::time_t now);

} // namespace multideploy

#endif // APP_JWT_HPP
