#include "app_jwt.hpp"

#include <openssl/bio.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <nlohmann/json.hpp>

#include <cctype>
#include <vector>

#include "errors.hpp"

namespace multideploy {

namespace {

struct BioDeleter {
    void operator()(BIO* b) const { BIO_free(b); }
};
struct PkeyDeleter {
    void operator()(EVP_PKEY* k) const { EVP_PKEY_free(k); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
};

std::string rs256_sign(const std::string& pem, const std::string& input) {
    std::unique_ptr<BIO, BioDeleter> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio)
        throw ConfigurationError("Unable to read app private key");
    std::unique_ptr<EVP_PKEY, PkeyDeleter> key(
        PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key)
        throw ConfigurationError("App private key is not a valid PEM private key");
    if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA)
        throw ConfigurationError("App private key is not an RSA key");

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) != 1)
        throw ConfigurationError("Unable to initialise RS256 signer");
    size_t sig_len = 0;
    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, data, input.size()) != 1)
        throw ConfigurationError("RS256 signing failed");
    std::vector<unsigned char> sig(sig_len);
    if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, data, input.size()) != 1)
        throw ConfigurationError("RS256 signing failed");
    return std::string(reinterpret_cast<const char*>(sig.data()), sig_len);
}

} // namespace

std::string base64url_encode(const std::string& input) {
    if (input.empty())
        return "";
    std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
    int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(input.data()),
                            static_cast<int>(input.size()));
    std::string b64(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(n));
    for (auto& c : b64) {
        if (c == '+')
            c = '-';
        else if (c == '/')
            c = '_';
    }
    while (!b64.empty() && b64.back() == '=')
        b64.pop_back();
    return b64;
}

std::string base64_decode(const std::string& input) {
    std::string clean;
    clean.reserve(input.size());
    for (char c : input) {
        if (!std::isspace(static_cast<unsigned char>(c)))
            clean += c;
    }
    if (clean.empty())
        return "";
    if (clean.size() % 4 != 0)
        throw ConfigurationError("Invalid base64 length");
    std::vector<unsigned char> out(clean.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(clean.data()),
                            static_cast<int>(clean.size()));
    if (n < 0)
        throw ConfigurationError("Invalid base64 data");
    // EVP_DecodeBlock counts padding as zero bytes.
    size_t len = static_cast<size_t>(n);
    if (clean.back() == '=')
        --len;
    if (clean.size() > 1 && clean[clean.size() - 2] == '=')
        --len;
    return std::string(reinterpret_cast<const char*>(out.data()), len);
}

std::string private_key_pem(const std::string& configured) {
    if (configured.find("-----BEGIN") != std::string::npos)
        return configured;
    return base64_decode(configured);
}

std::string make_app_assertion(const std::string& app_id, const std::string& pem,
                               std::time_t now) {
    const nlohmann::json header = {{"alg", "RS256"}, {"typ", "JWT"}};
    const nlohmann::json payload = {{"iat", static_cast<long long>(now)},
                                    {"exp", static_cast<long long>(now + kAssertionLifetime)},
                                    {"iss", app_id}};
    const std::string signing_input =
        base64url_encode(header.dump()) + "." + base64url_encode(payload.dump());
    return signing_input + "." + base64url_encode(rs256_sign(pem, signing_input));
}

} // namespace multideploy
