#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <string>
#include <vector>

namespace multideploy {

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief Minimal blocking HTTP interface used to talk to the token authority.
 *
 * Implementations throw `std::runtime_error` when no response was received at
 * all (DNS, TLS, timeout); any HTTP status is returned as a response.
 */
class HttpClient {
  public:
    virtual ~HttpClient() = default;
    virtual HttpResponse request(const std::string& method, const std::string& url,
                                 const std::vector<std::string>& headers,
                                 const std::string& body) = 0;
};

/// libcurl-backed client. Each request uses its own easy handle.
class CurlHttpClient : public HttpClient {
  public:
    explicit CurlHttpClient(long timeout_seconds = 30);
    HttpResponse request(const std::string& method, const std::string& url,
                         const std::vector<std::string>& headers,
                         const std::string& body) override;

  private:
    long timeout_seconds_;
};

} // namespace multideploy

#endif // HTTP_CLIENT_HPP
