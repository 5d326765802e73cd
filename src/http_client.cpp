#include "http_client.hpp"

#include <curl/curl.h>
#include <stdexcept>

namespace multideploy {

namespace {

size_t append_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlHandle {
    CURL* h = curl_easy_init();
    ~CurlHandle() {
        if (h)
            curl_easy_cleanup(h);
    }
};

struct HeaderList {
    curl_slist* list = nullptr;
    ~HeaderList() { curl_slist_free_all(list); }
};

} // namespace

CurlHttpClient::CurlHttpClient(long timeout_seconds) : timeout_seconds_(timeout_seconds) {}

HttpResponse CurlHttpClient::request(const std::string& method, const std::string& url,
                                     const std::vector<std::string>& headers,
                                     const std::string& body) {
    CurlHandle curl;
    if (!curl.h)
        throw std::runtime_error("curl_easy_init failed");
    HeaderList hdrs;
    for (const auto& h : headers)
        hdrs.list = curl_slist_append(hdrs.list, h.c_str());
    HttpResponse resp;
    curl_easy_setopt(curl.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.h, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl.h, CURLOPT_HTTPHEADER, hdrs.list);
    if (method == "POST" || !body.empty()) {
        curl_easy_setopt(curl.h, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }
    curl_easy_setopt(curl.h, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl.h, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl.h, CURLOPT_NOSIGNAL, 1L);
    CURLcode rc = curl_easy_perform(curl.h);
    if (rc != CURLE_OK)
        throw std::runtime_error(std::string("HTTP request to ") + url +
                                 " failed: " + curl_easy_strerror(rc));
    curl_easy_getinfo(curl.h, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
}

} // namespace multideploy
