#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace dgadmin {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl handle with common setup ────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;
    char errbuf[CURL_ERROR_SIZE] = {};

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

static void setup_request(CurlRequest& req, const std::string& url,
                           const std::vector<Header>& headers, long timeout) {
    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout);
    curl_easy_setopt(req.curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(req.curl, CURLOPT_ERRORBUFFER, req.errbuf);
}

static void set_post_body(CURL* curl, const std::string& body) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
}

static HttpResponse perform(CurlRequest& req) {
    HttpResponse response;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    CURLcode res = curl_easy_perform(req.curl);
    if (res != CURLE_OK) {
        // errbuf carries the detailed message (host, errno); strerror is the fallback
        response.error = req.errbuf[0] != '\0' ? req.errbuf : curl_easy_strerror(res);
        response.body.clear();
        return response;
    }
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::get(const std::string& url,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    return http_get(url, headers, timeout_seconds);
}

HttpResponse CurlHttpClient::post(const std::string& url,
                                   const std::string& body,
                                   const std::vector<Header>& headers,
                                   long timeout_seconds) {
    return http_post(url, body, headers, timeout_seconds);
}

HttpResponse http_post(const std::string& url,
                       const std::string& body,
                       const std::vector<Header>& headers,
                       long timeout_seconds) {
    CurlRequest req;
    if (!req) return {0, "", "failed to initialise libcurl handle"};
    setup_request(req, url, headers, timeout_seconds);
    set_post_body(req.curl, body);
    return perform(req);
}

HttpResponse http_get(const std::string& url,
                      const std::vector<Header>& headers,
                      long timeout_seconds) {
    CurlRequest req;
    if (!req) return {0, "", "failed to initialise libcurl handle"};
    setup_request(req, url, headers, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    return perform(req);
}

} // namespace dgadmin
