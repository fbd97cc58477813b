#include "http.hpp"
#include "util.hpp"

#include <curl/curl.h>
#include <string>

namespace cmdgate {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                             curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                             curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

struct BodyContext {
    std::string* body;
    size_t limit;
    bool truncated = false;
};

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<BodyContext*>(userdata);
    if (ctx->limit == 0) {
        ctx->body->append(ptr, total);
        return total;
    }
    size_t room = ctx->body->size() < ctx->limit ? ctx->limit - ctx->body->size() : 0;
    if (total > room) {
        ctx->body->append(ptr, room);
        ctx->truncated = true;
        return 0; // stops the transfer
    }
    ctx->body->append(ptr, total);
    return total;
}

static size_t header_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* headers = static_cast<std::vector<Header>*>(userdata);
    std::string line(ptr, total);
    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear(); // new response block (redirect or 100-continue)
        return total;
    }
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        headers->emplace_back(to_lower(trim(line.substr(0, colon))),
                              trim(line.substr(colon + 1)));
    }
    return total;
}

// ── RAII curl handle ──────────────────────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

HttpResponse CurlHttpClient::send(const HttpRequest& request) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.error = "failed to initialise libcurl";
        return response;
    }

    for (const auto& h : request.headers) {
        std::string entry = h.first + ": " + h.second;
        req.hlist = curl_slist_append(req.hlist, entry.c_str());
    }
    curl_easy_setopt(req.curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, request.timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_USERAGENT, "cmdgate");
    if (g_http_abort_flag) {
        curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    }

    if (request.method == "HEAD") {
        curl_easy_setopt(req.curl, CURLOPT_NOBODY, 1L);
    } else if (request.method != "GET") {
        curl_easy_setopt(req.curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    if (!request.body.empty() || request.method == "POST" || request.method == "PUT") {
        curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        if (request.method != "POST") {
            curl_easy_setopt(req.curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
    }

    BodyContext body{&response.body, request.max_body};
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(req.curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(req.curl, CURLOPT_HEADERDATA, &response.headers);

    CURLcode res = curl_easy_perform(req.curl);
    response.truncated = body.truncated;
    if (res == CURLE_OK || (res == CURLE_WRITE_ERROR && body.truncated)) {
        curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    } else {
        response.headers.clear();
        response.error = curl_easy_strerror(res);
    }
    return response;
}

} // namespace cmdgate
