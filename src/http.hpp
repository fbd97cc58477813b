#pragma once
#include <atomic>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace cmdgate {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::string body;
    std::vector<Header> headers;
    long timeout_seconds = 30;
    size_t max_body = 0;            // 0 = unlimited
};

struct HttpResponse {
    long status_code = 0;           // 0 when no response was received
    std::string body;
    std::vector<Header> headers;    // names lower-cased
    std::string error;              // transport failure, empty on success
    bool truncated = false;         // body cut at max_body

    // First header value with that (case-insensitive) name, or "".
    std::string header(const std::string& name) const;
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30);
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 30);
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse send(const HttpRequest& request) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Elsewhere: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse send(const HttpRequest& request) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

// One-shot request through the platform client.
HttpResponse http_send(const HttpRequest& request);

} // namespace cmdgate
