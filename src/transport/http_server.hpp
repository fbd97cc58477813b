#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace cmdgate {

// A parsed inbound HTTP request.
struct ServerRequest {
    std::string method;
    std::string path;                           // query string dropped
    std::map<std::string, std::string> headers; // names lowercased
    std::string body;

    // Return a header value (name lowercased), or "" if absent.
    std::string header(const std::string& name) const;
};

struct ServerResponse {
    int         status       = 200;
    std::string content_type = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers; // extra headers
};

// Small HTTP/1.1 server: one accept thread, one worker thread per
// connection, one request per connection (Connection: close). At most
// max_connections requests run at once; beyond that clients get 503.
class HttpServer {
public:
    using Handler = std::function<ServerResponse(const ServerRequest&)>;

    // port 0 binds an ephemeral port; see port().
    // max_body: maximum POST body size in bytes; larger bodies get 413.
    HttpServer(std::string host, uint16_t port, uint32_t max_body,
               uint32_t max_connections, Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Bind, listen and start the accept thread. Returns false and
    // populates error on failure.
    bool start(std::string& error);

    // Stop accepting, then wait for in-flight requests to finish.
    void stop();

    // Actually bound port (valid after start()).
    uint16_t port() const { return port_; }

    bool running() const { return running_.load(); }

private:
    void accept_loop();
    void handle_connection(int client_fd) const;

    std::string host_;
    uint16_t    port_;
    uint32_t    max_body_;
    uint32_t    max_connections_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex workers_mutex_;
    std::condition_variable workers_done_;
    uint32_t active_ = 0;
};

} // namespace cmdgate
