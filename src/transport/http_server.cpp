#include "transport/http_server.hpp"
#include "util.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <sstream>
#include <system_error>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace cmdgate {

namespace {

constexpr size_t kMaxHeaderBytes = 16384;
constexpr int kRecvTimeoutSeconds = 10;

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

void send_response(int fd, const ServerResponse& resp) {
    std::string out = "HTTP/1.1 " + std::to_string(resp.status) + " " +
                      reason_phrase(resp.status) + "\r\n";
    if (!resp.content_type.empty()) out += "Content-Type: " + resp.content_type + "\r\n";
    for (const auto& h : resp.headers) out += h.first + ": " + h.second + "\r\n";
    out += "Content-Length: " + std::to_string(resp.body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += resp.body;

    const char* p = out.data();
    size_t left = out.size();
    while (left > 0) {
        ssize_t n = ::send(fd, p, left, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        p += n;
        left -= static_cast<size_t>(n);
    }
}

void send_plain(int fd, int status, const std::string& text) {
    ServerResponse resp;
    resp.status = status;
    resp.content_type = "text/plain";
    resp.body = text;
    send_response(fd, resp);
}

void close_pair(int p[2]) {
    for (int i = 0; i < 2; ++i) {
        if (p[i] >= 0) { ::close(p[i]); p[i] = -1; }
    }
}

} // namespace

std::string ServerRequest::header(const std::string& name) const {
    auto it = headers.find(name);
    return it != headers.end() ? it->second : "";
}

// ── HttpServer ────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string host, uint16_t port, uint32_t max_body,
                       uint32_t max_connections, Handler handler)
    : host_(std::move(host))
    , port_(port)
    , max_body_(max_body)
    , max_connections_(max_connections == 0 ? 1 : max_connections)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::string& error) {
    if (::pipe(shutdown_pipe_) != 0) {
        error = std::string("failed to create shutdown pipe: ") + std::strerror(errno);
        return false;
    }

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = AI_PASSIVE | AI_NUMERICSERV;
    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port_);
    int gai = ::getaddrinfo(host_.empty() ? nullptr : host_.c_str(), port_str.c_str(),
                            &hints, &res);
    if (gai != 0) {
        error = "invalid bind address " + host_ + ": " + gai_strerror(gai);
        close_pair(shutdown_pipe_);
        return false;
    }

    std::string last_error = "no usable address";
    for (auto* ai = res; ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::string("socket failed: ") + std::strerror(errno);
            continue;
        }
        int opt = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
#ifdef SO_NOSIGPIPE  // macOS
        ::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif
        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
            last_error = "bind " + host_ + ":" + port_str + " failed: " + std::strerror(errno);
            ::close(fd);
            continue;
        }
        if (::listen(fd, 64) != 0) {
            last_error = std::string("listen failed: ") + std::strerror(errno);
            ::close(fd);
            continue;
        }
        server_fd_ = fd;
        break;
    }
    ::freeaddrinfo(res);

    if (server_fd_ < 0) {
        error = last_error;
        close_pair(shutdown_pipe_);
        return false;
    }

    struct sockaddr_storage bound{};
    socklen_t blen = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        if (bound.ss_family == AF_INET) {
            port_ = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
        } else if (bound.ss_family == AF_INET6) {
            port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
        }
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0) {
        ssize_t ignored = ::write(shutdown_pipe_[1], &b, 1);
        (void)ignored;
    }
    if (thread_.joinable()) thread_.join();
    if (server_fd_ >= 0) { ::close(server_fd_); server_fd_ = -1; }
    close_pair(shutdown_pipe_);

    // Workers capture this; they must all be gone before we return.
    std::unique_lock<std::mutex> lock(workers_mutex_);
    workers_done_.wait(lock, [this]() { return active_ == 0; });
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN; fds[0].revents = 0;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN; fds[1].revents = 0;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        int cfd = ::accept(server_fd_, nullptr, nullptr);
        if (cfd < 0) continue;

        struct timeval tv{kRecvTimeoutSeconds, 0};
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            if (active_ >= max_connections_) {
                send_plain(cfd, 503, "Too many concurrent requests");
                ::close(cfd);
                continue;
            }
            ++active_;
        }

        try {
            std::thread([this, cfd]() {
                handle_connection(cfd);
                ::close(cfd);
                std::lock_guard<std::mutex> lock(workers_mutex_);
                --active_;
                workers_done_.notify_all();
            }).detach();
        } catch (const std::system_error&) {
            send_plain(cfd, 503, "Server busy");
            ::close(cfd);
            std::lock_guard<std::mutex> lock(workers_mutex_);
            --active_;
            workers_done_.notify_all();
        }
    }
}

// ── Request handling ──────────────────────────────────────────────────

void HttpServer::handle_connection(int fd) const {
    // Read until end-of-headers (CRLFCRLF), capped.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > kMaxHeaderBytes) {
            send_plain(fd, 400, "Headers too large");
            return;
        }
    }

    auto hdr_end = buf.find("\r\n\r\n");
    std::string headers_raw = buf.substr(0, hdr_end);
    std::string leftover    = buf.substr(hdr_end + 4);

    ServerRequest req;
    auto rl_end = headers_raw.find("\r\n");
    {
        std::istringstream ss(headers_raw.substr(0, rl_end));
        std::string target, version;
        if (!(ss >> req.method >> target >> version) || version.rfind("HTTP/", 0) != 0) {
            send_plain(fd, 400, "Malformed request line");
            return;
        }
        req.path = target.substr(0, target.find('?'));
    }

    size_t pos = (rl_end == std::string::npos) ? headers_raw.size() : rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }

    if (req.method == "POST" || req.method == "PUT") {
        if (!req.header("transfer-encoding").empty()) {
            send_plain(fd, 411, "Chunked bodies are not supported; send Content-Length");
            return;
        }
        std::string len_text = req.header("content-length");
        if (len_text.empty()) {
            send_plain(fd, 411, "Content-Length required");
            return;
        }
        char* end = nullptr;
        errno = 0;
        unsigned long long content_len = std::strtoull(len_text.c_str(), &end, 10);
        if (end == len_text.c_str() || *end != '\0' || errno != 0) {
            send_plain(fd, 400, "Invalid Content-Length");
            return;
        }
        if (content_len > max_body_) {
            send_plain(fd, 413, "Payload too large");
            return;
        }

        req.body = std::move(leftover);
        while (req.body.size() < content_len) {
            ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                send_plain(fd, 400, "Incomplete request body");
                return;
            }
            req.body.append(tmp, static_cast<size_t>(n));
        }
        req.body.resize(static_cast<size_t>(content_len));
    }

    ServerResponse resp;
    try {
        resp = handler_(req);
    } catch (const std::exception& e) {
        resp = ServerResponse{};
        resp.status = 500;
        resp.content_type = "text/plain";
        resp.body = std::string("Internal server error: ") + e.what();
    }
    send_response(fd, resp);
}

} // namespace cmdgate
