// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Same interface behaviour as the libcurl client in http.cpp;
// http_init/cleanup are no-ops (OpenSSL 1.1+ auto-inits).
#ifdef __linux__

#include "http.hpp"
#include "util.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>

namespace cmdgate {

static const std::atomic<bool>* g_socket_abort_flag = nullptr;

void http_init() {}
void http_cleanup() {}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_socket_abort_flag = flag;
}

static bool aborted() {
    return g_socket_abort_flag && g_socket_abort_flag->load(std::memory_order_relaxed);
}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls = false;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static bool parse_url(const std::string& url, ParsedUrl& out, std::string& error) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        error = "invalid URL: " + url;
        return false;
    }
    std::string scheme = to_lower(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        error = "unsupported URL scheme: " + scheme;
        return false;
    }
    out.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?#", host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    out.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);
    if (out.path[0] != '/') out.path.insert(0, "/");
    auto hash = out.path.find('#');
    if (hash != std::string::npos) out.path.erase(hash);

    // Strip userinfo; credentials in URLs are not forwarded.
    auto at = host_port.rfind('@');
    if (at != std::string::npos) host_port.erase(0, at + 1);

    if (!host_port.empty() && host_port[0] == '[') {
        auto close = host_port.find(']');
        if (close == std::string::npos) {
            error = "invalid URL: " + url;
            return false;
        }
        out.host = host_port.substr(1, close - 1);
        out.port = (close + 1 < host_port.size() && host_port[close + 1] == ':')
            ? host_port.substr(close + 2) : "";
    } else {
        size_t colon = host_port.rfind(':');
        if (colon != std::string::npos) {
            out.host = host_port.substr(0, colon);
            out.port = host_port.substr(colon + 1);
        } else {
            out.host = host_port;
        }
    }
    if (out.port.empty()) out.port = out.tls ? "443" : "80";
    if (out.host.empty()) {
        error = "invalid URL: missing host: " + url;
        return false;
    }
    return true;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;

    Connection() = default;
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs, std::string& error) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        int gai = getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res);
        if (gai != 0) {
            error = "cannot resolve " + url.host + ": " + gai_strerror(gai);
            return false;
        }

        bool connected = false;
        int last_errno = 0;
        for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) { last_errno = errno; continue; }

            // Non-blocking connect so we can honour timeout_secs.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS) {
                fd_set wset;
                FD_ZERO(&wset);
                FD_SET(fd, &wset);
                struct timeval tv{timeout_secs, 0};
                rc = select(fd + 1, nullptr, &wset, nullptr, &tv);
                if (rc > 0) {
                    int err = 0;
                    socklen_t elen = sizeof(err);
                    getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                    if (err == 0) {
                        fcntl(fd, F_SETFL, flags);
                        connected = true;
                    } else {
                        last_errno = err;
                    }
                } else {
                    last_errno = (rc == 0) ? ETIMEDOUT : errno;
                }
            } else {
                last_errno = errno;
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (!connected) {
            error = "connection to " + url.host + ":" + url.port + " failed: " +
                    std::strerror(last_errno);
            return false;
        }

        // Use full timeout for TLS handshake, then switch to 1-second slices
        // so abort-flag checks work while reading the body.
        if (url.tls) {
            set_socket_timeout(timeout_secs);

            ctx = SSL_CTX_new(TLS_client_method());
            if (!ctx) { error = "TLS setup failed"; return false; }
            SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
            SSL_CTX_set_default_verify_paths(ctx);
            SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

            ssl = SSL_new(ctx);
            if (!ssl) { error = "TLS setup failed"; return false; }
            SSL_set_fd(ssl, fd);
            SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI
            SSL_set1_host(ssl, url.host.c_str());

            if (SSL_connect(ssl) != 1) {
                unsigned long code = ERR_get_error();
                char buf[256] = "unknown error";
                if (code != 0) ERR_error_string_n(code, buf, sizeof(buf));
                error = std::string("TLS handshake with ") + url.host + " failed: " + buf;
                return false;
            }
        }

        set_socket_timeout(1);
        return true;
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on error or abort.
    // Each 1-second slice expiry loops back so the abort flag is rechecked,
    // until the overall deadline passes.
    ssize_t read_some(char* buf, size_t len) {
        while (true) {
            if (aborted() || time(nullptr) > deadline) return -1;

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE)
                    continue;
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK))
                    continue; // 1-second slice expired
                if (err == SSL_ERROR_SYSCALL && n == 0) return 0; // unclean close
                return -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (aborted() || time(nullptr) > deadline) return false;
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

    time_t deadline = 0;

private:
    void set_socket_timeout(long secs) {
        struct timeval tv{secs, 0};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const HttpRequest& request, const ParsedUrl& url) {
    std::string req;
    req.reserve(512 + request.body.size());
    req += request.method + " " + url.path + " HTTP/1.1\r\n";

    bool default_port = (url.tls && url.port == "443") || (!url.tls && url.port == "80");
    std::string host = url.host.find(':') != std::string::npos ? "[" + url.host + "]" : url.host;
    req += "Host: " + host + (default_port ? "" : ":" + url.port) + "\r\n";

    bool has_content_length = false;
    bool has_user_agent = false;
    for (const auto& h : request.headers) {
        std::string name = to_lower(h.first);
        if (name == "host" || name == "connection") continue;
        req += h.first + ": " + h.second + "\r\n";
        if (name == "content-length") has_content_length = true;
        if (name == "user-agent") has_user_agent = true;
    }
    if (!has_user_agent) req += "User-Agent: cmdgate\r\n";
    if (!has_content_length &&
        (!request.body.empty() || request.method == "POST" || request.method == "PUT"))
        req += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += request.body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false on EOF before a newline.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        if (leftover.size() > 65536) return false;
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

struct ResponseHead {
    long status = 0;
    bool is_chunked = false;
    bool has_length = false;
    size_t content_length = 0;
};

// Parse status line + headers into head and resp.headers.
static bool parse_response_headers(Connection& conn, std::string& leftover,
                                   ResponseHead& head, HttpResponse& resp) {
    std::string status_line;
    if (!read_line(conn, leftover, status_line)) return false;

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (status_line.rfind("HTTP/", 0) != 0 || sp1 == std::string::npos) return false;
    char* end = nullptr;
    std::string code = status_line.substr(sp1 + 1, 3);
    long status = std::strtol(code.c_str(), &end, 10);
    if (end == code.c_str() || status < 100 || status > 999) return false;
    head.status = status;

    std::string line;
    while (read_line(conn, leftover, line)) {
        if (line.empty()) return true; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = to_lower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        resp.headers.emplace_back(name, value);

        if (name == "transfer-encoding") {
            head.is_chunked = (to_lower(value).find("chunked") != std::string::npos);
        } else if (name == "content-length") {
            errno = 0;
            unsigned long long n = std::strtoull(value.c_str(), &end, 10);
            if (end != value.c_str() && errno == 0) {
                head.content_length = static_cast<size_t>(n);
                head.has_length = true;
            }
        }
    }
    return false;
}

// Appends body bytes while honouring max_body. Returns false once the
// limit is hit so callers stop reading.
struct BodySink {
    std::string& out;
    size_t limit;
    bool truncated = false;

    bool append(const char* data, size_t len) {
        if (limit == 0) { out.append(data, len); return true; }
        size_t room = out.size() < limit ? limit - out.size() : 0;
        out.append(data, std::min(room, len));
        if (len > room) { truncated = true; return false; }
        return true;
    }
};

// Read exactly n bytes, consuming leftover first.
static bool read_exactly(Connection& conn, std::string& leftover,
                         size_t n, BodySink& sink) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            bool more = sink.append(leftover.data(), take);
            leftover.erase(0, take);
            n -= take;
            if (!more) return false;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
        if (got <= 0) return false;
        n -= static_cast<size_t>(got);
        if (!sink.append(buf, static_cast<size_t>(got))) return false;
    }
    return true;
}

static void read_until_eof(Connection& conn, std::string& leftover, BodySink& sink) {
    if (!sink.append(leftover.data(), leftover.size())) return;
    leftover.clear();
    char buf[4096];
    for (;;) {
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) break;
        if (!sink.append(buf, static_cast<size_t>(n))) break;
    }
}

// Accumulate full body (handles chunked + content-length + read-to-close).
static void read_body(Connection& conn, std::string& leftover,
                      const ResponseHead& head, BodySink& sink) {
    if (head.is_chunked) {
        std::string size_line;
        while (read_line(conn, leftover, size_line)) {
            // Chunk size is hex, may have extensions after ';'
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) break;
            if (!read_exactly(conn, leftover, chunk_size, sink)) break;
            std::string crlf;
            read_line(conn, leftover, crlf); // trailing \r\n
        }
    } else if (head.has_length) {
        read_exactly(conn, leftover, head.content_length, sink);
    } else {
        read_until_eof(conn, leftover, sink);
    }
}

// ── Core request executor ──────────────────────────────────────

HttpResponse SocketHttpClient::send(const HttpRequest& request) {
    HttpResponse resp;

    ParsedUrl url;
    if (!parse_url(request.url, url, resp.error)) return resp;

    long timeout = request.timeout_seconds > 0 ? request.timeout_seconds : 30;
    Connection conn;
    conn.deadline = time(nullptr) + timeout;
    if (!conn.connect(url, timeout, resp.error)) return resp;

    std::string wire = build_request(request, url);
    if (!conn.write_all(wire.c_str(), wire.size())) {
        resp.error = aborted() ? "request aborted" : "failed to send request to " + url.host;
        return resp;
    }

    std::string leftover;
    ResponseHead head;
    if (!parse_response_headers(conn, leftover, head, resp)) {
        resp.headers.clear();
        if (aborted()) {
            resp.error = "request aborted";
        } else if (time(nullptr) > conn.deadline) {
            resp.error = "request timed out after " + std::to_string(timeout) + "s";
        } else {
            resp.error = "invalid HTTP response from " + url.host;
        }
        return resp;
    }
    resp.status_code = head.status;

    // HEAD, 1xx, 204 and 304 responses never carry a body.
    bool no_body = request.method == "HEAD" || head.status < 200 ||
                   head.status == 204 || head.status == 304;
    if (!no_body) {
        BodySink sink{resp.body, request.max_body};
        read_body(conn, leftover, head, sink);
        resp.truncated = sink.truncated;
    }
    return resp;
}

} // namespace cmdgate

#endif // __linux__
