#include <catch2/catch.hpp>
#include "transport/http_transport.hpp"
#include "transport/http_server.hpp"
#include "dispatcher.hpp"
#include "http.hpp"
#include "tool_registry.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

using namespace cmdgate;
using nlohmann::json;

namespace {

// Blocks inside execute() until released, so a request can be held open.
class GateTool : public Tool {
public:
    GateTool(std::atomic<bool>& entered, std::atomic<bool>& release)
        : entered_(entered), release_(release) {}
    ToolResult execute(const json&) const override {
        entered_ = true;
        for (int i = 0; i < 500 && !release_.load(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return ToolResult{false, "released"};
    }
    std::string tool_name() const override { return "gate"; }
    std::string description() const override { return "Waits for release"; }
    json input_schema() const override { return {{"type", "object"}}; }

private:
    std::atomic<bool>& entered_;
    std::atomic<bool>& release_;
};

struct ServerFixture {
    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    ToolRegistry registry;
    std::unique_ptr<Dispatcher> dispatcher;
    std::unique_ptr<HttpServer> server;
    PlatformHttpClient client;

    explicit ServerFixture(std::string auth_token = "", uint32_t max_body = 1048576,
                           uint32_t max_connections = 8) {
        registry.add(std::make_unique<GateTool>(entered, release));
        dispatcher = std::make_unique<Dispatcher>(registry, ServerInfo{"cmdgate", "2.0.0"});
        HttpTransportOptions options;
        options.auth_token = std::move(auth_token);
        server = std::make_unique<HttpServer>(
            "127.0.0.1", 0, max_body, max_connections,
            make_mcp_http_handler(*dispatcher, options));
        std::string error;
        REQUIRE(server->start(error));
        REQUIRE(server->port() != 0);
    }

    ~ServerFixture() {
        release = true;
        server->stop();
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(server->port()) + path;
    }

    HttpResponse post_rpc(const std::string& body, std::vector<Header> headers = {}) {
        headers.emplace_back("Content-Type", "application/json");
        return client.post(url("/mcp"), body, headers, 10);
    }
};

// Write raw bytes, then read until the server closes the connection.
std::string raw_exchange(uint16_t port, const std::string& request) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(fd >= 0);
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    REQUIRE(::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0);
    struct timeval tv{5, 0};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    if (!request.empty()) {
        REQUIRE(::send(fd, request.data(), request.size(), 0) ==
                static_cast<ssize_t>(request.size()));
    }
    std::string out;
    char buf[4096];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    return out;
}

const char* kPing = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";

} // namespace

// ── Routing ─────────────────────────────────────────────────────

TEST_CASE("HTTP transport: health check", "[http]") {
    ServerFixture f;
    auto resp = f.client.get(f.url("/health"), {}, 10);
    REQUIRE(resp.error.empty());
    REQUIRE(resp.status_code == 200);
    auto body = json::parse(resp.body);
    REQUIRE(body["status"] == "ok");
    REQUIRE(body["name"] == "cmdgate");
    REQUIRE(body["version"] == "2.0.0");
}

TEST_CASE("HTTP transport: JSON-RPC over POST /mcp and /", "[http]") {
    ServerFixture f;
    auto resp = f.post_rpc(kPing);
    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.header("content-type") == "application/json");
    auto body = json::parse(resp.body);
    REQUIRE(body["id"] == 1);
    REQUIRE(body["result"] == json::object());

    auto root = f.client.post(f.url("/"), kPing, {{"Content-Type", "application/json"}}, 10);
    REQUIRE(root.status_code == 200);
}

TEST_CASE("HTTP transport: query string does not affect routing", "[http]") {
    ServerFixture f;
    auto resp = f.client.post(f.url("/mcp?session=abc"), kPing,
                              {{"Content-Type", "application/json"}}, 10);
    REQUIRE(resp.status_code == 200);
    REQUIRE(json::parse(resp.body)["id"] == 1);

    REQUIRE(f.client.get(f.url("/health?verbose=1"), {}, 10).status_code == 200);
}

TEST_CASE("HTTP transport: tool call round trip", "[http]") {
    ServerFixture f;
    f.release = true;
    auto resp = f.post_rpc(
        R"({"jsonrpc":"2.0","id":"c1","method":"tools/call","params":{"name":"gate"}})");
    REQUIRE(resp.status_code == 200);
    auto body = json::parse(resp.body);
    REQUIRE(body["id"] == "c1");
    REQUIRE(body["result"]["content"][0]["text"] == "released");
}

TEST_CASE("HTTP transport: notification is accepted without a body", "[http]") {
    ServerFixture f;
    auto resp = f.post_rpc(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    REQUIRE(resp.status_code == 202);
    REQUIRE(resp.body.empty());
}

TEST_CASE("HTTP transport: protocol errors still return 200", "[http]") {
    ServerFixture f;
    auto resp = f.post_rpc("{broken");
    REQUIRE(resp.status_code == 200);
    REQUIRE(json::parse(resp.body)["error"]["code"] == rpc_error::ParseError);
}

TEST_CASE("HTTP transport: unknown path is 404", "[http]") {
    ServerFixture f;
    auto resp = f.client.post(f.url("/rpc"), kPing, {}, 10);
    REQUIRE(resp.status_code == 404);
}

TEST_CASE("HTTP transport: wrong method is 405", "[http]") {
    ServerFixture f;
    auto resp = f.client.get(f.url("/mcp"), {}, 10);
    REQUIRE(resp.status_code == 405);
    REQUIRE(resp.header("allow") == "POST");

    auto health = f.client.post(f.url("/health"), "{}", {}, 10);
    REQUIRE(health.status_code == 405);
    REQUIRE(health.header("allow") == "GET");
}

// ── Authentication ──────────────────────────────────────────────

TEST_CASE("HTTP transport: bearer authentication", "[http]") {
    ServerFixture f("s3cret-token");

    auto none = f.post_rpc(kPing);
    REQUIRE(none.status_code == 401);
    REQUIRE(none.header("www-authenticate") == "Bearer");

    auto wrong = f.post_rpc(kPing, {{"Authorization", "Bearer s3cret-tokeX"}});
    REQUIRE(wrong.status_code == 401);

    auto ok = f.post_rpc(kPing, {{"Authorization", "Bearer s3cret-token"}});
    REQUIRE(ok.status_code == 200);
    REQUIRE(json::parse(ok.body)["id"] == 1);

    // Liveness stays open.
    REQUIRE(f.client.get(f.url("/health"), {}, 10).status_code == 200);
}

TEST_CASE("HTTP transport: authentication covers unknown paths", "[http]") {
    ServerFixture f("s3cret-token");

    auto anon = f.client.post(f.url("/admin"), kPing, {}, 10);
    REQUIRE(anon.status_code == 401);
    REQUIRE(anon.header("www-authenticate") == "Bearer");

    auto anon_get = f.client.get(f.url("/mcp"), {}, 10);
    REQUIRE(anon_get.status_code == 401);

    auto authed = f.client.post(f.url("/admin"), kPing,
                                {{"Authorization", "Bearer s3cret-token"}}, 10);
    REQUIRE(authed.status_code == 404);
}

TEST_CASE("bearer_token_matches", "[http]") {
    REQUIRE(bearer_token_matches("Bearer abc", "abc"));
    REQUIRE(bearer_token_matches("bearer abc", "abc"));
    REQUIRE(bearer_token_matches("  BEARER   abc  ", "abc"));
    REQUIRE_FALSE(bearer_token_matches("Bearer abcd", "abc"));
    REQUIRE_FALSE(bearer_token_matches("Bearer ab", "abc"));
    REQUIRE_FALSE(bearer_token_matches("Basic abc", "abc"));
    REQUIRE_FALSE(bearer_token_matches("abc", "abc"));
    REQUIRE_FALSE(bearer_token_matches("", "abc"));
    REQUIRE_FALSE(bearer_token_matches("Bearer ", ""));
}

// ── Request limits ──────────────────────────────────────────────

TEST_CASE("HTTP server: oversized body is 413", "[http]") {
    ServerFixture f("", 64);
    auto reply = raw_exchange(f.server->port(),
                              "POST /mcp HTTP/1.1\r\nHost: x\r\nContent-Length: 1000\r\n\r\n");
    REQUIRE(reply.rfind("HTTP/1.1 413", 0) == 0);
}

TEST_CASE("HTTP server: missing Content-Length is 411", "[http]") {
    ServerFixture f;
    auto reply = raw_exchange(f.server->port(), "POST /mcp HTTP/1.1\r\nHost: x\r\n\r\n");
    REQUIRE(reply.rfind("HTTP/1.1 411", 0) == 0);

    auto chunked = raw_exchange(f.server->port(),
                                "POST /mcp HTTP/1.1\r\nHost: x\r\n"
                                "Transfer-Encoding: chunked\r\n\r\n");
    REQUIRE(chunked.rfind("HTTP/1.1 411", 0) == 0);
}

TEST_CASE("HTTP server: malformed request line is 400", "[http]") {
    ServerFixture f;
    auto reply = raw_exchange(f.server->port(), "hello\r\n\r\n");
    REQUIRE(reply.rfind("HTTP/1.1 400", 0) == 0);
}

TEST_CASE("HTTP server: connection limit answers 503", "[http]") {
    ServerFixture f("", 1048576, 1);

    HttpResponse held;
    std::thread caller([&]() {
        held = f.post_rpc(
            R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"gate"}})");
    });
    for (int i = 0; i < 500 && !f.entered.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(f.entered.load());

    auto reply = raw_exchange(f.server->port(), "");
    REQUIRE(reply.rfind("HTTP/1.1 503", 0) == 0);

    f.release = true;
    caller.join();
    REQUIRE(held.status_code == 200);
}

TEST_CASE("HTTP server: stop is idempotent and frees the port", "[http]") {
    ToolRegistry registry;
    Dispatcher dispatcher(registry, ServerInfo{"cmdgate", "1"});
    HttpServer server("127.0.0.1", 0, 1024, 4,
                      make_mcp_http_handler(dispatcher, HttpTransportOptions{}));
    std::string error;
    REQUIRE(server.start(error));
    REQUIRE(server.running());
    server.stop();
    REQUIRE_FALSE(server.running());
    server.stop();
}

TEST_CASE("HTTP server: start reports bind failures", "[http]") {
    ToolRegistry registry;
    Dispatcher dispatcher(registry, ServerInfo{"cmdgate", "1"});
    HttpServer first("127.0.0.1", 0, 1024, 4,
                     make_mcp_http_handler(dispatcher, HttpTransportOptions{}));
    std::string error;
    REQUIRE(first.start(error));

    HttpServer second("127.0.0.1", first.port(), 1024, 4,
                      make_mcp_http_handler(dispatcher, HttpTransportOptions{}));
    std::string error2;
    REQUIRE_FALSE(second.start(error2));
    REQUIRE_FALSE(error2.empty());
    first.stop();
}
