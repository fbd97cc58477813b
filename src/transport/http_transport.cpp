#include "transport/http_transport.hpp"
#include "dispatcher.hpp"
#include "log.hpp"
#include "util.hpp"

#include <openssl/crypto.h>
#include <nlohmann/json.hpp>

namespace cmdgate {

bool bearer_token_matches(const std::string& header_value, const std::string& token) {
    std::string value = trim(header_value);
    const std::string scheme = "bearer ";
    if (value.size() <= scheme.size() || to_lower(value.substr(0, scheme.size())) != scheme) {
        return false;
    }
    std::string presented = trim(value.substr(scheme.size()));
    if (presented.size() != token.size() || token.empty()) return false;
    return CRYPTO_memcmp(presented.data(), token.data(), token.size()) == 0;
}

static ServerResponse json_response(int status, const nlohmann::json& body) {
    ServerResponse resp;
    resp.status = status;
    resp.body = body.dump();
    return resp;
}

static ServerResponse error_response(int status, const std::string& message) {
    return json_response(status, {{"error", message}});
}

HttpServer::Handler make_mcp_http_handler(const Dispatcher& dispatcher,
                                          HttpTransportOptions options,
                                          Logger* logger) {
    return [&dispatcher, options = std::move(options), logger](const ServerRequest& req) {
        auto log_access = [&](int status) {
            if (logger) {
                logger->debug("http: " + req.method + " " + req.path + " -> " +
                              std::to_string(status));
            }
        };

        if (req.path == "/health") {
            if (req.method != "GET") {
                ServerResponse resp = error_response(405, "method not allowed");
                resp.headers.emplace_back("Allow", "GET");
                log_access(resp.status);
                return resp;
            }
            ServerResponse resp = json_response(200, {
                {"status", "ok"},
                {"name", dispatcher.info().name},
                {"version", dispatcher.info().version}
            });
            log_access(resp.status);
            return resp;
        }

        if (!options.auth_token.empty() &&
            !bearer_token_matches(req.header("authorization"), options.auth_token)) {
            ServerResponse resp = error_response(401, "unauthorized");
            resp.headers.emplace_back("WWW-Authenticate", "Bearer");
            if (logger) logger->warn("http: rejected unauthenticated request to " + req.path);
            return resp;
        }

        if (req.path != "/" && req.path != "/mcp") {
            ServerResponse resp = error_response(404, "not found");
            log_access(resp.status);
            return resp;
        }

        if (req.method != "POST") {
            ServerResponse resp = error_response(405, "method not allowed");
            resp.headers.emplace_back("Allow", "POST");
            log_access(resp.status);
            return resp;
        }

        auto reply = dispatcher.handle_message(req.body);
        ServerResponse resp;
        if (!reply) {
            resp.status = 202;
            resp.content_type.clear();
        } else {
            resp.body = std::move(*reply);
        }
        log_access(resp.status);
        return resp;
    };
}

} // namespace cmdgate
