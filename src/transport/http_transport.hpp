#pragma once
#include "transport/http_server.hpp"
#include <string>

namespace cmdgate {

class Dispatcher;
class Logger;

struct HttpTransportOptions {
    std::string auth_token;   // empty = no authentication
};

// Route table for the MCP HTTP endpoint:
//   GET  /health      liveness, never authenticated
//   POST / , /mcp     one JSON-RPC envelope per request
// The dispatcher (and logger, when given) must outlive the handler.
HttpServer::Handler make_mcp_http_handler(const Dispatcher& dispatcher,
                                          HttpTransportOptions options,
                                          Logger* logger = nullptr);

// Constant-time check of an "Authorization: Bearer <token>" header value.
bool bearer_token_matches(const std::string& header_value, const std::string& token);

} // namespace cmdgate
