#include "web_fetch.hpp"
#include "tool_util.hpp"
#include "../event.hpp"
#include "../event_bus.hpp"
#include "../util.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <stdexcept>

namespace cmdgate {

static const char* const kMethods[] = {"GET", "POST", "PUT", "DELETE", "HEAD", "OPTIONS"};

static bool known_method(const std::string& method) {
    return std::find(std::begin(kMethods), std::end(kMethods), method) != std::end(kMethods);
}

static std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

ToolResult WebFetchTool::execute(const nlohmann::json& args) const {
    if (!args.is_object()) return error_result("arguments must be an object");
    if (auto err = require_string(args, "url")) return *err;

    HttpRequest req;
    req.url = trim(args["url"].get<std::string>());
    std::string scheme = to_lower(req.url.substr(0, req.url.find("://")));
    if (req.url.find("://") == std::string::npos ||
        (scheme != "http" && scheme != "https")) {
        return error_result("URL must use http:// or https:// protocol");
    }
    if (req.url.size() <= scheme.size() + 3) {
        return error_result("Invalid URL: missing host");
    }

    std::string method = "GET";
    if (auto err = optional_string(args, "method", method)) return *err;
    req.method = upper(method);
    if (!known_method(req.method)) {
        return error_result("method must be one of GET, POST, PUT, DELETE, HEAD, OPTIONS");
    }

    if (auto err = optional_string(args, "body", req.body)) return *err;

    std::map<std::string, std::string> headers;
    if (auto err = optional_string_map(args, "headers", headers)) return *err;
    for (const auto& [name, value] : headers) {
        req.headers.emplace_back(name, value);
    }

    std::string timeout_text;
    if (auto err = optional_string(args, "timeout", timeout_text)) {
        return error_result("Invalid timeout format: expected a duration string such as \"30s\"");
    }
    req.timeout_seconds = kDefaultTimeoutSeconds;
    if (!timeout_text.empty()) {
        std::chrono::nanoseconds ns;
        try {
            ns = parse_duration(timeout_text);
        } catch (const std::invalid_argument& e) {
            return error_result(std::string("Invalid timeout format: ") + e.what());
        }
        if (ns.count() > 0) {
            // Whole seconds, rounded up.
            long secs = static_cast<long>((ns.count() + 999999999LL) / 1000000000LL);
            req.timeout_seconds = std::min(secs, kMaxTimeoutSeconds);
        }
    }

    req.max_body = kDefaultMaxSize;
    if (args.contains("max_size") && !args["max_size"].is_null()) {
        const auto& v = args["max_size"];
        if (!v.is_number_integer()) {
            return error_result("max_size must be an integer");
        }
        int64_t size = v.get<int64_t>();
        size = std::max<int64_t>(size, static_cast<int64_t>(kMinMaxSize));
        size = std::min<int64_t>(size, static_cast<int64_t>(kMaxMaxSize));
        req.max_body = static_cast<size_t>(size);
    }

    auto start = std::chrono::steady_clock::now();
    HttpResponse resp = client_.send(req);
    auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start);

    WebFetchEvent ev;
    ev.method = req.method;
    ev.url = req.url;
    ev.status_code = resp.status_code;
    ev.bytes = resp.body.size();
    ev.duration = duration;
    ev.error = resp.error;
    emit(bus_, ev);

    if (!resp.error.empty() || resp.status_code == 0) {
        return error_result("Request failed: " +
                            (resp.error.empty() ? std::string("no response") : resp.error));
    }

    nlohmann::json response_headers = nlohmann::json::object();
    for (const auto& [name, value] : resp.headers) {
        if (!response_headers.contains(name)) response_headers[name] = value;
    }

    nlohmann::json j = {
        {"status_code", resp.status_code},
        {"content_length", resp.body.size()},
        {"content_type", resp.header("content-type")},
        {"duration", format_duration(duration)},
        {"headers", response_headers},
        {"body", resp.body}
    };
    if (resp.truncated) j["truncated"] = true;

    bool ok = resp.status_code >= 200 && resp.status_code < 300;
    return ToolResult{!ok, json_text(j)};
}

std::string WebFetchTool::description() const {
    return "Fetch content from an http:// or https:// URL and return the status, headers "
           "and body. Non-2xx responses are reported as errors. Timeout defaults to 30s.";
}

nlohmann::json WebFetchTool::input_schema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"url", {
                {"type", "string"},
                {"description", "URL to fetch, including the http:// or https:// scheme."}
            }},
            {"method", {
                {"type", "string"},
                {"description", "HTTP method (default GET)."},
                {"default", "GET"},
                {"enum", nlohmann::json::array({"GET", "POST", "PUT", "DELETE", "HEAD", "OPTIONS"})}
            }},
            {"headers", {
                {"type", "object"},
                {"description", "Request headers as name/value pairs."},
                {"additionalProperties", {{"type", "string"}}}
            }},
            {"body", {
                {"type", "string"},
                {"description", "Request body for POST/PUT. Set a matching Content-Type header."}
            }},
            {"timeout", {
                {"type", "string"},
                {"description", "Request timeout as a duration, e.g. '30s' or '1m'. Max 5m."},
                {"default", "30s"}
            }},
            {"max_size", {
                {"type", "integer"},
                {"description", "Maximum response body size in bytes; longer bodies are truncated."},
                {"default", kDefaultMaxSize},
                {"minimum", kMinMaxSize},
                {"maximum", kMaxMaxSize}
            }}
        }},
        {"required", nlohmann::json::array({"url"})}
    };
}

nlohmann::json WebFetchTool::annotations() const {
    return {
        {"title", "Web Fetch"},
        {"readOnlyHint", false},
        {"idempotentHint", false},
        {"openWorldHint", true}
    };
}

} // namespace cmdgate
