#include "http.hpp"
#include "util.hpp"

namespace cmdgate {

std::string HttpResponse::header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (const auto& h : headers) {
        if (to_lower(h.first) == wanted) return h.second;
    }
    return "";
}

HttpResponse HttpClient::get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds) {
    HttpRequest req;
    req.method = "GET";
    req.url = url;
    req.headers = headers;
    req.timeout_seconds = timeout_seconds;
    return send(req);
}

HttpResponse HttpClient::post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds) {
    HttpRequest req;
    req.method = "POST";
    req.url = url;
    req.body = body;
    req.headers = headers;
    req.timeout_seconds = timeout_seconds;
    return send(req);
}

HttpResponse http_send(const HttpRequest& request) {
    PlatformHttpClient client;
    return client.send(request);
}

} // namespace cmdgate
