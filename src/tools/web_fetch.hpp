#pragma once
#include "../tool.hpp"
#include "../http.hpp"

namespace cmdgate {

class EventBus;

// HTTP(S) fetch through the injected client. Non-2xx responses are
// reported as tool errors but still carry the response payload.
class WebFetchTool : public Tool {
public:
    static constexpr long kDefaultTimeoutSeconds = 30;
    static constexpr long kMaxTimeoutSeconds = 300;
    static constexpr size_t kDefaultMaxSize = 1048576;
    static constexpr size_t kMinMaxSize = 1024;
    static constexpr size_t kMaxMaxSize = 10485760;

    explicit WebFetchTool(HttpClient& client, const EventBus* bus = nullptr)
        : client_(client), bus_(bus) {}

    ToolResult execute(const nlohmann::json& args) const override;
    std::string tool_name() const override { return "web_fetch"; }
    std::string description() const override;
    nlohmann::json input_schema() const override;
    nlohmann::json annotations() const override;

private:
    HttpClient& client_;
    const EventBus* bus_;
};

} // namespace cmdgate
