#include "config.hpp"
#include "dispatcher.hpp"
#include "event_bus.hpp"
#include "executor.hpp"
#include "http.hpp"
#include "log.hpp"
#include "tool_registry.hpp"
#include "util.hpp"
#include "version.hpp"
#include "tools/execute_command.hpp"
#include "tools/policy_info.hpp"
#include "tools/web_fetch.hpp"
#include "transport/http_server.hpp"
#include "transport/http_transport.hpp"
#include "transport/stdio_transport.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

static std::atomic<bool> g_shutdown{false};
static std::atomic<int> g_signal{0};

static void signal_handler(int sig) {
    g_signal.store(sig);
    g_shutdown.store(true);
}

// No SA_RESTART: a blocking read on stdin must return so the stdio loop
// can notice the shutdown flag.
static void install_signal_handlers() {
    struct sigaction sa{};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

static void print_usage() {
    std::cout << "Usage: cmdgate [options]\n"
              << "\n"
              << "Serves shell command execution to MCP clients over stdio (default) or HTTP.\n"
              << "\n"
              << "Options:\n"
              << "  --allowed-commands LIST   Comma-separated allowed command prefixes (empty = all)\n"
              << "  --blocked-commands LIST   Comma-separated blocked patterns\n"
              << "  --no-default-blocklist    Do not add the built-in dangerous command list\n"
              << "  --timeout DURATION        Default command timeout (e.g. 30s, 5m)\n"
              << "  --shell PATH              Shell used to run commands (default /bin/sh)\n"
              << "  --shell-arg ARG           Argument placed before the command (default -c)\n"
              << "  --log-dir DIR             Also write logs under DIR/cmdgate/\n"
              << "  --log-level LEVEL         off, error, warn, info, access, debug\n"
              << "  --http                    Serve HTTP instead of stdio\n"
              << "  --host HOST               HTTP bind address (default 127.0.0.1)\n"
              << "  --port PORT               HTTP port (default 3000)\n"
              << "  --auth-token TOKEN        Require Authorization: Bearer TOKEN over HTTP\n"
              << "  --version                 Print version and exit\n"
              << "  -h, --help                Show this help\n"
              << "\n"
              << "Environment variables (override ~/.cmdgate/config.json; flags override both):\n"
              << "  MCP_ALLOWED_COMMANDS  MCP_BLOCKED_COMMANDS  MCP_DEFAULT_TIMEOUT\n"
              << "  MCP_SHELL  MCP_SHELL_ARG  MCP_LOG_DIR  MCP_LOG_LEVEL  MCP_AUTH_TOKEN\n"
              << "Variables in ~/.mcp_env are loaded first and never override the environment.\n";
}

static uint16_t parse_port(const std::string& text) {
    char* end = nullptr;
    long port = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || port <= 0 || port > 65535) {
        throw std::invalid_argument("invalid port: " + text);
    }
    return static_cast<uint16_t>(port);
}

static std::string shutdown_reason() {
    int sig = g_signal.load();
    if (sig == SIGINT) return "SIGINT";
    if (sig == SIGTERM) return "SIGTERM";
    return "end of input";
}

static int run_http(const cmdgate::Config& config,
                    const cmdgate::Dispatcher& dispatcher,
                    cmdgate::Logger& logger) {
    cmdgate::HttpTransportOptions options;
    options.auth_token = config.http.auth_token;

    cmdgate::HttpServer server(config.http.host, config.http.port,
                               config.http.max_body, config.http.max_connections,
                               cmdgate::make_mcp_http_handler(dispatcher, options, &logger));
    std::string error;
    if (!server.start(error)) {
        throw std::runtime_error("HTTP server failed to start: " + error);
    }
    logger.info("listening on http://" + config.http.host + ":" +
                std::to_string(server.port()) + "/mcp");

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    logger.info("stopping HTTP server; waiting for in-flight requests");
    server.stop();
    return 0;
}

int main(int argc, char* argv[]) try {
    std::optional<std::string> allowed, blocked, timeout, shell, shell_arg;
    std::optional<std::string> log_dir, log_level, host, auth_token;
    std::optional<uint16_t> port;
    bool no_default_blocklist = false;
    bool http_mode = false;

    for (int i = 1; i < argc; i++) {
        bool has_value = i + 1 < argc;
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "cmdgate " << CMDGATE_VERSION << "\n";
            return 0;
        } else if (std::strcmp(argv[i], "--allowed-commands") == 0 && has_value) {
            allowed = argv[++i];
        } else if (std::strcmp(argv[i], "--blocked-commands") == 0 && has_value) {
            blocked = argv[++i];
        } else if (std::strcmp(argv[i], "--no-default-blocklist") == 0) {
            no_default_blocklist = true;
        } else if (std::strcmp(argv[i], "--timeout") == 0 && has_value) {
            timeout = argv[++i];
        } else if (std::strcmp(argv[i], "--shell") == 0 && has_value) {
            shell = argv[++i];
        } else if (std::strcmp(argv[i], "--shell-arg") == 0 && has_value) {
            shell_arg = argv[++i];
        } else if (std::strcmp(argv[i], "--log-dir") == 0 && has_value) {
            log_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--log-level") == 0 && has_value) {
            log_level = argv[++i];
        } else if (std::strcmp(argv[i], "--http") == 0) {
            http_mode = true;
        } else if (std::strcmp(argv[i], "--host") == 0 && has_value) {
            host = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && has_value) {
            port = parse_port(argv[++i]);
        } else if (std::strcmp(argv[i], "--auth-token") == 0 && has_value) {
            auth_token = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    // Initialize
    cmdgate::http_init();
    cmdgate::load_env_file(cmdgate::expand_home("~/.mcp_env"));
    auto config = cmdgate::Config::load();

    // Override config with CLI args
    if (allowed)    config.commands.allowed = cmdgate::split_list(*allowed);
    if (blocked)    config.commands.blocked = cmdgate::split_list(*blocked);
    if (no_default_blocklist) config.commands.use_default_blocklist = false;
    if (timeout)    config.commands.default_timeout =
                        cmdgate::parse_timeout_setting("--timeout", *timeout);
    if (shell && !shell->empty()) config.commands.shell = *shell;
    if (shell_arg)  config.commands.shell_arg = *shell_arg;
    if (log_dir)    config.log.dir = *log_dir;
    if (log_level)  config.log.level = *log_level;
    if (http_mode)  config.http.enabled = true;
    if (host)       config.http.host = *host;
    if (port)       config.http.port = *port;
    if (auth_token) config.http.auth_token = *auth_token;

    cmdgate::Logger logger(cmdgate::parse_log_level(config.log.level));
    if (!config.log.dir.empty()) {
        logger.open_file(config.log.dir);
    }
    cmdgate::EventBus bus;
    logger.attach(bus);

    if (config.commands.default_timeout > config.commands.max_timeout) {
        logger.warn("default timeout exceeds max timeout; explicit timeouts are capped at " +
                    cmdgate::format_duration(config.commands.max_timeout));
    }

    const cmdgate::CommandPolicy policy = config.policy();

    cmdgate::ExecutorConfig exec_config;
    exec_config.shell = config.commands.shell;
    exec_config.shell_arg = config.commands.shell_arg;
    exec_config.default_timeout = config.commands.default_timeout;
    exec_config.max_output_bytes = config.commands.max_output_bytes;
    cmdgate::CommandExecutor executor(exec_config);

    cmdgate::PlatformHttpClient http_client;

    cmdgate::ToolRegistry registry;
    registry.add(std::make_unique<cmdgate::ExecuteCommandTool>(
        policy, executor, config.commands.max_timeout, &bus));
    registry.add(std::make_unique<cmdgate::ListAllowedCommandsTool>(policy));
    registry.add(std::make_unique<cmdgate::ListBlockedCommandsTool>(
        policy, config.commands.use_default_blocklist));
    registry.add(std::make_unique<cmdgate::ShellInfoTool>(executor));
    registry.add(std::make_unique<cmdgate::WebFetchTool>(http_client, &bus));

    cmdgate::Dispatcher dispatcher(registry, cmdgate::ServerInfo{"cmdgate", CMDGATE_VERSION}, &bus);

    install_signal_handlers();
    cmdgate::http_set_abort_flag(&g_shutdown);

    auto settings = config.describe();
    settings.push_back("tools: " + cmdgate::join(registry.names(), ", "));
    if (!logger.file_path().empty()) settings.push_back("log file: " + logger.file_path());
    logger.log_startup(CMDGATE_VERSION, settings);

    int rc = 0;
    if (config.http.enabled) {
        rc = run_http(config, dispatcher, logger);
    } else {
        size_t replies = cmdgate::run_stdio(dispatcher, std::cin, std::cout, &g_shutdown);
        logger.debug("stdio: wrote " + std::to_string(replies) + " responses");
    }

    logger.log_shutdown(shutdown_reason());
    cmdgate::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
}
