#pragma once
#include "config.hpp"
#include "pipeline.hpp"
#include "rate_limiter.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <string>
#include <thread>

namespace polygate {

// Wire shape a client speaks on the chat endpoints
enum class ClientFormat { openai, anthropic };

// OpenAI- and Anthropic-style chat endpoints plus session, stats and admin routes over one Pipeline.
class HttpServer {
public:
    HttpServer(Pipeline& pipeline, const GatewayConfig& cfg, std::string config_path);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds, then serves on a background thread. Throws Error if the port cannot be bound.
    void start();
    void stop();

    const std::string& host() const { return host_; }
    int port() const { return port_; }

    // {"error": {"type": ..., "message": ...}} plus any extra fields
    static nlohmann::json error_body(const std::string& type, const std::string& message,
                                     const nlohmann::json& extra = nlohmann::json::object());

private:
    void register_routes();

    void handle_chat(const httplib::Request& req, httplib::Response& res, ClientFormat format);
    void stream_chat(ExchangeRequest exchange, httplib::Response& res, ClientFormat format);

    bool check_auth(const httplib::Request& req, httplib::Response& res);
    bool check_rate_limit(const httplib::Request& req, httplib::Response& res);
    // 404 unless the session is live or journaled
    bool check_session(const std::string& id, httplib::Response& res);

    Pipeline& pipeline_;
    std::string host_;
    int port_;
    std::string api_key_;
    std::string config_path_;
    int worker_threads_;
    httplib::Server server_;
    std::thread thread_;
    RateLimiter rate_limiter_;
    std::atomic<bool> running_{false};
};

// Maps an exception thrown by the pipeline to an HTTP status and error body
int error_status(const std::exception& e, nlohmann::json& body);

// Configured providers and their models, in the OpenAI list shape
nlohmann::json models_body(const Runtime& rt);

nlohmann::json usage_json(const std::string& session_id, const SessionUsage& usage);

} // namespace polygate
