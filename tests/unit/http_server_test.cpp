#include "http_server.hpp"
#include "errors.hpp"
#include "rate_limiter.hpp"

#include "../test_logger.hpp"

#include <httplib.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

using namespace polygate;
using json = nlohmann::json;
namespace fs = std::filesystem;

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

fs::path UniqueDir() {
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    auto dir = fs::temp_directory_path() / ("polygate_http_test_" + std::to_string(static_cast<long long>(now)));
    fs::create_directories(dir);
    return dir;
}

// Answers every request with the same assistant text
class EchoTransport : public Transport {
public:
    WireResponse send(const Endpoint&, const WireRequest& req) override {
        std::string last = req.body["messages"].back()["content"].dump();
        json body = {
            {"id", "chatcmpl-echo"},
            {"model", req.body.value("model", "")},
            {"choices", {{{"index", 0},
                          {"message", {{"role", "assistant"}, {"content", "echo " + last}}},
                          {"finish_reason", "stop"}}}},
        };
        return {200, body.dump()};
    }

    WireResponse stream(const Endpoint& ep, const WireRequest& req, const ByteSink& on_bytes,
                        const CancelToken&) override {
        WireResponse whole = send(ep, req);
        json parsed = json::parse(whole.body);
        std::string text = parsed["choices"][0]["message"]["content"];
        json delta = {{"id", "c1"}, {"choices", {{{"index", 0}, {"delta", {{"content", text}}}}}}};
        json stop = {{"id", "c1"}, {"choices", {{{"index", 0}, {"delta", json::object()}, {"finish_reason", "stop"}}}}};
        on_bytes("data: " + delta.dump() + "\n\n");
        on_bytes("data: " + stop.dump() + "\n\ndata: [DONE]\n\n");
        return {200, ""};
    }
};

void ScenarioErrorStatusMapping() {
    json body;
    Require(error_status(UpstreamError("openai", 503, "overloaded"), body) == 502, "upstream errors map to 502");
    Require(body["error"]["type"] == "upstream_error" && body["error"]["status"] == 503,
            "upstream status should be carried in the body");

    Require(error_status(TranslationError("client", "bad messages"), body) == 400, "bad client input is a 400");
    Require(error_status(TranslationError("google", "bad candidate"), body) == 502,
            "unreadable upstream bodies are a 502");
    Require(body["error"]["provider"] == "google", "the provider is reported");
    Require(error_status(ConfigurationError("no such provider"), body) == 400, "configuration errors are a 400");
    Require(error_status(Cancelled(), body) == 499, "cancelled exchanges are a 499");
    Require(error_status(std::runtime_error("boom"), body) == 500, "anything else is a 500");
    Require(body["error"]["type"] == "internal_error", "unknown failures are internal errors");
}

void ScenarioRateLimiter() {
    RateLimiter limiter(2);
    auto t0 = RateLimiter::Clock::now();
    Require(limiter.allow("a", t0) && limiter.allow("a", t0), "requests under the limit pass");
    Require(!limiter.allow("a", t0 + std::chrono::seconds(1)), "the third request in a minute is refused");
    Require(limiter.allow("b", t0), "keys are limited independently");
    int wait = limiter.retry_after("a", t0 + std::chrono::seconds(30));
    Require(wait > 0 && wait <= 31, "retry_after should point at the oldest request's expiry");
    Require(limiter.allow("a", t0 + std::chrono::seconds(61)), "the window slides");

    RateLimiter unlimited(0);
    for (int i = 0; i < 100; i++) Require(unlimited.allow("x", t0), "zero means unlimited");
}

httplib::Result GetWithRetry(httplib::Client& cli, const std::string& path) {
    for (int i = 0; i < 50; i++) {
        auto res = cli.Get(path);
        if (res) return res;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return cli.Get(path);
}

void ScenarioRoutes(const fs::path& dir) {
    Config cfg;
    cfg.data_dir = dir.string();
    cfg.provider = "openai";
    cfg.hooks.load_claude_settings = false;
    cfg.injector.rule_files.clear();
    ProviderConfig openai;
    openai.api_base = "http://upstream.invalid/v1";
    openai.default_model = "gpt-test";
    cfg.providers["openai"] = openai;
    cfg.gateway.port = 0;
    cfg.gateway.api_key = "gw-secret";

    Pipeline pipeline(cfg, std::make_shared<EchoTransport>());
    HttpServer server(pipeline, cfg.gateway, (dir / "config.json").string());
    server.start();
    polygate::tests::LogKV("port", static_cast<long long>(server.port()));

    httplib::Client cli("127.0.0.1", server.port());
    auto health = GetWithRetry(cli, "/health");
    Require(health && health->status == 200, "health needs no auth");
    Require(json::parse(health->body)["default_provider"] == "openai", "health reports the default provider");

    json chat = {{"model", "gpt-test"}, {"messages", {{{"role", "user"}, {"content", "ping"}}}}};
    auto unauthorized = cli.Post("/v1/chat/completions", chat.dump(), "application/json");
    Require(unauthorized && unauthorized->status == 401, "chat requires the API key");

    httplib::Headers headers = {{"Authorization", "Bearer gw-secret"}};
    auto ok = cli.Post("/v1/chat/completions", headers, chat.dump(), "application/json");
    Require(ok && ok->status == 200, "authorized chat should succeed");
    json reply = json::parse(ok->body);
    Require(reply["choices"][0]["message"]["content"] == "echo \"ping\"", "the upstream reply is relayed");
    std::string sid = ok->get_header_value("X-Session-Id");
    Require(!sid.empty() && reply["polygate"]["session_id"] == sid, "the session id is returned");

    auto bad = cli.Post("/v1/chat/completions", headers, "{\"model\":\"x\"}", "application/json");
    Require(bad && bad->status == 400, "a request without messages is a 400");

    auto snapshot = cli.Get("/sessions/" + sid, headers);
    Require(snapshot && snapshot->status == 200, "the session can be fetched");
    auto missing = cli.Get("/sessions/ses_missing", headers);
    Require(missing && missing->status == 404, "unknown sessions are a 404");

    auto undo = cli.Post("/sessions/" + sid + "/undo", headers, "", "application/json");
    Require(undo && undo->status == 200, "the last turn can be undone");
    auto redo = cli.Post("/sessions/" + sid + "/redo", headers, "", "application/json");
    Require(redo && redo->status == 200, "the undone turn can be redone");
    auto redo_again = cli.Post("/sessions/" + sid + "/redo", headers, "", "application/json");
    Require(redo_again && redo_again->status == 409, "redo with nothing to redo is a conflict");

    json streamed = chat;
    streamed["stream"] = true;
    httplib::Headers stream_headers = headers;
    stream_headers.emplace("X-Session-Id", sid);
    auto sse = cli.Post("/v1/chat/completions", stream_headers, streamed.dump(), "application/json");
    Require(sse && sse->status == 200, "streamed chat should succeed");
    Require(sse->body.find("echo") != std::string::npos, "streamed text is relayed");
    Require(sse->body.rfind("data: [DONE]") != std::string::npos, "the stream is terminated");

    json message = {{"model", "gpt-test"}, {"max_tokens", 64},
                    {"messages", {{{"role", "user"}, {"content", "hello"}}}}};
    auto native = cli.Post("/v1/messages", headers, message.dump(), "application/json");
    Require(native && native->status == 200, "Messages API chat should succeed");
    json native_reply = json::parse(native->body);
    Require(native_reply["type"] == "message" && native_reply["role"] == "assistant",
            "the reply uses the Messages API shape");
    Require(native_reply["content"][0]["type"] == "text" && native_reply["content"][0]["text"] == "echo \"hello\"",
            "the upstream reply is relayed as a text block");
    Require(native_reply["stop_reason"] == "end_turn", "stop maps to end_turn");

    auto native_bad = cli.Post("/v1/messages", headers, "{\"model\":\"x\"}", "application/json");
    Require(native_bad && native_bad->status == 400, "a Messages request without messages is a 400");
    Require(json::parse(native_bad->body)["type"] == "error", "Messages API errors carry type:error");

    json native_stream = message;
    native_stream["stream"] = true;
    auto native_sse = cli.Post("/v1/messages", headers, native_stream.dump(), "application/json");
    Require(native_sse && native_sse->status == 200, "streamed Messages API chat should succeed");
    const std::string& events = native_sse->body;
    Require(events.find("event: message_start") != std::string::npos &&
            events.find("event: content_block_delta") != std::string::npos &&
            events.find("event: message_stop") != std::string::npos,
            "the stream uses Messages API events");
    Require(events.find("[DONE]") == std::string::npos, "Messages API streams have no [DONE] marker");

    auto models = cli.Get("/v1/models", headers);
    Require(models && models->status == 200, "models can be listed");
    json listed = json::parse(models->body);
    Require(listed["object"] == "list" && listed["data"].size() == 1 &&
            listed["data"][0]["id"] == "openai/gpt-test", "configured providers and models are listed");

    auto stats = cli.Get("/stats?session_id=" + sid, headers);
    Require(stats && stats->status == 200, "session stats can be fetched");
    Require(json::parse(stats->body)["requests"] == 2, "both exchanges on the session are counted");
    auto all_stats = cli.Get("/stats", headers);
    Require(all_stats && all_stats->status == 200, "gateway stats can be fetched");
    Require(json::parse(all_stats->body)["requests"] == 4, "every upstream call is counted");
    auto missing_stats = cli.Get("/stats?session_id=ses_missing", headers);
    Require(missing_stats && missing_stats->status == 404, "stats for unknown sessions are a 404");

    auto del = cli.Delete("/sessions/" + sid, headers);
    Require(del && del->status == 200, "the session can be deleted");
    Require(!pipeline.sessions().exists(sid), "a deleted session is gone");

    server.stop();
}

} // namespace

int main() {
    try {
        polygate::tests::Log("http_server_test: start");
        const auto dir = UniqueDir();
        ScenarioErrorStatusMapping();
        ScenarioRateLimiter();
        ScenarioRoutes(dir);
        std::error_code ec;
        fs::remove_all(dir, ec);
        polygate::tests::Log("http_server_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        polygate::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
