#include "pipeline.hpp"
#include "errors.hpp"

#include "../test_logger.hpp"

#include <chrono>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace {

using namespace polygate;
using json = nlohmann::json;
namespace fs = std::filesystem;

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

fs::path UniqueDir(const std::string& tag) {
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    auto dir = fs::temp_directory_path() /
               ("polygate_pipeline_test_" + tag + "_" + std::to_string(static_cast<long long>(now)));
    fs::create_directories(dir);
    return dir;
}

// Replays canned upstream bodies and records every request it was given
class ScriptedTransport : public Transport {
public:
    void push_body(std::string body) { bodies_.push_back(std::move(body)); }
    void push_stream(std::vector<std::string> chunks) { streams_.push_back(std::move(chunks)); }

    WireResponse send(const Endpoint& ep, const WireRequest& req) override {
        std::lock_guard<std::mutex> lock(mu_);
        endpoints.push_back(ep);
        requests.push_back(req);
        if (bodies_.empty()) throw UpstreamError(ep.provider, 0, "no scripted response");
        WireResponse res{200, bodies_.front()};
        bodies_.pop_front();
        return res;
    }

    WireResponse stream(const Endpoint& ep, const WireRequest& req,
                        const ByteSink& on_bytes, const CancelToken& cancel) override {
        std::vector<std::string> chunks;
        {
            std::lock_guard<std::mutex> lock(mu_);
            endpoints.push_back(ep);
            requests.push_back(req);
            if (streams_.empty()) throw UpstreamError(ep.provider, 0, "no scripted stream");
            chunks = streams_.front();
            streams_.pop_front();
        }
        for (auto& c : chunks) {
            if (cancel.cancelled()) throw Cancelled();
            on_bytes(c);
        }
        if (cancel.cancelled()) throw Cancelled();
        return {200, ""};
    }

    std::vector<Endpoint> endpoints;
    std::vector<WireRequest> requests;

private:
    std::mutex mu_;
    std::deque<std::string> bodies_;
    std::deque<std::vector<std::string>> streams_;
};

std::string TextReply(const std::string& text) {
    return json{
        {"id", "chatcmpl-test"},
        {"model", "gpt-test"},
        {"choices", {{{"index", 0},
                      {"message", {{"role", "assistant"}, {"content", text}}},
                      {"finish_reason", "stop"}}}},
        {"usage", {{"prompt_tokens", 10}, {"completion_tokens", 2}}},
    }.dump();
}

std::string ToolCallReply() {
    json call = {{"id", "call_1"}, {"type", "function"},
                 {"function", {{"name", "Bash"}, {"arguments", R"({"command":"rm -rf build"})"}}}};
    return json{
        {"id", "chatcmpl-tool"},
        {"model", "gpt-test"},
        {"choices", {{{"index", 0},
                      {"message", {{"role", "assistant"}, {"content", "Cleaning up."}, {"tool_calls", {call}}}},
                      {"finish_reason", "tool_calls"}}}},
    }.dump();
}

HookEntryConfig CommandHook(const std::string& matcher, const std::string& command) {
    HookEntryConfig entry;
    entry.matcher = matcher;
    HookHandlerConfig h;
    h.type = "command";
    h.command = command;
    h.timeout_ms = 5000;
    entry.handlers.push_back(h);
    return entry;
}

Config TestConfig(const fs::path& dir) {
    Config cfg;
    cfg.data_dir = dir.string();
    cfg.provider = "openai";
    cfg.model = "gpt-test";
    cfg.hooks.load_claude_settings = false;
    cfg.injector.rule_files.clear();

    ProviderConfig openai;
    openai.api_key = "sk-test";
    openai.api_base = "http://upstream.invalid/v1";
    openai.default_model = "gpt-test";
    cfg.providers["openai"] = openai;

    ProviderConfig local;
    local.kind = "openai-compatible";
    local.api_base = "http://127.0.0.1:1/v1";
    local.default_model = "local-model";
    local.thinking.enabled = true;
    local.thinking.budget_tokens = 1024;
    cfg.providers["local"] = local;
    return cfg;
}

ExchangeRequest UserRequest(const std::string& text, const fs::path& cwd) {
    ExchangeRequest req;
    req.cwd = cwd.string();
    req.request.messages = {Message::text(Role::system, "Be brief."), Message::text(Role::user, text)};
    return req;
}

void ScenarioPlainExchange() {
    auto dir = UniqueDir("plain");
    auto transport = std::make_shared<ScriptedTransport>();
    transport->push_body(TextReply("first answer"));
    transport->push_body(TextReply("second answer"));
    Pipeline pipeline(TestConfig(dir), transport);

    ExchangeResult r1 = pipeline.exchange(UserRequest("first question", dir));
    Require(!r1.blocked && r1.provider == "openai" && r1.model == "gpt-test", "default provider should be used");
    Require(r1.response.message.text() == "first answer", "upstream reply should be returned");
    Require(transport->endpoints[0].base_url == "http://upstream.invalid/v1", "configured base URL should be used");

    json sent = transport->requests[0].body;
    Require(sent["messages"][0]["role"] == "system" && sent["messages"][0]["content"] == "Be brief.",
            "client system text should lead the upstream request");

    Session s = pipeline.sessions().snapshot(r1.session_id);
    Require(s.turns.size() == 2, "user turn and assistant turn should be journaled");

    ExchangeRequest follow = UserRequest("second question", dir);
    follow.session_id = r1.session_id;
    ExchangeResult r2 = pipeline.exchange(follow);
    Require(r2.session_id == r1.session_id, "the session id should carry over");

    json second = transport->requests[1].body;
    std::string dumped = second["messages"].dump();
    Require(dumped.find("first question") != std::string::npos &&
            dumped.find("first answer") != std::string::npos,
            "session history should be replayed upstream");
    Require(pipeline.sessions().snapshot(r1.session_id).turns.size() == 4, "two exchanges make four turns");

    pipeline.end_session(r1.session_id, "client");
    Require(pipeline.sessions().snapshot(r1.session_id).status == SessionStatus::ended, "session should end");
    auto recent = pipeline.memory()->recent_sessions(1);
    Require(recent.size() == 1 && recent[0].summary.find("second question") != std::string::npos,
            "ending a session should leave a digest for later sessions");
}

void ScenarioBlockedPrompt() {
    auto dir = UniqueDir("blocked");
    auto transport = std::make_shared<ScriptedTransport>();
    Config cfg = TestConfig(dir);
    cfg.hooks.events["user_prompt_submit"] = {
        CommandHook("", "if grep -q secret; then echo 'contains a secret' >&2; exit 2; fi")};
    Pipeline pipeline(std::move(cfg), transport);

    ExchangeResult r = pipeline.exchange(UserRequest("here is my secret token", dir));
    Require(r.blocked, "the prompt should be vetoed");
    Require(r.block_reason == "contains a secret", "the hook's stderr becomes the reason");
    Require(transport->requests.empty(), "nothing should reach the upstream");
    Require(pipeline.sessions().snapshot(r.session_id).turns.empty(), "a vetoed prompt is not journaled");
}

void ScenarioToolCallVeto() {
    auto dir = UniqueDir("tools");
    auto transport = std::make_shared<ScriptedTransport>();
    transport->push_body(ToolCallReply());
    Config cfg = TestConfig(dir);
    cfg.hooks.events["pre_tool_use"] = {CommandHook("Bash", "echo 'shell is disabled' >&2; exit 2")};
    Pipeline pipeline(std::move(cfg), transport);

    ExchangeResult r = pipeline.exchange(UserRequest("clean the build", dir));
    Require(r.blocked_tools.size() == 1 && r.blocked_tools[0].id == "call_1", "the Bash call should be vetoed");
    Require(r.blocked_tools[0].reason == "shell is disabled", "the veto reason should be reported");
    Require(!r.response.message.has_tool_calls(), "vetoed calls never reach the client");
    Require(r.response.finish_reason == FinishReason::stop, "with no calls left the reply is final");
    Require(r.response.message.text().find("[tool call 'Bash' was blocked") != std::string::npos,
            "the reply should say the call was blocked");

    Session s = pipeline.sessions().snapshot(r.session_id);
    Require(!s.turns.back().messages.back().has_tool_calls(), "the journal keeps the gated reply");

    int ran = 0;
    ToolExecutor exec = [&ran](const std::string&, const json&) {
        ++ran;
        return std::string("ok");
    };
    ToolCallSegment read{"call_2", "Read", {{"path", "README.md"}}};
    ToolRunResult allowed = pipeline.run_tool(r.session_id, read, exec, dir.string());
    Require(allowed.executed && allowed.output == "ok" && ran == 1, "unmatched tools run normally");

    ToolCallSegment bash{"call_3", "Bash", {{"command", "ls"}}};
    ToolRunResult denied = pipeline.run_tool(r.session_id, bash, exec, dir.string());
    Require(denied.blocked && !denied.executed && ran == 1, "a vetoed tool never executes");
}

void ScenarioCancelLeavesSessionUntouched() {
    auto dir = UniqueDir("cancel");
    auto transport = std::make_shared<ScriptedTransport>();
    transport->push_stream({
        "data: {\"id\":\"c1\",\"model\":\"gpt-test\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\"Hel\"}}]}\n\n",
        "data: {\"id\":\"c1\",\"model\":\"gpt-test\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\"lo\"}}]}\n\n",
        "data: {\"id\":\"c1\",\"choices\":[{\"index\":0,\"delta\":{},\"finish_reason\":\"stop\"}]}\n\n",
        "data: [DONE]\n\n",
    });
    Pipeline pipeline(TestConfig(dir), transport);
    std::string sid = pipeline.start_session({}, dir.string());

    CancelToken cancel;
    std::string seen;
    ExchangeRequest req = UserRequest("stream please", dir);
    req.session_id = sid;
    req.request.stream = true;

    bool cancelled = false;
    try {
        pipeline.exchange(req, [&](const std::string& text) {
            seen += text;
            cancel.cancel();
        }, cancel);
    } catch (const Cancelled&) {
        cancelled = true;
    }
    Require(cancelled, "cancelling mid-stream should surface Cancelled");
    Require(seen == "Hel", "no text is delivered after cancellation");
    Require(pipeline.sessions().snapshot(sid).turns.empty(), "a cancelled exchange leaves no turns behind");
}

void ScenarioProviderSelectionAndErrors() {
    auto dir = UniqueDir("providers");
    auto transport = std::make_shared<ScriptedTransport>();
    transport->push_body(TextReply("from local"));
    Pipeline pipeline(TestConfig(dir), transport);

    ExchangeRequest req = UserRequest("hello", dir);
    req.request.model = "local/my-model";
    ExchangeResult r = pipeline.exchange(req);
    Require(r.provider == "local" && r.model == "my-model", "a provider/model prefix selects the provider");
    Require(transport->requests.back().body["model"] == "my-model", "the prefix is stripped upstream");
    Require(r.degradation_notes.size() == 1, "thinking on a provider without it should leave a note");
    Require(transport->requests.back().body.dump().find("thinking") == std::string::npos,
            "unsupported thinking parameters are not sent");

    ExchangeRequest bad = UserRequest("hello", dir);
    bad.provider = "nope";
    bool threw = false;
    try {
        pipeline.exchange(bad);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    Require(threw, "an unconfigured provider is a configuration error");

    // Upstream failure: the user turn is rolled back
    std::string sid = r.session_id;
    size_t before = pipeline.sessions().snapshot(sid).turns.size();
    ExchangeRequest failing = UserRequest("again", dir);
    failing.session_id = sid;
    threw = false;
    try {
        pipeline.exchange(failing);
    } catch (const UpstreamError& e) {
        threw = e.status() == 0;
    }
    Require(threw, "a transport failure should surface as UpstreamError");
    Require(pipeline.sessions().snapshot(sid).turns.size() == before, "a failed exchange leaves no turns behind");
}

void ScenarioMidStreamErrorKeepsSession() {
    auto dir = UniqueDir("stream_error");
    auto transport = std::make_shared<ScriptedTransport>();
    transport->push_stream({
        "data: {\"id\":\"c1\",\"model\":\"gpt-test\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\"Par\"}}]}\n\n",
        "data: {\"error\":{\"message\":\"upstream overloaded\",\"code\":503}}\n\n",
    });
    Pipeline pipeline(TestConfig(dir), transport);
    std::string sid = pipeline.start_session({}, dir.string());

    ExchangeRequest req = UserRequest("stream please", dir);
    req.session_id = sid;
    req.request.stream = true;
    bool threw = false;
    try {
        pipeline.exchange(req);
    } catch (const UpstreamError& e) {
        threw = e.status() == 503;
    }
    Require(threw, "an error frame mid-stream should surface as UpstreamError");
    Require(pipeline.sessions().snapshot(sid).turns.empty(), "a stream that errored leaves no turns behind");
}

void ScenarioEmptyReplyRejected() {
    auto dir = UniqueDir("empty");
    auto transport = std::make_shared<ScriptedTransport>();
    transport->push_body(TextReply(""));
    Pipeline pipeline(TestConfig(dir), transport);
    std::string sid = pipeline.start_session({}, dir.string());

    ExchangeRequest req = UserRequest("say something", dir);
    req.session_id = sid;
    bool threw = false;
    try {
        pipeline.exchange(req);
    } catch (const TranslationError& e) {
        threw = e.provider() == "openai";
    }
    Require(threw, "a reply with no content should be rejected");
    Require(pipeline.sessions().snapshot(sid).turns.empty(), "an empty reply is never journaled");
}

void ScenarioRedoSurvivesFailedExchange() {
    auto dir = UniqueDir("redo");
    auto transport = std::make_shared<ScriptedTransport>();
    transport->push_body(TextReply("an answer"));
    Pipeline pipeline(TestConfig(dir), transport);

    ExchangeResult r = pipeline.exchange(UserRequest("a question", dir));
    std::string sid = r.session_id;
    Require(pipeline.undo(sid), "undo should drop the assistant turn");
    Require(pipeline.sessions().snapshot(sid).redo_stack.size() == 1, "the undone turn is redoable");

    // nothing scripted: the transport fails
    ExchangeRequest failing = UserRequest("another question", dir);
    failing.session_id = sid;
    bool threw = false;
    try {
        pipeline.exchange(failing);
    } catch (const UpstreamError&) {
        threw = true;
    }
    Require(threw, "the scripted transport should fail the exchange");

    Session s = pipeline.sessions().snapshot(sid);
    Require(s.turns.size() == 1 && s.redo_stack.size() == 1, "a failed exchange keeps the redo history");
    Require(pipeline.redo(sid), "redo should still succeed after the failed exchange");
    Require(pipeline.sessions().snapshot(sid).turns.back().messages.back().text() == "an answer",
            "redo brings back the undone reply");
}

void ScenarioUsageAndExtensionRules() {
    auto dir = UniqueDir("rules");
    fs::create_directories(dir / ".polygate" / "rules");
    {
        std::ofstream(dir / ".polygate" / "rules" / "rs.md") << "Run cargo fmt before committing.\n";
    }
    auto transport = std::make_shared<ScriptedTransport>();
    transport->push_body(TextReply("done"));
    transport->push_body(TextReply("done again"));
    Pipeline pipeline(TestConfig(dir), transport);

    ExchangeResult r = pipeline.exchange(UserRequest("fix the bug in src/Main.RS please", dir));
    std::string system = transport->requests[0].body["messages"][0]["content"].get<std::string>();
    Require(system.find("Run cargo fmt before committing.") != std::string::npos,
            "rules for a mentioned extension should be injected");

    ExchangeRequest follow = UserRequest("and update notes.txt", dir);
    follow.session_id = r.session_id;
    pipeline.exchange(follow);

    auto usage = pipeline.usage();
    Require(usage.count(r.session_id) == 1, "usage should be kept per session");
    const SessionUsage& u = usage.at(r.session_id);
    Require(u.requests == 2, "each upstream call should be counted");
    Require(u.total.input_tokens == 20 && u.total.output_tokens == 4, "usage should accumulate");
    Require(u.last.input_tokens == 10 && u.last.output_tokens == 2, "the last call's usage should be kept");

    pipeline.destroy(r.session_id);
    Require(pipeline.usage().count(r.session_id) == 0, "destroying a session drops its usage");
}

void ScenarioReload() {
    auto dir = UniqueDir("reload");
    auto transport = std::make_shared<ScriptedTransport>();
    Pipeline pipeline(TestConfig(dir), transport);
    auto old = pipeline.runtime();

    Config broken = TestConfig(dir);
    broken.provider = "missing";
    bool threw = false;
    try {
        pipeline.reload(broken);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    Require(threw && pipeline.runtime() == old, "a rejected reload keeps the running configuration");

    Config next = TestConfig(dir);
    next.provider = "local";
    pipeline.reload(next);
    Require(pipeline.runtime()->config->provider == "local", "a valid reload is swapped in");
    Require(old->config->provider == "openai", "held snapshots are unaffected");
}

} // namespace

int main() {
    try {
        polygate::tests::Log("pipeline_test: start");
        ScenarioPlainExchange();
        ScenarioBlockedPrompt();
        ScenarioToolCallVeto();
        ScenarioCancelLeavesSessionUntouched();
        ScenarioProviderSelectionAndErrors();
        ScenarioMidStreamErrorKeepsSession();
        ScenarioEmptyReplyRejected();
        ScenarioRedoSurvivesFailedExchange();
        ScenarioUsageAndExtensionRules();
        ScenarioReload();
        polygate::tests::Log("pipeline_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        polygate::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
