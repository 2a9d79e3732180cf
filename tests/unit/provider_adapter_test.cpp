#include "providers/adapter_registry.hpp"
#include "providers/anthropic_adapter.hpp"
#include "providers/openai_format.hpp"
#include "errors.hpp"

#include "../test_logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using json = nlohmann::json;
using polygate::CanonicalRequest;
using polygate::Message;
using polygate::Role;

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

std::unique_ptr<polygate::ProviderAdapter> Make(const std::string& id, polygate::ProviderConfig cfg = {}) {
    cfg.api_key = "test-key";
    return polygate::AdapterRegistry::with_builtin_adapters().create(id, cfg);
}

// system, user, assistant (text + tool call), tool result, assistant text
std::vector<Message> Conversation() {
    return {
        Message::text(Role::system, "You are terse."),
        Message::text(Role::user, "List the files."),
        Message(Role::assistant, {
            polygate::TextSegment{"Listing."},
            polygate::ToolCallSegment{"call_ls", "list_dir", {{"path", "."}, {"depth", 1}}},
        }),
        Message(Role::tool, {polygate::ToolResultSegment{"call_ls", "a.txt\nb.txt", false}}),
        Message::text(Role::assistant, "Two files."),
    };
}

void RequireSameMessages(const std::vector<Message>& expected, const std::vector<Message>& actual,
                         const std::string& provider) {
    Require(expected.size() == actual.size(),
            provider + ": message count changed (" + std::to_string(actual.size()) + ")");
    for (size_t i = 0; i < expected.size(); i++) {
        const auto& e = expected[i];
        const auto& a = actual[i];
        std::string where = provider + " message " + std::to_string(i);
        Require(e.role() == a.role(), where + ": role changed");
        Require(e.text() == a.text(), where + ": text changed");
        auto ec = e.tool_calls();
        auto ac = a.tool_calls();
        Require(ec.size() == ac.size(), where + ": tool call count changed");
        for (size_t k = 0; k < ec.size(); k++) {
            Require(ec[k].id == ac[k].id && ec[k].name == ac[k].name && ec[k].input == ac[k].input,
                    where + ": tool call changed");
        }
        auto er = e.tool_results();
        auto ar = a.tool_results();
        Require(er.size() == ar.size(), where + ": tool result count changed");
        for (size_t k = 0; k < er.size(); k++) {
            Require(er[k].tool_call_id == ar[k].tool_call_id && er[k].content == ar[k].content,
                    where + ": tool result changed");
        }
    }
}

void ScenarioRoundTripPerProvider() {
    for (const std::string id : {"openai", "anthropic", "google", "deepseek", "qwen", "glm", "openai-compatible"}) {
        auto adapter = Make(id);
        CanonicalRequest req;
        req.model = "test-model";
        req.messages = Conversation();
        req.tools.push_back({"list_dir", "List a directory", {{"type", "object"}}});
        auto wire = adapter->to_wire(req, adapter->effective_capabilities());
        RequireSameMessages(Conversation(), adapter->messages_from_wire(wire.body), id);
        polygate::tests::Log("round trip ok: " + id);
    }
}

void ScenarioThinkingParameters() {
    CanonicalRequest req;
    req.model = "m";
    req.messages = {Message::text(Role::user, "hi")};
    req.thinking.enabled = true;
    req.thinking.budget_tokens = 2000;
    req.max_tokens = 1000;

    auto anthropic = Make("anthropic");
    CanonicalRequest a = req;
    auto wa = anthropic->to_wire(a, anthropic->effective_capabilities());
    Require(wa.body["thinking"]["budget_tokens"] == 2000, "anthropic should carry the thinking budget");
    Require(wa.body["max_tokens"].get<int>() > 2000, "anthropic max_tokens must exceed the budget");
    Require(a.metadata.degradation_notes.empty(), "anthropic supports thinking");

    auto deepseek = Make("deepseek");
    CanonicalRequest d = req;
    auto wd = deepseek->to_wire(d, deepseek->effective_capabilities());
    Require(wd.body.value("enable_thinking", false), "deepseek should set enable_thinking");

    auto google = Make("google");
    CanonicalRequest g = req;
    auto wg = google->to_wire(g, google->effective_capabilities());
    Require(wg.body["generationConfig"]["thinkingConfig"]["thinkingBudget"] == 2000,
            "google should carry thinkingBudget");

    auto openai = Make("openai");
    CanonicalRequest o = req;
    o.thinking.effort = "high";
    auto wo = openai->to_wire(o, openai->effective_capabilities());
    Require(wo.body["reasoning_effort"] == "high", "openai should carry reasoning_effort");

    auto glm = Make("glm");
    CanonicalRequest z = req;
    z.thinking.preserve_across_turns = true;
    auto wz = glm->to_wire(z, glm->effective_capabilities());
    Require(wz.body["thinking"]["type"] == "enabled", "glm should enable thinking");
    Require(wz.body.contains("clear_thinking") && wz.body["clear_thinking"] == false,
            "glm preserved thinking is a top-level clear_thinking=false");
    Require(!wz.body["thinking"].contains("clear_thinking"), "clear_thinking must not nest under thinking");
}

void ScenarioThinkingDegradation() {
    CanonicalRequest req;
    req.model = "m";
    req.messages = {Message::text(Role::user, "hi")};
    req.thinking.enabled = true;

    auto local = Make("openai-compatible");
    auto wire = local->to_wire(req, local->effective_capabilities());
    Require(!wire.body.contains("reasoning_effort") && !wire.body.contains("enable_thinking"),
            "unsupported thinking must not reach the wire");
    Require(req.metadata.degradation_notes.size() == 1, "exactly one degradation note expected");
    Require(req.metadata.degradation_notes[0] == polygate::degradation_note("openai-compatible"),
            "note should name the provider");

    polygate::ProviderConfig off;
    off.supports_thinking = false;
    auto openai = Make("openai", off);
    CanonicalRequest r2;
    r2.model = "m";
    r2.messages = {Message::text(Role::user, "hi")};
    r2.thinking.enabled = true;
    auto w2 = openai->to_wire(r2, openai->effective_capabilities());
    Require(!w2.body.contains("reasoning_effort"), "config override should disable thinking");
    Require(r2.metadata.degradation_notes.size() == 1, "override should produce a degradation note");
}

void ScenarioOpenAIStreamReassembly() {
    auto adapter = Make("openai");
    auto assembler = adapter->stream_assembler();
    std::string deltas;
    assembler->set_on_text([&deltas](const std::string& t) { deltas += t; });

    std::string wire =
        "data: {\"id\":\"c1\",\"model\":\"gpt\",\"choices\":[{\"delta\":{\"content\":\"Hel\"}}]}\n\n"
        "data: {\"id\":\"c1\",\"choices\":[{\"delta\":{\"content\":\"lo\"}}]}\n\n"
        "data: {\"id\":\"c1\",\"choices\":[{\"delta\":{\"tool_calls\":[{\"index\":0,\"id\":\"call_1\","
        "\"function\":{\"name\":\"grep\",\"arguments\":\"{\\\"pat\"}}]}}]}\n\n"
        "data: {\"id\":\"c1\",\"choices\":[{\"delta\":{\"tool_calls\":[{\"index\":0,"
        "\"function\":{\"arguments\":\"\\\": \\\"x\\\"}\"}}]},\"finish_reason\":\"tool_calls\"}]}\n\n"
        "data: [DONE]\n\n";

    // feed in awkward 7-byte slices
    for (size_t i = 0; i < wire.size(); i += 7) assembler->from_wire_chunk(wire.substr(i, 7));
    auto resp = assembler->finish();

    Require(deltas == "Hello", "deltas should arrive in order");
    Require(resp.message.text() == "Hello", "final text should match the deltas");
    Require(!resp.incomplete, "terminated stream is complete");
    Require(resp.finish_reason == polygate::FinishReason::tool_calls, "finish reason should be tool_calls");
    auto calls = resp.message.tool_calls();
    Require(calls.size() == 1 && calls[0].input["pat"] == "x", "fragmented arguments should be joined");
}

void ScenarioAnthropicStreamIncomplete() {
    auto adapter = Make("anthropic");
    auto assembler = adapter->stream_assembler();
    assembler->from_wire_chunk(
        "event: message_start\ndata: {\"type\":\"message_start\",\"message\":{\"id\":\"m1\",\"model\":\"claude\"}}\n\n"
        "event: content_block_delta\ndata: {\"type\":\"content_block_delta\",\"index\":0,"
        "\"delta\":{\"type\":\"text_delta\",\"text\":\"partial an\"}}\n\n");
    // connection drops before message_stop
    auto resp = assembler->finish();
    Require(resp.incomplete, "stream without message_stop should be incomplete");
    Require(resp.message.text() == "partial an", "content received so far should be kept");
    Require(resp.id == "m1", "message id should come from message_start");
}

void ScenarioGoogleStreamReassembly() {
    auto adapter = Make("google");
    auto assembler = adapter->stream_assembler();
    std::string deltas;
    assembler->set_on_text([&deltas](const std::string& t) { deltas += t; });

    assembler->from_wire_chunk(
        "data: {\"responseId\":\"r1\",\"modelVersion\":\"gemini-2.5\",\"candidates\":[{\"content\":"
        "{\"role\":\"model\",\"parts\":[{\"text\":\"weigh it\",\"thought\":true,\"thoughtSignature\":\"sig\"}]}}]}\r\n\r\n");
    assembler->from_wire_chunk(
        "data: {\"responseId\":\"r1\",\"candidates\":[{\"content\":{\"role\":\"model\","
        "\"parts\":[{\"text\":\"Hi \"}]}}]}\n\n"
        "data: {\"responseId\":\"r1\",\"candidates\":[{\"content\":{\"role\":\"model\",\"parts\":"
        "[{\"text\":\"there\"},{\"functionCall\":{\"name\":\"grep\",\"args\":{\"pat\":\"x\"}}}]},"
        "\"finishReason\":\"STOP\"}],\"usageMetadata\":{\"promptTokenCount\":3,\"candidatesTokenCount\":5}}\n\n");
    auto resp = assembler->finish();

    Require(deltas == "Hi there", "google deltas should arrive in order");
    Require(resp.message.text() == "Hi there", "google final text should match the deltas");
    Require(!resp.incomplete, "finishReason terminates a google stream");
    Require(resp.id == "r1" && resp.model == "gemini-2.5", "identity should come from the first frame");
    Require(resp.finish_reason == polygate::FinishReason::tool_calls, "STOP with a function call is tool_calls");
    Require(resp.usage.input_tokens == 3 && resp.usage.output_tokens == 5, "usageMetadata should be read");
    auto calls = resp.message.tool_calls();
    Require(calls.size() == 1 && calls[0].name == "grep" && calls[0].input["pat"] == "x",
            "functionCall parts should become tool calls");
    auto* reasoning = std::get_if<polygate::ReasoningSegment>(&resp.message.content().front());
    Require(reasoning && reasoning->text == "weigh it" && reasoning->signature == "sig",
            "thought parts should become reasoning with their signature");
}

void ScenarioThinkingBlocksKeptApart() {
    auto assembler = Make("anthropic")->stream_assembler();
    assembler->from_wire_chunk(
        "event: message_start\ndata: {\"type\":\"message_start\",\"message\":{\"id\":\"m2\",\"model\":\"claude\"}}\n\n"
        "event: content_block_start\ndata: {\"type\":\"content_block_start\",\"index\":0,"
        "\"content_block\":{\"type\":\"thinking\",\"thinking\":\"\"}}\n\n"
        "event: content_block_delta\ndata: {\"type\":\"content_block_delta\",\"index\":0,"
        "\"delta\":{\"type\":\"thinking_delta\",\"thinking\":\"first\"}}\n\n"
        "event: content_block_delta\ndata: {\"type\":\"content_block_delta\",\"index\":0,"
        "\"delta\":{\"type\":\"signature_delta\",\"signature\":\"s1\"}}\n\n"
        "event: content_block_start\ndata: {\"type\":\"content_block_start\",\"index\":1,"
        "\"content_block\":{\"type\":\"thinking\",\"thinking\":\"\"}}\n\n"
        "event: content_block_delta\ndata: {\"type\":\"content_block_delta\",\"index\":1,"
        "\"delta\":{\"type\":\"thinking_delta\",\"thinking\":\"second\"}}\n\n"
        "event: content_block_delta\ndata: {\"type\":\"content_block_delta\",\"index\":1,"
        "\"delta\":{\"type\":\"signature_delta\",\"signature\":\"s2\"}}\n\n"
        "event: content_block_delta\ndata: {\"type\":\"content_block_delta\",\"index\":2,"
        "\"delta\":{\"type\":\"text_delta\",\"text\":\"answer\"}}\n\n"
        "event: message_stop\ndata: {\"type\":\"message_stop\"}\n\n");
    auto resp = assembler->finish();

    std::vector<polygate::ReasoningSegment> blocks;
    for (auto& seg : resp.message.content()) {
        if (auto* r = std::get_if<polygate::ReasoningSegment>(&seg)) blocks.push_back(*r);
    }
    Require(blocks.size() == 2, "each thinking block should stay its own segment");
    Require(blocks[0].text == "first" && blocks[0].signature == "s1", "first block keeps its signature");
    Require(blocks[1].text == "second" && blocks[1].signature == "s2", "second block keeps its signature");
    Require(resp.message.text() == "answer", "text follows the thinking blocks");
}

void ScenarioMidStreamErrorEvents() {
    auto anthropic = Make("anthropic")->stream_assembler();
    anthropic->from_wire_chunk(
        "event: content_block_delta\ndata: {\"type\":\"content_block_delta\",\"index\":0,"
        "\"delta\":{\"type\":\"text_delta\",\"text\":\"par\"}}\n\n");
    bool raised = false;
    try {
        anthropic->from_wire_chunk(
            "event: error\ndata: {\"type\":\"error\",\"error\":{\"type\":\"overloaded_error\","
            "\"message\":\"Overloaded\"}}\n\n");
    } catch (const polygate::UpstreamError& e) {
        raised = e.provider() == "anthropic" && e.body().find("Overloaded") != std::string::npos;
    }
    Require(raised, "anthropic error event should raise UpstreamError");

    auto openai = Make("openai")->stream_assembler();
    raised = false;
    try {
        openai->from_wire_chunk("data: {\"error\":{\"message\":\"quota exceeded\",\"code\":429}}\n\n");
    } catch (const polygate::UpstreamError& e) {
        raised = e.provider() == "openai" && e.status() == 429;
    }
    Require(raised, "openai error frame should raise UpstreamError with its code");

    auto google = Make("google")->stream_assembler();
    raised = false;
    try {
        google->from_wire_chunk("data: {\"error\":{\"code\":500,\"message\":\"internal\"}}\n\n");
    } catch (const polygate::UpstreamError& e) {
        raised = e.provider() == "google" && e.status() == 500;
    }
    Require(raised, "google error frame should raise UpstreamError");
}

void RequireTranslationError(const std::string& id, const std::string& body, const std::string& what) {
    bool translation = false;
    try {
        Make(id)->from_wire({200, body});
    } catch (const polygate::TranslationError& e) {
        translation = e.provider() == id;
    }
    Require(translation, id + ": " + what + " should raise TranslationError");
}

void ScenarioMalformedBodies() {
    RequireTranslationError("openai",
        R"({"id": 5, "choices": [{"message": {"role": "assistant", "content": "x"}}]})", "numeric id");
    RequireTranslationError("deepseek",
        R"({"choices": [{"message": {"role": "assistant", "content": "x", "tool_calls": [7]}}]})",
        "non-object tool call");
    RequireTranslationError("anthropic", R"({"content": [{"type": "text", "text": 5}]})", "numeric text");
    RequireTranslationError("anthropic", R"({"content": [1]})", "non-object block");
    RequireTranslationError("google",
        R"({"responseId": 7, "candidates": [{"content": {"parts": [{"text": "x"}]}}]})", "numeric responseId");

    auto assembler = Make("openai")->stream_assembler();
    bool translation = false;
    try {
        assembler->from_wire_chunk("data: {\"id\":5,\"choices\":[{\"delta\":{\"content\":\"x\"}}]}\n\n");
    } catch (const polygate::TranslationError& e) {
        translation = e.provider() == "openai";
    }
    Require(translation, "malformed stream event should raise TranslationError");
}

void ScenarioErrors() {
    auto adapter = Make("openai");
    bool upstream = false;
    try {
        adapter->from_wire({503, "{\"error\":{\"message\":\"overloaded\"}}"});
    } catch (const polygate::UpstreamError& e) {
        upstream = e.status() == 503 && e.provider() == "openai" && e.body().find("overloaded") != std::string::npos;
    }
    Require(upstream, "non-2xx should raise UpstreamError carrying status and body");

    bool translation = false;
    try {
        Make("anthropic")->from_wire({200, "<html>gateway timeout</html>"});
    } catch (const polygate::TranslationError& e) {
        translation = e.provider() == "anthropic";
    }
    Require(translation, "unreadable body should raise TranslationError");

    bool unknown = false;
    try {
        Make("bedrock-classic");
    } catch (const polygate::ConfigurationError&) {
        unknown = true;
    }
    Require(unknown, "unknown adapter id should raise ConfigurationError");

    Require(Make("claude")->name() == "anthropic", "alias should resolve to the anthropic adapter");
    Require(Make("GEMINI")->name() == "google", "lookup should ignore case");
}

void ScenarioClientRequestDecoding() {
    json body = json::parse(R"({
        "model": "anthropic/claude-sonnet",
        "stream": true,
        "max_completion_tokens": 256,
        "reasoning_effort": "low",
        "messages": [
            {"role": "system", "content": "Be brief."},
            {"role": "user", "content": [{"type": "text", "text": "look"},
                                          {"type": "image_url", "image_url": {"url": "https://x/y.png"}}]}
        ]
    })");
    auto req = polygate::decode_openai_request(body);
    Require(req.model == "anthropic/claude-sonnet", "model string should be kept verbatim");
    Require(req.stream && req.max_tokens == 256, "stream flag and token cap should be read");
    Require(req.thinking.enabled && req.thinking.effort == "low", "reasoning_effort enables thinking");
    Require(req.messages.size() == 2 && req.messages[1].attachments().size() == 1,
            "image part should become an attachment");

    bool threw = false;
    try {
        polygate::decode_openai_request(json::parse(R"({"model": "x"})"));
    } catch (const polygate::TranslationError& e) {
        threw = e.provider() == "client";
    }
    Require(threw, "request without messages should be rejected as a client error");
}

void ScenarioAnthropicClientFormat() {
    json body = json::parse(R"({
        "model": "claude-sonnet",
        "max_tokens": 512,
        "system": "Be brief.",
        "thinking": {"type": "enabled", "budget_tokens": 2048},
        "tools": [{"name": "grep", "description": "search", "input_schema": {"type": "object"}}],
        "messages": [
            {"role": "user", "content": "find x"},
            {"role": "assistant", "content": [{"type": "tool_use", "id": "t1", "name": "grep", "input": {"pat": "x"}}]},
            {"role": "user", "content": [{"type": "tool_result", "tool_use_id": "t1", "content": "a.rs:1"}]}
        ]
    })");
    auto req = polygate::decode_anthropic_request(body);
    Require(req.model == "claude-sonnet" && req.max_tokens == 512, "model and max_tokens should be read");
    Require(req.thinking.enabled && req.thinking.budget_tokens == 2048, "thinking block should be read");
    Require(req.tools.size() == 1 && req.tools[0].name == "grep", "tools should be read");
    Require(req.messages.size() == 4 && req.messages[0].role() == Role::system, "system becomes a message");
    Require(req.messages[3].role() == Role::tool, "tool_result-only user message becomes role:tool");

    bool client_error = false;
    try {
        polygate::decode_anthropic_request(json::parse(R"({"model": "x", "messages": [{"role": "robot", "content": "hi"}]})"));
    } catch (const polygate::TranslationError& e) {
        client_error = e.provider() == "client";
    }
    Require(client_error, "unknown roles are a client error");

    polygate::CanonicalResponse resp;
    resp.id = "msg_1";
    resp.model = "claude-sonnet";
    resp.finish_reason = polygate::FinishReason::tool_calls;
    resp.message = Message(Role::assistant, {polygate::TextSegment{"Searching."},
                                             polygate::ToolCallSegment{"t2", "grep", {{"pat", "y"}}}});
    json out = polygate::encode_anthropic_response(resp);
    Require(out["type"] == "message" && out["stop_reason"] == "tool_use", "response should use Messages API shape");
    Require(out["content"].size() == 2 && out["content"][1]["type"] == "tool_use", "tool calls become tool_use blocks");

    auto tail = polygate::anthropic_stream_tail(resp, true);
    Require(tail.front().first == "content_block_stop" && tail.back().first == "message_stop",
            "stream tail closes the text block and ends the message");
    bool has_input = std::any_of(tail.begin(), tail.end(), [](const polygate::AnthropicEvent& e) {
        return e.second.contains("delta") && e.second["delta"].value("partial_json", "") == R"({"pat":"y"})";
    });
    Require(has_input, "tool input should be streamed as input_json_delta");
}

} // namespace

int main() {
    try {
        polygate::tests::Log("provider_adapter_test: start");
        ScenarioRoundTripPerProvider();
        ScenarioThinkingParameters();
        ScenarioThinkingDegradation();
        ScenarioOpenAIStreamReassembly();
        ScenarioAnthropicStreamIncomplete();
        ScenarioGoogleStreamReassembly();
        ScenarioThinkingBlocksKeptApart();
        ScenarioMidStreamErrorEvents();
        ScenarioMalformedBodies();
        ScenarioErrors();
        ScenarioClientRequestDecoding();
        ScenarioAnthropicClientFormat();
        polygate::tests::Log("provider_adapter_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        polygate::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
