#include "anthropic_adapter.hpp"
#include "../errors.hpp"
#include <algorithm>

namespace polygate {

using json = nlohmann::json;

namespace {

FinishReason parse_stop_reason(const std::string& s) {
    if (s == "end_turn" || s == "stop_sequence" || s == "pause_turn") return FinishReason::stop;
    if (s == "tool_use") return FinishReason::tool_calls;
    if (s == "max_tokens") return FinishReason::length;
    if (s == "refusal") return FinishReason::content_filter;
    return FinishReason::unknown;
}

json attachment_block(const AttachmentSegment& a) {
    if (a.uri.rfind("data:", 0) == 0) {
        // data:<media>;base64,<payload>
        size_t semi = a.uri.find(';');
        size_t comma = a.uri.find(',');
        if (semi != std::string::npos && comma != std::string::npos && semi < comma) {
            return {{"type", "image"},
                    {"source", {{"type", "base64"},
                                {"media_type", a.uri.substr(5, semi - 5)},
                                {"data", a.uri.substr(comma + 1)}}}};
        }
    }
    if (a.media_type.rfind("image", 0) == 0) {
        return {{"type", "image"}, {"source", {{"type", "url"}, {"url", a.uri}}}};
    }
    return {{"type", "text"},
            {"text", "[attachment: " + (a.label.empty() ? a.uri : a.label) + " <" + a.uri + ">]"}};
}

json encode_blocks(const Message& m) {
    json blocks = json::array();
    for (auto& seg : m.content()) {
        if (auto* r = std::get_if<ReasoningSegment>(&seg)) {
            if (m.role() != Role::assistant) continue;
            blocks.push_back({{"type", "thinking"}, {"thinking", r->text}, {"signature", r->signature}});
        } else if (auto* t = std::get_if<TextSegment>(&seg)) {
            if (!t->text.empty()) blocks.push_back({{"type", "text"}, {"text", t->text}});
        } else if (auto* tc = std::get_if<ToolCallSegment>(&seg)) {
            blocks.push_back({{"type", "tool_use"}, {"id", tc->id}, {"name", tc->name},
                              {"input", tc->input.is_object() ? tc->input : json::object()}});
        } else if (auto* tr = std::get_if<ToolResultSegment>(&seg)) {
            json block = {{"type", "tool_result"}, {"tool_use_id", tr->tool_call_id}, {"content", tr->content}};
            if (tr->is_error) block["is_error"] = true;
            blocks.push_back(std::move(block));
        } else if (auto* a = std::get_if<AttachmentSegment>(&seg)) {
            blocks.push_back(attachment_block(*a));
        }
    }
    return blocks;
}

std::string tool_result_text(const json& content) {
    if (content.is_string()) return content.get<std::string>();
    std::string out;
    if (content.is_array()) {
        for (auto& b : content) {
            if (b.value("type", "") == "text") out += b.value("text", "");
        }
    }
    return out;
}

std::vector<Segment> decode_blocks(const json& content, const std::string& provider) {
    std::vector<Segment> segments;
    if (content.is_string()) {
        segments.push_back(TextSegment{content.get<std::string>()});
        return segments;
    }
    if (!content.is_array()) throw TranslationError(provider, "content is neither text nor blocks");
    for (auto& b : content) {
        std::string type = b.value("type", "");
        if (type == "text") {
            segments.push_back(TextSegment{b.value("text", "")});
        } else if (type == "thinking") {
            segments.push_back(ReasoningSegment{b.value("thinking", ""), b.value("signature", "")});
        } else if (type == "tool_use") {
            segments.push_back(ToolCallSegment{b.value("id", ""), b.value("name", ""),
                                               b.contains("input") ? b["input"] : json::object()});
        } else if (type == "tool_result") {
            segments.push_back(ToolResultSegment{b.value("tool_use_id", ""),
                                                 tool_result_text(b.contains("content") ? b["content"] : json()),
                                                 b.value("is_error", false)});
        } else if (type == "image" && b.contains("source")) {
            auto& src = b["source"];
            if (src.value("type", "") == "base64") {
                std::string media = src.value("media_type", "image/png");
                segments.push_back(AttachmentSegment{"data:" + media + ";base64," + src.value("data", ""), media, ""});
            } else {
                segments.push_back(AttachmentSegment{src.value("url", ""), "image", ""});
            }
        }
        // redacted_thinking and server-side blocks carry nothing the canonical model keeps
    }
    return segments;
}

// Top-level system plus the messages array, as sent to /v1/messages
std::vector<Message> decode_messages_body(const json& body, const std::string& provider) {
    std::vector<Message> out;
    if (body.contains("system")) {
        auto& sys = body["system"];
        std::string text;
        if (sys.is_string()) {
            text = sys.get<std::string>();
        } else if (sys.is_array()) {
            for (auto& b : sys) text += b.value("text", "");
        }
        if (!text.empty()) out.push_back(Message::text(Role::system, text));
    }
    if (!body.contains("messages") || !body["messages"].is_array()) {
        throw TranslationError(provider, "request has no messages");
    }
    for (auto& m : body["messages"]) {
        std::string role = m.value("role", "");
        auto segments = decode_blocks(m.contains("content") ? m["content"] : json(), provider);
        if (role == "assistant") {
            out.emplace_back(Role::assistant, std::move(segments));
            continue;
        }
        if (role != "user") throw TranslationError(provider, "unexpected role '" + role + "'");
        bool all_results = !segments.empty() && std::all_of(segments.begin(), segments.end(),
            [](const Segment& s) { return std::holds_alternative<ToolResultSegment>(s); });
        out.emplace_back(all_results ? Role::tool : Role::user, std::move(segments));
    }
    return out;
}

class AnthropicStreamAssembler : public StreamAssembler {
public:
    using StreamAssembler::StreamAssembler;

protected:
    void on_event(const std::string& event, const json& data) override {
        std::string type = data.value("type", event);
        if (type == "message_start" && data.contains("message")) {
            auto& msg = data["message"];
            set_identity(msg.value("id", ""), msg.value("model", ""));
            if (msg.contains("usage")) set_usage(msg["usage"].value("input_tokens", 0), 0);
        } else if (type == "content_block_start" && data.contains("content_block")) {
            int index = data.value("index", 0);
            auto& block = data["content_block"];
            std::string btype = block.value("type", "");
            if (btype == "tool_use") {
                tool_call_start(index, block.value("id", ""), block.value("name", ""));
            } else if (btype == "text") {
                append_text(block.value("text", ""));
            } else if (btype == "thinking") {
                append_reasoning(index, block.value("thinking", ""), block.value("signature", ""));
            }
        } else if (type == "content_block_delta" && data.contains("delta")) {
            int index = data.value("index", 0);
            auto& delta = data["delta"];
            std::string dtype = delta.value("type", "");
            if (dtype == "text_delta") {
                append_text(delta.value("text", ""));
            } else if (dtype == "input_json_delta") {
                tool_call_arguments(index, delta.value("partial_json", ""));
            } else if (dtype == "thinking_delta") {
                append_reasoning(index, delta.value("thinking", ""));
            } else if (dtype == "signature_delta") {
                append_reasoning(index, "", delta.value("signature", ""));
            }
        } else if (type == "message_delta") {
            if (data.contains("delta") && data["delta"].contains("stop_reason") &&
                data["delta"]["stop_reason"].is_string()) {
                set_finish_reason(parse_stop_reason(data["delta"]["stop_reason"].get<std::string>()));
            }
            if (data.contains("usage")) set_usage(0, data["usage"].value("output_tokens", 0));
        } else if (type == "message_stop") {
            mark_done();
        } else if (type == "error") {
            throw UpstreamError(provider(), 0, data.dump());
        }
    }
};

} // namespace

CapabilitySet AnthropicAdapter::capabilities() const {
    CapabilitySet caps;
    caps.thinking = true;
    caps.reasoning = ReasoningParam::token_budget;
    caps.reasoning_param = "thinking.budget_tokens";
    return caps;
}

WireRequest AnthropicAdapter::to_wire(CanonicalRequest& request, const CapabilitySet& caps) const {
    WireRequest wire;
    wire.path = "/v1/messages";
    wire.stream = request.stream && caps.streaming;

    json body;
    body["model"] = request.model;

    std::string system;
    json messages = json::array();
    for (auto& m : request.messages) {
        if (m.role() == Role::system) {
            if (!system.empty()) system += "\n\n";
            system += m.text();
            continue;
        }
        // role:tool travels as a user message of tool_result blocks
        std::string role = (m.role() == Role::assistant) ? "assistant" : "user";
        json blocks = encode_blocks(m);
        if (blocks.empty()) continue;
        // The API requires alternating roles; merge runs of the same role
        if (!messages.empty() && messages.back()["role"] == role) {
            for (auto& b : blocks) messages.back()["content"].push_back(b);
        } else {
            messages.push_back({{"role", role}, {"content", blocks}});
        }
    }
    if (!system.empty()) {
        body["system"] = json::array({{{"type", "text"}, {"text", system},
                                       {"cache_control", {{"type", "ephemeral"}}}}});
    }
    body["messages"] = std::move(messages);

    int max_tokens = request.max_tokens.value_or(kDefaultMaxTokens);
    if (request.temperature) body["temperature"] = *request.temperature;

    if (!request.tools.empty() && caps.tool_calls) {
        json tools = json::array();
        for (auto& t : request.tools) {
            json schema = t.parameters.is_object() ? t.parameters : json::object();
            if (!schema.contains("type")) schema["type"] = "object";
            tools.push_back({{"name", t.name}, {"description", t.description}, {"input_schema", schema}});
        }
        tools.back()["cache_control"] = {{"type", "ephemeral"}};
        body["tools"] = std::move(tools);
    }

    if (thinking_applicable(request, caps)) {
        int budget = request.thinking.budget_tokens > 0 ? request.thinking.budget_tokens : kDefaultThinkingBudget;
        budget = std::max(budget, kMinThinkingBudget);
        body["thinking"] = {{"type", "enabled"}, {"budget_tokens", budget}};
        if (max_tokens <= budget) max_tokens = budget + kDefaultMaxTokens;
        // Extended thinking only runs at the default temperature
        body.erase("temperature");
    }
    body["max_tokens"] = max_tokens;
    if (wire.stream) body["stream"] = true;
    wire.body = std::move(body);

    wire.headers.emplace_back("x-api-key", config_.api_key);
    wire.headers.emplace_back("anthropic-version", "2023-06-01");
    for (auto& [k, v] : config_.headers) wire.headers.emplace_back(k, v);
    return wire;
}

CanonicalResponse AnthropicAdapter::from_wire(const WireResponse& response) const {
    check_status(response);
    json body = parse_body(response);
    if (body.value("type", "") == "error") throw UpstreamError(name(), response.status, response.body);
    if (!body.contains("content")) throw TranslationError(name(), "response has no content");

    CanonicalResponse resp;
    try {
        resp.id = body.value("id", "");
        resp.model = body.value("model", "");
        resp.message = Message(Role::assistant, decode_blocks(body["content"], name()), resp.id);
        if (body.contains("stop_reason") && body["stop_reason"].is_string()) {
            resp.finish_reason = parse_stop_reason(body["stop_reason"].get<std::string>());
        }
        if (body.contains("usage") && body["usage"].is_object()) {
            resp.usage.input_tokens = body["usage"].value("input_tokens", 0);
            resp.usage.output_tokens = body["usage"].value("output_tokens", 0);
        }
    } catch (const json::exception& e) {
        throw TranslationError(name(), std::string("malformed response: ") + e.what());
    }
    return resp;
}

std::vector<Message> AnthropicAdapter::messages_from_wire(const json& body) const {
    return decode_messages_body(body, name());
}

std::unique_ptr<StreamAssembler> AnthropicAdapter::stream_assembler() const {
    return std::make_unique<AnthropicStreamAssembler>(name());
}

// ── Client-facing Messages API ──────────────────────────────────────

const char* anthropic_stop_reason(FinishReason reason) {
    switch (reason) {
        case FinishReason::tool_calls: return "tool_use";
        case FinishReason::length: return "max_tokens";
        case FinishReason::content_filter: return "refusal";
        default: return "end_turn";
    }
}

CanonicalRequest decode_anthropic_request(const json& body) {
    if (!body.is_object()) throw TranslationError("client", "request body is not an object");
    CanonicalRequest req;
    try {
        req.model = body.value("model", "");
        req.messages = decode_messages_body(body, "client");
        if (body.contains("tools") && body["tools"].is_array()) {
            for (auto& t : body["tools"]) {
                req.tools.push_back({t.value("name", ""), t.value("description", ""),
                                     t.contains("input_schema") ? t["input_schema"] : json::object()});
            }
        }
        if (body.contains("max_tokens") && body["max_tokens"].is_number()) {
            req.max_tokens = body["max_tokens"].get<int>();
        }
        if (body.contains("temperature") && body["temperature"].is_number()) {
            req.temperature = body["temperature"].get<double>();
        }
        req.stream = body.value("stream", false);
        if (body.contains("thinking") && body["thinking"].is_object()) {
            auto& t = body["thinking"];
            req.thinking.enabled = t.value("type", "enabled") != "disabled";
            req.thinking.budget_tokens = t.value("budget_tokens", 0);
        }
    } catch (const json::exception& e) {
        throw TranslationError("client", std::string("malformed request: ") + e.what());
    }
    return req;
}

json encode_anthropic_response(const CanonicalResponse& resp) {
    return {
        {"id", resp.id},
        {"type", "message"},
        {"role", "assistant"},
        {"model", resp.model},
        {"content", encode_blocks(resp.message)},
        {"stop_reason", anthropic_stop_reason(resp.finish_reason)},
        {"stop_sequence", nullptr},
        {"usage", {{"input_tokens", resp.usage.input_tokens}, {"output_tokens", resp.usage.output_tokens}}},
    };
}

AnthropicEvent anthropic_message_start(const std::string& id, const std::string& model) {
    return {"message_start", {{"type", "message_start"},
                              {"message", {{"id", id}, {"type", "message"}, {"role", "assistant"},
                                           {"model", model}, {"content", json::array()},
                                           {"stop_reason", nullptr},
                                           {"usage", {{"input_tokens", 0}, {"output_tokens", 0}}}}}}};
}

AnthropicEvent anthropic_text_start() {
    return {"content_block_start", {{"type", "content_block_start"}, {"index", 0},
                                    {"content_block", {{"type", "text"}, {"text", ""}}}}};
}

AnthropicEvent anthropic_text_delta(const std::string& text) {
    return {"content_block_delta", {{"type", "content_block_delta"}, {"index", 0},
                                    {"delta", {{"type", "text_delta"}, {"text", text}}}}};
}

std::vector<AnthropicEvent> anthropic_stream_tail(const CanonicalResponse& resp, bool text_open) {
    std::vector<AnthropicEvent> out;
    int index = 0;
    if (text_open) {
        out.push_back({"content_block_stop", {{"type", "content_block_stop"}, {"index", 0}}});
        index = 1;
    }
    for (auto& tc : resp.message.tool_calls()) {
        out.push_back({"content_block_start", {{"type", "content_block_start"}, {"index", index},
                       {"content_block", {{"type", "tool_use"}, {"id", tc.id}, {"name", tc.name},
                                          {"input", json::object()}}}}});
        json input = tc.input.is_object() ? tc.input : json::object();
        out.push_back({"content_block_delta", {{"type", "content_block_delta"}, {"index", index},
                       {"delta", {{"type", "input_json_delta"}, {"partial_json", input.dump()}}}}});
        out.push_back({"content_block_stop", {{"type", "content_block_stop"}, {"index", index}}});
        index++;
    }
    out.push_back({"message_delta", {{"type", "message_delta"},
                   {"delta", {{"stop_reason", anthropic_stop_reason(resp.finish_reason)}, {"stop_sequence", nullptr}}},
                   {"usage", {{"output_tokens", resp.usage.output_tokens}}}}});
    out.push_back({"message_stop", {{"type", "message_stop"}}});
    return out;
}


} // namespace polygate
