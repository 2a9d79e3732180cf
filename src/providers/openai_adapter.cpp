#include "openai_adapter.hpp"
#include "openai_format.hpp"
#include "../errors.hpp"

namespace polygate {

using json = nlohmann::json;

namespace {

class OpenAIStreamAssembler : public StreamAssembler {
public:
    using StreamAssembler::StreamAssembler;

protected:
    void on_event(const std::string&, const json& data) override {
        if (data.contains("error") && !data["error"].is_null()) {
            throw UpstreamError(provider(), stream_error_status(data["error"]), data.dump());
        }
        set_identity(data.value("id", ""), data.value("model", ""));
        if (data.contains("usage") && data["usage"].is_object()) {
            set_usage(data["usage"].value("prompt_tokens", 0), data["usage"].value("completion_tokens", 0));
        }
        if (!data.contains("choices") || !data["choices"].is_array() || data["choices"].empty()) return;

        auto& choice = data["choices"][0];
        if (choice.contains("delta") && choice["delta"].is_object()) {
            auto& delta = choice["delta"];
            if (delta.contains("reasoning_content") && delta["reasoning_content"].is_string()) {
                append_reasoning(0, delta["reasoning_content"].get<std::string>());
            }
            if (delta.contains("content") && delta["content"].is_string()) {
                append_text(delta["content"].get<std::string>());
            }
            if (delta.contains("tool_calls") && delta["tool_calls"].is_array()) {
                for (auto& tc : delta["tool_calls"]) {
                    int index = tc.value("index", 0);
                    std::string name;
                    std::string args;
                    if (tc.contains("function")) {
                        name = tc["function"].value("name", "");
                        args = tc["function"].value("arguments", "");
                    }
                    tool_call_start(index, tc.value("id", ""), name);
                    if (!args.empty()) tool_call_arguments(index, args);
                }
            }
        }
        if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
            set_finish_reason(parse_openai_finish_reason(choice["finish_reason"].get<std::string>()));
        }
    }
};

} // namespace

CapabilitySet OpenAIAdapter::capabilities() const {
    CapabilitySet caps;
    caps.thinking = true;
    caps.reasoning = ReasoningParam::effort_level;
    caps.reasoning_param = "reasoning_effort";
    return caps;
}

WireRequest OpenAIAdapter::to_wire(CanonicalRequest& request, const CapabilitySet& caps) const {
    WireRequest wire;
    wire.path = chat_path();
    wire.stream = request.stream && caps.streaming;

    json body;
    body["model"] = request.model;
    body["messages"] = encode_openai_messages(request.messages, replays_reasoning());
    if (request.max_tokens) body["max_tokens"] = *request.max_tokens;
    if (request.temperature) body["temperature"] = *request.temperature;
    if (!request.tools.empty() && caps.tool_calls) body["tools"] = encode_openai_tools(request.tools);
    if (wire.stream) {
        body["stream"] = true;
        body["stream_options"] = {{"include_usage", true}};
    }
    apply_thinking(body, request.thinking, thinking_applicable(request, caps));
    wire.body = std::move(body);

    if (!config_.api_key.empty()) wire.headers.emplace_back("Authorization", "Bearer " + config_.api_key);
    for (auto& [k, v] : config_.headers) wire.headers.emplace_back(k, v);
    return wire;
}

void OpenAIAdapter::apply_thinking(json& body, const ThinkingRequest& thinking, bool enabled) const {
    if (!enabled) return;
    body["reasoning_effort"] = thinking.effort.empty() ? "medium" : thinking.effort;
}

CanonicalResponse OpenAIAdapter::from_wire(const WireResponse& response) const {
    check_status(response);
    json body = parse_body(response);
    if (body.contains("error") && !body["error"].is_null()) {
        throw UpstreamError(name(), response.status, response.body);
    }
    try {
        return decode_openai_response(body, name());
    } catch (const json::exception& e) {
        throw TranslationError(name(), std::string("malformed response: ") + e.what());
    }
}

std::vector<Message> OpenAIAdapter::messages_from_wire(const json& body) const {
    if (!body.contains("messages")) throw TranslationError(name(), "request has no messages");
    return decode_openai_messages(body["messages"], name());
}

std::unique_ptr<StreamAssembler> OpenAIAdapter::stream_assembler() const {
    return std::make_unique<OpenAIStreamAssembler>(name());
}

// ── DeepSeek ────────────────────────────────────────────────────────

CapabilitySet DeepSeekAdapter::capabilities() const {
    CapabilitySet caps;
    caps.thinking = true;
    caps.reasoning = ReasoningParam::enable_flag;
    caps.reasoning_param = "enable_thinking";
    return caps;
}

void DeepSeekAdapter::apply_thinking(json& body, const ThinkingRequest&, bool enabled) const {
    if (enabled) body["enable_thinking"] = true;
}

// ── Qwen ────────────────────────────────────────────────────────────

CapabilitySet QwenAdapter::capabilities() const {
    CapabilitySet caps;
    caps.thinking = true;
    caps.reasoning = ReasoningParam::enable_flag;
    caps.reasoning_param = "enable_thinking";
    return caps;
}

void QwenAdapter::apply_thinking(json& body, const ThinkingRequest&, bool enabled) const {
    // Qwen3 thinks by default; the switch is always sent explicitly
    body["enable_thinking"] = enabled;
}

// ── GLM ─────────────────────────────────────────────────────────────

CapabilitySet GlmAdapter::capabilities() const {
    CapabilitySet caps;
    caps.thinking = true;
    caps.reasoning = ReasoningParam::enable_flag;
    caps.reasoning_param = "thinking.type";
    return caps;
}

void GlmAdapter::apply_thinking(json& body, const ThinkingRequest& thinking, bool enabled) const {
    body["thinking"] = {{"type", enabled ? "enabled" : "disabled"}};
    if (enabled && thinking.preserve_across_turns) body["clear_thinking"] = false;
}

// ── Generic OpenAI-compatible ───────────────────────────────────────

CapabilitySet OpenAICompatibleAdapter::capabilities() const {
    CapabilitySet caps;
    caps.thinking = false;
    caps.reasoning = ReasoningParam::none;
    return caps;
}

} // namespace polygate
