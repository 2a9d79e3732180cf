#pragma once
#include "adapter.hpp"

namespace polygate {

// Messages API: top-level system, content blocks, tool_use / tool_result, thinking blocks.
class AnthropicAdapter : public ProviderAdapter {
public:
    using ProviderAdapter::ProviderAdapter;

    std::string name() const override { return "anthropic"; }
    CapabilitySet capabilities() const override;
    std::string default_base_url() const override { return "https://api.anthropic.com"; }

    WireRequest to_wire(CanonicalRequest& request, const CapabilitySet& caps) const override;
    CanonicalResponse from_wire(const WireResponse& response) const override;
    std::vector<Message> messages_from_wire(const nlohmann::json& body) const override;
    std::unique_ptr<StreamAssembler> stream_assembler() const override;

    static constexpr int kDefaultThinkingBudget = 10000;
    static constexpr int kMinThinkingBudget = 1024;
    static constexpr int kDefaultMaxTokens = 4096;
};

// Messages API as spoken to clients of the gateway's /v1/messages endpoint

const char* anthropic_stop_reason(FinishReason reason);

// Malformed bodies throw TranslationError("client", ...)
CanonicalRequest decode_anthropic_request(const nlohmann::json& body);
nlohmann::json encode_anthropic_response(const CanonicalResponse& resp);

// SSE event name and data
using AnthropicEvent = std::pair<std::string, nlohmann::json>;

AnthropicEvent anthropic_message_start(const std::string& id, const std::string& model);
AnthropicEvent anthropic_text_start();
AnthropicEvent anthropic_text_delta(const std::string& text);
// Closes the streamed text block, then tool_use blocks, message_delta, message_stop
std::vector<AnthropicEvent> anthropic_stream_tail(const CanonicalResponse& resp, bool text_open);

} // namespace polygate
