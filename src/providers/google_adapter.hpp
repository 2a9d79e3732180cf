#pragma once
#include "adapter.hpp"

namespace polygate {

// Gemini generateContent: contents/parts, functionCall/functionResponse, systemInstruction.
class GoogleAdapter : public ProviderAdapter {
public:
    using ProviderAdapter::ProviderAdapter;

    std::string name() const override { return "google"; }
    CapabilitySet capabilities() const override;
    std::string default_base_url() const override { return "https://generativelanguage.googleapis.com"; }

    WireRequest to_wire(CanonicalRequest& request, const CapabilitySet& caps) const override;
    CanonicalResponse from_wire(const WireResponse& response) const override;
    std::vector<Message> messages_from_wire(const nlohmann::json& body) const override;
    std::unique_ptr<StreamAssembler> stream_assembler() const override;

    static constexpr int kDefaultThinkingBudget = 8192;
    static constexpr int kMaxThinkingBudget = 32768;
};

} // namespace polygate
