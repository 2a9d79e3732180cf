#pragma once
#include "adapter.hpp"

namespace polygate {

// Chat-completions dialect. Providers that speak it with a different
// reasoning switch override apply_thinking.
class OpenAIAdapter : public ProviderAdapter {
public:
    using ProviderAdapter::ProviderAdapter;

    std::string name() const override { return "openai"; }
    CapabilitySet capabilities() const override;
    std::string default_base_url() const override { return "https://api.openai.com/v1"; }

    WireRequest to_wire(CanonicalRequest& request, const CapabilitySet& caps) const override;
    CanonicalResponse from_wire(const WireResponse& response) const override;
    std::vector<Message> messages_from_wire(const nlohmann::json& body) const override;
    std::unique_ptr<StreamAssembler> stream_assembler() const override;

protected:
    // enabled is false when thinking was not requested or was dropped
    virtual void apply_thinking(nlohmann::json& body, const ThinkingRequest& thinking, bool enabled) const;
    virtual bool replays_reasoning() const { return false; }
    virtual std::string chat_path() const { return "/chat/completions"; }
};

class DeepSeekAdapter : public OpenAIAdapter {
public:
    using OpenAIAdapter::OpenAIAdapter;
    std::string name() const override { return "deepseek"; }
    CapabilitySet capabilities() const override;
    std::string default_base_url() const override { return "https://api.deepseek.com/v1"; }

protected:
    void apply_thinking(nlohmann::json& body, const ThinkingRequest& thinking, bool enabled) const override;
    bool replays_reasoning() const override { return true; }
};

class QwenAdapter : public OpenAIAdapter {
public:
    using OpenAIAdapter::OpenAIAdapter;
    std::string name() const override { return "qwen"; }
    CapabilitySet capabilities() const override;
    std::string default_base_url() const override { return "https://dashscope.aliyuncs.com/compatible-mode/v1"; }

protected:
    void apply_thinking(nlohmann::json& body, const ThinkingRequest& thinking, bool enabled) const override;
    bool replays_reasoning() const override { return true; }
};

class GlmAdapter : public OpenAIAdapter {
public:
    using OpenAIAdapter::OpenAIAdapter;
    std::string name() const override { return "glm"; }
    CapabilitySet capabilities() const override;
    std::string default_base_url() const override { return "https://api.z.ai/api/paas/v4"; }

protected:
    void apply_thinking(nlohmann::json& body, const ThinkingRequest& thinking, bool enabled) const override;
    bool replays_reasoning() const override { return true; }
};

// Local servers (LM Studio, llama.cpp, vLLM, Ollama's /v1) without a reasoning switch
class OpenAICompatibleAdapter : public OpenAIAdapter {
public:
    using OpenAIAdapter::OpenAIAdapter;
    std::string name() const override { return "openai-compatible"; }
    CapabilitySet capabilities() const override;
    std::string default_base_url() const override { return "http://127.0.0.1:8000/v1"; }
};

} // namespace polygate
