#pragma once
#include "../message.hpp"
#include "../config.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <map>
#include <utility>

namespace polygate {

// How a provider expresses "think before answering"
enum class ReasoningParam { none, token_budget, effort_level, enable_flag };

struct CapabilitySet {
    bool streaming = true;
    bool tool_calls = true;
    bool thinking = false;
    ReasoningParam reasoning = ReasoningParam::none;
    std::string reasoning_param;  // wire location, e.g. "thinking.budget_tokens"
};

struct WireRequest {
    std::string path;
    std::vector<std::pair<std::string, std::string>> headers;
    nlohmann::json body;
    bool stream = false;
};

struct WireResponse {
    int status = 200;
    std::string body;
};

using DeltaCallback = std::function<void(const std::string& text)>;

// ── Streaming reassembly ────────────────────────────────────────────
// Splits server-sent-event frames across arbitrary chunk boundaries and
// feeds complete frames to the provider-specific on_event in arrival order.
class StreamAssembler {
public:
    explicit StreamAssembler(std::string provider) : provider_(std::move(provider)) {}
    virtual ~StreamAssembler() = default;

    void set_on_text(DeltaCallback cb) { on_text_ = std::move(cb); }

    void from_wire_chunk(const std::string& bytes);

    // Content received so far; incomplete when the terminal event never arrived
    CanonicalResponse finish();

    bool done() const { return done_; }

protected:
    virtual void on_event(const std::string& event, const nlohmann::json& data) = 0;

    void append_text(const std::string& text);
    // One reasoning segment per content-block index
    void append_reasoning(int index, const std::string& text, const std::string& signature = {});
    void tool_call_start(int index, const std::string& id, const std::string& name);
    void tool_call_arguments(int index, const std::string& fragment);
    void tool_call_input(int index, const nlohmann::json& input);
    void set_finish_reason(FinishReason reason) { finish_reason_ = reason; }
    void set_usage(int64_t input, int64_t output);
    void set_identity(const std::string& id, const std::string& model);
    void mark_done() { done_ = true; }

    const std::string& provider() const { return provider_; }

private:
    struct PartialToolCall {
        std::string id;
        std::string name;
        std::string arguments;
        nlohmann::json input;  // set when the provider sends whole objects
    };

    void process_frame(const std::string& frame);

    std::string provider_;
    DeltaCallback on_text_;
    std::string buffer_;
    std::string text_;
    std::map<int, ReasoningSegment> reasoning_;
    std::map<int, PartialToolCall> tool_calls_;
    FinishReason finish_reason_ = FinishReason::unknown;
    Usage usage_;
    std::string id_;
    std::string model_;
    bool done_ = false;
    int malformed_frames_ = 0;
};

// ── Adapter interface ───────────────────────────────────────────────

class ProviderAdapter {
public:
    explicit ProviderAdapter(const ProviderConfig& cfg) : config_(cfg) {}
    virtual ~ProviderAdapter() = default;

    virtual std::string name() const = 0;
    virtual CapabilitySet capabilities() const = 0;
    virtual std::string default_base_url() const = 0;

    // Encodes the request; unsupported thinking is dropped with a note in request.metadata
    virtual WireRequest to_wire(CanonicalRequest& request, const CapabilitySet& caps) const = 0;

    // Throws UpstreamError for non-2xx, TranslationError for bodies it cannot read
    virtual CanonicalResponse from_wire(const WireResponse& response) const = 0;

    // Decodes the message list of a wire request body produced by to_wire
    virtual std::vector<Message> messages_from_wire(const nlohmann::json& body) const = 0;

    virtual std::unique_ptr<StreamAssembler> stream_assembler() const = 0;

    // Capabilities after applying the provider's config overrides
    CapabilitySet effective_capabilities() const;

    const ProviderConfig& config() const { return config_; }

protected:
    // Returns false (and records the degradation) when thinking was requested but is unsupported
    bool thinking_applicable(CanonicalRequest& request, const CapabilitySet& caps) const;

    void check_status(const WireResponse& response) const;
    nlohmann::json parse_body(const WireResponse& response) const;

    ProviderConfig config_;
};

std::string degradation_note(const std::string& provider);

// HTTP-like status carried by an in-stream error object, 0 when it has none
int stream_error_status(const nlohmann::json& error);

} // namespace polygate
