#include "adapter.hpp"
#include "../errors.hpp"
#include "../log.hpp"
#include "../utils.hpp"
#include <algorithm>

namespace polygate {

std::string degradation_note(const std::string& provider) {
    return "thinking: " + provider + " does not support reasoning; parameter dropped";
}

int stream_error_status(const nlohmann::json& error) {
    if (!error.is_object()) return 0;
    for (const char* key : {"code", "status"}) {
        if (error.contains(key) && error[key].is_number_integer()) return error[key].get<int>();
    }
    return 0;
}

// ── StreamAssembler ─────────────────────────────────────────────────

void StreamAssembler::from_wire_chunk(const std::string& bytes) {
    for (char c : bytes) {
        if (c != '\r') buffer_ += c;
    }
    size_t pos;
    while ((pos = buffer_.find("\n\n")) != std::string::npos) {
        std::string frame = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 2);
        process_frame(frame);
    }
}

void StreamAssembler::process_frame(const std::string& frame) {
    std::string event;
    std::string data;
    size_t start = 0;
    while (start <= frame.size()) {
        size_t nl = frame.find('\n', start);
        std::string line = frame.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        start = (nl == std::string::npos) ? frame.size() + 1 : nl + 1;

        if (line.empty() || line[0] == ':') continue;
        if (line.compare(0, 6, "event:") == 0) {
            event = trim(line.substr(6));
        } else if (line.compare(0, 5, "data:") == 0) {
            std::string d = line.substr(5);
            if (!d.empty() && d[0] == ' ') d.erase(0, 1);
            if (!data.empty()) data += "\n";
            data += d;
        }
    }
    if (data.empty()) return;
    if (data == "[DONE]") {
        mark_done();
        return;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(data);
    } catch (const nlohmann::json::exception& e) {
        malformed_frames_++;
        log_warn(provider_, std::string("Skipping malformed stream frame: ") + e.what());
        return;
    }
    try {
        on_event(event, j);
    } catch (const nlohmann::json::exception& e) {
        throw TranslationError(provider_, std::string("malformed stream event: ") + e.what());
    }
}

void StreamAssembler::append_text(const std::string& text) {
    if (text.empty()) return;
    text_ += text;
    if (on_text_) on_text_(text);
}

void StreamAssembler::append_reasoning(int index, const std::string& text, const std::string& signature) {
    auto& block = reasoning_[index];
    block.text += text;
    block.signature += signature;
}

void StreamAssembler::tool_call_start(int index, const std::string& id, const std::string& name) {
    auto& tc = tool_calls_[index];
    if (!id.empty()) tc.id = id;
    if (!name.empty()) tc.name = name;
}

void StreamAssembler::tool_call_arguments(int index, const std::string& fragment) {
    tool_calls_[index].arguments += fragment;
}

void StreamAssembler::tool_call_input(int index, const nlohmann::json& input) {
    tool_calls_[index].input = input;
}

void StreamAssembler::set_usage(int64_t input, int64_t output) {
    if (input > 0) usage_.input_tokens = input;
    if (output > 0) usage_.output_tokens = output;
}

void StreamAssembler::set_identity(const std::string& id, const std::string& model) {
    if (!id.empty()) id_ = id;
    if (!model.empty()) model_ = model;
}

CanonicalResponse StreamAssembler::finish() {
    // A final frame without its blank-line terminator still counts if it is whole
    std::string tail = trim(buffer_);
    buffer_.clear();
    if (!tail.empty()) process_frame(tail);

    CanonicalResponse resp;
    resp.id = id_;
    resp.model = model_;
    resp.usage = usage_;
    resp.incomplete = !done_ || malformed_frames_ > 0;

    std::vector<Segment> segments;
    for (auto& [index, block] : reasoning_) {
        if (!block.text.empty() || !block.signature.empty()) segments.push_back(block);
    }
    if (!text_.empty()) segments.push_back(TextSegment{text_});
    for (auto& [index, tc] : tool_calls_) {
        ToolCallSegment seg;
        seg.id = tc.id.empty() ? generate_id("call") : tc.id;
        seg.name = tc.name;
        if (!tc.input.is_null()) {
            seg.input = tc.input;
        } else if (tc.arguments.empty()) {
            seg.input = nlohmann::json::object();
        } else {
            try {
                seg.input = nlohmann::json::parse(tc.arguments);
            } catch (const nlohmann::json::exception&) {
                log_warn(provider_, "Tool call '" + tc.name + "' arguments were cut off");
                seg.input = tc.arguments;
                resp.incomplete = true;
            }
        }
        segments.push_back(std::move(seg));
    }
    resp.message = Message(Role::assistant, std::move(segments), id_);

    resp.finish_reason = finish_reason_;
    if (resp.finish_reason == FinishReason::unknown && !tool_calls_.empty()) {
        resp.finish_reason = FinishReason::tool_calls;
    } else if (resp.finish_reason == FinishReason::unknown && done_) {
        resp.finish_reason = FinishReason::stop;
    }
    return resp;
}

// ── ProviderAdapter helpers ─────────────────────────────────────────

CapabilitySet ProviderAdapter::effective_capabilities() const {
    CapabilitySet caps = capabilities();
    if (config_.supports_thinking) {
        caps.thinking = *config_.supports_thinking;
        if (!caps.thinking) {
            caps.reasoning = ReasoningParam::none;
        } else if (caps.reasoning == ReasoningParam::none) {
            caps.reasoning = ReasoningParam::effort_level;
            caps.reasoning_param = "reasoning_effort";
        }
    }
    return caps;
}

bool ProviderAdapter::thinking_applicable(CanonicalRequest& request, const CapabilitySet& caps) const {
    if (!request.thinking.enabled) return false;
    if (caps.thinking && caps.reasoning != ReasoningParam::none) return true;
    std::string note = degradation_note(name());
    request.metadata.degradation_notes.push_back(note);
    log_warn(name(), note);
    return false;
}

void ProviderAdapter::check_status(const WireResponse& response) const {
    if (response.status < 200 || response.status >= 300) {
        throw UpstreamError(name(), response.status, response.body);
    }
}

nlohmann::json ProviderAdapter::parse_body(const WireResponse& response) const {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::exception& e) {
        throw TranslationError(name(), std::string("invalid JSON body: ") + e.what());
    }
    if (!j.is_object()) throw TranslationError(name(), "response body is not an object");
    return j;
}

} // namespace polygate
