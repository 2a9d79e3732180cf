#pragma once
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace polygate {

enum class Role { system, user, assistant, tool };

const char* role_name(Role role);
Role parse_role(const std::string& s);

// ── Content segments ────────────────────────────────────────────────

struct TextSegment {
    std::string text;
};

// input is the parsed argument object; a string value holds arguments that were not valid JSON
struct ToolCallSegment {
    std::string id;
    std::string name;
    nlohmann::json input = nlohmann::json::object();
};

struct ToolResultSegment {
    std::string tool_call_id;
    std::string content;
    bool is_error = false;
};

struct ReasoningSegment {
    std::string text;
    std::string signature; // opaque provider token, replayed verbatim
};

struct AttachmentSegment {
    std::string uri;
    std::string media_type;
    std::string label;
};

using Segment = std::variant<TextSegment, ToolCallSegment, ToolResultSegment,
                             ReasoningSegment, AttachmentSegment>;

// Immutable once constructed.
class Message {
public:
    Message() = default;
    Message(Role role, std::vector<Segment> content, std::string id = {});

    static Message text(Role role, const std::string& text);

    Role role() const { return role_; }
    const std::vector<Segment>& content() const { return content_; }
    const std::string& id() const { return id_; }

    // Concatenation of all text segments
    std::string text() const;
    std::string reasoning() const;
    std::vector<ToolCallSegment> tool_calls() const;
    std::vector<ToolResultSegment> tool_results() const;
    std::vector<AttachmentSegment> attachments() const;
    bool has_tool_calls() const;

    nlohmann::json to_json() const;
    static Message from_json(const nlohmann::json& j);

private:
    Role role_ = Role::assistant;
    std::vector<Segment> content_;
    std::string id_;
};

// ── Requests and responses ──────────────────────────────────────────

struct ThinkingRequest {
    bool enabled = false;
    int budget_tokens = 0;        // 0 = provider default
    std::string effort;           // "low" | "medium" | "high", empty = default
    bool preserve_across_turns = false;
};

struct ToolSpec {
    std::string name;
    std::string description;
    nlohmann::json parameters = nlohmann::json::object();
};

struct RequestMetadata {
    std::string session_id;
    std::vector<std::string> degradation_notes;
};

struct CanonicalRequest {
    std::string model;
    std::vector<Message> messages;
    std::vector<ToolSpec> tools;
    std::optional<int> max_tokens;
    std::optional<double> temperature;
    bool stream = false;
    ThinkingRequest thinking;
    RequestMetadata metadata;
};

enum class FinishReason { stop, tool_calls, length, content_filter, unknown };

const char* finish_reason_name(FinishReason reason);

struct Usage {
    int64_t input_tokens = 0;
    int64_t output_tokens = 0;
};

struct CanonicalResponse {
    std::string id;
    std::string model;
    Message message;
    FinishReason finish_reason = FinishReason::unknown;
    Usage usage;
    bool incomplete = false; // stream ended before its terminal event
};

// ── Size estimation (4 bytes ≈ 1 token, conservative) ───────────────

inline int estimate_tokens(const std::string& text) {
    return static_cast<int>((text.size() + 3) / 4);
}

int estimate_tokens(const Message& msg);

inline int estimate_tokens(const std::vector<Message>& msgs) {
    int total = 0;
    for (auto& m : msgs) total += estimate_tokens(m);
    return total;
}

} // namespace polygate
