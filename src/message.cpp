#include "message.hpp"
#include "errors.hpp"
#include <type_traits>

namespace polygate {

using json = nlohmann::json;

const char* role_name(Role role) {
    switch (role) {
        case Role::system:    return "system";
        case Role::user:      return "user";
        case Role::assistant: return "assistant";
        case Role::tool:      return "tool";
    }
    return "user";
}

Role parse_role(const std::string& s) {
    if (s == "system" || s == "developer") return Role::system;
    if (s == "user") return Role::user;
    if (s == "assistant") return Role::assistant;
    if (s == "tool") return Role::tool;
    throw Error("Unknown message role: " + s);
}

const char* finish_reason_name(FinishReason reason) {
    switch (reason) {
        case FinishReason::stop:           return "stop";
        case FinishReason::tool_calls:     return "tool_calls";
        case FinishReason::length:         return "length";
        case FinishReason::content_filter: return "content_filter";
        case FinishReason::unknown:        break;
    }
    return "stop";
}

Message::Message(Role role, std::vector<Segment> content, std::string id)
    : role_(role), content_(std::move(content)), id_(std::move(id)) {}

Message Message::text(Role role, const std::string& text) {
    return Message(role, {TextSegment{text}});
}

std::string Message::text() const {
    std::string out;
    for (auto& seg : content_) {
        if (auto* t = std::get_if<TextSegment>(&seg)) out += t->text;
    }
    return out;
}

std::string Message::reasoning() const {
    std::string out;
    for (auto& seg : content_) {
        if (auto* r = std::get_if<ReasoningSegment>(&seg)) out += r->text;
    }
    return out;
}

std::vector<ToolCallSegment> Message::tool_calls() const {
    std::vector<ToolCallSegment> out;
    for (auto& seg : content_) {
        if (auto* tc = std::get_if<ToolCallSegment>(&seg)) out.push_back(*tc);
    }
    return out;
}

std::vector<ToolResultSegment> Message::tool_results() const {
    std::vector<ToolResultSegment> out;
    for (auto& seg : content_) {
        if (auto* tr = std::get_if<ToolResultSegment>(&seg)) out.push_back(*tr);
    }
    return out;
}

std::vector<AttachmentSegment> Message::attachments() const {
    std::vector<AttachmentSegment> out;
    for (auto& seg : content_) {
        if (auto* a = std::get_if<AttachmentSegment>(&seg)) out.push_back(*a);
    }
    return out;
}

bool Message::has_tool_calls() const {
    for (auto& seg : content_) {
        if (std::holds_alternative<ToolCallSegment>(seg)) return true;
    }
    return false;
}

// ── Journal encoding ────────────────────────────────────────────────

static json segment_to_json(const Segment& seg) {
    return std::visit([](const auto& s) -> json {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, TextSegment>) {
            return {{"type", "text"}, {"text", s.text}};
        } else if constexpr (std::is_same_v<T, ToolCallSegment>) {
            return {{"type", "tool_call"}, {"id", s.id}, {"name", s.name}, {"input", s.input}};
        } else if constexpr (std::is_same_v<T, ToolResultSegment>) {
            return {{"type", "tool_result"}, {"tool_call_id", s.tool_call_id},
                    {"content", s.content}, {"is_error", s.is_error}};
        } else if constexpr (std::is_same_v<T, ReasoningSegment>) {
            return {{"type", "reasoning"}, {"text", s.text}, {"signature", s.signature}};
        } else {
            return {{"type", "attachment"}, {"uri", s.uri},
                    {"media_type", s.media_type}, {"label", s.label}};
        }
    }, seg);
}

static Segment segment_from_json(const json& j) {
    std::string type = j.value("type", "text");
    if (type == "tool_call") {
        return ToolCallSegment{j.value("id", ""), j.value("name", ""),
                               j.contains("input") ? j["input"] : json::object()};
    }
    if (type == "tool_result") {
        return ToolResultSegment{j.value("tool_call_id", ""), j.value("content", ""),
                                 j.value("is_error", false)};
    }
    if (type == "reasoning") {
        return ReasoningSegment{j.value("text", ""), j.value("signature", "")};
    }
    if (type == "attachment") {
        return AttachmentSegment{j.value("uri", ""), j.value("media_type", ""), j.value("label", "")};
    }
    if (type != "text") throw Error("Unknown segment type: " + type);
    return TextSegment{j.value("text", "")};
}

json Message::to_json() const {
    json j;
    j["role"] = role_name(role_);
    if (!id_.empty()) j["id"] = id_;
    j["content"] = json::array();
    for (auto& seg : content_) j["content"].push_back(segment_to_json(seg));
    return j;
}

Message Message::from_json(const json& j) {
    std::vector<Segment> content;
    if (j.contains("content") && j["content"].is_array()) {
        for (auto& s : j["content"]) content.push_back(segment_from_json(s));
    }
    return Message(parse_role(j.value("role", "user")), std::move(content), j.value("id", ""));
}

// ── Size estimation ─────────────────────────────────────────────────

int estimate_tokens(const Message& msg) {
    int tokens = 4; // per-message overhead
    for (auto& seg : msg.content()) {
        std::visit([&tokens](const auto& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, TextSegment>) {
                tokens += estimate_tokens(s.text);
            } else if constexpr (std::is_same_v<T, ToolCallSegment>) {
                tokens += estimate_tokens(s.name) + estimate_tokens(s.input.dump()) + 8;
            } else if constexpr (std::is_same_v<T, ToolResultSegment>) {
                tokens += estimate_tokens(s.content);
            } else if constexpr (std::is_same_v<T, ReasoningSegment>) {
                tokens += estimate_tokens(s.text);
            } else {
                tokens += estimate_tokens(s.label) + estimate_tokens(s.uri);
            }
        }, seg);
    }
    return tokens;
}

} // namespace polygate
