#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"

namespace polygate {

enum class HookEventKind {
    session_start,
    session_end,
    user_prompt_submit,
    pre_tool_use,
    post_tool_use,
    post_tool_use_failure,
    stop,
    subagent_start,
    subagent_stop,
    pre_compact,
    permission_request,
    notification,
};

const char* hook_event_key(HookEventKind kind);

// Accepts snake_case keys and Claude Code PascalCase names
std::optional<HookEventKind> parse_hook_event(const std::string& s);

// ── Typed payloads, one per event kind ──────────────────────────────

struct SessionStartPayload {
    static constexpr HookEventKind kind = HookEventKind::session_start;
    std::string source = "startup";  // "startup" | "resume"
};

struct SessionEndPayload {
    static constexpr HookEventKind kind = HookEventKind::session_end;
    std::string reason;
};

struct UserPromptSubmitPayload {
    static constexpr HookEventKind kind = HookEventKind::user_prompt_submit;
    std::string prompt;
};

struct PreToolUsePayload {
    static constexpr HookEventKind kind = HookEventKind::pre_tool_use;
    std::string tool_name;
    nlohmann::json tool_input;
};

struct PostToolUsePayload {
    static constexpr HookEventKind kind = HookEventKind::post_tool_use;
    std::string tool_name;
    nlohmann::json tool_input;
    std::string tool_response;
};

struct PostToolUseFailurePayload {
    static constexpr HookEventKind kind = HookEventKind::post_tool_use_failure;
    std::string tool_name;
    nlohmann::json tool_input;
    std::string error;
};

struct StopPayload {
    static constexpr HookEventKind kind = HookEventKind::stop;
    std::string reason;
};

struct SubagentStartPayload {
    static constexpr HookEventKind kind = HookEventKind::subagent_start;
    std::string agent_id;
    std::string agent_type;
};

struct SubagentStopPayload {
    static constexpr HookEventKind kind = HookEventKind::subagent_stop;
    std::string agent_id;
    std::string reason;
};

struct PreCompactPayload {
    static constexpr HookEventKind kind = HookEventKind::pre_compact;
    std::string trigger = "auto";  // "auto" | "manual"
    int current_tokens = 0;
    int max_tokens = 0;
};

struct PermissionRequestPayload {
    static constexpr HookEventKind kind = HookEventKind::permission_request;
    std::string tool_name;
    nlohmann::json tool_input;
};

struct NotificationPayload {
    static constexpr HookEventKind kind = HookEventKind::notification;
    std::string message;
};

using HookPayload = std::variant<SessionStartPayload, SessionEndPayload, UserPromptSubmitPayload,
                                 PreToolUsePayload, PostToolUsePayload, PostToolUseFailurePayload,
                                 StopPayload, SubagentStartPayload, SubagentStopPayload,
                                 PreCompactPayload, PermissionRequestPayload, NotificationPayload>;

struct HookEvent {
    HookPayload payload;
    std::string session_id;
    std::string cwd;
    std::string permission_mode = "default";

    HookEventKind kind() const;

    // What matchers are tested against: tool name, prompt text, or the event key
    std::string matcher_context() const;

    // Handler stdin document
    nlohmann::json to_json() const;
};

// ── Decisions ───────────────────────────────────────────────────────

enum class Permission { allow, ask, deny };

const char* permission_name(Permission p);

struct HookDecision {
    bool proceed = true;  // "continue" on the wire
    std::optional<nlohmann::json> updated_input;
    std::optional<Permission> permission;
    std::optional<std::string> system_message;
    bool suppress_output = false;
    std::string reason;

    static HookDecision from_json(const nlohmann::json& j);
};

enum class HandlerStatus { ok, blocking_failure, non_blocking_failure, timed_out };

struct HandlerOutcome {
    HandlerStatus status = HandlerStatus::ok;
    HookDecision decision;
    std::string error;  // stderr or failure description
};

class HookHandler {
public:
    virtual ~HookHandler() = default;
    virtual std::string describe() const = 0;
    virtual std::chrono::milliseconds timeout() const = 0;
    // Expected to return close to timeout(); the engine stops waiting regardless
    virtual HandlerOutcome run(const HookEvent& event, const std::string& input_json) = 0;
};

// sh -c <command>; event JSON on stdin, decision JSON on stdout
class CommandHookHandler : public HookHandler {
public:
    CommandHookHandler(std::string command, std::chrono::milliseconds timeout);

    std::string describe() const override { return "command: " + command_; }
    std::chrono::milliseconds timeout() const override { return timeout_; }
    HandlerOutcome run(const HookEvent& event, const std::string& input_json) override;

    static constexpr int kDefaultTimeoutMs = 60000;

private:
    std::string command_;
    std::chrono::milliseconds timeout_;
};

// (system prompt, user prompt) -> model text
using PromptEvaluator = std::function<std::string(const std::string&, const std::string&)>;

// One targeted model call whose only output is a JSON decision
class PromptHookHandler : public HookHandler {
public:
    PromptHookHandler(std::string prompt, std::chrono::milliseconds timeout, PromptEvaluator evaluator);

    std::string describe() const override { return "prompt: " + prompt_.substr(0, 40); }
    std::chrono::milliseconds timeout() const override { return timeout_; }
    HandlerOutcome run(const HookEvent& event, const std::string& input_json) override;

    static constexpr int kDefaultTimeoutMs = 30000;

private:
    std::string prompt_;
    std::chrono::milliseconds timeout_;
    PromptEvaluator evaluator_;
};

// ── Engine ──────────────────────────────────────────────────────────

struct HookMatcher {
    std::string pattern;  // regex; empty or "*" matches everything
    std::vector<std::shared_ptr<HookHandler>> handlers;
    std::shared_ptr<const std::regex> compiled;  // set by register_matcher
    bool invalid = false;                        // pattern failed to compile; never matches

    // Tool names, triggers and sources must match whole; prompt text is searched
    bool applies(const std::string& context, bool whole) const;
};

struct HandlerFailure {
    std::string handler;
    HandlerStatus status;
    std::string error;
};

struct HookResolution {
    bool blocked = false;
    std::string block_reason;
    std::optional<Permission> permission;
    std::optional<nlohmann::json> updated_input;
    std::vector<std::string> system_messages;
    bool suppress_output = false;
    std::vector<HandlerFailure> failures;
    int handlers_run = 0;
};

struct NamedOutcome {
    std::string handler;
    HandlerOutcome outcome;
};

// Outcomes in declaration order; timed-out entries contribute nothing
HookResolution merge_outcomes(HookEventKind kind, const std::vector<NamedOutcome>& outcomes);

class HookEngine {
public:
    // Throws ConfigurationError on unknown event keys
    static HookEngine from_config(const HooksConfig& cfg, PromptEvaluator evaluator = nullptr);

    void register_matcher(HookEventKind kind, HookMatcher matcher);

    // Runs matched handlers concurrently, waits at most each handler's timeout, merges
    HookResolution dispatch(const HookEvent& event) const;

    bool has_hooks(HookEventKind kind) const;
    int hook_count() const;

    // Slack added to every handler deadline for process spawn and teardown
    static constexpr std::chrono::milliseconds kJoinGrace{200};

private:
    std::map<HookEventKind, std::vector<HookMatcher>> matchers_;
};

} // namespace polygate
