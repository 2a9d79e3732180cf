#include "hooks.hpp"
#include "bounded_task.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <type_traits>

namespace polygate {

using json = nlohmann::json;

namespace {

struct EventName {
    HookEventKind kind;
    const char* key;
    const char* claude_name;
};

const EventName kEventNames[] = {
    {HookEventKind::session_start,         "session_start",         "SessionStart"},
    {HookEventKind::session_end,           "session_end",           "SessionEnd"},
    {HookEventKind::user_prompt_submit,    "user_prompt_submit",    "UserPromptSubmit"},
    {HookEventKind::pre_tool_use,          "pre_tool_use",          "PreToolUse"},
    {HookEventKind::post_tool_use,         "post_tool_use",         "PostToolUse"},
    {HookEventKind::post_tool_use_failure, "post_tool_use_failure", "PostToolUseFailure"},
    {HookEventKind::stop,                  "stop",                  "Stop"},
    {HookEventKind::subagent_start,        "subagent_start",        "SubagentStart"},
    {HookEventKind::subagent_stop,         "subagent_stop",         "SubagentStop"},
    {HookEventKind::pre_compact,           "pre_compact",           "PreCompact"},
    {HookEventKind::permission_request,    "permission_request",    "PermissionRequest"},
    {HookEventKind::notification,          "notification",          "Notification"},
};

int permission_rank(Permission p) {
    switch (p) {
        case Permission::allow: return 0;
        case Permission::ask:   return 1;
        case Permission::deny:  return 2;
    }
    return 0;
}

std::optional<Permission> parse_permission(const std::string& s) {
    if (s == "allow" || s == "approve") return Permission::allow;
    if (s == "ask") return Permission::ask;
    if (s == "deny") return Permission::deny;
    return std::nullopt;
}

const char* status_name(HandlerStatus s) {
    switch (s) {
        case HandlerStatus::ok:                   return "ok";
        case HandlerStatus::blocking_failure:     return "blocking failure";
        case HandlerStatus::non_blocking_failure: return "non-blocking failure";
        case HandlerStatus::timed_out:            return "timed out";
    }
    return "unknown";
}

} // namespace

const char* hook_event_key(HookEventKind kind) {
    for (auto& e : kEventNames) {
        if (e.kind == kind) return e.key;
    }
    return "notification";
}

std::optional<HookEventKind> parse_hook_event(const std::string& s) {
    for (auto& e : kEventNames) {
        if (s == e.key || s == e.claude_name) return e.kind;
    }
    return std::nullopt;
}

const char* permission_name(Permission p) {
    switch (p) {
        case Permission::allow: return "allow";
        case Permission::ask:   return "ask";
        case Permission::deny:  return "deny";
    }
    return "allow";
}

// ── HookEvent ───────────────────────────────────────────────────────

HookEventKind HookEvent::kind() const {
    return std::visit([](const auto& p) { return std::decay_t<decltype(p)>::kind; }, payload);
}

std::string HookEvent::matcher_context() const {
    return std::visit([](const auto& p) -> std::string {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, PreToolUsePayload> || std::is_same_v<T, PostToolUsePayload> ||
                      std::is_same_v<T, PostToolUseFailurePayload> ||
                      std::is_same_v<T, PermissionRequestPayload>) {
            return p.tool_name;
        } else if constexpr (std::is_same_v<T, UserPromptSubmitPayload>) {
            return p.prompt;
        } else if constexpr (std::is_same_v<T, PreCompactPayload>) {
            return p.trigger;
        } else if constexpr (std::is_same_v<T, SessionStartPayload>) {
            return p.source;
        } else {
            return hook_event_key(T::kind);
        }
    }, payload);
}

json HookEvent::to_json() const {
    json j;
    j["session_id"] = session_id;
    j["cwd"] = cwd;
    j["permission_mode"] = permission_mode;
    j["hook_event_name"] = hook_event_key(kind());
    std::visit([&j](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, SessionStartPayload>) {
            j["source"] = p.source;
        } else if constexpr (std::is_same_v<T, SessionEndPayload> || std::is_same_v<T, StopPayload>) {
            j["reason"] = p.reason;
        } else if constexpr (std::is_same_v<T, UserPromptSubmitPayload>) {
            j["prompt"] = p.prompt;
        } else if constexpr (std::is_same_v<T, PreToolUsePayload> ||
                             std::is_same_v<T, PermissionRequestPayload>) {
            j["tool_name"] = p.tool_name;
            j["tool_input"] = p.tool_input;
        } else if constexpr (std::is_same_v<T, PostToolUsePayload>) {
            j["tool_name"] = p.tool_name;
            j["tool_input"] = p.tool_input;
            j["tool_response"] = p.tool_response;
        } else if constexpr (std::is_same_v<T, PostToolUseFailurePayload>) {
            j["tool_name"] = p.tool_name;
            j["tool_input"] = p.tool_input;
            j["error"] = p.error;
        } else if constexpr (std::is_same_v<T, SubagentStartPayload>) {
            j["agent_id"] = p.agent_id;
            j["agent_type"] = p.agent_type;
        } else if constexpr (std::is_same_v<T, SubagentStopPayload>) {
            j["agent_id"] = p.agent_id;
            j["reason"] = p.reason;
        } else if constexpr (std::is_same_v<T, PreCompactPayload>) {
            j["trigger"] = p.trigger;
            j["current_tokens"] = p.current_tokens;
            j["max_tokens"] = p.max_tokens;
        } else if constexpr (std::is_same_v<T, NotificationPayload>) {
            j["message"] = p.message;
        }
    }, payload);
    return j;
}

// ── HookDecision ────────────────────────────────────────────────────

HookDecision HookDecision::from_json(const json& j) {
    HookDecision d;
    if (!j.is_object()) return d;

    d.proceed = j.value("continue", true);
    d.suppress_output = j.value("suppressOutput", false);
    if (j.contains("systemMessage") && j["systemMessage"].is_string()) {
        d.system_message = j["systemMessage"].get<std::string>();
    }
    if (j.contains("stopReason") && j["stopReason"].is_string()) d.reason = j["stopReason"].get<std::string>();
    if (j.contains("reason") && j["reason"].is_string()) d.reason = j["reason"].get<std::string>();

    if (j.contains("decision") && j["decision"].is_string()) {
        std::string decision = j["decision"].get<std::string>();
        if (decision == "block") d.proceed = false;
        else d.permission = parse_permission(decision);
    }
    if (j.contains("permissionDecision") && j["permissionDecision"].is_string()) {
        d.permission = parse_permission(j["permissionDecision"].get<std::string>());
    }
    if (j.contains("updatedInput")) d.updated_input = j["updatedInput"];
    if (j.contains("prompt") && j["prompt"].is_string()) d.updated_input = j["prompt"];

    if (j.contains("hookSpecificOutput") && j["hookSpecificOutput"].is_object()) {
        auto& hso = j["hookSpecificOutput"];
        if (hso.contains("permissionDecision") && hso["permissionDecision"].is_string()) {
            d.permission = parse_permission(hso["permissionDecision"].get<std::string>());
        }
        if (hso.contains("permissionDecisionReason") && hso["permissionDecisionReason"].is_string()) {
            d.reason = hso["permissionDecisionReason"].get<std::string>();
        }
        if (hso.contains("updatedInput")) d.updated_input = hso["updatedInput"];
        if (!d.system_message && hso.contains("additionalContext") && hso["additionalContext"].is_string()) {
            d.system_message = hso["additionalContext"].get<std::string>();
        }
    }
    return d;
}

// ── Merge ───────────────────────────────────────────────────────────

HookResolution merge_outcomes(HookEventKind kind, const std::vector<NamedOutcome>& outcomes) {
    HookResolution res;
    bool permission_blocks = kind == HookEventKind::pre_tool_use || kind == HookEventKind::permission_request;

    auto block = [&res](const std::string& reason) {
        if (!res.blocked) {
            res.blocked = true;
            res.block_reason = reason;
        }
    };

    for (auto& [handler, outcome] : outcomes) {
        switch (outcome.status) {
            case HandlerStatus::timed_out:
                res.failures.push_back({handler, outcome.status,
                                        HookTimeoutError("handler timed out: " + handler).what()});
                continue;
            case HandlerStatus::non_blocking_failure:
                res.failures.push_back({handler, outcome.status, outcome.error});
                continue;
            case HandlerStatus::blocking_failure: {
                res.handlers_run++;
                std::string reason = !outcome.error.empty() ? outcome.error : outcome.decision.reason;
                block(reason.empty() ? "blocked by hook (" + handler + ")" : reason);
                continue;
            }
            case HandlerStatus::ok:
                break;
        }

        res.handlers_run++;
        const HookDecision& d = outcome.decision;
        if (!d.proceed) {
            block(d.reason.empty() ? "blocked by hook (" + handler + ")" : d.reason);
        }
        if (d.permission) {
            if (!res.permission || permission_rank(*d.permission) > permission_rank(*res.permission)) {
                res.permission = d.permission;
            }
            if (*d.permission == Permission::deny && permission_blocks) {
                block(d.reason.empty() ? "denied by hook (" + handler + ")" : d.reason);
            }
        }
        if (d.updated_input) {
            if (res.updated_input && *res.updated_input != *d.updated_input) {
                log_warn("hooks", "Conflicting input rewrites for " + std::string(hook_event_key(kind)) +
                         "; keeping the one from " + handler);
            }
            res.updated_input = d.updated_input;
        }
        if (d.system_message && !d.system_message->empty()) res.system_messages.push_back(*d.system_message);
        res.suppress_output = res.suppress_output || d.suppress_output;
    }
    return res;
}

// ── Engine ──────────────────────────────────────────────────────────

HookEngine HookEngine::from_config(const HooksConfig& cfg, PromptEvaluator evaluator) {
    HookEngine engine;
    for (auto& [key, entries] : cfg.events) {
        auto kind = parse_hook_event(key);
        if (!kind) throw ConfigurationError("Unknown hook event: " + key);
        for (auto& entry : entries) {
            HookMatcher m;
            m.pattern = entry.matcher;
            for (auto& h : entry.handlers) {
                if (h.type == "prompt") {
                    if (!evaluator) throw ConfigurationError("Prompt hook configured but no model is available");
                    int ms = h.timeout_ms > 0 ? h.timeout_ms : PromptHookHandler::kDefaultTimeoutMs;
                    m.handlers.push_back(std::make_shared<PromptHookHandler>(
                        h.prompt, std::chrono::milliseconds(ms), evaluator));
                } else {
                    if (h.command.empty()) throw ConfigurationError("Command hook without command for " + key);
                    int ms = h.timeout_ms > 0 ? h.timeout_ms : CommandHookHandler::kDefaultTimeoutMs;
                    m.handlers.push_back(std::make_shared<CommandHookHandler>(h.command, std::chrono::milliseconds(ms)));
                }
            }
            engine.register_matcher(*kind, std::move(m));
        }
    }
    return engine;
}

void HookEngine::register_matcher(HookEventKind kind, HookMatcher matcher) {
    if (!matcher.pattern.empty() && matcher.pattern != "*") {
        try {
            matcher.compiled = std::make_shared<const std::regex>(matcher.pattern);
        } catch (const std::regex_error& e) {
            matcher.invalid = true;
            log_warn("hooks", "Invalid matcher '" + matcher.pattern + "' for " + hook_event_key(kind) +
                     " will never match: " + e.what());
        }
    }
    matchers_[kind].push_back(std::move(matcher));
}

bool HookMatcher::applies(const std::string& context, bool whole) const {
    if (invalid) return false;
    if (!compiled) return true;
    return whole ? std::regex_match(context, *compiled) : std::regex_search(context, *compiled);
}

HookResolution HookEngine::dispatch(const HookEvent& event) const {
    auto it = matchers_.find(event.kind());
    if (it == matchers_.end()) return {};

    std::string context = event.matcher_context();
    bool whole = event.kind() != HookEventKind::user_prompt_submit;
    std::vector<std::shared_ptr<HookHandler>> handlers;
    for (auto& m : it->second) {
        if (!m.applies(context, whole)) continue;
        for (auto& h : m.handlers) handlers.push_back(h);
    }
    if (handlers.empty()) return {};

    std::string input = event.to_json().dump();
    auto start = std::chrono::steady_clock::now();

    std::vector<BoundedTask<HandlerOutcome>> tasks;
    tasks.reserve(handlers.size());
    for (auto& h : handlers) {
        tasks.emplace_back([h, event, input]() { return h->run(event, input); });
    }

    std::vector<NamedOutcome> outcomes;
    for (size_t i = 0; i < tasks.size(); i++) {
        auto& h = handlers[i];
        NamedOutcome named{h->describe(), {}};
        switch (tasks[i].wait_until(start + h->timeout() + kJoinGrace)) {
            case BoundedTask<HandlerOutcome>::Status::done:
                named.outcome = tasks[i].take();
                break;
            case BoundedTask<HandlerOutcome>::Status::failed:
                named.outcome.status = HandlerStatus::non_blocking_failure;
                named.outcome.error = HookCrash("handler crashed: " + tasks[i].error()).what();
                break;
            case BoundedTask<HandlerOutcome>::Status::timed_out:
                named.outcome.status = HandlerStatus::timed_out;
                break;
        }
        if (named.outcome.status != HandlerStatus::ok) {
            log_warn("hooks", std::string(hook_event_key(event.kind())) + " handler '" + named.handler +
                     "' " + status_name(named.outcome.status) +
                     (named.outcome.error.empty() ? "" : ": " + named.outcome.error));
        }
        outcomes.push_back(std::move(named));
    }

    HookResolution res = merge_outcomes(event.kind(), outcomes);
    if (res.blocked) {
        log_info("hooks", std::string(hook_event_key(event.kind())) + " blocked: " + res.block_reason);
    }
    return res;
}

bool HookEngine::has_hooks(HookEventKind kind) const {
    auto it = matchers_.find(kind);
    return it != matchers_.end() && !it->second.empty();
}

int HookEngine::hook_count() const {
    int count = 0;
    for (auto& [_, vec] : matchers_) {
        for (auto& m : vec) count += static_cast<int>(m.handlers.size());
    }
    return count;
}

} // namespace polygate
