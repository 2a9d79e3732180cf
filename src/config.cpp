#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <fstream>
#include <cctype>

namespace polygate {

const ProviderConfig& Config::resolve_provider(const std::string& name) const {
    auto it = providers.find(name);
    if (it == providers.end()) {
        throw ConfigurationError("Provider '" + name + "' is not configured");
    }
    return it->second;
}

std::string Config::model_for(const std::string& provider_name) const {
    auto it = providers.find(provider_name);
    if (it != providers.end() && !it->second.default_model.empty() &&
        (model.empty() || provider_name != provider)) {
        return it->second.default_model;
    }
    return model;
}

Config Config::make_default() {
    Config c;
    ProviderConfig anthropic;
    anthropic.kind = "anthropic";
    anthropic.default_model = "claude-sonnet-4-20250514";
    c.providers["anthropic"] = anthropic;

    ProviderConfig openai;
    openai.kind = "openai";
    openai.default_model = "gpt-4o";
    c.providers["openai"] = openai;

    ProviderConfig local;
    local.kind = "openai-compatible";
    local.api_base = "http://127.0.0.1:8000/v1";
    c.providers["local"] = local;
    return c;
}

// ── Serialization ───────────────────────────────────────────────────

static nlohmann::json thinking_to_json(const ThinkingConfig& t) {
    nlohmann::json j = {{"enabled", t.enabled}};
    if (t.budget_tokens > 0) j["budget_tokens"] = t.budget_tokens;
    if (!t.reasoning_effort.empty()) j["reasoning_effort"] = t.reasoning_effort;
    if (t.preserve_across_turns) j["preserve_across_turns"] = true;
    return j;
}

nlohmann::json Config::to_json() const {
    nlohmann::json j;
    j["data_dir"] = data_dir;
    j["provider"] = provider;
    if (!model.empty()) j["model"] = model;
    j["max_tokens"] = max_tokens;
    j["log_level"] = log_level;

    j["gateway"] = {{"host", gateway.host}, {"port", gateway.port},
                    {"worker_threads", gateway.worker_threads}};
    if (!gateway.api_key.empty()) j["gateway"]["api_key"] = gateway.api_key;
    if (gateway.rate_limit_rpm > 0) j["gateway"]["rate_limit_rpm"] = gateway.rate_limit_rpm;

    for (auto& [k, v] : providers) {
        auto& p = j["providers"][k];
        p["kind"] = v.kind.empty() ? k : v.kind;
        if (!v.api_key.empty()) p["api_key"] = v.api_key;
        if (!v.api_base.empty()) p["api_base"] = v.api_base;
        if (!v.default_model.empty()) p["default_model"] = v.default_model;
        if (!v.headers.empty()) p["headers"] = v.headers;
        if (v.thinking.enabled) p["thinking"] = thinking_to_json(v.thinking);
        if (v.supports_thinking) p["supports_thinking"] = *v.supports_thinking;
        if (v.connect_timeout != 30) p["connect_timeout"] = v.connect_timeout;
        if (v.read_timeout != 300) p["read_timeout"] = v.read_timeout;
    }

    auto& hk = j["hooks"];
    hk["load_claude_settings"] = hooks.load_claude_settings;
    for (auto& [event, entries] : hooks.events) {
        auto& arr = hk["events"][event];
        for (auto& e : entries) {
            nlohmann::json entry;
            if (!e.matcher.empty()) entry["matcher"] = e.matcher;
            entry["handlers"] = nlohmann::json::array();
            for (auto& h : e.handlers) {
                nlohmann::json hj = {{"type", h.type}};
                if (!h.command.empty()) hj["command"] = h.command;
                if (!h.prompt.empty()) hj["prompt"] = h.prompt;
                if (h.timeout_ms > 0) hj["timeout_ms"] = h.timeout_ms;
                entry["handlers"].push_back(hj);
            }
            arr.push_back(entry);
        }
    }

    j["compaction"] = {{"enabled", compaction.enabled}, {"threshold", compaction.threshold},
                       {"preserve_recent_turns", compaction.preserve_recent_turns},
                       {"summary_max_tokens", compaction.summary_max_tokens}};
    if (compaction.context_limit > 0) j["compaction"]["context_limit"] = compaction.context_limit;

    j["session"] = {{"history_depth", session.history_depth},
                    {"permission_mode", session.permission_mode}};
    if (!session.dir.empty()) j["session"]["dir"] = session.dir;

    j["memory"] = {{"enabled", memory.enabled}, {"max_results", memory.max_results},
                   {"core_block_max_chars", memory.core_block_max_chars},
                   {"recent_sessions", memory.recent_sessions}};
    if (!memory.db_path.empty()) j["memory"]["db_path"] = memory.db_path;

    j["injector"] = {{"source_timeout_ms", injector.source_timeout_ms},
                     {"rule_files", injector.rule_files},
                     {"extension_rules_dir", injector.extension_rules_dir}};
    return j;
}

static std::vector<std::string> parse_string_array(const nlohmann::json& arr) {
    std::vector<std::string> result;
    if (arr.is_array()) {
        for (auto& item : arr) {
            if (item.is_string()) result.push_back(item.get<std::string>());
        }
    }
    return result;
}

static std::map<std::string, std::string> parse_string_map(const nlohmann::json& obj) {
    std::map<std::string, std::string> result;
    if (obj.is_object()) {
        for (auto& [k, v] : obj.items()) {
            if (v.is_string()) result[k] = v.get<std::string>();
        }
    }
    return result;
}

static HookHandlerConfig parse_handler(const nlohmann::json& h) {
    HookHandlerConfig hc;
    hc.type = h.value("type", "command");
    hc.command = h.value("command", "");
    hc.prompt = h.value("prompt", "");
    hc.timeout_ms = h.value("timeout_ms", 0);
    if (hc.type != "command" && hc.type != "prompt") {
        throw ConfigurationError("Unknown hook handler type: " + hc.type);
    }
    return hc;
}

Config Config::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigurationError("Config root must be a JSON object");
    Config c;
    try {
        c.data_dir = j.value("data_dir", c.data_dir);
        c.provider = j.value("provider", c.provider);
        c.model = j.value("model", c.model);
        c.max_tokens = j.value("max_tokens", c.max_tokens);
        c.log_level = j.value("log_level", c.log_level);

        if (j.contains("gateway")) {
            auto& g = j["gateway"];
            c.gateway.host = g.value("host", c.gateway.host);
            c.gateway.port = g.value("port", c.gateway.port);
            c.gateway.api_key = g.value("api_key", "");
            c.gateway.rate_limit_rpm = g.value("rate_limit_rpm", 0);
            c.gateway.worker_threads = g.value("worker_threads", c.gateway.worker_threads);
        }

        if (j.contains("providers")) {
            for (auto& [k, v] : j["providers"].items()) {
                ProviderConfig p;
                p.kind = v.value("kind", k);
                p.api_key = v.value("api_key", "");
                p.api_base = v.value("api_base", "");
                p.default_model = v.value("default_model", "");
                if (v.contains("headers")) p.headers = parse_string_map(v["headers"]);
                if (v.contains("thinking")) {
                    auto& t = v["thinking"];
                    p.thinking.enabled = t.value("enabled", false);
                    p.thinking.budget_tokens = t.value("budget_tokens", 0);
                    p.thinking.reasoning_effort = t.value("reasoning_effort", "");
                    p.thinking.preserve_across_turns = t.value("preserve_across_turns", false);
                }
                if (v.contains("supports_thinking")) p.supports_thinking = v["supports_thinking"].get<bool>();
                p.connect_timeout = v.value("connect_timeout", p.connect_timeout);
                p.read_timeout = v.value("read_timeout", p.read_timeout);
                c.providers[k] = std::move(p);
            }
        }

        if (j.contains("hooks")) {
            auto& hk = j["hooks"];
            c.hooks.load_claude_settings = hk.value("load_claude_settings", true);
            if (hk.contains("events")) {
                for (auto& [event, entries] : hk["events"].items()) {
                    auto& list = c.hooks.events[event];
                    for (auto& e : entries) {
                        HookEntryConfig entry;
                        entry.matcher = e.value("matcher", "");
                        if (e.contains("handlers")) {
                            for (auto& h : e["handlers"]) entry.handlers.push_back(parse_handler(h));
                        }
                        list.push_back(std::move(entry));
                    }
                }
            }
        }

        if (j.contains("compaction")) {
            auto& cp = j["compaction"];
            c.compaction.enabled = cp.value("enabled", true);
            c.compaction.context_limit = cp.value("context_limit", 0);
            c.compaction.threshold = cp.value("threshold", c.compaction.threshold);
            c.compaction.preserve_recent_turns = cp.value("preserve_recent_turns", 0);
            c.compaction.summary_max_tokens = cp.value("summary_max_tokens", c.compaction.summary_max_tokens);
            if (c.compaction.threshold <= 0.0 || c.compaction.threshold > 1.0) {
                throw ConfigurationError("compaction.threshold must be in (0, 1]");
            }
        }

        if (j.contains("session")) {
            auto& s = j["session"];
            c.session.dir = s.value("dir", "");
            c.session.history_depth = s.value("history_depth", c.session.history_depth);
            c.session.permission_mode = s.value("permission_mode", c.session.permission_mode);
        }

        if (j.contains("memory")) {
            auto& m = j["memory"];
            c.memory.enabled = m.value("enabled", true);
            c.memory.db_path = m.value("db_path", "");
            c.memory.max_results = m.value("max_results", c.memory.max_results);
            c.memory.core_block_max_chars = m.value("core_block_max_chars", c.memory.core_block_max_chars);
            c.memory.recent_sessions = m.value("recent_sessions", c.memory.recent_sessions);
        }

        if (j.contains("injector")) {
            auto& in = j["injector"];
            c.injector.source_timeout_ms = in.value("source_timeout_ms", c.injector.source_timeout_ms);
            if (in.contains("rule_files")) c.injector.rule_files = parse_string_array(in["rule_files"]);
            c.injector.extension_rules_dir = in.value("extension_rules_dir", c.injector.extension_rules_dir);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid config value: ") + e.what());
    }

    if (!c.provider.empty() && !c.providers.empty() && !c.providers.count(c.provider)) {
        throw ConfigurationError("Default provider '" + c.provider + "' is not configured");
    }
    return c;
}

// PreToolUse -> pre_tool_use
static std::string snake_case(const std::string& name) {
    std::string out;
    for (size_t i = 0; i < name.size(); i++) {
        char ch = name[i];
        if (std::isupper(static_cast<unsigned char>(ch))) {
            if (i > 0) out += '_';
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        } else {
            out += ch;
        }
    }
    return out;
}

void merge_claude_settings_hooks(HooksConfig& cfg, const nlohmann::json& settings) {
    if (!settings.contains("hooks") || !settings["hooks"].is_object()) return;
    for (auto& [event, entries] : settings["hooks"].items()) {
        if (!entries.is_array()) continue;
        auto& list = cfg.events[snake_case(event)];
        for (auto& e : entries) {
            HookEntryConfig entry;
            entry.matcher = e.value("matcher", "");
            if (e.contains("hooks")) {
                for (auto& h : e["hooks"]) {
                    HookHandlerConfig hc = parse_handler(h);
                    // settings.json timeouts are in seconds
                    if (h.contains("timeout")) hc.timeout_ms = h["timeout"].get<int>() * 1000;
                    entry.handlers.push_back(std::move(hc));
                }
            }
            list.push_back(std::move(entry));
        }
    }
}

static void merge_settings_file(HooksConfig& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f) return;
    try {
        merge_claude_settings_hooks(cfg, nlohmann::json::parse(f));
        log_info("config", "Loaded hooks from " + path);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Failed to parse " + path + ": " + e.what());
    }
}

Config Config::load(const std::string& path) {
    Config c;
    std::ifstream f(path);
    if (!f) {
        log_warn("config", "Config not found at " + path + ", using defaults");
        c = make_default();
    } else {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(f);
        } catch (const nlohmann::json::exception& e) {
            throw ConfigurationError("Failed to parse " + path + ": " + e.what());
        }
        c = from_json(j);
        if (c.providers.empty()) c.providers = make_default().providers;
    }

    if (c.hooks.load_claude_settings) {
        merge_settings_file(c.hooks, home_dir() + "/.claude/settings.json");
        merge_settings_file(c.hooks, current_dir() + "/.claude/settings.json");
    }
    return c;
}

void Config::save(const std::string& path) const {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream f(path);
    if (!f) throw Error("Cannot write config to " + path);
    f << to_json().dump(2) << std::endl;
}

} // namespace polygate
