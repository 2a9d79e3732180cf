#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace polygate {

struct ThinkingConfig {
    bool enabled = false;
    int budget_tokens = 0;          // 0 = provider default
    std::string reasoning_effort;   // empty = provider default
    bool preserve_across_turns = false;
};

struct ProviderConfig {
    std::string kind;           // adapter identifier; defaults to the provider key
    std::string api_key;
    std::string api_base;       // empty = adapter default
    std::string default_model;
    std::map<std::string, std::string> headers;
    ThinkingConfig thinking;
    std::optional<bool> supports_thinking;  // overrides the adapter's capability
    int connect_timeout = 30;   // seconds
    int read_timeout = 300;     // seconds
};

struct GatewayConfig {
    std::string host = "127.0.0.1";
    int port = 18790;
    std::string api_key;       // Optional Bearer token auth
    int rate_limit_rpm = 0;    // 0 = unlimited
    int worker_threads = 8;
};

struct HookHandlerConfig {
    std::string type = "command";  // "command" | "prompt"
    std::string command;
    std::string prompt;
    int timeout_ms = 0;            // 0 = type default
};

struct HookEntryConfig {
    std::string matcher;
    std::vector<HookHandlerConfig> handlers;
};

struct HooksConfig {
    // event key -> ordered entries; keys are validated when the engine is built
    std::map<std::string, std::vector<HookEntryConfig>> events;
    bool load_claude_settings = true;
};

struct CompactionConfig {
    bool enabled = true;
    int context_limit = 0;          // 0 = derived from the model
    double threshold = 0.85;
    int preserve_recent_turns = 0;
    int summary_max_tokens = 4096;
};

struct SessionConfig {
    std::string dir;                // empty = <data_dir>/sessions
    int history_depth = 50;
    std::string permission_mode = "default";
};

struct MemoryConfig {
    bool enabled = true;
    std::string db_path;            // empty = <data_dir>/memory.db
    int max_results = 10;
    int core_block_max_chars = 4000;
    int recent_sessions = 3;
};

struct InjectorConfig {
    int source_timeout_ms = 1000;
    std::vector<std::string> rule_files = {"CLAUDE.md", "AGENTS.md"};
    std::string extension_rules_dir = ".polygate/rules";  // <ext>.md files, relative to the cwd
};

struct Config {
    std::string data_dir = "~/.polygate";
    std::string provider = "anthropic";  // default provider key
    std::string model;                   // empty = provider's default_model
    int max_tokens = 4096;
    std::string log_level = "info";

    GatewayConfig gateway;
    std::map<std::string, ProviderConfig> providers;
    HooksConfig hooks;
    CompactionConfig compaction;
    SessionConfig session;
    MemoryConfig memory;
    InjectorConfig injector;

    std::string data_path() const { return expand_path(data_dir); }
    std::string sessions_path() const {
        return session.dir.empty() ? data_path() + "/sessions" : expand_path(session.dir);
    }
    std::string memory_db_path() const {
        return memory.db_path.empty() ? data_path() + "/memory.db" : expand_path(memory.db_path);
    }

    // Throws ConfigurationError when the key is not configured
    const ProviderConfig& resolve_provider(const std::string& name) const;
    std::string model_for(const std::string& provider_name) const;

    static Config make_default();
    static Config load(const std::string& path);
    void save(const std::string& path) const;
    nlohmann::json to_json() const;
    static Config from_json(const nlohmann::json& j);
};

// Merges hook blocks written in the .claude/settings.json layout
// ({"hooks": {"PreToolUse": [{"matcher": "...", "hooks": [...]}]}}) into cfg.
void merge_claude_settings_hooks(HooksConfig& cfg, const nlohmann::json& settings);

} // namespace polygate
