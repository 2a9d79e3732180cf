#include "status.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "hooks.hpp"
#include "memory_store.hpp"
#include "session.hpp"
#include "providers/adapter_registry.hpp"
#include <iostream>

namespace polygate {

// Writes a default config and creates the data directories; an existing config is left alone
int cmd_init(const std::string& config_path) {
    Config cfg;
    std::error_code ec;
    if (fs::exists(config_path, ec)) {
        cfg = Config::load(config_path);
        std::cout << "[init] Config already exists: " << config_path << "\n";
    } else {
        cfg = Config::make_default();
        cfg.save(config_path);
        std::cout << "[init] Created config: " << config_path << "\n";
    }

    for (auto& dir : {cfg.data_path(), cfg.sessions_path()}) {
        fs::create_directories(dir, ec);
        if (ec) throw Error("Cannot create " + dir + ": " + ec.message());
    }
    std::cout << "[init] Data dir: " << cfg.data_path() << "\n";

    if (cfg.memory.enabled) {
        MemoryStore store(cfg.memory_db_path(), cfg.memory.max_results, cfg.memory.core_block_max_chars);
        std::cout << "[init] Memory: " << cfg.memory_db_path()
                  << (store.fts_enabled() ? "" : " (FTS5 unavailable, using LIKE search)") << "\n";
    }

    std::cout << "\nAdd API keys under \"providers\" in " << config_path
              << ", then run 'polygate gateway'.\n";
    return 0;
}

int cmd_status(const std::string& config_path) {
    Config cfg = Config::load(config_path);

    std::cout << "=== polygate status ===\n";
    std::cout << "Config path  : " << config_path << "\n";
    std::cout << "Data dir     : " << cfg.data_path() << "\n";
    std::cout << "Listen       : " << cfg.gateway.host << ":" << cfg.gateway.port << "\n";
    std::cout << "Provider     : " << cfg.provider;
    std::string model = cfg.model_for(cfg.provider);
    if (!model.empty()) std::cout << " / " << model;
    std::cout << "\n";

    // Providers, with the adapter each resolves to
    auto registry = AdapterRegistry::with_builtin_adapters();
    std::cout << "Providers    :\n";
    for (auto& [name, p] : cfg.providers) {
        std::string kind = p.kind.empty() ? name : p.kind;
        std::cout << "  " << name;
        try {
            auto adapter = registry.create(kind, p);
            auto caps = adapter->effective_capabilities();
            std::cout << " [" << adapter->name() << "] "
                      << (p.api_base.empty() ? adapter->default_base_url() : p.api_base);
            if (caps.thinking) std::cout << " (thinking)";
            if (p.api_key.empty()) std::cout << " (no API key)";
        } catch (const ConfigurationError&) {
            std::cout << " [unknown adapter: " << kind << "]";
        }
        std::cout << "\n";
    }

    // Security
    if (!cfg.gateway.api_key.empty()) std::cout << "HTTP Auth    : Bearer token enabled\n";
    if (cfg.gateway.rate_limit_rpm > 0) {
        std::cout << "Rate Limit   : " << cfg.gateway.rate_limit_rpm << " req/min\n";
    }

    // Hooks
    try {
        auto engine = HookEngine::from_config(cfg.hooks, [](const std::string&, const std::string&) {
            return std::string();
        });
        std::cout << "Hooks        : " << engine.hook_count() << " handler(s)\n";
        for (auto& [event, entries] : cfg.hooks.events) {
            std::cout << "  " << event << ": " << entries.size() << " matcher(s)\n";
        }
    } catch (const ConfigurationError& e) {
        std::cout << "Hooks        : invalid (" << e.what() << ")\n";
    }

    std::cout << "Compaction   : " << (cfg.compaction.enabled ? "on" : "off")
              << ", threshold " << cfg.compaction.threshold;
    if (cfg.compaction.context_limit > 0) std::cout << " of " << cfg.compaction.context_limit << " tokens";
    std::cout << "\n";

    SessionJournal journal(cfg.sessions_path());
    std::cout << "Sessions     : " << journal.list().size() << " in " << cfg.sessions_path() << "\n";

    if (!cfg.memory.enabled) {
        std::cout << "Memory       : disabled\n";
        return 0;
    }
    try {
        MemoryStore store(cfg.memory_db_path(), cfg.memory.max_results, cfg.memory.core_block_max_chars);
        auto s = store.stats();
        std::cout << "Memory       : " << s.live_records << " live / " << s.archival_records
                  << " archival record(s), " << s.core_blocks << " core block(s), "
                  << s.session_summaries << " session summar" << (s.session_summaries == 1 ? "y" : "ies")
                  << (s.fts_enabled ? "" : ", FTS5 unavailable") << "\n";
    } catch (const std::exception& e) {
        std::cout << "Memory       : (error reading: " << e.what() << ")\n";
    }
    return 0;
}

// ── Sessions command ────────────────────────────────────────────────

int cmd_sessions(const std::string& config_path, const std::string& subcmd, const std::string& arg) {
    Config cfg = Config::load(config_path);
    SessionManager sessions(cfg.sessions_path(), cfg.session.history_depth);

    if (subcmd == "list" || subcmd.empty()) {
        auto ids = sessions.list();
        if (ids.empty()) {
            std::cout << "No sessions found.\n";
            return 0;
        }
        for (auto& id : ids) {
            Session s = sessions.snapshot(id);
            std::cout << "  " << id << "  " << session_status_name(s.status) << "  " << s.turns.size()
                      << " turn(s), ~" << s.budget << " tokens\n";
        }
        return 0;
    }

    if (subcmd == "show" && !arg.empty()) {
        if (!sessions.exists(arg)) {
            std::cout << "No session " << arg << "\n";
            return 1;
        }
        Session s = sessions.snapshot(arg);
        int n = 0;
        for (auto& t : s.turns) {
            std::cout << "[" << ++n << "]" << (t.kind == TurnKind::summary ? " (summary)" : "") << "\n";
            for (auto& m : t.messages) {
                std::string text = m.text();
                if (text.size() > 200) text = text.substr(0, 200) + "...";
                std::cout << "  " << role_name(m.role()) << ": " << text;
                for (auto& c : m.tool_calls()) std::cout << " <" << c.name << ">";
                std::cout << "\n";
            }
        }
        return 0;
    }

    if (subcmd == "delete" && !arg.empty()) {
        if (!sessions.exists(arg)) {
            std::cout << "No session " << arg << "\n";
            return 1;
        }
        sessions.destroy(arg);
        std::cout << "Deleted " << arg << "\n";
        return 0;
    }

    std::cout << "Usage: polygate sessions [list | show <id> | delete <id>]\n";
    return 1;
}

} // namespace polygate
