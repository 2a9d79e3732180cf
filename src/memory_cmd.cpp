#include "memory_cmd.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "memory_store.hpp"
#include <iostream>

namespace polygate {

namespace {

void print_record(const MemoryRecord& r) {
    std::cout << "id=" << r.id << " v" << r.version;
    if (!r.tags.empty()) {
        std::cout << " tags=";
        for (size_t i = 0; i < r.tags.size(); i++) std::cout << (i ? "," : "") << r.tags[i];
    }
    if (r.superseded_by) std::cout << " superseded_by=" << *r.superseded_by;
    std::cout << "\n  " << r.text << "\n";
}

} // namespace

int cmd_memory(const std::string& config_path, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Usage: polygate memory <search|core|history|stats> [args]\n";
        return 1;
    }

    Config cfg = Config::load(config_path);
    if (!cfg.memory.enabled) {
        std::cerr << "Memory is disabled in " << config_path << "\n";
        return 1;
    }
    MemoryStore store(cfg.memory_db_path(), cfg.memory.max_results, cfg.memory.core_block_max_chars);

    std::string subcmd = args[0];

    if (subcmd == "search") {
        std::string query;
        for (size_t i = 1; i < args.size(); i++) query += (i > 1 ? " " : "") + args[i];
        if (query.empty()) {
            std::cerr << "Usage: polygate memory search <query>\n";
            return 1;
        }
        auto results = store.search(query);
        if (results.empty()) {
            std::cout << "No matches.\n";
            return 0;
        }
        for (auto& r : results) print_record(r);
        return 0;
    }
    else if (subcmd == "core") {
        if (args.size() == 1) {
            for (auto& b : store.core_blocks()) {
                std::cout << "<" << b.name << "> (" << b.value.size() << " chars)\n";
                if (!b.value.empty()) std::cout << b.value << "\n";
            }
            return 0;
        }
        if (args.size() == 2) {
            auto block = store.core_block(args[1]);
            if (!block) {
                std::cerr << "No core block: " << args[1] << "\n";
                return 1;
            }
            std::cout << block->value << "\n";
            return 0;
        }
        try {
            store.set_core(args[1], args[2]);
        } catch (const MemoryCapacityError& e) {
            std::cerr << e.what() << "\n";
            return 1;
        }
        std::cout << "Updated core block: " << args[1] << "\n";
        return 0;
    }
    else if (subcmd == "history") {
        if (args.size() < 2) {
            std::cerr << "Usage: polygate memory history <record_id>\n";
            return 1;
        }
        auto versions = store.history(std::stoll(args[1]));
        if (versions.empty()) {
            std::cerr << "Record not found: id=" << args[1] << "\n";
            return 1;
        }
        for (auto& r : versions) print_record(r);
        return 0;
    }
    else if (subcmd == "stats") {
        auto s = store.stats();
        std::cout << "Database      : " << cfg.memory_db_path() << "\n";
        std::cout << "Archival      : " << s.live_records << " live, " << s.archival_records << " total\n";
        std::cout << "Core blocks   : " << s.core_blocks << "\n";
        std::cout << "Session notes : " << s.session_summaries << "\n";
        std::cout << "Full-text     : " << (s.fts_enabled ? "FTS5" : "substring fallback") << "\n";
        return 0;
    }

    std::cerr << "Unknown memory subcommand: " << subcmd << "\n";
    return 1;
}

} // namespace polygate
