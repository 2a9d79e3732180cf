#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace polygate {

// One version of an archival record. Versions of the same record share record_key.
struct MemoryRecord {
    int64_t id = 0;
    std::string record_key;
    int version = 1;
    std::string text;
    std::vector<std::string> tags;
    int64_t created_at = 0;
    std::optional<int64_t> superseded_by;
    double score = 0.0;  // search relevance, higher is better

    bool superseded() const { return superseded_by.has_value(); }
};

struct CoreMemoryBlock {
    std::string name;
    std::string value;
    int64_t updated_at = 0;
};

struct SessionSummary {
    std::string session_id;
    std::string summary;
    int64_t ended_at = 0;
};

struct MemoryStats {
    int archival_records = 0;   // every version
    int live_records = 0;       // not superseded
    int core_blocks = 0;
    int session_summaries = 0;
    bool fts_enabled = false;
};

class MemoryStore {
public:
    static constexpr int kSchemaVersion = 1;

    // Throws Error if the database cannot be opened or the schema cannot be created
    MemoryStore(const std::string& db_path, int max_results = 10, int core_block_max_chars = 4000);
    ~MemoryStore();

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    // ── Archival ────────────────────────────────────────────────────
    MemoryRecord save(const std::string& text, const std::vector<std::string>& tags = {});

    // Writes a new version and marks `id` superseded. Throws Error if `id` is
    // unknown or already superseded. Tags default to the previous version's.
    MemoryRecord update(int64_t id, const std::string& text,
                        const std::optional<std::vector<std::string>>& tags = std::nullopt);

    std::optional<MemoryRecord> get(int64_t id) const;
    // Every version of the record `id` belongs to, oldest first
    std::vector<MemoryRecord> history(int64_t id) const;

    // BM25-ranked, deduplicated by text, at most `limit` (0 means max_results).
    // Falls back to substring matching when FTS5 is unavailable or rejects the query.
    std::vector<MemoryRecord> search(const std::string& query, int limit = 0,
                                     bool include_superseded = false) const;

    // ── Core ────────────────────────────────────────────────────────
    // Whole-block replacement; throws MemoryCapacityError over the size limit
    void set_core(const std::string& name, const std::string& value);
    std::vector<CoreMemoryBlock> core_blocks() const;
    std::optional<CoreMemoryBlock> core_block(const std::string& name) const;

    // ── Recent sessions ─────────────────────────────────────────────
    void save_session_summary(const std::string& session_id, const std::string& summary);
    std::vector<SessionSummary> recent_sessions(int limit) const;

    MemoryStats stats() const;
    bool fts_enabled() const { return fts_enabled_; }
    int max_results() const { return max_results_; }
    int core_block_max_chars() const { return core_block_max_chars_; }

private:
    void init_tables();
    MemoryRecord insert_version(const std::string& key, int version, const std::string& text,
                                const std::vector<std::string>& tags);
    std::optional<MemoryRecord> get_locked(int64_t id) const;
    std::vector<MemoryRecord> search_fts(const std::string& match, int limit, bool include_superseded) const;
    std::vector<MemoryRecord> search_like(const std::vector<std::string>& terms, int limit,
                                          bool include_superseded) const;

    sqlite3* db_ = nullptr;
    bool fts_enabled_ = false;
    int max_results_;
    int core_block_max_chars_;
    mutable std::mutex mu_;
};

// "<core_memory>\n<name>\nvalue\n</name>\n...</core_memory>"; empty blocks are skipped
std::string format_core_memory(const std::vector<CoreMemoryBlock>& blocks);

// "<recent_sessions>" block, newest first; empty when there are none
std::string format_recent_sessions(const std::vector<SessionSummary>& sessions);

} // namespace polygate
