#include "memory_store.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <set>
#include <nlohmann/json.hpp>

namespace polygate {

using json = nlohmann::json;

namespace {

// Owns one prepared statement; throws Error on prepare or step failure
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt_);
            throw Error("sqlite prepare failed: " + msg);
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind_text(int idx, const std::string& v) {
        sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        return *this;
    }
    Statement& bind_int64(int idx, int64_t v) {
        sqlite3_bind_int64(stmt_, idx, v);
        return *this;
    }

    // true while rows remain
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw Error(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
    }

    std::string text(int col) const {
        auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return p ? std::string(p, static_cast<size_t>(sqlite3_column_bytes(stmt_, col))) : std::string();
    }
    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    double real(int col) const { return sqlite3_column_double(stmt_, col); }
    bool is_null(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db);
        if (err) sqlite3_free(err);
        throw Error("sqlite: " + msg);
    }
}

// Rolls back unless commit() was reached
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN IMMEDIATE"); }
    ~Transaction() {
        if (committed_) return;
        char* err = nullptr;
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
            log_error("memory", std::string("rollback failed: ") + (err ? err : "unknown"));
        }
        if (err) sqlite3_free(err);
    }
    void commit() {
        exec(db_, "COMMIT");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

const char* kRecordColumns =
    "m.id, m.record_key, m.version, m.text, m.tags, m.created_at, m.superseded_by";

MemoryRecord read_record(const Statement& st) {
    MemoryRecord r;
    r.id = st.int64(0);
    r.record_key = st.text(1);
    r.version = static_cast<int>(st.int64(2));
    r.text = st.text(3);
    json tags = json::parse(st.text(4), nullptr, false);
    if (tags.is_array()) {
        for (auto& t : tags) {
            if (t.is_string()) r.tags.push_back(t.get<std::string>());
        }
    }
    r.created_at = st.int64(5);
    if (!st.is_null(6)) r.superseded_by = st.int64(6);
    return r;
}

// Word characters, with UTF-8 bytes kept whole
std::vector<std::string> query_terms(const std::string& query) {
    std::vector<std::string> terms;
    std::string cur;
    for (unsigned char c : query) {
        if (std::isalnum(c) || c >= 0x80 || c == '_') {
            cur += static_cast<char>(c);
        } else if (!cur.empty()) {
            terms.push_back(std::move(cur));
            cur.clear();
        }
    }
    if (!cur.empty()) terms.push_back(std::move(cur));
    return terms;
}

std::string fts_match(const std::vector<std::string>& terms, const char* op) {
    std::string out;
    for (auto& t : terms) {
        if (!out.empty()) out += op;
        out += "\"" + t + "\"";
    }
    return out;
}

std::string like_pattern(const std::string& term) {
    std::string out = "%";
    for (char c : term) {
        if (c == '%' || c == '_' || c == '\\') out += '\\';
        out += c;
    }
    return out + "%";
}

std::vector<std::string> default_core_blocks() {
    return {"persona", "project", "preferences"};
}

} // namespace

// ── Setup ───────────────────────────────────────────────────────────

MemoryStore::MemoryStore(const std::string& db_path, int max_results, int core_block_max_chars)
    : max_results_(max_results > 0 ? max_results : 10)
    , core_block_max_chars_(core_block_max_chars) {
    auto parent = fs::path(db_path).parent_path();
    if (!parent.empty()) fs::create_directories(parent);

    int rc = sqlite3_open_v2(db_path.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw Error("Failed to open memory database " + db_path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);

    try {
        init_tables();
    } catch (const Error&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

MemoryStore::~MemoryStore() {
    if (db_) sqlite3_close(db_);
}

void MemoryStore::init_tables() {
    exec(db_, R"SQL(
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS archival_memory (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            record_key TEXT NOT NULL,
            version INTEGER NOT NULL,
            text TEXT NOT NULL,
            tags TEXT NOT NULL DEFAULT '[]',
            created_at INTEGER NOT NULL,
            superseded_by INTEGER
        );

        CREATE INDEX IF NOT EXISTS archival_memory_key ON archival_memory(record_key, version);

        CREATE TABLE IF NOT EXISTS core_memory (
            name TEXT PRIMARY KEY,
            value TEXT NOT NULL,
            updated_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS recent_sessions (
            session_id TEXT PRIMARY KEY,
            summary TEXT NOT NULL,
            ended_at INTEGER NOT NULL
        );
    )SQL");

    {
        Statement st(db_, "SELECT MAX(version) FROM schema_version");
        st.step();
        if (st.is_null(0)) {
            Statement ins(db_, "INSERT INTO schema_version (version) VALUES (?)");
            ins.bind_int64(1, kSchemaVersion).step();
        } else if (st.int64(0) > kSchemaVersion) {
            throw Error("Memory database schema version " + std::to_string(st.int64(0)) +
                        " is newer than supported version " + std::to_string(kSchemaVersion));
        }
    }

    for (auto& name : default_core_blocks()) {
        Statement st(db_, "INSERT OR IGNORE INTO core_memory (name, value, updated_at) VALUES (?, '', ?)");
        st.bind_text(1, name).bind_int64(2, epoch_now()).step();
    }

    // Archived text is never edited in place, so an insert trigger keeps the index current
    try {
        exec(db_, R"SQL(
            CREATE VIRTUAL TABLE IF NOT EXISTS archival_fts USING fts5(
                text, content='archival_memory', content_rowid='id'
            );

            CREATE TRIGGER IF NOT EXISTS archival_memory_ai AFTER INSERT ON archival_memory BEGIN
                INSERT INTO archival_fts(rowid, text) VALUES (new.id, new.text);
            END;
        )SQL");
        fts_enabled_ = true;
    } catch (const Error& e) {
        log_warn("memory", std::string("FTS5 unavailable, search uses substring matching: ") + e.what());
        fts_enabled_ = false;
    }
}

// ── Archival ────────────────────────────────────────────────────────

MemoryRecord MemoryStore::insert_version(const std::string& key, int version, const std::string& text,
                                         const std::vector<std::string>& tags) {
    MemoryRecord r;
    r.record_key = key;
    r.version = version;
    r.text = text;
    r.tags = tags;
    r.created_at = epoch_now();

    Statement st(db_, "INSERT INTO archival_memory (record_key, version, text, tags, created_at) "
                      "VALUES (?, ?, ?, ?, ?)");
    st.bind_text(1, key).bind_int64(2, version).bind_text(3, text)
      .bind_text(4, json(tags).dump()).bind_int64(5, r.created_at);
    st.step();
    r.id = sqlite3_last_insert_rowid(db_);
    return r;
}

MemoryRecord MemoryStore::save(const std::string& text, const std::vector<std::string>& tags) {
    if (trim(text).empty()) throw Error("Refusing to save an empty memory record");
    std::lock_guard<std::mutex> lock(mu_);
    return insert_version(generate_id("mem"), 1, text, tags);
}

MemoryRecord MemoryStore::update(int64_t id, const std::string& text,
                                 const std::optional<std::vector<std::string>>& tags) {
    if (trim(text).empty()) throw Error("Refusing to save an empty memory record");
    std::lock_guard<std::mutex> lock(mu_);
    Transaction tx(db_);

    auto old = get_locked(id);
    if (!old) throw Error("No memory record with id " + std::to_string(id));
    if (old->superseded()) {
        throw Error("Memory record " + std::to_string(id) + " was superseded by " +
                    std::to_string(*old->superseded_by));
    }

    MemoryRecord next = insert_version(old->record_key, old->version + 1, text, tags ? *tags : old->tags);
    Statement st(db_, "UPDATE archival_memory SET superseded_by = ? WHERE id = ?");
    st.bind_int64(1, next.id).bind_int64(2, id).step();

    tx.commit();
    return next;
}

std::optional<MemoryRecord> MemoryStore::get_locked(int64_t id) const {
    Statement st(db_, std::string("SELECT ") + kRecordColumns + " FROM archival_memory m WHERE m.id = ?");
    st.bind_int64(1, id);
    if (!st.step()) return std::nullopt;
    return read_record(st);
}

std::optional<MemoryRecord> MemoryStore::get(int64_t id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return get_locked(id);
}

std::vector<MemoryRecord> MemoryStore::history(int64_t id) const {
    std::lock_guard<std::mutex> lock(mu_);
    Statement st(db_, std::string("SELECT ") + kRecordColumns +
                      " FROM archival_memory m WHERE m.record_key ="
                      " (SELECT record_key FROM archival_memory WHERE id = ?) ORDER BY m.version");
    st.bind_int64(1, id);
    std::vector<MemoryRecord> out;
    while (st.step()) out.push_back(read_record(st));
    return out;
}

std::vector<MemoryRecord> MemoryStore::search_fts(const std::string& match, int limit,
                                                  bool include_superseded) const {
    std::string sql = std::string("SELECT ") + kRecordColumns + ", bm25(archival_fts) AS rank"
        " FROM archival_fts JOIN archival_memory m ON m.id = archival_fts.rowid"
        " WHERE archival_fts MATCH ?";
    if (!include_superseded) sql += " AND m.superseded_by IS NULL";
    sql += " ORDER BY rank LIMIT ?";

    Statement st(db_, sql);
    st.bind_text(1, match).bind_int64(2, limit);
    std::vector<MemoryRecord> out;
    while (st.step()) {
        MemoryRecord r = read_record(st);
        r.score = -st.real(7);  // bm25 is lower-is-better
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<MemoryRecord> MemoryStore::search_like(const std::vector<std::string>& terms, int limit,
                                                   bool include_superseded) const {
    std::string sql = std::string("SELECT ") + kRecordColumns + " FROM archival_memory m WHERE (";
    for (size_t i = 0; i < terms.size(); ++i) {
        if (i) sql += " OR ";
        sql += "m.text LIKE ? ESCAPE '\\'";
    }
    sql += ")";
    if (!include_superseded) sql += " AND m.superseded_by IS NULL";
    sql += " ORDER BY m.created_at DESC, m.id DESC";

    Statement st(db_, sql);
    for (size_t i = 0; i < terms.size(); ++i) st.bind_text(static_cast<int>(i + 1), like_pattern(terms[i]));

    std::vector<MemoryRecord> out;
    while (st.step()) {
        MemoryRecord r = read_record(st);
        std::string lower = to_lower(r.text);
        for (auto& t : terms) {
            if (lower.find(to_lower(t)) != std::string::npos) r.score += 1.0;
        }
        out.push_back(std::move(r));
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const MemoryRecord& a, const MemoryRecord& b) { return a.score > b.score; });
    if (static_cast<int>(out.size()) > limit) out.resize(static_cast<size_t>(limit));
    return out;
}

std::vector<MemoryRecord> MemoryStore::search(const std::string& query, int limit,
                                              bool include_superseded) const {
    if (limit <= 0) limit = max_results_;
    auto terms = query_terms(query);
    if (terms.empty()) return {};

    // Headroom for rows dropped as duplicates
    int fetch = limit * 3;
    std::vector<MemoryRecord> ranked;

    std::lock_guard<std::mutex> lock(mu_);
    bool fts_ok = fts_enabled_;
    if (fts_ok) {
        try {
            ranked = search_fts(fts_match(terms, " "), fetch, include_superseded);
            if (static_cast<int>(ranked.size()) < fetch && terms.size() > 1) {
                auto loose = search_fts(fts_match(terms, " OR "), fetch, include_superseded);
                ranked.insert(ranked.end(), loose.begin(), loose.end());
            }
        } catch (const Error& e) {
            log_warn("memory", std::string("FTS query failed, using substring match: ") + e.what());
            fts_ok = false;
        }
    }
    if (!fts_ok) ranked = search_like(terms, fetch, include_superseded);

    std::vector<MemoryRecord> out;
    std::set<int64_t> seen_ids;
    std::set<std::string> seen_text;
    for (auto& r : ranked) {
        if (!seen_ids.insert(r.id).second) continue;
        if (!seen_text.insert(trim(r.text)).second) continue;
        out.push_back(std::move(r));
        if (static_cast<int>(out.size()) >= limit) break;
    }
    return out;
}

// ── Core ────────────────────────────────────────────────────────────

void MemoryStore::set_core(const std::string& name, const std::string& value) {
    if (trim(name).empty()) throw Error("Core memory block name is empty");
    size_t chars = utf8_length(value);
    if (chars > static_cast<size_t>(core_block_max_chars_)) {
        throw MemoryCapacityError(name, chars, static_cast<size_t>(core_block_max_chars_));
    }
    std::lock_guard<std::mutex> lock(mu_);
    Statement st(db_, "INSERT OR REPLACE INTO core_memory (name, value, updated_at) VALUES (?, ?, ?)");
    st.bind_text(1, name).bind_text(2, value).bind_int64(3, epoch_now()).step();
}

std::vector<CoreMemoryBlock> MemoryStore::core_blocks() const {
    std::lock_guard<std::mutex> lock(mu_);
    Statement st(db_, "SELECT name, value, updated_at FROM core_memory ORDER BY "
                      "CASE name WHEN 'persona' THEN 0 WHEN 'project' THEN 1 "
                      "WHEN 'preferences' THEN 2 ELSE 3 END, name");
    std::vector<CoreMemoryBlock> out;
    while (st.step()) out.push_back({st.text(0), st.text(1), st.int64(2)});
    return out;
}

std::optional<CoreMemoryBlock> MemoryStore::core_block(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    Statement st(db_, "SELECT name, value, updated_at FROM core_memory WHERE name = ?");
    st.bind_text(1, name);
    if (!st.step()) return std::nullopt;
    return CoreMemoryBlock{st.text(0), st.text(1), st.int64(2)};
}

// ── Recent sessions ─────────────────────────────────────────────────

void MemoryStore::save_session_summary(const std::string& session_id, const std::string& summary) {
    std::lock_guard<std::mutex> lock(mu_);
    Statement st(db_, "INSERT OR REPLACE INTO recent_sessions (session_id, summary, ended_at) VALUES (?, ?, ?)");
    st.bind_text(1, session_id).bind_text(2, summary).bind_int64(3, epoch_now()).step();
}

std::vector<SessionSummary> MemoryStore::recent_sessions(int limit) const {
    std::lock_guard<std::mutex> lock(mu_);
    Statement st(db_, "SELECT session_id, summary, ended_at FROM recent_sessions "
                      "ORDER BY ended_at DESC, rowid DESC LIMIT ?");
    st.bind_int64(1, limit);
    std::vector<SessionSummary> out;
    while (st.step()) out.push_back({st.text(0), st.text(1), st.int64(2)});
    return out;
}

MemoryStats MemoryStore::stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    MemoryStats s;
    auto count = [this](const char* sql) {
        Statement st(db_, sql);
        st.step();
        return static_cast<int>(st.int64(0));
    };
    s.archival_records = count("SELECT COUNT(*) FROM archival_memory");
    s.live_records = count("SELECT COUNT(*) FROM archival_memory WHERE superseded_by IS NULL");
    s.core_blocks = count("SELECT COUNT(*) FROM core_memory WHERE value != ''");
    s.session_summaries = count("SELECT COUNT(*) FROM recent_sessions");
    s.fts_enabled = fts_enabled_;
    return s;
}

// ── Rendering ───────────────────────────────────────────────────────

std::string format_core_memory(const std::vector<CoreMemoryBlock>& blocks) {
    std::string body;
    for (auto& b : blocks) {
        if (trim(b.value).empty()) continue;
        body += "<" + b.name + ">\n" + b.value + "\n</" + b.name + ">\n";
    }
    if (body.empty()) return {};
    return "<core_memory>\n" + body + "</core_memory>";
}

std::string format_recent_sessions(const std::vector<SessionSummary>& sessions) {
    if (sessions.empty()) return {};
    std::string out = "<recent_sessions>\n";
    for (auto& s : sessions) {
        out += "<session id=\"" + s.session_id + "\">\n" + s.summary + "\n</session>\n";
    }
    return out + "</recent_sessions>";
}

} // namespace polygate
