#pragma once
#include "message.hpp"
#include "utils.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace polygate {

enum class TurnKind { verbatim, summary };
enum class SessionStatus { active, compacting, ended };

const char* session_status_name(SessionStatus status);

// One logical exchange: the Messages produced in response to one triggering event.
struct Turn {
    std::string id;
    TurnKind kind = TurnKind::verbatim;
    std::vector<Message> messages;
    int64_t created_at = 0;
    int estimated_size = 0;

    static Turn make(std::vector<Message> messages, TurnKind kind = TurnKind::verbatim);

    nlohmann::json to_json() const;
    static Turn from_json(const nlohmann::json& j);
};

struct Session {
    std::string id;
    int64_t created_at = 0;
    int64_t updated_at = 0;
    SessionStatus status = SessionStatus::active;
    std::vector<Turn> turns;
    std::vector<Turn> redo_stack;  // top is back()
    int budget = 0;                // sum of live turn estimates

    std::vector<Message> history() const;
    nlohmann::json to_json() const;
};

// Append-only JSONL file per session. Every record is flushed before returning.
class SessionJournal {
public:
    explicit SessionJournal(std::string dir);

    void append(const std::string& session_id, const nlohmann::json& record) const;
    std::vector<nlohmann::json> read(const std::string& session_id) const;
    bool exists(const std::string& session_id) const;
    void remove(const std::string& session_id) const;
    std::vector<std::string> list() const;

    std::string path_for(const std::string& session_id) const;

private:
    std::string dir_;
};

// Held for the whole of one exchange; keeps the session's mutex alive.
class ExchangeLock {
public:
    explicit ExchangeLock(std::shared_ptr<std::mutex> m) : mutex_(std::move(m)), lock_(*mutex_) {}

private:
    std::shared_ptr<std::mutex> mutex_;
    std::unique_lock<std::mutex> lock_;
};

class SessionManager {
public:
    SessionManager(std::string sessions_dir, int history_depth);

    // Empty id generates one. Throws Error if the id is taken or malformed.
    std::string create(const std::string& id = {});

    // Loads a journaled session (reactivating it if it had ended); false if there is none
    bool resume(const std::string& id);

    bool exists(const std::string& id) const;
    Session snapshot(const std::string& id) const;
    std::vector<std::string> list() const;

    ExchangeLock lock_exchange(const std::string& id);

    Turn append_turn(const std::string& id, Turn turn);
    // Drops a turn appended for an exchange that was then cancelled; not redoable.
    // redo_stack is the history the append discarded and is put back.
    void rollback_turn(const std::string& id, const std::string& turn_id,
                       const std::vector<Turn>& redo_stack = {});

    bool undo(const std::string& id);
    bool redo(const std::string& id);

    // Replaces turns [0, replaced) with summary
    void apply_compaction(const std::string& id, Turn summary, size_t replaced);

    void set_status(const std::string& id, SessionStatus status);
    void destroy(const std::string& id);

    int history_depth() const { return history_depth_; }

    static void validate_id(const std::string& id);

private:
    struct Slot {
        std::shared_ptr<std::mutex> exchange = std::make_shared<std::mutex>();
        std::mutex state;
        Session session;
    };

    std::shared_ptr<Slot> slot(const std::string& id) const;
    std::shared_ptr<Slot> load(const std::string& id) const;
    void commit(Slot& slot, nlohmann::json record);

    SessionJournal journal_;
    int history_depth_;
    mutable std::mutex mu_;
    mutable std::map<std::string, std::shared_ptr<Slot>> slots_;
};

// Applies one journal record; used both live and when replaying on resume
void apply_session_record(Session& session, const nlohmann::json& record, int history_depth);

} // namespace polygate
