#include "session.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <fstream>

namespace polygate {

using json = nlohmann::json;

const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::active:     return "active";
        case SessionStatus::compacting: return "compacting";
        case SessionStatus::ended:      return "ended";
    }
    return "active";
}

static SessionStatus parse_session_status(const std::string& s) {
    if (s == "compacting") return SessionStatus::compacting;
    if (s == "ended") return SessionStatus::ended;
    return SessionStatus::active;
}

// ── Turn ────────────────────────────────────────────────────────────

Turn Turn::make(std::vector<Message> messages, TurnKind kind) {
    Turn t;
    t.id = generate_id("turn");
    t.kind = kind;
    t.created_at = epoch_now();
    t.estimated_size = estimate_tokens(messages);
    t.messages = std::move(messages);
    return t;
}

json Turn::to_json() const {
    json j;
    j["id"] = id;
    j["kind"] = kind == TurnKind::summary ? "summary" : "verbatim";
    j["created_at"] = created_at;
    j["estimated_size"] = estimated_size;
    j["messages"] = json::array();
    for (auto& m : messages) j["messages"].push_back(m.to_json());
    return j;
}

Turn Turn::from_json(const json& j) {
    Turn t;
    t.id = j.value("id", "");
    t.kind = j.value("kind", "verbatim") == "summary" ? TurnKind::summary : TurnKind::verbatim;
    t.created_at = j.value("created_at", static_cast<int64_t>(0));
    t.estimated_size = j.value("estimated_size", 0);
    if (j.contains("messages")) {
        for (auto& m : j["messages"]) t.messages.push_back(Message::from_json(m));
    }
    return t;
}

// ── Session ─────────────────────────────────────────────────────────

std::vector<Message> Session::history() const {
    std::vector<Message> out;
    for (auto& t : turns) {
        out.insert(out.end(), t.messages.begin(), t.messages.end());
    }
    return out;
}

json Session::to_json() const {
    json turns_j = json::array();
    for (auto& t : turns) turns_j.push_back(t.to_json());
    return {
        {"id", id},
        {"status", session_status_name(status)},
        {"created_at", created_at},
        {"updated_at", updated_at},
        {"budget", budget},
        {"turn_count", turns.size()},
        {"redo_depth", redo_stack.size()},
        {"turns", turns_j}
    };
}

static void recompute_budget(Session& s) {
    s.budget = 0;
    for (auto& t : s.turns) s.budget += t.estimated_size;
}

void apply_session_record(Session& s, const json& record, int history_depth) {
    std::string op = record.value("op", "");
    int64_t ts = record.value("ts", epoch_now());

    if (op == "create") {
        s.id = record.value("id", s.id);
        s.created_at = ts;
        s.status = SessionStatus::active;
    } else if (op == "append") {
        s.turns.push_back(Turn::from_json(record.at("turn")));
        s.redo_stack.clear();
    } else if (op == "undo") {
        if (s.turns.empty() || s.turns.back().kind == TurnKind::summary) {
            throw Error("nothing to undo in session " + s.id);
        }
        if (static_cast<int>(s.redo_stack.size()) >= history_depth) {
            throw Error("undo depth exhausted in session " + s.id);
        }
        s.redo_stack.push_back(std::move(s.turns.back()));
        s.turns.pop_back();
    } else if (op == "redo") {
        if (s.redo_stack.empty()) throw Error("nothing to redo in session " + s.id);
        s.turns.push_back(std::move(s.redo_stack.back()));
        s.redo_stack.pop_back();
    } else if (op == "rollback") {
        std::string turn_id = record.value("turn_id", "");
        if (s.turns.empty() || s.turns.back().id != turn_id) {
            throw Error("rollback of turn " + turn_id + " that is not the tail");
        }
        s.turns.pop_back();
        // the append that is undone here also cleared the redo history
        if (record.contains("redo_stack")) {
            s.redo_stack.clear();
            for (auto& t : record["redo_stack"]) s.redo_stack.push_back(Turn::from_json(t));
        }
    } else if (op == "compact") {
        size_t replaced = record.value("replaced", static_cast<size_t>(0));
        if (replaced == 0 || replaced > s.turns.size()) throw Error("compaction range out of bounds");
        Turn summary = Turn::from_json(record.at("summary"));
        if (summary.kind != TurnKind::summary) throw Error("compaction record without a summary turn");
        std::vector<Turn> next;
        next.push_back(std::move(summary));
        for (size_t i = replaced; i < s.turns.size(); i++) {
            if (s.turns[i].kind == TurnKind::summary) throw Error("summary turn outside position 0");
            next.push_back(std::move(s.turns[i]));
        }
        s.turns = std::move(next);
        s.redo_stack.clear();
    } else if (op == "status") {
        s.status = parse_session_status(record.value("status", "active"));
    } else {
        throw Error("unknown journal record '" + op + "'");
    }
    s.updated_at = ts;
    recompute_budget(s);
}

// ── SessionJournal ──────────────────────────────────────────────────

SessionJournal::SessionJournal(std::string dir) : dir_(std::move(dir)) {
    fs::create_directories(dir_);
}

std::string SessionJournal::path_for(const std::string& session_id) const {
    return dir_ + "/" + session_id + ".jsonl";
}

void SessionJournal::append(const std::string& session_id, const json& record) const {
    std::ofstream f(path_for(session_id), std::ios::app);
    if (!f) throw Error("Cannot open journal for session " + session_id);
    f << record.dump() << "\n";
    f.flush();
    if (!f) throw Error("Failed to write journal for session " + session_id);
}

std::vector<json> SessionJournal::read(const std::string& session_id) const {
    std::vector<json> records;
    std::ifstream f(path_for(session_id));
    if (!f) return records;
    std::string line;
    int lineno = 0;
    while (std::getline(f, line)) {
        lineno++;
        if (line.empty()) continue;
        try {
            records.push_back(json::parse(line));
        } catch (const json::exception& e) {
            // a crash mid-write leaves at most one torn record at the tail
            log_warn("session", "Skipping corrupt journal line " + std::to_string(lineno) +
                     " of " + session_id + ": " + e.what());
        }
    }
    return records;
}

bool SessionJournal::exists(const std::string& session_id) const {
    return fs::exists(path_for(session_id));
}

void SessionJournal::remove(const std::string& session_id) const {
    std::error_code ec;
    fs::remove(path_for(session_id), ec);
    if (ec) throw Error("Cannot remove journal for " + session_id + ": " + ec.message());
}

std::vector<std::string> SessionJournal::list() const {
    std::vector<std::string> ids;
    std::error_code ec;
    for (auto& entry : fs::directory_iterator(dir_, ec)) {
        if (entry.path().extension() == ".jsonl") ids.push_back(entry.path().stem().string());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ── SessionManager ──────────────────────────────────────────────────

SessionManager::SessionManager(std::string sessions_dir, int history_depth)
    : journal_(std::move(sessions_dir)), history_depth_(history_depth > 0 ? history_depth : 1) {}

void SessionManager::validate_id(const std::string& id) {
    if (id.empty() || id.size() > 128 || id[0] == '.') throw Error("Invalid session id '" + id + "'");
    for (char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '-' || c == '_' || c == '.';
        if (!ok) throw Error("Invalid session id '" + id + "'");
    }
}

std::string SessionManager::create(const std::string& requested) {
    std::string id = requested.empty() ? generate_id("ses") : requested;
    validate_id(id);

    auto s = std::make_shared<Slot>();
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (slots_.count(id) || journal_.exists(id)) throw Error("Session " + id + " already exists");
        slots_[id] = s;
    }
    std::lock_guard<std::mutex> lock(s->state);
    try {
        commit(*s, {{"op", "create"}, {"id", id}});
    } catch (const Error&) {
        std::lock_guard<std::mutex> map_lock(mu_);
        slots_.erase(id);
        throw;
    }
    log_info("session", "Created " + id);
    return id;
}

std::shared_ptr<SessionManager::Slot> SessionManager::load(const std::string& id) const {
    auto records = journal_.read(id);
    if (records.empty()) return nullptr;

    auto s = std::make_shared<Slot>();
    s->session.id = id;
    for (auto& record : records) {
        try {
            apply_session_record(s->session, record, history_depth_);
        } catch (const std::exception& e) {
            log_warn("session", "Skipping journal record of " + id + ": " + e.what());
        }
    }
    return s;
}

std::shared_ptr<SessionManager::Slot> SessionManager::slot(const std::string& id) const {
    validate_id(id);
    std::lock_guard<std::mutex> lock(mu_);
    auto it = slots_.find(id);
    if (it != slots_.end()) return it->second;
    auto s = load(id);
    if (!s) throw Error("Unknown session " + id);
    slots_[id] = s;
    return s;
}

bool SessionManager::resume(const std::string& id) {
    if (!exists(id)) return false;
    auto s = slot(id);
    std::lock_guard<std::mutex> lock(s->state);
    if (s->session.status != SessionStatus::active) {
        commit(*s, {{"op", "status"}, {"status", "active"}});
    }
    log_info("session", "Resumed " + id + " (" + std::to_string(s->session.turns.size()) + " turns)");
    return true;
}

bool SessionManager::exists(const std::string& id) const {
    validate_id(id);
    std::lock_guard<std::mutex> lock(mu_);
    return slots_.count(id) > 0 || journal_.exists(id);
}

Session SessionManager::snapshot(const std::string& id) const {
    auto s = slot(id);
    std::lock_guard<std::mutex> lock(s->state);
    return s->session;
}

std::vector<std::string> SessionManager::list() const {
    std::vector<std::string> ids = journal_.list();
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& [id, _] : slots_) {
        if (!std::binary_search(ids.begin(), ids.end(), id)) ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

ExchangeLock SessionManager::lock_exchange(const std::string& id) {
    return ExchangeLock(slot(id)->exchange);
}

// Applies to a copy first so a rejected record leaves memory and journal untouched
void SessionManager::commit(Slot& s, json record) {
    record["ts"] = epoch_now();
    Session next = s.session;
    apply_session_record(next, record, history_depth_);
    journal_.append(next.id, record);
    s.session = std::move(next);
}

Turn SessionManager::append_turn(const std::string& id, Turn turn) {
    auto s = slot(id);
    std::lock_guard<std::mutex> lock(s->state);
    if (turn.kind == TurnKind::summary) throw Error("Summary turns are only written by compaction");
    commit(*s, {{"op", "append"}, {"turn", turn.to_json()}});
    return s->session.turns.back();
}

void SessionManager::rollback_turn(const std::string& id, const std::string& turn_id,
                                   const std::vector<Turn>& redo_stack) {
    auto s = slot(id);
    std::lock_guard<std::mutex> lock(s->state);
    json redo = json::array();
    for (auto& t : redo_stack) redo.push_back(t.to_json());
    commit(*s, {{"op", "rollback"}, {"turn_id", turn_id}, {"redo_stack", std::move(redo)}});
}

bool SessionManager::undo(const std::string& id) {
    auto s = slot(id);
    std::lock_guard<std::mutex> lock(s->state);
    auto& ses = s->session;
    if (ses.turns.empty() || ses.turns.back().kind == TurnKind::summary) return false;
    if (static_cast<int>(ses.redo_stack.size()) >= history_depth_) return false;
    commit(*s, {{"op", "undo"}});
    return true;
}

bool SessionManager::redo(const std::string& id) {
    auto s = slot(id);
    std::lock_guard<std::mutex> lock(s->state);
    if (s->session.redo_stack.empty()) return false;
    commit(*s, {{"op", "redo"}});
    return true;
}

void SessionManager::apply_compaction(const std::string& id, Turn summary, size_t replaced) {
    auto s = slot(id);
    std::lock_guard<std::mutex> lock(s->state);
    summary.kind = TurnKind::summary;
    commit(*s, {{"op", "compact"}, {"summary", summary.to_json()}, {"replaced", replaced}});
}

void SessionManager::set_status(const std::string& id, SessionStatus status) {
    auto s = slot(id);
    std::lock_guard<std::mutex> lock(s->state);
    if (s->session.status == status) return;
    commit(*s, {{"op", "status"}, {"status", session_status_name(status)}});
}

void SessionManager::destroy(const std::string& id) {
    auto s = slot(id);
    ExchangeLock in_flight(s->exchange);
    {
        std::lock_guard<std::mutex> lock(mu_);
        slots_.erase(id);
    }
    journal_.remove(id);
    log_info("session", "Destroyed " + id);
}

} // namespace polygate
