#include "compaction.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <sstream>

namespace polygate {

int context_window_for_model(const std::string& model) {
    std::string m = to_lower(model);
    if (m.find("claude") != std::string::npos || m.find("opus") != std::string::npos ||
        m.find("sonnet") != std::string::npos || m.find("haiku") != std::string::npos) {
        return 200000;
    }
    if (m.find("gemini") != std::string::npos) return 1000000;
    if (m.find("gpt-3.5") != std::string::npos) return 16385;
    if (m.find("gpt-4") != std::string::npos || m.find("o1") != std::string::npos ||
        m.find("o3") != std::string::npos) {
        return 128000;
    }
    return 128000;
}

const std::vector<std::string>& summary_sections() {
    static const std::vector<std::string> sections = {
        "Primary Request and Intent",
        "Key Technical Concepts",
        "Files and Code Sections",
        "Errors and Fixes",
        "Problem Solving",
        "Verbatim User Messages",
        "Pending Tasks",
        "Current Work",
        "Optional Next Step",
    };
    return sections;
}

std::string CompactionEngine::instructions() {
    std::ostringstream ss;
    ss << "Your task is to create a detailed summary of the conversation so far. It replaces the "
          "conversation, so it must preserve every technical detail, decision and open thread needed "
          "to continue the work without loss of context.\n\n"
          "Write exactly these numbered sections, using these headings:\n";
    int n = 1;
    for (auto& s : summary_sections()) ss << n++ << ". " << s << "\n";
    ss << "\nUnder \"Verbatim User Messages\" list every message the user wrote, word for word. "
          "Under \"Optional Next Step\" name only a step that directly continues the most recent work.";
    return ss.str();
}

std::string CompactionEngine::render_transcript(const std::vector<Turn>& turns) {
    std::ostringstream ss;
    for (auto& t : turns) {
        if (t.kind == TurnKind::summary) ss << "[Summary of earlier conversation]\n";
        for (auto& m : t.messages) {
            for (auto& seg : m.content()) {
                if (auto* text = std::get_if<TextSegment>(&seg)) {
                    ss << role_name(m.role()) << ": " << text->text << "\n";
                } else if (auto* tc = std::get_if<ToolCallSegment>(&seg)) {
                    ss << role_name(m.role()) << " called tool " << tc->name << " with "
                       << tc->input.dump() << "\n";
                } else if (auto* tr = std::get_if<ToolResultSegment>(&seg)) {
                    ss << "tool result" << (tr->is_error ? " (error)" : "") << ": " << tr->content << "\n";
                } else if (auto* a = std::get_if<AttachmentSegment>(&seg)) {
                    ss << role_name(m.role()) << " attached " << (a->label.empty() ? a->uri : a->label) << "\n";
                }
            }
        }
        ss << "\n";
    }
    return ss.str();
}

std::vector<std::string> CompactionEngine::missing_sections(const std::string& summary) {
    std::string haystack = to_lower(summary);
    std::vector<std::string> missing;
    for (auto& s : summary_sections()) {
        if (haystack.find(to_lower(s)) == std::string::npos) missing.push_back(s);
    }
    return missing;
}

CompactionEngine::CompactionEngine(CompactionConfig cfg, Summarizer summarizer,
                                   std::shared_ptr<const HookEngine> hooks)
    : cfg_(std::move(cfg)), summarizer_(std::move(summarizer)), hooks_(std::move(hooks)) {}

int CompactionEngine::context_limit_for(const std::string& model) const {
    return cfg_.context_limit > 0 ? cfg_.context_limit : context_window_for_model(model);
}

int CompactionEngine::trigger_point(const std::string& model) const {
    return static_cast<int>(context_limit_for(model) * cfg_.threshold);
}

bool CompactionEngine::should_compact(const Session& session, int incoming, const std::string& model) const {
    return cfg_.enabled && session.budget + incoming > trigger_point(model);
}

CompactionResult CompactionEngine::maybe_compact(SessionManager& sessions, const std::string& session_id,
                                                 int incoming, const std::string& model) {
    Session snap = sessions.snapshot(session_id);
    if (!should_compact(snap, incoming, model)) {
        CompactionResult r;
        r.tokens_before = r.tokens_after = snap.budget;
        return r;
    }
    log_info("compaction", session_id + ": " + std::to_string(snap.budget) + " + " +
             std::to_string(incoming) + " tokens exceeds " + std::to_string(trigger_point(model)));
    return compact(sessions, session_id, model, "auto");
}

std::string CompactionEngine::summarize(const std::vector<Turn>& turns) const {
    if (!summarizer_) throw CompactionFailure("no summarizer configured");
    std::string summary;
    try {
        summary = summarizer_(instructions(), render_transcript(turns), cfg_.summary_max_tokens);
    } catch (const std::exception& e) {
        throw CompactionFailure(std::string("summary call failed: ") + e.what());
    }
    auto missing = missing_sections(summary);
    if (!missing.empty()) {
        std::string names;
        for (auto& m : missing) names += (names.empty() ? "" : ", ") + m;
        throw CompactionFailure("summary is missing sections: " + names);
    }
    return summary;
}

CompactionResult CompactionEngine::compact(SessionManager& sessions, const std::string& session_id,
                                           const std::string& model, const std::string& trigger) {
    CompactionResult result;
    Session snap = sessions.snapshot(session_id);
    result.tokens_before = result.tokens_after = snap.budget;

    size_t preserve = static_cast<size_t>(std::max(cfg_.preserve_recent_turns, 0));
    if (snap.turns.size() <= preserve) {
        result.reason = "nothing to compact";
        return result;
    }
    size_t replaced = snap.turns.size() - preserve;
    if (replaced == 1 && snap.turns[0].kind == TurnKind::summary) {
        result.reason = "history is already a single summary";
        return result;
    }

    if (hooks_ && hooks_->has_hooks(HookEventKind::pre_compact)) {
        HookEvent event;
        event.payload = PreCompactPayload{trigger, snap.budget, context_limit_for(model)};
        event.session_id = session_id;
        event.cwd = current_dir();
        auto res = hooks_->dispatch(event);
        if (res.blocked) {
            result.deferred = true;
            result.reason = "pre_compact hook blocked: " + res.block_reason;
            log_info("compaction", session_id + " deferred, " + result.reason);
            return result;
        }
    }

    std::vector<Turn> prefix(snap.turns.begin(), snap.turns.begin() + static_cast<long>(replaced));
    sessions.set_status(session_id, SessionStatus::compacting);
    std::string summary;
    try {
        summary = summarize(prefix);
    } catch (const CompactionFailure& e) {
        sessions.set_status(session_id, SessionStatus::active);
        result.deferred = true;
        result.reason = e.what();
        log_warn("compaction", session_id + " deferred: " + result.reason);
        return result;
    }

    Message text = Message::text(Role::user,
        "This session continues an earlier conversation that was compacted. Summary of it:\n\n" + summary);
    try {
        sessions.apply_compaction(session_id, Turn::make({text}, TurnKind::summary), replaced);
    } catch (const Error&) {
        sessions.set_status(session_id, SessionStatus::active);
        throw;
    }
    sessions.set_status(session_id, SessionStatus::active);

    result.compacted = true;
    result.turns_replaced = replaced;
    result.tokens_after = sessions.snapshot(session_id).budget;
    log_info("compaction", session_id + ": " + std::to_string(replaced) + " turns, " +
             std::to_string(result.tokens_before) + " -> " + std::to_string(result.tokens_after) + " tokens");
    return result;
}

} // namespace polygate
