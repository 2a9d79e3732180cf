#include "compaction.hpp"
#include "errors.hpp"

#include "../test_logger.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace {

using polygate::CompactionEngine;
using polygate::Message;
using polygate::Role;
using polygate::SessionManager;
using polygate::Turn;
using polygate::TurnKind;

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

std::filesystem::path UniqueDir() {
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
           ("polygate_compaction_test_" + std::to_string(static_cast<long long>(now)));
}

// One user message of `chars` bytes; 784 bytes estimates to 200 tokens, 1984 to 500
Turn SizedTurn(size_t chars) {
    return Turn::make({Message::text(Role::user, std::string(chars, 'w'))});
}

std::string WellFormedSummary() {
    std::string s;
    int n = 1;
    for (auto& section : polygate::summary_sections()) {
        s += std::to_string(n++) + ". " + section + ": ok\n";
    }
    return s;
}

polygate::CompactionConfig SmallWindow() {
    polygate::CompactionConfig cfg;
    cfg.context_limit = 1000;
    cfg.threshold = 1.0;
    return cfg;
}

void ScenarioThreeTurnsPlusFiveHundred(const std::filesystem::path& dir) {
    SessionManager sessions(dir.string(), 50);
    std::string id = sessions.create();
    for (int i = 0; i < 3; i++) sessions.append_turn(id, SizedTurn(784));
    Require(sessions.snapshot(id).budget == 600, "three turns of 200 should total 600");

    int calls = 0;
    CompactionEngine engine(SmallWindow(), [&calls](const std::string& instructions, const std::string& transcript, int) {
        calls++;
        Require(instructions.find("Verbatim User Messages") != std::string::npos, "instructions should list sections");
        Require(transcript.find("user: www") != std::string::npos, "transcript should carry the turns");
        return WellFormedSummary();
    });

    Turn incoming = SizedTurn(1984);
    Require(incoming.estimated_size == 500, "incoming turn should estimate to 500");
    Require(!engine.should_compact(sessions.snapshot(id), 400, "m"), "1000 is not over the limit");
    Require(engine.should_compact(sessions.snapshot(id), 500, "m"), "1100 is over the limit");

    auto result = engine.maybe_compact(sessions, id, incoming.estimated_size, "m");
    Require(result.compacted && calls == 1, "compaction should run once");
    Require(result.turns_replaced == 3, "all three turns should be replaced");
    Require(result.tokens_before == 600 && result.tokens_after < 600, "budget should shrink");

    sessions.append_turn(id, incoming);
    auto s = sessions.snapshot(id);
    Require(s.turns.size() == 2, "history should be one summary then the new turn");
    Require(s.turns[0].kind == TurnKind::summary, "first turn should be the summary");
    Require(s.turns[1].kind == TurnKind::verbatim && s.turns[1].estimated_size == 500,
            "second turn should be the incoming 500-token turn");
    Require(s.budget == s.turns[0].estimated_size + 500, "budget should reset to summary plus new turn");
    Require(s.status == polygate::SessionStatus::active, "session should be active after compaction");
}

void ScenarioRepeatedCompactionKeepsOneSummary(const std::filesystem::path& dir) {
    SessionManager sessions(dir.string(), 50);
    std::string id = sessions.create();
    CompactionEngine engine(SmallWindow(), [](const std::string&, const std::string&, int) {
        return WellFormedSummary();
    });

    for (int round = 0; round < 5; round++) {
        for (int i = 0; i < 2; i++) sessions.append_turn(id, SizedTurn(784));
        auto r = engine.compact(sessions, id, "m");
        Require(r.compacted, "round " + std::to_string(round) + " should compact");
        auto s = sessions.snapshot(id);
        int summaries = 0;
        for (size_t i = 0; i < s.turns.size(); i++) {
            if (s.turns[i].kind == TurnKind::summary) {
                summaries++;
                Require(i == 0, "summary must only appear first");
            }
        }
        Require(summaries == 1, "exactly one summary after each compaction");
    }

    auto again = engine.compact(sessions, id, "m");
    Require(!again.compacted && !again.deferred, "a lone summary is not compacted again");
}

void ScenarioPreserveRecentTurns(const std::filesystem::path& dir) {
    SessionManager sessions(dir.string(), 50);
    std::string id = sessions.create();
    for (int i = 0; i < 4; i++) {
        sessions.append_turn(id, Turn::make({Message::text(Role::user, "turn " + std::to_string(i))}));
    }
    polygate::CompactionConfig cfg = SmallWindow();
    cfg.preserve_recent_turns = 2;
    std::string seen;
    CompactionEngine engine(cfg, [&seen](const std::string&, const std::string& transcript, int) {
        seen = transcript;
        return WellFormedSummary();
    });
    auto r = engine.compact(sessions, id, "m");
    Require(r.compacted && r.turns_replaced == 2, "only the older two turns should be summarized");
    Require(seen.find("turn 1") != std::string::npos && seen.find("turn 2") == std::string::npos,
            "recent turns should not reach the summarizer");
    auto s = sessions.snapshot(id);
    Require(s.turns.size() == 3 && s.turns[2].messages[0].text() == "turn 3", "recent turns stay verbatim");
}

void ScenarioFailureDefersAndKeepsHistory(const std::filesystem::path& dir) {
    SessionManager sessions(dir.string(), 50);
    std::string id = sessions.create();
    for (int i = 0; i < 3; i++) sessions.append_turn(id, SizedTurn(784));
    auto before = sessions.snapshot(id);

    CompactionEngine throwing(SmallWindow(), [](const std::string&, const std::string&, int) -> std::string {
        throw polygate::UpstreamError("anthropic", 500, "internal");
    });
    auto r = throwing.maybe_compact(sessions, id, 500, "m");
    Require(!r.compacted && r.deferred, "a failed summary call should defer");

    CompactionEngine sloppy(SmallWindow(), [](const std::string&, const std::string&, int) {
        return std::string("Primary Request and Intent: stuff. Current Work: things.");
    });
    auto r2 = sloppy.maybe_compact(sessions, id, 500, "m");
    Require(r2.deferred && r2.reason.find("Pending Tasks") != std::string::npos,
            "a summary missing sections should be rejected and name what is missing");

    auto after = sessions.snapshot(id);
    Require(after.turns.size() == before.turns.size() && after.budget == before.budget,
            "history must be untouched after a deferred compaction");
    Require(after.status == polygate::SessionStatus::active, "status should return to active");
}

void ScenarioPreCompactHookBlocks(const std::filesystem::path& dir) {
    SessionManager sessions(dir.string(), 50);
    std::string id = sessions.create();
    for (int i = 0; i < 3; i++) sessions.append_turn(id, SizedTurn(784));

    auto hooks = std::make_shared<polygate::HookEngine>();
    hooks->register_matcher(polygate::HookEventKind::pre_compact, polygate::HookMatcher{"auto", {
        std::make_shared<polygate::CommandHookHandler>(
            "cat >/dev/null; echo 'export the transcript first' >&2; exit 2", std::chrono::milliseconds(5000)),
    }});
    int calls = 0;
    CompactionEngine engine(SmallWindow(), [&calls](const std::string&, const std::string&, int) {
        calls++;
        return WellFormedSummary();
    }, hooks);

    auto r = engine.maybe_compact(sessions, id, 500, "m");
    Require(r.deferred && calls == 0, "blocked pre_compact should skip the summary call");
    Require(r.reason.find("export the transcript first") != std::string::npos, "reason should carry the hook's message");
    Require(sessions.snapshot(id).turns.size() == 3, "history untouched");

    // manual trigger does not match the "auto" matcher
    auto manual = engine.compact(sessions, id, "m", "manual");
    Require(manual.compacted && calls == 1, "manual compaction should not be blocked by an auto-only hook");
}

void ScenarioContextWindows() {
    Require(polygate::context_window_for_model("claude-sonnet-4-20250514") == 200000, "claude window");
    Require(polygate::context_window_for_model("gemini-2.5-pro") == 1000000, "gemini window");
    Require(polygate::context_window_for_model("gpt-3.5-turbo") == 16385, "gpt-3.5 window");
    Require(polygate::context_window_for_model("mystery-model") == 128000, "default window");

    polygate::CompactionConfig cfg;
    CompactionEngine engine(cfg, nullptr);
    int trigger = engine.trigger_point("claude-opus");
    Require(trigger >= 169999 && trigger <= 170000, "default threshold is 85 percent");
}

} // namespace

int main() {
    try {
        polygate::tests::Log("compaction_test: start");
        const auto dir = UniqueDir();
        ScenarioThreeTurnsPlusFiveHundred(dir / "a");
        ScenarioRepeatedCompactionKeepsOneSummary(dir / "b");
        ScenarioPreserveRecentTurns(dir / "c");
        ScenarioFailureDefersAndKeepsHistory(dir / "d");
        ScenarioPreCompactHookBlocks(dir / "e");
        ScenarioContextWindows();

        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        polygate::tests::Log("compaction_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        polygate::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
