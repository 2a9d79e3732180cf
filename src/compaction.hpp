#pragma once
#include "config.hpp"
#include "hooks.hpp"
#include "session.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace polygate {

// Context window in tokens by model family; 128k when unknown
int context_window_for_model(const std::string& model);

// The nine headings every summary must carry, in order
const std::vector<std::string>& summary_sections();

// (instructions, transcript, max_tokens) -> summary text; throws on a failed model call
using Summarizer = std::function<std::string(const std::string&, const std::string&, int)>;

struct CompactionResult {
    bool compacted = false;
    bool deferred = false;      // wanted to compact but could not
    std::string reason;
    int tokens_before = 0;
    int tokens_after = 0;
    size_t turns_replaced = 0;
};

class CompactionEngine {
public:
    CompactionEngine(CompactionConfig cfg, Summarizer summarizer,
                     std::shared_ptr<const HookEngine> hooks = nullptr);

    int context_limit_for(const std::string& model) const;
    // budget + incoming above this triggers compaction
    int trigger_point(const std::string& model) const;
    bool should_compact(const Session& session, int incoming, const std::string& model) const;

    CompactionResult maybe_compact(SessionManager& sessions, const std::string& session_id,
                                   int incoming, const std::string& model);

    // Summarizes every turn except the configured recent ones into one summary turn.
    // A blocked pre_compact hook or a CompactionFailure leaves history untouched.
    CompactionResult compact(SessionManager& sessions, const std::string& session_id,
                             const std::string& model, const std::string& trigger = "manual");

    static std::string render_transcript(const std::vector<Turn>& turns);
    static std::vector<std::string> missing_sections(const std::string& summary);
    static std::string instructions();

    const CompactionConfig& config() const { return cfg_; }

private:
    // Throws CompactionFailure
    std::string summarize(const std::vector<Turn>& turns) const;

    CompactionConfig cfg_;
    Summarizer summarizer_;
    std::shared_ptr<const HookEngine> hooks_;
};

} // namespace polygate
