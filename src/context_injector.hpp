#pragma once
#include "message.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace polygate {

class MemoryStore;

// Everything one exchange contributes to the outgoing message list
struct InjectionContext {
    std::string session_id;
    std::string cwd;
    std::vector<std::string> system;          // client-supplied system prompt text
    std::vector<Message> history;             // live turns, oldest first
    std::vector<Message> trigger;             // user message or tool results that started this exchange
    std::vector<std::string> hook_messages;   // system_message outputs of this exchange's hooks
};

struct InjectionResult {
    std::vector<Message> messages;
    std::vector<std::string> degraded_sources;
};

// ── Sources ─────────────────────────────────────────────────────────

// Always-on text for the first tier. fetch() may throw or stall; the injector bounds it.
class TextSource {
public:
    virtual ~TextSource() = default;
    virtual std::string name() const = 0;
    virtual std::vector<std::string> fetch(const InjectionContext& ctx) = 0;
};

// CLAUDE.md-style rule files, global directory first, then the working directory
class FileRulesSource : public TextSource {
public:
    FileRulesSource(std::vector<std::string> file_names, std::string global_dir);

    std::string name() const override { return "rules"; }
    std::vector<std::string> fetch(const InjectionContext& ctx) override;

private:
    std::vector<std::string> file_names_;
    std::string global_dir_;
};

// Rule files keyed by file extension: <dir>/<ext>.md applies when a message
// names a file with that extension. Global directory first, then the project's.
class ExtensionRulesSource : public TextSource {
public:
    ExtensionRulesSource(std::string project_dir, std::string global_dir);

    std::string name() const override { return "extension_rules"; }
    std::vector<std::string> fetch(const InjectionContext& ctx) override;

    // Lowercased, sorted, without duplicates
    static std::vector<std::string> extensions(const std::vector<Message>& messages);

private:
    std::string project_dir_;  // relative to the exchange's cwd
    std::string global_dir_;
};

// Core memory blocks, then recent session summaries
class MemorySource : public TextSource {
public:
    MemorySource(std::shared_ptr<MemoryStore> store, int recent_sessions);

    std::string name() const override { return "memory"; }
    std::vector<std::string> fetch(const InjectionContext& ctx) override;

private:
    std::shared_ptr<MemoryStore> store_;
    int recent_sessions_;
};

class AttachmentResolver {
public:
    virtual ~AttachmentResolver() = default;
    virtual std::string name() const = 0;
    // Segments placed before the triggering message
    virtual std::vector<Segment> resolve(const Message& trigger, const InjectionContext& ctx) = 0;
};

// Inlines text files named by @path mentions or file:// attachments
class FileMentionResolver : public AttachmentResolver {
public:
    static constexpr size_t kMaxFileBytes = 256 * 1024;

    std::string name() const override { return "file_mentions"; }
    std::vector<Segment> resolve(const Message& trigger, const InjectionContext& ctx) override;

    static std::vector<std::string> mentions(const std::string& text);
};

// ── Injector ────────────────────────────────────────────────────────

class ContextInjector {
public:
    explicit ContextInjector(std::chrono::milliseconds source_timeout = std::chrono::milliseconds(1000));

    void add_source(std::shared_ptr<TextSource> source);
    void add_resolver(std::shared_ptr<AttachmentResolver> resolver);

    // Tier 1: one system message (client system text, then each source in
    // registration order). Tier 2: history. Tier 3: attachments, hook
    // reminders, then the trigger. A failing or late source is skipped and
    // reported in degraded_sources.
    InjectionResult assemble(const InjectionContext& ctx) const;

    static std::string system_reminder(const std::vector<std::string>& messages);

    std::chrono::milliseconds source_timeout() const { return source_timeout_; }

private:
    std::chrono::milliseconds source_timeout_;
    std::vector<std::shared_ptr<TextSource>> sources_;
    std::vector<std::shared_ptr<AttachmentResolver>> resolvers_;
};

} // namespace polygate
