#include "context_injector.hpp"
#include "bounded_task.hpp"
#include "log.hpp"
#include "memory_store.hpp"
#include "utils.hpp"
#include <cctype>
#include <fstream>
#include <regex>
#include <set>

namespace polygate {

using Clock = std::chrono::steady_clock;

namespace {

std::string read_capped(const fs::path& p, size_t cap) {
    std::ifstream f(p, std::ios::binary);
    if (!f) return {};
    std::string out(cap, '\0');
    f.read(&out[0], static_cast<std::streamsize>(cap));
    out.resize(static_cast<size_t>(f.gcount()));
    return out;
}

bool is_text_media(const std::string& media_type) {
    return media_type.empty() || media_type.rfind("text/", 0) == 0 ||
           media_type == "application/json" || media_type == "application/xml";
}

std::string file_block(const fs::path& p, size_t cap) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) return {};
    auto size = fs::file_size(p, ec);
    std::string body = read_capped(p, cap);
    std::string block = "<file path=\"" + p.string() + "\">\n" + body;
    if (!ec && size > cap) block += "\n[truncated at " + std::to_string(cap) + " bytes]";
    return block + "\n</file>";
}

} // namespace

// ── Rules ───────────────────────────────────────────────────────────

FileRulesSource::FileRulesSource(std::vector<std::string> file_names, std::string global_dir)
    : file_names_(std::move(file_names)), global_dir_(expand_path(global_dir)) {}

std::vector<std::string> FileRulesSource::fetch(const InjectionContext& ctx) {
    std::vector<fs::path> dirs;
    if (!global_dir_.empty()) dirs.emplace_back(global_dir_);
    fs::path project = ctx.cwd.empty() ? current_dir() : ctx.cwd;
    std::error_code ec;
    if (dirs.empty() || fs::weakly_canonical(project, ec) != fs::weakly_canonical(dirs.front(), ec)) {
        dirs.push_back(project);
    }

    std::vector<std::string> out;
    for (auto& dir : dirs) {
        for (auto& name : file_names_) {
            fs::path p = dir / name;
            if (!fs::is_regular_file(p, ec)) continue;
            std::string text = trim(read_file(p.string()));
            if (!text.empty()) out.push_back("Contents of " + p.string() + ":\n\n" + text);
        }
    }
    return out;
}

// ── Extension rules ─────────────────────────────────────────────────

ExtensionRulesSource::ExtensionRulesSource(std::string project_dir, std::string global_dir)
    : project_dir_(std::move(project_dir)), global_dir_(expand_path(global_dir)) {}

std::vector<std::string> ExtensionRulesSource::extensions(const std::vector<Message>& messages) {
    static const std::regex kPathWithExtension(R"([\w/\\.-]+\.([a-zA-Z0-9]{1,10})\b)");
    std::set<std::string> found;
    for (auto& m : messages) {
        std::string text = m.text();
        for (std::sregex_iterator it(text.begin(), text.end(), kPathWithExtension), end; it != end; ++it) {
            found.insert(to_lower((*it)[1].str()));
        }
    }
    return {found.begin(), found.end()};
}

std::vector<std::string> ExtensionRulesSource::fetch(const InjectionContext& ctx) {
    std::vector<Message> messages = ctx.history;
    messages.insert(messages.end(), ctx.trigger.begin(), ctx.trigger.end());
    std::vector<std::string> exts = extensions(messages);
    if (exts.empty()) return {};

    std::vector<fs::path> dirs;
    if (!global_dir_.empty()) dirs.emplace_back(global_dir_);
    if (!project_dir_.empty()) {
        fs::path project = expand_path(project_dir_);
        if (project.is_relative()) project = fs::path(ctx.cwd.empty() ? current_dir() : ctx.cwd) / project;
        std::error_code ec;
        if (dirs.empty() || fs::weakly_canonical(project, ec) != fs::weakly_canonical(dirs.front(), ec)) {
            dirs.push_back(project);
        }
    }

    std::vector<std::string> out;
    std::error_code ec;
    for (auto& ext : exts) {
        for (auto& dir : dirs) {
            fs::path p = dir / (ext + ".md");
            if (!fs::is_regular_file(p, ec)) continue;
            std::string text = trim(read_file(p.string()));
            if (!text.empty()) out.push_back("Rules for ." + ext + " files (" + p.string() + "):\n\n" + text);
        }
    }
    return out;
}

// ── Memory ──────────────────────────────────────────────────────────

MemorySource::MemorySource(std::shared_ptr<MemoryStore> store, int recent_sessions)
    : store_(std::move(store)), recent_sessions_(recent_sessions) {}

std::vector<std::string> MemorySource::fetch(const InjectionContext&) {
    std::vector<std::string> out;
    std::string core = format_core_memory(store_->core_blocks());
    if (!core.empty()) out.push_back(std::move(core));
    if (recent_sessions_ > 0) {
        std::string recent = format_recent_sessions(store_->recent_sessions(recent_sessions_));
        if (!recent.empty()) out.push_back(std::move(recent));
    }
    return out;
}

// ── File mentions ───────────────────────────────────────────────────

std::vector<std::string> FileMentionResolver::mentions(const std::string& text) {
    std::vector<std::string> out;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '@') continue;
        if (i > 0 && !std::isspace(static_cast<unsigned char>(text[i - 1]))) continue;  // e-mail addresses
        size_t start = i + 1;
        if (start < text.size() && text[start] == '"') {
            size_t end = text.find('"', start + 1);
            if (end == std::string::npos) break;
            if (end > start + 1) out.push_back(text.substr(start + 1, end - start - 1));
            i = end;
            continue;
        }
        size_t end = start;
        while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) ++end;
        std::string path = text.substr(start, end - start);
        while (!path.empty() && (path.back() == ',' || path.back() == '.' || path.back() == ')' ||
                                 path.back() == ':' || path.back() == ';')) {
            path.pop_back();
        }
        if (!path.empty()) out.push_back(path);
        i = end;
    }
    return out;
}

std::vector<Segment> FileMentionResolver::resolve(const Message& trigger, const InjectionContext& ctx) {
    fs::path base = ctx.cwd.empty() ? current_dir() : ctx.cwd;
    std::vector<Segment> out;
    std::vector<std::string> seen;

    auto add = [&](const std::string& raw) {
        fs::path p = expand_path(raw);
        if (p.is_relative()) p = base / p;
        std::string key = p.lexically_normal().string();
        for (auto& s : seen) {
            if (s == key) return;
        }
        seen.push_back(key);
        std::string block = file_block(p, kMaxFileBytes);
        if (block.empty()) {
            log_debug("injector", "Mentioned file not found: " + key);
            return;
        }
        out.push_back(TextSegment{std::move(block)});
    };

    for (auto& m : mentions(trigger.text())) add(m);
    for (auto& a : trigger.attachments()) {
        if (a.uri.rfind("file://", 0) == 0 && is_text_media(a.media_type)) add(a.uri.substr(7));
    }
    return out;
}

// ── Injector ────────────────────────────────────────────────────────

ContextInjector::ContextInjector(std::chrono::milliseconds source_timeout)
    : source_timeout_(source_timeout) {}

void ContextInjector::add_source(std::shared_ptr<TextSource> source) {
    sources_.push_back(std::move(source));
}

void ContextInjector::add_resolver(std::shared_ptr<AttachmentResolver> resolver) {
    resolvers_.push_back(std::move(resolver));
}

std::string ContextInjector::system_reminder(const std::vector<std::string>& messages) {
    std::string body;
    for (auto& m : messages) {
        if (trim(m).empty()) continue;
        if (!body.empty()) body += "\n\n";
        body += m;
    }
    if (body.empty()) return {};
    return "<system-reminder>\n" + body + "\n</system-reminder>";
}

InjectionResult ContextInjector::assemble(const InjectionContext& ctx) const {
    InjectionResult result;

    // Tasks outlive a timed-out wait, so they get their own copy without the history
    auto shared = std::make_shared<InjectionContext>(ctx);
    shared->history.clear();

    const Message* user_trigger = nullptr;
    for (auto& m : ctx.trigger) {
        if (m.role() == Role::user) user_trigger = &m;
    }

    auto start = Clock::now();
    std::vector<BoundedTask<std::vector<std::string>>> source_tasks;
    for (auto& src : sources_) {
        source_tasks.emplace_back([src, shared] { return src->fetch(*shared); });
    }
    std::vector<BoundedTask<std::vector<Segment>>> resolver_tasks;
    if (user_trigger) {
        auto trigger = std::make_shared<Message>(*user_trigger);
        for (auto& r : resolvers_) {
            resolver_tasks.emplace_back([r, shared, trigger] { return r->resolve(*trigger, *shared); });
        }
    }
    auto deadline = start + source_timeout_;

    auto degraded = [&result](const std::string& name, const std::string& why) {
        log_warn("injector", "Source '" + name + "' skipped: " + why);
        result.degraded_sources.push_back(name);
    };

    // Tier 1
    std::vector<std::string> system_text;
    for (auto& s : ctx.system) {
        if (!trim(s).empty()) system_text.push_back(s);
    }
    for (size_t i = 0; i < source_tasks.size(); ++i) {
        auto status = source_tasks[i].wait_until(deadline);
        if (status == BoundedTask<std::vector<std::string>>::Status::timed_out) {
            degraded(sources_[i]->name(), "timed out after " + std::to_string(source_timeout_.count()) + " ms");
        } else if (status == BoundedTask<std::vector<std::string>>::Status::failed) {
            degraded(sources_[i]->name(), source_tasks[i].error());
        } else {
            for (auto& text : source_tasks[i].take()) {
                if (!trim(text).empty()) system_text.push_back(std::move(text));
            }
        }
    }
    if (!system_text.empty()) {
        std::string joined;
        for (auto& t : system_text) {
            if (!joined.empty()) joined += "\n\n";
            joined += t;
        }
        result.messages.push_back(Message::text(Role::system, joined));
    }

    // Tier 2
    result.messages.insert(result.messages.end(), ctx.history.begin(), ctx.history.end());

    // Tier 3
    std::vector<Segment> prelude;
    for (size_t i = 0; i < resolver_tasks.size(); ++i) {
        auto status = resolver_tasks[i].wait_until(deadline);
        if (status == BoundedTask<std::vector<Segment>>::Status::timed_out) {
            degraded(resolvers_[i]->name(), "timed out after " + std::to_string(source_timeout_.count()) + " ms");
        } else if (status == BoundedTask<std::vector<Segment>>::Status::failed) {
            degraded(resolvers_[i]->name(), resolver_tasks[i].error());
        } else {
            for (auto& seg : resolver_tasks[i].take()) prelude.push_back(std::move(seg));
        }
    }
    std::string reminder = system_reminder(ctx.hook_messages);
    if (!reminder.empty()) prelude.push_back(TextSegment{reminder});

    if (prelude.empty()) {
        result.messages.insert(result.messages.end(), ctx.trigger.begin(), ctx.trigger.end());
        return result;
    }

    if (user_trigger) {
        // Prelude goes inside the user message, ahead of what the user wrote
        for (auto& m : ctx.trigger) {
            if (&m != user_trigger) {
                result.messages.push_back(m);
                continue;
            }
            std::vector<Segment> merged = prelude;
            merged.insert(merged.end(), m.content().begin(), m.content().end());
            result.messages.emplace_back(Role::user, std::move(merged), m.id());
        }
    } else {
        // Tool results must directly follow the calls they answer
        result.messages.insert(result.messages.end(), ctx.trigger.begin(), ctx.trigger.end());
        result.messages.emplace_back(Role::user, std::move(prelude));
    }
    return result;
}

} // namespace polygate
