#pragma once
#include "cancel.hpp"
#include "compaction.hpp"
#include "config.hpp"
#include "context_injector.hpp"
#include "hooks.hpp"
#include "memory_store.hpp"
#include "message.hpp"
#include "session.hpp"
#include "providers/adapter.hpp"
#include "providers/adapter_registry.hpp"
#include "providers/upstream_client.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace polygate {

// Everything derived from one Config. Exchanges hold a snapshot for their whole duration.
struct Runtime {
    std::shared_ptr<const Config> config;
    std::map<std::string, std::shared_ptr<const ProviderAdapter>> adapters;  // by provider key
    std::shared_ptr<const HookEngine> hooks;
    std::shared_ptr<CompactionEngine> compaction;
    std::shared_ptr<ContextInjector> injector;

    // Throws ConfigurationError for a provider key that is not configured
    const ProviderAdapter& adapter(const std::string& provider) const;
};

struct ExchangeRequest {
    std::string session_id;   // empty starts a new session
    std::string provider;     // empty: "provider/model" prefix, then the configured default
    std::string cwd;
    CanonicalRequest request; // the client's full message list
};

struct BlockedToolCall {
    std::string id;
    std::string name;
    std::string reason;
};

struct ExchangeResult {
    std::string session_id;
    std::string provider;
    std::string model;
    bool blocked = false;            // user_prompt_submit veto; nothing was sent upstream
    std::string block_reason;
    CanonicalResponse response;
    std::vector<std::string> degradation_notes;
    std::vector<std::string> degraded_sources;
    std::vector<BlockedToolCall> blocked_tools;
    std::vector<std::string> hook_messages;  // from stop hooks, for the client
    bool compacted = false;
};

// Token counts reported by upstreams for one session, since this process started
struct SessionUsage {
    int64_t requests = 0;
    Usage total;
    Usage last;
};

using ToolExecutor = std::function<std::string(const std::string& name, const nlohmann::json& input)>;

struct ToolRunResult {
    bool executed = false;
    bool blocked = false;
    std::string reason;
    nlohmann::json input;
    std::string output;
    bool is_error = false;
    std::vector<std::string> hook_messages;
};

class Pipeline {
public:
    // Throws ConfigurationError for an unusable config
    explicit Pipeline(Config config, std::shared_ptr<Transport> transport = std::make_shared<UpstreamClient>(),
                      AdapterRegistry registry = AdapterRegistry::with_builtin_adapters());

    // One client round trip. on_text receives streamed text as it arrives.
    // Throws UpstreamError, TranslationError, ConfigurationError or Cancelled;
    // in each case the session is left as it was before the call.
    ExchangeResult exchange(ExchangeRequest req, const DeltaCallback& on_text = nullptr,
                            const CancelToken& cancel = CancelToken());

    // Creates the session or resumes its journal, firing session_start
    std::string start_session(const std::string& id = {}, const std::string& cwd = {});
    // Fires session_end, stores a summary for later sessions, marks the session ended
    void end_session(const std::string& id, const std::string& reason = "exit");

    // pre_tool_use gate, execution, then post_tool_use or post_tool_use_failure
    ToolRunResult run_tool(const std::string& session_id, const ToolCallSegment& call,
                           const ToolExecutor& executor, const std::string& cwd = {});

    CompactionResult compact(const std::string& session_id);
    bool undo(const std::string& session_id);
    bool redo(const std::string& session_id);
    void destroy(const std::string& session_id);

    std::map<std::string, SessionUsage> usage() const;

    // Builds a new runtime and swaps it in between exchanges; on error the old one stays
    void reload(Config next);

    std::shared_ptr<const Runtime> runtime() const { return std::atomic_load(&runtime_); }
    SessionManager& sessions() { return *sessions_; }
    std::shared_ptr<MemoryStore> memory() const { return memory_; }

private:
    std::shared_ptr<const Runtime> build_runtime(Config config) const;

    HookResolution fire(const Runtime& rt, HookPayload payload, const std::string& session_id,
                        const std::string& cwd) const;

    CanonicalResponse call_upstream(const ProviderAdapter& adapter, CanonicalRequest& request,
                                    const DeltaCallback& on_text, const CancelToken& cancel) const;

    // Drops tool calls a pre_tool_use hook vetoes and applies input rewrites
    Message gate_tool_calls(const Runtime& rt, const Message& msg, const std::string& session_id,
                            const std::string& cwd, std::vector<BlockedToolCall>& blocked) const;

    std::string ensure_session(const Runtime& rt, const std::string& id, const std::string& cwd);
    void record_usage(const std::string& session_id, const Usage& usage);

    AdapterRegistry registry_;
    std::shared_ptr<Transport> transport_;
    std::unique_ptr<SessionManager> sessions_;
    std::shared_ptr<MemoryStore> memory_;
    std::shared_ptr<const Runtime> runtime_;

    std::mutex live_mu_;
    std::set<std::string> live_;  // sessions that saw session_start in this process

    mutable std::mutex usage_mu_;
    std::map<std::string, SessionUsage> usage_;
};

Endpoint endpoint_for(const ProviderAdapter& adapter);

// Single non-streaming model call; used for summaries and prompt hooks
CanonicalResponse complete(const ProviderAdapter& adapter, Transport& transport, CanonicalRequest request);

} // namespace polygate
