#include "pipeline.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace polygate {

using json = nlohmann::json;

namespace {

// Text segments replaced by `text`; attachments and other segments kept in place
Message rewrite_prompt(const Message& msg, const std::string& text) {
    std::vector<Segment> segs;
    bool placed = false;
    for (auto& seg : msg.content()) {
        if (std::holds_alternative<TextSegment>(seg)) {
            if (!placed) segs.push_back(TextSegment{text});
            placed = true;
        } else {
            segs.push_back(seg);
        }
    }
    if (!placed) segs.push_back(TextSegment{text});
    return Message(msg.role(), std::move(segs), msg.id());
}

// What a later session sees of this one under <recent_sessions>
std::string session_digest(const Session& s) {
    constexpr size_t kMaxDigest = 2000;
    std::string out;
    if (!s.turns.empty() && s.turns.front().kind == TurnKind::summary) {
        for (auto& m : s.turns.front().messages) out += m.text();
    }
    std::vector<std::string> prompts;
    for (auto& t : s.turns) {
        if (t.kind == TurnKind::summary) continue;
        for (auto& m : t.messages) {
            if (m.role() != Role::user) continue;
            std::string text = trim(m.text());
            if (text.empty()) continue;
            if (text.size() > 200) text = text.substr(0, 200) + "...";
            prompts.push_back(text);
        }
    }
    size_t first = prompts.size() > 5 ? prompts.size() - 5 : 0;
    for (size_t i = first; i < prompts.size(); ++i) {
        if (!out.empty()) out += "\n";
        out += "User: " + prompts[i];
    }
    if (out.size() > kMaxDigest) out = out.substr(0, kMaxDigest) + "...";
    return out;
}

} // namespace

// ── Upstream calls ──────────────────────────────────────────────────

const ProviderAdapter& Runtime::adapter(const std::string& provider) const {
    auto it = adapters.find(provider);
    if (it == adapters.end()) throw ConfigurationError("Provider '" + provider + "' is not configured");
    return *it->second;
}

Endpoint endpoint_for(const ProviderAdapter& adapter) {
    const auto& cfg = adapter.config();
    Endpoint ep;
    ep.provider = adapter.name();
    ep.base_url = cfg.api_base.empty() ? adapter.default_base_url() : cfg.api_base;
    ep.connect_timeout = cfg.connect_timeout;
    ep.read_timeout = cfg.read_timeout;
    return ep;
}

CanonicalResponse complete(const ProviderAdapter& adapter, Transport& transport, CanonicalRequest request) {
    request.stream = false;
    WireRequest wire = adapter.to_wire(request, adapter.effective_capabilities());
    return adapter.from_wire(transport.send(endpoint_for(adapter), wire));
}

CanonicalResponse Pipeline::call_upstream(const ProviderAdapter& adapter, CanonicalRequest& request,
                                          const DeltaCallback& on_text, const CancelToken& cancel) const {
    CapabilitySet caps = adapter.effective_capabilities();
    request.stream = request.stream && caps.streaming;
    WireRequest wire = adapter.to_wire(request, caps);
    Endpoint ep = endpoint_for(adapter);

    if (cancel.cancelled()) throw Cancelled();
    if (!request.stream) return adapter.from_wire(transport_->send(ep, wire));

    auto assembler = adapter.stream_assembler();
    if (on_text) assembler->set_on_text(on_text);
    WireResponse res = transport_->stream(ep, wire,
        [&assembler](const std::string& bytes) { assembler->from_wire_chunk(bytes); }, cancel);
    if (res.status < 200 || res.status >= 300) throw UpstreamError(adapter.name(), res.status, res.body);

    CanonicalResponse resp = assembler->finish();
    if (resp.incomplete) log_warn(adapter.name(), "stream ended before its terminal event");
    return resp;
}

// ── Setup ───────────────────────────────────────────────────────────

Pipeline::Pipeline(Config config, std::shared_ptr<Transport> transport, AdapterRegistry registry)
    : registry_(std::move(registry)), transport_(std::move(transport)) {
    sessions_ = std::make_unique<SessionManager>(config.sessions_path(), config.session.history_depth);
    if (config.memory.enabled) {
        try {
            memory_ = std::make_shared<MemoryStore>(config.memory_db_path(), config.memory.max_results,
                                                    config.memory.core_block_max_chars);
        } catch (const std::exception& e) {
            log_warn("memory", std::string("Memory store disabled: ") + e.what());
        }
    }
    runtime_ = build_runtime(std::move(config));
}

std::shared_ptr<const Runtime> Pipeline::build_runtime(Config config) const {
    auto rt = std::make_shared<Runtime>();
    rt->config = std::make_shared<const Config>(std::move(config));
    const Config& cfg = *rt->config;

    cfg.resolve_provider(cfg.provider);
    for (auto& [key, pc] : cfg.providers) {
        std::string kind = pc.kind.empty() ? key : pc.kind;
        rt->adapters[key] = registry_.create(kind, pc);
    }

    std::shared_ptr<const ProviderAdapter> main_adapter = rt->adapters.at(cfg.provider);
    std::string model = cfg.model_for(cfg.provider);
    std::shared_ptr<Transport> transport = transport_;

    PromptEvaluator evaluator = [main_adapter, transport, model](const std::string& system,
                                                                 const std::string& user) {
        CanonicalRequest req;
        req.model = model;
        req.max_tokens = 1024;
        req.messages = {Message::text(Role::system, system), Message::text(Role::user, user)};
        return complete(*main_adapter, *transport, std::move(req)).message.text();
    };
    rt->hooks = std::make_shared<const HookEngine>(HookEngine::from_config(cfg.hooks, evaluator));

    Summarizer summarizer = [main_adapter, transport, model](const std::string& instructions,
                                                             const std::string& transcript, int max_tokens) {
        CanonicalRequest req;
        req.model = model;
        req.max_tokens = max_tokens;
        req.messages = {Message::text(Role::system, instructions), Message::text(Role::user, transcript)};
        CanonicalResponse resp = complete(*main_adapter, *transport, std::move(req));
        if (resp.finish_reason == FinishReason::length) throw Error("summary was cut off at the token limit");
        return resp.message.text();
    };
    rt->compaction = std::make_shared<CompactionEngine>(cfg.compaction, summarizer, rt->hooks);

    auto injector = std::make_shared<ContextInjector>(std::chrono::milliseconds(cfg.injector.source_timeout_ms));
    injector->add_source(std::make_shared<FileRulesSource>(cfg.injector.rule_files, cfg.data_path()));
    injector->add_source(std::make_shared<ExtensionRulesSource>(cfg.injector.extension_rules_dir,
                                                                (fs::path(cfg.data_path()) / "rules").string()));
    if (memory_) injector->add_source(std::make_shared<MemorySource>(memory_, cfg.memory.recent_sessions));
    injector->add_resolver(std::make_shared<FileMentionResolver>());
    rt->injector = injector;

    log_info("pipeline", std::to_string(rt->adapters.size()) + " provider(s), " +
             std::to_string(rt->hooks->hook_count()) + " hook handler(s), default " + cfg.provider +
             (model.empty() ? "" : "/" + model));
    return rt;
}

void Pipeline::reload(Config next) {
    auto current = runtime();
    if (next.sessions_path() != current->config->sessions_path() ||
        next.memory_db_path() != current->config->memory_db_path()) {
        log_warn("pipeline", "Session and memory paths take effect on restart");
    }
    std::shared_ptr<const Runtime> rt = build_runtime(std::move(next));
    std::atomic_store(&runtime_, rt);
    log_info("pipeline", "Configuration reloaded");
}

// ── Hooks ───────────────────────────────────────────────────────────

HookResolution Pipeline::fire(const Runtime& rt, HookPayload payload, const std::string& session_id,
                              const std::string& cwd) const {
    HookEvent event;
    event.payload = std::move(payload);
    event.session_id = session_id;
    event.cwd = cwd.empty() ? current_dir() : cwd;
    event.permission_mode = rt.config->session.permission_mode;
    if (!rt.hooks->has_hooks(event.kind())) return {};
    return rt.hooks->dispatch(event);
}

Message Pipeline::gate_tool_calls(const Runtime& rt, const Message& msg, const std::string& session_id,
                                  const std::string& cwd, std::vector<BlockedToolCall>& blocked) const {
    if (!msg.has_tool_calls()) return msg;

    std::vector<Segment> segs;
    std::vector<BlockedToolCall> vetoed;
    for (auto& seg : msg.content()) {
        auto* call = std::get_if<ToolCallSegment>(&seg);
        if (!call) {
            segs.push_back(seg);
            continue;
        }

        HookResolution res = fire(rt, PreToolUsePayload{call->name, call->input}, session_id, cwd);
        bool denied = res.blocked || res.permission == Permission::deny;
        std::string reason = res.block_reason;
        if (!denied && res.permission == Permission::ask) {
            HookResolution ask = fire(rt, PermissionRequestPayload{call->name, call->input}, session_id, cwd);
            denied = ask.blocked || ask.permission == Permission::deny;
            reason = ask.block_reason;
        }
        if (denied) {
            vetoed.push_back({call->id, call->name, reason.empty() ? "denied by hook" : reason});
            log_info("hooks", "pre_tool_use blocked " + call->name + " (" + call->id + ")");
            continue;
        }

        ToolCallSegment out = *call;
        if (res.updated_input) out.input = *res.updated_input;
        segs.push_back(std::move(out));
    }

    for (auto& v : vetoed) {
        segs.push_back(TextSegment{"\n[tool call '" + v.name + "' was blocked: " + v.reason + "]"});
        blocked.push_back(v);
    }
    return Message(msg.role(), std::move(segs), msg.id());
}

// ── Sessions ────────────────────────────────────────────────────────

std::string Pipeline::ensure_session(const Runtime& rt, const std::string& id, const std::string& cwd) {
    std::string sid = id;
    std::string source;
    {
        std::lock_guard<std::mutex> lock(live_mu_);
        if (!sid.empty() && live_.count(sid) && sessions_->exists(sid)) {
            if (sessions_->snapshot(sid).status != SessionStatus::ended) return sid;
            sessions_->resume(sid);
            source = "resume";
        } else if (!sid.empty() && sessions_->exists(sid)) {
            sessions_->resume(sid);
            source = "resume";
        } else {
            sid = sessions_->create(sid);
            source = "startup";
        }
        live_.insert(sid);
    }

    HookResolution res = fire(rt, SessionStartPayload{source}, sid, cwd);
    for (auto& m : res.system_messages) log_info("hooks", "session_start: " + m);
    return sid;
}

std::string Pipeline::start_session(const std::string& id, const std::string& cwd) {
    auto rt = runtime();
    return ensure_session(*rt, id, cwd);
}

void Pipeline::end_session(const std::string& id, const std::string& reason) {
    auto rt = runtime();
    auto lock = sessions_->lock_exchange(id);
    fire(*rt, SessionEndPayload{reason}, id, {});

    if (memory_) {
        std::string digest = session_digest(sessions_->snapshot(id));
        if (!digest.empty()) {
            try {
                memory_->save_session_summary(id, digest);
            } catch (const Error& e) {
                log_warn("memory", "Could not store summary of " + id + ": " + e.what());
            }
        }
    }
    sessions_->set_status(id, SessionStatus::ended);
    log_info("session", "Ended " + id + " (" + reason + ")");
}

CompactionResult Pipeline::compact(const std::string& session_id) {
    auto rt = runtime();
    auto lock = sessions_->lock_exchange(session_id);
    return rt->compaction->compact(*sessions_, session_id, rt->config->model_for(rt->config->provider), "manual");
}

bool Pipeline::undo(const std::string& session_id) {
    auto lock = sessions_->lock_exchange(session_id);
    return sessions_->undo(session_id);
}

bool Pipeline::redo(const std::string& session_id) {
    auto lock = sessions_->lock_exchange(session_id);
    return sessions_->redo(session_id);
}

void Pipeline::destroy(const std::string& session_id) {
    sessions_->destroy(session_id);
    {
        std::lock_guard<std::mutex> lock(live_mu_);
        live_.erase(session_id);
    }
    std::lock_guard<std::mutex> lock(usage_mu_);
    usage_.erase(session_id);
}

std::map<std::string, SessionUsage> Pipeline::usage() const {
    std::lock_guard<std::mutex> lock(usage_mu_);
    return usage_;
}

void Pipeline::record_usage(const std::string& session_id, const Usage& usage) {
    std::lock_guard<std::mutex> lock(usage_mu_);
    auto& u = usage_[session_id];
    u.requests++;
    u.total.input_tokens += usage.input_tokens;
    u.total.output_tokens += usage.output_tokens;
    u.last = usage;
}

// ── Tools ───────────────────────────────────────────────────────────

ToolRunResult Pipeline::run_tool(const std::string& session_id, const ToolCallSegment& call,
                                 const ToolExecutor& executor, const std::string& cwd) {
    auto rt = runtime();
    ToolRunResult result;
    result.input = call.input;

    HookResolution pre = fire(*rt, PreToolUsePayload{call.name, call.input}, session_id, cwd);
    if (pre.blocked || pre.permission == Permission::deny) {
        result.blocked = true;
        result.reason = pre.block_reason.empty() ? "denied by hook" : pre.block_reason;
        return result;
    }
    if (pre.updated_input) result.input = *pre.updated_input;
    result.hook_messages = pre.system_messages;

    try {
        result.output = executor(call.name, result.input);
        result.executed = true;
    } catch (const std::exception& e) {
        result.executed = true;
        result.is_error = true;
        result.output = e.what();
    }

    HookResolution post = result.is_error
        ? fire(*rt, PostToolUseFailurePayload{call.name, result.input, result.output}, session_id, cwd)
        : fire(*rt, PostToolUsePayload{call.name, result.input, result.output}, session_id, cwd);
    for (auto& m : post.system_messages) result.hook_messages.push_back(m);
    if (post.blocked) result.hook_messages.push_back(post.block_reason);
    return result;
}

// ── Exchange ────────────────────────────────────────────────────────

ExchangeResult Pipeline::exchange(ExchangeRequest req, const DeltaCallback& on_text, const CancelToken& cancel) {
    auto rt = runtime();
    const Config& cfg = *rt->config;
    ExchangeResult result;

    // Provider and model
    std::string provider = req.provider;
    std::string model = req.request.model;
    size_t slash = model.find('/');
    if (provider.empty() && slash != std::string::npos && cfg.providers.count(model.substr(0, slash))) {
        provider = model.substr(0, slash);
        model = model.substr(slash + 1);
    }
    if (provider.empty()) provider = cfg.provider;
    const ProviderAdapter& adapter = rt->adapter(provider);
    if (model.empty()) model = cfg.model_for(provider);
    result.provider = provider;
    result.model = model;

    // Client messages: system text, history the client already holds, and the new trigger
    std::vector<std::string> system_text;
    std::vector<Message> convo;
    for (auto& m : req.request.messages) {
        if (m.role() == Role::system) system_text.push_back(m.text());
        else convo.push_back(m);
    }
    size_t cut = 0;
    for (size_t i = 0; i < convo.size(); ++i) {
        if (convo[i].role() == Role::assistant) cut = i + 1;
    }
    if (cut == convo.size()) throw Error("Request has no message after the last assistant reply");
    std::vector<Message> prior(convo.begin(), convo.begin() + static_cast<long>(cut));
    std::vector<Message> trigger(convo.begin() + static_cast<long>(cut), convo.end());

    std::string sid = ensure_session(*rt, req.session_id, req.cwd);
    result.session_id = sid;
    auto lock = sessions_->lock_exchange(sid);

    if (!prior.empty() && sessions_->snapshot(sid).turns.empty()) {
        sessions_->append_turn(sid, Turn::make(prior));
    }

    // user_prompt_submit may veto or rewrite the prompt
    std::vector<std::string> hook_messages;
    for (auto& m : trigger) {
        if (m.role() != Role::user) continue;
        HookResolution res = fire(*rt, UserPromptSubmitPayload{m.text()}, sid, req.cwd);
        if (res.blocked) {
            result.blocked = true;
            result.block_reason = res.block_reason.empty() ? "prompt blocked by hook" : res.block_reason;
            log_info("hooks", "user_prompt_submit blocked in " + sid + ": " + result.block_reason);
            return result;
        }
        if (res.updated_input && res.updated_input->is_string()) {
            m = rewrite_prompt(m, res.updated_input->get<std::string>());
        }
        hook_messages.insert(hook_messages.end(), res.system_messages.begin(), res.system_messages.end());
    }

    CompactionResult compaction = rt->compaction->maybe_compact(*sessions_, sid, estimate_tokens(trigger), model);
    result.compacted = compaction.compacted;
    if (compaction.deferred) {
        fire(*rt, NotificationPayload{"Compaction deferred: " + compaction.reason}, sid, req.cwd);
    }

    Session session = sessions_->snapshot(sid);
    Turn user_turn = sessions_->append_turn(sid, Turn::make(trigger));
    auto rollback = [this, &sid, &user_turn, &session] {
        try {
            sessions_->rollback_turn(sid, user_turn.id, session.redo_stack);
        } catch (const Error& e) {
            log_error("session", "Rollback of " + user_turn.id + " failed: " + e.what());
        }
    };

    InjectionContext ctx;
    ctx.session_id = sid;
    ctx.cwd = req.cwd;
    ctx.system = std::move(system_text);
    ctx.history = session.history();
    ctx.trigger = trigger;
    ctx.hook_messages = std::move(hook_messages);
    InjectionResult injected = rt->injector->assemble(ctx);
    result.degraded_sources = injected.degraded_sources;
    if (!injected.degraded_sources.empty()) {
        std::string names;
        for (auto& n : injected.degraded_sources) names += (names.empty() ? "" : ", ") + n;
        fire(*rt, NotificationPayload{"Context sources skipped: " + names}, sid, req.cwd);
    }

    CanonicalRequest out = req.request;
    out.model = model;
    out.messages = std::move(injected.messages);
    out.metadata.session_id = sid;
    if (!out.max_tokens) out.max_tokens = cfg.max_tokens;
    const ThinkingConfig& thinking = adapter.config().thinking;
    if (!out.thinking.enabled && thinking.enabled) {
        out.thinking.enabled = true;
        out.thinking.budget_tokens = thinking.budget_tokens;
        out.thinking.effort = thinking.reasoning_effort;
        out.thinking.preserve_across_turns = thinking.preserve_across_turns;
    }

    CanonicalResponse response;
    try {
        response = call_upstream(adapter, out, on_text, cancel);
        if (cancel.cancelled()) throw Cancelled();
        if (response.message.content().empty() && response.finish_reason != FinishReason::content_filter) {
            throw TranslationError(adapter.name(), "response has no content");
        }
    } catch (const std::exception& e) {
        rollback();
        log_warn("pipeline", sid + ": exchange failed: " + e.what());
        throw;
    }
    record_usage(sid, response.usage);
    if (response.message.content().empty()) {
        // filtered before any output; nothing to journal
        rollback();
        if (response.model.empty()) response.model = model;
        result.response = std::move(response);
        return result;
    }
    result.degradation_notes = out.metadata.degradation_notes;
    if (response.model.empty()) response.model = model;

    Message message = gate_tool_calls(*rt, response.message, sid, req.cwd, result.blocked_tools);
    if (!message.has_tool_calls() && response.finish_reason == FinishReason::tool_calls) {
        response.finish_reason = FinishReason::stop;
    }
    response.message = message;

    if (response.finish_reason != FinishReason::tool_calls) {
        HookResolution stop = fire(*rt, StopPayload{finish_reason_name(response.finish_reason)}, sid, req.cwd);
        result.hook_messages = stop.system_messages;
        if (stop.blocked) result.hook_messages.push_back(stop.block_reason);
    }

    sessions_->append_turn(sid, Turn::make({response.message}));
    result.response = std::move(response);
    return result;
}

} // namespace polygate
