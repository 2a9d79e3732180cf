#include "http_server.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "utils.hpp"
#include "providers/anthropic_adapter.hpp"
#include "providers/openai_format.hpp"

namespace polygate {

using json = nlohmann::json;

namespace {

void send_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

json compaction_json(const CompactionResult& r) {
    return {
        {"compacted", r.compacted},
        {"deferred", r.deferred},
        {"reason", r.reason},
        {"tokens_before", r.tokens_before},
        {"tokens_after", r.tokens_after},
        {"turns_replaced", r.turns_replaced},
    };
}

json exchange_extras(const ExchangeResult& r) {
    json blocked = json::array();
    for (auto& b : r.blocked_tools) blocked.push_back({{"id", b.id}, {"name", b.name}, {"reason", b.reason}});
    return {
        {"session_id", r.session_id},
        {"provider", r.provider},
        {"compacted", r.compacted},
        {"incomplete", r.response.incomplete},
        {"degradation_notes", r.degradation_notes},
        {"degraded_sources", r.degraded_sources},
        {"blocked_tools", blocked},
        {"hook_messages", r.hook_messages},
    };
}

std::string blocked_note(const BlockedToolCall& b) {
    return "\n[tool call '" + b.name + "' was blocked: " + b.reason + "]";
}

// Anthropic clients expect {"type": "error", "error": {...}}
json format_error(ClientFormat format, json body) {
    if (format == ClientFormat::anthropic) body["type"] = "error";
    return body;
}

std::string sse_frame(ClientFormat format, const std::string& event, const json& data) {
    if (format == ClientFormat::anthropic) return "event: " + event + "\ndata: " + data.dump() + "\n\n";
    return "data: " + data.dump() + "\n\n";
}

} // namespace

json models_body(const Runtime& rt) {
    json data = json::array();
    for (auto& [key, adapter] : rt.adapters) {
        std::string model = adapter->config().default_model;
        if (key == rt.config->provider && !rt.config->model.empty()) model = rt.config->model;
        if (model.empty()) continue;
        data.push_back({{"id", key + "/" + model}, {"object", "model"}, {"owned_by", key},
                        {"provider", adapter->name()}, {"default", key == rt.config->provider}});
    }
    return {{"object", "list"}, {"data", data}};
}

json usage_json(const std::string& session_id, const SessionUsage& usage) {
    return {
        {"session_id", session_id},
        {"requests", usage.requests},
        {"cumulative_usage", {{"input_tokens", usage.total.input_tokens},
                              {"output_tokens", usage.total.output_tokens},
                              {"total_tokens", usage.total.input_tokens + usage.total.output_tokens}}},
        {"last_usage", {{"input_tokens", usage.last.input_tokens},
                        {"output_tokens", usage.last.output_tokens}}},
    };
}

json HttpServer::error_body(const std::string& type, const std::string& message, const json& extra) {
    json err = {{"type", type}, {"message", message}};
    for (auto& [k, v] : extra.items()) err[k] = v;
    return {{"error", err}};
}

int error_status(const std::exception& e, json& body) {
    if (auto* up = dynamic_cast<const UpstreamError*>(&e)) {
        body = HttpServer::error_body("upstream_error", up->what(),
            {{"provider", up->provider()}, {"status", up->status()}, {"body", up->body()}});
        return 502;
    }
    if (auto* tr = dynamic_cast<const TranslationError*>(&e)) {
        if (tr->provider() == "client") {
            body = HttpServer::error_body("invalid_request", tr->what());
            return 400;
        }
        body = HttpServer::error_body("translation_error", tr->what(), {{"provider", tr->provider()}});
        return 502;
    }
    if (dynamic_cast<const ConfigurationError*>(&e)) {
        body = HttpServer::error_body("configuration_error", e.what());
        return 400;
    }
    if (dynamic_cast<const Cancelled*>(&e)) {
        body = HttpServer::error_body("cancelled", e.what());
        return 499;
    }
    if (dynamic_cast<const Error*>(&e) || dynamic_cast<const json::exception*>(&e)) {
        body = HttpServer::error_body("invalid_request", e.what());
        return 400;
    }
    body = HttpServer::error_body("internal_error", e.what());
    return 500;
}

// ── Lifecycle ───────────────────────────────────────────────────────

HttpServer::HttpServer(Pipeline& pipeline, const GatewayConfig& cfg, std::string config_path)
    : pipeline_(pipeline)
    , host_(cfg.host)
    , port_(cfg.port)
    , api_key_(cfg.api_key)
    , config_path_(std::move(config_path))
    , worker_threads_(cfg.worker_threads > 0 ? cfg.worker_threads : 8)
    , rate_limiter_(cfg.rate_limit_rpm) {
    register_routes();
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    size_t workers = static_cast<size_t>(worker_threads_);
    server_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };

    if (port_ == 0) {
        port_ = server_.bind_to_any_port(host_);
        if (port_ < 0) throw Error("Cannot bind " + host_ + " on any port");
    } else if (!server_.bind_to_port(host_, port_)) {
        throw Error("Cannot bind " + host_ + ":" + std::to_string(port_));
    }

    running_ = true;
    thread_ = std::thread([this]() {
        log_info("http", "Listening on " + host_ + ":" + std::to_string(port_));
        if (!server_.listen_after_bind()) log_error("http", "Server loop exited with an error");
        running_ = false;
    });
}

void HttpServer::stop() {
    server_.stop();
    if (thread_.joinable()) thread_.join();
}

// ── Guards ──────────────────────────────────────────────────────────

bool HttpServer::check_auth(const httplib::Request& req, httplib::Response& res) {
    if (api_key_.empty()) return true;

    auto auth = req.get_header_value("Authorization");
    if (auth != "Bearer " + api_key_ && req.get_header_value("x-api-key") != api_key_) {
        send_json(res, 401, error_body("unauthorized", "missing or wrong API key"));
        return false;
    }
    return true;
}

bool HttpServer::check_rate_limit(const httplib::Request& req, httplib::Response& res) {
    if (!rate_limiter_.allow(req.remote_addr)) {
        res.set_header("Retry-After", std::to_string(rate_limiter_.retry_after(req.remote_addr)));
        send_json(res, 429, error_body("rate_limited", "rate limit exceeded"));
        return false;
    }
    return true;
}

bool HttpServer::check_session(const std::string& id, httplib::Response& res) {
    try {
        if (pipeline_.sessions().exists(id)) return true;
    } catch (const Error& e) {
        send_json(res, 400, error_body("invalid_request", e.what()));
        return false;
    }
    send_json(res, 404, error_body("not_found", "no session " + id));
    return false;
}

// ── Routes ──────────────────────────────────────────────────────────

void HttpServer::register_routes() {
    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        json body;
        int status = 500;
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            status = error_status(e, body);
        } catch (...) {
            body = error_body("internal_error", "non-standard exception");
        }
        log_error("http", req.method + " " + req.path + ": " + body["error"].value("message", ""));
        send_json(res, status, body);
    });

    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        auto rt = pipeline_.runtime();
        json providers = json::array();
        for (auto& [key, _] : rt->adapters) providers.push_back(key);
        send_json(res, 200, {{"status", "ok"}, {"default_provider", rt->config->provider},
                             {"providers", providers}, {"memory", pipeline_.memory() != nullptr}});
    });

    server_.Post("/v1/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        if (!check_rate_limit(req, res)) return;
        handle_chat(req, res, ClientFormat::openai);
    });

    server_.Post("/v1/messages", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        if (!check_rate_limit(req, res)) return;
        handle_chat(req, res, ClientFormat::anthropic);
    });

    server_.Get("/v1/models", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        send_json(res, 200, models_body(*pipeline_.runtime()));
    });

    // All sessions with usage, or one with ?session_id=
    server_.Get("/stats", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        auto usage = pipeline_.usage();
        if (req.has_param("session_id")) {
            std::string id = req.get_param_value("session_id");
            auto it = usage.find(id);
            if (it == usage.end()) {
                if (!check_session(id, res)) return;
                send_json(res, 200, usage_json(id, SessionUsage{}));
                return;
            }
            send_json(res, 200, usage_json(id, it->second));
            return;
        }
        json sessions = json::array();
        SessionUsage totals;
        for (auto& [id, u] : usage) {
            sessions.push_back(usage_json(id, u));
            totals.requests += u.requests;
            totals.total.input_tokens += u.total.input_tokens;
            totals.total.output_tokens += u.total.output_tokens;
        }
        send_json(res, 200, {{"sessions", sessions},
                             {"requests", totals.requests},
                             {"cumulative_usage", {{"input_tokens", totals.total.input_tokens},
                                                   {"output_tokens", totals.total.output_tokens},
                                                   {"total_tokens", totals.total.input_tokens +
                                                                    totals.total.output_tokens}}}});
    });

    const std::string session_path = R"(/sessions/([A-Za-z0-9._-]+))";

    server_.Get(session_path, [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        std::string id = req.matches[1];
        if (!check_session(id, res)) return;
        send_json(res, 200, pipeline_.sessions().snapshot(id).to_json());
    });

    server_.Delete(session_path, [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        std::string id = req.matches[1];
        if (!check_session(id, res)) return;
        pipeline_.destroy(id);
        send_json(res, 200, {{"deleted", id}});
    });

    server_.Post(session_path + "/undo", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        std::string id = req.matches[1];
        if (!check_session(id, res)) return;
        bool ok = pipeline_.undo(id);
        send_json(res, ok ? 200 : 409, {{"undone", ok}, {"turns", pipeline_.sessions().snapshot(id).turns.size()}});
    });

    server_.Post(session_path + "/redo", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        std::string id = req.matches[1];
        if (!check_session(id, res)) return;
        bool ok = pipeline_.redo(id);
        send_json(res, ok ? 200 : 409, {{"redone", ok}, {"turns", pipeline_.sessions().snapshot(id).turns.size()}});
    });

    server_.Post(session_path + "/compact", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        std::string id = req.matches[1];
        if (!check_session(id, res)) return;
        send_json(res, 200, compaction_json(pipeline_.compact(id)));
    });

    server_.Post(session_path + "/end", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        std::string id = req.matches[1];
        if (!check_session(id, res)) return;
        pipeline_.end_session(id, "client");
        send_json(res, 200, {{"ended", id}});
    });

    server_.Post("/admin/reload", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        try {
            pipeline_.reload(Config::load(config_path_));
        } catch (const ConfigurationError& e) {
            log_warn("http", std::string("Reload rejected, keeping current configuration: ") + e.what());
            send_json(res, 400, error_body("configuration_error", e.what()));
            return;
        }
        send_json(res, 200, {{"reloaded", true}});
    });
}

// ── Chat ────────────────────────────────────────────────────────────

void HttpServer::handle_chat(const httplib::Request& req, httplib::Response& res, ClientFormat format) {
    ExchangeRequest ex;
    try {
        json body = json::parse(req.body);
        ex.request = format == ClientFormat::anthropic ? decode_anthropic_request(body) : decode_openai_request(body);
    } catch (const std::exception& e) {
        json body;
        int status = error_status(e, body);
        send_json(res, status, format_error(format, body));
        return;
    }
    ex.session_id = req.get_header_value("X-Session-Id");
    ex.provider = req.get_header_value("X-Provider");
    ex.cwd = req.get_header_value("X-Working-Directory");

    if (ex.request.stream) {
        stream_chat(std::move(ex), res, format);
        return;
    }

    ExchangeResult r;
    try {
        r = pipeline_.exchange(std::move(ex));
    } catch (const std::exception& e) {
        json body;
        int status = error_status(e, body);
        send_json(res, status, format_error(format, body));
        return;
    }
    res.set_header("X-Session-Id", r.session_id);
    if (r.blocked) {
        send_json(res, 403, format_error(format, error_body("blocked", r.block_reason, {{"session_id", r.session_id}})));
        return;
    }
    json body = format == ClientFormat::anthropic ? encode_anthropic_response(r.response)
                                                  : encode_openai_response(r.response);
    body["polygate"] = exchange_extras(r);
    send_json(res, 200, body);
}

// Headers go out before the exchange runs, so failures after that point
// arrive as an SSE error event rather than an HTTP status.
void HttpServer::stream_chat(ExchangeRequest exchange, httplib::Response& res, ClientFormat format) {
    try {
        exchange.session_id = pipeline_.start_session(exchange.session_id, exchange.cwd);
    } catch (const std::exception& e) {
        json body;
        int status = error_status(e, body);
        send_json(res, status, format_error(format, body));
        return;
    }
    res.set_header("X-Session-Id", exchange.session_id);
    res.set_header("Cache-Control", "no-cache");

    auto ex = std::make_shared<ExchangeRequest>(std::move(exchange));
    res.set_chunked_content_provider("text/event-stream", [this, ex, format](size_t, httplib::DataSink& sink) {
        CancelToken cancel;
        bool anthropic = format == ClientFormat::anthropic;
        std::string chunk_id = generate_id(anthropic ? "msg" : "chatcmpl");
        bool text_open = false;
        auto send = [&sink, &cancel, format](const std::string& event, const json& j) {
            std::string frame = sse_frame(format, event, j);
            if (!sink.write(frame.data(), frame.size())) cancel.cancel();
        };
        auto on_text = [&](const std::string& text) {
            if (!anthropic) {
                send("", encode_openai_stream_delta(chunk_id, ex->request.model, text));
                return;
            }
            if (!text_open) {
                auto start = anthropic_text_start();
                send(start.first, start.second);
                text_open = true;
            }
            auto delta = anthropic_text_delta(text);
            send(delta.first, delta.second);
        };

        if (anthropic) {
            auto start = anthropic_message_start(chunk_id, ex->request.model);
            send(start.first, start.second);
        }
        try {
            ExchangeResult r = pipeline_.exchange(*ex, on_text, cancel);
            if (r.blocked) {
                send("error", format_error(format, error_body("blocked", r.block_reason, {{"session_id", r.session_id}})));
            } else {
                for (auto& b : r.blocked_tools) on_text(blocked_note(b));
                CanonicalResponse final_chunk = r.response;
                final_chunk.id = chunk_id;
                if (anthropic) {
                    auto tail = anthropic_stream_tail(final_chunk, text_open);
                    // extras ride on message_delta, the last event that carries data
                    for (auto& [event, data] : tail) {
                        if (event == "message_delta") data["polygate"] = exchange_extras(r);
                        send(event, data);
                    }
                } else {
                    json last = encode_openai_stream_final(final_chunk);
                    last["polygate"] = exchange_extras(r);
                    send("", last);
                }
            }
        } catch (const Cancelled&) {
            log_info("http", "Client went away, exchange in " + ex->session_id + " cancelled");
            return false;
        } catch (const std::exception& e) {
            json body;
            error_status(e, body);
            send("error", format_error(format, body));
        }

        if (!anthropic) {
            static const std::string done = "data: [DONE]\n\n";
            sink.write(done.data(), done.size());
        }
        sink.done();
        return true;
    });
}

} // namespace polygate
