#include "google_adapter.hpp"
#include "../errors.hpp"
#include "../utils.hpp"
#include <algorithm>
#include <map>

namespace polygate {

using json = nlohmann::json;

namespace {

// functionDeclarations accept an OpenAPI subset; drop what Gemini rejects
json gemini_schema(json node) {
    if (!node.is_object()) return node;

    for (const char* key : {"$schema", "$id", "$ref", "definitions", "additionalProperties",
                            "default", "examples", "title"}) {
        node.erase(key);
    }
    for (const char* key : {"anyOf", "oneOf"}) {
        auto it = node.find(key);
        if (it == node.end()) continue;
        json variant = it->is_array() && !it->empty() ? (*it)[0] : json::object();
        node.erase(key);
        node.merge_patch(variant);
    }
    if (node.contains("format") && node.value("type", json()) != "string") node.erase("format");

    if (node.contains("properties") && node["properties"].is_object()) {
        for (auto& prop : node["properties"]) prop = gemini_schema(prop);
    }
    if (node.contains("items")) node["items"] = gemini_schema(node["items"]);
    return node;
}

json gemini_parameters(const json& schema) {
    json params = gemini_schema(schema.is_object() ? schema : json::object());
    if (!params.contains("type")) params["type"] = "object";
    return params;
}

FinishReason parse_finish_reason(const std::string& s) {
    if (s == "STOP") return FinishReason::stop;
    if (s == "MAX_TOKENS") return FinishReason::length;
    if (s == "SAFETY" || s == "RECITATION" || s == "BLOCKLIST" ||
        s == "PROHIBITED_CONTENT" || s == "SPII") return FinishReason::content_filter;
    return FinishReason::unknown;
}

json attachment_part(const AttachmentSegment& a) {
    if (a.uri.rfind("data:", 0) == 0) {
        size_t semi = a.uri.find(';');
        size_t comma = a.uri.find(',');
        if (semi != std::string::npos && comma != std::string::npos && semi < comma) {
            return {{"inlineData", {{"mimeType", a.uri.substr(5, semi - 5)},
                                    {"data", a.uri.substr(comma + 1)}}}};
        }
    }
    std::string mime = a.media_type.find('/') != std::string::npos ? a.media_type : "application/octet-stream";
    return {{"fileData", {{"mimeType", mime}, {"fileUri", a.uri}}}};
}

// functionResponse needs the function name; resolve it from earlier calls
json encode_parts(const Message& m, const std::map<std::string, std::string>& call_names) {
    json parts = json::array();
    for (auto& seg : m.content()) {
        if (auto* r = std::get_if<ReasoningSegment>(&seg)) {
            if (m.role() != Role::assistant) continue;
            json part = {{"text", r->text}, {"thought", true}};
            if (!r->signature.empty()) part["thoughtSignature"] = r->signature;
            parts.push_back(std::move(part));
        } else if (auto* t = std::get_if<TextSegment>(&seg)) {
            if (!t->text.empty()) parts.push_back({{"text", t->text}});
        } else if (auto* tc = std::get_if<ToolCallSegment>(&seg)) {
            parts.push_back({{"functionCall", {{"id", tc->id}, {"name", tc->name},
                                               {"args", tc->input.is_object() ? tc->input : json::object()}}}});
        } else if (auto* tr = std::get_if<ToolResultSegment>(&seg)) {
            auto it = call_names.find(tr->tool_call_id);
            std::string fn = it != call_names.end() ? it->second : tr->tool_call_id;
            json response = tr->is_error ? json{{"error", tr->content}} : json{{"content", tr->content}};
            parts.push_back({{"functionResponse", {{"id", tr->tool_call_id}, {"name", fn}, {"response", response}}}});
        } else if (auto* a = std::get_if<AttachmentSegment>(&seg)) {
            parts.push_back(attachment_part(*a));
        }
    }
    return parts;
}

std::vector<Segment> decode_parts(const json& parts, const std::string& provider) {
    if (!parts.is_array()) throw TranslationError(provider, "parts is not an array");
    std::vector<Segment> segments;
    for (auto& p : parts) {
        if (p.contains("functionCall")) {
            auto& fc = p["functionCall"];
            std::string id = fc.value("id", "");
            segments.push_back(ToolCallSegment{id.empty() ? generate_id("call") : id, fc.value("name", ""),
                                               fc.contains("args") ? fc["args"] : json::object()});
        } else if (p.contains("functionResponse")) {
            auto& fr = p["functionResponse"];
            json response = fr.contains("response") ? fr["response"] : json::object();
            bool is_error = response.contains("error");
            std::string content;
            json field = is_error ? response["error"] : (response.contains("content") ? response["content"] : response);
            content = field.is_string() ? field.get<std::string>() : field.dump();
            std::string id = fr.value("id", "");
            segments.push_back(ToolResultSegment{id.empty() ? fr.value("name", "") : id, content, is_error});
        } else if (p.contains("inlineData")) {
            auto& d = p["inlineData"];
            std::string mime = d.value("mimeType", "application/octet-stream");
            segments.push_back(AttachmentSegment{"data:" + mime + ";base64," + d.value("data", ""), mime, ""});
        } else if (p.contains("fileData")) {
            auto& d = p["fileData"];
            segments.push_back(AttachmentSegment{d.value("fileUri", ""), d.value("mimeType", ""), ""});
        } else if (p.contains("text")) {
            if (p.value("thought", false)) {
                segments.push_back(ReasoningSegment{p.value("text", ""), p.value("thoughtSignature", "")});
            } else {
                segments.push_back(TextSegment{p.value("text", "")});
            }
        }
    }
    return segments;
}

class GoogleStreamAssembler : public StreamAssembler {
public:
    using StreamAssembler::StreamAssembler;

protected:
    void on_event(const std::string&, const json& data) override {
        if (data.contains("error") && !data["error"].is_null()) {
            throw UpstreamError(provider(), stream_error_status(data["error"]), data.dump());
        }
        set_identity(data.value("responseId", ""), data.value("modelVersion", ""));
        if (data.contains("usageMetadata")) {
            auto& u = data["usageMetadata"];
            set_usage(u.value("promptTokenCount", 0), u.value("candidatesTokenCount", 0));
        }
        if (!data.contains("candidates") || !data["candidates"].is_array() || data["candidates"].empty()) {
            return;
        }
        auto& cand = data["candidates"][0];
        if (cand.contains("content") && cand["content"].contains("parts")) {
            for (auto& p : cand["content"]["parts"]) {
                if (p.contains("functionCall")) {
                    auto& fc = p["functionCall"];
                    int index = next_call_++;
                    tool_call_start(index, fc.value("id", ""), fc.value("name", ""));
                    tool_call_input(index, fc.contains("args") ? fc["args"] : json::object());
                } else if (p.contains("text")) {
                    if (p.value("thought", false)) {
                        append_reasoning(0, p.value("text", ""), p.value("thoughtSignature", ""));
                    } else {
                        append_text(p.value("text", ""));
                    }
                }
            }
        }
        if (cand.contains("finishReason") && cand["finishReason"].is_string()) {
            FinishReason reason = parse_finish_reason(cand["finishReason"].get<std::string>());
            if (reason == FinishReason::stop && next_call_ > 0) reason = FinishReason::tool_calls;
            set_finish_reason(reason);
            mark_done();
        }
    }

private:
    int next_call_ = 0;
};

} // namespace

CapabilitySet GoogleAdapter::capabilities() const {
    CapabilitySet caps;
    caps.thinking = true;
    caps.reasoning = ReasoningParam::token_budget;
    caps.reasoning_param = "generationConfig.thinkingConfig.thinkingBudget";
    return caps;
}

WireRequest GoogleAdapter::to_wire(CanonicalRequest& request, const CapabilitySet& caps) const {
    WireRequest wire;
    wire.stream = request.stream && caps.streaming;
    wire.path = "/v1beta/models/" + request.model +
                (wire.stream ? ":streamGenerateContent?alt=sse" : ":generateContent");

    std::map<std::string, std::string> call_names;
    std::string system;
    json contents = json::array();
    for (auto& m : request.messages) {
        if (m.role() == Role::system) {
            if (!system.empty()) system += "\n\n";
            system += m.text();
            continue;
        }
        for (auto& tc : m.tool_calls()) call_names[tc.id] = tc.name;
        std::string role = (m.role() == Role::assistant) ? "model" : "user";
        json parts = encode_parts(m, call_names);
        if (parts.empty()) continue;
        if (!contents.empty() && contents.back()["role"] == role) {
            for (auto& p : parts) contents.back()["parts"].push_back(p);
        } else {
            contents.push_back({{"role", role}, {"parts", parts}});
        }
    }

    json body;
    body["contents"] = std::move(contents);
    if (!system.empty()) body["systemInstruction"] = {{"parts", json::array({{{"text", system}}})}};

    if (!request.tools.empty() && caps.tool_calls) {
        json decls = json::array();
        for (auto& t : request.tools) {
            decls.push_back({{"name", t.name}, {"description", t.description},
                             {"parameters", gemini_parameters(t.parameters)}});
        }
        body["tools"] = json::array({{{"functionDeclarations", decls}}});
    }

    json gen = json::object();
    if (request.max_tokens) gen["maxOutputTokens"] = *request.max_tokens;
    if (request.temperature) gen["temperature"] = *request.temperature;
    if (thinking_applicable(request, caps)) {
        int budget = request.thinking.budget_tokens > 0 ? request.thinking.budget_tokens : kDefaultThinkingBudget;
        gen["thinkingConfig"] = {{"thinkingBudget", std::min(budget, kMaxThinkingBudget)},
                                 {"includeThoughts", true}};
    }
    if (!gen.empty()) body["generationConfig"] = std::move(gen);
    wire.body = std::move(body);

    wire.headers.emplace_back("x-goog-api-key", config_.api_key);
    for (auto& [k, v] : config_.headers) wire.headers.emplace_back(k, v);
    return wire;
}

namespace {

CanonicalResponse decode_response(const json& body, const std::string& provider) {
    CanonicalResponse resp;
    resp.id = body.value("responseId", "");
    resp.model = body.value("modelVersion", "");
    if (body.contains("usageMetadata")) {
        resp.usage.input_tokens = body["usageMetadata"].value("promptTokenCount", 0);
        resp.usage.output_tokens = body["usageMetadata"].value("candidatesTokenCount", 0);
    }

    if (!body.contains("candidates") || !body["candidates"].is_array() || body["candidates"].empty()) {
        if (body.contains("promptFeedback") && body["promptFeedback"].contains("blockReason")) {
            resp.message = Message(Role::assistant, {}, resp.id);
            resp.finish_reason = FinishReason::content_filter;
            return resp;
        }
        throw TranslationError(provider, "response has no candidates");
    }

    auto& cand = body["candidates"][0];
    std::vector<Segment> segments;
    if (cand.contains("content") && cand["content"].contains("parts")) {
        segments = decode_parts(cand["content"]["parts"], provider);
    }
    resp.message = Message(Role::assistant, std::move(segments), resp.id);
    if (cand.contains("finishReason") && cand["finishReason"].is_string()) {
        resp.finish_reason = parse_finish_reason(cand["finishReason"].get<std::string>());
    }
    // Gemini reports STOP even when it asked for a function call
    if (resp.message.has_tool_calls() &&
        (resp.finish_reason == FinishReason::stop || resp.finish_reason == FinishReason::unknown)) {
        resp.finish_reason = FinishReason::tool_calls;
    }
    return resp;
}

} // namespace

CanonicalResponse GoogleAdapter::from_wire(const WireResponse& response) const {
    check_status(response);
    json body = parse_body(response);
    if (body.contains("error")) throw UpstreamError(name(), response.status, response.body);
    try {
        return decode_response(body, name());
    } catch (const json::exception& e) {
        throw TranslationError(name(), std::string("malformed response: ") + e.what());
    }
}

std::vector<Message> GoogleAdapter::messages_from_wire(const json& body) const {
    std::vector<Message> out;
    if (body.contains("systemInstruction") && body["systemInstruction"].contains("parts")) {
        std::string text;
        for (auto& p : body["systemInstruction"]["parts"]) text += p.value("text", "");
        if (!text.empty()) out.push_back(Message::text(Role::system, text));
    }
    if (!body.contains("contents") || !body["contents"].is_array()) {
        throw TranslationError(name(), "request has no contents");
    }
    for (auto& c : body["contents"]) {
        std::string role = c.value("role", "user");
        auto segments = decode_parts(c.contains("parts") ? c["parts"] : json::array(), name());
        if (role == "model") {
            out.emplace_back(Role::assistant, std::move(segments));
            continue;
        }
        bool all_results = !segments.empty() && std::all_of(segments.begin(), segments.end(),
            [](const Segment& s) { return std::holds_alternative<ToolResultSegment>(s); });
        out.emplace_back(all_results ? Role::tool : Role::user, std::move(segments));
    }
    return out;
}

std::unique_ptr<StreamAssembler> GoogleAdapter::stream_assembler() const {
    return std::make_unique<GoogleStreamAssembler>(name());
}

} // namespace polygate
