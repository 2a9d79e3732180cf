#include "openai_format.hpp"
#include "../errors.hpp"
#include "../utils.hpp"

namespace polygate {

using json = nlohmann::json;

static std::string arguments_string(const json& input) {
    // String input holds arguments that were never valid JSON; replay them untouched
    return input.is_string() ? input.get<std::string>() : input.dump();
}

static json parse_arguments(const std::string& args) {
    if (args.empty()) return json::object();
    try {
        return json::parse(args);
    } catch (const json::exception&) {
        return json(args);
    }
}

static std::string content_text(const json& content) {
    if (content.is_string()) return content.get<std::string>();
    std::string out;
    if (content.is_array()) {
        for (auto& part : content) {
            if (part.value("type", "") == "text") out += part.value("text", "");
        }
    }
    return out;
}

json encode_openai_messages(const std::vector<Message>& msgs, bool include_reasoning) {
    json out = json::array();
    for (auto& m : msgs) {
        // Tool results always travel as their own role:tool messages
        for (auto& tr : m.tool_results()) {
            out.push_back({{"role", "tool"}, {"tool_call_id", tr.tool_call_id}, {"content", tr.content}});
        }
        if (m.role() == Role::tool) continue;

        json wm;
        wm["role"] = role_name(m.role());
        auto attachments = m.attachments();
        if (attachments.empty()) {
            wm["content"] = m.text();
        } else {
            json parts = json::array();
            std::string text = m.text();
            if (!text.empty()) parts.push_back({{"type", "text"}, {"text", text}});
            for (auto& a : attachments) {
                if (a.media_type.rfind("image", 0) == 0) {
                    parts.push_back({{"type", "image_url"}, {"image_url", {{"url", a.uri}}}});
                } else {
                    parts.push_back({{"type", "text"},
                                     {"text", "[attachment: " + (a.label.empty() ? a.uri : a.label) +
                                              " <" + a.uri + ">]"}});
                }
            }
            wm["content"] = parts;
        }

        if (m.role() == Role::assistant) {
            auto calls = m.tool_calls();
            if (!calls.empty()) {
                if (wm["content"].is_string() && wm["content"].get<std::string>().empty()) {
                    wm["content"] = nullptr;
                }
                auto& arr = wm["tool_calls"];
                for (auto& tc : calls) {
                    arr.push_back({
                        {"id", tc.id},
                        {"type", "function"},
                        {"function", {{"name", tc.name}, {"arguments", arguments_string(tc.input)}}}
                    });
                }
            }
            if (include_reasoning) {
                std::string reasoning = m.reasoning();
                if (!reasoning.empty()) wm["reasoning_content"] = reasoning;
            }
        }
        out.push_back(std::move(wm));
    }
    return out;
}

Message decode_openai_message(const json& m, const std::string& provider) {
    if (!m.is_object()) throw TranslationError(provider, "message is not an object");
    std::string role = m.value("role", "");
    if (role.empty()) throw TranslationError(provider, "message without role");

    json content = m.contains("content") ? m["content"] : json();
    if (role == "tool") {
        return Message(Role::tool, {ToolResultSegment{m.value("tool_call_id", ""), content_text(content), false}});
    }

    Role r;
    try {
        r = parse_role(role);
    } catch (const Error& e) {
        throw TranslationError(provider, e.what());
    }

    std::vector<Segment> segments;
    if (m.contains("reasoning_content") && m["reasoning_content"].is_string()) {
        std::string reasoning = m["reasoning_content"].get<std::string>();
        if (!reasoning.empty()) segments.push_back(ReasoningSegment{reasoning, ""});
    }
    if (content.is_string()) {
        if (!content.get<std::string>().empty()) segments.push_back(TextSegment{content.get<std::string>()});
    } else if (content.is_array()) {
        for (auto& part : content) {
            std::string type = part.value("type", "");
            if (type == "text") {
                segments.push_back(TextSegment{part.value("text", "")});
            } else if (type == "image_url" && part.contains("image_url")) {
                auto& iu = part["image_url"];
                std::string url = iu.is_string() ? iu.get<std::string>() : iu.value("url", "");
                segments.push_back(AttachmentSegment{url, "image", ""});
            }
        }
    }
    if (m.contains("tool_calls") && m["tool_calls"].is_array()) {
        for (auto& tc : m["tool_calls"]) {
            ToolCallSegment seg;
            seg.id = tc.value("id", "");
            if (tc.contains("function")) {
                auto& fn = tc["function"];
                seg.name = fn.value("name", "");
                if (fn.contains("arguments")) {
                    seg.input = fn["arguments"].is_string()
                        ? parse_arguments(fn["arguments"].get<std::string>())
                        : fn["arguments"];
                }
            }
            if (seg.id.empty()) seg.id = generate_id("call");
            segments.push_back(std::move(seg));
        }
    }
    return Message(r, std::move(segments));
}

std::vector<Message> decode_openai_messages(const json& arr, const std::string& provider) {
    if (!arr.is_array()) throw TranslationError(provider, "messages is not an array");
    std::vector<Message> out;
    for (auto& m : arr) out.push_back(decode_openai_message(m, provider));
    return out;
}

json encode_openai_tools(const std::vector<ToolSpec>& tools) {
    json arr = json::array();
    for (auto& t : tools) {
        json params = t.parameters;
        if (!params.is_object()) params = json::object();
        if (!params.contains("type")) params["type"] = "object";
        arr.push_back({
            {"type", "function"},
            {"function", {{"name", t.name}, {"description", t.description}, {"parameters", params}}}
        });
    }
    return arr;
}

std::vector<ToolSpec> decode_openai_tools(const json& arr) {
    std::vector<ToolSpec> out;
    if (!arr.is_array()) return out;
    for (auto& t : arr) {
        if (!t.contains("function")) continue;
        auto& fn = t["function"];
        ToolSpec spec;
        spec.name = fn.value("name", "");
        spec.description = fn.value("description", "");
        if (fn.contains("parameters")) spec.parameters = fn["parameters"];
        out.push_back(std::move(spec));
    }
    return out;
}

FinishReason parse_openai_finish_reason(const std::string& s) {
    if (s == "stop") return FinishReason::stop;
    if (s == "tool_calls" || s == "function_call") return FinishReason::tool_calls;
    if (s == "length") return FinishReason::length;
    if (s == "content_filter") return FinishReason::content_filter;
    return FinishReason::unknown;
}

CanonicalRequest decode_openai_request(const json& body) {
    if (!body.is_object()) throw TranslationError("client", "request body is not an object");
    CanonicalRequest req;
    req.model = body.value("model", "");
    if (!body.contains("messages")) throw TranslationError("client", "request has no messages");
    req.messages = decode_openai_messages(body["messages"], "client");
    if (body.contains("tools")) req.tools = decode_openai_tools(body["tools"]);
    if (body.contains("max_completion_tokens") && body["max_completion_tokens"].is_number()) {
        req.max_tokens = body["max_completion_tokens"].get<int>();
    } else if (body.contains("max_tokens") && body["max_tokens"].is_number()) {
        req.max_tokens = body["max_tokens"].get<int>();
    }
    if (body.contains("temperature") && body["temperature"].is_number()) {
        req.temperature = body["temperature"].get<double>();
    }
    req.stream = body.value("stream", false);

    if (body.contains("reasoning_effort") && body["reasoning_effort"].is_string()) {
        req.thinking.enabled = true;
        req.thinking.effort = body["reasoning_effort"].get<std::string>();
    }
    if (body.contains("thinking") && body["thinking"].is_object()) {
        auto& t = body["thinking"];
        req.thinking.enabled = t.value("type", "enabled") != "disabled";
        req.thinking.budget_tokens = t.value("budget_tokens", 0);
    }
    return req;
}

CanonicalResponse decode_openai_response(const json& body, const std::string& provider) {
    if (!body.contains("choices") || !body["choices"].is_array() || body["choices"].empty()) {
        throw TranslationError(provider, "response has no choices");
    }
    auto& choice = body["choices"][0];
    if (!choice.contains("message")) throw TranslationError(provider, "choice has no message");

    CanonicalResponse resp;
    resp.id = body.value("id", "");
    resp.model = body.value("model", "");
    Message decoded = decode_openai_message(choice["message"], provider);
    resp.message = Message(Role::assistant, decoded.content(), resp.id);
    if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
        resp.finish_reason = parse_openai_finish_reason(choice["finish_reason"].get<std::string>());
    }
    if (body.contains("usage") && body["usage"].is_object()) {
        resp.usage.input_tokens = body["usage"].value("prompt_tokens", 0);
        resp.usage.output_tokens = body["usage"].value("completion_tokens", 0);
    }
    return resp;
}

static json encode_tool_calls(const std::vector<ToolCallSegment>& calls, bool with_index) {
    json arr = json::array();
    int index = 0;
    for (auto& tc : calls) {
        json j = {
            {"id", tc.id},
            {"type", "function"},
            {"function", {{"name", tc.name}, {"arguments", arguments_string(tc.input)}}}
        };
        if (with_index) j["index"] = index;
        index++;
        arr.push_back(std::move(j));
    }
    return arr;
}

json encode_openai_response(const CanonicalResponse& resp) {
    json msg = {{"role", "assistant"}, {"content", resp.message.text()}};
    auto calls = resp.message.tool_calls();
    if (!calls.empty()) msg["tool_calls"] = encode_tool_calls(calls, false);
    std::string reasoning = resp.message.reasoning();
    if (!reasoning.empty()) msg["reasoning_content"] = reasoning;

    return {
        {"id", resp.id.empty() ? generate_id("chatcmpl") : resp.id},
        {"object", "chat.completion"},
        {"created", epoch_now()},
        {"model", resp.model},
        {"choices", json::array({{
            {"index", 0},
            {"message", msg},
            {"finish_reason", finish_reason_name(resp.finish_reason)}
        }})},
        {"usage", {
            {"prompt_tokens", resp.usage.input_tokens},
            {"completion_tokens", resp.usage.output_tokens},
            {"total_tokens", resp.usage.input_tokens + resp.usage.output_tokens}
        }}
    };
}

json encode_openai_stream_delta(const std::string& id, const std::string& model, const std::string& text) {
    return {
        {"id", id},
        {"object", "chat.completion.chunk"},
        {"created", epoch_now()},
        {"model", model},
        {"choices", json::array({{
            {"index", 0},
            {"delta", {{"content", text}}},
            {"finish_reason", nullptr}
        }})}
    };
}

json encode_openai_stream_final(const CanonicalResponse& resp) {
    json delta = json::object();
    auto calls = resp.message.tool_calls();
    if (!calls.empty()) delta["tool_calls"] = encode_tool_calls(calls, true);
    return {
        {"id", resp.id},
        {"object", "chat.completion.chunk"},
        {"created", epoch_now()},
        {"model", resp.model},
        {"choices", json::array({{
            {"index", 0},
            {"delta", delta},
            {"finish_reason", finish_reason_name(resp.finish_reason)}
        }})},
        {"usage", {
            {"prompt_tokens", resp.usage.input_tokens},
            {"completion_tokens", resp.usage.output_tokens},
            {"total_tokens", resp.usage.input_tokens + resp.usage.output_tokens}
        }}
    };
}

} // namespace polygate
