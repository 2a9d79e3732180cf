#pragma once
#include "../message.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace polygate {

// Chat-completions wire format, shared by the OpenAI-style adapters and the
// gateway's client-facing endpoint.

nlohmann::json encode_openai_messages(const std::vector<Message>& msgs, bool include_reasoning);
std::vector<Message> decode_openai_messages(const nlohmann::json& arr, const std::string& provider);
Message decode_openai_message(const nlohmann::json& m, const std::string& provider);

nlohmann::json encode_openai_tools(const std::vector<ToolSpec>& tools);
std::vector<ToolSpec> decode_openai_tools(const nlohmann::json& arr);

FinishReason parse_openai_finish_reason(const std::string& s);

// Client request body -> canonical request (model may carry a "provider/" prefix)
CanonicalRequest decode_openai_request(const nlohmann::json& body);

CanonicalResponse decode_openai_response(const nlohmann::json& body, const std::string& provider);
nlohmann::json encode_openai_response(const CanonicalResponse& resp);

nlohmann::json encode_openai_stream_delta(const std::string& id, const std::string& model,
                                          const std::string& text);
nlohmann::json encode_openai_stream_final(const CanonicalResponse& resp);

} // namespace polygate
