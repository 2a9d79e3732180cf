#include "message.hpp"
#include "errors.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace {

using polygate::Message;
using polygate::Role;

void Require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error(message);
    }
}

void ScenarioMixedSegmentsKeepOrder() {
    Message m(Role::assistant, {
        polygate::ReasoningSegment{"thinking it over", "sig-1"},
        polygate::TextSegment{"Reading "},
        polygate::ToolCallSegment{"call_1", "read_file", {{"path", "a.txt"}}},
        polygate::TextSegment{"now."},
    }, "msg_1");

    Require(m.text() == "Reading now.", "text() should concatenate text segments only");
    Require(m.reasoning() == "thinking it over", "reasoning() should return the reasoning text");
    Require(m.has_tool_calls(), "message should report its tool call");
    auto calls = m.tool_calls();
    Require(calls.size() == 1 && calls[0].input["path"] == "a.txt", "tool call input should be preserved");
}

void ScenarioJournalEncodingPreservesSegments() {
    Message m(Role::tool, {
        polygate::ToolResultSegment{"call_1", "boom", true},
        polygate::AttachmentSegment{"file:///tmp/x.png", "image/png", "x.png"},
    }, "msg_2");

    Message back = Message::from_json(m.to_json());
    Require(back.role() == Role::tool, "role should survive journal encoding");
    Require(back.id() == "msg_2", "id should survive journal encoding");
    auto results = back.tool_results();
    Require(results.size() == 1 && results[0].is_error, "error flag on tool result should survive");
    Require(back.attachments().size() == 1 && back.attachments()[0].media_type == "image/png",
            "attachment should survive journal encoding");
}

void ScenarioUnknownRoleAndSegmentRejected() {
    bool threw = false;
    try {
        polygate::parse_role("narrator");
    } catch (const polygate::Error&) {
        threw = true;
    }
    Require(threw, "unknown role should throw");

    threw = false;
    try {
        Message::from_json({{"role", "user"}, {"content", {{{"type", "hologram"}}}}});
    } catch (const polygate::Error&) {
        threw = true;
    }
    Require(threw, "unknown segment type should throw");

    Require(polygate::parse_role("developer") == Role::system, "developer role maps to system");
}

void ScenarioSizeEstimate() {
    Require(polygate::estimate_tokens(std::string()) == 0, "empty text is zero tokens");
    Require(polygate::estimate_tokens(std::string(8, 'a')) == 2, "8 bytes is 2 tokens");
    Require(polygate::estimate_tokens(std::string(9, 'a')) == 3, "partial tokens round up");

    Message m = Message::text(Role::user, std::string(784, 'x'));
    Require(polygate::estimate_tokens(m) == 200, "784 bytes plus message overhead is 200 tokens");

    Message call(Role::assistant, {polygate::ToolCallSegment{"c", "tool", nlohmann::json::object()}});
    // 4 overhead + 1 for "tool" + 1 for "{}" + 8 per call
    Require(polygate::estimate_tokens(call) == 14, "tool call estimate should include its overhead");
}

} // namespace

int main() {
    try {
        polygate::tests::Log("message_test: start");
        ScenarioMixedSegmentsKeepOrder();
        ScenarioJournalEncodingPreservesSegments();
        ScenarioUnknownRoleAndSegmentRejected();
        ScenarioSizeEstimate();
        polygate::tests::Log("message_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        polygate::tests::LogError(ex.what());
        return EXIT_FAILURE;
    }
}
