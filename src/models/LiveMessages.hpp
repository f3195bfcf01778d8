#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/json.hpp>

#include "ToolCall.hpp"
#include "Transcoder.hpp"
#include "config.hpp"

namespace voxbridge::models {

struct LivePart {
    std::string text;
    std::optional<audio::AudioChunk> audio;  // inlineData, already base64-decoded
};

/**
 * @brief Everything the relay needs from one server message of the live session.
 * A single message may carry several of these at once.
 */
struct LiveServerMessage {
    bool setup_complete = false;
    std::vector<LivePart> parts;
    bool turn_complete = false;
    bool interrupted = false;
    std::vector<ToolCall> tool_calls;
    std::vector<std::string> cancelled_tool_call_ids;
    bool go_away = false;
};

/**
 * @brief Parses a server message. Both camelCase and snake_case field names are
 * accepted since API versions disagree.
 * @throws MalformedFrameError on invalid JSON or invalid inline audio.
 */
LiveServerMessage ParseLiveServerMessage(std::string_view text);

// --- Client messages (always camelCase) ---

std::string BuildSetupMessage(const LiveConfig& cfg, const boost::json::array& function_declarations);

std::string BuildClientContent(const std::string& role, const std::string& text, bool turn_complete);

std::string BuildRealtimeInput(const audio::AudioChunk& chunk);

std::string BuildToolResponse(const std::vector<ToolResponse>& responses);

}  // namespace voxbridge::models
