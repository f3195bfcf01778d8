#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace voxbridge::models {

enum class TelephonyEventKind { Connected, Start, Media, Mark, Stop, Unknown };

/**
 * @brief One message of the telephony media-stream protocol.
 * @details
 * @code
 * {"event":"start","start":{"streamSid":"MZ..","callSid":"CA.."}}
 * {"event":"media","streamSid":"MZ..","media":{"payload":"<base64 mu-law>"}}
 * {"event":"stop","streamSid":"MZ.."}
 * @endcode
 */
struct TelephonyEvent {
    TelephonyEventKind kind = TelephonyEventKind::Unknown;
    std::string event_name;
    std::string stream_sid;
    std::string call_sid;
    std::vector<uint8_t> payload;  // decoded mu-law bytes for Media
};

/**
 * @throws MalformedFrameError when the text is not a JSON object with an "event"
 * string, or a media payload is missing or not base64.
 */
TelephonyEvent ParseTelephonyMessage(std::string_view text);

std::string BuildTelephonyMedia(const std::string& stream_sid, std::span<const uint8_t> mulaw);

// Asks the provider to drop audio it has buffered but not yet played.
std::string BuildTelephonyClear(const std::string& stream_sid);

const char* to_string(TelephonyEventKind kind);

}  // namespace voxbridge::models
