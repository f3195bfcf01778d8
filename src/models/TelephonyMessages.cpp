#include "TelephonyMessages.hpp"

#include <boost/json.hpp>

#include "Base64.hpp"
#include "Errors.hpp"

namespace json = boost::json;

namespace voxbridge::models {

namespace {

std::string string_or_empty(const json::object& obj, std::string_view key) {
    if (const auto* v = obj.if_contains(key); v != nullptr && v->is_string()) {
        return std::string(v->as_string());
    }
    return {};
}

const json::object* object_or_null(const json::object& obj, std::string_view key) {
    if (const auto* v = obj.if_contains(key); v != nullptr && v->is_object()) {
        return &v->as_object();
    }
    return nullptr;
}

TelephonyEventKind kind_from_name(std::string_view name) {
    if (name == "connected") return TelephonyEventKind::Connected;
    if (name == "start") return TelephonyEventKind::Start;
    if (name == "media") return TelephonyEventKind::Media;
    if (name == "mark") return TelephonyEventKind::Mark;
    if (name == "stop") return TelephonyEventKind::Stop;
    return TelephonyEventKind::Unknown;
}

}  // namespace

TelephonyEvent ParseTelephonyMessage(std::string_view text) {
    boost::system::error_code ec;
    json::value jv = json::parse(text, ec);
    if (ec) {
        throw MalformedFrameError("Invalid JSON: " + ec.message());
    }
    if (!jv.is_object()) {
        throw MalformedFrameError("Telephony message root must be a JSON object");
    }

    const auto& root = jv.as_object();
    TelephonyEvent event;
    event.event_name = string_or_empty(root, "event");
    if (event.event_name.empty()) {
        throw MalformedFrameError("Telephony message without an event name");
    }
    event.kind = kind_from_name(event.event_name);
    event.stream_sid = string_or_empty(root, "streamSid");

    switch (event.kind) {
        case TelephonyEventKind::Start: {
            if (const auto* start = object_or_null(root, "start")) {
                if (auto sid = string_or_empty(*start, "streamSid"); !sid.empty()) {
                    event.stream_sid = std::move(sid);
                }
                event.call_sid = string_or_empty(*start, "callSid");
            }
            if (event.stream_sid.empty()) {
                throw MalformedFrameError("start event without a streamSid");
            }
            break;
        }
        case TelephonyEventKind::Media: {
            const auto* media = object_or_null(root, "media");
            if (media == nullptr) {
                throw MalformedFrameError("media event without a media object");
            }
            const auto* payload = media->if_contains("payload");
            if (payload == nullptr || !payload->is_string()) {
                throw MalformedFrameError("media event without a payload");
            }
            event.payload = Base64::Decode(payload->as_string());
            break;
        }
        default:
            break;
    }

    return event;
}

std::string BuildTelephonyMedia(const std::string& stream_sid, std::span<const uint8_t> mulaw) {
    json::object media;
    media["payload"] = Base64::Encode(mulaw);

    json::object j;
    j["event"] = "media";
    j["streamSid"] = stream_sid;
    j["media"] = std::move(media);
    return json::serialize(j);
}

std::string BuildTelephonyClear(const std::string& stream_sid) {
    json::object j;
    j["event"] = "clear";
    j["streamSid"] = stream_sid;
    return json::serialize(j);
}

const char* to_string(TelephonyEventKind kind) {
    switch (kind) {
        case TelephonyEventKind::Connected:
            return "connected";
        case TelephonyEventKind::Start:
            return "start";
        case TelephonyEventKind::Media:
            return "media";
        case TelephonyEventKind::Mark:
            return "mark";
        case TelephonyEventKind::Stop:
            return "stop";
        case TelephonyEventKind::Unknown:
            return "unknown";
    }
    return "unknown";
}

}  // namespace voxbridge::models
