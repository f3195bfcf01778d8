#include "LiveMessages.hpp"

#include "Base64.hpp"
#include "Errors.hpp"

namespace json = boost::json;

namespace voxbridge::models {

namespace {

const json::value* field(const json::object& obj, std::string_view camel, std::string_view snake) {
    if (const auto* v = obj.if_contains(camel)) return v;
    return obj.if_contains(snake);
}

const json::object* object_field(const json::object& obj, std::string_view camel,
                                 std::string_view snake) {
    const auto* v = field(obj, camel, snake);
    return (v != nullptr && v->is_object()) ? &v->as_object() : nullptr;
}

const json::array* array_field(const json::object& obj, std::string_view camel,
                               std::string_view snake) {
    const auto* v = field(obj, camel, snake);
    return (v != nullptr && v->is_array()) ? &v->as_array() : nullptr;
}

std::string string_field(const json::object& obj, std::string_view camel, std::string_view snake) {
    const auto* v = field(obj, camel, snake);
    return (v != nullptr && v->is_string()) ? std::string(v->as_string()) : std::string{};
}

bool bool_field(const json::object& obj, std::string_view camel, std::string_view snake) {
    const auto* v = field(obj, camel, snake);
    return v != nullptr && v->is_bool() && v->as_bool();
}

void parse_server_content(const json::object& content, LiveServerMessage& out) {
    out.turn_complete = bool_field(content, "turnComplete", "turn_complete");
    out.interrupted = bool_field(content, "interrupted", "interrupted");

    const auto* turn = object_field(content, "modelTurn", "model_turn");
    if (turn == nullptr) return;

    const auto* parts = array_field(*turn, "parts", "parts");
    if (parts == nullptr) return;

    for (const auto& p : *parts) {
        if (!p.is_object()) continue;
        const auto& part_obj = p.as_object();

        LivePart part;
        part.text = string_field(part_obj, "text", "text");

        if (const auto* inline_data = object_field(part_obj, "inlineData", "inline_data")) {
            const auto data = string_field(*inline_data, "data", "data");
            if (!data.empty()) {
                audio::AudioChunk chunk;
                chunk.mime_type = string_field(*inline_data, "mimeType", "mime_type");
                chunk.data = Base64::Decode(data);
                part.audio = std::move(chunk);
            }
        }

        if (!part.text.empty() || part.audio) {
            out.parts.push_back(std::move(part));
        }
    }
}

void parse_tool_call(const json::object& tool_call, LiveServerMessage& out) {
    const auto* calls = array_field(tool_call, "functionCalls", "function_calls");
    if (calls == nullptr) return;

    for (const auto& c : *calls) {
        if (!c.is_object()) continue;
        const auto& call_obj = c.as_object();

        ToolCall call;
        call.id = string_field(call_obj, "id", "id");
        call.name = string_field(call_obj, "name", "name");
        if (const auto* args = object_field(call_obj, "args", "args")) {
            call.args = *args;
        }
        out.tool_calls.push_back(std::move(call));
    }
}

// {"parts":[{"text":...}]}
json::object text_parts(const std::string& text) {
    json::object part;
    part["text"] = text;
    json::array parts;
    parts.push_back(std::move(part));
    json::object out;
    out["parts"] = std::move(parts);
    return out;
}

}  // namespace

LiveServerMessage ParseLiveServerMessage(std::string_view text) {
    boost::system::error_code ec;
    json::value jv = json::parse(text, ec);
    if (ec) {
        throw MalformedFrameError("Invalid JSON: " + ec.message());
    }
    if (!jv.is_object()) {
        throw MalformedFrameError("Live message root must be a JSON object");
    }

    const auto& root = jv.as_object();
    LiveServerMessage msg;

    msg.setup_complete = field(root, "setupComplete", "setup_complete") != nullptr;
    msg.go_away = field(root, "goAway", "go_away") != nullptr;

    if (const auto* content = object_field(root, "serverContent", "server_content")) {
        parse_server_content(*content, msg);
    }

    if (const auto* tool_call = object_field(root, "toolCall", "tool_call")) {
        parse_tool_call(*tool_call, msg);
    }

    if (const auto* cancel = object_field(root, "toolCallCancellation", "tool_call_cancellation")) {
        if (const auto* ids = array_field(*cancel, "ids", "ids")) {
            for (const auto& id : *ids) {
                if (id.is_string()) {
                    msg.cancelled_tool_call_ids.emplace_back(id.as_string());
                }
            }
        }
    }

    return msg;
}

std::string BuildSetupMessage(const LiveConfig& cfg, const json::array& function_declarations) {
    json::array modalities;
    for (const auto& m : cfg.response_modalities) {
        modalities.emplace_back(m);
    }

    json::object generation_config;
    generation_config["responseModalities"] = std::move(modalities);
    json::object prebuilt_voice;
    prebuilt_voice["voiceName"] = cfg.voice;
    json::object voice_config;
    voice_config["prebuiltVoiceConfig"] = std::move(prebuilt_voice);
    json::object speech_config;
    speech_config["voiceConfig"] = std::move(voice_config);
    generation_config["speechConfig"] = std::move(speech_config);

    json::object setup;
    setup["model"] = cfg.model;
    setup["generationConfig"] = std::move(generation_config);
    setup["systemInstruction"] = text_parts(cfg.system_prompt);

    if (!function_declarations.empty()) {
        json::object tool;
        tool["functionDeclarations"] = function_declarations;
        json::array tools;
        tools.push_back(std::move(tool));
        setup["tools"] = std::move(tools);
    }

    json::object j;
    j["setup"] = std::move(setup);
    return json::serialize(j);
}

std::string BuildClientContent(const std::string& role, const std::string& text,
                               bool turn_complete) {
    json::object turn = text_parts(text);
    turn["role"] = role;

    json::array turns;
    turns.push_back(std::move(turn));
    json::object content;
    content["turns"] = std::move(turns);
    content["turnComplete"] = turn_complete;

    json::object j;
    j["clientContent"] = std::move(content);
    return json::serialize(j);
}

std::string BuildRealtimeInput(const audio::AudioChunk& chunk) {
    json::object media;
    media["mimeType"] = chunk.mime_type;
    media["data"] = Base64::Encode(chunk.data);

    json::array chunks;
    chunks.push_back(std::move(media));
    json::object input;
    input["mediaChunks"] = std::move(chunks);

    json::object j;
    j["realtimeInput"] = std::move(input);
    return json::serialize(j);
}

std::string BuildToolResponse(const std::vector<ToolResponse>& responses) {
    json::array function_responses;
    for (const auto& r : responses) {
        json::object fr;
        fr["id"] = r.id;
        fr["name"] = r.name;
        json::object response;
        response["result"] = r.result;
        fr["response"] = std::move(response);
        function_responses.push_back(std::move(fr));
    }

    json::object tool_response;
    tool_response["functionResponses"] = std::move(function_responses);

    json::object j;
    j["toolResponse"] = std::move(tool_response);
    return json::serialize(j);
}

}  // namespace voxbridge::models
