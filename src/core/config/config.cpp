#include "config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <string_view>
#include <toml++/toml.hpp>

namespace voxbridge {

namespace {

// Environment wins over the file so secrets can stay out of config.toml.
void override_from_env(std::string& target, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (const char* value = std::getenv(name); value != nullptr && *value != '\0') {
            target = value;
            spdlog::debug("Config value taken from environment variable {}", name);
            return;
        }
    }
}

void apply_environment(AppConfig& config) {
    override_from_env(config.live.api_key, {"GEMINI_API_KEY", "API_KEY"});
    override_from_env(config.calendar.client_id, {"GOOGLE_CLIENT_ID"});
    override_from_env(config.calendar.client_secret, {"GOOGLE_CLIENT_SECRET"});
    override_from_env(config.calendar.refresh_token, {"GOOGLE_REFRESH_TOKEN"});
}

std::vector<std::string> read_string_array(const toml::node_view<toml::node>& node,
                                           std::vector<std::string> fallback) {
    const auto* arr = node.as_array();
    if (arr == nullptr) {
        return fallback;
    }
    std::vector<std::string> out;
    for (const auto& el : *arr) {
        if (auto value = el.value<std::string>()) {
            out.push_back(*value);
        }
    }
    return out;
}

}  // namespace

UpsamplePolicy ParseUpsamplePolicy(const std::string& name) {
    if (name == "duplicate") return UpsamplePolicy::Duplicate;
    if (name == "interpolate") return UpsamplePolicy::Interpolate;
    throw ConfigError("Unknown upsample policy: " + name);
}

const char* to_string(UpsamplePolicy policy) {
    switch (policy) {
        case UpsamplePolicy::Duplicate:
            return "duplicate";
        case UpsamplePolicy::Interpolate:
            return "interpolate";
    }
    return "unknown";
}

AppConfig LoadConfig(const std::string& path) {
    AppConfig config;

    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file '{}' not found. Using defaults.", path);
        apply_environment(config);
        return config;
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config file: {}", err.description());
        throw ConfigError("Config parse error");
    }

    // 1. Server Settings
    if (auto server = tbl["server"]) {
        config.server.address = server["address"].value_or(config.server.address);
        config.server.port = server["port"].value_or(config.server.port);
        config.server.threads = server["threads"].value_or(config.server.threads);
    }

    // 2. Logging
    if (auto logging = tbl["logging"]) {
        config.logging.level = logging["level"].value_or(config.logging.level);
        config.logging.file = logging["file"].value_or(config.logging.file);
        config.logging.max_file_size =
            logging["max_file_size"].value_or(config.logging.max_file_size);
        config.logging.max_files = logging["max_files"].value_or(config.logging.max_files);
    }

    // 3. Telephony Media Stream
    if (auto telephony = tbl["telephony"]) {
        config.telephony.stream_path =
            telephony["stream_path"].value_or(config.telephony.stream_path);
        config.telephony.public_host =
            telephony["public_host"].value_or(config.telephony.public_host);
        config.telephony.pending_audio_frames = telephony["pending_audio_frames"].value_or(
            config.telephony.pending_audio_frames);
    }

    // 4. Live AI Session
    if (auto live = tbl["live"]) {
        config.live.host = live["host"].value_or(config.live.host);
        config.live.port = live["port"].value_or(config.live.port);
        config.live.path = live["path"].value_or(config.live.path);
        config.live.api_key = live["api_key"].value_or(config.live.api_key);
        config.live.model = live["model"].value_or(config.live.model);
        config.live.voice = live["voice"].value_or(config.live.voice);
        config.live.system_prompt = live["system_prompt"].value_or(config.live.system_prompt);
        config.live.kickstart = live["kickstart"].value_or(config.live.kickstart);
        config.live.kickstart_text = live["kickstart_text"].value_or(config.live.kickstart_text);
        config.live.response_modalities =
            read_string_array(live["response_modalities"], config.live.response_modalities);
    }

    // 5. Audio Pipeline
    if (auto audio = tbl["audio"]) {
        config.audio.upsample =
            ParseUpsamplePolicy(audio["upsample"].value_or(std::string{"duplicate"}));
        config.audio.output_gain = audio["output_gain"].value_or(config.audio.output_gain);
        if (config.audio.output_gain <= 0.0) {
            throw ConfigError("audio.output_gain must be positive");
        }
    }

    // 6. Scheduling Backend
    if (auto calendar = tbl["calendar"]) {
        auto& cal = config.calendar;
        cal.api_host = calendar["api_host"].value_or(cal.api_host);
        cal.token_host = calendar["token_host"].value_or(cal.token_host);
        cal.port = calendar["port"].value_or(cal.port);
        cal.client_id = calendar["client_id"].value_or(cal.client_id);
        cal.client_secret = calendar["client_secret"].value_or(cal.client_secret);
        cal.refresh_token = calendar["refresh_token"].value_or(cal.refresh_token);
        cal.time_zone = calendar["time_zone"].value_or(cal.time_zone);
        cal.opening_time = calendar["opening_time"].value_or(cal.opening_time);
        cal.closing_time = calendar["closing_time"].value_or(cal.closing_time);
        cal.slot_minutes = calendar["slot_minutes"].value_or(cal.slot_minutes);
        cal.booking_minutes =
            calendar["booking_minutes"].value_or(cal.booking_minutes);

        if (cal.slot_minutes == 0 || cal.booking_minutes == 0) {
            throw ConfigError("calendar.slot_minutes and calendar.booking_minutes must be > 0");
        }

        if (const auto* resources = calendar["resources"].as_array()) {
            for (const auto& el : *resources) {
                const auto* entry = el.as_table();
                if (entry == nullptr) {
                    throw ConfigError("calendar.resources entries must be tables");
                }
                CalendarResource resource;
                resource.name = (*entry)["name"].value_or(std::string{});
                resource.calendar_id = (*entry)["calendar_id"].value_or(std::string{"primary"});
                if (resource.name.empty()) {
                    throw ConfigError("calendar.resources entry without a name");
                }
                cal.resources.push_back(std::move(resource));
            }
        }
    }

    apply_environment(config);

    spdlog::info("Loaded configuration from {}", path);
    return config;
}

}  // namespace voxbridge
