#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "Errors.hpp"

namespace voxbridge {

// Telephony side: G.711 mu-law, 8 kHz, 20 ms frames
static constexpr unsigned TELEPHONY_SAMPLE_RATE = 8000;
static constexpr unsigned LIVE_INPUT_SAMPLE_RATE = 16000;
static constexpr unsigned LIVE_OUTPUT_SAMPLE_RATE = 24000;
static constexpr size_t FRAME_DURATION_MS = 20;
static constexpr size_t SAMPLES_PER_FRAME = TELEPHONY_SAMPLE_RATE * FRAME_DURATION_MS / 1000;
static constexpr size_t BYTES_PER_SAMPLE = 2;
static constexpr size_t DOWNSAMPLE_FACTOR = LIVE_OUTPUT_SAMPLE_RATE / TELEPHONY_SAMPLE_RATE;
// 3 samples x 2 bytes
static constexpr size_t OUTBOUND_CHUNK_ALIGNMENT = DOWNSAMPLE_FACTOR * BYTES_PER_SAMPLE;

enum class UpsamplePolicy { Duplicate, Interpolate };

struct ServerConfig {
    std::string address = "0.0.0.0";
    uint16_t port = 3000;  // NOLINT
    unsigned int threads = 0;  // 0 = hardware concurrency
};

struct LoggingConfig {
    std::string level = "debug";
    std::string file = "logs/voxbridge.log";
    size_t max_file_size = 1024 * 1024 * 5;
    size_t max_files = 3;
};

struct TelephonyConfig {
    std::string stream_path = "/connection";
    // Host placed in the TwiML stream URL. Empty = use the request's Host header.
    std::string public_host;
    size_t pending_audio_frames = 50;  // 1 s of 20 ms frames
};

struct LiveConfig {
    std::string host = "generativelanguage.googleapis.com";
    std::string port = "443";
    std::string path =
        "/ws/google.ai.generativelanguage.v1alpha.GenerativeService.BidiGenerateContent";
    std::string api_key;
    std::string model = "models/gemini-2.0-flash-exp";
    std::string voice = "Aoede";
    std::vector<std::string> response_modalities = {"AUDIO"};
    std::string system_prompt =
        "You are Emma, the receptionist of a barbershop. Keep answers short. "
        "Check availability before booking an appointment.";
    bool kickstart = true;
    std::string kickstart_text = "Start now.";
};

struct AudioConfig {
    UpsamplePolicy upsample = UpsamplePolicy::Duplicate;
    double output_gain = 1.0;
};

struct CalendarResource {
    std::string name;
    std::string calendar_id;
};

struct CalendarConfig {
    std::string api_host = "www.googleapis.com";
    std::string token_host = "oauth2.googleapis.com";
    std::string port = "443";
    std::string client_id;
    std::string client_secret;
    std::string refresh_token;
    std::string time_zone = "Europe/Sofia";
    std::string opening_time = "09:00";
    std::string closing_time = "19:00";
    unsigned int slot_minutes = 30;
    unsigned int booking_minutes = 30;
    std::vector<CalendarResource> resources;
};

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    TelephonyConfig telephony;
    LiveConfig live;
    AudioConfig audio;
    CalendarConfig calendar;
};

/**
 * @brief Loads configuration from a TOML file, then applies environment overrides
 * for secrets (GEMINI_API_KEY / API_KEY, GOOGLE_CLIENT_ID, GOOGLE_CLIENT_SECRET,
 * GOOGLE_REFRESH_TOKEN).
 * @param path Path to the .toml file (default: "config.toml")
 * @return Parsed AppConfig object. Defaults are used when the file does not exist.
 * @throws ConfigError if the file cannot be parsed or holds invalid values.
 */
AppConfig LoadConfig(const std::string& path = "config.toml");

UpsamplePolicy ParseUpsamplePolicy(const std::string& name);
const char* to_string(UpsamplePolicy policy);

}  // namespace voxbridge
