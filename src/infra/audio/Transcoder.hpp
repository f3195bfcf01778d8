#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "PcmBuffer.hpp"
#include "config.hpp"

namespace voxbridge::audio {

/**
 * @brief Audio as the live AI session carries it: PCM bytes plus a MIME tag that
 * names the rate (e.g. "audio/pcm;rate=16000").
 */
struct AudioChunk {
    std::string mime_type;
    std::vector<uint8_t> data;
};

/**
 * @brief Converts audio between the telephony leg and the AI leg.
 * @details
 * Inbound:  mu-law 8 kHz -> decode -> upsample -> PCM 16 kHz little-endian.
 * Outbound: PCM 24 kHz little-endian -> downsample -> gain -> encode -> mu-law 8 kHz.
 *
 * Both directions are pure and frame-local: one input frame gives exactly one
 * output frame, and no state is carried between calls. The outbound side assumes
 * the AI speaks at 24 kHz and never inspects the chunk's MIME tag.
 */
class Transcoder {
   public:
    explicit Transcoder(AudioConfig cfg = {}) : cfg_(cfg) {}

    AudioChunk TelephonyFrameToAIChunk(std::span<const uint8_t> mulaw) const;

    /**
     * @throws MalformedFrameError if the byte length is not a multiple of
     * OUTBOUND_CHUNK_ALIGNMENT (whole groups of three 16-bit samples).
     */
    std::vector<uint8_t> AIChunkToTelephonyFrame(std::span<const uint8_t> pcm24k) const;

    const AudioConfig& config() const noexcept { return cfg_; }

   private:
    AudioConfig cfg_;
};

}  // namespace voxbridge::audio
