#include "Transcoder.hpp"

#include <fmt/format.h>

#include "Errors.hpp"
#include "Resampler.hpp"
#include "mulaw.hpp"

namespace voxbridge::audio {

AudioChunk Transcoder::TelephonyFrameToAIChunk(std::span<const uint8_t> mulaw) const {
    Pcm8k narrow;
    narrow.samples.resize(mulaw.size());
    decode_mulaw(mulaw, narrow.samples);

    const Pcm16k wide = Upsample8to16(narrow, cfg_.upsample);

    return AudioChunk{Pcm16k::MimeType(), wide.ToLittleEndian()};
}

std::vector<uint8_t> Transcoder::AIChunkToTelephonyFrame(std::span<const uint8_t> pcm24k) const {
    if (pcm24k.size() % OUTBOUND_CHUNK_ALIGNMENT != 0) {
        throw MalformedFrameError(fmt::format(
            "AI audio chunk of {} bytes is not a multiple of {}", pcm24k.size(),
            OUTBOUND_CHUNK_ALIGNMENT));
    }

    Pcm8k narrow = Downsample24to8(Pcm24k::FromLittleEndian(pcm24k));
    ApplyGain(narrow.samples, cfg_.output_gain);

    std::vector<uint8_t> frame(narrow.size());
    encode_mulaw(narrow.samples, frame);
    return frame;
}

}  // namespace voxbridge::audio
