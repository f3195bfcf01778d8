#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "config.hpp"

namespace voxbridge::audio {

/**
 * @brief 16-bit linear PCM samples tagged with their sample rate.
 * @details
 * Nothing in the wire format says which rate a block of PCM is at; the pipeline
 * stage decides. Carrying the rate in the type makes each stage state the rate it
 * consumes and produces, so a 24 kHz buffer cannot be fed to a 16 kHz stage.
 */
template <unsigned Rate>
struct PcmBuffer {
    static constexpr unsigned kSampleRate = Rate;

    std::vector<int16_t> samples;

    PcmBuffer() = default;
    explicit PcmBuffer(std::vector<int16_t> s) : samples(std::move(s)) {}

    std::size_t size() const noexcept { return samples.size(); }
    bool empty() const noexcept { return samples.empty(); }

    static std::string MimeType() { return fmt::format("audio/pcm;rate={}", Rate); }

    // Little-endian wire bytes. A trailing odd byte is ignored rather than read past.
    static PcmBuffer FromLittleEndian(std::span<const uint8_t> bytes) {
        PcmBuffer out;
        const std::size_t count = bytes.size() / sizeof(int16_t);
        out.samples.resize(count);
        for (std::size_t i = 0; i < count; ++i) {
            const auto lo = static_cast<uint16_t>(bytes[2 * i]);
            const auto hi = static_cast<uint16_t>(bytes[2 * i + 1]);
            out.samples[i] = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
        }
        return out;
    }

    std::vector<uint8_t> ToLittleEndian() const {
        std::vector<uint8_t> bytes(samples.size() * sizeof(int16_t));
        for (std::size_t i = 0; i < samples.size(); ++i) {
            const auto value = static_cast<uint16_t>(samples[i]);
            bytes[2 * i] = static_cast<uint8_t>(value & 0xFF);
            bytes[2 * i + 1] = static_cast<uint8_t>(value >> 8);
        }
        return bytes;
    }
};

using Pcm8k = PcmBuffer<TELEPHONY_SAMPLE_RATE>;
using Pcm16k = PcmBuffer<LIVE_INPUT_SAMPLE_RATE>;
using Pcm24k = PcmBuffer<LIVE_OUTPUT_SAMPLE_RATE>;

static_assert(LIVE_INPUT_SAMPLE_RATE == 2 * TELEPHONY_SAMPLE_RATE, "inbound path upsamples by exactly 2");

}  // namespace voxbridge::audio
