#include "mulaw.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace voxbridge::audio {

static constexpr int16_t MIN_16BIT_VALUE = std::numeric_limits<int16_t>::min();
static constexpr int16_t MAX_16BIT_VALUE = std::numeric_limits<int16_t>::max();
static constexpr uint32_t VALUE_COUNT_16BIT = MAX_16BIT_VALUE - MIN_16BIT_VALUE + 1;

static constexpr uint8_t MIN_U8BIT_VALUE = std::numeric_limits<uint8_t>::min();
static constexpr uint8_t MAX_U8BIT_VALUE = std::numeric_limits<uint8_t>::max();
static constexpr uint16_t VALUE_COUNT_U8BIT = MAX_U8BIT_VALUE - MIN_U8BIT_VALUE + 1;

static constexpr int32_t MULAW_BIAS = 0x84;
static constexpr uint8_t QUANT_MASK = 0b0000'1111;
static constexpr uint8_t SEGMENT_MASK = 0b0111'0000;
static constexpr uint8_t SIGN_BIT_MASK = 0b1000'0000;
static constexpr uint8_t SEGMENT_SHIFT = 4;
static constexpr uint8_t QUANT_SHIFT = 3;

static uint16_t get_encode_table_idx(const int16_t pcm_sample) {
    static constexpr int32_t PCM_IDX_DIFF = -static_cast<int32_t>(MIN_16BIT_VALUE);
    return static_cast<uint16_t>(pcm_sample + PCM_IDX_DIFF);
}

// The mu-law algorithm requires signed bitwise operations.
// NOLINTBEGIN(hicpp-signed-bitwise)

static uint8_t compute_mulaw(int32_t pcm_sample) {
    uint8_t sign = 0;
    if (pcm_sample < 0) {
        sign = SIGN_BIT_MASK;
        pcm_sample = -pcm_sample;
    }
    if (pcm_sample > MULAW_CLIP) {
        pcm_sample = MULAW_CLIP;
    }
    pcm_sample += MULAW_BIAS;

    // Segment = position of the highest set bit above bit 7.
    uint8_t segment_idx = 7;
    for (int32_t mask = 0x4000; (pcm_sample & mask) == 0 && segment_idx > 0; mask >>= 1) {
        --segment_idx;
    }

    const auto mantissa =
        static_cast<uint8_t>((pcm_sample >> (segment_idx + QUANT_SHIFT)) & QUANT_MASK);
    const auto shifted_segment = static_cast<uint8_t>(segment_idx << SEGMENT_SHIFT);

    // Codes are transmitted inverted.
    return static_cast<uint8_t>(~(sign | shifted_segment | mantissa));
}

static std::array<uint8_t, VALUE_COUNT_16BIT> make_encode_table() {
    std::array<uint8_t, VALUE_COUNT_16BIT> encode_table{};

    // Using wide_pcm_sample because we need it to reach MAX_16BIT_VALUE + 1 for
    // the loop's exit condition.
    for (int32_t wide_pcm_sample = MIN_16BIT_VALUE; wide_pcm_sample <= MAX_16BIT_VALUE;
         wide_pcm_sample++) {
        const auto pcm_sample = static_cast<int16_t>(wide_pcm_sample);
        encode_table.at(get_encode_table_idx(pcm_sample)) = compute_mulaw(wide_pcm_sample);
    }

    return encode_table;
}

static std::array<int16_t, VALUE_COUNT_U8BIT> make_decode_table() {
    std::array<int16_t, VALUE_COUNT_U8BIT> decode_table{};

    for (uint16_t wide_mulaw_sample = MIN_U8BIT_VALUE; wide_mulaw_sample <= MAX_U8BIT_VALUE;
         wide_mulaw_sample++) {
        const auto mulaw_sample = static_cast<uint8_t>(~wide_mulaw_sample);

        const int32_t segment_idx = (mulaw_sample & SEGMENT_MASK) >> SEGMENT_SHIFT;
        int32_t magnitude = ((mulaw_sample & QUANT_MASK) << QUANT_SHIFT) + MULAW_BIAS;
        magnitude <<= segment_idx;
        magnitude -= MULAW_BIAS;

        const bool negative = (mulaw_sample & SIGN_BIT_MASK) != 0;
        decode_table.at(wide_mulaw_sample) = static_cast<int16_t>(negative ? -magnitude : magnitude);
    }

    return decode_table;
}

// NOLINTEND(hicpp-signed-bitwise)

static const std::array<uint8_t, VALUE_COUNT_16BIT>& encode_table() {
    static const auto table = make_encode_table();
    return table;
}

static const std::array<int16_t, VALUE_COUNT_U8BIT>& decode_table() {
    static const auto table = make_decode_table();
    return table;
}

uint8_t EncodeMulaw(int16_t sample) {
    return encode_table()[get_encode_table_idx(sample)];
}

int16_t DecodeMulaw(uint8_t code) {
    return decode_table()[code];
}

int32_t MulawStepSize(uint8_t code) {
    const auto inverted = static_cast<uint8_t>(~code);
    const int32_t segment_idx = (inverted & SEGMENT_MASK) >> SEGMENT_SHIFT;
    return 1 << (segment_idx + QUANT_SHIFT);
}

void encode_mulaw(std::span<const int16_t> pcm, std::span<uint8_t> mulawOut) {
    if (pcm.size() > mulawOut.size()) {
        throw std::invalid_argument("encode_mulaw: output buffer too small");
    }

    const auto& table = encode_table();
    for (std::size_t i = 0; i < pcm.size(); ++i) {
        mulawOut[i] = table[get_encode_table_idx(pcm[i])];
    }
}

void decode_mulaw(std::span<const uint8_t> mulaw, std::span<int16_t> pcmOut) {
    if (mulaw.size() > pcmOut.size()) {
        throw std::invalid_argument("decode_mulaw: output buffer too small");
    }

    const auto& table = decode_table();
    for (std::size_t i = 0; i < mulaw.size(); ++i) {
        pcmOut[i] = table[mulaw[i]];
    }
}

}  // namespace voxbridge::audio
