#pragma once
#include <cstddef>
#include <cstdint>
#include <span>

namespace voxbridge::audio {

// Largest magnitude the mu-law segments can represent; louder samples are clipped.
static constexpr int32_t MULAW_CLIP = 32635;
static constexpr uint8_t MULAW_SILENCE = 0xFF;

/**
 * @brief Encodes one 16-bit PCM sample into an 8-bit mu-law (G.711u) code.
 * Uses a pre-computed 65536-entry table indexed by `sample + 32768`.
 */
uint8_t EncodeMulaw(int16_t sample);

/**
 * @brief Decodes one mu-law code back to 16-bit PCM (256-entry table).
 */
int16_t DecodeMulaw(uint8_t code);

/**
 * @brief Encodes 16-bit PCM samples into 8-bit mu-law.
 * @param pcm Input buffer of 16-bit signed integers.
 * @param mulawOut Output buffer. Must be at least `pcm.size()` bytes.
 * @throws std::invalid_argument if the output buffer is too small.
 */
void encode_mulaw(std::span<const int16_t> pcm, std::span<uint8_t> mulawOut);

/**
 * @brief Decodes mu-law bytes to 16-bit PCM.
 * @throws std::invalid_argument if the output buffer is too small.
 */
void decode_mulaw(std::span<const uint8_t> mulaw, std::span<int16_t> pcmOut);

/**
 * @brief Size of the quantization interval a code belongs to (2^(exponent+3)).
 */
int32_t MulawStepSize(uint8_t code);

}  // namespace voxbridge::audio
