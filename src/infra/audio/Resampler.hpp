#pragma once

#include "PcmBuffer.hpp"
#include "config.hpp"

namespace voxbridge::audio {

/**
 * @brief 8 kHz -> 16 kHz. Output is exactly twice the input length.
 * @details
 * - Duplicate: zero-order hold, every sample emitted twice. Keeps the high
 *   frequency content of the narrowband signal.
 * - Interpolate: the inserted sample is the mean of a sample and its successor;
 *   the last sample is repeated since it has no successor.
 */
Pcm16k Upsample8to16(const Pcm8k& in, UpsamplePolicy policy = UpsamplePolicy::Duplicate);

/**
 * @brief 24 kHz -> 8 kHz by decimation (keeps samples 0, 3, 6, ...).
 * Output length is floor(input length / 3); there is no anti-aliasing filter.
 */
Pcm8k Downsample24to8(const Pcm24k& in);

/**
 * @brief Scales samples in place, saturating at the int16 range.
 * A gain of exactly 1.0 leaves the buffer untouched.
 */
void ApplyGain(std::vector<int16_t>& samples, double gain);

}  // namespace voxbridge::audio
