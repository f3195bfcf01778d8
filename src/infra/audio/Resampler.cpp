#include "Resampler.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace voxbridge::audio {

Pcm16k Upsample8to16(const Pcm8k& in, UpsamplePolicy policy) {
    Pcm16k out;
    const std::size_t n = in.size();
    out.samples.resize(n * 2);

    for (std::size_t i = 0; i < n; ++i) {
        const int16_t current = in.samples[i];
        int16_t inserted = current;

        if (policy == UpsamplePolicy::Interpolate && i + 1 < n) {
            const int32_t sum = static_cast<int32_t>(current) + in.samples[i + 1];
            inserted = static_cast<int16_t>(sum / 2);
        }

        out.samples[2 * i] = current;
        out.samples[2 * i + 1] = inserted;
    }

    return out;
}

Pcm8k Downsample24to8(const Pcm24k& in) {
    Pcm8k out;
    const std::size_t out_len = in.size() / DOWNSAMPLE_FACTOR;
    out.samples.resize(out_len);

    for (std::size_t i = 0; i < out_len; ++i) {
        out.samples[i] = in.samples[i * DOWNSAMPLE_FACTOR];
    }

    return out;
}

void ApplyGain(std::vector<int16_t>& samples, double gain) {
    if (gain == 1.0) {
        return;
    }

    static constexpr double MAX_SAMPLE = std::numeric_limits<int16_t>::max();
    static constexpr double MIN_SAMPLE = std::numeric_limits<int16_t>::min();

    for (auto& sample : samples) {
        const double scaled = std::round(static_cast<double>(sample) * gain);
        sample = static_cast<int16_t>(std::clamp(scaled, MIN_SAMPLE, MAX_SAMPLE));
    }
}

}  // namespace voxbridge::audio
