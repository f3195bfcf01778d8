/**
 * @file resampler_test.cpp
 * @brief Unit tests for the 8/16/24 kHz rate converters and output gain.
 */

#include "Resampler.hpp"

#include "gtest/gtest.h"

#include <vector>

using namespace voxbridge;
using namespace voxbridge::audio;

namespace {

TEST(ResamplerTest, UpsampleDoublesLength) {
  for (size_t n : {1U, 2U, 159U, 160U}) {
    Pcm8k in{std::vector<int16_t>(n, 7)};
    EXPECT_EQ(Upsample8to16(in).size(), 2 * n);
    EXPECT_EQ(Upsample8to16(in, UpsamplePolicy::Interpolate).size(), 2 * n);
  }
}

TEST(ResamplerTest, UpsampleOfEmptyIsEmpty) {
  EXPECT_TRUE(Upsample8to16(Pcm8k{}).empty());
  EXPECT_TRUE(Upsample8to16(Pcm8k{}, UpsamplePolicy::Interpolate).empty());
}

TEST(ResamplerTest, DuplicateRepeatsEachSample) {
  Pcm8k in{{100, -200, 300}};
  const auto out = Upsample8to16(in, UpsamplePolicy::Duplicate);
  EXPECT_EQ(out.samples, (std::vector<int16_t>{100, 100, -200, -200, 300, 300}));
}

TEST(ResamplerTest, InterpolateInsertsMidpoints) {
  Pcm8k in{{100, 300, -100}};
  const auto out = Upsample8to16(in, UpsamplePolicy::Interpolate);
  // Last sample has no successor and is repeated.
  EXPECT_EQ(out.samples, (std::vector<int16_t>{100, 200, 300, 100, -100, -100}));
}

TEST(ResamplerTest, InterpolateDoesNotOverflow) {
  Pcm8k in{{32767, 32767}};
  const auto out = Upsample8to16(in, UpsamplePolicy::Interpolate);
  EXPECT_EQ(out.samples[1], 32767);
}

TEST(ResamplerTest, DownsampleKeepsEveryThirdSample) {
  Pcm24k in{{1, 2, 3, 4, 5, 6, 7, 8, 9}};
  EXPECT_EQ(Downsample24to8(in).samples, (std::vector<int16_t>{1, 4, 7}));
}

TEST(ResamplerTest, DownsampleLengthIsFloorOfThird) {
  for (size_t n : {0U, 1U, 2U, 3U, 4U, 719U, 720U}) {
    Pcm24k in{std::vector<int16_t>(n, 0)};
    EXPECT_EQ(Downsample24to8(in).size(), n / 3) << n;
  }
}

TEST(ResamplerTest, UnityGainLeavesSamplesUntouched) {
  std::vector<int16_t> samples{-32768, -1, 0, 1, 32767};
  const auto before = samples;
  ApplyGain(samples, 1.0);
  EXPECT_EQ(samples, before);
}

TEST(ResamplerTest, GainSaturates) {
  std::vector<int16_t> samples{1000, -1000, 20000, -20000};
  ApplyGain(samples, 2.0);
  EXPECT_EQ(samples, (std::vector<int16_t>{2000, -2000, 32767, -32768}));
}

TEST(PcmBufferTest, LittleEndianRoundTripAndOddByte) {
  const std::vector<uint8_t> bytes{0x34, 0x12, 0xFF, 0xFF, 0x7F};
  const auto pcm = Pcm24k::FromLittleEndian(bytes);
  ASSERT_EQ(pcm.size(), 2U);
  EXPECT_EQ(pcm.samples[0], 0x1234);
  EXPECT_EQ(pcm.samples[1], -1);
  EXPECT_EQ(pcm.ToLittleEndian(), (std::vector<uint8_t>{0x34, 0x12, 0xFF, 0xFF}));
}

TEST(PcmBufferTest, MimeTypeCarriesRate) {
  EXPECT_EQ(Pcm16k::MimeType(), "audio/pcm;rate=16000");
  EXPECT_EQ(Pcm24k::kSampleRate, 24000U);
}

TEST(PcmBufferTest, RatesFollowTheWireFormats) {
  EXPECT_EQ(Pcm8k::kSampleRate, TELEPHONY_SAMPLE_RATE);
  EXPECT_EQ(Pcm16k::kSampleRate, LIVE_INPUT_SAMPLE_RATE);
  EXPECT_EQ(Pcm24k::kSampleRate, LIVE_OUTPUT_SAMPLE_RATE);
  // One 20 ms telephony frame.
  EXPECT_EQ(SAMPLES_PER_FRAME, 160U);
}

}  // namespace
