/**
 * @file telephony_messages_test.cpp
 * @brief Parsing and building of telephony media-stream messages.
 */

#include "TelephonyMessages.hpp"

#include "gtest/gtest.h"

#include <vector>

#include "Errors.hpp"
#include "test_support.hpp"

using namespace voxbridge;
using namespace voxbridge::models;
using voxbridge::testing::ParseObject;

namespace {

TEST(TelephonyMessagesTest, StartTakesStreamSidFromNestedObject) {
  const auto ev = ParseTelephonyMessage(
      R"({"event":"start","start":{"streamSid":"MZ123","callSid":"CA9"}})");
  EXPECT_EQ(ev.kind, TelephonyEventKind::Start);
  EXPECT_EQ(ev.stream_sid, "MZ123");
  EXPECT_EQ(ev.call_sid, "CA9");
}

TEST(TelephonyMessagesTest, StartFallsBackToTopLevelStreamSid) {
  const auto ev = ParseTelephonyMessage(R"({"event":"start","streamSid":"MZ7","start":{}})");
  EXPECT_EQ(ev.stream_sid, "MZ7");
}

TEST(TelephonyMessagesTest, StartWithoutStreamSidIsMalformed) {
  EXPECT_THROW(ParseTelephonyMessage(R"({"event":"start","start":{}})"), MalformedFrameError);
}

TEST(TelephonyMessagesTest, MediaPayloadIsDecoded) {
  const auto ev =
      ParseTelephonyMessage(R"({"event":"media","streamSid":"MZ1","media":{"payload":"/w=="}})");
  EXPECT_EQ(ev.kind, TelephonyEventKind::Media);
  EXPECT_EQ(ev.stream_sid, "MZ1");
  EXPECT_EQ(ev.payload, (std::vector<uint8_t>{0xFF}));
}

TEST(TelephonyMessagesTest, MediaWithBadPayloadIsMalformed) {
  EXPECT_THROW(ParseTelephonyMessage(R"({"event":"media","media":{"payload":"@@@@"}})"),
               MalformedFrameError);
  EXPECT_THROW(ParseTelephonyMessage(R"({"event":"media","media":{}})"), MalformedFrameError);
  EXPECT_THROW(ParseTelephonyMessage(R"({"event":"media"})"), MalformedFrameError);
}

TEST(TelephonyMessagesTest, MediaWithUnpaddedPayloadIsMalformed) {
  EXPECT_THROW(ParseTelephonyMessage(R"({"event":"media","media":{"payload":"AAAAAA"}})"),
               MalformedFrameError);
  EXPECT_THROW(ParseTelephonyMessage(R"({"event":"media","media":{"payload":"AA"}})"),
               MalformedFrameError);
}

TEST(TelephonyMessagesTest, RejectsMessagesWithoutEvent) {
  EXPECT_THROW(ParseTelephonyMessage(R"({"streamSid":"MZ1"})"), MalformedFrameError);
  EXPECT_THROW(ParseTelephonyMessage(R"({"event":42})"), MalformedFrameError);
  EXPECT_THROW(ParseTelephonyMessage("[1,2]"), MalformedFrameError);
  EXPECT_THROW(ParseTelephonyMessage("not json"), MalformedFrameError);
}

TEST(TelephonyMessagesTest, UnknownAndControlEvents) {
  EXPECT_EQ(ParseTelephonyMessage(R"({"event":"dtmf"})").kind, TelephonyEventKind::Unknown);
  EXPECT_EQ(ParseTelephonyMessage(R"({"event":"mark"})").kind, TelephonyEventKind::Mark);
  EXPECT_EQ(ParseTelephonyMessage(R"({"event":"connected"})").kind,
            TelephonyEventKind::Connected);

  const auto stop = ParseTelephonyMessage(R"({"event":"stop","streamSid":"MZ1"})");
  EXPECT_EQ(stop.kind, TelephonyEventKind::Stop);
  EXPECT_STREQ(to_string(stop.kind), "stop");
}

TEST(TelephonyMessagesTest, BuildMediaEncodesPayload) {
  const std::vector<uint8_t> frame{0xFF, 0xFF, 0xFF};
  const auto obj = ParseObject(BuildTelephonyMedia("MZ1", frame));

  EXPECT_EQ(obj.at("event").as_string(), "media");
  EXPECT_EQ(obj.at("streamSid").as_string(), "MZ1");
  EXPECT_EQ(obj.at("media").as_object().at("payload").as_string(), "////");

  // And what we build we can read back.
  const auto ev = ParseTelephonyMessage(BuildTelephonyMedia("MZ1", frame));
  EXPECT_EQ(ev.payload, frame);
}

TEST(TelephonyMessagesTest, BuildClear) {
  const auto obj = ParseObject(BuildTelephonyClear("MZ1"));
  EXPECT_EQ(obj.at("event").as_string(), "clear");
  EXPECT_EQ(obj.at("streamSid").as_string(), "MZ1");
  EXPECT_EQ(obj.size(), 2U);
}

}  // namespace
