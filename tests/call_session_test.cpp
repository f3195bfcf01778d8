/**
 * @file call_session_test.cpp
 * @brief Call relay state machine, audio forwarding and tool-call handling,
 * driven through in-memory channels.
 */

#include "CallSession.hpp"

#include "gtest/gtest.h"

#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "Base64.hpp"
#include "LiveMessages.hpp"
#include "SchedulingTools.hpp"
#include "TelephonyMessages.hpp"
#include "ToolDispatcher.hpp"
#include "Transcoder.hpp"
#include "test_support.hpp"

using namespace voxbridge;
using namespace voxbridge::testing;

namespace {

constexpr const char* kStart =
    R"({"event":"start","start":{"streamSid":"MZ1","callSid":"CA1"}})";

std::string MediaMessage(uint8_t fill, size_t size = SAMPLES_PER_FRAME) {
  const std::vector<uint8_t> frame(size, fill);
  return models::BuildTelephonyMedia("MZ1", frame);
}

std::string AiAudioMessage(size_t bytes) {
  const std::vector<uint8_t> pcm(bytes, 0);
  return R"({"serverContent":{"modelTurn":{"parts":[{"inlineData":{"mimeType":"audio/pcm;rate=24000","data":")" +
         Base64::Encode(pcm) + R"("}}]}}})";
}

class CallSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto dispatcher = std::make_shared<ToolDispatcher>();
    RegisterSchedulingTools(*dispatcher, backend);
    tools = dispatcher;
  }

  std::shared_ptr<CallSession> MakeSession(CallSessionConfig cfg = {}) {
    auto session = std::make_shared<CallSession>(ioc.get_executor(), "call-1", telephony, live,
                                                 tools, std::move(cfg));
    session->AttachObserver(observer);
    session->SetCloseHandler([this](const std::string& id) {
      closed_ids.push_back(id);
    });
    session->Start();
    return session;
  }

  // Runs everything queued on the session executor.
  void Drain() {
    ioc.restart();
    ioc.run();
  }

  boost::asio::io_context ioc;
  std::shared_ptr<FakeTelephonyChannel> telephony = std::make_shared<FakeTelephonyChannel>();
  std::shared_ptr<FakeLiveChannel> live = std::make_shared<FakeLiveChannel>();
  std::shared_ptr<FakeSchedulingBackend> backend = std::make_shared<FakeSchedulingBackend>();
  std::shared_ptr<const ToolDispatcher> tools;
  std::shared_ptr<RecordingObserver> observer = std::make_shared<RecordingObserver>();
  std::vector<std::string> closed_ids;
};

TEST_F(CallSessionTest, StartOpensAiSessionWithSetupAndKickstart) {
  auto session = MakeSession();
  EXPECT_TRUE(telephony->started);
  EXPECT_EQ(session->state(), CallState::Idle);

  session->OnTelephonyMessage(kStart);

  EXPECT_EQ(session->state(), CallState::Connecting);
  EXPECT_EQ(session->stream_sid(), "MZ1");
  EXPECT_EQ(live->open_calls, 1);
  ASSERT_EQ(live->Kinds(), (std::vector<std::string>{"setup", "clientContent"}));

  const auto setup = ParseObject(live->sent[0]).at("setup").as_object();
  const auto& decls = setup.at("tools").as_array().at(0).as_object().at("functionDeclarations");
  EXPECT_EQ(decls.as_array().size(), 2U);

  session->OnLiveOpen();
  EXPECT_EQ(session->state(), CallState::Active);
  EXPECT_EQ(observer->states,
            (std::vector<CallState>{CallState::Connecting, CallState::Active}));
}

TEST_F(CallSessionTest, KickstartCanBeDisabled) {
  CallSessionConfig cfg;
  cfg.live.kickstart = false;
  auto session = MakeSession(cfg);

  session->OnTelephonyMessage(kStart);
  EXPECT_EQ(live->Kinds(), (std::vector<std::string>{"setup"}));
}

TEST_F(CallSessionTest, DuplicateStartIsIgnored) {
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnTelephonyMessage(kStart);
  EXPECT_EQ(live->open_calls, 1);
  EXPECT_EQ(live->sent.size(), 2U);
}

TEST_F(CallSessionTest, MediaBeforeStartIsDropped) {
  auto session = MakeSession();
  session->OnTelephonyMessage(MediaMessage(0xFF));

  EXPECT_EQ(session->state(), CallState::Idle);
  EXPECT_EQ(session->pending_audio_frames(), 0U);
  EXPECT_EQ(live->open_calls, 0);
  EXPECT_TRUE(live->sent.empty());
}

TEST_F(CallSessionTest, MediaWhileConnectingIsBufferedDroppingOldest) {
  CallSessionConfig cfg;
  cfg.pending_audio_frames = 3;
  cfg.live.kickstart = false;
  auto session = MakeSession(cfg);
  session->OnTelephonyMessage(kStart);

  for (uint8_t fill = 0xF0; fill < 0xF5; ++fill) {
    session->OnTelephonyMessage(MediaMessage(fill));
  }
  EXPECT_EQ(session->pending_audio_frames(), 3U);
  EXPECT_EQ(live->sent.size(), 1U);  // setup only

  session->OnLiveOpen();

  EXPECT_EQ(session->pending_audio_frames(), 0U);
  ASSERT_EQ(live->sent.size(), 4U);
  audio::Transcoder transcoder;
  for (uint8_t i = 0; i < 3; ++i) {
    const std::vector<uint8_t> frame(SAMPLES_PER_FRAME, static_cast<uint8_t>(0xF2 + i));
    EXPECT_EQ(live->sent[1 + i],
              models::BuildRealtimeInput(transcoder.TelephonyFrameToAIChunk(frame)));
  }
}

TEST_F(CallSessionTest, ActiveMediaIsForwardedAsRealtimeInput) {
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();
  live->sent.clear();

  session->OnTelephonyMessage(MediaMessage(0xFF));

  ASSERT_EQ(live->Kinds(), (std::vector<std::string>{"realtimeInput"}));
  const auto input = ParseObject(live->sent[0]).at("realtimeInput").as_object();
  const auto& chunk = input.at("mediaChunks").as_array().at(0).as_object();
  EXPECT_EQ(chunk.at("mimeType").as_string(), "audio/pcm;rate=16000");
  EXPECT_EQ(Base64::Decode(chunk.at("data").as_string()), std::vector<uint8_t>(640, 0));
}

TEST_F(CallSessionTest, EmptyMediaFrameIsSkipped) {
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();
  live->sent.clear();

  session->OnTelephonyMessage(R"({"event":"media","streamSid":"MZ1","media":{"payload":""}})");
  EXPECT_TRUE(live->sent.empty());
}

TEST_F(CallSessionTest, AiAudioIsSentToTelephony) {
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();

  session->OnLiveMessage(AiAudioMessage(1440));

  ASSERT_EQ(telephony->sent.size(), 1U);
  const auto ev = models::ParseTelephonyMessage(telephony->sent[0]);
  EXPECT_EQ(ev.kind, models::TelephonyEventKind::Media);
  EXPECT_EQ(ev.stream_sid, "MZ1");
  EXPECT_EQ(ev.payload, std::vector<uint8_t>(240, 0xFF));
}

TEST_F(CallSessionTest, MisalignedAiAudioIsDropped) {
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();

  session->OnLiveMessage(AiAudioMessage(1442));

  EXPECT_TRUE(telephony->sent.empty());
  EXPECT_EQ(session->state(), CallState::Active);
}

TEST_F(CallSessionTest, AiTextGoesToObserver) {
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();

  session->OnLiveMessage(R"({"serverContent":{"modelTurn":{"parts":[{"text":"Hi there"}]}}})");
  EXPECT_EQ(observer->transcripts, (std::vector<std::string>{"Hi there"}));
}

TEST_F(CallSessionTest, InterruptionClearsTelephonyPlayback) {
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();

  session->OnLiveMessage(R"({"serverContent":{"interrupted":true}})");

  ASSERT_EQ(telephony->sent.size(), 1U);
  EXPECT_EQ(telephony->sent[0], models::BuildTelephonyClear("MZ1"));
}

TEST_F(CallSessionTest, MalformedMessagesAreIgnored) {
  auto session = MakeSession();
  session->OnTelephonyMessage("{oops");
  session->OnTelephonyMessage(R"({"no_event":true})");
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();
  session->OnLiveMessage("not json at all");
  session->OnTelephonyMessage(R"({"event":"media","media":{"payload":"!!"}})");

  EXPECT_EQ(session->state(), CallState::Active);
  EXPECT_TRUE(telephony->sent.empty());
  EXPECT_TRUE(closed_ids.empty());
}

TEST_F(CallSessionTest, StopEventClosesBothSidesOnce) {
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();

  session->OnTelephonyMessage(R"({"event":"stop","streamSid":"MZ1"})");

  EXPECT_EQ(session->state(), CallState::Closed);
  EXPECT_EQ(telephony->close_calls, 1);
  EXPECT_EQ(live->close_calls, 1);
  EXPECT_EQ(closed_ids, (std::vector<std::string>{"call-1"}));
  EXPECT_EQ(observer->states.back(), CallState::Closed);

  // Everything after Closed is a no-op.
  const auto sent_before = live->sent.size();
  session->OnTelephonyMessage(MediaMessage(0xFF));
  session->OnLiveMessage(AiAudioMessage(1440));
  session->OnTelephonyClosed("socket gone");
  session->OnLiveClosed("socket gone");

  EXPECT_EQ(live->sent.size(), sent_before);
  EXPECT_TRUE(telephony->sent.empty());
  EXPECT_EQ(telephony->close_calls, 1);
  EXPECT_EQ(closed_ids.size(), 1U);
}

TEST_F(CallSessionTest, StopIsPostedToSessionExecutor) {
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);

  session->Stop();
  EXPECT_EQ(session->state(), CallState::Connecting);

  Drain();
  EXPECT_EQ(session->state(), CallState::Closed);
  EXPECT_EQ(session->pending_audio_frames(), 0U);
  EXPECT_EQ(closed_ids.size(), 1U);
}

TEST_F(CallSessionTest, TelephonyCloseEndsCall) {
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();

  session->OnTelephonyClosed("end of stream");

  EXPECT_EQ(session->state(), CallState::Closed);
  EXPECT_EQ(live->close_calls, 1);
  EXPECT_TRUE(observer->errors.empty());
}

TEST_F(CallSessionTest, AiClosingBeforeReadyReportsErrorAndHangsUp) {
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);

  session->OnLiveClosed("handshake failed");

  EXPECT_EQ(session->state(), CallState::Closed);
  EXPECT_EQ(telephony->close_calls, 1);
  ASSERT_EQ(observer->errors.size(), 1U);
  EXPECT_NE(observer->errors[0].find("before setup completed"), std::string::npos);
}

TEST_F(CallSessionTest, GoAwayClosesCall) {
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();

  session->OnLiveMessage(R"({"goAway":{"timeLeft":"5s"}})");

  EXPECT_EQ(session->state(), CallState::Closed);
  EXPECT_EQ(telephony->close_calls, 1);
}

TEST_F(CallSessionTest, ToolCallResultIsSentBack) {
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();
  live->sent.clear();

  session->OnLiveMessage(R"({"toolCall":{"functionCalls":[{"id":"t1","name":"CheckAvailability",
      "args":{"date":"2024-05-10","resource":"Jason"}}]}})");
  EXPECT_EQ(session->tool_calls_in_flight(), 1U);

  Drain();

  EXPECT_EQ(session->tool_calls_in_flight(), 0U);
  EXPECT_EQ(observer->tool_calls, (std::vector<std::string>{"CheckAvailability"}));
  EXPECT_EQ(observer->tool_results, (std::vector<std::string>{"CheckAvailability"}));
  EXPECT_EQ(observer->schedule_changes, 0);

  ASSERT_EQ(live->Kinds(), (std::vector<std::string>{"toolResponse"}));
  const auto tr = ParseObject(live->sent[0]).at("toolResponse").as_object();
  const auto& fr = tr.at("functionResponses").as_array().at(0).as_object();
  EXPECT_EQ(fr.at("id").as_string(), "t1");
  const auto& result = fr.at("response").as_object().at("result").as_object();
  EXPECT_EQ(result.at("status").as_string(), "success");
}

TEST_F(CallSessionTest, SuccessfulBookingNotifiesScheduleChange) {
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();

  session->OnLiveMessage(R"({"toolCall":{"functionCalls":[{"id":"b1","name":"CreateBooking",
      "args":{"startTime":"2024-05-10T14:30:00","resource":"Jason","service":"Haircut",
      "clientName":"Ana"}}]}})");
  Drain();

  EXPECT_EQ(backend->bookings, 1);
  EXPECT_EQ(observer->schedule_changes, 1);
}

TEST_F(CallSessionTest, FailingBackendStillAnswersTheCall) {
  backend->fail = true;
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();
  live->sent.clear();

  session->OnLiveMessage(R"({"toolCall":{"functionCalls":[{"id":"t1","name":"CreateBooking",
      "args":{"startTime":"2024-05-10T14:30:00","resource":"Jason","service":"Haircut",
      "clientName":"Ana"}}]}})");
  Drain();

  ASSERT_EQ(live->Kinds(), (std::vector<std::string>{"toolResponse"}));
  const auto tr = ParseObject(live->sent[0]).at("toolResponse").as_object();
  const auto& fr = tr.at("functionResponses").as_array().at(0).as_object();
  EXPECT_EQ(fr.at("id").as_string(), "t1");
  const auto& result = fr.at("response").as_object().at("result").as_object();
  EXPECT_EQ(result.at("error").as_string(), "Calendar unavailable");
  EXPECT_EQ(observer->schedule_changes, 0);
  EXPECT_EQ(session->state(), CallState::Active);
}

TEST_F(CallSessionTest, ToolCallWithoutDispatcherGetsErrorResponse) {
  tools = nullptr;
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();
  live->sent.clear();

  session->OnLiveMessage(R"({"toolCall":{"functionCalls":[{"id":"t1","name":"CreateBooking"}]}})");
  Drain();

  ASSERT_EQ(live->Kinds(), (std::vector<std::string>{"toolResponse"}));
  const auto tr = ParseObject(live->sent[0]).at("toolResponse").as_object();
  const auto& fr = tr.at("functionResponses").as_array().at(0).as_object();
  EXPECT_EQ(fr.at("id").as_string(), "t1");
  EXPECT_EQ(fr.at("name").as_string(), "CreateBooking");
  EXPECT_TRUE(fr.at("response").as_object().at("result").as_object().contains("error"));
  EXPECT_EQ(session->tool_calls_in_flight(), 0U);
  EXPECT_EQ(observer->errors.size(), 1U);
}

class ThrowingResultObserver : public RecordingObserver {
 public:
  void OnToolResult(const std::string&, const std::string&, const boost::json::object&) override {
    throw std::runtime_error("dashboard offline");
  }
};

TEST_F(CallSessionTest, ObserverFailureDoesNotLoseToolResponse) {
  observer = std::make_shared<ThrowingResultObserver>();
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();
  live->sent.clear();

  session->OnLiveMessage(R"({"toolCall":{"functionCalls":[{"id":"t2","name":"CheckAvailability",
      "args":{"date":"2024-05-10","resource":"Jason"}}]}})");
  Drain();

  ASSERT_EQ(live->Kinds(), (std::vector<std::string>{"toolResponse"}));
  EXPECT_EQ(session->tool_calls_in_flight(), 0U);
  EXPECT_EQ(session->state(), CallState::Active);
}

TEST_F(CallSessionTest, LateToolResultAfterHangupIsDiscarded) {
  backend->delay = std::chrono::milliseconds(50);
  auto session = MakeSession();
  session->OnTelephonyMessage(kStart);
  session->OnLiveOpen();
  live->sent.clear();

  session->OnLiveMessage(R"({"toolCall":{"functionCalls":[{"id":"t9","name":"CheckAvailability",
      "args":{"date":"2024-05-10","resource":"Jason"}}]}})");

  // Let the call reach the backend, then hang up while it waits.
  ioc.poll();
  EXPECT_EQ(session->tool_calls_in_flight(), 1U);
  session->Stop();
  Drain();

  EXPECT_EQ(session->state(), CallState::Closed);
  EXPECT_EQ(session->tool_calls_in_flight(), 0U);
  EXPECT_TRUE(live->sent.empty());
  EXPECT_TRUE(observer->tool_results.empty());
}

TEST(CallStateTest, Names) {
  EXPECT_STREQ(to_string(CallState::Idle), "Idle");
  EXPECT_STREQ(to_string(CallState::Active), "Active");
  EXPECT_STREQ(to_string(CallState::Closed), "Closed");
}

}  // namespace
