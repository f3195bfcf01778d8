/**
 * @file live_messages_test.cpp
 * @brief Parsing of live-session server messages and building of client messages.
 */

#include "LiveMessages.hpp"

#include "gtest/gtest.h"

#include <string>
#include <vector>

#include "Errors.hpp"
#include "test_support.hpp"

using namespace voxbridge;
using namespace voxbridge::models;
using voxbridge::testing::ParseObject;

namespace {

TEST(LiveMessagesTest, SetupComplete) {
  const auto msg = ParseLiveServerMessage(R"({"setupComplete":{}})");
  EXPECT_TRUE(msg.setup_complete);
  EXPECT_TRUE(msg.parts.empty());
  EXPECT_TRUE(msg.tool_calls.empty());
  EXPECT_FALSE(msg.go_away);
}

TEST(LiveMessagesTest, CamelCaseAudioAndText) {
  const auto msg = ParseLiveServerMessage(R"({"serverContent":{"modelTurn":{"parts":[
      {"inlineData":{"mimeType":"audio/pcm;rate=24000","data":"AAAAAAAA"}},
      {"text":"Hello"}]},"turnComplete":true}})");

  ASSERT_EQ(msg.parts.size(), 2U);
  ASSERT_TRUE(msg.parts[0].audio.has_value());
  EXPECT_EQ(msg.parts[0].audio->mime_type, "audio/pcm;rate=24000");
  EXPECT_EQ(msg.parts[0].audio->data, std::vector<uint8_t>(6, 0));
  EXPECT_EQ(msg.parts[1].text, "Hello");
  EXPECT_FALSE(msg.parts[1].audio.has_value());
  EXPECT_TRUE(msg.turn_complete);
}

TEST(LiveMessagesTest, SnakeCaseAudio) {
  const auto msg = ParseLiveServerMessage(R"({"server_content":{"model_turn":{"parts":[
      {"inline_data":{"mime_type":"audio/pcm","data":"AAAAAAAA"}}]},"turn_complete":true}})");

  ASSERT_EQ(msg.parts.size(), 1U);
  ASSERT_TRUE(msg.parts[0].audio.has_value());
  EXPECT_EQ(msg.parts[0].audio->mime_type, "audio/pcm");
  EXPECT_EQ(msg.parts[0].audio->data.size(), 6U);
  EXPECT_TRUE(msg.turn_complete);
}

TEST(LiveMessagesTest, EmptyPartsAreSkipped) {
  const auto msg =
      ParseLiveServerMessage(R"({"serverContent":{"modelTurn":{"parts":[{},{"text":""},7]}}})");
  EXPECT_TRUE(msg.parts.empty());
}

TEST(LiveMessagesTest, InvalidInlineAudioIsMalformed) {
  EXPECT_THROW(ParseLiveServerMessage(
                   R"({"serverContent":{"modelTurn":{"parts":[{"inlineData":{"data":"@@"}}]}}})"),
               MalformedFrameError);
}

TEST(LiveMessagesTest, UnpaddedInlineAudioIsMalformed) {
  for (const char* data : {"AAAAAA", "AA"}) {
    const std::string text =
        std::string(R"({"serverContent":{"modelTurn":{"parts":[{"inlineData":{"data":")") + data +
        R"("}}]}}})";
    EXPECT_THROW(ParseLiveServerMessage(text), MalformedFrameError) << data;
  }
}

TEST(LiveMessagesTest, Interrupted) {
  const auto msg = ParseLiveServerMessage(R"({"serverContent":{"interrupted":true}})");
  EXPECT_TRUE(msg.interrupted);
  EXPECT_FALSE(msg.turn_complete);
}

TEST(LiveMessagesTest, ToolCallCarriesIdNameAndArgs) {
  const auto msg = ParseLiveServerMessage(R"({"toolCall":{"functionCalls":[
      {"id":"t1","name":"CheckAvailability","args":{"date":"2024-05-10","resource":"Jason"}},
      {"id":"t2","name":"CreateBooking"}]}})");

  ASSERT_EQ(msg.tool_calls.size(), 2U);
  EXPECT_EQ(msg.tool_calls[0].id, "t1");
  EXPECT_EQ(msg.tool_calls[0].name, "CheckAvailability");
  EXPECT_EQ(msg.tool_calls[0].args.at("resource").as_string(), "Jason");
  EXPECT_EQ(msg.tool_calls[1].name, "CreateBooking");
  EXPECT_TRUE(msg.tool_calls[1].args.empty());
}

TEST(LiveMessagesTest, SnakeCaseToolCall) {
  const auto msg = ParseLiveServerMessage(
      R"({"tool_call":{"function_calls":[{"id":"a","name":"CheckAvailability","args":{}}]}})");
  ASSERT_EQ(msg.tool_calls.size(), 1U);
  EXPECT_EQ(msg.tool_calls[0].id, "a");
}

TEST(LiveMessagesTest, CancellationAndGoAway) {
  const auto msg =
      ParseLiveServerMessage(R"({"toolCallCancellation":{"ids":["t1","t2"]},"goAway":{}})");
  EXPECT_EQ(msg.cancelled_tool_call_ids, (std::vector<std::string>{"t1", "t2"}));
  EXPECT_TRUE(msg.go_away);
}

TEST(LiveMessagesTest, RejectsInvalidJson) {
  EXPECT_THROW(ParseLiveServerMessage("{"), MalformedFrameError);
  EXPECT_THROW(ParseLiveServerMessage("\"text\""), MalformedFrameError);
}

TEST(LiveMessagesTest, UnknownFieldsAreIgnored) {
  const auto msg = ParseLiveServerMessage(R"({"usageMetadata":{"totalTokenCount":12}})");
  EXPECT_FALSE(msg.setup_complete);
  EXPECT_TRUE(msg.parts.empty());
}

TEST(LiveMessagesTest, SetupMessageCarriesModelVoiceAndPrompt) {
  LiveConfig cfg;
  cfg.model = "models/test-model";
  cfg.voice = "Puck";
  cfg.system_prompt = "Be brief.";

  const auto obj = ParseObject(BuildSetupMessage(cfg, {}));
  const auto& setup = obj.at("setup").as_object();

  EXPECT_EQ(setup.at("model").as_string(), "models/test-model");
  const auto& gen = setup.at("generationConfig").as_object();
  EXPECT_EQ(gen.at("responseModalities").as_array().at(0).as_string(), "AUDIO");
  const auto& voice = gen.at("speechConfig").as_object().at("voiceConfig").as_object();
  EXPECT_EQ(voice.at("prebuiltVoiceConfig").as_object().at("voiceName").as_string(), "Puck");
  const auto& instruction = setup.at("systemInstruction").as_object();
  EXPECT_EQ(instruction.at("parts").as_array().at(0).as_object().at("text").as_string(),
            "Be brief.");
  // No declarations, no tools block.
  EXPECT_FALSE(setup.contains("tools"));
}

TEST(LiveMessagesTest, SetupMessageListsFunctionDeclarations) {
  boost::json::array decls;
  decls.push_back(boost::json::object{{"name", "CheckAvailability"}});

  const auto obj = ParseObject(BuildSetupMessage(LiveConfig{}, decls));
  const auto& tools = obj.at("setup").as_object().at("tools").as_array();
  ASSERT_EQ(tools.size(), 1U);
  const auto& decl = tools[0].as_object().at("functionDeclarations").as_array().at(0);
  EXPECT_EQ(decl.as_object().at("name").as_string(), "CheckAvailability");
}

TEST(LiveMessagesTest, ClientContentTurn) {
  const auto obj = ParseObject(BuildClientContent("user", "Start now.", true));
  const auto& content = obj.at("clientContent").as_object();
  EXPECT_TRUE(content.at("turnComplete").as_bool());
  const auto& turn = content.at("turns").as_array().at(0).as_object();
  EXPECT_EQ(turn.at("role").as_string(), "user");
  EXPECT_EQ(turn.at("parts").as_array().at(0).as_object().at("text").as_string(), "Start now.");
}

TEST(LiveMessagesTest, RealtimeInputChunk) {
  audio::AudioChunk chunk{"audio/pcm;rate=16000", std::vector<uint8_t>(3, 0)};
  const auto obj = ParseObject(BuildRealtimeInput(chunk));
  const auto& input = obj.at("realtimeInput").as_object();
  const auto& media = input.at("mediaChunks").as_array().at(0).as_object();
  EXPECT_EQ(media.at("mimeType").as_string(), "audio/pcm;rate=16000");
  EXPECT_EQ(media.at("data").as_string(), "AAAA");
}

TEST(LiveMessagesTest, ToolResponseShape) {
  ToolResponse r;
  r.id = "t1";
  r.name = "CreateBooking";
  r.result["success"] = true;

  const auto obj = ParseObject(BuildToolResponse({r}));
  const auto& fr = obj.at("toolResponse").as_object().at("functionResponses").as_array();
  ASSERT_EQ(fr.size(), 1U);
  const auto& first = fr[0].as_object();
  EXPECT_EQ(first.at("id").as_string(), "t1");
  EXPECT_EQ(first.at("name").as_string(), "CreateBooking");
  const auto& result = first.at("response").as_object().at("result").as_object();
  EXPECT_TRUE(result.at("success").as_bool());
}

}  // namespace
