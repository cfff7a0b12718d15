#include <gtest/gtest.h>

#include "chatstream/error.hpp"
#include "chatstream/stream_event.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

using chatstream::DecodeError;
using chatstream::decode_stream_event;

namespace {

DecodeError expect_decode_error(const std::string& frame) {
  try {
    decode_stream_event(frame);
  } catch (const DecodeError& error) {
    return error;
  }
  ADD_FAILURE() << "Expected DecodeError for " << frame;
  return DecodeError::malformed("not thrown");
}

}  // namespace

TEST(StreamEventDecodeTest, DecodesCreated) {
  auto event = decode_stream_event(
      R"({"type":"response.created","sequence_number":0,"response":{"id":"resp_1","status":"in_progress"}})");
  ASSERT_TRUE(std::holds_alternative<chatstream::CreatedEvent>(event));
  const auto& created = std::get<chatstream::CreatedEvent>(event);
  EXPECT_EQ(created.response_id, "resp_1");
  EXPECT_EQ(created.status, "in_progress");
  ASSERT_TRUE(created.sequence_number.has_value());
  EXPECT_EQ(*created.sequence_number, 0);
}

TEST(StreamEventDecodeTest, DecodesTextDelta) {
  auto event = decode_stream_event(
      R"({"type":"response.output_text.delta","item_id":"msg_1","output_index":0,"content_index":1,"delta":"Hel"})");
  ASSERT_TRUE(std::holds_alternative<chatstream::TextDeltaEvent>(event));
  const auto& delta = std::get<chatstream::TextDeltaEvent>(event);
  EXPECT_EQ(delta.item_id, "msg_1");
  EXPECT_EQ(delta.output_index, 0);
  EXPECT_EQ(delta.content_index, 1);
  EXPECT_EQ(delta.text, "Hel");
  EXPECT_FALSE(delta.sequence_number.has_value());
}

TEST(StreamEventDecodeTest, DecodesTextDoneAndContentPartDone) {
  auto done = decode_stream_event(
      R"({"type":"response.output_text.done","item_id":"msg_1","output_index":0,"content_index":0,"text":"Hello"})");
  ASSERT_TRUE(std::holds_alternative<chatstream::TextDoneEvent>(done));
  EXPECT_EQ(std::get<chatstream::TextDoneEvent>(done).text, "Hello");

  auto part = decode_stream_event(
      R"({"type":"response.content_part.done","item_id":"msg_1","content_index":0,"part":{"type":"output_text","text":"Hi"}})");
  ASSERT_TRUE(std::holds_alternative<chatstream::ContentPartDoneEvent>(part));
  ASSERT_TRUE(std::get<chatstream::ContentPartDoneEvent>(part).text.has_value());
  EXPECT_EQ(*std::get<chatstream::ContentPartDoneEvent>(part).text, "Hi");

  auto refusal = decode_stream_event(
      R"({"type":"response.content_part.done","item_id":"msg_1","content_index":0,"part":{"type":"refusal"}})");
  EXPECT_FALSE(std::get<chatstream::ContentPartDoneEvent>(refusal).text.has_value());
}

TEST(StreamEventDecodeTest, DecodesCompletedWithOutputTextAndImages) {
  auto event = decode_stream_event(
      R"({"type":"response.completed","response":{"id":"resp_1","status":"completed","output_text":"Hello",)"
      R"("output":[{"type":"message"},{"type":"image_generation_call","result":"AQID"}]}})");
  ASSERT_TRUE(std::holds_alternative<chatstream::CompletedEvent>(event));
  const auto& completed = std::get<chatstream::CompletedEvent>(event);
  EXPECT_EQ(completed.response_id, "resp_1");
  ASSERT_TRUE(completed.output_text.has_value());
  EXPECT_EQ(*completed.output_text, "Hello");
  ASSERT_EQ(completed.generated_images.size(), 1u);
  EXPECT_EQ(completed.generated_images[0], (std::vector<std::uint8_t>{1, 2, 3}));
}

TEST(StreamEventDecodeTest, DecodesFailedWithFallbackMessage) {
  auto with_error = decode_stream_event(
      R"({"type":"response.failed","response":{"id":"resp_1","error":{"code":"server_error","message":"boom"}}})");
  const auto& failed = std::get<chatstream::FailedEvent>(with_error);
  EXPECT_EQ(failed.message, "boom");
  ASSERT_TRUE(failed.code.has_value());
  EXPECT_EQ(*failed.code, "server_error");

  auto without_error = decode_stream_event(R"({"type":"response.failed","response":{"id":"resp_1"}})");
  EXPECT_EQ(std::get<chatstream::FailedEvent>(without_error).message, "Response failed");
}

TEST(StreamEventDecodeTest, DecodesIncompleteReason) {
  auto event = decode_stream_event(
      R"({"type":"response.incomplete","response":{"id":"resp_1","incomplete_details":{"reason":"max_output_tokens"}}})");
  const auto& incomplete = std::get<chatstream::IncompleteEvent>(event);
  ASSERT_TRUE(incomplete.reason.has_value());
  EXPECT_EQ(*incomplete.reason, "max_output_tokens");
  EXPECT_EQ(incomplete.response_id.value_or(""), "resp_1");
}

TEST(StreamEventDecodeTest, DecodesErrorEvent) {
  auto event = decode_stream_event(R"({"type":"error","code":"rate_limit","message":"slow down","param":null})");
  const auto& error = std::get<chatstream::ErrorEvent>(event);
  EXPECT_EQ(error.message, "slow down");
  EXPECT_EQ(error.code.value_or(""), "rate_limit");
  EXPECT_FALSE(error.param.has_value());
}

TEST(StreamEventDecodeTest, LifecycleEventsWithoutPayloadDecode) {
  EXPECT_TRUE(std::holds_alternative<chatstream::InProgressEvent>(
      decode_stream_event(R"({"type":"response.in_progress","response":{"id":"resp_1"}})")));
  EXPECT_TRUE(std::holds_alternative<chatstream::QueuedEvent>(
      decode_stream_event(R"({"type":"response.queued","response":{}})")));
}

TEST(StreamEventDecodeTest, UnknownTypeIsIgnored) {
  auto event = decode_stream_event(R"({"type":"response.mcp_call.completed"})");
  ASSERT_TRUE(std::holds_alternative<chatstream::IgnoredEvent>(event));
  EXPECT_EQ(std::get<chatstream::IgnoredEvent>(event).raw_type, "response.mcp_call.completed");
  EXPECT_EQ(chatstream::event_type_name(event), "response.mcp_call.completed");
}

TEST(StreamEventDecodeTest, MalformedJsonIsReported) {
  auto error = expect_decode_error("{not json");
  EXPECT_EQ(error.kind(), DecodeError::Kind::MalformedPayload);

  EXPECT_EQ(expect_decode_error("[1,2]").kind(), DecodeError::Kind::MalformedPayload);
  EXPECT_EQ(expect_decode_error(R"({"type":7})").kind(), DecodeError::Kind::MalformedPayload);
}

TEST(StreamEventDecodeTest, MissingTypeIsMissingField) {
  auto error = expect_decode_error(R"({"delta":"x"})");
  EXPECT_EQ(error.kind(), DecodeError::Kind::MissingField);
  EXPECT_EQ(error.key(), "type");
  EXPECT_EQ(error.path(), "$");
  EXPECT_TRUE(error.event_type().empty());
  EXPECT_STREQ(error.what(), "Missing required field 'type' at $");

  EXPECT_EQ(expect_decode_error(R"({"type":null})").kind(), DecodeError::Kind::MissingField);
}

TEST(StreamEventDecodeTest, MissingFieldReportsKeyAndPath) {
  auto delta = expect_decode_error(R"({"type":"response.output_text.delta","item_id":"m","output_index":0,"content_index":0})");
  EXPECT_EQ(delta.kind(), DecodeError::Kind::MissingField);
  EXPECT_EQ(delta.key(), "delta");
  EXPECT_EQ(delta.path(), "$");
  EXPECT_EQ(delta.event_type(), "response.output_text.delta");

  auto created = expect_decode_error(R"({"type":"response.created","response":{"status":"queued"}})");
  EXPECT_EQ(created.kind(), DecodeError::Kind::MissingField);
  EXPECT_EQ(created.key(), "id");
  EXPECT_EQ(created.path(), "$.response");

  auto lifecycle = expect_decode_error(R"({"type":"response.completed"})");
  EXPECT_EQ(lifecycle.key(), "response");
  EXPECT_EQ(lifecycle.path(), "$");

  auto part = expect_decode_error(R"({"type":"response.content_part.done","item_id":"m","content_index":0})");
  EXPECT_EQ(part.key(), "part");

  auto error = expect_decode_error(R"({"type":"error","code":"x"})");
  EXPECT_EQ(error.key(), "message");
}

TEST(StreamEventDecodeTest, EventTypeNameMatchesWireType) {
  auto event = decode_stream_event(
      R"({"type":"response.output_text.done","item_id":"m","content_index":0,"text":""})");
  EXPECT_EQ(chatstream::event_type_name(event), "response.output_text.done");
}
