#include <gtest/gtest.h>

#include "chatstream/error.hpp"
#include "chatstream/response_accumulator.hpp"
#include "chatstream/stream_event.hpp"

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using chatstream::CancelledUpdate;
using chatstream::CompletedEvent;
using chatstream::CompletedUpdate;
using chatstream::ConversationContext;
using chatstream::CreatedEvent;
using chatstream::DeltaUpdate;
using chatstream::FailedUpdate;
using chatstream::ResponseAccumulator;
using chatstream::ResponseStatus;
using chatstream::SnapshotUpdate;
using chatstream::StartedUpdate;
using chatstream::StreamEvent;
using chatstream::StreamUpdate;

namespace {

StreamEvent created(const std::string& id) {
  return CreatedEvent{.response_id = id, .status = "in_progress", .sequence_number = std::nullopt};
}

StreamEvent delta(const std::string& text) {
  chatstream::TextDeltaEvent event;
  event.item_id = "msg_1";
  event.text = text;
  return event;
}

StreamEvent text_done(const std::string& text) {
  chatstream::TextDoneEvent event;
  event.item_id = "msg_1";
  event.text = text;
  return event;
}

StreamEvent completed(const std::string& id, std::optional<std::string> output_text) {
  CompletedEvent event;
  event.response_id = id;
  event.status = "completed";
  event.output_text = std::move(output_text);
  return event;
}

std::vector<StreamUpdate> run(ResponseAccumulator& accumulator, const std::vector<StreamEvent>& events) {
  std::vector<StreamUpdate> updates;
  for (const auto& event : events) {
    if (auto update = accumulator.ingest(event)) {
      updates.push_back(*update);
    }
  }
  return updates;
}

}  // namespace

TEST(ResponseAccumulatorTest, AssemblesDeltasSnapshotAndCompletion) {
  ResponseAccumulator accumulator;
  auto updates = run(accumulator, {created("r1"), delta("Hel"), delta("lo"), text_done("Hello"), completed("r1", "Hello")});

  ASSERT_EQ(updates.size(), 5u);
  ASSERT_TRUE(std::holds_alternative<StartedUpdate>(updates[0]));
  EXPECT_EQ(std::get<StartedUpdate>(updates[0]).response_id, "r1");
  EXPECT_EQ(std::get<DeltaUpdate>(updates[1]).text, "Hel");
  EXPECT_EQ(std::get<DeltaUpdate>(updates[2]).text, "lo");
  EXPECT_EQ(std::get<SnapshotUpdate>(updates[3]).text, "Hello");
  ASSERT_TRUE(std::holds_alternative<CompletedUpdate>(updates[4]));
  const auto& done = std::get<CompletedUpdate>(updates[4]);
  EXPECT_EQ(done.text, "Hello");
  EXPECT_EQ(done.response_id, "r1");
  EXPECT_FALSE(done.incomplete);

  EXPECT_EQ(accumulator.status(), ResponseStatus::Completed);
  EXPECT_TRUE(accumulator.is_terminal());
  EXPECT_EQ(accumulator.state().previous_response_id.value_or(""), "r1");
}

TEST(ResponseAccumulatorTest, StatusFollowsLifecycle) {
  ResponseAccumulator accumulator;
  EXPECT_EQ(accumulator.status(), ResponseStatus::Idle);
  (void)accumulator.ingest(created("r1"));
  EXPECT_EQ(accumulator.status(), ResponseStatus::Created);
  EXPECT_EQ(accumulator.response_id().value_or(""), "r1");
  (void)accumulator.ingest(delta("a"));
  EXPECT_EQ(accumulator.status(), ResponseStatus::Streaming);
  EXPECT_EQ(accumulator.accumulated_text(), "a");
}

TEST(ResponseAccumulatorTest, SnapshotReplacesDriftedDeltas) {
  ResponseAccumulator accumulator;
  run(accumulator, {created("r1"), delta("Hxl"), delta("lo")});
  EXPECT_EQ(accumulator.accumulated_text(), "Hxllo");

  auto update = accumulator.ingest(text_done("Hello"));
  ASSERT_TRUE(update.has_value());
  EXPECT_EQ(std::get<SnapshotUpdate>(*update).text, "Hello");
  EXPECT_EQ(accumulator.accumulated_text(), "Hello");

  (void)accumulator.ingest(delta("!"));
  EXPECT_EQ(accumulator.accumulated_text(), "Hello!");
}

TEST(ResponseAccumulatorTest, ContentPartDoneWithoutTextIsNoOp) {
  ResponseAccumulator accumulator;
  run(accumulator, {created("r1"), delta("Hi")});

  chatstream::ContentPartDoneEvent part;
  part.item_id = "msg_1";
  EXPECT_FALSE(accumulator.ingest(part).has_value());
  EXPECT_EQ(accumulator.accumulated_text(), "Hi");

  part.text = "Hi there";
  auto update = accumulator.ingest(part);
  ASSERT_TRUE(update.has_value());
  EXPECT_EQ(std::get<SnapshotUpdate>(*update).text, "Hi there");
}

TEST(ResponseAccumulatorTest, CompletedWithoutOutputTextFallsBackToDeltas) {
  ResponseAccumulator accumulator;
  auto updates = run(accumulator, {created("r1"), delta("par"), delta("tial"), completed("r1", std::nullopt)});
  ASSERT_EQ(updates.size(), 4u);
  EXPECT_EQ(std::get<CompletedUpdate>(updates.back()).text, "partial");
}

TEST(ResponseAccumulatorTest, CompletedOutputTextWinsOverAccumulatedText) {
  ResponseAccumulator accumulator;
  auto updates = run(accumulator, {created("r1"), delta("draft"), completed("r1", "final")});
  EXPECT_EQ(std::get<CompletedUpdate>(updates.back()).text, "final");
}

TEST(ResponseAccumulatorTest, CompletedBeforeCreatedIsAbsorbed) {
  ResponseAccumulator accumulator;
  auto update = accumulator.ingest(completed("r9", "text"));
  ASSERT_TRUE(update.has_value());
  EXPECT_EQ(std::get<CompletedUpdate>(*update).response_id, "r9");
  EXPECT_EQ(accumulator.response_id().value_or(""), "r9");
}

TEST(ResponseAccumulatorTest, SecondCreatedIsIgnored) {
  ResponseAccumulator accumulator;
  auto updates = run(accumulator, {created("r1"), created("r2")});
  ASSERT_EQ(updates.size(), 1u);
  EXPECT_EQ(accumulator.response_id().value_or(""), "r1");
}

TEST(ResponseAccumulatorTest, IgnoredAndLifecycleEventsAreNoOps) {
  ResponseAccumulator accumulator;
  auto updates = run(accumulator,
                     {created("r1"), chatstream::IgnoredEvent{"response.mcp_call.completed"},
                      chatstream::InProgressEvent{}, chatstream::QueuedEvent{}, delta("ok")});
  ASSERT_EQ(updates.size(), 2u);
  EXPECT_EQ(std::get<DeltaUpdate>(updates[1]).text, "ok");
}

TEST(ResponseAccumulatorTest, FailedAndErrorEventsTerminate) {
  ResponseAccumulator failed_accumulator;
  chatstream::FailedEvent failed;
  failed.message = "server exploded";
  failed.code = "server_error";
  auto update = failed_accumulator.ingest(failed);
  ASSERT_TRUE(update.has_value());
  const auto& failure = std::get<FailedUpdate>(*update);
  EXPECT_EQ(failure.message, "server exploded");
  EXPECT_EQ(failure.code.value_or(""), "server_error");
  EXPECT_EQ(failed_accumulator.status(), ResponseStatus::Failed);

  ResponseAccumulator error_accumulator;
  chatstream::ErrorEvent error;
  error.message = "bad request";
  auto error_update = error_accumulator.ingest(error);
  ASSERT_TRUE(error_update.has_value());
  EXPECT_EQ(std::get<FailedUpdate>(*error_update).message, "bad request");
  EXPECT_FALSE(error_accumulator.ingest(delta("late")).has_value());
}

TEST(ResponseAccumulatorTest, CancelEmitsExactlyOnce) {
  ResponseAccumulator accumulator;
  run(accumulator, {created("r1"), delta("a"), delta("b")});

  ASSERT_EQ(accumulator.accumulated_text(), "ab");

  auto first = accumulator.cancel();
  ASSERT_TRUE(first.has_value());
  EXPECT_TRUE(std::holds_alternative<CancelledUpdate>(*first));
  EXPECT_TRUE(accumulator.accumulated_text().empty());
  EXPECT_TRUE(accumulator.state().accumulated_text.empty());
  EXPECT_FALSE(accumulator.cancel().has_value());
  EXPECT_FALSE(accumulator.ingest(delta("c")).has_value());
  EXPECT_FALSE(accumulator.ingest(completed("r1", "abc")).has_value());
  EXPECT_FALSE(accumulator.finish().has_value());
  EXPECT_EQ(accumulator.status(), ResponseStatus::Cancelled);
}

TEST(ResponseAccumulatorTest, CancelFromIdle) {
  ResponseAccumulator accumulator;
  auto update = accumulator.cancel();
  ASSERT_TRUE(update.has_value());
  EXPECT_TRUE(std::holds_alternative<CancelledUpdate>(*update));
}

TEST(ResponseAccumulatorTest, TerminalUpdateIsNeverRepeated) {
  ResponseAccumulator accumulator;
  auto updates = run(accumulator, {created("r1"), completed("r1", "a"), completed("r1", "b")});
  ASSERT_EQ(updates.size(), 2u);
  EXPECT_FALSE(accumulator.cancel().has_value());
  EXPECT_FALSE(accumulator.fail("late").has_value());
}

TEST(ResponseAccumulatorTest, IncompleteFinalizesWithFlag) {
  ResponseAccumulator accumulator;
  run(accumulator, {created("r1"), delta("cut sh")});

  chatstream::IncompleteEvent incomplete;
  incomplete.reason = "max_output_tokens";
  auto update = accumulator.ingest(incomplete);
  ASSERT_TRUE(update.has_value());
  const auto& done = std::get<CompletedUpdate>(*update);
  EXPECT_TRUE(done.incomplete);
  EXPECT_EQ(done.incomplete_reason.value_or(""), "max_output_tokens");
  EXPECT_EQ(done.text, "cut sh");
  EXPECT_EQ(done.response_id, "r1");
  EXPECT_EQ(accumulator.status(), ResponseStatus::Completed);
}

TEST(ResponseAccumulatorTest, FailCarriesCause) {
  ResponseAccumulator accumulator;
  (void)accumulator.ingest(created("r1"));
  auto update = accumulator.fail("transport dropped", std::make_exception_ptr(std::runtime_error("eof")));
  ASSERT_TRUE(update.has_value());
  const auto& failure = std::get<FailedUpdate>(*update);
  EXPECT_EQ(failure.message, "transport dropped");
  ASSERT_TRUE(failure.cause);
  EXPECT_THROW(std::rethrow_exception(failure.cause), std::runtime_error);
}

TEST(ResponseAccumulatorTest, FinishWithoutTerminalFails) {
  ResponseAccumulator accumulator;
  run(accumulator, {created("r1"), delta("x")});
  auto update = accumulator.finish();
  ASSERT_TRUE(update.has_value());
  EXPECT_EQ(std::get<FailedUpdate>(*update).message, "stream ended before the response completed");
  EXPECT_FALSE(accumulator.finish().has_value());
}

TEST(ResponseAccumulatorTest, ContextReceivesResponseIdOnCompletion) {
  ConversationContext context;
  ResponseAccumulator accumulator;
  (void)accumulator.ingest(created("r1"), context);
  EXPECT_FALSE(context.previous_response_id.has_value());
  (void)accumulator.ingest(completed("r1", "done"), context);
  EXPECT_EQ(context.previous_response_id.value_or(""), "r1");
}

TEST(ResponseAccumulatorTest, FailedStreamLeavesContextUntouched) {
  ConversationContext context{.previous_response_id = "r0"};
  ResponseAccumulator accumulator;
  chatstream::ErrorEvent error;
  error.message = "nope";
  (void)accumulator.ingest(created("r1"), context);
  (void)accumulator.ingest(error, context);
  EXPECT_EQ(context.previous_response_id.value_or(""), "r0");
}

TEST(ResponseAccumulatorTest, IndependentContextsDoNotInterfere) {
  ConversationContext first;
  ConversationContext second;
  ResponseAccumulator a;
  ResponseAccumulator b;
  (void)a.ingest(completed("ra", "x"), first);
  (void)b.ingest(completed("rb", "y"), second);
  EXPECT_EQ(first.previous_response_id.value_or(""), "ra");
  EXPECT_EQ(second.previous_response_id.value_or(""), "rb");
}
