#include "executor/event_queue.hpp"

#include <thread>

#include "executor/results.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using executor::EventQueue;

// NOLINTNEXTLINE
TEST(EventQueueTest, TestOrder) {
  EventQueue queue;
  queue.JobStarted("a");
  queue.JobCompleted(executor::MakeSuccess("a"));
  queue.JobFailed(executor::MakeFailure(
      "b", proto::Result::RUNTIME_FAILURE, "broken"));

  absl::optional<proto::Event> event = queue.Dequeue();
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->job_id(), "a");
  EXPECT_EQ(event->type(), proto::Event::STARTED);
  EXPECT_GT(event->timestamp_millis(), 0);
  EXPECT_FALSE(event->has_result());

  event = queue.Dequeue();
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->type(), proto::Event::COMPLETED);
  EXPECT_EQ(event->result().status(), proto::Result::SUCCESS);

  event = queue.Dequeue();
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->job_id(), "b");
  EXPECT_EQ(event->type(), proto::Event::FAILED);
  EXPECT_EQ(event->result().error(), "broken");
}

// NOLINTNEXTLINE
TEST(EventQueueTest, TestStopDrainsQueue) {
  EventQueue queue;
  queue.JobStarted("a");
  queue.Stop();
  EXPECT_TRUE(queue.IsStopped());
  EXPECT_TRUE(queue.Dequeue().has_value());
  EXPECT_FALSE(queue.Dequeue().has_value());
}

// NOLINTNEXTLINE
TEST(EventQueueTest, TestDequeueBlocks) {
  EventQueue queue;
  absl::optional<proto::Event> event;
  std::thread reader([&queue, &event]() { event = queue.Dequeue(); });
  queue.JobStarted("late");
  reader.join();
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->job_id(), "late");
}

}  // namespace
