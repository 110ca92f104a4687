#include <gtest/gtest.h>
#include <atomic>
#include <cstdio>
#include <fstream>
#include <thread>
#include <unistd.h>

#include "usb_broker/core/event_buffer.hpp"

using usb_broker::core::EventBuffer;

class EventBufferTest : public ::testing::Test {
protected:
  void Add(const std::string &title,
           broker::v1::EventType type = broker::v1::EVENT_TYPE_DEVICE_REGISTERED) {
    buffer_.AddEvent(type, broker::v1::EVENT_SEVERITY_INFO, "rack-1:1-1", title, "");
  }

  EventBuffer buffer_{100};  // max 100 events
};

TEST_F(EventBufferTest, StartsEmpty) {
  EXPECT_TRUE(buffer_.GetLatestEvents(10).empty());
  EXPECT_TRUE(buffer_.LatestEventId().empty());
}

TEST_F(EventBufferTest, AddAndRetrieve) {
  Add("Device registered");
  auto events = buffer_.GetLatestEvents(10);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type(), broker::v1::EVENT_TYPE_DEVICE_REGISTERED);
  EXPECT_EQ(events[0].device_id(), "rack-1:1-1");
  EXPECT_EQ(events[0].title(), "Device registered");
  EXPECT_FALSE(events[0].event_id().empty());
  EXPECT_GT(events[0].timestamp().seconds(), 0);
}

TEST_F(EventBufferTest, EventIdsAreMonotonicallyIncreasing) {
  for (int i = 0; i < 5; ++i) Add("event-" + std::to_string(i));
  auto events = buffer_.GetLatestEvents(10);
  ASSERT_EQ(events.size(), 5u);
  for (size_t i = 1; i < events.size(); ++i) {
    EXPECT_GT(events[i].event_id(), events[i - 1].event_id());
  }
  EXPECT_EQ(buffer_.LatestEventId(), events.back().event_id());
}

TEST_F(EventBufferTest, GetEventsSinceReplaysOnlyNewer) {
  Add("first");
  const std::string cursor = buffer_.LatestEventId();
  Add("second");
  Add("third");

  auto since = buffer_.GetEventsSince(cursor);
  ASSERT_EQ(since.size(), 2u);
  EXPECT_EQ(since[0].title(), "second");
  EXPECT_EQ(since[1].title(), "third");

  // Empty cursor replays everything
  EXPECT_EQ(buffer_.GetEventsSince("").size(), 3u);
}

TEST_F(EventBufferTest, EvictedCursorResumesFromOldest) {
  EventBuffer small(3);
  auto add = [&small](const std::string &title) {
    small.AddEvent(broker::v1::EVENT_TYPE_DEVICE_REGISTERED,
                   broker::v1::EVENT_SEVERITY_INFO, "rack-1:1-1", title, "");
  };
  add("first");
  const std::string cursor = small.LatestEventId();
  add("second");
  add("third");
  add("fourth");

  auto since = small.GetEventsSince(cursor);
  ASSERT_EQ(since.size(), 3u);
  EXPECT_EQ(since.front().title(), "second");

  // Cursor at the newest event has nothing to replay
  EXPECT_TRUE(small.GetEventsSince(small.LatestEventId()).empty());
}

TEST_F(EventBufferTest, WallClockStepDoesNotReorderIds) {
  using std::chrono::system_clock;
  const auto base = system_clock::now();
  std::atomic<int> step_hours{0};
  EventBuffer stepped(100, [&]() {
    return base + std::chrono::hours(step_hours.load());
  });
  auto add = [&stepped](const std::string &title) {
    stepped.AddEvent(broker::v1::EVENT_TYPE_LEASE_GRANTED,
                     broker::v1::EVENT_SEVERITY_INFO, "rack-1:1-1", title, "");
  };

  add("before");
  const std::string cursor = stepped.LatestEventId();
  step_hours = -2;  // NTP step backwards
  add("after-step-back");
  step_hours = 5;  // and a large step forwards
  add("after-step-forward");

  auto events = stepped.GetLatestEvents(10);
  ASSERT_EQ(events.size(), 3u);
  EXPECT_LT(events[1].timestamp().seconds(), events[0].timestamp().seconds());
  for (size_t i = 1; i < events.size(); ++i) {
    EXPECT_GT(events[i].event_id(), events[i - 1].event_id());
    EXPECT_EQ(events[i].event_id().size(), events[0].event_id().size());
  }

  auto since = stepped.GetEventsSince(cursor);
  ASSERT_EQ(since.size(), 2u);
  EXPECT_EQ(since[0].title(), "after-step-back");
  EXPECT_EQ(since[1].title(), "after-step-forward");

  broker::v1::Event next;
  ASSERT_TRUE(stepped.WaitForEventAfter(cursor, &next, std::chrono::milliseconds(10)));
  EXPECT_EQ(next.title(), "after-step-back");
}

TEST_F(EventBufferTest, BoundsAtMaxSize) {
  for (int i = 0; i < 150; ++i) Add("event-" + std::to_string(i));
  auto events = buffer_.GetLatestEvents(200);
  ASSERT_EQ(events.size(), 100u);
  EXPECT_EQ(events.front().title(), "event-50");
}

TEST_F(EventBufferTest, WaitForEventAfterTimeout) {
  broker::v1::Event event;
  EXPECT_FALSE(buffer_.WaitForEventAfter("", &event, std::chrono::milliseconds(50)));
}

TEST_F(EventBufferTest, WaitForEventAfterWakes) {
  Add("old");
  const std::string cursor = buffer_.LatestEventId();

  std::thread producer([this]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    buffer_.AddEvent(broker::v1::EVENT_TYPE_LEASE_REVOKED,
                     broker::v1::EVENT_SEVERITY_WARNING, "rack-1:1-1",
                     "Lease revoked", "admin");
  });

  broker::v1::Event event;
  bool got = buffer_.WaitForEventAfter(cursor, &event, std::chrono::milliseconds(500));
  producer.join();
  ASSERT_TRUE(got);
  EXPECT_EQ(event.type(), broker::v1::EVENT_TYPE_LEASE_REVOKED);
  EXPECT_EQ(event.title(), "Lease revoked");
}

TEST_F(EventBufferTest, PersistsJsonLines) {
  const std::string path = ::testing::TempDir() + "usb_broker_events_" +
                           std::to_string(::getpid()) + ".jsonl";
  std::remove(path.c_str());
  {
    EventBuffer persisted(10);
    persisted.EnablePersistence(path);
    persisted.AddEvent(broker::v1::EVENT_TYPE_DEVICE_REMOVED,
                       broker::v1::EVENT_SEVERITY_WARNING, "rack-1:1-1",
                       "Device \"removed\"", "unplugged");
  }

  std::ifstream in(path);
  std::string line;
  ASSERT_TRUE(std::getline(in, line));
  EXPECT_NE(line.find("\"type\":\"EVENT_TYPE_DEVICE_REMOVED\""), std::string::npos);
  EXPECT_NE(line.find("\"severity\":\"WARNING\""), std::string::npos);
  EXPECT_NE(line.find("Device \\\"removed\\\""), std::string::npos);
  std::remove(path.c_str());
}
