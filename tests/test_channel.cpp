/**
 * @file test_channel.cpp
 * @brief Tests for the rendezvous channel behind PacketSource::packets().
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <optional>
#include <thread>

#include "strata/source/rendezvous_channel.hpp"

using strata::source::RendezvousChannel;
using Status = RendezvousChannel<int>::SendStatus;

TEST(RendezvousChannel, SendBlocksUntilReceived) {
  RendezvousChannel<int> ch;
  std::atomic<bool> sent{false};

  std::jthread producer([&](std::stop_token st) {
    EXPECT_EQ(ch.send(7, st), Status::Delivered);
    sent.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(sent.load());

  auto v = ch.receive();
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(*v, 7);
  producer.join();
  EXPECT_TRUE(sent.load());
}

TEST(RendezvousChannel, PreservesOrder) {
  RendezvousChannel<int> ch;
  std::jthread producer([&](std::stop_token st) {
    for (int i = 0; i < 100; ++i) {
      if (ch.send(i, st) != Status::Delivered) return;
    }
    ch.close();
  });

  int expected = 0;
  while (auto v = ch.receive()) {
    EXPECT_EQ(*v, expected);
    ++expected;
  }
  EXPECT_EQ(expected, 100);
}

TEST(RendezvousChannel, CloseWakesReceiverWithNullopt) {
  RendezvousChannel<int> ch;
  std::jthread closer([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ch.close();
  });
  EXPECT_FALSE(ch.receive().has_value());
  EXPECT_TRUE(ch.done());

  std::stop_source ss;
  EXPECT_EQ(ch.send(1, ss.get_token()), Status::Closed);
}

TEST(RendezvousChannel, CancelReleasesBlockedSender) {
  RendezvousChannel<int> ch;
  std::optional<Status> status;

  std::jthread producer([&](std::stop_token st) { status = ch.send(5, st); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  ch.cancel();
  producer.join();

  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(*status, Status::Cancelled);
  EXPECT_FALSE(ch.receive().has_value());
}

TEST(RendezvousChannel, StopTokenReleasesBlockedSender) {
  RendezvousChannel<int> ch;
  std::optional<Status> status;

  std::jthread producer([&](std::stop_token st) { status = ch.send(5, st); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  producer.request_stop();
  producer.join();

  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(*status, Status::Cancelled);
  // The withdrawn offer is not delivered later.
  ch.close();
  EXPECT_FALSE(ch.receive().has_value());
}
