#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <map>
#include <thread>
#include <vector>

#include "NotificationChannel.hpp"

namespace fetcher {
namespace {

using std::chrono::milliseconds;

TEST(NotificationChannelTest, DeliversInSendOrder) {
  NotificationChannel channel;
  channel.send(1, makeProgress(10));
  channel.send(1, makeProgress(20));
  channel.send(1, makeSuccess("/tmp/a.mp4"));

  std::vector<NotificationChannel::Envelope> got;
  EXPECT_EQ(channel.drain(
                [&got](const NotificationChannel::Envelope& e) {
                  got.push_back(e);
                }),
            3u);
  ASSERT_EQ(got.size(), 3u);
  EXPECT_EQ(std::get<Progress>(got[0].notification).percent, 10);
  EXPECT_EQ(std::get<Progress>(got[1].notification).percent, 20);
  EXPECT_TRUE(isTerminal(got[2].notification));
  EXPECT_EQ(channel.size(), 0u);
}

TEST(NotificationChannelTest, ReceiveTimesOutWhenEmpty) {
  NotificationChannel channel;
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(channel.receive(milliseconds(20)).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - start, milliseconds(15));
}

TEST(NotificationChannelTest, ReceiveWakesOnSendFromAnotherThread) {
  NotificationChannel channel;
  std::thread sender([&channel]() {
    std::this_thread::sleep_for(milliseconds(20));
    channel.send(7, makeFailure(FailureReason::TRANSFER_ERROR, "disk full"));
  });
  auto envelope = channel.receive(milliseconds(5000));
  sender.join();
  ASSERT_TRUE(envelope.has_value());
  EXPECT_EQ(envelope->jobId, 7u);
  EXPECT_EQ(describe(envelope->notification),
            "Failed: TransferError: disk full");
}

TEST(NotificationChannelTest, ConcurrentSendersLoseNothingAndKeepOrder) {
  NotificationChannel channel;
  constexpr int kSenders = 8;
  constexpr int kPerSender = 500;
  std::vector<std::thread> senders;
  for (int s = 0; s < kSenders; ++s) {
    senders.emplace_back([&channel, s]() {
      for (int i = 0; i < kPerSender; ++i) {
        channel.send(static_cast<JobId>(s), makeProgress(i % 101));
      }
      channel.send(static_cast<JobId>(s), makeSuccess("done"));
    });
  }
  for (auto& t : senders) t.join();

  std::map<JobId, int> counts;
  std::map<JobId, bool> terminated;
  channel.drain([&](const NotificationChannel::Envelope& e) {
    EXPECT_FALSE(terminated[e.jobId]) << "notification after terminal";
    if (isTerminal(e.notification)) {
      terminated[e.jobId] = true;
      return;
    }
    EXPECT_EQ(std::get<Progress>(e.notification).percent,
              counts[e.jobId] % 101);
    ++counts[e.jobId];
  });
  ASSERT_EQ(counts.size(), static_cast<size_t>(kSenders));
  for (const auto& kv : counts) {
    EXPECT_EQ(kv.second, kPerSender);
    EXPECT_TRUE(terminated[kv.first]);
  }
}

TEST(NotificationChannelTest, CloseIgnoresLaterSends) {
  NotificationChannel channel;
  channel.send(1, makeProgress(5));
  channel.close();
  channel.send(1, makeProgress(6));
  EXPECT_TRUE(channel.closed());
  EXPECT_EQ(channel.size(), 1u);
  EXPECT_TRUE(channel.receive(milliseconds(0)).has_value());
  // 关闭且为空时立即返回
  EXPECT_FALSE(channel.receive(milliseconds(5000)).has_value());
}

TEST(NotificationTest, DescribeAndClamp) {
  EXPECT_EQ(describe(makeProgress(42)), "progress 42%");
  EXPECT_EQ(std::get<Progress>(makeProgress(250)).percent, 100);
  EXPECT_EQ(std::get<Progress>(makeProgress(-3)).percent, 0);
  EXPECT_EQ(describe(makeSuccess("/data/x.mp4")), "Saved: /data/x.mp4");
  EXPECT_EQ(describe(makeFailure(FailureReason::NO_STREAM_AVAILABLE, "")),
            "Failed: NoStreamAvailable");
  EXPECT_TRUE(std::get<Terminal>(makeSuccess("p")).succeeded());
  EXPECT_FALSE(
      std::get<Terminal>(makeFailure(FailureReason::RESOLUTION_ERROR, "x"))
          .succeeded());
}

}  // namespace
}  // namespace fetcher
