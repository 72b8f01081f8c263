#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "bus/channel.hpp"
#include "test_utils.hpp"

using namespace quloud;
using namespace quloud::bus;

class ChannelTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_test_logging();
  }

  Channel channel;

  static Envelope make_envelope(const std::string& destination, const std::string& payload) {
    return Envelope{destination, test::bytes_of(payload)};
  }

public:
  // Producer thread body
  void run_producer(int start_id, int count) {
    for (int i = 0; i < count; ++i) {
      channel.produce(make_envelope("dest", std::to_string(start_id + i)));
    }
  }
};

TEST_F(ChannelTest, StartsEmpty) {
  EXPECT_TRUE(channel.empty());
  EXPECT_EQ(channel.size(), 0u);
  EXPECT_FALSE(channel.closed());

  Envelope envelope;
  EXPECT_FALSE(channel.consume(envelope));
}

TEST_F(ChannelTest, FifoOrder) {
  ASSERT_TRUE(channel.produce(make_envelope("a", "first")));
  ASSERT_TRUE(channel.produce(make_envelope("b", "second")));
  EXPECT_EQ(channel.size(), 2u);

  Envelope envelope;
  ASSERT_TRUE(channel.consume(envelope));
  EXPECT_EQ(envelope.destination, "a");
  EXPECT_EQ(envelope.payload, test::bytes_of("first"));

  ASSERT_TRUE(channel.consume(envelope));
  EXPECT_EQ(envelope.destination, "b");
  EXPECT_TRUE(channel.empty());
}

TEST_F(ChannelTest, WaitConsumeTimesOut) {
  Envelope envelope;
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(channel.wait_consume(envelope, std::chrono::milliseconds(50)));
  EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));
}

TEST_F(ChannelTest, WaitConsumeWakesOnProduce) {
  std::thread producer([this] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    channel.produce(make_envelope("dest", "late"));
  });

  Envelope envelope;
  EXPECT_TRUE(channel.wait_consume(envelope, std::chrono::seconds(5)));
  EXPECT_EQ(envelope.payload, test::bytes_of("late"));
  producer.join();
}

TEST_F(ChannelTest, CloseWakesWaiterAndRejectsProduce) {
  std::atomic<bool> returned{false};
  std::thread waiter([this, &returned] {
    Envelope envelope;
    channel.wait_consume(envelope, std::chrono::seconds(10));
    returned = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  channel.close();
  waiter.join();

  EXPECT_TRUE(returned);
  EXPECT_TRUE(channel.closed());
  EXPECT_FALSE(channel.produce(make_envelope("dest", "too late")));
}

TEST_F(ChannelTest, QueuedEnvelopesSurviveClose) {
  channel.produce(make_envelope("dest", "queued"));
  channel.close();

  Envelope envelope;
  EXPECT_TRUE(channel.wait_consume(envelope, std::chrono::milliseconds(10)));
  EXPECT_EQ(envelope.payload, test::bytes_of("queued"));
  EXPECT_FALSE(channel.wait_consume(envelope, std::chrono::milliseconds(10)));
}

TEST_F(ChannelTest, ConcurrentProducersAndConsumers) {
  const int num_producers = 4;
  const int per_producer = 250;
  std::atomic<int> consumed{0};
  std::atomic<bool> done{false};

  std::vector<std::thread> consumers;
  for (int c = 0; c < 3; ++c) {
    consumers.emplace_back([this, &consumed, &done] {
      Envelope envelope;
      while (!done || !channel.empty()) {
        if (channel.wait_consume(envelope, std::chrono::milliseconds(10))) {
          ++consumed;
        }
      }
    });
  }

  std::vector<std::thread> producers;
  for (int p = 0; p < num_producers; ++p) {
    producers.emplace_back(&ChannelTest::run_producer, this, p * per_producer, per_producer);
  }
  for (auto& producer : producers) {
    producer.join();
  }
  done = true;
  for (auto& consumer : consumers) {
    consumer.join();
  }

  EXPECT_EQ(consumed.load(), num_producers * per_producer);
  EXPECT_TRUE(channel.empty());
}
