// =============================================================================
// dataset_gateway_test.cpp
// =============================================================================
// Unit tests for sentiment::DatasetGateway.
//
// Validates:
//   - Row and end-of-stream messages decode correctly
//   - null and absent values read as missing
//   - Malformed payloads are rejected without throwing
//   - stop() from another thread ends collect() with no publisher attached
//   - stop() issued before collect() is not lost
//   - collect() over a real socket: rows, null values, malformed payloads
//     and end-of-stream from a locally bound publisher
//   - idle timeout closes a stream that never sends end-of-stream
//
// The publisher side is an XPUB socket bound to an ephemeral port. XPUB
// surfaces the gateway's subscription frame, so the tests wait for it
// instead of sleeping before they publish.
// =============================================================================

#include "sentiment/gateway/dataset_gateway.hpp"

#include <gtest/gtest.h>
#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <string>
#include <thread>

using sentiment::DatasetGateway;
using sentiment::domain::fromCivil;

namespace {

// Local stand-in for the data fetcher's PUB socket.
class TestPublisher {
 public:
  TestPublisher() {
    socket_.set(zmq::sockopt::linger, 0);
    socket_.set(zmq::sockopt::rcvtimeo, 5000);
    socket_.bind("tcp://127.0.0.1:*");
  }

  std::string endpoint() { return socket_.get(zmq::sockopt::last_endpoint); }

  // Blocks until a subscriber's subscribe frame (0x01 prefix) arrives.
  bool awaitSubscriber() {
    zmq::message_t frame;
    auto result = socket_.recv(frame, zmq::recv_flags::none);
    return result.has_value() && frame.size() > 0 &&
           static_cast<const unsigned char*>(frame.data())[0] == 1;
  }

  bool publish(const std::string& payload) {
    auto sent = socket_.send(zmq::buffer(payload), zmq::send_flags::none);
    return sent.has_value();
  }

 private:
  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::xpub};
};

}  // namespace

TEST(DatasetGatewayTest, ParsesRowMessage) {
  auto msg = DatasetGateway::parseMessage(
      R"({"date": "2020-03-16", "close": 239.85, "vix": 82.69, "fear_greed": 2})");
  ASSERT_TRUE(msg.has_value());
  EXPECT_EQ(msg->kind, DatasetGateway::Message::Kind::Row);
  EXPECT_EQ(msg->date, sentiment::domain::fromCivil(2020, 3, 16));
  EXPECT_DOUBLE_EQ(msg->close, 239.85);
  EXPECT_DOUBLE_EQ(msg->vix, 82.69);
  EXPECT_DOUBLE_EQ(msg->fear_greed, 2.0);
}

TEST(DatasetGatewayTest, NullAndAbsentValuesAreMissing) {
  auto msg = DatasetGateway::parseMessage(
      R"({"date": "2020-03-17", "close": 252.8, "vix": null})");
  ASSERT_TRUE(msg.has_value());
  EXPECT_DOUBLE_EQ(msg->close, 252.8);
  EXPECT_TRUE(std::isnan(msg->vix));
  EXPECT_TRUE(std::isnan(msg->fear_greed));
}

TEST(DatasetGatewayTest, ParsesEndOfStream) {
  auto msg = DatasetGateway::parseMessage(R"({"type": "eos"})");
  ASSERT_TRUE(msg.has_value());
  EXPECT_EQ(msg->kind, DatasetGateway::Message::Kind::EndOfStream);
}

TEST(DatasetGatewayTest, RejectsMalformedPayloads) {
  EXPECT_FALSE(DatasetGateway::parseMessage("not json").has_value());
  EXPECT_FALSE(DatasetGateway::parseMessage("[1, 2, 3]").has_value());
  EXPECT_FALSE(DatasetGateway::parseMessage(R"({"close": 1.0})").has_value());
  EXPECT_FALSE(
      DatasetGateway::parseMessage(R"({"date": "2020-02-30"})").has_value());
  EXPECT_FALSE(
      DatasetGateway::parseMessage(R"({"date": 20200316})").has_value());
  EXPECT_FALSE(DatasetGateway::parseMessage(
                   R"({"date": "2020-03-16", "vix": "high"})")
                   .has_value());
}

// -----------------------------------------------------------------------------
// stop() keeps being requested until collect() returns; the recv timeout
// guarantees the loop re-checks the flag with no traffic.
// -----------------------------------------------------------------------------
TEST(DatasetGatewayTest, StopEndsCollect) {
  DatasetGateway gateway("tcp://127.0.0.1:5599");

  std::atomic<bool> done{false};
  std::thread stopper([&] {
    while (!done.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      gateway.stop();
    }
  });

  auto dataset = gateway.collect();
  done.store(true);
  stopper.join();

  EXPECT_TRUE(dataset.empty());
}

// -----------------------------------------------------------------------------
// A stop() that lands before collect() starts still ends it: the flag is
// latched, not reset on entry.
// -----------------------------------------------------------------------------
TEST(DatasetGatewayTest, StopBeforeCollectIsNotLost) {
  DatasetGateway gateway("tcp://127.0.0.1:5598");
  gateway.stop();

  const auto start = std::chrono::steady_clock::now();
  auto dataset = gateway.collect();
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(dataset.empty());
  EXPECT_LT(elapsed, std::chrono::seconds(1));

  // Still latched for a second call.
  EXPECT_TRUE(gateway.collect().empty());
}

// -----------------------------------------------------------------------------
// Full receive path: two rows (one with a null VIX), a malformed payload in
// between, then end-of-stream.
// -----------------------------------------------------------------------------
TEST(DatasetGatewayTest, CollectsRowsUntilEndOfStream) {
  TestPublisher publisher;
  DatasetGateway gateway(publisher.endpoint());
  ASSERT_TRUE(publisher.awaitSubscriber());

  ASSERT_TRUE(publisher.publish(
      R"({"date": "2020-03-16", "close": 239.85, "vix": 82.69, "fear_greed": 2})"));
  ASSERT_TRUE(publisher.publish("not json"));
  ASSERT_TRUE(publisher.publish(
      R"({"date": "2020-03-17", "close": 252.8, "vix": null, "fear_greed": 3})"));
  ASSERT_TRUE(publisher.publish(R"({"type": "eos"})"));

  auto dataset = gateway.collect();

  ASSERT_EQ(dataset.size(), 2u);
  EXPECT_EQ(dataset.prices[0].date, fromCivil(2020, 3, 16));
  EXPECT_DOUBLE_EQ(dataset.prices[0].close, 239.85);
  EXPECT_DOUBLE_EQ(dataset.sentiment[0].vix, 82.69);
  EXPECT_DOUBLE_EQ(dataset.sentiment[0].fear_greed, 2.0);

  EXPECT_EQ(dataset.prices[1].date, fromCivil(2020, 3, 17));
  EXPECT_EQ(dataset.sentiment[1].date, fromCivil(2020, 3, 17));
  EXPECT_DOUBLE_EQ(dataset.prices[1].close, 252.8);
  EXPECT_TRUE(std::isnan(dataset.sentiment[1].vix));
  EXPECT_DOUBLE_EQ(dataset.sentiment[1].fear_greed, 3.0);
}

// -----------------------------------------------------------------------------
// A fetcher that dies mid-stream: rows arrive, no end-of-stream follows, and
// the idle timeout returns what was received.
// -----------------------------------------------------------------------------
TEST(DatasetGatewayTest, IdleTimeoutClosesStream) {
  TestPublisher publisher;
  DatasetGateway gateway(publisher.endpoint(), std::chrono::milliseconds(200));
  ASSERT_TRUE(publisher.awaitSubscriber());

  ASSERT_TRUE(publisher.publish(
      R"({"date": "2024-01-02", "close": 472.65, "vix": 13.2, "fear_greed": 71})"));
  ASSERT_TRUE(publisher.publish(
      R"({"date": "2024-01-03", "close": 468.79, "vix": 14.04, "fear_greed": 65})"));

  const auto start = std::chrono::steady_clock::now();
  auto dataset = gateway.collect();
  const auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_EQ(dataset.size(), 2u);
  EXPECT_EQ(dataset.prices[1].date, fromCivil(2024, 1, 3));
  EXPECT_DOUBLE_EQ(dataset.sentiment[1].fear_greed, 65.0);
  EXPECT_GE(elapsed, std::chrono::milliseconds(200));
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}
