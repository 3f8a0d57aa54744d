#pragma once

#include "sentiment/data/aligned_dataset.hpp"
#include "sentiment/domain/date.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

namespace sentiment {

// -----------------------------------------------------------------------------
// DatasetGateway — ZeroMQ bridge from the data fetcher
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to the data fetcher's PUB socket, decodes one JSON row
//         per message, and assembles an AlignedDataset in memory.
//
// @details
// The Python fetcher downloads and caches VIX, CNN fear & greed and SPY
// history, merges them, and publishes the merged table row by row so the
// C++ side never touches the network or the fetcher's cache format.
//
// Expected JSON messages:
//   { "date": "2020-03-16", "close": 239.85, "vix": 82.69, "fear_greed": 2 }
//   { "type": "eos" }                      // end of stream
// "close", "vix" and "fear_greed" may be null or absent (read as missing).
// Rows are stored in arrival order; alignment and ordering are validated
// later by the evaluator, not here.
//
// Loop termination:
//   - an end-of-stream message,
//   - stop() from any thread, before or during collect(),
//   - idle_timeout elapsing without a message after at least one row
//     arrived (disabled when idle_timeout is zero).
//
// Shutdown safety (ZMQ_RCVTIMEO):
//   recv() returns every kRecvTimeoutMs even with no traffic so the stop
//   flag and idle timer are re-checked.
//
// Stop semantics:
//   stop() latches. Once requested, the current collect() returns and any
//   later collect() returns immediately with an empty dataset; the flag is
//   never cleared, so a stop() that races ahead of collect() is not lost.
//
// Ownership:
//   Owns the zmq::context_t and zmq::socket_t (RAII).
// -----------------------------------------------------------------------------
class DatasetGateway {
 public:
  // Decoded form of one message.
  struct Message {
    enum class Kind { Row, EndOfStream } kind{Kind::Row};
    domain::Date date{};
    double close{domain::kMissing};
    double vix{domain::kMissing};
    double fear_greed{domain::kMissing};
  };

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  endpoint      ZMQ endpoint of the fetcher's PUB socket.
  // @param  idle_timeout  See loop termination above. Zero waits forever.
  //
  // Side-effects: Opens a SUB socket and connects (non-blocking).
  // -------------------------------------------------------------------------
  explicit DatasetGateway(
      const std::string& endpoint = "tcp://127.0.0.1:5555",
      std::chrono::milliseconds idle_timeout = std::chrono::milliseconds{0});

  ~DatasetGateway() = default;

  DatasetGateway(const DatasetGateway&) = delete;
  DatasetGateway& operator=(const DatasetGateway&) = delete;
  DatasetGateway(DatasetGateway&&) = delete;
  DatasetGateway& operator=(DatasetGateway&&) = delete;

  // -------------------------------------------------------------------------
  // collect()
  // -------------------------------------------------------------------------
  // @brief  Blocking receive loop; returns every row received.
  //
  // Malformed messages are logged to stderr and skipped.
  // -------------------------------------------------------------------------
  AlignedDataset collect();

  // Requests collect() to return. Safe to call from any thread, and
  // effective even when called before collect() starts.
  void stop();

  // -------------------------------------------------------------------------
  // parseMessage(payload)
  // -------------------------------------------------------------------------
  // @return The decoded message, or std::nullopt if the payload is not
  //         valid JSON, lacks a parseable "date", or has a non-numeric
  //         value field.
  // -------------------------------------------------------------------------
  static std::optional<Message> parseMessage(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  std::chrono::milliseconds idle_timeout_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> stop_requested_{false};
};

}  // namespace sentiment
