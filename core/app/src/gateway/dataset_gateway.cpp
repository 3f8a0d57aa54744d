#include "sentiment/gateway/dataset_gateway.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace sentiment {

namespace {

// Absent and null both mean "no observation for this day".
double numberOrMissing(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return domain::kMissing;
  }
  // get<double>() throws type_error for strings and objects; parseMessage
  // turns that into a rejected payload.
  return it->get<double>();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: SUB socket with receive timeout
// -----------------------------------------------------------------------------
DatasetGateway::DatasetGateway(const std::string& endpoint,
                               std::chrono::milliseconds idle_timeout)
    : idle_timeout_(idle_timeout) {
  // Empty filter: accept every row the fetcher publishes. The fetcher
  // sends one untopiced stream per run.
  socket_.set(zmq::sockopt::subscribe, "");

  // ZMQ_RCVTIMEO bounds each recv() so the loop wakes up to re-check the
  // stop flag and the idle timer even when the fetcher is silent.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);

  // A SUB socket only ever queues subscription frames outbound; drop them
  // on close so context teardown never waits for an absent fetcher.
  socket_.set(zmq::sockopt::linger, 0);

  // connect() is non-blocking; the TCP handshake and the subscription
  // upstream happen in the ZMQ I/O thread. The fetcher may start before or
  // after us, ZMQ reconnects either way.
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// parseMessage: JSON payload -> Message
// -----------------------------------------------------------------------------
std::optional<DatasetGateway::Message> DatasetGateway::parseMessage(
    const std::string& payload) {
  try {
    // parse() throws parse_error on malformed text.
    auto json = nlohmann::json::parse(payload);
    if (!json.is_object()) {
      return std::nullopt;
    }

    Message msg;

    // --- End-of-stream marker ---------------------------------------------
    if (json.value("type", std::string()) == "eos") {
      msg.kind = Message::Kind::EndOfStream;
      return msg;
    }

    // --- Row -------------------------------------------------------------
    // at() throws out_of_range when "date" is absent; get<std::string>()
    // throws type_error when it is not a string. Both land in the catch.
    auto date = domain::parseDate(json.at("date").get<std::string>());
    if (!date.has_value()) {
      return std::nullopt;
    }
    msg.date = *date;

    // Value fields are optional: null or absent is a missing observation,
    // which the signal engine degrades to HOLD.
    msg.close = numberOrMissing(json, "close");
    msg.vix = numberOrMissing(json, "vix");
    msg.fear_greed = numberOrMissing(json, "fear_greed");
    return msg;
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// collect(): blocking recv loop
// -----------------------------------------------------------------------------
AlignedDataset DatasetGateway::collect() {
  using Clock = std::chrono::steady_clock;

  AlignedDataset dataset;
  auto last_message = Clock::now();

  // stop_requested_ is only ever set, never cleared here: a stop() issued
  // before this call makes the loop body never run.
  while (!stop_requested_.load()) {
    zmq::message_t msg;

    // Bounded by ZMQ_RCVTIMEO. An empty result means the timeout expired
    // with no message.
    auto result = socket_.recv(msg, zmq::recv_flags::none);

    if (!result.has_value()) {
      // --- Timeout ------------------------------------------------------
      // Before the first row, keep waiting: the fetcher may still be
      // downloading. Once rows have started flowing, a long silence means
      // the fetcher exited without sending end-of-stream.
      if (idle_timeout_.count() > 0 && !dataset.empty() &&
          Clock::now() - last_message >= idle_timeout_) {
        std::cerr << "[DatasetGateway] WARNING: no message for "
                  << idle_timeout_.count()
                  << " ms, closing stream without end-of-stream marker\n";
        break;
      }
      continue;
    }
    last_message = Clock::now();

    // --- Step 1: decode ------------------------------------------------
    // to_string() copies the frame; rows are small and arrive once per
    // trading day of history.
    std::string payload = msg.to_string();
    auto parsed = parseMessage(payload);
    if (!parsed.has_value()) {
      // A bad row is skipped, not fatal. The evaluator's alignment checks
      // catch any hole this leaves in the dataset.
      std::cerr << "[DatasetGateway] malformed message skipped: " << payload
                << "\n";
      continue;
    }

    // --- Step 2: end of stream ends the loop -----------------------------
    if (parsed->kind == Message::Kind::EndOfStream) {
      break;
    }

    // --- Step 3: append in arrival order ---------------------------------
    // Ordering and duplicate dates are left to validateAlignment().
    dataset.append(parsed->date, parsed->close, parsed->vix,
                   parsed->fear_greed);
  }

  std::cout << "[DatasetGateway] received " << dataset.size() << " rows\n";
  return dataset;
}

// -----------------------------------------------------------------------------
// stop(): signal the recv loop to exit
// -----------------------------------------------------------------------------
void DatasetGateway::stop() {
  // Atomic store, seen by collect() within kRecvTimeoutMs. Latched: there
  // is no restart, so nothing ever resets it.
  stop_requested_.store(true);
}

}  // namespace sentiment
