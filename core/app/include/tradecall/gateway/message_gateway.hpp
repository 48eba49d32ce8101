#pragma once

#include "tradecall/events/event.hpp"
#include "tradecall/time/i_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace tradecall {

// -----------------------------------------------------------------------------
// MessageGateway - ZeroMQ ingress for chat messages
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON-encoded chat messages from
//         the chat bridge and pushes ChatMessageEvent into the signal loop.
//
// @details
// The chat bridge (a separate process holding the chat platform session)
// publishes one JSON object per message:
//
//   {
//     "sender":       "123456789",      // author id
//     "channel":      "987654321",      // channel id
//     "content":      "BUY BTC AT 50000",
//     "timestamp_ms": 1700000000000     // optional, epoch ms
//   }
//
// Messages without timestamp_ms are stamped with ITimeProvider::now_ms().
// Each decoded message gets the next sequence id (starting at 1); the id is
// what operators use to CONFIRM or IGNORE a pending call.
//
// Malformed payloads (invalid JSON, missing or wrong-typed fields) are
// logged on std::cerr and skipped; the loop keeps running.
//
// Thread model:
//   run() blocks; MessageThread calls it on a dedicated thread. stop() is
//   safe from any thread and takes effect within kRecvTimeoutMs.
//
// Ownership:
//   Owns the zmq context and socket. Holds a reference to the time provider
//   and a copy of the event sink.
// -----------------------------------------------------------------------------
class MessageGateway {
 public:
  using EventSink = std::function<void(Event)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Creates the SUB socket, subscribes to everything, sets the
  //         receive timeout and connects to `endpoint`.
  // -------------------------------------------------------------------------
  MessageGateway(const ITimeProvider& time_provider, EventSink event_sink,
                 const std::string& endpoint);

  ~MessageGateway() = default;

  MessageGateway(const MessageGateway&) = delete;
  MessageGateway& operator=(const MessageGateway&) = delete;
  MessageGateway(MessageGateway&&) = delete;
  MessageGateway& operator=(MessageGateway&&) = delete;

  void run();
  void stop();

  // -------------------------------------------------------------------------
  // decode(payload)
  // -------------------------------------------------------------------------
  // @brief  Turns one wire payload into a ChatMessageEvent.
  // @return std::nullopt (after logging) when the payload is malformed.
  //         Consumes a sequence id only on success.
  // -------------------------------------------------------------------------
  std::optional<ChatMessageEvent> decode(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  const ITimeProvider& time_provider_;
  EventSink event_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  // True from construction so a stop() issued before run() is not lost.
  std::atomic<bool> running_{true};
  std::uint64_t next_sequence_{1};  // Recv thread only
};

}  // namespace tradecall
