#pragma once

#include "tradecall/events/event.hpp"
#include "tradecall/gateway/message_gateway.hpp"
#include "tradecall/time/i_time_provider.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace tradecall {

// -----------------------------------------------------------------------------
// MessageThread - dedicated I/O thread for chat ingress
// -----------------------------------------------------------------------------
//
// @brief  Owns a MessageGateway and the std::thread running its recv loop.
//
// @details
// The gateway is created in start(), not in the constructor, so
// TradingEngine can build the thread object before any socket exists.
// The event sink is bound to the signal loop's push(), so every message is
// handed to SignalRouter on the signal loop thread.
//
// Thread model:
//   start()/stop() from the owning thread only. stop() blocks until the
//   recv loop exits (at most one receive timeout).
//
// Ownership:
//   Owned by TradingEngine via std::unique_ptr. Owns the gateway.
// -----------------------------------------------------------------------------
class MessageThread {
 public:
  using EventSink = std::function<void(Event)>;

  MessageThread(const ITimeProvider& time_provider, EventSink event_sink,
                std::string endpoint);

  ~MessageThread();

  MessageThread(const MessageThread&) = delete;
  MessageThread& operator=(const MessageThread&) = delete;
  MessageThread(MessageThread&&) = delete;
  MessageThread& operator=(MessageThread&&) = delete;

  // Idempotent.
  void start();

  // Idempotent; safe if never started.
  void stop();

 private:
  const ITimeProvider& time_provider_;
  EventSink event_sink_;
  std::string endpoint_;

  std::unique_ptr<MessageGateway> gateway_;
  std::thread thread_;
};

}  // namespace tradecall
