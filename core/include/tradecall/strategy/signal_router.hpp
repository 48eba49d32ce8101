#pragma once

#include "tradecall/domain/engine_config.hpp"
#include "tradecall/eventbus/event_bus.hpp"
#include "tradecall/events/event_types.hpp"
#include "tradecall/execution/execution_engine.hpp"
#include "tradecall/parser/intent_parser.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tradecall {

// -----------------------------------------------------------------------------
// PendingSignal
// -----------------------------------------------------------------------------
// A parsed call waiting for an operator decision. `id` is the sequence id of
// the chat message it came from.
// -----------------------------------------------------------------------------
struct PendingSignal {
  std::uint64_t id{0};
  std::string sender;
  std::string raw_text;
  domain::TradeIntent intent;
};

// -----------------------------------------------------------------------------
// ConfirmResult
// -----------------------------------------------------------------------------
struct ConfirmResult {
  enum class Status { Executed, UnknownId, Halted };
  Status status{Status::UnknownId};
  ExecutionOutcome outcome;     // Valid when status == Executed
};

// -----------------------------------------------------------------------------
// SignalRouter
// -----------------------------------------------------------------------------
// Responsibility: Decides what happens to each chat message. Subscribes to
// ChatMessageEvent on the signal loop's bus and, per message:
//
//   1. Drops it silently if authorized_sender / authorized_channel are set
//      and do not match.
//   2. Runs IntentParser::parseMessage().
//   3. Publishes a SignalEvent with the resulting disposition:
//        no intent           -> Ignored (logged at info level)
//        trading halted      -> Halted
//        auto-execute on     -> Executed (ExecutionEngine::execute called)
//        auto-execute off    -> Pending (parked under the message id)
//
// The SignalEvent for an executed call is published after execute()
// returns, so order and position events for the call precede it on the bus.
//
// Operator controls (IPC thread): setHalted(), setAutoExecute(), confirm(),
// ignore(), pending().
//
// Thread model: onMessage() runs on the signal loop thread. Flags are
// atomics; the pending map is behind pending_mutex_, which is never held
// while an intent executes.
// -----------------------------------------------------------------------------
class SignalRouter {
 public:
  SignalRouter(EventBus& bus, const IntentParser& parser,
               ExecutionEngine& engine, const domain::EngineConfig& config);

  ~SignalRouter();

  SignalRouter(const SignalRouter&) = delete;
  SignalRouter& operator=(const SignalRouter&) = delete;
  SignalRouter(SignalRouter&&) = delete;
  SignalRouter& operator=(SignalRouter&&) = delete;

  // Executes a parked call. The call is removed from the pending set unless
  // trading is halted.
  ConfirmResult confirm(std::uint64_t id);

  // Discards a parked call. Returns false for an unknown id.
  bool ignore(std::uint64_t id);

  std::vector<PendingSignal> pending() const;

  void setHalted(bool halted);
  bool halted() const { return halted_.load(); }

  void setAutoExecute(bool enabled);
  bool autoExecute() const { return auto_execute_.load(); }

 private:
  void onMessage(const ChatMessageEvent& event);
  bool authorized(const ChatMessageEvent& event) const;

  EventBus& bus_;
  const IntentParser& parser_;
  ExecutionEngine& engine_;
  const domain::EngineConfig& config_;
  EventBus::SubscriptionId subscription_id_{0};

  std::atomic<bool> halted_{false};
  std::atomic<bool> auto_execute_;

  mutable std::mutex pending_mutex_;
  std::map<std::uint64_t, PendingSignal> pending_;
};

}  // namespace tradecall
