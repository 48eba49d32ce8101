#include "tradecall/strategy/signal_router.hpp"
#include "tradecall/events/signal_event.hpp"

#include <iostream>

namespace tradecall {

// -----------------------------------------------------------------------------
// Constructor: subscribe to ChatMessageEvent
// -----------------------------------------------------------------------------
SignalRouter::SignalRouter(EventBus& bus, const IntentParser& parser,
                           ExecutionEngine& engine,
                           const domain::EngineConfig& config)
    : bus_(bus),
      parser_(parser),
      engine_(engine),
      config_(config),
      auto_execute_(config.auto_execute) {
  subscription_id_ = bus_.subscribe<ChatMessageEvent>(
      [this](const ChatMessageEvent& e) { onMessage(e); });
}

// -----------------------------------------------------------------------------
// Destructor: unsubscribe so no more callbacks
// -----------------------------------------------------------------------------
SignalRouter::~SignalRouter() { bus_.unsubscribe(subscription_id_); }

// -----------------------------------------------------------------------------
// authorized: empty filters accept everything
// -----------------------------------------------------------------------------
bool SignalRouter::authorized(const ChatMessageEvent& event) const {
  if (!config_.authorized_sender.empty() &&
      event.sender != config_.authorized_sender) {
    return false;
  }
  if (!config_.authorized_channel.empty() &&
      event.channel != config_.authorized_channel) {
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// onMessage: filter, size check, parse, then execute / park / drop
// -----------------------------------------------------------------------------
void SignalRouter::onMessage(const ChatMessageEvent& event) {
  if (!authorized(event)) {
    return;
  }

  SignalEvent signal;
  signal.sender = event.sender;
  signal.raw_text = event.content;
  signal.timestamp = event.timestamp;
  signal.sequence_id = event.sequence_id;

  if (event.content.size() > config_.max_message_chars) {
    std::cout << "[SignalRouter] #" << event.sequence_id << " dropped, "
              << event.content.size() << " chars exceeds limit of "
              << config_.max_message_chars << "\n";
    signal.raw_text = event.content.substr(0, config_.max_message_chars);
    signal.disposition = SignalEvent::Disposition::Ignored;
    bus_.publish(signal);
    return;
  }

  signal.intent = parser_.parseMessage(event.content);

  if (!signal.intent) {
    std::cout << "[SignalRouter] #" << event.sequence_id
              << " not a trade call\n";
    signal.disposition = SignalEvent::Disposition::Ignored;
    bus_.publish(signal);
    return;
  }

  const domain::TradeIntent& intent = *signal.intent;
  std::cout << "[SignalRouter] #" << event.sequence_id << " "
            << domain::toString(intent.action) << " " << intent.symbol << " "
            << domain::toString(intent.order_kind) << " @ "
            << intent.primaryPrice() << " lev " << intent.leverage << "x ("
            << domain::toString(intent.rule) << ")\n";

  if (halted_.load()) {
    std::cout << "[SignalRouter] trading halted, call #" << event.sequence_id
              << " dropped\n";
    signal.disposition = SignalEvent::Disposition::Halted;
  } else if (auto_execute_.load()) {
    engine_.execute(intent);
    signal.disposition = SignalEvent::Disposition::Executed;
  } else {
    {
      std::lock_guard lock(pending_mutex_);
      pending_[event.sequence_id] =
          PendingSignal{event.sequence_id, event.sender, event.content, intent};
    }
    std::cout << "[SignalRouter] call #" << event.sequence_id
              << " pending, CONFIRM " << event.sequence_id << " to execute\n";
    signal.disposition = SignalEvent::Disposition::Pending;
  }

  bus_.publish(signal);
}

// -----------------------------------------------------------------------------
// confirm: execute a parked call outside the pending lock
// -----------------------------------------------------------------------------
ConfirmResult SignalRouter::confirm(std::uint64_t id) {
  ConfirmResult result;
  if (halted_.load()) {
    result.status = ConfirmResult::Status::Halted;
    return result;
  }

  PendingSignal parked;
  {
    std::lock_guard lock(pending_mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
      result.status = ConfirmResult::Status::UnknownId;
      return result;
    }
    parked = std::move(it->second);
    pending_.erase(it);
  }

  std::cout << "[SignalRouter] call #" << id << " confirmed\n";
  result.status = ConfirmResult::Status::Executed;
  result.outcome = engine_.execute(parked.intent);
  return result;
}

bool SignalRouter::ignore(std::uint64_t id) {
  std::lock_guard lock(pending_mutex_);
  return pending_.erase(id) > 0;
}

std::vector<PendingSignal> SignalRouter::pending() const {
  std::lock_guard lock(pending_mutex_);
  std::vector<PendingSignal> result;
  result.reserve(pending_.size());
  for (const auto& entry : pending_) {
    result.push_back(entry.second);
  }
  return result;
}

// -----------------------------------------------------------------------------
// Operator flags
// -----------------------------------------------------------------------------
void SignalRouter::setHalted(bool halted) {
  halted_.store(halted);
  std::cout << "[SignalRouter] trading " << (halted ? "HALTED" : "RESUMED")
            << "\n";
}

void SignalRouter::setAutoExecute(bool enabled) {
  auto_execute_.store(enabled);
  std::cout << "[SignalRouter] auto-execute " << (enabled ? "ON" : "OFF")
            << "\n";
}

}  // namespace tradecall
