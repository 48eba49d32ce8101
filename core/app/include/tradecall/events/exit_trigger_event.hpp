#pragma once

#include "tradecall/events/event_types.hpp"

#include <string>

namespace tradecall {

// -----------------------------------------------------------------------------
// ExitTriggerEvent
// -----------------------------------------------------------------------------
// Responsibility: PositionMonitor detected an exit condition. Published before
// the close is attempted, so a trigger whose close later fails is still
// visible.
//
//   StopLoss         price <= absolute stop_loss
//   StopLossPercent  leveraged P/L <= -stop_loss_pct (no absolute stop set)
//   TakeProfit       ladder level `level_index` crossed
//   ProfitTarget     leveraged P/L >= take_profit_pct (no ladder)
//
// `threshold` is the stop/target price for absolute rules and the configured
// percentage for percentage rules.
// -----------------------------------------------------------------------------
struct ExitTriggerEvent {
  enum class Trigger { StopLoss, StopLossPercent, TakeProfit, ProfitTarget };

  std::string symbol;
  Trigger trigger{Trigger::StopLoss};
  double price{0.0};          // Market price that tripped the rule
  double threshold{0.0};
  int level_index{-1};        // TakeProfit only
  double close_size{0.0};     // Size the monitor will request (0 = nothing)
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

inline const char* toString(ExitTriggerEvent::Trigger t) {
  switch (t) {
    case ExitTriggerEvent::Trigger::StopLoss:        return "stop_loss";
    case ExitTriggerEvent::Trigger::StopLossPercent: return "stop_loss_pct";
    case ExitTriggerEvent::Trigger::TakeProfit:      return "take_profit";
    case ExitTriggerEvent::Trigger::ProfitTarget:    return "profit_target";
  }
  return "unknown";
}

}  // namespace tradecall
