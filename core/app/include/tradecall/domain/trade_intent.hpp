#pragma once

#include "tradecall/domain/order.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tradecall {
namespace domain {

// -----------------------------------------------------------------------------
// IntentAction
// -----------------------------------------------------------------------------
// BUY and LONG normalize to Open. SELL and SHORT normalize to Close: the
// engine only holds long positions, so a sell-side call reduces or flattens
// the existing position for that symbol. Opening shorts is not supported.
// -----------------------------------------------------------------------------
enum class IntentAction {
  Open,
  Close,
};

// -----------------------------------------------------------------------------
// PatternRule
// -----------------------------------------------------------------------------
// Identifies which parser rule produced an intent. The single-line cascade
// rules are listed in priority order; Multiline marks block-structured calls.
// Carried on the intent for logging and telemetry.
// -----------------------------------------------------------------------------
enum class PatternRule {
  BuyNow,             // "BUY NOW <SYM> [<N>X]"
  MarketDirection,    // "MARKET LONG|SHORT [<SYM>]"
  ExplicitKind,       // "<MARKET|LIMIT> <ACTION> <SYM> <PRICE>"
  EmojiExplicitKind,  // emoji-prefixed ExplicitKind
  SignalPrefix,       // "SIGNAL: <ACTION> <SYM> <PRICE>"
  PositionPrefix,     // "POSITION: <LONG|SHORT> <SYM> ENTRY <PRICE>"
  ActionAt,           // "<ACTION> <SYM> AT|@ <PRICE>"
  SymbolFirst,        // "<SYM> <ACTION> <PRICE>"
  EmojiSymbolFirst,   // "[emoji] <SYM> <ACTION> [ENTRY] <PRICE>"
  DirectionBare,      // "<LONG|SHORT> <SYM> <PRICE>"
  BuySellBare,        // "<BUY|SELL> <SYM> <PRICE>"
  CatchAll,           // "<ACTION> <SYM> [AT|@] <PRICE>[K|M]"
  Multiline,          // block-structured message
};

// -----------------------------------------------------------------------------
// TradeIntent
// -----------------------------------------------------------------------------
//
// @brief  Canonical, structured form of a parsed trade call.
//
// @details
// Produced only by IntentParser. An intent always carries an action, a
// symbol and at least one entry level; anything less is rejected by the
// parser and never constructed.
//
// entries:
//   Ordered price levels. A single level is the common case; several levels
//   form a ladder whose size is split evenly across legs. A level of 0.0
//   means "at market" and is resolved from the venue at execution time.
//   For Close intents entries.front() is the exit price reference.
//
// leverage / explicit_leverage:
//   Leverage defaults to 2.0. explicit_leverage records whether the text
//   carried a value, so a trailing "LEVERAGE:" line can fill a default.
//
// Thread model:
//   Plain value type. Copied into SignalEvent and into pending-signal storage.
// -----------------------------------------------------------------------------
struct TradeIntent {
  IntentAction action{IntentAction::Open};
  std::string symbol;                    // Uppercased ticker
  OrderKind order_kind{OrderKind::Limit};
  std::vector<double> entries;           // Size >= 1; 0.0 = at market
  double leverage{2.0};
  bool explicit_leverage{false};
  std::optional<double> stop_loss;       // Absolute price
  std::vector<double> take_profits;      // Absolute prices, ascending
  double sell_fraction{1.0};             // Close intents only, in [0, 1]
  PatternRule rule{PatternRule::CatchAll};

  double primaryPrice() const { return entries.empty() ? 0.0 : entries.front(); }
};

inline const char* toString(IntentAction action) {
  switch (action) {
    case IntentAction::Open:  return "OPEN";
    case IntentAction::Close: return "CLOSE";
  }
  return "UNKNOWN";
}

inline const char* toString(PatternRule rule) {
  using R = PatternRule;
  switch (rule) {
    case R::BuyNow:            return "buy_now";
    case R::MarketDirection:   return "market_direction";
    case R::ExplicitKind:      return "explicit_kind";
    case R::EmojiExplicitKind: return "emoji_explicit_kind";
    case R::SignalPrefix:      return "signal_prefix";
    case R::PositionPrefix:    return "position_prefix";
    case R::ActionAt:          return "action_at";
    case R::SymbolFirst:       return "symbol_first";
    case R::EmojiSymbolFirst:  return "emoji_symbol_first";
    case R::DirectionBare:     return "direction_bare";
    case R::BuySellBare:       return "buy_sell_bare";
    case R::CatchAll:          return "catch_all";
    case R::Multiline:         return "multiline";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace tradecall
