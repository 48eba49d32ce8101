#pragma once

#include "tradecall/domain/trade_intent.hpp"

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace tradecall {

// -----------------------------------------------------------------------------
// IntentSupplement
// -----------------------------------------------------------------------------
// Fields a message can add to an intent that was already recognized from its
// primary line: stop-loss, take-profit ladder, entry ladder and leverage.
// Every field is optional; an empty supplement changes nothing on merge.
// -----------------------------------------------------------------------------
struct IntentSupplement {
  std::optional<double> stop_loss;
  std::vector<double> take_profits;
  std::vector<double> entries;        // Only ladders (two or more levels)
  std::optional<double> leverage;

  bool empty() const {
    return !stop_loss && take_profits.empty() && entries.empty() && !leverage;
  }
};

// -----------------------------------------------------------------------------
// IntentParser - free text to TradeIntent
// -----------------------------------------------------------------------------
//
// @brief  Recognizes trade calls in chat messages and converts them into a
//         canonical domain::TradeIntent.
//
// @details
// Three entry points, combined by parseMessage():
//
//   parse()           Single-line cascade. Twelve regex rules are tried in a
//                     fixed priority order against the uppercased text and
//                     the FIRST rule that matches anywhere in the text wins.
//                     Order encodes precedence: "MARKET LONG BTC 50000" is
//                     caught by the market-direction rule (no price) before
//                     the explicit-kind rule gets a chance.
//
//   parseMultiline()  Block-structured calls, one directive per line.
//                     Lines are classified by keywords, not by position.
//
//   parseSupplement() SL/TP/entries/leverage only, for merging into an
//                     intent recognized by parse().
//
// Every cascade rule declares the shape of its captures (which group is the
// action, the symbol, the price, the order kind) and produces a tagged
// RuleMatch. Nothing downstream infers meaning from group counts.
//
// Normalization applied to every single-line match:
//   - BUY/LONG -> Open, SELL/SHORT -> Close.
//   - Order kind: MARKET for the buy-now and market-direction rules, the
//     captured kind for the explicit-kind rules, LIMIT otherwise.
//   - Price suffix: a K or M directly after the matched number multiplies it
//     by 1e3 or 1e6.
//   - Leverage: the buy-now rule's own "<N>X" wins; otherwise a second pass
//     over the whole text looks for "<N>X" or "LEVERAGE[:] <N>"; otherwise
//     the configured default.
//
// Failure model:
//   A text that is not a trade call yields std::nullopt. This is the normal
//   case for chat traffic and is never reported as an error.
//   Texts longer than kMaxTextLength are never matched: std::regex recurses
//   per character and would exhaust the stack on very long input.
//
// Thread model:
//   Immutable after construction. All methods are const and may run
//   concurrently; each call uses its own match state.
// -----------------------------------------------------------------------------
class IntentParser {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Compiles the cascade and line-classification regexes.
  //
  // @param  default_leverage  Leverage for calls that do not state one.
  //                           Non-positive values fall back to 2.0.
  // -------------------------------------------------------------------------
  explicit IntentParser(double default_leverage = kDefaultLeverage);

  // -------------------------------------------------------------------------
  // parse(text)
  // -------------------------------------------------------------------------
  // @brief  Runs the single-line cascade.
  //
  // @return The intent produced by the first matching rule, or std::nullopt.
  //         The returned intent has exactly one entry level (0.0 for market
  //         calls that carry no price) and no stop-loss or take-profits.
  // -------------------------------------------------------------------------
  std::optional<domain::TradeIntent> parse(const std::string& text) const;

  // -------------------------------------------------------------------------
  // parseMultiline(text)
  // -------------------------------------------------------------------------
  // @brief  Parses a block-structured call such as
  //
  //           Limit Long BTC: 117320/116900/116500
  //           SL: 116250
  //           TP: 118900/119500/120000
  //
  // @details
  // Requires at least two lines. Each line is classified by the first
  // matching keyword group:
  //   1. LIMIT or MARKET plus an action word -> signal line
  //   2. ':' plus an action word ("BTC LONG: x", "SHORT SOL: x") -> signal line
  //   3. ENTRY / ENTRIES -> entry ladder
  //   4. STOP LOSS / STOP: / SL: -> stop-loss (first number)
  //   5. TP: / TAKE PROFIT / TARGET: / PROFIT: -> take-profit ladder
  //   6. LEVERAGE / LEV -> leverage (first integer)
  // Several numbers on a signal, entries or take-profit line form a ladder.
  //
  // @return An intent when an action, a symbol and a price were found across
  //         the lines; std::nullopt otherwise.
  // -------------------------------------------------------------------------
  std::optional<domain::TradeIntent> parseMultiline(
      const std::string& text) const;

  // -------------------------------------------------------------------------
  // parseSupplement(text)
  // -------------------------------------------------------------------------
  // @brief  Extracts SL, TP ladder, entry ladder and leverage lines without
  //         requiring an action or symbol. A single ENTRY number is ignored
  //         so a market call keeps its market price.
  // -------------------------------------------------------------------------
  IntentSupplement parseSupplement(const std::string& text) const;

  // -------------------------------------------------------------------------
  // mergeSupplement(intent, supplement)
  // -------------------------------------------------------------------------
  // @brief  Copies supplement fields the intent does not already carry.
  //         Leverage is merged only if the intent's leverage was defaulted.
  // -------------------------------------------------------------------------
  static void mergeSupplement(domain::TradeIntent& intent,
                              const IntentSupplement& supplement);

  // -------------------------------------------------------------------------
  // parseMessage(text)
  // -------------------------------------------------------------------------
  // @brief  Full interpretation of one chat message.
  //
  // @details
  // Tries parse() first. When it matches and the message spans several lines
  // or mentions SL/STOP/TP/TAKE PROFIT/TARGET, the supplement is merged in.
  // When parse() does not match, parseMultiline() is tried.
  // -------------------------------------------------------------------------
  std::optional<domain::TradeIntent> parseMessage(
      const std::string& text) const;

  double defaultLeverage() const { return default_leverage_; }

  static constexpr double kDefaultLeverage = 2.0;
  static constexpr std::size_t kMaxTextLength = 8000;

 private:
  // Which capture group holds what, per cascade rule.
  enum class Shape {
    BuyNow,               // 1: symbol, 2: leverage (optional)
    MarketDirection,      // 1: direction, 2: symbol
    MarketDirectionOnly,  // 1: direction; symbol defaults to BTC
    KindActionSymbol,     // 1: kind, 2: action, 3: symbol, 4: price
    ActionSymbol,         // 1: action, 2: symbol, 3: price
    SymbolAction,         // 1: symbol, 2: action, 3: price
  };

  struct CascadeRule {
    domain::PatternRule id;
    Shape shape;
    std::regex pattern;
  };

  // Tagged result of one cascade rule, before normalization.
  struct RuleMatch {
    domain::PatternRule rule{domain::PatternRule::CatchAll};
    std::string action_word;              // BUY, SELL, LONG or SHORT
    std::string symbol;
    std::optional<std::string> kind_word; // MARKET or LIMIT when captured
    std::optional<double> price;          // After K/M scaling
    std::optional<double> leverage;       // Buy-now rule only
  };

  std::optional<RuleMatch> matchCascade(const std::string& upper) const;
  domain::TradeIntent buildIntent(const RuleMatch& match,
                                  const std::string& upper) const;
  std::optional<double> extractLeverage(const std::string& upper) const;
  std::vector<double> numbersIn(const std::string& text) const;

  // Accumulates what the lines of a multiline message carry. classifyLine()
  // records one uppercased line into it.
  struct MultilineState;
  void classifyLine(const std::string& line, MultilineState& state) const;

  double default_leverage_;
  std::vector<CascadeRule> cascade_;
  std::regex leverage_pattern_;
  std::regex number_pattern_;
  std::regex integer_pattern_;
  std::regex kind_signal_line_;
  std::regex symbol_action_line_;
  std::regex action_symbol_line_;
};

}  // namespace tradecall
