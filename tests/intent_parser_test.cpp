// =============================================================================
// intent_parser_test.cpp
// =============================================================================
// Unit tests for tradecall::IntentParser.
//
// Validates:
//   - Single-line cascade: rule precedence, action/kind normalization
//   - K / M price suffixes and leverage extraction
//   - Block-structured multiline calls with entry / SL / TP ladders
//   - Supplement merge into a single-line call
//   - Ordinary chat text yields no intent
//   - Text over the length limit is never matched
// =============================================================================

#include "tradecall/parser/intent_parser.hpp"

#include <gtest/gtest.h>

#include <string>

using tradecall::IntentParser;
using tradecall::domain::IntentAction;
using tradecall::domain::OrderKind;
using tradecall::domain::PatternRule;

class IntentParserTest : public ::testing::Test {
 protected:
  IntentParser parser;
};

// -----------------------------------------------------------------------------
// 1. "BUY <SYM> AT <PRICE>" opens a LIMIT position at the default leverage.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, BuyAtPriceIsLimitOpen) {
  auto intent = parser.parseMessage("BUY BTC AT 50000");

  ASSERT_TRUE(intent.has_value());
  EXPECT_EQ(intent->action, IntentAction::Open);
  EXPECT_EQ(intent->symbol, "BTC");
  EXPECT_EQ(intent->order_kind, OrderKind::Limit);
  ASSERT_EQ(intent->entries.size(), 1u);
  EXPECT_DOUBLE_EQ(intent->entries[0], 50000.0);
  EXPECT_DOUBLE_EQ(intent->leverage, 2.0);
  EXPECT_FALSE(intent->explicit_leverage);
  EXPECT_EQ(intent->rule, PatternRule::ActionAt);
  EXPECT_FALSE(intent->stop_loss.has_value());
  EXPECT_TRUE(intent->take_profits.empty());
}

// -----------------------------------------------------------------------------
// 2. SHORT and SELL normalize to Close.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, ShortAndSellNormalizeToClose) {
  auto short_call = parser.parseMessage("SHORT SOL 150");
  ASSERT_TRUE(short_call.has_value());
  EXPECT_EQ(short_call->action, IntentAction::Close);
  EXPECT_EQ(short_call->symbol, "SOL");
  EXPECT_DOUBLE_EQ(short_call->primaryPrice(), 150.0);
  EXPECT_EQ(short_call->rule, PatternRule::DirectionBare);

  auto sell_call = parser.parseMessage("sell btc at 52000");
  ASSERT_TRUE(sell_call.has_value());
  EXPECT_EQ(sell_call->action, IntentAction::Close);
  EXPECT_EQ(sell_call->symbol, "BTC");
  EXPECT_DOUBLE_EQ(sell_call->primaryPrice(), 52000.0);
}

// -----------------------------------------------------------------------------
// 3. "Buy Now <SYM> <N>X" is a market open with explicit leverage and no
//    price.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, BuyNowCarriesLeverageAndMarketKind) {
  auto intent = parser.parseMessage("Buy Now ETH 10X");

  ASSERT_TRUE(intent.has_value());
  EXPECT_EQ(intent->rule, PatternRule::BuyNow);
  EXPECT_EQ(intent->action, IntentAction::Open);
  EXPECT_EQ(intent->symbol, "ETH");
  EXPECT_EQ(intent->order_kind, OrderKind::Market);
  EXPECT_DOUBLE_EQ(intent->leverage, 10.0);
  EXPECT_TRUE(intent->explicit_leverage);
  ASSERT_EQ(intent->entries.size(), 1u);
  EXPECT_DOUBLE_EQ(intent->entries[0], 0.0);
}

// -----------------------------------------------------------------------------
// 4. "Market LONG" without a symbol defaults to BTC.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, MarketDirectionWithoutSymbolDefaultsToBtc) {
  auto intent = parser.parseMessage("Market LONG");

  ASSERT_TRUE(intent.has_value());
  EXPECT_EQ(intent->rule, PatternRule::MarketDirection);
  EXPECT_EQ(intent->symbol, "BTC");
  EXPECT_EQ(intent->action, IntentAction::Open);
  EXPECT_EQ(intent->order_kind, OrderKind::Market);
}

// -----------------------------------------------------------------------------
// 5. The market-direction rule outranks the explicit-kind rule, so the price
//    in "MARKET LONG ETH 3000" is not captured.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, MarketDirectionTakesPrecedenceOverExplicitKind) {
  auto intent = parser.parseMessage("MARKET LONG ETH 3000");

  ASSERT_TRUE(intent.has_value());
  EXPECT_EQ(intent->rule, PatternRule::MarketDirection);
  EXPECT_EQ(intent->symbol, "ETH");
  EXPECT_DOUBLE_EQ(intent->primaryPrice(), 0.0);

  auto limit = parser.parseMessage("LIMIT BUY ETH 3000");
  ASSERT_TRUE(limit.has_value());
  EXPECT_EQ(limit->rule, PatternRule::ExplicitKind);
  EXPECT_EQ(limit->order_kind, OrderKind::Limit);
  EXPECT_DOUBLE_EQ(limit->primaryPrice(), 3000.0);
}

// -----------------------------------------------------------------------------
// 6. Prefix and symbol-first forms.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, PrefixAndSymbolFirstForms) {
  auto signal = parser.parseMessage("Signal: BUY ETH 3000");
  ASSERT_TRUE(signal.has_value());
  EXPECT_EQ(signal->rule, PatternRule::SignalPrefix);
  EXPECT_EQ(signal->symbol, "ETH");

  auto symbol_first = parser.parseMessage("BTC LONG 50000");
  ASSERT_TRUE(symbol_first.has_value());
  EXPECT_EQ(symbol_first->rule, PatternRule::SymbolFirst);
  EXPECT_EQ(symbol_first->symbol, "BTC");
  EXPECT_EQ(symbol_first->action, IntentAction::Open);
  EXPECT_DOUBLE_EQ(symbol_first->primaryPrice(), 50000.0);
}

// -----------------------------------------------------------------------------
// 7. A K or M directly after the number scales the price.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, PriceSuffixScalesValue) {
  auto thousands = parser.parseMessage("BUY BTC 50K");
  ASSERT_TRUE(thousands.has_value());
  EXPECT_DOUBLE_EQ(thousands->primaryPrice(), 50000.0);

  auto millions = parser.parseMessage("BUY BTC AT 1.5M");
  ASSERT_TRUE(millions.has_value());
  EXPECT_DOUBLE_EQ(millions->primaryPrice(), 1500000.0);
}

// -----------------------------------------------------------------------------
// 8. Leverage anywhere in the text overrides the default; the constructor
//    default applies otherwise.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, LeverageFromTextOrConstructorDefault) {
  auto intent = parser.parseMessage("LONG BTC 50000 20x");
  ASSERT_TRUE(intent.has_value());
  EXPECT_DOUBLE_EQ(intent->leverage, 20.0);
  EXPECT_TRUE(intent->explicit_leverage);

  IntentParser five_x(5.0);
  auto defaulted = five_x.parseMessage("BUY BTC AT 50000");
  ASSERT_TRUE(defaulted.has_value());
  EXPECT_DOUBLE_EQ(defaulted->leverage, 5.0);

  IntentParser invalid(0.0);
  EXPECT_DOUBLE_EQ(invalid.defaultLeverage(), IntentParser::kDefaultLeverage);
}

// -----------------------------------------------------------------------------
// 9. Block-structured call: entry ladder, stop-loss and take-profit ladder.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, MultilineLadderWithStopAndTargets) {
  auto intent = parser.parseMessage(
      "Limit Long BTC: 117320/116900/116500\n"
      "SL: 116250\n"
      "TP: 118900/119500/120000");

  ASSERT_TRUE(intent.has_value());
  EXPECT_EQ(intent->rule, PatternRule::Multiline);
  EXPECT_EQ(intent->action, IntentAction::Open);
  EXPECT_EQ(intent->symbol, "BTC");
  EXPECT_EQ(intent->order_kind, OrderKind::Limit);

  ASSERT_EQ(intent->entries.size(), 3u);
  EXPECT_DOUBLE_EQ(intent->entries[0], 117320.0);
  EXPECT_DOUBLE_EQ(intent->entries[1], 116900.0);
  EXPECT_DOUBLE_EQ(intent->entries[2], 116500.0);

  ASSERT_TRUE(intent->stop_loss.has_value());
  EXPECT_DOUBLE_EQ(*intent->stop_loss, 116250.0);

  ASSERT_EQ(intent->take_profits.size(), 3u);
  EXPECT_DOUBLE_EQ(intent->take_profits[0], 118900.0);
  EXPECT_DOUBLE_EQ(intent->take_profits[2], 120000.0);
}

// -----------------------------------------------------------------------------
// 10. Multiline "<SYM> LONG: <PRICE>" with a separate leverage line.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, MultilineSymbolFirstWithLeverageLine) {
  auto intent = parser.parseMessage("BTC LONG: 50000\nLeverage: 10x");

  ASSERT_TRUE(intent.has_value());
  EXPECT_EQ(intent->rule, PatternRule::Multiline);
  EXPECT_EQ(intent->symbol, "BTC");
  EXPECT_DOUBLE_EQ(intent->primaryPrice(), 50000.0);
  EXPECT_DOUBLE_EQ(intent->leverage, 10.0);
  EXPECT_TRUE(intent->explicit_leverage);
}

// -----------------------------------------------------------------------------
// 11. SL / TP lines under a single-line call are merged into it.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, SupplementMergedIntoSingleLineCall) {
  auto intent = parser.parseMessage("BUY ETH AT 3000\nSL: 2800\nTP: 3200, 3400");

  ASSERT_TRUE(intent.has_value());
  EXPECT_EQ(intent->rule, PatternRule::ActionAt);
  EXPECT_DOUBLE_EQ(intent->primaryPrice(), 3000.0);
  ASSERT_TRUE(intent->stop_loss.has_value());
  EXPECT_DOUBLE_EQ(*intent->stop_loss, 2800.0);
  ASSERT_EQ(intent->take_profits.size(), 2u);
  EXPECT_DOUBLE_EQ(intent->take_profits[0], 3200.0);
  EXPECT_DOUBLE_EQ(intent->take_profits[1], 3400.0);
}

// -----------------------------------------------------------------------------
// 12. mergeSupplement never overwrites what the intent already carries.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, MergeKeepsExistingFields) {
  auto intent = parser.parse("LONG BTC 50000 20x");
  ASSERT_TRUE(intent.has_value());
  intent->stop_loss = 48000.0;

  tradecall::IntentSupplement supplement;
  supplement.stop_loss = 47000.0;
  supplement.leverage = 3.0;
  supplement.entries = {50000.0, 49500.0};
  supplement.take_profits = {52000.0};

  IntentParser::mergeSupplement(*intent, supplement);

  EXPECT_DOUBLE_EQ(*intent->stop_loss, 48000.0);
  EXPECT_DOUBLE_EQ(intent->leverage, 20.0);
  ASSERT_EQ(intent->entries.size(), 2u);
  ASSERT_EQ(intent->take_profits.size(), 1u);
}

// -----------------------------------------------------------------------------
// 13. A single ENTRY number in a supplement is ignored.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, SupplementIgnoresSingleEntry) {
  auto supplement = parser.parseSupplement("Entry: 3000\nSL: 2800");

  EXPECT_TRUE(supplement.entries.empty());
  ASSERT_TRUE(supplement.stop_loss.has_value());
  EXPECT_DOUBLE_EQ(*supplement.stop_loss, 2800.0);
  EXPECT_FALSE(supplement.empty());
}

// -----------------------------------------------------------------------------
// 14. Ordinary chat produces no intent.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, NonSignalTextYieldsNothing) {
  EXPECT_FALSE(parser.parseMessage("good morning everyone").has_value());
  EXPECT_FALSE(parser.parseMessage("ETH looking strong, might buy later")
                   .has_value());
  EXPECT_FALSE(parser.parseMessage("").has_value());
  EXPECT_FALSE(parser.parseMessage("SL: 100\nTP: 200").has_value());
}

// -----------------------------------------------------------------------------
// 15. Position prefix, emoji symbol-first, bare direction and catch-all forms
//     each report the rule that matched.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, LaterCascadeRulesAreTagged) {
  auto position = parser.parseMessage("POSITION: LONG BTC ENTRY $50000");
  ASSERT_TRUE(position.has_value());
  EXPECT_EQ(position->rule, PatternRule::PositionPrefix);
  EXPECT_EQ(position->action, IntentAction::Open);
  EXPECT_EQ(position->symbol, "BTC");
  EXPECT_DOUBLE_EQ(position->primaryPrice(), 50000.0);

  auto emoji = parser.parseMessage("\xF0\x9F\x9A\x80 ETH LONG ENTRY: 3000");
  ASSERT_TRUE(emoji.has_value());
  EXPECT_EQ(emoji->rule, PatternRule::EmojiSymbolFirst);
  EXPECT_EQ(emoji->symbol, "ETH");
  EXPECT_DOUBLE_EQ(emoji->primaryPrice(), 3000.0);

  auto bare = parser.parseMessage("SHORT SOL 150");
  ASSERT_TRUE(bare.has_value());
  EXPECT_EQ(bare->rule, PatternRule::DirectionBare);
  EXPECT_EQ(bare->action, IntentAction::Close);
  EXPECT_EQ(bare->symbol, "SOL");
  EXPECT_DOUBLE_EQ(bare->primaryPrice(), 150.0);

  auto catch_all = parser.parseMessage("LONG ETH $3.2K");
  ASSERT_TRUE(catch_all.has_value());
  EXPECT_EQ(catch_all->rule, PatternRule::CatchAll);
  EXPECT_EQ(catch_all->order_kind, OrderKind::Limit);
  EXPECT_DOUBLE_EQ(catch_all->primaryPrice(), 3200.0);
}

// -----------------------------------------------------------------------------
// 16. Oversized text is rejected before any pattern runs.
// -----------------------------------------------------------------------------
TEST_F(IntentParserTest, OversizedTextYieldsNothing) {
  const std::string huge = "BUY BTC AT 50000 " + std::string(100000, 'A');

  EXPECT_FALSE(parser.parseMessage(huge).has_value());
  EXPECT_FALSE(parser.parse(huge).has_value());
  EXPECT_FALSE(parser.parseMultiline(huge + "\nSL: 100").has_value());
  EXPECT_TRUE(parser.parseSupplement("SL: 100\n" + huge).empty());

  const std::string padding(IntentParser::kMaxTextLength - 17, '.');
  auto at_limit = parser.parseMessage("BUY BTC AT 50000 " + padding);
  ASSERT_TRUE(at_limit.has_value());
  EXPECT_DOUBLE_EQ(at_limit->primaryPrice(), 50000.0);
}
