#include "tradecall/parser/intent_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <sstream>

namespace tradecall {

namespace {

// 🚀 📈 📊 as UTF-8 byte sequences; matched byte-wise.
const std::string kEmojiPrefix =
    "(?:\xF0\x9F\x9A\x80|\xF0\x9F\x93\x88|\xF0\x9F\x93\x8A)?";

// Price capture shared by every cascade rule.
const std::string kPrice = R"re((\d+(?:\.\d+)?))re";

std::string toUpper(const std::string& text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

std::string trim(const std::string& text) {
  const char* ws = " \t\r\n\f\v";
  auto first = text.find_first_not_of(ws);
  if (first == std::string::npos) {
    return {};
  }
  auto last = text.find_last_not_of(ws);
  return text.substr(first, last - first + 1);
}

std::vector<std::string> splitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

bool containsAny(const std::string& line,
                 std::initializer_list<const char*> words) {
  return std::any_of(words.begin(), words.end(), [&line](const char* w) {
    return line.find(w) != std::string::npos;
  });
}

bool containsActionWord(const std::string& line) {
  return containsAny(line, {"LONG", "SHORT", "BUY", "SELL"});
}

// Text following the earliest keyword occurrence (longest keyword wins a
// tie), or nullopt when no keyword occurs.
std::optional<std::string> tailAfterKeyword(
    const std::string& line, std::initializer_list<const char*> words) {
  std::size_t best_pos = std::string::npos;
  std::size_t best_len = 0;
  for (const char* w : words) {
    std::size_t pos = line.find(w);
    if (pos == std::string::npos) {
      continue;
    }
    std::size_t len = std::char_traits<char>::length(w);
    if (pos < best_pos || (pos == best_pos && len > best_len)) {
      best_pos = pos;
      best_len = len;
    }
  }
  if (best_pos == std::string::npos) {
    return std::nullopt;
  }
  return line.substr(best_pos + best_len);
}

// strtod without exceptions; rejects overflow.
std::optional<double> toNumber(const std::string& token) {
  if (token.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  double value = std::strtod(token.c_str(), &end);
  if (end == token.c_str() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

bool isOpenWord(const std::string& word) {
  return word == "BUY" || word == "LONG";
}

}  // namespace

// -----------------------------------------------------------------------------
// MultilineState: fields accumulated across the lines of one message
// -----------------------------------------------------------------------------
struct IntentParser::MultilineState {
  std::string action_word;
  std::string symbol;
  std::optional<std::string> kind_word;
  std::vector<double> prices;        // Signal or entries line
  std::optional<double> stop_loss;
  std::vector<double> take_profits;
  std::optional<double> leverage;
};

// -----------------------------------------------------------------------------
// Constructor: compile the cascade in priority order
// -----------------------------------------------------------------------------
IntentParser::IntentParser(double default_leverage)
    : default_leverage_(default_leverage > 0.0 ? default_leverage
                                               : kDefaultLeverage),
      leverage_pattern_(R"re((\d+)X|LEVERAGE[:\s]*(\d+))re"),
      number_pattern_(R"re(\d+(?:\.\d+)?)re"),
      integer_pattern_(R"re((\d+)X?)re"),
      kind_signal_line_(
          R"re((LIMIT|MARKET)?\s*(LONG|SHORT|BUY|SELL)\s+(\w+)[:,]?\s*([\d./\s]+))re"),
      symbol_action_line_(
          R"re((\w+)\s+(LONG|SHORT|BUY|SELL)[:,]\s*([\d./\s]+))re"),
      action_symbol_line_(
          R"re((LONG|SHORT|BUY|SELL)\s+(\w+)[:,]\s*([\d./\s]+))re") {
  using R = domain::PatternRule;

  auto add = [this](R id, Shape shape, const std::string& pattern) {
    cascade_.push_back(CascadeRule{id, shape, std::regex(pattern)});
  };

  add(R::BuyNow, Shape::BuyNow, R"re(BUY\s+NOW\s+(\w+)(?:\s+(\d+)X)?)re");
  add(R::MarketDirection, Shape::MarketDirection,
      R"re(MARKET\s+(LONG|SHORT)\s+(\w+))re");
  add(R::MarketDirection, Shape::MarketDirectionOnly,
      R"re(MARKET\s+(LONG|SHORT))re");
  add(R::ExplicitKind, Shape::KindActionSymbol,
      R"re((MARKET|LIMIT)\s+(BUY|SELL|LONG|SHORT)\s+(\w+)\s+\$?)re" + kPrice);
  add(R::EmojiExplicitKind, Shape::KindActionSymbol,
      kEmojiPrefix +
          R"re(\s*(MARKET|LIMIT)\s+(LONG|SHORT|BUY|SELL)\s+(\w+)\s+\$?)re" +
          kPrice);
  add(R::SignalPrefix, Shape::ActionSymbol,
      R"re(SIGNAL:?\s+(BUY|SELL|LONG|SHORT)\s+(\w+)\s*\$?)re" + kPrice);
  add(R::PositionPrefix, Shape::ActionSymbol,
      R"re(POSITION:?\s+(LONG|SHORT)\s+(\w+)\s+(?:ENTRY:?)?\s*\$?)re" + kPrice);
  add(R::ActionAt, Shape::ActionSymbol,
      R"re((BUY|SELL|LONG|SHORT)\s+(\w+)\s+(?:AT|@)\s*\$?)re" + kPrice);
  add(R::SymbolFirst, Shape::SymbolAction,
      R"re((\w+)\s+(BUY|SELL|LONG|SHORT)\s+\$?)re" + kPrice);
  add(R::EmojiSymbolFirst, Shape::SymbolAction,
      kEmojiPrefix +
          R"re(\s*(\w+)\s+(LONG|SHORT|BUY|SELL)\s+(?:ENTRY:?)?\s*\$?)re" +
          kPrice);
  add(R::DirectionBare, Shape::ActionSymbol,
      R"re((LONG|SHORT)\s+(\w+)\s+)re" + kPrice);
  add(R::BuySellBare, Shape::ActionSymbol,
      R"re((BUY|SELL)\s+(\w+)\s+)re" + kPrice);
  add(R::CatchAll, Shape::ActionSymbol,
      R"re((BUY|SELL|LONG|SHORT)\s+(\w+)\s+(?:AT|@)?\s*\$?)re" + kPrice +
          "[KM]?");
}

// -----------------------------------------------------------------------------
// matchCascade: first rule that matches anywhere in the text
// -----------------------------------------------------------------------------
std::optional<IntentParser::RuleMatch> IntentParser::matchCascade(
    const std::string& upper) const {
  // Price of capture group `g`, scaled by a K/M suffix that directly follows
  // the digits in the text.
  auto priceOf = [&upper](const std::smatch& m,
                          std::size_t g) -> std::optional<double> {
    auto value = toNumber(m.str(g));
    if (!value) {
      return std::nullopt;
    }
    auto end = static_cast<std::size_t>(m.position(g) + m.length(g));
    if (end < upper.size()) {
      if (upper[end] == 'K') {
        *value *= 1000.0;
      } else if (upper[end] == 'M') {
        *value *= 1000000.0;
      }
    }
    return value;
  };

  for (const auto& rule : cascade_) {
    std::smatch m;
    if (!std::regex_search(upper, m, rule.pattern)) {
      continue;
    }

    RuleMatch match;
    match.rule = rule.id;

    switch (rule.shape) {
      case Shape::BuyNow:
        match.action_word = "BUY";
        match.symbol = m.str(1);
        match.kind_word = "MARKET";
        if (m[2].matched) {
          auto lev = toNumber(m.str(2));
          if (lev && *lev > 0.0) {
            match.leverage = lev;
          }
        }
        break;
      case Shape::MarketDirection:
        match.action_word = m.str(1);
        match.symbol = m.str(2);
        match.kind_word = "MARKET";
        break;
      case Shape::MarketDirectionOnly:
        match.action_word = m.str(1);
        match.symbol = "BTC";
        match.kind_word = "MARKET";
        break;
      case Shape::KindActionSymbol:
        match.kind_word = m.str(1);
        match.action_word = m.str(2);
        match.symbol = m.str(3);
        match.price = priceOf(m, 4);
        break;
      case Shape::ActionSymbol:
        match.action_word = m.str(1);
        match.symbol = m.str(2);
        match.price = priceOf(m, 3);
        break;
      case Shape::SymbolAction:
        match.symbol = m.str(1);
        match.action_word = m.str(2);
        match.price = priceOf(m, 3);
        break;
    }

    // Priced shapes must yield a usable number; otherwise keep cascading.
    bool priced = rule.shape == Shape::KindActionSymbol ||
                  rule.shape == Shape::ActionSymbol ||
                  rule.shape == Shape::SymbolAction;
    if (match.symbol.empty() || (priced && !match.price)) {
      continue;
    }
    return match;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// extractLeverage: generic "<N>X" / "LEVERAGE[:] <N>" pass over the text
// -----------------------------------------------------------------------------
std::optional<double> IntentParser::extractLeverage(
    const std::string& upper) const {
  std::smatch m;
  if (!std::regex_search(upper, m, leverage_pattern_)) {
    return std::nullopt;
  }
  auto value = toNumber(m[1].matched ? m.str(1) : m.str(2));
  if (!value || *value <= 0.0) {
    return std::nullopt;
  }
  return value;
}

// -----------------------------------------------------------------------------
// buildIntent: normalize a tagged match into a TradeIntent
// -----------------------------------------------------------------------------
domain::TradeIntent IntentParser::buildIntent(const RuleMatch& match,
                                              const std::string& upper) const {
  domain::TradeIntent intent;
  intent.rule = match.rule;
  intent.symbol = match.symbol;
  intent.action = isOpenWord(match.action_word) ? domain::IntentAction::Open
                                                : domain::IntentAction::Close;
  intent.order_kind = (match.kind_word && *match.kind_word == "MARKET")
                          ? domain::OrderKind::Market
                          : domain::OrderKind::Limit;
  intent.entries.push_back(match.price.value_or(0.0));

  if (match.leverage) {
    intent.leverage = *match.leverage;
    intent.explicit_leverage = true;
  } else if (auto lev = extractLeverage(upper)) {
    intent.leverage = *lev;
    intent.explicit_leverage = true;
  } else {
    intent.leverage = default_leverage_;
  }
  return intent;
}

// -----------------------------------------------------------------------------
// parse: single-line cascade
// -----------------------------------------------------------------------------
std::optional<domain::TradeIntent> IntentParser::parse(
    const std::string& text) const {
  if (text.size() > kMaxTextLength) {
    return std::nullopt;
  }
  const std::string upper = toUpper(text);
  auto match = matchCascade(upper);
  if (!match) {
    return std::nullopt;
  }
  return buildIntent(*match, upper);
}

// -----------------------------------------------------------------------------
// numbersIn: every decimal number in order of appearance
// -----------------------------------------------------------------------------
std::vector<double> IntentParser::numbersIn(const std::string& text) const {
  std::vector<double> out;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), number_pattern_);
       it != std::sregex_iterator(); ++it) {
    if (auto v = toNumber(it->str())) {
      out.push_back(*v);
    }
  }
  return out;
}

// -----------------------------------------------------------------------------
// classifyLine: keyword-driven, first matching group only
// -----------------------------------------------------------------------------
void IntentParser::classifyLine(const std::string& line,
                                MultilineState& state) const {
  auto applySignal = [&](const std::string& action, const std::string& symbol,
                         const std::string& price_part) {
    state.action_word = action;
    state.symbol = symbol;
    auto prices = numbersIn(price_part);
    if (!prices.empty()) {
      state.prices = std::move(prices);
    }
  };

  std::smatch m;

  if (containsAny(line, {"LIMIT", "MARKET"}) && containsActionWord(line)) {
    if (std::regex_search(line, m, kind_signal_line_)) {
      state.kind_word = m[1].matched ? m.str(1) : std::string("LIMIT");
      applySignal(m.str(2), m.str(3), m.str(4));
    }
  } else if (line.find(':') != std::string::npos && containsActionWord(line)) {
    if (std::regex_search(line, m, symbol_action_line_)) {
      applySignal(m.str(2), m.str(1), m.str(3));
    } else if (std::regex_search(line, m, action_symbol_line_)) {
      applySignal(m.str(1), m.str(2), m.str(3));
    }
  } else if (auto entry_tail = tailAfterKeyword(line, {"ENTRY", "ENTRIES"})) {
    auto prices = numbersIn(*entry_tail);
    if (!prices.empty()) {
      state.prices = std::move(prices);
    }
  } else if (auto stop_tail =
                 tailAfterKeyword(line, {"STOP LOSS", "STOP:", "SL:"})) {
    auto prices = numbersIn(*stop_tail);
    if (!prices.empty()) {
      state.stop_loss = prices.front();
    }
  } else if (auto tp_tail = tailAfterKeyword(
                 line, {"TP:", "TAKE PROFIT", "TARGET:", "PROFIT:"})) {
    auto prices = numbersIn(*tp_tail);
    if (!prices.empty()) {
      state.take_profits = std::move(prices);
    }
  } else if (auto lev_tail = tailAfterKeyword(line, {"LEVERAGE", "LEV"})) {
    if (std::regex_search(*lev_tail, m, integer_pattern_)) {
      auto lev = toNumber(m.str(1));
      if (lev && *lev > 0.0) {
        state.leverage = lev;
      }
    }
  }
}

// -----------------------------------------------------------------------------
// parseMultiline: per-line classification, then validity check
// -----------------------------------------------------------------------------
std::optional<domain::TradeIntent> IntentParser::parseMultiline(
    const std::string& text) const {
  if (text.size() > kMaxTextLength) {
    return std::nullopt;
  }
  auto lines = splitLines(trim(text));
  if (lines.size() < 2) {
    return std::nullopt;
  }

  MultilineState state;
  for (const auto& raw : lines) {
    std::string line = toUpper(trim(raw));
    if (!line.empty()) {
      classifyLine(line, state);
    }
  }

  if (state.action_word.empty() || state.symbol.empty() ||
      state.prices.empty()) {
    return std::nullopt;
  }

  domain::TradeIntent intent;
  intent.rule = domain::PatternRule::Multiline;
  intent.action = isOpenWord(state.action_word) ? domain::IntentAction::Open
                                                : domain::IntentAction::Close;
  intent.symbol = state.symbol;
  intent.order_kind = (state.kind_word && *state.kind_word == "MARKET")
                          ? domain::OrderKind::Market
                          : domain::OrderKind::Limit;
  intent.entries = std::move(state.prices);
  intent.stop_loss = state.stop_loss;
  intent.take_profits = std::move(state.take_profits);
  if (state.leverage) {
    intent.leverage = *state.leverage;
    intent.explicit_leverage = true;
  } else {
    intent.leverage = default_leverage_;
  }
  return intent;
}

// -----------------------------------------------------------------------------
// parseSupplement: SL / TP / entry ladder / leverage lines only
// -----------------------------------------------------------------------------
IntentSupplement IntentParser::parseSupplement(const std::string& text) const {
  IntentSupplement supplement;
  if (text.size() > kMaxTextLength) {
    return supplement;
  }

  for (const auto& raw : splitLines(trim(text))) {
    std::string line = toUpper(trim(raw));
    if (line.empty()) {
      continue;
    }

    if (auto tail = tailAfterKeyword(line, {"STOP LOSS", "STOP:", "SL:"})) {
      auto prices = numbersIn(*tail);
      if (!prices.empty()) {
        supplement.stop_loss = prices.front();
      }
      continue;
    }
    if (auto tail = tailAfterKeyword(
            line, {"TP:", "TAKE PROFIT", "TARGET:", "PROFIT:"})) {
      auto prices = numbersIn(*tail);
      if (!prices.empty()) {
        supplement.take_profits = std::move(prices);
      }
      continue;
    }
    if (auto tail = tailAfterKeyword(line, {"ENTRY", "ENTRIES"})) {
      auto prices = numbersIn(*tail);
      if (prices.size() > 1) {
        supplement.entries = std::move(prices);
      }
      continue;
    }
    if (auto tail = tailAfterKeyword(line, {"LEVERAGE", "LEV"})) {
      std::smatch m;
      if (std::regex_search(*tail, m, integer_pattern_)) {
        auto lev = toNumber(m.str(1));
        if (lev && *lev > 0.0) {
          supplement.leverage = lev;
        }
      }
    }
  }
  return supplement;
}

// -----------------------------------------------------------------------------
// mergeSupplement: fill only what the intent lacks
// -----------------------------------------------------------------------------
void IntentParser::mergeSupplement(domain::TradeIntent& intent,
                                   const IntentSupplement& supplement) {
  if (!intent.stop_loss && supplement.stop_loss) {
    intent.stop_loss = supplement.stop_loss;
  }
  if (intent.take_profits.empty() && !supplement.take_profits.empty()) {
    intent.take_profits = supplement.take_profits;
  }
  if (intent.entries.size() <= 1 && supplement.entries.size() > 1) {
    intent.entries = supplement.entries;
  }
  if (!intent.explicit_leverage && supplement.leverage) {
    intent.leverage = *supplement.leverage;
    intent.explicit_leverage = true;
  }
}

// -----------------------------------------------------------------------------
// parseMessage: cascade (+ supplement), else multiline
// -----------------------------------------------------------------------------
std::optional<domain::TradeIntent> IntentParser::parseMessage(
    const std::string& text) const {
  if (auto intent = parse(text)) {
    const std::string upper = toUpper(text);
    bool has_hints = text.find('\n') != std::string::npos ||
                     containsAny(upper, {"SL", "STOP", "TP", "TAKE PROFIT",
                                         "TARGET"});
    if (has_hints) {
      mergeSupplement(*intent, parseSupplement(text));
    }
    return intent;
  }
  return parseMultiline(text);
}

}  // namespace tradecall
