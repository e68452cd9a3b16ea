#include "riskguard/config/config_loader.hpp"
#include "riskguard/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <utility>

namespace riskguard {

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

// -----------------------------------------------------------------------------
// Node: one JSON object plus its path, remembering which keys were read so
// leftovers can be reported as unknown.
// -----------------------------------------------------------------------------
class Node {
 public:
  Node(const nlohmann::json& json, std::string path)
      : json_(json), path_(std::move(path)) {
    if (!json_.is_object()) {
      throw ConfigError(where() + ": must be an object");
    }
  }

  [[noreturn]] void fail(const std::string& key,
                         const std::string& message) const {
    throw ConfigError(at(key) + ": " + message);
  }

  std::string at(const std::string& key) const {
    return path_.empty() ? key : path_ + "." + key;
  }

  const nlohmann::json* find(const std::string& key) {
    used_.insert(key);
    auto it = json_.find(key);
    return it == json_.end() ? nullptr : &*it;
  }

  const nlohmann::json& require(const std::string& key) {
    const nlohmann::json* value = find(key);
    if (!value) {
      fail(key, "is required");
    }
    return *value;
  }

  double number(const std::string& key, std::optional<double> fallback) {
    const nlohmann::json* value = find(key);
    if (!value) {
      if (!fallback) {
        fail(key, "is required");
      }
      return *fallback;
    }
    if (!value->is_number()) {
      fail(key, "must be a number");
    }
    const double d = value->get<double>();
    if (!std::isfinite(d)) {
      fail(key, "must be finite");
    }
    return d;
  }

  int integer(const std::string& key, std::optional<int> fallback) {
    const nlohmann::json* value = find(key);
    if (!value) {
      if (!fallback) {
        fail(key, "is required");
      }
      return *fallback;
    }
    if (!value->is_number_integer()) {
      fail(key, "must be an integer");
    }
    return value->get<int>();
  }

  bool boolean(const std::string& key, bool fallback) {
    const nlohmann::json* value = find(key);
    if (!value) {
      return fallback;
    }
    if (!value->is_boolean()) {
      fail(key, "must be true or false");
    }
    return value->get<bool>();
  }

  std::string text(const std::string& key,
                   std::optional<std::string> fallback) {
    const nlohmann::json* value = find(key);
    if (!value) {
      if (!fallback) {
        fail(key, "is required");
      }
      return *fallback;
    }
    if (!value->is_string()) {
      fail(key, "must be a string");
    }
    return value->get<std::string>();
  }

  // Maps a string field onto one of `choices`.
  template <typename E>
  E choice(const std::string& key, const std::map<std::string, E>& choices,
           E fallback) {
    if (!find(key)) {
      return fallback;
    }
    const std::string value = text(key, std::nullopt);
    auto it = choices.find(value);
    if (it == choices.end()) {
      std::string allowed;
      for (const auto& entry : choices) {
        allowed += (allowed.empty() ? "" : " | ") + entry.first;
      }
      fail(key, "unknown value '" + value + "' (expected " + allowed + ")");
    }
    return it->second;
  }

  // Throws for any key nobody asked for.
  void finish() const {
    for (auto it = json_.begin(); it != json_.end(); ++it) {
      if (used_.count(it.key()) == 0) {
        fail(it.key(), "unknown key");
      }
    }
  }

 private:
  std::string where() const { return path_.empty() ? "<root>" : path_; }

  const nlohmann::json& json_;
  std::string path_;
  std::set<std::string> used_;
};

std::string indexed(const std::string& path, std::size_t i) {
  return path + "[" + std::to_string(i) + "]";
}

LocalTime timeField(Node& node, const std::string& key,
                    std::optional<LocalTime> fallback) {
  if (!node.find(key) && fallback) {
    return *fallback;
  }
  const std::string text = node.text(key, std::nullopt);
  auto parsed = LocalTime::parse(text);
  if (!parsed) {
    node.fail(key, "'" + text + "' is not HH:MM");
  }
  return *parsed;
}

std::chrono::seconds secondsField(Node& node, const std::string& key,
                                  std::optional<int> fallback) {
  const int s = node.integer(key, fallback);
  if (s <= 0) {
    node.fail(key, "must be > 0");
  }
  return std::chrono::seconds(s);
}

std::string zoneField(Node& node, const std::string& key,
                      const std::string& fallback) {
  const std::string zone = node.text(key, fallback);
  if (!TimeZone::isKnownZone(zone)) {
    node.fail(key, "unknown time zone '" + zone + "'");
  }
  return zone;
}

const std::map<std::string, RuleCategory>& unrealizedCategories() {
  static const std::map<std::string, RuleCategory> kChoices = {
      {"trade_by_trade", RuleCategory::TradeByTrade},
      {"hard_lockout", RuleCategory::HardLockout},
  };
  return kChoices;
}

// -----------------------------------------------------------------------------
// Per-type parameter parsers
// -----------------------------------------------------------------------------

RuleParams parseMaxContracts(Node& n) {
  MaxContractsParams p;
  p.limit = n.integer("limit", std::nullopt);
  if (p.limit <= 0) n.fail("limit", "must be > 0");
  p.measure = n.choice<PositionMeasure>(
      "measure", {{"net", PositionMeasure::Net}, {"gross", PositionMeasure::Gross}},
      PositionMeasure::Net);
  p.reduce_to_limit = n.choice<bool>(
      "enforcement", {{"close_all", false}, {"reduce_to_limit", true}}, false);
  return p;
}

RuleParams parseMaxContractsPerInstrument(Node& n) {
  MaxContractsPerInstrumentParams p;
  const nlohmann::json& limits = n.require("limits");
  Node limits_node(limits, n.at("limits"));
  for (auto it = limits.begin(); it != limits.end(); ++it) {
    const int limit = limits_node.integer(it.key(), std::nullopt);
    if (limit <= 0) limits_node.fail(it.key(), "must be > 0");
    p.limits[upper(it.key())] = limit;
  }
  p.unknown_symbol = n.choice<UnknownSymbolPolicy>(
      "unknown_symbol",
      {{"block", UnknownSymbolPolicy::Block},
       {"allow_with_limit", UnknownSymbolPolicy::AllowWithLimit},
       {"allow_unlimited", UnknownSymbolPolicy::AllowUnlimited}},
      UnknownSymbolPolicy::Block);
  if (p.unknown_symbol == UnknownSymbolPolicy::AllowWithLimit) {
    p.default_limit = n.integer("default_limit", std::nullopt);
    if (p.default_limit <= 0) n.fail("default_limit", "must be > 0");
  } else if (n.find("default_limit")) {
    n.fail("default_limit", "only valid with unknown_symbol allow_with_limit");
  }
  p.reduce_to_limit = n.choice<bool>(
      "enforcement", {{"reduce_to_limit", true}, {"close_symbol", false}},
      true);
  return p;
}

RuleParams parseDailyRealizedLoss(Node& n) {
  DailyRealizedLossParams p;
  p.limit = n.number("limit", std::nullopt);
  if (p.limit >= 0.0) n.fail("limit", "must be < 0");
  return p;
}

RuleParams parseDailyRealizedProfit(Node& n) {
  DailyRealizedProfitParams p;
  p.target = n.number("target", std::nullopt);
  if (p.target <= 0.0) n.fail("target", "must be > 0");
  return p;
}

RuleParams parseDailyUnrealizedLoss(Node& n) {
  DailyUnrealizedLossParams p;
  p.limit = n.number("limit", std::nullopt);
  if (p.limit >= 0.0) n.fail("limit", "must be < 0");
  p.category = n.choice("category", unrealizedCategories(),
                        RuleCategory::TradeByTrade);
  return p;
}

RuleParams parseMaxUnrealizedProfit(Node& n) {
  MaxUnrealizedProfitParams p;
  p.target = n.number("target", std::nullopt);
  if (p.target <= 0.0) n.fail("target", "must be > 0");
  p.category = n.choice("category", unrealizedCategories(),
                        RuleCategory::TradeByTrade);
  return p;
}

RuleParams parseTradeFrequency(Node& n) {
  TradeFrequencyParams p;
  p.per_minute = n.integer("per_minute", 0);
  p.per_hour = n.integer("per_hour", 0);
  p.per_session = n.integer("per_session", 0);
  if (p.per_minute < 0) n.fail("per_minute", "must be >= 0");
  if (p.per_hour < 0) n.fail("per_hour", "must be >= 0");
  if (p.per_session < 0) n.fail("per_session", "must be >= 0");
  if (p.per_minute == 0 && p.per_hour == 0 && p.per_session == 0) {
    n.fail("per_minute", "at least one of per_minute, per_hour, per_session "
                         "must be > 0");
  }
  p.minute_cooldown = secondsField(n, "minute_cooldown_s", 60);
  p.hour_cooldown = secondsField(n, "hour_cooldown_s", 1800);
  p.session_cooldown = secondsField(n, "session_cooldown_s", 3600);
  return p;
}

RuleParams parseCooldownAfterLoss(Node& n) {
  CooldownAfterLossParams p;
  const nlohmann::json& tiers = n.require("tiers");
  if (!tiers.is_array() || tiers.empty()) {
    n.fail("tiers", "must be a non-empty array");
  }
  std::set<double> thresholds;
  for (std::size_t i = 0; i < tiers.size(); ++i) {
    Node tier(tiers[i], indexed(n.at("tiers"), i));
    LossTier t;
    t.loss_threshold = tier.number("loss_threshold", std::nullopt);
    if (t.loss_threshold >= 0.0) tier.fail("loss_threshold", "must be < 0");
    if (!thresholds.insert(t.loss_threshold).second) {
      tier.fail("loss_threshold", "duplicates another tier");
    }
    t.cooldown = secondsField(tier, "cooldown_s", std::nullopt);
    tier.finish();
    p.tiers.push_back(t);
  }
  p.close_all = n.boolean("close_all", true);
  return p;
}

RuleParams parseNoStopLossGrace(Node& n) {
  NoStopLossGraceParams p;
  p.grace = secondsField(n, "grace_s", std::nullopt);
  return p;
}

SessionWindow windowFrom(Node& n) {
  SessionWindow w;
  w.start = timeField(n, "start", std::nullopt);
  w.end = timeField(n, "end", std::nullopt);
  if (w.start == w.end) {
    n.fail("end", "must differ from start");
  }
  return w;
}

RuleParams parseSessionBlock(Node& n) {
  SessionBlockParams p;
  p.session = windowFrom(n);
  if (const nlohmann::json* sessions = n.find("symbol_sessions")) {
    Node sessions_node(*sessions, n.at("symbol_sessions"));
    for (auto it = sessions->begin(); it != sessions->end(); ++it) {
      sessions_node.find(it.key());
      Node window(it.value(), sessions_node.at(it.key()));
      p.symbol_sessions[upper(it.key())] = windowFrom(window);
      window.finish();
    }
  }
  p.timezone = zoneField(n, "timezone", "UTC");
  p.block_weekends = n.boolean("block_weekends", true);
  p.respect_holidays = n.boolean("respect_holidays", true);
  return p;
}

RuleParams parseAuthLossGuard(Node& /*n*/) { return AuthLossGuardParams{}; }

RuleParams parseSymbolBlocks(Node& n) {
  SymbolBlocksParams p;
  const nlohmann::json& symbols = n.require("symbols");
  if (!symbols.is_array() || symbols.empty()) {
    n.fail("symbols", "must be a non-empty array");
  }
  for (std::size_t i = 0; i < symbols.size(); ++i) {
    if (!symbols[i].is_string() || symbols[i].get<std::string>().empty()) {
      throw ConfigError(indexed(n.at("symbols"), i) +
                        ": must be a non-empty string");
    }
    p.patterns.push_back(upper(symbols[i].get<std::string>()));
  }
  return p;
}

RuleParams parseTradeManagement(Node& n) {
  TradeManagementParams p;
  p.default_tick_size = n.number("default_tick_size", 0.25);
  if (p.default_tick_size <= 0.0) n.fail("default_tick_size", "must be > 0");
  if (const nlohmann::json* ticks = n.find("tick_sizes")) {
    Node ticks_node(*ticks, n.at("tick_sizes"));
    for (auto it = ticks->begin(); it != ticks->end(); ++it) {
      const double tick = ticks_node.number(it.key(), std::nullopt);
      if (tick <= 0.0) ticks_node.fail(it.key(), "must be > 0");
      p.tick_sizes[upper(it.key())] = tick;
    }
  }
  p.stop_loss_ticks = n.integer("stop_loss_ticks", 0);
  p.breakeven_trigger_ticks = n.integer("breakeven_trigger_ticks", 0);
  p.trailing_ticks = n.integer("trailing_ticks", 0);
  if (p.stop_loss_ticks < 0) n.fail("stop_loss_ticks", "must be >= 0");
  if (p.breakeven_trigger_ticks < 0) {
    n.fail("breakeven_trigger_ticks", "must be >= 0");
  }
  if (p.trailing_ticks < 0) n.fail("trailing_ticks", "must be >= 0");
  if (p.stop_loss_ticks == 0 && p.breakeven_trigger_ticks == 0 &&
      p.trailing_ticks == 0) {
    n.fail("stop_loss_ticks", "at least one automation must be enabled");
  }
  return p;
}

using ParamsParser = std::function<RuleParams(Node&)>;

const std::map<std::string, ParamsParser>& ruleParsers() {
  static const std::map<std::string, ParamsParser> kParsers = {
      {"max_contracts", parseMaxContracts},
      {"max_contracts_per_instrument", parseMaxContractsPerInstrument},
      {"daily_realized_loss", parseDailyRealizedLoss},
      {"daily_realized_profit", parseDailyRealizedProfit},
      {"daily_unrealized_loss", parseDailyUnrealizedLoss},
      {"max_unrealized_profit", parseMaxUnrealizedProfit},
      {"trade_frequency_limit", parseTradeFrequency},
      {"cooldown_after_loss", parseCooldownAfterLoss},
      {"no_stop_loss_grace", parseNoStopLossGrace},
      {"session_block_outside", parseSessionBlock},
      {"auth_loss_guard", parseAuthLossGuard},
      {"symbol_blocks", parseSymbolBlocks},
      {"trade_management", parseTradeManagement},
  };
  return kParsers;
}

RuleConfig parseRule(const nlohmann::json& json, const std::string& path) {
  Node n(json, path);
  const std::string type = n.text("type", std::nullopt);
  auto it = ruleParsers().find(type);
  if (it == ruleParsers().end()) {
    n.fail("type", "unknown rule type '" + type + "'");
  }

  RuleConfig rule;
  rule.enabled = n.boolean("enabled", true);
  rule.name = n.text("name", std::string());
  rule.params = it->second(n);
  n.finish();
  return rule;
}

std::chrono::milliseconds positiveMs(Node& n, const std::string& key,
                                     int fallback) {
  const int ms = n.integer(key, fallback);
  if (ms <= 0) {
    n.fail(key, "must be > 0");
  }
  return std::chrono::milliseconds(ms);
}

}  // namespace

// -----------------------------------------------------------------------------
// parseConfig(document)
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const nlohmann::json& document) {
  Node root(document, "");
  EngineConfig config;

  config.account_id = root.text("account_id", std::nullopt);
  if (config.account_id.empty()) {
    root.fail("account_id", "must not be empty");
  }
  config.state_dir = root.text("state_dir", config.state_dir);
  config.timezone = zoneField(root, "timezone", config.timezone);
  config.reset_time = timeField(root, "reset_time", config.reset_time);

  if (const nlohmann::json* holidays = root.find("holidays")) {
    if (!holidays->is_array()) {
      root.fail("holidays", "must be an array of YYYY-MM-DD");
    }
    for (std::size_t i = 0; i < holidays->size(); ++i) {
      const auto& entry = (*holidays)[i];
      std::optional<LocalDate> date;
      if (entry.is_string()) {
        date = LocalDate::parse(entry.get<std::string>());
      }
      if (!date) {
        throw ConfigError(indexed("holidays", i) + ": not a YYYY-MM-DD date");
      }
      config.holidays.push_back(*date);
    }
  }

  if (const nlohmann::json* enforcement = root.find("enforcement")) {
    Node n(*enforcement, "enforcement");
    config.enforcement.max_attempts = n.integer("max_attempts", 3);
    if (config.enforcement.max_attempts < 1) {
      n.fail("max_attempts", "must be >= 1");
    }
    config.enforcement.initial_backoff = positiveMs(n, "initial_backoff_ms", 250);
    config.enforcement.attempt_timeout = positiveMs(n, "attempt_timeout_ms", 5000);
    n.finish();
  }

  config.sweep_interval = positiveMs(root, "sweep_interval_ms", 1000);
  config.reset_check_interval =
      positiveMs(root, "reset_check_interval_ms", 60000);

  if (const nlohmann::json* endpoints = root.find("endpoints")) {
    Node n(*endpoints, "endpoints");
    Endpoints& e = config.endpoints;
    e.broker_events = n.text("broker_events", e.broker_events);
    e.broker_commands = n.text("broker_commands", e.broker_commands);
    e.ipc_cmd = n.text("ipc_cmd", e.ipc_cmd);
    e.ipc_pub = n.text("ipc_pub", e.ipc_pub);
    n.finish();
  }

  const nlohmann::json& rules = root.require("rules");
  if (!rules.is_array()) {
    root.fail("rules", "must be an array");
  }
  std::set<std::string> seen;
  for (std::size_t i = 0; i < rules.size(); ++i) {
    const std::string path = indexed("rules", i);
    RuleConfig rule = parseRule(rules[i], path);
    const std::string type = ruleTypeName(rule.params);
    if (!seen.insert(type).second) {
      throw ConfigError(path + ".type: rule type '" + type +
                        "' is configured twice");
    }
    config.rules.push_back(std::move(rule));
  }

  root.finish();
  return config;
}

EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }
  nlohmann::json document;
  try {
    in >> document;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(path + ": " + e.what());
  }
  return parseConfig(document);
}

}  // namespace riskguard
