#pragma once

#include "riskguard/time/time_zone.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace riskguard {

// What the engine does with a breaching verdict.
enum class RuleCategory { TradeByTrade, Cooldown, HardLockout, Automation };

inline const char* toString(RuleCategory category) {
  switch (category) {
    case RuleCategory::TradeByTrade: return "trade_by_trade";
    case RuleCategory::Cooldown:     return "cooldown";
    case RuleCategory::HardLockout:  return "hard_lockout";
    case RuleCategory::Automation:   return "automation";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// Per-rule parameter structs
// -----------------------------------------------------------------------------
// One struct per rule type. The config loader validates every field before
// building one; rules assume their parameters are already valid.

enum class PositionMeasure { Net, Gross };

struct MaxContractsParams {
  int limit{0};                                  // > 0
  PositionMeasure measure{PositionMeasure::Net};
  bool reduce_to_limit{false};                   // false = close all
};

enum class UnknownSymbolPolicy { Block, AllowWithLimit, AllowUnlimited };

struct MaxContractsPerInstrumentParams {
  std::map<std::string, int> limits;             // Uppercased symbol -> max
  UnknownSymbolPolicy unknown_symbol{UnknownSymbolPolicy::Block};
  int default_limit{0};                          // For AllowWithLimit
  bool reduce_to_limit{true};                    // false = close symbol
};

struct DailyRealizedLossParams {
  double limit{0.0};                             // < 0
};

struct DailyRealizedProfitParams {
  double target{0.0};                            // > 0
};

struct DailyUnrealizedLossParams {
  double limit{0.0};                             // < 0
  RuleCategory category{RuleCategory::TradeByTrade};
};

struct MaxUnrealizedProfitParams {
  double target{0.0};                            // > 0
  RuleCategory category{RuleCategory::TradeByTrade};
};

struct TradeFrequencyParams {
  int per_minute{0};
  int per_hour{0};
  int per_session{0};
  std::chrono::seconds minute_cooldown{60};
  std::chrono::seconds hour_cooldown{1800};
  std::chrono::seconds session_cooldown{3600};
};

struct LossTier {
  double loss_threshold{0.0};                    // < 0
  std::chrono::seconds cooldown{0};
};

struct CooldownAfterLossParams {
  std::vector<LossTier> tiers;                   // Any order; rule sorts
  bool close_all{true};
};

struct NoStopLossGraceParams {
  std::chrono::seconds grace{0};
};

struct SessionWindow {
  LocalTime start;
  LocalTime end;                                 // end < start = overnight
};

struct SessionBlockParams {
  SessionWindow session;
  std::map<std::string, SessionWindow> symbol_sessions;
  std::string timezone{"UTC"};
  bool block_weekends{true};
  bool respect_holidays{true};
};

struct AuthLossGuardParams {};

struct SymbolBlocksParams {
  std::vector<std::string> patterns;             // Uppercased, fnmatch syntax
};

struct TradeManagementParams {
  double default_tick_size{0.25};
  std::map<std::string, double> tick_sizes;
  int stop_loss_ticks{0};                        // 0 = no initial stop
  int breakeven_trigger_ticks{0};                // 0 = no breakeven move
  int trailing_ticks{0};                         // 0 = no trailing
};

using RuleParams = std::variant<
    MaxContractsParams,
    MaxContractsPerInstrumentParams,
    DailyRealizedLossParams,
    DailyRealizedProfitParams,
    DailyUnrealizedLossParams,
    MaxUnrealizedProfitParams,
    TradeFrequencyParams,
    CooldownAfterLossParams,
    NoStopLossGraceParams,
    SessionBlockParams,
    AuthLossGuardParams,
    SymbolBlocksParams,
    TradeManagementParams>;

// -----------------------------------------------------------------------------
// RuleConfig
// -----------------------------------------------------------------------------
// One configured rule. The variant alternative IS the rule type, so an
// unknown type cannot exist past the loader.
// -----------------------------------------------------------------------------
struct RuleConfig {
  bool enabled{true};
  std::string name;                              // Label for logs; may be empty
  RuleParams params;
};

// Config-file name of each alternative ("max_contracts", ...).
const char* ruleTypeName(const RuleParams& params);

}  // namespace riskguard
