#pragma once

#include "riskguard/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace riskguard {

// -----------------------------------------------------------------------------
// Config loading
// -----------------------------------------------------------------------------
//
// @brief  Builds a validated EngineConfig from JSON.
//
// @details
// Top level:
//   {
//     "account_id": "ACC-1",                 required
//     "state_dir": "state",
//     "timezone": "America/Chicago",
//     "reset_time": "17:00",
//     "holidays": ["2026-12-25"],
//     "enforcement": {"max_attempts": 3, "initial_backoff_ms": 250,
//                     "attempt_timeout_ms": 5000},
//     "sweep_interval_ms": 1000,
//     "reset_check_interval_ms": 60000,
//     "endpoints": {"broker_events": "...", "broker_commands": "...",
//                   "ipc_cmd": "...", "ipc_pub": "..."},
//     "rules": [ {"type": "daily_realized_loss", "limit": -500}, ... ]
//   }
//
// Every rule block has "type", optional "enabled" (default true) and
// optional "name"; the remaining keys belong to the rule type (see
// config_loader.cpp). Unknown keys anywhere, unknown rule types, the same
// rule type twice, out-of-range thresholds, malformed "HH:MM" / "YYYY-MM-DD"
// text and unknown time zones all throw ConfigError whose message starts
// with the offending path, e.g. "rules[2].tiers[0].cooldown_s: must be > 0".
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const nlohmann::json& document);

// Reads and parses a JSON file. ConfigError if it cannot be read or parsed.
EngineConfig loadConfig(const std::string& path);

}  // namespace riskguard
