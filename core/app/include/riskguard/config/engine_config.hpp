#pragma once

#include "riskguard/enforcement/enforcement_executor.hpp"
#include "riskguard/rules/rule_config.hpp"
#include "riskguard/time/time_zone.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace riskguard {

// ZMQ endpoints of the process edges. An empty string disables that edge;
// all are empty unless the config file names them.
struct Endpoints {
  std::string broker_events;     // SUB, connect
  std::string broker_commands;   // REQ, connect; empty = dry run (mock)
  std::string ipc_cmd;           // REP, bind
  std::string ipc_pub;           // PUB, bind
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
// Everything one RiskGuardEngine instance needs. Built by loadConfig() and
// never changed while the engine runs.
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::string account_id;
  std::string state_dir{"state"};
  std::string timezone{"UTC"};                 // IANA name
  LocalTime reset_time{17, 0};
  std::vector<LocalDate> holidays;
  std::vector<RuleConfig> rules;               // Order = verdict tie-break
  EnforcementOptions enforcement;
  std::chrono::milliseconds sweep_interval{1000};
  std::chrono::milliseconds reset_check_interval{60000};
  Endpoints endpoints;
};

}  // namespace riskguard
