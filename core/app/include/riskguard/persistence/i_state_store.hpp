#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <vector>

namespace riskguard {

// Logical table names. Each is owned by exactly one manager.
namespace tables {
inline constexpr const char* kDailyPnl = "daily_pnl";       // PnlAccumulator
inline constexpr const char* kLockouts = "lockouts";        // LockoutManager
inline constexpr const char* kTimers = "timers";            // TimerManager
inline constexpr const char* kResetState = "reset_state";   // ResetScheduler
inline constexpr const char* kAuditLog = "audit_log";       // EnforcementExecutor
}  // namespace tables

// -----------------------------------------------------------------------------
// IStateStore: embedded transactional state
// -----------------------------------------------------------------------------
//
// @brief  The single durable store behind every manager. Tables are JSON
//         values; logs are append-only sequences of JSON records.
//
// @details
// transact() is the only way to change a table. The mutator receives a copy
// of the table; the store persists the whole result and only then makes it
// visible to read(). If the mutator throws, or the write fails, nothing
// changes and the exception propagates (PersistenceError for I/O failures).
// Concurrent transact() calls are serialized, so a read-modify-write inside
// one mutator can never lose an update made by another.
//
// Implementations:
//   JsonStateStore: state.json + <log>.jsonl in a directory.
//   Tests provide an in-memory store with failure injection.
//
// Thread-safety: All methods are safe from any thread.
// -----------------------------------------------------------------------------
class IStateStore {
 public:
  using Mutator = std::function<void(nlohmann::json& table)>;

  virtual ~IStateStore() = default;

  // Snapshot of a table; an object {} if it has never been written.
  virtual nlohmann::json read(const std::string& table) const = 0;

  // Atomic read-modify-write of one table. Throws PersistenceError.
  virtual void transact(const std::string& table, const Mutator& mutator) = 0;

  // Durable append to an append-only log. Throws PersistenceError.
  virtual void append(const std::string& log,
                      const nlohmann::json& record) = 0;

  // Every record of a log in append order.
  virtual std::vector<nlohmann::json> readLog(const std::string& log) const = 0;
};

}  // namespace riskguard
