#pragma once

#include "riskguard/persistence/i_state_store.hpp"
#include "riskguard/time/i_time_provider.hpp"
#include "riskguard/time/time_zone.hpp"

#include <cstdint>
#include <string>

namespace riskguard {

// One account's realized result for one trading day.
struct DailyPnl {
  std::string account_id;
  LocalDate date;
  double realized_pnl{0.0};
  int trade_count{0};        // Full-turn trades that carried realized P&L
  int execution_count{0};    // Every fill since the last reset (session)
};

// -----------------------------------------------------------------------------
// PnlAccumulator: realized P&L and execution counts per trading day
// -----------------------------------------------------------------------------
//
// @brief  Owns the `daily_pnl` table: one row per (account, local date) with
//         the running realized total, the realized-trade count and the
//         session execution count, plus a short per-account history of
//         execution timestamps for the rolling 60 s / 3600 s windows.
//
// @details
// The current date is the calendar day of now_ms() in the account time zone.
// Rows for earlier dates are never modified again.
//
// Idempotence: each row remembers the trade ids it has already applied.
// addTrade() and recordExecution() ignore an id that is already present, so
// replaying an event after a crash (or after a PersistenceError retry)
// never double-counts.
//
// Every mutation is a single IStateStore::transact(): read the row, add,
// write total and count together.
//
// Thread model: Called from the event loop (ingestion), from the reset
// thread (resetDaily) and from IPC (getDaily). The store serializes writers;
// this class keeps no state of its own beyond configuration.
// -----------------------------------------------------------------------------
class PnlAccumulator {
 public:
  PnlAccumulator(IStateStore& store, const ITimeProvider& clock, TimeZone zone);

  PnlAccumulator(const PnlAccumulator&) = delete;
  PnlAccumulator& operator=(const PnlAccumulator&) = delete;

  // -------------------------------------------------------------------------
  // addTrade(account_id, trade_id, pnl_delta)
  // -------------------------------------------------------------------------
  // @brief  Adds one full-turn trade's realized P&L to today's row.
  //
  // @return The row's realized total after the call. A duplicate trade_id
  //         returns the current total unchanged.
  //
  // Side-effects: One transaction on `daily_pnl`. Throws PersistenceError.
  // -------------------------------------------------------------------------
  double addTrade(const std::string& account_id, const std::string& trade_id,
                  double pnl_delta);

  // -------------------------------------------------------------------------
  // recordExecution(account_id, trade_id, executed_at_ms)
  // -------------------------------------------------------------------------
  // @brief  Counts one fill (opening or closing) toward the session count
  //         and the rolling windows. Duplicate ids are ignored.
  // -------------------------------------------------------------------------
  void recordExecution(const std::string& account_id,
                       const std::string& trade_id,
                       std::int64_t executed_at_ms);

  // Today's row; a zero row if nothing has been recorded yet.
  DailyPnl getDaily(const std::string& account_id) const;

  // Fills recorded at or after since_ms (rolling-window counts).
  int executionsSince(const std::string& account_id,
                      std::int64_t since_ms) const;

  // -------------------------------------------------------------------------
  // resetDaily(account_id)
  // -------------------------------------------------------------------------
  // @brief  Zeroes today's row (total, trade count, execution count).
  //         Earlier rows are kept as history. Applied trade ids are kept so
  //         a replayed fill still cannot be counted twice.
  // -------------------------------------------------------------------------
  void resetDaily(const std::string& account_id);

  const TimeZone& zone() const { return zone_; }

 private:
  static std::string rowKey(const std::string& account_id,
                            const LocalDate& date);

  IStateStore& store_;
  const ITimeProvider& clock_;
  TimeZone zone_;
};

}  // namespace riskguard
