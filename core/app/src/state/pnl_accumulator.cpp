#include "riskguard/state/pnl_accumulator.hpp"
#include "riskguard/logging/log.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace riskguard {

namespace {

constexpr const char* kComponent = "PnlAccumulator";

// Longest rolling window any rule reads. Older execution timestamps are
// pruned on every write.
constexpr std::int64_t kExecutionHistoryMs = 3'600'000;

nlohmann::json& rowFor(nlohmann::json& table, const std::string& key,
                       const std::string& account_id, const LocalDate& date) {
  nlohmann::json& rows = table["rows"];
  if (!rows.is_object()) {
    rows = nlohmann::json::object();
  }
  nlohmann::json& row = rows[key];
  if (row.is_null()) {
    row = {{"account_id", account_id},
           {"date", date.toString()},
           {"realized_pnl", 0.0},
           {"trade_count", 0},
           {"execution_count", 0},
           {"pnl_trade_ids", nlohmann::json::array()},
           {"execution_ids", nlohmann::json::array()}};
  }
  return row;
}

bool containsId(const nlohmann::json& ids, const std::string& id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

}  // namespace

PnlAccumulator::PnlAccumulator(IStateStore& store, const ITimeProvider& clock,
                               TimeZone zone)
    : store_(store), clock_(clock), zone_(std::move(zone)) {}

std::string PnlAccumulator::rowKey(const std::string& account_id,
                                   const LocalDate& date) {
  return account_id + "|" + date.toString();
}

// -----------------------------------------------------------------------------
// addTrade
// -----------------------------------------------------------------------------
double PnlAccumulator::addTrade(const std::string& account_id,
                                const std::string& trade_id,
                                double pnl_delta) {
  const LocalDate today = zone_.localDate(clock_.now_ms());
  const std::string key = rowKey(account_id, today);

  double total = 0.0;
  int count = 0;
  bool duplicate = false;

  store_.transact(tables::kDailyPnl, [&](nlohmann::json& table) {
    nlohmann::json& row = rowFor(table, key, account_id, today);
    if (!trade_id.empty() && containsId(row["pnl_trade_ids"], trade_id)) {
      duplicate = true;
    } else {
      row["realized_pnl"] = row["realized_pnl"].get<double>() + pnl_delta;
      row["trade_count"] = row["trade_count"].get<int>() + 1;
      if (!trade_id.empty()) {
        row["pnl_trade_ids"].push_back(trade_id);
      }
    }
    total = row["realized_pnl"].get<double>();
    count = row["trade_count"].get<int>();
  });

  std::ostringstream oss;
  if (duplicate) {
    oss << "stage=pnl_duplicate account=" << account_id
        << " trade_id=" << trade_id << " total=" << total;
  } else {
    oss << "stage=pnl_updated account=" << account_id
        << " date=" << today.toString() << " delta=" << pnl_delta
        << " total=" << total << " trades=" << count;
  }
  log::info(kComponent, oss.str());
  return total;
}

// -----------------------------------------------------------------------------
// recordExecution
// -----------------------------------------------------------------------------
void PnlAccumulator::recordExecution(const std::string& account_id,
                                     const std::string& trade_id,
                                     std::int64_t executed_at_ms) {
  const std::int64_t now = clock_.now_ms();
  const LocalDate today = zone_.localDate(now);
  const std::string key = rowKey(account_id, today);

  store_.transact(tables::kDailyPnl, [&](nlohmann::json& table) {
    nlohmann::json& row = rowFor(table, key, account_id, today);
    if (!trade_id.empty() && containsId(row["execution_ids"], trade_id)) {
      return;
    }
    row["execution_count"] = row["execution_count"].get<int>() + 1;
    if (!trade_id.empty()) {
      row["execution_ids"].push_back(trade_id);
    }

    nlohmann::json& history = table["executions"][account_id];
    if (!history.is_array()) {
      history = nlohmann::json::array();
    }
    nlohmann::json kept = nlohmann::json::array();
    for (const auto& ts : history) {
      if (ts.get<std::int64_t>() >= now - kExecutionHistoryMs) {
        kept.push_back(ts);
      }
    }
    kept.push_back(executed_at_ms);
    history = std::move(kept);
  });
}

// -----------------------------------------------------------------------------
// getDaily
// -----------------------------------------------------------------------------
DailyPnl PnlAccumulator::getDaily(const std::string& account_id) const {
  DailyPnl out;
  out.account_id = account_id;
  out.date = zone_.localDate(clock_.now_ms());

  const nlohmann::json table = store_.read(tables::kDailyPnl);
  auto rows = table.find("rows");
  if (rows == table.end()) {
    return out;
  }
  auto row = rows->find(rowKey(account_id, out.date));
  if (row == rows->end()) {
    return out;
  }
  out.realized_pnl = row->value("realized_pnl", 0.0);
  out.trade_count = row->value("trade_count", 0);
  out.execution_count = row->value("execution_count", 0);
  return out;
}

int PnlAccumulator::executionsSince(const std::string& account_id,
                                    std::int64_t since_ms) const {
  const nlohmann::json table = store_.read(tables::kDailyPnl);
  auto executions = table.find("executions");
  if (executions == table.end()) {
    return 0;
  }
  auto history = executions->find(account_id);
  if (history == executions->end()) {
    return 0;
  }
  return static_cast<int>(std::count_if(
      history->begin(), history->end(), [since_ms](const nlohmann::json& ts) {
        return ts.get<std::int64_t>() >= since_ms;
      }));
}

// -----------------------------------------------------------------------------
// resetDaily
// -----------------------------------------------------------------------------
void PnlAccumulator::resetDaily(const std::string& account_id) {
  const LocalDate today = zone_.localDate(clock_.now_ms());
  const std::string key = rowKey(account_id, today);

  store_.transact(tables::kDailyPnl, [&](nlohmann::json& table) {
    nlohmann::json& row = rowFor(table, key, account_id, today);
    row["realized_pnl"] = 0.0;
    row["trade_count"] = 0;
    row["execution_count"] = 0;
  });

  log::info(kComponent, "stage=pnl_reset account=" + account_id +
                            " date=" + today.toString());
}

}  // namespace riskguard
