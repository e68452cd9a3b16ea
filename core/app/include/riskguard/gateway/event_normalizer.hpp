#pragma once

#include "riskguard/events/risk_event.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace riskguard {

// -----------------------------------------------------------------------------
// normalizeBrokerEvent(message)
// -----------------------------------------------------------------------------
//
// @brief  Translates one broker-native JSON message into a RiskEvent.
//         Pure and stateless.
//
// @details
// Recognised messages (field "event"):
//
//   trade_executed     -> TradeExecuted
//       trade_id, side, size, price, realized_pnl (optional / null)
//   position_opened    -> PositionChanged
//   position_updated   -> PositionChanged
//       net_size (signed), average_price, unrealized_pnl, market_price
//   position_closed    -> PositionChanged with net_size 0
//   order_placed       -> OrderChanged, status Working
//   order_modified     -> OrderChanged, status Working
//   order_filled       -> OrderChanged, status Filled
//   order_cancelled    -> OrderChanged, status Cancelled
//   order_rejected     -> OrderChanged, status Rejected
//       order_id, order_type, side, size, stop_price, limit_price
//   account_updated    -> AccountStatusChanged
//       can_trade
//
// Every message carries account_id and timestamp_ms; all but
// account_updated carry symbol, which is upper-cased here. Enum fields are
// lower-case text: side "buy" | "sell"; order_type "market" | "limit" |
// "stop" | "stop_limit" | "trailing_stop".
//
// @return nullopt for event names outside the table (quotes, bars and
//         other traffic the engine does not consume).
// @throws nlohmann::json::exception for missing or mistyped fields;
//         std::invalid_argument for unknown enum text.
// -----------------------------------------------------------------------------
std::optional<RiskEvent> normalizeBrokerEvent(const nlohmann::json& message);

OrderType parseOrderType(const std::string& text);
OrderSide parseOrderSide(const std::string& text);

std::string upperSymbol(std::string symbol);

}  // namespace riskguard
