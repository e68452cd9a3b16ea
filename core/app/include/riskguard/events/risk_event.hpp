#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace riskguard {

// Wall-clock instant carried by every event. Converted to epoch milliseconds
// (see time_utils.hpp) wherever it is persisted or compared against state.
using Timestamp = std::chrono::system_clock::time_point;

enum class RiskEventKind {
  TradeExecuted,
  PositionChanged,
  OrderChanged,
  AccountStatusChanged,
};

enum class OrderSide { Buy, Sell };

enum class OrderType { Market, Limit, Stop, StopLimit, TrailingStop };

enum class OrderStatus { Pending, Working, Filled, Cancelled, Rejected };

// -----------------------------------------------------------------------------
// Kind-specific payloads
// -----------------------------------------------------------------------------

// A fill. realized_pnl is empty for half-turn (opening) fills; only full-turn
// fills carry a realized component.
struct TradePayload {
  std::string trade_id;                 // Broker fill id, unique per account
  std::optional<double> realized_pnl;
  OrderSide side{OrderSide::Buy};
  double size{0.0};                     // Unsigned fill size
  double price{0.0};
};

// Full snapshot of one instrument's position after the change.
struct PositionPayload {
  double net_size{0.0};                 // Signed: +long, -short, 0 = flat
  double average_price{0.0};
  std::optional<double> unrealized_pnl;
  std::optional<double> market_price;
};

struct OrderPayload {
  std::string order_id;
  OrderType type{OrderType::Market};
  OrderSide side{OrderSide::Buy};
  double size{0.0};
  std::optional<double> stop_price;
  std::optional<double> limit_price;
  OrderStatus status{OrderStatus::Pending};
};

struct AccountStatusPayload {
  bool can_trade{true};
};

using RiskEventPayload = std::variant<TradePayload, PositionPayload,
                                      OrderPayload, AccountStatusPayload>;

// -----------------------------------------------------------------------------
// RiskEvent
// -----------------------------------------------------------------------------
//
// @brief  The engine's only input. Produced by the EventNormalizer from a
//         broker-native message and consumed once by the EventRouter.
//
// @details
// kind() is derived from the payload alternative, so the two can never
// disagree. Events are passed by value into the loop and by const reference
// everywhere after; nothing mutates an event once it is built.
// -----------------------------------------------------------------------------
struct RiskEvent {
  std::string account_id;
  std::optional<std::string> symbol;    // Empty for account-level events
  Timestamp timestamp{};
  RiskEventPayload payload;
  std::uint64_t sequence_id{0};         // Assigned by the gateway, for logs

  RiskEventKind kind() const {
    switch (payload.index()) {
      case 0: return RiskEventKind::TradeExecuted;
      case 1: return RiskEventKind::PositionChanged;
      case 2: return RiskEventKind::OrderChanged;
      default: return RiskEventKind::AccountStatusChanged;
    }
  }

  bool isTradingEvent() const {
    return kind() != RiskEventKind::AccountStatusChanged;
  }

  const TradePayload* trade() const {
    return std::get_if<TradePayload>(&payload);
  }
  const PositionPayload* position() const {
    return std::get_if<PositionPayload>(&payload);
  }
  const OrderPayload* order() const {
    return std::get_if<OrderPayload>(&payload);
  }
  const AccountStatusPayload* accountStatus() const {
    return std::get_if<AccountStatusPayload>(&payload);
  }
};

inline const char* toString(RiskEventKind kind) {
  switch (kind) {
    case RiskEventKind::TradeExecuted:        return "TradeExecuted";
    case RiskEventKind::PositionChanged:      return "PositionChanged";
    case RiskEventKind::OrderChanged:         return "OrderChanged";
    case RiskEventKind::AccountStatusChanged: return "AccountStatusChanged";
  }
  return "Unknown";
}

}  // namespace riskguard
