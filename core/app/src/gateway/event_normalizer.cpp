#include "riskguard/gateway/event_normalizer.hpp"
#include "riskguard/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace riskguard {

namespace {

std::optional<double> optionalNumber(const nlohmann::json& message,
                                     const char* field) {
  auto it = message.find(field);
  if (it == message.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<double>();
}

TradePayload tradeFrom(const nlohmann::json& message) {
  TradePayload trade;
  trade.trade_id = message.at("trade_id").get<std::string>();
  if (trade.trade_id.empty()) {
    throw std::invalid_argument("trade_executed without trade_id");
  }
  trade.realized_pnl = optionalNumber(message, "realized_pnl");
  trade.side = parseOrderSide(message.at("side").get<std::string>());
  trade.size = message.at("size").get<double>();
  trade.price = message.value("price", 0.0);
  return trade;
}

PositionPayload positionFrom(const nlohmann::json& message, bool closed) {
  PositionPayload position;
  position.net_size = closed ? 0.0 : message.at("net_size").get<double>();
  position.average_price = message.value("average_price", 0.0);
  position.unrealized_pnl =
      closed ? std::optional<double>(0.0)
             : optionalNumber(message, "unrealized_pnl");
  position.market_price = optionalNumber(message, "market_price");
  return position;
}

OrderPayload orderFrom(const nlohmann::json& message, OrderStatus status) {
  OrderPayload order;
  order.order_id = message.at("order_id").get<std::string>();
  order.type = parseOrderType(message.at("order_type").get<std::string>());
  order.side = parseOrderSide(message.at("side").get<std::string>());
  order.size = message.value("size", 0.0);
  order.stop_price = optionalNumber(message, "stop_price");
  order.limit_price = optionalNumber(message, "limit_price");
  order.status = status;
  return order;
}

}  // namespace

std::string upperSymbol(std::string symbol) {
  std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return symbol;
}

OrderType parseOrderType(const std::string& text) {
  if (text == "market") return OrderType::Market;
  if (text == "limit") return OrderType::Limit;
  if (text == "stop") return OrderType::Stop;
  if (text == "stop_limit") return OrderType::StopLimit;
  if (text == "trailing_stop") return OrderType::TrailingStop;
  throw std::invalid_argument("unknown order_type '" + text + "'");
}

OrderSide parseOrderSide(const std::string& text) {
  if (text == "buy") return OrderSide::Buy;
  if (text == "sell") return OrderSide::Sell;
  throw std::invalid_argument("unknown side '" + text + "'");
}

// -----------------------------------------------------------------------------
// normalizeBrokerEvent
// -----------------------------------------------------------------------------
std::optional<RiskEvent> normalizeBrokerEvent(const nlohmann::json& message) {
  const std::string name = message.at("event").get<std::string>();

  RiskEvent event;
  if (name == "trade_executed") {
    event.payload = tradeFrom(message);
  } else if (name == "position_opened" || name == "position_updated") {
    event.payload = positionFrom(message, false);
  } else if (name == "position_closed") {
    event.payload = positionFrom(message, true);
  } else if (name == "order_placed" || name == "order_modified") {
    event.payload = orderFrom(message, OrderStatus::Working);
  } else if (name == "order_filled") {
    event.payload = orderFrom(message, OrderStatus::Filled);
  } else if (name == "order_cancelled") {
    event.payload = orderFrom(message, OrderStatus::Cancelled);
  } else if (name == "order_rejected") {
    event.payload = orderFrom(message, OrderStatus::Rejected);
  } else if (name == "account_updated") {
    event.payload = AccountStatusPayload{message.at("can_trade").get<bool>()};
  } else {
    return std::nullopt;
  }

  event.account_id = message.at("account_id").get<std::string>();
  event.timestamp = ms_to_timestamp(message.at("timestamp_ms").get<std::int64_t>());
  if (event.kind() != RiskEventKind::AccountStatusChanged) {
    event.symbol = upperSymbol(message.at("symbol").get<std::string>());
  }
  return event;
}

}  // namespace riskguard
