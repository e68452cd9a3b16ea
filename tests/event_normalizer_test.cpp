// =============================================================================
// event_normalizer_test.cpp
// =============================================================================
// Unit tests for normalizeBrokerEvent(), BrokerEventGateway::handleMessage()
// and IpcServer::formatTelemetry().
//
// Validates:
//   - Each broker message maps to the right RiskEvent kind and payload
//   - Symbols are upper-cased; position_closed is a flat snapshot
//   - Unknown event names are skipped, malformed messages throw
//   - The gateway counts forwarded / skipped / malformed messages and
//     assigns increasing sequence ids
//   - Telemetry JSON for the events the IPC server publishes
// =============================================================================

#include "riskguard/gateway/broker_event_gateway.hpp"
#include "riskguard/gateway/event_normalizer.hpp"
#include "riskguard/network/ipc_server.hpp"
#include "riskguard/time/time_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <stdexcept>
#include <vector>

using namespace riskguard;
using nlohmann::json;

namespace {

constexpr std::int64_t kTs = 1709647200000;

json base(const char* event) {
  return json{{"event", event}, {"account_id", "ACC-1"}, {"timestamp_ms", kTs}};
}

}  // namespace

TEST(EventNormalizerTest, TradeExecuted) {
  json msg = base("trade_executed");
  msg["symbol"] = "es";
  msg["trade_id"] = "T-100";
  msg["side"] = "sell";
  msg["size"] = 2;
  msg["price"] = 5012.25;
  msg["realized_pnl"] = -137.5;

  const auto event = normalizeBrokerEvent(msg);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->kind(), RiskEventKind::TradeExecuted);
  EXPECT_EQ(event->account_id, "ACC-1");
  EXPECT_EQ(event->symbol, std::string("ES"));
  EXPECT_EQ(timestamp_to_ms(event->timestamp), kTs);

  const TradePayload* trade = event->trade();
  ASSERT_NE(trade, nullptr);
  EXPECT_EQ(trade->trade_id, "T-100");
  EXPECT_EQ(trade->side, OrderSide::Sell);
  EXPECT_DOUBLE_EQ(trade->size, 2.0);
  ASSERT_TRUE(trade->realized_pnl.has_value());
  EXPECT_DOUBLE_EQ(*trade->realized_pnl, -137.5);
}

// An opening fill has no realized P&L; null and absent both mean "none".
TEST(EventNormalizerTest, TradeWithoutRealizedPnl) {
  json msg = base("trade_executed");
  msg["symbol"] = "NQ";
  msg["trade_id"] = "T-1";
  msg["side"] = "buy";
  msg["size"] = 1;
  msg["realized_pnl"] = nullptr;

  const auto event = normalizeBrokerEvent(msg);
  ASSERT_TRUE(event.has_value());
  EXPECT_FALSE(event->trade()->realized_pnl.has_value());
}

TEST(EventNormalizerTest, PositionUpdatedAndClosed) {
  json msg = base("position_updated");
  msg["symbol"] = "mnq";
  msg["net_size"] = -3;
  msg["average_price"] = 17800.0;
  msg["unrealized_pnl"] = 42.0;
  msg["market_price"] = 17790.0;

  auto event = normalizeBrokerEvent(msg);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->kind(), RiskEventKind::PositionChanged);
  EXPECT_EQ(event->symbol, std::string("MNQ"));
  EXPECT_DOUBLE_EQ(event->position()->net_size, -3.0);
  EXPECT_DOUBLE_EQ(*event->position()->market_price, 17790.0);

  json closed = base("position_closed");
  closed["symbol"] = "MNQ";
  event = normalizeBrokerEvent(closed);
  ASSERT_TRUE(event.has_value());
  EXPECT_DOUBLE_EQ(event->position()->net_size, 0.0);
  EXPECT_DOUBLE_EQ(*event->position()->unrealized_pnl, 0.0);
}

TEST(EventNormalizerTest, OrderLifecycleStatuses) {
  const std::vector<std::pair<const char*, OrderStatus>> cases = {
      {"order_placed", OrderStatus::Working},
      {"order_modified", OrderStatus::Working},
      {"order_filled", OrderStatus::Filled},
      {"order_cancelled", OrderStatus::Cancelled},
      {"order_rejected", OrderStatus::Rejected},
  };
  for (const auto& [name, status] : cases) {
    json msg = base(name);
    msg["symbol"] = "ES";
    msg["order_id"] = "O-9";
    msg["order_type"] = "trailing_stop";
    msg["side"] = "sell";
    msg["size"] = 1;
    msg["stop_price"] = 5000.0;

    const auto event = normalizeBrokerEvent(msg);
    ASSERT_TRUE(event.has_value()) << name;
    const OrderPayload* order = event->order();
    ASSERT_NE(order, nullptr) << name;
    EXPECT_EQ(order->status, status) << name;
    EXPECT_EQ(order->type, OrderType::TrailingStop) << name;
    EXPECT_DOUBLE_EQ(*order->stop_price, 5000.0) << name;
    EXPECT_FALSE(order->limit_price.has_value()) << name;
  }
}

TEST(EventNormalizerTest, AccountUpdatedHasNoSymbol) {
  json msg = base("account_updated");
  msg["can_trade"] = false;

  const auto event = normalizeBrokerEvent(msg);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->kind(), RiskEventKind::AccountStatusChanged);
  EXPECT_FALSE(event->symbol.has_value());
  EXPECT_FALSE(event->accountStatus()->can_trade);
  EXPECT_FALSE(event->isTradingEvent());
}

TEST(EventNormalizerTest, UnknownEventIsSkipped) {
  json msg = base("quote");
  msg["symbol"] = "ES";
  msg["bid"] = 5000.0;
  EXPECT_FALSE(normalizeBrokerEvent(msg).has_value());
}

// -----------------------------------------------------------------------------
// Malformed input throws; the gateway turns that into a counted skip.
// -----------------------------------------------------------------------------
TEST(EventNormalizerTest, MalformedMessagesThrow) {
  json no_size = base("position_updated");
  no_size["symbol"] = "ES";
  EXPECT_THROW(normalizeBrokerEvent(no_size), json::exception);

  json bad_side = base("trade_executed");
  bad_side["symbol"] = "ES";
  bad_side["trade_id"] = "T-1";
  bad_side["side"] = "short";
  bad_side["size"] = 1;
  EXPECT_THROW(normalizeBrokerEvent(bad_side), std::invalid_argument);

  json empty_id = bad_side;
  empty_id["side"] = "buy";
  empty_id["trade_id"] = "";
  EXPECT_THROW(normalizeBrokerEvent(empty_id), std::invalid_argument);

  json bad_type = base("order_placed");
  bad_type["symbol"] = "ES";
  bad_type["order_id"] = "O-1";
  bad_type["order_type"] = "iceberg";
  bad_type["side"] = "buy";
  EXPECT_THROW(normalizeBrokerEvent(bad_type), std::invalid_argument);

  json no_account = base("account_updated");
  no_account.erase("account_id");
  no_account["can_trade"] = true;
  EXPECT_THROW(normalizeBrokerEvent(no_account), json::exception);
}

TEST(BrokerEventGatewayTest, HandleMessageCountsOutcomes) {
  std::vector<RiskEvent> received;
  BrokerEventGateway gateway(
      [&received](RiskEvent e) { received.push_back(std::move(e)); },
      "tcp://127.0.0.1:59123");

  json account = base("account_updated");
  account["can_trade"] = true;

  EXPECT_TRUE(gateway.handleMessage(account.dump()));
  EXPECT_TRUE(gateway.handleMessage(account.dump()));
  EXPECT_FALSE(gateway.handleMessage(base("heartbeat").dump()));
  EXPECT_FALSE(gateway.handleMessage("{not json"));
  EXPECT_FALSE(gateway.handleMessage(base("trade_executed").dump()));

  EXPECT_EQ(gateway.forwarded(), 2u);
  EXPECT_EQ(gateway.skipped(), 1u);
  EXPECT_EQ(gateway.malformed(), 2u);
  ASSERT_EQ(received.size(), 2u);
  EXPECT_LT(received[0].sequence_id, received[1].sequence_id);
}

// -----------------------------------------------------------------------------
// Telemetry: only lockout, enforcement and stop-adjustment events publish.
// -----------------------------------------------------------------------------
TEST(IpcTelemetryTest, FormatsPublishedEvents) {
  LockoutChangedEvent lockout{"ACC-1", std::nullopt, "hard", "daily loss",
                              true,    "set",        kTs + 1000,
                              ms_to_timestamp(kTs)};
  auto text = IpcServer::formatTelemetry(Event{lockout});
  ASSERT_TRUE(text.has_value());
  auto j = json::parse(*text);
  EXPECT_EQ(j["type"], "lockout");
  EXPECT_TRUE(j["symbol"].is_null());
  EXPECT_EQ(j["installed"], true);
  EXPECT_EQ(j["expires_at_ms"], kTs + 1000);
  EXPECT_EQ(j["timestamp_ms"], kTs);

  StopAdjustmentEvent stop{"ACC-1", "ES", 4990.25, "trailing",
                           ms_to_timestamp(kTs)};
  text = IpcServer::formatTelemetry(Event{stop});
  ASSERT_TRUE(text.has_value());
  j = json::parse(*text);
  EXPECT_EQ(j["type"], "stop_adjustment");
  EXPECT_DOUBLE_EQ(j["stop_price"].get<double>(), 4990.25);

  EXPECT_FALSE(IpcServer::formatTelemetry(Event{RetryDeferredEvent{}}).has_value());
}
