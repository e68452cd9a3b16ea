// =============================================================================
// event_router_test.cpp
// =============================================================================
// Unit tests for riskguard::EventRouter with real rules and managers and
// capturing sinks in place of the executor and the event bus.
//
// Validates:
//   - Events for other accounts are dropped before ingestion
//   - A due daily reset fires before ingestion
//   - Ingestion runs before the rules, and books are updated once per event
//     even when processing is retried
//   - The lockout gate: blocked events, the growing-position bypass close,
//     and AccountStatusChanged passing through
//   - One verdict per event, most severe first, earlier rule on ties
//   - ModifyStop goes to the stop sink, never to enforcement
//   - A stop request that lost to a close is asked for again
//   - Stop-loss timer expiry produces a close
// =============================================================================

#include "riskguard/router/event_router.hpp"
#include "riskguard/rules/cooldown_rules.hpp"
#include "riskguard/rules/guard_rules.hpp"
#include "riskguard/rules/pnl_rules.hpp"
#include "riskguard/rules/position_rules.hpp"
#include "riskguard/rules/trade_management_rule.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

using namespace riskguard;
using namespace riskguard::test;
using std::chrono::seconds;

class EventRouterTest : public ::testing::Test {
 protected:
  StateHarness h;
  std::vector<EnforcementRequest> enforced;
  std::vector<StopAdjustmentEvent> stops;
  std::unique_ptr<EventRouter> router;

  void build(std::vector<std::unique_ptr<IRule>> rules) {
    router = std::make_unique<EventRouter>(
        kAccount, std::move(rules), h.pnl, h.lockouts, h.timers, h.reset,
        h.positions, h.orders, h.clock,
        [this](EnforcementRequest r) { enforced.push_back(std::move(r)); },
        [this](StopAdjustmentEvent s) { stops.push_back(std::move(s)); });
  }

  void process(RiskEvent event) {
    RoutedEvent routed{std::move(event), std::nullopt};
    router->process(routed);
  }
};

namespace {

std::vector<std::unique_ptr<IRule>> dailyLossRules() {
  std::vector<std::unique_ptr<IRule>> rules;
  rules.push_back(std::make_unique<DailyRealizedLossRule>(
      DailyRealizedLossParams{-500.0}));
  return rules;
}

}  // namespace

TEST_F(EventRouterTest, OtherAccountIsDropped) {
  build(dailyLossRules());
  process(tradeEvent("ES", "t1", -900.0, kBaseMs, "ACC-2"));

  EXPECT_TRUE(enforced.empty());
  EXPECT_DOUBLE_EQ(h.pnl.getDaily("ACC-2").realized_pnl, 0.0);
}

// -----------------------------------------------------------------------------
// 1. Ingestion happens before evaluation: the loss that crosses the limit is
//    already in the daily total when the rule reads it.
// -----------------------------------------------------------------------------
TEST_F(EventRouterTest, TradeIngestedThenEvaluated) {
  build(dailyLossRules());

  process(tradeEvent("ES", "t1", -300.0));
  EXPECT_TRUE(enforced.empty());

  process(tradeEvent("ES", "t2", -250.0));
  ASSERT_EQ(enforced.size(), 1u);
  EXPECT_EQ(enforced[0].account_id, kAccount);
  EXPECT_EQ(enforced[0].verdict.rule, "daily_realized_loss");
  EXPECT_EQ(enforced[0].verdict.action, VerdictAction::CloseAll);
  EXPECT_EQ(h.pnl.getDaily(kAccount).execution_count, 2);
}

TEST_F(EventRouterTest, RedeliveredTradeNotCountedTwice) {
  build(dailyLossRules());

  process(tradeEvent("ES", "t1", -300.0));
  process(tradeEvent("ES", "t1", -300.0));

  EXPECT_DOUBLE_EQ(h.pnl.getDaily(kAccount).realized_pnl, -300.0);
  EXPECT_TRUE(enforced.empty());
}

// A fill stamped after the reset time lands on the new day even when no
// reset task ran in between.
TEST_F(EventRouterTest, DueResetFiresBeforeIngestion) {
  build(dailyLossRules());

  process(tradeEvent("ES", "t1", -550.0));
  ASSERT_EQ(enforced.size(), 1u);

  h.clock.advance_time(kResetMs + 30'000);
  process(tradeEvent("ES", "t2", 10.0, kResetMs + 30'000));

  EXPECT_EQ(enforced.size(), 1u);
  EXPECT_DOUBLE_EQ(h.pnl.getDaily(kAccount).realized_pnl, 10.0);
  ASSERT_TRUE(h.reset.lastResetDate().has_value());
  EXPECT_EQ(*h.reset.lastResetDate(), (LocalDate{2024, 3, 5}));
}

// -----------------------------------------------------------------------------
// 2. Lockout gate: a locked account's events skip the rules.
// -----------------------------------------------------------------------------
TEST_F(EventRouterTest, GateBlocksEvaluationWhileLocked) {
  build(dailyLossRules());
  h.lockouts.setHard(kAccount, std::nullopt, "daily loss", kResetMs,
                     "daily_realized_loss");

  process(tradeEvent("ES", "t1", -900.0));

  EXPECT_TRUE(enforced.empty());
  // Still ingested, so the day's total stays truthful.
  EXPECT_DOUBLE_EQ(h.pnl.getDaily(kAccount).realized_pnl, -900.0);
}

// -----------------------------------------------------------------------------
// 3. A position growing while locked is closed again, with no new lockout.
// Why: The lockout only stops rule evaluation; an order that slipped through
//      at the broker must still be flattened.
// -----------------------------------------------------------------------------
TEST_F(EventRouterTest, GateClosesPositionGrowingWhileLocked) {
  build(dailyLossRules());
  h.lockouts.setHard(kAccount, std::string("CL"), "blocked", std::nullopt,
                     "symbol_blocks");

  process(positionEvent("CL", 1.0));
  ASSERT_EQ(enforced.size(), 1u);
  EXPECT_EQ(enforced[0].verdict.rule, EventRouter::kGateRule);
  EXPECT_EQ(enforced[0].verdict.action, VerdictAction::CloseSymbol);
  EXPECT_EQ(enforced[0].verdict.symbol, std::string("CL"));
  EXPECT_FALSE(enforced[0].verdict.lockout.has_value());

  // Shrinking toward flat is the close working: no further request.
  process(positionEvent("CL", 0.0));
  EXPECT_EQ(enforced.size(), 1u);

  // Other symbols are unaffected by a symbol lockout.
  process(positionEvent("ES", 1.0));
  EXPECT_EQ(enforced.size(), 1u);
}

TEST_F(EventRouterTest, AccountStatusPassesTheGate) {
  std::vector<std::unique_ptr<IRule>> rules;
  rules.push_back(std::make_unique<AuthLossGuardRule>(AuthLossGuardParams{}));
  build(std::move(rules));

  process(accountEvent(false));
  ASSERT_EQ(enforced.size(), 1u);
  h.lockouts.setHard(kAccount, std::nullopt, enforced[0].verdict.reason,
                     std::nullopt, "auth_loss_guard");

  process(accountEvent(true));
  EXPECT_FALSE(h.lockouts.isLockedOut(kAccount, std::nullopt));
}

// -----------------------------------------------------------------------------
// 4. Several rules breach on one event: only the most severe is enforced.
// -----------------------------------------------------------------------------
TEST_F(EventRouterTest, MostSevereVerdictWins) {
  std::vector<std::unique_ptr<IRule>> rules;
  CooldownAfterLossParams cooldown;
  cooldown.tiers = {{-100.0, seconds(300)}};
  cooldown.close_all = true;
  rules.push_back(std::make_unique<CooldownAfterLossRule>(cooldown));
  rules.push_back(std::make_unique<DailyRealizedLossRule>(
      DailyRealizedLossParams{-500.0}));
  build(std::move(rules));

  process(tradeEvent("ES", "t1", -600.0));

  ASSERT_EQ(enforced.size(), 1u);
  EXPECT_EQ(enforced[0].verdict.rule, "daily_realized_loss");
  EXPECT_EQ(enforced[0].verdict.lockout->kind, LockoutKind::Hard);
}

TEST(EventRouterSelectTest, TieGoesToEarlierRule) {
  RuleVerdict first;
  first.breached = true;
  first.rule = "max_contracts";
  first.action = VerdictAction::CloseAll;
  RuleVerdict second = first;
  second.rule = "session_block_outside";
  RuleVerdict weaker;
  weaker.breached = true;
  weaker.rule = "trade_management";
  weaker.action = VerdictAction::ModifyStop;

  const auto winner = EventRouter::selectVerdict({weaker, first, second});
  ASSERT_TRUE(winner.has_value());
  EXPECT_EQ(winner->rule, "max_contracts");

  EXPECT_FALSE(EventRouter::selectVerdict({}).has_value());
  EXPECT_FALSE(
      EventRouter::selectVerdict({RuleVerdict::none()}).has_value());
}

TEST_F(EventRouterTest, ModifyStopGoesToStopSink) {
  std::vector<std::unique_ptr<IRule>> rules;
  TradeManagementParams p;
  p.stop_loss_ticks = 4;
  rules.push_back(std::make_unique<TradeManagementRule>(p));
  build(std::move(rules));

  process(positionEvent("ES", 1.0, 100.0));

  EXPECT_TRUE(enforced.empty());
  ASSERT_EQ(stops.size(), 1u);
  EXPECT_EQ(stops[0].account_id, kAccount);
  EXPECT_EQ(stops[0].symbol, "ES");
  EXPECT_DOUBLE_EQ(stops[0].stop_price, 99.0);
}

// A stop request outranked by a close is not remembered as placed: the next
// update within the limit asks for it again.
TEST_F(EventRouterTest, OutrankedStopIsRequestedAgain) {
  std::vector<std::unique_ptr<IRule>> rules;
  rules.push_back(std::make_unique<MaxContractsRule>(
      MaxContractsParams{1, PositionMeasure::Net, true}));
  TradeManagementParams p;
  p.stop_loss_ticks = 4;
  rules.push_back(std::make_unique<TradeManagementRule>(p));
  build(std::move(rules));

  process(positionEvent("ES", 2.0, 100.0));
  ASSERT_EQ(enforced.size(), 1u);
  EXPECT_EQ(enforced[0].verdict.rule, "max_contracts");
  EXPECT_TRUE(stops.empty());

  process(positionEvent("ES", 1.0, 100.0, std::nullopt, 100.0));
  EXPECT_EQ(enforced.size(), 1u);
  ASSERT_EQ(stops.size(), 1u);
  EXPECT_DOUBLE_EQ(stops[0].stop_price, 99.0);

  process(positionEvent("ES", 1.0, 100.0, std::nullopt, 100.0));
  EXPECT_EQ(stops.size(), 1u);
}

// -----------------------------------------------------------------------------
// 5. A storage failure propagates; the retry does not apply the position
//    update to the book a second time.
// Why: On the retry the grace rule must still see the position as newly
//      opened (previous size 0), or it would never arm its timer.
// -----------------------------------------------------------------------------
TEST_F(EventRouterTest, RetryAfterPersistenceErrorAppliesBooksOnce) {
  std::vector<std::unique_ptr<IRule>> rules;
  rules.push_back(std::make_unique<NoStopLossGraceRule>(
      NoStopLossGraceParams{seconds(30)}));
  build(std::move(rules));

  RoutedEvent routed{positionEvent("ES", 1.0), std::nullopt};
  h.store.failWrites(true);
  EXPECT_THROW(router->process(routed), PersistenceError);
  ASSERT_TRUE(routed.previous_size.has_value());
  EXPECT_DOUBLE_EQ(*routed.previous_size, 0.0);

  h.store.failWrites(false);
  router->process(routed);
  EXPECT_TRUE(h.timers.exists(kAccount, stopLossTimerName("ES")));
  EXPECT_DOUBLE_EQ(h.positions.totalNet(), 1.0);
}

TEST_F(EventRouterTest, StopLossCheckClosesUnprotectedPosition) {
  std::vector<std::unique_ptr<IRule>> rules;
  rules.push_back(std::make_unique<NoStopLossGraceRule>(
      NoStopLossGraceParams{seconds(30)}));
  build(std::move(rules));

  process(positionEvent("ES", 2.0));
  router->onStopLossCheck(CheckStopLossAction{kAccount, "ES"});

  ASSERT_EQ(enforced.size(), 1u);
  EXPECT_EQ(enforced[0].verdict.rule, "no_stop_loss_grace");
  EXPECT_EQ(enforced[0].verdict.action, VerdictAction::CloseSymbol);

  router->onStopLossCheck(CheckStopLossAction{"ACC-2", "ES"});
  EXPECT_EQ(enforced.size(), 1u);
}

TEST_F(EventRouterTest, StartRulesInstallsSymbolBlocks) {
  std::vector<std::unique_ptr<IRule>> rules;
  rules.push_back(
      std::make_unique<SymbolBlocksRule>(SymbolBlocksParams{{"CL"}}));
  build(std::move(rules));

  router->startRules();
  EXPECT_TRUE(h.lockouts.isLockedOut(kAccount, std::string("CL")));
}
