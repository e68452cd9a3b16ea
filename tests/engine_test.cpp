// =============================================================================
// engine_test.cpp
// =============================================================================
// End-to-end tests for riskguard::RiskGuardEngine with an in-memory store,
// MockBrokerGateway and a simulation clock. No ZMQ endpoints are configured.
//
// Validates:
//   - Lifecycle: start()/stop() idempotent, destructor stops a running engine
//   - Full path: events -> rules -> enforcement -> lockout -> gate
//   - Events arriving during an enforcement are held, then released in order
//   - A storage failure parks the event; the next sweep retries it
//   - Admin commands: PING, STATUS, CLEAR, RESET
//   - Restart: lockouts and P&L survive on the same store
// =============================================================================

#include "riskguard/engine/risk_guard_engine.hpp"
#include "riskguard/enforcement/mock_broker_gateway.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <thread>

using namespace riskguard;
using namespace riskguard::test;
using std::chrono::milliseconds;

namespace {

constexpr milliseconds kWait{5000};

EngineConfig dailyLossConfig() {
  EngineConfig config;
  config.account_id = kAccount;
  config.timezone = "UTC";
  config.reset_time = LocalTime{17, 0};

  RuleConfig loss;
  loss.params = DailyRealizedLossParams{-500.0};
  config.rules.push_back(loss);

  config.enforcement = EnforcementOptions{2, milliseconds(1), milliseconds(100)};
  // Tests drive sweeps and reset checks by hand.
  config.sweep_interval = std::chrono::hours(1);
  config.reset_check_interval = std::chrono::hours(1);
  return config;
}

// Polls until `predicate` holds or the deadline passes.
template <typename Predicate>
bool eventually(Predicate predicate, milliseconds timeout = kWait) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(milliseconds(2));
  }
  return predicate();
}

}  // namespace

class EngineTest : public ::testing::Test {
 protected:
  MemoryStateStore store;
  SimulationTimeProvider clock{kBaseMs};
  MockBrokerGateway broker;
};

// -----------------------------------------------------------------------------
// 1. Lifecycle
// -----------------------------------------------------------------------------
TEST_F(EngineTest, StartStopAreIdempotent) {
  RiskGuardEngine engine(dailyLossConfig(), store, broker, clock);
  EXPECT_FALSE(engine.running());

  engine.start();
  engine.start();
  EXPECT_TRUE(engine.running());

  engine.stop();
  engine.stop();
  EXPECT_FALSE(engine.running());
}

TEST_F(EngineTest, DestructorStopsRunningEngine) {
  {
    RiskGuardEngine engine(dailyLossConfig(), store, broker, clock);
    engine.start();
    engine.pushEvent(tradeEvent("ES", "t1", -100.0));
  }
  SUCCEED();
}

TEST_F(EngineTest, InvalidConfigRejectedAtConstruction) {
  EngineConfig no_account = dailyLossConfig();
  no_account.account_id.clear();
  EXPECT_THROW(RiskGuardEngine(no_account, store, broker, clock), ConfigError);

  EngineConfig bad_zone = dailyLossConfig();
  bad_zone.timezone = "Mars/Olympus_Mons";
  EXPECT_THROW(RiskGuardEngine(bad_zone, store, broker, clock), ConfigError);
}

// -----------------------------------------------------------------------------
// 2. Daily loss end to end: the breach closes everything, cancels orders and
//    locks the account until 17:00; later trades are gated.
// -----------------------------------------------------------------------------
TEST_F(EngineTest, DailyLossBreachEnforcedAndLocked) {
  RiskGuardEngine engine(dailyLossConfig(), store, broker, clock);
  engine.start();

  engine.pushEvent(tradeEvent("ES", "t1", -300.0));
  engine.pushEvent(tradeEvent("ES", "t2", -250.0));
  ASSERT_TRUE(engine.waitIdle(kWait));

  EXPECT_EQ(broker.callCount("close_all"), 1u);
  EXPECT_EQ(broker.callCount("cancel_all_orders"), 1u);
  const auto info = engine.lockouts().info(kAccount, std::nullopt);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->kind, LockoutKind::Hard);
  EXPECT_EQ(info->expires_at_ms, kResetMs);

  // Locked: a further loss is booked but triggers nothing new.
  engine.pushEvent(tradeEvent("ES", "t3", -100.0));
  ASSERT_TRUE(engine.waitIdle(kWait));
  EXPECT_EQ(broker.callCount("close_all"), 1u);
  EXPECT_DOUBLE_EQ(engine.pnl().getDaily(kAccount).realized_pnl, -650.0);

  engine.stop();
}

// -----------------------------------------------------------------------------
// 3. While enforcement is in flight, new events wait; afterwards they are
//    processed in arrival order.
// Why: An event evaluated mid-enforcement would see a half-closed account
//      and could trigger a second, conflicting enforcement.
// -----------------------------------------------------------------------------
TEST_F(EngineTest, EventsHeldWhileEnforcementInFlight) {
  broker.setLatency(milliseconds(150));
  RiskGuardEngine engine(dailyLossConfig(), store, broker, clock);
  engine.start();

  engine.pushEvent(tradeEvent("ES", "t1", -600.0));
  engine.pushEvent(positionEvent("ES", 0.0));
  engine.pushEvent(tradeEvent("NQ", "t2", 40.0));

  EXPECT_TRUE(eventually([&] { return engine.heldEvents() == 2; }));
  EXPECT_TRUE(engine.executor().hasInFlight(kAccount));

  ASSERT_TRUE(engine.waitIdle(kWait));
  EXPECT_EQ(engine.heldEvents(), 0u);
  EXPECT_DOUBLE_EQ(engine.pnl().getDaily(kAccount).realized_pnl, -560.0);
  EXPECT_FALSE(engine.positions().position("ES").has_value());
  EXPECT_EQ(broker.callCount("close_all"), 1u);

  engine.stop();
}

// -----------------------------------------------------------------------------
// 4. Storage outage: the event is parked, later events queue behind it, and
//    the first sweep after recovery processes both in order.
// -----------------------------------------------------------------------------
TEST_F(EngineTest, StorageFailureParksEventUntilSweep) {
  RiskGuardEngine engine(dailyLossConfig(), store, broker, clock);
  engine.start();

  store.failWrites(true);
  engine.pushEvent(tradeEvent("ES", "t1", -300.0));
  ASSERT_TRUE(engine.waitIdle(kWait));
  EXPECT_EQ(engine.heldEvents(), 1u);

  engine.pushEvent(tradeEvent("ES", "t2", -300.0));
  ASSERT_TRUE(engine.waitIdle(kWait));
  EXPECT_EQ(engine.heldEvents(), 2u);
  EXPECT_EQ(broker.callCount("close_all"), 0u);

  store.failWrites(false);
  engine.runSweepOnce();
  ASSERT_TRUE(engine.waitIdle(kWait));

  EXPECT_EQ(engine.heldEvents(), 0u);
  EXPECT_DOUBLE_EQ(engine.pnl().getDaily(kAccount).realized_pnl, -600.0);
  EXPECT_EQ(broker.callCount("close_all"), 1u);
  EXPECT_TRUE(engine.lockouts().isLockedOut(kAccount, std::nullopt));

  engine.stop();
}

// -----------------------------------------------------------------------------
// 5. Sweep and reset passes
// -----------------------------------------------------------------------------
TEST_F(EngineTest, ResetCheckClearsDailyLockout) {
  RiskGuardEngine engine(dailyLossConfig(), store, broker, clock);
  engine.start();

  engine.pushEvent(tradeEvent("ES", "t1", -700.0));
  ASSERT_TRUE(engine.waitIdle(kWait));
  ASSERT_TRUE(engine.lockouts().isLockedOut(kAccount, std::nullopt));

  EXPECT_FALSE(engine.runResetCheckOnce());
  clock.advance_time(kResetMs);
  EXPECT_TRUE(engine.runResetCheckOnce());

  EXPECT_FALSE(engine.lockouts().isLockedOut(kAccount, std::nullopt));
  EXPECT_DOUBLE_EQ(engine.pnl().getDaily(kAccount).realized_pnl, 0.0);
  engine.stop();
}

// The sweep that unlocks the account at the reset time also zeroes the day,
// so the first fill of the new session is not judged against the old loss.
TEST_F(EngineTest, SweepAtResetTimeDoesNotReenforceOldLoss) {
  RiskGuardEngine engine(dailyLossConfig(), store, broker, clock);
  engine.start();

  clock.advance_time(kResetMs - kMinuteMs);
  engine.pushEvent(tradeEvent("ES", "t1", -550.0, kResetMs - kMinuteMs));
  ASSERT_TRUE(engine.waitIdle(kWait));
  ASSERT_EQ(broker.callCount("close_all"), 1u);
  ASSERT_TRUE(engine.lockouts().isLockedOut(kAccount, std::nullopt));

  clock.advance_time(kResetMs + 30'000);
  engine.runSweepOnce();
  ASSERT_TRUE(engine.waitIdle(kWait));
  EXPECT_FALSE(engine.lockouts().isLockedOut(kAccount, std::nullopt));
  EXPECT_DOUBLE_EQ(engine.pnl().getDaily(kAccount).realized_pnl, 0.0);

  engine.pushEvent(tradeEvent("ES", "t2", 10.0, kResetMs + 30'000));
  ASSERT_TRUE(engine.waitIdle(kWait));

  EXPECT_EQ(broker.callCount("close_all"), 1u);
  EXPECT_EQ(broker.callCount("cancel_all_orders"), 1u);
  EXPECT_FALSE(engine.lockouts().isLockedOut(kAccount, std::nullopt));
  EXPECT_DOUBLE_EQ(engine.pnl().getDaily(kAccount).realized_pnl, 10.0);
  engine.stop();
}

TEST_F(EngineTest, StopLossGraceExpiryClosesViaSweep) {
  EngineConfig config = dailyLossConfig();
  RuleConfig grace;
  grace.params = NoStopLossGraceParams{std::chrono::seconds(30)};
  config.rules.push_back(grace);
  RiskGuardEngine engine(config, store, broker, clock);
  engine.start();

  engine.pushEvent(positionEvent("ES", 1.0));
  ASSERT_TRUE(engine.waitIdle(kWait));
  ASSERT_TRUE(engine.timers().exists(kAccount, stopLossTimerName("ES")));

  clock.advance_by(std::chrono::seconds(30));
  engine.runSweepOnce();
  ASSERT_TRUE(engine.waitIdle(kWait));

  ASSERT_EQ(broker.callCount("close_position"), 1u);
  EXPECT_EQ(broker.calls()[0].symbol, std::string("ES"));
  EXPECT_FALSE(engine.timers().exists(kAccount, stopLossTimerName("ES")));
  engine.stop();
}

// -----------------------------------------------------------------------------
// 6. Admin commands
// -----------------------------------------------------------------------------
TEST_F(EngineTest, PingAndUnknownCommand) {
  RiskGuardEngine engine(dailyLossConfig(), store, broker, clock);

  const auto ping = nlohmann::json::parse(engine.executeCommand("PING"));
  EXPECT_EQ(ping["status"], "ok");
  EXPECT_EQ(ping["response"], "PONG");

  const auto bad = nlohmann::json::parse(engine.executeCommand("FLY"));
  EXPECT_EQ(bad["status"], "error");
}

TEST_F(EngineTest, StatusReportsAccountState) {
  StaticReconciler reconciler({snapshot("ES", 2.0, -40.0)}, {});
  RiskGuardEngine engine(dailyLossConfig(), store, broker, clock);
  engine.start(&reconciler);

  engine.pushEvent(tradeEvent("ES", "t1", -120.0));
  ASSERT_TRUE(engine.waitIdle(kWait));

  const auto status = nlohmann::json::parse(engine.executeCommand("STATUS"));
  EXPECT_EQ(status["status"], "ok");
  EXPECT_EQ(status["account_id"], kAccount);
  EXPECT_EQ(status["daily_pnl"]["date"], "2024-03-05");
  EXPECT_DOUBLE_EQ(status["daily_pnl"]["realized_pnl"].get<double>(), -120.0);
  EXPECT_EQ(status["daily_pnl"]["trade_count"], 1);
  EXPECT_TRUE(status["lockouts"].empty());
  ASSERT_EQ(status["positions"].size(), 1u);
  EXPECT_EQ(status["positions"][0]["symbol"], "ES");
  EXPECT_EQ(status["next_reset_ms"], kResetMs);
  EXPECT_TRUE(status["last_reset_date"].is_null());
  engine.stop();
}

TEST_F(EngineTest, ClearCommandRemovesLockout) {
  RiskGuardEngine engine(dailyLossConfig(), store, broker, clock);
  engine.lockouts().setHard(kAccount, std::string("CL"), "blocked",
                            std::nullopt, "symbol_blocks");

  auto reply = nlohmann::json::parse(engine.executeCommand("CLEAR cl"));
  EXPECT_EQ(reply["status"], "ok");
  EXPECT_EQ(reply["cleared"], true);
  EXPECT_FALSE(engine.lockouts().isLockedOut(kAccount, std::string("CL")));

  reply = nlohmann::json::parse(engine.executeCommand("CLEAR *"));
  EXPECT_EQ(reply["cleared"], false);

  reply = nlohmann::json::parse(engine.executeCommand("CLEAR"));
  EXPECT_EQ(reply["status"], "error");
}

TEST_F(EngineTest, ResetCommandOncePerDay) {
  RiskGuardEngine engine(dailyLossConfig(), store, broker, clock);
  engine.pnl().addTrade(kAccount, "t1", -90.0);

  auto reply = nlohmann::json::parse(engine.executeCommand("RESET"));
  EXPECT_EQ(reply["reset"], true);
  EXPECT_DOUBLE_EQ(engine.pnl().getDaily(kAccount).realized_pnl, 0.0);

  reply = nlohmann::json::parse(engine.executeCommand("RESET"));
  EXPECT_EQ(reply["status"], "ok");
  EXPECT_EQ(reply["reset"], false);
}

// -----------------------------------------------------------------------------
// 7. Restart on the same store: the lockout and the day's P&L come back.
// -----------------------------------------------------------------------------
TEST_F(EngineTest, StateSurvivesRestart) {
  {
    RiskGuardEngine engine(dailyLossConfig(), store, broker, clock);
    engine.start();
    engine.pushEvent(tradeEvent("ES", "t1", -800.0));
    ASSERT_TRUE(engine.waitIdle(kWait));
    engine.stop();
  }

  clock.advance_by(std::chrono::minutes(10));
  RiskGuardEngine restarted(dailyLossConfig(), store, broker, clock);
  restarted.start();
  EXPECT_TRUE(restarted.lockouts().isLockedOut(kAccount, std::string("ES")));
  EXPECT_DOUBLE_EQ(restarted.pnl().getDaily(kAccount).realized_pnl, -800.0);

  // The redelivered fill is not booked twice.
  restarted.pushEvent(tradeEvent("ES", "t1", -800.0));
  ASSERT_TRUE(restarted.waitIdle(kWait));
  EXPECT_DOUBLE_EQ(restarted.pnl().getDaily(kAccount).realized_pnl, -800.0);
  restarted.stop();
}
