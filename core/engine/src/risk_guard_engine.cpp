#include "riskguard/engine/risk_guard_engine.hpp"
#include "riskguard/errors.hpp"
#include "riskguard/gateway/event_normalizer.hpp"
#include "riskguard/logging/log.hpp"
#include "riskguard/rules/rule_factory.hpp"
#include "riskguard/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <sstream>
#include <utility>

namespace riskguard {

namespace {

constexpr const char* kComponent = "RiskGuardEngine";

// Extra time stop() grants beyond the worst-case enforcement duration.
constexpr std::chrono::milliseconds kShutdownGrace{2000};

HolidayCalendar calendarFrom(const std::vector<LocalDate>& holidays) {
  HolidayCalendar calendar;
  for (const auto& day : holidays) {
    calendar.add(day);
  }
  return calendar;
}

nlohmann::json optionalText(const std::optional<std::string>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json optionalMs(const std::optional<std::int64_t>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: managers load their tables, rules are built, nothing runs
// -----------------------------------------------------------------------------
RiskGuardEngine::RiskGuardEngine(EngineConfig config, IStateStore& store,
                                 IBrokerGateway& broker,
                                 const ITimeProvider& clock)
    : config_(std::move(config)),
      store_(store),
      broker_(broker),
      clock_(clock) {
  if (config_.account_id.empty()) {
    throw ConfigError("account_id must not be empty");
  }
  if (!TimeZone::isKnownZone(config_.timezone)) {
    throw ConfigError("unknown time zone '" + config_.timezone + "'");
  }
  const TimeZone zone(config_.timezone);

  pnl_ = std::make_unique<PnlAccumulator>(store_, clock_, zone);
  timers_ = std::make_unique<TimerManager>(store_, clock_);
  lockouts_ = std::make_unique<LockoutManager>(store_, *timers_, clock_);
  reset_ = std::make_unique<ResetScheduler>(store_, *pnl_, *lockouts_, clock_,
                                            config_.account_id);
  reset_->schedule(config_.reset_time, zone, calendarFrom(config_.holidays));

  executor_ = std::make_unique<EnforcementExecutor>(
      broker_, *lockouts_, store_, clock_, config_.enforcement);

  router_ = std::make_unique<EventRouter>(
      config_.account_id, buildRules(config_.rules), *pnl_, *lockouts_,
      *timers_, *reset_, positions_, orders_, clock_,
      [this](EnforcementRequest request) {
        submitEnforcement(std::move(request));
      },
      [this](StopAdjustmentEvent event) { post(std::move(event)); });

  lockouts_->setObserver(
      [this](const LockoutChange& change) { onLockoutChange(change); });

  // Loop subscribers. The last one marks the event as fully handled.
  EventBus& bus = loop_.eventBus();
  bus.subscribe<RiskEvent>([this](const RiskEvent& e) { onRiskEvent(e); });
  bus.subscribe<EnforcementSettledEvent>(
      [this](const EnforcementSettledEvent& e) { onSettled(e); });
  bus.subscribe<StopLossCheckEvent>(
      [this](const StopLossCheckEvent& e) { onStopLossCheck(e); });
  bus.subscribe<RetryDeferredEvent>(
      [this](const RetryDeferredEvent&) { onRetryDeferred(); });
  bus.subscribe<LockoutChangedEvent>([this](const LockoutChangedEvent& e) {
    if (ipc_server_) ipc_server_->pushTelemetry(e);
  });
  bus.subscribe<EnforcementSettledEvent>(
      [this](const EnforcementSettledEvent& e) {
        if (ipc_server_) ipc_server_->pushTelemetry(e);
      });
  bus.subscribe<StopAdjustmentEvent>([this](const StopAdjustmentEvent& e) {
    if (ipc_server_) ipc_server_->pushTelemetry(e);
  });
  bus.subscribe([this](const Event&) { --outstanding_; });

  sweep_task_ = std::make_unique<PeriodicTask>(
      "sweep", config_.sweep_interval, [this] { runSweepOnce(); });
  reset_task_ = std::make_unique<PeriodicTask>(
      "reset", config_.reset_check_interval, [this] { runResetCheckOnce(); });

  log::info(kComponent, "account " + config_.account_id + ": " +
                            std::to_string(router_->rules().size()) +
                            " rule(s) enabled");
}

RiskGuardEngine::~RiskGuardEngine() { stop(); }

// -----------------------------------------------------------------------------
// start(reconciler)
// -----------------------------------------------------------------------------
void RiskGuardEngine::start(IReconciler* reconciler) {
  if (running_.load()) {
    return;
  }

  if (reconciler != nullptr) {
    auto positions = reconciler->reconcilePositions();
    for (const auto& pos : positions) {
      positions_.hydrate(pos);
    }
    auto orders = reconciler->reconcileOrders();
    for (const auto& order : orders) {
      orders_.hydrate(order);
    }
    log::info(kComponent, "reconciliation complete: " +
                              std::to_string(positions.size()) +
                              " position(s), " +
                              std::to_string(orders.size()) +
                              " working order(s) hydrated");
  }

  router_->startRules();
  runResetCheckOnce();

  // The IPC server exists before the loop starts relaying telemetry to it.
  startIpc();
  executor_->start();
  loop_.start();
  sweep_task_->start();
  reset_task_->start();
  running_.store(true);

  startGateway();

  log::info(kComponent, std::string("started. Threads: loop, enforcer, "
                                    "sweep, reset") +
                            (ipc_server_ ? ", ipc" : "") +
                            (gateway_ ? ", gateway" : ""));
}

// -----------------------------------------------------------------------------
// stop(): gateway first, then drain, then join in reverse dependency order
// -----------------------------------------------------------------------------
void RiskGuardEngine::stop() {
  if (!running_.load()) {
    return;
  }

  if (gateway_) {
    gateway_->stop();
    if (gateway_thread_.joinable()) {
      gateway_thread_.join();
    }
    gateway_.reset();
  }

  sweep_task_->stop();
  reset_task_->stop();

  const auto drain_limit = config_.enforcement.attempt_timeout *
                               config_.enforcement.max_attempts +
                           kShutdownGrace;
  if (!waitIdle(
          std::chrono::duration_cast<std::chrono::milliseconds>(drain_limit))) {
    log::warn(kComponent, "shutdown drain timed out; stopping anyway");
  }

  executor_->stop();
  loop_.stop();
  stopIpc();
  running_.store(false);

  log::info(kComponent, "stopped. All threads joined.");
}

void RiskGuardEngine::startIpc() {
  const Endpoints& endpoints = config_.endpoints;
  if (!endpoints.ipc_cmd.empty() && !endpoints.ipc_pub.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        endpoints.ipc_cmd, endpoints.ipc_pub);
    ipc_server_->start();
  }
}

void RiskGuardEngine::startGateway() {
  const Endpoints& endpoints = config_.endpoints;
  if (!endpoints.broker_events.empty()) {
    gateway_ = std::make_unique<BrokerEventGateway>(
        [this](RiskEvent event) { pushEvent(std::move(event)); },
        endpoints.broker_events);
    gateway_thread_ = std::thread([this] { gateway_->run(); });
  }
}

void RiskGuardEngine::stopIpc() {
  if (ipc_server_) {
    ipc_server_->stop();
    ipc_server_.reset();
  }
}

void RiskGuardEngine::post(Event event) {
  ++outstanding_;
  loop_.push(std::move(event));
}

void RiskGuardEngine::pushEvent(RiskEvent event) { post(std::move(event)); }

bool RiskGuardEngine::waitIdle(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    // The executor posts its settlement before it stops counting as busy,
    // so "not busy, nothing posted, still not busy" means quiescent.
    if (!executor_->busy() && outstanding_.load() == 0 &&
        !executor_->busy()) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
}

// -----------------------------------------------------------------------------
// Loop thread: routing with hold / park
// -----------------------------------------------------------------------------
void RiskGuardEngine::onRiskEvent(const RiskEvent& event) {
  if (enforcing_ > 0 || stalled_ || !held_.empty()) {
    held_.push_back(RoutedEvent{event, std::nullopt});
    held_count_.store(held_.size());
    log::info(kComponent, "stage=event_deferred account=" + event.account_id +
                              " seq=" + std::to_string(event.sequence_id) +
                              " reason=" +
                              (stalled_ ? "storage" : "enforcement_in_flight") +
                              " held=" + std::to_string(held_.size()));
    return;
  }

  RoutedEvent routed{event, std::nullopt};
  if (!route(routed)) {
    held_.push_front(std::move(routed));
    held_count_.store(held_.size());
  }
}

bool RiskGuardEngine::route(RoutedEvent& routed) {
  try {
    router_->process(routed);
    return true;
  } catch (const PersistenceError& e) {
    stalled_ = true;
    has_parked_.store(true);
    log::error(kComponent, "stage=event_deferred account=" +
                               routed.event.account_id + " seq=" +
                               std::to_string(routed.event.sequence_id) +
                               " reason=storage error=\"" + e.what() + "\"");
    return false;
  }
}

void RiskGuardEngine::drainHeld() {
  while (!held_.empty() && enforcing_ == 0 && !stalled_) {
    RoutedEvent routed = std::move(held_.front());
    held_.pop_front();
    if (!route(routed)) {
      held_.push_front(std::move(routed));
    }
  }
  held_count_.store(held_.size());
}

void RiskGuardEngine::onSettled(const EnforcementSettledEvent& /*event*/) {
  if (enforcing_ > 0) {
    --enforcing_;
  }
  drainHeld();
}

void RiskGuardEngine::onRetryDeferred() {
  if (!stalled_) {
    return;
  }
  stalled_ = false;
  has_parked_.store(false);
  log::info(kComponent, "retrying " + std::to_string(held_.size()) +
                            " parked event(s)");
  drainHeld();
}

void RiskGuardEngine::onStopLossCheck(const StopLossCheckEvent& event) {
  try {
    router_->onStopLossCheck(CheckStopLossAction{event.account_id, event.symbol});
  } catch (const PersistenceError& e) {
    log::error(kComponent, "stop-loss check for " + event.symbol +
                               " failed: " + e.what());
  }
}

void RiskGuardEngine::submitEnforcement(EnforcementRequest request) {
  ++enforcing_;
  executor_->submit(std::move(request), [this](const EnforcementOutcome& o) {
    const RuleVerdict& v = o.request.verdict;
    post(EnforcementSettledEvent{o.request.account_id, v.rule,
                                 toString(v.action), v.symbol, v.reason,
                                 o.success, o.lockout_installed,
                                 ms_to_timestamp(clock_.now_ms())});
  });
}

void RiskGuardEngine::onLockoutChange(const LockoutChange& change) {
  const Lockout& l = change.lockout;
  post(LockoutChangedEvent{l.account_id, l.symbol, toString(l.kind), l.reason,
                           change.installed, change.cause, l.expires_at_ms,
                           ms_to_timestamp(clock_.now_ms())});
}

// -----------------------------------------------------------------------------
// Sweep and reset passes
// -----------------------------------------------------------------------------
void RiskGuardEngine::runSweepOnce() {
  try {
    timers_->tick([this](const Timer& timer) {
      if (const auto* clear = std::get_if<ClearLockoutAction>(&timer.action)) {
        lockouts_->clearExpiredCooldown(clear->account_id, clear->symbol);
      } else if (const auto* check =
                     std::get_if<CheckStopLossAction>(&timer.action)) {
        post(StopLossCheckEvent{check->account_id, check->symbol});
      }
    });
  } catch (const PersistenceError& e) {
    log::error(kComponent, std::string("timer sweep failed: ") + e.what());
  }

  // The reset runs before the sweep: a date-bound lockout expiring at the
  // reset time must not unlock the account while the old totals still hold.
  runResetCheckOnce();

  try {
    lockouts_->sweepExpired();
  } catch (const PersistenceError& e) {
    log::error(kComponent, std::string("lockout sweep failed: ") + e.what());
  }

  if (has_parked_.load()) {
    post(RetryDeferredEvent{});
  }
}

bool RiskGuardEngine::runResetCheckOnce() {
  try {
    return reset_->tick();
  } catch (const PersistenceError& e) {
    log::error(kComponent, std::string("daily reset failed, will retry: ") +
                               e.what());
    return false;
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): admin surface
// -----------------------------------------------------------------------------
std::string RiskGuardEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;
  std::istringstream in(cmd);
  std::string verb;
  std::string arg;
  in >> verb >> arg;

  try {
    if (verb == "PING") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (verb == "STATUS") {
      const std::string& account = config_.account_id;
      const DailyPnl daily = pnl_->getDaily(account);
      response["status"] = "ok";
      response["account_id"] = account;
      response["daily_pnl"] = {{"date", daily.date.toString()},
                               {"realized_pnl", daily.realized_pnl},
                               {"trade_count", daily.trade_count},
                               {"execution_count", daily.execution_count}};

      nlohmann::json lockouts_json = nlohmann::json::array();
      for (const auto& l : lockouts_->list(account)) {
        lockouts_json.push_back({{"symbol", optionalText(l.symbol)},
                                 {"kind", toString(l.kind)},
                                 {"reason", l.reason},
                                 {"source", l.source},
                                 {"expires_at_ms", optionalMs(l.expires_at_ms)}});
      }
      response["lockouts"] = std::move(lockouts_json);

      nlohmann::json timers_json = nlohmann::json::array();
      for (const auto& t : timers_->list(account)) {
        timers_json.push_back(
            {{"name", t.name},
             {"expires_at_ms", t.expires_at_ms},
             {"remaining_ms", timers_->remaining(account, t.name).count()}});
      }
      response["timers"] = std::move(timers_json);

      nlohmann::json positions_json = nlohmann::json::array();
      for (const auto& p : positions_.snapshots()) {
        positions_json.push_back(
            {{"symbol", p.symbol},
             {"net_size", p.net_size},
             {"average_price", p.average_price},
             {"unrealized_pnl", p.unrealized_pnl
                                    ? nlohmann::json(*p.unrealized_pnl)
                                    : nlohmann::json(nullptr)}});
      }
      response["positions"] = std::move(positions_json);

      const auto last = reset_->lastResetDate();
      response["last_reset_date"] =
          last ? nlohmann::json(last->toString()) : nlohmann::json(nullptr);
      response["next_reset_ms"] = reset_->nextResetAfter(clock_.now_ms());
      response["enforcement_busy"] = executor_->busy();
      response["held_events"] = heldEvents();
    } else if (verb == "CLEAR") {
      if (arg.empty()) {
        response["status"] = "error";
        response["response"] = "usage: CLEAR <symbol|*>";
      } else {
        std::optional<std::string> symbol;
        if (arg != "*") {
          symbol = upperSymbol(arg);
        }
        const bool cleared =
            lockouts_->clear(config_.account_id, symbol, "manual");
        response["status"] = "ok";
        response["cleared"] = cleared;
        log::info(kComponent, "manual clear " + arg + ": " +
                                  (cleared ? "removed" : "nothing to remove"));
      }
    } else if (verb == "RESET") {
      const bool fired = reset_->resetNow();
      response["status"] = "ok";
      response["reset"] = fired;
      if (!fired) {
        response["response"] = "already reset today";
      }
    } else {
      response["status"] = "error";
      response["response"] = "Unknown command: " + cmd;
    }
  } catch (const Error& e) {
    response = nlohmann::json::object();
    response["status"] = "error";
    response["response"] = e.what();
  }

  return response.dump();
}

}  // namespace riskguard
