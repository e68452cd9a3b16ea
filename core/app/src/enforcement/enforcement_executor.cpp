#include "riskguard/enforcement/enforcement_executor.hpp"
#include "riskguard/errors.hpp"
#include "riskguard/logging/log.hpp"

#include <utility>

namespace riskguard {

namespace {

constexpr const char* kComponent = "EnforcementExecutor";

// Longest the idle worker blocks before re-checking running_.
constexpr std::chrono::milliseconds kIdleWait{10};

std::string describe(const EnforcementRequest& request,
                     const char* action,
                     const std::optional<std::string>& symbol) {
  return "account=" + request.account_id + " rule=" + request.verdict.rule +
         " action=" + action + " symbol=" + symbol.value_or("*");
}

}  // namespace

EnforcementExecutor::EnforcementExecutor(IBrokerGateway& broker,
                                         LockoutManager& lockouts,
                                         IStateStore& store,
                                         const ITimeProvider& clock,
                                         EnforcementOptions options)
    : broker_(broker),
      lockouts_(lockouts),
      store_(store),
      clock_(clock),
      options_(options) {
  if (options_.max_attempts < 1) {
    throw ConfigError("enforcement.max_attempts must be at least 1");
  }
}

EnforcementExecutor::~EnforcementExecutor() { stop(); }

void EnforcementExecutor::start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return;
  }
  thread_ = std::thread([this] { run(); });
  log::info(kComponent, "worker started");
}

void EnforcementExecutor::stop() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) {
    return;
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  log::info(kComponent, "worker stopped");
}

void EnforcementExecutor::submit(EnforcementRequest request,
                                 Completion on_done) {
  {
    std::lock_guard lock(state_mutex_);
    ++in_flight_[request.account_id];
    ++outstanding_;
  }
  queue_.push(Job{std::move(request), std::move(on_done)});
}

bool EnforcementExecutor::hasInFlight(const std::string& account_id) const {
  std::lock_guard lock(state_mutex_);
  auto it = in_flight_.find(account_id);
  return it != in_flight_.end() && it->second > 0;
}

bool EnforcementExecutor::busy() const {
  std::lock_guard lock(state_mutex_);
  return outstanding_ > 0;
}

bool EnforcementExecutor::waitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(state_mutex_);
  return state_cv_.wait_for(lock, timeout, [this] { return outstanding_ == 0; });
}

// -----------------------------------------------------------------------------
// Worker loop: stop() lets it drain whatever was already queued
// -----------------------------------------------------------------------------
void EnforcementExecutor::run() {
  for (;;) {
    std::optional<Job> job = queue_.pop_for(kIdleWait);
    if (!job) {
      if (!running_.load()) {
        return;
      }
      continue;
    }
    const EnforcementOutcome outcome = execute(job->request);
    finish(*job, outcome);
  }
}

void EnforcementExecutor::finish(const Job& job,
                                 const EnforcementOutcome& outcome) {
  if (job.on_done) {
    try {
      job.on_done(outcome);
    } catch (const std::exception& e) {
      log::error(kComponent, std::string("completion callback threw: ") +
                                 e.what());
    }
  }

  std::lock_guard lock(state_mutex_);
  auto it = in_flight_.find(job.request.account_id);
  if (it != in_flight_.end() && --it->second <= 0) {
    in_flight_.erase(it);
  }
  --outstanding_;
  state_cv_.notify_all();
}

// -----------------------------------------------------------------------------
// execute(request)
// -----------------------------------------------------------------------------
EnforcementOutcome EnforcementExecutor::execute(
    const EnforcementRequest& request) {
  const RuleVerdict& verdict = request.verdict;
  const auto timeout = options_.attempt_timeout;
  bool all_ok = true;

  switch (verdict.action) {
    case VerdictAction::CloseAll:
      all_ok &= callWithRetry(request, "close_all", std::nullopt, [&] {
        return broker_.closeAll(timeout);
      }).ok();
      break;
    case VerdictAction::CloseSymbol:
      all_ok &= callWithRetry(request, "close_position", verdict.symbol, [&] {
        return broker_.closePosition(verdict.symbol.value_or(""), timeout);
      }).ok();
      break;
    case VerdictAction::ReduceToLimit:
      all_ok &= callWithRetry(request, "reduce_position", verdict.symbol, [&] {
        return broker_.reducePosition(verdict.symbol.value_or(""),
                                      verdict.target_size, timeout);
      }).ok();
      break;
    case VerdictAction::CancelOrders:
      all_ok &= callWithRetry(request, "cancel_all_orders", std::nullopt, [&] {
        return broker_.cancelAllOrders(timeout);
      }).ok();
      break;
    case VerdictAction::ModifyStop:
      log::warn(kComponent, "stop adjustments are not broker enforcement; "
                            "ignoring verdict from " + verdict.rule);
      break;
    case VerdictAction::None:
      break;
  }

  // Orders are cancelled even when the close failed: fewer working orders
  // is never less safe.
  if (verdict.cancel_orders && verdict.action != VerdictAction::CancelOrders) {
    all_ok &= callWithRetry(request, "cancel_all_orders", std::nullopt, [&] {
      return broker_.cancelAllOrders(timeout);
    }).ok();
  }

  EnforcementOutcome outcome{request, all_ok, false};
  if (verdict.lockout) {
    if (all_ok) {
      outcome.lockout_installed = installLockout(request);
    } else {
      audit(request, std::string("lockout_") + toString(verdict.lockout->kind),
            verdict.lockout->symbol, "not_installed", 0,
            "enforcement failed; lockout deferred to next breach");
    }
  }

  log::info(kComponent, "stage=enforcement_result " +
                            describe(request, toString(verdict.action),
                                     verdict.symbol) +
                            " result=" + (all_ok ? "ok" : "failed") +
                            " lockout=" +
                            (outcome.lockout_installed ? "installed" : "none"));
  return outcome;
}

// -----------------------------------------------------------------------------
// callWithRetry: Transient retried with doubling backoff, Rejected is final
// -----------------------------------------------------------------------------
BrokerResult EnforcementExecutor::callWithRetry(
    const EnforcementRequest& request, const char* action,
    const std::optional<std::string>& symbol,
    const std::function<BrokerResult()>& call) {
  auto backoff = options_.initial_backoff;
  BrokerResult result = BrokerResult::transient("not attempted");
  int attempt = 0;

  while (attempt < options_.max_attempts) {
    ++attempt;
    result = call();
    log::info(kComponent, "stage=enforcement_attempt " +
                              describe(request, action, symbol) +
                              " attempt=" + std::to_string(attempt) +
                              " status=" + toString(result.status) +
                              (result.message.empty()
                                   ? std::string()
                                   : " message=\"" + result.message + "\""));
    if (result.status != BrokerResult::Status::Transient) {
      break;
    }
    if (attempt < options_.max_attempts) {
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
  }

  if (!result.ok()) {
    log::error(kComponent, "enforcement call failed: " +
                               describe(request, action, symbol) +
                               " after " + std::to_string(attempt) +
                               " attempt(s): " + result.message);
  }
  audit(request, action, symbol, toString(result.status), attempt,
        result.message);
  return result;
}

bool EnforcementExecutor::installLockout(const EnforcementRequest& request) {
  const RuleVerdict& verdict = request.verdict;
  const LockoutDirective& directive = *verdict.lockout;
  const std::string action = std::string("lockout_") + toString(directive.kind);

  try {
    if (directive.kind == LockoutKind::Hard) {
      lockouts_.setHard(request.account_id, directive.symbol, verdict.reason,
                        directive.until_ms, verdict.rule);
    } else {
      lockouts_.setCooldown(request.account_id, directive.symbol,
                            verdict.reason, directive.duration, verdict.rule);
    }
  } catch (const PersistenceError& e) {
    log::critical(kComponent, "lockout not persisted: " +
                                  describe(request, action.c_str(),
                                           directive.symbol) +
                                  ": " + e.what());
    audit(request, action, directive.symbol, "failed", 1, e.what());
    return false;
  }

  audit(request, action, directive.symbol, "installed", 1, "");
  return true;
}

void EnforcementExecutor::audit(const EnforcementRequest& request,
                                const std::string& action,
                                const std::optional<std::string>& symbol,
                                const std::string& result, int attempts,
                                const std::string& detail) {
  nlohmann::json record = {
      {"timestamp", clock_.now_ms()},
      {"account_id", request.account_id},
      {"rule", request.verdict.rule},
      {"action", action},
      {"symbol", symbol ? nlohmann::json(*symbol) : nlohmann::json(nullptr)},
      {"reason", request.verdict.reason},
      {"result", result},
      {"attempts", attempts},
  };
  if (!detail.empty()) {
    record["detail"] = detail;
  }

  try {
    store_.append(tables::kAuditLog, record);
  } catch (const PersistenceError& e) {
    log::critical(kComponent, "audit record lost (" + record.dump() +
                                  "): " + e.what());
  }
}

}  // namespace riskguard
