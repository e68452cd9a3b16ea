#pragma once

#include <stdexcept>
#include <string>

namespace riskguard {

// -----------------------------------------------------------------------------
// Error hierarchy
// -----------------------------------------------------------------------------
//
// @brief  Exceptions that unwind out of a component. Broker outcomes are NOT
//         exceptions (see BrokerResult); they are values retried inside the
//         EnforcementExecutor.
//
// @details
//   ConfigError         Invalid configuration. Thrown during startup only;
//                       the engine never runs with a partially-valid rule set.
//   PersistenceError    The state store could not read or write. The
//                       operation that raised it did not take effect and the
//                       caller must retry it (the event is not processed).
//   InvariantViolation  Persisted state contradicts an invariant (e.g. two
//                       lockouts for one key). Owners catch it, log it as
//                       critical and repair toward the more restricted state.
// -----------------------------------------------------------------------------
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ConfigError : public Error {
 public:
  using Error::Error;
};

class PersistenceError : public Error {
 public:
  using Error::Error;
};

class InvariantViolation : public Error {
 public:
  using Error::Error;
};

}  // namespace riskguard
