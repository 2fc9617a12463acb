#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/Errors.hpp"

namespace hotspot::core {

  /**
 * @class ErrorMonitor
 * @brief Components call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected vector).
 * * Remembers the kind of the most recent failure so the CLI can pick an exit code.
 */
  class ErrorMonitor {
  public:
    using Escalation = std::function<void(ErrorKind, const std::string&)>;

    ErrorMonitor();
    virtual ~ErrorMonitor();

    /// Register a lambda that escalates a fault (CLI: log + exit-code bookkeeping).
    void registerEscalation(Escalation cb);

    /// Called on fault; will forward to the escalation callback if not seen before.
    virtual void notifyFailure(ErrorKind kind, const std::string& message);

    std::optional<ErrorKind> lastFailure() const;
    std::size_t uniqueFailures() const;

    /// Forget everything seen so far (start of a new toggle run).
    void reset();

  private:
    bool rememberIfNew(const std::string& message);

    Escalation escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    std::optional<ErrorKind> last_{};
    mutable std::mutex mtx_;
  };

} // namespace hotspot::core
