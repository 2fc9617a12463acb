#pragma once
/** @file  AsyncBridge.hpp
 *  @brief Turns platform futures into blocking calls; hosts the bounded poll loop.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

// STL headers
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <utility>

// Hotspot headers
#include "core/Clock.hpp"
#include "core/Errors.hpp"
#include "core/RetryBudget.hpp"

namespace hotspot::core {

  /**
 * @class AsyncBridge
 * @brief Stateless adaptation shim, no retry policy of its own.
 *
 *  * `await()` blocks with no timeout; the platform operation must be bounded.
 *  * `pollUntil()` is the only loop and is bounded by a RetryBudget.
 */
  class AsyncBridge {
  public:
    /**
     * @brief Block until @p op completes and return its value.
     *
     * @param op    Operation handed out by a platform capability.
     * @param what  Operation name used in the failure message.
     * @throws AsyncBridgeUnavailable if @p op carries no shared state.
     *         Exceptions stored in the operation are rethrown unchanged.
     */
    template <typename T> static T await(std::future<T> op, const std::string& what) {
      if (!op.valid())
        throw AsyncBridgeUnavailable("[AsyncBridge] no pending operation for " + what);
      op.wait();
      return op.get();
    }

    /**
     * @brief Call @p probe until it yields a value or the budget runs out.
     *
     * Sleeps `budget.interval` between misses, never after the last one.
     * @p onMiss receives the 1-based attempt number of each miss.
     */
    template <typename T>
    static std::optional<T> pollUntil(const std::function<std::optional<T>()>& probe,
                                      const RetryBudget& budget, Clock& clock,
                                      const std::function<void(int)>& onMiss = {}) {
      for (int attempt = 1; attempt <= budget.maxAttempts; ++attempt) {
        if (auto value = probe())
          return value;
        if (onMiss)
          onMiss(attempt);
        if (attempt < budget.maxAttempts)
          clock.sleepFor(budget.interval);
      }
      return std::nullopt;
    }
  };

} // namespace hotspot::core
