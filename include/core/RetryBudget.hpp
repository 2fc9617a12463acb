#pragma once
/** @file  RetryBudget.hpp
 *  @brief Attempt count + interval for bounded polling loops.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <chrono>

namespace hotspot::core {

  struct RetryBudget {
    int maxAttempts{ 12 };
    std::chrono::milliseconds interval{ std::chrono::seconds{ 5 } };

    /// Worst-case time spent sleeping between attempts.
    std::chrono::milliseconds ceiling() const {
      return maxAttempts > 1 ? interval * (maxAttempts - 1) : std::chrono::milliseconds{ 0 };
    }
  };

} // namespace hotspot::core
