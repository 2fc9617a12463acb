#pragma once
/** @file  ConnectionProfileWaiter.hpp
 *  @brief Bounded wait for an internet connection profile (boot race).
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include "core/Clock.hpp"
#include "core/Logger.hpp"
#include "core/RetryBudget.hpp"
#include "platform/ConnectionProfile.hpp"

namespace hotspot::core {

  class ConnectionProfileWaiter {
  public:
    ConnectionProfileWaiter(platform::NetworkInformation& network, Clock& clock, Logger& log);

    /**
     * @brief Poll until a profile shows up.
     *
     * At most `budget.maxAttempts` polls with `budget.interval` between them.
     * @throws NoProfileFound once the budget is spent.
     */
    platform::ConnectionProfile waitForInternetProfile(const RetryBudget& budget);

  private:
    platform::NetworkInformation& network_;
    Clock& clock_;
    Logger& log_;
  };

} // namespace hotspot::core
