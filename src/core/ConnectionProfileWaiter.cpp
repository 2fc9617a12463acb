/* @file ConnectionProfileWaiter.cpp
 * @brief poll NetworkInformation under a RetryBudget
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <functional>
#include <optional>
#include <string>

#include "core/AsyncBridge.hpp"
#include "core/ConnectionProfileWaiter.hpp"
#include "core/Errors.hpp"

using namespace hotspot::core;
using hotspot::platform::ConnectionProfile;

ConnectionProfileWaiter::ConnectionProfileWaiter(platform::NetworkInformation& network, Clock& clock,
                                                 Logger& log)
    : network_{ network }, clock_{ clock }, log_{ log } {}

ConnectionProfile ConnectionProfileWaiter::waitForInternetProfile(const RetryBudget& budget) {
  const std::function<std::optional<ConnectionProfile>()> probe = [this] {
    return network_.internetConnectionProfile();
  };
  const auto onMiss = [&](int attempt) {
    log_.info("[ConnectionProfileWaiter] no internet profile yet, attempt " + std::to_string(attempt) +
              "/" + std::to_string(budget.maxAttempts));
  };

  auto profile = AsyncBridge::pollUntil(probe, budget, clock_, onMiss);
  if (!profile)
    throw NoProfileFound("[ConnectionProfileWaiter] no internet connection profile after " +
                         std::to_string(budget.maxAttempts) + " attempts");

  log_.info("[ConnectionProfileWaiter] internet profile '" + profile->name + "' on " + profile->device);
  return *profile;
}
