/* @file TetheringController.cpp
 * @brief awaits tethering operations and logs their outcome
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <string>

#include "core/AsyncBridge.hpp"
#include "core/Errors.hpp"
#include "core/TetheringController.hpp"

using namespace hotspot::core;
using hotspot::platform::TetheringOperationResult;

namespace {

  std::string describe(const TetheringOperationResult& r) {
    std::string out = std::string(hotspot::platform::toString(r.status)) + " (code " +
                      std::to_string(r.nativeCode) + ")";
    if (!r.message.empty())
      out += ": " + r.message;
    return out;
  }

} // namespace

TetheringController::TetheringController(platform::TetheringManagerFactory& factory, Logger& log)
    : factory_{ factory }, log_{ log } {}

TetheringHandle TetheringController::fromProfile(const platform::ConnectionProfile& profile) {
  auto handle = factory_.createFromProfile(profile);
  if (!handle)
    throw PlatformFailure("[TetheringController] no tethering manager for profile '" + profile.name + "'");
  log_.debug("[TetheringController] tethering manager bound to '" + profile.name + "'");
  return handle;
}

hotspot::platform::TetheringState TetheringController::operationalState(const TetheringHandle& handle) {
  using hotspot::platform::TetheringState;

  const TetheringState reported = handle->operationalState();
  if (reported == TetheringState::Off)
    return TetheringState::Off;

  // anything but a definite Off means the hotspot connection exists
  if (reported != TetheringState::On)
    log_.debug(std::string("[TetheringController] platform reports ") + hotspot::platform::toString(reported) +
               ", treating as On");
  return TetheringState::On;
}

TetheringOperationResult TetheringController::start(const TetheringHandle& handle) {
  auto result = AsyncBridge::await(handle->startTethering(), "tethering start");
  log_.debug("[TetheringController] start -> " + describe(result));
  return result;
}

TetheringOperationResult TetheringController::stop(const TetheringHandle& handle) {
  auto result = AsyncBridge::await(handle->stopTethering(), "tethering stop");
  log_.debug("[TetheringController] stop -> " + describe(result));
  return result;
}
