/* @file RadioController.cpp
 * @brief WiFi radio lookup, power switching and re-resolution
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <string>
#include <vector>

// Hotspot headers
#include "core/AsyncBridge.hpp"
#include "core/Errors.hpp"
#include "core/RadioController.hpp"

using namespace hotspot::core;
using hotspot::platform::RadioAccessStatus;
using hotspot::platform::RadioKind;
using hotspot::platform::RadioState;

RadioController::RadioController(platform::RadioManager& radios, Logger& log)
    : radios_{ radios }, log_{ log } {}

void RadioController::requireAccess() {
  const auto status = AsyncBridge::await(radios_.requestAccess(), "radio access request");
  if (status != RadioAccessStatus::Allowed)
    throw RadioAccessDenied(std::string("[RadioController] radio access: ") + platform::toString(status));
}

std::vector<RadioHandle> RadioController::enumerate() {
  return AsyncBridge::await(radios_.enumerate(), "radio enumeration");
}

RadioHandle RadioController::findWifiRadio() {
  requireAccess();

  const auto all = enumerate();
  auto it = std::find_if(all.begin(), all.end(),
                         [](const RadioHandle& r) { return r && r->kind() == RadioKind::WiFi; });
  if (it == all.end())
    throw RadioNotFound("[RadioController] no WiFi radio among " + std::to_string(all.size()) + " radios");

  log_.debug("[RadioController] WiFi radio '" + (*it)->name() + "' is " + platform::toString((*it)->state()));
  return *it;
}

bool RadioController::setState(const RadioHandle& handle, RadioState target) {
  if (!handle)
    return false;

  const auto status = AsyncBridge::await(handle->setState(target), "radio set-state");
  if (status != RadioAccessStatus::Allowed) {
    log_.warn("[RadioController] setting '" + handle->name() + "' " + platform::toString(target) +
              " refused: " + platform::toString(status));
    return false;
  }
  log_.debug("[RadioController] radio '" + handle->name() + "' set " + platform::toString(target));
  return true;
}

RadioHandle RadioController::refresh(const RadioHandle& handle) {
  const auto all = enumerate();

  if (handle) {
    auto same = std::find_if(all.begin(), all.end(), [&](const RadioHandle& r) {
      return r && r->kind() == RadioKind::WiFi && r->name() == handle->name();
    });
    if (same != all.end())
      return *same;
  }

  auto first = std::find_if(all.begin(), all.end(),
                            [](const RadioHandle& r) { return r && r->kind() == RadioKind::WiFi; });
  if (first == all.end())
    throw RadioNotFound("[RadioController] WiFi radio vanished on re-enumeration");
  return *first;
}
