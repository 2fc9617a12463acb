/* @file DesktopNotifier.cpp
 * @brief desktop popups through notify-send
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <string>

#include "io/DesktopNotifier.hpp"

using namespace hotspot::io;

void DesktopNotifier::notify(const std::string& title, const std::string& message) {
  const auto result = runner_.run({ "notify-send", "--app-name=hotspot-toggle", title, message });
  if (!result.ok())
    log_.warn("[DesktopNotifier] notify-send exited " + std::to_string(result.exitCode) + ": " + result.output);
}
