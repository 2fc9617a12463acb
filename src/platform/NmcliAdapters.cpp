/* @file NmcliAdapters.cpp
 * @brief wifi device discovery + disconnect/connect restart
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <vector>

#include "core/Errors.hpp"
#include "platform/NmcliAdapters.hpp"
#include "platform/NmcliOutput.hpp"

using namespace hotspot::platform;

bool NmcliAdapterController::restart(const core::WifiAdapter& adapter) {
  if (!nmcli::isValidInterfaceName(adapter.name)) {
    log_.warn("[NmcliAdapterController] refusing to restart '" + adapter.name + "'");
    return false;
  }

  const auto down = runner_.run({ "nmcli", "device", "disconnect", adapter.name });
  if (!down.ok())
    log_.warn("[NmcliAdapterController] disconnect " + adapter.name + " exited " + std::to_string(down.exitCode));

  const auto up = runner_.run({ "nmcli", "device", "connect", adapter.name });
  if (!up.ok()) {
    log_.warn("[NmcliAdapterController] connect " + adapter.name + " exited " + std::to_string(up.exitCode) +
              ": " + nmcli::trim(up.output));
    return false;
  }
  return true;
}

std::string NmcliAdapterResolver::describe(const std::string& ifname) {
  const auto result = runner_.run({ "nmcli", "-g", "GENERAL.VENDOR,GENERAL.PRODUCT", "device", "show", ifname });
  if (!result.ok())
    return {};

  std::string description;
  for (const auto& line : nmcli::lines(result.output)) {
    const std::string part = nmcli::trim(line);
    if (part.empty())
      continue;
    if (!description.empty())
      description += ' ';
    description += part;
  }
  return description;
}

hotspot::core::WifiAdapter NmcliAdapterResolver::resolve(const std::string& preferredName) {
  const auto result = runner_.run({ "nmcli", "-t", "-f", "DEVICE,TYPE", "device", "status" });
  if (!result.ok())
    throw core::PlatformFailure("[NmcliAdapterResolver] nmcli device status exited " +
                                std::to_string(result.exitCode));

  std::vector<std::string> wifiDevices;
  for (const auto& line : nmcli::lines(result.output)) {
    const auto fields = nmcli::splitFields(line);
    if (fields.size() < 2 || fields[1] != "wifi")
      continue;
    if (!nmcli::isValidInterfaceName(fields[0])) {
      log_.warn("[NmcliAdapterResolver] suspicious interface name '" + fields[0] + "', skipping");
      continue;
    }
    wifiDevices.push_back(fields[0]);
  }

  std::string chosen;
  if (preferredName.empty()) {
    if (wifiDevices.empty())
      throw core::PlatformFailure("[NmcliAdapterResolver] no wifi device found");
    chosen = wifiDevices.front();
  } else {
    for (const auto& dev : wifiDevices) {
      if (dev == preferredName)
        chosen = dev;
    }
    if (chosen.empty())
      throw core::PlatformFailure("[NmcliAdapterResolver] '" + preferredName + "' is not a wifi device");
  }

  core::WifiAdapter adapter{ chosen, describe(chosen) };
  log_.debug("[NmcliAdapterResolver] using " + adapter.name +
             (adapter.description.empty() ? "" : " (" + adapter.description + ")"));
  return adapter;
}
