/* @file NmcliNetworkInformation.cpp
 * @brief `nmcli networking connectivity` + active connection scan
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <array>
#include <utility>

#include "platform/NmcliNetworkInformation.hpp"
#include "platform/NmcliOutput.hpp"

using namespace hotspot::platform;

NmcliNetworkInformation::NmcliNetworkInformation(io::CommandRunner& runner, std::string hotspotConnectionName,
                                                 core::Logger& log)
    : runner_{ runner }, hotspotConnection_{ std::move(hotspotConnectionName) }, log_{ log } {}

bool NmcliNetworkInformation::isUplinkType(const std::string& type) {
  static const std::array<const char*, 7> kUplinks{ "802-3-ethernet", "802-11-wireless", "gsm", "cdma",
                                                    "bluetooth",      "vpn",             "wireguard" };
  for (const char* t : kUplinks) {
    if (type == t)
      return true;
  }
  return false;
}

bool NmcliNetworkInformation::hasConnectivity() {
  const auto result = runner_.run({ "nmcli", "-t", "networking", "connectivity" });
  if (!result.ok()) {
    log_.debug("[NmcliNetworkInformation] connectivity check exited " + std::to_string(result.exitCode));
    return false;
  }
  const std::string level = nmcli::trim(result.output);
  log_.debug("[NmcliNetworkInformation] connectivity: " + level);
  return level == "full" || level == "limited";
}

std::optional<ConnectionProfile> NmcliNetworkInformation::internetConnectionProfile() {
  if (!hasConnectivity())
    return std::nullopt;

  const auto result = runner_.run({ "nmcli", "-t", "-f", "NAME,UUID,TYPE,DEVICE", "connection", "show", "--active" });
  if (!result.ok())
    return std::nullopt;

  for (const auto& line : nmcli::lines(result.output)) {
    const auto fields = nmcli::splitFields(line);
    if (fields.size() < 4)
      continue;

    ConnectionProfile profile{ fields[0], fields[1], fields[2], fields[3] };
    if (profile.name == hotspotConnection_ || !isUplinkType(profile.type))
      continue;
    return profile;
  }
  return std::nullopt;
}
