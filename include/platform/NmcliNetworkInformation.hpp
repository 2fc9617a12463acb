#pragma once
/** @file  NmcliNetworkInformation.hpp
 *  @brief NetworkManager view of the current internet connection.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <string>

#include "core/Logger.hpp"
#include "io/CommandRunner.hpp"
#include "platform/ConnectionProfile.hpp"

namespace hotspot::platform {

  /**
 * @class NmcliNetworkInformation
 * @brief First active uplink connection, once NM reports connectivity.
 *
 *  * The hotspot's own connection is never reported as the uplink.
 */
  class NmcliNetworkInformation : public NetworkInformation {
  public:
    NmcliNetworkInformation(io::CommandRunner& runner, std::string hotspotConnectionName, core::Logger& log);

    std::optional<ConnectionProfile> internetConnectionProfile() override;

  private:
    bool hasConnectivity();
    static bool isUplinkType(const std::string& type);

    io::CommandRunner& runner_;
    std::string hotspotConnection_;
    core::Logger& log_;
  };

} // namespace hotspot::platform
