#pragma once
/** @file  NmcliTethering.hpp
 *  @brief TetheringManager on top of `nmcli device wifi hotspot`.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <memory>
#include <string>
#include <vector>

#include "core/HotspotConfig.hpp"
#include "core/Logger.hpp"
#include "core/WifiAdapter.hpp"
#include "io/CommandRunner.hpp"
#include "platform/TetheringManager.hpp"

namespace hotspot::platform {

  /**
 * @class NmcliTetheringManager
 * @brief Hotspot = one NM connection (default "Hotspot") on the WiFi adapter.
 *
 *  * start/stop run nmcli on a worker thread via std::async.
 *  * State comes from the active connection list, never cached.
 */
  class NmcliTetheringManager : public TetheringManager {
  public:
    NmcliTetheringManager(io::CommandRunner& runner, ConnectionProfile uplink, core::WifiAdapter adapter,
                          core::HotspotSettings settings, core::Logger& log);

    TetheringState operationalState() override;
    std::future<TetheringOperationResult> startTethering() override;
    std::future<TetheringOperationResult> stopTethering() override;

    const ConnectionProfile& uplink() const { return uplink_; }

  private:
    TetheringOperationResult runOperation(const std::vector<std::string>& argv);

    io::CommandRunner& runner_;
    ConnectionProfile uplink_;
    core::WifiAdapter adapter_;
    core::HotspotSettings settings_;
    core::Logger& log_;
  };

  class NmcliTetheringManagerFactory : public TetheringManagerFactory {
  public:
    NmcliTetheringManagerFactory(io::CommandRunner& runner, core::WifiAdapter adapter,
                                 core::HotspotSettings settings, core::Logger& log);

    std::unique_ptr<TetheringManager> createFromProfile(const ConnectionProfile& profile) override;

  private:
    io::CommandRunner& runner_;
    core::WifiAdapter adapter_;
    core::HotspotSettings settings_;
    core::Logger& log_;
  };

} // namespace hotspot::platform
