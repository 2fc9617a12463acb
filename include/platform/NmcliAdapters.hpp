#pragma once
/** @file  NmcliAdapters.hpp
 *  @brief Adapter lookup and restart through nmcli.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <string>

#include "core/Logger.hpp"
#include "core/WifiAdapter.hpp"
#include "io/CommandRunner.hpp"
#include "platform/AdapterController.hpp"

namespace hotspot::platform {

  class NmcliAdapterController : public AdapterController {
  public:
    NmcliAdapterController(io::CommandRunner& runner, core::Logger& log) : runner_{ runner }, log_{ log } {}

    /// `nmcli device disconnect` then `nmcli device connect`.
    bool restart(const core::WifiAdapter& adapter) override;

  private:
    io::CommandRunner& runner_;
    core::Logger& log_;
  };

  /**
 * @class NmcliAdapterResolver
 * @brief Turns a configured interface name (or nothing) into a WifiAdapter.
 *
 *  * Throws core::PlatformFailure when no matching wifi device exists.
 */
  class NmcliAdapterResolver {
  public:
    NmcliAdapterResolver(io::CommandRunner& runner, core::Logger& log) : runner_{ runner }, log_{ log } {}

    core::WifiAdapter resolve(const std::string& preferredName);

  private:
    std::string describe(const std::string& ifname);

    io::CommandRunner& runner_;
    core::Logger& log_;
  };

} // namespace hotspot::platform
