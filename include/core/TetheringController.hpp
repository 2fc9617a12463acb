#pragma once
/** @file  TetheringController.hpp
 *  @brief Blocking start/stop/state over platform::TetheringManager.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <memory>

#include "core/Logger.hpp"
#include "platform/TetheringManager.hpp"

namespace hotspot::core {

  using TetheringHandle = std::unique_ptr<platform::TetheringManager>;

  class TetheringController {
  public:
    TetheringController(platform::TetheringManagerFactory& factory, Logger& log);

    /// Only ever called with a profile that is actually present.
    TetheringHandle fromProfile(const platform::ConnectionProfile& profile);

    /// Only ever `On` or `Off`: `Off` strictly when the platform says so,
    /// `InTransition` and `Unknown` fold into `On`.
    platform::TetheringState operationalState(const TetheringHandle& handle);

    platform::TetheringOperationResult start(const TetheringHandle& handle);
    platform::TetheringOperationResult stop(const TetheringHandle& handle);

  private:
    platform::TetheringManagerFactory& factory_;
    Logger& log_;
  };

} // namespace hotspot::core
