#pragma once
/** @file  AdapterController.hpp
 *  @brief Full adapter restart, used only by the power-cycle policy.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include "core/WifiAdapter.hpp"

namespace hotspot::platform {

  class AdapterController {
  public:
    virtual ~AdapterController() = default;

    /// @returns false if the adapter could not be brought down and up again.
    virtual bool restart(const core::WifiAdapter& adapter) = 0;
  };

} // namespace hotspot::platform
