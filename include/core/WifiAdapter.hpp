#pragma once
/** @file  WifiAdapter.hpp
 *  @brief Resolved adapter identity handed to the orchestrator.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <string>

namespace hotspot::core {

  struct WifiAdapter {
    std::string name;        ///< interface name, e.g. wlan0
    std::string description; ///< vendor/product string, may be empty
  };

} // namespace hotspot::core
