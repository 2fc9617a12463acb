#pragma once
/** @file  HotspotConfig.hpp
 *  @brief Immutable run-time settings, built once at process start.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <string>

#include "core/Logger.hpp"
#include "core/RetryBudget.hpp"
#include "core/WifiAdapter.hpp"

namespace hotspot::core {

  /**
 * @enum RadioCyclePolicy
 * @brief How the radio is cycled before tethering is started.
 *
 *  * TetheringDance: only when the radio reads On, start then stop tethering
 *    and require the refreshed radio to read Off.
 *  * PowerCycle: always radio Off, wait, radio On, wait (+ optional adapter restart).
 */
  enum class RadioCyclePolicy : std::uint8_t { TetheringDance, PowerCycle };

  inline const char* toString(RadioCyclePolicy p) {
    switch (p) {
    case RadioCyclePolicy::TetheringDance:
      return "tethering-dance";
    case RadioCyclePolicy::PowerCycle:
      return "power-cycle";
    default:
      return "unknown";
    }
  }

  struct HotspotSettings {
    std::string connectionName{ "Hotspot" };
    std::string ssid{};     ///< empty: platform default
    std::string password{}; ///< empty: platform generated
  };

  struct RadioCycleSettings {
    RadioCyclePolicy policy{ RadioCyclePolicy::PowerCycle };
    std::chrono::milliseconds settle{ 2000 };   ///< dance: after start and after stop
    std::chrono::milliseconds offDelay{ 2000 }; ///< power-cycle: radio held off
    std::chrono::milliseconds onSettle{ 6000 }; ///< power-cycle: after radio on
    bool restartAdapter{ false };
    std::chrono::milliseconds adapterRestartSettle{ 5000 };
  };

  struct HotspotConfig {
    WifiAdapter adapter{};
    HotspotSettings hotspot{};
    RetryBudget profileWait{};
    RadioCycleSettings radioCycle{};

    std::string logFile{}; ///< empty: stderr only
    Severity minSeverity{ Severity::Info };
    bool notificationsEnabled{ true };
  };

} // namespace hotspot::core
