#pragma once
/** @file  TetheringManager.hpp
 *  @brief Capability interface over the platform hotspot (tethering) service.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <future>
#include <memory>
#include <string>

// Hotspot headers
#include "platform/ConnectionProfile.hpp"

namespace hotspot {
  namespace platform {

    enum class TetheringState : std::uint8_t { Off, On, InTransition, Unknown };

    enum class TetheringOperationStatus : std::uint8_t {
      Success,
      Timeout,
      ActivationFailed,
      DeactivationFailed,
      ServiceUnavailable,
      NotFound,
      Unknown
    };

    inline const char* toString(TetheringState s) {
      switch (s) {
      case TetheringState::Off:
        return "Off";
      case TetheringState::On:
        return "On";
      case TetheringState::InTransition:
        return "InTransition";
      default:
        return "Unknown";
      }
    }

    inline const char* toString(TetheringOperationStatus s) {
      switch (s) {
      case TetheringOperationStatus::Success:
        return "Success";
      case TetheringOperationStatus::Timeout:
        return "Timeout";
      case TetheringOperationStatus::ActivationFailed:
        return "ActivationFailed";
      case TetheringOperationStatus::DeactivationFailed:
        return "DeactivationFailed";
      case TetheringOperationStatus::ServiceUnavailable:
        return "ServiceUnavailable";
      case TetheringOperationStatus::NotFound:
        return "NotFound";
      default:
        return "Unknown";
      }
    }

    struct TetheringOperationResult {
      TetheringOperationStatus status{ TetheringOperationStatus::Unknown };
      int nativeCode{ -1 };   ///< platform specific (nmcli exit code)
      std::string message{}; ///< platform diagnostic, may be empty

      bool ok() const { return status == TetheringOperationStatus::Success; }
    };

    /**
 * @class TetheringManager
 * @brief One tethering session bound to one internet connection profile.
 *
 *  * start/stop hand back operations; callers must await them.
 *  * Not reusable across toggle runs.
 */
    class TetheringManager {
    public:
      virtual ~TetheringManager() = default;

      virtual TetheringState operationalState() = 0;
      virtual std::future<TetheringOperationResult> startTethering() = 0;
      virtual std::future<TetheringOperationResult> stopTethering() = 0;
    };

    class TetheringManagerFactory {
    public:
      virtual ~TetheringManagerFactory() = default;

      virtual std::unique_ptr<TetheringManager> createFromProfile(const ConnectionProfile& profile) = 0;
    };

  } // namespace platform
} // namespace hotspot
