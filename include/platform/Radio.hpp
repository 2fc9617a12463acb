#pragma once
/** @file  Radio.hpp
 *  @brief Capability interface over the platform radio list (WiFi, WWAN, ...).
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace hotspot {
  namespace platform {

    enum class RadioKind : std::uint8_t { WiFi, MobileBroadband, Bluetooth, Other };
    enum class RadioState : std::uint8_t { On, Off, Unknown };
    enum class RadioAccessStatus : std::uint8_t { Allowed, DeniedByUser, DeniedBySystem, Unspecified };

    inline const char* toString(RadioState s) {
      switch (s) {
      case RadioState::On:
        return "On";
      case RadioState::Off:
        return "Off";
      default:
        return "Unknown";
      }
    }

    inline const char* toString(RadioAccessStatus s) {
      switch (s) {
      case RadioAccessStatus::Allowed:
        return "Allowed";
      case RadioAccessStatus::DeniedByUser:
        return "DeniedByUser";
      case RadioAccessStatus::DeniedBySystem:
        return "DeniedBySystem";
      default:
        return "Unspecified";
      }
    }

    /**
 * @class Radio
 * @brief Snapshot of one transceiver taken at enumeration time.
 *
 *  * `state()` is not live: re-enumerate after anything that may change it.
 */
    class Radio {
    public:
      virtual ~Radio() = default;

      virtual std::string name() const = 0;
      virtual RadioKind kind() const = 0;
      virtual RadioState state() const = 0;

      virtual std::future<RadioAccessStatus> setState(RadioState target) = 0;
    };

    class RadioManager {
    public:
      virtual ~RadioManager() = default;

      virtual std::future<RadioAccessStatus> requestAccess() = 0;
      virtual std::future<std::vector<std::shared_ptr<Radio>>> enumerate() = 0;
    };

  } // namespace platform
} // namespace hotspot
