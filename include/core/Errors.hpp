#pragma once
/** @file  Errors.hpp
 *  @brief Failure taxonomy for a toggle run.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>
#include <string>

// Hotspot headers
#include "platform/TetheringManager.hpp"

namespace hotspot {
  namespace core {

    enum class ErrorKind : std::uint8_t {
      NoProfileFound,
      RadioAccessDenied,
      RadioNotFound,
      RadioCycleVerificationFailed,
      TetheringOperationFailed,
      AsyncBridgeUnavailable,
      PlatformFailure,
      Count
    };
    static_assert(static_cast<std::uint8_t>(ErrorKind::Count) == 7,
                  "ErrorKind count changed please update toString and the CLI exit codes");

    inline const char* toString(ErrorKind k) {
      switch (k) {
      case ErrorKind::NoProfileFound:
        return "NoProfileFound";
      case ErrorKind::RadioAccessDenied:
        return "RadioAccessDenied";
      case ErrorKind::RadioNotFound:
        return "RadioNotFound";
      case ErrorKind::RadioCycleVerificationFailed:
        return "RadioCycleVerificationFailed";
      case ErrorKind::TetheringOperationFailed:
        return "TetheringOperationFailed";
      case ErrorKind::AsyncBridgeUnavailable:
        return "AsyncBridgeUnavailable";
      case ErrorKind::PlatformFailure:
        return "PlatformFailure";
      default:
        return "Unknown";
      }
    }

    /**
 * @class HotspotError
 * @brief Base for every failure raised inside a toggle run.
 *
 *  * Caught at the HotspotOrchestrator boundary and turned into `false`.
 */
    class HotspotError : public std::runtime_error {
    public:
      HotspotError(ErrorKind kind, const std::string& what)
          : std::runtime_error(what), kind_{ kind } {}

      ErrorKind kind() const noexcept { return kind_; }

    private:
      ErrorKind kind_;
    };

    /// Profile wait budget exhausted.
    class NoProfileFound : public HotspotError {
    public:
      explicit NoProfileFound(const std::string& what)
          : HotspotError(ErrorKind::NoProfileFound, what) {}
    };

    class RadioAccessDenied : public HotspotError {
    public:
      explicit RadioAccessDenied(const std::string& what)
          : HotspotError(ErrorKind::RadioAccessDenied, what) {}
    };

    class RadioNotFound : public HotspotError {
    public:
      explicit RadioNotFound(const std::string& what)
          : HotspotError(ErrorKind::RadioNotFound, what) {}
    };

    /// Radio still reads On after the tethering start/stop cycle.
    class RadioCycleVerificationFailed : public HotspotError {
    public:
      explicit RadioCycleVerificationFailed(const std::string& what)
          : HotspotError(ErrorKind::RadioCycleVerificationFailed, what) {}
    };

    class TetheringOperationFailed : public HotspotError {
    public:
      TetheringOperationFailed(const std::string& what, platform::TetheringOperationStatus status)
          : HotspotError(ErrorKind::TetheringOperationFailed, what), status_{ status } {}

      platform::TetheringOperationStatus status() const noexcept { return status_; }

    private:
      platform::TetheringOperationStatus status_;
    };

    /// The platform handed back no operation to wait on.
    class AsyncBridgeUnavailable : public HotspotError {
    public:
      explicit AsyncBridgeUnavailable(const std::string& what)
          : HotspotError(ErrorKind::AsyncBridgeUnavailable, what) {}
    };

    class PlatformFailure : public HotspotError {
    public:
      explicit PlatformFailure(const std::string& what)
          : HotspotError(ErrorKind::PlatformFailure, what) {}
    };

  } // namespace core
} // namespace hotspot
