#pragma once
/** @file  ConnectionProfile.hpp
 *  @brief The connection currently carrying the default internet route.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <optional>
#include <string>

namespace hotspot {
  namespace platform {

    struct ConnectionProfile {
      std::string name;
      std::string uuid;
      std::string type;   ///< e.g. 802-3-ethernet, 802-11-wireless, gsm
      std::string device; ///< interface carrying it
    };

    /**
 * @class NetworkInformation
 * @brief Answers "which profile reaches the internet right now?".
 *
 *  * Returns std::nullopt while nothing is connected (typical at boot).
 */
    class NetworkInformation {
    public:
      virtual ~NetworkInformation() = default;

      virtual std::optional<ConnectionProfile> internetConnectionProfile() = 0;
    };

  } // namespace platform
} // namespace hotspot
