#pragma once
/** @file  RadioController.hpp
 *  @brief Resolves the WiFi radio and drives its power state.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <memory>
#include <vector>

#include "core/Logger.hpp"
#include "platform/Radio.hpp"

namespace hotspot::core {

  using RadioHandle = std::shared_ptr<platform::Radio>;

  /**
 * @class RadioController
 * @brief Radio access on top of platform::RadioManager.
 *
 *  * Handles are snapshots; call `refresh()` before trusting `state()` again.
 *  * Every platform call is awaited through AsyncBridge.
 */
  class RadioController {
  public:
    RadioController(platform::RadioManager& radios, Logger& log);

    /// First WiFi radio in enumeration order. Throws RadioAccessDenied / RadioNotFound.
    RadioHandle findWifiRadio();

    /// @returns false if the platform refused the change; never throws for that.
    bool setState(const RadioHandle& handle, platform::RadioState target);

    /// Re-enumerate and re-resolve @p handle (same name, else first WiFi radio).
    RadioHandle refresh(const RadioHandle& handle);

  private:
    void requireAccess();
    std::vector<RadioHandle> enumerate();

    platform::RadioManager& radios_;
    Logger& log_;
  };

} // namespace hotspot::core
