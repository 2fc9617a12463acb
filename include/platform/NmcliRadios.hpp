#pragma once
/** @file  NmcliRadios.hpp
 *  @brief RadioManager over `nmcli radio` (WiFi + WWAN kill switches).
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/Logger.hpp"
#include "io/CommandRunner.hpp"
#include "platform/Radio.hpp"

namespace hotspot::platform {

  /**
 * @class NmcliRadio
 * @brief One `nmcli radio <wifi|wwan>` switch as seen at enumeration time.
 *
 *  * Reads On only when both the hardware and software switch are enabled.
 */
  class NmcliRadio : public Radio {
  public:
    NmcliRadio(io::CommandRunner& runner, std::string name, RadioKind kind, RadioState state, core::Logger& log);

    std::string name() const override { return name_; }
    RadioKind kind() const override { return kind_; }
    RadioState state() const override { return state_; }

    std::future<RadioAccessStatus> setState(RadioState target) override;

  private:
    io::CommandRunner& runner_;
    std::string name_; ///< nmcli radio keyword: "wifi" or "wwan"
    RadioKind kind_;
    RadioState state_;
    core::Logger& log_;
  };

  class NmcliRadioManager : public RadioManager {
  public:
    NmcliRadioManager(io::CommandRunner& runner, core::Logger& log);

    std::future<RadioAccessStatus> requestAccess() override;
    std::future<std::vector<std::shared_ptr<Radio>>> enumerate() override;

    /// "enabled"/"disabled"/"missing" pair → state; nullopt when the hardware is absent.
    static std::optional<RadioState> combine(const std::string& hw, const std::string& sw);

  private:
    RadioAccessStatus queryAccess();
    std::vector<std::shared_ptr<Radio>> queryRadios();

    io::CommandRunner& runner_;
    core::Logger& log_;
  };

} // namespace hotspot::platform
