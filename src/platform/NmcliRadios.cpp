/* @file NmcliRadios.cpp
 * @brief nmcli radio enumeration, permission check and switching
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

// STL headers
#include <future>
#include <utility>

// Hotspot headers
#include "core/Errors.hpp"
#include "platform/NmcliOutput.hpp"
#include "platform/NmcliRadios.hpp"

using namespace hotspot::platform;

namespace {
  constexpr const char* kWifiPermission = "org.freedesktop.NetworkManager.enable-disable-wifi";
}

NmcliRadio::NmcliRadio(io::CommandRunner& runner, std::string name, RadioKind kind, RadioState state,
                       core::Logger& log)
    : runner_{ runner }, name_{ std::move(name) }, kind_{ kind }, state_{ state }, log_{ log } {}

std::future<RadioAccessStatus> NmcliRadio::setState(RadioState target) {
  if (target == RadioState::Unknown) {
    std::promise<RadioAccessStatus> refused;
    refused.set_value(RadioAccessStatus::Unspecified);
    return refused.get_future();
  }

  const std::string onOff = target == RadioState::On ? "on" : "off";
  return std::async(std::launch::async, [this, onOff] {
    const auto result = runner_.run({ "nmcli", "radio", name_, onOff });
    if (!result.ok()) {
      log_.debug("[NmcliRadio] nmcli radio " + name_ + " " + onOff + " exited " +
                 std::to_string(result.exitCode) + ": " + nmcli::trim(result.output));
      return RadioAccessStatus::DeniedBySystem;
    }
    return RadioAccessStatus::Allowed;
  });
}

NmcliRadioManager::NmcliRadioManager(io::CommandRunner& runner, core::Logger& log)
    : runner_{ runner }, log_{ log } {}

std::optional<RadioState> NmcliRadioManager::combine(const std::string& hw, const std::string& sw) {
  if (hw == "missing")
    return std::nullopt;
  if (hw == "enabled" && sw == "enabled")
    return RadioState::On;
  if ((hw == "enabled" || hw == "disabled") && (sw == "enabled" || sw == "disabled"))
    return RadioState::Off;
  return RadioState::Unknown;
}

RadioAccessStatus NmcliRadioManager::queryAccess() {
  const auto result = runner_.run({ "nmcli", "-t", "-f", "PERMISSION,VALUE", "general", "permissions" });
  if (!result.ok()) {
    log_.warn("[NmcliRadioManager] permission query exited " + std::to_string(result.exitCode));
    return RadioAccessStatus::Unspecified;
  }

  for (const auto& line : nmcli::lines(result.output)) {
    const auto fields = nmcli::splitFields(line);
    if (fields.size() < 2 || fields[0] != kWifiPermission)
      continue;
    // "auth" means polkit will prompt, which is still a yes for our purposes
    if (fields[1] == "yes" || fields[1] == "auth")
      return RadioAccessStatus::Allowed;
    if (fields[1] == "no")
      return RadioAccessStatus::DeniedBySystem;
    return RadioAccessStatus::Unspecified;
  }
  return RadioAccessStatus::Unspecified;
}

std::vector<std::shared_ptr<Radio>> NmcliRadioManager::queryRadios() {
  const auto result = runner_.run({ "nmcli", "-t", "-f", "WIFI-HW,WIFI,WWAN-HW,WWAN", "radio" });
  if (!result.ok())
    throw core::PlatformFailure("[NmcliRadioManager] nmcli radio exited " + std::to_string(result.exitCode));

  const auto rows = nmcli::lines(result.output);
  const auto fields = rows.empty() ? std::vector<std::string>{} : nmcli::splitFields(rows.front());
  if (fields.size() < 4)
    throw core::PlatformFailure("[NmcliRadioManager] unexpected nmcli radio output: '" + nmcli::trim(result.output) + "'");

  std::vector<std::shared_ptr<Radio>> radios;
  if (auto wifi = combine(fields[0], fields[1]))
    radios.push_back(std::make_shared<NmcliRadio>(runner_, "wifi", RadioKind::WiFi, *wifi, log_));
  if (auto wwan = combine(fields[2], fields[3]))
    radios.push_back(std::make_shared<NmcliRadio>(runner_, "wwan", RadioKind::MobileBroadband, *wwan, log_));
  return radios;
}

std::future<RadioAccessStatus> NmcliRadioManager::requestAccess() {
  return std::async(std::launch::async, [this] { return queryAccess(); });
}

std::future<std::vector<std::shared_ptr<Radio>>> NmcliRadioManager::enumerate() {
  return std::async(std::launch::async, [this] { return queryRadios(); });
}
