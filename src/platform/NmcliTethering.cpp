/* @file NmcliTethering.cpp
 * @brief nmcli hotspot start/stop/state
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

// STL headers
#include <future>
#include <utility>
#include <vector>

// Hotspot headers
#include "core/Errors.hpp"
#include "platform/NmcliOutput.hpp"
#include "platform/NmcliTethering.hpp"

using namespace hotspot::platform;

NmcliTetheringManager::NmcliTetheringManager(io::CommandRunner& runner, ConnectionProfile uplink,
                                             core::WifiAdapter adapter, core::HotspotSettings settings,
                                             core::Logger& log)
    : runner_{ runner }, uplink_{ std::move(uplink) }, adapter_{ std::move(adapter) },
      settings_{ std::move(settings) }, log_{ log } {}

TetheringState NmcliTetheringManager::operationalState() {
  const auto result = runner_.run({ "nmcli", "-t", "-f", "NAME,STATE", "connection", "show", "--active" });
  if (!result.ok())
    throw core::PlatformFailure("[NmcliTethering] cannot list active connections (exit " +
                                std::to_string(result.exitCode) + ")");

  for (const auto& line : nmcli::lines(result.output)) {
    const auto fields = nmcli::splitFields(line);
    if (fields.size() < 2 || fields[0] != settings_.connectionName)
      continue;
    if (fields[1] == "activated")
      return TetheringState::On;
    if (fields[1] == "activating" || fields[1] == "deactivating")
      return TetheringState::InTransition;
    return TetheringState::Unknown;
  }
  return TetheringState::Off;
}

TetheringOperationResult NmcliTetheringManager::runOperation(const std::vector<std::string>& argv) {
  const auto result = runner_.run(argv);

  TetheringOperationResult op;
  op.nativeCode = result.exitCode;
  op.status = nmcli::statusFromExitCode(result.exitCode);
  if (!op.ok())
    op.message = nmcli::trim(result.output);
  return op;
}

std::future<TetheringOperationResult> NmcliTetheringManager::startTethering() {
  std::vector<std::string> argv{ "nmcli",          "device", "wifi", "hotspot", "ifname", adapter_.name,
                                 "con-name",       settings_.connectionName };
  if (!settings_.ssid.empty()) {
    argv.push_back("ssid");
    argv.push_back(settings_.ssid);
  }
  if (!settings_.password.empty()) {
    argv.push_back("password");
    argv.push_back(settings_.password);
  }

  log_.debug("[NmcliTethering] starting '" + settings_.connectionName + "' on " + adapter_.name + " sharing '" +
             uplink_.name + "'");
  return std::async(std::launch::async, [this, argv = std::move(argv)] { return runOperation(argv); });
}

std::future<TetheringOperationResult> NmcliTetheringManager::stopTethering() {
  log_.debug("[NmcliTethering] stopping '" + settings_.connectionName + "'");
  std::vector<std::string> argv{ "nmcli", "connection", "down", settings_.connectionName };
  return std::async(std::launch::async, [this, argv = std::move(argv)] { return runOperation(argv); });
}

NmcliTetheringManagerFactory::NmcliTetheringManagerFactory(io::CommandRunner& runner, core::WifiAdapter adapter,
                                                           core::HotspotSettings settings, core::Logger& log)
    : runner_{ runner }, adapter_{ std::move(adapter) }, settings_{ std::move(settings) }, log_{ log } {}

std::unique_ptr<TetheringManager> NmcliTetheringManagerFactory::createFromProfile(const ConnectionProfile& profile) {
  return std::make_unique<NmcliTetheringManager>(runner_, profile, adapter_, settings_, log_);
}
