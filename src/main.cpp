/* @file main.cpp
 * @brief hotspot-toggle CLI: wire the nmcli backend into the orchestrator and map the outcome to an exit code
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

// Hotspot headers
#include "core/Clock.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ConnectionProfileWaiter.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/HotspotOrchestrator.hpp"
#include "core/Logger.hpp"
#include "core/Notifier.hpp"
#include "core/RadioController.hpp"
#include "core/TetheringController.hpp"
#include "io/CommandRunner.hpp"
#include "io/DesktopNotifier.hpp"
#include "io/FileLogger.hpp"
#include "platform/NmcliAdapters.hpp"
#include "platform/NmcliNetworkInformation.hpp"
#include "platform/NmcliRadios.hpp"
#include "platform/NmcliTethering.hpp"

using namespace hotspot;

namespace {

  enum ExitCode : int {
    kToggled = 0,
    kFailed = 1,
    kUsage = 2,
    kNoProfile = 3,
    kNoRadio = 4,
    kRadioCycle = 5,
    kTethering = 6,
    kPlatform = 7
  };

  struct Options {
    std::string configPath;
    std::string adapter;
    bool verbose{ false };
  };

  void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [--config <path>] [--adapter <ifname>] [--verbose]\n";
  }

  std::optional<Options> parseArgs(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
        opts.configPath = argv[++i];
      } else if ((arg == "--adapter" || arg == "-a") && i + 1 < argc) {
        opts.adapter = argv[++i];
      } else if (arg == "--verbose" || arg == "-v") {
        opts.verbose = true;
      } else {
        return std::nullopt;
      }
    }
    return opts;
  }

  int exitCodeFor(std::optional<core::ErrorKind> kind) {
    if (!kind)
      return kFailed;
    switch (*kind) {
    case core::ErrorKind::NoProfileFound:
      return kNoProfile;
    case core::ErrorKind::RadioAccessDenied:
    case core::ErrorKind::RadioNotFound:
      return kNoRadio;
    case core::ErrorKind::RadioCycleVerificationFailed:
      return kRadioCycle;
    case core::ErrorKind::TetheringOperationFailed:
      return kTethering;
    case core::ErrorKind::AsyncBridgeUnavailable:
    case core::ErrorKind::PlatformFailure:
      return kPlatform;
    default:
      return kFailed;
    }
  }

} // namespace

int main(int argc, char** argv) {
  const auto opts = parseArgs(argc, argv);
  if (!opts) {
    usage(argv[0]);
    return kUsage;
  }

  core::HotspotConfig config;
  try {
    if (!opts->configPath.empty())
      config = core::ConfigLoader(opts->configPath).loadConfig();
  } catch (const std::exception& e) {
    std::cerr << "configuration error: " << e.what() << "\n";
    return kUsage;
  }
  if (!opts->adapter.empty())
    config.adapter.name = opts->adapter;

  core::Logger log;
  log.setMinSeverity(opts->verbose ? core::Severity::Debug : config.minSeverity);
  if (!config.logFile.empty()) {
    auto file = std::make_shared<io::FileLogger>();
    if (file->open(config.logFile))
      log.attachFile(file);
    else
      log.warn("could not open log file " + config.logFile + ", logging to stderr only");
  }

  core::ErrorMonitor errors;
  errors.registerEscalation([&log](core::ErrorKind kind, const std::string&) {
    log.debug(std::string("[main] recorded failure ") + core::toString(kind));
  });

  io::CommandRunner runner;

  core::WifiAdapter adapter;
  try {
    adapter = platform::NmcliAdapterResolver(runner, log).resolve(config.adapter.name);
    if (!config.adapter.description.empty())
      adapter.description = config.adapter.description;
  } catch (const core::HotspotError& e) {
    log.error(e.what());
    return exitCodeFor(e.kind());
  }

  core::SteadyClock clock;
  platform::NmcliNetworkInformation network(runner, config.hotspot.connectionName, log);
  platform::NmcliTetheringManagerFactory tetheringFactory(runner, adapter, config.hotspot, log);
  platform::NmcliRadioManager radioManager(runner, log);
  platform::NmcliAdapterController adapterController(runner, log);

  std::unique_ptr<core::Notifier> notifier;
  if (config.notificationsEnabled)
    notifier = std::make_unique<io::DesktopNotifier>(runner, log);
  else
    notifier = std::make_unique<core::LogNotifier>(log);

  core::ConnectionProfileWaiter profiles(network, clock, log);
  core::RadioController radios(radioManager, log);
  core::TetheringController tethering(tetheringFactory, log);

  log.debug(std::string("[main] radio cycle policy: ") + core::toString(config.radioCycle.policy));

  core::HotspotOrchestrator orchestrator(
      config, { profiles, radios, tethering, adapterController, clock, log, *notifier, errors });

  if (orchestrator.toggleHotspot(adapter))
    return kToggled;
  return exitCodeFor(errors.lastFailure());
}
