/* @file HotspotOrchestrator.cpp
 * @brief toggle FSM: check state, stop, or wait/cycle/start
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

// STL headers
#include <exception>
#include <string>

// Hotspot headers
#include "core/Errors.hpp"
#include "core/HotspotOrchestrator.hpp"

using namespace hotspot::core;
using hotspot::platform::RadioState;
using hotspot::platform::TetheringState;

namespace {
  constexpr const char* kNotifyTitle = "Mobile Hotspot";
}

const char* hotspot::core::toString(HotspotOrchestrator::State s) {
  using State = HotspotOrchestrator::State;
  switch (s) {
  case State::CheckingState:
    return "CheckingState";
  case State::StoppingHotspot:
    return "StoppingHotspot";
  case State::WaitingForProfile:
    return "WaitingForProfile";
  case State::CyclingRadio:
    return "CyclingRadio";
  case State::StartingHotspot:
    return "StartingHotspot";
  case State::Done:
    return "Done";
  case State::Failed:
    return "Failed";
  default:
    return "Unknown";
  }
}

HotspotOrchestrator::HotspotOrchestrator(const HotspotConfig& config, Collaborators deps)
    : config_{ config }, deps_{ deps } {}

bool HotspotOrchestrator::toggleHotspot(const WifiAdapter& adapter) {
  deps_.log.info("[HotspotOrchestrator] toggling hotspot on '" + adapter.name + "'" +
                 (adapter.description.empty() ? "" : " (" + adapter.description + ")"));
  deps_.errors.reset();
  try {
    return runToggle(adapter);
  } catch (const HotspotError& e) {
    fail(e.kind(), e.what());
  } catch (const std::exception& e) {
    fail(ErrorKind::PlatformFailure, e.what());
  }
  return false;
}

bool HotspotOrchestrator::runToggle(const WifiAdapter& adapter) {
  transitionTo(State::CheckingState);

  // the tethering manager can only be built from a live profile
  const auto profile = deps_.profiles.waitForInternetProfile(config_.profileWait);
  const TetheringHandle tethering = deps_.tethering.fromProfile(profile);

  const TetheringState current = deps_.tethering.operationalState(tethering);
  deps_.log.info(std::string("[HotspotOrchestrator] hotspot is ") + platform::toString(current));

  if (current == TetheringState::On) {
    transitionTo(State::StoppingHotspot);
    return stopHotspot(tethering);
  }

  // profile was established above, nothing left to wait for
  transitionTo(State::WaitingForProfile);

  transitionTo(State::CyclingRadio);
  cycleRadio(adapter, tethering);

  transitionTo(State::StartingHotspot);
  return startHotspot(tethering);
}

bool HotspotOrchestrator::stopHotspot(const TetheringHandle& tethering) {
  const auto result = deps_.tethering.stop(tethering);
  if (!result.ok()) {
    fail(ErrorKind::TetheringOperationFailed,
         std::string("[HotspotOrchestrator] failed to disable hotspot: ") + platform::toString(result.status) +
             (result.message.empty() ? "" : " - " + result.message));
    return false;
  }

  transitionTo(State::Done);
  deps_.log.info("[HotspotOrchestrator] hotspot disabled");
  notifySafely(kNotifyTitle, "Hotspot disabled");
  return true;
}

void HotspotOrchestrator::cycleRadio(const WifiAdapter& adapter, const TetheringHandle& tethering) {
  switch (config_.radioCycle.policy) {
  case RadioCyclePolicy::TetheringDance:
    forceRadioOffViaTethering(tethering);
    break;
  case RadioCyclePolicy::PowerCycle:
    powerCycleRadio(adapter);
    break;
  }
}

void HotspotOrchestrator::forceRadioOffViaTethering(const TetheringHandle& tethering) {
  RadioHandle radio = deps_.radios.findWifiRadio();
  if (radio->state() != RadioState::On) {
    deps_.log.info(std::string("[HotspotOrchestrator] radio is ") + platform::toString(radio->state()) +
                   ", no cycle needed");
    return;
  }

  deps_.log.info("[HotspotOrchestrator] radio is On, forcing it off through a tethering start/stop");
  requireSuccess(deps_.tethering.start(tethering), "cycle start");
  deps_.clock.sleepFor(config_.radioCycle.settle);

  requireSuccess(deps_.tethering.stop(tethering), "cycle stop");
  deps_.clock.sleepFor(config_.radioCycle.settle);

  // tethering side effects may have re-created the radio; never trust the old handle
  radio = deps_.radios.refresh(radio);
  if (radio->state() != RadioState::Off)
    throw RadioCycleVerificationFailed(std::string("[HotspotOrchestrator] radio still ") +
                                       platform::toString(radio->state()) + " after tethering cycle");

  deps_.log.info("[HotspotOrchestrator] radio verified Off");
}

void HotspotOrchestrator::powerCycleRadio(const WifiAdapter& adapter) {
  RadioHandle radio = deps_.radios.findWifiRadio();

  deps_.log.info("[HotspotOrchestrator] power cycling WiFi radio '" + radio->name() + "'");
  if (!deps_.radios.setState(radio, RadioState::Off))
    deps_.log.warn("[HotspotOrchestrator] radio refused to switch Off");
  deps_.clock.sleepFor(config_.radioCycle.offDelay);

  radio = deps_.radios.refresh(radio);
  if (!deps_.radios.setState(radio, RadioState::On))
    deps_.log.warn("[HotspotOrchestrator] radio refused to switch On");
  deps_.clock.sleepFor(config_.radioCycle.onSettle);

  if (!config_.radioCycle.restartAdapter)
    return;

  deps_.log.info("[HotspotOrchestrator] restarting adapter '" + adapter.name + "'");
  if (!deps_.adapters.restart(adapter))
    deps_.log.warn("[HotspotOrchestrator] adapter restart failed, continuing");
  deps_.clock.sleepFor(config_.radioCycle.adapterRestartSettle);
}

bool HotspotOrchestrator::startHotspot(const TetheringHandle& tethering) {
  requireSuccess(deps_.tethering.start(tethering), "failed to enable hotspot");

  transitionTo(State::Done);
  deps_.log.info("[HotspotOrchestrator] hotspot enabled");
  notifySafely(kNotifyTitle, "Hotspot enabled");
  return true;
}

void HotspotOrchestrator::requireSuccess(const platform::TetheringOperationResult& result, const char* step) {
  if (result.ok())
    return;
  throw TetheringOperationFailed(std::string("[HotspotOrchestrator] ") + step + ": " +
                                     platform::toString(result.status) + " (code " +
                                     std::to_string(result.nativeCode) + ")" +
                                     (result.message.empty() ? "" : " - " + result.message),
                                 result.status);
}

void HotspotOrchestrator::fail(ErrorKind kind, const std::string& reason) {
  transitionTo(State::Failed);
  deps_.log.error(reason);
  deps_.errors.notifyFailure(kind, reason);
}

void HotspotOrchestrator::notifySafely(const std::string& title, const std::string& message) {
  try {
    deps_.notifier.notify(title, message);
  } catch (const std::exception& e) {
    deps_.log.warn(std::string("[HotspotOrchestrator] notification failed: ") + e.what());
  }
}

void HotspotOrchestrator::transitionTo(State next) {
  deps_.log.debug(std::string("[HotspotOrchestrator] ") + toString(currentState_) + " -> " + toString(next));
  currentState_ = next;
}
