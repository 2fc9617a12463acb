#pragma once

/** @file  HotspotOrchestrator.hpp
 *  @brief Public API for hotspot::core::HotspotOrchestrator, the toggle state machine.
 *
 *  © 2026 hotspot-toggle contributors — licensed under MIT.
 */

#include <string>

#include "core/Clock.hpp"
#include "core/ConnectionProfileWaiter.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/HotspotConfig.hpp"
#include "core/Logger.hpp"
#include "core/Notifier.hpp"
#include "core/RadioController.hpp"
#include "core/TetheringController.hpp"
#include "core/WifiAdapter.hpp"
#include "platform/AdapterController.hpp"

namespace hotspot {
  namespace core {

    /**
 * @class HotspotOrchestrator
 * @brief Flips the hotspot: on → off, or off → (radio cycle) → on.
 *
 *  * Runs synchronously on the caller's thread; one run in flight at a time.
 *  * Owns no platform objects between runs, every handle is re-acquired.
 *  * Never throws out of `toggleHotspot()`; failures come back as `false`.
 *  * Each run starts with a clean ErrorMonitor, so `lastFailure()` describes
 *    only the latest run.
 */
    class HotspotOrchestrator {

    public:
      enum class State {
        CheckingState,
        StoppingHotspot,
        WaitingForProfile,
        CyclingRadio,
        StartingHotspot,
        Done,
        Failed
      };

      struct Collaborators {
        ConnectionProfileWaiter& profiles;
        RadioController& radios;
        TetheringController& tethering;
        platform::AdapterController& adapters;
        Clock& clock;
        Logger& log;
        Notifier& notifier;
        ErrorMonitor& errors;
      };

      HotspotOrchestrator(const HotspotConfig& config, Collaborators deps);
      ~HotspotOrchestrator() = default;

      // ---- public API ----------------------------------------------------------
      bool toggleHotspot(const WifiAdapter& adapter);

      State state() const { return currentState_; }

    private:
      bool runToggle(const WifiAdapter& adapter);

      bool stopHotspot(const TetheringHandle& tethering);
      void cycleRadio(const WifiAdapter& adapter, const TetheringHandle& tethering);
      void forceRadioOffViaTethering(const TetheringHandle& tethering);
      void powerCycleRadio(const WifiAdapter& adapter);
      bool startHotspot(const TetheringHandle& tethering);
      void requireSuccess(const platform::TetheringOperationResult& result, const char* step);

      void fail(ErrorKind kind, const std::string& reason);
      void notifySafely(const std::string& title, const std::string& message);
      void transitionTo(State next);

      const HotspotConfig& config_;
      Collaborators deps_;
      State currentState_{ State::Done };
    };

    const char* toString(HotspotOrchestrator::State s);

  } // namespace core
} // namespace hotspot
