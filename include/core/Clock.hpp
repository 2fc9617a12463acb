#pragma once
/** @file  Clock.hpp
 *  @brief Injectable sleep for settle delays and polling back-off.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <chrono>
#include <thread>

namespace hotspot::core {

  /**
 * @class Clock
 * @brief Every sleep in a toggle run goes through here so tests can run on
 *        simulated time.
 */
  class Clock {
  public:
    virtual ~Clock() = default;

    virtual void sleepFor(std::chrono::milliseconds d) = 0;
  };

  class SteadyClock : public Clock {
  public:
    void sleepFor(std::chrono::milliseconds d) override {
      if (d.count() > 0)
        std::this_thread::sleep_for(d);
    }
  };

} // namespace hotspot::core
