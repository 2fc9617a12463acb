#pragma once
/** @file  DesktopNotifier.hpp
 *  @brief notify-send backed Notifier.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include "core/Logger.hpp"
#include "core/Notifier.hpp"
#include "io/CommandRunner.hpp"

namespace hotspot::io {

  class DesktopNotifier : public core::Notifier {
  public:
    DesktopNotifier(CommandRunner& runner, core::Logger& log) : runner_{ runner }, log_{ log } {}

    /// Best effort; a missing notification daemon only produces a warning.
    void notify(const std::string& title, const std::string& message) override;

  private:
    CommandRunner& runner_;
    core::Logger& log_;
  };

} // namespace hotspot::io
