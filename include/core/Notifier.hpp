#pragma once
/** @file  Notifier.hpp
 *  @brief User-facing title/message sink for successful enable/disable.
 *
 *  © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <string>

#include "core/Logger.hpp"

namespace hotspot::core {

  class Notifier {
  public:
    virtual ~Notifier() = default;

    virtual void notify(const std::string& title, const std::string& message) = 0;
  };

  /// Used when desktop notifications are disabled: the pair becomes a log line.
  class LogNotifier : public Notifier {
  public:
    explicit LogNotifier(Logger& log) : log_{ log } {}

    void notify(const std::string& title, const std::string& message) override {
      log_.info(title + ": " + message);
    }

  private:
    Logger& log_;
  };

} // namespace hotspot::core
