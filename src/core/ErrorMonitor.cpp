/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault sink
 *
 * © 2026 hotspot-toggle contributors — MIT-licensed.
 */

#include <algorithm>
#include <utility>

#include "core/ErrorMonitor.hpp"

namespace hotspot {
  namespace core {
    ErrorMonitor::ErrorMonitor() = default;
    ErrorMonitor::~ErrorMonitor() = default;

    void ErrorMonitor::registerEscalation(Escalation cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(ErrorKind kind, const std::string& message) {
      Escalation cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        last_ = kind;
        if (!rememberIfNew(message))
          return;
        cb = escalation_;
      }
      // outside the lock, the callback may log or query us
      if (cb)
        cb(kind, message);
    }

    std::optional<ErrorKind> ErrorMonitor::lastFailure() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return last_;
    }

    std::size_t ErrorMonitor::uniqueFailures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    void ErrorMonitor::reset() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
      last_.reset();
    }

    bool ErrorMonitor::rememberIfNew(const std::string& message) {
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      return true;
    }
  } // namespace core
} // namespace hotspot
