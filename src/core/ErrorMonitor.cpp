/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault log with optional escalation hook
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>

// cloneflow headers
#include "core/ErrorMonitor.hpp"

namespace cloneflow {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      if (!markSeen(message))
        return;

      std::cerr << "[ErrorMonitor] " << message << '\n';

      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        cb = escalation_;
      }
      // invoked outside the lock so the callback may report again
      if (cb)
        cb(message);
    }

    void ErrorMonitor::clearSeen() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
    }

    std::size_t ErrorMonitor::uniqueFailures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    bool ErrorMonitor::markSeen(const std::string& message) {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.insert(message).second;
    }

  } // namespace core
} // namespace cloneflow
