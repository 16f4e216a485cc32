#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>

namespace cloneflow::core {

  /**
 * @class ErrorMonitor
 * @brief Subsystems call `notifyFailure()` from any thread; each unique message is
 *        logged once and handed to the escalation callback.
 *
 * * Thread-safe (mutex-protected set).
 * * Debounces duplicate failures so a flapping link doesn't flood the log.
 * * Failures reported here never drive workflow state; the Orchestrator
 *   reports best-effort remote failures here instead of entering `error`.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault (e.g. to the CLI status line).
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Forget seen messages so the next occurrence is reported again.
    void clearSeen();

    std::size_t uniqueFailures() const;

  private:
    bool markSeen(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::unordered_set<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace cloneflow::core
