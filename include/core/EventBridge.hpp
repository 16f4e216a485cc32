#pragma once
/** @file  EventBridge.hpp
 *  @brief Turns hub notifications into normalised orchestrator events.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// cloneflow headers
#include "core/NotificationHub.hpp"

namespace cloneflow::core {

  namespace bridged {

    struct WriteProgress {
      int percent{ 0 }; ///< already clamped to [0,100]
      std::optional<std::uint16_t> currentBlock;
      std::optional<std::uint16_t> totalBlocks;
    };

    struct HfProgress {
      std::string phase;
      std::uint32_t keysFound{ 0 };
      std::uint32_t keysTotal{ 0 };
      std::uint32_t elapsedSecs{ 0 };
    };

    struct FlashProgress {
      int percent{ 0 };
      std::string phase;
      std::string message;
    };

    struct FlashComplete {};

    struct FlashFailed {
      std::string message;
    };

  } // namespace bridged

  /// Everything but FlashComplete / FlashFailed is a context-only mutation.
  using BridgedEvent = std::variant<bridged::WriteProgress, bridged::HfProgress,
                                    bridged::FlashProgress, bridged::FlashComplete,
                                    bridged::FlashFailed>;

  /** Values at or below 1.0 are fractions and are scaled by 100; the result is
   *  rounded and clamped to [0,100]. */
  int normalisePercent(double reported);

  BridgedEvent toBridged(const protocols::Notification& n);

  /**
 * @class EventBridge
 * @brief Holds one Subscription per notification kind for the lifetime of a mount.
 *
 *  * The sink is called on the publishing thread; the orchestrator's sink
 *    only posts into its EventLoop.
 *  * `detach()` (or destruction) tears every subscription down together; once
 *    it returns the sink is never called again.
 */
  class EventBridge {
  public:
    using Sink = std::function<void(BridgedEvent)>;

    EventBridge(NotificationHub& hub, Sink sink);
    ~EventBridge() { detach(); }

    void detach();
    bool attached() const { return !subscriptions_.empty(); }

    EventBridge(const EventBridge&) = delete;
    EventBridge& operator=(const EventBridge&) = delete;

  private:
    Sink sink_;
    std::vector<Subscription> subscriptions_;
  };

} // namespace cloneflow::core
