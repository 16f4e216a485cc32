/* @file EventBridge.cpp
 * @brief notification normalisation and scoped subscriptions
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>

// cloneflow headers
#include "core/EventBridge.hpp"

namespace cloneflow::core {

  namespace {

    template <class... Ts> struct overloaded : Ts... {
      using Ts::operator()...;
    };

  } // namespace

  int normalisePercent(double reported) {
    if (!std::isfinite(reported))
      return 0;
    const double scaled = reported <= 1.0 ? reported * 100.0 : reported;
    return static_cast<int>(std::lround(std::clamp(scaled, 0.0, 100.0)));
  }

  BridgedEvent toBridged(const protocols::Notification& n) {
    return std::visit(
        overloaded{
            [](const protocols::WriteProgressEvent& e) -> BridgedEvent {
              return bridged::WriteProgress{ normalisePercent(e.progress), e.currentBlock,
                                             e.totalBlocks };
            },
            [](const protocols::HfProgressEvent& e) -> BridgedEvent {
              return bridged::HfProgress{ e.phase, e.keysFound, e.keysTotal, e.elapsedSecs };
            },
            [](const protocols::FirmwareProgressEvent& e) -> BridgedEvent {
              // flasher already reports whole percent
              return bridged::FlashProgress{ std::clamp(e.percent, 0, 100), e.phase, e.message };
            },
            [](const protocols::FirmwareCompleteEvent&) -> BridgedEvent {
              return bridged::FlashComplete{};
            },
            [](const protocols::FirmwareFailedEvent& e) -> BridgedEvent {
              return bridged::FlashFailed{ e.message };
            },
        },
        n);
  }

  EventBridge::EventBridge(NotificationHub& hub, Sink sink) : sink_(std::move(sink)) {
    auto forward = [this](const auto& event) { sink_(toBridged(protocols::Notification{ event })); };

    subscriptions_.reserve(std::variant_size_v<protocols::Notification>);
    subscriptions_.push_back(hub.subscribe<protocols::WriteProgressEvent>(forward));
    subscriptions_.push_back(hub.subscribe<protocols::HfProgressEvent>(forward));
    subscriptions_.push_back(hub.subscribe<protocols::FirmwareProgressEvent>(forward));
    subscriptions_.push_back(hub.subscribe<protocols::FirmwareCompleteEvent>(forward));
    subscriptions_.push_back(hub.subscribe<protocols::FirmwareFailedEvent>(forward));
  }

  void EventBridge::detach() {
    // each reset() waits out an in-flight delivery before returning
    subscriptions_.clear();
  }

} // namespace cloneflow::core
