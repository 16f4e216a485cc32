#pragma once
/** @file  NotificationHub.hpp
 *  @brief Publish/subscribe fan-out for out-of-band device notifications.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <type_traits>
#include <variant>
#include <vector>

// cloneflow headers
#include "protocols/Notifications.hpp"

namespace cloneflow {
  namespace core {

    /**
 * @class Subscription
 * @brief Move-only handle; destroying or resetting it unsubscribes.
 *
 *  * `reset()` returns only after any delivery already running for this
 *    handler has finished, so nothing the handler captured is touched after.
 *  * Safe to outlive the hub (holds the registry weakly).
 */
    class Subscription {
    public:
      Subscription() = default;
      ~Subscription() { reset(); }

      void reset();
      bool active() const { return id_ != 0 && !registry_.expired(); }

      //---non-copyable, move-enabled---------------------------------------
      Subscription(const Subscription&) = delete;
      Subscription& operator=(const Subscription&) = delete;
      Subscription(Subscription&& other) noexcept;
      Subscription& operator=(Subscription&& other) noexcept;

    private:
      friend class NotificationHub;
      struct Registry;
      Subscription(std::weak_ptr<Registry> registry, std::uint64_t id)
          : registry_{ std::move(registry) }, id_{ id } {}

      std::weak_ptr<Registry> registry_;
      std::uint64_t id_{ 0 };
    };

    /**
 * @class NotificationHub
 * @brief Routes each published notification to the handlers of its channel.
 *
 *  * `publish()` may be called from any thread (the RPC reader thread in
 *    production). Handlers run on the publishing thread and must not
 *    subscribe/unsubscribe from inside the callback.
 *  * At-most-once delivery per publish; no cross-channel ordering promise.
 */
    class NotificationHub {
    public:
      using Handler = std::function<void(const protocols::Notification&)>;

      NotificationHub();
      ~NotificationHub() = default;

      /// Subscribe to the channel of alternative \p Event.
      template <typename Event> [[nodiscard]] Subscription subscribe(std::function<void(const Event&)> h) {
        return subscribeIndex(indexOf<Event>(), [h = std::move(h)](const protocols::Notification& n) {
          h(std::get<Event>(n));
        });
      }

      void publish(const protocols::Notification& n);

      std::size_t subscriberCount() const;

      NotificationHub(const NotificationHub&) = delete;
      NotificationHub& operator=(const NotificationHub&) = delete;

    private:
      template <typename Event, std::size_t I = 0> static constexpr std::size_t indexOf() {
        static_assert(I < std::variant_size_v<protocols::Notification>, "not a notification type");
        if constexpr (std::is_same_v<Event, std::variant_alternative_t<I, protocols::Notification>>)
          return I;
        else
          return indexOf<Event, I + 1>();
      }

      Subscription subscribeIndex(std::size_t channel, Handler h);

      std::shared_ptr<Subscription::Registry> registry_;
    };

  } // namespace core
} // namespace cloneflow
