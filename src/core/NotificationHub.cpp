/* @file NotificationHub.cpp
 * @brief channel-indexed handler registry guarded by a shared_mutex
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <mutex>

// cloneflow headers
#include "core/NotificationHub.hpp"

namespace cloneflow::core {

  struct Subscription::Registry {
    struct Entry {
      std::uint64_t id;
      std::size_t channel;
      NotificationHub::Handler handler;
    };

    // publish holds it shared for the whole delivery; unsubscribe takes it exclusive
    mutable std::shared_mutex mtx;
    std::uint64_t nextId{ 1 };
    std::vector<Entry> entries;
  };

  //---Subscription-------------------------------------------------------------
  Subscription::Subscription(Subscription&& other) noexcept
      : registry_{ std::move(other.registry_) }, id_{ other.id_ } {
    other.id_ = 0;
  }

  Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
      reset();
      registry_ = std::move(other.registry_);
      id_ = other.id_;
      other.id_ = 0;
    }
    return *this;
  }

  void Subscription::reset() {
    if (id_ == 0)
      return;
    if (auto reg = registry_.lock()) {
      std::unique_lock lock(reg->mtx);
      std::erase_if(reg->entries, [this](const Registry::Entry& e) { return e.id == id_; });
    }
    registry_.reset();
    id_ = 0;
  }

  //---NotificationHub----------------------------------------------------------
  NotificationHub::NotificationHub() : registry_{ std::make_shared<Subscription::Registry>() } {}

  Subscription NotificationHub::subscribeIndex(std::size_t channel, Handler h) {
    std::unique_lock lock(registry_->mtx);
    const auto id = registry_->nextId++;
    registry_->entries.push_back({ id, channel, std::move(h) });
    return Subscription{ registry_, id };
  }

  void NotificationHub::publish(const protocols::Notification& n) {
    std::shared_lock lock(registry_->mtx);
    for (const auto& entry : registry_->entries) {
      if (entry.channel == n.index())
        entry.handler(n);
    }
  }

  std::size_t NotificationHub::subscriberCount() const {
    std::shared_lock lock(registry_->mtx);
    return registry_->entries.size();
  }

} // namespace cloneflow::core
