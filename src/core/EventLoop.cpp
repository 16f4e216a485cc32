/* @file EventLoop.cpp
 * @brief FIFO task queue with deadline timers
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// cloneflow headers
#include "core/EventLoop.hpp"

using namespace cloneflow::core;

EventLoop::EventLoop(NowFn now) : now_(std::move(now)) {}

void EventLoop::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
}

EventLoop::TimerId EventLoop::scheduleAfter(Clock::duration delay, Task task) {
  std::lock_guard<std::mutex> lock(mtx_);
  const TimerId id = nextTimer_++;
  timers_.emplace(id, Timer{ now_() + delay, std::move(task) });
  cv_.notify_one();
  return id;
}

void EventLoop::cancel(TimerId id) {
  std::lock_guard<std::mutex> lock(mtx_);
  timers_.erase(id);
}

bool EventLoop::timerPending(TimerId id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return timers_.count(id) != 0;
}

std::size_t EventLoop::runPending() {
  std::size_t ran = 0;
  while (runOneReady())
    ++ran;
  return ran;
}

void EventLoop::run() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stopping_ = false;
  }
  for (;;) {
    if (runOneReady())
      continue;

    std::unique_lock<std::mutex> lock(mtx_);
    if (stopping_)
      return;
    if (!queue_.empty())
      continue;
    if (timers_.empty()) {
      cv_.wait(lock);
    } else {
      auto next = std::min_element(timers_.begin(), timers_.end(), [](const auto& a, const auto& b) {
        return a.second.deadline < b.second.deadline;
      });
      cv_.wait_until(lock, next->second.deadline);
    }
  }
}

void EventLoop::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stopping_ = true;
  }
  cv_.notify_all();
}

bool EventLoop::runOneReady() {
  Task task;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!queue_.empty()) {
      task = std::move(queue_.front());
      queue_.pop_front();
    } else {
      const auto now = now_();
      auto due = timers_.end();
      for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.deadline <= now && (due == timers_.end() || it->second.deadline < due->second.deadline))
          due = it;
      }
      if (due == timers_.end())
        return false;
      task = std::move(due->second.task);
      timers_.erase(due);
    }
  }
  task(); // outside the lock: tasks post and schedule
  return true;
}
