#pragma once
/** @file  ManualExecutor.hpp
 *  @brief Executor that queues tasks until the test runs them on its own thread.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <deque>
#include <functional>

#include "core/EventLoop.hpp"
#include "core/Executor.hpp"

namespace cloneflow {
  namespace test {

    class ManualExecutor : public cloneflow::core::Executor {
    public:
      void submit(std::function<void()> task) override { tasks_.push_back(std::move(task)); }

      /// Run queued tasks (including ones they submit); returns how many ran.
      std::size_t runAll() {
        std::size_t ran = 0;
        while (!tasks_.empty()) {
          auto task = std::move(tasks_.front());
          tasks_.pop_front();
          task();
          ++ran;
        }
        return ran;
      }

      std::size_t pending() const { return tasks_.size(); }

    private:
      std::deque<std::function<void()>> tasks_;
    };

    /// Steady-clock stand-in that only moves when the test advances it.
    struct FakeClock {
      cloneflow::core::EventLoop::Clock::time_point now{};

      void advance(std::chrono::steady_clock::duration d) { now += d; }
    };

  } // namespace test
} // namespace cloneflow
