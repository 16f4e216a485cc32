#pragma once
/** @file  EventLoop.hpp
 *  @brief Single-threaded mutation queue + timers that serialise all orchestrator work.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>

namespace cloneflow::core {

  /**
 * @class EventLoop
 * @brief Tasks posted from any thread run one at a time on the loop thread.
 *
 *  * `post()` is the only thread-safe entry point.
 *  * Timers are loop-thread only; a cancelled timer never fires.
 *  * The clock is injectable so tests can step time with `runPending()`.
 */
  class EventLoop {
  public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;
    using TimerId = std::uint64_t;

    explicit EventLoop(NowFn now = &Clock::now);
    ~EventLoop() = default;

    void post(Task task);

    TimerId scheduleAfter(Clock::duration delay, Task task);
    void cancel(TimerId id);
    bool timerPending(TimerId id) const;

    /// Run queued tasks and due timers until none are ready; returns how many ran.
    std::size_t runPending();

    /// Block (real time) until `stop()`, running work as it becomes ready.
    void run();
    void stop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

  private:
    struct Timer {
      Clock::time_point deadline;
      Task task;
    };

    bool runOneReady();

    NowFn now_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<Task> queue_;
    std::map<TimerId, Timer> timers_;
    TimerId nextTimer_{ 1 };
    bool stopping_{ false };
  };

} // namespace cloneflow::core
