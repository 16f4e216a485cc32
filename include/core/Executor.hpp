#pragma once
/** @file  Executor.hpp
 *  @brief Where blocking gateway calls run, off the orchestrator's loop thread.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace cloneflow {
  namespace core {

    class Executor {
    public:
      virtual ~Executor() = default;
      virtual void submit(std::function<void()> task) = 0;
    };

    /**
 * @class WorkerExecutor
 * @brief One worker thread, FIFO. The device is a serially accessed resource, so
 *        a single worker guarantees at most one in-flight request to it.
 *
 *  * Tasks still queued at destruction are discarded; the running one is joined.
 */
    class WorkerExecutor : public Executor {
    public:
      WorkerExecutor();
      ~WorkerExecutor() override;

      void submit(std::function<void()> task) override;

      WorkerExecutor(const WorkerExecutor&) = delete;
      WorkerExecutor& operator=(const WorkerExecutor&) = delete;

    private:
      void workerLoop();

      std::mutex mtx_;
      std::condition_variable cv_;
      std::deque<std::function<void()>> tasks_;
      std::atomic<bool> running_{ true };
      std::thread worker_;
    };

  } // namespace core
} // namespace cloneflow
