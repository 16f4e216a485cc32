/* @file Executor.cpp
 * @brief single-thread worker for device round trips
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <exception>
#include <iostream>

#include "core/Executor.hpp"

using namespace cloneflow::core;

WorkerExecutor::WorkerExecutor() : worker_(&WorkerExecutor::workerLoop, this) {}

WorkerExecutor::~WorkerExecutor() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    running_ = false;
    tasks_.clear();
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
}

void WorkerExecutor::submit(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_)
      return;
    tasks_.push_back(std::move(task));
  }
  cv_.notify_one();
}

void WorkerExecutor::workerLoop() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait(lock, [this] { return !running_ || !tasks_.empty(); });
      if (!running_)
        return;
      task = std::move(tasks_.front());
      tasks_.pop_front();
    }
    try {
      task();
    } catch (const std::exception& e) {
      // submitted tasks handle their own errors; anything here is a bug in the task
      std::cerr << "[WorkerExecutor] task threw: " << e.what() << '\n';
    }
  }
}
