#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

using TaskId = uint64_t;

// Single worker thread running posted tasks in deadline order; tasks with the
// same deadline run in submission order.
class TaskScheduler
{
public:
  using Task = std::function<void()>;

  explicit TaskScheduler(std::string name);
  ~TaskScheduler();

  TaskScheduler(const TaskScheduler &) = delete;
  TaskScheduler &operator=(const TaskScheduler &) = delete;

  TaskId post(Task task);
  TaskId postDelayed(int64_t delayMs, Task task);

  // Returns false if the task already ran, is running, or never existed.
  bool cancel(TaskId id);

  // Drops pending tasks and joins the worker. Idempotent.
  void stop();

  bool isWorkerThread() const;

  size_t pendingCount() const;

private:
  using Clock = std::chrono::steady_clock;
  using Key = std::pair<Clock::time_point, TaskId>;

  void run();

  std::string name_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<Key, Task> queue_;
  TaskId nextId_ = 1;
  bool stopping_ = false;
  std::thread worker_;
};
