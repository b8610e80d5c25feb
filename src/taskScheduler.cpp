#include "taskScheduler.hpp"
#include "AppLogger.hpp"

#include <exception>

TaskScheduler::TaskScheduler(std::string name)
    : name_(std::move(name))
{
  worker_ = std::thread(&TaskScheduler::run, this);
}

TaskScheduler::~TaskScheduler()
{
  stop();
}

TaskId TaskScheduler::post(Task task)
{
  return postDelayed(0, std::move(task));
}

TaskId TaskScheduler::postDelayed(int64_t delayMs, Task task)
{
  TaskId id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_)
    {
      AppLogger::getInstance().warn("[" + name_ + "] Task dropped, scheduler stopped");
      return 0;
    }
    id = nextId_++;
    const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(delayMs > 0 ? delayMs : 0);
    queue_.emplace(Key(deadline, id), std::move(task));
  }
  cv_.notify_one();
  return id;
}

bool TaskScheduler::cancel(TaskId id)
{
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = queue_.begin(); it != queue_.end(); ++it)
  {
    if (it->first.second == id)
    {
      queue_.erase(it);
      return true;
    }
  }
  return false;
}

void TaskScheduler::stop()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    queue_.clear();
  }
  cv_.notify_all();

  if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id())
  {
    worker_.join();
  }
}

bool TaskScheduler::isWorkerThread() const
{
  return std::this_thread::get_id() == worker_.get_id();
}

size_t TaskScheduler::pendingCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void TaskScheduler::run()
{
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_)
  {
    if (queue_.empty())
    {
      cv_.wait(lock);
      continue;
    }

    const Clock::time_point deadline = queue_.begin()->first.first;
    if (Clock::now() < deadline)
    {
      cv_.wait_until(lock, deadline);
      continue;
    }

    Task task = std::move(queue_.begin()->second);
    queue_.erase(queue_.begin());

    lock.unlock();
    try
    {
      task();
    }
    catch (const std::exception &e)
    {
      AppLogger::getInstance().error("[" + name_ + "] Task threw: " + std::string(e.what()));
    }
    lock.lock();
  }
}
