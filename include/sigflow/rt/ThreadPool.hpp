#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace sigflow::rt {

class ThreadPool {
public:
  explicit ThreadPool(unsigned nThreads = std::thread::hardware_concurrency());
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&)                 = delete;
  ThreadPool& operator=(ThreadPool&&)      = delete;

  // Enqueue work. Returns false once shutdown has begun (task not queued).
  bool post(std::function<void()> fn);

  // Waits until the queue is empty and no task is running.
  void drain();

  // Runs every queued task, then joins the workers. Idempotent.
  void shutdown();

  size_t size() const noexcept { return threads_.size(); }

private:
  void workerLoop();

private:
  std::vector<std::thread>          threads_;
  std::mutex                        mx_;
  std::condition_variable           cv_;
  std::condition_variable           idleCv_;
  std::queue<std::function<void()>> q_;
  size_t                            active_ = 0;
  std::atomic<bool>                 stopping_{false};
};

} // namespace sigflow::rt
