#include "sigflow/rt/ThreadPool.hpp"
#include "sigflow/util/Logger.hpp"
#include "sigflow/util/Metrics.hpp"

#include <exception>

namespace sigflow::rt {

ThreadPool::ThreadPool(unsigned nThreads) {
  if (nThreads == 0) nThreads = 1;
  threads_.reserve(nThreads);
  for (unsigned i=0;i<nThreads;++i) {
    threads_.emplace_back([this]{ workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

bool ThreadPool::post(std::function<void()> fn) {
  size_t depth = 0;
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (stopping_) return false;
    q_.push(std::move(fn));
    depth = q_.size();
  }
  SIGFLOW_METRIC_SET("pool.queue_depth", static_cast<double>(depth));
  cv_.notify_one();
  return true;
}

void ThreadPool::drain() {
  std::unique_lock<std::mutex> lk(mx_);
  idleCv_.wait(lk, [this]{ return q_.empty() && active_ == 0; });
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lk(mx_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& t : threads_) if (t.joinable()) t.join();
}

void ThreadPool::workerLoop() {
  for (;;) {
    std::function<void()> fn;
    {
      std::unique_lock<std::mutex> lk(mx_);
      cv_.wait(lk, [this]{ return stopping_ || !q_.empty(); });
      if (stopping_ && q_.empty()) return;
      fn = std::move(q_.front()); q_.pop();
      ++active_;
    }
    try {
      fn();
    } catch (const std::exception& ex) {
      // keep the pool alive; the task owner reports its own failures
      SIGFLOW_METRIC_HIT("pool.task_failures");
      util::logger().error("pool.task.exception", {{"what", ex.what()}});
    }
    {
      std::lock_guard<std::mutex> lk(mx_);
      --active_;
      if (q_.empty() && active_ == 0) idleCv_.notify_all();
    }
  }
}

} // namespace sigflow::rt
