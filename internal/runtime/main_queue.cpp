#include "main_queue.hpp"

#include "internal/observability/logging.hpp"

namespace stash::runtime {

bool MainQueue::Post(Job job) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(job));
  }
  cv_.notify_one();
  return true;
}

bool MainQueue::Call(Job job) {
  auto task   = std::make_shared<std::packaged_task<void()>>(std::move(job));
  auto result = task->get_future();

  if (!Post([task] { (*task)(); })) {
    return false;
  }
  result.get();
  return true;
}

void MainQueue::Execute(Job& job) {
  try {
    job();
  } catch (const std::exception& e) {
    STASH_LOG_ERROR("main queue job failed", {observability::StringField("error", e.what())});
  }
}

void MainQueue::Run() {
  {
    std::lock_guard lock(mutex_);
    owner_ = std::this_thread::get_id();
  }

  while (true) {
    Job job;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

      if (shutdown_ && queue_.empty()) break;

      job = std::move(queue_.front());
      queue_.pop();
    }
    Execute(job);
  }
}

std::size_t MainQueue::RunPending() {
  std::queue<Job> pending;
  {
    std::lock_guard lock(mutex_);
    owner_ = std::this_thread::get_id();
    std::swap(pending, queue_);
  }

  std::size_t ran = 0;
  while (!pending.empty()) {
    Execute(pending.front());
    pending.pop();
    ++ran;
  }
  return ran;
}

void MainQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool MainQueue::IsOwnerThread() const {
  std::lock_guard lock(mutex_);
  return owner_ == std::this_thread::get_id();
}

} // namespace stash::runtime
