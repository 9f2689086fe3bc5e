#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <future>
#include <mutex>
#include <queue>
#include <thread>

namespace stash::runtime {

/*
  The owner context.

  A serial job queue drained by exactly one thread at a time. All
  TieringEngine state is touched only from jobs running here; other
  threads hand work over with Post() or Call().
*/
class MainQueue {
 public:
  using Job = std::function<void()>;

  // False once Shutdown() has been called.
  bool Post(Job job);

  // Posts `job` and blocks until it has run. Exceptions from the job
  // are rethrown here. False, without running `job`, once Shutdown()
  // has been called. Must not be called from the draining thread.
  bool Call(Job job);

  // Drains jobs until Shutdown(); the calling thread becomes the owner.
  void Run();

  // Runs whatever is queued right now, then returns the number of jobs run.
  std::size_t RunPending();

  void Shutdown();

  bool IsOwnerThread() const;

 private:
  void Execute(Job& job);

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<Job>         queue_;
  bool                    shutdown_ = false;
  std::thread::id         owner_;
};

} // namespace stash::runtime
