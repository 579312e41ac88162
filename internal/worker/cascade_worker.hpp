#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace cascade::core {
class CascadeProcessor;
}

namespace cascade::worker {

/*
  Background pool that drives delete operations.

  Thread 0 first resumes operations left InProgress by a previous process.
  Every thread then loops:
      ProcessPending
      PruneExpired (thread 0, every prune_interval)
      sleep poll_interval or until Wake()
*/
class CascadeWorker {
 public:
  explicit CascadeWorker(std::shared_ptr<cascade::core::CascadeProcessor> processor);
  ~CascadeWorker();

  void Start();
  void Stop();

  // Cuts the current poll sleep short.
  void Wake();

 private:
  void Run(std::size_t index);

  std::shared_ptr<cascade::core::CascadeProcessor> processor_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};

  std::mutex              wake_mutex_;
  std::condition_variable wake_cv_;
  bool                    wake_pending_{false};
};

} // namespace cascade::worker
