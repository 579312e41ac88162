#include "cascade_worker.hpp"

#include <algorithm>

#include "internal/core/cascade_processor.hpp"
#include "internal/observability/logging.hpp"

namespace cascade::worker {

CascadeWorker::CascadeWorker(std::shared_ptr<cascade::core::CascadeProcessor> processor) : processor_(std::move(processor)) {
}

CascadeWorker::~CascadeWorker() {
  Stop();
}

void CascadeWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }

  const auto thread_count = std::max<uint32_t>(processor_->Options().worker_threads, 1);
  for (uint32_t i = 0; i < thread_count; ++i) {
    threads_.emplace_back(&CascadeWorker::Run, this, i);
  }
  CASCADE_LOG_INFO("Cascade worker started", {observability::IntField("threads", thread_count)});
}

void CascadeWorker::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  Wake();
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
  CASCADE_LOG_INFO("Cascade worker stopped");
}

void CascadeWorker::Wake() {
  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    wake_pending_ = true;
  }
  wake_cv_.notify_all();
}

void CascadeWorker::Run(std::size_t index) {
  const auto& options = processor_->Options();

  if (index == 0) {
    try {
      processor_->ResumeInProgress();
    } catch (const std::exception& e) {
      CASCADE_LOG_ERROR("Resuming delete operations failed", {observability::StringField("error", e.what())});
    }
  }

  auto next_prune = std::chrono::steady_clock::now();
  while (running_) {
    try {
      processor_->ProcessPending();

      if (index == 0 && std::chrono::steady_clock::now() >= next_prune) {
        processor_->PruneExpired();
        next_prune = std::chrono::steady_clock::now() + options.prune_interval;
      }
    } catch (const std::exception& e) {
      CASCADE_LOG_ERROR("Cascade worker iteration failed", {observability::StringField("error", e.what())});
    }

    std::unique_lock<std::mutex> lock(wake_mutex_);
    wake_cv_.wait_for(lock, options.poll_interval, [this] {
      return wake_pending_ || !running_;
    });
    wake_pending_ = false;
  }
}

} // namespace cascade::worker
