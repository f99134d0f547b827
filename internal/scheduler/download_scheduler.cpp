#include "download_scheduler.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace trackq::scheduler {

DownloadScheduler::DownloadScheduler(std::shared_ptr<queue::QueueStore> store, std::shared_ptr<ItemExecutor> executor,
                                     SchedulerOptions options)
    : store_(std::move(store)),
      executor_(std::move(executor)),
      options_(options),
      signal_(std::make_shared<DispatchSignal>()),
      controls_(std::make_shared<ControlRegistry>()) {
  if (!store_ || !executor_) {
    throw std::invalid_argument("download scheduler requires store and executor");
  }
  if (options_.workers == 0) {
    throw std::invalid_argument("download scheduler requires at least one worker");
  }
}

DownloadScheduler::~DownloadScheduler() {
  Stop();
}

void DownloadScheduler::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;

  // fresh signal and controls so a stopped scheduler can be restarted
  signal_   = std::make_shared<DispatchSignal>();
  controls_ = std::make_shared<ControlRegistry>();

  workers_.reserve(options_.workers);
  for (uint32_t i = 0; i < options_.workers; ++i) {
    auto worker = std::make_unique<DownloadWorker>("download-" + std::to_string(i), store_, executor_, signal_, controls_,
                                                   options_.idle_poll);
    worker->Start();
    workers_.push_back(std::move(worker));
  }
  running_ = true;

  TRACKQ_LOG_INFO("download scheduler started", {observability::IntField("workers", options_.workers)});
}

void DownloadScheduler::Stop() {
  std::vector<std::unique_ptr<DownloadWorker>> workers;
  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    running_ = false;
    workers.swap(workers_);
  }

  controls_->StopAll(StopRequest::Shutdown);
  signal_->Shutdown();
  for (auto& worker : workers) {
    worker->Stop();
  }

  TRACKQ_LOG_INFO("download scheduler stopped", {observability::IntField("workers", static_cast<int64_t>(workers.size()))});
}

void DownloadScheduler::Wake() {
  signal_->Notify();
}

bool DownloadScheduler::RequestStop(const std::string& id, StopRequest request) {
  return controls_->Request(id, request);
}

std::size_t DownloadScheduler::ActiveCount() const {
  return controls_->ActiveCount();
}

bool DownloadScheduler::Running() const {
  std::lock_guard lock(mutex_);
  return running_;
}

} // namespace trackq::scheduler
