#include "download_worker.hpp"

#include <optional>

#include "internal/observability/logging.hpp"

namespace trackq::scheduler {

DownloadWorker::DownloadWorker(std::string name, std::shared_ptr<queue::QueueStore> store, std::shared_ptr<ItemExecutor> executor,
                               std::shared_ptr<DispatchSignal> signal, std::shared_ptr<ControlRegistry> controls,
                               std::chrono::milliseconds idle_poll)
    : name_(std::move(name)),
      store_(std::move(store)),
      executor_(std::move(executor)),
      signal_(std::move(signal)),
      controls_(std::move(controls)),
      idle_poll_(idle_poll) {}

DownloadWorker::~DownloadWorker() {
  Stop();
}

void DownloadWorker::Start() {
  running_ = true;
  thread_  = std::thread(&DownloadWorker::Run, this);
}

void DownloadWorker::Stop() {
  running_ = false;
  if (thread_.joinable())
    thread_.join();
}

void DownloadWorker::Run() {
  TRACKQ_LOG_DEBUG("download worker started", {observability::StringField("worker", name_)});

  while (running_ && !signal_->IsShutdown()) {
    const auto seen = signal_->Generation();

    bool worked = false;
    try {
      worked = RunOnce();
    } catch (const std::exception& e) {
      TRACKQ_LOG_ERROR("download worker iteration failed",
                       {observability::StringField("worker", name_), observability::StringField("error", e.what())});
    }

    if (!worked && !signal_->Wait(seen, idle_poll_)) {
      break;
    }
  }

  TRACKQ_LOG_DEBUG("download worker stopped", {observability::StringField("worker", name_)});
}

bool DownloadWorker::RunOnce() {
  std::shared_ptr<ItemControl>             control;
  std::string                              registered_id;
  std::optional<db::model::QueueItemRecord> claimed;

  try {
    claimed = store_->ClaimNextPending([&](const db::model::QueueItemRecord& item) {
      control       = controls_->Register(item.id);
      registered_id = item.id;
    });
  } catch (...) {
    // claim rolled back after registration
    if (control) controls_->Release(registered_id);
    throw;
  }
  if (!claimed) {
    return false;
  }

  ExecutionResult result;
  try {
    result = executor_->Execute(*claimed, *control);
  } catch (...) {
    controls_->Release(claimed->id);
    throw;
  }
  controls_->Release(claimed->id);

  TRACKQ_LOG_DEBUG("item finished", {observability::StringField("worker", name_), observability::StringField("item_id", claimed->id),
                                     observability::StringField("result", ToString(result))});

  // a freed slot or a requeued item may be claimable by an idle peer
  signal_->Notify();
  return true;
}

} // namespace trackq::scheduler
