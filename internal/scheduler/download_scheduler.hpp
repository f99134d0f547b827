#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "dispatch_signal.hpp"
#include "download_worker.hpp"
#include "item_control.hpp"
#include "item_executor.hpp"

namespace trackq::scheduler {

struct SchedulerOptions {
  uint32_t                  workers   = 8;
  std::chrono::milliseconds idle_poll = std::chrono::milliseconds(5000);
};

/*
  Fixed-size download pool. The worker count is the only admission knob:
  at most `workers` items are downloading at any time.
*/
class DownloadScheduler {
 public:
  DownloadScheduler(std::shared_ptr<queue::QueueStore> store, std::shared_ptr<ItemExecutor> executor, SchedulerOptions options);
  ~DownloadScheduler();

  DownloadScheduler(const DownloadScheduler&)            = delete;
  DownloadScheduler& operator=(const DownloadScheduler&) = delete;

  void Start();

  // In-flight items go back to pending; waits for every worker to exit.
  void Stop();

  // Wakes idle workers after new work became eligible.
  void Wake();

  // False if no worker currently holds the id.
  bool RequestStop(const std::string& id, StopRequest request);

  std::size_t ActiveCount() const;

  uint32_t WorkerCount() const {
    return options_.workers;
  }

  bool Running() const;

 private:
  std::shared_ptr<queue::QueueStore> store_;
  std::shared_ptr<ItemExecutor>      executor_;
  SchedulerOptions                   options_;

  std::shared_ptr<DispatchSignal>  signal_;
  std::shared_ptr<ControlRegistry> controls_;

  mutable std::mutex                           mutex_;
  std::vector<std::unique_ptr<DownloadWorker>> workers_;
  bool                                         running_ = false;
};

} // namespace trackq::scheduler
