#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "dispatch_signal.hpp"
#include "item_control.hpp"
#include "item_executor.hpp"

namespace trackq::scheduler {

/*
  One thread of the download pool.

  Loop: claim the oldest eligible pending item, execute it, repeat. With
  nothing to claim the worker waits on the dispatch signal, bounded by the
  idle poll interval.
*/
class DownloadWorker {
 public:
  DownloadWorker(std::string name, std::shared_ptr<queue::QueueStore> store, std::shared_ptr<ItemExecutor> executor,
                 std::shared_ptr<DispatchSignal> signal, std::shared_ptr<ControlRegistry> controls,
                 std::chrono::milliseconds idle_poll);
  ~DownloadWorker();

  void Start();

  // Joins the thread; the owner shuts the dispatch signal down first so an
  // idle worker does not sit out its poll interval.
  void Stop();

 private:
  void Run();
  bool RunOnce();

  std::string                        name_;
  std::shared_ptr<queue::QueueStore> store_;
  std::shared_ptr<ItemExecutor>      executor_;
  std::shared_ptr<DispatchSignal>    signal_;
  std::shared_ptr<ControlRegistry>   controls_;
  std::chrono::milliseconds          idle_poll_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace trackq::scheduler
