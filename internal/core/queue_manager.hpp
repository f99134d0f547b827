#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/child_track_record.hpp"
#include "internal/db/model/history_record.hpp"
#include "internal/db/model/queue_item_record.hpp"
#include "internal/db/model/queue_stats.hpp"
#include "internal/notify/notification_bridge.hpp"
#include "internal/queue/queue_store.hpp"
#include "internal/scheduler/download_scheduler.hpp"
#include "internal/scheduler/item_control.hpp"

namespace trackq::core {

// Display metadata supplied with an enqueue; the catalog may refine it later.
struct EnqueueHints {
  std::string title;
  std::string artist;
  std::string album;
};

/*
  Control API of the download engine.

  All state changes go through the queue store. Transitions that concern a
  downloading item are requested from the worker that holds it and take
  effect at its next chunk or child boundary; the call returns once the
  request is registered. An item that finishes before the boundary keeps its
  final state.
*/
class QueueManager {
 public:
  QueueManager(std::shared_ptr<queue::QueueStore> store, std::shared_ptr<scheduler::DownloadScheduler> scheduler,
               std::shared_ptr<notify::NotificationBridge> bridge);

  // Requeues items interrupted by a previous process, then starts the workers.
  void Start();
  void Stop();

  db::model::QueueItemRecord Enqueue(const std::string& id, trackq::v1::ItemType type, const EnqueueHints& hints = {});

  db::model::QueueItemRecord Pause(const std::string& id);
  db::model::QueueItemRecord Resume(const std::string& id);
  db::model::QueueItemRecord Retry(const std::string& id);
  db::model::QueueItemRecord Cancel(const std::string& id);
  void                       Remove(const std::string& id);

  std::vector<db::model::QueueItemRecord> List(uint64_t offset, uint64_t limit,
                                               std::optional<trackq::v1::ItemStatus> status = std::nullopt);
  db::model::QueueItemRecord              Get(const std::string& id);
  db::model::QueueStats                   Stats();

  std::vector<db::model::HistoryRecord>    History(uint64_t offset, uint64_t limit);
  std::vector<db::model::ChildTrackRecord> FailedTracks(const std::string& id);

  uint64_t ClearCompleted();
  uint64_t ClearAll();

  notify::NotificationBridge::SubscriptionId Subscribe(notify::NotificationBridge::Listener listener);
  void                                       Unsubscribe(notify::NotificationBridge::SubscriptionId id);

 private:
  /*
    Asks the worker holding `id` to stop. A refused request means the run
    already settled, so the row is re-read. When no worker holds a
    downloading row (left over while the scheduler is not running) `orphan`
    is applied directly. Returns the item as read before the request.
  */
  db::model::QueueItemRecord StopDownloading(const std::string& id, scheduler::StopRequest request,
                                             const queue::QueueStore::Mutation& orphan);

  void AbandonDownload(const db::model::QueueItemRecord& item);

  std::shared_ptr<queue::QueueStore>            store_;
  std::shared_ptr<scheduler::DownloadScheduler> scheduler_;
  std::shared_ptr<notify::NotificationBridge>   bridge_;
};

} // namespace trackq::core
