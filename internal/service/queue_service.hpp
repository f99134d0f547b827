#pragma once

#include <functional>
#include <memory>

#include "internal/core/queue_manager.hpp"
#include "internal/db/model/child_track_record.hpp"
#include "internal/db/model/history_record.hpp"
#include "internal/db/model/queue_item_record.hpp"
#include "internal/db/model/queue_stats.hpp"
#include "trackq/v1.hpp"

namespace trackq::service {

trackq::v1::QueueItem    ToProto(const db::model::QueueItemRecord& record);
trackq::v1::ChildTrack   ToProto(const db::model::ChildTrackRecord& record);
trackq::v1::HistoryEntry ToProto(const db::model::HistoryRecord& record);
trackq::v1::QueueStats   ToProto(const db::model::QueueStats& stats);

/*
  Request/response facade over the queue manager.

  Transport adapters stay thin: every RPC maps to exactly one call here.
  Errors are logged with the route name and rethrown for the transport to
  translate.
*/
class QueueService {
 public:
  explicit QueueService(std::shared_ptr<core::QueueManager> manager);

  trackq::v1::EnqueueResponse Enqueue(const trackq::v1::EnqueueRequest& req);
  trackq::v1::ItemResponse    Pause(const trackq::v1::ItemRequest& req);
  trackq::v1::ItemResponse    Resume(const trackq::v1::ItemRequest& req);
  trackq::v1::ItemResponse    Retry(const trackq::v1::ItemRequest& req);
  trackq::v1::ItemResponse    Cancel(const trackq::v1::ItemRequest& req);
  trackq::v1::RemoveResponse  Remove(const trackq::v1::ItemRequest& req);

  trackq::v1::ItemResponse         Get(const trackq::v1::ItemRequest& req);
  trackq::v1::ListResponse         List(const trackq::v1::ListRequest& req);
  trackq::v1::StatsResponse        Stats(const trackq::v1::StatsRequest& req);
  trackq::v1::HistoryResponse      History(const trackq::v1::HistoryRequest& req);
  trackq::v1::FailedTracksResponse FailedTracks(const trackq::v1::ItemRequest& req);

  trackq::v1::ClearResponse ClearCompleted(const trackq::v1::ClearRequest& req);
  trackq::v1::ClearResponse ClearAll(const trackq::v1::ClearRequest& req);

  // Watch plumbing; the listener runs on the notification thread.
  using WatchListener = std::function<void(const trackq::v1::QueueItem&)>;

  notify::NotificationBridge::SubscriptionId Watch(WatchListener listener);
  void                                       Unwatch(notify::NotificationBridge::SubscriptionId id);

 private:
  std::shared_ptr<core::QueueManager> manager_;
};

} // namespace trackq::service
