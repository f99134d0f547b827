#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

#include "internal/db/model/queue_item_record.hpp"

namespace trackq::notify {

/*
  Delivers persisted item snapshots to external observers.

  Publish() only enqueues; a dedicated dispatch thread calls the listeners,
  so scheduler threads never run presentation code. Delivery is in publish
  order and at-least-once for every subscriber registered at delivery time.
  A listener that throws is logged and stays subscribed.

  A listener may still run once after Unsubscribe() returns if its delivery
  was already under way.
*/
class NotificationBridge {
 public:
  using Listener       = std::function<void(const db::model::QueueItemRecord&)>;
  using SubscriptionId = uint64_t;

  NotificationBridge();
  ~NotificationBridge();

  NotificationBridge(const NotificationBridge&)            = delete;
  NotificationBridge& operator=(const NotificationBridge&) = delete;

  SubscriptionId Subscribe(Listener listener);
  void           Unsubscribe(SubscriptionId id);

  void Publish(const db::model::QueueItemRecord& snapshot);

  // Blocks until everything published before the call has been delivered.
  // Must not be called from a listener.
  void Flush();

  // Delivers what is queued, then stops the dispatch thread. Idempotent.
  void Shutdown();

  std::size_t SubscriberCount() const;

 private:
  void Run();

  mutable std::mutex                   listeners_mutex_;
  std::map<SubscriptionId, Listener>   listeners_;
  SubscriptionId                       next_id_ = 1;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::condition_variable                drained_cv_;
  std::deque<db::model::QueueItemRecord> queue_;
  uint64_t                               published_ = 0;
  uint64_t                               delivered_ = 0;
  bool                                   shutdown_  = false;

  std::thread thread_;
};

} // namespace trackq::notify
