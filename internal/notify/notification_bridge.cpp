#include "notification_bridge.hpp"

#include <exception>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"

namespace trackq::notify {

NotificationBridge::NotificationBridge() : thread_(&NotificationBridge::Run, this) {
}

NotificationBridge::~NotificationBridge() {
  Shutdown();
}

NotificationBridge::SubscriptionId NotificationBridge::Subscribe(Listener listener) {
  std::lock_guard lock(listeners_mutex_);
  const auto      id = next_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void NotificationBridge::Unsubscribe(SubscriptionId id) {
  std::lock_guard lock(listeners_mutex_);
  listeners_.erase(id);
}

std::size_t NotificationBridge::SubscriberCount() const {
  std::lock_guard lock(listeners_mutex_);
  return listeners_.size();
}

void NotificationBridge::Publish(const db::model::QueueItemRecord& snapshot) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      TRACKQ_LOG_WARN("notification dropped after shutdown", {observability::StringField("item_id", snapshot.id)});
      return;
    }
    queue_.push_back(snapshot);
    ++published_;
  }
  cv_.notify_one();
}

void NotificationBridge::Flush() {
  std::unique_lock lock(mutex_);
  const auto       target = published_;
  drained_cv_.wait(lock, [&] { return delivered_ >= target; });
}

void NotificationBridge::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

void NotificationBridge::Run() {
  while (true) {
    db::model::QueueItemRecord snapshot;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
      if (queue_.empty()) break;

      snapshot = std::move(queue_.front());
      queue_.pop_front();
    }

    std::vector<std::pair<SubscriptionId, Listener>> listeners;
    {
      std::lock_guard lock(listeners_mutex_);
      listeners.assign(listeners_.begin(), listeners_.end());
    }

    for (const auto& [id, listener] : listeners) {
      try {
        listener(snapshot);
      } catch (const std::exception& e) {
        TRACKQ_LOG_ERROR("notification listener failed", {observability::IntField("subscription", static_cast<int64_t>(id)),
                                                          observability::StringField("item_id", snapshot.id),
                                                          observability::StringField("error", e.what())});
      } catch (...) {
        TRACKQ_LOG_ERROR("notification listener failed", {observability::IntField("subscription", static_cast<int64_t>(id)),
                                                          observability::StringField("item_id", snapshot.id),
                                                          observability::StringField("error", "non-standard exception")});
      }
    }

    {
      std::lock_guard lock(mutex_);
      ++delivered_;
    }
    drained_cv_.notify_all();
  }
}

} // namespace trackq::notify
