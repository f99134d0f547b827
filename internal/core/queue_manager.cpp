#include "queue_manager.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/queue/progress.hpp"
#include "internal/util/errors.hpp"

namespace trackq::core {

using db::model::QueueItemRecord;
using observability::IntField;
using observability::StringField;
using scheduler::StopRequest;

namespace {

constexpr const char* kCancelledByUser = "cancelled by user";

// Row changed between the read and the write; the caller re-reads.
class StaleRead : public std::runtime_error {
 public:
  StaleRead() : std::runtime_error("stale read") {
  }
};

const char* StatusName(trackq::v1::ItemStatus status) {
  switch (status) {
    case trackq::v1::ITEM_STATUS_PENDING:
      return "pending";
    case trackq::v1::ITEM_STATUS_DOWNLOADING:
      return "downloading";
    case trackq::v1::ITEM_STATUS_PAUSED:
      return "paused";
    case trackq::v1::ITEM_STATUS_COMPLETED:
      return "completed";
    case trackq::v1::ITEM_STATUS_FAILED:
      return "failed";
    default:
      return "unknown";
  }
}

[[noreturn]] void ThrowInvalidTransition(const QueueItemRecord& item, const char* operation) {
  throw util::InvalidTransition(std::string("cannot ") + operation + " " + item.id + " while " + StatusName(item.status));
}

// Applies fn only if the row still carries the status and stamp of `seen`.
std::optional<QueueItemRecord> Transition(queue::QueueStore& store, const QueueItemRecord& seen, const queue::QueueStore::Mutation& fn) {
  try {
    return store.Modify(seen.id, [&](QueueItemRecord& record) {
      if (record.status != seen.status || record.updated_at_ms != seen.updated_at_ms) {
        throw StaleRead();
      }
      fn(record);
    });
  } catch (const StaleRead&) {
    return std::nullopt;
  }
}

void MarkCancelled(QueueItemRecord& record) {
  record.status             = trackq::v1::ITEM_STATUS_FAILED;
  record.error_message      = kCancelledByUser;
  record.next_attempt_at_ms = 0;
}

void MarkPaused(QueueItemRecord& record) {
  record.status             = trackq::v1::ITEM_STATUS_PAUSED;
  record.next_attempt_at_ms = 0;
}

} // namespace

QueueManager::QueueManager(std::shared_ptr<queue::QueueStore> store, std::shared_ptr<scheduler::DownloadScheduler> scheduler,
                           std::shared_ptr<notify::NotificationBridge> bridge)
    : store_(std::move(store)), scheduler_(std::move(scheduler)), bridge_(std::move(bridge)) {
  if (!store_ || !scheduler_ || !bridge_) {
    throw std::invalid_argument("queue manager requires store, scheduler and bridge");
  }
}

void QueueManager::Start() {
  const auto interrupted = store_->ResetInterrupted();
  if (!interrupted.empty()) {
    TRACKQ_LOG_INFO("requeued interrupted downloads", {IntField("count", static_cast<int64_t>(interrupted.size()))});
  }
  scheduler_->Start();
}

void QueueManager::Stop() {
  scheduler_->Stop();
  bridge_->Flush();
}

QueueItemRecord QueueManager::Enqueue(const std::string& id, trackq::v1::ItemType type, const EnqueueHints& hints) {
  if (id.empty()) {
    throw util::InvalidArgument("item id must not be empty");
  }
  if (!trackq::v1::ItemType_IsValid(type) || type == trackq::v1::ITEM_TYPE_UNSPECIFIED) {
    throw util::InvalidArgument("item type must be set for " + id);
  }

  QueueItemRecord item;
  item.id     = id;
  item.type   = type;
  item.status = trackq::v1::ITEM_STATUS_PENDING;
  item.title  = hints.title;
  item.artist = hints.artist;
  item.album  = hints.album;

  auto added = store_->Add(std::move(item));
  scheduler_->Wake();

  TRACKQ_LOG_INFO("item enqueued", {StringField("item_id", id), IntField("type", type)});
  return added;
}

QueueItemRecord QueueManager::StopDownloading(const std::string& id, StopRequest request, const queue::QueueStore::Mutation& orphan) {
  while (true) {
    auto item = store_->GetById(id);
    if (item.status != trackq::v1::ITEM_STATUS_DOWNLOADING) {
      return item;
    }
    if (scheduler_->RequestStop(id, request)) {
      TRACKQ_LOG_INFO("stop requested", {StringField("item_id", id), StringField("request", scheduler::ToString(request))});
      return item;
    }
    // nobody holds a row that is still downloading with the same stamp
    if (auto applied = Transition(*store_, item, orphan)) {
      TRACKQ_LOG_WARN("stopped orphaned download", {StringField("item_id", id), StringField("request", scheduler::ToString(request))});
      return *applied;
    }
  }
}

// Runs inside the deleting transaction, so the holder cannot change under it.
void QueueManager::AbandonDownload(const QueueItemRecord& item) {
  if (item.status == trackq::v1::ITEM_STATUS_DOWNLOADING) {
    scheduler_->RequestStop(item.id, StopRequest::Remove);
  }
}

QueueItemRecord QueueManager::Pause(const std::string& id) {
  while (true) {
    auto item = store_->GetById(id);
    switch (item.status) {
      case trackq::v1::ITEM_STATUS_PAUSED:
        return item;
      case trackq::v1::ITEM_STATUS_DOWNLOADING: {
        auto seen = StopDownloading(id, StopRequest::Pause, MarkPaused);
        if (seen.status == trackq::v1::ITEM_STATUS_DOWNLOADING || seen.status == trackq::v1::ITEM_STATUS_PAUSED) {
          return seen;
        }
        continue;
      }
      default:
        ThrowInvalidTransition(item, "pause");
    }
  }
}

QueueItemRecord QueueManager::Resume(const std::string& id) {
  while (true) {
    auto item = store_->GetById(id);
    if (item.status != trackq::v1::ITEM_STATUS_PAUSED) {
      ThrowInvalidTransition(item, "resume");
    }

    auto resumed = Transition(*store_, item, [](QueueItemRecord& record) {
      record.status             = trackq::v1::ITEM_STATUS_PENDING;
      record.next_attempt_at_ms = 0;
    });
    if (!resumed) continue;

    scheduler_->Wake();
    TRACKQ_LOG_INFO("item resumed", {StringField("item_id", id)});
    return *resumed;
  }
}

QueueItemRecord QueueManager::Retry(const std::string& id) {
  while (true) {
    auto item = store_->GetById(id);
    if (item.status != trackq::v1::ITEM_STATUS_COMPLETED && item.status != trackq::v1::ITEM_STATUS_FAILED) {
      ThrowInvalidTransition(item, "retry");
    }

    // terminal items are not held by any worker, so children can be reset first
    uint64_t reset_children = 0;
    if (db::model::IsComposite(item.type)) {
      reset_children = store_->ResetFailedChildren(id);
    }

    auto retried = Transition(*store_, item, [](QueueItemRecord& record) {
      record.status             = trackq::v1::ITEM_STATUS_PENDING;
      record.retry_count        = 0;
      record.next_attempt_at_ms = 0;
      record.error_message.clear();
      if (db::model::IsComposite(record.type)) {
        queue::ApplyCompositeProgress(record);
      } else {
        record.progress         = 0;
        record.bytes_downloaded = 0;
      }
    });
    if (!retried) continue;

    scheduler_->Wake();
    TRACKQ_LOG_INFO("item retried", {StringField("item_id", id), IntField("reset_children", static_cast<int64_t>(reset_children))});
    return *retried;
  }
}

QueueItemRecord QueueManager::Cancel(const std::string& id) {
  while (true) {
    auto item = store_->GetById(id);
    switch (item.status) {
      case trackq::v1::ITEM_STATUS_PENDING:
      case trackq::v1::ITEM_STATUS_PAUSED: {
        auto cancelled = Transition(*store_, item, MarkCancelled);
        if (!cancelled) continue;
        TRACKQ_LOG_INFO("item cancelled", {StringField("item_id", id)});
        return *cancelled;
      }
      case trackq::v1::ITEM_STATUS_DOWNLOADING: {
        auto seen = StopDownloading(id, StopRequest::Cancel, MarkCancelled);
        if (seen.status == trackq::v1::ITEM_STATUS_DOWNLOADING ||
            (seen.status == trackq::v1::ITEM_STATUS_FAILED && seen.error_message == kCancelledByUser)) {
          return seen;
        }
        continue;
      }
      default:
        ThrowInvalidTransition(item, "cancel");
    }
  }
}

void QueueManager::Remove(const std::string& id) {
  store_->Remove(id, [this](const QueueItemRecord& item) { AbandonDownload(item); });
  TRACKQ_LOG_INFO("item removed", {StringField("item_id", id)});
}

std::vector<QueueItemRecord> QueueManager::List(uint64_t offset, uint64_t limit, std::optional<trackq::v1::ItemStatus> status) {
  if (status.has_value()) {
    return store_->GetByStatus(*status, offset, limit);
  }
  return store_->GetAll(offset, limit);
}

QueueItemRecord QueueManager::Get(const std::string& id) {
  return store_->GetById(id);
}

db::model::QueueStats QueueManager::Stats() {
  return store_->GetStats();
}

std::vector<db::model::HistoryRecord> QueueManager::History(uint64_t offset, uint64_t limit) {
  return store_->GetHistory(offset, limit);
}

std::vector<db::model::ChildTrackRecord> QueueManager::FailedTracks(const std::string& id) {
  // NotFound for unknown ids rather than an empty list
  store_->GetById(id);
  return store_->GetFailedChildren(id);
}

uint64_t QueueManager::ClearCompleted() {
  const auto removed = store_->ClearCompleted();
  TRACKQ_LOG_INFO("cleared completed items", {IntField("count", static_cast<int64_t>(removed))});
  return removed;
}

uint64_t QueueManager::ClearAll() {
  const auto removed = store_->ClearAll([this](const QueueItemRecord& item) { AbandonDownload(item); });
  TRACKQ_LOG_INFO("cleared queue", {IntField("count", static_cast<int64_t>(removed))});
  return removed;
}

notify::NotificationBridge::SubscriptionId QueueManager::Subscribe(notify::NotificationBridge::Listener listener) {
  return bridge_->Subscribe(std::move(listener));
}

void QueueManager::Unsubscribe(notify::NotificationBridge::SubscriptionId id) {
  bridge_->Unsubscribe(id);
}

} // namespace trackq::core
