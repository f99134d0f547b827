#include "queue_service.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace trackq::service {

using namespace trackq::v1;

namespace {

// Runs one route; failures are logged and rethrown unchanged.
template <typename Fn>
auto Route(const char* route, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const std::exception& ex) {
    TRACKQ_LOG_WARN("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    throw;
  }
}

void RequireId(const ItemRequest& req) {
  if (req.id().empty()) {
    throw util::InvalidArgument("id is required");
  }
}

ItemResponse ItemReply(const db::model::QueueItemRecord& record) {
  ItemResponse resp;
  *resp.mutable_item() = ToProto(record);
  return resp;
}

} // namespace

// ------------------------------------------------------------------
// Conversions
// ------------------------------------------------------------------

QueueItem ToProto(const db::model::QueueItemRecord& record) {
  QueueItem item;
  item.set_id(record.id);
  item.set_type(record.type);
  item.set_title(record.title);
  item.set_artist(record.artist);
  item.set_album(record.album);
  item.set_status(record.status);
  item.set_progress(record.progress);
  item.set_output_path(record.output_path);
  item.set_download_url(record.download_url);
  item.set_error_message(record.error_message);
  item.set_retry_count(record.retry_count);
  item.set_total_tracks(record.total_tracks);
  item.set_completed_tracks(record.completed_tracks);
  item.set_bytes_downloaded(record.bytes_downloaded);
  item.set_total_bytes(record.total_bytes);
  item.set_speed_bytes_per_sec(record.speed_bytes_per_sec);
  item.set_eta_seconds(record.eta_seconds);
  *item.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *item.mutable_updated_at() = util::MillisToProto(record.updated_at_ms);
  if (record.completed_at_ms != 0) {
    *item.mutable_completed_at() = util::MillisToProto(record.completed_at_ms);
  }
  item.set_partial_success(db::model::IsPartialSuccess(record));
  item.set_removed(db::model::IsRemoved(record));
  return item;
}

ChildTrack ToProto(const db::model::ChildTrackRecord& record) {
  ChildTrack child;
  child.set_parent_id(record.parent_id);
  child.set_track_id(record.track_id);
  child.set_position(record.position);
  child.set_title(record.title);
  child.set_artist(record.artist);
  child.set_status(record.status);
  child.set_error_message(record.error_message);
  child.set_attempts(record.attempts);
  child.set_file_path(record.file_path);
  child.set_file_size_bytes(record.file_size_bytes);
  return child;
}

HistoryEntry ToProto(const db::model::HistoryRecord& record) {
  HistoryEntry entry;
  entry.set_id(record.id);
  entry.set_track_id(record.track_id);
  entry.set_title(record.title);
  entry.set_artist(record.artist);
  entry.set_album(record.album);
  entry.set_file_path(record.file_path);
  entry.set_file_size_bytes(record.file_size_bytes);
  entry.set_quality(record.quality);
  *entry.mutable_downloaded_at() = util::MillisToProto(record.downloaded_at_ms);
  return entry;
}

QueueStats ToProto(const db::model::QueueStats& stats) {
  QueueStats out;
  out.set_total(stats.total);
  out.set_pending(stats.pending);
  out.set_downloading(stats.downloading);
  out.set_paused(stats.paused);
  out.set_completed(stats.completed);
  out.set_failed(stats.failed);
  return out;
}

// ------------------------------------------------------------------
// Routes
// ------------------------------------------------------------------

QueueService::QueueService(std::shared_ptr<core::QueueManager> manager) : manager_(std::move(manager)) {
  if (!manager_) {
    throw std::invalid_argument("queue service requires a manager");
  }
}

EnqueueResponse QueueService::Enqueue(const EnqueueRequest& req) {
  return Route("QueueService.Enqueue", [&] {
    core::EnqueueHints hints;
    hints.title  = req.title();
    hints.artist = req.artist();
    hints.album  = req.album();

    EnqueueResponse resp;
    *resp.mutable_item() = ToProto(manager_->Enqueue(req.id(), req.type(), hints));
    return resp;
  });
}

ItemResponse QueueService::Pause(const ItemRequest& req) {
  return Route("QueueService.Pause", [&] {
    RequireId(req);
    return ItemReply(manager_->Pause(req.id()));
  });
}

ItemResponse QueueService::Resume(const ItemRequest& req) {
  return Route("QueueService.Resume", [&] {
    RequireId(req);
    return ItemReply(manager_->Resume(req.id()));
  });
}

ItemResponse QueueService::Retry(const ItemRequest& req) {
  return Route("QueueService.Retry", [&] {
    RequireId(req);
    return ItemReply(manager_->Retry(req.id()));
  });
}

ItemResponse QueueService::Cancel(const ItemRequest& req) {
  return Route("QueueService.Cancel", [&] {
    RequireId(req);
    return ItemReply(manager_->Cancel(req.id()));
  });
}

RemoveResponse QueueService::Remove(const ItemRequest& req) {
  return Route("QueueService.Remove", [&] {
    RequireId(req);
    manager_->Remove(req.id());
    return RemoveResponse{};
  });
}

ItemResponse QueueService::Get(const ItemRequest& req) {
  return Route("QueueService.Get", [&] {
    RequireId(req);
    return ItemReply(manager_->Get(req.id()));
  });
}

ListResponse QueueService::List(const ListRequest& req) {
  return Route("QueueService.List", [&] {
    std::optional<ItemStatus> status;
    if (req.status() != ITEM_STATUS_UNSPECIFIED) {
      status = req.status();
    }

    ListResponse resp;
    for (const auto& record : manager_->List(req.offset(), req.limit(), status)) {
      *resp.add_items() = ToProto(record);
    }
    return resp;
  });
}

StatsResponse QueueService::Stats(const StatsRequest&) {
  return Route("QueueService.Stats", [&] {
    StatsResponse resp;
    *resp.mutable_stats() = ToProto(manager_->Stats());
    return resp;
  });
}

HistoryResponse QueueService::History(const HistoryRequest& req) {
  return Route("QueueService.History", [&] {
    HistoryResponse resp;
    for (const auto& record : manager_->History(req.offset(), req.limit())) {
      *resp.add_entries() = ToProto(record);
    }
    return resp;
  });
}

FailedTracksResponse QueueService::FailedTracks(const ItemRequest& req) {
  return Route("QueueService.FailedTracks", [&] {
    RequireId(req);
    FailedTracksResponse resp;
    for (const auto& record : manager_->FailedTracks(req.id())) {
      *resp.add_tracks() = ToProto(record);
    }
    return resp;
  });
}

ClearResponse QueueService::ClearCompleted(const ClearRequest&) {
  return Route("QueueService.ClearCompleted", [&] {
    ClearResponse resp;
    resp.set_removed(manager_->ClearCompleted());
    return resp;
  });
}

ClearResponse QueueService::ClearAll(const ClearRequest&) {
  return Route("QueueService.ClearAll", [&] {
    ClearResponse resp;
    resp.set_removed(manager_->ClearAll());
    return resp;
  });
}

notify::NotificationBridge::SubscriptionId QueueService::Watch(WatchListener listener) {
  return manager_->Subscribe([listener = std::move(listener)](const db::model::QueueItemRecord& record) { listener(ToProto(record)); });
}

void QueueService::Unwatch(notify::NotificationBridge::SubscriptionId id) {
  manager_->Unsubscribe(id);
}

} // namespace trackq::service
