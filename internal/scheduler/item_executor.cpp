#include "item_executor.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/pipeline/output_path.hpp"
#include "internal/queue/progress.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace trackq::scheduler {

using db::model::ChildTrackRecord;
using db::model::QueueItemRecord;
using observability::IntField;
using observability::StringField;

namespace {

constexpr const char* kCancelledByUser = "cancelled by user";

void ApplyResolvedMetadata(QueueItemRecord& item, const pipeline::ResolvedItem& resolved) {
  if (!resolved.title.empty()) item.title = resolved.title;
  if (!resolved.artist.empty()) item.artist = resolved.artist;
  if (!resolved.album.empty()) item.album = resolved.album;
}

// Resting state of an item whose run ended on `request`.
void ApplyStop(QueueItemRecord& record, StopRequest request) {
  switch (request) {
    case StopRequest::Remove:
      // the requester deletes the row
      return;
    case StopRequest::Cancel:
      record.status             = trackq::v1::ITEM_STATUS_FAILED;
      record.error_message      = kCancelledByUser;
      record.next_attempt_at_ms = 0;
      return;
    case StopRequest::Pause:
      record.status             = trackq::v1::ITEM_STATUS_PAUSED;
      record.next_attempt_at_ms = 0;
      return;
    case StopRequest::Shutdown:
    case StopRequest::None:
      record.status = trackq::v1::ITEM_STATUS_PENDING;
      return;
  }
}

ExecutionResult StopResult(const std::string& id, StopRequest request) {
  if (request == StopRequest::Remove) {
    TRACKQ_LOG_INFO("item removed while executing", {StringField("item_id", id)});
    return ExecutionResult::Abandoned;
  }
  TRACKQ_LOG_INFO("item stopped", {StringField("item_id", id), StringField("request", ToString(request))});
  return ExecutionResult::Stopped;
}

} // namespace

const char* ToString(ExecutionResult result) {
  switch (result) {
    case ExecutionResult::Completed:
      return "completed";
    case ExecutionResult::Failed:
      return "failed";
    case ExecutionResult::Requeued:
      return "requeued";
    case ExecutionResult::Stopped:
      return "stopped";
    case ExecutionResult::Abandoned:
      return "abandoned";
  }
  return "unknown";
}

ItemExecutor::ItemExecutor(std::shared_ptr<queue::QueueStore> store, std::shared_ptr<pipeline::CatalogClient> catalog,
                           std::shared_ptr<pipeline::TrackDownloader> downloader, queue::RetryPolicy retry_policy,
                           ExecutorOptions options)
    : store_(std::move(store)),
      catalog_(std::move(catalog)),
      downloader_(std::move(downloader)),
      retry_policy_(retry_policy),
      options_(std::move(options)) {
  if (!store_ || !catalog_ || !downloader_) {
    throw std::invalid_argument("item executor requires store, catalog and downloader");
  }
}

ExecutionResult ItemExecutor::Execute(const QueueItemRecord& claimed, ItemControl& control) {
  try {
    if (control.StopRequested()) {
      return HandleStop(claimed.id, control);
    }
    return db::model::IsComposite(claimed.type) ? RunComposite(claimed, control) : RunLeaf(claimed, control);
  } catch (const util::NotFound&) {
    TRACKQ_LOG_INFO("item removed while executing", {StringField("item_id", claimed.id)});
    return ExecutionResult::Abandoned;
  } catch (...) {
    auto error = std::current_exception();
    if (control.StopRequested()) {
      return HandleStop(claimed.id, control);
    }
    return HandleFailure(claimed.id, control, error);
  }
}

// ------------------------------------------------------------------
// Leaf tracks
// ------------------------------------------------------------------

ExecutionResult ItemExecutor::RunLeaf(const QueueItemRecord& item, ItemControl& control) {
  const auto resolved = catalog_->Resolve(item.id, trackq::v1::ITEM_TYPE_TRACK);

  const auto folder      = pipeline::ItemFolder(options_.output_dir, trackq::v1::ITEM_TYPE_TRACK, resolved.artist, resolved.album,
                                                resolved.title);
  const auto destination = folder / pipeline::TrackFileName(trackq::v1::ITEM_TYPE_TRACK, resolved.track_number, resolved.artist,
                                                            resolved.title, options_.quality);

  store_->Modify(item.id, [&](QueueItemRecord& record) {
    ApplyResolvedMetadata(record, resolved);
    record.output_path  = destination.string();
    record.download_url = resolved.stream_locator;
  });

  queue::LeafProgress progress(item.progress, options_.progress_step);
  queue::TransferRate rate(util::Now());

  const auto outcome = downloader_->Download(resolved, destination, [&](uint64_t done, uint64_t total) {
    if (control.StopRequested()) {
      return false;
    }
    if (progress.Advance(queue::TransferPercent(done, total))) {
      rate.Sample(done, total, util::Now());
      store_->Modify(item.id, [&](QueueItemRecord& record) {
        record.progress            = std::max(record.progress, progress.Current());
        record.bytes_downloaded    = done;
        record.total_bytes         = total;
        record.speed_bytes_per_sec = rate.BytesPerSecond();
        record.eta_seconds         = rate.EtaSeconds();
      });
    }
    return true;
  });

  if (!outcome.completed) {
    return HandleStop(item.id, control);
  }

  auto       stopped = StopRequest::None;
  const auto done    = Settle(
      item.id, control, StopRequest::Pause,
      [&](QueueItemRecord& record) {
        record.status           = trackq::v1::ITEM_STATUS_COMPLETED;
        record.progress         = 100;
        record.output_path      = outcome.path.string();
        record.bytes_downloaded = outcome.bytes;
        record.total_bytes      = std::max(record.total_bytes, outcome.bytes);
        record.error_message.clear();
      },
      stopped);
  if (stopped != StopRequest::None) {
    return StopResult(item.id, stopped);
  }

  TRACKQ_LOG_INFO("track downloaded", {StringField("item_id", item.id), StringField("path", outcome.path.string()),
                                       IntField("bytes", static_cast<int64_t>(outcome.bytes))});
  RecordHistory(done, outcome.path.string(), outcome.bytes);
  return ExecutionResult::Completed;
}

// ------------------------------------------------------------------
// Composite items
// ------------------------------------------------------------------

ExecutionResult ItemExecutor::RunComposite(const QueueItemRecord& item, ItemControl& control) {
  const auto resolved = catalog_->Resolve(item.id, item.type);
  if (resolved.children.empty()) {
    throw util::ContentUnavailable("no tracks to download for " + item.id);
  }

  const auto folder = pipeline::ItemFolder(options_.output_dir, item.type, resolved.artist, resolved.album, resolved.title);

  // children known from an earlier run keep their state
  std::unordered_set<std::string> known;
  for (const auto& child : store_->GetChildren(item.id)) {
    known.insert(child.track_id);
  }
  for (const auto& ref : resolved.children) {
    if (known.contains(ref.track_id)) continue;
    ChildTrackRecord child;
    child.parent_id = item.id;
    child.track_id  = ref.track_id;
    child.position  = ref.position;
    child.title     = ref.title;
    child.artist    = ref.artist;
    child.status    = trackq::v1::CHILD_STATUS_PENDING;
    store_->UpsertChild(std::move(child));
  }

  const auto registered = store_->CountChildren(item.id);
  auto       parent     = store_->Modify(item.id, [&](QueueItemRecord& record) {
    ApplyResolvedMetadata(record, resolved);
    record.output_path      = folder.string();
    record.total_tracks     = registered.total;
    record.completed_tracks = registered.completed;
    queue::ApplyCompositeProgress(record);
  });

  for (auto& child : store_->GetChildren(item.id)) {
    if (child.status == trackq::v1::CHILD_STATUS_COMPLETED || child.status == trackq::v1::CHILD_STATUS_FAILED) continue;

    if (control.StopRequested() || !DownloadChild(parent, folder, child, control)) {
      return HandleStop(item.id, control);
    }

    parent = store_->CommitChild(child, [](QueueItemRecord& record, const queue::ChildCounts&) {
      queue::ApplyCompositeProgress(record);
    });
  }

  const auto counts = store_->CountChildren(item.id);
  if (counts.completed == 0) {
    throw util::ContentUnavailable("none of the " + std::to_string(counts.total) + " tracks could be downloaded");
  }

  uint64_t total_size = 0;
  for (const auto& child : store_->GetChildren(item.id)) {
    if (child.status == trackq::v1::CHILD_STATUS_COMPLETED) total_size += child.file_size_bytes;
  }

  auto       stopped = StopRequest::None;
  const auto done    = Settle(
      item.id, control, StopRequest::Pause,
      [&](QueueItemRecord& record) {
        record.status           = trackq::v1::ITEM_STATUS_COMPLETED;
        record.total_tracks     = counts.total;
        record.completed_tracks = counts.completed;
        record.bytes_downloaded = total_size;
        record.total_bytes      = std::max(record.total_bytes, total_size);
        record.error_message.clear();
        queue::ApplyCompositeProgress(record);
      },
      stopped);
  if (stopped != StopRequest::None) {
    return StopResult(item.id, stopped);
  }

  if (db::model::IsPartialSuccess(done)) {
    TRACKQ_LOG_WARN("composite completed with missing tracks",
                    {StringField("item_id", item.id), IntField("completed", done.completed_tracks), IntField("total", done.total_tracks)});
  } else {
    TRACKQ_LOG_INFO("composite completed", {StringField("item_id", item.id), IntField("tracks", done.completed_tracks)});
  }

  RecordHistory(done, folder.string(), total_size);
  return ExecutionResult::Completed;
}

bool ItemExecutor::DownloadChild(const QueueItemRecord& parent, const std::filesystem::path& folder, ChildTrackRecord& child,
                                 ItemControl& control) {
  while (true) {
    ++child.attempts;
    try {
      const auto track  = catalog_->Resolve(child.track_id, trackq::v1::ITEM_TYPE_TRACK);
      const auto number = (parent.type == trackq::v1::ITEM_TYPE_ALBUM && track.track_number > 0) ? track.track_number : child.position;
      const auto destination =
          folder / pipeline::TrackFileName(parent.type, number, track.artist, track.title, options_.quality);

      const auto outcome = downloader_->Download(track, destination, [&](uint64_t, uint64_t) { return !control.StopRequested(); });
      if (!outcome.completed) {
        return false;
      }

      if (!track.title.empty()) child.title = track.title;
      if (!track.artist.empty()) child.artist = track.artist;
      child.status          = trackq::v1::CHILD_STATUS_COMPLETED;
      child.file_path       = outcome.path.string();
      child.file_size_bytes = outcome.bytes;
      child.error_message.clear();
      return true;
    } catch (const util::AuthError&) {
      throw;
    } catch (const util::DiskError&) {
      throw;
    } catch (const std::exception& e) {
      const auto failure = queue::RetryPolicy::Classify(e);
      if (retry_policy_.ShouldRetryChild(child.attempts, failure)) {
        TRACKQ_LOG_WARN("child track failed, retrying", {StringField("item_id", parent.id), StringField("track_id", child.track_id),
                                                         IntField("attempt", child.attempts), StringField("error", e.what())});
        if (!control.WaitFor(std::chrono::milliseconds(retry_policy_.BackoffMs(child.attempts)))) {
          return false;
        }
        continue;
      }

      TRACKQ_LOG_WARN("child track failed", {StringField("item_id", parent.id), StringField("track_id", child.track_id),
                                             StringField("error", e.what())});
      child.status        = trackq::v1::CHILD_STATUS_FAILED;
      child.error_message = e.what();
      return true;
    }
  }
}

// ------------------------------------------------------------------
// Stop / failure handling
// ------------------------------------------------------------------

QueueItemRecord ItemExecutor::Settle(const std::string& id, ItemControl& control, StopRequest overridden_by,
                                     const queue::QueueStore::Mutation& outcome, StopRequest& applied) {
  applied = StopRequest::None;
  return store_->Modify(id, [&](QueueItemRecord& record) {
    const auto requested = control.Seal();
    if (requested != StopRequest::None && static_cast<int>(requested) >= static_cast<int>(overridden_by)) {
      applied = requested;
      ApplyStop(record, requested);
      return;
    }
    applied = StopRequest::None;
    outcome(record);
  });
}

ExecutionResult ItemExecutor::HandleStop(const std::string& id, ItemControl& control) {
  auto applied = StopRequest::None;
  try {
    Settle(id, control, StopRequest::Shutdown, [](QueueItemRecord& record) { ApplyStop(record, StopRequest::None); }, applied);
  } catch (const util::NotFound&) {
    return ExecutionResult::Abandoned;
  } catch (const std::exception& e) {
    TRACKQ_LOG_ERROR("stop could not be persisted", {StringField("item_id", id), StringField("request", ToString(control.Requested())),
                                                     StringField("error", e.what())});
    return ExecutionResult::Stopped;
  }
  return StopResult(id, applied);
}

ExecutionResult ItemExecutor::HandleFailure(const std::string& id, ItemControl& control, std::exception_ptr error) {
  const auto message = queue::RetryPolicy::Describe(error);
  const auto failure = queue::RetryPolicy::Classify(error);

  try {
    // the message is persisted while the item is still downloading
    store_->Modify(id, [&](QueueItemRecord& record) { record.error_message = message; });

    auto       result  = ExecutionResult::Failed;
    auto       stopped = StopRequest::None;
    const auto after   = Settle(
        id, control, StopRequest::Shutdown,
        [&](QueueItemRecord& record) {
          const auto decision = retry_policy_.Decide(record, failure);
          retry_policy_.Apply(record, decision, message, store_->NowMs());
          result = decision.requeue ? ExecutionResult::Requeued : ExecutionResult::Failed;
        },
        stopped);

    if (stopped != StopRequest::None) {
      TRACKQ_LOG_INFO("stop request overrides failure", {StringField("item_id", id), StringField("error", message)});
      return StopResult(id, stopped);
    }
    if (result == ExecutionResult::Requeued) {
      TRACKQ_LOG_WARN("item requeued after failure", {StringField("item_id", id), IntField("retry_count", after.retry_count),
                                                      StringField("error", message)});
    } else {
      TRACKQ_LOG_ERROR("item failed", {StringField("item_id", id), IntField("retry_count", after.retry_count),
                                       StringField("error", message)});
    }
    return result;
  } catch (const util::NotFound&) {
    return ExecutionResult::Abandoned;
  } catch (const std::exception& e) {
    TRACKQ_LOG_ERROR("failure could not be persisted",
                     {StringField("item_id", id), StringField("error", message), StringField("store_error", e.what())});
    return ExecutionResult::Failed;
  }
}

void ItemExecutor::RecordHistory(const QueueItemRecord& item, const std::string& file_path, uint64_t size_bytes) {
  db::model::HistoryRecord record;
  record.track_id        = item.id;
  record.title           = item.title;
  record.artist          = item.artist;
  record.album           = item.album;
  record.file_path       = file_path;
  record.file_size_bytes = size_bytes;
  record.quality         = options_.quality;
  store_->AddToHistory(std::move(record));
}

} // namespace trackq::scheduler
