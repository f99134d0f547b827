#include "queue_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace trackq::queue {

namespace {

using db::model::ChildTrackRecord;
using db::model::HistoryRecord;
using db::model::QueueItemRecord;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::DuplicateId(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

bool IsTerminal(trackq::v1::ItemStatus status) {
  return status == trackq::v1::ITEM_STATUS_COMPLETED || status == trackq::v1::ITEM_STATUS_FAILED;
}

void CheckInvariants(const QueueItemRecord& item) {
  if (item.id.empty()) {
    throw util::InvalidArgument("queue item id must not be empty");
  }
  if (item.type == trackq::v1::ITEM_TYPE_UNSPECIFIED) {
    throw util::InvalidArgument("queue item type must be set: " + item.id);
  }
  if (item.status == trackq::v1::ITEM_STATUS_UNSPECIFIED) {
    throw util::InvalidArgument("queue item status must be set: " + item.id);
  }
  if (item.progress > 100) {
    throw util::InvalidArgument("progress out of range for " + item.id + ": " + std::to_string(item.progress));
  }
  if (item.completed_tracks > item.total_tracks) {
    throw util::InvalidArgument("completed_tracks exceeds total_tracks for " + item.id);
  }
}

QueueItemRecord Tombstone(QueueItemRecord item) {
  item.status              = trackq::v1::ITEM_STATUS_UNSPECIFIED;
  item.speed_bytes_per_sec = 0;
  item.eta_seconds         = 0;
  return item;
}

} // namespace

QueueStore::QueueStore(std::shared_ptr<db::QueueRepository> repository, util::ClockFn clock, ItemObserver observer)
    : repository_(std::move(repository)), clock_(std::move(clock)), observer_(std::move(observer)) {
  if (!repository_) {
    throw std::invalid_argument("queue store requires a repository");
  }
  if (!clock_) {
    clock_ = util::Now;
  }
}

uint64_t QueueStore::NowMs() const {
  return util::ToUnixMillis(clock_());
}

uint64_t QueueStore::NextStamp(uint64_t previous) {
  std::lock_guard lock(stamp_mutex_);
  last_stamp_ms_ = std::max({NowMs(), last_stamp_ms_ + 1, previous + 1});
  return last_stamp_ms_;
}

void QueueStore::Notify(const QueueItemRecord& item) const {
  if (observer_) {
    observer_(item);
  }
}

void QueueStore::Persist(db::Transaction& tx, const QueueItemRecord& before, QueueItemRecord& after) {
  after.id            = before.id;
  after.created_at_ms = before.created_at_ms;
  CheckInvariants(after);

  after.updated_at_ms = NextStamp(before.updated_at_ms);

  if (after.status != trackq::v1::ITEM_STATUS_DOWNLOADING) {
    after.speed_bytes_per_sec = 0;
    after.eta_seconds         = 0;
  }

  // completed_at is written once, on the first terminal transition
  if (before.completed_at_ms != 0) {
    after.completed_at_ms = before.completed_at_ms;
  } else if (IsTerminal(after.status)) {
    after.completed_at_ms = after.updated_at_ms;
  } else {
    after.completed_at_ms = 0;
  }

  ThrowIfDbError(repository_->UpdateItem(tx, after), "update queue item " + after.id);
}

ChildCounts QueueStore::Count(const std::vector<ChildTrackRecord>& children) {
  ChildCounts counts;
  counts.total = static_cast<uint32_t>(children.size());
  for (const auto& child : children) {
    if (child.status == trackq::v1::CHILD_STATUS_COMPLETED) {
      ++counts.completed;
    } else if (child.status == trackq::v1::CHILD_STATUS_FAILED) {
      ++counts.failed;
    }
  }
  return counts;
}

// ------------------------------------------------------------------
// Queue items
// ------------------------------------------------------------------

QueueItemRecord QueueStore::Add(QueueItemRecord item) {
  if (item.status == trackq::v1::ITEM_STATUS_UNSPECIFIED) {
    item.status = trackq::v1::ITEM_STATUS_PENDING;
  }
  CheckInvariants(item);

  auto tx = repository_->Begin();
  if (repository_->GetItem(*tx, item.id).has_value()) {
    throw util::DuplicateId("queue item already exists: " + item.id);
  }

  item.created_at_ms   = NextStamp(0);
  item.updated_at_ms   = item.created_at_ms;
  item.completed_at_ms = IsTerminal(item.status) ? item.updated_at_ms : 0;

  ThrowIfDbError(repository_->InsertItem(*tx, item), "add queue item " + item.id);
  tx->Commit();

  Notify(item);
  return item;
}

QueueItemRecord QueueStore::Update(const QueueItemRecord& item) {
  auto tx     = repository_->Begin();
  auto stored = repository_->GetItem(*tx, item.id);
  if (!stored.has_value()) {
    throw util::NotFound("queue item not found: " + item.id);
  }

  auto updated = item;
  Persist(*tx, *stored, updated);
  tx->Commit();

  Notify(updated);
  return updated;
}

QueueItemRecord QueueStore::Modify(const std::string& id, const Mutation& fn) {
  auto tx     = repository_->Begin();
  auto stored = repository_->GetItem(*tx, id);
  if (!stored.has_value()) {
    throw util::NotFound("queue item not found: " + id);
  }

  auto updated = *stored;
  fn(updated);
  Persist(*tx, *stored, updated);
  tx->Commit();

  Notify(updated);
  return updated;
}

QueueItemRecord QueueStore::GetById(const std::string& id) {
  auto tx     = repository_->Begin();
  auto stored = repository_->GetItem(*tx, id);
  tx->Commit();

  if (!stored.has_value()) {
    throw util::NotFound("queue item not found: " + id);
  }
  return *stored;
}

std::vector<QueueItemRecord> QueueStore::GetAll(uint64_t offset, uint64_t limit) {
  auto tx    = repository_->Begin();
  auto items = repository_->ListItems(*tx, offset, limit);
  tx->Commit();
  return items;
}

std::vector<QueueItemRecord> QueueStore::GetByStatus(trackq::v1::ItemStatus status, uint64_t offset, uint64_t limit) {
  auto tx    = repository_->Begin();
  auto items = repository_->ListItemsByStatus(*tx, status, offset, limit);
  tx->Commit();
  return items;
}

db::model::QueueStats QueueStore::GetStats() {
  auto tx    = repository_->Begin();
  auto stats = repository_->CountByStatus(*tx);
  tx->Commit();
  return stats;
}

void QueueStore::Remove(const std::string& id, const ItemObserver& on_remove) {
  auto tx     = repository_->Begin();
  auto stored = repository_->GetItem(*tx, id);
  if (!stored.has_value()) {
    throw util::NotFound("remove queue item " + id + ": not found");
  }
  ThrowIfDbError(repository_->DeleteItem(*tx, id), "remove queue item " + id);
  if (on_remove) {
    on_remove(*stored);
  }
  tx->Commit();

  Notify(Tombstone(*stored));
}

uint64_t QueueStore::ClearCompleted() {
  auto tx = repository_->Begin();

  std::vector<QueueItemRecord> doomed;
  for (auto& item : repository_->ListItemsByStatus(*tx, trackq::v1::ITEM_STATUS_COMPLETED, 0, 0)) {
    // partial successes stay so their failed tracks remain visible
    if (!db::model::IsPartialSuccess(item)) doomed.push_back(std::move(item));
  }
  auto removed = repository_->DeleteCompleted(*tx);
  tx->Commit();

  for (const auto& item : doomed) {
    Notify(Tombstone(item));
  }
  return removed;
}

uint64_t QueueStore::ClearAll(const ItemObserver& on_remove) {
  auto tx      = repository_->Begin();
  auto doomed  = repository_->ListItems(*tx, 0, 0);
  auto removed = repository_->DeleteAllItems(*tx);
  if (on_remove) {
    for (const auto& item : doomed) {
      on_remove(item);
    }
  }
  tx->Commit();

  for (const auto& item : doomed) {
    Notify(Tombstone(item));
  }
  return removed;
}

std::optional<QueueItemRecord> QueueStore::ClaimNextPending(const ItemObserver& on_claim) {
  auto tx   = repository_->Begin();
  auto next = repository_->NextPending(*tx, NowMs());
  if (!next.has_value()) {
    tx->Commit();
    return std::nullopt;
  }

  auto claimed               = *next;
  claimed.status             = trackq::v1::ITEM_STATUS_DOWNLOADING;
  claimed.next_attempt_at_ms = 0;
  Persist(*tx, *next, claimed);
  if (on_claim) {
    on_claim(claimed);
  }
  tx->Commit();

  Notify(claimed);
  return claimed;
}

std::vector<QueueItemRecord> QueueStore::ResetInterrupted() {
  auto tx          = repository_->Begin();
  auto interrupted = repository_->ListItemsByStatus(*tx, trackq::v1::ITEM_STATUS_DOWNLOADING, 0, 0);

  std::vector<QueueItemRecord> reset;
  reset.reserve(interrupted.size());
  for (const auto& item : interrupted) {
    auto updated               = item;
    updated.status             = trackq::v1::ITEM_STATUS_PENDING;
    updated.next_attempt_at_ms = 0;
    Persist(*tx, item, updated);
    reset.push_back(std::move(updated));
  }
  tx->Commit();

  for (const auto& item : reset) {
    Notify(item);
  }
  return reset;
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

void QueueStore::AddToHistory(HistoryRecord record) {
  try {
    if (record.downloaded_at_ms == 0) {
      record.downloaded_at_ms = NowMs();
    }
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertHistory(*tx, record), "add history for " + record.track_id);
    tx->Commit();
  } catch (const std::exception& e) {
    TRACKQ_LOG_ERROR("history write failed",
                     {observability::StringField("track_id", record.track_id), observability::StringField("error", e.what())});
  }
}

std::vector<HistoryRecord> QueueStore::GetHistory(uint64_t offset, uint64_t limit) {
  auto tx      = repository_->Begin();
  auto history = repository_->ListHistory(*tx, offset, limit);
  tx->Commit();
  return history;
}

// ------------------------------------------------------------------
// Child tracks
// ------------------------------------------------------------------

ChildTrackRecord QueueStore::UpsertChild(ChildTrackRecord child) {
  auto tx = repository_->Begin();
  if (!repository_->GetItem(*tx, child.parent_id).has_value()) {
    throw util::NotFound("queue item not found: " + child.parent_id);
  }

  child.updated_at_ms = NowMs();
  ThrowIfDbError(repository_->UpsertChild(*tx, child), "upsert child " + child.track_id + " of " + child.parent_id);
  tx->Commit();
  return child;
}

std::vector<ChildTrackRecord> QueueStore::GetChildren(const std::string& parent_id) {
  auto tx       = repository_->Begin();
  auto children = repository_->GetChildren(*tx, parent_id);
  tx->Commit();
  return children;
}

std::vector<ChildTrackRecord> QueueStore::GetFailedChildren(const std::string& parent_id) {
  auto children = GetChildren(parent_id);
  children.erase(std::remove_if(children.begin(), children.end(),
                                [](const ChildTrackRecord& child) { return child.status != trackq::v1::CHILD_STATUS_FAILED; }),
                 children.end());
  return children;
}

ChildCounts QueueStore::CountChildren(const std::string& parent_id) {
  return Count(GetChildren(parent_id));
}

uint64_t QueueStore::ResetFailedChildren(const std::string& parent_id) {
  auto tx       = repository_->Begin();
  auto children = repository_->GetChildren(*tx, parent_id);

  uint64_t   reset = 0;
  const auto now   = NowMs();
  for (auto& child : children) {
    if (child.status != trackq::v1::CHILD_STATUS_FAILED) continue;
    child.status        = trackq::v1::CHILD_STATUS_PENDING;
    child.error_message.clear();
    child.attempts      = 0;
    child.updated_at_ms = now;
    ThrowIfDbError(repository_->UpsertChild(*tx, child), "reset child " + child.track_id + " of " + parent_id);
    ++reset;
  }
  tx->Commit();
  return reset;
}

QueueItemRecord QueueStore::CommitChild(ChildTrackRecord child, const ChildMutation& fn) {
  auto tx     = repository_->Begin();
  auto parent = repository_->GetItem(*tx, child.parent_id);
  if (!parent.has_value()) {
    throw util::NotFound("queue item not found: " + child.parent_id);
  }

  child.updated_at_ms = NowMs();
  ThrowIfDbError(repository_->UpsertChild(*tx, child), "upsert child " + child.track_id + " of " + child.parent_id);

  const auto counts  = Count(repository_->GetChildren(*tx, child.parent_id));
  auto       updated = *parent;
  updated.total_tracks     = std::max(updated.total_tracks, counts.total);
  updated.completed_tracks = counts.completed;
  if (fn) {
    fn(updated, counts);
  }
  Persist(*tx, *parent, updated);
  tx->Commit();

  Notify(updated);
  return updated;
}

} // namespace trackq::queue
