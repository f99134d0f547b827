#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace trackq::db::memory {

namespace {

bool CreatedBefore(const model::QueueItemRecord& a, const model::QueueItemRecord& b) {
  return std::tie(a.created_at_ms, a.id) < std::tie(b.created_at_ms, b.id);
}

bool ClaimsBefore(const model::QueueItemRecord& a, const model::QueueItemRecord& b) {
  return std::tie(a.updated_at_ms, a.created_at_ms, a.id) < std::tie(b.updated_at_ms, b.created_at_ms, b.id);
}

template <typename T>
std::vector<T> Page(std::vector<T> rows, uint64_t offset, uint64_t limit) {
  if (offset >= rows.size()) return {};
  auto first = rows.begin() + static_cast<std::ptrdiff_t>(offset);
  auto last  = (limit == 0 || offset + limit >= rows.size()) ? rows.end() : first + static_cast<std::ptrdiff_t>(limit);
  return std::vector<T>(std::make_move_iterator(first), std::make_move_iterator(last));
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertItem(Transaction& t, const model::QueueItemRecord& r) {
  if (TX(t).View().items.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "queue item already exists: " + r.id);
  TX(t).Mutable().items[r.id] = r;
  return Result::Ok();
}

std::optional<model::QueueItemRecord> MemoryRepository::GetItem(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.items.find(id);
  if (it == s.items.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateItem(Transaction& t, const model::QueueItemRecord& r) {
  if (!TX(t).View().items.contains(r.id)) return Result::Err(ErrorCode::NotFound, "queue item not found: " + r.id);
  TX(t).Mutable().items[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteItem(Transaction& t, const std::string& id) {
  if (!TX(t).View().items.contains(id)) return Result::Err(ErrorCode::NotFound, "queue item not found: " + id);
  auto& s = TX(t).Mutable();
  s.items.erase(id);
  s.children.erase(id);
  return Result::Ok();
}

std::vector<model::QueueItemRecord> MemoryRepository::ListItems(Transaction& t, uint64_t offset, uint64_t limit) {
  const auto&                         s = TX(t).View();
  std::vector<model::QueueItemRecord> rows;
  rows.reserve(s.items.size());
  for (const auto& [_, record] : s.items) {
    rows.push_back(record);
  }
  std::sort(rows.begin(), rows.end(), CreatedBefore);
  return Page(std::move(rows), offset, limit);
}

std::vector<model::QueueItemRecord> MemoryRepository::ListItemsByStatus(Transaction& t, trackq::v1::ItemStatus status,
                                                                        uint64_t offset, uint64_t limit) {
  const auto&                         s = TX(t).View();
  std::vector<model::QueueItemRecord> rows;
  for (const auto& [_, record] : s.items) {
    if (record.status == status) rows.push_back(record);
  }
  std::sort(rows.begin(), rows.end(), CreatedBefore);
  return Page(std::move(rows), offset, limit);
}

std::optional<model::QueueItemRecord> MemoryRepository::NextPending(Transaction& t, uint64_t now_ms) {
  const auto&                   s    = TX(t).View();
  const model::QueueItemRecord* best = nullptr;
  for (const auto& [_, record] : s.items) {
    if (record.status != trackq::v1::ITEM_STATUS_PENDING || record.next_attempt_at_ms > now_ms) continue;
    if (!best || ClaimsBefore(record, *best)) best = &record;
  }
  if (!best) return std::nullopt;
  return *best;
}

model::QueueStats MemoryRepository::CountByStatus(Transaction& t) {
  model::QueueStats stats;
  for (const auto& [_, record] : TX(t).View().items) {
    ++stats.total;
    switch (record.status) {
      case trackq::v1::ITEM_STATUS_PENDING:
        ++stats.pending;
        break;
      case trackq::v1::ITEM_STATUS_DOWNLOADING:
        ++stats.downloading;
        break;
      case trackq::v1::ITEM_STATUS_PAUSED:
        ++stats.paused;
        break;
      case trackq::v1::ITEM_STATUS_COMPLETED:
        ++stats.completed;
        break;
      case trackq::v1::ITEM_STATUS_FAILED:
        ++stats.failed;
        break;
      default:
        break;
    }
  }
  return stats;
}

uint64_t MemoryRepository::DeleteCompleted(Transaction& t) {
  std::vector<std::string> doomed;
  for (const auto& [id, record] : TX(t).View().items) {
    if (record.status == trackq::v1::ITEM_STATUS_COMPLETED && !model::IsPartialSuccess(record)) doomed.push_back(id);
  }
  if (doomed.empty()) return 0;

  auto& s = TX(t).Mutable();
  for (const auto& id : doomed) {
    s.items.erase(id);
    s.children.erase(id);
  }
  return doomed.size();
}

uint64_t MemoryRepository::DeleteAllItems(Transaction& t) {
  const uint64_t removed = TX(t).View().items.size();
  if (removed == 0) return 0;

  auto& s = TX(t).Mutable();
  s.items.clear();
  s.children.clear();
  return removed;
}

Result MemoryRepository::UpsertChild(Transaction& t, const model::ChildTrackRecord& r) {
  if (!TX(t).View().items.contains(r.parent_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "parent queue item not found: " + r.parent_id);
  }
  TX(t).Mutable().children[r.parent_id][r.track_id] = r;
  return Result::Ok();
}

std::vector<model::ChildTrackRecord> MemoryRepository::GetChildren(Transaction& t, const std::string& parent_id) {
  const auto&                          s  = TX(t).View();
  std::vector<model::ChildTrackRecord> rows;
  auto                                 it = s.children.find(parent_id);
  if (it == s.children.end()) return rows;

  for (const auto& [_, child] : it->second) {
    rows.push_back(child);
  }
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    return std::tie(a.position, a.track_id) < std::tie(b.position, b.track_id);
  });
  return rows;
}

Result MemoryRepository::InsertHistory(Transaction& t, model::HistoryRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_history_id++;
  s.history.push_back(r);
  return Result::Ok();
}

std::vector<model::HistoryRecord> MemoryRepository::ListHistory(Transaction& t, uint64_t offset, uint64_t limit) {
  const auto& s = TX(t).View();
  std::vector<model::HistoryRecord> rows(s.history.rbegin(), s.history.rend());
  std::stable_sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    return a.downloaded_at_ms > b.downloaded_at_ms;
  });
  return Page(std::move(rows), offset, limit);
}

} // namespace trackq::db::memory
