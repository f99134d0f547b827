#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace trackq::queue {

struct ChildCounts {
  uint32_t total     = 0;
  uint32_t completed = 0;
  uint32_t failed    = 0;

  uint32_t Finished() const {
    return completed + failed;
  }
};

/*
  Durable queue facade used by the engine.

  Every mutation runs in one repository transaction, so writes to the same
  id are serialized and a read-modify-write through Modify() is atomic.

  updated_at strictly increases on every mutation of an item and is unique
  across the store; claim order relies on it.

  The observer (if any) is invoked after each committed item mutation with
  the persisted snapshot. A deleted item is reported once more as a
  tombstone (status unspecified, see db::model::IsRemoved). The observer
  runs on the mutating thread and must not call back into the store.
*/
class QueueStore {
 public:
  using Mutation      = std::function<void(db::model::QueueItemRecord&)>;
  using ChildMutation = std::function<void(db::model::QueueItemRecord&, const ChildCounts&)>;
  using ItemObserver  = std::function<void(const db::model::QueueItemRecord&)>;

  explicit QueueStore(std::shared_ptr<db::QueueRepository> repository, util::ClockFn clock = util::Now,
                      ItemObserver observer = nullptr);

  // ---------------------------------------------------------------------
  // Queue items
  // ---------------------------------------------------------------------

  db::model::QueueItemRecord Add(db::model::QueueItemRecord item);
  db::model::QueueItemRecord Update(const db::model::QueueItemRecord& item);
  db::model::QueueItemRecord Modify(const std::string& id, const Mutation& fn);

  db::model::QueueItemRecord              GetById(const std::string& id);
  std::vector<db::model::QueueItemRecord> GetAll(uint64_t offset = 0, uint64_t limit = 0);
  std::vector<db::model::QueueItemRecord> GetByStatus(trackq::v1::ItemStatus status, uint64_t offset = 0, uint64_t limit = 0);
  db::model::QueueStats                   GetStats();

  // on_remove runs inside the deleting transaction, once per deleted item.
  void     Remove(const std::string& id, const ItemObserver& on_remove = nullptr);
  uint64_t ClearCompleted();
  uint64_t ClearAll(const ItemObserver& on_remove = nullptr);

  /*
    pending -> downloading for the oldest eligible item, persisted before
    return. on_claim runs inside the claiming transaction, before commit.
  */
  std::optional<db::model::QueueItemRecord> ClaimNextPending(const ItemObserver& on_claim = nullptr);

  // downloading -> pending for items left over by a previous process
  std::vector<db::model::QueueItemRecord> ResetInterrupted();

  // ---------------------------------------------------------------------
  // History
  // ---------------------------------------------------------------------

  // Failures are logged, never thrown.
  void                                  AddToHistory(db::model::HistoryRecord record);
  std::vector<db::model::HistoryRecord> GetHistory(uint64_t offset = 0, uint64_t limit = 0);

  // ---------------------------------------------------------------------
  // Child tracks
  // ---------------------------------------------------------------------

  db::model::ChildTrackRecord              UpsertChild(db::model::ChildTrackRecord child);
  std::vector<db::model::ChildTrackRecord> GetChildren(const std::string& parent_id);
  std::vector<db::model::ChildTrackRecord> GetFailedChildren(const std::string& parent_id);
  ChildCounts                              CountChildren(const std::string& parent_id);
  uint64_t                                 ResetFailedChildren(const std::string& parent_id);

  /*
    Persists one child and its parent in a single transaction.
    completed_tracks is recomputed from the child rows before fn runs.
  */
  db::model::QueueItemRecord CommitChild(db::model::ChildTrackRecord child, const ChildMutation& fn);

  uint64_t NowMs() const;

 private:
  // Strictly increasing store-wide stamp, also above the item's previous value.
  uint64_t NextStamp(uint64_t previous);

  void Persist(db::Transaction& tx, const db::model::QueueItemRecord& before, db::model::QueueItemRecord& after);
  void Notify(const db::model::QueueItemRecord& item) const;

  static ChildCounts Count(const std::vector<db::model::ChildTrackRecord>& children);

  std::shared_ptr<db::QueueRepository> repository_;
  util::ClockFn                        clock_;
  ItemObserver                         observer_;

  std::mutex stamp_mutex_;
  uint64_t   last_stamp_ms_ = 0;
};

} // namespace trackq::queue
