#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/child_track_record.hpp"
#include "internal/db/model/history_record.hpp"
#include "internal/db/model/queue_item_record.hpp"
#include "internal/db/model/queue_stats.hpp"

namespace trackq::db {

/*
  Queue repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Deleting an item deletes its child tracks
  - History rows are independent of queue items

  A limit of 0 means "no limit" for every paged read.
*/

class QueueRepository {
 public:
  virtual ~QueueRepository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Queue items
  // ---------------------------------------------------------------------

  virtual Result InsertItem(Transaction&, const model::QueueItemRecord&) = 0;

  virtual std::optional<model::QueueItemRecord> GetItem(Transaction&, const std::string& id) = 0;

  virtual Result UpdateItem(Transaction&, const model::QueueItemRecord&) = 0;

  virtual Result DeleteItem(Transaction&, const std::string& id) = 0;

  // Ordered by created_at, then id.
  virtual std::vector<model::QueueItemRecord> ListItems(Transaction&, uint64_t offset, uint64_t limit) = 0;

  virtual std::vector<model::QueueItemRecord> ListItemsByStatus(Transaction&, trackq::v1::ItemStatus status, uint64_t offset,
                                                                uint64_t limit) = 0;

  // Oldest pending item whose back-off has elapsed, ordered by
  // updated_at, created_at, id.
  virtual std::optional<model::QueueItemRecord> NextPending(Transaction&, uint64_t now_ms) = 0;

  virtual model::QueueStats CountByStatus(Transaction&) = 0;

  // Deletes completed items that are not partial successes.
  virtual uint64_t DeleteCompleted(Transaction&) = 0;

  virtual uint64_t DeleteAllItems(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Child tracks
  // ---------------------------------------------------------------------

  virtual Result UpsertChild(Transaction&, const model::ChildTrackRecord&) = 0;

  // Ordered by position.
  virtual std::vector<model::ChildTrackRecord> GetChildren(Transaction&, const std::string& parent_id) = 0;

  // ---------------------------------------------------------------------
  // History
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertHistory(Transaction&, model::HistoryRecord&) = 0;

  // Newest first.
  virtual std::vector<model::HistoryRecord> ListHistory(Transaction&, uint64_t offset, uint64_t limit) = 0;
};

} // namespace trackq::db
