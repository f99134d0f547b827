#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace trackq::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::QueueRepository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertItem(Transaction&, const model::QueueItemRecord&) override;
  std::optional<model::QueueItemRecord> GetItem(Transaction&, const std::string&) override;
  Result UpdateItem(Transaction&, const model::QueueItemRecord&) override;
  Result DeleteItem(Transaction&, const std::string&) override;

  std::vector<model::QueueItemRecord> ListItems(Transaction&, uint64_t offset, uint64_t limit) override;
  std::vector<model::QueueItemRecord> ListItemsByStatus(Transaction&, trackq::v1::ItemStatus, uint64_t offset,
                                                        uint64_t limit) override;
  std::optional<model::QueueItemRecord> NextPending(Transaction&, uint64_t now_ms) override;
  model::QueueStats CountByStatus(Transaction&) override;
  uint64_t DeleteCompleted(Transaction&) override;
  uint64_t DeleteAllItems(Transaction&) override;

  Result UpsertChild(Transaction&, const model::ChildTrackRecord&) override;
  std::vector<model::ChildTrackRecord> GetChildren(Transaction&, const std::string&) override;

  Result InsertHistory(Transaction&, model::HistoryRecord&) override;
  std::vector<model::HistoryRecord> ListHistory(Transaction&, uint64_t offset, uint64_t limit) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::QueueItemRecord> items;
    // parent id -> track id -> child
    std::unordered_map<std::string, std::map<std::string, model::ChildTrackRecord>> children;
    std::vector<model::HistoryRecord> history;
    uint64_t next_history_id = 1;
  };

  std::mutex mutex_;
  State committed_;
};

} // namespace trackq::db::memory
