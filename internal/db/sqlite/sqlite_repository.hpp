#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace trackq::db::sqlite {

class SqliteRepository final : public db::QueueRepository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace trackq::db::sqlite
