#pragma once

#include <mutex>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace trackq::db::memory {

/*
  Transaction = exclusive repository lock + lazy snapshot.

  Reads see the committed state until the first write copies it; Commit()
  publishes the copy. The lock is held for the transaction lifetime, so
  transactions on one repository never interleave.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const;

 private:
  MemoryRepository&                      repo_;
  std::unique_lock<std::mutex>           lock_;
  std::optional<MemoryRepository::State> working_;
  bool                                   committed_   = false;
  bool                                   rolled_back_ = false;
};

} // namespace trackq::db::memory
