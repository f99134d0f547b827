#include "memory_tx.hpp"

#include <stdexcept>

namespace trackq::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("memory transaction already finished");
  }
  if (!working_) {
    working_ = repo_.committed_; // snapshot copy
  }
  return *working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  return working_ ? *working_ : repo_.committed_;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("memory transaction already finished");
  }
  if (working_) {
    repo_.committed_ = std::move(*working_);
    working_.reset();
  }
  committed_ = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) return;
  working_.reset();
  rolled_back_ = true;
  lock_.unlock();
}

} // namespace trackq::db::memory
