#include "memory_tx.hpp"

#include <stdexcept>

namespace upload::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), write_lock_(repo.write_mutex_) {
  std::scoped_lock lock(repo_.state_mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw std::runtime_error("transaction already finished");
  }
  {
    std::scoped_lock lock(repo_.state_mutex_);
    repo_.committed_ = std::move(working_);
  }
  finished_ = true;
  write_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (finished_) {
    return;
  }
  finished_ = true;
  write_lock_.unlock();
}

} // namespace upload::db::memory
