#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace upload::db::memory {

/*
  Transaction = snapshot + write set

  Transactions are serialized on the repository write mutex, which gives the
  same behavior as SQLite BEGIN IMMEDIATE: a session read "for update" cannot
  change underneath the holder.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return finished_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> write_lock_;
  MemoryRepository::State      working_;
  bool                         finished_ = false;
};

} // namespace upload::db::memory
