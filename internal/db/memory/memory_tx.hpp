#pragma once

#include <set>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace siros::db::memory {

/*
  Transaction = snapshot + write set

  Commit publishes only the rows this transaction wrote and fails with
  util::Conflict if any of them was committed by someone else after
  the snapshot was taken.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  bool ReadOnly() const {
    return read_only_;
  }

  const MemoryRepository::State& View() const {
    return working_;
  }

  MemoryRepository::State& WriteResource(const std::string& id);
  MemoryRepository::State& WriteChain(const std::string& resource_id);
  MemoryRepository::State& WriteSchema(const std::string& provider, const std::string& type);

 private:
  MemoryRepository&                        repo_;
  MemoryRepository::State                  working_;
  MemoryRepository::Versions               snapshot_versions_;
  std::set<std::string>                    touched_resources_;
  std::set<std::string>                    touched_chains_;
  std::set<MemoryRepository::SchemaKey>    touched_schemas_;
  bool                                     read_only_;
  bool                                     committed_   = false;
  bool                                     rolled_back_ = false;
};

} // namespace siros::db::memory
