#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/change_record.hpp"

namespace siros::audit {

struct VerifyReport {
  std::uint64_t chains_verified  = 0;
  std::uint64_t records_verified = 0;
};

/*
  Per-resource hash chain over the repository's change log.

  Appends run inside the caller's transaction so the change record and
  the resource mutation commit or roll back together. The first record
  of a chain links to kGenesisHash. Delete and re-create under the same
  id continue the existing chain.
*/
class AuditChain {
 public:
  explicit AuditChain(std::shared_ptr<db::Repository> repository);

  // Assigns sequence, previous_hash and block_hash (and id/timestamp when
  // unset), then appends. A concurrent append that took the same
  // sequence surfaces as util::Conflict.
  model::ChangeRecord Append(db::Transaction& tx, model::ChangeRecord record);

  // Records in sequence order. Empty when the resource was never written.
  std::vector<model::ChangeRecord> History(db::Transaction& tx, const std::string& resource_id);

  // Recomputes the chain from genesis. Throws util::ChainBroken at the
  // first mismatch; returns the number of records checked.
  std::uint64_t Verify(db::Transaction& tx, const std::string& resource_id);

  VerifyReport VerifyAll(db::Transaction& tx);

 private:
  std::shared_ptr<db::Repository> repository_;
};

db::model::ChangeLogRecord ToChangeLogRecord(const model::ChangeRecord& record);
model::ChangeRecord        FromChangeLogRecord(const db::model::ChangeLogRecord& row);

} // namespace siros::audit
