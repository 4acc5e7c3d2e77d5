#include "audit_chain.hpp"

#include <stdexcept>

#include "internal/audit/canonical.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace siros::audit {

db::model::ChangeLogRecord ToChangeLogRecord(const model::ChangeRecord& record) {
  db::model::ChangeLogRecord row;
  row.id            = record.id;
  row.resource_id   = record.resource_id;
  row.sequence      = record.sequence;
  row.operation     = model::ToString(record.operation);
  row.changes_json  = util::ToJson(record.changes);
  row.actor         = record.actor;
  row.timestamp_ms  = util::ToUnixMillis(record.timestamp);
  row.previous_hash = record.previous_hash;
  row.block_hash    = record.block_hash;
  return row;
}

model::ChangeRecord FromChangeLogRecord(const db::model::ChangeLogRecord& row) {
  auto operation = model::ParseChangeOperation(row.operation);
  if (!operation) {
    throw std::runtime_error("change record " + row.id + " has unknown operation '" + row.operation + "'");
  }

  model::ChangeRecord record;
  record.id          = row.id;
  record.resource_id = row.resource_id;
  record.sequence    = row.sequence;
  record.operation   = *operation;
  util::FromJson(row.changes_json, &record.changes);
  record.actor         = row.actor;
  record.timestamp     = util::FromUnixMillis(row.timestamp_ms);
  record.previous_hash = row.previous_hash;
  record.block_hash    = row.block_hash;
  return record;
}

AuditChain::AuditChain(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

model::ChangeRecord AuditChain::Append(db::Transaction& tx, model::ChangeRecord record) {
  if (record.resource_id.empty()) {
    throw util::InvalidArgument("audit append: resource_id is required");
  }
  if (record.id.empty()) record.id = util::ToString(util::GenerateUUID());
  if (record.timestamp == util::TimePoint{}) record.timestamp = util::Now();

  const auto head = repository_->GetChainHead(tx, record.resource_id);
  if (head) {
    record.sequence      = head->sequence + 1;
    record.previous_hash = head->block_hash;
  } else {
    record.sequence      = 0;
    record.previous_hash = std::string(kGenesisHash);
  }
  record.block_hash = ComputeBlockHash(record.previous_hash, record);

  auto result = repository_->AppendChangeRecord(tx, ToChangeLogRecord(record));
  if (result.code == db::ErrorCode::ConstraintViolation || result.code == db::ErrorCode::AlreadyExists) {
    throw util::Conflict("audit chain for " + record.resource_id + " advanced concurrently at sequence " + std::to_string(record.sequence) + ": " +
                         result.message);
  }
  db::ThrowIfDbError(result, "append change record for " + record.resource_id);
  return record;
}

std::vector<model::ChangeRecord> AuditChain::History(db::Transaction& tx, const std::string& resource_id) {
  std::vector<model::ChangeRecord> out;
  for (const auto& row : repository_->ListChangeRecords(tx, resource_id)) {
    try {
      out.push_back(FromChangeLogRecord(row));
    } catch (const std::runtime_error& e) {
      throw util::PersistenceFailed("decode audit trail for " + resource_id + ": " + e.what());
    }
  }
  return out;
}

std::uint64_t AuditChain::Verify(db::Transaction& tx, const std::string& resource_id) {
  const auto rows = repository_->ListChangeRecords(tx, resource_id);

  std::string expected_previous(kGenesisHash);
  for (std::uint64_t i = 0; i < rows.size(); ++i) {
    const auto& row = rows[i];
    if (row.sequence != i) {
      throw util::ChainBroken(resource_id, i, "audit chain " + resource_id + " broken at index " + std::to_string(i) + ": expected sequence " +
                                                  std::to_string(i) + ", found " + std::to_string(row.sequence));
    }
    if (row.previous_hash != expected_previous) {
      throw util::ChainBroken(resource_id, i, "audit chain " + resource_id + " broken at index " + std::to_string(i) + ": previous hash mismatch");
    }

    model::ChangeRecord record;
    try {
      record = FromChangeLogRecord(row);
    } catch (const std::runtime_error& e) {
      throw util::ChainBroken(resource_id, i, "audit chain " + resource_id + " broken at index " + std::to_string(i) + ": " + e.what());
    }

    if (ComputeBlockHash(expected_previous, record) != row.block_hash) {
      throw util::ChainBroken(resource_id, i, "audit chain " + resource_id + " broken at index " + std::to_string(i) + ": block hash mismatch");
    }
    expected_previous = row.block_hash;
  }
  return rows.size();
}

VerifyReport AuditChain::VerifyAll(db::Transaction& tx) {
  VerifyReport report;
  for (const auto& resource_id : repository_->ListChainIds(tx)) {
    report.records_verified += Verify(tx, resource_id);
    ++report.chains_verified;
  }
  return report;
}

} // namespace siros::audit
