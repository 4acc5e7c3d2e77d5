#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/change_log_record.hpp"
#include "internal/db/model/resource_record.hpp"
#include "internal/db/model/schema_record.hpp"

namespace siros::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Change records are append-only; no operation rewrites one
  - (resource_id, sequence) is unique; a racing append fails with
    Conflict or ConstraintViolation
  - Stored vectors always have exactly VectorDimension() entries

  Write operations report failures through Result. Read operations throw
  util::PersistenceFailed when the backend fails.

  The DB is the source of truth for:
    resources and their vectors
    audit chains
    schemas
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Read-only snapshot; writes through it are rejected.
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  virtual std::uint32_t VectorDimension() const = 0;

  // ---------------------------------------------------------------------
  // Resources
  // ---------------------------------------------------------------------

  virtual Result InsertResource(Transaction&, const model::ResourceRecord&) = 0;

  virtual std::optional<model::ResourceRecord> GetResource(Transaction&, const std::string& id) = 0;

  virtual Result UpdateResource(Transaction&, const model::ResourceRecord&) = 0;

  virtual Result DeleteResource(Transaction&, const std::string& id) = 0;

  // Ordered by created_at (per order), ties broken by id ascending.
  virtual std::vector<model::ResourceRecord> ListResources(Transaction&, const ResourceFilter& filter, const Pagination& page,
                                                           SortOrder order) = 0;

  // Exact k nearest vectorized resources by cosine distance (1 - cos).
  // Ties: created_at descending, then id ascending. When max_distance is
  // set, farther resources are dropped before k is applied.
  virtual std::vector<NeighborRecord> NearestNeighbors(Transaction&, const std::vector<float>& query, std::size_t k,
                                                       const ResourceFilter& filter, const std::optional<std::string>& exclude_id,
                                                       const std::optional<double>& max_distance) = 0;

  // Case-insensitive substring match on name or data JSON text, ordered
  // like ListResources newest first.
  virtual std::vector<model::ResourceRecord> SearchText(Transaction&, const std::string& text, const ResourceFilter& filter,
                                                        const Pagination& page) = 0;

  // ---------------------------------------------------------------------
  // Audit chain
  // ---------------------------------------------------------------------

  virtual Result AppendChangeRecord(Transaction&, const model::ChangeLogRecord&) = 0;

  virtual std::optional<model::ChangeLogRecord> GetChainHead(Transaction&, const std::string& resource_id) = 0;

  // Ordered by sequence ascending.
  virtual std::vector<model::ChangeLogRecord> ListChangeRecords(Transaction&, const std::string& resource_id) = 0;

  // Every resource id with at least one change record, ascending.
  virtual std::vector<std::string> ListChainIds(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Schemas
  // ---------------------------------------------------------------------

  virtual Result UpsertSchema(Transaction&, const model::SchemaRecord&) = 0;

  virtual std::optional<model::SchemaRecord> GetSchema(Transaction&, const std::string& provider, const std::string& type) = 0;

  // Empty provider lists all schemas. Ordered by (provider, type).
  virtual std::vector<model::SchemaRecord> ListSchemas(Transaction&, const std::string& provider) = 0;

  virtual Result DeleteSchema(Transaction&, const std::string& provider, const std::string& type) = 0;
};

} // namespace siros::db
