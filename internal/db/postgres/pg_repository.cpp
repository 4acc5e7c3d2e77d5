#include "pg_repository.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"

namespace siros::db::postgres {

namespace {

constexpr const char* kResourceColumns =
    "r.id,r.type,r.provider,r.region,r.name,r.data::text,r.metadata::text,r.parent_id,r.children::text,r.links::text,r.embedding::text,"
    "r.state,r.created_at_ms,r.updated_at_ms,r.last_scanned_at_ms";

std::optional<std::string> VectorLiteral(const std::vector<float>& v) {
  if (v.empty()) return std::nullopt;

  std::string out = "[";
  char        buf[32];
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i) out += ',';
    std::snprintf(buf, sizeof(buf), "%.9g", static_cast<double>(v[i]));
    out += buf;
  }
  out += ']';
  return out;
}

std::vector<float> ParseVector(const pqxx::field& f) {
  std::vector<float> out;
  if (f.is_null()) return out;

  const char* p = f.c_str();
  if (*p == '[') ++p;
  while (*p && *p != ']') {
    char* end = nullptr;
    out.push_back(std::strtof(p, &end));
    if (end == p) break;
    p = end;
    if (*p == ',') ++p;
  }
  return out;
}

std::string TextOrEmpty(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

std::optional<std::string> OptionalText(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

std::optional<uint64_t> OptionalMillis(uint64_t v) {
  if (v == 0) return std::nullopt;
  return v;
}

model::ResourceRecord ReadResourceRow(const pqxx::row& row) {
  model::ResourceRecord r;
  r.id                 = row[0].c_str();
  r.type               = row[1].c_str();
  r.provider           = row[2].c_str();
  r.region             = row[3].c_str();
  r.name               = row[4].c_str();
  r.data_json          = row[5].c_str();
  r.metadata_json      = row[6].c_str();
  r.parent_id          = TextOrEmpty(row[7]);
  r.children_json      = row[8].c_str();
  r.links_json         = row[9].c_str();
  r.vector             = ParseVector(row[10]);
  r.state              = row[11].as<int>();
  r.created_at_ms      = row[12].as<uint64_t>();
  r.updated_at_ms      = row[13].as<uint64_t>();
  r.last_scanned_at_ms = row[14].is_null() ? 0 : row[14].as<uint64_t>();
  return r;
}

model::ChangeLogRecord ReadChangeRow(const pqxx::row& row) {
  model::ChangeLogRecord r;
  r.id            = row[0].c_str();
  r.resource_id   = row[1].c_str();
  r.sequence      = row[2].as<uint64_t>();
  r.operation     = row[3].c_str();
  r.changes_json  = row[4].c_str();
  r.actor         = row[5].c_str();
  r.timestamp_ms  = row[6].as<uint64_t>();
  r.previous_hash = row[7].c_str();
  r.block_hash    = row[8].c_str();
  return r;
}

model::SchemaRecord ReadSchemaRow(const pqxx::row& row) {
  model::SchemaRecord r;
  r.provider             = row[0].c_str();
  r.type                 = row[1].c_str();
  r.name                 = row[2].c_str();
  r.version              = row[3].c_str();
  r.required_fields_json = row[4].c_str();
  r.description          = row[5].c_str();
  r.created_at_ms        = row[6].as<uint64_t>();
  return r;
}

void LoadTags(pqxx::transaction_base& tx, model::ResourceRecord& r) {
  for (const auto& row : tx.exec_prepared("list_tags", r.id)) {
    r.tags[row[0].c_str()] = row[1].c_str();
  }
}

void WriteTags(pqxx::transaction_base& tx, const model::ResourceRecord& r) {
  for (const auto& [key, value] : r.tags) {
    tx.exec_prepared("insert_tag", r.id, key, value);
  }
}

// Filter values are quoted by the connection, never spliced raw.
std::string BuildWhere(pqxx::transaction_base& tx, const ResourceFilter& f) {
  std::string where = " WHERE 1=1";
  if (f.provider) where += " AND r.provider=" + tx.quote(*f.provider);
  if (f.type) where += " AND r.type=" + tx.quote(*f.type);
  if (f.region) where += " AND r.region=" + tx.quote(*f.region);
  if (f.parent_id) where += " AND r.parent_id=" + tx.quote(*f.parent_id);
  for (const auto& [key, value] : f.tags) {
    where += " AND EXISTS (SELECT 1 FROM resource_tags t WHERE t.resource_id=r.id AND t.key=" + tx.quote(key) + " AND t.value=" + tx.quote(value) +
             ")";
  }
  return where;
}

Result ReadOnlyError() {
  return Result::Err(ErrorCode::Unsupported, "write attempted through a read-only transaction");
}

// Reads surface backend failures as exceptions rather than Results.
template <typename Fn>
auto Read(const std::string& context, Fn&& fn) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    throw util::PersistenceFailed(context + ": " + e.what());
  }
}

class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

} // namespace

void BootstrapSchema(PgPool& pool, std::uint32_t vector_dimension) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  PgMigrationExecutor executor(tx);
  sql::RunMigrations(executor, sql::PostgresMigrations(vector_dimension));

  auto res = tx.exec_params("SELECT value FROM store_settings WHERE key=$1", std::string(sql::kDimensionSettingKey));
  if (res.empty() || std::string(res[0][0].c_str()) != std::to_string(vector_dimension)) {
    throw util::PersistenceFailed("postgres store was created with vector dimension " + (res.empty() ? std::string("?") : res[0][0].c_str()) +
                                  ", configured " + std::to_string(vector_dimension));
  }
  tx.commit();
}

PgRepository::PgRepository(std::shared_ptr<PgPool> pool, std::uint32_t vector_dimension)
    : pool_(std::move(pool)), vector_dimension_(vector_dimension) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_, false);
}

std::unique_ptr<db::Transaction> PgRepository::BeginRead() {
  return std::make_unique<PgTransaction>(pool_, true);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Resources
// ------------------------------------------------------------------

Result PgRepository::InsertResource(Transaction& t, const model::ResourceRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();
  if (!r.vector.empty() && r.vector.size() != vector_dimension_) {
    return Result::Err(ErrorCode::ConstraintViolation, "vector dimension " + std::to_string(r.vector.size()) + " does not match store dimension " +
                                                           std::to_string(vector_dimension_));
  }

  try {
    tx.Tx().exec_prepared("insert_resource", r.id, r.type, r.provider, r.region, r.name, r.data_json, r.metadata_json, OptionalText(r.parent_id),
                          r.children_json, r.links_json, VectorLiteral(r.vector), r.state, r.created_at_ms, r.updated_at_ms,
                          OptionalMillis(r.last_scanned_at_ms));
    WriteTags(tx.Tx(), r);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ResourceRecord> PgRepository::GetResource(Transaction& t, const std::string& id) {
  auto& tx = TX(t).Tx();
  return Read("get resource " + id, [&]() -> std::optional<model::ResourceRecord> {
    auto res = tx.exec_prepared("get_resource", id);
    if (res.empty()) return std::nullopt;

    auto r = ReadResourceRow(res[0]);
    LoadTags(tx, r);
    return r;
  });
}

Result PgRepository::UpdateResource(Transaction& t, const model::ResourceRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();
  if (!r.vector.empty() && r.vector.size() != vector_dimension_) {
    return Result::Err(ErrorCode::ConstraintViolation, "vector dimension " + std::to_string(r.vector.size()) + " does not match store dimension " +
                                                           std::to_string(vector_dimension_));
  }

  try {
    auto res = tx.Tx().exec_prepared("update_resource", r.id, r.type, r.provider, r.region, r.name, r.data_json, r.metadata_json,
                                     OptionalText(r.parent_id), r.children_json, r.links_json, VectorLiteral(r.vector), r.state,
                                     r.created_at_ms, r.updated_at_ms, OptionalMillis(r.last_scanned_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "resource " + r.id + " not found");

    tx.Tx().exec_prepared("delete_tags", r.id);
    WriteTags(tx.Tx(), r);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteResource(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  try {
    auto res = tx.Tx().exec_prepared("delete_resource", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "resource " + id + " not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ResourceRecord> PgRepository::ListResources(Transaction& t, const ResourceFilter& filter, const Pagination& page,
                                                               SortOrder order) {
  auto& tx = TX(t).Tx();
  return Read("list resources", [&] {
    const auto sql = std::string("SELECT ") + kResourceColumns + " FROM resources r" + BuildWhere(tx, filter) + " ORDER BY r.created_at_ms " +
                     (order == SortOrder::kNewestFirst ? "DESC" : "ASC") + ", r.id ASC LIMIT " + std::to_string(page.limit) + " OFFSET " +
                     std::to_string(page.offset);

    std::vector<model::ResourceRecord> out;
    for (const auto& row : tx.exec(sql)) {
      out.push_back(ReadResourceRow(row));
    }
    for (auto& r : out)
      LoadTags(tx, r);
    return out;
  });
}

std::vector<NeighborRecord> PgRepository::NearestNeighbors(Transaction& t, const std::vector<float>& query, std::size_t k,
                                                           const ResourceFilter& filter, const std::optional<std::string>& exclude_id,
                                                           const std::optional<double>& max_distance) {
  auto& tx = TX(t).Tx();
  return Read("nearest neighbors", [&] {
    auto where = BuildWhere(tx, filter) + " AND r.embedding IS NOT NULL";
    if (exclude_id) where += " AND r.id<>" + tx.quote(*exclude_id);
    if (max_distance) where += " AND d.distance<=" + tx.quote(*max_distance) + "::float8";

    // pgvector yields NaN against a zero vector; treat it as orthogonal.
    const auto sql = std::string("SELECT ") + kResourceColumns +
                     ", d.distance FROM resources r "
                     "CROSS JOIN LATERAL (SELECT CASE WHEN x.raw = 'NaN'::float8 THEN 1.0 ELSE x.raw END AS distance FROM "
                     "(SELECT (r.embedding <=> " +
                     tx.quote(*VectorLiteral(query)) + "::vector)::float8 AS raw) x) d" + where +
                     " ORDER BY d.distance ASC, r.created_at_ms DESC, r.id ASC LIMIT " + std::to_string(k);

    std::vector<NeighborRecord> out;
    for (const auto& row : tx.exec(sql)) {
      out.push_back(NeighborRecord{ReadResourceRow(row), row[15].as<double>()});
    }
    for (auto& n : out)
      LoadTags(tx, n.record);
    return out;
  });
}

std::vector<model::ResourceRecord> PgRepository::SearchText(Transaction& t, const std::string& text, const ResourceFilter& filter,
                                                            const Pagination& page) {
  auto& tx = TX(t).Tx();
  return Read("search resources", [&] {
    const auto pattern = tx.quote("%" + tx.esc_like(text) + "%");
    const auto sql     = std::string("SELECT ") + kResourceColumns + " FROM resources r" + BuildWhere(tx, filter) + " AND (r.name ILIKE " + pattern +
                     " OR r.data::text ILIKE " + pattern + ") ORDER BY r.created_at_ms DESC, r.id ASC LIMIT " + std::to_string(page.limit) +
                     " OFFSET " + std::to_string(page.offset);

    std::vector<model::ResourceRecord> out;
    for (const auto& row : tx.exec(sql)) {
      out.push_back(ReadResourceRow(row));
    }
    for (auto& r : out)
      LoadTags(tx, r);
    return out;
  });
}

// ------------------------------------------------------------------
// Audit chain
// ------------------------------------------------------------------

Result PgRepository::AppendChangeRecord(Transaction& t, const model::ChangeLogRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  try {
    tx.Tx().exec_prepared("append_change", r.id, r.resource_id, r.sequence, r.operation, r.changes_json, r.actor, r.timestamp_ms, r.previous_hash,
                          r.block_hash);
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ChangeLogRecord> PgRepository::GetChainHead(Transaction& t, const std::string& resource_id) {
  auto& tx = TX(t).Tx();
  return Read("chain head " + resource_id, [&]() -> std::optional<model::ChangeLogRecord> {
    auto res = tx.exec_prepared("chain_head", resource_id);
    if (res.empty()) return std::nullopt;
    return ReadChangeRow(res[0]);
  });
}

std::vector<model::ChangeLogRecord> PgRepository::ListChangeRecords(Transaction& t, const std::string& resource_id) {
  auto& tx = TX(t).Tx();
  return Read("list change records " + resource_id, [&] {
    std::vector<model::ChangeLogRecord> out;
    for (const auto& row : tx.exec_prepared("list_changes", resource_id)) {
      out.push_back(ReadChangeRow(row));
    }
    return out;
  });
}

std::vector<std::string> PgRepository::ListChainIds(Transaction& t) {
  auto& tx = TX(t).Tx();
  return Read("list chains", [&] {
    std::vector<std::string> out;
    for (const auto& row : tx.exec("SELECT DISTINCT resource_id FROM change_records ORDER BY resource_id ASC")) {
      out.emplace_back(row[0].c_str());
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Schemas
// ------------------------------------------------------------------

Result PgRepository::UpsertSchema(Transaction& t, const model::SchemaRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  try {
    tx.Tx().exec_prepared("upsert_schema", r.provider, r.type, r.name, r.version, r.required_fields_json, r.description, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SchemaRecord> PgRepository::GetSchema(Transaction& t, const std::string& provider, const std::string& type) {
  auto& tx = TX(t).Tx();
  return Read("get schema " + provider + "/" + type, [&]() -> std::optional<model::SchemaRecord> {
    auto res = tx.exec_prepared("get_schema", provider, type);
    if (res.empty()) return std::nullopt;
    return ReadSchemaRow(res[0]);
  });
}

std::vector<model::SchemaRecord> PgRepository::ListSchemas(Transaction& t, const std::string& provider) {
  auto& tx = TX(t).Tx();
  return Read("list schemas", [&] {
    auto sql = std::string("SELECT provider,type,name,version,required_fields::text,description,created_at_ms FROM schemas");
    if (!provider.empty()) sql += " WHERE provider=" + tx.quote(provider);
    sql += " ORDER BY provider ASC, type ASC";

    std::vector<model::SchemaRecord> out;
    for (const auto& row : tx.exec(sql)) {
      out.push_back(ReadSchemaRow(row));
    }
    return out;
  });
}

Result PgRepository::DeleteSchema(Transaction& t, const std::string& provider, const std::string& type) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  try {
    auto res = tx.Tx().exec_prepared("delete_schema", provider, type);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "schema " + provider + "/" + type + " not found");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace siros::db::postgres
