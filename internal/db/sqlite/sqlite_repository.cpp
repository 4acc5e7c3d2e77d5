#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <cstring>

#include "internal/db/sql/migrations.hpp"
#include "internal/index/similarity.hpp"
#include "internal/util/errors.hpp"

namespace siros::db::sqlite {

using siros::db::ErrorCode;
using siros::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

constexpr const char* kResourceColumns =
    "r.id,r.type,r.provider,r.region,r.name,r.data_json,r.metadata_json,r.parent_id,r.children_json,r.links_json,r.vector,r.state,"
    "r.created_at_ms,r.updated_at_ms,r.last_scanned_at_ms";

constexpr const char* kChangeColumns = "id,resource_id,sequence,operation,changes_json,actor,timestamp_ms,previous_hash,block_hash";

constexpr const char* kSchemaColumns = "provider,type,name,version,required_fields_json,description,created_at_ms";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalU64(sqlite3_stmt* st, int idx, uint64_t v) {
  if (v == 0) {
    sqlite3_bind_null(st, idx);
  } else {
    BindU64(st, idx, v);
  }
}

void BindVector(sqlite3_stmt* st, int idx, const std::vector<float>& v) {
  if (v.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    sqlite3_bind_blob(st, idx, v.data(), static_cast<int>(v.size() * sizeof(float)), SQLITE_TRANSIENT);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::vector<float> ColVector(sqlite3_stmt* st, int col) {
  const void* blob  = sqlite3_column_blob(st, col);
  const int   bytes = sqlite3_column_bytes(st, col);
  if (!blob || bytes <= 0) return {};

  std::vector<float> v(static_cast<std::size_t>(bytes) / sizeof(float));
  std::memcpy(v.data(), blob, v.size() * sizeof(float));
  return v;
}

Stmt Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw util::PersistenceFailed("sqlite prepare: " + std::string(sqlite3_errmsg(db)));
  }
  return Stmt(st);
}

void ThrowStepError(sqlite3* db, const std::string& context) {
  throw util::PersistenceFailed(context + ": " + sqlite3_errmsg(db));
}

// Binds the 14 non-key resource columns starting at idx.
int BindResourceFields(sqlite3_stmt* st, int idx, const model::ResourceRecord& r) {
  BindText(st, idx++, r.type);
  BindText(st, idx++, r.provider);
  BindText(st, idx++, r.region);
  BindText(st, idx++, r.name);
  BindText(st, idx++, r.data_json);
  BindText(st, idx++, r.metadata_json);
  BindOptionalText(st, idx++, r.parent_id);
  BindText(st, idx++, r.children_json);
  BindText(st, idx++, r.links_json);
  BindVector(st, idx++, r.vector);
  sqlite3_bind_int(st, idx++, r.state);
  BindU64(st, idx++, r.created_at_ms);
  BindU64(st, idx++, r.updated_at_ms);
  BindOptionalU64(st, idx++, r.last_scanned_at_ms);
  return idx;
}

model::ResourceRecord ReadResourceRow(sqlite3_stmt* st) {
  model::ResourceRecord r;
  r.id                 = ColText(st, 0);
  r.type               = ColText(st, 1);
  r.provider           = ColText(st, 2);
  r.region             = ColText(st, 3);
  r.name               = ColText(st, 4);
  r.data_json          = ColText(st, 5);
  r.metadata_json      = ColText(st, 6);
  r.parent_id          = ColText(st, 7);
  r.children_json      = ColText(st, 8);
  r.links_json         = ColText(st, 9);
  r.vector             = ColVector(st, 10);
  r.state              = sqlite3_column_int(st, 11);
  r.created_at_ms      = ColU64(st, 12);
  r.updated_at_ms      = ColU64(st, 13);
  r.last_scanned_at_ms = ColU64(st, 14);
  return r;
}

model::ChangeLogRecord ReadChangeRow(sqlite3_stmt* st) {
  model::ChangeLogRecord r;
  r.id            = ColText(st, 0);
  r.resource_id   = ColText(st, 1);
  r.sequence      = ColU64(st, 2);
  r.operation     = ColText(st, 3);
  r.changes_json  = ColText(st, 4);
  r.actor         = ColText(st, 5);
  r.timestamp_ms  = ColU64(st, 6);
  r.previous_hash = ColText(st, 7);
  r.block_hash    = ColText(st, 8);
  return r;
}

model::SchemaRecord ReadSchemaRow(sqlite3_stmt* st) {
  model::SchemaRecord r;
  r.provider             = ColText(st, 0);
  r.type                 = ColText(st, 1);
  r.name                 = ColText(st, 2);
  r.version              = ColText(st, 3);
  r.required_fields_json = ColText(st, 4);
  r.description          = ColText(st, 5);
  r.created_at_ms        = ColU64(st, 6);
  return r;
}

void LoadTags(sqlite3* db, model::ResourceRecord& r) {
  auto st = Prepare(db, "SELECT key,value FROM resource_tags WHERE resource_id=?;");
  BindText(st.get(), 1, r.id);

  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    r.tags[ColText(st.get(), 0)] = ColText(st.get(), 1);
  }
  if (rc != SQLITE_DONE) ThrowStepError(db, "load tags for " + r.id);
}

struct WhereClause {
  std::string              sql;
  std::vector<std::string> params;
};

WhereClause BuildWhere(const ResourceFilter& f) {
  WhereClause w;
  w.sql = " WHERE 1=1";
  if (f.provider) {
    w.sql += " AND r.provider=?";
    w.params.push_back(*f.provider);
  }
  if (f.type) {
    w.sql += " AND r.type=?";
    w.params.push_back(*f.type);
  }
  if (f.region) {
    w.sql += " AND r.region=?";
    w.params.push_back(*f.region);
  }
  if (f.parent_id) {
    w.sql += " AND r.parent_id=?";
    w.params.push_back(*f.parent_id);
  }
  for (const auto& [key, value] : f.tags) {
    w.sql += " AND EXISTS (SELECT 1 FROM resource_tags t WHERE t.resource_id=r.id AND t.key=? AND t.value=?)";
    w.params.push_back(key);
    w.params.push_back(value);
  }
  return w;
}

// LIKE pattern matching text anywhere; wildcards in text are literal.
std::string ContainsPattern(const std::string& text) {
  std::string out = "%";
  for (char c : text) {
    if (c == '%' || c == '_' || c == '\\') out += '\\';
    out += c;
  }
  out += '%';
  return out;
}

int BindWhere(sqlite3_stmt* st, const WhereClause& w) {
  int idx = 1;
  for (const auto& p : w.params)
    BindText(st, idx++, p);
  return idx;
}

std::vector<model::ResourceRecord> QueryResources(sqlite3* db, sqlite3_stmt* st, const std::string& context) {
  std::vector<model::ResourceRecord> out;
  int                                rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadResourceRow(st));
  }
  if (rc != SQLITE_DONE) ThrowStepError(db, context);

  for (auto& r : out)
    LoadTags(db, r);
  return out;
}

Result ReadOnlyError() {
  return Result::Err(ErrorCode::Unsupported, "write attempted through a read-only transaction");
}

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  SqliteDB& db_;
};

} // namespace

void BootstrapSchema(SqlitePool& pool, std::uint32_t vector_dimension) {
  auto conn = pool.Acquire();

  SqliteMigrationExecutor executor(*conn);
  sql::RunMigrations(executor, sql::SqliteMigrations(vector_dimension));

  auto st = Prepare(conn->Handle(), "SELECT value FROM store_settings WHERE key=?;");
  BindText(st.get(), 1, sql::kDimensionSettingKey);
  if (sqlite3_step(st.get()) != SQLITE_ROW) ThrowStepError(conn->Handle(), "read store settings");

  const auto stored = ColText(st.get(), 0);
  if (stored != std::to_string(vector_dimension)) {
    throw util::PersistenceFailed("sqlite store " + pool.Path() + " was created with vector dimension " + stored + ", configured " +
                                  std::to_string(vector_dimension));
  }
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqlitePool> pool, std::uint32_t vector_dimension)
    : pool_(std::move(pool)), vector_dimension_(vector_dimension) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(pool_->Acquire(), false);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(pool_->Acquire(), true);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Resources
// ------------------------------------------------------------------

Result SqliteRepository::WriteTags(sqlite3* db, const model::ResourceRecord& r) {
  for (const auto& [key, value] : r.tags) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "INSERT INTO resource_tags(resource_id,key,value) VALUES(?,?,?);", -1, &st, nullptr) != SQLITE_OK)
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    Stmt guard(st);

    BindText(st, 1, r.id);
    BindText(st, 2, key);
    BindText(st, 3, value);
    if (auto res = Translate(db, sqlite3_step(st)); !res) return res;
  }
  return Result::Ok();
}

Result SqliteRepository::InsertResource(Transaction& t, const model::ResourceRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();
  if (!r.vector.empty() && r.vector.size() != vector_dimension_) {
    return Result::Err(ErrorCode::ConstraintViolation, "vector dimension " + std::to_string(r.vector.size()) + " does not match store dimension " +
                                                           std::to_string(vector_dimension_));
  }

  auto*         db = tx.Handle();
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db,
                         "INSERT INTO resources(id,type,provider,region,name,data_json,metadata_json,parent_id,children_json,links_json,"
                         "vector,state,created_at_ms,updated_at_ms,last_scanned_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);",
                         -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  BindText(st, 1, r.id);
  BindResourceFields(st, 2, r);

  if (auto res = Translate(db, sqlite3_step(st)); !res) return res;
  return WriteTags(db, r);
}

std::optional<model::ResourceRecord> SqliteRepository::GetResource(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kResourceColumns + " FROM resources r WHERE r.id=?;");
  BindText(st.get(), 1, id);

  auto rows = QueryResources(db, st.get(), "get resource " + id);
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

Result SqliteRepository::UpdateResource(Transaction& t, const model::ResourceRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();
  if (!r.vector.empty() && r.vector.size() != vector_dimension_) {
    return Result::Err(ErrorCode::ConstraintViolation, "vector dimension " + std::to_string(r.vector.size()) + " does not match store dimension " +
                                                           std::to_string(vector_dimension_));
  }

  auto*         db = tx.Handle();
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db,
                         "UPDATE resources SET type=?,provider=?,region=?,name=?,data_json=?,metadata_json=?,parent_id=?,children_json=?,"
                         "links_json=?,vector=?,state=?,created_at_ms=?,updated_at_ms=?,last_scanned_at_ms=? WHERE id=?;",
                         -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  const int id_idx = BindResourceFields(st, 1, r);
  BindText(st, id_idx, r.id);

  if (auto res = Translate(db, sqlite3_step(st)); !res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "resource " + r.id + " not found");

  sqlite3_stmt* del = nullptr;
  if (sqlite3_prepare_v2(db, "DELETE FROM resource_tags WHERE resource_id=?;", -1, &del, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt del_guard(del);
  BindText(del, 1, r.id);
  if (auto res = Translate(db, sqlite3_step(del)); !res) return res;

  return WriteTags(db, r);
}

Result SqliteRepository::DeleteResource(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  auto*         db = tx.Handle();
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "DELETE FROM resources WHERE id=?;", -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  BindText(st, 1, id);
  if (auto res = Translate(db, sqlite3_step(st)); !res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "resource " + id + " not found");
  return Result::Ok();
}

std::vector<model::ResourceRecord> SqliteRepository::ListResources(Transaction& t, const ResourceFilter& filter, const Pagination& page,
                                                                   SortOrder order) {
  auto*      db    = TX(t).Handle();
  const auto where = BuildWhere(filter);
  const auto sql   = std::string("SELECT ") + kResourceColumns + " FROM resources r" + where.sql + " ORDER BY r.created_at_ms " +
                   (order == SortOrder::kNewestFirst ? "DESC" : "ASC") + ", r.id ASC LIMIT ? OFFSET ?;";

  auto st  = Prepare(db, sql);
  int  idx = BindWhere(st.get(), where);
  BindU64(st.get(), idx++, page.limit);
  BindU64(st.get(), idx, page.offset);

  return QueryResources(db, st.get(), "list resources");
}

std::vector<NeighborRecord> SqliteRepository::NearestNeighbors(Transaction& t, const std::vector<float>& query, std::size_t k,
                                                               const ResourceFilter& filter, const std::optional<std::string>& exclude_id,
                                                               const std::optional<double>& max_distance) {
  auto* db    = TX(t).Handle();
  auto  where = BuildWhere(filter);
  where.sql += " AND r.vector IS NOT NULL";
  if (exclude_id) {
    where.sql += " AND r.id<>?";
    where.params.push_back(*exclude_id);
  }

  auto st = Prepare(db, std::string("SELECT ") + kResourceColumns + " FROM resources r" + where.sql + ";");
  BindWhere(st.get(), where);

  return index::RankNearest(QueryResources(db, st.get(), "scan vectors"), query, k, max_distance);
}

// LIKE folds ASCII case only, matching the other backends.
std::vector<model::ResourceRecord> SqliteRepository::SearchText(Transaction& t, const std::string& text, const ResourceFilter& filter,
                                                                const Pagination& page) {
  auto*      db      = TX(t).Handle();
  auto       where   = BuildWhere(filter);
  const auto pattern = ContainsPattern(text);
  where.sql += " AND (r.name LIKE ? ESCAPE '\\' OR r.data_json LIKE ? ESCAPE '\\')";
  where.params.push_back(pattern);
  where.params.push_back(pattern);

  auto st  = Prepare(db, std::string("SELECT ") + kResourceColumns + " FROM resources r" + where.sql +
                               " ORDER BY r.created_at_ms DESC, r.id ASC LIMIT ? OFFSET ?;");
  int  idx = BindWhere(st.get(), where);
  BindU64(st.get(), idx++, page.limit);
  BindU64(st.get(), idx, page.offset);

  return QueryResources(db, st.get(), "search resources");
}

// ------------------------------------------------------------------
// Audit chain
// ------------------------------------------------------------------

Result SqliteRepository::AppendChangeRecord(Transaction& t, const model::ChangeLogRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  auto*         db = tx.Handle();
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "INSERT INTO change_records(id,resource_id,sequence,operation,changes_json,actor,timestamp_ms,previous_hash,block_hash) "
                             "VALUES(?,?,?,?,?,?,?,?,?);",
                         -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  BindText(st, 1, r.id);
  BindText(st, 2, r.resource_id);
  BindU64(st, 3, r.sequence);
  BindText(st, 4, r.operation);
  BindText(st, 5, r.changes_json);
  BindText(st, 6, r.actor);
  BindU64(st, 7, r.timestamp_ms);
  BindText(st, 8, r.previous_hash);
  BindText(st, 9, r.block_hash);

  auto res = Translate(db, sqlite3_step(st));
  // a duplicate change id is not a new resource; report it as a constraint failure
  if (res.code == ErrorCode::AlreadyExists) res.code = ErrorCode::ConstraintViolation;
  return res;
}

std::optional<model::ChangeLogRecord> SqliteRepository::GetChainHead(Transaction& t, const std::string& resource_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kChangeColumns + " FROM change_records WHERE resource_id=? ORDER BY sequence DESC LIMIT 1;");
  BindText(st.get(), 1, resource_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowStepError(db, "chain head " + resource_id);
  return ReadChangeRow(st.get());
}

std::vector<model::ChangeLogRecord> SqliteRepository::ListChangeRecords(Transaction& t, const std::string& resource_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kChangeColumns + " FROM change_records WHERE resource_id=? ORDER BY sequence ASC;");
  BindText(st.get(), 1, resource_id);

  std::vector<model::ChangeLogRecord> out;
  int                                 rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadChangeRow(st.get()));
  }
  if (rc != SQLITE_DONE) ThrowStepError(db, "list change records " + resource_id);
  return out;
}

std::vector<std::string> SqliteRepository::ListChainIds(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, "SELECT DISTINCT resource_id FROM change_records ORDER BY resource_id ASC;");

  std::vector<std::string> out;
  int                      rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ColText(st.get(), 0));
  }
  if (rc != SQLITE_DONE) ThrowStepError(db, "list chains");
  return out;
}

// ------------------------------------------------------------------
// Schemas
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSchema(Transaction& t, const model::SchemaRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  auto*         db = tx.Handle();
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db,
                         "INSERT INTO schemas(provider,type,name,version,required_fields_json,description,created_at_ms) VALUES(?,?,?,?,?,?,?) "
                         "ON CONFLICT(provider,type) DO UPDATE SET name=excluded.name,version=excluded.version,"
                         "required_fields_json=excluded.required_fields_json,description=excluded.description,created_at_ms=excluded.created_at_ms;",
                         -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  BindText(st, 1, r.provider);
  BindText(st, 2, r.type);
  BindText(st, 3, r.name);
  BindText(st, 4, r.version);
  BindText(st, 5, r.required_fields_json);
  BindText(st, 6, r.description);
  BindU64(st, 7, r.created_at_ms);

  return Translate(db, sqlite3_step(st));
}

std::optional<model::SchemaRecord> SqliteRepository::GetSchema(Transaction& t, const std::string& provider, const std::string& type) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + kSchemaColumns + " FROM schemas WHERE provider=? AND type=?;");
  BindText(st.get(), 1, provider);
  BindText(st.get(), 2, type);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowStepError(db, "get schema " + provider + "/" + type);
  return ReadSchemaRow(st.get());
}

std::vector<model::SchemaRecord> SqliteRepository::ListSchemas(Transaction& t, const std::string& provider) {
  auto* db  = TX(t).Handle();
  auto  sql = std::string("SELECT ") + kSchemaColumns + " FROM schemas" + (provider.empty() ? "" : " WHERE provider=?") +
             " ORDER BY provider ASC, type ASC;";
  auto st = Prepare(db, sql);
  if (!provider.empty()) BindText(st.get(), 1, provider);

  std::vector<model::SchemaRecord> out;
  int                              rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadSchemaRow(st.get()));
  }
  if (rc != SQLITE_DONE) ThrowStepError(db, "list schemas");
  return out;
}

Result SqliteRepository::DeleteSchema(Transaction& t, const std::string& provider, const std::string& type) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  auto*         db = tx.Handle();
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "DELETE FROM schemas WHERE provider=? AND type=?;", -1, &st, nullptr) != SQLITE_OK)
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  Stmt guard(st);

  BindText(st, 1, provider);
  BindText(st, 2, type);
  if (auto res = Translate(db, sqlite3_step(st)); !res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "schema " + provider + "/" + type + " not found");
  return Result::Ok();
}

} // namespace siros::db::sqlite
