#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace siros::db::sqlite {

// Creates the tables if missing and checks the stored vector dimension.
void BootstrapSchema(SqlitePool& pool, std::uint32_t vector_dimension);

/*
  SQLite has no vector type: vectors are float32 BLOBs and similarity
  is ranked in process over the filtered candidate set.
*/
class SqliteRepository final : public db::Repository {
 public:
  SqliteRepository(std::shared_ptr<SqlitePool> pool, std::uint32_t vector_dimension);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;
  std::uint32_t                VectorDimension() const override {
    return vector_dimension_;
  }

  Result                               InsertResource(Transaction&, const model::ResourceRecord&) override;
  std::optional<model::ResourceRecord> GetResource(Transaction&, const std::string&) override;
  Result                               UpdateResource(Transaction&, const model::ResourceRecord&) override;
  Result                               DeleteResource(Transaction&, const std::string&) override;
  std::vector<model::ResourceRecord>   ListResources(Transaction&, const ResourceFilter&, const Pagination&, SortOrder) override;
  std::vector<NeighborRecord>          NearestNeighbors(Transaction&, const std::vector<float>& query, std::size_t k, const ResourceFilter&,
                                                        const std::optional<std::string>& exclude_id,
                                                        const std::optional<double>&      max_distance) override;
  std::vector<model::ResourceRecord>   SearchText(Transaction&, const std::string& text, const ResourceFilter&, const Pagination&) override;

  Result                                AppendChangeRecord(Transaction&, const model::ChangeLogRecord&) override;
  std::optional<model::ChangeLogRecord> GetChainHead(Transaction&, const std::string& resource_id) override;
  std::vector<model::ChangeLogRecord>   ListChangeRecords(Transaction&, const std::string& resource_id) override;
  std::vector<std::string>              ListChainIds(Transaction&) override;

  Result                             UpsertSchema(Transaction&, const model::SchemaRecord&) override;
  std::optional<model::SchemaRecord> GetSchema(Transaction&, const std::string& provider, const std::string& type) override;
  std::vector<model::SchemaRecord>   ListSchemas(Transaction&, const std::string& provider) override;
  Result                             DeleteSchema(Transaction&, const std::string& provider, const std::string& type) override;

 private:
  std::shared_ptr<SqlitePool> pool_;
  std::uint32_t               vector_dimension_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  Result WriteTags(sqlite3* db, const model::ResourceRecord& r);
};

} // namespace siros::db::sqlite
