#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace siros::db::postgres {

// Installs the pgvector extension and tables; checks the stored vector dimension.
void BootstrapSchema(PgPool& pool, std::uint32_t vector_dimension);

/*
  Vectors live in a pgvector column; similarity uses the cosine
  distance operator (<=>) with the same tie-break as the other backends.
*/
class PgRepository final : public db::Repository {
 public:
  PgRepository(std::shared_ptr<PgPool> pool, std::uint32_t vector_dimension);

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
  std::shared_ptr<PgPool> pool_;
  std::uint32_t           vector_dimension_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace siros::db::postgres
