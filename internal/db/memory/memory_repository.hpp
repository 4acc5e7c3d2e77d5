#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace siros::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  explicit MemoryRepository(std::uint32_t vector_dimension);

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
  friend class MemoryTransaction;

  using SchemaKey = std::pair<std::string, std::string>;

  struct State {
    std::map<std::string, model::ResourceRecord>                             resources;
    std::map<std::string, std::map<std::uint64_t, model::ChangeLogRecord>> chains;
    std::map<SchemaKey, model::SchemaRecord>                                 schemas;
  };

  // Commit counters per logical row; a transaction conflicts only on rows it wrote.
  struct Versions {
    std::map<std::string, std::uint64_t> resources;
    std::map<std::string, std::uint64_t> chains;
    std::map<SchemaKey, std::uint64_t>   schemas;
  };

  Result CheckVector(const model::ResourceRecord& r) const;

  std::uint32_t vector_dimension_;
  std::mutex    mutex_;
  State         committed_;
  Versions      versions_;
};

} // namespace siros::db::memory
