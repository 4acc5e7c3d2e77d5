#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/audit/audit_chain.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/embedding/embedding_provider.hpp"
#include "internal/model/change_record.hpp"
#include "internal/model/resource.hpp"
#include "internal/model/schema.hpp"
#include "internal/util/deadline.hpp"
#include "internal/validation/validator.hpp"

namespace siros::core {

struct CallOptions {
  std::string    actor;
  util::Deadline deadline = util::Deadline::Never();
};

// Unset members are left untouched.
struct ResourcePatch {
  std::optional<std::string>                        name;
  std::optional<std::string>                        region;
  std::optional<google::protobuf::Struct>           data;
  std::optional<std::map<std::string, std::string>> tags;
  // Replaces iam and custom; created_by is immutable, modified_by
  // always follows the caller.
  std::optional<model::ResourceMetadata> metadata;
  // Empty string clears the parent.
  std::optional<std::string>                      parent_id;
  std::optional<std::set<std::string>>            children;
  std::optional<std::vector<model::ResourceLink>> links;
  std::optional<util::TimePoint>                  last_scanned_at;
};

struct ListQuery {
  db::ResourceFilter filter;
  // 0 means the default page size.
  std::size_t   limit  = 0;
  std::size_t   offset = 0;
  db::SortOrder order  = db::SortOrder::kNewestFirst;
};

// Exactly one of vector, resource_id, text must be set.
struct SimilarityQuery {
  std::optional<model::FloatVector> vector;
  std::optional<std::string>        resource_id;
  std::optional<std::string>        text;
  std::int64_t                      k = 10;
  db::ResourceFilter                filter;
  // Drops matches farther than this cosine distance; must lie in [0, 2].
  std::optional<double> max_distance;
};

// Case-insensitive substring match on name or the data JSON text.
struct TextQuery {
  std::string        query;
  db::ResourceFilter filter;
  // 0 means the default page size.
  std::size_t limit  = 0;
  std::size_t offset = 0;
};

struct SimilarResource {
  model::Resource resource;
  double          distance = 0.0;
};

struct ManagerOptions {
  std::size_t max_k              = 100;
  std::size_t default_page_limit = 50;
  std::size_t max_page_limit     = 1000;
};

/*
  Resource Lifecycle & Audit Engine.

  Every mutation runs as: validate -> embed -> one repository
  transaction { resource row, audit append } -> commit. Any failure
  before commit leaves no trace in the store. Mutations of the same id
  are serialized by an in-process mutex; the unique (resource_id,
  sequence) constraint catches writers in other processes.

  Reads never take the per-id mutex and run on read transactions.

  A null embedder means embedding is disabled: resources are stored
  unvectorized and text similarity queries are rejected.
*/
class ResourceManager {
 public:
  ResourceManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<embedding::EmbeddingProvider> embedder,
                  validation::Validator validator, ManagerOptions options = {});

  model::Resource Create(model::Resource input, const CallOptions& call);
  model::Resource Update(const std::string& id, const ResourcePatch& patch, const CallOptions& call);
  void            Delete(const std::string& id, const CallOptions& call);

  model::Resource              Get(const std::string& id, bool include_vector = false);
  std::vector<model::Resource> List(const ListQuery& query);
  std::vector<SimilarResource> SearchSimilar(const SimilarityQuery& query, const CallOptions& call);
  std::vector<model::Resource> SearchText(const TextQuery& query);

  std::vector<model::ChangeRecord> GetAuditTrail(const std::string& resource_id);
  std::uint64_t                    VerifyChain(const std::string& resource_id);
  audit::VerifyReport              VerifyAllChains();

  model::Schema              RegisterSchema(model::Schema schema);
  model::Schema              GetSchema(const std::string& provider, const std::string& type);
  std::vector<model::Schema> ListSchemas(const std::string& provider);
  void                       DeleteSchema(const std::string& provider, const std::string& type);

  // Ids that currently have a mutation holding or waiting on their mutex.
  std::size_t InFlightMutations() const;

 private:
  // Holds the per-id mutex; the map entry is dropped once no other
  // caller shares it, so only in-flight ids stay resident.
  class ResourceLock {
   public:
    ResourceLock(ResourceManager& manager, const std::string& id);
    ~ResourceLock();

    ResourceLock(const ResourceLock&)            = delete;
    ResourceLock& operator=(const ResourceLock&) = delete;

   private:
    ResourceManager&             manager_;
    std::string                  id_;
    std::shared_ptr<std::mutex>  mutex_;
    std::unique_lock<std::mutex> lock_;
  };

  std::shared_ptr<std::mutex> ResourceMutex(const std::string& id);
  void                        ReleaseResourceMutex(const std::string& id, std::shared_ptr<std::mutex> resource_mutex);

  std::optional<model::Schema> LookupSchema(const std::string& provider, const std::string& type);
  model::FloatVector           Embed(const model::Resource& resource);
  // Throws EmbeddingFailed unless the provider returns a finite vector of the store dimension.
  model::FloatVector Embed(const google::protobuf::Struct& content, const google::protobuf::Struct& metadata);

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<embedding::EmbeddingProvider> embedder_;
  validation::Validator                         validator_;
  ManagerOptions                                options_;
  audit::AuditChain                             chain_;

  mutable std::mutex                                           resource_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> resource_mutexes_;
};

} // namespace siros::core
