#include "resource_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include "internal/core/change_set.hpp"
#include "internal/core/record_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace siros::core {

namespace {

bool IsBlank(const std::string& s) {
  return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

model::Resource WithoutVector(model::Resource resource) {
  resource.vector.clear();
  return resource;
}

bool AllFinite(const model::FloatVector& v) {
  return std::all_of(v.begin(), v.end(), [](float x) { return std::isfinite(x); });
}

model::ChangeRecord NewChange(const std::string& resource_id, model::ChangeOperation op, google::protobuf::Struct changes,
                              const std::string& actor) {
  model::ChangeRecord record;
  record.resource_id = resource_id;
  record.operation   = op;
  record.changes     = std::move(changes);
  record.actor       = actor;
  record.timestamp   = util::Now();
  return record;
}

} // namespace

ResourceManager::ResourceManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<embedding::EmbeddingProvider> embedder,
                                 validation::Validator validator, ManagerOptions options)
    : repository_(std::move(repository)),
      embedder_(std::move(embedder)),
      validator_(std::move(validator)),
      options_(options),
      chain_(repository_) {
  if (!repository_) {
    throw std::invalid_argument("ResourceManager requires a repository");
  }
  if (embedder_ && embedder_->Dimension() != repository_->VectorDimension()) {
    throw std::invalid_argument("embedder dimension " + std::to_string(embedder_->Dimension()) + " does not match store dimension " +
                                std::to_string(repository_->VectorDimension()));
  }
}

std::shared_ptr<std::mutex> ResourceManager::ResourceMutex(const std::string& id) {
  std::lock_guard<std::mutex> lock(resource_mutexes_guard_);
  auto&                       resource_mutex = resource_mutexes_[id];
  if (!resource_mutex) {
    resource_mutex = std::make_shared<std::mutex>();
  }
  return resource_mutex;
}

void ResourceManager::ReleaseResourceMutex(const std::string& id, std::shared_ptr<std::mutex> resource_mutex) {
  std::lock_guard<std::mutex> lock(resource_mutexes_guard_);
  resource_mutex.reset();

  auto it = resource_mutexes_.find(id);
  if (it != resource_mutexes_.end() && it->second.use_count() == 1) {
    resource_mutexes_.erase(it);
  }
}

std::size_t ResourceManager::InFlightMutations() const {
  std::lock_guard<std::mutex> lock(resource_mutexes_guard_);
  return resource_mutexes_.size();
}

ResourceManager::ResourceLock::ResourceLock(ResourceManager& manager, const std::string& id)
    : manager_(manager), id_(id), mutex_(manager.ResourceMutex(id)), lock_(*mutex_) {
}

ResourceManager::ResourceLock::~ResourceLock() {
  lock_.unlock();
  manager_.ReleaseResourceMutex(id_, std::move(mutex_));
}

std::optional<model::Schema> ResourceManager::LookupSchema(const std::string& provider, const std::string& type) {
  auto tx     = repository_->BeginRead();
  auto record = repository_->GetSchema(*tx, provider, type);
  if (!record) {
    return std::nullopt;
  }
  return FromSchemaRecord(*record);
}

model::FloatVector ResourceManager::Embed(const model::Resource& resource) {
  return Embed(EmbeddingContent(resource), EmbeddingMetadata(resource));
}

model::FloatVector ResourceManager::Embed(const google::protobuf::Struct& content, const google::protobuf::Struct& metadata) {
  auto vector = embedder_->GenerateVector(content, metadata);
  if (vector.size() != repository_->VectorDimension()) {
    throw util::EmbeddingFailed("embedding provider returned " + std::to_string(vector.size()) + " values, store expects " +
                                std::to_string(repository_->VectorDimension()));
  }
  if (!AllFinite(vector)) {
    throw util::EmbeddingFailed("embedding provider returned a non-finite value");
  }
  return vector;
}

// ---------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------

model::Resource ResourceManager::Create(model::Resource input, const CallOptions& call) {
  if (IsBlank(input.id)) {
    input.id = util::GenerateResourceId();
  }

  const auto now   = util::Now();
  input.created_at = now;
  input.updated_at = now;
  if (input.metadata.created_by.empty()) input.metadata.created_by = call.actor;
  if (input.metadata.modified_by.empty()) input.metadata.modified_by = call.actor;
  input.vector.clear();
  input.state = model::ResourceState::kUnvectorized;

  const auto schema = LookupSchema(input.provider, input.type);
  validator_.Check(input, schema ? &*schema : nullptr);

  ResourceLock lock(*this, input.id);

  if (embedder_) {
    call.deadline.Check("before embedding");
    input.vector = Embed(input);
    input.state  = model::ResourceState::kActive;
    call.deadline.Check("after embedding");
  }

  auto tx = repository_->Begin();
  if (repository_->GetResource(*tx, input.id)) {
    throw util::AlreadyExists("resource already exists: " + input.id);
  }
  db::ThrowIfDbError(repository_->InsertResource(*tx, ToResourceRecord(input)), "insert resource " + input.id);

  const auto record = chain_.Append(*tx, NewChange(input.id, model::ChangeOperation::kCreate, Snapshot(input), call.actor));

  call.deadline.Check("before commit");
  tx->Commit();

  SIROS_LOG_INFO("resource created", {observability::StringField("resource_id", input.id), observability::StringField("provider", input.provider),
                                      observability::StringField("type", input.type), observability::StringField("state", model::ToString(input.state)),
                                      observability::IntField("sequence", static_cast<std::int64_t>(record.sequence))});
  return WithoutVector(std::move(input));
}

model::Resource ResourceManager::Update(const std::string& id, const ResourcePatch& patch, const CallOptions& call) {
  ResourceLock lock(*this, id);

  std::optional<db::model::ResourceRecord> current;
  {
    auto tx = repository_->BeginRead();
    current = repository_->GetResource(*tx, id);
  }
  if (!current) {
    throw util::NotFound("resource not found: " + id);
  }

  const auto before = FromResourceRecord(*current);
  auto       after  = before;

  if (patch.name) after.name = *patch.name;
  if (patch.region) after.region = *patch.region;
  if (patch.data) after.data = *patch.data;
  if (patch.tags) after.tags = *patch.tags;
  if (patch.metadata) {
    after.metadata.iam    = patch.metadata->iam;
    after.metadata.custom = patch.metadata->custom;
  }
  if (patch.parent_id) {
    after.parent_id = patch.parent_id->empty() ? std::nullopt : std::optional<std::string>(*patch.parent_id);
  }
  if (patch.children) after.children = *patch.children;
  if (patch.links) after.links = *patch.links;
  if (patch.last_scanned_at) after.last_scanned_at = *patch.last_scanned_at;
  if (!call.actor.empty()) after.metadata.modified_by = call.actor;
  after.updated_at = std::max(util::Now(), before.updated_at);

  const auto schema = LookupSchema(after.provider, after.type);
  validator_.Check(after, schema ? &*schema : nullptr);

  const bool revectorize = embedder_ && (before.vector.empty() || TouchesVectorizedContent(DiffResources(before, after)));
  if (revectorize) {
    call.deadline.Check("before embedding");
    after.vector = Embed(after);
    after.state  = model::ResourceState::kActive;
    call.deadline.Check("after embedding");
  }
  if (!model::CanTransition(before.state, after.state)) {
    throw util::Conflict(std::string("resource ") + id + " cannot move from " + model::ToString(before.state) + " to " + model::ToString(after.state));
  }

  google::protobuf::Struct changes;
  (*changes.mutable_fields())["fields"].mutable_struct_value()->CopyFrom(DiffResources(before, after));
  (*changes.mutable_fields())["revectorized"].set_bool_value(revectorize);

  auto tx     = repository_->Begin();
  auto latest = repository_->GetResource(*tx, id);
  if (!latest) {
    throw util::NotFound("resource not found: " + id);
  }
  if (latest->updated_at_ms != current->updated_at_ms) {
    throw util::Conflict("resource " + id + " was modified concurrently");
  }
  db::ThrowIfDbError(repository_->UpdateResource(*tx, ToResourceRecord(after)), "update resource " + id);

  const auto record = chain_.Append(*tx, NewChange(id, model::ChangeOperation::kUpdate, std::move(changes), call.actor));

  call.deadline.Check("before commit");
  tx->Commit();

  SIROS_LOG_INFO("resource updated", {observability::StringField("resource_id", id), observability::BoolField("revectorized", revectorize),
                                      observability::IntField("sequence", static_cast<std::int64_t>(record.sequence))});
  return WithoutVector(std::move(after));
}

void ResourceManager::Delete(const std::string& id, const CallOptions& call) {
  ResourceLock lock(*this, id);

  auto tx      = repository_->Begin();
  auto current = repository_->GetResource(*tx, id);
  if (!current) {
    throw util::NotFound("resource not found: " + id);
  }

  auto resource  = FromResourceRecord(*current);
  resource.state = model::ResourceState::kDeleted;

  // The delete record goes in first; the row is only removed once the
  // chain has accepted it.
  const auto record = chain_.Append(*tx, NewChange(id, model::ChangeOperation::kDelete, Snapshot(resource), call.actor));
  db::ThrowIfDbError(repository_->DeleteResource(*tx, id), "delete resource " + id);

  call.deadline.Check("before commit");
  tx->Commit();

  SIROS_LOG_INFO("resource deleted",
                 {observability::StringField("resource_id", id), observability::IntField("sequence", static_cast<std::int64_t>(record.sequence))});
}

// ---------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------

model::Resource ResourceManager::Get(const std::string& id, bool include_vector) {
  auto tx     = repository_->BeginRead();
  auto record = repository_->GetResource(*tx, id);
  if (!record) {
    throw util::NotFound("resource not found: " + id);
  }
  auto resource = FromResourceRecord(*record);
  return include_vector ? resource : WithoutVector(std::move(resource));
}

std::vector<model::Resource> ResourceManager::List(const ListQuery& query) {
  db::Pagination page;
  page.limit  = query.limit == 0 ? options_.default_page_limit : std::min(query.limit, options_.max_page_limit);
  page.offset = query.offset;

  auto tx   = repository_->BeginRead();
  auto rows = repository_->ListResources(*tx, query.filter, page, query.order);

  std::vector<model::Resource> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(WithoutVector(FromResourceRecord(row)));
  }
  return out;
}

std::vector<SimilarResource> ResourceManager::SearchSimilar(const SimilarityQuery& query, const CallOptions& call) {
  const int kinds = (query.vector ? 1 : 0) + (query.resource_id ? 1 : 0) + (query.text ? 1 : 0);
  if (kinds != 1) {
    throw util::InvalidArgument("similarity query needs exactly one of vector, resource_id or text");
  }
  if (query.k < 1) {
    throw util::InvalidArgument("k must be at least 1, got " + std::to_string(query.k));
  }
  const auto k = std::min(static_cast<std::size_t>(query.k), options_.max_k);
  if (query.max_distance && !(*query.max_distance >= 0.0 && *query.max_distance <= 2.0)) {
    throw util::InvalidArgument("max_distance must lie in [0, 2], got " + std::to_string(*query.max_distance));
  }

  model::FloatVector         probe;
  std::optional<std::string> exclude;

  if (query.vector) {
    if (query.vector->size() != repository_->VectorDimension()) {
      throw util::InvalidArgument("query vector has " + std::to_string(query.vector->size()) + " dimensions, store expects " +
                                  std::to_string(repository_->VectorDimension()));
    }
    if (!AllFinite(*query.vector)) {
      throw util::InvalidArgument("query vector has a non-finite component");
    }
    probe = *query.vector;
  } else if (query.resource_id) {
    auto tx     = repository_->BeginRead();
    auto record = repository_->GetResource(*tx, *query.resource_id);
    if (!record) {
      throw util::NotFound("resource not found: " + *query.resource_id);
    }
    if (record->vector.empty()) {
      throw util::InvalidArgument("resource " + *query.resource_id + " has no vector");
    }
    probe   = record->vector;
    exclude = *query.resource_id;
  } else {
    if (IsBlank(*query.text)) {
      throw util::InvalidArgument("query text is empty");
    }
    if (!embedder_) {
      throw util::InvalidArgument("text similarity queries need an embedding provider");
    }
    call.deadline.Check("before embedding");
    google::protobuf::Struct content;
    (*content.mutable_fields())["text"] = StringValue(*query.text);
    probe                               = Embed(content, google::protobuf::Struct{});
    call.deadline.Check("after embedding");
  }

  auto tx        = repository_->BeginRead();
  auto neighbors = repository_->NearestNeighbors(*tx, probe, k, query.filter, exclude, query.max_distance);

  std::vector<SimilarResource> out;
  out.reserve(neighbors.size());
  for (const auto& neighbor : neighbors) {
    out.push_back({WithoutVector(FromResourceRecord(neighbor.record)), neighbor.distance});
  }
  return out;
}

std::vector<model::Resource> ResourceManager::SearchText(const TextQuery& query) {
  if (IsBlank(query.query)) {
    throw util::InvalidArgument("search text is empty");
  }

  db::Pagination page;
  page.limit  = query.limit == 0 ? options_.default_page_limit : std::min(query.limit, options_.max_page_limit);
  page.offset = query.offset;

  auto tx   = repository_->BeginRead();
  auto rows = repository_->SearchText(*tx, query.query, query.filter, page);

  std::vector<model::Resource> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(WithoutVector(FromResourceRecord(row)));
  }
  return out;
}

// ---------------------------------------------------------------------
// Audit
// ---------------------------------------------------------------------

std::vector<model::ChangeRecord> ResourceManager::GetAuditTrail(const std::string& resource_id) {
  auto tx = repository_->BeginRead();
  return chain_.History(*tx, resource_id);
}

std::uint64_t ResourceManager::VerifyChain(const std::string& resource_id) {
  auto       tx      = repository_->BeginRead();
  const auto checked = chain_.Verify(*tx, resource_id);
  if (checked == 0) {
    throw util::NotFound("no audit chain for " + resource_id);
  }
  return checked;
}

audit::VerifyReport ResourceManager::VerifyAllChains() {
  auto tx = repository_->BeginRead();
  return chain_.VerifyAll(*tx);
}

// ---------------------------------------------------------------------
// Schema registry
// ---------------------------------------------------------------------

model::Schema ResourceManager::RegisterSchema(model::Schema schema) {
  auto result = validator_.ValidateSchema(schema);
  if (!result) {
    throw util::ValidationFailed(result.code, result.field, result.message);
  }

  auto tx           = repository_->Begin();
  auto existing     = repository_->GetSchema(*tx, schema.provider, schema.type);
  schema.created_at = existing ? util::FromUnixMillis(existing->created_at_ms) : util::Now();
  db::ThrowIfDbError(repository_->UpsertSchema(*tx, ToSchemaRecord(schema)), "register schema " + schema.provider + "/" + schema.type);
  tx->Commit();

  SIROS_LOG_INFO("schema registered", {observability::StringField("provider", schema.provider), observability::StringField("type", schema.type),
                                       observability::StringField("version", schema.version)});
  return schema;
}

model::Schema ResourceManager::GetSchema(const std::string& provider, const std::string& type) {
  auto schema = LookupSchema(provider, type);
  if (!schema) {
    throw util::NotFound("schema not found: " + provider + "/" + type);
  }
  return *schema;
}

std::vector<model::Schema> ResourceManager::ListSchemas(const std::string& provider) {
  auto tx = repository_->BeginRead();

  std::vector<model::Schema> out;
  for (const auto& record : repository_->ListSchemas(*tx, provider)) {
    out.push_back(FromSchemaRecord(record));
  }
  return out;
}

void ResourceManager::DeleteSchema(const std::string& provider, const std::string& type) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteSchema(*tx, provider, type), "delete schema " + provider + "/" + type);
  tx->Commit();

  SIROS_LOG_INFO("schema deleted", {observability::StringField("provider", provider), observability::StringField("type", type)});
}

} // namespace siros::core
