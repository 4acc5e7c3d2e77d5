#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/resource_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/embedding/feature_hash_embedder.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/forwarding_repository.hpp"

namespace {

using siros::core::CallOptions;
using siros::core::ResourceManager;
using siros::core::ResourcePatch;
using siros::model::ChangeOperation;
using siros::model::Resource;
using siros::model::ResourceState;

constexpr std::uint32_t kDim = 16;

class FailingEmbedder final : public siros::embedding::EmbeddingProvider {
 public:
  siros::model::FloatVector GenerateVector(const google::protobuf::Struct&, const google::protobuf::Struct&) override {
    throw siros::util::EmbeddingFailed("provider unavailable");
  }
  std::uint32_t Dimension() const override {
    return kDim;
  }
};

// Returns a fixed vector regardless of input.
class ConstantEmbedder final : public siros::embedding::EmbeddingProvider {
 public:
  explicit ConstantEmbedder(siros::model::FloatVector vector) : vector_(std::move(vector)) {
  }
  siros::model::FloatVector GenerateVector(const google::protobuf::Struct&, const google::protobuf::Struct&) override {
    return vector_;
  }
  std::uint32_t Dimension() const override {
    return kDim;
  }

 private:
  siros::model::FloatVector vector_;
};

struct Fixture {
  std::shared_ptr<siros::db::memory::MemoryRepository>  memory = std::make_shared<siros::db::memory::MemoryRepository>(kDim);
  std::shared_ptr<siros::testing::ForwardingRepository> repo   = std::make_shared<siros::testing::ForwardingRepository>(memory);
  std::shared_ptr<siros::embedding::EmbeddingProvider>  embedder;
  std::unique_ptr<ResourceManager>                      manager;

  explicit Fixture(std::shared_ptr<siros::embedding::EmbeddingProvider> e = std::make_shared<siros::embedding::FeatureHashEmbedder>(kDim),
                   siros::core::ManagerOptions                          options = {})
      : embedder(std::move(e)) {
    manager = std::make_unique<ResourceManager>(repo, embedder, siros::validation::Validator{}, options);
  }
};

CallOptions Caller(const std::string& actor = "alice") {
  CallOptions call;
  call.actor = actor;
  return call;
}

Resource MakeResource(const std::string& id, const std::string& provider, const std::string& size) {
  Resource r;
  r.id       = id;
  r.type     = "vm";
  r.provider = provider;
  (*r.data.mutable_fields())["size"].set_string_value(size);
  return r;
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestCreateVectorizesAndRecordsCreate() {
  Fixture f;

  auto created = f.manager->Create(MakeResource("r1", "aws", "t3.micro"), Caller());
  assert(created.id == "r1");
  assert(created.state == ResourceState::kActive);
  assert(created.vector.empty());
  assert(created.metadata.created_by == "alice");
  assert(created.metadata.modified_by == "alice");

  auto stored = f.manager->Get("r1", true);
  assert(stored.vector.size() == kDim);
  assert(f.manager->Get("r1").vector.empty());

  auto trail = f.manager->GetAuditTrail("r1");
  assert(trail.size() == 1);
  assert(trail[0].operation == ChangeOperation::kCreate);
  assert(trail[0].actor == "alice");
  assert(trail[0].changes.fields().at("id").string_value() == "r1");
}

void TestCreateGeneratesIdAndRejectsDuplicates() {
  Fixture f;

  auto created = f.manager->Create(MakeResource("", "aws", "t3.micro"), Caller());
  assert(created.id.rfind("siros-", 0) == 0);

  f.manager->Create(MakeResource("dup", "aws", "a"), Caller());
  assert(Throws<siros::util::AlreadyExists>([&] { f.manager->Create(MakeResource("dup", "aws", "b"), Caller()); }));
  assert(f.manager->GetAuditTrail("dup").size() == 1);
}

void TestUpdateChainsAndRevectorizes() {
  Fixture f;
  f.manager->Create(MakeResource("r1", "aws", "t3.micro"), Caller());
  const auto before = f.manager->Get("r1", true);

  ResourcePatch patch;
  patch.data = before.data;
  (*patch.data->mutable_fields())["size"].set_string_value("t3.large");
  auto updated = f.manager->Update("r1", patch, Caller("bob"));
  assert(updated.data.fields().at("size").string_value() == "t3.large");
  assert(updated.metadata.created_by == "alice");
  assert(updated.metadata.modified_by == "bob");

  const auto after = f.manager->Get("r1", true);
  assert(after.vector != before.vector);

  auto trail = f.manager->GetAuditTrail("r1");
  assert(trail.size() == 2);
  assert(trail[1].operation == ChangeOperation::kUpdate);
  assert(trail[1].previous_hash == trail[0].block_hash);
  assert(trail[1].changes.fields().at("revectorized").bool_value());

  const auto& fields = trail[1].changes.fields().at("fields").struct_value().fields();
  assert(fields.size() == 1);
  assert(fields.at("data.size").struct_value().fields().at("old").string_value() == "t3.micro");
  assert(fields.at("data.size").struct_value().fields().at("new").string_value() == "t3.large");

  assert(f.manager->VerifyChain("r1") == 2);
}

void TestStructuralUpdateKeepsVector() {
  Fixture f;
  f.manager->Create(MakeResource("r1", "aws", "t3.micro"), Caller());
  const auto before = f.manager->Get("r1", true);

  ResourcePatch patch;
  patch.parent_id = "vpc-1";
  f.manager->Update("r1", patch, Caller());

  const auto after = f.manager->Get("r1", true);
  assert(after.parent_id == std::optional<std::string>("vpc-1"));
  assert(after.vector == before.vector);
  assert(!f.manager->GetAuditTrail("r1")[1].changes.fields().at("revectorized").bool_value());

  patch.parent_id = "";
  f.manager->Update("r1", patch, Caller());
  assert(!f.manager->Get("r1").parent_id.has_value());
}

void TestEmptyPatchStillRecordsUpdate() {
  Fixture f;
  f.manager->Create(MakeResource("r1", "aws", "x"), Caller());
  f.manager->Update("r1", ResourcePatch{}, Caller());

  auto trail = f.manager->GetAuditTrail("r1");
  assert(trail.size() == 2);
  assert(trail[1].changes.fields().at("fields").struct_value().fields().empty());
  assert(!trail[1].changes.fields().at("revectorized").bool_value());
}

void TestUpdateAndDeleteOfMissingResource() {
  Fixture f;
  assert(Throws<siros::util::NotFound>([&] { f.manager->Update("nope", ResourcePatch{}, Caller()); }));
  assert(Throws<siros::util::NotFound>([&] { f.manager->Delete("nope", Caller()); }));
  assert(Throws<siros::util::NotFound>([&] { f.manager->Get("nope"); }));
  assert(f.manager->GetAuditTrail("nope").empty());
  assert(Throws<siros::util::NotFound>([&] { f.manager->VerifyChain("nope"); }));
}

void TestDeleteKeepsChain() {
  Fixture f;
  f.manager->Create(MakeResource("r1", "aws", "t3.micro"), Caller());
  f.manager->Delete("r1", Caller("carol"));

  assert(Throws<siros::util::NotFound>([&] { f.manager->Get("r1"); }));
  auto trail = f.manager->GetAuditTrail("r1");
  assert(trail.size() == 2);
  assert(trail[1].operation == ChangeOperation::kDelete);
  assert(trail[1].actor == "carol");
  assert(trail[1].changes.fields().at("state").string_value() == "deleted");
  assert(f.manager->VerifyChain("r1") == 2);

  // Re-creating under the same id continues the chain.
  f.manager->Create(MakeResource("r1", "aws", "t3.nano"), Caller());
  trail = f.manager->GetAuditTrail("r1");
  assert(trail.size() == 3);
  assert(trail[2].sequence == 2);
  assert(trail[2].previous_hash == trail[1].block_hash);
}

void TestEmbeddingFailureLeavesNoTrace() {
  Fixture f(std::make_shared<FailingEmbedder>());

  assert(Throws<siros::util::EmbeddingFailed>([&] { f.manager->Create(MakeResource("r1", "aws", "x"), Caller()); }));
  assert(Throws<siros::util::NotFound>([&] { f.manager->Get("r1"); }));
  assert(f.manager->GetAuditTrail("r1").empty());
}

void TestValidationFailureLeavesNoTrace() {
  Fixture f;
  auto bad = MakeResource("r1", "aws", "x");
  bad.type = "";

  bool rejected = false;
  try {
    f.manager->Create(bad, Caller());
  } catch (const siros::util::ValidationFailed& e) {
    rejected = true;
    assert(e.code() == siros::util::ValidationErrorCode::kMissingField);
    assert(e.field() == "type");
  }
  assert(rejected);
  assert(f.manager->GetAuditTrail("r1").empty());
}

void TestSchemaRequiredFieldsEnforced() {
  Fixture f;

  siros::model::Schema schema;
  schema.provider        = "aws";
  schema.type            = "vm";
  schema.name            = "virtual machine";
  schema.version         = "1";
  schema.required_fields = {"size", "image"};
  auto registered        = f.manager->RegisterSchema(schema);
  assert(registered.created_at != siros::util::TimePoint{});

  bool mismatch = false;
  try {
    f.manager->Create(MakeResource("r1", "aws", "x"), Caller());
  } catch (const siros::util::ValidationFailed& e) {
    mismatch = e.code() == siros::util::ValidationErrorCode::kSchemaMismatch && e.field() == "data.image";
  }
  assert(mismatch);

  auto ok = MakeResource("r2", "aws", "x");
  (*ok.data.mutable_fields())["image"].set_string_value("ami-1");
  f.manager->Create(ok, Caller());

  // Re-registration keeps the original created_at.
  schema.version = "2";
  auto again     = f.manager->RegisterSchema(schema);
  assert(again.created_at == registered.created_at);
  assert(f.manager->GetSchema("aws", "vm").version == "2");
  assert(f.manager->ListSchemas("aws").size() == 1);
  assert(f.manager->ListSchemas("gcp").empty());

  f.manager->DeleteSchema("aws", "vm");
  assert(Throws<siros::util::NotFound>([&] { f.manager->GetSchema("aws", "vm"); }));
  assert(Throws<siros::util::NotFound>([&] { f.manager->DeleteSchema("aws", "vm"); }));

  schema.version = "";
  assert(Throws<siros::util::ValidationFailed>([&] { f.manager->RegisterSchema(schema); }));
}

void TestFailedDeleteAppendKeepsResource() {
  Fixture f;
  f.manager->Create(MakeResource("r1", "aws", "x"), Caller());

  f.repo->on_append = [](const siros::db::model::ChangeLogRecord& r) -> std::optional<siros::db::Result> {
    if (r.operation == "delete") return siros::db::Result::Err(siros::db::ErrorCode::IOError, "disk full");
    return std::nullopt;
  };

  assert(Throws<siros::util::PersistenceFailed>([&] { f.manager->Delete("r1", Caller()); }));
  assert(f.manager->Get("r1").id == "r1");
  assert(f.manager->GetAuditTrail("r1").size() == 1);
}

void TestFailedCreateAppendLeavesNoRow() {
  Fixture f;
  f.repo->on_append = [](const siros::db::model::ChangeLogRecord&) -> std::optional<siros::db::Result> {
    return siros::db::Result::Err(siros::db::ErrorCode::ConstraintViolation, "sequence taken");
  };

  assert(Throws<siros::util::Conflict>([&] { f.manager->Create(MakeResource("r1", "aws", "x"), Caller()); }));
  f.repo->on_append = nullptr;
  assert(Throws<siros::util::NotFound>([&] { f.manager->Get("r1"); }));
  assert(f.manager->GetAuditTrail("r1").empty());
}

void TestExpiredDeadlinePersistsNothing() {
  Fixture     f;
  CallOptions call = Caller();
  call.deadline    = siros::util::Deadline::At(siros::util::Deadline::Clock::now() - std::chrono::seconds(1));

  assert(Throws<siros::util::DeadlineExceeded>([&] { f.manager->Create(MakeResource("r1", "aws", "x"), call); }));
  assert(Throws<siros::util::NotFound>([&] { f.manager->Get("r1"); }));
  assert(f.manager->GetAuditTrail("r1").empty());

  f.manager->Create(MakeResource("r2", "aws", "x"), Caller());
  ResourcePatch patch;
  patch.name = "renamed";
  assert(Throws<siros::util::DeadlineExceeded>([&] { f.manager->Update("r2", patch, call); }));
  assert(f.manager->Get("r2").name.empty());
  assert(Throws<siros::util::DeadlineExceeded>([&] { f.manager->Delete("r2", call); }));
  assert(f.manager->GetAuditTrail("r2").size() == 1);
}

void TestConcurrentUpdatesFormOneChain() {
  Fixture f;
  f.manager->Create(MakeResource("r1", "aws", "t3.micro"), Caller());

  std::atomic<int>         failures{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < 10; ++i) {
    workers.emplace_back([&, i] {
      ResourcePatch patch;
      google::protobuf::Struct data;
      (*data.mutable_fields())["size"].set_string_value("size-" + std::to_string(i));
      patch.data = data;
      try {
        f.manager->Update("r1", patch, Caller("worker-" + std::to_string(i)));
      } catch (const std::exception&) {
        ++failures;
      }
    });
  }
  for (auto& worker : workers) worker.join();

  assert(failures.load() == 0);
  auto trail = f.manager->GetAuditTrail("r1");
  assert(trail.size() == 11);
  for (std::size_t i = 1; i < trail.size(); ++i) {
    assert(trail[i].sequence == i);
    assert(trail[i].previous_hash == trail[i - 1].block_hash);
  }
  assert(f.manager->VerifyChain("r1") == 11);
}

void TestSearchSimilarWithFilter() {
  Fixture f;
  f.manager->Create(MakeResource("a1", "aws", "t3.micro"), Caller());
  f.manager->Create(MakeResource("a2", "aws", "t3.large"), Caller());
  f.manager->Create(MakeResource("a3", "aws", "m5.xlarge"), Caller());
  f.manager->Create(MakeResource("g1", "gcp", "e2-small"), Caller());
  f.manager->Create(MakeResource("z1", "azure", "b1s"), Caller());

  siros::core::SimilarityQuery query;
  query.text            = "t3.micro vm";
  query.k               = 3;
  query.filter.provider = "aws";
  auto results          = f.manager->SearchSimilar(query, Caller());
  assert(results.size() == 3);
  for (std::size_t i = 0; i < results.size(); ++i) {
    assert(results[i].resource.provider == "aws");
    assert(results[i].resource.vector.empty());
    if (i > 0) assert(results[i - 1].distance <= results[i].distance);
  }

  // k larger than the candidate set returns every match.
  query.k = 50;
  assert(f.manager->SearchSimilar(query, Caller()).size() == 3);

  siros::core::SimilarityQuery by_id;
  by_id.resource_id = "a1";
  by_id.k           = 10;
  auto neighbors    = f.manager->SearchSimilar(by_id, Caller());
  assert(neighbors.size() == 4);
  assert(std::none_of(neighbors.begin(), neighbors.end(), [](const auto& n) { return n.resource.id == "a1"; }));

  siros::core::SimilarityQuery by_vector;
  by_vector.vector = f.manager->Get("g1", true).vector;
  by_vector.k      = 1;
  auto nearest     = f.manager->SearchSimilar(by_vector, Caller());
  assert(nearest.size() == 1);
  assert(nearest[0].resource.id == "g1");
  assert(nearest[0].distance < 1e-6);
}

void TestSearchSimilarRejectsBadQueries() {
  Fixture f;
  f.manager->Create(MakeResource("a1", "aws", "x"), Caller());

  siros::core::SimilarityQuery none;
  assert(Throws<siros::util::InvalidArgument>([&] { f.manager->SearchSimilar(none, Caller()); }));

  siros::core::SimilarityQuery two;
  two.text        = "x";
  two.resource_id = "a1";
  assert(Throws<siros::util::InvalidArgument>([&] { f.manager->SearchSimilar(two, Caller()); }));

  siros::core::SimilarityQuery zero_k;
  zero_k.text = "x";
  zero_k.k    = 0;
  assert(Throws<siros::util::InvalidArgument>([&] { f.manager->SearchSimilar(zero_k, Caller()); }));

  siros::core::SimilarityQuery short_vector;
  short_vector.vector = siros::model::FloatVector(kDim - 1, 0.5f);
  assert(Throws<siros::util::InvalidArgument>([&] { f.manager->SearchSimilar(short_vector, Caller()); }));

  siros::core::SimilarityQuery missing;
  missing.resource_id = "nope";
  assert(Throws<siros::util::NotFound>([&] { f.manager->SearchSimilar(missing, Caller()); }));

  siros::core::SimilarityQuery blank;
  blank.text = "  ";
  assert(Throws<siros::util::InvalidArgument>([&] { f.manager->SearchSimilar(blank, Caller()); }));
}

void TestIdleResourceMutexesAreReleased() {
  Fixture f;

  for (int i = 0; i < 1000; ++i) {
    const auto id = "missing-" + std::to_string(i);
    assert(Throws<siros::util::NotFound>([&] { f.manager->Delete(id, Caller()); }));
    assert(Throws<siros::util::NotFound>([&] { f.manager->Update(id, ResourcePatch{}, Caller()); }));
  }
  assert(f.manager->InFlightMutations() == 0);

  f.manager->Create(MakeResource("r1", "aws", "x"), Caller());
  ResourcePatch patch;
  patch.name = "renamed";
  f.manager->Update("r1", patch, Caller());
  assert(f.manager->InFlightMutations() == 0);

  assert(Throws<siros::util::AlreadyExists>([&] { f.manager->Create(MakeResource("r1", "aws", "y"), Caller()); }));
  f.manager->Delete("r1", Caller());
  assert(f.manager->InFlightMutations() == 0);

  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&f, t] {
      for (int i = 0; i < 50; ++i) {
        const auto id = "w" + std::to_string(t) + "-" + std::to_string(i);
        f.manager->Create(MakeResource(id, "aws", "x"), Caller());
        f.manager->Delete(id, Caller());
      }
    });
  }
  for (auto& w : workers)
    w.join();
  assert(f.manager->InFlightMutations() == 0);
}

void TestSearchSimilarRejectsNonFiniteVectors() {
  Fixture f;
  for (int i = 0; i < 3; ++i) {
    f.manager->Create(MakeResource("r" + std::to_string(i), "aws", "size-" + std::to_string(i)), Caller());
  }

  siros::core::SimilarityQuery nan_query;
  nan_query.vector       = f.manager->Get("r0", true).vector;
  (*nan_query.vector)[0] = std::numeric_limits<float>::quiet_NaN();
  nan_query.k            = 3;
  assert(Throws<siros::util::InvalidArgument>([&] { f.manager->SearchSimilar(nan_query, Caller()); }));

  siros::core::SimilarityQuery inf_query;
  inf_query.vector              = siros::model::FloatVector(kDim, 0.1f);
  (*inf_query.vector)[kDim - 1] = std::numeric_limits<float>::infinity();
  assert(Throws<siros::util::InvalidArgument>([&] { f.manager->SearchSimilar(inf_query, Caller()); }));

  // Text queries are embedded under the same checks as stored resources.
  auto nan_vector = siros::model::FloatVector(kDim, 0.25f);
  nan_vector[3]   = std::numeric_limits<float>::quiet_NaN();
  Fixture                      nan_embedder(std::make_shared<ConstantEmbedder>(nan_vector));
  siros::core::SimilarityQuery text;
  text.text = "web";
  assert(Throws<siros::util::EmbeddingFailed>([&] { nan_embedder.manager->SearchSimilar(text, Caller()); }));
  assert(Throws<siros::util::EmbeddingFailed>([&] { nan_embedder.manager->Create(MakeResource("n1", "aws", "x"), Caller()); }));
  assert(nan_embedder.memory->ListChainIds(*nan_embedder.memory->BeginRead()).empty());

  Fixture short_embedder(std::make_shared<ConstantEmbedder>(siros::model::FloatVector(kDim - 2, 0.5f)));
  assert(Throws<siros::util::EmbeddingFailed>([&] { short_embedder.manager->SearchSimilar(text, Caller()); }));
}

void TestSearchSimilarClampsKToMax() {
  siros::core::ManagerOptions options;
  options.max_k = 2;
  Fixture f(std::make_shared<siros::embedding::FeatureHashEmbedder>(kDim), options);
  for (int i = 0; i < 5; ++i) {
    f.manager->Create(MakeResource("r" + std::to_string(i), "aws", "x"), Caller());
  }

  siros::core::SimilarityQuery query;
  query.text = "x";
  query.k    = 5;
  assert(f.manager->SearchSimilar(query, Caller()).size() == 2);

  query.k = 1;
  assert(f.manager->SearchSimilar(query, Caller()).size() == 1);
}

void TestSearchSimilarMaxDistance() {
  Fixture f;
  f.manager->Create(MakeResource("a1", "aws", "t3.micro"), Caller());
  f.manager->Create(MakeResource("a2", "aws", "m5.xlarge"), Caller());
  f.manager->Create(MakeResource("g1", "gcp", "n2-standard"), Caller());

  siros::core::SimilarityQuery query;
  query.vector = f.manager->Get("g1", true).vector;
  query.k      = 10;
  assert(f.manager->SearchSimilar(query, Caller()).size() == 3);

  query.max_distance = 1e-6;
  auto exact         = f.manager->SearchSimilar(query, Caller());
  assert(exact.size() == 1);
  assert(exact[0].resource.id == "g1");

  query.max_distance = 2.0;
  assert(f.manager->SearchSimilar(query, Caller()).size() == 3);

  query.max_distance = -0.1;
  assert(Throws<siros::util::InvalidArgument>([&] { f.manager->SearchSimilar(query, Caller()); }));
  query.max_distance = std::numeric_limits<double>::quiet_NaN();
  assert(Throws<siros::util::InvalidArgument>([&] { f.manager->SearchSimilar(query, Caller()); }));
}

void TestSearchTextMatchesNameAndData() {
  Fixture f;

  auto web = MakeResource("web", "aws", "t3.micro");
  web.name = "Frontend-WebServer";
  f.manager->Create(web, Caller());
  std::this_thread::sleep_for(std::chrono::milliseconds(2));

  auto db = MakeResource("db", "aws", "db.r5.large");
  (*db.data.mutable_fields())["note"].set_string_value("serves the WEBSERVER fleet");
  f.manager->Create(db, Caller());
  std::this_thread::sleep_for(std::chrono::milliseconds(2));

  auto cache = MakeResource("cache", "gcp", "memorystore");
  cache.name = "webserver-cache";
  f.manager->Create(cache, Caller());

  siros::core::TextQuery query;
  query.query = "WebServer";
  auto hits   = f.manager->SearchText(query);
  assert(hits.size() == 3);
  assert(hits[0].id == "cache");
  assert(hits[1].id == "db");
  assert(hits[2].id == "web");
  assert(std::all_of(hits.begin(), hits.end(), [](const auto& r) { return r.vector.empty(); }));

  query.filter.provider = "aws";
  auto aws              = f.manager->SearchText(query);
  assert(aws.size() == 2);
  assert(aws[0].id == "db");

  query.limit  = 1;
  query.offset = 1;
  auto paged   = f.manager->SearchText(query);
  assert(paged.size() == 1);
  assert(paged[0].id == "web");

  siros::core::TextQuery by_size;
  by_size.query = "R5.LARGE";
  auto by_data  = f.manager->SearchText(by_size);
  assert(by_data.size() == 1);
  assert(by_data[0].id == "db");

  siros::core::TextQuery none;
  none.query = "mainframe";
  assert(f.manager->SearchText(none).empty());

  siros::core::TextQuery blank;
  blank.query = " \t";
  assert(Throws<siros::util::InvalidArgument>([&] { f.manager->SearchText(blank); }));
}

void TestEmbeddingDisabledStoresUnvectorized() {
  Fixture f(nullptr);
  auto    created = f.manager->Create(MakeResource("r1", "aws", "x"), Caller());
  assert(created.state == ResourceState::kUnvectorized);
  assert(f.manager->Get("r1", true).vector.empty());

  siros::core::SimilarityQuery text;
  text.text = "x";
  assert(Throws<siros::util::InvalidArgument>([&] { f.manager->SearchSimilar(text, Caller()); }));

  siros::core::SimilarityQuery by_id;
  by_id.resource_id = "r1";
  assert(Throws<siros::util::InvalidArgument>([&] { f.manager->SearchSimilar(by_id, Caller()); }));
}

void TestDimensionMismatchRejectedAtConstruction() {
  auto repo     = std::make_shared<siros::db::memory::MemoryRepository>(kDim);
  auto embedder = std::make_shared<siros::embedding::FeatureHashEmbedder>(kDim * 2);
  assert(Throws<std::invalid_argument>([&] { std::make_unique<ResourceManager>(repo, embedder, siros::validation::Validator{}); }));
  assert(Throws<std::invalid_argument>([&] { std::make_unique<ResourceManager>(nullptr, nullptr, siros::validation::Validator{}); }));
}

void TestListFiltersAndPages() {
  Fixture f;
  for (int i = 0; i < 7; ++i) {
    auto r        = MakeResource("r" + std::to_string(i), i % 2 == 0 ? "aws" : "gcp", "x");
    r.tags["env"] = i < 3 ? "prod" : "dev";
    f.manager->Create(r, Caller());
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  siros::core::ListQuery all;
  auto                   everything = f.manager->List(all);
  assert(everything.size() == 7);
  assert(everything.front().id == "r6");
  assert(everything.back().id == "r0");

  siros::core::ListQuery aws;
  aws.filter.provider = "aws";
  assert(f.manager->List(aws).size() == 4);

  siros::core::ListQuery prod;
  prod.filter.tags["env"] = "prod";
  prod.order              = siros::db::SortOrder::kOldestFirst;
  auto prod_rows          = f.manager->List(prod);
  assert(prod_rows.size() == 3);
  assert(prod_rows.front().id == "r0");

  siros::core::ListQuery page;
  page.limit  = 2;
  page.offset = 6;
  assert(f.manager->List(page).size() == 1);
}

void TestVerifyAllChains() {
  Fixture f;
  f.manager->Create(MakeResource("a", "aws", "x"), Caller());
  f.manager->Create(MakeResource("b", "aws", "y"), Caller());
  f.manager->Delete("b", Caller());

  auto report = f.manager->VerifyAllChains();
  assert(report.chains_verified == 2);
  assert(report.records_verified == 3);

  f.repo->on_list_changes = [](std::vector<siros::db::model::ChangeLogRecord>& rows) {
    if (!rows.empty() && rows[0].resource_id == "b") rows[0].actor = "mallory";
  };
  bool broken = false;
  try {
    f.manager->VerifyAllChains();
  } catch (const siros::util::ChainBroken& e) {
    broken = e.resource_id() == "b" && e.index() == 0;
  }
  assert(broken);
}

} // namespace

int main() {
  TestCreateVectorizesAndRecordsCreate();
  TestCreateGeneratesIdAndRejectsDuplicates();
  TestUpdateChainsAndRevectorizes();
  TestStructuralUpdateKeepsVector();
  TestEmptyPatchStillRecordsUpdate();
  TestUpdateAndDeleteOfMissingResource();
  TestDeleteKeepsChain();
  TestEmbeddingFailureLeavesNoTrace();
  TestValidationFailureLeavesNoTrace();
  TestSchemaRequiredFieldsEnforced();
  TestFailedDeleteAppendKeepsResource();
  TestFailedCreateAppendLeavesNoRow();
  TestExpiredDeadlinePersistsNothing();
  TestConcurrentUpdatesFormOneChain();
  TestSearchSimilarWithFilter();
  TestSearchSimilarRejectsBadQueries();
  TestIdleResourceMutexesAreReleased();
  TestSearchSimilarRejectsNonFiniteVectors();
  TestSearchSimilarClampsKToMax();
  TestSearchSimilarMaxDistance();
  TestSearchTextMatchesNameAndData();
  TestEmbeddingDisabledStoresUnvectorized();
  TestDimensionMismatchRejectedAtConstruction();
  TestListFiltersAndPages();
  TestVerifyAllChains();

  std::cout << "siros_resource_manager_test: pass\n";
  return 0;
}
