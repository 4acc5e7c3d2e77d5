#include <algorithm>
#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

#if SIROS_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if SIROS_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using siros::db::ErrorCode;
using siros::db::Repository;
using siros::db::memory::MemoryRepository;
using siros::db::model::ChangeLogRecord;
using siros::db::model::ResourceRecord;
using siros::db::model::SchemaRecord;

constexpr std::uint32_t kDim = 4;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

ResourceRecord MakeRecord(const std::string& id, const std::string& region, std::vector<float> vector, uint64_t created_at_ms) {
  ResourceRecord r;
  r.id            = id;
  r.type          = "vm";
  r.provider      = "aws";
  r.region        = region;
  r.name          = id + "-name";
  r.data_json     = R"({"size":"t3.micro"})";
  r.metadata_json = R"({"created_by":"alice","modified_by":"alice"})";
  r.tags          = {{"env", "prod"}, {"team", "infra"}};
  r.children_json = "[]";
  r.links_json    = "[]";
  r.vector        = std::move(vector);
  r.state         = r.vector.empty() ? 1 : 2;
  r.created_at_ms = created_at_ms;
  r.updated_at_ms = created_at_ms;
  return r;
}

ChangeLogRecord MakeChange(const std::string& resource_id, uint64_t sequence, const std::string& previous_hash) {
  ChangeLogRecord c;
  c.id            = resource_id + "-change-" + std::to_string(sequence);
  c.resource_id   = resource_id;
  c.sequence      = sequence;
  c.operation     = sequence == 0 ? "create" : "update";
  c.changes_json  = R"({"k":1})";
  c.actor         = "alice";
  c.timestamp_ms  = NowMs();
  c.previous_hash = previous_hash;
  c.block_hash    = std::string(64, static_cast<char>('a' + sequence % 6));
  return c;
}

void VerifyResourceLifecycle(Repository& repo, const std::string& id, const std::string& region) {
  auto record = MakeRecord(id, region, {1.0f, 0.0f, 0.0f, 0.0f}, NowMs());
  record.parent_id          = id + "-parent";
  record.children_json      = R"(["c1","c2"])";
  record.last_scanned_at_ms = record.created_at_ms + 5;

  {
    auto tx = repo.Begin();
    assert(repo.InsertResource(*tx, record));

    auto read = repo.GetResource(*tx, id);
    assert(read.has_value());
    assert(read->name == record.name);
    assert(read->tags == record.tags);
    assert(read->vector == record.vector);
    assert(read->parent_id == record.parent_id);
    assert(read->created_at_ms == record.created_at_ms);
    assert(read->last_scanned_at_ms == record.last_scanned_at_ms);
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto dup = repo.InsertResource(*tx, record);
    assert(!dup);
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    record.name          = "renamed";
    record.tags          = {{"env", "dev"}};
    record.vector        = {0.0f, 1.0f, 0.0f, 0.0f};
    record.updated_at_ms = record.created_at_ms + 10;
    assert(repo.UpdateResource(*tx, record));
    tx->Commit();
  }

  {
    auto tx   = repo.BeginRead();
    auto read = repo.GetResource(*tx, id);
    assert(read.has_value());
    assert(read->name == "renamed");
    assert(read->tags.size() == 1);
    assert(read->tags.at("env") == "dev");
    assert(read->vector[1] == 1.0f);
    assert(read->updated_at_ms == record.updated_at_ms);
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteResource(*tx, id));
    assert(!repo.GetResource(*tx, id).has_value());
    tx->Commit();
  }

  auto tx  = repo.Begin();
  auto res = repo.DeleteResource(*tx, id);
  assert(!res);
  assert(res.code == ErrorCode::NotFound);
  tx->Rollback();
}

void VerifyWrongDimensionRejected(Repository& repo, const std::string& id, const std::string& region) {
  auto tx  = repo.Begin();
  auto res = repo.InsertResource(*tx, MakeRecord(id, region, {1.0f, 2.0f}, NowMs()));
  assert(!res);
  assert(res.code == ErrorCode::ConstraintViolation);
  tx->Rollback();
}

void VerifyListFiltersAndPagination(Repository& repo, const std::string& prefix, const std::string& region) {
  const auto base = NowMs();
  {
    auto tx = repo.Begin();
    for (int i = 0; i < 5; ++i) {
      auto r = MakeRecord(prefix + std::to_string(i), region, {}, base + i);
      if (i % 2 == 1) r.tags["env"] = "dev";
      if (i == 4) r.provider = "gcp";
      assert(repo.InsertResource(*tx, r));
    }
    tx->Commit();
  }

  auto tx = repo.BeginRead();

  siros::db::ResourceFilter by_region;
  by_region.region = region;
  auto newest      = repo.ListResources(*tx, by_region, {100, 0}, siros::db::SortOrder::kNewestFirst);
  assert(newest.size() == 5);
  assert(newest.front().id == prefix + "4");
  assert(newest.back().id == prefix + "0");

  auto oldest_page = repo.ListResources(*tx, by_region, {2, 1}, siros::db::SortOrder::kOldestFirst);
  assert(oldest_page.size() == 2);
  assert(oldest_page[0].id == prefix + "1");
  assert(oldest_page[1].id == prefix + "2");

  auto by_tag        = by_region;
  by_tag.tags["env"] = "dev";
  assert(repo.ListResources(*tx, by_tag, {100, 0}, siros::db::SortOrder::kNewestFirst).size() == 2);

  auto by_provider     = by_region;
  by_provider.provider = "gcp";
  auto gcp             = repo.ListResources(*tx, by_provider, {100, 0}, siros::db::SortOrder::kNewestFirst);
  assert(gcp.size() == 1);
  assert(gcp[0].id == prefix + "4");
}

void VerifyNearestNeighbors(Repository& repo, const std::string& prefix, const std::string& region) {
  const auto base = NowMs();
  {
    auto tx = repo.Begin();
    assert(repo.InsertResource(*tx, MakeRecord(prefix + "x", region, {1.0f, 0.0f, 0.0f, 0.0f}, base)));
    assert(repo.InsertResource(*tx, MakeRecord(prefix + "xy", region, {1.0f, 1.0f, 0.0f, 0.0f}, base + 1)));
    assert(repo.InsertResource(*tx, MakeRecord(prefix + "y", region, {0.0f, 1.0f, 0.0f, 0.0f}, base + 2)));
    assert(repo.InsertResource(*tx, MakeRecord(prefix + "none", region, {}, base + 3)));
    auto other     = MakeRecord(prefix + "other", region, {1.0f, 0.0f, 0.0f, 0.0f}, base + 4);
    other.provider = "gcp";
    assert(repo.InsertResource(*tx, other));
    tx->Commit();
  }

  auto tx = repo.BeginRead();

  siros::db::ResourceFilter filter;
  filter.region   = region;
  filter.provider = "aws";

  auto hits = repo.NearestNeighbors(*tx, {1.0f, 0.0f, 0.0f, 0.0f}, 10, filter, std::nullopt, std::nullopt);
  assert(hits.size() == 3);
  assert(hits[0].record.id == prefix + "x");
  assert(hits[1].record.id == prefix + "xy");
  assert(hits[2].record.id == prefix + "y");
  assert(std::fabs(hits[0].distance) < 1e-6);
  assert(std::fabs(hits[1].distance - (1.0 - 1.0 / std::sqrt(2.0))) < 1e-5);
  assert(std::fabs(hits[2].distance - 1.0) < 1e-6);

  auto top1 = repo.NearestNeighbors(*tx, {1.0f, 0.0f, 0.0f, 0.0f}, 1, filter, prefix + "x", std::nullopt);
  assert(top1.size() == 1);
  assert(top1[0].record.id == prefix + "xy");

  // y sits at distance 1.0 and falls outside the cutoff.
  auto close = repo.NearestNeighbors(*tx, {1.0f, 0.0f, 0.0f, 0.0f}, 10, filter, std::nullopt, 0.5);
  assert(close.size() == 2);
  assert(close[0].record.id == prefix + "x");
  assert(close[1].record.id == prefix + "xy");

  assert(repo.NearestNeighbors(*tx, {0.0f, 0.0f, 1.0f, 0.0f}, 10, filter, std::nullopt, 0.5).empty());
}

void VerifyTextSearch(Repository& repo, const std::string& prefix, const std::string& region) {
  const auto base = NowMs();
  {
    auto tx = repo.Begin();

    auto web      = MakeRecord(prefix + "web", region, {}, base);
    web.name      = "Frontend-WebServer";
    web.data_json = R"({"role":"nginx"})";
    assert(repo.InsertResource(*tx, web));

    auto db      = MakeRecord(prefix + "db", region, {}, base + 1);
    db.name      = "orders-db";
    db.data_json = R"({"engine":"Postgres","note":"behind the WEBSERVER"})";
    assert(repo.InsertResource(*tx, db));

    auto cache      = MakeRecord(prefix + "cache", region, {}, base + 2);
    cache.name      = "session_cache";
    cache.data_json = R"({"engine":"redis"})";
    cache.provider  = "gcp";
    assert(repo.InsertResource(*tx, cache));

    auto pct      = MakeRecord(prefix + "pct", region, {}, base + 3);
    pct.name      = "sessionXcache";
    pct.data_json = R"({"load":"90%"})";
    assert(repo.InsertResource(*tx, pct));

    tx->Commit();
  }

  auto tx = repo.BeginRead();

  siros::db::ResourceFilter filter;
  filter.region = region;

  // Name and data both match, case-insensitively, newest first.
  auto hits = repo.SearchText(*tx, "webserver", filter, {100, 0});
  assert(hits.size() == 2);
  assert(hits[0].id == prefix + "db");
  assert(hits[1].id == prefix + "web");

  auto paged = repo.SearchText(*tx, "WebServer", filter, {1, 1});
  assert(paged.size() == 1);
  assert(paged[0].id == prefix + "web");

  auto by_provider     = filter;
  by_provider.provider = "gcp";
  auto redis           = repo.SearchText(*tx, "REDIS", by_provider, {100, 0});
  assert(redis.size() == 1);
  assert(redis[0].id == prefix + "cache");
  assert(repo.SearchText(*tx, "nginx", by_provider, {100, 0}).empty());

  // Wildcard characters match only themselves.
  auto underscore = repo.SearchText(*tx, "session_", filter, {100, 0});
  assert(underscore.size() == 1);
  assert(underscore[0].id == prefix + "cache");

  auto percent = repo.SearchText(*tx, "90%", filter, {100, 0});
  assert(percent.size() == 1);
  assert(percent[0].id == prefix + "pct");

  assert(repo.SearchText(*tx, "mainframe", filter, {100, 0}).empty());
}

void VerifyChainAppendAndUniqueness(Repository& repo, const std::string& resource_id) {
  {
    auto tx = repo.Begin();
    assert(!repo.GetChainHead(*tx, resource_id).has_value());
    auto first = MakeChange(resource_id, 0, std::string(64, '0'));
    assert(repo.AppendChangeRecord(*tx, first));
    assert(repo.AppendChangeRecord(*tx, MakeChange(resource_id, 1, first.block_hash)));
    tx->Commit();
  }

  {
    auto tx   = repo.BeginRead();
    auto head = repo.GetChainHead(*tx, resource_id);
    assert(head.has_value());
    assert(head->sequence == 1);

    auto rows = repo.ListChangeRecords(*tx, resource_id);
    assert(rows.size() == 2);
    assert(rows[0].sequence == 0);
    assert(rows[1].previous_hash == rows[0].block_hash);
    assert(rows[0].changes_json.find("\"k\"") != std::string::npos);

    auto ids = repo.ListChainIds(*tx);
    assert(std::find(ids.begin(), ids.end(), resource_id) != ids.end());
  }

  auto fork = MakeChange(resource_id, 1, "fork");
  fork.id += "-fork";

  auto tx  = repo.Begin();
  auto dup = repo.AppendChangeRecord(*tx, fork);
  assert(!dup);
  assert(dup.code == ErrorCode::ConstraintViolation);
  tx->Rollback();
}

void VerifySchemaRegistry(Repository& repo, const std::string& provider) {
  SchemaRecord schema;
  schema.provider             = provider;
  schema.type                 = "vm";
  schema.name                 = "virtual machine";
  schema.version              = "1";
  schema.required_fields_json = R"(["size"])";
  schema.created_at_ms        = NowMs();

  {
    auto tx = repo.Begin();
    assert(repo.UpsertSchema(*tx, schema));
    schema.version = "2";
    assert(repo.UpsertSchema(*tx, schema));
    tx->Commit();
  }

  {
    auto tx   = repo.BeginRead();
    auto read = repo.GetSchema(*tx, provider, "vm");
    assert(read.has_value());
    assert(read->version == "2");
    assert(read->required_fields_json.find("size") != std::string::npos);
    assert(repo.ListSchemas(*tx, provider).size() == 1);
  }

  auto tx = repo.Begin();
  assert(repo.DeleteSchema(*tx, provider, "vm"));
  auto again = repo.DeleteSchema(*tx, provider, "vm");
  assert(!again);
  assert(again.code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id, const std::string& region) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertResource(*tx, MakeRecord(id, region, {}, NowMs())));
    assert(repo.AppendChangeRecord(*tx, MakeChange(id, 0, std::string(64, '0'))));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertResource(*tx, MakeRecord(id + "-dropped", region, {}, NowMs())));
    // Destructor without Commit rolls back.
  }

  auto tx = repo.BeginRead();
  assert(!repo.GetResource(*tx, id).has_value());
  assert(!repo.GetResource(*tx, id + "-dropped").has_value());
  assert(repo.ListChangeRecords(*tx, id).empty());
}

void VerifyReadTransactionRejectsWrites(Repository& repo, const std::string& id, const std::string& region) {
  auto tx  = repo.BeginRead();
  auto res = repo.InsertResource(*tx, MakeRecord(id, region, {}, NowMs()));
  assert(!res);
  assert(res.code == ErrorCode::Unsupported);
}

void VerifyConcurrentChainAppend(Repository& repo, const std::string& resource_id, bool parallel) {
  if (!parallel) {
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();
  assert(repo.AppendChangeRecord(*tx1, MakeChange(resource_id, 0, std::string(64, '0'))));
  tx1->Commit();

  bool conflicted = false;
  try {
    auto rival = MakeChange(resource_id, 0, std::string(64, '0'));
    rival.id += "-rival";
    auto res = repo.AppendChangeRecord(*tx2, rival);
    if (!res) {
      conflicted = true;
    } else {
      tx2->Commit();
    }
  } catch (const siros::util::Conflict&) {
    conflicted = true;
  }
  assert(conflicted);

  auto verify = repo.BeginRead();
  assert(repo.ListChangeRecords(*verify, resource_id).size() == 1);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id, const std::string& region) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertResource(*tx, MakeRecord(id, region, {0.5f, 0.5f, 0.5f, 0.5f}, NowMs())));
    assert(repo->AppendChangeRecord(*tx, MakeChange(id, 0, std::string(64, '0'))));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->BeginRead();
  auto r  = repo->GetResource(*tx, id);
  assert(r.has_value());
  assert(r->vector.size() == kDim);
  assert(r->vector[2] == 0.5f);
  assert(repo->ListChangeRecords(*tx, id).size() == 1);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(kDim); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if SIROS_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("siros_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto pool = std::make_shared<siros::db::sqlite::SqlitePool>(db_path);
    siros::db::sqlite::BootstrapSchema(*pool, kDim);
    return std::make_shared<siros::db::sqlite::SqliteRepository>(std::move(pool), kDim);
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .supports_parallel_transactions = false,
  };
}
#endif

#if SIROS_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("SIROS_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("SIROS_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<siros::db::postgres::PgPool>(conninfo);
    siros::db::postgres::BootstrapSchema(*pool, kDim);
    return std::make_shared<siros::db::postgres::PgRepository>(std::move(pool), kDim);
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // Persistent backends keep rows across runs; every id and region is run-scoped.
  const auto run    = backend.name + "-" + std::to_string(NowMs());
  const auto region = "region-" + run;

  VerifyResourceLifecycle(*repo, run + "-life", region);
  VerifyWrongDimensionRejected(*repo, run + "-dim", region);
  VerifyListFiltersAndPagination(*repo, run + "-list-", region + "-list");
  VerifyNearestNeighbors(*repo, run + "-nn-", region + "-nn");
  VerifyTextSearch(*repo, run + "-text-", region + "-text");
  VerifyChainAppendAndUniqueness(*repo, run + "-chain");
  VerifySchemaRegistry(*repo, "provider-" + run);
  VerifyRollbackBehavior(*repo, run + "-rollback", region);
  VerifyReadTransactionRejectsWrites(*repo, run + "-readonly", region);
  VerifyConcurrentChainAppend(*repo, run + "-race", backend.supports_parallel_transactions);

  VerifyRestartDurability(backend, run + "-durable", region);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SIROS_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if SIROS_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "siros_repository_parity: pass\n";
  return 0;
}
