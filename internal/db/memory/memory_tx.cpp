#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace siros::db::memory {

namespace {

template <typename Map, typename Key>
std::uint64_t VersionOf(const Map& versions, const Key& key) {
  auto it = versions.find(key);
  return it == versions.end() ? 0 : it->second;
}

template <typename Map, typename Key>
void Publish(Map& committed, const Map& working, const Key& key) {
  auto it = working.find(key);
  if (it == working.end()) {
    committed.erase(key);
  } else {
    committed[key] = it->second;
  }
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
  std::scoped_lock lock(repo_.mutex_);
  working_           = repo_.committed_; // snapshot copy
  snapshot_versions_ = repo_.versions_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::WriteResource(const std::string& id) {
  touched_resources_.insert(id);
  return working_;
}

MemoryRepository::State& MemoryTransaction::WriteChain(const std::string& resource_id) {
  touched_chains_.insert(resource_id);
  return working_;
}

MemoryRepository::State& MemoryTransaction::WriteSchema(const std::string& provider, const std::string& type) {
  touched_schemas_.insert({provider, type});
  return working_;
}

void MemoryTransaction::Commit() {
  if (read_only_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  for (const auto& id : touched_resources_) {
    if (VersionOf(repo_.versions_.resources, id) != VersionOf(snapshot_versions_.resources, id)) {
      throw util::Conflict("transaction conflict: resource " + id + " was modified by a concurrent transaction");
    }
  }
  for (const auto& id : touched_chains_) {
    if (VersionOf(repo_.versions_.chains, id) != VersionOf(snapshot_versions_.chains, id)) {
      throw util::Conflict("transaction conflict: audit chain " + id + " was appended by a concurrent transaction");
    }
  }
  for (const auto& key : touched_schemas_) {
    if (VersionOf(repo_.versions_.schemas, key) != VersionOf(snapshot_versions_.schemas, key)) {
      throw util::Conflict("transaction conflict: schema " + key.first + "/" + key.second + " was modified by a concurrent transaction");
    }
  }

  for (const auto& id : touched_resources_) {
    Publish(repo_.committed_.resources, working_.resources, id);
    ++repo_.versions_.resources[id];
  }
  for (const auto& id : touched_chains_) {
    Publish(repo_.committed_.chains, working_.chains, id);
    ++repo_.versions_.chains[id];
  }
  for (const auto& key : touched_schemas_) {
    Publish(repo_.committed_.schemas, working_.schemas, key);
    ++repo_.versions_.schemas[key];
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace siros::db::memory
