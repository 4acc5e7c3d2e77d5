#include "memory_repository.hpp"

#include <algorithm>
#include <cctype>

#include "internal/index/similarity.hpp"
#include "memory_tx.hpp"

namespace siros::db::memory {

namespace {

bool Matches(const model::ResourceRecord& r, const ResourceFilter& f) {
  if (f.provider && r.provider != *f.provider) return false;
  if (f.type && r.type != *f.type) return false;
  if (f.region && r.region != *f.region) return false;
  if (f.parent_id && r.parent_id != *f.parent_id) return false;
  for (const auto& [key, value] : f.tags) {
    auto it = r.tags.find(key);
    if (it == r.tags.end() || it->second != value) return false;
  }
  return true;
}

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool SortsBefore(const model::ResourceRecord& a, const model::ResourceRecord& b, SortOrder order) {
  if (a.created_at_ms != b.created_at_ms) {
    return order == SortOrder::kNewestFirst ? a.created_at_ms > b.created_at_ms : a.created_at_ms < b.created_at_ms;
  }
  return a.id < b.id;
}

std::vector<model::ResourceRecord> Page(std::vector<model::ResourceRecord> matched, const Pagination& page) {
  if (page.offset >= matched.size()) return {};
  auto first = matched.begin() + static_cast<std::ptrdiff_t>(page.offset);
  auto last  = matched.begin() + static_cast<std::ptrdiff_t>(std::min(matched.size(), page.offset + page.limit));
  return {std::make_move_iterator(first), std::make_move_iterator(last)};
}

Result ReadOnlyError() {
  return Result::Err(ErrorCode::Unsupported, "write attempted through a read-only transaction");
}

} // namespace

MemoryRepository::MemoryRepository(std::uint32_t vector_dimension) : vector_dimension_(vector_dimension) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::CheckVector(const model::ResourceRecord& r) const {
  if (!r.vector.empty() && r.vector.size() != vector_dimension_) {
    return Result::Err(ErrorCode::ConstraintViolation, "vector dimension " + std::to_string(r.vector.size()) + " does not match store dimension " +
                                                           std::to_string(vector_dimension_));
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Resources
// ------------------------------------------------------------------

Result MemoryRepository::InsertResource(Transaction& t, const model::ResourceRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();
  if (auto check = CheckVector(r); !check) return check;

  auto& s = tx.WriteResource(r.id);
  if (s.resources.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "resource " + r.id + " already exists");
  s.resources[r.id] = r;
  return Result::Ok();
}

std::optional<model::ResourceRecord> MemoryRepository::GetResource(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.resources.find(id);
  if (it == s.resources.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateResource(Transaction& t, const model::ResourceRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();
  if (auto check = CheckVector(r); !check) return check;

  auto& s = tx.WriteResource(r.id);
  if (!s.resources.contains(r.id)) return Result::Err(ErrorCode::NotFound, "resource " + r.id + " not found");
  s.resources[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteResource(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  auto& s = tx.WriteResource(id);
  if (s.resources.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "resource " + id + " not found");
  return Result::Ok();
}

std::vector<model::ResourceRecord> MemoryRepository::ListResources(Transaction& t, const ResourceFilter& filter, const Pagination& page,
                                                                   SortOrder order) {
  std::vector<model::ResourceRecord> matched;
  for (const auto& [_, record] : TX(t).View().resources) {
    if (Matches(record, filter)) matched.push_back(record);
  }

  std::sort(matched.begin(), matched.end(), [order](const auto& a, const auto& b) { return SortsBefore(a, b, order); });
  return Page(std::move(matched), page);
}

std::vector<NeighborRecord> MemoryRepository::NearestNeighbors(Transaction& t, const std::vector<float>& query, std::size_t k,
                                                               const ResourceFilter& filter, const std::optional<std::string>& exclude_id,
                                                               const std::optional<double>& max_distance) {
  std::vector<model::ResourceRecord> candidates;
  for (const auto& [id, record] : TX(t).View().resources) {
    if (record.vector.empty()) continue;
    if (exclude_id && id == *exclude_id) continue;
    if (Matches(record, filter)) candidates.push_back(record);
  }
  return index::RankNearest(std::move(candidates), query, k, max_distance);
}

std::vector<model::ResourceRecord> MemoryRepository::SearchText(Transaction& t, const std::string& text, const ResourceFilter& filter,
                                                                const Pagination& page) {
  const auto needle = Lower(text);

  std::vector<model::ResourceRecord> matched;
  for (const auto& [_, record] : TX(t).View().resources) {
    if (!Matches(record, filter)) continue;
    if (Lower(record.name).find(needle) != std::string::npos || Lower(record.data_json).find(needle) != std::string::npos) {
      matched.push_back(record);
    }
  }

  std::sort(matched.begin(), matched.end(), [](const auto& a, const auto& b) { return SortsBefore(a, b, SortOrder::kNewestFirst); });
  return Page(std::move(matched), page);
}

// ------------------------------------------------------------------
// Audit chain
// ------------------------------------------------------------------

Result MemoryRepository::AppendChangeRecord(Transaction& t, const model::ChangeLogRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();

  auto& chain = tx.WriteChain(r.resource_id).chains[r.resource_id];
  if (chain.contains(r.sequence)) {
    return Result::Err(ErrorCode::ConstraintViolation,
                       "change record " + r.resource_id + "#" + std::to_string(r.sequence) + " already exists");
  }
  chain.emplace(r.sequence, r);
  return Result::Ok();
}

std::optional<model::ChangeLogRecord> MemoryRepository::GetChainHead(Transaction& t, const std::string& resource_id) {
  const auto& s  = TX(t).View();
  auto        it = s.chains.find(resource_id);
  if (it == s.chains.end() || it->second.empty()) return std::nullopt;
  return it->second.rbegin()->second;
}

std::vector<model::ChangeLogRecord> MemoryRepository::ListChangeRecords(Transaction& t, const std::string& resource_id) {
  std::vector<model::ChangeLogRecord> out;
  const auto&                         s  = TX(t).View();
  auto                                it = s.chains.find(resource_id);
  if (it == s.chains.end()) return out;
  out.reserve(it->second.size());
  for (const auto& [_, record] : it->second)
    out.push_back(record);
  return out;
}

std::vector<std::string> MemoryRepository::ListChainIds(Transaction& t) {
  std::vector<std::string> out;
  for (const auto& [id, chain] : TX(t).View().chains)
    if (!chain.empty()) out.push_back(id);
  return out;
}

// ------------------------------------------------------------------
// Schemas
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSchema(Transaction& t, const model::SchemaRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();
  tx.WriteSchema(r.provider, r.type).schemas[{r.provider, r.type}] = r;
  return Result::Ok();
}

std::optional<model::SchemaRecord> MemoryRepository::GetSchema(Transaction& t, const std::string& provider, const std::string& type) {
  const auto& s  = TX(t).View();
  auto        it = s.schemas.find({provider, type});
  if (it == s.schemas.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SchemaRecord> MemoryRepository::ListSchemas(Transaction& t, const std::string& provider) {
  std::vector<model::SchemaRecord> out;
  for (const auto& [key, record] : TX(t).View().schemas)
    if (provider.empty() || key.first == provider) out.push_back(record);
  return out;
}

Result MemoryRepository::DeleteSchema(Transaction& t, const std::string& provider, const std::string& type) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyError();
  if (tx.WriteSchema(provider, type).schemas.erase({provider, type}) == 0) {
    return Result::Err(ErrorCode::NotFound, "schema " + provider + "/" + type + " not found");
  }
  return Result::Ok();
}

} // namespace siros::db::memory
