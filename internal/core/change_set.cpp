#include "change_set.hpp"

#include <set>
#include <string>

#include <google/protobuf/util/message_differencer.h>

#include "internal/core/record_codec.hpp"

namespace siros::core {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

const std::set<std::string> kNestedFields  = {"data", "tags", "metadata"};
const std::set<std::string> kIgnoredPaths  = {"updated_at", "metadata.modified_by"};
const std::set<std::string> kVectorRoots   = {"type", "provider", "region", "name", "data", "tags"};
const std::set<std::string> kVectorMetaKey = {"metadata.iam", "metadata.custom"};

const Value* Find(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  return it == s.fields().end() ? nullptr : &it->second;
}

bool SameValue(const Value* a, const Value* b) {
  if (!a || !b) {
    return a == b;
  }
  return google::protobuf::util::MessageDifferencer::Equals(*a, *b);
}

void Record(const std::string& path, const Value* before, const Value* after, Struct* diff) {
  if (kIgnoredPaths.count(path) > 0 || SameValue(before, after)) {
    return;
  }
  Struct entry;
  (*entry.mutable_fields())["old"] = before ? *before : NullValue();
  (*entry.mutable_fields())["new"] = after ? *after : NullValue();

  Value v;
  *v.mutable_struct_value()       = entry;
  (*diff->mutable_fields())[path] = v;
}

void DiffNested(const std::string& root, const Struct& before, const Struct& after, Struct* diff) {
  std::set<std::string> keys;
  for (const auto& entry : before.fields()) keys.insert(entry.first);
  for (const auto& entry : after.fields()) keys.insert(entry.first);
  for (const auto& key : keys) {
    Record(root + "." + key, Find(before, key), Find(after, key), diff);
  }
}

} // namespace

Struct DiffResources(const model::Resource& before, const model::Resource& after) {
  const auto old_snapshot = Snapshot(before);
  const auto new_snapshot = Snapshot(after);

  Struct diff;
  for (const auto& entry : new_snapshot.fields()) {
    const auto& key       = entry.first;
    const auto* old_value = Find(old_snapshot, key);
    if (kNestedFields.count(key) > 0) {
      DiffNested(key, old_value ? old_value->struct_value() : Struct{}, entry.second.struct_value(), &diff);
    } else {
      Record(key, old_value, &entry.second, &diff);
    }
  }
  return diff;
}

bool TouchesVectorizedContent(const Struct& diff) {
  for (const auto& entry : diff.fields()) {
    const auto& path = entry.first;
    const auto  root = path.substr(0, path.find('.'));
    if (kVectorRoots.count(root) > 0) {
      return true;
    }
    if (kVectorMetaKey.count(path) > 0) {
      return true;
    }
  }
  return false;
}

} // namespace siros::core
