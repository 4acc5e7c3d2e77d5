#include "proto_convert.hpp"

#include "internal/util/time.hpp"

namespace siros::service {

namespace {

void CopyMap(const std::map<std::string, std::string>& in, google::protobuf::Map<std::string, std::string>* out) {
  for (const auto& [key, value] : in) {
    (*out)[key] = value;
  }
}

std::map<std::string, std::string> CopyMap(const google::protobuf::Map<std::string, std::string>& in) {
  std::map<std::string, std::string> out;
  for (const auto& entry : in) {
    out[entry.first] = entry.second;
  }
  return out;
}

siros::v1::ResourceLink ToApi(const model::ResourceLink& link) {
  siros::v1::ResourceLink out;
  out.set_target_id(link.target_id);
  out.set_type(link.type);
  out.set_direction(link.direction);
  CopyMap(link.properties, out.mutable_properties());
  return out;
}

model::ResourceLink FromApi(const siros::v1::ResourceLink& link) {
  model::ResourceLink out;
  out.target_id  = link.target_id();
  out.type       = link.type();
  out.direction  = link.direction();
  out.properties = CopyMap(link.properties());
  return out;
}

siros::v1::ResourceMetadata ToApi(const model::ResourceMetadata& metadata) {
  siros::v1::ResourceMetadata out;
  out.set_created_by(metadata.created_by);
  out.set_modified_by(metadata.modified_by);
  *out.mutable_iam()    = metadata.iam;
  *out.mutable_custom() = metadata.custom;
  return out;
}

model::ResourceMetadata FromApi(const siros::v1::ResourceMetadata& metadata) {
  model::ResourceMetadata out;
  out.created_by  = metadata.created_by();
  out.modified_by = metadata.modified_by();
  out.iam         = metadata.iam();
  out.custom      = metadata.custom();
  return out;
}

} // namespace

siros::v1::ResourceState ToApi(model::ResourceState state) {
  switch (state) {
    case model::ResourceState::kUnvectorized:
      return siros::v1::RESOURCE_STATE_UNVECTORIZED;
    case model::ResourceState::kActive:
      return siros::v1::RESOURCE_STATE_ACTIVE;
    case model::ResourceState::kDeleted:
      return siros::v1::RESOURCE_STATE_DELETED;
  }
  return siros::v1::RESOURCE_STATE_UNSPECIFIED;
}

siros::v1::ChangeOperation ToApi(model::ChangeOperation op) {
  switch (op) {
    case model::ChangeOperation::kCreate:
      return siros::v1::CHANGE_OPERATION_CREATE;
    case model::ChangeOperation::kUpdate:
      return siros::v1::CHANGE_OPERATION_UPDATE;
    case model::ChangeOperation::kDelete:
      return siros::v1::CHANGE_OPERATION_DELETE;
  }
  return siros::v1::CHANGE_OPERATION_UNSPECIFIED;
}

siros::v1::Resource ToApi(const model::Resource& resource) {
  siros::v1::Resource out;
  out.set_id(resource.id);
  out.set_type(resource.type);
  out.set_provider(resource.provider);
  out.set_region(resource.region);
  out.set_name(resource.name);
  *out.mutable_data() = resource.data;
  CopyMap(resource.tags, out.mutable_tags());
  *out.mutable_metadata() = ToApi(resource.metadata);
  if (resource.parent_id) {
    out.set_parent_id(*resource.parent_id);
  }
  for (const auto& child : resource.children) {
    out.add_children(child);
  }
  for (const auto& link : resource.links) {
    *out.add_links() = ToApi(link);
  }
  out.set_state(ToApi(resource.state));
  *out.mutable_created_at() = util::ToProto(resource.created_at);
  *out.mutable_updated_at() = util::ToProto(resource.updated_at);
  if (resource.last_scanned_at) {
    *out.mutable_last_scanned_at() = util::ToProto(*resource.last_scanned_at);
  }
  return out;
}

model::Resource FromApi(const siros::v1::Resource& resource) {
  model::Resource out;
  out.id       = resource.id();
  out.type     = resource.type();
  out.provider = resource.provider();
  out.region   = resource.region();
  out.name     = resource.name();
  out.data     = resource.data();
  out.tags     = CopyMap(resource.tags());
  out.metadata = FromApi(resource.metadata());
  if (resource.has_parent_id() && !resource.parent_id().empty()) {
    out.parent_id = resource.parent_id();
  }
  out.children.insert(resource.children().begin(), resource.children().end());
  for (const auto& link : resource.links()) {
    out.links.push_back(FromApi(link));
  }
  if (resource.has_last_scanned_at()) {
    out.last_scanned_at = util::FromProto(resource.last_scanned_at());
  }
  return out;
}

siros::v1::ChangeRecord ToApi(const model::ChangeRecord& record) {
  siros::v1::ChangeRecord out;
  out.set_id(record.id);
  out.set_resource_id(record.resource_id);
  out.set_sequence(record.sequence);
  out.set_operation(ToApi(record.operation));
  *out.mutable_changes() = record.changes;
  out.set_actor(record.actor);
  *out.mutable_timestamp() = util::ToProto(record.timestamp);
  out.set_previous_hash(record.previous_hash);
  out.set_block_hash(record.block_hash);
  return out;
}

siros::v1::Schema ToApi(const model::Schema& schema) {
  siros::v1::Schema out;
  out.set_provider(schema.provider);
  out.set_type(schema.type);
  out.set_name(schema.name);
  out.set_version(schema.version);
  for (const auto& field : schema.required_fields) {
    out.add_required_fields(field);
  }
  out.set_description(schema.description);
  *out.mutable_created_at() = util::ToProto(schema.created_at);
  return out;
}

model::Schema FromApi(const siros::v1::Schema& schema) {
  model::Schema out;
  out.provider = schema.provider();
  out.type     = schema.type();
  out.name     = schema.name();
  out.version  = schema.version();
  out.required_fields.assign(schema.required_fields().begin(), schema.required_fields().end());
  out.description = schema.description();
  return out;
}

db::ResourceFilter FromApi(const siros::v1::ResourceFilter& filter) {
  db::ResourceFilter out;
  if (!filter.provider().empty()) out.provider = filter.provider();
  if (!filter.type().empty()) out.type = filter.type();
  if (!filter.region().empty()) out.region = filter.region();
  if (!filter.parent_id().empty()) out.parent_id = filter.parent_id();
  out.tags = CopyMap(filter.tags());
  return out;
}

core::ResourcePatch FromApi(const siros::v1::ResourcePatch& patch) {
  core::ResourcePatch out;
  if (patch.has_name()) out.name = patch.name();
  if (patch.has_region()) out.region = patch.region();
  if (patch.has_data()) out.data = patch.data();
  if (patch.has_tags()) out.tags = CopyMap(patch.tags().values());
  if (patch.has_metadata()) out.metadata = FromApi(patch.metadata());
  if (patch.has_parent_id()) out.parent_id = patch.parent_id();
  if (patch.has_children()) {
    out.children = std::set<std::string>(patch.children().ids().begin(), patch.children().ids().end());
  }
  if (patch.has_links()) {
    std::vector<model::ResourceLink> links;
    for (const auto& link : patch.links().links()) {
      links.push_back(FromApi(link));
    }
    out.links = std::move(links);
  }
  if (patch.has_last_scanned_at()) out.last_scanned_at = util::FromProto(patch.last_scanned_at());
  return out;
}

} // namespace siros::service
