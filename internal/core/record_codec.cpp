#include "record_codec.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace siros::core {

namespace {

google::protobuf::Value StructValue(const google::protobuf::Struct& s) {
  google::protobuf::Value v;
  *v.mutable_struct_value() = s;
  return v;
}

google::protobuf::Struct TagsStruct(const std::map<std::string, std::string>& tags) {
  google::protobuf::Struct s;
  for (const auto& [key, value] : tags) {
    (*s.mutable_fields())[key] = StringValue(value);
  }
  return s;
}

google::protobuf::Struct MetadataStruct(const model::ResourceMetadata& metadata) {
  google::protobuf::Struct s;
  auto&                    fields = *s.mutable_fields();
  fields["created_by"]            = StringValue(metadata.created_by);
  fields["modified_by"]           = StringValue(metadata.modified_by);
  fields["iam"]                   = StructValue(metadata.iam);
  fields["custom"]                = StructValue(metadata.custom);
  return s;
}

google::protobuf::ListValue ChildrenList(const std::set<std::string>& children) {
  google::protobuf::ListValue list;
  for (const auto& child : children) {
    *list.add_values() = StringValue(child);
  }
  return list;
}

google::protobuf::ListValue LinksList(const std::vector<model::ResourceLink>& links) {
  google::protobuf::ListValue list;
  for (const auto& link : links) {
    google::protobuf::Struct s;
    auto&                    fields = *s.mutable_fields();
    fields["target_id"]             = StringValue(link.target_id);
    fields["type"]                  = StringValue(link.type);
    fields["direction"]             = StringValue(link.direction);
    fields["properties"]            = StructValue(TagsStruct(link.properties));
    *list.add_values()              = StructValue(s);
  }
  return list;
}

std::string FieldString(const google::protobuf::Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  if (it == s.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

google::protobuf::Struct FieldStruct(const google::protobuf::Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  if (it == s.fields().end() || it->second.kind_case() != google::protobuf::Value::kStructValue) {
    return {};
  }
  return it->second.struct_value();
}

std::map<std::string, std::string> StringMap(const google::protobuf::Struct& s) {
  std::map<std::string, std::string> out;
  for (const auto& entry : s.fields()) {
    out[entry.first] = entry.second.string_value();
  }
  return out;
}

} // namespace

google::protobuf::Value StringValue(const std::string& s) {
  google::protobuf::Value v;
  v.set_string_value(s);
  return v;
}

google::protobuf::Value NumberValue(double d) {
  google::protobuf::Value v;
  v.set_number_value(d);
  return v;
}

google::protobuf::Value NullValue() {
  google::protobuf::Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

db::model::ResourceRecord ToResourceRecord(const model::Resource& resource) {
  db::model::ResourceRecord record;
  record.id            = resource.id;
  record.type          = resource.type;
  record.provider      = resource.provider;
  record.region        = resource.region;
  record.name          = resource.name;
  record.data_json     = util::ToJson(resource.data);
  record.metadata_json = util::ToJson(MetadataStruct(resource.metadata));
  record.tags          = resource.tags;
  record.parent_id     = resource.parent_id.value_or("");
  record.children_json = util::ToJson(ChildrenList(resource.children));
  record.links_json    = util::ToJson(LinksList(resource.links));
  record.vector        = resource.vector;
  record.state         = static_cast<int>(resource.state);
  record.created_at_ms = util::ToUnixMillis(resource.created_at);
  record.updated_at_ms = util::ToUnixMillis(resource.updated_at);
  record.last_scanned_at_ms = resource.last_scanned_at ? util::ToUnixMillis(*resource.last_scanned_at) : 0;
  return record;
}

model::Resource FromResourceRecord(const db::model::ResourceRecord& record) {
  if (record.state < static_cast<int>(model::ResourceState::kUnvectorized) || record.state > static_cast<int>(model::ResourceState::kDeleted)) {
    throw util::PersistenceFailed("resource " + record.id + " has invalid state " + std::to_string(record.state));
  }

  model::Resource resource;
  resource.id       = record.id;
  resource.type     = record.type;
  resource.provider = record.provider;
  resource.region   = record.region;
  resource.name     = record.name;
  resource.tags     = record.tags;
  resource.vector   = record.vector;
  resource.state    = static_cast<model::ResourceState>(record.state);
  if (!record.parent_id.empty()) {
    resource.parent_id = record.parent_id;
  }
  resource.created_at = util::FromUnixMillis(record.created_at_ms);
  resource.updated_at = util::FromUnixMillis(record.updated_at_ms);
  if (record.last_scanned_at_ms != 0) {
    resource.last_scanned_at = util::FromUnixMillis(record.last_scanned_at_ms);
  }

  try {
    util::FromJson(record.data_json, &resource.data);

    google::protobuf::Struct metadata;
    util::FromJson(record.metadata_json, &metadata);
    resource.metadata.created_by  = FieldString(metadata, "created_by");
    resource.metadata.modified_by = FieldString(metadata, "modified_by");
    resource.metadata.iam         = FieldStruct(metadata, "iam");
    resource.metadata.custom      = FieldStruct(metadata, "custom");

    google::protobuf::ListValue children;
    util::FromJson(record.children_json, &children);
    for (const auto& child : children.values()) {
      resource.children.insert(child.string_value());
    }

    google::protobuf::ListValue links;
    util::FromJson(record.links_json, &links);
    for (const auto& item : links.values()) {
      const auto&         s = item.struct_value();
      model::ResourceLink link;
      link.target_id  = FieldString(s, "target_id");
      link.type       = FieldString(s, "type");
      link.direction  = FieldString(s, "direction");
      link.properties = StringMap(FieldStruct(s, "properties"));
      resource.links.push_back(std::move(link));
    }
  } catch (const std::runtime_error& e) {
    throw util::PersistenceFailed("decode resource " + record.id + ": " + e.what());
  }

  return resource;
}

db::model::SchemaRecord ToSchemaRecord(const model::Schema& schema) {
  google::protobuf::ListValue fields;
  for (const auto& field : schema.required_fields) {
    *fields.add_values() = StringValue(field);
  }

  db::model::SchemaRecord record;
  record.provider             = schema.provider;
  record.type                 = schema.type;
  record.name                 = schema.name;
  record.version              = schema.version;
  record.required_fields_json = util::ToJson(fields);
  record.description          = schema.description;
  record.created_at_ms        = util::ToUnixMillis(schema.created_at);
  return record;
}

model::Schema FromSchemaRecord(const db::model::SchemaRecord& record) {
  model::Schema schema;
  schema.provider    = record.provider;
  schema.type        = record.type;
  schema.name        = record.name;
  schema.version     = record.version;
  schema.description = record.description;
  schema.created_at  = util::FromUnixMillis(record.created_at_ms);

  google::protobuf::ListValue fields;
  try {
    util::FromJson(record.required_fields_json, &fields);
  } catch (const std::runtime_error& e) {
    throw util::PersistenceFailed("decode schema " + record.provider + "/" + record.type + ": " + e.what());
  }
  for (const auto& field : fields.values()) {
    schema.required_fields.push_back(field.string_value());
  }
  return schema;
}

google::protobuf::Struct Snapshot(const model::Resource& resource) {
  google::protobuf::Struct s;
  auto&                    fields = *s.mutable_fields();
  fields["id"]                    = StringValue(resource.id);
  fields["type"]                  = StringValue(resource.type);
  fields["provider"]              = StringValue(resource.provider);
  fields["region"]                = StringValue(resource.region);
  fields["name"]                  = StringValue(resource.name);
  fields["data"]                  = StructValue(resource.data);
  fields["tags"]                  = StructValue(TagsStruct(resource.tags));
  fields["metadata"]              = StructValue(MetadataStruct(resource.metadata));
  fields["parent_id"]             = resource.parent_id ? StringValue(*resource.parent_id) : NullValue();

  google::protobuf::Value children;
  *children.mutable_list_value() = ChildrenList(resource.children);
  fields["children"]             = children;

  google::protobuf::Value links;
  *links.mutable_list_value() = LinksList(resource.links);
  fields["links"]             = links;

  fields["state"]      = StringValue(model::ToString(resource.state));
  fields["created_at"] = NumberValue(static_cast<double>(util::ToUnixMillis(resource.created_at)));
  fields["updated_at"] = NumberValue(static_cast<double>(util::ToUnixMillis(resource.updated_at)));
  fields["last_scanned_at"] =
      resource.last_scanned_at ? NumberValue(static_cast<double>(util::ToUnixMillis(*resource.last_scanned_at))) : NullValue();
  return s;
}

google::protobuf::Struct EmbeddingContent(const model::Resource& resource) {
  google::protobuf::Struct s;
  auto&                    fields = *s.mutable_fields();
  fields["type"]                  = StringValue(resource.type);
  fields["provider"]              = StringValue(resource.provider);
  if (!resource.region.empty()) fields["region"] = StringValue(resource.region);
  if (!resource.name.empty()) fields["name"] = StringValue(resource.name);
  if (resource.data.fields_size() > 0) fields["data"] = StructValue(resource.data);
  if (!resource.tags.empty()) fields["tags"] = StructValue(TagsStruct(resource.tags));
  return s;
}

google::protobuf::Struct EmbeddingMetadata(const model::Resource& resource) {
  google::protobuf::Struct s;
  auto&                    fields = *s.mutable_fields();
  if (resource.metadata.iam.fields_size() > 0) fields["iam"] = StructValue(resource.metadata.iam);
  if (resource.metadata.custom.fields_size() > 0) fields["custom"] = StructValue(resource.metadata.custom);
  return s;
}

} // namespace siros::core
