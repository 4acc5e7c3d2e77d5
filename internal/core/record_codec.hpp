#pragma once

#include <google/protobuf/struct.pb.h>

#include "internal/db/model/resource_record.hpp"
#include "internal/db/model/schema_record.hpp"
#include "internal/model/resource.hpp"
#include "internal/model/schema.hpp"

namespace siros::core {

/*
  Conversions between the domain model and repository rows, plus the
  Struct views the lifecycle needs (audit snapshots, embedding input).

  Decoding a row that does not parse throws util::PersistenceFailed:
  the store holds something this build never wrote.
*/

db::model::ResourceRecord ToResourceRecord(const model::Resource& resource);
model::Resource           FromResourceRecord(const db::model::ResourceRecord& record);

db::model::SchemaRecord ToSchemaRecord(const model::Schema& schema);
model::Schema           FromSchemaRecord(const db::model::SchemaRecord& record);

// Full resource state without the vector. Used for create and delete records.
google::protobuf::Struct Snapshot(const model::Resource& resource);

// Vectorizable content: classification, name, data and tags.
google::protobuf::Struct EmbeddingContent(const model::Resource& resource);
// Vectorizable metadata: iam and custom.
google::protobuf::Struct EmbeddingMetadata(const model::Resource& resource);

google::protobuf::Value StringValue(const std::string& s);
google::protobuf::Value NumberValue(double v);
google::protobuf::Value NullValue();

} // namespace siros::core
