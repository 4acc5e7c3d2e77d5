#pragma once

#include "internal/core/resource_manager.hpp"
#include "internal/db/api/types.hpp"
#include "internal/model/change_record.hpp"
#include "internal/model/resource.hpp"
#include "internal/model/schema.hpp"
#include "siros/v1.hpp"

namespace siros::service {

/*
  Conversions between the siros.v1 wire messages and the domain model.

  Client-supplied state, timestamps and vectors on a Resource are
  ignored; the lifecycle owns them.
*/

siros::v1::Resource ToApi(const model::Resource& resource);
model::Resource     FromApi(const siros::v1::Resource& resource);

siros::v1::ChangeRecord ToApi(const model::ChangeRecord& record);

siros::v1::Schema ToApi(const model::Schema& schema);
model::Schema     FromApi(const siros::v1::Schema& schema);

db::ResourceFilter  FromApi(const siros::v1::ResourceFilter& filter);
core::ResourcePatch FromApi(const siros::v1::ResourcePatch& patch);

siros::v1::ResourceState   ToApi(model::ResourceState state);
siros::v1::ChangeOperation ToApi(model::ChangeOperation op);

} // namespace siros::service
