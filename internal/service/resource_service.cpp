#include "resource_service.hpp"

#include <stdexcept>
#include <string_view>
#include <type_traits>

#include "internal/core/resource_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"

namespace siros::service {

using namespace siros::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view resource_id, Fn&& fn) {
  siros::observability::SpanScope span(route);
  if (!resource_id.empty()) {
    span.SetAttribute("resource.id", resource_id);
  }

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      return;
    } else {
      return fn();
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SIROS_LOG_ERROR("RPC failed", {siros::observability::StringField("route", route), siros::observability::StringField("error", ex.what()),
                                   siros::observability::StringField("resource_id", resource_id)});
    throw;
  }
}

core::CallOptions Call(const std::string& actor, const RequestContext& rctx) {
  core::CallOptions call;
  call.actor    = actor;
  call.deadline = rctx.deadline;
  return call;
}

} // namespace

ResourceService::ResourceService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.manager) {
    throw std::invalid_argument("ResourceService requires a ResourceManager");
  }
}

Resource ResourceService::CreateResource(const CreateResourceRequest& req, const RequestContext& rctx) {
  return ObserveRpc("ResourceService.CreateResource", req.resource().id(), [&] {
    return ToApi(ctx_.manager->Create(FromApi(req.resource()), Call(req.actor(), rctx)));
  });
}

Resource ResourceService::UpdateResource(const UpdateResourceRequest& req, const RequestContext& rctx) {
  return ObserveRpc("ResourceService.UpdateResource", req.id(), [&] {
    if (req.id().empty()) {
      throw util::InvalidArgument("id is required");
    }
    return ToApi(ctx_.manager->Update(req.id(), FromApi(req.patch()), Call(req.actor(), rctx)));
  });
}

void ResourceService::DeleteResource(const DeleteResourceRequest& req, const RequestContext& rctx) {
  ObserveRpc("ResourceService.DeleteResource", req.id(), [&] {
    if (req.id().empty()) {
      throw util::InvalidArgument("id is required");
    }
    ctx_.manager->Delete(req.id(), Call(req.actor(), rctx));
  });
}

Resource ResourceService::GetResource(const GetResourceRequest& req) {
  return ObserveRpc("ResourceService.GetResource", req.id(), [&] { return ToApi(ctx_.manager->Get(req.id())); });
}

ListResourcesResponse ResourceService::ListResources(const ListResourcesRequest& req) {
  return ObserveRpc("ResourceService.ListResources", "", [&] {
    core::ListQuery query;
    query.filter = FromApi(req.filter());
    query.limit  = req.limit();
    query.offset = req.offset();
    query.order  = req.ascending() ? db::SortOrder::kOldestFirst : db::SortOrder::kNewestFirst;

    ListResourcesResponse resp;
    for (const auto& resource : ctx_.manager->List(query)) {
      *resp.add_resources() = ToApi(resource);
    }
    return resp;
  });
}

SearchSimilarResponse ResourceService::SearchSimilar(const SearchSimilarRequest& req, const RequestContext& rctx) {
  return ObserveRpc("ResourceService.SearchSimilar", req.resource_id(), [&] {
    core::SimilarityQuery query;
    switch (req.query_case()) {
      case SearchSimilarRequest::kVector:
        query.vector = model::FloatVector(req.vector().values().begin(), req.vector().values().end());
        break;
      case SearchSimilarRequest::kResourceId:
        query.resource_id = req.resource_id();
        break;
      case SearchSimilarRequest::kText:
        query.text = req.text();
        break;
      default:
        throw util::InvalidArgument("query must set one of vector, resource_id or text");
    }
    query.k      = req.k();
    query.filter = FromApi(req.filter());
    if (req.has_max_distance()) {
      query.max_distance = req.max_distance();
    }

    SearchSimilarResponse resp;
    for (const auto& match : ctx_.manager->SearchSimilar(query, Call("", rctx))) {
      auto* result                = resp.add_results();
      *result->mutable_resource() = ToApi(match.resource);
      result->set_distance(match.distance);
    }
    return resp;
  });
}

SearchTextResponse ResourceService::SearchText(const SearchTextRequest& req) {
  return ObserveRpc("ResourceService.SearchText", "", [&] {
    core::TextQuery query;
    query.query  = req.query();
    query.filter = FromApi(req.filter());
    query.limit  = req.limit();
    query.offset = req.offset();

    SearchTextResponse resp;
    for (const auto& resource : ctx_.manager->SearchText(query)) {
      *resp.add_resources() = ToApi(resource);
    }
    return resp;
  });
}

GetAuditTrailResponse ResourceService::GetAuditTrail(const GetAuditTrailRequest& req) {
  return ObserveRpc("ResourceService.GetAuditTrail", req.resource_id(), [&] {
    GetAuditTrailResponse resp;
    for (const auto& record : ctx_.manager->GetAuditTrail(req.resource_id())) {
      *resp.add_records() = ToApi(record);
    }
    return resp;
  });
}

VerifyChainResponse ResourceService::VerifyChain(const VerifyChainRequest& req) {
  return ObserveRpc("ResourceService.VerifyChain", req.resource_id(), [&] {
    VerifyChainResponse resp;
    if (req.resource_id().empty()) {
      const auto report = ctx_.manager->VerifyAllChains();
      resp.set_chains_verified(report.chains_verified);
      resp.set_records_verified(report.records_verified);
    } else {
      resp.set_chains_verified(1);
      resp.set_records_verified(ctx_.manager->VerifyChain(req.resource_id()));
    }
    return resp;
  });
}

Schema ResourceService::RegisterSchema(const RegisterSchemaRequest& req) {
  return ObserveRpc("ResourceService.RegisterSchema", "", [&] { return ToApi(ctx_.manager->RegisterSchema(FromApi(req.schema()))); });
}

Schema ResourceService::GetSchema(const GetSchemaRequest& req) {
  return ObserveRpc("ResourceService.GetSchema", "", [&] { return ToApi(ctx_.manager->GetSchema(req.provider(), req.type())); });
}

ListSchemasResponse ResourceService::ListSchemas(const ListSchemasRequest& req) {
  return ObserveRpc("ResourceService.ListSchemas", "", [&] {
    ListSchemasResponse resp;
    for (const auto& schema : ctx_.manager->ListSchemas(req.provider())) {
      *resp.add_schemas() = ToApi(schema);
    }
    return resp;
  });
}

void ResourceService::DeleteSchema(const DeleteSchemaRequest& req) {
  ObserveRpc("ResourceService.DeleteSchema", "", [&] { ctx_.manager->DeleteSchema(req.provider(), req.type()); });
}

} // namespace siros::service
