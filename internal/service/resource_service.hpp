#pragma once

#include "internal/service/service_context.hpp"
#include "siros/v1.hpp"

namespace siros::service {

/*
  Request/response facade over ResourceManager.

  Each call opens a span, converts the wire messages and logs failures
  with the route name before rethrowing them to the transport.
*/
class ResourceService {
 public:
  explicit ResourceService(ServiceContext ctx);

  siros::v1::Resource CreateResource(const siros::v1::CreateResourceRequest& req, const RequestContext& rctx = {});
  siros::v1::Resource UpdateResource(const siros::v1::UpdateResourceRequest& req, const RequestContext& rctx = {});
  void                DeleteResource(const siros::v1::DeleteResourceRequest& req, const RequestContext& rctx = {});
  siros::v1::Resource GetResource(const siros::v1::GetResourceRequest& req);

  siros::v1::ListResourcesResponse ListResources(const siros::v1::ListResourcesRequest& req);
  siros::v1::SearchSimilarResponse SearchSimilar(const siros::v1::SearchSimilarRequest& req, const RequestContext& rctx = {});
  siros::v1::SearchTextResponse    SearchText(const siros::v1::SearchTextRequest& req);

  siros::v1::GetAuditTrailResponse GetAuditTrail(const siros::v1::GetAuditTrailRequest& req);
  siros::v1::VerifyChainResponse   VerifyChain(const siros::v1::VerifyChainRequest& req);

  siros::v1::Schema              RegisterSchema(const siros::v1::RegisterSchemaRequest& req);
  siros::v1::Schema              GetSchema(const siros::v1::GetSchemaRequest& req);
  siros::v1::ListSchemasResponse ListSchemas(const siros::v1::ListSchemasRequest& req);
  void                           DeleteSchema(const siros::v1::DeleteSchemaRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace siros::service
