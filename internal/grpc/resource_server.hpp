#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/resource_service.hpp"
#include "siros/v1.hpp"

namespace siros::grpc {

class ResourceServer final : public siros::v1::ResourceService::Service {
 public:
  explicit ResourceServer(std::shared_ptr<siros::service::ResourceService> svc);

  ::grpc::Status CreateResource(::grpc::ServerContext*, const siros::v1::CreateResourceRequest*, siros::v1::Resource*) override;
  ::grpc::Status UpdateResource(::grpc::ServerContext*, const siros::v1::UpdateResourceRequest*, siros::v1::Resource*) override;
  ::grpc::Status DeleteResource(::grpc::ServerContext*, const siros::v1::DeleteResourceRequest*, google::protobuf::Empty*) override;
  ::grpc::Status GetResource(::grpc::ServerContext*, const siros::v1::GetResourceRequest*, siros::v1::Resource*) override;
  ::grpc::Status ListResources(::grpc::ServerContext*, const siros::v1::ListResourcesRequest*, siros::v1::ListResourcesResponse*) override;
  ::grpc::Status SearchSimilar(::grpc::ServerContext*, const siros::v1::SearchSimilarRequest*, siros::v1::SearchSimilarResponse*) override;
  ::grpc::Status SearchText(::grpc::ServerContext*, const siros::v1::SearchTextRequest*, siros::v1::SearchTextResponse*) override;

  ::grpc::Status GetAuditTrail(::grpc::ServerContext*, const siros::v1::GetAuditTrailRequest*, siros::v1::GetAuditTrailResponse*) override;
  ::grpc::Status VerifyChain(::grpc::ServerContext*, const siros::v1::VerifyChainRequest*, siros::v1::VerifyChainResponse*) override;

  ::grpc::Status RegisterSchema(::grpc::ServerContext*, const siros::v1::RegisterSchemaRequest*, siros::v1::Schema*) override;
  ::grpc::Status GetSchema(::grpc::ServerContext*, const siros::v1::GetSchemaRequest*, siros::v1::Schema*) override;
  ::grpc::Status ListSchemas(::grpc::ServerContext*, const siros::v1::ListSchemasRequest*, siros::v1::ListSchemasResponse*) override;
  ::grpc::Status DeleteSchema(::grpc::ServerContext*, const siros::v1::DeleteSchemaRequest*, google::protobuf::Empty*) override;

 private:
  std::shared_ptr<siros::service::ResourceService> service_;
};

// Client deadline as a steady-clock Deadline; none set means Never.
siros::service::RequestContext FromServerContext(const ::grpc::ServerContext* context);

} // namespace siros::grpc
