#include "resource_server.hpp"

#include <chrono>

#include "grpc_error.hpp"

namespace siros::grpc {

using namespace siros::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

siros::service::RequestContext FromServerContext(const ::grpc::ServerContext* context) {
  siros::service::RequestContext rctx;
  if (!context) {
    return rctx;
  }

  const auto deadline = context->deadline();
  if (deadline == std::chrono::system_clock::time_point::max()) {
    return rctx;
  }

  const auto remaining = deadline - std::chrono::system_clock::now();
  rctx.deadline        = util::Deadline::At(util::Deadline::Clock::now() + std::chrono::duration_cast<util::Deadline::Clock::duration>(remaining));
  return rctx;
}

ResourceServer::ResourceServer(std::shared_ptr<siros::service::ResourceService> svc) : service_(std::move(svc)) {
}

::grpc::Status ResourceServer::CreateResource(::grpc::ServerContext* context, const CreateResourceRequest* req, Resource* resp) {
  return Handle([&] { *resp = service_->CreateResource(*req, FromServerContext(context)); });
}

::grpc::Status ResourceServer::UpdateResource(::grpc::ServerContext* context, const UpdateResourceRequest* req, Resource* resp) {
  return Handle([&] { *resp = service_->UpdateResource(*req, FromServerContext(context)); });
}

::grpc::Status ResourceServer::DeleteResource(::grpc::ServerContext* context, const DeleteResourceRequest* req, google::protobuf::Empty*) {
  return Handle([&] { service_->DeleteResource(*req, FromServerContext(context)); });
}

::grpc::Status ResourceServer::GetResource(::grpc::ServerContext*, const GetResourceRequest* req, Resource* resp) {
  return Handle([&] { *resp = service_->GetResource(*req); });
}

::grpc::Status ResourceServer::ListResources(::grpc::ServerContext*, const ListResourcesRequest* req, ListResourcesResponse* resp) {
  return Handle([&] { *resp = service_->ListResources(*req); });
}

::grpc::Status ResourceServer::SearchSimilar(::grpc::ServerContext* context, const SearchSimilarRequest* req, SearchSimilarResponse* resp) {
  return Handle([&] { *resp = service_->SearchSimilar(*req, FromServerContext(context)); });
}

::grpc::Status ResourceServer::SearchText(::grpc::ServerContext*, const SearchTextRequest* req, SearchTextResponse* resp) {
  return Handle([&] { *resp = service_->SearchText(*req); });
}

::grpc::Status ResourceServer::GetAuditTrail(::grpc::ServerContext*, const GetAuditTrailRequest* req, GetAuditTrailResponse* resp) {
  return Handle([&] { *resp = service_->GetAuditTrail(*req); });
}

::grpc::Status ResourceServer::VerifyChain(::grpc::ServerContext*, const VerifyChainRequest* req, VerifyChainResponse* resp) {
  return Handle([&] { *resp = service_->VerifyChain(*req); });
}

::grpc::Status ResourceServer::RegisterSchema(::grpc::ServerContext*, const RegisterSchemaRequest* req, Schema* resp) {
  return Handle([&] { *resp = service_->RegisterSchema(*req); });
}

::grpc::Status ResourceServer::GetSchema(::grpc::ServerContext*, const GetSchemaRequest* req, Schema* resp) {
  return Handle([&] { *resp = service_->GetSchema(*req); });
}

::grpc::Status ResourceServer::ListSchemas(::grpc::ServerContext*, const ListSchemasRequest* req, ListSchemasResponse* resp) {
  return Handle([&] { *resp = service_->ListSchemas(*req); });
}

::grpc::Status ResourceServer::DeleteSchema(::grpc::ServerContext*, const DeleteSchemaRequest* req, google::protobuf::Empty*) {
  return Handle([&] { service_->DeleteSchema(*req); });
}

} // namespace siros::grpc
