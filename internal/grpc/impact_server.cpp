#include "impact_server.hpp"
#include "grpc_error.hpp"
#include "impact/v1.hpp"

namespace impact::grpc {

ImpactServer::ImpactServer(std::shared_ptr<impact::service::ImpactService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ImpactServer::GetIncidentEvents(::grpc::ServerContext*,
                                             const impact::v1::GetIncidentEventsRequest* req,
                                             impact::v1::GetIncidentEventsResponse* resp) {
  try {
    *resp = service_->GetIncidentEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ImpactServer::GetUserInformaticEvents(::grpc::ServerContext* ctx,
                                                   const impact::v1::GetUserInformaticEventsRequest* req,
                                                   impact::v1::GetUserInformaticEventsResponse* resp) {
  try {
    *resp = service_->GetUserInformaticEvents(*req, [ctx] { return ctx->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ImpactServer::DecodePolyline(::grpc::ServerContext*,
                                          const impact::v1::DecodePolylineRequest* req,
                                          impact::v1::DecodePolylineResponse* resp) {
  try {
    *resp = service_->DecodePolyline(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ImpactServer::GetUnreadEvents(::grpc::ServerContext* ctx,
                                           const impact::v1::GetUnreadEventsRequest* req,
                                           impact::v1::GetUnreadEventsResponse* resp) {
  try {
    *resp = service_->GetUnreadEvents(*req, [ctx] { return ctx->IsCancelled(); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ImpactServer::AcknowledgeEvents(::grpc::ServerContext*,
                                             const impact::v1::AcknowledgeEventsRequest* req,
                                             impact::v1::AcknowledgeEventsResponse* resp) {
  try {
    *resp = service_->AcknowledgeEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
