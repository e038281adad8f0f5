#include "ingest_server.hpp"
#include "grpc_error.hpp"
#include "impact/v1.hpp"

namespace impact::grpc {

IngestServer::IngestServer(std::shared_ptr<impact::service::IngestService> svc)
    : service_(std::move(svc)) {}

::grpc::Status IngestServer::UpsertEvents(::grpc::ServerContext*,
                                        const impact::v1::UpsertEventsRequest* req,
                                        impact::v1::UpsertEventsResponse* resp) {
  try {
    *resp = service_->UpsertEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status IngestServer::PurgeExpired(::grpc::ServerContext*,
                                        const impact::v1::PurgeExpiredRequest* req,
                                        impact::v1::PurgeExpiredResponse* resp) {
  try {
    *resp = service_->PurgeExpired(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
