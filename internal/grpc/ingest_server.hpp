#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "impact/services/v1/ingest_service.grpc.pb.h"
#include "internal/service/ingest_service.hpp"
#include "impact/v1.hpp"

namespace impact::grpc {

class IngestServer final : public impact::v1::EventIngestService::Service {
public:
  explicit IngestServer(std::shared_ptr<impact::service::IngestService> svc);

  ::grpc::Status UpsertEvents(::grpc::ServerContext*,
                            const impact::v1::UpsertEventsRequest*,
                            impact::v1::UpsertEventsResponse*) override;

  ::grpc::Status PurgeExpired(::grpc::ServerContext*,
                            const impact::v1::PurgeExpiredRequest*,
                            impact::v1::PurgeExpiredResponse*) override;

private:
  std::shared_ptr<impact::service::IngestService> service_;
};

}
