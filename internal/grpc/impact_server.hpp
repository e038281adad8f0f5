#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "impact/services/v1/impact_service.grpc.pb.h"
#include "internal/service/impact_service.hpp"
#include "impact/v1.hpp"

namespace impact::grpc {

class ImpactServer final : public impact::v1::IncidentImpactService::Service {
public:
  explicit ImpactServer(std::shared_ptr<impact::service::ImpactService> svc);

  ::grpc::Status GetIncidentEvents(::grpc::ServerContext*,
                                 const impact::v1::GetIncidentEventsRequest*,
                                 impact::v1::GetIncidentEventsResponse*) override;

  ::grpc::Status GetUserInformaticEvents(::grpc::ServerContext*,
                                       const impact::v1::GetUserInformaticEventsRequest*,
                                       impact::v1::GetUserInformaticEventsResponse*) override;

  ::grpc::Status DecodePolyline(::grpc::ServerContext*,
                              const impact::v1::DecodePolylineRequest*,
                              impact::v1::DecodePolylineResponse*) override;

  ::grpc::Status GetUnreadEvents(::grpc::ServerContext*,
                               const impact::v1::GetUnreadEventsRequest*,
                               impact::v1::GetUnreadEventsResponse*) override;

  ::grpc::Status AcknowledgeEvents(::grpc::ServerContext*,
                                 const impact::v1::AcknowledgeEventsRequest*,
                                 impact::v1::AcknowledgeEventsResponse*) override;

private:
  std::shared_ptr<impact::service::ImpactService> service_;
};

}
