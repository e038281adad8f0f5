#pragma once

#include "impact/core/v1/types.pb.h"

#include "impact/services/v1/impact_service.pb.h"
#include "impact/services/v1/ingest_service.pb.h"

#include "impact/services/v1/impact_service.grpc.pb.h"
#include "impact/services/v1/ingest_service.grpc.pb.h"

namespace impact::v1 {
using namespace ::impact::core::v1;
using namespace ::impact::services::v1;
}
