#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "impact/services/v1/impact_service.grpc.pb.h"
#include "impact/services/v1/ingest_service.grpc.pb.h"
#include "impact/v1.hpp"

using namespace impact::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  impactctl <addr> decode <polyline> [google|here]\n"
            << "  impactctl <addr> events <min_lon> <min_lat> <max_lon> <max_lat> [since_version]\n"
            << "  impactctl <addr> affecting <user_id> <route_id>=<polyline>...\n"
            << "  impactctl <addr> unread <user_id> [lat lon]\n"
            << "  impactctl <addr> ack <user_id> <event_id>...\n"
            << "  impactctl <addr> ingest <events.json>\n"
            << "  impactctl <addr> purge\n";
}

static void Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string out;
  if (!google::protobuf::util::MessageToJsonString(message, &out, options).ok()) {
    std::cout << message.DebugString();
    return;
  }
  std::cout << out << "\n";
}

static int Report(const grpc::Status& status, const google::protobuf::Message& resp) {
  if (!status.ok()) {
    std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
    return 2;
  }
  Print(resp);
  return 0;
}

static PolylineFormat ParseFormat(const std::string& value) {
  return value == "here" ? POLYLINE_FORMAT_HERE : POLYLINE_FORMAT_GOOGLE;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto impact_stub = IncidentImpactService::NewStub(channel);
  auto ingest_stub = EventIngestService::NewStub(channel);

  grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(30));

  try {
    // ------------------------------------------------------------

    if (cmd == "decode") {
      if (argc < 4) return 1;

      DecodePolylineRequest req;
      req.set_polyline(argv[3]);
      req.set_format(ParseFormat(argc >= 5 ? argv[4] : "google"));

      DecodePolylineResponse resp;
      return Report(impact_stub->DecodePolyline(&ctx, req, &resp), resp);
    }

    // ------------------------------------------------------------

    if (cmd == "events") {
      if (argc < 7) return 1;

      GetIncidentEventsRequest req;
      req.mutable_bbox()->set_min_lon(std::stod(argv[3]));
      req.mutable_bbox()->set_min_lat(std::stod(argv[4]));
      req.mutable_bbox()->set_max_lon(std::stod(argv[5]));
      req.mutable_bbox()->set_max_lat(std::stod(argv[6]));
      if (argc >= 8) {
        req.set_version(std::stoull(argv[7]));
      }

      GetIncidentEventsResponse resp;
      return Report(impact_stub->GetIncidentEvents(&ctx, req, &resp), resp);
    }

    // ------------------------------------------------------------

    if (cmd == "affecting") {
      if (argc < 5) return 1;

      GetUserInformaticEventsRequest req;
      req.set_user_id(argv[3]);
      for (int i = 4; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto        eq  = arg.find('=');
        if (eq == std::string::npos) {
          std::cerr << "route must be <route_id>=<polyline>: " << arg << "\n";
          return 1;
        }
        auto* route = req.add_routes();
        route->set_id(arg.substr(0, eq));
        route->set_polyline(arg.substr(eq + 1));
        route->set_format(POLYLINE_FORMAT_GOOGLE);
      }

      GetUserInformaticEventsResponse resp;
      return Report(impact_stub->GetUserInformaticEvents(&ctx, req, &resp), resp);
    }

    // ------------------------------------------------------------

    if (cmd == "unread") {
      if (argc < 4) return 1;

      GetUnreadEventsRequest req;
      req.set_user_id(argv[3]);
      if (argc >= 6) {
        req.mutable_location()->set_lat(std::stod(argv[4]));
        req.mutable_location()->set_lon(std::stod(argv[5]));
      }

      GetUnreadEventsResponse resp;
      return Report(impact_stub->GetUnreadEvents(&ctx, req, &resp), resp);
    }

    // ------------------------------------------------------------

    if (cmd == "ack") {
      if (argc < 5) return 1;

      AcknowledgeEventsRequest req;
      req.set_user_id(argv[3]);
      for (int i = 4; i < argc; ++i) {
        req.add_event_ids(argv[i]);
      }

      AcknowledgeEventsResponse resp;
      return Report(impact_stub->AcknowledgeEvents(&ctx, req, &resp), resp);
    }

    // ------------------------------------------------------------

    if (cmd == "ingest") {
      if (argc < 4) return 1;

      std::ifstream in(argv[3]);
      if (!in) {
        std::cerr << "cannot open " << argv[3] << "\n";
        return 1;
      }
      std::stringstream buffer;
      buffer << in.rdbuf();

      // UpsertEventsRequest in proto JSON form: {"events": [...]}
      UpsertEventsRequest req;
      auto                parsed = google::protobuf::util::JsonStringToMessage(buffer.str(), &req);
      if (!parsed.ok()) {
        std::cerr << "invalid events file: " << parsed.ToString() << "\n";
        return 1;
      }

      UpsertEventsResponse resp;
      return Report(ingest_stub->UpsertEvents(&ctx, req, &resp), resp);
    }

    // ------------------------------------------------------------

    if (cmd == "purge") {
      PurgeExpiredRequest  req;
      PurgeExpiredResponse resp;
      return Report(ingest_stub->PurgeExpired(&ctx, req, &resp), resp);
    }
  } catch (const std::exception& e) {
    // std::stod / std::stoull on bad arguments
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
