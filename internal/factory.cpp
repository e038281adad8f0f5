#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/engine/eta_validator.hpp"
#include "internal/engine/intersection_engine.hpp"
#include "internal/engine/route_evaluator.hpp"
#include "internal/geo/polyline_codec.hpp"
#include "internal/grpc/impact_server.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/notify/notification_sink.hpp"
#include "internal/notify/notification_targeting.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/impact_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/store/event_store_gateway.hpp"
#if IMPACT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if IMPACT_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace impact::factory {

using namespace impact;

namespace {

#if IMPACT_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::kSqliteSchema) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,source_type,version,updated_at_ms FROM events LIMIT 1;");
  sqlite_db->Exec("SELECT user_id,event_id,delivered_at_ms,read FROM user_event_state LIMIT 1;");
}
#endif

#if IMPACT_DB_POSTGRES
// Runs on its own connection: pooled connections prepare statements against
// these tables on connect.
void BootstrapPostgresSchema(const std::string& connection_uri) {
  pqxx::connection conn(connection_uri);
  pqxx::work       tx(conn);

  for (const auto& sql : db::sql::kPostgresSchema) {
    tx.exec(sql);
  }

  tx.exec("SELECT id,source_type,version,updated_at_ms FROM events LIMIT 1;");
  tx.exec("SELECT user_id,event_id,delivered_at_ms,read FROM user_event_state LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const impact::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if IMPACT_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    IMPACT_LOG_INFO("using sqlite event store", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if IMPACT_DB_POSTGRES
    const auto& pg = database.postgres();
    BootstrapPostgresSchema(pg.connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections() > 0 ? pg.max_connections() : 16);
    IMPACT_LOG_INFO("using postgres event store");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  IMPACT_LOG_WARN("no database configured, using in-memory event store");
  return std::make_shared<db::memory::MemoryRepository>();
}

service::ServiceContext BuildContext(const impact::runtime::config::EngineConfig& engine_config, std::shared_ptr<db::Repository> repository) {
  // ------------------------------------------------------------------
  // Engine components
  // ------------------------------------------------------------------
  geo::PolylineOptions codec_options;
  if (engine_config.max_polyline_length() > 0) {
    codec_options.max_length = engine_config.max_polyline_length();
  }
  if (engine_config.google_precision() > 0) {
    codec_options.google_precision = static_cast<int>(engine_config.google_precision());
  }

  engine::IntersectionOptions intersection_options;
  if (engine_config.max_route_vertices() > 0) {
    intersection_options.max_route_vertices = engine_config.max_route_vertices();
  }

  engine::EtaOptions eta_options;
  if (engine_config.default_speed_kph() > 0.0) {
    eta_options.default_speed_kph = engine_config.default_speed_kph();
  }
  if (engine_config.direction_tolerance_deg() > 0.0) {
    eta_options.direction_tolerance_deg = engine_config.direction_tolerance_deg();
  }

  engine::EvaluatorOptions evaluator_options;
  evaluator_options.max_workers = engine_config.max_workers();

  auto codec         = std::make_shared<geo::PolylineCodec>(codec_options);
  auto intersections = std::make_shared<engine::IntersectionEngine>(intersection_options);
  auto validator     = std::make_shared<engine::EtaValidator>(eta_options);
  auto evaluator     = std::make_shared<engine::RouteEvaluator>(codec, intersections, validator, evaluator_options);
  auto gateway       = std::make_shared<store::EventStoreGateway>(repository);

  // ------------------------------------------------------------------
  // Targeting
  // ------------------------------------------------------------------
  notify::TargetingOptions targeting_options;
  if (engine_config.lookahead_sec() > 0) {
    targeting_options.lookahead = std::chrono::seconds(engine_config.lookahead_sec());
  }
  if (engine_config.request_deadline_ms() > 0) {
    targeting_options.request_deadline = std::chrono::milliseconds(engine_config.request_deadline_ms());
  }
  if (engine_config.poll_page_limit() > 0) {
    targeting_options.poll_page_limit = engine_config.poll_page_limit();
  }

  auto targeting = std::make_shared<notify::NotificationTargeting>(repository, gateway, evaluator, std::make_shared<notify::LoggingNotificationSink>(),
                                                                   targeting_options);

  service::ServiceContext ctx;
  ctx.repository = std::move(repository);
  ctx.gateway    = gateway;
  ctx.codec      = codec;
  ctx.targeting  = targeting;
  if (engine_config.point_buffer_m() > 0.0) {
    ctx.geojson.point_buffer_m = engine_config.point_buffer_m();
  }

  IMPACT_LOG_INFO("engine configured", {observability::IntField("max_workers", static_cast<int64_t>(evaluator->max_workers())),
                                        observability::IntField("max_route_vertices", static_cast<int64_t>(intersection_options.max_route_vertices)),
                                        observability::DoubleField("default_speed_kph", eta_options.default_speed_kph)});
  return ctx;
}

/*
    Build full application dependency graph
*/
Application Build(const impact::runtime::config::RuntimeConfig& config) {
  Application app;
  app.context = BuildContext(config.engine(), BuildRepository(config));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  auto impact_service = std::make_shared<service::ImpactService>(app.context);
  auto ingest_service = std::make_shared<service::IngestService>(app.context);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ImpactServer>(impact_service));
  app.grpc_services.push_back(std::make_unique<grpc::IngestServer>(ingest_service));

  return app;
}

} // namespace impact::factory
