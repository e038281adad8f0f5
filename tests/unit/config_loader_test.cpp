#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "impact_engine_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "/var/lib/impact/events.db"
    wal_mode: true
logging:
  level: debug
engine:
  max_route_vertices: 2000
  default_speed_kph: 45.5
  direction_tolerance_deg: 30
  lookahead_sec: 7200
  request_deadline_ms: 2500
  max_workers: 4
  poll_page_limit: 250
  google_precision: 6
  point_buffer_m: 150
)");

  auto config = impact::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.engine().max_route_vertices() == 2000);
  assert(config.engine().default_speed_kph() == 45.5);
  assert(config.engine().direction_tolerance_deg() == 30.0);
  assert(config.engine().lookahead_sec() == 7200);
  assert(config.engine().max_workers() == 4);
  assert(config.engine().google_precision() == 6);
  assert(config.engine().point_buffer_m() == 150.0);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\impact\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = impact::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\impact\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  auto config = impact::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "line1\nline2☃"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestEmptyDocumentGivesDefaults() {
  auto config = impact::config::ConfigLoader::LoadFromYamlString("");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
  assert(config.engine().max_workers() == 0);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)impact::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsAnError() {
  bool threw = false;
  try {
    (void)impact::config::ConfigLoader::LoadFromYaml("/nonexistent/impact/config.yaml");
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestEmptyDocumentGivesDefaults();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsAnError();

  std::cout << "impact_engine_unit_config_loader: pass\n";
  return 0;
}
