#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/engine_options.hpp"

namespace {

using namespace std::chrono_literals;
using roadcast::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "roadcast_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigParsesIntoOptions() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "/var/lib/roadcast/roadcast.db"
spatial:
  cell_resolution: 6
cache:
  fast_max_entries: 5000
  route_fast_ttl: "3600s"
  stale_grace: "1800s"
gate:
  leader_lock_ttl: "20s"
  follower_wait_timeout: "5s"
graph:
  snap_tolerance_m: 25
  sample_interval_m: 2000
weather:
  max_parallel_fetches: 16
  default_time_zone: "Asia/Tehran"
  segment_interval_m: 25000
discovery:
  enabled: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/roadcast/roadcast.db");

  const auto options = roadcast::config::FromConfig(config);
  assert(options.spatial.cell_resolution == 6);
  assert(options.cache.fast_max_entries == 5000);
  assert(options.cache.route_fast_ttl == 1h);
  assert(options.cache.stale_grace == 30min);
  assert(options.gate.leader_lock_ttl == 20s);
  assert(options.gate.follower_wait_timeout == 5s);
  assert(options.graph.snap_tolerance_m == 25.0);
  assert(options.graph.sample_interval_m == 2000.0);
  assert(options.weather.max_parallel_fetches == 16);
  assert(options.weather.default_time_zone == "Asia/Tehran");
  assert(options.weather.segment_interval_m == 25000.0);
  assert(options.routing.discovery_enabled);
}

void TestDefaultsApplyToEmptySections() {
  auto       config  = ConfigLoader::LoadFromYamlString("server:\n  bind_address: \"127.0.0.1:0\"\n");
  const auto options = roadcast::config::FromConfig(config);

  assert(options.spatial.cell_resolution == 7);
  assert(options.graph.snap_tolerance_m == 50.0);
  assert(options.gate.leader_lock_ttl == 30s);
  assert(options.weather.default_time_zone == "UTC");
  assert(!options.routing.discovery_enabled);
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(weather:
  initial_generation: "007"
database:
  sqlite:
    path: "C:\\roadcast\\\"quoted\"\\db.sqlite"
)");
  assert(config.weather().initial_generation() == "007");
  assert(config.database().sqlite().path() == "C:\\roadcast\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestOutOfRangeResolutionIsRejected() {
  auto config = ConfigLoader::LoadFromYamlString("spatial:\n  cell_resolution: 16\n");

  bool threw = false;
  try {
    (void)roadcast::config::FromConfig(config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigParsesIntoOptions();
  TestDefaultsApplyToEmptySections();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestOutOfRangeResolutionIsRejected();

  std::cout << "config_loader_test: pass" << std::endl;
  return 0;
}
