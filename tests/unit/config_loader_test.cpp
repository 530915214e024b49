#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "submission_gate_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void ClearEnvironment() {
  unsetenv("DATABASE_URL");
  unsetenv("REDIS_URL");
  unsetenv("BIND_ADDR");
}

bool Throws(const std::string& yaml) {
  try {
    (void)gate::config::ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:8080"
database:
  sqlite:
    path: "C:\\gate\\\"quoted\"\\ledger.sqlite"
    wal_mode: true
)");

  auto config = gate::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\gate\\\"quoted\"\\ledger.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestQuotedNumericScalarsStayStrings() {
  auto config = gate::config::ConfigLoader::LoadFromYamlString(R"(task:
  task_id: "0042"
  performance_threshold: 0.75
  validation_data_hash: "00ff"
database:
  memory:
    miners:
      - miner_id: 7
        public_key: "0123456789"
)");

  assert(config.task().task_id() == "0042");
  assert(config.task().performance_threshold() == 0.75);
  assert(config.task().validation_data_hash() == "00ff");
  assert(config.database().memory().miners_size() == 1);
  assert(config.database().memory().miners(0).miner_id() == 7);
  assert(config.database().memory().miners(0).public_key() == "0123456789");
}

void TestUnknownFieldsAreRejected() {
  assert(Throws(R"(server:
  bind_address: "0.0.0.0:8080"
unknown_field: 123
)"));
}

void TestEmptyDocumentGetsDefaults() {
  auto config = gate::config::ConfigLoader::LoadFromYamlString("");

  assert(config.server().bind_address() == "0.0.0.0:8080");
  assert(config.server().io_threads() == 4);
  assert(config.server().worker_threads() == 8);
  assert(config.server().max_body_bytes() == 64ull * 1024 * 1024);
  assert(config.database().has_memory());
  assert(config.cache().has_memory());
  assert(config.cache().memory().max_entries() == 1000000);
  assert(config.verification().max_clock_skew_sec() == 60);
  assert(config.verification().max_age_sec() == 300);
  assert(config.verification().replay_ttl_sec() == 300);
  assert(config.task().task_id() == "task-prod-001");
  assert(config.task().performance_threshold() == 0.90);
  assert(config.task().validation_data_hash() == "deadbeef" + std::string(56, '0'));
}

void TestRedisDefaultsFillGaps() {
  auto config = gate::config::ConfigLoader::LoadFromYamlString(R"(cache:
  redis:
    url: "redis://cache:6380/2"
)");

  assert(config.cache().has_redis());
  assert(config.cache().redis().url() == "redis://cache:6380/2");
  assert(config.cache().redis().pool_size() == 8);
  assert(config.cache().redis().connect_timeout_ms() == 1000);
  assert(config.cache().redis().command_timeout_ms() == 1000);
}

void TestMissingBackendSettingsAreRejected() {
  assert(Throws(R"(database:
  sqlite:
    wal_mode: true
)"));
  assert(Throws(R"(database:
  postgres:
    pool_size: 4
)"));
}

void TestEnvironmentOverrides() {
  setenv("DATABASE_URL", "postgresql://gate:secret@db:5432/gate", 1);
  setenv("REDIS_URL", "redis://:pw@cache:6379/1", 1);
  setenv("BIND_ADDR", "127.0.0.1:9000", 1);

  auto config = gate::config::ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "/tmp/ignored.sqlite"
)");

  assert(config.database().has_postgres());
  assert(config.database().postgres().connection_uri() == "postgresql://gate:secret@db:5432/gate");
  assert(config.database().postgres().pool_size() == 16);
  assert(config.cache().redis().url() == "redis://:pw@cache:6379/1");
  assert(config.server().bind_address() == "127.0.0.1:9000");

  setenv("DATABASE_URL", "sqlite:///var/lib/gate/ledger.sqlite", 1);
  config = gate::config::ConfigLoader::FromEnvironment();
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/gate/ledger.sqlite");

  setenv("DATABASE_URL", "mysql://db/gate", 1);
  bool threw = false;
  try {
    (void)gate::config::ConfigLoader::FromEnvironment();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "unsupported DATABASE_URL scheme must be rejected");

  ClearEnvironment();
}

void TestExplicitZeroWindowIsKept() {
  auto config = gate::config::ConfigLoader::LoadFromYamlString(R"(verification:
  max_clock_skew_sec: 0
  max_age_sec: 0
cache:
  memory:
    max_entries: 0
)");

  assert(config.verification().has_max_clock_skew_sec());
  assert(config.verification().max_clock_skew_sec() == 0);
  assert(config.verification().max_age_sec() == 0);
  assert(config.verification().replay_ttl_sec() == 300);
  assert(config.cache().memory().max_entries() == 0);

  assert(Throws(R"(verification:
  replay_ttl_sec: 0
)"));
}

void TestObservabilitySettings() {
  auto config = gate::config::ConfigLoader::LoadFromYamlString(R"(observability:
  tracing_enabled: true
  transport: "OTLP_TRANSPORT_HTTP"
  trace_sample_ratio: 0.25
  metrics_export_interval_ms: 5000
)");

  assert(config.observability().tracing_enabled());
  assert(config.observability().transport() == gate::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().trace_sample_ratio() == 0.25);
  assert(config.observability().metrics_export_interval_ms() == 5000);

  assert(Throws(R"(observability:
  trace_sample_ratio: 1.5
)"));
  assert(Throws(R"(observability:
  tracing:
    processor: "TRACE_PROCESSOR_SIMPLE"
)"));
}

} // namespace

int main() {
  ClearEnvironment();

  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumericScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestEmptyDocumentGetsDefaults();
  TestRedisDefaultsFillGaps();
  TestExplicitZeroWindowIsKept();
  TestObservabilitySettings();
  TestMissingBackendSettingsAreRejected();
  TestEnvironmentOverrides();

  std::cout << "submission_gate_unit_config_loader: pass\n";
  return 0;
}
