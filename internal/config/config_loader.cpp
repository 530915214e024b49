#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace gate::config {

namespace {

constexpr const char* kDefaultBindAddress   = "0.0.0.0:8080";
constexpr const char* kDefaultRedisUrl      = "redis://127.0.0.1/";
constexpr uint64_t    kDefaultMaxBody       = 64ull * 1024 * 1024;
constexpr uint64_t    kDefaultReplayEntries = 1000000;

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("0123" public keys, numeric task ids)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static gate::runtime::config::RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  gate::runtime::config::RuntimeConfig config;

  // an empty document is a valid all-defaults config
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

gate::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = ParseYamlNode(yaml);
  ApplyEnvironmentOverrides(config);
  ApplyDefaults(config);
  return config;
}

gate::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  auto config = ParseYamlNode(yaml);
  ApplyEnvironmentOverrides(config);
  ApplyDefaults(config);
  return config;
}

gate::runtime::config::RuntimeConfig ConfigLoader::FromEnvironment() {
  gate::runtime::config::RuntimeConfig config;
  ApplyEnvironmentOverrides(config);
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyEnvironmentOverrides(gate::runtime::config::RuntimeConfig& config) {
  if (const char* bind = std::getenv("BIND_ADDR"); bind && *bind) {
    config.mutable_server()->set_bind_address(bind);
  }

  if (const char* url = std::getenv("DATABASE_URL"); url && *url) {
    const std::string value(url);
    if (StartsWith(value, "postgres://") || StartsWith(value, "postgresql://")) {
      const auto pool = config.database().has_postgres() ? config.database().postgres().pool_size() : 0;
      auto*      pg   = config.mutable_database()->mutable_postgres();
      pg->set_connection_uri(value);
      pg->set_pool_size(pool);
    } else if (StartsWith(value, "sqlite://")) {
      config.mutable_database()->mutable_sqlite()->set_path(value.substr(std::string("sqlite://").size()));
    } else {
      throw std::runtime_error("DATABASE_URL: unsupported scheme: " + value);
    }
  }

  if (const char* url = std::getenv("REDIS_URL"); url && *url) {
    config.mutable_cache()->mutable_redis()->set_url(url);
  }
}

void ConfigLoader::ApplyDefaults(gate::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address(kDefaultBindAddress);
  if (server->io_threads() == 0) server->set_io_threads(4);
  if (server->worker_threads() == 0) server->set_worker_threads(8);
  if (server->max_body_bytes() == 0) server->set_max_body_bytes(kDefaultMaxBody);
  if (server->read_timeout_ms() == 0) server->set_read_timeout_ms(30000);

  auto* database = config.mutable_database();
  if (database->backend_case() == gate::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_memory();
  }
  if (database->has_sqlite() && database->sqlite().path().empty()) {
    throw std::runtime_error("database.sqlite.path is required");
  }
  if (database->has_postgres()) {
    if (database->postgres().connection_uri().empty()) {
      throw std::runtime_error("database.postgres.connection_uri is required");
    }
    if (database->postgres().pool_size() == 0) database->mutable_postgres()->set_pool_size(16);
  }

  auto* cache = config.mutable_cache();
  if (cache->backend_case() == gate::runtime::config::CacheConfig::BACKEND_NOT_SET) {
    cache->mutable_memory();
  }
  if (cache->has_memory() && !cache->memory().has_max_entries()) {
    cache->mutable_memory()->set_max_entries(kDefaultReplayEntries);
  }
  if (cache->has_redis()) {
    auto* redis = cache->mutable_redis();
    if (redis->url().empty()) redis->set_url(kDefaultRedisUrl);
    if (redis->pool_size() == 0) redis->set_pool_size(8);
    if (redis->connect_timeout_ms() == 0) redis->set_connect_timeout_ms(1000);
    if (redis->command_timeout_ms() == 0) redis->set_command_timeout_ms(1000);
  }

  auto* verification = config.mutable_verification();
  if (!verification->has_max_clock_skew_sec()) verification->set_max_clock_skew_sec(60);
  if (!verification->has_max_age_sec()) verification->set_max_age_sec(300);
  if (!verification->has_replay_ttl_sec()) verification->set_replay_ttl_sec(300);
  if (verification->replay_ttl_sec() == 0) {
    throw std::runtime_error("verification.replay_ttl_sec must be positive");
  }

  const auto& observability = config.observability();
  if (observability.has_trace_sample_ratio() &&
      !(observability.trace_sample_ratio() >= 0.0 && observability.trace_sample_ratio() <= 1.0)) {
    throw std::runtime_error("observability.trace_sample_ratio must be within [0, 1]");
  }

  auto* task = config.mutable_task();
  if (task->task_id().empty()) {
    task->set_task_id("task-prod-001");
    if (task->performance_threshold() == 0.0) task->set_performance_threshold(0.90);
    if (task->validation_data_hash().empty()) task->set_validation_data_hash("deadbeef" + std::string(56, '0'));
  }
}

} // namespace gate::config
