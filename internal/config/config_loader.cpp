#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace trackq::config {

namespace {

constexpr const char* kDefaultBindAddress       = "127.0.0.1:50061";
constexpr uint32_t    kDefaultConcurrency       = 8;
constexpr uint32_t    kMaxConcurrency           = 32;
constexpr uint32_t    kDefaultProgressStep      = 5;
constexpr uint64_t    kDefaultChunkSizeBytes    = 64 * 1024;
constexpr uint32_t    kDefaultMaxRetries        = 3;
constexpr uint64_t    kDefaultBackoffInitialMs  = 2000;
constexpr uint64_t    kDefaultBackoffMaxMs      = 30000;
constexpr uint64_t    kDefaultIdlePollMs        = 5000;
constexpr uint32_t    kDefaultLogMaxSizeMb      = 10;
constexpr uint32_t    kDefaultLogMaxBackups     = 3;

void Fail(const std::string& message) {
  throw std::runtime_error("Invalid configuration: " + message);
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

trackq::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  trackq::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

// ------------------------------------------------------------
// Defaults / validation
// ------------------------------------------------------------

void ApplyDefaults(trackq::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  if (config.database().backend_case() == trackq::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
  if (config.database().has_sqlite() && !config.database().sqlite().has_wal_mode()) {
    config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
  }

  auto* download = config.mutable_download();
  if (download->quality() == trackq::runtime::config::AUDIO_QUALITY_UNSPECIFIED) {
    download->set_quality(trackq::runtime::config::MP3_320);
  }
  if (download->concurrent_downloads() == 0) {
    download->set_concurrent_downloads(kDefaultConcurrency);
  }
  if (download->progress_step() == 0) {
    download->set_progress_step(kDefaultProgressStep);
  }
  if (download->chunk_size_bytes() == 0) {
    download->set_chunk_size_bytes(kDefaultChunkSizeBytes);
  }

  auto* retry = config.mutable_retry();
  if (!retry->has_max_retries()) {
    retry->set_max_retries(kDefaultMaxRetries);
  }
  if (!retry->has_backoff_initial_ms()) {
    retry->set_backoff_initial_ms(kDefaultBackoffInitialMs);
  }
  if (!retry->has_backoff_max_ms()) {
    retry->set_backoff_max_ms(std::max(kDefaultBackoffMaxMs, retry->backoff_initial_ms()));
  }

  if (config.dispatch().idle_poll_ms() == 0) {
    config.mutable_dispatch()->set_idle_poll_ms(kDefaultIdlePollMs);
  }

  auto* logging = config.mutable_logging();
  if (logging->max_size_mb() == 0) {
    logging->set_max_size_mb(kDefaultLogMaxSizeMb);
  }
  if (logging->max_backups() == 0) {
    logging->set_max_backups(kDefaultLogMaxBackups);
  }
}

void Validate(const trackq::runtime::config::RuntimeConfig& config) {
  const auto& download = config.download();

  if (download.concurrent_downloads() < 1) {
    Fail("concurrent downloads must be at least 1");
  }
  if (download.concurrent_downloads() > kMaxConcurrency) {
    Fail("concurrent downloads cannot exceed " + std::to_string(kMaxConcurrency));
  }
  if (download.quality() != trackq::runtime::config::MP3_320 && download.quality() != trackq::runtime::config::FLAC) {
    Fail("invalid quality (must be MP3_320 or FLAC)");
  }
  if (download.output_dir().empty()) {
    Fail("output directory cannot be empty");
  }
  if (download.progress_step() < 1 || download.progress_step() > 100) {
    Fail("progress step must be between 1 and 100");
  }

  const auto& retry = config.retry();
  if (retry.backoff_max_ms() < retry.backoff_initial_ms()) {
    Fail("retry backoff_max_ms must not be below backoff_initial_ms");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    Fail("database.sqlite.path cannot be empty");
  }

  const auto& logging = config.logging();
  if (!logging.level().empty() && spdlog::level::from_str(logging.level()) == spdlog::level::off && logging.level() != "off") {
    Fail("invalid log level: " + logging.level());
  }
  if (logging.output() != trackq::runtime::config::LoggingConfig::OUTPUT_CONSOLE && logging.file_path().empty()) {
    Fail("logging.file_path is required when logging to a file");
  }
}

} // namespace trackq::config
