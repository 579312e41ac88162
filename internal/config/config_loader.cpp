#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdlib>
#include <stdexcept>

namespace cascade::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings
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
  if (endptr && *endptr == '\0') {
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

static cascade::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  cascade::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

cascade::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

cascade::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

// ------------------------------------------------------------
// Delete operation options
// ------------------------------------------------------------

namespace {

constexpr uint32_t kMaxBatchSize = 1000;

template <typename Duration>
Duration OrDefault(bool present, const google::protobuf::Duration& value, Duration fallback, const char* name) {
  if (!present) {
    return fallback;
  }
  const auto ms = google::protobuf::util::TimeUtil::DurationToMilliseconds(value);
  if (ms < 0) {
    throw std::invalid_argument(std::string("delete_operations.") + name + " must not be negative");
  }
  if (ms == 0) {
    return fallback;
  }
  return std::chrono::duration_cast<Duration>(std::chrono::milliseconds(ms));
}

} // namespace

cascade::core::CascadeOptions BuildCascadeOptions(const cascade::runtime::config::RuntimeConfig& config) {
  cascade::core::CascadeOptions options;
  const auto&                   section = config.delete_operations();

  if (section.max_concurrent_per_actor() > 0) options.max_concurrent_per_actor = section.max_concurrent_per_actor();
  if (section.batch_size() > 0) options.batch_size = section.batch_size();
  if (section.discovery_page_size() > 0) options.discovery_page_size = section.discovery_page_size();
  if (section.claim_batch_size() > 0) options.claim_batch_size = section.claim_batch_size();
  if (section.worker_threads() > 0) options.worker_threads = section.worker_threads();
  if (section.default_list_limit() > 0) options.default_list_limit = section.default_list_limit();
  if (section.max_list_limit() > 0) options.max_list_limit = section.max_list_limit();

  options.retry_after = OrDefault(section.has_retry_after(), section.retry_after(), options.retry_after, "retry_after");
  options.poll_interval =
      OrDefault(section.has_poll_interval(), section.poll_interval(), options.poll_interval, "poll_interval");
  options.operation_retention = OrDefault(section.has_operation_retention(), section.operation_retention(),
                                          options.operation_retention, "operation_retention");
  options.entity_retention =
      OrDefault(section.has_entity_retention(), section.entity_retention(), options.entity_retention, "entity_retention");
  options.prune_interval =
      OrDefault(section.has_prune_interval(), section.prune_interval(), options.prune_interval, "prune_interval");

  if (options.batch_size > kMaxBatchSize) {
    throw std::invalid_argument("delete_operations.batch_size must be at most " + std::to_string(kMaxBatchSize));
  }
  if (options.default_list_limit > options.max_list_limit) {
    throw std::invalid_argument("delete_operations.default_list_limit must not exceed max_list_limit");
  }
  return options;
}

} // namespace cascade::config
