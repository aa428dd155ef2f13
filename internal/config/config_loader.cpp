#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace archstore::config {

using archstore::runtime::config::RuntimeConfig;
using google::protobuf::util::TimeUtil;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("60s", "1.0")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

static void DefaultDuration(google::protobuf::Duration* duration, int64_t millis) {
  if (duration->seconds() == 0 && duration->nanos() == 0) {
    *duration = TimeUtil::MillisecondsToDuration(millis);
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
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

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  if (config.store().path().empty()) {
    throw std::runtime_error("Invalid configuration: store.path is required");
  }

  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* store = config.mutable_store();
  if (store->conflict_policy() == archstore::runtime::config::CONFLICT_POLICY_UNSPECIFIED) {
    store->set_conflict_policy(archstore::runtime::config::CONFLICT_POLICY_LAST_WRITER_WINS);
  }

  auto* backup = config.mutable_backup();
  if (backup->directory().empty()) {
    const auto parent = std::filesystem::path(store->path()).parent_path();
    backup->set_directory((parent / "backups").string());
  }
  if (backup->retention_days() == 0) backup->set_retention_days(30);
  if (backup->max_copy_attempts() == 0) backup->set_max_copy_attempts(3);
  DefaultDuration(backup->mutable_retry_backoff(), 50);
  DefaultDuration(backup->mutable_cleanup_interval(), 3600 * 1000);

  auto* migration = config.mutable_migration();
  if (!migration->has_auto_migrate()) migration->set_auto_migrate(true);
  if (!migration->has_snapshot_projects()) migration->set_snapshot_projects(true);
  DefaultDuration(migration->mutable_timeout(), 300 * 1000);

  auto* history = config.mutable_history();
  if (history->max_versions() == 0) history->set_max_versions(50);
  if (history->significant_change_threshold() == 0) history->set_significant_change_threshold(5);
  if (!history->has_autosave_enabled()) history->set_autosave_enabled(true);
  if (history->author().empty()) history->set_author("local");
  if (history->app_version().empty()) history->set_app_version("1.0.0");
  DefaultDuration(history->mutable_min_auto_interval(), 60 * 1000);
  DefaultDuration(history->mutable_autosave_interval(), 30 * 1000);
  if (TimeUtil::DurationToMilliseconds(history->autosave_interval()) < 10 * 1000) {
    *history->mutable_autosave_interval() = TimeUtil::MillisecondsToDuration(10 * 1000);
  }

  auto* integrity = config.mutable_integrity();
  if (integrity->valid_threshold() <= 0.0) integrity->set_valid_threshold(0.8);
  if (!integrity->has_auto_repair()) integrity->set_auto_repair(true);
  if (integrity->quick_check_sample() == 0) integrity->set_quick_check_sample(100);
  if (integrity->max_entity_count() == 0) integrity->set_max_entity_count(10000);
  if (integrity->max_payload_bytes() == 0) integrity->set_max_payload_bytes(10ull * 1024 * 1024);
  if (!integrity->has_min_free_bytes()) integrity->set_min_free_bytes(100ull * 1024 * 1024);
  if (integrity->max_issues_per_check() == 0) integrity->set_max_issues_per_check(100);
  DefaultDuration(integrity->mutable_quick_check_interval(), 3600 * 1000);
  DefaultDuration(integrity->mutable_quick_check_budget(), 2000);
  DefaultDuration(integrity->mutable_full_check_timeout(), 300 * 1000);
}

RuntimeConfig ConfigLoader::Defaults(const std::string& store_path) {
  RuntimeConfig config;
  config.mutable_store()->set_path(store_path);
  ApplyDefaults(config);
  return config;
}

} // namespace archstore::config
