#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <set>
#include <stdexcept>

namespace kbsync::config {

using kbsync::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings ("2024" as a midfix stays text)
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

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
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

static RuntimeConfig Finish(RuntimeConfig config) {
  ConfigLoader::ApplyEnvironmentOverrides(config);
  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
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

  return Finish(ParseYaml(yaml));
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return Finish(ParseYaml(yaml));
}

void ConfigLoader::ApplyEnvironmentOverrides(RuntimeConfig& config) {
  if (const char* url = std::getenv("KBSYNC_API_URL")) {
    config.mutable_ingestion()->set_base_url(url);
  }
  if (const char* key = std::getenv("KBSYNC_API_KEY")) {
    config.mutable_ingestion()->set_api_key(key);
  }
  if (const char* kb = std::getenv("KBSYNC_KNOWLEDGE_BASE_ID")) {
    config.mutable_ingestion()->set_knowledge_base_id(kb);
  }
  if (const char* db_path = std::getenv("KBSYNC_DB_PATH")) {
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
  }
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* database = config.mutable_database();
  if (!database->has_sqlite() && !database->has_memory()) {
    database->mutable_sqlite();
  }
  if (database->has_sqlite()) {
    auto* sqlite = database->mutable_sqlite();
    if (sqlite->path().empty()) sqlite->set_path(defaults::kDatabasePath);
    if (sqlite->busy_timeout_ms() == 0) sqlite->set_busy_timeout_ms(defaults::kBusyTimeoutMs);
  }

  auto* discovery = config.mutable_discovery();
  if (!discovery->has_min_file_size_bytes()) discovery->set_min_file_size_bytes(defaults::kMinFileSizeBytes);
  if (!discovery->has_purge_remote_on_change()) discovery->set_purge_remote_on_change(true);

  auto* ingestion = config.mutable_ingestion();
  if (ingestion->base_url().empty()) ingestion->set_base_url(defaults::kBaseUrl);
  if (ingestion->api_prefix().empty()) ingestion->set_api_prefix(defaults::kApiPrefix);
  if (ingestion->connect_timeout_ms() == 0) ingestion->set_connect_timeout_ms(defaults::kConnectTimeoutMs);
  if (ingestion->request_timeout_ms() == 0) ingestion->set_request_timeout_ms(defaults::kRequestTimeoutMs);

  auto* submission = config.mutable_submission();
  if (submission->batch_size() == 0) submission->set_batch_size(defaults::kSubmitBatchSize);
  if (submission->hash_algorithm().empty()) submission->set_hash_algorithm(defaults::kHashAlgorithm);

  auto* poller = config.mutable_poller();
  if (!poller->has_request_delay_ms()) poller->set_request_delay_ms(defaults::kPollRequestDelayMs);

  auto* schedule = config.mutable_schedule();
  if (schedule->discover_interval_s() == 0) schedule->set_discover_interval_s(defaults::kDiscoverIntervalSec);
  if (schedule->submit_interval_s() == 0) schedule->set_submit_interval_s(defaults::kSubmitIntervalSec);
  if (schedule->poll_interval_s() == 0) schedule->set_poll_interval_s(defaults::kPollIntervalSec);
  if (schedule->tick_ms() == 0) schedule->set_tick_ms(defaults::kSchedulerTickMs);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& algorithm = config.submission().hash_algorithm();
  if (algorithm != "sha256" && algorithm != "md5") {
    throw std::runtime_error("Invalid configuration: submission.hash_algorithm must be sha256 or md5, got '" + algorithm + "'");
  }

  const auto& base_url = config.ingestion().base_url();
  if (base_url.rfind("http://", 0) != 0 && base_url.rfind("https://", 0) != 0) {
    throw std::runtime_error("Invalid configuration: ingestion.base_url must be an http(s) URL, got '" + base_url + "'");
  }

  if (!config.ingestion().api_prefix().empty() && config.ingestion().api_prefix().front() != '/') {
    throw std::runtime_error("Invalid configuration: ingestion.api_prefix must start with '/'");
  }

  for (const auto& root : config.discovery().roots()) {
    if (root.empty() || root.front() != '/') {
      throw std::runtime_error("Invalid configuration: discovery root must be an absolute path, got '" + root + "'");
    }
  }

  for (const auto& group : config.discovery().root_groups()) {
    if (group.prefix().empty() || group.prefix().front() != '/') {
      throw std::runtime_error("Invalid configuration: root group prefix must be an absolute path, got '" + group.prefix() + "'");
    }
    if (group.midfixes().empty()) {
      throw std::runtime_error("Invalid configuration: root group '" + group.prefix() + "' has no midfixes");
    }
  }
}

void ConfigLoader::RequireDiscoveryRoots(const RuntimeConfig& config) {
  if (ExpandRoots(config.discovery()).empty()) {
    throw std::runtime_error("Invalid configuration: discovery needs at least one entry in discovery.roots or discovery.root_groups");
  }
}

std::vector<std::string> ConfigLoader::ExpandRoots(const kbsync::runtime::config::DiscoveryConfig& discovery) {
  std::vector<std::string> roots;
  std::set<std::string>    seen;

  auto add = [&](std::string path) {
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    if (seen.insert(path).second) roots.push_back(std::move(path));
  };

  for (const auto& root : discovery.roots()) {
    add(root);
  }

  for (const auto& group : discovery.root_groups()) {
    for (const auto& midfix : group.midfixes()) {
      std::string path = group.prefix();
      if (!path.empty() && path.back() != '/') path += '/';
      path += midfix;
      if (!group.suffix().empty()) {
        if (group.suffix().front() != '/') path += '/';
        path += group.suffix();
      }
      add(std::move(path));
    }
  }

  return roots;
}

} // namespace kbsync::config
