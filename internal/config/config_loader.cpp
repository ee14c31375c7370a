#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace backoffice::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("30s", "0.0.0.0:50051")
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

static void DefaultDuration(std::string* field, const char* fallback, const char* name) {
  if (field->empty()) {
    *field = fallback;
  }
  try {
    (void)util::ParseDuration(*field);
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string("Invalid configuration: ") + name + ": " + e.what());
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

backoffice::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
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

  backoffice::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(backoffice::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:50061");
  }

  if (!config.database().has_sqlite() && !config.database().has_memory()) {
    config.mutable_database()->mutable_memory();
  }
  if (config.database().has_sqlite()) {
    auto* sqlite = config.mutable_database()->mutable_sqlite();
    if (sqlite->path().empty()) {
      throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
    }
    DefaultDuration(sqlite->mutable_busy_timeout(), "5s", "database.sqlite.busy_timeout");
    if (!sqlite->has_wal_mode()) {
      sqlite->set_wal_mode(true);
    }
  }

  DefaultDuration(config.mutable_lock()->mutable_wait_timeout(), "30s", "lock.wait_timeout");

  auto* ttl = config.mutable_cache()->mutable_ttl();
  DefaultDuration(ttl->mutable_inventory(), "3m", "cache.ttl.inventory");
  DefaultDuration(ttl->mutable_customers(), "5m", "cache.ttl.customers");
  DefaultDuration(ttl->mutable_suppliers(), "5m", "cache.ttl.suppliers");
  DefaultDuration(ttl->mutable_sales(), "2m", "cache.ttl.sales");
  DefaultDuration(ttl->mutable_quotations(), "5m", "cache.ttl.quotations");
  DefaultDuration(ttl->mutable_dashboard(), "1m", "cache.ttl.dashboard");
  DefaultDuration(ttl->mutable_reference(), "1h", "cache.ttl.reference");

  if (config.sequence().pad_width() == 0) {
    config.mutable_sequence()->set_pad_width(4);
  }
  if (config.sequence().pad_width() > 12) {
    throw std::runtime_error("Invalid configuration: sequence.pad_width must be at most 12");
  }

  auto* shop = config.mutable_shop();
  if (shop->name().empty()) shop->set_name("BeiPoa");
  if (shop->currency().empty()) shop->set_currency("USD");
  if (shop->currency_symbol().empty()) shop->set_currency_symbol("$");
  if (shop->timezone().empty()) shop->set_timezone("UTC");
  if (shop->quotation_valid_days() == 0) shop->set_quotation_valid_days(14);
}

} // namespace backoffice::config
