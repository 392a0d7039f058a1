#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <set>
#include <stdexcept>
#include <utility>

#include "internal/collaborators/metadata_writer.hpp"

namespace upload::config {

using upload::runtime::config::RuntimeConfig;

namespace {

// S3 rejects non-final parts below 5 MiB and any part above 5 GiB.
constexpr std::uint64_t kMinChunkBytes = 5ULL * 1024 * 1024;
constexpr std::uint64_t kMaxChunkBytes = 5ULL * 1024 * 1024 * 1024;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // quoted scalars carry the non-specific "!" tag and are always strings
  if (node.Tag() != "!") {
    if (scalar == "true" || scalar == "false") {
      value->set_bool_value(scalar == "true");
      return;
    }
    if (scalar == "null" || scalar == "~") {
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      return;
    }
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  if (yaml.IsNull()) {
    json_value.mutable_struct_value();
  } else {
    YamlToProtoValue(yaml, &json_value);
  }

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

  ConfigLoader::Validate(config);
  return config;
}

[[noreturn]] void Reject(const std::string& field, const std::string& reason) {
  throw std::runtime_error("Invalid configuration: " + field + " " + reason);
}

void RequireUniqueTenant(std::set<std::string>& seen, const std::string& tenant_id, const std::string& field) {
  if (tenant_id.empty()) {
    Reject(field + ".tenant_id", "must not be empty");
  }
  if (!seen.insert(tenant_id).second) {
    Reject(field, "lists tenant '" + tenant_id + "' twice");
  }
}

void ValidateDatabase(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    Reject("database.sqlite.path", "must not be empty");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    Reject("database.postgres.connection_uri", "must not be empty");
  }
}

void ValidateUploads(const RuntimeConfig& config) {
  const auto& uploads = config.uploads();
  if (uploads.chunk_size_bytes() != 0 && (uploads.chunk_size_bytes() < kMinChunkBytes || uploads.chunk_size_bytes() > kMaxChunkBytes)) {
    Reject("uploads.chunk_size_bytes", "must be between 5 MiB and 5 GiB");
  }
  if (uploads.has_session_ttl() && uploads.session_ttl().seconds() <= 0) {
    Reject("uploads.session_ttl", "must be positive");
  }
  if (uploads.has_presign_ttl() && uploads.presign_ttl().seconds() < 0) {
    Reject("uploads.presign_ttl", "must not be negative");
  }
  if (uploads.has_part_presign_ttl() && uploads.part_presign_ttl().seconds() <= 0) {
    Reject("uploads.part_presign_ttl", "must be positive");
  }
}

void ValidateTenantOverrides(const RuntimeConfig& config) {
  std::set<std::string> plan_tenants;
  for (const auto& plan : config.plans().tenants()) {
    RequireUniqueTenant(plan_tenants, plan.tenant_id(), "plans.tenants");
  }

  std::set<std::string> bucket_tenants;
  for (const auto& bucket : config.buckets().tenants()) {
    RequireUniqueTenant(bucket_tenants, bucket.tenant_id(), "buckets.tenants");
  }
}

void ValidateCategories(const RuntimeConfig& config) {
  std::set<std::pair<std::string, std::string>> seen;
  for (const auto& category : config.categories()) {
    if (category.id().empty()) {
      Reject("categories.id", "must not be empty");
    }
    const auto field = "categories[" + category.id() + "]";
    if (!seen.emplace(category.tenant_id(), category.id()).second) {
      Reject(field, "is declared twice");
    }
    if (!category.asset_class().empty() && category.asset_class() != "asset" && category.asset_class() != "deliverable") {
      Reject(field + ".asset_class", "must be 'asset' or 'deliverable'");
    }
    for (const auto& key : category.metadata_fields()) {
      if (!upload::collaborators::SchemaMetadataWriter::IsWellFormedKey(key)) {
        Reject(field + ".metadata_fields", "has malformed key '" + key + "'");
      }
    }
  }
}

} // namespace

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
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  ValidateDatabase(config);
  ValidateUploads(config);
  ValidateTenantOverrides(config);
  ValidateCategories(config);
}

} // namespace upload::config
