#include "metadata_writer.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace upload::collaborators {

namespace {

constexpr std::size_t kMaxKeyLength   = 64;
constexpr std::size_t kMaxValueLength = 4096;

} // namespace

std::vector<std::string> MetadataValidation::AcceptedKeys() const {
  std::vector<std::string> keys;
  keys.reserve(accepted.size());
  for (const auto& field : accepted) {
    keys.push_back(field.first);
  }
  return keys;
}

SchemaMetadataWriter::SchemaMetadataWriter(std::shared_ptr<db::Repository> repository, util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
}

bool SchemaMetadataWriter::IsWellFormedKey(const std::string& key) {
  if (key.empty() || key.size() > kMaxKeyLength) return false;
  return std::all_of(key.begin(), key.end(), [](unsigned char c) { return std::islower(c) || std::isdigit(c) || c == '_' || c == '.'; });
}

MetadataValidation SchemaMetadataWriter::Validate(const std::optional<Category>& category, const std::vector<MetadataField>& fields) const {
  auto allowed = [&](const std::string& key) {
    if (!category) return IsWellFormedKey(key);
    const auto& declared = category->metadata_fields;
    return std::find(declared.begin(), declared.end(), key) != declared.end();
  };

  MetadataValidation result;
  for (const auto& field : fields) {
    const auto& [key, value] = field;
    if (!allowed(key) || value.empty() || value.size() > kMaxValueLength) {
      result.rejected.push_back(key);
      continue;
    }
    result.accepted.push_back(field);
  }
  return result;
}

void SchemaMetadataWriter::Write(db::Transaction& tx, const db::model::AssetRecord& asset, const std::vector<MetadataField>& accepted) {
  const auto now_ms = util::ToUnixMillis(now_());
  for (const auto& [key, value] : accepted) {
    db::model::AssetMetadataRecord row;
    row.asset_id      = asset.id;
    row.field_key     = key;
    row.value         = value;
    row.updated_at_ms = now_ms;

    auto written = repository_->UpsertAssetMetadata(tx, row);
    if (written) {
      continue;
    }
    const auto message = "persist metadata field " + key + " (" + std::string(db::ToString(written.code)) + "): " + written.message;
    if (db::IsRetryable(written.code)) {
      throw util::RemoteUnavailable(message);
    }
    throw std::runtime_error(message);
  }
}

} // namespace upload::collaborators
