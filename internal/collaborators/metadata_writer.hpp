#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/collaborators/category_directory.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace upload::collaborators {

using MetadataField = std::pair<std::string, std::string>;

struct MetadataValidation {
  std::vector<MetadataField> accepted;
  std::vector<std::string>   rejected;

  std::vector<std::string> AcceptedKeys() const;
};

/*
  Persists user supplied metadata for a freshly created asset.

  Validation is separate from writing so the caller can refuse a request
  before anything is committed. Write runs on the caller's transaction and
  throws if a row cannot be stored.
*/
class MetadataWriter {
 public:
  virtual ~MetadataWriter() = default;

  virtual MetadataValidation Validate(const std::optional<Category>& category, const std::vector<MetadataField>& fields) const = 0;

  virtual void Write(db::Transaction& tx, const db::model::AssetRecord& asset, const std::vector<MetadataField>& accepted) = 0;
};

/*
  Validates keys against the category schema and upserts accepted rows.

  With a category, only its declared field keys are accepted. Without one,
  any well-formed key is accepted. Empty values are always rejected.
*/
class SchemaMetadataWriter final : public MetadataWriter {
 public:
  SchemaMetadataWriter(std::shared_ptr<db::Repository> repository, util::NowFn now = util::Now);

  MetadataValidation Validate(const std::optional<Category>& category, const std::vector<MetadataField>& fields) const override;

  void Write(db::Transaction& tx, const db::model::AssetRecord& asset, const std::vector<MetadataField>& accepted) override;

  static bool IsWellFormedKey(const std::string& key);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
};

} // namespace upload::collaborators
