#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/asset_kind.hpp"

namespace upload::collaborators {

struct Category {
  std::string              id;
  std::string              tenant_id;
  model::AssetClass        asset_class       = model::AssetClass::kAsset;
  bool                     requires_approval = false;
  std::vector<std::string> metadata_fields;
};

class CategoryDirectory {
 public:
  virtual ~CategoryDirectory() = default;

  // Categories with an empty tenant are visible to every tenant.
  virtual std::optional<Category> Find(const std::string& tenant_id, const std::string& category_id) const = 0;
};

class ConfigCategoryDirectory final : public CategoryDirectory {
 public:
  explicit ConfigCategoryDirectory(const google::protobuf::RepeatedPtrField<upload::runtime::config::CategoryConfig>& categories);
  explicit ConfigCategoryDirectory(std::vector<Category> categories);

  std::optional<Category> Find(const std::string& tenant_id, const std::string& category_id) const override;

 private:
  std::vector<Category> categories_;
};

} // namespace upload::collaborators
