#include "category_directory.hpp"

#include <utility>

namespace upload::collaborators {

ConfigCategoryDirectory::ConfigCategoryDirectory(const google::protobuf::RepeatedPtrField<upload::runtime::config::CategoryConfig>& categories) {
  for (const auto& entry : categories) {
    Category category;
    category.id                = entry.id();
    category.tenant_id         = entry.tenant_id();
    category.asset_class       = model::ParseAssetClass(entry.asset_class());
    category.requires_approval = entry.requires_approval();
    category.metadata_fields.assign(entry.metadata_fields().begin(), entry.metadata_fields().end());
    categories_.push_back(std::move(category));
  }
}

ConfigCategoryDirectory::ConfigCategoryDirectory(std::vector<Category> categories) : categories_(std::move(categories)) {
}

std::optional<Category> ConfigCategoryDirectory::Find(const std::string& tenant_id, const std::string& category_id) const {
  if (category_id.empty()) {
    return std::nullopt;
  }
  // tenant-scoped definitions shadow global ones
  const Category* global = nullptr;
  for (const auto& category : categories_) {
    if (category.id != category_id) continue;
    if (category.tenant_id == tenant_id) return category;
    if (category.tenant_id.empty() && !global) global = &category;
  }
  if (global) return *global;
  return std::nullopt;
}

} // namespace upload::collaborators
