#pragma once

#include <cstdint>
#include <string>

#include "internal/model/asset_kind.hpp"
#include "internal/model/publication.hpp"

namespace upload::db::model {

/*
  Persistent asset row.

  upload_session_id is unique among rows with deleted_at_ms == 0. That index
  is what makes completion exactly-once.
*/

struct AssetRecord {
  std::string id;
  std::string tenant_id;
  std::string brand_id;
  std::string upload_session_id;

  std::string bucket;
  std::string object_key;
  std::string original_file_name;
  std::string title; // empty = no title

  // verified against the object store
  std::string mime_type;
  uint64_t    size_bytes = 0;

  upload::model::AssetClass asset_class = upload::model::AssetClass::kAsset;
  std::string               category_id;

  upload::model::Visibility     visibility = upload::model::Visibility::kVisible;
  upload::model::ApprovalStatus approval   = upload::model::ApprovalStatus::kNotRequired;
  uint64_t                      published_at_ms = 0; // 0 = unpublished
  std::string                   published_by;

  std::string created_by;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
  uint64_t    deleted_at_ms = 0;
};

struct AssetMetadataRecord {
  std::string asset_id;
  std::string field_key;
  std::string value;
  uint64_t    updated_at_ms = 0;
};

} // namespace upload::db::model
