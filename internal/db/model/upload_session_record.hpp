#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/session_state.hpp"

namespace upload::db::model {

/*
  Persistent upload session row.

  IMPORTANT:
  - multipart_upload_id is set only for chunked sessions whose multipart
    upload has been initiated.
  - target_asset_id is set iff mode == kReplace.
  - Empty strings are stored as NULL by the SQL backends.
*/

struct UploadSessionRecord {
  std::string id;
  std::string tenant_id;
  std::string brand_id;
  std::string client_reference;
  std::string batch_reference;

  upload::model::TransferType transfer_type = upload::model::TransferType::kUnspecified;
  uint64_t                    expected_size_bytes = 0;
  std::optional<uint64_t>     uploaded_size_bytes;
  std::string                 multipart_upload_id;
  uint64_t                    part_size_bytes = 0;
  uint32_t                    total_parts     = 0;

  upload::model::UploadMode mode = upload::model::UploadMode::kCreate;
  std::string               target_asset_id;

  upload::model::SessionStatus status = upload::model::SessionStatus::kInitiating;
  uint64_t                     expires_at_ms       = 0;
  uint64_t                     last_activity_at_ms = 0;
  std::string                  failure_reason;
  uint32_t                     failure_count = 0;
  std::string                  escalation_ticket_id;

  std::string bucket;
  std::string object_key;

  // client hints, never trusted as facts
  std::string file_name;
  std::string mime_type;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace upload::db::model
