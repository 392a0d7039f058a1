#include "pg_repository.hpp"

namespace upload::db::postgres {

namespace {

constexpr const char* kSessionColumns =
    "id,tenant_id,brand_id,client_reference,batch_reference,transfer_type,expected_size_bytes,uploaded_size_bytes,"
    "multipart_upload_id,part_size_bytes,total_parts,mode,target_asset_id,status,expires_at_ms,last_activity_at_ms,"
    "failure_reason,failure_count,escalation_ticket_id,bucket,object_key,file_name,mime_type,created_at_ms,updated_at_ms";

// empty string -> NULL
std::optional<std::string> Opt(const std::string& value) {
  if (value.empty()) return std::nullopt;
  return value;
}

// 0 -> NULL
std::optional<uint64_t> OptU64(uint64_t value) {
  if (value == 0) return std::nullopt;
  return value;
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string{} : std::string(f.c_str());
}

uint64_t U64(const pqxx::field& f) {
  return f.is_null() ? 0 : f.as<uint64_t>();
}

model::UploadSessionRecord ReadSession(const pqxx::row& row) {
  model::UploadSessionRecord r;
  r.id                  = Text(row[0]);
  r.tenant_id           = Text(row[1]);
  r.brand_id            = Text(row[2]);
  r.client_reference    = Text(row[3]);
  r.batch_reference     = Text(row[4]);
  r.transfer_type       = static_cast<upload::model::TransferType>(row[5].as<int>());
  r.expected_size_bytes = U64(row[6]);
  if (!row[7].is_null()) {
    r.uploaded_size_bytes = row[7].as<uint64_t>();
  }
  r.multipart_upload_id  = Text(row[8]);
  r.part_size_bytes      = U64(row[9]);
  r.total_parts          = row[10].as<uint32_t>();
  r.mode                 = static_cast<upload::model::UploadMode>(row[11].as<int>());
  r.target_asset_id      = Text(row[12]);
  r.status               = static_cast<upload::model::SessionStatus>(row[13].as<int>());
  r.expires_at_ms        = U64(row[14]);
  r.last_activity_at_ms  = U64(row[15]);
  r.failure_reason       = Text(row[16]);
  r.failure_count        = row[17].as<uint32_t>();
  r.escalation_ticket_id = Text(row[18]);
  r.bucket               = Text(row[19]);
  r.object_key           = Text(row[20]);
  r.file_name            = Text(row[21]);
  r.mime_type            = Text(row[22]);
  r.created_at_ms        = U64(row[23]);
  r.updated_at_ms        = U64(row[24]);
  return r;
}

model::AssetRecord ReadAsset(const pqxx::row& row) {
  model::AssetRecord r;
  r.id                 = Text(row[0]);
  r.tenant_id          = Text(row[1]);
  r.brand_id           = Text(row[2]);
  r.upload_session_id  = Text(row[3]);
  r.bucket             = Text(row[4]);
  r.object_key         = Text(row[5]);
  r.original_file_name = Text(row[6]);
  r.title              = Text(row[7]);
  r.mime_type          = Text(row[8]);
  r.size_bytes         = U64(row[9]);
  r.asset_class        = static_cast<upload::model::AssetClass>(row[10].as<int>());
  r.category_id        = Text(row[11]);
  r.visibility         = static_cast<upload::model::Visibility>(row[12].as<int>());
  r.approval           = static_cast<upload::model::ApprovalStatus>(row[13].as<int>());
  r.published_at_ms    = U64(row[14]);
  r.published_by       = Text(row[15]);
  r.created_by         = Text(row[16]);
  r.created_at_ms      = U64(row[17]);
  r.updated_at_ms      = U64(row[18]);
  r.deleted_at_ms      = U64(row[19]);
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) {
    return Result::Err(ErrorCode::NotFound, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Upload sessions
// ------------------------------------------------------------------

Result PgRepository::InsertSession(Transaction& t, const model::UploadSessionRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO upload_sessions(") + kSessionColumns +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20,$21,$22,$23,$24,$25);",
                             r.id, r.tenant_id, Opt(r.brand_id), Opt(r.client_reference), Opt(r.batch_reference), static_cast<int>(r.transfer_type),
                             r.expected_size_bytes, r.uploaded_size_bytes, Opt(r.multipart_upload_id), r.part_size_bytes, r.total_parts,
                             static_cast<int>(r.mode), Opt(r.target_asset_id), static_cast<int>(r.status), r.expires_at_ms, r.last_activity_at_ms,
                             Opt(r.failure_reason), r.failure_count, Opt(r.escalation_ticket_id), r.bucket, r.object_key, Opt(r.file_name),
                             Opt(r.mime_type), r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UploadSessionRecord> PgRepository::GetSession(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_session", id);
  if (res.empty()) return std::nullopt;
  return ReadSession(res[0]);
}

std::optional<model::UploadSessionRecord> PgRepository::GetSessionForUpdate(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_session_for_update", id);
  if (res.empty()) return std::nullopt;
  return ReadSession(res[0]);
}

Result PgRepository::UpdateSession(Transaction& t, const model::UploadSessionRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE upload_sessions SET tenant_id=$2,brand_id=$3,client_reference=$4,batch_reference=$5,transfer_type=$6,"
        "expected_size_bytes=$7,uploaded_size_bytes=$8,multipart_upload_id=$9,part_size_bytes=$10,total_parts=$11,mode=$12,"
        "target_asset_id=$13,status=$14,expires_at_ms=$15,last_activity_at_ms=$16,failure_reason=$17,failure_count=$18,"
        "escalation_ticket_id=$19,bucket=$20,object_key=$21,file_name=$22,mime_type=$23,created_at_ms=$24,updated_at_ms=$25 "
        "WHERE id=$1;",
        r.id, r.tenant_id, Opt(r.brand_id), Opt(r.client_reference), Opt(r.batch_reference), static_cast<int>(r.transfer_type),
        r.expected_size_bytes, r.uploaded_size_bytes, Opt(r.multipart_upload_id), r.part_size_bytes, r.total_parts, static_cast<int>(r.mode),
        Opt(r.target_asset_id), static_cast<int>(r.status), r.expires_at_ms, r.last_activity_at_ms, Opt(r.failure_reason), r.failure_count,
        Opt(r.escalation_ticket_id), r.bucket, r.object_key, Opt(r.file_name), Opt(r.mime_type), r.created_at_ms, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "upload session " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::UploadSessionRecord> PgRepository::ListExpiredSessions(Transaction& t, uint64_t now_ms, uint32_t limit) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kSessionColumns +
                                          " FROM upload_sessions WHERE status IN ($1,$2) AND expires_at_ms<=$3 "
                                          "ORDER BY expires_at_ms ASC LIMIT $4 FOR UPDATE SKIP LOCKED;",
                                      static_cast<int>(upload::model::SessionStatus::kInitiating),
                                      static_cast<int>(upload::model::SessionStatus::kUploading), now_ms,
                                      limit == 0 ? std::optional<uint32_t>{} : std::optional<uint32_t>{limit});

  std::vector<model::UploadSessionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadSession(row));
  return out;
}

// ------------------------------------------------------------------
// Assets
// ------------------------------------------------------------------

InsertAssetResult PgRepository::InsertAsset(Transaction& t, const model::AssetRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO assets(id,tenant_id,brand_id,upload_session_id,bucket,object_key,original_file_name,title,mime_type,size_bytes,"
        "asset_class,category_id,visibility,approval,published_at_ms,published_by,created_by,created_at_ms,updated_at_ms,deleted_at_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20) "
        "ON CONFLICT (upload_session_id) WHERE deleted_at_ms IS NULL DO NOTHING RETURNING id;",
        r.id, r.tenant_id, Opt(r.brand_id), Opt(r.upload_session_id), r.bucket, r.object_key, Opt(r.original_file_name), Opt(r.title),
        Opt(r.mime_type), r.size_bytes, static_cast<int>(r.asset_class), Opt(r.category_id), static_cast<int>(r.visibility),
        static_cast<int>(r.approval), OptU64(r.published_at_ms), Opt(r.published_by), Opt(r.created_by), r.created_at_ms, r.updated_at_ms,
        OptU64(r.deleted_at_ms));

    if (!res.empty()) return AssetCreated{r};

    auto existing = FindAssetBySession(t, r.upload_session_id);
    if (!existing.has_value()) return Result::Err(ErrorCode::Conflict, "asset insert ignored without a visible winner");
    return AssetAlreadyExists{std::move(*existing)};
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AssetRecord> PgRepository::GetAsset(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_asset", id);
  if (res.empty()) return std::nullopt;
  return ReadAsset(res[0]);
}

std::optional<model::AssetRecord> PgRepository::FindAssetBySession(Transaction& t, const std::string& session_id) {
  auto res = TX(t).Work().exec_prepared("find_asset_by_session", session_id);
  if (res.empty()) return std::nullopt;
  return ReadAsset(res[0]);
}

Result PgRepository::UpdateAsset(Transaction& t, const model::AssetRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE assets SET tenant_id=$2,brand_id=$3,upload_session_id=$4,bucket=$5,object_key=$6,original_file_name=$7,title=$8,"
        "mime_type=$9,size_bytes=$10,asset_class=$11,category_id=$12,visibility=$13,approval=$14,published_at_ms=$15,"
        "published_by=$16,created_by=$17,created_at_ms=$18,updated_at_ms=$19,deleted_at_ms=$20 WHERE id=$1;",
        r.id, r.tenant_id, Opt(r.brand_id), Opt(r.upload_session_id), r.bucket, r.object_key, Opt(r.original_file_name), Opt(r.title),
        Opt(r.mime_type), r.size_bytes, static_cast<int>(r.asset_class), Opt(r.category_id), static_cast<int>(r.visibility),
        static_cast<int>(r.approval), OptU64(r.published_at_ms), Opt(r.published_by), Opt(r.created_by), r.created_at_ms, r.updated_at_ms,
        OptU64(r.deleted_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "asset " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Asset metadata
// ------------------------------------------------------------------

Result PgRepository::UpsertAssetMetadata(Transaction& t, const model::AssetMetadataRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO asset_metadata(asset_id,field_key,value,updated_at_ms) VALUES($1,$2,$3,$4) "
        "ON CONFLICT(asset_id,field_key) DO UPDATE SET value=EXCLUDED.value,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.asset_id, r.field_key, r.value, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AssetMetadataRecord> PgRepository::ListAssetMetadata(Transaction& t, const std::string& asset_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT asset_id,field_key,value,updated_at_ms FROM asset_metadata WHERE asset_id=$1 ORDER BY field_key ASC;", asset_id);

  std::vector<model::AssetMetadataRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::AssetMetadataRecord r;
    r.asset_id      = Text(row[0]);
    r.field_key     = Text(row[1]);
    r.value         = Text(row[2]);
    r.updated_at_ms = U64(row[3]);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace upload::db::postgres
