#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace upload::db::sqlite {

using upload::db::ErrorCode;
using upload::db::Result;

namespace {

constexpr const char* kSessionColumns =
    "id,tenant_id,brand_id,client_reference,batch_reference,transfer_type,expected_size_bytes,uploaded_size_bytes,"
    "multipart_upload_id,part_size_bytes,total_parts,mode,target_asset_id,status,expires_at_ms,last_activity_at_ms,"
    "failure_reason,failure_count,escalation_ticket_id,bucket,object_key,file_name,mime_type,created_at_ms,updated_at_ms";

constexpr const char* kAssetColumns =
    "id,tenant_id,brand_id,upload_session_id,bucket,object_key,original_file_name,title,mime_type,size_bytes,"
    "asset_class,category_id,visibility,approval,published_at_ms,published_by,created_by,created_at_ms,updated_at_ms,deleted_at_ms";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// empty string -> NULL
void BindOptText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
    return;
  }
  BindText(st, idx, s);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

// 0 -> NULL
void BindOptU64(sqlite3_stmt* st, int idx, uint64_t v) {
  if (v == 0) {
    sqlite3_bind_null(st, idx);
    return;
  }
  BindU64(st, idx, v);
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

void BindSession(sqlite3_stmt* st, const model::UploadSessionRecord& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.tenant_id);
  BindOptText(st, 3, r.brand_id);
  BindOptText(st, 4, r.client_reference);
  BindOptText(st, 5, r.batch_reference);
  BindI32(st, 6, static_cast<int>(r.transfer_type));
  BindU64(st, 7, r.expected_size_bytes);
  if (r.uploaded_size_bytes.has_value()) {
    BindU64(st, 8, *r.uploaded_size_bytes);
  } else {
    sqlite3_bind_null(st, 8);
  }
  BindOptText(st, 9, r.multipart_upload_id);
  BindU64(st, 10, r.part_size_bytes);
  BindI32(st, 11, static_cast<int>(r.total_parts));
  BindI32(st, 12, static_cast<int>(r.mode));
  BindOptText(st, 13, r.target_asset_id);
  BindI32(st, 14, static_cast<int>(r.status));
  BindU64(st, 15, r.expires_at_ms);
  BindU64(st, 16, r.last_activity_at_ms);
  BindOptText(st, 17, r.failure_reason);
  BindI32(st, 18, static_cast<int>(r.failure_count));
  BindOptText(st, 19, r.escalation_ticket_id);
  BindText(st, 20, r.bucket);
  BindText(st, 21, r.object_key);
  BindOptText(st, 22, r.file_name);
  BindOptText(st, 23, r.mime_type);
  BindU64(st, 24, r.created_at_ms);
  BindU64(st, 25, r.updated_at_ms);
}

model::UploadSessionRecord ReadSession(sqlite3_stmt* st) {
  model::UploadSessionRecord r;
  r.id                  = ColText(st, 0);
  r.tenant_id           = ColText(st, 1);
  r.brand_id            = ColText(st, 2);
  r.client_reference    = ColText(st, 3);
  r.batch_reference     = ColText(st, 4);
  r.transfer_type       = static_cast<upload::model::TransferType>(ColI32(st, 5));
  r.expected_size_bytes = ColU64(st, 6);
  if (sqlite3_column_type(st, 7) != SQLITE_NULL) {
    r.uploaded_size_bytes = ColU64(st, 7);
  }
  r.multipart_upload_id  = ColText(st, 8);
  r.part_size_bytes      = ColU64(st, 9);
  r.total_parts          = static_cast<uint32_t>(ColI32(st, 10));
  r.mode                 = static_cast<upload::model::UploadMode>(ColI32(st, 11));
  r.target_asset_id      = ColText(st, 12);
  r.status               = static_cast<upload::model::SessionStatus>(ColI32(st, 13));
  r.expires_at_ms        = ColU64(st, 14);
  r.last_activity_at_ms  = ColU64(st, 15);
  r.failure_reason       = ColText(st, 16);
  r.failure_count        = static_cast<uint32_t>(ColI32(st, 17));
  r.escalation_ticket_id = ColText(st, 18);
  r.bucket               = ColText(st, 19);
  r.object_key           = ColText(st, 20);
  r.file_name            = ColText(st, 21);
  r.mime_type            = ColText(st, 22);
  r.created_at_ms        = ColU64(st, 23);
  r.updated_at_ms        = ColU64(st, 24);
  return r;
}

void BindAsset(sqlite3_stmt* st, const model::AssetRecord& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.tenant_id);
  BindOptText(st, 3, r.brand_id);
  BindOptText(st, 4, r.upload_session_id);
  BindText(st, 5, r.bucket);
  BindText(st, 6, r.object_key);
  BindOptText(st, 7, r.original_file_name);
  BindOptText(st, 8, r.title);
  BindOptText(st, 9, r.mime_type);
  BindU64(st, 10, r.size_bytes);
  BindI32(st, 11, static_cast<int>(r.asset_class));
  BindOptText(st, 12, r.category_id);
  BindI32(st, 13, static_cast<int>(r.visibility));
  BindI32(st, 14, static_cast<int>(r.approval));
  BindOptU64(st, 15, r.published_at_ms);
  BindOptText(st, 16, r.published_by);
  BindOptText(st, 17, r.created_by);
  BindU64(st, 18, r.created_at_ms);
  BindU64(st, 19, r.updated_at_ms);
  BindOptU64(st, 20, r.deleted_at_ms);
}

model::AssetRecord ReadAsset(sqlite3_stmt* st) {
  model::AssetRecord r;
  r.id                 = ColText(st, 0);
  r.tenant_id          = ColText(st, 1);
  r.brand_id           = ColText(st, 2);
  r.upload_session_id  = ColText(st, 3);
  r.bucket             = ColText(st, 4);
  r.object_key         = ColText(st, 5);
  r.original_file_name = ColText(st, 6);
  r.title              = ColText(st, 7);
  r.mime_type          = ColText(st, 8);
  r.size_bytes         = ColU64(st, 9);
  r.asset_class        = static_cast<upload::model::AssetClass>(ColI32(st, 10));
  r.category_id        = ColText(st, 11);
  r.visibility         = static_cast<upload::model::Visibility>(ColI32(st, 12));
  r.approval           = static_cast<upload::model::ApprovalStatus>(ColI32(st, 13));
  r.published_at_ms    = ColU64(st, 14);
  r.published_by       = ColText(st, 15);
  r.created_by         = ColText(st, 16);
  r.created_at_ms      = ColU64(st, 17);
  r.updated_at_ms      = ColU64(st, 18);
  r.deleted_at_ms      = ColU64(st, 19);
  return r;
}

std::optional<model::AssetRecord> SelectOneAsset(sqlite3* db, const std::string& where, const std::string& arg) {
  const auto    sql = std::string("SELECT ") + kAssetColumns + " FROM assets WHERE " + where + ";";
  sqlite3_stmt* st  = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindText(st, 1, arg);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadAsset(st);
  sqlite3_finalize(st);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Upload sessions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSession(Transaction& t, const model::UploadSessionRecord& r) {
  auto* db = TX(t).Handle();

  const auto sql = std::string("INSERT INTO upload_sessions(") + kSessionColumns +
                   ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindSession(st, r);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (result.code == ErrorCode::ConstraintViolation) result.code = ErrorCode::AlreadyExists;
  return result;
}

std::optional<model::UploadSessionRecord> SqliteRepository::GetSession(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const auto sql = std::string("SELECT ") + kSessionColumns + " FROM upload_sessions WHERE id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return std::nullopt;

  BindText(st, 1, id);

  if (sqlite3_step(st) != SQLITE_ROW) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadSession(st);
  sqlite3_finalize(st);
  return r;
}

std::optional<model::UploadSessionRecord> SqliteRepository::GetSessionForUpdate(Transaction& t, const std::string& id) {
  // BEGIN IMMEDIATE already holds the database write lock
  return GetSession(t, id);
}

Result SqliteRepository::UpdateSession(Transaction& t, const model::UploadSessionRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "UPDATE upload_sessions SET tenant_id=?2,brand_id=?3,client_reference=?4,batch_reference=?5,transfer_type=?6,"
      "expected_size_bytes=?7,uploaded_size_bytes=?8,multipart_upload_id=?9,part_size_bytes=?10,total_parts=?11,mode=?12,"
      "target_asset_id=?13,status=?14,expires_at_ms=?15,last_activity_at_ms=?16,failure_reason=?17,failure_count=?18,"
      "escalation_ticket_id=?19,bucket=?20,object_key=?21,file_name=?22,mime_type=?23,created_at_ms=?24,updated_at_ms=?25 "
      "WHERE id=?1;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindSession(st, r);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "upload session " + r.id);
  return result;
}

std::vector<model::UploadSessionRecord> SqliteRepository::ListExpiredSessions(Transaction& t, uint64_t now_ms, uint32_t limit) {
  auto* db = TX(t).Handle();

  const auto sql = std::string("SELECT ") + kSessionColumns +
                   " FROM upload_sessions WHERE status IN (?,?) AND expires_at_ms<=? ORDER BY expires_at_ms ASC LIMIT ?;";

  std::vector<model::UploadSessionRecord> out;
  sqlite3_stmt*                           st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return out;

  BindI32(st, 1, static_cast<int>(upload::model::SessionStatus::kInitiating));
  BindI32(st, 2, static_cast<int>(upload::model::SessionStatus::kUploading));
  BindU64(st, 3, now_ms);
  sqlite3_bind_int64(st, 4, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));

  while (sqlite3_step(st) == SQLITE_ROW) {
    out.push_back(ReadSession(st));
  }
  sqlite3_finalize(st);
  return out;
}

// ------------------------------------------------------------------
// Assets
// ------------------------------------------------------------------

InsertAssetResult SqliteRepository::InsertAsset(Transaction& t, const model::AssetRecord& r) {
  auto* db = TX(t).Handle();

  // a live duplicate on upload_session_id is swallowed and resolved below
  const auto sql = std::string("INSERT INTO assets(") + kAssetColumns +
                   ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) "
                   "ON CONFLICT(upload_session_id) WHERE deleted_at_ms IS NULL DO NOTHING;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindAsset(st, r);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (!result) {
    if (result.code == ErrorCode::ConstraintViolation) result.code = ErrorCode::AlreadyExists;
    return result;
  }

  if (sqlite3_changes(db) == 1) return AssetCreated{r};

  auto existing = FindAssetBySession(t, r.upload_session_id);
  if (!existing.has_value()) return Result::Err(ErrorCode::Conflict, "asset insert ignored without a visible winner");
  return AssetAlreadyExists{std::move(*existing)};
}

std::optional<model::AssetRecord> SqliteRepository::GetAsset(Transaction& t, const std::string& id) {
  return SelectOneAsset(TX(t).Handle(), "id=?", id);
}

std::optional<model::AssetRecord> SqliteRepository::FindAssetBySession(Transaction& t, const std::string& session_id) {
  return SelectOneAsset(TX(t).Handle(), "upload_session_id=? AND deleted_at_ms IS NULL", session_id);
}

Result SqliteRepository::UpdateAsset(Transaction& t, const model::AssetRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "UPDATE assets SET tenant_id=?2,brand_id=?3,upload_session_id=?4,bucket=?5,object_key=?6,original_file_name=?7,"
      "title=?8,mime_type=?9,size_bytes=?10,asset_class=?11,category_id=?12,visibility=?13,approval=?14,"
      "published_at_ms=?15,published_by=?16,created_by=?17,created_at_ms=?18,updated_at_ms=?19,deleted_at_ms=?20 "
      "WHERE id=?1;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindAsset(st, r);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "asset " + r.id);
  return result;
}

// ------------------------------------------------------------------
// Asset metadata
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAssetMetadata(Transaction& t, const model::AssetMetadataRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO asset_metadata(asset_id,field_key,value,updated_at_ms) VALUES(?,?,?,?) "
      "ON CONFLICT(asset_id,field_key) DO UPDATE SET value=excluded.value, updated_at_ms=excluded.updated_at_ms;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.asset_id);
  BindText(st, 2, r.field_key);
  BindText(st, 3, r.value);
  BindU64(st, 4, r.updated_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (result.code == ErrorCode::ConstraintViolation) result.code = ErrorCode::NotFound;
  return result;
}

std::vector<model::AssetMetadataRecord> SqliteRepository::ListAssetMetadata(Transaction& t, const std::string& asset_id) {
  auto* db = TX(t).Handle();

  const char* sql = "SELECT asset_id,field_key,value,updated_at_ms FROM asset_metadata WHERE asset_id=? ORDER BY field_key ASC;";

  std::vector<model::AssetMetadataRecord> out;
  sqlite3_stmt*                           st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return out;

  BindText(st, 1, asset_id);

  while (sqlite3_step(st) == SQLITE_ROW) {
    model::AssetMetadataRecord r;
    r.asset_id      = ColText(st, 0);
    r.field_key     = ColText(st, 1);
    r.value         = ColText(st, 2);
    r.updated_at_ms = ColU64(st, 3);
    out.push_back(std::move(r));
  }
  sqlite3_finalize(st);
  return out;
}

} // namespace upload::db::sqlite
