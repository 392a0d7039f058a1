#pragma once

#include <string>
#include <vector>

namespace upload::db::sql {

/*
  Bootstrap DDL per backend, applied in order by the composition root.

  The partial unique index on assets(upload_session_id) is load-bearing:
  concurrent completions of one session collapse onto a single asset row.
*/

// Bumped whenever a statement below changes; sqlite records it in user_version.
inline constexpr int kSchemaVersion = 1;

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSql = {
      "CREATE TABLE IF NOT EXISTS upload_sessions ("
      " id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, brand_id TEXT, client_reference TEXT, batch_reference TEXT,"
      " transfer_type INTEGER NOT NULL, expected_size_bytes INTEGER NOT NULL, uploaded_size_bytes INTEGER,"
      " multipart_upload_id TEXT, part_size_bytes INTEGER NOT NULL DEFAULT 0, total_parts INTEGER NOT NULL DEFAULT 0,"
      " mode INTEGER NOT NULL, target_asset_id TEXT,"
      " status INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, last_activity_at_ms INTEGER NOT NULL,"
      " failure_reason TEXT, failure_count INTEGER NOT NULL DEFAULT 0, escalation_ticket_id TEXT,"
      " bucket TEXT NOT NULL, object_key TEXT NOT NULL, file_name TEXT, mime_type TEXT,"
      " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS upload_sessions_expiry ON upload_sessions(status, expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS assets ("
      " id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, brand_id TEXT, upload_session_id TEXT,"
      " bucket TEXT NOT NULL, object_key TEXT NOT NULL, original_file_name TEXT, title TEXT,"
      " mime_type TEXT, size_bytes INTEGER NOT NULL, asset_class INTEGER NOT NULL, category_id TEXT,"
      " visibility INTEGER NOT NULL, approval INTEGER NOT NULL, published_at_ms INTEGER, published_by TEXT,"
      " created_by TEXT, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, deleted_at_ms INTEGER);",
      "CREATE UNIQUE INDEX IF NOT EXISTS assets_upload_session_live ON assets(upload_session_id) WHERE deleted_at_ms IS NULL;",
      "CREATE TABLE IF NOT EXISTS asset_metadata ("
      " asset_id TEXT NOT NULL REFERENCES assets(id) ON DELETE CASCADE, field_key TEXT NOT NULL, value TEXT NOT NULL,"
      " updated_at_ms INTEGER NOT NULL, PRIMARY KEY (asset_id, field_key));"};
  return kSql;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSql = {
      "CREATE TABLE IF NOT EXISTS upload_sessions ("
      " id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, brand_id TEXT, client_reference TEXT, batch_reference TEXT,"
      " transfer_type SMALLINT NOT NULL, expected_size_bytes BIGINT NOT NULL, uploaded_size_bytes BIGINT,"
      " multipart_upload_id TEXT, part_size_bytes BIGINT NOT NULL DEFAULT 0, total_parts INTEGER NOT NULL DEFAULT 0,"
      " mode SMALLINT NOT NULL, target_asset_id TEXT,"
      " status SMALLINT NOT NULL, expires_at_ms BIGINT NOT NULL, last_activity_at_ms BIGINT NOT NULL,"
      " failure_reason TEXT, failure_count INTEGER NOT NULL DEFAULT 0, escalation_ticket_id TEXT,"
      " bucket TEXT NOT NULL, object_key TEXT NOT NULL, file_name TEXT, mime_type TEXT,"
      " created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS upload_sessions_expiry ON upload_sessions(status, expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS assets ("
      " id TEXT PRIMARY KEY, tenant_id TEXT NOT NULL, brand_id TEXT, upload_session_id TEXT,"
      " bucket TEXT NOT NULL, object_key TEXT NOT NULL, original_file_name TEXT, title TEXT,"
      " mime_type TEXT, size_bytes BIGINT NOT NULL, asset_class SMALLINT NOT NULL, category_id TEXT,"
      " visibility SMALLINT NOT NULL, approval SMALLINT NOT NULL, published_at_ms BIGINT, published_by TEXT,"
      " created_by TEXT, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, deleted_at_ms BIGINT);",
      "CREATE UNIQUE INDEX IF NOT EXISTS assets_upload_session_live ON assets(upload_session_id) WHERE deleted_at_ms IS NULL;",
      "CREATE TABLE IF NOT EXISTS asset_metadata ("
      " asset_id TEXT NOT NULL REFERENCES assets(id) ON DELETE CASCADE, field_key TEXT NOT NULL, value TEXT NOT NULL,"
      " updated_at_ms BIGINT NOT NULL, PRIMARY KEY (asset_id, field_key));"};
  return kSql;
}

} // namespace upload::db::sql
