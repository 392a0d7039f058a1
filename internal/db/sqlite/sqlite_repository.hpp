#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace upload::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertSession(Transaction&, const model::UploadSessionRecord&) override;
  std::optional<model::UploadSessionRecord> GetSession(Transaction&, const std::string&) override;
  std::optional<model::UploadSessionRecord> GetSessionForUpdate(Transaction&, const std::string&) override;
  Result UpdateSession(Transaction&, const model::UploadSessionRecord&) override;
  std::vector<model::UploadSessionRecord> ListExpiredSessions(Transaction&, uint64_t now_ms, uint32_t limit) override;

  InsertAssetResult InsertAsset(Transaction&, const model::AssetRecord&) override;
  std::optional<model::AssetRecord> GetAsset(Transaction&, const std::string&) override;
  std::optional<model::AssetRecord> FindAssetBySession(Transaction&, const std::string&) override;
  Result UpdateAsset(Transaction&, const model::AssetRecord&) override;

  Result UpsertAssetMetadata(Transaction&, const model::AssetMetadataRecord&) override;
  std::vector<model::AssetMetadataRecord> ListAssetMetadata(Transaction&, const std::string&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
