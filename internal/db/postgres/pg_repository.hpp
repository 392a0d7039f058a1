#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace upload::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
