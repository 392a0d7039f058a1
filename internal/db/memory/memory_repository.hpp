#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace upload::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::UploadSessionRecord> sessions;
    std::unordered_map<std::string, model::AssetRecord> assets;

    // upload_session_id -> asset id, non-deleted assets only
    std::unordered_map<std::string, std::string> asset_by_session;

    // asset id -> field key -> row
    std::unordered_map<std::string, std::map<std::string, model::AssetMetadataRecord>> metadata;
  };

  // held by the live transaction for its whole lifetime
  std::mutex write_mutex_;

  std::mutex state_mutex_;
  State committed_;
};

}
