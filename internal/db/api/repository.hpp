#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/asset_record.hpp"
#include "internal/db/model/upload_session_record.hpp"

namespace upload::db {

struct AssetCreated {
  model::AssetRecord asset;
};

struct AssetAlreadyExists {
  model::AssetRecord existing;
};

/*
  Outcome of InsertAsset.

  A duplicate upload_session_id is not an error: the backend resolves it to
  the row that won the race.
*/
using InsertAssetResult = std::variant<AssetCreated, AssetAlreadyExists, Result>;

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - GetSessionForUpdate holds the session row until commit/rollback
  - At most one non-deleted asset per upload session

  The DB is the source of truth for:
    upload sessions
    assets
    asset metadata
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Upload sessions
  // ---------------------------------------------------------------------

  virtual Result InsertSession(Transaction&, const model::UploadSessionRecord&) = 0;

  virtual std::optional<model::UploadSessionRecord> GetSession(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::UploadSessionRecord> GetSessionForUpdate(Transaction&, const std::string& id) = 0;

  virtual Result UpdateSession(Transaction&, const model::UploadSessionRecord&) = 0;

  // Non-terminal sessions with expires_at_ms <= now_ms, oldest first.
  virtual std::vector<model::UploadSessionRecord> ListExpiredSessions(Transaction&, uint64_t now_ms, uint32_t limit) = 0;

  // ---------------------------------------------------------------------
  // Assets
  // ---------------------------------------------------------------------

  virtual InsertAssetResult InsertAsset(Transaction&, const model::AssetRecord&) = 0;

  virtual std::optional<model::AssetRecord> GetAsset(Transaction&, const std::string& id) = 0;

  // Non-deleted asset created from the session, if any.
  virtual std::optional<model::AssetRecord> FindAssetBySession(Transaction&, const std::string& session_id) = 0;

  virtual Result UpdateAsset(Transaction&, const model::AssetRecord&) = 0;

  // ---------------------------------------------------------------------
  // Asset metadata
  // ---------------------------------------------------------------------

  virtual Result UpsertAssetMetadata(Transaction&, const model::AssetMetadataRecord&) = 0;

  virtual std::vector<model::AssetMetadataRecord> ListAssetMetadata(Transaction&, const std::string& asset_id) = 0;
};

} // namespace upload::db
