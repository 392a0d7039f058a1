#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace upload::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Upload sessions
// ------------------------------------------------------------------

Result MemoryRepository::InsertSession(Transaction& t, const model::UploadSessionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.sessions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "upload session " + r.id);
  s.sessions[r.id] = r;
  return Result::Ok();
}

std::optional<model::UploadSessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

std::optional<model::UploadSessionRecord> MemoryRepository::GetSessionForUpdate(Transaction& t, const std::string& id) {
  // the transaction already holds the write mutex
  return GetSession(t, id);
}

Result MemoryRepository::UpdateSession(Transaction& t, const model::UploadSessionRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.sessions.find(r.id);
  if (it == s.sessions.end()) return Result::Err(ErrorCode::NotFound, "upload session " + r.id);
  it->second = r;
  return Result::Ok();
}

std::vector<model::UploadSessionRecord> MemoryRepository::ListExpiredSessions(Transaction& t, uint64_t now_ms, uint32_t limit) {
  std::vector<model::UploadSessionRecord> out;
  for (const auto& [_, session] : TX(t).View().sessions) {
    if (!upload::model::IsTerminal(session.status) && session.expires_at_ms <= now_ms) {
      out.push_back(session);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.expires_at_ms < b.expires_at_ms; });
  if (limit > 0 && out.size() > limit) out.resize(limit);
  return out;
}

// ------------------------------------------------------------------
// Assets
// ------------------------------------------------------------------

InsertAssetResult MemoryRepository::InsertAsset(Transaction& t, const model::AssetRecord& r) {
  auto& s = TX(t).Mutable();

  if (r.deleted_at_ms == 0 && !r.upload_session_id.empty()) {
    auto existing = s.asset_by_session.find(r.upload_session_id);
    if (existing != s.asset_by_session.end()) {
      return AssetAlreadyExists{s.assets.at(existing->second)};
    }
  }
  if (s.assets.contains(r.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "asset " + r.id);
  }

  s.assets[r.id] = r;
  if (r.deleted_at_ms == 0 && !r.upload_session_id.empty()) {
    s.asset_by_session[r.upload_session_id] = r.id;
  }
  return AssetCreated{r};
}

std::optional<model::AssetRecord> MemoryRepository::GetAsset(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.assets.find(id);
  if (it == s.assets.end()) return std::nullopt;
  return it->second;
}

std::optional<model::AssetRecord> MemoryRepository::FindAssetBySession(Transaction& t, const std::string& session_id) {
  const auto& s  = TX(t).View();
  auto        it = s.asset_by_session.find(session_id);
  if (it == s.asset_by_session.end()) return std::nullopt;
  return s.assets.at(it->second);
}

Result MemoryRepository::UpdateAsset(Transaction& t, const model::AssetRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.assets.find(r.id);
  if (it == s.assets.end()) return Result::Err(ErrorCode::NotFound, "asset " + r.id);

  if (r.deleted_at_ms == 0 && !r.upload_session_id.empty()) {
    auto owner = s.asset_by_session.find(r.upload_session_id);
    if (owner != s.asset_by_session.end() && owner->second != r.id) {
      return Result::Err(ErrorCode::ConstraintViolation, "upload session already has an asset");
    }
  }

  const auto& previous = it->second;
  if (previous.deleted_at_ms == 0 && !previous.upload_session_id.empty()) {
    s.asset_by_session.erase(previous.upload_session_id);
  }
  if (r.deleted_at_ms == 0 && !r.upload_session_id.empty()) {
    s.asset_by_session[r.upload_session_id] = r.id;
  }
  it->second = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Asset metadata
// ------------------------------------------------------------------

Result MemoryRepository::UpsertAssetMetadata(Transaction& t, const model::AssetMetadataRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.assets.contains(r.asset_id)) return Result::Err(ErrorCode::NotFound, "asset " + r.asset_id);
  s.metadata[r.asset_id][r.field_key] = r;
  return Result::Ok();
}

std::vector<model::AssetMetadataRecord> MemoryRepository::ListAssetMetadata(Transaction& t, const std::string& asset_id) {
  std::vector<model::AssetMetadataRecord> out;
  const auto&                             s  = TX(t).View();
  auto                                    it = s.metadata.find(asset_id);
  if (it == s.metadata.end()) return out;
  for (const auto& [_, row] : it->second) out.push_back(row);
  return out;
}

} // namespace upload::db::memory
