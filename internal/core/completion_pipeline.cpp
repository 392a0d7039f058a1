#include "completion_pipeline.hpp"

#include <utility>

#include "internal/core/title.hpp"
#include "internal/model/asset_kind.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/uuid.hpp"

namespace upload::core {

using upload::model::SessionStatus;
using upload::model::TransferType;
using upload::model::UploadMode;
using upload::observability::IntField;
using upload::observability::SizeField;
using upload::observability::StringField;

namespace {

constexpr std::string_view kUnknownContentType = "application/octet-stream";

} // namespace

CompletionPipeline::CompletionPipeline(std::shared_ptr<db::Repository> repository, std::shared_ptr<objectstore::ObjectStore> store,
                                       CompletionCollaborators collaborators, UploadOptions options)
    : repository_(std::move(repository)),
      store_(std::move(store)),
      collaborators_(std::move(collaborators)),
      options_(std::move(options)),
      guard_(repository_, options_.now),
      assembler_(store_) {
}

// ------------------------------------------------------------------
// Complete
// ------------------------------------------------------------------

CompletionResult CompletionPipeline::Complete(const RequestContext& ctx, const CompletionRequest& request) {
  RequireBrand(ctx);

  db::model::UploadSessionRecord session;
  if (auto replay = Replay(ctx, request.session_id, &session)) {
    upload::observability::Metrics::Instance().RecordCompletion("replayed");
    return *replay;
  }

  std::optional<collaborators::Category> category;
  collaborators::MetadataValidation      metadata;
  if (session.mode == UploadMode::kCreate) {
    if (!request.category_id.empty()) {
      category = collaborators_.categories->Find(session.tenant_id, request.category_id);
    }
    if (!request.metadata.empty()) {
      metadata = collaborators_.metadata->Validate(category, request.metadata);
      if (metadata.accepted.empty()) {
        RecordFailure(ctx, session.id, model::failure_reason::kMetadataRejected, false);
        upload::observability::Metrics::Instance().RecordCompletion("failed");
        throw util::MetadataPersistenceFailed("none of the " + std::to_string(request.metadata.size()) + " metadata fields were accepted");
      }
    }
  }

  if (session.transfer_type == TransferType::kChunked) {
    try {
      assembler_.Assemble(session);
    } catch (const TransferGone&) {
      RecordFailure(ctx, session.id, model::failure_reason::kTransferAborted, true);
      upload::observability::Metrics::Instance().RecordCompletion("failed");
      throw;
    } catch (const util::TransferAssemblyFailed&) {
      RecordFailure(ctx, session.id, model::failure_reason::kAssemblyFailed, false);
      upload::observability::Metrics::Instance().RecordCompletion("failed");
      throw;
    }
  }

  const auto stat = store_->ExistsAndStat(session.bucket, session.object_key);
  if (!stat.exists) {
    throw util::NotFound("uploaded object not found for session " + session.id);
  }
  if (stat.size_bytes != session.expected_size_bytes) {
    RecordFailure(ctx, session.id, model::failure_reason::kSizeMismatch, true);
    upload::observability::Metrics::Instance().RecordCompletion("failed");
    throw util::SizeMismatch("uploaded object is " + std::to_string(stat.size_bytes) + " bytes, expected " +
                                 std::to_string(session.expected_size_bytes),
                             session.expected_size_bytes, stat.size_bytes);
  }
  upload::observability::Metrics::Instance().ObserveVerifiedBytes(stat.size_bytes);

  auto result = Persist(ctx, request, stat, category, metadata);
  if (result.replayed) {
    upload::observability::Metrics::Instance().RecordCompletion("replayed");
    return result;
  }

  if (result.mode == UploadMode::kReplace) {
    EmitEvents(ctx, result.asset, false);
    upload::observability::Metrics::Instance().RecordCompletion("replaced");
    return result;
  }

  Publish(ctx, result.asset, category);

  if (!metadata.rejected.empty()) {
    UPLOAD_LOG_WARN("metadata partially accepted", {StringField("asset_id", result.asset.id),
                                                    IntField("accepted", static_cast<std::int64_t>(metadata.accepted.size())),
                                                    IntField("rejected", static_cast<std::int64_t>(metadata.rejected.size()))});
  }

  EmitEvents(ctx, result.asset, true);
  upload::observability::Metrics::Instance().RecordCompletion("created");
  return result;
}

// ------------------------------------------------------------------
// Replay detection
// ------------------------------------------------------------------

std::optional<CompletionResult> CompletionPipeline::Replay(const RequestContext& ctx, const std::string& session_id,
                                                           db::model::UploadSessionRecord* session_out) {
  auto tx      = repository_->Begin();
  auto session = guard_.LoadForUpdate(*tx, session_id, ctx);

  auto existing = ProducedAsset(*tx, session);
  if (existing) {
    if (session.status != SessionStatus::kCompleted && model::CanTransition(session.status, SessionStatus::kCompleted)) {
      session.uploaded_size_bytes = existing->size_bytes;
      guard_.Transition(*tx, session, SessionStatus::kCompleted);
      tx->Commit();
    }
    CompletionResult result;
    result.asset    = *existing;
    result.mode     = session.mode;
    result.replayed = true;
    return result;
  }

  if (session.status == SessionStatus::kCompleted) {
    throw util::NotFound("asset for completed upload session " + session.id + " no longer exists");
  }

  guard_.RequireTransition(*tx, session, SessionStatus::kCompleted);
  *session_out = session;
  return std::nullopt;
}

std::optional<db::model::AssetRecord> CompletionPipeline::ProducedAsset(db::Transaction& tx, const db::model::UploadSessionRecord& session) {
  if (session.mode == UploadMode::kCreate) {
    return repository_->FindAssetBySession(tx, session.id);
  }
  if (session.status != SessionStatus::kCompleted) {
    return std::nullopt;
  }
  auto target = repository_->GetAsset(tx, session.target_asset_id);
  if (!target || target->deleted_at_ms != 0) {
    return std::nullopt;
  }
  return target;
}

// ------------------------------------------------------------------
// Atomic unit
// ------------------------------------------------------------------

CompletionResult CompletionPipeline::Persist(const RequestContext& ctx, const CompletionRequest& request, const objectstore::ObjectStat& stat,
                                             const std::optional<collaborators::Category>& category,
                                             const collaborators::MetadataValidation& metadata) {
  auto tx      = repository_->Begin();
  auto session = guard_.LoadForUpdate(*tx, request.session_id, ctx);
  const auto now_ms = guard_.NowMs();

  CompletionResult result;
  result.mode = session.mode;

  // a concurrent call may have won between verification and this lock
  if (auto raced = ProducedAsset(*tx, session)) {
    if (model::CanTransition(session.status, SessionStatus::kCompleted)) {
      session.uploaded_size_bytes = raced->size_bytes;
      guard_.Transition(*tx, session, SessionStatus::kCompleted);
      tx->Commit();
    }
    result.asset    = *raced;
    result.replayed = true;
    return result;
  }

  guard_.RequireTransition(*tx, session, SessionStatus::kCompleted);

  const auto mime_type = stat.content_type.empty() ? std::string(kUnknownContentType) : stat.content_type;

  if (session.mode == UploadMode::kReplace) {
    auto target = repository_->GetAsset(*tx, session.target_asset_id);
    if (!target || target->tenant_id != session.tenant_id || target->deleted_at_ms != 0) {
      throw util::NotFound("asset not found: " + session.target_asset_id);
    }
    target->bucket            = session.bucket;
    target->object_key        = session.object_key;
    target->size_bytes        = stat.size_bytes;
    target->mime_type         = mime_type;
    target->updated_at_ms     = now_ms;
    ThrowIfDbError(repository_->UpdateAsset(*tx, *target), "replace asset file");
    result.asset = *target;
  } else {
    db::model::AssetRecord asset;
    asset.id                 = util::NewId();
    asset.tenant_id          = session.tenant_id;
    asset.brand_id           = session.brand_id.empty() ? ctx.brand_id : session.brand_id;
    asset.upload_session_id  = session.id;
    asset.bucket             = session.bucket;
    asset.object_key         = session.object_key;
    asset.original_file_name = request.file_name.empty() ? session.file_name : request.file_name;
    asset.title              = ResolveTitle(request.title, asset.original_file_name).value_or("");
    asset.mime_type          = mime_type;
    asset.size_bytes         = stat.size_bytes;
    asset.asset_class        = category ? category->asset_class : model::AssetClass::kAsset;
    asset.category_id        = category ? category->id : std::string();
    asset.created_by         = ctx.user_id;
    asset.created_at_ms      = now_ms;
    asset.updated_at_ms      = now_ms;

    auto inserted = repository_->InsertAsset(*tx, asset);
    if (auto* created = std::get_if<db::AssetCreated>(&inserted)) {
      result.asset = created->asset;
      collaborators_.metadata->Write(*tx, result.asset, metadata.accepted);
      result.accepted_metadata_keys = metadata.AcceptedKeys();
      result.rejected_metadata_keys = metadata.rejected;
    } else if (auto* duplicate = std::get_if<db::AssetAlreadyExists>(&inserted)) {
      result.asset    = duplicate->existing;
      result.replayed = true;
    } else {
      ThrowIfDbError(std::get<db::Result>(inserted), "insert asset");
    }
  }

  session.uploaded_size_bytes = stat.size_bytes;
  session.last_activity_at_ms = now_ms;
  guard_.Transition(*tx, session, SessionStatus::kCompleted);
  tx->Commit();

  UPLOAD_LOG_INFO("upload session completed", {StringField("session_id", session.id), StringField("asset_id", result.asset.id),
                                               StringField("mode", model::ToString(session.mode)),
                                               SizeField("size_bytes", stat.size_bytes)});
  return result;
}

// ------------------------------------------------------------------
// Publication and events
// ------------------------------------------------------------------

void CompletionPipeline::Publish(const RequestContext& ctx, db::model::AssetRecord& asset, const std::optional<collaborators::Category>& category) {
  if (!category) {
    return;
  }

  if (category->requires_approval) {
    asset.visibility = model::Visibility::kHidden;
    asset.approval   = model::ApprovalStatus::kPending;
  } else if (!ctx.user_id.empty()) {
    asset.published_at_ms = guard_.NowMs();
    asset.published_by    = ctx.user_id;
  } else {
    return;
  }

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->UpdateAsset(*tx, asset), "publish asset");
  tx->Commit();

  if (asset.approval == model::ApprovalStatus::kPending) {
    try {
      collaborators_.approvals->ApprovalRequested(asset, ctx.user_id);
    } catch (const std::exception& e) {
      UPLOAD_LOG_WARN("approval notification failed", {StringField("asset_id", asset.id), StringField("error", e.what())});
    }
  }
}

void CompletionPipeline::EmitEvents(const RequestContext& ctx, const db::model::AssetRecord& asset, bool created) {
  const auto kind = model::ClassifyContentType(asset.mime_type);
  try {
    if (created) {
      collaborators_.events->AssetCreated(asset, ctx.user_id);
    }
    collaborators_.events->ProcessingRequested(asset, model::ProcessingSteps(kind));
  } catch (const std::exception& e) {
    UPLOAD_LOG_WARN("asset event emission failed", {StringField("asset_id", asset.id), StringField("kind", model::KindName(kind)),
                                                    StringField("error", e.what())});
  }
}

// ------------------------------------------------------------------
// Failure bookkeeping
// ------------------------------------------------------------------

void CompletionPipeline::RecordFailure(const RequestContext& ctx, const std::string& session_id, std::string_view reason, bool terminal) {
  auto tx      = repository_->Begin();
  auto session = guard_.LoadForUpdate(*tx, session_id, ctx);
  if (model::IsTerminal(session.status)) {
    return;
  }

  if (terminal) {
    guard_.Transition(*tx, session, SessionStatus::kFailed, reason);
  } else {
    ++session.failure_count;
    session.failure_reason = std::string(reason);
    guard_.Save(*tx, session);
  }
  tx->Commit();

  UPLOAD_LOG_WARN("upload completion failed", {StringField("session_id", session.id), StringField("reason", reason),
                                               IntField("failure_count", session.failure_count), upload::observability::BoolField("terminal", terminal)});
}

} // namespace upload::core
