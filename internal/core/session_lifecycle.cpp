#include "session_lifecycle.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace upload::core {

using upload::model::SessionStatus;
using upload::model::TransferType;
using upload::observability::IntField;
using upload::observability::StringField;

SessionLifecycle::SessionLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<objectstore::ObjectStore> store,
                                   std::shared_ptr<collaborators::TicketSink> tickets, UploadOptions options)
    : repository_(std::move(repository)),
      store_(std::move(store)),
      tickets_(std::move(tickets)),
      options_(std::move(options)),
      guard_(repository_, options_.now) {
}

void SessionLifecycle::CleanupRemote(const db::model::UploadSessionRecord& session) {
  if (!session.multipart_upload_id.empty()) {
    try {
      store_->AbortMultipart(session.bucket, session.object_key, session.multipart_upload_id);
    } catch (const objectstore::TransferNotFound&) {
      // already completed or aborted
    } catch (const std::exception& e) {
      UPLOAD_LOG_WARN("multipart abort failed", {StringField("session_id", session.id), StringField("error", e.what())});
    }
  }

  try {
    store_->DeleteObject(session.bucket, session.object_key);
  } catch (const std::exception& e) {
    UPLOAD_LOG_WARN("temporary object delete failed", {StringField("session_id", session.id), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------------
// Cancel
// ------------------------------------------------------------------

CancelResult SessionLifecycle::Cancel(const RequestContext& ctx, const std::string& session_id) {
  auto tx      = repository_->Begin();
  auto session = guard_.LoadForUpdate(*tx, session_id, ctx);

  if (guard_.ExpireIfDue(*tx, session)) {
    tx->Commit();
  }
  if (model::IsTerminal(session.status)) {
    return CancelResult{false, session.status};
  }

  guard_.Transition(*tx, session, SessionStatus::kCancelled, model::failure_reason::kCancelledByUser);
  tx->Commit();

  UPLOAD_LOG_INFO("upload session cancelled", {StringField("session_id", session.id), StringField("tenant_id", session.tenant_id)});
  CleanupRemote(session);
  return CancelResult{true, session.status};
}

// ------------------------------------------------------------------
// Activity
// ------------------------------------------------------------------

MarkUploadingResult SessionLifecycle::MarkUploading(const RequestContext& ctx, const std::string& session_id) {
  auto tx      = repository_->Begin();
  auto session = guard_.LoadForUpdate(*tx, session_id, ctx);

  if (session.status == SessionStatus::kUploading && !guard_.IsExpiryDue(session)) {
    guard_.Touch(*tx, session);
    tx->Commit();
    return MarkUploadingResult{false, session.status};
  }

  guard_.RequireTransition(*tx, session, SessionStatus::kUploading);
  session.last_activity_at_ms = guard_.NowMs();
  guard_.Transition(*tx, session, SessionStatus::kUploading);
  tx->Commit();
  return MarkUploadingResult{true, session.status};
}

TouchResult SessionLifecycle::TouchActivity(const RequestContext& ctx, const std::string& session_id) {
  auto tx      = repository_->Begin();
  auto session = guard_.LoadForUpdate(*tx, session_id, ctx);

  if (guard_.ExpireIfDue(*tx, session)) {
    tx->Commit();
  }
  if (model::IsTerminal(session.status)) {
    return TouchResult{false, util::FromUnixMillis(session.last_activity_at_ms)};
  }

  guard_.Touch(*tx, session);
  tx->Commit();
  return TouchResult{true, util::FromUnixMillis(session.last_activity_at_ms)};
}

// ------------------------------------------------------------------
// Lookup
// ------------------------------------------------------------------

db::model::UploadSessionRecord SessionLifecycle::GetSession(const RequestContext& ctx, const std::string& session_id) {
  auto tx      = repository_->Begin();
  auto session = guard_.LoadForUpdate(*tx, session_id, ctx);
  if (guard_.ExpireIfDue(*tx, session)) {
    tx->Commit();
  }
  return session;
}

ResumeInfo SessionLifecycle::GetResumeInfo(const RequestContext& ctx, const std::string& session_id) {
  ResumeInfo info;
  {
    auto tx      = repository_->Begin();
    auto session = guard_.LoadForUpdate(*tx, session_id, ctx);

    if (guard_.ExpireIfDue(*tx, session)) {
      info.blocked_reason = "session expired";
    } else if (model::IsTerminal(session.status)) {
      info.blocked_reason = "session is " + std::string(model::ToString(session.status));
    } else {
      info.can_resume = true;
      guard_.Touch(*tx, session);
    }
    tx->Commit();
    info.session = std::move(session);
  }

  if (info.can_resume && info.session.transfer_type == TransferType::kChunked && !info.session.multipart_upload_id.empty()) {
    try {
      info.uploaded_parts = store_->ListParts(info.session.bucket, info.session.object_key, info.session.multipart_upload_id);
    } catch (const objectstore::TransferNotFound&) {
      info.can_resume     = false;
      info.blocked_reason = "multipart upload no longer exists";
    }
  }
  return info;
}

// ------------------------------------------------------------------
// Multipart abort
// ------------------------------------------------------------------

AbortResult SessionLifecycle::AbortMultipart(const RequestContext& ctx, const std::string& session_id) {
  auto tx      = repository_->Begin();
  auto session = guard_.LoadForUpdate(*tx, session_id, ctx);

  if (session.status == SessionStatus::kCompleted) {
    throw util::StateConflict("upload session " + session.id + " is completed, cannot abort multipart upload", "completed",
                              "initiating|uploading");
  }
  if (guard_.ExpireIfDue(*tx, session)) {
    tx->Commit();
  }
  if (session.multipart_upload_id.empty()) {
    return AbortResult{false, true};
  }

  // terminal rows are left as they are; only the remote side is cleaned up
  const bool terminal = model::IsTerminal(session.status);

  AbortResult result;
  try {
    store_->AbortMultipart(session.bucket, session.object_key, session.multipart_upload_id);
    result.aborted = true;
  } catch (const objectstore::TransferNotFound&) {
    result.already_aborted = true;
  } catch (const std::exception& e) {
    if (!terminal) {
      throw;
    }
    UPLOAD_LOG_WARN("multipart abort failed", {StringField("session_id", session.id), StringField("error", e.what())});
    return result;
  }

  UPLOAD_LOG_INFO("multipart upload aborted", {StringField("session_id", session.id), StringField("transfer_id", session.multipart_upload_id),
                                               upload::observability::BoolField("already_aborted", result.already_aborted)});
  if (terminal) {
    return result;
  }

  session.multipart_upload_id.clear();
  session.total_parts = 0;
  guard_.Save(*tx, session);
  tx->Commit();
  return result;
}

// ------------------------------------------------------------------
// Escalation
// ------------------------------------------------------------------

EscalationResult SessionLifecycle::Escalate(const RequestContext& ctx, const std::string& session_id, const std::string& summary) {
  auto tx      = repository_->Begin();
  auto session = guard_.LoadForUpdate(*tx, session_id, ctx);

  if (!session.escalation_ticket_id.empty()) {
    return EscalationResult{session.escalation_ticket_id, false};
  }

  session.escalation_ticket_id = tickets_->OpenTicket(session, summary);
  if (session.escalation_ticket_id.empty()) {
    throw std::runtime_error("ticket sink returned an empty reference");
  }
  guard_.Save(*tx, session);
  tx->Commit();
  return EscalationResult{session.escalation_ticket_id, true};
}

// ------------------------------------------------------------------
// Expiry sweep
// ------------------------------------------------------------------

std::vector<std::string> SessionLifecycle::ReapExpired(std::uint32_t limit) {
  std::vector<db::model::UploadSessionRecord> expired;
  {
    auto tx = repository_->Begin();
    expired = repository_->ListExpiredSessions(*tx, guard_.NowMs(), limit);
    for (auto& session : expired) {
      guard_.Transition(*tx, session, SessionStatus::kExpired, model::failure_reason::kExpired);
    }
    tx->Commit();
  }

  std::vector<std::string> ids;
  ids.reserve(expired.size());
  for (const auto& session : expired) {
    CleanupRemote(session);
    ids.push_back(session.id);
  }

  upload::observability::Metrics::Instance().RecordReaped(ids.size());
  UPLOAD_LOG_INFO("expired upload sessions reaped", {IntField("count", static_cast<std::int64_t>(ids.size()))});
  return ids;
}

} // namespace upload::core
