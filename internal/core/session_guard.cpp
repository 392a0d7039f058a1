#include "session_guard.hpp"

#include <utility>

#include "internal/observability/spans.hpp"
#include "internal/util/uuid.hpp"

namespace upload::core {

using upload::model::SessionStatus;

namespace {

std::string ConflictMessage(const db::model::UploadSessionRecord& session, SessionStatus target) {
  return "upload session " + session.id + " is " + std::string(model::ToString(session.status)) + ", cannot move to " +
         std::string(model::ToString(target));
}

} // namespace

SessionGuard::SessionGuard(std::shared_ptr<db::Repository> repository, util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
}

std::uint64_t SessionGuard::NowMs() const {
  return util::ToUnixMillis(now_());
}

db::model::UploadSessionRecord SessionGuard::LoadForUpdate(db::Transaction& tx, const std::string& session_id, const RequestContext& ctx) {
  RequireTenant(ctx);
  if (!util::IsValidId(session_id)) {
    throw util::InvalidArgument("invalid upload session id");
  }

  auto session = repository_->GetSessionForUpdate(tx, session_id);
  if (!session || session->tenant_id != ctx.tenant_id) {
    throw util::NotFound("upload session not found: " + session_id);
  }
  if (!ctx.brand_id.empty() && !session->brand_id.empty() && session->brand_id != ctx.brand_id) {
    throw util::NotFound("upload session not found: " + session_id);
  }
  return *session;
}

bool SessionGuard::IsExpiryDue(const db::model::UploadSessionRecord& session) const {
  return !model::IsTerminal(session.status) && session.expires_at_ms <= NowMs();
}

bool SessionGuard::ExpireIfDue(db::Transaction& tx, db::model::UploadSessionRecord& session) {
  if (!IsExpiryDue(session)) {
    return false;
  }
  Transition(tx, session, SessionStatus::kExpired, model::failure_reason::kExpired);
  return true;
}

void SessionGuard::RequireTransition(db::Transaction& tx, db::model::UploadSessionRecord& session, SessionStatus target) {
  if (target != SessionStatus::kExpired && ExpireIfDue(tx, session)) {
    tx.Commit();
    throw util::StateConflict(ConflictMessage(session, target), std::string(model::ToString(session.status)),
                              std::string(model::ToString(target)));
  }
  if (!model::CanTransition(session.status, target)) {
    throw util::StateConflict(ConflictMessage(session, target), std::string(model::ToString(session.status)),
                              std::string(model::ToString(target)));
  }
}

void SessionGuard::RequireLive(db::Transaction& tx, db::model::UploadSessionRecord& session, std::string_view operation) {
  if (ExpireIfDue(tx, session)) {
    tx.Commit();
  }
  if (model::IsTerminal(session.status)) {
    throw util::StateConflict("upload session " + session.id + " is " + std::string(model::ToString(session.status)) + ", cannot " +
                                  std::string(operation),
                              std::string(model::ToString(session.status)), "initiating|uploading");
  }
}

void SessionGuard::Transition(db::Transaction& tx, db::model::UploadSessionRecord& session, SessionStatus target,
                              std::string_view failure_reason) {
  if (!model::CanTransition(session.status, target)) {
    throw util::StateConflict(ConflictMessage(session, target), std::string(model::ToString(session.status)),
                              std::string(model::ToString(target)));
  }

  session.status = target;
  if (!failure_reason.empty()) {
    session.failure_reason = std::string(failure_reason);
  }
  if (target == SessionStatus::kFailed) {
    ++session.failure_count;
  }
  Save(tx, session);
  upload::observability::Metrics::Instance().RecordSessionTransition(model::ToString(target));
}

void SessionGuard::Touch(db::Transaction& tx, db::model::UploadSessionRecord& session) {
  session.last_activity_at_ms = NowMs();
  Save(tx, session);
}

void SessionGuard::Save(db::Transaction& tx, db::model::UploadSessionRecord& session) {
  session.updated_at_ms = NowMs();
  ThrowIfDbError(repository_->UpdateSession(tx, session), "update upload session");
}

} // namespace upload::core
