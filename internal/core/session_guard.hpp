#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/core/upload_context.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/session_state.hpp"

namespace upload::core {

/*
  Single gate for session state changes.

  Every mutating operation loads the session through LoadForUpdate and
  asks RequireTransition / RequireLive before writing. Expiry is lazy: a
  live session past expires_at is moved to EXPIRED on its next touch and
  that write is committed before the conflict is reported.
*/
class SessionGuard {
 public:
  SessionGuard(std::shared_ptr<db::Repository> repository, util::NowFn now);

  // Row-locked load scoped to the caller's tenant. Unknown ids and foreign
  // tenants are both NotFound.
  db::model::UploadSessionRecord LoadForUpdate(db::Transaction& tx, const std::string& session_id, const RequestContext& ctx);

  bool IsExpiryDue(const db::model::UploadSessionRecord& session) const;

  // Moves a live, past-expiry session to EXPIRED. Returns true if it did.
  bool ExpireIfDue(db::Transaction& tx, db::model::UploadSessionRecord& session);

  // Throws StateConflict unless `target` is reachable. A due expiry is
  // applied and committed on `tx` first.
  void RequireTransition(db::Transaction& tx, db::model::UploadSessionRecord& session, model::SessionStatus target);

  // Throws StateConflict if the session is terminal (or just expired).
  void RequireLive(db::Transaction& tx, db::model::UploadSessionRecord& session, std::string_view operation);

  void Transition(db::Transaction& tx, db::model::UploadSessionRecord& session, model::SessionStatus target,
                  std::string_view failure_reason = {});

  // Refreshes last activity and persists.
  void Touch(db::Transaction& tx, db::model::UploadSessionRecord& session);

  void Save(db::Transaction& tx, db::model::UploadSessionRecord& session);

  std::uint64_t NowMs() const;

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
};

} // namespace upload::core
