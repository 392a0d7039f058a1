#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/collaborators/sinks.hpp"
#include "internal/core/session_guard.hpp"
#include "internal/core/upload_context.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/objectstore/object_store.hpp"

namespace upload::core {

struct CancelResult {
  bool                 cancelled = false;
  model::SessionStatus status    = model::SessionStatus::kUnspecified;
};

struct MarkUploadingResult {
  bool                 transitioned = false;
  model::SessionStatus status       = model::SessionStatus::kUnspecified;
};

struct TouchResult {
  bool            touched = false;
  util::TimePoint last_activity_at{};
};

struct ResumeInfo {
  db::model::UploadSessionRecord     session;
  bool                               can_resume = false;
  std::string                        blocked_reason;
  std::vector<objectstore::PartInfo> uploaded_parts;
};

struct AbortResult {
  bool aborted         = false;
  bool already_aborted = false;
};

struct EscalationResult {
  std::string ticket_id;
  bool        newly_attached = false;
};

/*
  Session operations outside initiation and completion.

  Remote cleanup (object delete, multipart abort) is best-effort and runs
  after the state change is committed; its failures are only logged.
*/
class SessionLifecycle {
 public:
  SessionLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<objectstore::ObjectStore> store,
                   std::shared_ptr<collaborators::TicketSink> tickets, UploadOptions options);

  // Idempotent: a terminal session reports cancelled = false.
  CancelResult Cancel(const RequestContext& ctx, const std::string& session_id);

  // INITIATING -> UPLOADING. Already UPLOADING only refreshes activity.
  MarkUploadingResult MarkUploading(const RequestContext& ctx, const std::string& session_id);

  TouchResult TouchActivity(const RequestContext& ctx, const std::string& session_id);

  db::model::UploadSessionRecord GetSession(const RequestContext& ctx, const std::string& session_id);

  ResumeInfo GetResumeInfo(const RequestContext& ctx, const std::string& session_id);

  // Clears the transfer on live sessions. Terminal sessions only get the
  // remote abort; their row is not written.
  AbortResult AbortMultipart(const RequestContext& ctx, const std::string& session_id);

  // Attaches a ticket at most once; later calls return the existing one.
  EscalationResult Escalate(const RequestContext& ctx, const std::string& session_id, const std::string& summary);

  // Marks up to `limit` (0 = all) past-expiry live sessions EXPIRED.
  std::vector<std::string> ReapExpired(std::uint32_t limit);

 private:
  void CleanupRemote(const db::model::UploadSessionRecord& session);

  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<objectstore::ObjectStore>  store_;
  std::shared_ptr<collaborators::TicketSink> tickets_;
  UploadOptions                              options_;
  SessionGuard                               guard_;
};

} // namespace upload::core
