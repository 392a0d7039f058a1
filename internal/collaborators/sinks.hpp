#pragma once

#include <string>
#include <vector>

#include "internal/db/model/asset_record.hpp"
#include "internal/db/model/upload_session_record.hpp"

namespace upload::collaborators {

/*
  Outbound notifications of the completion pipeline.

  Callers treat every failure here as best-effort: it is logged and never
  fails the request that triggered it.
*/

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void AssetCreated(const db::model::AssetRecord& asset, const std::string& actor_user_id) = 0;

  // steps: processing capabilities resolved from the verified content type
  virtual void ProcessingRequested(const db::model::AssetRecord& asset, const std::vector<std::string>& steps) = 0;
};

class ApprovalNotifier {
 public:
  virtual ~ApprovalNotifier() = default;

  virtual void ApprovalRequested(const db::model::AssetRecord& asset, const std::string& requested_by) = 0;
};

class TicketSink {
 public:
  virtual ~TicketSink() = default;

  // Returns the external ticket reference.
  virtual std::string OpenTicket(const db::model::UploadSessionRecord& session, const std::string& summary) = 0;
};

} // namespace upload::collaborators
