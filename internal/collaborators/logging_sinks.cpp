#include "logging_sinks.hpp"

#include "internal/model/session_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace upload::collaborators {

using upload::observability::IntField;
using upload::observability::SizeField;
using upload::observability::StringField;

void LoggingEventSink::AssetCreated(const db::model::AssetRecord& asset, const std::string& actor_user_id) {
  UPLOAD_LOG_INFO("asset created", {StringField("asset_id", asset.id), StringField("tenant_id", asset.tenant_id),
                                    StringField("upload_session_id", asset.upload_session_id), StringField("actor", actor_user_id),
                                    SizeField("size_bytes", asset.size_bytes)});
}

void LoggingEventSink::ProcessingRequested(const db::model::AssetRecord& asset, const std::vector<std::string>& steps) {
  std::string joined;
  for (const auto& step : steps) {
    if (!joined.empty()) joined += ",";
    joined += step;
  }
  UPLOAD_LOG_INFO("asset processing requested",
                  {StringField("asset_id", asset.id), StringField("mime_type", asset.mime_type), StringField("steps", joined)});
}

void LoggingApprovalNotifier::ApprovalRequested(const db::model::AssetRecord& asset, const std::string& requested_by) {
  UPLOAD_LOG_INFO("asset approval requested", {StringField("asset_id", asset.id), StringField("tenant_id", asset.tenant_id),
                                               StringField("category_id", asset.category_id), StringField("requested_by", requested_by)});
}

std::string LoggingTicketSink::OpenTicket(const db::model::UploadSessionRecord& session, const std::string& summary) {
  auto ticket_id = "UPL-" + util::NewId().substr(0, 8);
  UPLOAD_LOG_WARN("upload escalated", {StringField("ticket_id", ticket_id), StringField("session_id", session.id),
                                       StringField("tenant_id", session.tenant_id),
                                       StringField("status", upload::model::ToString(session.status)),
                                       IntField("failure_count", session.failure_count), StringField("summary", summary)});
  return ticket_id;
}

} // namespace upload::collaborators
