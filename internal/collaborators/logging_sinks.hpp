#pragma once

#include "internal/collaborators/sinks.hpp"

namespace upload::collaborators {

// Sinks that write structured log lines; the default wiring of the server.

class LoggingEventSink final : public EventSink {
 public:
  void AssetCreated(const db::model::AssetRecord& asset, const std::string& actor_user_id) override;
  void ProcessingRequested(const db::model::AssetRecord& asset, const std::vector<std::string>& steps) override;
};

class LoggingApprovalNotifier final : public ApprovalNotifier {
 public:
  void ApprovalRequested(const db::model::AssetRecord& asset, const std::string& requested_by) override;
};

class LoggingTicketSink final : public TicketSink {
 public:
  std::string OpenTicket(const db::model::UploadSessionRecord& session, const std::string& summary) override;
};

} // namespace upload::collaborators
