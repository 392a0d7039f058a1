#include "upload_service.hpp"

#include <chrono>
#include <utility>

#include "internal/core/completion_pipeline.hpp"
#include "internal/core/session_initiator.hpp"
#include "internal/core/session_lifecycle.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace upload::service {

using namespace upload::manager::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, const RequestContext& context, const std::string& session_id, Fn&& fn) {
  upload::observability::SpanScope span(route);
  span.SetUploadContext(context.tenant_id(), context.brand_id(), session_id);

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };
  try {
    auto result = fn();
    upload::observability::Metrics::Instance().RecordRequest(route, true);
    upload::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    UPLOAD_LOG_ERROR("RPC failed", {upload::observability::StringField("route", route), upload::observability::StringField("error", ex.what()),
                                    upload::observability::StringField("tenant_id", context.tenant_id()),
                                    upload::observability::StringField("session_id", session_id)});
    upload::observability::Metrics::Instance().RecordRequest(route, false);
    upload::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

upload::core::RequestContext FromProto(const RequestContext& context) {
  return upload::core::RequestContext{context.tenant_id(), context.brand_id(), context.user_id()};
}

upload::core::FileRequest FromProto(const FileSpec& file) {
  return upload::core::FileRequest{file.file_name(), file.size_bytes(), file.mime_type(), file.client_reference()};
}

void ToProto(const upload::objectstore::PresignedUrl& url, UploadGrant* grant) {
  grant->set_url(url.url);
  grant->set_method(url.method);
  for (const auto& [name, value] : url.headers) {
    (*grant->mutable_headers())[name] = value;
  }
  *grant->mutable_expires_at() = upload::util::ToProto(url.expires_at);
}

void ToProto(const upload::core::InitiateResult& result, InitiateUploadResponse* resp) {
  resp->set_session_id(result.session_id);
  resp->set_client_reference(result.client_reference);
  resp->set_batch_reference(result.batch_reference);
  resp->set_status(static_cast<SessionStatus>(result.status));
  resp->set_transfer_type(static_cast<TransferType>(result.transfer_type));
  if (result.grant) {
    ToProto(*result.grant, resp->mutable_grant());
  }
  resp->set_multipart_upload_id(result.multipart_upload_id);
  resp->set_chunk_size_bytes(result.chunk_size_bytes);
  *resp->mutable_expires_at() = upload::util::ToProto(result.expires_at);
  resp->set_object_key(result.object_key);
}

void ToProto(const upload::db::model::UploadSessionRecord& record, UploadSession* session) {
  session->set_session_id(record.id);
  session->set_tenant_id(record.tenant_id);
  session->set_brand_id(record.brand_id);
  session->set_client_reference(record.client_reference);
  session->set_batch_reference(record.batch_reference);
  session->set_transfer_type(static_cast<TransferType>(record.transfer_type));
  session->set_expected_size_bytes(record.expected_size_bytes);
  session->set_uploaded_size_bytes(record.uploaded_size_bytes.value_or(0));
  session->set_multipart_upload_id(record.multipart_upload_id);
  session->set_part_size_bytes(record.part_size_bytes);
  session->set_total_parts(record.total_parts);
  session->set_mode(static_cast<UploadMode>(record.mode));
  session->set_target_asset_id(record.target_asset_id);
  session->set_status(static_cast<SessionStatus>(record.status));
  *session->mutable_expires_at()       = upload::util::ToProto(upload::util::FromUnixMillis(record.expires_at_ms));
  *session->mutable_last_activity_at() = upload::util::ToProto(upload::util::FromUnixMillis(record.last_activity_at_ms));
  session->set_failure_reason(record.failure_reason);
  session->set_failure_count(record.failure_count);
  session->set_escalation_ticket_id(record.escalation_ticket_id);
  session->set_bucket(record.bucket);
  session->set_object_key(record.object_key);
  session->set_file_name(record.file_name);
  session->set_mime_type(record.mime_type);
}

void ToProto(const upload::db::model::AssetRecord& record, Asset* asset) {
  asset->set_asset_id(record.id);
  asset->set_tenant_id(record.tenant_id);
  asset->set_brand_id(record.brand_id);
  asset->set_upload_session_id(record.upload_session_id);
  asset->set_bucket(record.bucket);
  asset->set_object_key(record.object_key);
  asset->set_original_file_name(record.original_file_name);
  asset->set_title(record.title);
  asset->set_mime_type(record.mime_type);
  asset->set_size_bytes(record.size_bytes);
  asset->set_asset_class(std::string(upload::model::ToString(record.asset_class)));
  asset->set_category_id(record.category_id);
  asset->set_visibility(static_cast<VisibilityStatus>(record.visibility));
  asset->set_approval(static_cast<ApprovalStatus>(record.approval));
  asset->set_published(record.published_at_ms != 0);
  asset->set_published_by(record.published_by);
  if (record.published_at_ms != 0) {
    *asset->mutable_published_at() = upload::util::ToProto(upload::util::FromUnixMillis(record.published_at_ms));
  }
  asset->set_created_by(record.created_by);
  *asset->mutable_created_at() = upload::util::ToProto(upload::util::FromUnixMillis(record.created_at_ms));
  *asset->mutable_updated_at() = upload::util::ToProto(upload::util::FromUnixMillis(record.updated_at_ms));
}

} // namespace

UploadService::UploadService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

// ------------------------------------------------------------------
// Initiation
// ------------------------------------------------------------------

InitiateUploadResponse UploadService::InitiateUpload(const InitiateUploadRequest& req) {
  return ObserveRpc("UploadService.InitiateUpload", req.context(), {}, [&] {
    auto result = ctx_.initiator->Initiate(FromProto(req.context()), FromProto(req.file()), req.target_asset_id());

    InitiateUploadResponse resp;
    ToProto(result, &resp);
    return resp;
  });
}

InitiateBatchResponse UploadService::InitiateBatch(const InitiateBatchRequest& req) {
  return ObserveRpc("UploadService.InitiateBatch", req.context(), {}, [&] {
    std::vector<upload::core::FileRequest> files;
    files.reserve(req.files_size());
    for (const auto& file : req.files()) {
      files.push_back(FromProto(file));
    }

    auto items = ctx_.initiator->InitiateBatch(FromProto(req.context()), files, req.batch_reference());

    InitiateBatchResponse resp;
    resp.set_batch_reference(req.batch_reference());
    for (const auto& item : items) {
      auto* out = resp.add_items();
      out->set_ok(item.result.has_value());
      out->set_client_reference(item.client_reference);
      if (item.result) {
        ToProto(*item.result, out->mutable_result());
      } else {
        out->set_error_code(item.error_code);
        out->set_error_message(item.error_message);
      }
    }
    return resp;
  });
}

// ------------------------------------------------------------------
// Multipart
// ------------------------------------------------------------------

InitiateMultipartResponse UploadService::InitiateMultipart(const InitiateMultipartRequest& req) {
  return ObserveRpc("UploadService.InitiateMultipart", req.context(), req.session_id(), [&] {
    auto result = ctx_.initiator->InitiateMultipart(FromProto(req.context()), req.session_id());

    InitiateMultipartResponse resp;
    resp.set_multipart_upload_id(result.multipart_upload_id);
    resp.set_part_size_bytes(result.part_size_bytes);
    resp.set_total_parts(result.total_parts);
    resp.set_already_initiated(result.already_initiated);
    return resp;
  });
}

SignPartUrlResponse UploadService::SignPartUrl(const SignPartUrlRequest& req) {
  return ObserveRpc("UploadService.SignPartUrl", req.context(), req.session_id(), [&] {
    auto url = ctx_.initiator->SignPartUrl(FromProto(req.context()), req.session_id(), req.part_number());

    SignPartUrlResponse resp;
    ToProto(url, resp.mutable_grant());
    resp.set_part_number(req.part_number());
    return resp;
  });
}

AbortMultipartResponse UploadService::AbortMultipart(const AbortMultipartRequest& req) {
  return ObserveRpc("UploadService.AbortMultipart", req.context(), req.session_id(), [&] {
    auto result = ctx_.lifecycle->AbortMultipart(FromProto(req.context()), req.session_id());

    AbortMultipartResponse resp;
    resp.set_aborted(result.aborted);
    resp.set_already_aborted(result.already_aborted);
    return resp;
  });
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

MarkUploadingResponse UploadService::MarkUploading(const MarkUploadingRequest& req) {
  return ObserveRpc("UploadService.MarkUploading", req.context(), req.session_id(), [&] {
    auto result = ctx_.lifecycle->MarkUploading(FromProto(req.context()), req.session_id());

    MarkUploadingResponse resp;
    resp.set_transitioned(result.transitioned);
    resp.set_status(static_cast<SessionStatus>(result.status));
    return resp;
  });
}

TouchActivityResponse UploadService::TouchActivity(const TouchActivityRequest& req) {
  return ObserveRpc("UploadService.TouchActivity", req.context(), req.session_id(), [&] {
    auto result = ctx_.lifecycle->TouchActivity(FromProto(req.context()), req.session_id());

    TouchActivityResponse resp;
    resp.set_touched(result.touched);
    *resp.mutable_last_activity_at() = upload::util::ToProto(result.last_activity_at);
    return resp;
  });
}

CancelUploadResponse UploadService::CancelUpload(const CancelUploadRequest& req) {
  return ObserveRpc("UploadService.CancelUpload", req.context(), req.session_id(), [&] {
    auto result = ctx_.lifecycle->Cancel(FromProto(req.context()), req.session_id());

    CancelUploadResponse resp;
    resp.set_cancelled(result.cancelled);
    resp.set_status(static_cast<SessionStatus>(result.status));
    return resp;
  });
}

// ------------------------------------------------------------------
// Completion
// ------------------------------------------------------------------

CompleteUploadResponse UploadService::CompleteUpload(const CompleteUploadRequest& req) {
  return ObserveRpc("UploadService.CompleteUpload", req.context(), req.session_id(), [&] {
    upload::core::CompletionRequest request;
    request.session_id  = req.session_id();
    request.file_name   = req.file_name();
    request.title       = req.title();
    request.category_id = req.category_id();
    for (const auto& field : req.metadata()) {
      request.metadata.emplace_back(field.key(), field.value());
    }

    auto result = ctx_.completion->Complete(FromProto(req.context()), request);

    CompleteUploadResponse resp;
    ToProto(result.asset, resp.mutable_asset());
    resp.set_mode(static_cast<UploadMode>(result.mode));
    for (const auto& key : result.accepted_metadata_keys) {
      resp.add_accepted_metadata_keys(key);
    }
    for (const auto& key : result.rejected_metadata_keys) {
      resp.add_rejected_metadata_keys(key);
    }
    return resp;
  });
}

// ------------------------------------------------------------------
// Inspection / support
// ------------------------------------------------------------------

GetSessionResponse UploadService::GetSession(const GetSessionRequest& req) {
  return ObserveRpc("UploadService.GetSession", req.context(), req.session_id(), [&] {
    GetSessionResponse resp;
    ToProto(ctx_.lifecycle->GetSession(FromProto(req.context()), req.session_id()), resp.mutable_session());
    return resp;
  });
}

GetResumeInfoResponse UploadService::GetResumeInfo(const GetResumeInfoRequest& req) {
  return ObserveRpc("UploadService.GetResumeInfo", req.context(), req.session_id(), [&] {
    auto info = ctx_.lifecycle->GetResumeInfo(FromProto(req.context()), req.session_id());

    GetResumeInfoResponse resp;
    ToProto(info.session, resp.mutable_session());
    resp.set_can_resume(info.can_resume);
    resp.set_blocked_reason(info.blocked_reason);
    for (const auto& part : info.uploaded_parts) {
      auto* out = resp.add_uploaded_parts();
      out->set_part_number(part.part_number);
      out->set_etag(part.etag);
      out->set_size_bytes(part.size_bytes);
    }
    return resp;
  });
}

EscalateResponse UploadService::Escalate(const EscalateRequest& req) {
  return ObserveRpc("UploadService.Escalate", req.context(), req.session_id(), [&] {
    auto result = ctx_.lifecycle->Escalate(FromProto(req.context()), req.session_id(), req.summary());

    EscalateResponse resp;
    resp.set_ticket_id(result.ticket_id);
    resp.set_newly_attached(result.newly_attached);
    return resp;
  });
}

ReapExpiredResponse UploadService::ReapExpired(const ReapExpiredRequest& req) {
  return ObserveRpc("UploadService.ReapExpired", RequestContext::default_instance(), {}, [&] {
    auto ids = ctx_.lifecycle->ReapExpired(req.limit());

    ReapExpiredResponse resp;
    resp.set_expired(static_cast<uint32_t>(ids.size()));
    for (const auto& id : ids) {
      resp.add_session_ids(id);
    }
    return resp;
  });
}

} // namespace upload::service
