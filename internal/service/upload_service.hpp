#pragma once

#include "api/upload/manager/v1.hpp"
#include "service_context.hpp"

namespace upload::service {

/*
  Protobuf facing upload API. Translates messages to core calls; errors
  propagate as the util exception types.
*/
class UploadService {
 public:
  explicit UploadService(ServiceContext ctx);

  upload::manager::v1::InitiateUploadResponse InitiateUpload(const upload::manager::v1::InitiateUploadRequest& req);
  upload::manager::v1::InitiateBatchResponse  InitiateBatch(const upload::manager::v1::InitiateBatchRequest& req);

  upload::manager::v1::InitiateMultipartResponse InitiateMultipart(const upload::manager::v1::InitiateMultipartRequest& req);
  upload::manager::v1::SignPartUrlResponse       SignPartUrl(const upload::manager::v1::SignPartUrlRequest& req);
  upload::manager::v1::AbortMultipartResponse    AbortMultipart(const upload::manager::v1::AbortMultipartRequest& req);

  upload::manager::v1::MarkUploadingResponse MarkUploading(const upload::manager::v1::MarkUploadingRequest& req);
  upload::manager::v1::TouchActivityResponse TouchActivity(const upload::manager::v1::TouchActivityRequest& req);
  upload::manager::v1::CancelUploadResponse  CancelUpload(const upload::manager::v1::CancelUploadRequest& req);

  upload::manager::v1::CompleteUploadResponse CompleteUpload(const upload::manager::v1::CompleteUploadRequest& req);

  upload::manager::v1::GetSessionResponse    GetSession(const upload::manager::v1::GetSessionRequest& req);
  upload::manager::v1::GetResumeInfoResponse GetResumeInfo(const upload::manager::v1::GetResumeInfoRequest& req);
  upload::manager::v1::EscalateResponse      Escalate(const upload::manager::v1::EscalateRequest& req);
  upload::manager::v1::ReapExpiredResponse   ReapExpired(const upload::manager::v1::ReapExpiredRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace upload::service
