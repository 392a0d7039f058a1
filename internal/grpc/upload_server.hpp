#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "api/upload/manager/v1.hpp"
#include "internal/service/upload_service.hpp"

namespace upload::grpc {

class UploadServer final : public upload::manager::v1::UploadService::Service {
 public:
  explicit UploadServer(std::shared_ptr<upload::service::UploadService> svc);

  ::grpc::Status InitiateUpload(::grpc::ServerContext*, const upload::manager::v1::InitiateUploadRequest*,
                         upload::manager::v1::InitiateUploadResponse*) override;
  ::grpc::Status InitiateBatch(::grpc::ServerContext*, const upload::manager::v1::InitiateBatchRequest*,
                         upload::manager::v1::InitiateBatchResponse*) override;
  ::grpc::Status InitiateMultipart(::grpc::ServerContext*, const upload::manager::v1::InitiateMultipartRequest*,
                         upload::manager::v1::InitiateMultipartResponse*) override;
  ::grpc::Status SignPartUrl(::grpc::ServerContext*, const upload::manager::v1::SignPartUrlRequest*,
                         upload::manager::v1::SignPartUrlResponse*) override;
  ::grpc::Status AbortMultipart(::grpc::ServerContext*, const upload::manager::v1::AbortMultipartRequest*,
                         upload::manager::v1::AbortMultipartResponse*) override;
  ::grpc::Status MarkUploading(::grpc::ServerContext*, const upload::manager::v1::MarkUploadingRequest*,
                         upload::manager::v1::MarkUploadingResponse*) override;
  ::grpc::Status TouchActivity(::grpc::ServerContext*, const upload::manager::v1::TouchActivityRequest*,
                         upload::manager::v1::TouchActivityResponse*) override;
  ::grpc::Status CancelUpload(::grpc::ServerContext*, const upload::manager::v1::CancelUploadRequest*,
                         upload::manager::v1::CancelUploadResponse*) override;
  ::grpc::Status CompleteUpload(::grpc::ServerContext*, const upload::manager::v1::CompleteUploadRequest*,
                         upload::manager::v1::CompleteUploadResponse*) override;
  ::grpc::Status GetSession(::grpc::ServerContext*, const upload::manager::v1::GetSessionRequest*,
                         upload::manager::v1::GetSessionResponse*) override;
  ::grpc::Status GetResumeInfo(::grpc::ServerContext*, const upload::manager::v1::GetResumeInfoRequest*,
                         upload::manager::v1::GetResumeInfoResponse*) override;
  ::grpc::Status Escalate(::grpc::ServerContext*, const upload::manager::v1::EscalateRequest*,
                         upload::manager::v1::EscalateResponse*) override;
  ::grpc::Status ReapExpired(::grpc::ServerContext*, const upload::manager::v1::ReapExpiredRequest*,
                         upload::manager::v1::ReapExpiredResponse*) override;

 private:
  std::shared_ptr<upload::service::UploadService> service_;
};

} // namespace upload::grpc
