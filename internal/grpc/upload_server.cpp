#include "upload_server.hpp"

#include "grpc_error.hpp"

namespace upload::grpc {

using namespace upload::manager::v1;

UploadServer::UploadServer(std::shared_ptr<upload::service::UploadService> svc) : service_(std::move(svc)) {
}

::grpc::Status UploadServer::InitiateUpload(::grpc::ServerContext*, const InitiateUploadRequest* req, InitiateUploadResponse* resp) {
  try {
    *resp = service_->InitiateUpload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::InitiateBatch(::grpc::ServerContext*, const InitiateBatchRequest* req, InitiateBatchResponse* resp) {
  try {
    *resp = service_->InitiateBatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::InitiateMultipart(::grpc::ServerContext*, const InitiateMultipartRequest* req, InitiateMultipartResponse* resp) {
  try {
    *resp = service_->InitiateMultipart(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::SignPartUrl(::grpc::ServerContext*, const SignPartUrlRequest* req, SignPartUrlResponse* resp) {
  try {
    *resp = service_->SignPartUrl(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::AbortMultipart(::grpc::ServerContext*, const AbortMultipartRequest* req, AbortMultipartResponse* resp) {
  try {
    *resp = service_->AbortMultipart(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::MarkUploading(::grpc::ServerContext*, const MarkUploadingRequest* req, MarkUploadingResponse* resp) {
  try {
    *resp = service_->MarkUploading(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::TouchActivity(::grpc::ServerContext*, const TouchActivityRequest* req, TouchActivityResponse* resp) {
  try {
    *resp = service_->TouchActivity(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::CancelUpload(::grpc::ServerContext*, const CancelUploadRequest* req, CancelUploadResponse* resp) {
  try {
    *resp = service_->CancelUpload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::CompleteUpload(::grpc::ServerContext*, const CompleteUploadRequest* req, CompleteUploadResponse* resp) {
  try {
    *resp = service_->CompleteUpload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::GetSession(::grpc::ServerContext*, const GetSessionRequest* req, GetSessionResponse* resp) {
  try {
    *resp = service_->GetSession(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::GetResumeInfo(::grpc::ServerContext*, const GetResumeInfoRequest* req, GetResumeInfoResponse* resp) {
  try {
    *resp = service_->GetResumeInfo(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::Escalate(::grpc::ServerContext*, const EscalateRequest* req, EscalateResponse* resp) {
  try {
    *resp = service_->Escalate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status UploadServer::ReapExpired(::grpc::ServerContext*, const ReapExpiredRequest* req, ReapExpiredResponse* resp) {
  try {
    *resp = service_->ReapExpired(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace upload::grpc
