#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "api/upload/manager/v1.hpp"
#include "internal/core/multipart_assembler.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/upload_server.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/upload_service.hpp"
#include "internal/util/uuid.hpp"
#include "tests/unit/upload_test_support.hpp"

namespace {

using namespace upload::manager::v1;
using upload::testing::Harness;

std::unique_ptr<upload::grpc::UploadServer> BuildServer(Harness& h) {
  upload::service::ServiceContext ctx;
  ctx.initiator  = h.initiator;
  ctx.completion = h.completion;
  ctx.lifecycle  = h.lifecycle;
  return std::make_unique<upload::grpc::UploadServer>(std::make_shared<upload::service::UploadService>(ctx));
}

void SetContext(RequestContext* context, const std::string& tenant = "acme") {
  context->set_tenant_id(tenant);
  context->set_brand_id("brand-1");
  context->set_user_id("user-1");
}

void TestErrorMapping() {
  using upload::grpc::ToStatus;
  using namespace upload::util;

  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(PlanLimitExceeded("x", 10)).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(BucketNotReady("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(StateConflict("x", "completed", "cancelled")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(SizeMismatch("x", 10, 9)).error_code() == ::grpc::StatusCode::DATA_LOSS);
  assert(ToStatus(TransferAssemblyFailed("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(upload::core::TransferGone("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(MetadataPersistenceFailed("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(RemoteUnavailable("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(NotFound("upload session not found: abc"));
  assert(status.error_message() == "upload session not found: abc");
}

void TestGetSessionWithMalformedIdReturnsInvalidArgument() {
  Harness h;
  auto    server = BuildServer(h);

  GetSessionRequest req;
  SetContext(req.mutable_context());
  req.set_session_id("not a session id");
  GetSessionResponse    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server->GetSession(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestCompleteMissingSessionReturnsNotFound() {
  Harness h;
  auto    server = BuildServer(h);

  CompleteUploadRequest req;
  SetContext(req.mutable_context());
  req.set_session_id(upload::util::NewId());
  CompleteUploadResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = server->CompleteUpload(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestPlanLimitReturnsResourceExhausted() {
  Harness h;
  auto    server = BuildServer(h);

  InitiateUploadRequest req;
  SetContext(req.mutable_context(), "small");
  req.mutable_file()->set_file_name("big.jpg");
  req.mutable_file()->set_size_bytes(5000);
  req.mutable_file()->set_mime_type("image/jpeg");
  InitiateUploadResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = server->InitiateUpload(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
}

void TestCompleteAfterCancelReturnsFailedPrecondition() {
  Harness h;
  auto    server = BuildServer(h);

  InitiateUploadRequest init_req;
  SetContext(init_req.mutable_context());
  init_req.mutable_file()->set_file_name("photo.jpg");
  init_req.mutable_file()->set_size_bytes(10);
  init_req.mutable_file()->set_mime_type("image/jpeg");
  InitiateUploadResponse init_resp;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server->InitiateUpload(&grpc_ctx, &init_req, &init_resp).ok());
  }
  assert(init_resp.transfer_type() == TRANSFER_TYPE_DIRECT);
  assert(!init_resp.grant().url().empty());

  CancelUploadRequest cancel_req;
  SetContext(cancel_req.mutable_context());
  cancel_req.set_session_id(init_resp.session_id());
  CancelUploadResponse cancel_resp;
  {
    ::grpc::ServerContext grpc_ctx;
    assert(server->CancelUpload(&grpc_ctx, &cancel_req, &cancel_resp).ok());
  }
  assert(cancel_resp.cancelled());
  assert(cancel_resp.status() == SESSION_STATUS_CANCELLED);

  CompleteUploadRequest complete_req;
  SetContext(complete_req.mutable_context());
  complete_req.set_session_id(init_resp.session_id());
  CompleteUploadResponse complete_resp;
  ::grpc::ServerContext  grpc_ctx;

  const auto status = server->CompleteUpload(&grpc_ctx, &complete_req, &complete_resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestMissingTenantReturnsInvalidArgument() {
  Harness h;
  auto    server = BuildServer(h);

  CancelUploadRequest req;
  req.set_session_id(upload::util::NewId());
  CancelUploadResponse  resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server->CancelUpload(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

} // namespace

int main() {
  TestErrorMapping();
  TestGetSessionWithMalformedIdReturnsInvalidArgument();
  TestCompleteMissingSessionReturnsNotFound();
  TestPlanLimitReturnsResourceExhausted();
  TestCompleteAfterCancelReturnsFailedPrecondition();
  TestMissingTenantReturnsInvalidArgument();

  std::cout << "upload_manager_unit_grpc_status: pass\n";
  return 0;
}
