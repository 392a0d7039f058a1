#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "api/upload/manager/v1.hpp"

using namespace upload::manager::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  uploadctl <addr> initiate <file_name> <size_bytes> [mime_type]\n"
            << "  uploadctl <addr> replace <asset_id> <file_name> <size_bytes> [mime_type]\n"
            << "  uploadctl <addr> multipart <session_id>\n"
            << "  uploadctl <addr> sign-part <session_id> <part_number>\n"
            << "  uploadctl <addr> abort-multipart <session_id>\n"
            << "  uploadctl <addr> mark-uploading <session_id>\n"
            << "  uploadctl <addr> touch <session_id>\n"
            << "  uploadctl <addr> cancel <session_id>\n"
            << "  uploadctl <addr> complete <session_id> [title] [category_id]\n"
            << "  uploadctl <addr> get <session_id>\n"
            << "  uploadctl <addr> resume <session_id>\n"
            << "  uploadctl <addr> escalate <session_id> <summary>\n"
            << "  uploadctl <addr> reap-expired [limit]\n"
            << "\n"
            << "Caller identity is read from UPLOAD_TENANT, UPLOAD_BRAND and UPLOAD_USER.\n";
}

static std::string EnvOr(const char* name, const std::string& fallback) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : fallback;
}

static RequestContext MakeContext() {
  RequestContext ctx;
  ctx.set_tenant_id(EnvOr("UPLOAD_TENANT", ""));
  ctx.set_brand_id(EnvOr("UPLOAD_BRAND", ""));
  ctx.set_user_id(EnvOr("UPLOAD_USER", ""));
  return ctx;
}

static const char* StatusName(SessionStatus status) {
  switch (status) {
    case SESSION_STATUS_INITIATING:
      return "initiating";
    case SESSION_STATUS_UPLOADING:
      return "uploading";
    case SESSION_STATUS_COMPLETED:
      return "completed";
    case SESSION_STATUS_CANCELLED:
      return "cancelled";
    case SESSION_STATUS_FAILED:
      return "failed";
    case SESSION_STATUS_EXPIRED:
      return "expired";
    default:
      return "unspecified";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_code() << ": " << status.error_message() << "\n";
  return 2;
}

static void PrintInitiate(const InitiateUploadResponse& resp) {
  std::cout << "session_id=" << resp.session_id() << "\n"
            << "status=" << StatusName(resp.status()) << "\n"
            << "transfer=" << (resp.transfer_type() == TRANSFER_TYPE_CHUNKED ? "chunked" : "direct") << "\n"
            << "object_key=" << resp.object_key() << "\n";
  if (resp.has_grant()) {
    std::cout << "url=" << resp.grant().url() << "\n";
  }
  if (!resp.multipart_upload_id().empty()) {
    std::cout << "multipart_upload_id=" << resp.multipart_upload_id() << "\n";
  }
}

static void PrintSession(const UploadSession& session) {
  std::cout << "session_id=" << session.session_id() << "\n"
            << "status=" << StatusName(session.status()) << "\n"
            << "expected_size_bytes=" << session.expected_size_bytes() << "\n"
            << "uploaded_size_bytes=" << session.uploaded_size_bytes() << "\n";
  if (!session.failure_reason().empty()) {
    std::cout << "failure_reason=" << session.failure_reason() << " (" << session.failure_count() << ")\n";
  }
  if (!session.escalation_ticket_id().empty()) {
    std::cout << "ticket=" << session.escalation_ticket_id() << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = UploadService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "initiate" || cmd == "replace") {
    const int base = cmd == "replace" ? 4 : 3;
    if (argc < base + 2) {
      Usage();
      return 1;
    }

    InitiateUploadRequest req;
    *req.mutable_context() = MakeContext();
    if (cmd == "replace") req.set_target_asset_id(argv[3]);
    req.mutable_file()->set_file_name(argv[base]);
    req.mutable_file()->set_size_bytes(std::stoull(argv[base + 1]));
    if (argc > base + 2) req.mutable_file()->set_mime_type(argv[base + 2]);

    InitiateUploadResponse resp;
    auto                   status = stub->InitiateUpload(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintInitiate(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reap-expired") {
    ReapExpiredRequest req;
    if (argc >= 4) req.set_limit(static_cast<uint32_t>(std::stoul(argv[3])));

    ReapExpiredResponse resp;
    auto                status = stub->ReapExpired(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "expired=" << resp.expired() << "\n";
    for (const auto& id : resp.session_ids()) std::cout << "  " << id << "\n";
    return 0;
  }

  // Every remaining command addresses one session.
  if (argc < 4) {
    Usage();
    return 1;
  }
  const std::string session_id = argv[3];

  // ------------------------------------------------------------

  if (cmd == "multipart") {
    InitiateMultipartRequest req;
    *req.mutable_context() = MakeContext();
    req.set_session_id(session_id);

    InitiateMultipartResponse resp;
    auto                      status = stub->InitiateMultipart(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "multipart_upload_id=" << resp.multipart_upload_id() << "\n"
              << "part_size_bytes=" << resp.part_size_bytes() << "\n"
              << "total_parts=" << resp.total_parts() << "\n"
              << "already_initiated=" << (resp.already_initiated() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sign-part") {
    if (argc < 5) return 1;

    SignPartUrlRequest req;
    *req.mutable_context() = MakeContext();
    req.set_session_id(session_id);
    req.set_part_number(static_cast<uint32_t>(std::stoul(argv[4])));

    SignPartUrlResponse resp;
    auto                status = stub->SignPartUrl(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.grant().method() << " " << resp.grant().url() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "abort-multipart") {
    AbortMultipartRequest req;
    *req.mutable_context() = MakeContext();
    req.set_session_id(session_id);

    AbortMultipartResponse resp;
    auto                   status = stub->AbortMultipart(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.already_aborted() ? "already aborted" : "aborted") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "mark-uploading") {
    MarkUploadingRequest req;
    *req.mutable_context() = MakeContext();
    req.set_session_id(session_id);

    MarkUploadingResponse resp;
    auto                  status = stub->MarkUploading(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "status=" << StatusName(resp.status()) << " transitioned=" << (resp.transitioned() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "touch") {
    TouchActivityRequest req;
    *req.mutable_context() = MakeContext();
    req.set_session_id(session_id);

    TouchActivityResponse resp;
    auto                  status = stub->TouchActivity(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.touched() ? "touched" : "not touched") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    CancelUploadRequest req;
    *req.mutable_context() = MakeContext();
    req.set_session_id(session_id);

    CancelUploadResponse resp;
    auto                 status = stub->CancelUpload(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "status=" << StatusName(resp.status()) << " cancelled=" << (resp.cancelled() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "complete") {
    CompleteUploadRequest req;
    *req.mutable_context() = MakeContext();
    req.set_session_id(session_id);
    if (argc >= 5) req.set_title(argv[4]);
    if (argc >= 6) req.set_category_id(argv[5]);

    CompleteUploadResponse resp;
    auto                   status = stub->CompleteUpload(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "asset_id=" << resp.asset().asset_id() << "\n"
              << "title=" << resp.asset().title() << "\n"
              << "size_bytes=" << resp.asset().size_bytes() << "\n"
              << "mode=" << (resp.mode() == UPLOAD_MODE_REPLACE ? "replace" : "create") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    GetSessionRequest req;
    *req.mutable_context() = MakeContext();
    req.set_session_id(session_id);

    GetSessionResponse resp;
    auto               status = stub->GetSession(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintSession(resp.session());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "resume") {
    GetResumeInfoRequest req;
    *req.mutable_context() = MakeContext();
    req.set_session_id(session_id);

    GetResumeInfoResponse resp;
    auto                  status = stub->GetResumeInfo(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintSession(resp.session());
    std::cout << "can_resume=" << (resp.can_resume() ? "true" : "false") << "\n";
    if (!resp.blocked_reason().empty()) std::cout << "blocked_reason=" << resp.blocked_reason() << "\n";
    for (const auto& part : resp.uploaded_parts()) {
      std::cout << "  part " << part.part_number() << " etag=" << part.etag() << " size=" << part.size_bytes() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "escalate") {
    if (argc < 5) return 1;

    EscalateRequest req;
    *req.mutable_context() = MakeContext();
    req.set_session_id(session_id);
    req.set_summary(argv[4]);

    EscalateResponse resp;
    auto             status = stub->Escalate(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "ticket=" << resp.ticket_id() << (resp.newly_attached() ? " (new)" : "") << "\n";
    return 0;
  }

  Usage();
  return 1;
}
