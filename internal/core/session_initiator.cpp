#include "session_initiator.hpp"

#include <algorithm>
#include <atomic>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/uuid.hpp"

namespace upload::core {

using upload::model::SessionStatus;
using upload::model::TransferType;
using upload::observability::IntField;
using upload::observability::SizeField;
using upload::observability::StringField;
using upload::observability::UrlField;

namespace {

constexpr std::string_view kBucketUnavailable = "Storage bucket unavailable.";

std::string ErrorCodeOf(const std::exception& e) {
  if (dynamic_cast<const util::PlanLimitExceeded*>(&e)) return "plan_limit_exceeded";
  if (dynamic_cast<const util::InvalidArgument*>(&e)) return "invalid_argument";
  if (dynamic_cast<const util::NotFound*>(&e)) return "not_found";
  if (dynamic_cast<const util::RemoteUnavailable*>(&e)) return "remote_unavailable";
  if (dynamic_cast<const util::BucketNotReady*>(&e)) return "bucket_not_ready";
  return "internal";
}

[[noreturn]] void RejectFile(const std::string& message) {
  upload::observability::Metrics::Instance().RecordInitiationRejected("invalid");
  throw util::InvalidArgument(message);
}

void ValidateFile(const FileRequest& file) {
  if (file.file_name.empty()) {
    RejectFile("file name is required");
  }
  if (file.size_bytes == 0) {
    RejectFile("file size must be positive");
  }
}

std::string ResolveBucketOrThrow(collaborators::BucketResolver& buckets, const std::string& tenant_id) {
  try {
    return buckets.ResolveBucket(tenant_id);
  } catch (const util::BucketNotReady&) {
    upload::observability::Metrics::Instance().RecordInitiationRejected("bucket_not_ready");
    throw;
  }
}

} // namespace

SessionInitiator::SessionInitiator(std::shared_ptr<db::Repository> repository, std::shared_ptr<objectstore::ObjectStore> store,
                                   std::shared_ptr<collaborators::PlanLimitGate> plans,
                                   std::shared_ptr<collaborators::BucketResolver> buckets, UploadOptions options)
    : repository_(std::move(repository)),
      store_(std::move(store)),
      plans_(std::move(plans)),
      buckets_(std::move(buckets)),
      options_(std::move(options)),
      guard_(repository_, options_.now) {
}

TransferType SessionInitiator::TransferTypeFor(std::uint64_t size_bytes, std::uint64_t threshold_bytes) {
  return size_bytes > threshold_bytes ? TransferType::kChunked : TransferType::kDirect;
}

std::uint32_t SessionInitiator::TotalParts(std::uint64_t size_bytes, std::uint64_t part_size_bytes) {
  if (part_size_bytes == 0) return 0;
  return static_cast<std::uint32_t>((size_bytes + part_size_bytes - 1) / part_size_bytes);
}

void SessionInitiator::CheckPlan(const RequestContext& ctx, const FileRequest& file) {
  auto decision = plans_->CheckUploadAllowed(ctx.tenant_id, file.size_bytes);
  if (!decision.allowed) {
    upload::observability::Metrics::Instance().RecordInitiationRejected("plan_limit");
    throw util::PlanLimitExceeded("upload of " + std::to_string(file.size_bytes) + " bytes exceeds the plan limit of " +
                                      std::to_string(decision.limit_bytes) + " bytes",
                                  decision.limit_bytes);
  }
}

// ------------------------------------------------------------------
// Single
// ------------------------------------------------------------------

InitiateResult SessionInitiator::Initiate(const RequestContext& ctx, const FileRequest& file, const std::string& target_asset_id) {
  if (target_asset_id.empty()) {
    RequireTenant(ctx);
  } else {
    RequireBrand(ctx);
  }
  ValidateFile(file);
  CheckPlan(ctx, file);

  const auto bucket = ResolveBucketOrThrow(*buckets_, ctx.tenant_id);
  return InitiateWithBucket(ctx, file, bucket, target_asset_id, {});
}

InitiateResult SessionInitiator::InitiateWithBucket(const RequestContext& ctx, const FileRequest& file, const std::string& bucket,
                                                    const std::string& target_asset_id, const std::string& batch_reference) {
  const auto now        = options_.now();
  const auto now_ms     = util::ToUnixMillis(now);
  const auto expires_at = now + options_.session_ttl;

  db::model::UploadSessionRecord session;
  session.id                  = util::NewId();
  session.tenant_id           = ctx.tenant_id;
  session.brand_id            = ctx.brand_id;
  session.client_reference    = file.client_reference;
  session.batch_reference     = batch_reference;
  session.transfer_type       = TransferTypeFor(file.size_bytes, options_.multipart_threshold_bytes);
  session.expected_size_bytes = file.size_bytes;
  session.mode                = target_asset_id.empty() ? model::UploadMode::kCreate : model::UploadMode::kReplace;
  session.target_asset_id     = target_asset_id;
  session.status              = SessionStatus::kInitiating;
  session.expires_at_ms       = util::ToUnixMillis(expires_at);
  session.last_activity_at_ms = now_ms;
  session.bucket              = bucket;
  session.object_key          = ObjectKeyFor(session.id);
  session.file_name           = file.file_name;
  session.mime_type           = file.mime_type;
  session.created_at_ms       = now_ms;
  session.updated_at_ms       = now_ms;

  const bool chunked = session.transfer_type == TransferType::kChunked;
  if (chunked) {
    session.part_size_bytes = options_.chunk_size_bytes;
  }

  // remote calls first so a failed call leaves no row behind
  std::optional<objectstore::PresignedUrl> grant;
  if (!chunked) {
    const auto ttl = options_.presign_ttl.count() > 0 ? options_.presign_ttl : options_.session_ttl;
    grant          = store_->PresignPut(bucket, session.object_key, file.mime_type, ttl);
    UPLOAD_LOG_DEBUG("direct upload grant issued", {StringField("session_id", session.id), UrlField("url", grant->url)});
  }
  if (chunked && options_.initiate_multipart_eagerly) {
    session.multipart_upload_id = store_->InitiateMultipart(bucket, session.object_key, file.mime_type);
    session.total_parts         = TotalParts(file.size_bytes, session.part_size_bytes);
  }

  try {
    auto tx = repository_->Begin();
    if (session.mode == model::UploadMode::kReplace) {
      auto target = repository_->GetAsset(*tx, target_asset_id);
      if (!target || target->tenant_id != ctx.tenant_id || target->deleted_at_ms != 0) {
        throw util::NotFound("asset not found: " + target_asset_id);
      }
    }
    ThrowIfDbError(repository_->InsertSession(*tx, session), "insert upload session");
    tx->Commit();
  } catch (const std::exception&) {
    if (!session.multipart_upload_id.empty()) {
      try {
        store_->AbortMultipart(bucket, session.object_key, session.multipart_upload_id);
      } catch (const std::exception& abort_error) {
        UPLOAD_LOG_WARN("orphaned multipart upload", {StringField("transfer_id", session.multipart_upload_id),
                                                      StringField("error", abort_error.what())});
      }
    }
    throw;
  }

  InitiateResult result;
  result.session_id          = session.id;
  result.client_reference    = session.client_reference;
  result.batch_reference     = session.batch_reference;
  result.status              = session.status;
  result.transfer_type       = session.transfer_type;
  result.multipart_upload_id = session.multipart_upload_id;
  result.chunk_size_bytes    = session.part_size_bytes;
  result.expires_at          = expires_at;
  result.object_key          = session.object_key;
  result.grant               = std::move(grant);

  UPLOAD_LOG_INFO("upload session initiated",
                  {StringField("session_id", session.id), StringField("tenant_id", session.tenant_id),
                   StringField("transfer_type", model::ToString(session.transfer_type)), StringField("mode", model::ToString(session.mode)),
                   SizeField("size_bytes", session.expected_size_bytes)});
  upload::observability::Metrics::Instance().RecordInitiation(model::ToString(session.transfer_type));
  return result;
}

// ------------------------------------------------------------------
// Batch
// ------------------------------------------------------------------

std::vector<BatchItemResult> SessionInitiator::InitiateBatch(const RequestContext& ctx, const std::vector<FileRequest>& files,
                                                             const std::string& batch_reference) {
  RequireTenant(ctx);
  if (files.empty()) {
    throw util::InvalidArgument("batch must contain at least one file");
  }
  if (files.size() > options_.max_batch_size) {
    throw util::InvalidArgument("batch of " + std::to_string(files.size()) + " files exceeds the limit of " +
                                std::to_string(options_.max_batch_size));
  }

  std::vector<BatchItemResult> results(files.size());
  for (std::size_t i = 0; i < files.size(); ++i) {
    results[i].client_reference = files[i].client_reference;
  }

  std::string bucket;
  try {
    bucket = ResolveBucketOrThrow(*buckets_, ctx.tenant_id);
  } catch (const util::BucketNotReady&) {
    throw;
  } catch (const std::exception& e) {
    UPLOAD_LOG_ERROR("batch bucket resolution failed", {StringField("tenant_id", ctx.tenant_id), StringField("error", e.what())});
    for (auto& item : results) {
      item.error_code    = "bucket_unavailable";
      item.error_message = std::string(kBucketUnavailable);
    }
    return results;
  }

  auto run_item = [&](std::size_t index) {
    auto& item = results[index];
    try {
      ValidateFile(files[index]);
      CheckPlan(ctx, files[index]);
      item.result = InitiateWithBucket(ctx, files[index], bucket, {}, batch_reference);
    } catch (const std::exception& e) {
      item.error_code    = ErrorCodeOf(e);
      item.error_message = e.what();
      UPLOAD_LOG_WARN("batch item rejected", {StringField("tenant_id", ctx.tenant_id), StringField("batch_reference", batch_reference),
                                              IntField("index", static_cast<std::int64_t>(index)), StringField("error", e.what())});
    }
  };

  const auto workers = std::min<std::size_t>(std::max<std::uint32_t>(options_.batch_parallelism, 1), files.size());
  if (workers == 1) {
    for (std::size_t i = 0; i < files.size(); ++i) run_item(i);
    return results;
  }

  std::atomic<std::size_t> next{0};
  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t w = 0; w < workers; ++w) {
    threads.emplace_back([&] {
      for (auto i = next.fetch_add(1); i < files.size(); i = next.fetch_add(1)) {
        run_item(i);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  return results;
}

// ------------------------------------------------------------------
// Multipart
// ------------------------------------------------------------------

MultipartInitResult SessionInitiator::InitiateMultipart(const RequestContext& ctx, const std::string& session_id) {
  auto tx      = repository_->Begin();
  auto session = guard_.LoadForUpdate(*tx, session_id, ctx);

  if (session.transfer_type != TransferType::kChunked) {
    throw util::InvalidArgument("upload session " + session_id + " is not a chunked upload");
  }

  MultipartInitResult result;
  result.part_size_bytes = session.part_size_bytes;
  if (!session.multipart_upload_id.empty()) {
    result.multipart_upload_id = session.multipart_upload_id;
    result.total_parts         = session.total_parts;
    result.already_initiated   = true;
    return result;
  }

  guard_.RequireLive(*tx, session, "initiate multipart upload");

  if (session.part_size_bytes == 0) {
    session.part_size_bytes = options_.chunk_size_bytes;
  }
  session.multipart_upload_id = store_->InitiateMultipart(session.bucket, session.object_key, session.mime_type);
  session.total_parts         = TotalParts(session.expected_size_bytes, session.part_size_bytes);
  guard_.Touch(*tx, session);
  tx->Commit();

  result.multipart_upload_id = session.multipart_upload_id;
  result.part_size_bytes     = session.part_size_bytes;
  result.total_parts         = session.total_parts;
  return result;
}

objectstore::PresignedUrl SessionInitiator::SignPartUrl(const RequestContext& ctx, const std::string& session_id, std::uint32_t part_number) {
  auto tx      = repository_->Begin();
  auto session = guard_.LoadForUpdate(*tx, session_id, ctx);
  guard_.RequireLive(*tx, session, "sign part url");

  if (session.multipart_upload_id.empty()) {
    throw util::InvalidArgument("multipart upload has not been initiated for session " + session_id);
  }
  if (part_number < 1 || part_number > session.total_parts) {
    throw util::InvalidArgument("part number " + std::to_string(part_number) + " outside 1.." + std::to_string(session.total_parts));
  }

  guard_.Touch(*tx, session);
  tx->Commit();

  auto grant = store_->PresignUploadPart(session.bucket, session.object_key, session.multipart_upload_id, part_number,
                                         options_.part_presign_ttl);
  UPLOAD_LOG_DEBUG("part upload grant issued", {StringField("session_id", session.id), IntField("part_number", part_number),
                                                UrlField("url", grant.url)});
  return grant;
}

} // namespace upload::core
