#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/collaborators/bucket_resolver.hpp"
#include "internal/collaborators/plan_limit_gate.hpp"
#include "internal/core/session_guard.hpp"
#include "internal/core/upload_context.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/objectstore/object_store.hpp"

namespace upload::core {

struct FileRequest {
  std::string   file_name;
  std::uint64_t size_bytes = 0;
  std::string   mime_type;
  std::string   client_reference;
};

struct InitiateResult {
  std::string                              session_id;
  std::string                              client_reference;
  std::string                              batch_reference;
  model::SessionStatus                     status        = model::SessionStatus::kInitiating;
  model::TransferType                      transfer_type = model::TransferType::kDirect;
  std::optional<objectstore::PresignedUrl> grant;
  std::string                              multipart_upload_id;
  std::uint64_t                            chunk_size_bytes = 0;
  util::TimePoint                          expires_at{};
  std::string                              object_key;
};

struct BatchItemResult {
  std::optional<InitiateResult> result;
  std::string                   client_reference;
  std::string                   error_code;
  std::string                   error_message;
};

struct MultipartInitResult {
  std::string   multipart_upload_id;
  std::uint64_t part_size_bytes   = 0;
  std::uint32_t total_parts       = 0;
  bool          already_initiated = false;
};

/*
  Opens upload sessions and hands out transfer grants.

  Ordering of a single initiation:
    plan gate → bucket → transfer type → grant → persist

  Nothing is written when the plan gate or bucket resolution rejects.
*/
class SessionInitiator {
 public:
  SessionInitiator(std::shared_ptr<db::Repository> repository, std::shared_ptr<objectstore::ObjectStore> store,
                   std::shared_ptr<collaborators::PlanLimitGate> plans, std::shared_ptr<collaborators::BucketResolver> buckets,
                   UploadOptions options);

  // Non-empty target_asset_id opens a replace session for that asset.
  InitiateResult Initiate(const RequestContext& ctx, const FileRequest& file, const std::string& target_asset_id = {});

  /*
    Every file is initiated in isolation; a failure becomes that item's
    error. Results are returned in request order.

    Throws InvalidArgument for an empty or oversized batch and
    BucketNotReady when the tenant bucket is still provisioning.
  */
  std::vector<BatchItemResult> InitiateBatch(const RequestContext& ctx, const std::vector<FileRequest>& files,
                                             const std::string& batch_reference);

  // Deferred multipart initiation. Idempotent.
  MultipartInitResult InitiateMultipart(const RequestContext& ctx, const std::string& session_id);

  objectstore::PresignedUrl SignPartUrl(const RequestContext& ctx, const std::string& session_id, std::uint32_t part_number);

  static model::TransferType TransferTypeFor(std::uint64_t size_bytes, std::uint64_t threshold_bytes);
  static std::uint32_t       TotalParts(std::uint64_t size_bytes, std::uint64_t part_size_bytes);

 private:
  InitiateResult InitiateWithBucket(const RequestContext& ctx, const FileRequest& file, const std::string& bucket,
                                    const std::string& target_asset_id, const std::string& batch_reference);

  void CheckPlan(const RequestContext& ctx, const FileRequest& file);

  std::shared_ptr<db::Repository>                repository_;
  std::shared_ptr<objectstore::ObjectStore>      store_;
  std::shared_ptr<collaborators::PlanLimitGate>  plans_;
  std::shared_ptr<collaborators::BucketResolver> buckets_;
  UploadOptions                                  options_;
  SessionGuard                                   guard_;
};

} // namespace upload::core
