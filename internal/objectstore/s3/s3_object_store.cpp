#include "s3_object_store.hpp"

#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/http/HttpTypes.h>
#include <aws/core/http/ServiceSpecificParameters.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/DeleteObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListPartsRequest.h>

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace upload::objectstore {

using Aws::S3::S3Errors;

namespace {

constexpr std::uint64_t kMaxPresignSeconds = 7 * 24 * 3600;

std::uint64_t PresignSeconds(std::chrono::milliseconds ttl) {
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(ttl).count();
  return std::clamp<std::uint64_t>(seconds > 0 ? static_cast<std::uint64_t>(seconds) : 1, 1, kMaxPresignSeconds);
}

template <typename Outcome>
[[noreturn]] void ThrowOutcome(const Outcome& outcome, const std::string& op, const std::string& bucket, const std::string& key) {
  const auto& error   = outcome.GetError();
  const auto  message = op + " " + bucket + "/" + key + ": " + std::string(error.GetExceptionName()) + " " + std::string(error.GetMessage());

  if (error.GetErrorType() == S3Errors::NO_SUCH_UPLOAD) {
    throw TransferNotFound(message);
  }
  if (error.ShouldRetry() || error.GetErrorType() == S3Errors::NETWORK_CONNECTION ||
      error.GetResponseCode() == Aws::Http::HttpResponseCode::REQUEST_NOT_MADE) {
    throw util::RemoteUnavailable(message);
  }
  throw RequestRejected(message);
}

} // namespace

S3ObjectStore::S3ObjectStore(const upload::runtime::config::S3Config& config) {
  Aws::InitAPI(sdk_options_);

  Aws::Client::ClientConfiguration client_config;
  if (!config.region().empty()) {
    client_config.region = config.region();
  }
  if (!config.endpoint().empty()) {
    client_config.endpointOverride = config.endpoint();
  }
  client_config.connectTimeoutMs = config.connect_timeout_ms() > 0 ? config.connect_timeout_ms() : 3000;
  client_config.requestTimeoutMs = config.request_timeout_ms() > 0 ? config.request_timeout_ms() : 10000;

  client_ = std::make_unique<Aws::S3::S3Client>(client_config, Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
                                                /*useVirtualAddressing=*/!config.path_style());

  UPLOAD_LOG_INFO("s3 object store ready", {upload::observability::StringField("region", client_config.region),
                                            upload::observability::StringField("endpoint", config.endpoint()),
                                            upload::observability::BoolField("path_style", config.path_style())});
}

S3ObjectStore::~S3ObjectStore() {
  client_.reset();
  Aws::ShutdownAPI(sdk_options_);
}

// ------------------------------------------------------------------
// Objects
// ------------------------------------------------------------------

ObjectStat S3ObjectStore::ExistsAndStat(const std::string& bucket, const std::string& key) {
  Aws::S3::Model::HeadObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);

  auto       outcome = client_->HeadObject(request);
  ObjectStat stat;
  if (!outcome.IsSuccess()) {
    const auto& error = outcome.GetError();
    if (error.GetErrorType() == S3Errors::RESOURCE_NOT_FOUND || error.GetErrorType() == S3Errors::NO_SUCH_KEY ||
        error.GetResponseCode() == Aws::Http::HttpResponseCode::NOT_FOUND) {
      return stat;
    }
    ThrowOutcome(outcome, "HeadObject", bucket, key);
  }

  stat.exists       = true;
  stat.size_bytes   = static_cast<std::uint64_t>(outcome.GetResult().GetContentLength());
  stat.content_type = outcome.GetResult().GetContentType();
  return stat;
}

void S3ObjectStore::DeleteObject(const std::string& bucket, const std::string& key) {
  Aws::S3::Model::DeleteObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);

  auto outcome = client_->DeleteObject(request);
  if (!outcome.IsSuccess()) {
    ThrowOutcome(outcome, "DeleteObject", bucket, key);
  }
}

// ------------------------------------------------------------------
// Presigned grants
// ------------------------------------------------------------------

PresignedUrl S3ObjectStore::PresignPut(const std::string& bucket, const std::string& key, const std::string& content_type,
                                       std::chrono::milliseconds ttl) {
  Aws::Http::HeaderValueCollection headers;
  if (!content_type.empty()) {
    headers.emplace("content-type", content_type);
  }

  const auto   seconds = PresignSeconds(ttl);
  PresignedUrl grant;
  grant.url        = client_->GeneratePresignedUrl(bucket, key, Aws::Http::HttpMethod::HTTP_PUT, headers, seconds);
  grant.expires_at = util::Now() + std::chrono::seconds(seconds);
  if (!content_type.empty()) {
    grant.headers["Content-Type"] = content_type;
  }
  if (grant.url.empty()) {
    throw RequestRejected("presign failed for " + bucket + "/" + key);
  }
  return grant;
}

PresignedUrl S3ObjectStore::PresignUploadPart(const std::string& bucket, const std::string& key, const std::string& transfer_id,
                                              std::uint32_t part_number, std::chrono::milliseconds ttl) {
  auto params                         = std::make_shared<Aws::Http::ServiceSpecificParameters>();
  params->parameterMap["partNumber"] = std::to_string(part_number);
  params->parameterMap["uploadId"]   = transfer_id;

  const auto   seconds = PresignSeconds(ttl);
  PresignedUrl grant;
  grant.url        = client_->GeneratePresignedUrl(bucket, key, Aws::Http::HttpMethod::HTTP_PUT, {}, seconds, params);
  grant.expires_at = util::Now() + std::chrono::seconds(seconds);
  if (grant.url.empty()) {
    throw RequestRejected("presign part failed for " + bucket + "/" + key);
  }
  return grant;
}

// ------------------------------------------------------------------
// Multipart
// ------------------------------------------------------------------

std::string S3ObjectStore::InitiateMultipart(const std::string& bucket, const std::string& key, const std::string& content_type) {
  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  if (!content_type.empty()) {
    request.SetContentType(content_type);
  }

  auto outcome = client_->CreateMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    ThrowOutcome(outcome, "CreateMultipartUpload", bucket, key);
  }
  return outcome.GetResult().GetUploadId();
}

std::vector<PartInfo> S3ObjectStore::ListParts(const std::string& bucket, const std::string& key, const std::string& transfer_id) {
  std::vector<PartInfo> out;

  Aws::S3::Model::ListPartsRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetUploadId(transfer_id);

  while (true) {
    auto outcome = client_->ListParts(request);
    if (!outcome.IsSuccess()) {
      ThrowOutcome(outcome, "ListParts", bucket, key);
    }

    const auto& result = outcome.GetResult();
    for (const auto& part : result.GetParts()) {
      out.push_back(PartInfo{static_cast<std::uint32_t>(part.GetPartNumber()), part.GetETag(), static_cast<std::uint64_t>(part.GetSize())});
    }
    if (!result.GetIsTruncated()) {
      break;
    }
    request.SetPartNumberMarker(result.GetNextPartNumberMarker());
  }
  return out;
}

void S3ObjectStore::CompleteMultipart(const std::string& bucket, const std::string& key, const std::string& transfer_id,
                                      const std::vector<PartInfo>& parts) {
  Aws::S3::Model::CompletedMultipartUpload upload;
  for (const auto& part : parts) {
    upload.AddParts(Aws::S3::Model::CompletedPart().WithPartNumber(static_cast<int>(part.part_number)).WithETag(part.etag));
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetUploadId(transfer_id);
  request.SetMultipartUpload(upload);

  auto outcome = client_->CompleteMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    ThrowOutcome(outcome, "CompleteMultipartUpload", bucket, key);
  }
}

void S3ObjectStore::AbortMultipart(const std::string& bucket, const std::string& key, const std::string& transfer_id) {
  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);
  request.SetUploadId(transfer_id);

  auto outcome = client_->AbortMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    ThrowOutcome(outcome, "AbortMultipartUpload", bucket, key);
  }
}

} // namespace upload::objectstore
