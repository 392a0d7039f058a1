#pragma once

#include <aws/core/Aws.h>
#include <aws/s3/S3Client.h>

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/objectstore/object_store.hpp"

namespace upload::objectstore {

/*
  S3 / MinIO object store backed by aws-sdk-cpp.

  Credentials come from the SDK default provider chain (env, profile,
  instance metadata). Presigned URLs are signed locally; no request is
  made to the store.

  Error mapping:
    NoSuchUpload              → TransferNotFound
    retryable / transport     → util::RemoteUnavailable
    anything else             → RequestRejected
*/

class S3ObjectStore final : public ObjectStore {
 public:
  explicit S3ObjectStore(const upload::runtime::config::S3Config& config);
  ~S3ObjectStore() override;

  S3ObjectStore(const S3ObjectStore&)            = delete;
  S3ObjectStore& operator=(const S3ObjectStore&) = delete;

  ObjectStat ExistsAndStat(const std::string& bucket, const std::string& key) override;
  void       DeleteObject(const std::string& bucket, const std::string& key) override;

  PresignedUrl PresignPut(const std::string& bucket, const std::string& key, const std::string& content_type,
                          std::chrono::milliseconds ttl) override;
  PresignedUrl PresignUploadPart(const std::string& bucket, const std::string& key, const std::string& transfer_id,
                                 std::uint32_t part_number, std::chrono::milliseconds ttl) override;

  std::string           InitiateMultipart(const std::string& bucket, const std::string& key, const std::string& content_type) override;
  std::vector<PartInfo> ListParts(const std::string& bucket, const std::string& key, const std::string& transfer_id) override;
  void CompleteMultipart(const std::string& bucket, const std::string& key, const std::string& transfer_id,
                         const std::vector<PartInfo>& parts) override;
  void AbortMultipart(const std::string& bucket, const std::string& key, const std::string& transfer_id) override;

 private:
  Aws::SDKOptions                    sdk_options_;
  std::unique_ptr<Aws::S3::S3Client> client_;
};

} // namespace upload::objectstore
