#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace upload::objectstore {

struct ObjectStat {
  bool          exists = false;
  std::uint64_t size_bytes = 0;
  std::string   content_type;
};

struct PresignedUrl {
  std::string                        url;
  std::string                        method = "PUT";
  std::map<std::string, std::string> headers;
  util::TimePoint                    expires_at{};
};

struct PartInfo {
  std::uint32_t part_number = 0;
  std::string   etag;
  std::uint64_t size_bytes = 0;
};

// The multipart transfer was already completed or aborted.
class TransferNotFound : public std::runtime_error {
 public:
  explicit TransferNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The store answered and refused the request (bad part list, access denied).
class RequestRejected : public std::runtime_error {
 public:
  explicit RequestRejected(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Object store gateway.

  All calls are synchronous with bounded timeouts. Transport failures and
  timeouts surface as util::RemoteUnavailable.

  Implementations:
    MEMORY → in-process objects, used by tests and local runs
    S3     → aws-sdk-cpp client (S3, MinIO)
*/
class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  // ------------------------------------------------------------------
  // Objects
  // ------------------------------------------------------------------

  virtual ObjectStat ExistsAndStat(const std::string& bucket, const std::string& key) = 0;

  // Best-effort: deleting a missing object is not an error.
  virtual void DeleteObject(const std::string& bucket, const std::string& key) = 0;

  // ------------------------------------------------------------------
  // Presigned grants
  // ------------------------------------------------------------------

  virtual PresignedUrl PresignPut(const std::string& bucket, const std::string& key, const std::string& content_type,
                                  std::chrono::milliseconds ttl) = 0;

  virtual PresignedUrl PresignUploadPart(const std::string& bucket, const std::string& key, const std::string& transfer_id,
                                         std::uint32_t part_number, std::chrono::milliseconds ttl) = 0;

  // ------------------------------------------------------------------
  // Multipart
  // ------------------------------------------------------------------

  virtual std::string InitiateMultipart(const std::string& bucket, const std::string& key, const std::string& content_type) = 0;

  // Throws TransferNotFound when the transfer is gone.
  virtual std::vector<PartInfo> ListParts(const std::string& bucket, const std::string& key, const std::string& transfer_id) = 0;

  /*
    Parts must be in ascending part number order.

    Throws TransferNotFound when already completed or aborted and
    RequestRejected when the store refuses the part list.
  */
  virtual void CompleteMultipart(const std::string& bucket, const std::string& key, const std::string& transfer_id,
                                 const std::vector<PartInfo>& parts) = 0;

  // Throws TransferNotFound when already completed or aborted.
  virtual void AbortMultipart(const std::string& bucket, const std::string& key, const std::string& transfer_id) = 0;
};

} // namespace upload::objectstore
