#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/objectstore/object_store.hpp"

namespace upload::objectstore {

/*
  In-process object store.

  Objects are tracked by size and content type only; no bytes are kept.
  Clients "upload" through PutObject / UploadPart, which stand in for the
  presigned PUTs a real client would issue.

  Thread safety:
    - all operations serialize on one mutex
*/

class MemoryObjectStore final : public ObjectStore {
 public:
  explicit MemoryObjectStore(std::string presign_base_url = "memory://", util::NowFn now = util::Now);
  ~MemoryObjectStore() override = default;

  // ObjectStore interface
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

  // ------------------------------------------------------------------
  // Client-side simulation
  // ------------------------------------------------------------------

  void PutObject(const std::string& bucket, const std::string& key, std::uint64_t size_bytes, const std::string& content_type);
  void UploadPart(const std::string& transfer_id, std::uint32_t part_number, std::uint64_t size_bytes);

  // ------------------------------------------------------------------
  // Fault injection and inspection
  // ------------------------------------------------------------------

  // Every call throws util::RemoteUnavailable while set.
  void SetUnavailable(bool unavailable);
  // CompleteMultipart throws RequestRejected while set.
  void SetRejectComplete(bool reject);

  bool          HasTransfer(const std::string& transfer_id) const;
  std::uint32_t CompleteCalls() const {
    return complete_calls_.load();
  }
  std::uint32_t DeleteCalls() const {
    return delete_calls_.load();
  }
  std::uint32_t AbortCalls() const {
    return abort_calls_.load();
  }

 private:
  struct Object {
    std::uint64_t size_bytes = 0;
    std::string   content_type;
  };

  struct Transfer {
    std::string                       bucket;
    std::string                       key;
    std::string                       content_type;
    std::map<std::uint32_t, PartInfo> parts;
  };

  static std::string Path(const std::string& bucket, const std::string& key);

  void      ThrowIfUnavailable() const;
  Transfer& FindTransfer(const std::string& bucket, const std::string& key, const std::string& transfer_id);

  const std::string base_url_;
  const util::NowFn now_;

  mutable std::mutex                        mutex_;
  std::unordered_map<std::string, Object>   objects_;
  std::unordered_map<std::string, Transfer> transfers_;
  std::uint64_t                             next_transfer_ = 1;

  bool                       unavailable_     = false;
  bool                       reject_complete_ = false;
  std::atomic<std::uint32_t> complete_calls_{0};
  std::atomic<std::uint32_t> delete_calls_{0};
  std::atomic<std::uint32_t> abort_calls_{0};
};

} // namespace upload::objectstore
