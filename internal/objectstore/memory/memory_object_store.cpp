#include "memory_object_store.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace upload::objectstore {

MemoryObjectStore::MemoryObjectStore(std::string presign_base_url, util::NowFn now)
    : base_url_(std::move(presign_base_url)), now_(std::move(now)) {
}

std::string MemoryObjectStore::Path(const std::string& bucket, const std::string& key) {
  return bucket + "/" + key;
}

void MemoryObjectStore::ThrowIfUnavailable() const {
  if (unavailable_) {
    throw util::RemoteUnavailable("memory object store unavailable");
  }
}

MemoryObjectStore::Transfer& MemoryObjectStore::FindTransfer(const std::string& bucket, const std::string& key,
                                                            const std::string& transfer_id) {
  auto it = transfers_.find(transfer_id);
  if (it == transfers_.end() || it->second.bucket != bucket || it->second.key != key) {
    throw TransferNotFound("no such upload: " + transfer_id);
  }
  return it->second;
}

// ------------------------------------------------------------------
// Objects
// ------------------------------------------------------------------

ObjectStat MemoryObjectStore::ExistsAndStat(const std::string& bucket, const std::string& key) {
  std::lock_guard lock(mutex_);
  ThrowIfUnavailable();

  ObjectStat stat;
  auto       it = objects_.find(Path(bucket, key));
  if (it == objects_.end()) {
    return stat;
  }
  stat.exists       = true;
  stat.size_bytes   = it->second.size_bytes;
  stat.content_type = it->second.content_type;
  return stat;
}

void MemoryObjectStore::DeleteObject(const std::string& bucket, const std::string& key) {
  std::lock_guard lock(mutex_);
  ++delete_calls_;
  ThrowIfUnavailable();
  objects_.erase(Path(bucket, key));
}

// ------------------------------------------------------------------
// Presigned grants
// ------------------------------------------------------------------

PresignedUrl MemoryObjectStore::PresignPut(const std::string& bucket, const std::string& key, const std::string& content_type,
                                           std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);
  ThrowIfUnavailable();

  PresignedUrl grant;
  grant.expires_at = now_() + ttl;
  grant.url        = base_url_ + "/" + Path(bucket, key) + "?expires=" + std::to_string(util::ToUnixMillis(grant.expires_at));
  if (!content_type.empty()) {
    grant.headers["Content-Type"] = content_type;
  }
  return grant;
}

PresignedUrl MemoryObjectStore::PresignUploadPart(const std::string& bucket, const std::string& key, const std::string& transfer_id,
                                                  std::uint32_t part_number, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);
  ThrowIfUnavailable();
  FindTransfer(bucket, key, transfer_id);

  PresignedUrl grant;
  grant.expires_at = now_() + ttl;
  grant.url        = base_url_ + "/" + Path(bucket, key) + "?uploadId=" + transfer_id + "&partNumber=" + std::to_string(part_number) +
              "&expires=" + std::to_string(util::ToUnixMillis(grant.expires_at));
  return grant;
}

// ------------------------------------------------------------------
// Multipart
// ------------------------------------------------------------------

std::string MemoryObjectStore::InitiateMultipart(const std::string& bucket, const std::string& key, const std::string& content_type) {
  std::lock_guard lock(mutex_);
  ThrowIfUnavailable();

  auto  id              = "mpu-" + std::to_string(next_transfer_++);
  auto& transfer        = transfers_[id];
  transfer.bucket       = bucket;
  transfer.key          = key;
  transfer.content_type = content_type;
  return id;
}

std::vector<PartInfo> MemoryObjectStore::ListParts(const std::string& bucket, const std::string& key, const std::string& transfer_id) {
  std::lock_guard lock(mutex_);
  ThrowIfUnavailable();

  std::vector<PartInfo> out;
  for (const auto& [_, part] : FindTransfer(bucket, key, transfer_id).parts) {
    out.push_back(part);
  }
  return out;
}

void MemoryObjectStore::CompleteMultipart(const std::string& bucket, const std::string& key, const std::string& transfer_id,
                                          const std::vector<PartInfo>& parts) {
  std::lock_guard lock(mutex_);
  ++complete_calls_;
  ThrowIfUnavailable();

  auto& transfer = FindTransfer(bucket, key, transfer_id);
  if (reject_complete_) {
    throw RequestRejected("complete rejected for upload " + transfer_id);
  }

  std::uint64_t total       = 0;
  std::uint32_t last_number = 0;
  for (const auto& part : parts) {
    auto it = transfer.parts.find(part.part_number);
    if (it == transfer.parts.end() || it->second.etag != part.etag) {
      throw RequestRejected("invalid part " + std::to_string(part.part_number));
    }
    if (part.part_number <= last_number) {
      throw RequestRejected("parts out of order");
    }
    last_number = part.part_number;
    total += it->second.size_bytes;
  }

  objects_[Path(bucket, key)] = Object{total, transfer.content_type};
  transfers_.erase(transfer_id);
}

void MemoryObjectStore::AbortMultipart(const std::string& bucket, const std::string& key, const std::string& transfer_id) {
  std::lock_guard lock(mutex_);
  ++abort_calls_;
  ThrowIfUnavailable();

  FindTransfer(bucket, key, transfer_id);
  transfers_.erase(transfer_id);
}

// ------------------------------------------------------------------
// Client-side simulation
// ------------------------------------------------------------------

void MemoryObjectStore::PutObject(const std::string& bucket, const std::string& key, std::uint64_t size_bytes,
                                  const std::string& content_type) {
  std::lock_guard lock(mutex_);
  objects_[Path(bucket, key)] = Object{size_bytes, content_type};
}

void MemoryObjectStore::UploadPart(const std::string& transfer_id, std::uint32_t part_number, std::uint64_t size_bytes) {
  std::lock_guard lock(mutex_);
  auto            it = transfers_.find(transfer_id);
  if (it == transfers_.end()) {
    throw TransferNotFound("no such upload: " + transfer_id);
  }
  it->second.parts[part_number] = PartInfo{part_number, "etag-" + transfer_id + "-" + std::to_string(part_number), size_bytes};
}

// ------------------------------------------------------------------
// Fault injection and inspection
// ------------------------------------------------------------------

void MemoryObjectStore::SetUnavailable(bool unavailable) {
  std::lock_guard lock(mutex_);
  unavailable_ = unavailable;
}

void MemoryObjectStore::SetRejectComplete(bool reject) {
  std::lock_guard lock(mutex_);
  reject_complete_ = reject;
}

bool MemoryObjectStore::HasTransfer(const std::string& transfer_id) const {
  std::lock_guard lock(mutex_);
  return transfers_.contains(transfer_id);
}

} // namespace upload::objectstore
