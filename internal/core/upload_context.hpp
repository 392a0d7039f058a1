#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace upload::core {

/*
  Caller identity threaded explicitly through every operation.

  tenant_id is always required. brand_id is required for completion and
  replace initiation. user_id is the acting user, empty for system calls.
*/
struct RequestContext {
  std::string tenant_id;
  std::string brand_id;
  std::string user_id;
};

struct UploadOptions {
  std::uint64_t multipart_threshold_bytes = 100ULL * 1024 * 1024;
  std::uint64_t chunk_size_bytes          = 10ULL * 1024 * 1024;

  std::chrono::milliseconds session_ttl{std::chrono::minutes(60)};
  // 0 = grant valid until the session expires
  std::chrono::milliseconds presign_ttl{0};
  std::chrono::milliseconds part_presign_ttl{std::chrono::minutes(15)};

  std::uint32_t max_batch_size             = 100;
  std::uint32_t batch_parallelism          = 8;
  bool          initiate_multipart_eagerly = false;

  util::NowFn now = util::Now;
};

// Deterministic, immutable storage key of a session's upload.
inline std::string ObjectKeyFor(const std::string& session_id) {
  return "temp/uploads/" + session_id + "/original";
}

inline void RequireTenant(const RequestContext& ctx) {
  if (ctx.tenant_id.empty()) {
    throw util::InvalidArgument("tenant id is required");
  }
}

inline void RequireBrand(const RequestContext& ctx) {
  RequireTenant(ctx);
  if (ctx.brand_id.empty()) {
    throw util::InvalidArgument("brand id is required");
  }
}

inline void ThrowIfDbError(const upload::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + " (" + std::string(upload::db::ToString(result.code)) + ")" + (result.message.empty() ? "" : ": " + result.message);
  if (upload::db::IsRetryable(result.code)) {
    throw upload::util::RemoteUnavailable(message);
  }
  switch (result.code) {
    case upload::db::ErrorCode::NotFound:
      throw upload::util::NotFound(message);
    case upload::db::ErrorCode::AlreadyExists:
    case upload::db::ErrorCode::ConstraintViolation:
      throw upload::util::InvalidArgument(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace upload::core
