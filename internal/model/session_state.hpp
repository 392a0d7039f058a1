#pragma once

#include <cstdint>
#include <string_view>

namespace upload::model {

enum class SessionStatus : std::uint8_t {
  kUnspecified = 0,
  kInitiating  = 1,
  kUploading   = 2,
  kCompleted   = 3,
  kCancelled   = 4,
  kFailed      = 5,
  kExpired     = 6,
};

enum class TransferType : std::uint8_t {
  kUnspecified = 0,
  kDirect      = 1,
  kChunked     = 2,
};

enum class UploadMode : std::uint8_t {
  kUnspecified = 0,
  kCreate      = 1,
  kReplace     = 2,
};

constexpr bool IsTerminal(SessionStatus status) {
  return status == SessionStatus::kCompleted || status == SessionStatus::kCancelled || status == SessionStatus::kFailed ||
         status == SessionStatus::kExpired;
}

/*
  Static transition table. Expiry is checked separately by the guard.

  INITIATING -> UPLOADING | COMPLETED | CANCELLED | FAILED | EXPIRED
  UPLOADING  -> COMPLETED | CANCELLED | FAILED | EXPIRED

  Terminal states have no outgoing edges, not even to themselves.
*/
constexpr bool CanTransition(SessionStatus from, SessionStatus to) {
  if (IsTerminal(from) || from == SessionStatus::kUnspecified) {
    return false;
  }

  switch (to) {
    case SessionStatus::kUploading:
      return from == SessionStatus::kInitiating;
    case SessionStatus::kCompleted:
    case SessionStatus::kCancelled:
    case SessionStatus::kFailed:
    case SessionStatus::kExpired:
      return true;
    default:
      return false;
  }
}

constexpr std::string_view ToString(SessionStatus status) {
  switch (status) {
    case SessionStatus::kInitiating:
      return "initiating";
    case SessionStatus::kUploading:
      return "uploading";
    case SessionStatus::kCompleted:
      return "completed";
    case SessionStatus::kCancelled:
      return "cancelled";
    case SessionStatus::kFailed:
      return "failed";
    case SessionStatus::kExpired:
      return "expired";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(TransferType type) {
  switch (type) {
    case TransferType::kDirect:
      return "direct";
    case TransferType::kChunked:
      return "chunked";
    default:
      return "unspecified";
  }
}

constexpr std::string_view ToString(UploadMode mode) {
  switch (mode) {
    case UploadMode::kCreate:
      return "create";
    case UploadMode::kReplace:
      return "replace";
    default:
      return "unspecified";
  }
}

// Categorical failure reasons stored on the session.
namespace failure_reason {
inline constexpr std::string_view kCancelledByUser = "cancelled_by_user";
inline constexpr std::string_view kSizeMismatch    = "size_mismatch";
inline constexpr std::string_view kTransferAborted = "transfer_aborted";
inline constexpr std::string_view kAssemblyFailed  = "assembly_failed";
inline constexpr std::string_view kMetadataRejected = "metadata_rejected";
inline constexpr std::string_view kExpired         = "expired";
} // namespace failure_reason

} // namespace upload::model
