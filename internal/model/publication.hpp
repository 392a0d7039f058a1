#pragma once

#include <cstdint>
#include <string_view>

namespace upload::model {

enum class Visibility : std::uint8_t {
  kVisible = 1,
  kHidden  = 2,
};

enum class ApprovalStatus : std::uint8_t {
  kNotRequired = 1,
  kPending     = 2,
};

constexpr std::string_view ToString(Visibility visibility) {
  return visibility == Visibility::kHidden ? "hidden" : "visible";
}

constexpr std::string_view ToString(ApprovalStatus approval) {
  return approval == ApprovalStatus::kPending ? "pending" : "not_required";
}

} // namespace upload::model
