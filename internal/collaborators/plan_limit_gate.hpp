#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include "config/config.pb.h"

namespace upload::collaborators {

struct PlanDecision {
  bool          allowed     = true;
  std::uint64_t limit_bytes = 0;
};

/*
  Per-tenant upload size policy, consulted before any side effect of an
  initiation.
*/
class PlanLimitGate {
 public:
  virtual ~PlanLimitGate() = default;

  virtual PlanDecision CheckUploadAllowed(const std::string& tenant_id, std::uint64_t size_bytes) = 0;
};

// Limits from the `plans` config section; a limit of 0 means unlimited.
class ConfigPlanLimitGate final : public PlanLimitGate {
 public:
  explicit ConfigPlanLimitGate(const upload::runtime::config::PlansConfig& config);

  PlanDecision CheckUploadAllowed(const std::string& tenant_id, std::uint64_t size_bytes) override;

 private:
  std::uint64_t                                  default_limit_;
  std::unordered_map<std::string, std::uint64_t> tenant_limits_;
};

} // namespace upload::collaborators
