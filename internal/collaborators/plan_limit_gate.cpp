#include "plan_limit_gate.hpp"

namespace upload::collaborators {

ConfigPlanLimitGate::ConfigPlanLimitGate(const upload::runtime::config::PlansConfig& config)
    : default_limit_(config.default_max_upload_bytes()) {
  for (const auto& tenant : config.tenants()) {
    tenant_limits_[tenant.tenant_id()] = tenant.max_upload_bytes();
  }
}

PlanDecision ConfigPlanLimitGate::CheckUploadAllowed(const std::string& tenant_id, std::uint64_t size_bytes) {
  auto it    = tenant_limits_.find(tenant_id);
  auto limit = it == tenant_limits_.end() ? default_limit_ : it->second;

  PlanDecision decision;
  decision.limit_bytes = limit;
  decision.allowed     = limit == 0 || size_bytes <= limit;
  return decision;
}

} // namespace upload::collaborators
