#include "bucket_resolver.hpp"

#include <string_view>

#include "internal/util/errors.hpp"

namespace upload::collaborators {

namespace {

constexpr std::string_view kTenantPlaceholder = "{tenant}";

std::string ExpandTemplate(std::string name, const std::string& tenant_id) {
  for (auto pos = name.find(kTenantPlaceholder); pos != std::string::npos; pos = name.find(kTenantPlaceholder, pos + tenant_id.size())) {
    name.replace(pos, kTenantPlaceholder.size(), tenant_id);
  }
  return name;
}

} // namespace

ConfigBucketResolver::ConfigBucketResolver(const upload::runtime::config::BucketsConfig& config)
    : name_template_(config.name_template().empty() ? "uploads-{tenant}" : config.name_template()) {
  for (const auto& tenant : config.tenants()) {
    tenants_[tenant.tenant_id()] = Entry{tenant.bucket(), tenant.provisioning()};
  }
}

std::string ConfigBucketResolver::ResolveBucket(const std::string& tenant_id) {
  if (tenant_id.empty()) {
    throw util::InvalidArgument("tenant id is required");
  }

  auto it = tenants_.find(tenant_id);
  if (it == tenants_.end()) {
    return ExpandTemplate(name_template_, tenant_id);
  }
  if (it->second.provisioning) {
    throw util::BucketNotReady("storage bucket for tenant " + tenant_id + " is still being provisioned");
  }
  return it->second.bucket.empty() ? ExpandTemplate(name_template_, tenant_id) : it->second.bucket;
}

} // namespace upload::collaborators
