#pragma once

#include <string>
#include <unordered_map>

#include "config/config.pb.h"

namespace upload::collaborators {

/*
  Resolves (and provisions) the storage bucket of a tenant.

  Never blocks on provisioning: a bucket still being created raises
  util::BucketNotReady so the caller can retry later.
*/
class BucketResolver {
 public:
  virtual ~BucketResolver() = default;

  virtual std::string ResolveBucket(const std::string& tenant_id) = 0;
};

class ConfigBucketResolver final : public BucketResolver {
 public:
  explicit ConfigBucketResolver(const upload::runtime::config::BucketsConfig& config);

  std::string ResolveBucket(const std::string& tenant_id) override;

 private:
  struct Entry {
    std::string bucket;
    bool        provisioning = false;
  };

  std::string                            name_template_;
  std::unordered_map<std::string, Entry> tenants_;
};

} // namespace upload::collaborators
