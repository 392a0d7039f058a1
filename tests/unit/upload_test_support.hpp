#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/collaborators/bucket_resolver.hpp"
#include "internal/collaborators/category_directory.hpp"
#include "internal/collaborators/metadata_writer.hpp"
#include "internal/collaborators/plan_limit_gate.hpp"
#include "internal/collaborators/sinks.hpp"
#include "internal/core/completion_pipeline.hpp"
#include "internal/core/session_initiator.hpp"
#include "internal/core/session_lifecycle.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/objectstore/memory/memory_object_store.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace upload::testing {

/*
  Shared fixtures for the core unit tests.

  Everything runs against the in-memory repository and object store with a
  clock the test moves by hand.
*/

class ManualClock {
 public:
  ManualClock() : ms_(std::make_shared<std::atomic<std::uint64_t>>(1'700'000'000'000ULL)) {
  }

  util::NowFn Fn() const {
    auto ms = ms_;
    return [ms] { return util::FromUnixMillis(ms->load()); };
  }

  void Advance(std::chrono::milliseconds delta) {
    ms_->fetch_add(static_cast<std::uint64_t>(delta.count()));
  }

  std::uint64_t NowMs() const {
    return ms_->load();
  }

 private:
  std::shared_ptr<std::atomic<std::uint64_t>> ms_;
};

class RecordingEventSink final : public collaborators::EventSink {
 public:
  void AssetCreated(const db::model::AssetRecord& asset, const std::string&) override {
    std::lock_guard lock(mutex_);
    if (fail) throw std::runtime_error("event bus down");
    created.push_back(asset.id);
  }

  void ProcessingRequested(const db::model::AssetRecord& asset, const std::vector<std::string>& steps) override {
    std::lock_guard lock(mutex_);
    if (fail) throw std::runtime_error("event bus down");
    processing.push_back(asset.id);
    last_steps = steps;
  }

  bool                     fail = false;
  std::vector<std::string> created;
  std::vector<std::string> processing;
  std::vector<std::string> last_steps;

 private:
  std::mutex mutex_;
};

class RecordingApprovalNotifier final : public collaborators::ApprovalNotifier {
 public:
  void ApprovalRequested(const db::model::AssetRecord& asset, const std::string&) override {
    if (fail) throw std::runtime_error("mailer down");
    requested.push_back(asset.id);
  }

  bool                     fail = false;
  std::vector<std::string> requested;
};

class CountingTicketSink final : public collaborators::TicketSink {
 public:
  std::string OpenTicket(const db::model::UploadSessionRecord&, const std::string& summary) override {
    ++opened;
    last_summary = summary;
    return "TICKET-" + std::to_string(opened);
  }

  int         opened = 0;
  std::string last_summary;
};

inline core::RequestContext Ctx(const std::string& tenant = "acme", const std::string& brand = "brand-1", const std::string& user = "user-1") {
  return core::RequestContext{tenant, brand, user};
}

inline core::FileRequest File(const std::string& name, std::uint64_t size, const std::string& mime = "image/jpeg",
                              const std::string& client_reference = {}) {
  return core::FileRequest{name, size, mime, client_reference};
}

struct Harness {
  explicit Harness(core::UploadOptions base = {}) {
    options     = base;
    options.now = clock.Fn();

    repository = std::make_shared<db::memory::MemoryRepository>();
    store      = std::make_shared<objectstore::MemoryObjectStore>("memory://", clock.Fn());

    upload::runtime::config::PlansConfig plans_config;
    auto*                                limited = plans_config.add_tenants();
    limited->set_tenant_id("small");
    limited->set_max_upload_bytes(1000);
    plans = std::make_shared<collaborators::ConfigPlanLimitGate>(plans_config);

    upload::runtime::config::BucketsConfig buckets_config;
    auto*                                  pending = buckets_config.add_tenants();
    pending->set_tenant_id("fresh");
    pending->set_provisioning(true);
    buckets = std::make_shared<collaborators::ConfigBucketResolver>(buckets_config);

    collaborators::Category press;
    press.id                = "press";
    press.asset_class       = model::AssetClass::kDeliverable;
    press.requires_approval = true;
    press.metadata_fields   = {"campaign", "region"};

    collaborators::Category photos;
    photos.id              = "photos";
    photos.metadata_fields = {"photographer"};

    categories = std::make_shared<collaborators::ConfigCategoryDirectory>(std::vector<collaborators::Category>{press, photos});
    events     = std::make_shared<RecordingEventSink>();
    approvals  = std::make_shared<RecordingApprovalNotifier>();
    tickets    = std::make_shared<CountingTicketSink>();

    core::CompletionCollaborators collaborators;
    collaborators.categories = categories;
    collaborators.metadata   = std::make_shared<collaborators::SchemaMetadataWriter>(repository, clock.Fn());
    collaborators.events     = events;
    collaborators.approvals  = approvals;

    initiator  = std::make_shared<core::SessionInitiator>(repository, store, plans, buckets, options);
    completion = std::make_shared<core::CompletionPipeline>(repository, store, collaborators, options);
    lifecycle  = std::make_shared<core::SessionLifecycle>(repository, store, tickets, options);
  }

  db::model::UploadSessionRecord Session(const std::string& id) {
    auto tx      = repository->Begin();
    auto session = repository->GetSession(*tx, id);
    tx->Commit();
    return session.value();
  }

  std::optional<db::model::AssetRecord> Asset(const std::string& id) {
    auto tx    = repository->Begin();
    auto asset = repository->GetAsset(*tx, id);
    tx->Commit();
    return asset;
  }

  // Simulates the client finishing a direct upload of `size` bytes.
  void Upload(const core::InitiateResult& initiated, std::uint64_t size, const std::string& mime = "image/jpeg") {
    store->PutObject(Session(initiated.session_id).bucket, initiated.object_key, size, mime);
  }

  // Simulates the client uploading every part of a chunked session.
  void UploadParts(const std::string& session_id) {
    auto          session   = Session(session_id);
    std::uint64_t remaining = session.expected_size_bytes;
    for (std::uint32_t part = 1; part <= session.total_parts; ++part) {
      const auto size = std::min(remaining, session.part_size_bytes);
      store->UploadPart(session.multipart_upload_id, part, size);
      remaining -= size;
    }
  }

  core::CompletionRequest Request(const std::string& session_id, const std::string& title = {}) {
    core::CompletionRequest request;
    request.session_id = session_id;
    request.title      = title;
    return request;
  }

  ManualClock         clock;
  core::UploadOptions options;

  std::shared_ptr<db::memory::MemoryRepository>           repository;
  std::shared_ptr<objectstore::MemoryObjectStore>         store;
  std::shared_ptr<collaborators::ConfigPlanLimitGate>     plans;
  std::shared_ptr<collaborators::ConfigBucketResolver>    buckets;
  std::shared_ptr<collaborators::ConfigCategoryDirectory> categories;
  std::shared_ptr<RecordingEventSink>                     events;
  std::shared_ptr<RecordingApprovalNotifier>              approvals;
  std::shared_ptr<CountingTicketSink>                     tickets;

  std::shared_ptr<core::SessionInitiator>   initiator;
  std::shared_ptr<core::CompletionPipeline> completion;
  std::shared_ptr<core::SessionLifecycle>   lifecycle;
};

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

} // namespace upload::testing
