#include <cassert>
#include <iostream>
#include <memory>
#include <set>

#include "tests/unit/upload_test_support.hpp"

namespace {

using namespace upload;
using namespace upload::testing;
using upload::model::SessionStatus;
using upload::model::TransferType;

constexpr std::uint64_t kMiB = 1024 * 1024;

void TestDirectInitiationPersistsSessionAndGrant() {
  Harness h;
  auto    result = h.initiator->Initiate(Ctx(), File("photo.jpg", 5 * kMiB, "image/jpeg", "client-1"));

  assert(util::IsValidId(result.session_id));
  assert(result.transfer_type == TransferType::kDirect);
  assert(result.status == SessionStatus::kInitiating);
  assert(result.client_reference == "client-1");
  assert(result.object_key == "temp/uploads/" + result.session_id + "/original");
  assert(result.grant.has_value());
  assert(result.grant->method == "PUT");
  assert(result.grant->headers.at("Content-Type") == "image/jpeg");
  // grant lasts as long as the session
  assert(result.grant->expires_at == result.expires_at);
  assert(util::ToUnixMillis(result.expires_at) == h.clock.NowMs() + 60 * 60 * 1000);

  auto session = h.Session(result.session_id);
  assert(session.tenant_id == "acme");
  assert(session.bucket == "uploads-acme");
  assert(session.expected_size_bytes == 5 * kMiB);
  assert(session.mode == model::UploadMode::kCreate);
  assert(session.multipart_upload_id.empty());
  assert(session.last_activity_at_ms == h.clock.NowMs());
}

void TestThresholdSelectsTransferType() {
  assert(core::SessionInitiator::TransferTypeFor(100 * kMiB, 100 * kMiB) == TransferType::kDirect);
  assert(core::SessionInitiator::TransferTypeFor(100 * kMiB + 1, 100 * kMiB) == TransferType::kChunked);
  assert(core::SessionInitiator::TotalParts(25, 10) == 3);
  assert(core::SessionInitiator::TotalParts(30, 10) == 3);
}

void TestChunkedInitiationDefersMultipart() {
  Harness h;
  auto    result = h.initiator->Initiate(Ctx(), File("film.mov", 250 * kMiB, "video/quicktime"));

  assert(result.transfer_type == TransferType::kChunked);
  assert(!result.grant.has_value());
  assert(result.multipart_upload_id.empty());
  assert(result.chunk_size_bytes == 10 * kMiB);

  auto multipart = h.initiator->InitiateMultipart(Ctx(), result.session_id);
  assert(!multipart.already_initiated);
  assert(multipart.total_parts == 25);
  assert(h.store->HasTransfer(multipart.multipart_upload_id));

  auto again = h.initiator->InitiateMultipart(Ctx(), result.session_id);
  assert(again.already_initiated);
  assert(again.multipart_upload_id == multipart.multipart_upload_id);

  auto grant = h.initiator->SignPartUrl(Ctx(), result.session_id, 25);
  assert(grant.url.find("partNumber=25") != std::string::npos);
  assert(util::ToUnixMillis(grant.expires_at) == h.clock.NowMs() + 15 * 60 * 1000);

  assert(Throws<util::InvalidArgument>([&] { h.initiator->SignPartUrl(Ctx(), result.session_id, 0); }));
  assert(Throws<util::InvalidArgument>([&] { h.initiator->SignPartUrl(Ctx(), result.session_id, 26); }));
}

void TestEagerMultipartInitiation() {
  core::UploadOptions options;
  options.initiate_multipart_eagerly = true;
  Harness h(options);

  auto result = h.initiator->Initiate(Ctx(), File("film.mov", 101 * kMiB, "video/mp4"));
  assert(!result.multipart_upload_id.empty());
  assert(h.Session(result.session_id).total_parts == 11);
}

void TestSignPartBeforeMultipartIsRejected() {
  Harness h;
  auto    chunked = h.initiator->Initiate(Ctx(), File("film.mov", 250 * kMiB));
  assert(Throws<util::InvalidArgument>([&] { h.initiator->SignPartUrl(Ctx(), chunked.session_id, 1); }));

  auto direct = h.initiator->Initiate(Ctx(), File("photo.jpg", kMiB));
  assert(Throws<util::InvalidArgument>([&] { h.initiator->InitiateMultipart(Ctx(), direct.session_id); }));
}

void TestPlanLimitRejectsWithoutSideEffects() {
  Harness h;
  bool    rejected = false;
  try {
    h.initiator->Initiate(Ctx("small"), File("big.bin", 1001));
  } catch (const util::PlanLimitExceeded& e) {
    rejected = true;
    assert(e.LimitBytes() == 1000);
  }
  assert(rejected);

  auto tx = h.repository->Begin();
  assert(h.repository->ListExpiredSessions(*tx, h.clock.NowMs() + 24ULL * 60 * 60 * 1000, 0).empty());
  tx->Commit();

  h.initiator->Initiate(Ctx("small"), File("ok.bin", 1000));
}

void TestProvisioningBucketIsRetryable() {
  Harness h;
  assert(Throws<util::BucketNotReady>([&] { h.initiator->Initiate(Ctx("fresh"), File("a.jpg", 10)); }));
}

void TestValidation() {
  Harness h;
  assert(Throws<util::InvalidArgument>([&] { h.initiator->Initiate(Ctx(""), File("a.jpg", 10)); }));
  assert(Throws<util::InvalidArgument>([&] { h.initiator->Initiate(Ctx(), File("", 10)); }));
  assert(Throws<util::InvalidArgument>([&] { h.initiator->Initiate(Ctx(), File("a.jpg", 0)); }));
  assert(Throws<util::InvalidArgument>([&] { h.initiator->InitiateMultipart(Ctx(), "not-a-uuid"); }));
}

void TestReplaceRequiresExistingTenantAsset() {
  Harness h;
  assert(Throws<util::NotFound>([&] { h.initiator->Initiate(Ctx(), File("a.jpg", 10), util::NewId()); }));
  assert(Throws<util::InvalidArgument>([&] { h.initiator->Initiate(Ctx("acme", ""), File("a.jpg", 10), util::NewId()); }));

  db::model::AssetRecord asset;
  asset.id        = util::NewId();
  asset.tenant_id = "acme";
  {
    auto tx = h.repository->Begin();
    assert(std::holds_alternative<db::AssetCreated>(h.repository->InsertAsset(*tx, asset)));
    tx->Commit();
  }

  assert(Throws<util::NotFound>([&] { h.initiator->Initiate(Ctx("other"), File("a.jpg", 10), asset.id); }));

  auto result  = h.initiator->Initiate(Ctx(), File("a.jpg", 10), asset.id);
  auto session = h.Session(result.session_id);
  assert(session.mode == model::UploadMode::kReplace);
  assert(session.target_asset_id == asset.id);
}

void TestSessionsAreTenantScoped() {
  Harness h;
  auto    result = h.initiator->Initiate(Ctx(), File("film.mov", 250 * kMiB));
  assert(Throws<util::NotFound>([&] { h.initiator->InitiateMultipart(Ctx("other"), result.session_id); }));
  assert(Throws<util::NotFound>([&] { h.initiator->InitiateMultipart(Ctx("acme", "brand-2"), result.session_id); }));
}

void TestExpiredSessionCannotStartMultipart() {
  Harness h;
  auto    result = h.initiator->Initiate(Ctx(), File("film.mov", 250 * kMiB));
  h.clock.Advance(std::chrono::minutes(61));

  assert(Throws<util::StateConflict>([&] { h.initiator->InitiateMultipart(Ctx(), result.session_id); }));
  // expiry is persisted even though the call failed
  assert(h.Session(result.session_id).status == SessionStatus::kExpired);
}

void TestBatchIsolatesFailuresAndKeepsOrder() {
  Harness h;
  std::vector<core::FileRequest> files = {
      File("a.jpg", 10, "image/jpeg", "ref-a"),
      File("", 10, "image/jpeg", "ref-bad"),
      File("c.mov", 250 * kMiB, "video/mp4", "ref-c"),
      File("d.jpg", 0, "image/jpeg", "ref-zero"),
  };

  auto items = h.initiator->InitiateBatch(Ctx(), files, "batch-1");
  assert(items.size() == 4);
  assert(items[0].result.has_value() && items[0].client_reference == "ref-a");
  assert(items[0].result->batch_reference == "batch-1");
  assert(!items[1].result.has_value() && items[1].error_code == "invalid_argument");
  assert(items[2].result->transfer_type == TransferType::kChunked);
  assert(items[3].error_code == "invalid_argument");

  std::set<std::string> ids = {items[0].result->session_id, items[2].result->session_id};
  assert(ids.size() == 2);
  assert(h.Session(items[2].result->session_id).batch_reference == "batch-1");
}

void TestBatchPlanLimitPerItem() {
  Harness h;
  auto    items = h.initiator->InitiateBatch(Ctx("small"), {File("ok.bin", 500), File("big.bin", 5000)}, "batch-2");
  assert(items[0].result.has_value());
  assert(items[1].error_code == "plan_limit_exceeded");
}

void TestBatchLimits() {
  core::UploadOptions options;
  options.max_batch_size = 2;
  Harness h(options);

  assert(Throws<util::InvalidArgument>([&] { h.initiator->InitiateBatch(Ctx(), {}, "empty"); }));
  assert(Throws<util::InvalidArgument>([&] {
    h.initiator->InitiateBatch(Ctx(), {File("a", 1), File("b", 1), File("c", 1)}, "too-many");
  }));
  assert(Throws<util::BucketNotReady>([&] { h.initiator->InitiateBatch(Ctx("fresh"), {File("a", 1)}, "fresh"); }));
}

void TestLargeParallelBatch() {
  Harness                        h;
  std::vector<core::FileRequest> files;
  for (int i = 0; i < 50; ++i) {
    files.push_back(File("f" + std::to_string(i) + ".jpg", 10 + i, "image/jpeg", "ref-" + std::to_string(i)));
  }

  auto items = h.initiator->InitiateBatch(Ctx(), files, "bulk");
  assert(items.size() == files.size());
  for (std::size_t i = 0; i < items.size(); ++i) {
    assert(items[i].client_reference == "ref-" + std::to_string(i));
    assert(items[i].result.has_value());
    assert(h.Session(items[i].result->session_id).expected_size_bytes == 10 + i);
  }
}

void TestStoreOutageSurfacesAsRemoteUnavailable() {
  Harness h;
  auto    chunked = h.initiator->Initiate(Ctx(), File("film.mov", 250 * kMiB));
  h.store->SetUnavailable(true);
  assert(Throws<util::RemoteUnavailable>([&] { h.initiator->InitiateMultipart(Ctx(), chunked.session_id); }));
  h.store->SetUnavailable(false);

  assert(h.Session(chunked.session_id).multipart_upload_id.empty());
}

void TestGrantFailureLeavesNoSession() {
  Harness h;
  h.store->SetUnavailable(true);
  assert(Throws<util::RemoteUnavailable>([&] { h.initiator->Initiate(Ctx(), File("a.jpg", 10)); }));
  h.store->SetUnavailable(false);

  // nothing was persisted, so there is nothing for the reaper to find
  h.clock.Advance(std::chrono::hours(2));
  assert(h.lifecycle->ReapExpired(100).empty());
}

} // namespace

int main() {
  TestDirectInitiationPersistsSessionAndGrant();
  TestThresholdSelectsTransferType();
  TestChunkedInitiationDefersMultipart();
  TestEagerMultipartInitiation();
  TestSignPartBeforeMultipartIsRejected();
  TestPlanLimitRejectsWithoutSideEffects();
  TestProvisioningBucketIsRetryable();
  TestValidation();
  TestReplaceRequiresExistingTenantAsset();
  TestSessionsAreTenantScoped();
  TestExpiredSessionCannotStartMultipart();
  TestBatchIsolatesFailuresAndKeepsOrder();
  TestBatchPlanLimitPerItem();
  TestBatchLimits();
  TestLargeParallelBatch();
  TestStoreOutageSurfacesAsRemoteUnavailable();
  TestGrantFailureLeavesNoSession();

  std::cout << "session_initiator_test: pass\n";
  return 0;
}
