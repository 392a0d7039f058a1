#include "internal/core/multipart_assembler.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/objectstore/memory/memory_object_store.hpp"

namespace {

using upload::core::AssemblyOutcome;
using upload::core::MultipartAssembler;
using upload::core::TransferGone;
using upload::db::model::UploadSessionRecord;
using upload::objectstore::MemoryObjectStore;
using upload::objectstore::PartInfo;

// Reports every uploaded part twice, as a misbehaving store might.
class DuplicatingStore final : public upload::objectstore::ObjectStore {
 public:
  explicit DuplicatingStore(std::shared_ptr<MemoryObjectStore> inner) : inner_(std::move(inner)) {
  }

  upload::objectstore::ObjectStat ExistsAndStat(const std::string& bucket, const std::string& key) override {
    return inner_->ExistsAndStat(bucket, key);
  }
  void DeleteObject(const std::string& bucket, const std::string& key) override {
    inner_->DeleteObject(bucket, key);
  }
  upload::objectstore::PresignedUrl PresignPut(const std::string& bucket, const std::string& key, const std::string& content_type,
                                               std::chrono::milliseconds ttl) override {
    return inner_->PresignPut(bucket, key, content_type, ttl);
  }
  upload::objectstore::PresignedUrl PresignUploadPart(const std::string& bucket, const std::string& key, const std::string& transfer_id,
                                                      std::uint32_t part_number, std::chrono::milliseconds ttl) override {
    return inner_->PresignUploadPart(bucket, key, transfer_id, part_number, ttl);
  }
  std::string InitiateMultipart(const std::string& bucket, const std::string& key, const std::string& content_type) override {
    return inner_->InitiateMultipart(bucket, key, content_type);
  }
  std::vector<PartInfo> ListParts(const std::string& bucket, const std::string& key, const std::string& transfer_id) override {
    auto parts = inner_->ListParts(bucket, key, transfer_id);
    auto copy  = parts;
    parts.insert(parts.end(), copy.begin(), copy.end());
    return parts;
  }
  void CompleteMultipart(const std::string& bucket, const std::string& key, const std::string& transfer_id,
                         const std::vector<PartInfo>& parts) override {
    inner_->CompleteMultipart(bucket, key, transfer_id, parts);
  }
  void AbortMultipart(const std::string& bucket, const std::string& key, const std::string& transfer_id) override {
    inner_->AbortMultipart(bucket, key, transfer_id);
  }

 private:
  std::shared_ptr<MemoryObjectStore> inner_;
};

UploadSessionRecord StartTransfer(MemoryObjectStore& store) {
  UploadSessionRecord session;
  session.id                  = "session-1";
  session.bucket              = "uploads-acme";
  session.object_key          = "temp/uploads/session-1/original";
  session.expected_size_bytes = 25;
  session.part_size_bytes     = 10;
  session.total_parts         = 3;
  session.multipart_upload_id = store.InitiateMultipart(session.bucket, session.object_key, "video/mp4");
  return session;
}

void TestOrderPartsSortsAscending() {
  auto ordered = MultipartAssembler::OrderParts({{3, "c", 5}, {1, "a", 10}, {2, "b", 10}});
  assert(ordered.size() == 3);
  assert(ordered[0].part_number == 1);
  assert(ordered[1].part_number == 2);
  assert(ordered[2].part_number == 3);
}

void TestOrderPartsRejectsEmptyAndDuplicates() {
  bool threw = false;
  try {
    MultipartAssembler::OrderParts({});
  } catch (const upload::util::TransferAssemblyFailed&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    MultipartAssembler::OrderParts({{1, "a", 10}, {2, "b", 10}, {1, "a2", 10}});
  } catch (const upload::util::TransferAssemblyFailed&) {
    threw = true;
  }
  assert(threw);
}

void TestAssemblesUploadedParts() {
  auto store   = std::make_shared<MemoryObjectStore>();
  auto session = StartTransfer(*store);
  store->UploadPart(session.multipart_upload_id, 2, 10);
  store->UploadPart(session.multipart_upload_id, 3, 5);
  store->UploadPart(session.multipart_upload_id, 1, 10);

  MultipartAssembler assembler(store);
  assert(assembler.Assemble(session) == AssemblyOutcome::kAssembled);

  auto stat = store->ExistsAndStat(session.bucket, session.object_key);
  assert(stat.exists);
  assert(stat.size_bytes == 25);
  assert(stat.content_type == "video/mp4");
  assert(!store->HasTransfer(session.multipart_upload_id));
}

void TestAlreadyAssembledTransferIsRecognized() {
  auto store   = std::make_shared<MemoryObjectStore>();
  auto session = StartTransfer(*store);
  store->UploadPart(session.multipart_upload_id, 1, 25);

  MultipartAssembler assembler(store);
  assert(assembler.Assemble(session) == AssemblyOutcome::kAssembled);
  // a retry after the remote completion succeeded
  assert(assembler.Assemble(session) == AssemblyOutcome::kAlreadyAssembled);
  assert(store->CompleteCalls() == 1);
}

void TestAbortedTransferWithoutObjectIsGone() {
  auto store   = std::make_shared<MemoryObjectStore>();
  auto session = StartTransfer(*store);
  store->AbortMultipart(session.bucket, session.object_key, session.multipart_upload_id);

  MultipartAssembler assembler(store);
  bool               gone = false;
  try {
    assembler.Assemble(session);
  } catch (const TransferGone&) {
    gone = true;
  }
  assert(gone);
}

void TestNoPartsFailsAssembly() {
  auto store   = std::make_shared<MemoryObjectStore>();
  auto session = StartTransfer(*store);

  MultipartAssembler assembler(store);
  bool               failed = false;
  try {
    assembler.Assemble(session);
  } catch (const TransferGone&) {
    assert(false && "an empty transfer is not gone");
  } catch (const upload::util::TransferAssemblyFailed&) {
    failed = true;
  }
  assert(failed);
  assert(store->HasTransfer(session.multipart_upload_id));
}

void TestDuplicatePartsNeverReachTheStore() {
  auto inner   = std::make_shared<MemoryObjectStore>();
  auto session = StartTransfer(*inner);
  inner->UploadPart(session.multipart_upload_id, 1, 25);

  MultipartAssembler assembler(std::make_shared<DuplicatingStore>(inner));
  bool               failed = false;
  try {
    assembler.Assemble(session);
  } catch (const upload::util::TransferAssemblyFailed&) {
    failed = true;
  }
  assert(failed);
  assert(inner->CompleteCalls() == 0);
}

void TestRejectedCompletionIsAssemblyFailure() {
  auto store   = std::make_shared<MemoryObjectStore>();
  auto session = StartTransfer(*store);
  store->UploadPart(session.multipart_upload_id, 1, 25);
  store->SetRejectComplete(true);

  MultipartAssembler assembler(store);
  bool               failed = false;
  try {
    assembler.Assemble(session);
  } catch (const TransferGone&) {
    assert(false && "a rejected completion is retryable");
  } catch (const upload::util::TransferAssemblyFailed&) {
    failed = true;
  }
  assert(failed);
}

void TestMissingTransferIdFails() {
  auto                store = std::make_shared<MemoryObjectStore>();
  UploadSessionRecord session;
  session.id = "session-2";

  MultipartAssembler assembler(store);
  bool               failed = false;
  try {
    assembler.Assemble(session);
  } catch (const upload::util::TransferAssemblyFailed&) {
    failed = true;
  }
  assert(failed);
}

void TestOutagePropagatesAsRemoteUnavailable() {
  auto store   = std::make_shared<MemoryObjectStore>();
  auto session = StartTransfer(*store);
  store->SetUnavailable(true);

  MultipartAssembler assembler(store);
  bool               unavailable = false;
  try {
    assembler.Assemble(session);
  } catch (const upload::util::RemoteUnavailable&) {
    unavailable = true;
  }
  assert(unavailable);
}

} // namespace

int main() {
  TestOrderPartsSortsAscending();
  TestOrderPartsRejectsEmptyAndDuplicates();
  TestAssemblesUploadedParts();
  TestAlreadyAssembledTransferIsRecognized();
  TestAbortedTransferWithoutObjectIsGone();
  TestNoPartsFailsAssembly();
  TestDuplicatePartsNeverReachTheStore();
  TestRejectedCompletionIsAssemblyFailure();
  TestMissingTransferIdFails();
  TestOutagePropagatesAsRemoteUnavailable();

  std::cout << "multipart_assembler_test: pass\n";
  return 0;
}
