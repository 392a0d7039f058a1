#include "multipart_assembler.hpp"

#include <algorithm>
#include <utility>

#include "internal/observability/logging.hpp"

namespace upload::core {

using upload::observability::IntField;
using upload::observability::StringField;

MultipartAssembler::MultipartAssembler(std::shared_ptr<objectstore::ObjectStore> store) : store_(std::move(store)) {
}

std::vector<objectstore::PartInfo> MultipartAssembler::OrderParts(std::vector<objectstore::PartInfo> parts) {
  if (parts.empty()) {
    throw util::TransferAssemblyFailed("no uploaded parts to assemble");
  }

  std::sort(parts.begin(), parts.end(), [](const auto& a, const auto& b) { return a.part_number < b.part_number; });
  auto duplicate = std::adjacent_find(parts.begin(), parts.end(), [](const auto& a, const auto& b) { return a.part_number == b.part_number; });
  if (duplicate != parts.end()) {
    throw util::TransferAssemblyFailed("duplicate part number " + std::to_string(duplicate->part_number));
  }
  return parts;
}

AssemblyOutcome MultipartAssembler::ResolveMissingTransfer(const db::model::UploadSessionRecord& session) {
  auto stat = store_->ExistsAndStat(session.bucket, session.object_key);
  if (stat.exists) {
    UPLOAD_LOG_INFO("multipart upload already assembled", {StringField("session_id", session.id)});
    return AssemblyOutcome::kAlreadyAssembled;
  }
  throw TransferGone("multipart upload " + session.multipart_upload_id + " no longer exists and no object was produced");
}

AssemblyOutcome MultipartAssembler::Assemble(const db::model::UploadSessionRecord& session) {
  if (session.multipart_upload_id.empty()) {
    throw util::TransferAssemblyFailed("multipart upload was never initiated for session " + session.id);
  }

  std::vector<objectstore::PartInfo> parts;
  try {
    parts = store_->ListParts(session.bucket, session.object_key, session.multipart_upload_id);
  } catch (const objectstore::TransferNotFound&) {
    return ResolveMissingTransfer(session);
  }

  auto ordered = OrderParts(std::move(parts));

  try {
    store_->CompleteMultipart(session.bucket, session.object_key, session.multipart_upload_id, ordered);
  } catch (const objectstore::TransferNotFound&) {
    return ResolveMissingTransfer(session);
  } catch (const objectstore::RequestRejected& e) {
    throw util::TransferAssemblyFailed(std::string("object store rejected multipart completion: ") + e.what());
  }

  UPLOAD_LOG_INFO("multipart upload assembled", {StringField("session_id", session.id),
                                                 IntField("parts", static_cast<std::int64_t>(ordered.size()))});
  return AssemblyOutcome::kAssembled;
}

} // namespace upload::core
