#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/model/upload_session_record.hpp"
#include "internal/objectstore/object_store.hpp"
#include "internal/util/errors.hpp"

namespace upload::core {

// The transfer is gone and no object was produced. The session cannot
// recover.
class TransferGone : public util::TransferAssemblyFailed {
 public:
  explicit TransferGone(const std::string& msg) : util::TransferAssemblyFailed(msg) {
  }
};

enum class AssemblyOutcome {
  kAssembled,
  kAlreadyAssembled,
};

/*
  Stitches the uploaded parts of a chunked session into the final object.

  Failure contract:
    no parts / duplicate parts / rejected complete → TransferAssemblyFailed
    transfer gone and object absent               → TransferGone
    transport failure                             → util::RemoteUnavailable
*/
class MultipartAssembler {
 public:
  explicit MultipartAssembler(std::shared_ptr<objectstore::ObjectStore> store);

  AssemblyOutcome Assemble(const db::model::UploadSessionRecord& session);

  // Sorted ascending by part number; throws on an empty list or duplicates.
  static std::vector<objectstore::PartInfo> OrderParts(std::vector<objectstore::PartInfo> parts);

 private:
  AssemblyOutcome ResolveMissingTransfer(const db::model::UploadSessionRecord& session);

  std::shared_ptr<objectstore::ObjectStore> store_;
};

} // namespace upload::core
