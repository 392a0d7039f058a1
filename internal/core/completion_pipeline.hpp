#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/collaborators/category_directory.hpp"
#include "internal/collaborators/metadata_writer.hpp"
#include "internal/collaborators/sinks.hpp"
#include "internal/core/multipart_assembler.hpp"
#include "internal/core/session_guard.hpp"
#include "internal/core/upload_context.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/objectstore/object_store.hpp"

namespace upload::core {

struct CompletionRequest {
  std::string                                session_id;
  std::string                                file_name;
  std::string                                title;
  std::string                                category_id;
  std::vector<collaborators::MetadataField> metadata;
};

struct CompletionResult {
  db::model::AssetRecord   asset;
  model::UploadMode        mode = model::UploadMode::kCreate;
  // true when an earlier or concurrent call created the asset
  bool                     replayed = false;
  std::vector<std::string> accepted_metadata_keys;
  std::vector<std::string> rejected_metadata_keys;
};

struct CompletionCollaborators {
  std::shared_ptr<collaborators::CategoryDirectory> categories;
  std::shared_ptr<collaborators::MetadataWriter>    metadata;
  std::shared_ptr<collaborators::EventSink>         events;
  std::shared_ptr<collaborators::ApprovalNotifier>  approvals;
};

/*
  Turns a finished upload into exactly one asset.

  Idempotency:
    - completed session           → existing asset (the target, for replace)
    - asset already references it → session marked COMPLETED, existing asset
    - concurrent winners          → row lock + re-check + unique index

  Metadata is validated before any side effect and written inside the
  same transaction as the asset, so a rejected request leaves the session
  open for a corrected retry.

  Only facts verified against the object store (size, content type) are
  stored on the asset. Remote errors leave the session untouched.
*/
class CompletionPipeline {
 public:
  CompletionPipeline(std::shared_ptr<db::Repository> repository, std::shared_ptr<objectstore::ObjectStore> store,
                     CompletionCollaborators collaborators, UploadOptions options);

  CompletionResult Complete(const RequestContext& ctx, const CompletionRequest& request);

 private:
  std::optional<CompletionResult> Replay(const RequestContext& ctx, const std::string& session_id,
                                         db::model::UploadSessionRecord* session_out);

  // Asset the session already produced, if any. Replace sessions resolve
  // to their target once COMPLETED; the target keeps its creating session.
  std::optional<db::model::AssetRecord> ProducedAsset(db::Transaction& tx, const db::model::UploadSessionRecord& session);

  CompletionResult Persist(const RequestContext& ctx, const CompletionRequest& request, const objectstore::ObjectStat& stat,
                           const std::optional<collaborators::Category>& category, const collaborators::MetadataValidation& metadata);

  void Publish(const RequestContext& ctx, db::model::AssetRecord& asset, const std::optional<collaborators::Category>& category);
  void EmitEvents(const RequestContext& ctx, const db::model::AssetRecord& asset, bool created);

  // Records a failed attempt; `terminal` also moves the session to FAILED.
  void RecordFailure(const RequestContext& ctx, const std::string& session_id, std::string_view reason, bool terminal);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<objectstore::ObjectStore> store_;
  CompletionCollaborators                  collaborators_;
  UploadOptions                            options_;
  SessionGuard                             guard_;
  MultipartAssembler                       assembler_;
};

} // namespace upload::core
