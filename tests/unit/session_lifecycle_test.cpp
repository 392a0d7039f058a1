#include <cassert>
#include <iostream>
#include <memory>

#include "tests/unit/upload_test_support.hpp"

namespace {

using namespace upload;
using namespace upload::testing;
using upload::model::SessionStatus;

constexpr std::uint64_t kMiB = 1024 * 1024;

void TestCancelIsIdempotentAndCleansUp() {
  Harness h;
  auto    initiated = h.initiator->Initiate(Ctx(), File("film.mov", 250 * kMiB));
  auto    multipart = h.initiator->InitiateMultipart(Ctx(), initiated.session_id);

  auto first = h.lifecycle->Cancel(Ctx(), initiated.session_id);
  assert(first.cancelled);
  assert(first.status == SessionStatus::kCancelled);
  assert(!h.store->HasTransfer(multipart.multipart_upload_id));
  assert(h.store->DeleteCalls() == 1);

  auto session = h.Session(initiated.session_id);
  assert(session.failure_reason == "cancelled_by_user");
  assert(session.failure_count == 0);

  auto second = h.lifecycle->Cancel(Ctx(), initiated.session_id);
  assert(!second.cancelled);
  assert(second.status == SessionStatus::kCancelled);
}

void TestCancelSurvivesStoreOutage() {
  Harness h;
  auto    initiated = h.initiator->Initiate(Ctx(), File("a.jpg", 10));
  h.store->SetUnavailable(true);

  auto result = h.lifecycle->Cancel(Ctx(), initiated.session_id);
  h.store->SetUnavailable(false);
  assert(result.cancelled);
  assert(h.Session(initiated.session_id).status == SessionStatus::kCancelled);
}

void TestCancelOfCompletedSessionIsNoop() {
  Harness h;
  auto    initiated = h.initiator->Initiate(Ctx(), File("a.jpg", 10));
  h.Upload(initiated, 10);
  h.completion->Complete(Ctx(), h.Request(initiated.session_id));

  auto result = h.lifecycle->Cancel(Ctx(), initiated.session_id);
  assert(!result.cancelled);
  assert(result.status == SessionStatus::kCompleted);
  assert(h.store->ExistsAndStat(h.Session(initiated.session_id).bucket, initiated.object_key).exists);
}

void TestCancelOfOverdueSessionExpiresIt() {
  Harness h;
  auto    initiated = h.initiator->Initiate(Ctx(), File("a.jpg", 10));
  h.clock.Advance(std::chrono::hours(2));

  auto result = h.lifecycle->Cancel(Ctx(), initiated.session_id);
  assert(!result.cancelled);
  assert(result.status == SessionStatus::kExpired);
  assert(h.Session(initiated.session_id).status == SessionStatus::kExpired);
}

void TestMarkUploading() {
  Harness h;
  auto    initiated = h.initiator->Initiate(Ctx(), File("a.jpg", 10));

  h.clock.Advance(std::chrono::seconds(5));
  auto first = h.lifecycle->MarkUploading(Ctx(), initiated.session_id);
  assert(first.transitioned);
  assert(first.status == SessionStatus::kUploading);
  assert(h.Session(initiated.session_id).last_activity_at_ms == h.clock.NowMs());

  h.clock.Advance(std::chrono::seconds(5));
  auto second = h.lifecycle->MarkUploading(Ctx(), initiated.session_id);
  assert(!second.transitioned);
  assert(second.status == SessionStatus::kUploading);
  assert(h.Session(initiated.session_id).last_activity_at_ms == h.clock.NowMs());

  h.lifecycle->Cancel(Ctx(), initiated.session_id);
  assert(Throws<util::StateConflict>([&] { h.lifecycle->MarkUploading(Ctx(), initiated.session_id); }));
}

void TestMarkUploadingAfterExpiryConflicts() {
  Harness h;
  auto    initiated = h.initiator->Initiate(Ctx(), File("a.jpg", 10));
  h.lifecycle->MarkUploading(Ctx(), initiated.session_id);
  h.clock.Advance(std::chrono::minutes(61));

  assert(Throws<util::StateConflict>([&] { h.lifecycle->MarkUploading(Ctx(), initiated.session_id); }));
  assert(h.Session(initiated.session_id).status == SessionStatus::kExpired);
}

void TestTouchActivity() {
  Harness h;
  auto    initiated = h.initiator->Initiate(Ctx(), File("a.jpg", 10));
  h.clock.Advance(std::chrono::minutes(10));

  auto touched = h.lifecycle->TouchActivity(Ctx(), initiated.session_id);
  assert(touched.touched);
  assert(util::ToUnixMillis(touched.last_activity_at) == h.clock.NowMs());

  h.lifecycle->Cancel(Ctx(), initiated.session_id);
  h.clock.Advance(std::chrono::minutes(1));
  auto after_cancel = h.lifecycle->TouchActivity(Ctx(), initiated.session_id);
  assert(!after_cancel.touched);
}

void TestGetSessionAppliesLazyExpiry() {
  Harness h;
  auto    initiated = h.initiator->Initiate(Ctx(), File("a.jpg", 10));
  assert(h.lifecycle->GetSession(Ctx(), initiated.session_id).status == SessionStatus::kInitiating);

  h.clock.Advance(std::chrono::minutes(60));
  auto session = h.lifecycle->GetSession(Ctx(), initiated.session_id);
  assert(session.status == SessionStatus::kExpired);
  assert(h.Session(initiated.session_id).status == SessionStatus::kExpired);

  assert(Throws<util::NotFound>([&] { h.lifecycle->GetSession(Ctx("other"), initiated.session_id); }));
  assert(Throws<util::NotFound>([&] { h.lifecycle->GetSession(Ctx(), util::NewId()); }));
  assert(Throws<util::InvalidArgument>([&] { h.lifecycle->GetSession(Ctx(), "../etc/passwd"); }));
}

void TestResumeInfoListsUploadedParts() {
  Harness h;
  auto    initiated = h.initiator->Initiate(Ctx(), File("film.mov", 250 * kMiB));
  auto    multipart = h.initiator->InitiateMultipart(Ctx(), initiated.session_id);
  h.store->UploadPart(multipart.multipart_upload_id, 1, 10 * kMiB);
  h.store->UploadPart(multipart.multipart_upload_id, 2, 10 * kMiB);

  h.clock.Advance(std::chrono::minutes(30));
  auto info = h.lifecycle->GetResumeInfo(Ctx(), initiated.session_id);
  assert(info.can_resume);
  assert(info.uploaded_parts.size() == 2);
  assert(info.session.total_parts == 25);
  // resuming counts as activity
  assert(h.Session(initiated.session_id).last_activity_at_ms == h.clock.NowMs());
}

void TestResumeInfoBlockedStates() {
  Harness h;
  auto    gone      = h.initiator->Initiate(Ctx(), File("film.mov", 250 * kMiB));
  auto    multipart = h.initiator->InitiateMultipart(Ctx(), gone.session_id);
  h.store->AbortMultipart(h.Session(gone.session_id).bucket, gone.object_key, multipart.multipart_upload_id);

  auto info = h.lifecycle->GetResumeInfo(Ctx(), gone.session_id);
  assert(!info.can_resume);
  assert(!info.blocked_reason.empty());

  auto cancelled = h.initiator->Initiate(Ctx(), File("a.jpg", 10));
  h.lifecycle->Cancel(Ctx(), cancelled.session_id);
  auto cancelled_info = h.lifecycle->GetResumeInfo(Ctx(), cancelled.session_id);
  assert(!cancelled_info.can_resume);
  assert(cancelled_info.blocked_reason == "session is cancelled");

  auto overdue = h.initiator->Initiate(Ctx(), File("b.jpg", 10));
  h.clock.Advance(std::chrono::hours(1));
  auto overdue_info = h.lifecycle->GetResumeInfo(Ctx(), overdue.session_id);
  assert(!overdue_info.can_resume);
  assert(overdue_info.session.status == SessionStatus::kExpired);
}

void TestAbortMultipart() {
  Harness h;
  auto    initiated = h.initiator->Initiate(Ctx(), File("film.mov", 250 * kMiB));

  auto none = h.lifecycle->AbortMultipart(Ctx(), initiated.session_id);
  assert(!none.aborted && none.already_aborted);

  auto multipart = h.initiator->InitiateMultipart(Ctx(), initiated.session_id);
  auto aborted   = h.lifecycle->AbortMultipart(Ctx(), initiated.session_id);
  assert(aborted.aborted);
  assert(!h.store->HasTransfer(multipart.multipart_upload_id));

  auto session = h.Session(initiated.session_id);
  assert(session.multipart_upload_id.empty());
  assert(session.total_parts == 0);
  assert(session.status == SessionStatus::kInitiating);

  // a fresh transfer can be started afterwards
  auto restarted = h.initiator->InitiateMultipart(Ctx(), initiated.session_id);
  assert(!restarted.already_initiated);
  assert(restarted.multipart_upload_id != multipart.multipart_upload_id);
}

void TestAbortMultipartOfCompletedSessionConflicts() {
  Harness h;
  auto    initiated = h.initiator->Initiate(Ctx(), File("film.mov", 250 * kMiB));
  h.initiator->InitiateMultipart(Ctx(), initiated.session_id);
  h.UploadParts(initiated.session_id);
  h.completion->Complete(Ctx(), h.Request(initiated.session_id));

  assert(Throws<util::StateConflict>([&] { h.lifecycle->AbortMultipart(Ctx(), initiated.session_id); }));
}

bool SameRow(const db::model::UploadSessionRecord& a, const db::model::UploadSessionRecord& b) {
  return a.status == b.status && a.multipart_upload_id == b.multipart_upload_id && a.total_parts == b.total_parts &&
         a.part_size_bytes == b.part_size_bytes && a.expires_at_ms == b.expires_at_ms && a.last_activity_at_ms == b.last_activity_at_ms &&
         a.failure_reason == b.failure_reason && a.failure_count == b.failure_count && a.escalation_ticket_id == b.escalation_ticket_id &&
         a.updated_at_ms == b.updated_at_ms;
}

void TestAbortMultipartLeavesTerminalSessionUntouched() {
  Harness h;
  auto    initiated = h.initiator->Initiate(Ctx(), File("film.mov", 150 * kMiB));
  auto    multipart = h.initiator->InitiateMultipart(Ctx(), initiated.session_id);
  h.lifecycle->Cancel(Ctx(), initiated.session_id);
  h.clock.Advance(std::chrono::seconds(5));

  const auto before = h.Session(initiated.session_id);
  assert(before.status == SessionStatus::kCancelled);
  assert(before.multipart_upload_id == multipart.multipart_upload_id);

  auto result = h.lifecycle->AbortMultipart(Ctx(), initiated.session_id);
  assert(result.already_aborted);
  assert(SameRow(before, h.Session(initiated.session_id)));
}

void TestAbortMultipartExpiresOverdueSession() {
  Harness h;
  auto    initiated = h.initiator->Initiate(Ctx(), File("film.mov", 150 * kMiB));
  auto    multipart = h.initiator->InitiateMultipart(Ctx(), initiated.session_id);
  h.clock.Advance(std::chrono::hours(1));

  auto result = h.lifecycle->AbortMultipart(Ctx(), initiated.session_id);
  assert(result.aborted);
  assert(!h.store->HasTransfer(multipart.multipart_upload_id));

  auto session = h.Session(initiated.session_id);
  assert(session.status == SessionStatus::kExpired);
  assert(session.failure_reason == "expired");
  // the expired row keeps its transfer reference
  assert(session.multipart_upload_id == multipart.multipart_upload_id);

  const auto expired = session;
  h.clock.Advance(std::chrono::seconds(5));
  auto again = h.lifecycle->AbortMultipart(Ctx(), initiated.session_id);
  assert(again.already_aborted);
  assert(SameRow(expired, h.Session(initiated.session_id)));
}

void TestEscalationAttachesOnce() {
  Harness h;
  auto    initiated = h.initiator->Initiate(Ctx(), File("a.jpg", 10));
  h.Upload(initiated, 9);
  assert(Throws<util::SizeMismatch>([&] { h.completion->Complete(Ctx(), h.Request(initiated.session_id)); }));

  auto first = h.lifecycle->Escalate(Ctx(), initiated.session_id, "upload keeps failing");
  assert(first.newly_attached);
  assert(first.ticket_id == "TICKET-1");
  assert(h.tickets->last_summary == "upload keeps failing");

  auto second = h.lifecycle->Escalate(Ctx(), initiated.session_id, "again");
  assert(!second.newly_attached);
  assert(second.ticket_id == "TICKET-1");
  assert(h.tickets->opened == 1);
  assert(h.Session(initiated.session_id).escalation_ticket_id == "TICKET-1");
}

void TestReaperExpiresOverdueSessions() {
  Harness h;
  auto    overdue   = h.initiator->Initiate(Ctx(), File("a.jpg", 10));
  auto    multipart = h.initiator->Initiate(Ctx(), File("film.mov", 250 * kMiB));
  auto    transfer  = h.initiator->InitiateMultipart(Ctx(), multipart.session_id);
  auto    done      = h.initiator->Initiate(Ctx(), File("b.jpg", 10));
  h.Upload(done, 10);
  h.completion->Complete(Ctx(), h.Request(done.session_id));

  h.clock.Advance(std::chrono::minutes(30));
  auto fresh = h.initiator->Initiate(Ctx(), File("c.jpg", 10));
  h.clock.Advance(std::chrono::minutes(31));

  auto reaped = h.lifecycle->ReapExpired(0);
  assert(reaped.size() == 2);
  assert(h.Session(overdue.session_id).status == SessionStatus::kExpired);
  assert(h.Session(overdue.session_id).failure_reason == "expired");
  assert(h.Session(multipart.session_id).status == SessionStatus::kExpired);
  assert(!h.store->HasTransfer(transfer.multipart_upload_id));
  assert(h.Session(done.session_id).status == SessionStatus::kCompleted);
  assert(h.Session(fresh.session_id).status == SessionStatus::kInitiating);

  assert(h.lifecycle->ReapExpired(0).empty());
}

void TestReaperHonorsLimit() {
  Harness h;
  for (int i = 0; i < 5; ++i) {
    h.initiator->Initiate(Ctx(), File("f" + std::to_string(i) + ".jpg", 10));
  }
  h.clock.Advance(std::chrono::hours(2));

  assert(h.lifecycle->ReapExpired(2).size() == 2);
  assert(h.lifecycle->ReapExpired(0).size() == 3);
}

} // namespace

int main() {
  TestCancelIsIdempotentAndCleansUp();
  TestCancelSurvivesStoreOutage();
  TestCancelOfCompletedSessionIsNoop();
  TestCancelOfOverdueSessionExpiresIt();
  TestMarkUploading();
  TestMarkUploadingAfterExpiryConflicts();
  TestTouchActivity();
  TestGetSessionAppliesLazyExpiry();
  TestResumeInfoListsUploadedParts();
  TestResumeInfoBlockedStates();
  TestAbortMultipart();
  TestAbortMultipartOfCompletedSessionConflicts();
  TestAbortMultipartLeavesTerminalSessionUntouched();
  TestAbortMultipartExpiresOverdueSession();
  TestEscalationAttachesOnce();
  TestReaperExpiresOverdueSessions();
  TestReaperHonorsLimit();

  std::cout << "session_lifecycle_test: pass\n";
  return 0;
}
