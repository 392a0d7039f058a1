#include "internal/db/memory/memory_repository.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <variant>

namespace {

using upload::db::AssetCreated;
using upload::db::memory::MemoryRepository;
using upload::db::model::AssetRecord;
using upload::db::model::UploadSessionRecord;
using upload::model::SessionStatus;

UploadSessionRecord MakeSession(const std::string& id) {
  UploadSessionRecord session;
  session.id            = id;
  session.tenant_id     = "acme";
  session.bucket        = "uploads-acme";
  session.object_key    = "temp/uploads/" + id + "/original";
  session.expires_at_ms = 1000;
  return session;
}

void TestRolledBackWritesAreDiscarded() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, MakeSession("s-1")));
    assert(repo.GetSession(*tx, "s-1").has_value());
    tx->Rollback();
    assert(tx->IsCommitted());
  }

  auto tx = repo.Begin();
  assert(!repo.GetSession(*tx, "s-1").has_value());
  tx->Commit();
}

void TestCommitTwiceThrows() {
  MemoryRepository repo;
  auto             tx = repo.Begin();
  tx->Commit();

  bool threw = false;
  try {
    tx->Commit();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestTransactionsAreSerialized() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.InsertSession(*tx, MakeSession("s-2")));
    tx->Commit();
  }

  std::atomic<bool> second_started{false};
  std::atomic<bool> second_done{false};

  auto holder = repo.Begin();
  auto locked = repo.GetSessionForUpdate(*holder, "s-2");
  locked->status = SessionStatus::kUploading;
  assert(repo.UpdateSession(*holder, *locked));

  std::thread second([&] {
    second_started = true;
    auto tx        = repo.Begin();
    auto seen      = repo.GetSessionForUpdate(*tx, "s-2");
    // the first writer committed before this transaction could start
    assert(seen->status == SessionStatus::kUploading);
    tx->Commit();
    second_done = true;
  });

  while (!second_started) std::this_thread::yield();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(!second_done);

  holder->Commit();
  second.join();
  assert(second_done);
}

void TestExpiredListingSkipsTerminalSessions() {
  MemoryRepository repo;
  auto             tx = repo.Begin();

  auto live    = MakeSession("live");
  auto expired = MakeSession("expired");
  expired.status = SessionStatus::kExpired;
  auto future  = MakeSession("future");
  future.expires_at_ms = 5000;

  assert(repo.InsertSession(*tx, live));
  assert(repo.InsertSession(*tx, expired));
  assert(repo.InsertSession(*tx, future));

  auto due = repo.ListExpiredSessions(*tx, 1000, 0);
  assert(due.size() == 1);
  assert(due[0].id == "live");
  tx->Commit();
}

void TestUpdateAssetRejectsSecondLiveAssetWithoutMutating() {
  MemoryRepository repo;
  auto             tx = repo.Begin();

  AssetRecord a;
  a.id                = "asset-a";
  a.tenant_id         = "acme";
  a.upload_session_id = "s-a";
  AssetRecord b       = a;
  b.id                = "asset-b";
  b.upload_session_id = "s-b";

  assert(std::holds_alternative<AssetCreated>(repo.InsertAsset(*tx, a)));
  assert(std::holds_alternative<AssetCreated>(repo.InsertAsset(*tx, b)));

  b.upload_session_id = "s-a";
  b.title             = "changed";
  assert(!repo.UpdateAsset(*tx, b));
  assert(repo.GetAsset(*tx, "asset-b")->title.empty());
  assert(repo.FindAssetBySession(*tx, "s-b")->id == "asset-b");
  tx->Commit();
}

} // namespace

int main() {
  TestRolledBackWritesAreDiscarded();
  TestCommitTwiceThrows();
  TestTransactionsAreSerialized();
  TestExpiredListingSkipsTerminalSessions();
  TestUpdateAssetRejectsSecondLiveAssetWithoutMutating();

  std::cout << "memory_repository_test: pass\n";
  return 0;
}
