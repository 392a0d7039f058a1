#include "internal/model/session_state.hpp"

#include <array>
#include <cassert>
#include <iostream>

namespace {

using upload::model::CanTransition;
using upload::model::IsTerminal;
using upload::model::SessionStatus;

constexpr std::array<SessionStatus, 6> kAll = {SessionStatus::kInitiating, SessionStatus::kUploading, SessionStatus::kCompleted,
                                               SessionStatus::kCancelled,  SessionStatus::kFailed,    SessionStatus::kExpired};

void TestInitiatingEdges() {
  assert(CanTransition(SessionStatus::kInitiating, SessionStatus::kUploading));
  assert(CanTransition(SessionStatus::kInitiating, SessionStatus::kCompleted));
  assert(CanTransition(SessionStatus::kInitiating, SessionStatus::kCancelled));
  assert(CanTransition(SessionStatus::kInitiating, SessionStatus::kFailed));
  assert(CanTransition(SessionStatus::kInitiating, SessionStatus::kExpired));
  assert(!CanTransition(SessionStatus::kInitiating, SessionStatus::kInitiating));
}

void TestUploadingEdges() {
  assert(!CanTransition(SessionStatus::kUploading, SessionStatus::kInitiating));
  assert(!CanTransition(SessionStatus::kUploading, SessionStatus::kUploading));
  assert(CanTransition(SessionStatus::kUploading, SessionStatus::kCompleted));
  assert(CanTransition(SessionStatus::kUploading, SessionStatus::kCancelled));
  assert(CanTransition(SessionStatus::kUploading, SessionStatus::kFailed));
  assert(CanTransition(SessionStatus::kUploading, SessionStatus::kExpired));
}

void TestTerminalStatesAreAbsorbing() {
  for (auto from : kAll) {
    if (!IsTerminal(from)) continue;
    for (auto to : kAll) {
      assert(!CanTransition(from, to));
    }
  }
}

void TestTerminalClassification() {
  assert(!IsTerminal(SessionStatus::kInitiating));
  assert(!IsTerminal(SessionStatus::kUploading));
  assert(IsTerminal(SessionStatus::kCompleted));
  assert(IsTerminal(SessionStatus::kCancelled));
  assert(IsTerminal(SessionStatus::kFailed));
  assert(IsTerminal(SessionStatus::kExpired));
}

void TestNothingEntersInitiating() {
  for (auto from : kAll) {
    assert(!CanTransition(from, SessionStatus::kInitiating));
  }
  assert(!CanTransition(SessionStatus::kUnspecified, SessionStatus::kUploading));
}

void TestNames() {
  static_assert(upload::model::ToString(SessionStatus::kExpired) == "expired");
  assert(upload::model::ToString(SessionStatus::kUploading) == "uploading");
  assert(upload::model::ToString(upload::model::TransferType::kChunked) == "chunked");
  assert(upload::model::ToString(upload::model::UploadMode::kReplace) == "replace");
}

} // namespace

int main() {
  TestInitiatingEdges();
  TestUploadingEdges();
  TestTerminalStatesAreAbsorbing();
  TestTerminalClassification();
  TestNothingEntersInitiating();
  TestNames();

  std::cout << "session_state_test: pass\n";
  return 0;
}
