#include <cassert>
#include <iostream>

#include "internal/control/control_channel.hpp"
#include "internal/core/interception_worker.hpp"
#include "support/test_app.hpp"

namespace {

using offline::control::ControlKind;
using offline::control::ParseControlMessage;
using offline::test::TestApp;

void TestParseRecognizesTypesAndAliases() {
  assert(ParseControlMessage(R"({"type":"ACTIVATE_NOW"})") == ControlKind::kActivateNow);
  assert(ParseControlMessage(R"({"type":"SKIP_WAITING"})") == ControlKind::kActivateNow);
  assert(ParseControlMessage(R"({"type":"PURGE_ALL"})") == ControlKind::kPurgeAll);
  assert(ParseControlMessage(R"({"type":"CLEAR_CACHE","reason":"logout"})") == ControlKind::kPurgeAll);
}

void TestParseIgnoresEverythingElse() {
  assert(ParseControlMessage(R"({"type":"RELOAD"})") == ControlKind::kUnknown);
  assert(ParseControlMessage(R"({"kind":"PURGE_ALL"})") == ControlKind::kUnknown);
  assert(ParseControlMessage("PURGE_ALL") == ControlKind::kUnknown);
  assert(ParseControlMessage("") == ControlKind::kUnknown);
}

void TestActivateNowPromotesWaitingVersion() {
  TestApp t;
  t.app.worker->Install(1);
  t.app.worker->Install(2);
  assert(t.app.worker->Status().lifecycle.waiting.has_value());

  assert(t.app.worker->PostMessage(R"({"type":"ACTIVATE_NOW"})") == ControlKind::kActivateNow);

  const auto status = t.app.worker->Status();
  assert(status.lifecycle.active->version == 2);
  assert(!status.lifecycle.waiting.has_value());
  assert(status.generations.size() == 2);
}

void TestPurgeAllDropsEveryGeneration() {
  TestApp t;
  t.app.worker->Install(1);
  assert(!t.app.worker->Status().generations.empty());

  assert(t.app.worker->PostMessage(R"({"type":"PURGE_ALL"})") == ControlKind::kPurgeAll);
  assert(t.app.worker->Status().generations.empty());

  // a later install rebuilds the current generations
  t.app.worker->Install(1);
  assert(t.app.worker->Status().generations.size() == 2);
}

void TestUnknownMessageChangesNothing() {
  TestApp t;
  t.app.worker->Install(1);
  t.app.worker->Install(2);

  assert(t.app.worker->PostMessage("hello") == ControlKind::kUnknown);
  const auto status = t.app.worker->Status();
  assert(status.lifecycle.active->version == 1);
  assert(status.lifecycle.waiting->version == 2);
}

} // namespace

int main() {
  TestParseRecognizesTypesAndAliases();
  TestParseIgnoresEverythingElse();
  TestActivateNowPromotesWaitingVersion();
  TestPurgeAllDropsEveryGeneration();
  TestUnknownMessageChangesNothing();

  std::cout << "offline_worker_unit_control_channel: pass\n";
  return 0;
}
