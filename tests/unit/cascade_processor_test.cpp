#include "internal/core/cascade_processor.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "internal/model/operation_state.hpp"
#include "tests/support/test_support.hpp"

namespace {

using namespace cascade::manager::core::v1;
using cascade::core::ProcessOutcome;
using cascade::testing::Engine;
using cascade::testing::LoadEntity;
using cascade::testing::LoadOperation;
using cascade::testing::MakeEngine;
using cascade::testing::SeedContainer;
using cascade::testing::SeedEntity;
using cascade::testing::SeedTree;

Engine SeededEngine(cascade::core::CascadeOptions options = {}) {
  auto engine = MakeEngine(options);
  SeedContainer(*engine.repository, "c1", "alice");
  return engine;
}

// Root plus `count` direct children named root.0 .. root.N.
void SeedFlat(Engine& engine, uint32_t count) {
  SeedTree(*engine.repository, "c1", "root", count, 1);
}

cascade::db::model::DeleteOperationRecord RunToCompletion(Engine& engine, const std::string& entity_id, bool with_descendants = true) {
  auto record = engine.initiator->Initiate("c1", entity_id, "alice", with_descendants);
  assert(engine.processor->ProcessPending() == 1);
  return LoadOperation(*engine.repository, "c1", record.operation_id);
}

void TestRootWithThreeChildrenCompletes() {
  auto engine = SeededEngine();
  SeedFlat(engine, 3);

  const auto op = RunToCompletion(engine, "root");
  assert(op.status == DELETE_OPERATION_STATUS_COMPLETED);
  assert(op.total_entities == 4);
  assert(op.deleted_count == 4);
  assert(op.failed_count == 0);
  assert(op.failed_entity_ids.empty());
  assert(op.started_at_ms && op.completed_at_ms);
  assert(*op.completed_at_ms >= *op.started_at_ms);

  for (const auto& id : {"root", "root.0", "root.1", "root.2"}) {
    assert(LoadEntity(*engine.repository, "c1", id).is_deleted);
  }
}

void TestTwoFailuresInTenEntitiesIsPartial() {
  cascade::core::CascadeOptions options;
  options.batch_size = 3;

  auto engine = SeededEngine(options);
  SeedFlat(engine, 9);
  engine.repository->FailEntity("root.2");
  engine.repository->FailEntity("root.7");

  const auto op = RunToCompletion(engine, "root");
  assert(op.status == DELETE_OPERATION_STATUS_PARTIAL);
  assert(op.total_entities == 10);
  assert(op.deleted_count == 8);
  assert(op.failed_count == 2);
  assert(op.failed_entity_ids.size() == 2);
  assert(LoadEntity(*engine.repository, "c1", "root.3").is_deleted);
  assert(!LoadEntity(*engine.repository, "c1", "root.2").is_deleted);
  assert(!LoadEntity(*engine.repository, "c1", "root.7").is_deleted);
}

void TestSingleEntityWithoutCascade() {
  auto engine = SeededEngine();
  SeedEntity(*engine.repository, "c1", "leaf", std::nullopt);

  const auto op = RunToCompletion(engine, "leaf", false);
  assert(op.status == DELETE_OPERATION_STATUS_COMPLETED);
  assert(op.total_entities == 1);
  assert(op.deleted_count == 1);
  assert(!op.cascade);
}

void TestDeletionFieldsAreStampedTogether() {
  auto engine = SeededEngine();
  SeedFlat(engine, 1);

  const auto before = LoadEntity(*engine.repository, "c1", "root.0");
  assert(!before.is_deleted && !before.deleted_at_ms && !before.deleted_by && !before.expires_after_s);

  RunToCompletion(engine, "root");
  const auto child = LoadEntity(*engine.repository, "c1", "root.0");
  assert(child.is_deleted);
  assert(child.deleted_at_ms && *child.deleted_at_ms > 0);
  assert(child.deleted_by && *child.deleted_by == "alice");
  assert(child.expires_after_s && *child.expires_after_s == 90ull * 24 * 3600);
}

void TestAlreadyDeletedRootCompletesWithoutWrites() {
  auto engine = SeededEngine();
  SeedEntity(*engine.repository, "c1", "root", std::nullopt, true);
  SeedEntity(*engine.repository, "c1", "child", std::string("root"), true);

  const auto op = RunToCompletion(engine, "root");
  assert(op.status == DELETE_OPERATION_STATUS_COMPLETED);
  assert(op.total_entities == 0);
  assert(op.deleted_count == 0);

  // Seeded deletion stamp is left as is.
  const auto root = LoadEntity(*engine.repository, "c1", "root");
  assert(root.deleted_by && *root.deleted_by == "seed");
  assert(root.deleted_at_ms && *root.deleted_at_ms == 1);
}

void TestDeletedAncestorDoesNotHideLiveDescendants() {
  auto engine = SeededEngine();
  SeedEntity(*engine.repository, "c1", "root", std::nullopt);
  SeedEntity(*engine.repository, "c1", "mid", std::string("root"), true);
  SeedEntity(*engine.repository, "c1", "leaf", std::string("mid"));

  const auto op = RunToCompletion(engine, "root");
  assert(op.status == DELETE_OPERATION_STATUS_COMPLETED);
  assert(op.total_entities == 2);
  assert(op.deleted_count == 2);
  assert(LoadEntity(*engine.repository, "c1", "leaf").is_deleted);
}

void TestDeepHierarchyIsFullyDeleted() {
  cascade::core::CascadeOptions options;
  options.batch_size          = 4;
  options.discovery_page_size = 2;

  auto engine = SeededEngine(options);
  const auto ids = SeedTree(*engine.repository, "c1", "root", 3, 3);
  assert(ids.size() == 1 + 3 + 9 + 27);

  const auto op = RunToCompletion(engine, "root");
  assert(op.status == DELETE_OPERATION_STATUS_COMPLETED);
  assert(op.total_entities == ids.size());
  assert(op.deleted_count == ids.size());
  for (const auto& id : ids) {
    assert(LoadEntity(*engine.repository, "c1", id).is_deleted);
  }
}

void TestLongChainIsFullyDeleted() {
  auto engine = SeededEngine();

  constexpr int kDepth = 200;
  SeedEntity(*engine.repository, "c1", "n0", std::nullopt);
  for (int i = 1; i < kDepth; ++i) {
    SeedEntity(*engine.repository, "c1", "n" + std::to_string(i), "n" + std::to_string(i - 1));
  }

  const auto op = RunToCompletion(engine, "n0");
  assert(op.status == DELETE_OPERATION_STATUS_COMPLETED);
  assert(op.total_entities == kDepth);
  assert(op.deleted_count == kDepth);
  assert(LoadEntity(*engine.repository, "c1", "n" + std::to_string(kDepth - 1)).is_deleted);
}

void TestParentCycleTerminates() {
  auto engine = SeededEngine();
  SeedEntity(*engine.repository, "c1", "a", std::string("c"));
  SeedEntity(*engine.repository, "c1", "b", std::string("a"));
  SeedEntity(*engine.repository, "c1", "c", std::string("b"));

  const auto op = RunToCompletion(engine, "a");
  assert(op.status == DELETE_OPERATION_STATUS_COMPLETED);
  assert(op.total_entities == 3);
  assert(op.deleted_count == 3);
}

void TestCycleThroughRootStartedMidway() {
  auto engine = SeededEngine();
  SeedEntity(*engine.repository, "c1", "a", std::string("c"));
  SeedEntity(*engine.repository, "c1", "b", std::string("a"));
  SeedEntity(*engine.repository, "c1", "c", std::string("b"));
  SeedEntity(*engine.repository, "c1", "leaf", std::string("c"));

  const auto op = RunToCompletion(engine, "b");
  assert(op.status == DELETE_OPERATION_STATUS_COMPLETED);
  assert(op.total_entities == 4);
  assert(op.deleted_count == 4);
}

void TestManyFailuresAreRecordedOnce() {
  constexpr int kChildren = 400;

  auto engine = SeededEngine();
  SeedFlat(engine, kChildren);
  for (int i = 0; i < kChildren; ++i) {
    engine.repository->FailEntity("root." + std::to_string(i));
  }

  const auto op = RunToCompletion(engine, "root");
  assert(op.status == DELETE_OPERATION_STATUS_PARTIAL);
  assert(op.deleted_count == 1);
  assert(op.failed_count == kChildren);
  assert(op.failed_entity_ids.size() == static_cast<std::size_t>(kChildren));
  assert(std::set<std::string>(op.failed_entity_ids.begin(), op.failed_entity_ids.end()).size() == op.failed_entity_ids.size());
}

void TestFailedParentStillDeletesChildren() {
  auto engine = SeededEngine();
  SeedTree(*engine.repository, "c1", "root", 2, 2);
  engine.repository->FailEntity("root.0");

  const auto op = RunToCompletion(engine, "root");
  assert(op.status == DELETE_OPERATION_STATUS_PARTIAL);
  assert(op.failed_entity_ids.size() == 1 && op.failed_entity_ids.front() == "root.0");
  assert(LoadEntity(*engine.repository, "c1", "root.0.0").is_deleted);
  assert(LoadEntity(*engine.repository, "c1", "root.0.1").is_deleted);
  assert(op.deleted_count + op.failed_count == op.total_entities);
}

void TestEveryEntityFailingMarksFailed() {
  auto engine = SeededEngine();
  SeedFlat(engine, 2);
  for (const auto& id : {"root", "root.0", "root.1"}) {
    engine.repository->FailEntity(id);
  }

  const auto op = RunToCompletion(engine, "root");
  assert(op.status == DELETE_OPERATION_STATUS_FAILED);
  assert(op.failed_count == 3);
  assert(op.total_entities == 3);
  assert(op.deleted_count == 0);
  assert(!op.error_detail);
}

void TestResumeAfterInterruptionMatchesUninterruptedRun() {
  cascade::core::CascadeOptions options;
  options.batch_size = 2;

  auto engine = SeededEngine(options);
  const auto ids = SeedTree(*engine.repository, "c1", "root", 3, 2);

  // Ledger writes: claim, total, [root], [root.0 root.1], then the
  // checkpoint of [root.2] is lost as if the process died mid-batch.
  engine.repository->InjectOperationUpdateFault(4, 1, cascade::db::ErrorCode::Conflict);

  auto record = engine.initiator->Initiate("c1", "root", "alice");
  assert(engine.processor->ProcessPending() == 0);

  auto interrupted = LoadOperation(*engine.repository, "c1", record.operation_id);
  assert(interrupted.status == DELETE_OPERATION_STATUS_IN_PROGRESS);
  assert(interrupted.deleted_count == 3);
  assert(interrupted.total_entities == ids.size());
  assert(!LoadEntity(*engine.repository, "c1", "root.2").is_deleted);

  engine.repository->ClearFaults();
  cascade::core::CascadeProcessor restarted(engine.repository, engine.ledger, options);
  assert(restarted.ResumeInProgress() == 1);

  const auto op = LoadOperation(*engine.repository, "c1", record.operation_id);
  assert(op.status == DELETE_OPERATION_STATUS_COMPLETED);
  assert(op.deleted_count == ids.size());
  assert(op.total_entities == ids.size());
  for (const auto& id : ids) {
    assert(LoadEntity(*engine.repository, "c1", id).is_deleted);
  }
}

void TestResumeBeforeDiscoveryRecounts() {
  auto engine = SeededEngine();
  SeedFlat(engine, 4);

  // Claim lands, the total never does.
  engine.repository->InjectOperationUpdateFault(1, 1, cascade::db::ErrorCode::Conflict);
  auto record = engine.initiator->Initiate("c1", "root", "alice");
  engine.processor->ProcessPending();

  auto interrupted = LoadOperation(*engine.repository, "c1", record.operation_id);
  assert(interrupted.status == DELETE_OPERATION_STATUS_IN_PROGRESS);
  assert(interrupted.total_entities == 0);

  engine.repository->ClearFaults();
  assert(engine.processor->ResumeInProgress() == 1);

  const auto op = LoadOperation(*engine.repository, "c1", record.operation_id);
  assert(op.status == DELETE_OPERATION_STATUS_COMPLETED);
  assert(op.total_entities == 5);
  assert(op.deleted_count == 5);
}

void TestRetryOnlyRevisitsFailures() {
  auto engine = SeededEngine();
  SeedFlat(engine, 4);
  engine.repository->FailEntity("root.3");

  auto first = RunToCompletion(engine, "root");
  assert(first.status == DELETE_OPERATION_STATUS_PARTIAL);
  assert(first.deleted_count == 4);
  const auto stamp = *LoadEntity(*engine.repository, "c1", "root.0").deleted_at_ms;

  engine.repository->ClearFaults();
  engine.initiator->Retry("c1", first.operation_id, "alice");
  assert(engine.processor->ProcessPending() == 1);

  const auto op = LoadOperation(*engine.repository, "c1", first.operation_id);
  assert(op.status == DELETE_OPERATION_STATUS_COMPLETED);
  assert(op.total_entities == 1);
  assert(op.deleted_count == 1);
  assert(op.failed_entity_ids.empty());
  assert(LoadEntity(*engine.repository, "c1", "root.3").is_deleted);
  assert(*LoadEntity(*engine.repository, "c1", "root.0").deleted_at_ms == stamp);
}

void TestLedgerWriteFailureMarksOperationFailed() {
  auto engine = SeededEngine();
  SeedFlat(engine, 2);

  // claim and total succeed; the first checkpoint hits a storage error.
  engine.repository->InjectOperationUpdateFault(2, 1, cascade::db::ErrorCode::IOError);

  auto record = engine.initiator->Initiate("c1", "root", "alice");
  assert(engine.processor->ProcessPending() == 1);

  const auto op = LoadOperation(*engine.repository, "c1", record.operation_id);
  assert(op.status == DELETE_OPERATION_STATUS_FAILED);
  assert(op.error_detail);
  assert(op.error_detail->find("injected ledger fault") != std::string::npos);
  assert(op.completed_at_ms);
  // The batch that could not be checkpointed was rolled back.
  assert(!LoadEntity(*engine.repository, "c1", "root").is_deleted);

  // Failed operations may be retried.
  engine.repository->ClearFaults();
  engine.initiator->Retry("c1", record.operation_id, "alice");
  engine.processor->ProcessPending();
  const auto retried = LoadOperation(*engine.repository, "c1", record.operation_id);
  assert(retried.status == DELETE_OPERATION_STATUS_COMPLETED);
  assert(!retried.error_detail);
  assert(retried.deleted_count == 3);
}

void TestTerminalOperationsAreSkipped() {
  auto engine = SeededEngine();
  SeedEntity(*engine.repository, "c1", "root", std::nullopt);

  auto op = RunToCompletion(engine, "root");
  assert(engine.processor->Process(op) == ProcessOutcome::kSkipped);
  assert(LoadOperation(*engine.repository, "c1", op.operation_id).version == op.version);
}

void TestPruneRemovesExpiredTerminalOperations() {
  cascade::core::CascadeOptions options;
  options.operation_retention = std::chrono::seconds(0);

  auto engine = SeededEngine(options);
  SeedEntity(*engine.repository, "c1", "a", std::nullopt);
  SeedEntity(*engine.repository, "c1", "b", std::nullopt);

  RunToCompletion(engine, "a");
  engine.initiator->Initiate("c1", "b", "alice");

  assert(engine.processor->PruneExpired() == 1);

  auto tx = engine.repository->Begin();
  assert(engine.ledger->ListByStatus(*tx, DELETE_OPERATION_STATUS_PENDING, 10).size() == 1);
}

} // namespace

int main() {
  TestRootWithThreeChildrenCompletes();
  TestTwoFailuresInTenEntitiesIsPartial();
  TestSingleEntityWithoutCascade();
  TestDeletionFieldsAreStampedTogether();
  TestAlreadyDeletedRootCompletesWithoutWrites();
  TestDeletedAncestorDoesNotHideLiveDescendants();
  TestDeepHierarchyIsFullyDeleted();
  TestLongChainIsFullyDeleted();
  TestParentCycleTerminates();
  TestCycleThroughRootStartedMidway();
  TestManyFailuresAreRecordedOnce();
  TestFailedParentStillDeletesChildren();
  TestEveryEntityFailingMarksFailed();
  TestResumeAfterInterruptionMatchesUninterruptedRun();
  TestResumeBeforeDiscoveryRecounts();
  TestRetryOnlyRevisitsFailures();
  TestLedgerWriteFailureMarksOperationFailed();
  TestTerminalOperationsAreSkipped();
  TestPruneRemovesExpiredTerminalOperations();

  std::cout << "cascade_unit_cascade_processor: pass\n";
  return 0;
}
