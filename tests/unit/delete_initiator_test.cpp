#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/model/operation_state.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

using namespace cascade::manager::core::v1;
using cascade::testing::Engine;
using cascade::testing::MakeEngine;
using cascade::testing::SeedContainer;
using cascade::testing::SeedEntity;
using cascade::testing::SeedTree;

Engine SeededEngine(cascade::core::CascadeOptions options = {}) {
  auto engine = MakeEngine(options);
  SeedContainer(*engine.repository, "c1", "alice");
  return engine;
}

void TestInitiateRecordsPendingOperation() {
  auto engine = SeededEngine();
  SeedTree(*engine.repository, "c1", "root", 2, 1);

  auto record = engine.initiator->Initiate("c1", "root", "alice");
  assert(!record.operation_id.empty());
  assert(record.status == DELETE_OPERATION_STATUS_PENDING);
  assert(record.root_entity_name == "name-root");
  assert(record.created_by == "alice");
  assert(record.cascade);
  assert(record.total_entities == 0);

  // Nothing is deleted until the processor runs.
  assert(!cascade::testing::LoadEntity(*engine.repository, "c1", "root").is_deleted);

  auto stored = cascade::testing::LoadOperation(*engine.repository, "c1", record.operation_id);
  assert(stored.status == DELETE_OPERATION_STATUS_PENDING);
  assert(stored.expires_at_ms > stored.created_at_ms);
}

void TestNonCascadeWithLiveChildrenIsRejected() {
  auto engine = SeededEngine();
  SeedEntity(*engine.repository, "c1", "parent", std::nullopt);
  SeedEntity(*engine.repository, "c1", "child", std::string("parent"));

  bool threw = false;
  try {
    engine.initiator->Initiate("c1", "parent", "alice", false);
  } catch (const cascade::util::HasChildren& e) {
    threw = true;
    assert(std::string(e.what()) ==
           "Cannot delete entity 'name-parent' (ID: 'parent') without cascade: it has child entities. Use cascade=true to delete all "
           "descendants.");
  }
  assert(threw);

  auto tx = engine.repository->Begin();
  assert(engine.ledger->CountLive(*tx, "c1", "alice") == 0);
}

void TestNonCascadeIgnoresDeletedChildren() {
  auto engine = SeededEngine();
  SeedEntity(*engine.repository, "c1", "parent", std::nullopt);
  SeedEntity(*engine.repository, "c1", "gone", std::string("parent"), true);

  auto record = engine.initiator->Initiate("c1", "parent", "alice", false);
  assert(!record.cascade);
}

void TestSixthConcurrentRequestIsRateLimited() {
  auto engine = SeededEngine();
  for (int i = 0; i < 6; ++i) {
    SeedEntity(*engine.repository, "c1", "e" + std::to_string(i), std::nullopt);
  }

  for (int i = 0; i < 5; ++i) {
    engine.initiator->Initiate("c1", "e" + std::to_string(i), "alice");
  }

  bool threw = false;
  try {
    engine.initiator->Initiate("c1", "e5", "alice");
  } catch (const cascade::util::RateLimited& e) {
    threw = true;
    assert(e.ActiveCount() == 5);
    assert(e.MaxAllowed() == 5);
    assert(e.RetryAfterSeconds() == 30);
  }
  assert(threw);

  auto tx = engine.repository->Begin();
  assert(engine.limiter->CountActive(*tx, "c1", "alice") == 5);
}

void TestRateLimitIsPerActor() {
  cascade::core::CascadeOptions options;
  options.max_concurrent_per_actor = 1;

  auto engine = MakeEngine(options);
  SeedContainer(*engine.repository, "c1", "alice");
  SeedEntity(*engine.repository, "c1", "a", std::nullopt);
  SeedEntity(*engine.repository, "c1", "b", std::nullopt);

  engine.initiator->Initiate("c1", "a", "alice");

  // bob is refused by the owner policy before any limit applies.
  bool denied = false;
  try {
    engine.initiator->Initiate("c1", "b", "bob");
  } catch (const cascade::util::PermissionDenied&) {
    denied = true;
  }
  assert(denied);

  bool limited = false;
  try {
    engine.initiator->Initiate("c1", "b", "alice");
  } catch (const cascade::util::RateLimited&) {
    limited = true;
  }
  assert(limited);
}

void TestLiveOperationOnSameRootIsRejected() {
  auto engine = SeededEngine();
  SeedEntity(*engine.repository, "c1", "root", std::nullopt);

  auto first = engine.initiator->Initiate("c1", "root", "alice");

  bool threw = false;
  try {
    engine.initiator->Initiate("c1", "root", "alice");
  } catch (const cascade::util::AlreadyExists& e) {
    threw = true;
    assert(std::string(e.what()).find(first.operation_id) != std::string::npos);
  }
  assert(threw);
}

void TestUnknownContainerAndEntity() {
  auto engine = SeededEngine();

  bool missing_container = false;
  try {
    engine.initiator->Initiate("nope", "root", "alice");
  } catch (const cascade::util::NotFound& e) {
    missing_container = true;
    assert(std::string(e.what()) == "Container 'nope' not found.");
  }
  assert(missing_container);

  bool missing_entity = false;
  try {
    engine.initiator->Initiate("c1", "ghost", "alice");
  } catch (const cascade::util::NotFound&) {
    missing_entity = true;
  }
  assert(missing_entity);
}

void TestRetryRequiresRetryableStatus() {
  auto engine = SeededEngine();
  SeedEntity(*engine.repository, "c1", "root", std::nullopt);

  auto record = engine.initiator->Initiate("c1", "root", "alice");

  bool threw = false;
  try {
    engine.initiator->Retry("c1", record.operation_id, "alice");
  } catch (const cascade::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  bool missing = false;
  try {
    engine.initiator->Retry("c1", "no-such-operation", "alice");
  } catch (const cascade::util::NotFound& e) {
    missing = true;
    assert(std::string(e.what()) == "Delete operation 'no-such-operation' not found or has expired.");
  }
  assert(missing);
}

void TestRetryRequeuesPartialOperation() {
  auto engine = SeededEngine();
  SeedTree(*engine.repository, "c1", "root", 2, 1);
  engine.repository->FailEntity("root.1");

  auto record = engine.initiator->Initiate("c1", "root", "alice");
  engine.processor->ProcessPending();

  auto partial = cascade::testing::LoadOperation(*engine.repository, "c1", record.operation_id);
  assert(partial.status == DELETE_OPERATION_STATUS_PARTIAL);

  auto retried = engine.initiator->Retry("c1", record.operation_id, "alice");
  assert(retried.status == DELETE_OPERATION_STATUS_PENDING);
  assert(retried.failed_entity_ids.empty());
  assert(retried.deleted_count == 0);
  assert(retried.version == partial.version + 1);

  // A retried operation counts against the ceiling again.
  auto tx = engine.repository->Begin();
  assert(engine.limiter->CountActive(*tx, "c1", "alice") == 1);
}

void TestRetryRejectedWhileRootHasNewerLiveOperation() {
  auto engine = SeededEngine();
  SeedTree(*engine.repository, "c1", "root", 2, 1);
  engine.repository->FailEntity("root.1");

  auto first = engine.initiator->Initiate("c1", "root", "alice");
  engine.processor->ProcessPending();
  assert(cascade::testing::LoadOperation(*engine.repository, "c1", first.operation_id).status == DELETE_OPERATION_STATUS_PARTIAL);

  auto second = engine.initiator->Initiate("c1", "root", "alice");

  bool threw = false;
  try {
    engine.initiator->Retry("c1", first.operation_id, "alice");
  } catch (const cascade::util::AlreadyExists& e) {
    threw = true;
    assert(std::string(e.what()).find(second.operation_id) != std::string::npos);
  }
  assert(threw);

  assert(cascade::testing::LoadOperation(*engine.repository, "c1", first.operation_id).status == DELETE_OPERATION_STATUS_PARTIAL);
  auto tx = engine.repository->Begin();
  assert(engine.limiter->CountActive(*tx, "c1", "alice") == 1);
}

void TestConcurrentRequestsNeverExceedCeiling() {
  auto engine = SeededEngine();
  for (int i = 0; i < 8; ++i) {
    SeedEntity(*engine.repository, "c1", "e" + std::to_string(i), std::nullopt);
  }

  std::atomic<int>         admitted{0};
  std::atomic<int>         limited{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i] {
      try {
        engine.initiator->Initiate("c1", "e" + std::to_string(i), "alice");
        ++admitted;
      } catch (const cascade::util::RateLimited&) {
        ++limited;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(admitted == 5);
  assert(limited == 3);
}

} // namespace

int main() {
  TestInitiateRecordsPendingOperation();
  TestNonCascadeWithLiveChildrenIsRejected();
  TestNonCascadeIgnoresDeletedChildren();
  TestSixthConcurrentRequestIsRateLimited();
  TestRateLimitIsPerActor();
  TestLiveOperationOnSameRootIsRejected();
  TestUnknownContainerAndEntity();
  TestRetryRequiresRetryableStatus();
  TestRetryRequeuesPartialOperation();
  TestRetryRejectedWhileRootHasNewerLiveOperation();
  TestConcurrentRequestsNeverExceedCeiling();

  std::cout << "cascade_unit_delete_initiator: pass\n";
  return 0;
}
