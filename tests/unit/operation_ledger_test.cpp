#include "internal/ledger/operation_ledger.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/core/operation_lifecycle.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace cascade::manager::core::v1;
using cascade::db::model::DeleteOperationRecord;

DeleteOperationRecord MakeRecord(const std::string& operation_id, const std::string& root_entity_id, uint64_t created_at_ms) {
  DeleteOperationRecord record;
  record.operation_id     = operation_id;
  record.container_id     = "c1";
  record.root_entity_id   = root_entity_id;
  record.root_entity_name = "name-" + root_entity_id;
  record.status           = DELETE_OPERATION_STATUS_PENDING;
  record.created_by       = "alice";
  record.created_at_ms    = created_at_ms;
  return record;
}

void TestCreateStampsExpiryAndRejectsDuplicates() {
  auto                            repo = std::make_shared<cascade::db::memory::MemoryRepository>();
  cascade::ledger::OperationLedger operation_ledger(repo, std::chrono::hours(1));

  auto record       = MakeRecord("op-1", "root", cascade::util::NowMillis());
  const auto before = cascade::util::NowMillis();
  {
    auto tx = repo->Begin();
    operation_ledger.Create(*tx, record);
    tx->Commit();
  }
  assert(record.version == 0);
  assert(record.expires_at_ms >= before + 3'600'000);

  bool threw = false;
  try {
    auto tx        = repo->Begin();
    auto duplicate = MakeRecord("op-1", "other", cascade::util::NowMillis());
    operation_ledger.Create(*tx, duplicate);
  } catch (const cascade::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
}

void TestStaleUpdateReportsLostRace() {
  auto                            repo = std::make_shared<cascade::db::memory::MemoryRepository>();
  cascade::ledger::OperationLedger operation_ledger(repo, std::chrono::hours(1));

  auto record = MakeRecord("op-1", "root", cascade::util::NowMillis());
  {
    auto tx = repo->Begin();
    operation_ledger.Create(*tx, record);
    tx->Commit();
  }

  auto first  = record;
  auto second = record;
  {
    auto tx = repo->Begin();
    cascade::core::lifecycle::Start(first, 1, cascade::util::NowMillis());
    assert(operation_ledger.TryUpdate(*tx, first));
    tx->Commit();
  }
  assert(first.version == 1);

  {
    auto tx                  = repo->Begin();
    const auto stale_expires = second.expires_at_ms;
    cascade::core::lifecycle::Start(second, 1, cascade::util::NowMillis());
    assert(!operation_ledger.TryUpdate(*tx, second));
    assert(second.version == 0);
    assert(second.expires_at_ms == stale_expires);
  }

  auto tx     = repo->Begin();
  auto stored = operation_ledger.Find(*tx, "c1", "op-1");
  assert(stored && stored->version == 1);
  assert(stored->status == DELETE_OPERATION_STATUS_IN_PROGRESS);
}

void TestExpiredTerminalRecordsAreHiddenAndPruned() {
  auto                            repo = std::make_shared<cascade::db::memory::MemoryRepository>();
  cascade::ledger::OperationLedger operation_ledger(repo, std::chrono::seconds(0));

  auto done    = MakeRecord("op-done", "a", cascade::util::NowMillis());
  auto pending = MakeRecord("op-pending", "b", cascade::util::NowMillis());
  {
    auto tx = repo->Begin();
    operation_ledger.Create(*tx, done);
    operation_ledger.Create(*tx, pending);

    cascade::core::lifecycle::Start(done, 0, cascade::util::NowMillis());
    cascade::core::lifecycle::Finalize(done, cascade::util::NowMillis());
    assert(operation_ledger.TryUpdate(*tx, done));
    tx->Commit();
  }

  {
    auto tx = repo->Begin();
    assert(!operation_ledger.Find(*tx, "c1", "op-done"));
    assert(operation_ledger.Find(*tx, "c1", "op-pending"));
    // The stored row is still there until pruned.
    assert(repo->GetOperation(*tx, "c1", "op-done"));
    tx->Commit();
  }

  {
    auto tx = repo->Begin();
    assert(operation_ledger.PruneExpired(*tx) == 1);
    tx->Commit();
  }

  auto tx = repo->Begin();
  assert(!repo->GetOperation(*tx, "c1", "op-done"));
  assert(repo->GetOperation(*tx, "c1", "op-pending"));
}

void TestLiveQueries() {
  auto                            repo = std::make_shared<cascade::db::memory::MemoryRepository>();
  cascade::ledger::OperationLedger operation_ledger(repo, std::chrono::hours(1));

  auto first  = MakeRecord("op-1", "a", 1);
  auto second = MakeRecord("op-2", "b", 2);
  auto other  = MakeRecord("op-3", "c", 3);
  other.created_by = "bob";

  auto tx = repo->Begin();
  operation_ledger.Create(*tx, first);
  operation_ledger.Create(*tx, second);
  operation_ledger.Create(*tx, other);

  assert(operation_ledger.CountLive(*tx, "c1", "alice") == 2);
  assert(operation_ledger.CountLive(*tx, "c1", "bob") == 1);
  assert(operation_ledger.CountLive(*tx, "c2", "alice") == 0);

  auto live = operation_ledger.FindLiveForRoot(*tx, "c1", "b");
  assert(live && live->operation_id == "op-2");
  assert(!operation_ledger.FindLiveForRoot(*tx, "c1", "zzz"));

  auto pending = operation_ledger.ListByStatus(*tx, DELETE_OPERATION_STATUS_PENDING, 2);
  assert(pending.size() == 2);
  assert(pending[0].operation_id == "op-1");
  assert(pending[1].operation_id == "op-2");
  tx->Commit();
}

} // namespace

int main() {
  TestCreateStampsExpiryAndRejectsDuplicates();
  TestStaleUpdateReportsLostRace();
  TestExpiredTerminalRecordsAreHiddenAndPruned();
  TestLiveQueries();

  std::cout << "cascade_unit_operation_ledger: pass\n";
  return 0;
}
