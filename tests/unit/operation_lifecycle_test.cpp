#include "internal/core/operation_lifecycle.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/model/operation_state.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace cascade::manager::core::v1;
namespace lifecycle = cascade::core::lifecycle;

lifecycle::Record PendingRecord() {
  lifecycle::Record record;
  record.operation_id   = "op-1";
  record.container_id   = "c1";
  record.root_entity_id = "root";
  record.status         = DELETE_OPERATION_STATUS_PENDING;
  return record;
}

void TestCompletionRule() {
  assert(lifecycle::CompletionStatus(0, 0, 0) == DELETE_OPERATION_STATUS_COMPLETED);
  assert(lifecycle::CompletionStatus(5, 0, 0) == DELETE_OPERATION_STATUS_COMPLETED);
  assert(lifecycle::CompletionStatus(5, 5, 0) == DELETE_OPERATION_STATUS_COMPLETED);
  assert(lifecycle::CompletionStatus(5, 4, 1) == DELETE_OPERATION_STATUS_PARTIAL);
  assert(lifecycle::CompletionStatus(5, 0, 5) == DELETE_OPERATION_STATUS_FAILED);
}

void TestStartStampsAndMovesToInProgress() {
  auto record = PendingRecord();
  lifecycle::Start(record, 3, 1000);

  assert(record.status == DELETE_OPERATION_STATUS_IN_PROGRESS);
  assert(record.total_entities == 3);
  assert(record.started_at_ms && *record.started_at_ms == 1000);
  assert(!record.completed_at_ms);

  bool threw = false;
  try {
    lifecycle::Start(record, 3, 2000);
  } catch (const cascade::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestFailuresAreDeduplicated() {
  auto record = PendingRecord();
  lifecycle::Start(record, 2, 1);

  lifecycle::FailureLog failures(record);
  assert(failures.Add("a"));
  assert(!failures.Add("a"));
  assert(record.failed_count == 1);
  assert(record.failed_entity_ids.size() == 1);
  assert(failures.Contains("a"));
  assert(!failures.Contains("b"));

  // A log built over an existing record sees earlier failures.
  lifecycle::FailureLog resumed(record);
  assert(resumed.Contains("a"));
  assert(!resumed.Add("a"));
  assert(resumed.Add("b"));
  assert(record.failed_entity_ids == std::vector<std::string>({"a", "b"}));
}

void TestTotalNeverFallsBelowProcessed() {
  auto record = PendingRecord();
  lifecycle::Start(record, 1, 1);

  lifecycle::RecordDeleted(record);
  lifecycle::RecordDeleted(record);
  lifecycle::FailureLog{record}.Add("x");

  assert(record.deleted_count == 2);
  assert(record.failed_count == 1);
  assert(record.total_entities == 3);
}

void TestFinalizeAppliesCompletionRule() {
  auto partial = PendingRecord();
  lifecycle::Start(partial, 2, 1);
  lifecycle::RecordDeleted(partial);
  lifecycle::FailureLog{partial}.Add("b");
  assert(lifecycle::Finalize(partial, 50) == DELETE_OPERATION_STATUS_PARTIAL);
  assert(partial.completed_at_ms && *partial.completed_at_ms == 50);

  auto empty = PendingRecord();
  lifecycle::Start(empty, 0, 1);
  assert(lifecycle::Finalize(empty, 2) == DELETE_OPERATION_STATUS_COMPLETED);
  assert(cascade::model::IsTerminal(empty.status));
}

void TestFailRecordsDetail() {
  auto record = PendingRecord();
  lifecycle::Start(record, 4, 1);
  lifecycle::Fail(record, "database unavailable", 9);

  assert(record.status == DELETE_OPERATION_STATUS_FAILED);
  assert(record.error_detail && *record.error_detail == "database unavailable");
  assert(record.completed_at_ms && *record.completed_at_ms == 9);
}

void TestTerminalStatesRejectFurtherTransitions() {
  auto record = PendingRecord();
  lifecycle::Start(record, 1, 1);
  lifecycle::RecordDeleted(record);
  lifecycle::Finalize(record, 2);

  bool threw = false;
  try {
    lifecycle::Fail(record, "late", 3);
  } catch (const cascade::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(record.status == DELETE_OPERATION_STATUS_COMPLETED);
}

void TestResetForRetry() {
  auto record = PendingRecord();
  lifecycle::Start(record, 2, 1);
  lifecycle::RecordDeleted(record);
  lifecycle::FailureLog{record}.Add("b");
  lifecycle::Finalize(record, 2);

  lifecycle::ResetForRetry(record);
  assert(record.status == DELETE_OPERATION_STATUS_PENDING);
  assert(record.total_entities == 0);
  assert(record.deleted_count == 0);
  assert(record.failed_count == 0);
  assert(record.failed_entity_ids.empty());
  assert(!record.started_at_ms);
  assert(!record.completed_at_ms);

  bool threw = false;
  try {
    lifecycle::ResetForRetry(record);
  } catch (const cascade::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCompletionRule();
  TestStartStampsAndMovesToInProgress();
  TestFailuresAreDeduplicated();
  TestTotalNeverFallsBelowProcessed();
  TestFinalizeAppliesCompletionRule();
  TestFailRecordsDetail();
  TestTerminalStatesRejectFurtherTransitions();
  TestResetForRetry();

  std::cout << "cascade_unit_operation_lifecycle: pass\n";
  return 0;
}
