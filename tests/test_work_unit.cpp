#include <gtest/gtest.h>

#include "core/stage_error.h"
#include "core/work_unit.h"

using namespace stagehand::core;

// ============================================================
// Test: Legal state transitions
// ============================================================

TEST(UnitStateMachine, PendingToReadyToRunning) {
  ExecutionState s;
  ASSERT_EQ(s.status, UnitStatus::Pending);

  ASSERT_TRUE(s.transition_to(UnitStatus::Ready, 100).is_ok());
  ASSERT_EQ(s.status, UnitStatus::Ready);
  ASSERT_FALSE(s.started_at_ms.has_value());

  ASSERT_TRUE(s.transition_to(UnitStatus::Running, 110).is_ok());
  ASSERT_EQ(s.status, UnitStatus::Running);
  ASSERT_EQ(*s.started_at_ms, 110);
}

TEST(UnitStateMachine, BlockedWaitsThenBecomesReady) {
  ExecutionState s;
  ASSERT_TRUE(s.transition_to(UnitStatus::Blocked, 1).is_ok());
  ASSERT_TRUE(s.transition_to(UnitStatus::Ready, 2).is_ok());
  ASSERT_EQ(s.status, UnitStatus::Ready);
}

TEST(UnitStateMachine, TerminalStatesStampFinishTime) {
  ExecutionState s;
  s.transition_to(UnitStatus::Ready, 1000);
  s.transition_to(UnitStatus::Running, 1000);
  ASSERT_TRUE(s.transition_to(UnitStatus::Succeeded, 1250).is_ok());
  ASSERT_TRUE(s.finished_at_ms.has_value());
  ASSERT_EQ(s.duration_ms(), 250);
}

TEST(UnitStateMachine, StaleClaimTakeoverKeepsStartTime) {
  ExecutionState s;
  s.transition_to(UnitStatus::Ready, 10);
  s.transition_to(UnitStatus::Running, 20);
  ASSERT_TRUE(s.transition_to(UnitStatus::Ready, 500).is_ok());
  ASSERT_TRUE(s.transition_to(UnitStatus::Running, 510).is_ok());
  ASSERT_EQ(*s.started_at_ms, 20);
}

TEST(UnitStateMachine, ResumeResetsFailedUnit) {
  ExecutionState s;
  s.transition_to(UnitStatus::Ready, 1);
  s.transition_to(UnitStatus::Running, 2);
  s.attempt_count = 3;
  s.owner = "engine-a";
  s.outputs["k"] = "v";
  s.last_error = StageError::Execution("boom");
  ASSERT_TRUE(s.transition_to(UnitStatus::Failed, 3).is_ok());

  ASSERT_TRUE(s.transition_to(UnitStatus::Pending, 4).is_ok());
  EXPECT_EQ(s.attempt_count, 0);
  EXPECT_FALSE(s.started_at_ms.has_value());
  EXPECT_FALSE(s.finished_at_ms.has_value());
  EXPECT_TRUE(s.owner.empty());
  EXPECT_TRUE(s.outputs.empty());
  // The previous failure stays visible until the unit runs again.
  ASSERT_TRUE(s.last_error.has_value());
  EXPECT_EQ(s.last_error->message, "boom");
}

TEST(UnitStateMachine, SkippedCanBeRequeuedAsBlocked) {
  ExecutionState s;
  s.transition_to(UnitStatus::Blocked, 1);
  ASSERT_TRUE(s.transition_to(UnitStatus::Skipped, 2).is_ok());
  ASSERT_TRUE(s.transition_to(UnitStatus::Blocked, 3).is_ok());
  ASSERT_EQ(s.status, UnitStatus::Blocked);
}

// ============================================================
// Test: Illegal state transitions
// ============================================================

TEST(UnitStateMachine, PendingCannotJumpToRunning) {
  ExecutionState s;
  auto result = s.transition_to(UnitStatus::Running, 1);
  ASSERT_TRUE(result.is_err());
  ASSERT_EQ(result.error().category, ErrorCategory::Internal);
  ASSERT_EQ(s.status, UnitStatus::Pending);
}

TEST(UnitStateMachine, SucceededIsFinal) {
  ExecutionState s;
  s.transition_to(UnitStatus::Ready, 1);
  s.transition_to(UnitStatus::Running, 2);
  s.transition_to(UnitStatus::Succeeded, 3);

  for (auto target : {UnitStatus::Pending, UnitStatus::Blocked,
                      UnitStatus::Ready, UnitStatus::Running,
                      UnitStatus::Failed, UnitStatus::Skipped}) {
    ASSERT_TRUE(s.transition_to(target, 4).is_err()) << to_string(target);
  }
  ASSERT_EQ(s.status, UnitStatus::Succeeded);
}

TEST(UnitStateMachine, BlockedCannotFail) {
  ExecutionState s;
  s.transition_to(UnitStatus::Blocked, 1);
  ASSERT_TRUE(s.transition_to(UnitStatus::Failed, 2).is_err());
}

// ============================================================
// Test: Names
// ============================================================

TEST(UnitStatusNames, RoundTrip) {
  for (auto status : {UnitStatus::Pending, UnitStatus::Blocked,
                      UnitStatus::Ready, UnitStatus::Running,
                      UnitStatus::Succeeded, UnitStatus::Failed,
                      UnitStatus::Skipped}) {
    auto parsed = unit_status_from_string(to_string(status));
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(*parsed, status);
  }
  ASSERT_FALSE(unit_status_from_string("exploded").has_value());
}

TEST(UnitStatusNames, TerminalSet) {
  EXPECT_TRUE(is_terminal(UnitStatus::Succeeded));
  EXPECT_TRUE(is_terminal(UnitStatus::Failed));
  EXPECT_TRUE(is_terminal(UnitStatus::Skipped));
  EXPECT_FALSE(is_terminal(UnitStatus::Running));
  EXPECT_FALSE(is_terminal(UnitStatus::Blocked));
}

TEST(StageErrorNames, KindAndCategoryRoundTrip) {
  EXPECT_STREQ(to_string(ErrorKind::CycleDetected), "CycleDetectedError");
  EXPECT_EQ(error_kind_from_string("CircuitOpenError"), ErrorKind::CircuitOpen);
  EXPECT_EQ(error_kind_from_string("nonsense"), ErrorKind::StageExecution);
  EXPECT_EQ(error_category_from_string(to_string(ErrorCategory::Network)),
            ErrorCategory::Network);
  EXPECT_EQ(error_category_from_string("nonsense"), ErrorCategory::Unknown);
}

TEST(StageErrorFactories, TimeoutCarriesUnitAndBudget) {
  auto e = StageError::Timeout("render", 250);
  EXPECT_EQ(e.kind, ErrorKind::StageTimeout);
  EXPECT_EQ(e.category, ErrorCategory::Timeout);
  EXPECT_TRUE(e.retryable);
  EXPECT_EQ(e.unit_id, "render");
  EXPECT_EQ(e.details.at("timeout_ms"), "250");
}
