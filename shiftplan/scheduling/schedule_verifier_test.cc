// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "shiftplan/scheduling/schedule_verifier.h"

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "shiftplan/scheduling/assignment_matrix.h"
#include "shiftplan/scheduling/horizon.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"
#include "shiftplan/scheduling/shift_scheduling_parameters.pb.h"
#include "shiftplan/scheduling/test_util.h"

namespace shiftplan {
namespace {

using ::testing::HasSubstr;

// Verifies `assignment` against a one worker model whose requirements are
// exactly covered by `assignment`.
absl::Status VerifyCovered(ShiftSchedulingModel model,
                           const AssignmentMatrix& assignment) {
  SetHeadcountsFromAssignment(assignment, &model);
  return VerifyAssignment(model, assignment);
}

TEST(VerifyAssignment, AcceptsValidSchedule) {
  AssignmentMatrix assignment(1);
  AssignHours(0, 0, 0, 8, COOK, &assignment);
  AssignHours(0, 1, 2, 5, COOK, &assignment);
  AssignHours(0, 1, 9, 14, COOK, &assignment);
  AssignHours(0, 4, 4, 14, DISHWASHER, &assignment);
  const absl::Status status =
      VerifyCovered(ModelWithoutNeeds(1, 42, 3), assignment);
  EXPECT_TRUE(status.ok()) << status;
}

TEST(VerifyAssignment, AcceptsIdleWeek) {
  const absl::Status status =
      VerifyAssignment(ModelWithoutNeeds(2, 42, 3), AssignmentMatrix(2));
  EXPECT_TRUE(status.ok()) << status;
}

TEST(VerifyAssignment, WrongNumberOfWorkers) {
  const absl::Status status =
      VerifyAssignment(ModelWithoutNeeds(2, 42, 3), AssignmentMatrix(3));
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(status.message(), HasSubstr("3 workers instead of 2"));
}

TEST(VerifyAssignment, TwoRolesAtOnce) {
  AssignmentMatrix assignment(1);
  AssignHours(0, 0, 0, 4, COOK, &assignment);
  assignment.Assign(0, SlotIndex(0, 1), PIZZA_MAKER);
  const absl::Status status =
      VerifyCovered(ModelWithoutNeeds(1, 42, 3), assignment);
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(status.message(), HasSubstr("has 2 roles at slot 1"));
}

TEST(VerifyAssignment, IneligibleRole) {
  ShiftSchedulingModel model = ModelWithoutNeeds(1, 42, 3);
  model.mutable_workers(0)->clear_eligible_roles();
  model.mutable_workers(0)->add_eligible_roles(COOK);
  AssignmentMatrix assignment(1);
  AssignHours(0, 2, 0, 4, DISHWASHER, &assignment);
  const absl::Status status = VerifyCovered(model, assignment);
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(status.message(),
              HasSubstr("is assigned Dishwasher without being eligible"));
}

TEST(VerifyAssignment, TooFewDailyHours) {
  AssignmentMatrix assignment(1);
  AssignHours(0, 0, 3, 5, COOK, &assignment);
  const absl::Status status =
      VerifyCovered(ModelWithoutNeeds(1, 42, 3), assignment);
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(status.message(), HasSubstr("works 2 hours on Monday"));
}

TEST(VerifyAssignment, TooManyDailyHours) {
  AssignmentMatrix assignment(1);
  AssignHours(0, 6, 0, 11, COOK, &assignment);
  const absl::Status status =
      VerifyCovered(ModelWithoutNeeds(1, 42, 3), assignment);
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(status.message(), HasSubstr("works 11 hours on Sunday"));
}

TEST(VerifyAssignment, ShortBlock) {
  AssignmentMatrix assignment(1);
  AssignHours(0, 0, 0, 4, COOK, &assignment);
  AssignHours(0, 0, 6, 8, COOK, &assignment);
  const absl::Status status =
      VerifyCovered(ModelWithoutNeeds(1, 42, 3), assignment);
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(status.message(), HasSubstr("has a block of 2 hours on Monday"));
}

TEST(VerifyAssignment, TooManyBlocks) {
  AssignmentMatrix assignment(1);
  AssignHours(0, 0, 0, 3, COOK, &assignment);
  AssignHours(0, 0, 5, 8, COOK, &assignment);
  const absl::Status status =
      VerifyCovered(ModelWithoutNeeds(1, 42, 0), assignment);
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(status.message(), HasSubstr("has 2 blocks on Monday"));
}

TEST(VerifyAssignment, RoleSwitchAfterBreakIsAllowedByDefault) {
  AssignmentMatrix assignment(1);
  AssignHours(0, 0, 0, 3, COOK, &assignment);
  AssignHours(0, 0, 5, 8, PIZZA_MAKER, &assignment);
  const absl::Status status =
      VerifyCovered(ModelWithoutNeeds(1, 42, 3), assignment);
  EXPECT_TRUE(status.ok()) << status;
}

TEST(VerifyAssignment, RoleSwitchInsideBlock) {
  AssignmentMatrix assignment(1);
  AssignHours(0, 0, 0, 3, COOK, &assignment);
  AssignHours(0, 0, 3, 6, DISHWASHER, &assignment);
  const absl::Status status =
      VerifyCovered(ModelWithoutNeeds(1, 42, 3), assignment);
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(status.message(),
              HasSubstr("switches from Cook to Dishwasher on Monday at 13:00"));
}

TEST(VerifyAssignment, RoleSwitchAfterBreakWithinDayScope) {
  ShiftSchedulingModel model = ModelWithoutNeeds(1, 42, 3);
  model.mutable_parameters()->mutable_labor_policy()->set_role_switch_scope(
      LaborPolicy::WITHIN_DAY);
  AssignmentMatrix assignment(1);
  AssignHours(0, 0, 0, 3, COOK, &assignment);
  AssignHours(0, 0, 5, 8, PIZZA_MAKER, &assignment);
  const absl::Status status = VerifyCovered(model, assignment);
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(status.message(),
              HasSubstr("switches from Cook to PizzaMaker on Monday at 15:00"));
}

TEST(VerifyAssignment, NoConsecutiveDaysOff) {
  AssignmentMatrix assignment(1);
  for (const int day : {0, 2, 4, 6}) {
    AssignHours(0, day, 0, 4, COOK, &assignment);
  }
  const absl::Status status =
      VerifyCovered(ModelWithoutNeeds(1, 42, 3), assignment);
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(status.message(), HasSubstr("never has 2 consecutive days off"));
}

TEST(VerifyAssignment, DaysOffRuleDisabled) {
  ShiftSchedulingModel model = ModelWithoutNeeds(1, 42, 3);
  model.mutable_parameters()->mutable_labor_policy()->set_consecutive_days_off(
      0);
  AssignmentMatrix assignment(1);
  for (const int day : {0, 2, 4, 6}) {
    AssignHours(0, day, 0, 4, COOK, &assignment);
  }
  const absl::Status status = VerifyCovered(model, assignment);
  EXPECT_TRUE(status.ok()) << status;
}

TEST(VerifyAssignment, WeeklyCapExceeded) {
  AssignmentMatrix assignment(1);
  AssignHours(0, 0, 0, 8, COOK, &assignment);
  AssignHours(0, 1, 0, 8, COOK, &assignment);
  const absl::Status status =
      VerifyCovered(ModelWithoutNeeds(1, 10, 3), assignment);
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(status.message(), HasSubstr("works 16 hours, more than 10"));
}

TEST(VerifyAssignment, CoverageMismatch) {
  ShiftSchedulingModel model = ModelWithoutNeeds(1, 42, 3);
  AssignmentMatrix assignment(1);
  AssignHours(0, 0, 0, 4, COOK, &assignment);
  SetHeadcountsFromAssignment(assignment, &model);
  SetHeadcount(COOK, 0, 0, 1, 2, &model);
  const absl::Status status = VerifyAssignment(model, assignment);
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(status.message(),
              HasSubstr("1 workers are Cook on Monday at 10:00 instead of 2"));
}

TEST(VerifyAssignment, UncoveredNeed) {
  ShiftSchedulingModel model = ModelWithoutNeeds(1, 42, 3);
  SetHeadcount(PIZZA_MAKER, 5, 13, 14, 1, &model);
  const absl::Status status = VerifyAssignment(model, AssignmentMatrix(1));
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_THAT(status.message(),
              HasSubstr("0 workers are PizzaMaker on Saturday at 23:00"));
}

}  // namespace
}  // namespace shiftplan
