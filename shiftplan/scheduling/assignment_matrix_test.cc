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

#include "shiftplan/scheduling/assignment_matrix.h"

#include "gtest/gtest.h"
#include "shiftplan/scheduling/horizon.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"
#include "shiftplan/scheduling/test_util.h"

namespace shiftplan {
namespace {

TEST(AssignmentMatrixTest, EmptyMatrix) {
  const AssignmentMatrix assignment(2);
  EXPECT_EQ(assignment.num_workers(), 2);
  EXPECT_EQ(assignment.WeeklyHours(1), 0);
  EXPECT_FALSE(assignment.IsWorking(0, 5));
  EXPECT_EQ(assignment.RoleAt(0, 5), ROLE_UNSPECIFIED);
  const DailyWork work = assignment.GetDailyWork(0, 3);
  EXPECT_TRUE(work.is_day_off());
  EXPECT_FALSE(work.has_gap());
  EXPECT_EQ(work.first_hour, -1);
  EXPECT_EQ(work.num_blocks, 0);
  EXPECT_EQ(work.shortest_block, 0);
}

TEST(AssignmentMatrixTest, RolesAndHeadcounts) {
  AssignmentMatrix assignment(3);
  assignment.Assign(0, 7, COOK);
  assignment.Assign(1, 7, COOK);
  assignment.Assign(2, 7, DISHWASHER);
  EXPECT_TRUE(assignment.HasRole(0, 7, COOK));
  EXPECT_FALSE(assignment.HasRole(0, 7, PIZZA_MAKER));
  EXPECT_EQ(assignment.Headcount(COOK, 7), 2);
  EXPECT_EQ(assignment.Headcount(DISHWASHER, 7), 1);
  EXPECT_EQ(assignment.Headcount(PIZZA_MAKER, 7), 0);
  EXPECT_EQ(assignment.NumAssignedRoles(0, 7), 1);
}

TEST(AssignmentMatrixTest, SeveralRolesInOneSlot) {
  AssignmentMatrix assignment(1);
  assignment.Assign(0, 0, DISHWASHER);
  assignment.Assign(0, 0, COOK);
  EXPECT_EQ(assignment.NumAssignedRoles(0, 0), 2);
  EXPECT_EQ(assignment.RoleMask(0, 0), 0b101u);
  EXPECT_EQ(assignment.RoleAt(0, 0), DISHWASHER);
  EXPECT_EQ(assignment.WeeklyHours(0), 1);
}

TEST(AssignmentMatrixTest, DailyWorkWithTwoBlocks) {
  AssignmentMatrix assignment(1);
  AssignHours(0, 2, 1, 4, COOK, &assignment);
  AssignHours(0, 2, 8, 13, COOK, &assignment);
  const DailyWork work = assignment.GetDailyWork(0, 2);
  EXPECT_EQ(work.worked_hours, 8);
  EXPECT_EQ(work.first_hour, 1);
  EXPECT_EQ(work.last_hour, 12);
  EXPECT_EQ(work.num_blocks, 2);
  EXPECT_EQ(work.shortest_block, 3);
  EXPECT_TRUE(work.has_gap());
  EXPECT_TRUE(assignment.GetDailyWork(0, 1).is_day_off());
}

TEST(AssignmentMatrixTest, BlockEndingAtClosingTime) {
  AssignmentMatrix assignment(1);
  AssignHours(0, 6, 10, kHoursPerDay, PIZZA_MAKER, &assignment);
  const DailyWork work = assignment.GetDailyWork(0, 6);
  EXPECT_EQ(work.worked_hours, 4);
  EXPECT_EQ(work.last_hour, kHoursPerDay - 1);
  EXPECT_EQ(work.num_blocks, 1);
  EXPECT_EQ(work.shortest_block, 4);
  EXPECT_FALSE(work.has_gap());
}

TEST(AssignmentMatrixTest, Equality) {
  AssignmentMatrix a(2);
  AssignmentMatrix b(2);
  EXPECT_TRUE(a == b);
  a.Assign(1, 30, COOK);
  EXPECT_FALSE(a == b);
  b.Assign(1, 30, COOK);
  EXPECT_TRUE(a == b);
  EXPECT_FALSE(a == AssignmentMatrix(3));
}

}  // namespace
}  // namespace shiftplan
