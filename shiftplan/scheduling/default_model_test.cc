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

#include "shiftplan/scheduling/default_model.h"

#include "absl/status/statusor.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "shiftplan/scheduling/horizon.h"
#include "shiftplan/scheduling/model_validation.h"
#include "shiftplan/scheduling/requirements.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"

namespace shiftplan {
namespace {

using ::testing::ElementsAre;

TEST(DefaultModelTest, Roster) {
  const auto roster = MakeDefaultRoster(4);
  ASSERT_EQ(roster.size(), 4);
  EXPECT_EQ(roster.Get(0).name(), "Emp1");
  EXPECT_EQ(roster.Get(3).name(), "Emp4");
  for (const Worker& worker : roster) {
    EXPECT_THAT(worker.eligible_roles(),
                ElementsAre(COOK, PIZZA_MAKER, DISHWASHER));
    EXPECT_EQ(worker.max_weekly_hours(), 42);
    EXPECT_EQ(worker.max_breaks(), 3);
  }
}

TEST(DefaultModelTest, Requirements) {
  const ShiftSchedulingModel model = MakeDefaultModel(6);
  EXPECT_EQ(model.display_name(), "Kitchen");
  EXPECT_TRUE(ValidateShiftSchedulingModel(model).ok());
  const absl::StatusOr<HeadcountGrid> grid = HeadcountGrid::FromModel(model);
  ASSERT_TRUE(grid.ok()) << grid.status();

  for (int d = 0; d < kNumDays; ++d) {
    // 10:00 to 15:00.
    for (int h = 0; h <= 5; ++h) {
      for (int r = 0; r < kNumRoles; ++r) {
        EXPECT_EQ(grid->Get(r, SlotIndex(d, h)), 1);
      }
    }
    // 16:00 and 17:00, cooks only.
    for (int h = 6; h <= 7; ++h) {
      EXPECT_EQ(grid->Get(RoleIndex(COOK), SlotIndex(d, h)), 1);
      EXPECT_EQ(grid->Get(RoleIndex(PIZZA_MAKER), SlotIndex(d, h)), 0);
      EXPECT_EQ(grid->Get(RoleIndex(DISHWASHER), SlotIndex(d, h)), 0);
    }
    // 18:00 to 22:00.
    for (int h = 8; h <= 12; ++h) {
      for (int r = 0; r < kNumRoles; ++r) {
        EXPECT_EQ(grid->Get(r, SlotIndex(d, h)), 1);
      }
    }
    // 23:00.
    for (int r = 0; r < kNumRoles; ++r) {
      EXPECT_EQ(grid->Get(r, SlotIndex(d, 13)), 0);
    }
  }
  EXPECT_EQ(grid->TotalHeadcount(), kNumDays * (13 + 11 + 11));
}

}  // namespace
}  // namespace shiftplan
