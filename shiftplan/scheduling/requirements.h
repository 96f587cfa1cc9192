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

#ifndef SHIFTPLAN_SCHEDULING_REQUIREMENTS_H_
#define SHIFTPLAN_SCHEDULING_REQUIREMENTS_H_

#include <vector>

#include "absl/log/check.h"
#include "absl/status/statusor.h"
#include "shiftplan/scheduling/horizon.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"

namespace shiftplan {

// Dense (role, slot) -> required headcount table, built from the requirement
// section of a ShiftSchedulingModel.
class HeadcountGrid {
 public:
  HeadcountGrid() : headcounts_(kNumRoles * kNumSlots, 0) {}

  // Returns InvalidArgumentError if a role or a day is missing or duplicated,
  // if a day does not have exactly kHoursPerDay values, or if a value is
  // negative.
  static absl::StatusOr<HeadcountGrid> FromModel(
      const ShiftSchedulingModel& model);

  int Get(int role_index, int slot) const {
    return headcounts_[Index(role_index, slot)];
  }
  void Set(int role_index, int slot, int headcount) {
    DCHECK_GE(headcount, 0);
    headcounts_[Index(role_index, slot)] = headcount;
  }

  // Sum of all headcounts, i.e. the number of worker-hours of the week.
  int TotalHeadcount() const;

 private:
  static int Index(int role_index, int slot) {
    DCHECK_GE(role_index, 0);
    DCHECK_LT(role_index, kNumRoles);
    DCHECK_GE(slot, 0);
    DCHECK_LT(slot, kNumSlots);
    return role_index * kNumSlots + slot;
  }

  std::vector<int> headcounts_;
};

}  // namespace shiftplan

#endif  // SHIFTPLAN_SCHEDULING_REQUIREMENTS_H_
