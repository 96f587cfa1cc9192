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

#include <algorithm>

#include "shiftplan/scheduling/horizon.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"

namespace shiftplan {

Role AssignmentMatrix::RoleAt(int worker, int slot) const {
  Role role_here = ROLE_UNSPECIFIED;
  for (const Role role : kAllRoles) {
    if (HasRole(worker, slot, role)) role_here = role;
  }
  return role_here;
}

DailyWork AssignmentMatrix::GetDailyWork(int worker, int day) const {
  DailyWork work;
  int block_length = 0;
  for (int hour = 0; hour <= kHoursPerDay; ++hour) {
    if (hour < kHoursPerDay && IsWorking(worker, SlotIndex(day, hour))) {
      if (work.first_hour < 0) work.first_hour = hour;
      work.last_hour = hour;
      ++work.worked_hours;
      ++block_length;
      continue;
    }
    // End of a block, or of the day.
    if (block_length > 0) {
      ++work.num_blocks;
      work.shortest_block = work.num_blocks == 1
                                ? block_length
                                : std::min(work.shortest_block, block_length);
      block_length = 0;
    }
  }
  return work;
}

int AssignmentMatrix::WeeklyHours(int worker) const {
  int hours = 0;
  for (int slot = 0; slot < kNumSlots; ++slot) {
    if (IsWorking(worker, slot)) ++hours;
  }
  return hours;
}

int AssignmentMatrix::Headcount(Role role, int slot) const {
  int headcount = 0;
  for (int worker = 0; worker < num_workers_; ++worker) {
    if (HasRole(worker, slot, role)) ++headcount;
  }
  return headcount;
}

}  // namespace shiftplan
