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

#ifndef SHIFTPLAN_SCHEDULING_ASSIGNMENT_MATRIX_H_
#define SHIFTPLAN_SCHEDULING_ASSIGNMENT_MATRIX_H_

#include <cstdint>
#include <vector>

#include "absl/log/check.h"
#include "absl/numeric/bits.h"
#include "shiftplan/scheduling/horizon.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"

namespace shiftplan {

// Work of one worker on one day, as seen from the worked hours only.
struct DailyWork {
  int worked_hours = 0;
  // First and last worked hour of the day, -1 on a day off.
  int first_hour = -1;
  int last_hour = -1;
  // Number of maximal runs of consecutive worked hours.
  int num_blocks = 0;
  // Length of the shortest of these runs, 0 on a day off.
  int shortest_block = 0;

  bool is_day_off() const { return worked_hours == 0; }
  // True if some hour between the first and the last worked hours is not
  // worked.
  bool has_gap() const {
    return worked_hours > 0 && worked_hours < last_hour - first_hour + 1;
  }
};

// Values of the (worker, role, slot) assignment booleans of a solution.
//
// Storage is one role bitmask per (worker, slot), bit i standing for
// kAllRoles[i]. A well-formed solution has at most one bit set per mask.
class AssignmentMatrix {
 public:
  explicit AssignmentMatrix(int num_workers)
      : num_workers_(num_workers), role_masks_(num_workers * kNumSlots, 0) {}

  int num_workers() const { return num_workers_; }

  void Assign(int worker, int slot, Role role) {
    role_masks_[Index(worker, slot)] |= uint32_t{1} << RoleIndex(role);
  }

  bool HasRole(int worker, int slot, Role role) const {
    return (role_masks_[Index(worker, slot)] >> RoleIndex(role)) & 1;
  }

  uint32_t RoleMask(int worker, int slot) const {
    return role_masks_[Index(worker, slot)];
  }

  int NumAssignedRoles(int worker, int slot) const {
    return absl::popcount(role_masks_[Index(worker, slot)]);
  }

  bool IsWorking(int worker, int slot) const {
    return role_masks_[Index(worker, slot)] != 0;
  }

  // The role performed at the slot, ROLE_UNSPECIFIED if none. If several
  // roles are set, the last one in kAllRoles order is returned.
  Role RoleAt(int worker, int slot) const;

  DailyWork GetDailyWork(int worker, int day) const;

  int WeeklyHours(int worker) const;

  // Number of (worker, slot) pairs with the given role, over all workers.
  int Headcount(Role role, int slot) const;

  bool operator==(const AssignmentMatrix& other) const {
    return num_workers_ == other.num_workers_ &&
           role_masks_ == other.role_masks_;
  }

 private:
  int Index(int worker, int slot) const {
    DCHECK_GE(worker, 0);
    DCHECK_LT(worker, num_workers_);
    DCHECK_GE(slot, 0);
    DCHECK_LT(slot, kNumSlots);
    return worker * kNumSlots + slot;
  }

  int num_workers_;
  std::vector<uint32_t> role_masks_;
};

}  // namespace shiftplan

#endif  // SHIFTPLAN_SCHEDULING_ASSIGNMENT_MATRIX_H_
