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

#include <cstdint>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "shiftplan/base/status_builder.h"
#include "shiftplan/base/status_macros.h"
#include "shiftplan/scheduling/assignment_matrix.h"
#include "shiftplan/scheduling/horizon.h"
#include "shiftplan/scheduling/requirements.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"
#include "shiftplan/scheduling/shift_scheduling_parameters.pb.h"

namespace shiftplan {
namespace {

uint32_t EligibleRoleMask(const Worker& worker) {
  uint32_t mask = 0;
  for (const int role : worker.eligible_roles()) {
    mask |= uint32_t{1} << RoleIndex(static_cast<Role>(role));
  }
  return mask;
}

absl::Status VerifyDay(const Worker& worker, const LaborPolicy& policy,
                       const AssignmentMatrix& assignment, int w, int d) {
  const DailyWork work = assignment.GetDailyWork(w, d);
  if (work.is_day_off()) return absl::OkStatus();
  if (work.worked_hours < policy.min_daily_hours() ||
      work.worked_hours > policy.max_daily_hours()) {
    return InternalErrorBuilder()
           << "worker '" << worker.name() << "' works " << work.worked_hours
           << " hours on " << DayDisplayName(d);
  }
  if (work.shortest_block < policy.min_block_hours()) {
    return InternalErrorBuilder()
           << "worker '" << worker.name() << "' has a block of "
           << work.shortest_block << " hours on " << DayDisplayName(d);
  }
  if (work.num_blocks > worker.max_breaks() + 1) {
    return InternalErrorBuilder()
           << "worker '" << worker.name() << "' has " << work.num_blocks
           << " blocks on " << DayDisplayName(d);
  }

  const bool whole_day =
      policy.role_switch_scope() == LaborPolicy::WITHIN_DAY;
  Role day_role = ROLE_UNSPECIFIED;
  for (int h = 0; h < kHoursPerDay; ++h) {
    const Role role = assignment.RoleAt(w, SlotIndex(d, h));
    if (role == ROLE_UNSPECIFIED) {
      if (!whole_day) day_role = ROLE_UNSPECIFIED;
      continue;
    }
    if (day_role != ROLE_UNSPECIFIED && role != day_role) {
      return InternalErrorBuilder()
             << "worker '" << worker.name() << "' switches from "
             << RoleDisplayName(day_role) << " to " << RoleDisplayName(role)
             << " on " << DayDisplayName(d) << " at " << HourLabel(h);
    }
    day_role = role;
  }
  return absl::OkStatus();
}

absl::Status VerifyWorker(const Worker& worker, const LaborPolicy& policy,
                          const AssignmentMatrix& assignment, int w) {
  const uint32_t eligible_mask = EligibleRoleMask(worker);
  for (int t = 0; t < kNumSlots; ++t) {
    if (assignment.NumAssignedRoles(w, t) > 1) {
      return InternalErrorBuilder()
             << "worker '" << worker.name() << "' has "
             << assignment.NumAssignedRoles(w, t) << " roles at slot " << t;
    }
    if ((assignment.RoleMask(w, t) & ~eligible_mask) != 0) {
      return InternalErrorBuilder()
             << "worker '" << worker.name() << "' is assigned "
             << RoleDisplayName(assignment.RoleAt(w, t))
             << " without being eligible, at slot " << t;
    }
  }

  for (int d = 0; d < kNumDays; ++d) {
    RETURN_IF_ERROR(VerifyDay(worker, policy, assignment, w, d));
  }

  const int window = policy.consecutive_days_off();
  if (window > 0) {
    int off_streak = 0;
    int max_off_streak = 0;
    for (int d = 0; d < kNumDays; ++d) {
      off_streak = assignment.GetDailyWork(w, d).is_day_off() ? off_streak + 1
                                                               : 0;
      if (off_streak > max_off_streak) max_off_streak = off_streak;
    }
    if (max_off_streak < window) {
      return InternalErrorBuilder()
             << "worker '" << worker.name() << "' never has " << window
             << " consecutive days off";
    }
  }

  const int weekly_hours = assignment.WeeklyHours(w);
  if (weekly_hours > worker.max_weekly_hours()) {
    return InternalErrorBuilder()
           << "worker '" << worker.name() << "' works " << weekly_hours
           << " hours, more than " << worker.max_weekly_hours();
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status VerifyAssignment(const ShiftSchedulingModel& model,
                              const AssignmentMatrix& assignment) {
  if (assignment.num_workers() != model.workers_size()) {
    return InternalErrorBuilder()
           << "the assignment has " << assignment.num_workers()
           << " workers instead of " << model.workers_size();
  }
  const LaborPolicy& policy = model.parameters().labor_policy();
  for (int w = 0; w < model.workers_size(); ++w) {
    RETURN_IF_ERROR(VerifyWorker(model.workers(w), policy, assignment, w));
  }

  ASSIGN_OR_RETURN(const HeadcountGrid headcounts,
                   HeadcountGrid::FromModel(model));
  for (const Role role : kAllRoles) {
    for (int d = 0; d < kNumDays; ++d) {
      for (int h = 0; h < kHoursPerDay; ++h) {
        const int t = SlotIndex(d, h);
        const int assigned = assignment.Headcount(role, t);
        const int required = headcounts.Get(RoleIndex(role), t);
        if (assigned != required) {
          return InternalErrorBuilder()
                 << assigned << " workers are " << RoleDisplayName(role)
                 << " on " << DayDisplayName(d) << " at " << HourLabel(h)
                 << " instead of " << required;
        }
      }
    }
  }
  return absl::OkStatus();
}

}  // namespace shiftplan
