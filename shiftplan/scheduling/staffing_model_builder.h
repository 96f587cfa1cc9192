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

// CP-SAT formulation of the weekly shift scheduling problem.
//
// The decision variables are the booleans x(w, r, t), true iff worker w
// performs role r at time slot t. Every other variable is derived from them:
//   - working(w, t)        = sum_r x(w, r, t)
//   - day_off(w, d)        <=> worker w does not work on day d
//   - block_start(w, d, h) <=> worker w starts a working block at hour h of d
//
// The constraints, in the order they are added, are:
//   1. A worker performs at most one role per hour.
//   2. A worker does not switch roles between two adjacent hours, or during a
//      whole day with LaborPolicy.role_switch_scope = WITHIN_DAY.
//   3. A day is either off or has at least min_daily_hours hours.
//   4. A day has at most max_daily_hours hours.
//   5. A block lasts at least min_block_hours hours, so it cannot start in the
//      last min_block_hours - 1 hours of the day, and a day has at most
//      max_breaks + 1 blocks.
//   6. A worker has consecutive_days_off consecutive days off at least once.
//   7. A worker works at most max_weekly_hours hours.
//   8. A worker only performs roles listed in its eligible roles.
//   9. The number of workers performing a role at a slot is exactly the
//      requested headcount.
// The objective minimizes the number of assigned hours. Since constraint 9 is
// an equality, this number is fixed by the requirements and the objective
// does not discriminate between feasible schedules.

#ifndef SHIFTPLAN_SCHEDULING_STAFFING_MODEL_BUILDER_H_
#define SHIFTPLAN_SCHEDULING_STAFFING_MODEL_BUILDER_H_

#include <memory>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/statusor.h"
#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model.pb.h"
#include "shiftplan/scheduling/assignment_matrix.h"
#include "shiftplan/scheduling/horizon.h"
#include "shiftplan/scheduling/requirements.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"
#include "shiftplan/scheduling/shift_scheduling_parameters.pb.h"

namespace shiftplan {

class StaffingCpModel {
 public:
  using BoolVar = ::operations_research::sat::BoolVar;

  // Validates `model` and builds its CP-SAT formulation. Returns
  // InvalidArgumentError if the model is malformed.
  static absl::StatusOr<std::unique_ptr<StaffingCpModel>> Build(
      const ShiftSchedulingModel& model);

  // The variables keep a pointer to the CpModelBuilder.
  StaffingCpModel(const StaffingCpModel&) = delete;
  StaffingCpModel& operator=(const StaffingCpModel&) = delete;

  const ::operations_research::sat::CpModelBuilder& cp_model() const {
    return cp_model_;
  }
  ::operations_research::sat::CpModelBuilder* mutable_cp_model() {
    return &cp_model_;
  }

  int num_workers() const { return num_workers_; }

  BoolVar assignment(int worker, Role role, int slot) const {
    return assignment_[AssignmentIndex(worker, RoleIndex(role), slot)];
  }
  BoolVar working(int worker, int slot) const {
    return working_[WorkerSlotIndex(worker, slot)];
  }
  BoolVar day_off(int worker, int day) const {
    DCHECK_GE(day, 0);
    DCHECK_LT(day, kNumDays);
    return day_off_[worker * kNumDays + day];
  }
  BoolVar block_start(int worker, int day, int hour) const {
    return block_start_[WorkerSlotIndex(worker, SlotIndex(day, hour))];
  }

  // Reads the assignment booleans of the solution held by `response`. The
  // response must contain a solution.
  AssignmentMatrix ExtractAssignment(
      const ::operations_research::sat::CpSolverResponse& response) const;

 private:
  StaffingCpModel(const ShiftSchedulingModel& model, HeadcountGrid headcounts);

  int AssignmentIndex(int worker, int role_index, int slot) const {
    DCHECK_GE(worker, 0);
    DCHECK_LT(worker, num_workers_);
    DCHECK_GE(slot, 0);
    DCHECK_LT(slot, kNumSlots);
    return (worker * kNumRoles + role_index) * kNumSlots + slot;
  }
  int WorkerSlotIndex(int worker, int slot) const {
    DCHECK_GE(worker, 0);
    DCHECK_LT(worker, num_workers_);
    DCHECK_GE(slot, 0);
    DCHECK_LT(slot, kNumSlots);
    return worker * kNumSlots + slot;
  }

  // The working(w, t) variables of one day.
  std::vector<BoolVar> DayWorkingVars(int worker, int day) const;

  void CreateVariables();
  void AddSingleRoleConstraints();
  void AddRoleSwitchConstraints();
  void AddDailyHoursConstraints();
  void AddBlockConstraints();
  void AddDaysOffConstraints();
  void AddWeeklyHoursConstraints();
  void AddEligibilityConstraints();
  void AddCoverageConstraints();
  void AddObjective();

  // Number of constraints added since the previous call.
  int NumNewConstraints();

  const ShiftSchedulingModel model_;
  const LaborPolicy policy_;
  const HeadcountGrid headcounts_;
  const int num_workers_;

  ::operations_research::sat::CpModelBuilder cp_model_;
  int num_logged_constraints_ = 0;

  // Indexed by AssignmentIndex().
  std::vector<BoolVar> assignment_;
  // Indexed by WorkerSlotIndex().
  std::vector<BoolVar> working_;
  std::vector<BoolVar> block_start_;
  // Indexed by worker * kNumDays + day.
  std::vector<BoolVar> day_off_;
};

}  // namespace shiftplan

#endif  // SHIFTPLAN_SCHEDULING_STAFFING_MODEL_BUILDER_H_
