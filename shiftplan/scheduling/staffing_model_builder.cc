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

#include "shiftplan/scheduling/staffing_model_builder.h"

#include <memory>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model.pb.h"
#include "shiftplan/base/status_macros.h"
#include "shiftplan/scheduling/assignment_matrix.h"
#include "shiftplan/scheduling/horizon.h"
#include "shiftplan/scheduling/model_validation.h"
#include "shiftplan/scheduling/requirements.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"

namespace shiftplan {

using ::operations_research::sat::BoolVar;
using ::operations_research::sat::CpSolverResponse;
using ::operations_research::sat::LinearExpr;
using ::operations_research::sat::Not;
using ::operations_research::sat::SolutionBooleanValue;

absl::StatusOr<std::unique_ptr<StaffingCpModel>> StaffingCpModel::Build(
    const ShiftSchedulingModel& model) {
  RETURN_IF_ERROR(ValidateShiftSchedulingModel(model));
  ASSIGN_OR_RETURN(HeadcountGrid headcounts, HeadcountGrid::FromModel(model));

  // The constructor is private, hence no std::make_unique.
  std::unique_ptr<StaffingCpModel> staffing(
      new StaffingCpModel(model, std::move(headcounts)));
  staffing->CreateVariables();
  staffing->AddSingleRoleConstraints();
  staffing->AddRoleSwitchConstraints();
  staffing->AddDailyHoursConstraints();
  staffing->AddBlockConstraints();
  staffing->AddDaysOffConstraints();
  staffing->AddWeeklyHoursConstraints();
  staffing->AddEligibilityConstraints();
  staffing->AddCoverageConstraints();
  staffing->AddObjective();

  LOG(INFO) << "Built staffing model with " << staffing->num_workers_
            << " workers, " << staffing->cp_model_.Proto().variables_size()
            << " variables and "
            << staffing->cp_model_.Proto().constraints_size()
            << " constraints.";
  return staffing;
}

StaffingCpModel::StaffingCpModel(const ShiftSchedulingModel& model,
                                 HeadcountGrid headcounts)
    : model_(model),
      policy_(model.parameters().labor_policy()),
      headcounts_(std::move(headcounts)),
      num_workers_(model.workers_size()) {}

AssignmentMatrix StaffingCpModel::ExtractAssignment(
    const CpSolverResponse& response) const {
  AssignmentMatrix matrix(num_workers_);
  for (int w = 0; w < num_workers_; ++w) {
    for (const Role role : kAllRoles) {
      for (int t = 0; t < kNumSlots; ++t) {
        if (SolutionBooleanValue(response, assignment(w, role, t))) {
          matrix.Assign(w, t, role);
        }
      }
    }
  }
  return matrix;
}

std::vector<BoolVar> StaffingCpModel::DayWorkingVars(int worker,
                                                     int day) const {
  std::vector<BoolVar> vars;
  vars.reserve(kHoursPerDay);
  for (int h = 0; h < kHoursPerDay; ++h) {
    vars.push_back(working(worker, SlotIndex(day, h)));
  }
  return vars;
}

int StaffingCpModel::NumNewConstraints() {
  const int num_constraints = cp_model_.Proto().constraints_size();
  const int num_new = num_constraints - num_logged_constraints_;
  num_logged_constraints_ = num_constraints;
  return num_new;
}

void StaffingCpModel::CreateVariables() {
  assignment_.resize(num_workers_ * kNumRoles * kNumSlots);
  working_.resize(num_workers_ * kNumSlots);
  block_start_.resize(num_workers_ * kNumSlots);
  day_off_.resize(num_workers_ * kNumDays);
  for (int w = 0; w < num_workers_; ++w) {
    for (int r = 0; r < kNumRoles; ++r) {
      const absl::string_view role_name = RoleDisplayName(RoleFromIndex(r));
      for (int t = 0; t < kNumSlots; ++t) {
        assignment_[AssignmentIndex(w, r, t)] =
            cp_model_.NewBoolVar().WithName(
                absl::StrCat("w", w, "_", role_name, "_", t));
      }
    }
    for (int t = 0; t < kNumSlots; ++t) {
      working_[WorkerSlotIndex(w, t)] =
          cp_model_.NewBoolVar().WithName(absl::StrCat("working_", w, "_", t));
      block_start_[WorkerSlotIndex(w, t)] =
          cp_model_.NewBoolVar().WithName(absl::StrCat("start_", w, "_", t));
    }
    for (int d = 0; d < kNumDays; ++d) {
      day_off_[w * kNumDays + d] =
          cp_model_.NewBoolVar().WithName(absl::StrCat("off_", w, "_", d));
    }
  }
}

void StaffingCpModel::AddSingleRoleConstraints() {
  for (int w = 0; w < num_workers_; ++w) {
    for (int t = 0; t < kNumSlots; ++t) {
      std::vector<BoolVar> roles_at_slot;
      for (const Role role : kAllRoles) {
        roles_at_slot.push_back(assignment(w, role, t));
      }
      cp_model_.AddAtMostOne(roles_at_slot);
      // Since at most one role is taken, the sum is a boolean.
      cp_model_.AddEquality(LinearExpr::Sum(roles_at_slot), working(w, t));
    }
  }
  VLOG(1) << "Added " << NumNewConstraints() << " single role constraints.";
}

void StaffingCpModel::AddRoleSwitchConstraints() {
  const bool whole_day =
      policy_.role_switch_scope() == LaborPolicy::WITHIN_DAY;
  for (int w = 0; w < num_workers_; ++w) {
    for (int d = 0; d < kNumDays; ++d) {
      for (int h = 0; h < kHoursPerDay - 1; ++h) {
        const int t = SlotIndex(d, h);
        const int last_hour = whole_day ? kHoursPerDay - 1 : h + 1;
        for (int later = h + 1; later <= last_hour; ++later) {
          const int t_later = SlotIndex(d, later);
          for (const Role r1 : kAllRoles) {
            for (const Role r2 : kAllRoles) {
              if (r1 == r2) continue;
              // Prohibit r1 at hour h followed by r2 at a later hour.
              cp_model_.AddBoolOr({Not(assignment(w, r1, t)),
                                   Not(assignment(w, r2, t_later))});
            }
          }
        }
      }
    }
  }
  VLOG(1) << "Added " << NumNewConstraints() << " role switch constraints.";
}

void StaffingCpModel::AddDailyHoursConstraints() {
  for (int w = 0; w < num_workers_; ++w) {
    for (int d = 0; d < kNumDays; ++d) {
      const LinearExpr day_total = LinearExpr::Sum(DayWorkingVars(w, d));
      const BoolVar off = day_off(w, d);
      cp_model_.AddEquality(day_total, 0).OnlyEnforceIf(off);
      cp_model_.AddGreaterOrEqual(day_total, policy_.min_daily_hours())
          .OnlyEnforceIf(Not(off));
      cp_model_.AddLessOrEqual(day_total, policy_.max_daily_hours());
    }
  }
  VLOG(1) << "Added " << NumNewConstraints() << " daily hours constraints.";
}

void StaffingCpModel::AddBlockConstraints() {
  const int min_block = policy_.min_block_hours();
  for (int w = 0; w < num_workers_; ++w) {
    const int max_blocks = model_.workers(w).max_breaks() + 1;
    for (int d = 0; d < kNumDays; ++d) {
      std::vector<BoolVar> starts;
      for (int h = 0; h < kHoursPerDay; ++h) {
        const BoolVar start = block_start(w, d, h);
        const BoolVar current = working(w, SlotIndex(d, h));
        if (h == 0) {
          // The first hour of the day starts a block iff it is worked.
          cp_model_.AddEquality(start, current);
        } else {
          // A block starts when a worked hour follows a free one.
          const BoolVar previous = working(w, SlotIndex(d, h - 1));
          cp_model_.AddBoolAnd({current, Not(previous)}).OnlyEnforceIf(start);
          cp_model_.AddBoolOr({Not(current), previous})
              .OnlyEnforceIf(Not(start));
        }

        if (h + min_block <= kHoursPerDay) {
          std::vector<BoolVar> block;
          for (int hh = h; hh < h + min_block; ++hh) {
            block.push_back(working(w, SlotIndex(d, hh)));
          }
          cp_model_.AddGreaterOrEqual(LinearExpr::Sum(block), min_block)
              .OnlyEnforceIf(start);
        } else {
          // Too few hours remain in the day for a full block.
          cp_model_.AddEquality(start, 0);
        }
        starts.push_back(start);
      }
      // n blocks means n - 1 breaks.
      cp_model_.AddLessOrEqual(LinearExpr::Sum(starts), max_blocks);
    }
  }
  VLOG(1) << "Added " << NumNewConstraints() << " block constraints.";
}

void StaffingCpModel::AddDaysOffConstraints() {
  const int window = policy_.consecutive_days_off();
  if (window == 0) return;
  for (int w = 0; w < num_workers_; ++w) {
    std::vector<BoolVar> windows_off;
    for (int first_day = 0; first_day + window <= kNumDays; ++first_day) {
      std::vector<BoolVar> offs;
      std::vector<BoolVar> not_offs;
      for (int d = first_day; d < first_day + window; ++d) {
        offs.push_back(day_off(w, d));
        not_offs.push_back(Not(day_off(w, d)));
      }
      const BoolVar all_off = cp_model_.NewBoolVar().WithName(
          absl::StrCat(window, "off_", w, "_", first_day));
      cp_model_.AddBoolAnd(offs).OnlyEnforceIf(all_off);
      cp_model_.AddBoolOr(not_offs).OnlyEnforceIf(Not(all_off));
      windows_off.push_back(all_off);
    }
    cp_model_.AddBoolOr(windows_off);
  }
  VLOG(1) << "Added " << NumNewConstraints() << " days off constraints.";
}

void StaffingCpModel::AddWeeklyHoursConstraints() {
  for (int w = 0; w < num_workers_; ++w) {
    const std::vector<BoolVar> week(working_.begin() + w * kNumSlots,
                                    working_.begin() + (w + 1) * kNumSlots);
    cp_model_.AddLessOrEqual(LinearExpr::Sum(week),
                             model_.workers(w).max_weekly_hours());
  }
  VLOG(1) << "Added " << NumNewConstraints() << " weekly hours constraints.";
}

void StaffingCpModel::AddEligibilityConstraints() {
  for (int w = 0; w < num_workers_; ++w) {
    const Worker& worker = model_.workers(w);
    for (const Role role : kAllRoles) {
      bool eligible = false;
      for (const int eligible_role : worker.eligible_roles()) {
        if (eligible_role == role) eligible = true;
      }
      if (eligible) continue;
      LOG(INFO) << "Worker '" << worker.name() << "' is not eligible for role "
                << RoleDisplayName(role) << ".";
      for (int t = 0; t < kNumSlots; ++t) {
        cp_model_.AddEquality(assignment(w, role, t), 0);
      }
    }
  }
  VLOG(1) << "Added " << NumNewConstraints() << " eligibility constraints.";
}

void StaffingCpModel::AddCoverageConstraints() {
  for (const Role role : kAllRoles) {
    for (int t = 0; t < kNumSlots; ++t) {
      std::vector<BoolVar> assigned;
      for (int w = 0; w < num_workers_; ++w) {
        assigned.push_back(assignment(w, role, t));
      }
      cp_model_.AddEquality(LinearExpr::Sum(assigned),
                            headcounts_.Get(RoleIndex(role), t));
    }
  }
  VLOG(1) << "Added " << NumNewConstraints() << " coverage constraints.";
}

void StaffingCpModel::AddObjective() {
  cp_model_.Minimize(LinearExpr::Sum(assignment_));
}

}  // namespace shiftplan
