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

#include "shiftplan/scheduling/solution_decoder.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "ortools/sat/cp_model.pb.h"
#include "shiftplan/scheduling/assignment_matrix.h"
#include "shiftplan/scheduling/horizon.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"
#include "shiftplan/scheduling/staffing_model_builder.h"

namespace shiftplan {

using ::operations_research::sat::CpSolverResponse;
using ::operations_research::sat::CpSolverStatus;

ShiftSchedulingResultStatus ToResultStatus(CpSolverStatus status) {
  switch (status) {
    case CpSolverStatus::OPTIMAL:
      return SOLVER_OPTIMAL;
    case CpSolverStatus::FEASIBLE:
      return SOLVER_FEASIBLE;
    case CpSolverStatus::INFEASIBLE:
      return SOLVER_INFEASIBLE;
    case CpSolverStatus::MODEL_INVALID:
      return SOLVER_MODEL_INVALID;
    case CpSolverStatus::UNKNOWN:
      return SOLVER_NOT_SOLVED;
    default:
      return SHIFT_SCHEDULING_RESULT_STATUS_UNSPECIFIED;
  }
}

bool HasSchedule(ShiftSchedulingResultStatus status) {
  return status == SOLVER_OPTIMAL || status == SOLVER_FEASIBLE;
}

ShiftSchedulingResult DecodeSolution(const ShiftSchedulingModel& model,
                                     const StaffingCpModel& staffing,
                                     const CpSolverResponse& response) {
  ShiftSchedulingResult result;
  result.set_solver_status(ToResultStatus(response.status()));
  result.set_wall_time_seconds(response.wall_time());
  switch (result.solver_status()) {
    case SOLVER_OPTIMAL:
    case SOLVER_FEASIBLE:
      break;
    case SOLVER_INFEASIBLE:
      result.set_message(
          "No schedule satisfies the constraints. Try adjusting the worker "
          "limits or the staffing needs.");
      return result;
    case SOLVER_NOT_SOLVED:
      result.set_message(
          "No schedule was found within the time limit. Try a longer time "
          "limit or adjusting the staffing needs.");
      return result;
    case SOLVER_MODEL_INVALID:
      result.set_message(
          "The solver rejected the model: " + response.solution_info());
      return result;
    default:
      result.set_message("The solver returned an unexpected status.");
      return result;
  }

  result.set_objective_value(response.objective_value());
  result.set_best_objective_bound(response.best_objective_bound());
  DecodeAssignment(model, staffing.ExtractAssignment(response), &result);
  return result;
}

void DecodeAssignment(const ShiftSchedulingModel& model,
                      const AssignmentMatrix& assignment,
                      ShiftSchedulingResult* result) {
  for (int w = 0; w < assignment.num_workers(); ++w) {
    const std::string& name = model.workers(w).name();
    for (int d = 0; d < kNumDays; ++d) {
      WorkerDaySchedule* const row = result->add_schedule();
      row->set_worker_index(w);
      row->set_worker_name(name);
      row->set_day(WeekdayFromIndex(d));
      for (int h = 0; h < kHoursPerDay; ++h) {
        row->add_hourly_roles(assignment.RoleAt(w, SlotIndex(d, h)));
      }
      const DailyWork work = assignment.GetDailyWork(w, d);
      row->set_worked_hours(work.worked_hours);
      row->set_num_blocks(work.num_blocks);
    }
    *result->add_summaries() = SummarizeWorker(model, assignment, w);
  }
}

WorkerSummary SummarizeWorker(const ShiftSchedulingModel& model,
                              const AssignmentMatrix& assignment, int worker) {
  int total_hours = 0;
  int working_days = 0;
  int breaks = 0;
  int max_off_streak = 0;
  int current_off_streak = 0;
  for (int d = 0; d < kNumDays; ++d) {
    const DailyWork work = assignment.GetDailyWork(worker, d);
    if (work.is_day_off()) {
      ++current_off_streak;
      max_off_streak = std::max(max_off_streak, current_off_streak);
      continue;
    }
    ++working_days;
    total_hours += work.worked_hours;
    // A day counts one break whenever its worked hours do not fill the span
    // between its first and last worked hours.
    if (work.has_gap()) ++breaks;
    current_off_streak = 0;
  }

  WorkerSummary summary;
  summary.set_worker_index(worker);
  summary.set_worker_name(model.workers(worker).name());
  summary.set_total_hours(total_hours);
  summary.set_working_days(working_days);
  summary.set_breaks(breaks);
  summary.set_max_consecutive_days_off(max_off_streak);
  summary.set_average_daily_hours(
      working_days == 0
          ? 0.0
          : std::round(100.0 * total_hours / working_days) / 100.0);
  return summary;
}

}  // namespace shiftplan
