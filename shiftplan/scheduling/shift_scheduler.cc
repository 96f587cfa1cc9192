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

#include "shiftplan/scheduling/shift_scheduler.h"

#include <memory>
#include <string>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model.pb.h"
#include "ortools/sat/model.h"
#include "ortools/sat/sat_parameters.pb.h"
#include "shiftplan/scheduling/schedule_verifier.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"
#include "shiftplan/scheduling/shift_scheduling_parameters.pb.h"
#include "shiftplan/scheduling/solution_decoder.h"
#include "shiftplan/scheduling/staffing_model_builder.h"

namespace shiftplan {

using ::operations_research::sat::CpSolverResponse;
using ::operations_research::sat::CpSolverResponseStats;
using ::operations_research::sat::Model;
using ::operations_research::sat::NewSatParameters;
using ::operations_research::sat::SatParameters;
using ::operations_research::sat::SolveCpModel;

SatParameters MakeSatParameters(const SolverOptions& options) {
  SatParameters parameters;
  parameters.set_max_time_in_seconds(options.max_time_in_seconds());
  parameters.set_num_search_workers(options.num_search_workers());
  parameters.set_log_search_progress(options.log_search_progress());
  parameters.set_random_seed(options.random_seed());
  return parameters;
}

ShiftSchedulingResult ShiftScheduler::Solve(
    const ShiftSchedulingModel& model) const {
  ShiftSchedulingResult result;
  const absl::StatusOr<std::unique_ptr<StaffingCpModel>> staffing =
      StaffingCpModel::Build(model);
  if (!staffing.ok()) {
    LOG(WARNING) << "Invalid scheduling model: " << staffing.status();
    result.set_solver_status(SOLVER_MODEL_INVALID);
    result.set_message(std::string(staffing.status().message()));
    return result;
  }

  Model sat_model;
  sat_model.Add(
      NewSatParameters(MakeSatParameters(model.parameters().solver_options())));
  const CpSolverResponse response =
      SolveCpModel((*staffing)->cp_model().Build(), &sat_model);
  VLOG(1) << CpSolverResponseStats(response);

  result = DecodeSolution(model, **staffing, response);
  LOG(INFO) << "Solver result status: "
            << ShiftSchedulingResultStatus_Name(result.solver_status())
            << " in " << result.wall_time_seconds() << "s.";
  if (!HasSchedule(result.solver_status())) {
    LOG(WARNING) << result.message();
    return result;
  }

  const absl::Status verification =
      VerifyAssignment(model, (*staffing)->ExtractAssignment(response));
  if (!verification.ok()) {
    LOG(ERROR) << "Verification failed: " << verification;
    result.clear_schedule();
    result.clear_summaries();
    result.set_solver_status(ABNORMAL);
    result.set_message(
        absl::StrCat("Verification failed: ", verification.message()));
  }
  return result;
}

}  // namespace shiftplan
