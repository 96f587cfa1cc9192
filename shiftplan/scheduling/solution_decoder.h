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

// Turns a CP-SAT response into a ShiftSchedulingResult: maps the solver
// status, and when a solution exists, rebuilds the per (worker, day) schedule
// and the per worker statistics.

#ifndef SHIFTPLAN_SCHEDULING_SOLUTION_DECODER_H_
#define SHIFTPLAN_SCHEDULING_SOLUTION_DECODER_H_

#include "ortools/sat/cp_model.pb.h"
#include "shiftplan/scheduling/assignment_matrix.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"
#include "shiftplan/scheduling/staffing_model_builder.h"

namespace shiftplan {

ShiftSchedulingResultStatus ToResultStatus(
    ::operations_research::sat::CpSolverStatus status);

// True for the statuses that come with a schedule.
bool HasSchedule(ShiftSchedulingResultStatus status);

// Decodes `response`, which must have been produced by solving `staffing`.
// On failure statuses, the result only holds the status and a message.
ShiftSchedulingResult DecodeSolution(
    const ShiftSchedulingModel& model, const StaffingCpModel& staffing,
    const ::operations_research::sat::CpSolverResponse& response);

// Appends one WorkerDaySchedule per (worker, day) and one WorkerSummary per
// worker to `result`. Decoding twice the same assignment gives the same
// records.
void DecodeAssignment(const ShiftSchedulingModel& model,
                      const AssignmentMatrix& assignment,
                      ShiftSchedulingResult* result);

WorkerSummary SummarizeWorker(const ShiftSchedulingModel& model,
                              const AssignmentMatrix& assignment, int worker);

}  // namespace shiftplan

#endif  // SHIFTPLAN_SCHEDULING_SOLUTION_DECODER_H_
