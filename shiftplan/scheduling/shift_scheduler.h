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

#ifndef SHIFTPLAN_SCHEDULING_SHIFT_SCHEDULER_H_
#define SHIFTPLAN_SCHEDULING_SHIFT_SCHEDULER_H_

#include "ortools/sat/sat_parameters.pb.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"
#include "shiftplan/scheduling/shift_scheduling_parameters.pb.h"

namespace shiftplan {

// Solves weekly shift scheduling problems with CP-SAT. Every call builds its
// own CP model, so a ShiftScheduler can be shared between threads.
class ShiftScheduler {
 public:
  ShiftScheduler() = default;

  // Never fails: malformed inputs, infeasible problems and time outs are
  // reported through the status and the message of the result. A result
  // holds a schedule iff its status is SOLVER_OPTIMAL or SOLVER_FEASIBLE.
  ShiftSchedulingResult Solve(const ShiftSchedulingModel& model) const;
};

::operations_research::sat::SatParameters MakeSatParameters(
    const SolverOptions& options);

}  // namespace shiftplan

#endif  // SHIFTPLAN_SCHEDULING_SHIFT_SCHEDULER_H_
