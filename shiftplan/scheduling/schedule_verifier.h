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

#ifndef SHIFTPLAN_SCHEDULING_SCHEDULE_VERIFIER_H_
#define SHIFTPLAN_SCHEDULING_SCHEDULE_VERIFIER_H_

#include "absl/status/status.h"
#include "shiftplan/scheduling/assignment_matrix.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"

namespace shiftplan {

// Checks that `assignment` satisfies every rule of the labor policy of
// `model`, the worker limits, the eligibility of the workers and the exact
// staffing requirements. Returns InternalError describing the first violation
// found, and OkStatus otherwise. `model` must be valid.
absl::Status VerifyAssignment(const ShiftSchedulingModel& model,
                              const AssignmentMatrix& assignment);

}  // namespace shiftplan

#endif  // SHIFTPLAN_SCHEDULING_SCHEDULE_VERIFIER_H_
