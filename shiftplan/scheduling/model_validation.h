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

// Validation of the scheduler inputs. Every function returns
// InvalidArgumentError with a message naming the faulty field, and OkStatus
// otherwise.

#ifndef SHIFTPLAN_SCHEDULING_MODEL_VALIDATION_H_
#define SHIFTPLAN_SCHEDULING_MODEL_VALIDATION_H_

#include "absl/status/status.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"
#include "shiftplan/scheduling/shift_scheduling_parameters.pb.h"

namespace shiftplan {

absl::Status ValidateLaborPolicy(const LaborPolicy& policy);

absl::Status ValidateSolverOptions(const SolverOptions& options);

absl::Status ValidateSchedulingParameters(
    const ShiftSchedulingParameters& parameters);

// A role missing from the eligible roles of a worker is not an error: the
// worker is simply not allowed to take that role.
absl::Status ValidateWorker(const Worker& worker);

// Validates the roster, the requirement section and the parameters.
absl::Status ValidateShiftSchedulingModel(const ShiftSchedulingModel& model);

}  // namespace shiftplan

#endif  // SHIFTPLAN_SCHEDULING_MODEL_VALIDATION_H_
