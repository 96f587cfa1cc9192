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

#include "shiftplan/scheduling/model_validation.h"

#include <cmath>
#include <string>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "shiftplan/base/status_builder.h"
#include "shiftplan/base/status_macros.h"
#include "shiftplan/scheduling/horizon.h"
#include "shiftplan/scheduling/requirements.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"
#include "shiftplan/scheduling/shift_scheduling_parameters.pb.h"

namespace shiftplan {

using ::absl::InvalidArgumentError;
using ::absl::OkStatus;

absl::Status ValidateLaborPolicy(const LaborPolicy& policy) {
  if (policy.min_block_hours() < 1 || policy.min_block_hours() > kHoursPerDay) {
    return InvalidArgumentErrorBuilder()
           << "min_block_hours must be in [1, " << kHoursPerDay << "], got "
           << policy.min_block_hours();
  }
  if (policy.min_daily_hours() < 1 || policy.min_daily_hours() > kHoursPerDay) {
    return InvalidArgumentErrorBuilder()
           << "min_daily_hours must be in [1, " << kHoursPerDay << "], got "
           << policy.min_daily_hours();
  }
  if (policy.max_daily_hours() < policy.min_daily_hours() ||
      policy.max_daily_hours() < policy.min_block_hours()) {
    return InvalidArgumentError(
        "max_daily_hours must be at least min_daily_hours and "
        "min_block_hours");
  }
  if (policy.consecutive_days_off() < 0 ||
      policy.consecutive_days_off() > kNumDays) {
    return InvalidArgumentErrorBuilder()
           << "consecutive_days_off must be in [0, " << kNumDays << "], got "
           << policy.consecutive_days_off();
  }
  if (!LaborPolicy::RoleSwitchScope_IsValid(policy.role_switch_scope())) {
    return InvalidArgumentError("invalid value for role_switch_scope");
  }
  return OkStatus();
}

absl::Status ValidateSolverOptions(const SolverOptions& options) {
  if (std::isnan(options.max_time_in_seconds())) {
    return InvalidArgumentError("max_time_in_seconds is NAN");
  }
  if (options.max_time_in_seconds() <= 0) {
    return InvalidArgumentError("max_time_in_seconds must be positive");
  }
  if (options.num_search_workers() < 0) {
    return InvalidArgumentError("num_search_workers must be non-negative");
  }
  if (options.random_seed() < 0) {
    return InvalidArgumentError("random_seed must be non-negative");
  }
  return OkStatus();
}

absl::Status ValidateSchedulingParameters(
    const ShiftSchedulingParameters& parameters) {
  RETURN_IF_ERROR(ValidateLaborPolicy(parameters.labor_policy()))
      << "in labor_policy";
  RETURN_IF_ERROR(ValidateSolverOptions(parameters.solver_options()))
      << "in solver_options";
  return OkStatus();
}

absl::Status ValidateWorker(const Worker& worker) {
  if (worker.name().empty()) {
    return InvalidArgumentError("worker name must not be empty");
  }
  if (!worker.has_max_weekly_hours()) {
    return InvalidArgumentError(
        absl::StrCat("worker '", worker.name(), "' has no max_weekly_hours"));
  }
  if (worker.max_weekly_hours() < 0) {
    return InvalidArgumentError(absl::StrCat(
        "worker '", worker.name(), "' has a negative max_weekly_hours"));
  }
  if (!worker.has_max_breaks()) {
    return InvalidArgumentError(
        absl::StrCat("worker '", worker.name(), "' has no max_breaks"));
  }
  if (worker.max_breaks() < 0) {
    return InvalidArgumentError(absl::StrCat("worker '", worker.name(),
                                             "' has a negative max_breaks"));
  }
  for (const int role : worker.eligible_roles()) {
    if (role == ROLE_UNSPECIFIED || !Role_IsValid(role)) {
      return InvalidArgumentError(absl::StrCat(
          "worker '", worker.name(), "' lists an invalid role ", role));
    }
  }
  return OkStatus();
}

absl::Status ValidateShiftSchedulingModel(const ShiftSchedulingModel& model) {
  if (model.workers().empty()) {
    return InvalidArgumentError("the model has no workers");
  }
  absl::flat_hash_set<std::string> names;
  for (int w = 0; w < model.workers_size(); ++w) {
    const Worker& worker = model.workers(w);
    RETURN_IF_ERROR(ValidateWorker(worker)) << "worker #" << w;
    if (!names.insert(worker.name()).second) {
      return InvalidArgumentError(
          absl::StrCat("worker name '", worker.name(), "' appears twice"));
    }
  }
  RETURN_IF_ERROR(HeadcountGrid::FromModel(model).status());
  RETURN_IF_ERROR(ValidateSchedulingParameters(model.parameters()));
  return OkStatus();
}

}  // namespace shiftplan
