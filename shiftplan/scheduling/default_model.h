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

// Default inputs of the kitchen scheduler: a roster of interchangeable
// workers and the usual lunch and dinner staffing needs.

#ifndef SHIFTPLAN_SCHEDULING_DEFAULT_MODEL_H_
#define SHIFTPLAN_SCHEDULING_DEFAULT_MODEL_H_

#include "google/protobuf/repeated_ptr_field.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"

namespace shiftplan {

inline constexpr int kDefaultMaxWeeklyHours = 42;
inline constexpr int kDefaultMaxBreaks = 3;

// Workers "Emp1" to "Emp<num_workers>", eligible for every role, with the
// default weekly limits.
google::protobuf::RepeatedPtrField<Worker> MakeDefaultRoster(int num_workers);

// Every day, one worker per role from 10:00 to 15:00 and from 18:00 to 22:00,
// one cook only from 16:00 to 17:00, and nobody at 23:00.
google::protobuf::RepeatedPtrField<RoleRequirement> MakeDefaultRequirements();

// Default roster and requirements, with default parameters.
ShiftSchedulingModel MakeDefaultModel(int num_workers);

}  // namespace shiftplan

#endif  // SHIFTPLAN_SCHEDULING_DEFAULT_MODEL_H_
