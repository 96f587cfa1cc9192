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

#include "shiftplan/scheduling/default_model.h"

#include "absl/strings/str_cat.h"
#include "google/protobuf/repeated_ptr_field.h"
#include "shiftplan/scheduling/horizon.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"

namespace shiftplan {

google::protobuf::RepeatedPtrField<Worker> MakeDefaultRoster(int num_workers) {
  google::protobuf::RepeatedPtrField<Worker> roster;
  for (int i = 0; i < num_workers; ++i) {
    Worker* const worker = roster.Add();
    worker->set_name(absl::StrCat("Emp", i + 1));
    for (const Role role : kAllRoles) worker->add_eligible_roles(role);
    worker->set_max_weekly_hours(kDefaultMaxWeeklyHours);
    worker->set_max_breaks(kDefaultMaxBreaks);
  }
  return roster;
}

google::protobuf::RepeatedPtrField<RoleRequirement> MakeDefaultRequirements() {
  google::protobuf::RepeatedPtrField<RoleRequirement> requirements;
  for (const Role role : kAllRoles) {
    RoleRequirement* const requirement = requirements.Add();
    requirement->set_role(role);
    for (int d = 0; d < kNumDays; ++d) {
      DailyRequirement* const daily = requirement->add_days();
      daily->set_day(WeekdayFromIndex(d));
      for (int h = 0; h < kHoursPerDay; ++h) {
        int headcount = 0;
        if (h <= 5 || (h >= 8 && h <= 12)) {
          // Lunch and dinner peaks.
          headcount = 1;
        } else if (h <= 7) {
          headcount = role == COOK ? 1 : 0;
        }
        daily->add_hourly_headcount(headcount);
      }
    }
  }
  return requirements;
}

ShiftSchedulingModel MakeDefaultModel(int num_workers) {
  ShiftSchedulingModel model;
  model.set_display_name("Kitchen");
  *model.mutable_workers() = MakeDefaultRoster(num_workers);
  *model.mutable_requirements() = MakeDefaultRequirements();
  return model;
}

}  // namespace shiftplan
