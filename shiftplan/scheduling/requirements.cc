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

#include "shiftplan/scheduling/requirements.h"

#include <array>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "shiftplan/base/status_builder.h"
#include "shiftplan/scheduling/horizon.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"

namespace shiftplan {

absl::StatusOr<HeadcountGrid> HeadcountGrid::FromModel(
    const ShiftSchedulingModel& model) {
  HeadcountGrid grid;
  std::array<bool, kNumRoles> role_seen = {};
  for (const RoleRequirement& requirement : model.requirements()) {
    if (requirement.role() == ROLE_UNSPECIFIED ||
        !Role_IsValid(requirement.role())) {
      return InvalidArgumentErrorBuilder()
             << "requirement with invalid role " << requirement.role();
    }
    const int role_index = RoleIndex(requirement.role());
    const absl::string_view role_name = RoleDisplayName(requirement.role());
    if (role_seen[role_index]) {
      return InvalidArgumentErrorBuilder()
             << "requirements for role " << role_name << " appear twice";
    }
    role_seen[role_index] = true;

    std::array<bool, kNumDays> day_seen = {};
    for (const DailyRequirement& daily : requirement.days()) {
      if (daily.day() == WEEKDAY_UNSPECIFIED || !Weekday_IsValid(daily.day())) {
        return InvalidArgumentErrorBuilder()
               << "requirements for role " << role_name
               << " contain an invalid day " << daily.day();
      }
      const int day = DayIndex(daily.day());
      if (day_seen[day]) {
        return InvalidArgumentErrorBuilder()
               << "requirements for role " << role_name << " list "
               << DayDisplayName(day) << " twice";
      }
      day_seen[day] = true;
      if (daily.hourly_headcount_size() != kHoursPerDay) {
        return InvalidArgumentErrorBuilder()
               << "requirements for role " << role_name << " on "
               << DayDisplayName(day) << " have "
               << daily.hourly_headcount_size() << " hourly values instead of "
               << kHoursPerDay;
      }
      for (int hour = 0; hour < kHoursPerDay; ++hour) {
        const int headcount = daily.hourly_headcount(hour);
        if (headcount < 0) {
          return InvalidArgumentErrorBuilder()
                 << "requirements for role " << role_name << " on "
                 << DayDisplayName(day) << " at " << HourLabel(hour)
                 << " must be non-negative, got " << headcount;
        }
        grid.Set(role_index, SlotIndex(day, hour), headcount);
      }
    }
    for (int day = 0; day < kNumDays; ++day) {
      if (!day_seen[day]) {
        return InvalidArgumentErrorBuilder()
               << "requirements for role " << role_name << " are missing "
               << DayDisplayName(day);
      }
    }
  }
  for (int role_index = 0; role_index < kNumRoles; ++role_index) {
    if (!role_seen[role_index]) {
      return InvalidArgumentErrorBuilder()
             << "requirements are missing role "
             << RoleDisplayName(RoleFromIndex(role_index));
    }
  }
  return grid;
}

int HeadcountGrid::TotalHeadcount() const {
  int total = 0;
  for (const int headcount : headcounts_) total += headcount;
  return total;
}

}  // namespace shiftplan
