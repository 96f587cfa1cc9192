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

// Dimensions of the scheduling horizon, and conversions between the proto
// enums and the dense indices used by the CP model and the decoder.

#ifndef SHIFTPLAN_SCHEDULING_HORIZON_H_
#define SHIFTPLAN_SCHEDULING_HORIZON_H_

#include <array>
#include <string>

#include "absl/log/check.h"
#include "absl/strings/string_view.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"

namespace shiftplan {

inline constexpr int kNumDays = 7;
inline constexpr int kHoursPerDay = 14;
inline constexpr int kNumSlots = kNumDays * kHoursPerDay;
// Clock hour of the first hour of each day.
inline constexpr int kFirstClockHour = 10;

inline constexpr int kNumRoles = 3;
inline constexpr std::array<Role, kNumRoles> kAllRoles = {COOK, PIZZA_MAKER,
                                                          DISHWASHER};

// Flattens (day, hour) into a time slot.
inline int SlotIndex(int day, int hour) {
  DCHECK_GE(day, 0);
  DCHECK_LT(day, kNumDays);
  DCHECK_GE(hour, 0);
  DCHECK_LT(hour, kHoursPerDay);
  return day * kHoursPerDay + hour;
}

// Dense index of a role in [0, kNumRoles). The role must not be
// ROLE_UNSPECIFIED.
inline int RoleIndex(Role role) {
  DCHECK_NE(role, ROLE_UNSPECIFIED);
  return static_cast<int>(role) - 1;
}

inline Role RoleFromIndex(int role_index) {
  DCHECK_GE(role_index, 0);
  DCHECK_LT(role_index, kNumRoles);
  return kAllRoles[role_index];
}

// Day index in [0, kNumDays) of a weekday, MONDAY being 0.
inline int DayIndex(Weekday day) {
  DCHECK_NE(day, WEEKDAY_UNSPECIFIED);
  return static_cast<int>(day) - 1;
}

inline Weekday WeekdayFromIndex(int day) {
  DCHECK_GE(day, 0);
  DCHECK_LT(day, kNumDays);
  return static_cast<Weekday>(day + 1);
}

// "Cook", "PizzaMaker", "Dishwasher", and "" for ROLE_UNSPECIFIED.
absl::string_view RoleDisplayName(Role role);

// "Monday" ... "Sunday".
absl::string_view DayDisplayName(int day);

// "10:00" for hour 0 up to "23:00" for hour 13.
std::string HourLabel(int hour);

}  // namespace shiftplan

#endif  // SHIFTPLAN_SCHEDULING_HORIZON_H_
