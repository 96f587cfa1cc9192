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

#include "shiftplan/scheduling/horizon.h"

#include <string>

#include "absl/log/check.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"

namespace shiftplan {

absl::string_view RoleDisplayName(Role role) {
  switch (role) {
    case COOK:
      return "Cook";
    case PIZZA_MAKER:
      return "PizzaMaker";
    case DISHWASHER:
      return "Dishwasher";
    default:
      return "";
  }
}

absl::string_view DayDisplayName(int day) {
  static constexpr absl::string_view kDayNames[kNumDays] = {
      "Monday", "Tuesday",  "Wednesday", "Thursday",
      "Friday", "Saturday", "Sunday"};
  CHECK_GE(day, 0);
  CHECK_LT(day, kNumDays);
  return kDayNames[day];
}

std::string HourLabel(int hour) {
  return absl::StrFormat("%d:00", (kFirstClockHour + hour) % 24);
}

}  // namespace shiftplan
