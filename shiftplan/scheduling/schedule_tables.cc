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

#include "shiftplan/scheduling/schedule_tables.h"

#include <algorithm>
#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "shiftplan/scheduling/horizon.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"

namespace shiftplan {
namespace {

constexpr int kDayColumnWidth = 10;
// Wide enough for the longest role name.
constexpr int kHourColumnWidth = 11;

int NameColumnWidth(const ShiftSchedulingResult& result) {
  int width = 8;
  for (const WorkerSummary& summary : result.summaries()) {
    width = std::max<int>(width, summary.worker_name().size() + 1);
  }
  return width;
}

}  // namespace

std::string FormatScheduleTable(const ShiftSchedulingResult& result) {
  const int name_width = NameColumnWidth(result);
  std::string table =
      absl::StrFormat("%-*s%-*s", name_width, "Worker", kDayColumnWidth, "Day");
  for (int h = 0; h < kHoursPerDay; ++h) {
    absl::StrAppendFormat(&table, "%-*s", kHourColumnWidth, HourLabel(h));
  }
  absl::StrAppend(&table, "\n");
  for (const WorkerDaySchedule& row : result.schedule()) {
    absl::StrAppendFormat(&table, "%-*s%-*s", name_width, row.worker_name(),
                          kDayColumnWidth,
                          DayDisplayName(DayIndex(row.day())));
    for (const int role : row.hourly_roles()) {
      absl::StrAppendFormat(&table, "%-*s", kHourColumnWidth,
                            RoleDisplayName(static_cast<Role>(role)));
    }
    absl::StrAppend(&table, "\n");
  }
  return table;
}

std::string FormatSummaryTable(const ShiftSchedulingResult& result) {
  const int name_width = NameColumnWidth(result);
  std::string table = absl::StrFormat(
      "%-*s%8s%8s%8s%12s%10s\n", name_width, "Worker", "Hours", "Days",
      "Breaks", "MaxDaysOff", "Avg/day");
  for (const WorkerSummary& summary : result.summaries()) {
    absl::StrAppendFormat(&table, "%-*s%8d%8d%8d%12d%10.2f\n", name_width,
                          summary.worker_name(), summary.total_hours(),
                          summary.working_days(), summary.breaks(),
                          summary.max_consecutive_days_off(),
                          summary.average_daily_hours());
  }
  return table;
}

}  // namespace shiftplan
