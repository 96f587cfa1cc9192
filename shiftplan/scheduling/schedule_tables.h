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

#ifndef SHIFTPLAN_SCHEDULING_SCHEDULE_TABLES_H_
#define SHIFTPLAN_SCHEDULING_SCHEDULE_TABLES_H_

#include <string>

#include "shiftplan/scheduling/shift_scheduling.pb.h"

namespace shiftplan {

// One line per (worker, day) and one column per hour, holding the role name
// or nothing.
std::string FormatScheduleTable(const ShiftSchedulingResult& result);

// One line per worker with its weekly statistics.
std::string FormatSummaryTable(const ShiftSchedulingResult& result);

}  // namespace shiftplan

#endif  // SHIFTPLAN_SCHEDULING_SCHEDULE_TABLES_H_
