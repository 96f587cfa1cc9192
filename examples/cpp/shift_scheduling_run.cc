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

// This file implements the main function for the weekly shift scheduler. It
// reads the roster and the staffing needs from an input file specified via
// command-line flags, and prints the schedule of each worker and a summary of
// the week.
//
// Example usage:
// ./shift_scheduling_run \
//     --input=examples/data/shift_scheduling/kitchen_week.textproto
// ./shift_scheduling_run --num_workers=10 --params="solver_options {
//     max_time_in_seconds: 60 }"

#include <cstdlib>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/check.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "google/protobuf/text_format.h"
#include "shiftplan/base/file.h"
#include "shiftplan/base/status_macros.h"
#include "shiftplan/scheduling/default_model.h"
#include "shiftplan/scheduling/schedule_tables.h"
#include "shiftplan/scheduling/shift_scheduler.h"
#include "shiftplan/scheduling/shift_scheduling.pb.h"
#include "shiftplan/scheduling/shift_scheduling_parameters.pb.h"

ABSL_FLAG(std::string, input, "",
          "Input file containing a ShiftSchedulingModel in text format. When "
          "empty, the default kitchen model is solved.");
ABSL_FLAG(int, num_workers, 6,
          "Number of workers of the default model, between 2 and 12.");
ABSL_FLAG(std::string, params, "",
          "ShiftSchedulingParameters in text format, merged into the "
          "parameters of the model.");
ABSL_FLAG(std::string, output, "",
          "If not empty, the ShiftSchedulingResult is written to this file in "
          "text format.");

namespace shiftplan {

absl::StatusOr<ShiftSchedulingModel> LoadModel() {
  ShiftSchedulingModel model;
  if (absl::GetFlag(FLAGS_input).empty()) {
    const int num_workers = absl::GetFlag(FLAGS_num_workers);
    if (num_workers < 2 || num_workers > 12) {
      return absl::InvalidArgumentError(
          "--num_workers must be between 2 and 12");
    }
    model = MakeDefaultModel(num_workers);
  } else {
    ASSIGN_OR_RETURN(model, file::GetTextProto<ShiftSchedulingModel>(
                                absl::GetFlag(FLAGS_input)));
  }

  const std::string params = absl::GetFlag(FLAGS_params);
  if (!params.empty()) {
    ShiftSchedulingParameters overrides;
    if (!google::protobuf::TextFormat::ParseFromString(params, &overrides)) {
      return absl::InvalidArgumentError(
          "--params is not a valid ShiftSchedulingParameters text proto");
    }
    model.mutable_parameters()->MergeFrom(overrides);
  }
  return model;
}

int Main() {
  const absl::StatusOr<ShiftSchedulingModel> model = LoadModel();
  if (!model.ok()) {
    LOG(ERROR) << model.status().message();
    return EXIT_FAILURE;
  }
  LOG(INFO) << "Scheduling '" << model->display_name() << "' with "
            << model->workers_size() << " workers.";

  const ShiftScheduler scheduler;
  const ShiftSchedulingResult result = scheduler.Solve(*model);

  if (!absl::GetFlag(FLAGS_output).empty()) {
    const absl::Status status =
        file::SetTextProto(absl::GetFlag(FLAGS_output), result);
    if (!status.ok()) LOG(ERROR) << status.message();
  }

  if (result.solver_status() != SOLVER_OPTIMAL &&
      result.solver_status() != SOLVER_FEASIBLE) {
    LOG(ERROR) << "No solution found ("
               << ShiftSchedulingResultStatus_Name(result.solver_status())
               << "). " << result.message();
    return EXIT_FAILURE;
  }

  LOG(INFO) << "Weekly schedule:\n" << FormatScheduleTable(result);
  LOG(INFO) << "Summary per worker:\n" << FormatSummaryTable(result);
  return EXIT_SUCCESS;
}

}  // namespace shiftplan

static const char kUsage[] =
    "Usage: see flags.\nThis program builds the weekly schedule of a kitchen "
    "team that satisfies the hourly staffing needs.";

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(kUsage);
  absl::ParseCommandLine(argc, argv);
  absl::SetStderrThreshold(absl::LogSeverityAtLeast::kInfo);
  absl::InitializeLog();
  return shiftplan::Main();
}
