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

#include "shiftplan/base/file.h"

#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "shiftplan/base/protobuf_util.h"
#include "shiftplan/scheduling/shift_scheduling_parameters.pb.h"

namespace shiftplan {
namespace {

TEST(FileTest, ContentsRoundTrip) {
  const std::string path = absl::StrCat(::testing::TempDir(), "/contents.txt");
  ASSERT_TRUE(file::SetContents(path, "kitchen\n").ok());
  const absl::StatusOr<std::string> contents = file::GetContents(path);
  ASSERT_TRUE(contents.ok()) << contents.status();
  EXPECT_EQ(*contents, "kitchen\n");
}

TEST(FileTest, MissingFile) {
  const absl::StatusOr<std::string> contents =
      file::GetContents(absl::StrCat(::testing::TempDir(), "/no/such/file"));
  EXPECT_FALSE(contents.ok());
}

TEST(FileTest, TextProto) {
  const auto parameters = ParseTextOrDie<ShiftSchedulingParameters>(R"pb(
    labor_policy { max_daily_hours: 8 }
    solver_options { max_time_in_seconds: 5 }
  )pb");
  const std::string path = absl::StrCat(::testing::TempDir(), "/params.txtpb");
  ASSERT_TRUE(file::SetTextProto(path, parameters).ok());
  const absl::StatusOr<ShiftSchedulingParameters> read =
      file::GetTextProto<ShiftSchedulingParameters>(path);
  ASSERT_TRUE(read.ok()) << read.status();
  EXPECT_EQ(read->labor_policy().max_daily_hours(), 8);
  EXPECT_EQ(read->solver_options().max_time_in_seconds(), 5.0);
  EXPECT_FALSE(read->labor_policy().has_min_daily_hours());
}

TEST(FileTest, BinaryProtoFallback) {
  ShiftSchedulingParameters parameters;
  parameters.mutable_labor_policy()->set_consecutive_days_off(3);
  const std::string path = absl::StrCat(::testing::TempDir(), "/params.bin");
  ASSERT_TRUE(file::SetContents(path, parameters.SerializeAsString()).ok());
  const absl::StatusOr<ShiftSchedulingParameters> read =
      file::GetTextProto<ShiftSchedulingParameters>(path);
  ASSERT_TRUE(read.ok()) << read.status();
  EXPECT_EQ(read->labor_policy().consecutive_days_off(), 3);
}

TEST(FileTest, GarbageIsRejected) {
  const std::string path = absl::StrCat(::testing::TempDir(), "/garbage.txt");
  ASSERT_TRUE(file::SetContents(path, "labor_policy {").ok());
  ShiftSchedulingParameters parameters;
  EXPECT_EQ(file::GetTextProto(path, &parameters).code(),
            absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace shiftplan
