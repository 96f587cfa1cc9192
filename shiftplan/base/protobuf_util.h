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

#ifndef SHIFTPLAN_BASE_PROTOBUF_UTIL_H_
#define SHIFTPLAN_BASE_PROTOBUF_UTIL_H_

#include <string>

#include "absl/log/check.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/text_format.h"

namespace shiftplan {

template <typename T>
T ParseTextOrDie(absl::string_view input) {
  T result;
  CHECK(google::protobuf::TextFormat::ParseFromString(std::string(input),
                                                      &result))
      << "Failed to parse text proto: " << input;
  return result;
}

}  // namespace shiftplan

#endif  // SHIFTPLAN_BASE_PROTOBUF_UTIL_H_
