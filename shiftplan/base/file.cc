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

#include <cstdio>
#include <string>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/message.h"
#include "google/protobuf/text_format.h"

namespace shiftplan::file {

absl::StatusOr<std::string> GetContents(absl::string_view path) {
  const std::string file_name(path);
  FILE* const f = fopen(file_name.c_str(), "rb");
  if (f == nullptr) {
    return absl::NotFoundError(absl::StrCat("Could not open '", path, "'."));
  }
  std::string contents;
  char buffer[4096];
  size_t read;
  while ((read = fread(buffer, 1, sizeof(buffer), f)) > 0) {
    contents.append(buffer, read);
  }
  const bool failed = ferror(f) != 0;
  fclose(f);  // Even if fread() fails!
  if (failed) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not read from '", path, "'."));
  }
  return contents;
}

absl::Status SetContents(absl::string_view path, absl::string_view contents) {
  const std::string file_name(path);
  FILE* const f = fopen(file_name.c_str(), "wb");
  if (f == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not open '", path, "' for writing."));
  }
  const size_t written = fwrite(contents.data(), 1, contents.size(), f);
  const bool closed = fclose(f) == 0;
  if (written != contents.size() || !closed) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not write to '", path, "'."));
  }
  return absl::OkStatus();
}

absl::Status GetTextProto(absl::string_view path,
                          google::protobuf::Message* proto) {
  const absl::StatusOr<std::string> contents = GetContents(path);
  if (!contents.ok()) {
    VLOG(1) << "Could not read '" << path << "'";
    return absl::InvalidArgumentError(
        absl::StrCat("Could not read proto from '", path,
                     "': ", contents.status().message()));
  }
  // Text format is tried first: a text proto is very unlikely to also be a
  // valid binary encoding.
  if (google::protobuf::TextFormat::ParseFromString(*contents, proto)) {
    return absl::OkStatus();
  }
  if (proto->ParseFromString(*contents)) {
    return absl::OkStatus();
  }
  return absl::InvalidArgumentError(absl::StrCat(
      "Could not parse '", path, "' as a ", proto->GetTypeName(), "."));
}

absl::Status SetTextProto(absl::string_view path,
                          const google::protobuf::Message& proto) {
  std::string proto_string;
  if (!google::protobuf::TextFormat::PrintToString(proto, &proto_string)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Could not print ", proto.GetTypeName(), "."));
  }
  return SetContents(path, proto_string);
}

}  // namespace shiftplan::file
