// Copyright 2019 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "icebox/util/file_helpers.h"

#include <cerrno>
#include <fstream>
#include <sstream>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "icebox/util/os_error.h"

namespace icebox::file {

absl::StatusOr<std::string> GetContents(absl::string_view path) {
  errno = 0;
  std::ifstream in_stream{std::string(path), std::ios_base::binary};
  if (!in_stream) {
    return ErrnoStatus(errno != 0 ? errno : EIO, "Failed to open file: ",
                       path);
  }
  std::ostringstream out_stream;
  out_stream << in_stream.rdbuf();
  if (in_stream.bad() || !out_stream) {
    return absl::UnknownError(absl::StrCat("Error during read: ", path));
  }
  return out_stream.str();
}

absl::Status SetContents(absl::string_view path, absl::string_view content) {
  errno = 0;
  std::ofstream out_stream(std::string(path),
                           std::ios_base::trunc | std::ios_base::binary);
  if (!out_stream) {
    return ErrnoStatus(errno != 0 ? errno : EIO, "Failed to open file: ",
                       path);
  }
  out_stream.write(content.data(), content.size());
  out_stream.flush();
  if (!out_stream) {
    return ErrnoStatus(errno != 0 ? errno : EIO, "Error during write: ",
                       path);
  }
  return absl::OkStatus();
}

}  // namespace icebox::file
