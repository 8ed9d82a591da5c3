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

#ifndef ICEBOX_UTIL_OS_ERROR_H_
#define ICEBOX_UTIL_OS_ERROR_H_

#include <cstddef>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace icebox {

// Writes the description of a POSIX error code to buf, without allocating
// memory, and returns it. Unknown codes read "Unknown error nnn". The returned
// pointer may be a static string instead of buf. errno is left untouched.
const char* RawStrError(int errnum, char* buf, size_t buflen);

// Returns the concatenation of args, followed by ": " and the description of
// error_number.
template <typename... Arg>
std::string OsErrorMessage(int error_number, const Arg&... args) {
  char buf[100];
  return absl::StrCat(args..., ": ",
                      RawStrError(error_number, buf, sizeof(buf)));
}

// Builds a status from an errno value, using the canonical errno to status
// code mapping (EPERM -> kPermissionDenied, ENOENT -> kNotFound, ENOSPC ->
// kResourceExhausted, ...). The message is the concatenation of args.
template <typename... Arg>
absl::Status ErrnoStatus(int error_number, const Arg&... args) {
  return absl::ErrnoToStatus(error_number, absl::StrCat(args...));
}

}  // namespace icebox

#endif  // ICEBOX_UTIL_OS_ERROR_H_
