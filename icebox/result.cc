// Copyright 2026 Google LLC
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

#include "icebox/result.h"

#include <string.h>

#include "absl/strings/str_cat.h"
#include "icebox/setup_error.h"

namespace icebox {

absl::StatusOr<int> Result::ExitStatus() const {
  switch (final_status()) {
    case OK:
      return static_cast<int>(reason_code());
    case SIGNALED:
      return -static_cast<int>(reason_code());
    default:
      return absl::FailedPreconditionError(
          absl::StrCat("Program did not run: ", ToString()));
  }
}

absl::Status Result::ToStatus() const {
  switch (final_status()) {
    case OK:
      if (reason_code() == 0) {
        return absl::OkStatus();
      }
      break;
    case SETUP_ERROR:
    case INTERNAL_ERROR:
      if (!setup_status_.ok()) {
        return absl::Status(setup_status_.code(), ToString());
      }
      break;
    default:
      break;
  }
  return absl::InternalError(ToString());
}

std::string Result::ToString() const {
  switch (final_status()) {
    case UNSET:
      return absl::StrCat("UNSET - Code: ", reason_code());
    case OK:
      return absl::StrCat("OK - Exit code: ", reason_code());
    case SIGNALED:
      return absl::StrCat("Process terminated with a SIGNAL - Signal: ",
                          reason_code(), " (",
                          strsignal(static_cast<int>(reason_code())), ")");
    case SETUP_ERROR:
    case INTERNAL_ERROR: {
      std::string result = absl::StrCat(
          StatusEnumToString(final_status()), " - Code: ",
          ReasonCodeEnumToString(static_cast<ReasonCodeEnum>(reason_code())));
      if (!setup_status_.ok()) {
        absl::StrAppend(&result, " (",
                        SetupErrorKindToString(
                            ClassifySetupError(setup_status_)),
                        "): ", setup_status_.ToString());
      }
      return result;
    }
  }
  return absl::StrCat("<UNKNOWN>(", final_status(), ") Code: ", reason_code());
}

std::string Result::StatusEnumToString(StatusEnum value) {
  switch (value) {
    case UNSET:
      return "UNSET";
    case OK:
      return "OK";
    case SETUP_ERROR:
      return "SETUP_ERROR";
    case SIGNALED:
      return "SIGNALED";
    case INTERNAL_ERROR:
      return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}

std::string Result::ReasonCodeEnumToString(ReasonCodeEnum value) {
  switch (value) {
    case FAILED_NAMESPACES:
      return "FAILED_NAMESPACES";
    case FAILED_ROOT:
      return "FAILED_ROOT";
    case FAILED_EXEC:
      return "FAILED_EXEC";
    case FAILED_SUBPROCESS:
      return "FAILED_SUBPROCESS";
    case FAILED_REPORT:
      return "FAILED_REPORT";
    case FAILED_PIPE:
      return "FAILED_PIPE";
    case FAILED_FORK:
      return "FAILED_FORK";
    case FAILED_WAIT:
      return "FAILED_WAIT";
  }
  return absl::StrCat("UNKNOWN: ", value);
}

}  // namespace icebox
