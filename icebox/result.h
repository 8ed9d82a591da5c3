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

// This file defines the icebox::Result class which holds the outcome of
// running one command in a sandbox.

#ifndef ICEBOX_RESULT_H_
#define ICEBOX_RESULT_H_

#include <cstdint>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace icebox {

class Result {
 public:
  // Final execution status.
  enum StatusEnum {
    // Not set yet
    UNSET = 0,
    // Program exited
    OK,
    // Sandbox initialization failure
    SETUP_ERROR,
    // Program terminated with a signal
    SIGNALED,
    // Failure in the supervisor itself
    INTERNAL_ERROR,
  };

  // Detailed reason codes
  enum ReasonCodeEnum {
    // Codes used by status=`SETUP_ERROR`:
    FAILED_NAMESPACES = 0,
    FAILED_ROOT,
    FAILED_EXEC,
    FAILED_SUBPROCESS,
    FAILED_REPORT,

    // Codes used by status=`INTERNAL_ERROR`:
    FAILED_PIPE,
    FAILED_FORK,
    FAILED_WAIT,
  };

  Result() = default;

  // Setters/getters for the final status/code value.
  void SetExitStatusCode(StatusEnum final_status, uintptr_t reason_code) {
    // Don't overwrite exit status codes.
    if (final_status_ != UNSET) {
      return;
    }
    final_status_ = final_status;
    reason_code_ = reason_code;
  }

  // Status that caused a SETUP_ERROR or INTERNAL_ERROR.
  void set_setup_status(absl::Status status) {
    setup_status_ = std::move(status);
  }
  const absl::Status& setup_status() const { return setup_status_; }

  StatusEnum final_status() const { return final_status_; }
  uintptr_t reason_code() const { return reason_code_; }

  // If true, the program never ran because of a transient sandbox
  // construction failure or a supervisor out of processes or descriptors,
  // and running the command again might succeed.
  bool IsRetryable() const {
    switch (final_status_) {
      case SETUP_ERROR:
        return reason_code_ != FAILED_EXEC;
      case INTERNAL_ERROR:
        return reason_code_ == FAILED_PIPE || reason_code_ == FAILED_FORK;
      default:
        return false;
    }
  }

  // Exit code of the program, or minus the terminating signal. Fails if the
  // program did not run to completion.
  absl::StatusOr<int> ExitStatus() const;

  // Converts this result to a absl::Status object. The status will only be
  // OK if the program exited normally with an exit code of 0.
  absl::Status ToStatus() const;

  // Returns a descriptive string for final result.
  std::string ToString() const;

  // Converts StatusEnum to a string.
  static std::string StatusEnumToString(StatusEnum value);

  // Converts ReasonCodeEnum to a string.
  static std::string ReasonCodeEnumToString(ReasonCodeEnum value);

 private:
  // Final execution status - see 'StatusEnum' for details.
  StatusEnum final_status_ = UNSET;
  // Termination cause:
  //  a). process exit value if final_status_ == OK,
  //  b). terminating signal if final_status_ == SIGNALED,
  //  c). a ReasonCodeEnum for SETUP_ERROR and INTERNAL_ERROR.
  uintptr_t reason_code_ = 0;
  absl::Status setup_status_;
};

}  // namespace icebox

#endif  // ICEBOX_RESULT_H_
