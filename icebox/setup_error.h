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

// Categories of sandbox construction failures.

#ifndef ICEBOX_SETUP_ERROR_H_
#define ICEBOX_SETUP_ERROR_H_

#include <string>

#include "absl/status/status.h"

namespace icebox {

enum class SetupErrorKind {
  kNone,
  // Not allowed to create namespaces, write ID maps or mount.
  kPrivilege,
  // A kernel limit was hit (namespaces, memory, tmpfs space).
  kResourceExhaustion,
  // A required host path does not exist.
  kMissingPath,
  // The layout or the sandbox directories are malformed.
  kInvalidConfiguration,
  // The root assembler was called outside PID 1 of the sandbox.
  kPrecondition,
  // pivot_root() into the assembled root failed.
  kPivot,
  kOther,
};

// Type URL of the status payload naming the SetupErrorKind explicitly.
constexpr char kSetupErrorKindPayload[] = "type.icebox/SetupErrorKind";

// Returns status, tagged as a failure of the given kind. The tag travels in a
// payload, so it survives SetupReport round-trips.
absl::Status WithSetupErrorKind(absl::Status status, SetupErrorKind kind);

// Maps a status returned by CreateNamespace() or EnterNamespace() to its
// failure category. An explicit tag wins over the status code.
SetupErrorKind ClassifySetupError(const absl::Status& status);

std::string SetupErrorKindToString(SetupErrorKind kind);

}  // namespace icebox

#endif  // ICEBOX_SETUP_ERROR_H_
