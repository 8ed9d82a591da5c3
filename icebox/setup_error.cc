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

#include "icebox/setup_error.h"


#include "absl/strings/cord.h"
#include "absl/types/optional.h"

namespace icebox {
namespace {

constexpr SetupErrorKind kTaggableKinds[] = {
    SetupErrorKind::kPrivilege,    SetupErrorKind::kResourceExhaustion,
    SetupErrorKind::kMissingPath,  SetupErrorKind::kInvalidConfiguration,
    SetupErrorKind::kPrecondition, SetupErrorKind::kPivot,
    SetupErrorKind::kOther,
};

}  // namespace

absl::Status WithSetupErrorKind(absl::Status status, SetupErrorKind kind) {
  if (!status.ok()) {
    status.SetPayload(kSetupErrorKindPayload,
                      absl::Cord(SetupErrorKindToString(kind)));
  }
  return status;
}

SetupErrorKind ClassifySetupError(const absl::Status& status) {
  if (absl::optional<absl::Cord> tag =
          status.GetPayload(kSetupErrorKindPayload);
      tag.has_value()) {
    for (SetupErrorKind kind : kTaggableKinds) {
      if (*tag == SetupErrorKindToString(kind)) {
        return kind;
      }
    }
  }
  switch (status.code()) {
    case absl::StatusCode::kOk:
      return SetupErrorKind::kNone;
    case absl::StatusCode::kPermissionDenied:
      return SetupErrorKind::kPrivilege;
    case absl::StatusCode::kResourceExhausted:
    case absl::StatusCode::kUnavailable:
      return SetupErrorKind::kResourceExhaustion;
    case absl::StatusCode::kNotFound:
      return SetupErrorKind::kMissingPath;
    case absl::StatusCode::kInvalidArgument:
      return SetupErrorKind::kInvalidConfiguration;
    case absl::StatusCode::kFailedPrecondition:
      return SetupErrorKind::kPrecondition;
    default:
      return SetupErrorKind::kOther;
  }
}

std::string SetupErrorKindToString(SetupErrorKind kind) {
  switch (kind) {
    case SetupErrorKind::kNone:
      return "NONE";
    case SetupErrorKind::kPrivilege:
      return "PRIVILEGE";
    case SetupErrorKind::kResourceExhaustion:
      return "RESOURCE_EXHAUSTION";
    case SetupErrorKind::kMissingPath:
      return "MISSING_PATH";
    case SetupErrorKind::kInvalidConfiguration:
      return "INVALID_CONFIGURATION";
    case SetupErrorKind::kPrecondition:
      return "PRECONDITION";
    case SetupErrorKind::kPivot:
      return "PIVOT";
    case SetupErrorKind::kOther:
      return "OTHER";
  }
  return "UNKNOWN";
}

}  // namespace icebox
