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

#ifndef ICEBOX_FLAGS_H_
#define ICEBOX_FLAGS_H_

#include <string>

#include "absl/flags/declare.h"
#include "absl/status/statusor.h"
#include "icebox/layout.pb.h"

ABSL_DECLARE_FLAG(std::string, icebox_layout);

namespace icebox {

// Returns the layout named by --icebox_layout, or DefaultLayout() if the flag
// is empty.
absl::StatusOr<SandboxLayout> LayoutFromFlags();

}  // namespace icebox

#endif  // ICEBOX_FLAGS_H_
