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

#include "icebox/flags.h"

#include "absl/flags/flag.h"
#include "icebox/layout.h"

ABSL_FLAG(std::string, icebox_layout, "",
          "Text format SandboxLayout file with the host paths to expose. Uses "
          "the built-in allow-list if empty");

namespace icebox {

absl::StatusOr<SandboxLayout> LayoutFromFlags() {
  const std::string path = absl::GetFlag(FLAGS_icebox_layout);
  if (path.empty()) {
    return DefaultLayout();
  }
  return LoadLayout(path);
}

}  // namespace icebox
