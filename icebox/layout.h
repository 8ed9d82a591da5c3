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

// Which host paths a sandbox exposes, and how large its scratch space is.

#ifndef ICEBOX_LAYOUT_H_
#define ICEBOX_LAYOUT_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "icebox/layout.pb.h"

namespace icebox {

// Entries of the sandbox root that are always present and cannot be used as
// the target of a trusted path.
inline constexpr absl::string_view kReservedTargets[] = {
    "/proc", "/dev", "/tmp", "/in", "/out", "/etc/passwd", "/old_root",
};

// Built-in allow-list of toolchain paths and interpreter home directories.
SandboxLayout DefaultLayout();

// Parses a layout in protobuf text format and validates it.
absl::StatusOr<SandboxLayout> ParseLayout(absl::string_view text);

// Reads and parses a text format layout file.
absl::StatusOr<SandboxLayout> LoadLayout(const std::string& path);

absl::Status ValidateLayout(const SandboxLayout& layout);

// Path inside the sandbox at which entry is exposed.
std::string TargetOf(const TrustedPath& entry);

}  // namespace icebox

#endif  // ICEBOX_LAYOUT_H_
