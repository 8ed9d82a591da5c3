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

// Prepares a freshly forked sandbox process before it touches namespaces.

#ifndef ICEBOX_SANITIZER_H_
#define ICEBOX_SANITIZER_H_

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace icebox::sanitizer {

// Returns a set with all file descriptors open in the current process.
absl::StatusOr<absl::flat_hash_set<int>> GetListOfFDs();

// Marks all file descriptors as close-on-exec, except the ones listed in
// fd_exceptions.
absl::Status MarkAllFDsAsCOEExcept(
    const absl::flat_hash_set<int>& fd_exceptions);

// Kills the current process when its parent dies, and keeps every file
// descriptor except stdio and fd_exceptions from reaching the sandboxed
// program.
absl::Status SanitizeCurrentProcess(
    const absl::flat_hash_set<int>& fd_exceptions);

}  // namespace icebox::sanitizer

#endif  // ICEBOX_SANITIZER_H_
