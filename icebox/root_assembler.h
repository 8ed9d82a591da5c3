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

// Assembles the sandbox root filesystem and pivots into it.

#ifndef ICEBOX_ROOT_ASSEMBLER_H_
#define ICEBOX_ROOT_ASSEMBLER_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "icebox/layout.pb.h"
#include "icebox/mounts.h"
#include "icebox/namespace.h"

namespace icebox {

// The only device nodes visible inside a sandbox.
inline constexpr absl::string_view kSandboxDevices[] = {"/dev/null",
                                                        "/dev/urandom"};

inline constexpr char kPasswdEntry[] =
    "icebox:x:1000:1000:icebox:/:/bin/bash\n";

// What EnterNamespace() put into the sandbox root. Targets are the paths
// under root_dir at the time they were mounted.
struct SandboxRoot {
  std::vector<MountIntent> mounted;
  // Trusted host paths that were symlinks and were recreated as such.
  std::vector<std::string> symlinked;
  // Optional host paths that were absent.
  std::vector<std::string> skipped_optional;
};

// Builds the sandbox root in a tmpfs at root_dir, exposes in_dir and out_dir
// read-write at /in and /out, pivots into it and seals it read-only.
//
// Must run as PID 1 of the namespaces created by CreateNamespace(), i.e. in
// the first child forked after it; fails with kFailedPrecondition otherwise.
// Errors before the pivot are returned and leave the host untouched, as all
// mounts are private to the namespace. Failures after the pivot abort the
// process.
absl::StatusOr<SandboxRoot> EnterNamespace(const IsolatedProcess& process,
                                           const std::string& root_dir,
                                           const std::string& in_dir,
                                           const std::string& out_dir,
                                           const SandboxLayout& layout);

}  // namespace icebox

#endif  // ICEBOX_ROOT_ASSEMBLER_H_
