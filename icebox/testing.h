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

#ifndef ICEBOX_TESTING_H_
#define ICEBOX_TESTING_H_

#include <string>

#include "gmock/gmock.h"  // IWYU pragma: keep
#include "gtest/gtest.h"  // IWYU pragma: keep
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "icebox/util/status_matchers.h"  // IWYU pragma: export

// Skips the current test when this host cannot build sandboxes, e.g. because
// unprivileged user namespaces are disabled or a seccomp filter blocks
// unshare(2). Example:
//
//   TEST(Foo, Bar) {
//     ICEBOX_SKIP_IF_SANDBOXES_UNSUPPORTED;
//     [...]
//   }
#define ICEBOX_SKIP_IF_SANDBOXES_UNSUPPORTED                               \
  do {                                                                     \
    if (absl::Status icebox_support = ::icebox::SandboxesSupported();      \
        !icebox_support.ok()) {                                            \
      GTEST_SKIP() << "Sandboxes unsupported: " << icebox_support;         \
    }                                                                      \
  } while (0)

namespace icebox {

// Returns a writable absolute path usable in tests. If the name argument is
// specified, returns a name under that path.
std::string GetTestTempPath(absl::string_view name = {});

// Creates a temporary directory under a path starting with prefix and returns
// its path.
absl::StatusOr<std::string> CreateTempDir(absl::string_view prefix);

// Returns the path of a binary built from icebox/testcases.
std::string GetTestcaseBinPath(absl::string_view name);

// Checks, in throwaway child processes, that the calling user can create the
// sandbox namespaces and mount a fresh proc in them. The result is cached.
absl::Status SandboxesSupported();

// Host directories for one sandboxed task.
struct TaskDirs {
  std::string root;
  std::string in;
  std::string out;
};

// Creates fresh, empty root, in and out directories below base.
absl::StatusOr<TaskDirs> CreateTaskDirs(const std::string& base);

// Copies a testcase binary into dir and returns its path inside the sandbox
// assuming dir is exposed at inside_dir.
absl::StatusOr<std::string> InstallTestcase(absl::string_view name,
                                            const std::string& dir,
                                            absl::string_view inside_dir);

}  // namespace icebox

#endif  // ICEBOX_TESTING_H_
