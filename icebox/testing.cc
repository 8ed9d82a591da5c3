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

#include "icebox/testing.h"

#include <limits.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <fstream>

#include "absl/strings/str_cat.h"
#include "icebox/namespace.h"
#include "icebox/util/fileops.h"
#include "icebox/util/os_error.h"
#include "icebox/util/path.h"

#ifndef ICEBOX_TESTCASES_DIR
#error "ICEBOX_TESTCASES_DIR must point to the built testcases"
#endif

namespace icebox {

namespace {

namespace fileops = ::icebox::file_util::fileops;

enum SupportTesteeExitCode {
  kSupported = 0,
  kNoNamespaces = 10,
  kNoFork = 11,
  kNoPrivateMounts = 12,
  kNoTmpfs = 13,
  kNoProc = 14,
};

// Mirrors the first steps of CreateNamespace() and EnterNamespace(), without
// touching the root.
[[noreturn]] void TesteeSupport(const std::string& mount_dir) {
  if (!CreateNamespace().ok()) {
    _exit(kNoNamespaces);
  }
  pid_t init = fork();
  if (init == -1) {
    _exit(kNoFork);
  }
  if (init == 0) {
    if (mount("", "/", "", MS_REC | MS_PRIVATE, nullptr) == -1) {
      _exit(kNoPrivateMounts);
    }
    if (mount("tmpfs", mount_dir.c_str(), "tmpfs", MS_NOSUID, nullptr) ==
        -1) {
      _exit(kNoTmpfs);
    }
    if (mount("proc", mount_dir.c_str(), "proc",
              MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) == -1) {
      _exit(kNoProc);
    }
    _exit(kSupported);
  }
  int status;
  if (TEMP_FAILURE_RETRY(waitpid(init, &status, 0)) == -1 ||
      !WIFEXITED(status)) {
    _exit(kNoFork);
  }
  _exit(WEXITSTATUS(status));
}

absl::Status CopyExecutable(const std::string& source,
                            const std::string& target) {
  {
    std::ifstream input(source, std::ios_base::binary);
    std::ofstream output(target, std::ios_base::trunc | std::ios_base::binary);
    output << input.rdbuf();
    if (!input || !output) {
      return absl::NotFoundError(
          absl::StrCat("Could not copy ", source, " to ", target));
    }
  }
  if (chmod(target.c_str(), 0755) == -1) {
    return ErrnoStatus(errno, "chmod(", target, ")");
  }
  return absl::OkStatus();
}

absl::Status CheckSandboxesSupported() {
  absl::StatusOr<std::string> mount_dir =
      CreateTempDir(GetTestTempPath("support_check_"));
  if (!mount_dir.ok()) {
    return mount_dir.status();
  }
  pid_t pid = fork();
  if (pid == -1) {
    return ErrnoStatus(errno, "fork()");
  }
  if (pid == 0) {
    TesteeSupport(*mount_dir);
  }
  int status;
  if (TEMP_FAILURE_RETRY(waitpid(pid, &status, 0)) == -1) {
    return ErrnoStatus(errno, "waitpid()");
  }
  if (rmdir(mount_dir->c_str()) == -1) {
    return ErrnoStatus(errno, "rmdir(", *mount_dir, ")");
  }
  if (!WIFEXITED(status)) {
    return absl::InternalError("Support check crashed");
  }
  switch (WEXITSTATUS(status)) {
    case kSupported:
      return absl::OkStatus();
    case kNoNamespaces:
      return absl::UnavailableError("Cannot create user namespaces");
    case kNoPrivateMounts:
      return absl::UnavailableError("Cannot make mounts private");
    case kNoTmpfs:
      return absl::UnavailableError("Cannot mount tmpfs");
    case kNoProc:
      return absl::UnavailableError("Cannot mount a fresh proc");
    default:
      return absl::UnavailableError(
          absl::StrCat("Support check failed with ", WEXITSTATUS(status)));
  }
}

}  // namespace

std::string GetTestTempPath(absl::string_view name) {
  const char* test_tmpdir = getenv("TEST_TMPDIR");
  std::string base;
  if (test_tmpdir != nullptr) {
    base = test_tmpdir;
  } else {
    char cwd[PATH_MAX];
    base = getcwd(cwd, sizeof(cwd)) != nullptr ? cwd : "/tmp";
  }
  return file::JoinPath(base, name);
}

absl::StatusOr<std::string> CreateTempDir(absl::string_view prefix) {
  std::string path = absl::StrCat(prefix, "XXXXXX");
  if (mkdtemp(&path[0]) == nullptr) {
    return ErrnoStatus(errno, "mkdtemp(", path, ")");
  }
  return path;
}

std::string GetTestcaseBinPath(absl::string_view name) {
  return file::JoinPath(ICEBOX_TESTCASES_DIR, name);
}

absl::Status SandboxesSupported() {
  static const absl::Status* const kSupport =
      new absl::Status(CheckSandboxesSupported());
  return *kSupport;
}

absl::StatusOr<TaskDirs> CreateTaskDirs(const std::string& base) {
  if (!fileops::CreateDirectoryRecursively(base, 0755)) {
    return ErrnoStatus(errno, "creating '", base, "'");
  }
  absl::StatusOr<std::string> task =
      CreateTempDir(file::JoinPath(base, "task_"));
  if (!task.ok()) {
    return task.status();
  }
  TaskDirs dirs{file::JoinPath(*task, "root"), file::JoinPath(*task, "in"),
                file::JoinPath(*task, "out")};
  for (const std::string* dir : {&dirs.root, &dirs.in, &dirs.out}) {
    if (mkdir(dir->c_str(), 0755) == -1) {
      return ErrnoStatus(errno, "mkdir(", *dir, ")");
    }
  }
  // mkdtemp() creates 0700 directories.
  if (chmod(task->c_str(), 0755) == -1) {
    return ErrnoStatus(errno, "chmod(", *task, ")");
  }
  return dirs;
}

absl::StatusOr<std::string> InstallTestcase(absl::string_view name,
                                            const std::string& dir,
                                            absl::string_view inside_dir) {
  const std::string source = GetTestcaseBinPath(name);
  const std::string target = file::JoinPath(dir, name);
  absl::Status copied = CopyExecutable(source, target);
  if (!copied.ok()) {
    return copied;
  }
  return file::JoinPath(inside_dir, name);
}

}  // namespace icebox
