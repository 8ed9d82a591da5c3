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

#include "icebox/sanitizer.h"

#include <fcntl.h>
#include <sys/prctl.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <string>
#include <vector>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "icebox/util/fileops.h"
#include "icebox/util/os_error.h"
#include "icebox/util/raw_logging.h"
#include "icebox/util/status_macros.h"

namespace icebox::sanitizer {

namespace {

namespace fileops = ::icebox::file_util::fileops;

constexpr char kProcSelfFd[] = "/proc/self/fd";

}  // namespace

absl::StatusOr<absl::flat_hash_set<int>> GetListOfFDs() {
  std::vector<std::string> entries;
  std::string error;
  if (!fileops::ListDirectoryEntries(kProcSelfFd, &entries, &error)) {
    return absl::InternalError(error);
  }
  absl::flat_hash_set<int> fds;
  fds.reserve(entries.size());
  for (const auto& entry : entries) {
    int fd;
    if (!absl::SimpleAtoi(entry, &fd)) {
      return absl::InternalError(
          absl::StrCat("Cannot convert ", entry, " to a number"));
    }
    // Skip the directory fd that was open while listing.
    if (fcntl(fd, F_GETFD) != -1) {
      fds.insert(fd);
    }
  }
  return fds;
}

absl::Status MarkAllFDsAsCOEExcept(
    const absl::flat_hash_set<int>& fd_exceptions) {
  ICEBOX_ASSIGN_OR_RETURN(absl::flat_hash_set<int> fds, GetListOfFDs());

  for (const auto& fd : fds) {
    if (fd <= STDERR_FILENO || fd_exceptions.contains(fd)) {
      continue;
    }

    ICEBOX_RAW_VLOG(2, "Marking FD:%d as close-on-exec", fd);

    const int flags = fcntl(fd, F_GETFD);
    if (flags == -1) {
      return ErrnoStatus(errno, "fcntl(", fd, ", F_GETFD)");
    }
    if ((flags & FD_CLOEXEC) == 0 &&
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1) {
      return ErrnoStatus(errno, "fcntl(", fd, ", F_SETFD, FD_CLOEXEC)");
    }
  }
  return absl::OkStatus();
}

absl::Status SanitizeCurrentProcess(
    const absl::flat_hash_set<int>& fd_exceptions) {
  // Dies with the process that forked it.
  if (prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0) != 0) {
    return ErrnoStatus(errno, "prctl(PR_SET_PDEATHSIG, SIGKILL)");
  }
  return MarkAllFDsAsCOEExcept(fd_exceptions);
}

}  // namespace icebox::sanitizer
