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

#include "icebox/identity.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>

#include "absl/strings/str_cat.h"
#include "icebox/util/fileops.h"
#include "icebox/util/os_error.h"
#include "icebox/util/path.h"
#include "icebox/util/raw_logging.h"
#include "icebox/util/status_macros.h"

namespace icebox {

namespace fileops = ::icebox::file_util::fileops;

IdentityMapping IdentityMapping::CaptureCurrent() {
  return IdentityMapping(geteuid(), getegid());
}

std::string IdentityMapping::UidMapLine() const {
  return absl::StrCat(kSandboxUid, " ", host_uid_, " 1");
}

std::string IdentityMapping::GidMapLine() const {
  return absl::StrCat(kSandboxGid, " ", host_gid_, " 1");
}

absl::StatusOr<SetgroupsControl> DenySetgroups(const std::string& proc_self) {
  const std::string path = file::JoinPath(proc_self, "setgroups");
  fileops::FDCloser fd(
      TEMP_FAILURE_RETRY(open(path.c_str(), O_WRONLY | O_CLOEXEC)));
  if (fd.get() == -1) {
    if (errno == ENOENT) {
      ICEBOX_RAW_VLOG(1, "%s not supported by this kernel", path.c_str());
      return SetgroupsControl::kNotSupported;
    }
    return ErrnoStatus(errno, "open(", path, ")");
  }
  constexpr absl::string_view kDeny = "deny";
  if (!fileops::WriteToFD(fd.get(), kDeny.data(), kDeny.size())) {
    return ErrnoStatus(errno, "writing '", kDeny, "' to ", path);
  }
  return SetgroupsControl::kApplied;
}

absl::Status WriteIdMap(const std::string& map_path, absl::string_view line) {
  fileops::FDCloser fd(
      TEMP_FAILURE_RETRY(open(map_path.c_str(), O_WRONLY | O_CLOEXEC)));
  if (fd.get() == -1) {
    return ErrnoStatus(errno, "open(", map_path, ")");
  }
  // The kernel accepts a map only in a single write().
  ssize_t written =
      TEMP_FAILURE_RETRY(write(fd.get(), line.data(), line.size()));
  if (written != static_cast<ssize_t>(line.size())) {
    return ErrnoStatus(written == -1 ? errno : EIO, "writing '", line,
                       "' to ", map_path);
  }
  return absl::OkStatus();
}

absl::StatusOr<SetgroupsControl> InstallIdentityMapping(
    const IdentityMapping& mapping, const std::string& proc_self) {
  ICEBOX_RETURN_IF_ERROR(
      WriteIdMap(file::JoinPath(proc_self, "uid_map"), mapping.UidMapLine()));
  ICEBOX_ASSIGN_OR_RETURN(SetgroupsControl setgroups, DenySetgroups(proc_self));
  ICEBOX_RETURN_IF_ERROR(
      WriteIdMap(file::JoinPath(proc_self, "gid_map"), mapping.GidMapLine()));
  return setgroups;
}

absl::Status DropToSandboxIdentity() {
  if (setresuid(kSandboxUid, kSandboxUid, kSandboxUid) == -1) {
    return ErrnoStatus(errno, "setresuid(", kSandboxUid, ")");
  }
  if (setresgid(kSandboxGid, kSandboxGid, kSandboxGid) == -1) {
    return ErrnoStatus(errno, "setresgid(", kSandboxGid, ")");
  }
  return absl::OkStatus();
}

}  // namespace icebox
