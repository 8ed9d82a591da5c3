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

#include "icebox/mounts.h"

#include <fcntl.h>
#include <sys/mount.h>
#include <sys/statvfs.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "icebox/util/file_helpers.h"
#include "icebox/util/fileops.h"
#include "icebox/util/os_error.h"
#include "icebox/util/path.h"
#include "icebox/util/raw_logging.h"
#include "icebox/util/status_macros.h"

namespace icebox {

namespace fileops = ::icebox::file_util::fileops;

MountIntent MountIntent::Directory(std::string target) {
  return MountIntent("", std::move(target), kMakeDir);
}

MountIntent MountIntent::DeviceNode(std::string source, std::string target) {
  return MountIntent(std::move(source), std::move(target), kMakeNode | kBind);
}

MountIntent MountIntent::ReadOnly(std::string source, std::string target,
                                  bool recursive) {
  return MountIntent(std::move(source), std::move(target),
                     kMakeDir | kBind | kRemountReadOnly |
                         (recursive ? kBindRecursive : 0));
}

MountIntent MountIntent::ReadWrite(std::string source, std::string target) {
  return MountIntent(std::move(source), std::move(target), kMakeDir | kBind);
}

std::string MountIntent::ToString() const {
  std::vector<absl::string_view> caps;
  if (Has(kMakeDir)) caps.push_back("dir");
  if (Has(kMakeNode)) caps.push_back("node");
  if (Has(kBind)) caps.push_back("bind");
  if (Has(kBindRecursive)) caps.push_back("rec");
  if (Has(kRemountReadOnly)) caps.push_back("ro");
  return absl::StrCat(source_.empty() ? "-" : source_, " -> ", target_, " [",
                      absl::StrJoin(caps, ","), "]");
}

absl::StatusOr<uint64_t> GetMountFlagsFor(const std::string& path) {
  struct statvfs vfs;
  if (TEMP_FAILURE_RETRY(statvfs(path.c_str(), &vfs)) == -1) {
    return ErrnoStatus(errno, "statvfs(", path, ")");
  }

  uint64_t flags = 0;
  using MountPair = std::pair<uint64_t, uint64_t>;
  for (const auto& [mount_flag, vfs_flag] : {
           MountPair(MS_RDONLY, ST_RDONLY),
           MountPair(MS_NOSUID, ST_NOSUID),
           MountPair(MS_NODEV, ST_NODEV),
           MountPair(MS_NOEXEC, ST_NOEXEC),
           MountPair(MS_NOATIME, ST_NOATIME),
           MountPair(MS_NODIRATIME, ST_NODIRATIME),
           MountPair(MS_RELATIME, ST_RELATIME),
       }) {
    if (vfs.f_flag & vfs_flag) {
      flags |= mount_flag;
    }
  }
  return flags;
}

std::string MountFlagsToString(uint64_t flags) {
#define ICEBOX_MAP(x) {x, #x}
  static constexpr std::pair<uint64_t, absl::string_view> kMap[] = {
      ICEBOX_MAP(MS_RDONLY),      ICEBOX_MAP(MS_NOSUID),
      ICEBOX_MAP(MS_NODEV),       ICEBOX_MAP(MS_NOEXEC),
      ICEBOX_MAP(MS_SYNCHRONOUS), ICEBOX_MAP(MS_REMOUNT),
      ICEBOX_MAP(MS_MANDLOCK),    ICEBOX_MAP(MS_DIRSYNC),
      ICEBOX_MAP(MS_NOATIME),     ICEBOX_MAP(MS_NODIRATIME),
      ICEBOX_MAP(MS_BIND),        ICEBOX_MAP(MS_MOVE),
      ICEBOX_MAP(MS_REC),         ICEBOX_MAP(MS_SILENT),
      ICEBOX_MAP(MS_POSIXACL),    ICEBOX_MAP(MS_UNBINDABLE),
      ICEBOX_MAP(MS_PRIVATE),     ICEBOX_MAP(MS_SLAVE),
      ICEBOX_MAP(MS_SHARED),      ICEBOX_MAP(MS_RELATIME),
      ICEBOX_MAP(MS_KERNMOUNT),   ICEBOX_MAP(MS_I_VERSION),
      ICEBOX_MAP(MS_STRICTATIME),
#ifdef MS_LAZYTIME
      ICEBOX_MAP(MS_LAZYTIME),
#endif
  };
#undef ICEBOX_MAP
  std::vector<absl::string_view> flags_list;
  for (const auto& [val, str] : kMap) {
    if ((flags & val) == val) {
      flags &= ~val;
      flags_list.push_back(str);
    }
  }
  std::string flags_str = absl::StrCat(flags);
  if (flags_list.empty() || flags != 0) {
    flags_list.push_back(flags_str);
  }
  return absl::StrJoin(flags_list, "|");
}

absl::Status Mount(const std::string& source, const std::string& target,
                   const char* fs_type, uint64_t flags,
                   const std::string& data) {
  ICEBOX_RAW_VLOG(1, R"(mount("%s", "%s", "%s", %s, "%s"))", source.c_str(),
                  target.c_str(), fs_type, MountFlagsToString(flags).c_str(),
                  data.c_str());
  if (mount(source.c_str(), target.c_str(), fs_type, flags,
            data.empty() ? nullptr : data.c_str()) == -1) {
    return ErrnoStatus(errno, "mounting '", source, "' on '", target,
                       "' (flags=", MountFlagsToString(flags), ")");
  }
  return absl::OkStatus();
}

absl::Status RemountReadOnly(const std::string& target) {
  // Flags the kernel locked on the source mount must be repeated, or the
  // remount fails with EPERM inside a user namespace.
  ICEBOX_ASSIGN_OR_RETURN(const uint64_t locked, GetMountFlagsFor(target));
  return Mount("", target, "",
               MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID | locked);
}

std::string UnescapeMountInfoPath(absl::string_view path) {
  std::string result;
  result.reserve(path.size());
  for (size_t i = 0; i < path.size(); ++i) {
    if (path[i] == '\\' && i + 3 < path.size() &&
        path[i + 1] >= '0' && path[i + 1] <= '3' && path[i + 2] >= '0' &&
        path[i + 2] <= '7' && path[i + 3] >= '0' && path[i + 3] <= '7') {
      result.push_back(static_cast<char>((path[i + 1] - '0') * 64 +
                                         (path[i + 2] - '0') * 8 +
                                         (path[i + 3] - '0')));
      i += 3;
    } else {
      result.push_back(path[i]);
    }
  }
  return result;
}

absl::StatusOr<std::vector<std::string>> SubmountsBelow(
    absl::string_view mountinfo, absl::string_view dir) {
  const std::string prefix =
      dir == "/" ? "/" : absl::StrCat(file::CleanPath(dir), "/");
  std::vector<std::string> submounts;
  for (absl::string_view line :
       absl::StrSplit(mountinfo, '\n', absl::SkipWhitespace())) {
    // <id> <parent id> <major:minor> <root> <mount point> <options> ...
    std::vector<absl::string_view> fields =
        absl::StrSplit(line, ' ', absl::SkipEmpty());
    if (fields.size() < 5) {
      return absl::InternalError(
          absl::StrCat("malformed mountinfo line: '", line, "'"));
    }
    std::string mount_point = UnescapeMountInfoPath(fields[4]);
    if (mount_point.size() > prefix.size() &&
        absl::StartsWith(mount_point, prefix)) {
      submounts.push_back(std::move(mount_point));
    }
  }
  return submounts;
}

namespace {

absl::Status RemountSubmountsReadOnly(const std::string& target) {
  ICEBOX_ASSIGN_OR_RETURN(std::string mountinfo,
                          file::GetContents("/proc/self/mountinfo"));
  ICEBOX_ASSIGN_OR_RETURN(std::vector<std::string> submounts,
                          SubmountsBelow(mountinfo, target));
  for (const std::string& submount : submounts) {
    ICEBOX_RETURN_IF_ERROR(RemountReadOnly(submount));
  }
  return absl::OkStatus();
}

absl::Status CreateEmptyFile(const std::string& path) {
  fileops::FDCloser fd(TEMP_FAILURE_RETRY(
      open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644)));
  if (fd.get() == -1) {
    return ErrnoStatus(errno, "creating '", path, "'");
  }
  return absl::OkStatus();
}

}  // namespace

absl::Status BindMount(const std::string& source, const std::string& target,
                       bool make_dir, bool make_node, bool bind,
                       bool rebind_read_only, bool recursive) {
  if (make_dir && !fileops::CreateDirectoryRecursively(target, 0755)) {
    return ErrnoStatus(errno, "creating directory '", target, "'");
  }
  if (make_node) {
    ICEBOX_RETURN_IF_ERROR(CreateEmptyFile(target));
  }
  if (bind) {
    const uint64_t flags = MS_BIND | MS_NOSUID | (recursive ? MS_REC : 0);
    ICEBOX_RETURN_IF_ERROR(Mount(source, target, "", flags));
  }
  if (rebind_read_only) {
    // MS_REC is ignored on remount, nested mounts are handled one by one.
    ICEBOX_RETURN_IF_ERROR(RemountReadOnly(target));
    if (recursive) {
      ICEBOX_RETURN_IF_ERROR(RemountSubmountsReadOnly(target));
    }
  }
  return absl::OkStatus();
}

absl::Status ApplyMountIntent(const MountIntent& intent) {
  return BindMount(intent.source(), intent.target(),
                   intent.Has(MountIntent::kMakeDir),
                   intent.Has(MountIntent::kMakeNode),
                   intent.Has(MountIntent::kBind),
                   intent.Has(MountIntent::kRemountReadOnly),
                   intent.Has(MountIntent::kBindRecursive));
}

}  // namespace icebox
