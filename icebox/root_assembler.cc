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

#include "icebox/root_assembler.h"

#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

#include "absl/strings/str_cat.h"
#include "icebox/layout.h"
#include "icebox/setup_error.h"
#include "icebox/util/file_helpers.h"
#include "icebox/util/fileops.h"
#include "icebox/util/os_error.h"
#include "icebox/util/path.h"
#include "icebox/util/raw_logging.h"
#include "icebox/util/status_macros.h"

namespace icebox {

namespace fileops = ::icebox::file_util::fileops;

namespace {

constexpr char kOldRoot[] = "old_root";

// Collects the results of the individual assembly steps.
class Assembly {
 public:
  explicit Assembly(std::string root_dir) : root_dir_(std::move(root_dir)) {}

  std::string Rebase(absl::string_view inside) const {
    return file::RebasePath(root_dir_, inside);
  }

  absl::Status Apply(MountIntent intent) {
    ICEBOX_RETURN_IF_ERROR(ApplyMountIntent(intent));
    root_.mounted.push_back(std::move(intent));
    return absl::OkStatus();
  }

  // Exposes a host path read-only at target, or recreates it if it is a
  // symlink.
  absl::Status ExposeTrusted(const std::string& source,
                             absl::string_view target, bool recursive,
                             bool optional) {
    struct stat64 st;
    if (lstat64(source.c_str(), &st) == -1) {
      const int saved_errno = errno;
      if (optional && (saved_errno == ENOENT || saved_errno == ENOTDIR ||
                       saved_errno == EACCES)) {
        ICEBOX_RAW_VLOG(1, "Skipping optional path %s", source.c_str());
        root_.skipped_optional.push_back(source);
        return absl::OkStatus();
      }
      return ErrnoStatus(saved_errno, "trusted path '", source, "'");
    }

    const std::string inside = Rebase(target);
    if (S_ISLNK(st.st_mode)) {
      const std::string link = fileops::ReadLink(source);
      if (link.empty()) {
        return ErrnoStatus(errno, "readlink(", source, ")");
      }
      const std::string parent(file::SplitPath(inside).first);
      if (!fileops::CreateDirectoryRecursively(parent, 0755)) {
        return ErrnoStatus(errno, "creating directory '", parent, "'");
      }
      if (symlink(link.c_str(), inside.c_str()) == -1) {
        return ErrnoStatus(errno, "symlink(", link, ", ", inside, ")");
      }
      ICEBOX_RAW_VLOG(1, "symlink %s -> %s", inside.c_str(), link.c_str());
      root_.symlinked.push_back(source);
      return absl::OkStatus();
    }
    return Apply(MountIntent::ReadOnly(source, inside, recursive));
  }

  SandboxRoot Release() { return std::move(root_); }

 private:
  std::string root_dir_;
  SandboxRoot root_;
};

absl::Status ValidateDirArgument(absl::string_view name,
                                 const std::string& dir) {
  if (dir.empty() || !file::IsAbsolutePath(dir) ||
      file::HasParentReference(dir)) {
    return absl::InvalidArgumentError(
        absl::StrCat(name, " must be an absolute path: '", dir, "'"));
  }
  return absl::OkStatus();
}

// Logs the filesystem contents if verbose logging is enabled.
void LogFilesystem(const std::string& dir) {
  std::vector<std::string> entries;
  std::string error;
  if (!fileops::ListDirectoryEntries(dir, &entries, &error)) {
    ICEBOX_RAW_LOG(ERROR, "could not list directory entries for %s: %s",
                   dir.c_str(), error.c_str());
    return;
  }

  for (const auto& entry : entries) {
    struct stat64 st;
    std::string full_path = file::JoinPath(dir, entry);
    if (full_path == "/proc") {
      continue;
    }
    if (lstat64(full_path.c_str(), &st) != 0) {
      ICEBOX_RAW_PLOG(ERROR, "could not stat %s", full_path);
      continue;
    }

    char ftype;
    switch (st.st_mode & S_IFMT) {
      case S_IFREG:
        ftype = '-';
        break;
      case S_IFDIR:
        ftype = 'd';
        break;
      case S_IFLNK:
        ftype = 'l';
        break;
      case S_IFCHR:
        ftype = 'c';
        break;
      default:
        ftype = '?';
        break;
    }

    std::string type_and_mode;
    type_and_mode += ftype;
    type_and_mode += st.st_mode & S_IRUSR ? 'r' : '-';
    type_and_mode += st.st_mode & S_IWUSR ? 'w' : '-';
    type_and_mode += st.st_mode & S_IXUSR ? 'x' : '-';
    type_and_mode += st.st_mode & S_IRGRP ? 'r' : '-';
    type_and_mode += st.st_mode & S_IWGRP ? 'w' : '-';
    type_and_mode += st.st_mode & S_IXGRP ? 'x' : '-';
    type_and_mode += st.st_mode & S_IROTH ? 'r' : '-';
    type_and_mode += st.st_mode & S_IWOTH ? 'w' : '-';
    type_and_mode += st.st_mode & S_IXOTH ? 'x' : '-';

    std::string link;
    if (S_ISLNK(st.st_mode)) {
      link = absl::StrCat(" -> ", fileops::ReadLink(full_path));
    }
    ICEBOX_RAW_VLOG(2, "%s %s%s", type_and_mode.c_str(), full_path.c_str(),
                    link.c_str());

    if (S_ISDIR(st.st_mode)) {
      LogFilesystem(full_path);
    }
  }
}

}  // namespace

absl::StatusOr<SandboxRoot> EnterNamespace(const IsolatedProcess& process,
                                           const std::string& root_dir,
                                           const std::string& in_dir,
                                           const std::string& out_dir,
                                           const SandboxLayout& layout) {
  if (getpid() != 1) {
    return absl::FailedPreconditionError(absl::StrCat(
        "The sandbox root must be assembled by PID 1 of the sandbox "
        "namespaces, not by pid ",
        getpid()));
  }
  ICEBOX_RETURN_IF_ERROR(ValidateDirArgument("root_dir", root_dir));
  ICEBOX_RETURN_IF_ERROR(ValidateDirArgument("in_dir", in_dir));
  ICEBOX_RETURN_IF_ERROR(ValidateDirArgument("out_dir", out_dir));
  ICEBOX_RETURN_IF_ERROR(ValidateLayout(layout));
  ICEBOX_RAW_VLOG(1, "Assembling sandbox root in %s as %d:%d",
                  root_dir.c_str(), static_cast<int>(getuid()),
                  static_cast<int>(getgid()));

  // Nothing mounted below may propagate back to the host. This is also a
  // precondition of pivot_root().
  ICEBOX_RETURN_IF_ERROR(Mount("", "/", "", MS_REC | MS_PRIVATE));

  Assembly assembly(file::CleanPath(root_dir));
  if (!fileops::CreateDirectoryRecursively(root_dir, 0755)) {
    return ErrnoStatus(errno, "creating root directory '", root_dir, "'");
  }
  ICEBOX_RETURN_IF_ERROR(Mount("tmpfs", root_dir, "tmpfs", MS_NOSUID));
  if (chdir(root_dir.c_str()) == -1) {
    return ErrnoStatus(errno, "chdir(", root_dir, ")");
  }

  const std::string proc = assembly.Rebase("/proc");
  ICEBOX_RETURN_IF_ERROR(assembly.Apply(MountIntent::Directory(proc)));
  ICEBOX_RETURN_IF_ERROR(
      Mount("proc", proc, "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC));

  ICEBOX_RETURN_IF_ERROR(
      assembly.Apply(MountIntent::Directory(assembly.Rebase("/dev"))));
  for (absl::string_view device : kSandboxDevices) {
    ICEBOX_RETURN_IF_ERROR(assembly.Apply(
        MountIntent::DeviceNode(std::string(device), assembly.Rebase(device))));
  }

  const std::string tmp = assembly.Rebase("/tmp");
  ICEBOX_RETURN_IF_ERROR(assembly.Apply(MountIntent::Directory(tmp)));
  ICEBOX_RETURN_IF_ERROR(
      Mount("tmpfs", tmp, "tmpfs", MS_NOSUID | MS_NODEV,
            absl::StrCat("size=", layout.tmp_size_bytes(),
                         ",nr_inodes=", layout.tmp_inodes())));

  for (const TrustedPath& entry : layout.trusted_paths()) {
    ICEBOX_RETURN_IF_ERROR(assembly.ExposeTrusted(
        entry.path(), TargetOf(entry), entry.recursive(), entry.optional()));
  }

  ICEBOX_RETURN_IF_ERROR(
      assembly.Apply(MountIntent::ReadWrite(in_dir, assembly.Rebase("/in"))));
  ICEBOX_RETURN_IF_ERROR(
      assembly.Apply(MountIntent::ReadWrite(out_dir, assembly.Rebase("/out"))));

  for (const std::string& path : layout.auxiliary_paths()) {
    ICEBOX_RETURN_IF_ERROR(assembly.ExposeTrusted(path, path,
                                                  /*recursive=*/true,
                                                  /*optional=*/true));
  }

  const std::string etc = assembly.Rebase("/etc");
  if (!fileops::CreateDirectoryRecursively(etc, 0755)) {
    return ErrnoStatus(errno, "creating directory '", etc, "'");
  }
  ICEBOX_RETURN_IF_ERROR(
      file::SetContents(assembly.Rebase("/etc/passwd"), kPasswdEntry));

  const std::string old_root = assembly.Rebase(kOldRoot);
  if (mkdir(old_root.c_str(), 0755) == -1) {
    return ErrnoStatus(errno, "mkdir(", old_root, ")");
  }
  if (syscall(SYS_pivot_root, ".", kOldRoot) == -1) {
    return WithSetupErrorKind(
        ErrnoStatus(errno, "pivot_root(", root_dir, ", ", kOldRoot, ")"),
        SetupErrorKind::kPivot);
  }

  // Point of no return. The host root is still attached below /old_root.
  ICEBOX_RAW_PCHECK(chdir("/") == 0, "changing cwd after pivot_root failed");
  ICEBOX_RAW_PCHECK(umount2("/old_root", MNT_DETACH) == 0,
                    "detaching old root failed");
  ICEBOX_RAW_PCHECK(rmdir("/old_root") == 0, "removing /old_root failed");
  // Writable submounts (/in, /out, /tmp) keep their own flags.
  ICEBOX_RAW_PCHECK(mount("/", "/", "", MS_BIND | MS_REMOUNT | MS_RDONLY |
                                            MS_NOSUID,
                          nullptr) == 0,
                    "sealing sandbox root read-only failed");

  if (ICEBOX_VLOG_IS_ON(2)) {
    ICEBOX_RAW_VLOG(2, "Sandbox root assembled for host identity %d:%d",
                    static_cast<int>(process.identity().host_uid()),
                    static_cast<int>(process.identity().host_gid()));
    LogFilesystem("/");
  }
  return assembly.Release();
}

}  // namespace icebox
