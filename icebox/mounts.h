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

// Declarative bind-mount primitive used to populate the sandbox root.

#ifndef ICEBOX_MOUNTS_H_
#define ICEBOX_MOUNTS_H_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace icebox {

// One filesystem-exposure decision. Immutable once constructed.
class MountIntent {
 public:
  enum Capability : uint32_t {
    // Create target and its parents as directories.
    kMakeDir = 1 << 0,
    // Create target as an empty file, used as a device bind target.
    kMakeNode = 1 << 1,
    kBind = 1 << 2,
    // Bind with MS_REC, and remount nested mounts too.
    kBindRecursive = 1 << 3,
    kRemountReadOnly = 1 << 4,
  };

  MountIntent(std::string source, std::string target, uint32_t capabilities)
      : source_(std::move(source)),
        target_(std::move(target)),
        capabilities_(capabilities) {}

  // Only creates a directory.
  static MountIntent Directory(std::string target);
  // Binds a host device onto an empty file.
  static MountIntent DeviceNode(std::string source, std::string target);
  static MountIntent ReadOnly(std::string source, std::string target,
                              bool recursive);
  static MountIntent ReadWrite(std::string source, std::string target);

  const std::string& source() const { return source_; }
  const std::string& target() const { return target_; }
  uint32_t capabilities() const { return capabilities_; }
  bool Has(Capability capability) const {
    return (capabilities_ & capability) != 0;
  }
  bool IsReadOnly() const { return Has(kRemountReadOnly); }

  // E.g. "/usr/local -> /r/usr/local [dir,bind,rec,ro]".
  std::string ToString() const;

 private:
  std::string source_;
  std::string target_;
  uint32_t capabilities_;
};

// Creates and mounts target according to the toggles, in this order: make
// directory, make node, bind (always nosuid), read-only remount. recursive
// applies to both the bind and the remount.
absl::Status BindMount(const std::string& source, const std::string& target,
                       bool make_dir, bool make_node, bool bind,
                       bool rebind_read_only, bool recursive = false);

absl::Status ApplyMountIntent(const MountIntent& intent);

// Calls mount(2), logging the call at verbosity 1.
absl::Status Mount(const std::string& source, const std::string& target,
                   const char* fs_type, uint64_t flags,
                   const std::string& data = "");

// Remounts an existing bind mount read-only and nosuid, keeping the flags the
// kernel locks on it (nodev, noexec, atime flags).
absl::Status RemountReadOnly(const std::string& target);

// Returns the MS_* flags currently in effect for the mount containing path.
absl::StatusOr<uint64_t> GetMountFlagsFor(const std::string& path);

// Renders MS_* flags, e.g. "MS_RDONLY|MS_NOSUID".
std::string MountFlagsToString(uint64_t flags);

// Decodes the octal escapes (\040 and friends) used in /proc/*/mountinfo.
std::string UnescapeMountInfoPath(absl::string_view path);

// Returns the mount points listed in mountinfo contents that lie strictly
// below dir, in mount order.
absl::StatusOr<std::vector<std::string>> SubmountsBelow(
    absl::string_view mountinfo, absl::string_view dir);

}  // namespace icebox

#endif  // ICEBOX_MOUNTS_H_
