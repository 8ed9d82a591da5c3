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

// User and group identity of a sandboxed process.

#ifndef ICEBOX_IDENTITY_H_
#define ICEBOX_IDENTITY_H_

#include <sys/types.h>

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace icebox {

// Every sandboxed process runs as this identity inside its user namespace.
inline constexpr uid_t kSandboxUid = 1000;
inline constexpr gid_t kSandboxGid = 1000;

// Single-entry mapping of the host identity that created the user namespace
// onto the fixed sandbox identity.
class IdentityMapping {
 public:
  IdentityMapping(uid_t host_uid, gid_t host_gid)
      : host_uid_(host_uid), host_gid_(host_gid) {}

  // Captures the effective UID and GID of the calling process.
  static IdentityMapping CaptureCurrent();

  uid_t host_uid() const { return host_uid_; }
  gid_t host_gid() const { return host_gid_; }
  uid_t sandbox_uid() const { return kSandboxUid; }
  gid_t sandbox_gid() const { return kSandboxGid; }

  // Contents for /proc/<pid>/uid_map and gid_map, e.g. "1000 2000 1".
  std::string UidMapLine() const;
  std::string GidMapLine() const;

 private:
  uid_t host_uid_;
  gid_t host_gid_;
};

// Outcome of DenySetgroups() when it did not fail.
enum class SetgroupsControl {
  kApplied,
  // The kernel has no setgroups control file.
  kNotSupported,
};

// Writes "deny" to <proc_self>/setgroups. A missing control file is reported
// as kNotSupported, any other failure as an error.
absl::StatusOr<SetgroupsControl> DenySetgroups(
    const std::string& proc_self = "/proc/self");

// Writes a single map line to an ID map control file.
absl::Status WriteIdMap(const std::string& map_path, absl::string_view line);

// Installs the UID map, denies setgroups and installs the GID map, in that
// order. Must be called right after the user namespace was created.
absl::StatusOr<SetgroupsControl> InstallIdentityMapping(
    const IdentityMapping& mapping,
    const std::string& proc_self = "/proc/self");

// Sets the real, effective and saved UID, then GID, to the sandbox identity.
// The mapping must already be installed.
absl::Status DropToSandboxIdentity();

}  // namespace icebox

#endif  // ICEBOX_IDENTITY_H_
