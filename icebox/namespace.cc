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

#include "icebox/namespace.h"

#include <sched.h>
#include <sys/prctl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "icebox/util/os_error.h"
#include "icebox/util/raw_logging.h"
#include "icebox/util/status_macros.h"

namespace icebox {

absl::StatusOr<IsolatedProcess> CreateNamespace() {
  const IdentityMapping identity = IdentityMapping::CaptureCurrent();

  if (unshare(kNamespaceFlags) == -1) {
    return ErrnoStatus(errno,
                       "unshare(NEWNS|NEWUTS|NEWIPC|NEWUSER|NEWPID|NEWNET)");
  }
  ICEBOX_RAW_VLOG(1, "Created namespaces, host identity %d:%d",
                  static_cast<int>(identity.host_uid()),
                  static_cast<int>(identity.host_gid()));

  // A caller that changed its credentials is not dumpable, which leaves
  // /proc/self/{uid,gid}_map owned by the host root and unwritable.
  if (prctl(PR_SET_DUMPABLE, 1) == -1) {
    return ErrnoStatus(errno, "prctl(PR_SET_DUMPABLE, 1)");
  }
  ICEBOX_ASSIGN_OR_RETURN(SetgroupsControl setgroups,
                          InstallIdentityMapping(identity));
  ICEBOX_RETURN_IF_ERROR(DropToSandboxIdentity());

  if (sethostname(kSandboxHostname, strlen(kSandboxHostname)) == -1) {
    return ErrnoStatus(errno, "sethostname(", kSandboxHostname, ")");
  }
  return IsolatedProcess(identity, setgroups);
}

}  // namespace icebox
