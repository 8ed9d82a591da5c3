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

// Moves the calling process into fresh namespaces under the sandbox identity.

#ifndef ICEBOX_NAMESPACE_H_
#define ICEBOX_NAMESPACE_H_

#include <sched.h>

#include "absl/status/statusor.h"
#include "icebox/identity.h"

namespace icebox {

inline constexpr char kSandboxHostname[] = "icebox";

// Created together in one unshare(2) call.
inline constexpr int kNamespaceFlags = CLONE_NEWNS | CLONE_NEWUTS |
                                       CLONE_NEWIPC | CLONE_NEWUSER |
                                       CLONE_NEWPID | CLONE_NEWNET;

// Proof that the calling process completed CreateNamespace(). The root
// assembler requires one, so it cannot run before the namespaces exist.
//
// The namespaces, and everything mounted in them later, have no lifetime of
// their own. The kernel reclaims them once the last process inside exits;
// destroying this handle releases nothing.
class IsolatedProcess {
 public:
  IsolatedProcess(IsolatedProcess&&) = default;
  IsolatedProcess& operator=(IsolatedProcess&&) = default;
  IsolatedProcess(const IsolatedProcess&) = delete;
  IsolatedProcess& operator=(const IsolatedProcess&) = delete;

  const IdentityMapping& identity() const { return identity_; }
  SetgroupsControl setgroups() const { return setgroups_; }

 private:
  friend absl::StatusOr<IsolatedProcess> CreateNamespace();

  IsolatedProcess(IdentityMapping identity, SetgroupsControl setgroups)
      : identity_(identity), setgroups_(setgroups) {}

  IdentityMapping identity_;
  SetgroupsControl setgroups_;
};

// Unshares all of kNamespaceFlags at once, maps the caller's effective
// UID/GID to 1000:1000, switches to that identity and sets the hostname.
//
// Must be called in a single-threaded process. The caller itself does not
// enter the new PID namespace; its first child becomes PID 1 there.
// On failure before unshare(2) succeeded, the process is left unchanged.
absl::StatusOr<IsolatedProcess> CreateNamespace();

}  // namespace icebox

#endif  // ICEBOX_NAMESPACE_H_
