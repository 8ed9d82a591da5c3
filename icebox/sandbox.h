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

// The icebox::Sandbox class runs commands for one judging task, each in a
// freshly built sandbox.

#ifndef ICEBOX_SANDBOX_H_
#define ICEBOX_SANDBOX_H_

#include <sys/types.h>

#include <atomic>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "icebox/command.h"
#include "icebox/layout.h"
#include "icebox/layout.pb.h"
#include "icebox/result.h"

namespace icebox {

struct SandboxOptions {
  // Host directory that becomes the sandbox root. Created if missing; only
  // its contents inside the sandbox mount namespace change.
  std::string root_dir;
  // Host directories of the task, exposed read-write at /in and /out.
  std::string in_dir;
  std::string out_dir;
  SandboxLayout layout = DefaultLayout();
};

class Sandbox final {
 public:
  explicit Sandbox(SandboxOptions options) : options_(std::move(options)) {}

  Sandbox(const Sandbox&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;

  // Runs command in a new sandbox and blocks until it finished. The process
  // tree is:
  //   supervisor (caller)
  //   `- holder: CreateNamespace()
  //      `- init, PID 1: EnterNamespace(), reaps orphans
  //         `- program: execve(command)
  // Every resource of the sandbox goes away with the holder.
  Result Run(const Command& command);

  // Deletes everything under in_dir and out_dir, keeping the directories.
  absl::Status Reset();

  // Pid of the holder process of the current Run(), or -1. Killing it tears
  // down the whole sandbox, which is how callers enforce timeouts.
  pid_t pid() const { return pid_.load(); }

  const SandboxOptions& options() const { return options_; }

 private:
  SandboxOptions options_;
  std::atomic<pid_t> pid_{-1};
};

}  // namespace icebox

#endif  // ICEBOX_SANDBOX_H_
