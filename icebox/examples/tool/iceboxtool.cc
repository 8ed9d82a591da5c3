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

// Runs one command in an icebox sandbox and prints the result.
//
// Example usage:
//   iceboxtool
//     --icebox_root_dir=/scratch/s1
//     --icebox_in_dir=/tasks/42/in
//     --icebox_out_dir=/tasks/42/out
//     --icebox_stdout=/out/stdout.txt
//     -- /usr/bin/gcc -o /out/a.out /in/main.c
//
// Exit code 0 means the command exited with 0, 1 that it failed and 2 that
// the sandbox could not be built.

#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/strings/str_format.h"
#include "icebox/command.h"
#include "icebox/flags.h"
#include "icebox/result.h"
#include "icebox/sandbox.h"
#include "icebox/util/path.h"

ABSL_FLAG(std::string, icebox_root_dir, "",
          "Host directory that becomes the sandbox root");
ABSL_FLAG(std::string, icebox_in_dir, "",
          "Host directory exposed read-write at /in");
ABSL_FLAG(std::string, icebox_out_dir, "",
          "Host directory exposed read-write at /out");
ABSL_FLAG(std::string, icebox_cwd, "/",
          "Working directory of the command inside the sandbox");
ABSL_FLAG(std::string, icebox_stdin, "",
          "If not empty, path inside the sandbox to read stdin from");
ABSL_FLAG(std::string, icebox_stdout, "",
          "If not empty, path inside the sandbox to write stdout to");
ABSL_FLAG(std::string, icebox_stderr, "",
          "If not empty, path inside the sandbox to write stderr to");
ABSL_FLAG(bool, icebox_reset, false,
          "Clear the in and out directories after the command finished");

namespace {

constexpr int kExitProgramFailed = 1;
constexpr int kExitSandboxFailed = 2;

}  // namespace

int main(int argc, char* argv[]) {
  const std::string program_name(icebox::file::SplitPath(argv[0]).second);
  absl::SetProgramUsageMessage(
      absl::StrFormat("Runs a command in a judging sandbox.\n"
                      "Usage: %1$s [OPTION] -- CMD [ARGS]...",
                      program_name));

  std::vector<std::string> args;
  {
    const std::vector<char*> parsed_argv = absl::ParseCommandLine(argc, argv);
    args.assign(parsed_argv.begin() + 1, parsed_argv.end());
  }
  if (args.empty()) {
    absl::FPrintF(stderr, "Missing command to execute\n");
    return kExitSandboxFailed;
  }

  absl::StatusOr<icebox::SandboxLayout> layout = icebox::LayoutFromFlags();
  if (!layout.ok()) {
    absl::FPrintF(stderr, "Invalid layout: %s\n", layout.status().ToString());
    return kExitSandboxFailed;
  }

  icebox::SandboxOptions options;
  options.root_dir = absl::GetFlag(FLAGS_icebox_root_dir);
  options.in_dir = absl::GetFlag(FLAGS_icebox_in_dir);
  options.out_dir = absl::GetFlag(FLAGS_icebox_out_dir);
  options.layout = *std::move(layout);
  if (options.root_dir.empty() || options.in_dir.empty() ||
      options.out_dir.empty()) {
    absl::FPrintF(stderr,
                  "--icebox_root_dir, --icebox_in_dir and --icebox_out_dir "
                  "are required\n");
    return kExitSandboxFailed;
  }

  icebox::Command command;
  command.path = args[0];
  command.argv = args;
  command.cwd = absl::GetFlag(FLAGS_icebox_cwd);
  command.stdin_path = absl::GetFlag(FLAGS_icebox_stdin);
  command.stdout_path = absl::GetFlag(FLAGS_icebox_stdout);
  command.stderr_path = absl::GetFlag(FLAGS_icebox_stderr);

  icebox::Sandbox sandbox(std::move(options));
  const icebox::Result result = sandbox.Run(command);
  absl::FPrintF(stderr, "Final execution status: %s\n", result.ToString());

  if (absl::GetFlag(FLAGS_icebox_reset)) {
    if (absl::Status status = sandbox.Reset(); !status.ok()) {
      absl::FPrintF(stderr, "Reset failed: %s\n", status.ToString());
      return kExitSandboxFailed;
    }
  }

  switch (result.final_status()) {
    case icebox::Result::OK:
      return result.reason_code() == 0 ? EXIT_SUCCESS : kExitProgramFailed;
    case icebox::Result::SIGNALED:
      return kExitProgramFailed;
    default:
      return kExitSandboxFailed;
  }
}
