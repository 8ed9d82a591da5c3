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

#include "icebox/sandbox.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <string>
#include <utility>
#include <vector>

#include "absl/cleanup/cleanup.h"
#include "absl/strings/str_cat.h"
#include "icebox/namespace.h"
#include "icebox/report.h"
#include "icebox/root_assembler.h"
#include "icebox/sanitizer.h"
#include "icebox/util/fileops.h"
#include "icebox/util/os_error.h"
#include "icebox/util/path.h"
#include "icebox/util/raw_logging.h"
#include "icebox/util/status_macros.h"

namespace icebox {

namespace fileops = ::icebox::file_util::fileops;

namespace {

// Exit codes of the holder and init processes. Only used for logging, the
// outcome travels in the SetupReport.
constexpr int kSetupFailedExitCode = 1;
constexpr int kReportFailedExitCode = 2;
constexpr int kExecFailedExitCode = 127;

// argv/envp arrays for execve(), built before forking. Holds pointers into
// `strings`, which must outlive it.
class ExecArgs {
 public:
  explicit ExecArgs(const std::vector<std::string>& strings) {
    for (const std::string& s : strings) {
      pointers_.push_back(s.c_str());
    }
    pointers_.push_back(nullptr);
  }
  explicit ExecArgs(std::vector<std::string>&&) = delete;

  char* const* get() const {
    return const_cast<char* const*>(pointers_.data());
  }

 private:
  std::vector<const char*> pointers_;
};

[[noreturn]] void ReportAndExit(int report_fd, SetupReport::Stage stage,
                                const absl::Status& status, int exit_code) {
  ICEBOX_RAW_LOG(ERROR, "Sandbox setup failed: %s",
                 status.ToString().c_str());
  _exit(SendReport(report_fd, MakeFailureReport(stage, status))
            ? exit_code
            : kReportFailedExitCode);
}

absl::Status RedirectStream(const std::string& path, int flags,
                            int target_fd) {
  if (path.empty()) {
    return absl::OkStatus();
  }
  fileops::FDCloser fd(TEMP_FAILURE_RETRY(open(path.c_str(), flags, 0644)));
  if (fd.get() == -1) {
    return ErrnoStatus(errno, "open(", path, ")");
  }
  if (dup2(fd.get(), target_fd) == -1) {
    return ErrnoStatus(errno, "dup2(", path, ", ", target_fd, ")");
  }
  return absl::OkStatus();
}

absl::Status PrepareProgram(const Command& command) {
  if (chdir(command.cwd.c_str()) == -1) {
    return ErrnoStatus(errno, "chdir(", command.cwd, ")");
  }
  ICEBOX_RETURN_IF_ERROR(
      RedirectStream(command.stdin_path, O_RDONLY, STDIN_FILENO));
  ICEBOX_RETURN_IF_ERROR(RedirectStream(command.stdout_path,
                                        O_WRONLY | O_CREAT | O_TRUNC,
                                        STDOUT_FILENO));
  ICEBOX_RETURN_IF_ERROR(RedirectStream(command.stderr_path,
                                        O_WRONLY | O_CREAT | O_TRUNC,
                                        STDERR_FILENO));
  return absl::OkStatus();
}

[[noreturn]] void RunProgram(int report_fd, const Command& command,
                             const ExecArgs& argv, const ExecArgs& envp) {
  if (absl::Status status = PrepareProgram(command); !status.ok()) {
    ReportAndExit(report_fd, SetupReport::EXEC, status, kExecFailedExitCode);
  }
  execve(command.path.c_str(), argv.get(), envp.get());
  ReportAndExit(report_fd, SetupReport::EXEC,
                ErrnoStatus(errno, "execve(", command.path, ")"),
                kExecFailedExitCode);
}

// Waits for the program and reaps every other process that gets reparented
// to init meanwhile.
absl::StatusOr<int> ReapUntil(pid_t program) {
  for (;;) {
    int status;
    pid_t pid = waitpid(-1, &status, __WALL);
    if (pid == -1) {
      if (errno == EINTR) {
        continue;
      }
      return ErrnoStatus(errno, "waitpid()");
    }
    if (pid == program) {
      return status;
    }
    ICEBOX_RAW_VLOG(1, "Reaped orphan %d", pid);
  }
}

[[noreturn]] void RunInit(int report_fd, const IsolatedProcess& process,
                          const SandboxOptions& options,
                          const Command& command, const ExecArgs& argv,
                          const ExecArgs& envp) {
  if (absl::Status status = sanitizer::SanitizeCurrentProcess({report_fd});
      !status.ok()) {
    ReportAndExit(report_fd, SetupReport::SUBPROCESS, status,
                  kSetupFailedExitCode);
  }
  absl::StatusOr<SandboxRoot> root =
      EnterNamespace(process, options.root_dir, options.in_dir,
                     options.out_dir, options.layout);
  if (!root.ok()) {
    ReportAndExit(report_fd, SetupReport::ROOT, root.status(),
                  kSetupFailedExitCode);
  }
  ICEBOX_RAW_VLOG(1,
                  "Sandbox root ready: %zu mounts, %zu symlinks, %zu skipped",
                  root->mounted.size(), root->symlinked.size(),
                  root->skipped_optional.size());

  pid_t program = fork();
  if (program == -1) {
    ReportAndExit(report_fd, SetupReport::SUBPROCESS,
                  ErrnoStatus(errno, "fork() of the program"),
                  kSetupFailedExitCode);
  }
  if (program == 0) {
    RunProgram(report_fd, command, argv, envp);
  }

  absl::StatusOr<int> wait_status = ReapUntil(program);
  if (!wait_status.ok()) {
    ReportAndExit(report_fd, SetupReport::SUBPROCESS, wait_status.status(),
                  kSetupFailedExitCode);
  }
  SetupReport report;
  report.set_stage(SetupReport::FINISHED);
  report.set_wait_status(*wait_status);
  _exit(SendReport(report_fd, report) ? 0 : kReportFailedExitCode);
}

[[noreturn]] void RunHolder(int report_fd, const SandboxOptions& options,
                            const Command& command, const ExecArgs& argv,
                            const ExecArgs& envp) {
  absl::StatusOr<IsolatedProcess> process = CreateNamespace();
  if (!process.ok()) {
    ReportAndExit(report_fd, SetupReport::NAMESPACES, process.status(),
                  kSetupFailedExitCode);
  }
  // After CreateNamespace(), as changing credentials clears the parent death
  // signal.
  if (absl::Status status = sanitizer::SanitizeCurrentProcess({report_fd});
      !status.ok()) {
    ReportAndExit(report_fd, SetupReport::SUBPROCESS, status,
                  kSetupFailedExitCode);
  }

  pid_t init = fork();
  if (init == -1) {
    ReportAndExit(report_fd, SetupReport::SUBPROCESS,
                  ErrnoStatus(errno, "fork() of the sandbox init"),
                  kSetupFailedExitCode);
  }
  if (init == 0) {
    RunInit(report_fd, *process, options, command, argv, envp);
  }

  int status;
  if (TEMP_FAILURE_RETRY(waitpid(init, &status, __WALL)) == -1) {
    ReportAndExit(report_fd, SetupReport::SUBPROCESS,
                  ErrnoStatus(errno, "waitpid() of the sandbox init"),
                  kSetupFailedExitCode);
  }
  if (WIFSIGNALED(status)) {
    ICEBOX_RAW_LOG(ERROR, "Sandbox init killed by signal %d",
                   WTERMSIG(status));
  }
  _exit(WIFEXITED(status) ? WEXITSTATUS(status) : kSetupFailedExitCode);
}

Result MakeResult(Result::StatusEnum final_status, uintptr_t reason_code,
                  absl::Status status) {
  Result result;
  result.SetExitStatusCode(final_status, reason_code);
  result.set_setup_status(std::move(status));
  return result;
}

Result ResultFromReport(const SetupReport& report) {
  absl::Status status = MakeStatusFromProto(report.status());
  switch (report.stage()) {
    case SetupReport::FINISHED: {
      Result result;
      const int wait_status = report.wait_status();
      if (WIFEXITED(wait_status)) {
        result.SetExitStatusCode(Result::OK, WEXITSTATUS(wait_status));
      } else if (WIFSIGNALED(wait_status)) {
        result.SetExitStatusCode(Result::SIGNALED, WTERMSIG(wait_status));
      } else {
        return MakeResult(
            Result::SETUP_ERROR, Result::FAILED_REPORT,
            absl::DataLossError(absl::StrCat("Unexpected wait status: ",
                                             wait_status)));
      }
      return result;
    }
    case SetupReport::NAMESPACES:
      return MakeResult(Result::SETUP_ERROR, Result::FAILED_NAMESPACES,
                        std::move(status));
    case SetupReport::ROOT:
      return MakeResult(Result::SETUP_ERROR, Result::FAILED_ROOT,
                        std::move(status));
    case SetupReport::EXEC:
      return MakeResult(Result::SETUP_ERROR, Result::FAILED_EXEC,
                        std::move(status));
    case SetupReport::SUBPROCESS:
      return MakeResult(Result::SETUP_ERROR, Result::FAILED_SUBPROCESS,
                        std::move(status));
    default:
      return MakeResult(
          Result::SETUP_ERROR, Result::FAILED_REPORT,
          absl::DataLossError(absl::StrCat("Unknown setup stage: ",
                                           report.stage())));
  }
}

absl::Status ValidateCommand(const Command& command) {
  if (!file::IsAbsolutePath(command.path)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Program path must be absolute: '", command.path, "'"));
  }
  if (!file::IsAbsolutePath(command.cwd)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Working directory must be absolute: '", command.cwd, "'"));
  }
  return absl::OkStatus();
}

}  // namespace

Result Sandbox::Run(const Command& command) {
  if (absl::Status status = ValidateCommand(command); !status.ok()) {
    return MakeResult(Result::SETUP_ERROR, Result::FAILED_EXEC,
                      std::move(status));
  }
  if (!fileops::CreateDirectoryRecursively(options_.root_dir, 0755)) {
    return MakeResult(
        Result::SETUP_ERROR, Result::FAILED_ROOT,
        ErrnoStatus(errno, "creating root directory '", options_.root_dir,
                    "'"));
  }

  // ExecArgs points into these strings, which must outlive the forks.
  const std::vector<std::string> argv_strings =
      command.argv.empty() ? std::vector<std::string>{command.path}
                           : command.argv;
  const ExecArgs argv(argv_strings);
  const ExecArgs envp(command.envp);

  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {
    return MakeResult(Result::INTERNAL_ERROR, Result::FAILED_PIPE,
                      ErrnoStatus(errno, "pipe2()"));
  }
  fileops::FDCloser read_end(fds[0]);
  fileops::FDCloser write_end(fds[1]);

  pid_t holder = fork();
  if (holder == -1) {
    return MakeResult(Result::INTERNAL_ERROR, Result::FAILED_FORK,
                      ErrnoStatus(errno, "fork()"));
  }
  if (holder == 0) {
    read_end.Close();
    RunHolder(write_end.get(), options_, command, argv, envp);
  }
  pid_.store(holder);
  absl::Cleanup reset_pid = [this] { pid_.store(-1); };
  write_end.Close();

  SetupReport report;
  absl::StatusOr<bool> received = RecvReport(read_end.get(), &report);

  int status;
  if (TEMP_FAILURE_RETRY(waitpid(holder, &status, __WALL)) == -1) {
    return MakeResult(Result::INTERNAL_ERROR, Result::FAILED_WAIT,
                      ErrnoStatus(errno, "waitpid(", holder, ")"));
  }

  if (!received.ok()) {
    return MakeResult(Result::SETUP_ERROR, Result::FAILED_REPORT,
                      received.status());
  }
  if (!*received) {
    // Died before reporting, e.g. on a fatal check after the pivot.
    return MakeResult(
        Result::SETUP_ERROR, Result::FAILED_REPORT,
        absl::InternalError(absl::StrCat(
            "Sandbox exited without a report, ",
            WIFSIGNALED(status) ? absl::StrCat("signal ", WTERMSIG(status))
                                : absl::StrCat("exit code ",
                                               WEXITSTATUS(status)))));
  }
  return ResultFromReport(report);
}

absl::Status Sandbox::Reset() {
  for (const std::string* dir : {&options_.in_dir, &options_.out_dir}) {
    if (!fileops::DeleteDirectoryContents(*dir)) {
      return ErrnoStatus(errno, "clearing '", *dir, "'");
    }
  }
  return absl::OkStatus();
}

}  // namespace icebox
