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

#include <grp.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include "icebox/command.h"
#include "icebox/identity.h"
#include "icebox/layout.h"
#include "icebox/result.h"
#include "icebox/root_assembler.h"
#include "icebox/testing.h"
#include "icebox/util/file_helpers.h"
#include "icebox/util/fileops.h"
#include "icebox/util/path.h"
#include "icebox/util/status_macros.h"
#include "icebox/util/status_matchers.h"

namespace icebox {
namespace {

namespace fileops = ::icebox::file_util::fileops;
using ::testing::AnyOf;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::Le;
using ::testing::StrEq;

constexpr char kStdout[] = "stdout";

// The default layout without the entries this host does not have.
SandboxLayout HostLayout() {
  SandboxLayout layout = DefaultLayout();
  SandboxLayout host = layout;
  host.clear_trusted_paths();
  for (const TrustedPath& entry : layout.trusted_paths()) {
    struct stat st;
    if (lstat(entry.path().c_str(), &st) == 0) {
      *host.add_trusted_paths() = entry;
    }
  }
  return host;
}

// The directory holding root, in and out.
std::string TaskDir(const TaskDirs& dirs) {
  return std::string(file::SplitPath(dirs.root).first);
}

std::vector<std::string> Lines(absl::string_view text) {
  return absl::StrSplit(text, '\n', absl::SkipEmpty());
}

// Expects "<path> <errno>" lines reporting a read-only filesystem.
void ExpectReadOnlyErrors(const std::vector<std::string>& lines) {
  for (const std::string& line : lines) {
    std::vector<std::string> fields = absl::StrSplit(line, ' ');
    ASSERT_THAT(fields.size(), Eq(2)) << line;
    EXPECT_THAT(fields[1], AnyOf(absl::StrCat(EROFS), absl::StrCat(EACCES)))
        << line;
  }
}

// Moves the calling process to a private mount namespace, so that it can
// mount without affecting the host. Unprivileged callers get a user namespace
// in which they are root.
absl::Status EnterPrivateMountNamespace() {
  if (geteuid() == 0) {
    if (unshare(CLONE_NEWNS) == -1) {
      return absl::ErrnoToStatus(errno, "unshare(CLONE_NEWNS)");
    }
  } else {
    const uid_t uid = geteuid();
    const gid_t gid = getegid();
    if (unshare(CLONE_NEWUSER | CLONE_NEWNS) == -1) {
      return absl::ErrnoToStatus(errno, "unshare(CLONE_NEWUSER|CLONE_NEWNS)");
    }
    ICEBOX_RETURN_IF_ERROR(
        WriteIdMap("/proc/self/uid_map", absl::StrCat("0 ", uid, " 1")));
    ICEBOX_RETURN_IF_ERROR(DenySetgroups().status());
    ICEBOX_RETURN_IF_ERROR(
        WriteIdMap("/proc/self/gid_map", absl::StrCat("0 ", gid, " 1")));
  }
  if (mount("", "/", "", MS_REC | MS_PRIVATE, nullptr) == -1) {
    return absl::ErrnoToStatus(errno, "making / private");
  }
  return absl::OkStatus();
}

class SandboxTest : public testing::Test {
 protected:
  void SetUp() override {
    ICEBOX_SKIP_IF_SANDBOXES_UNSUPPORTED;
    ICEBOX_ASSERT_OK_AND_ASSIGN(dirs_,
                                CreateTaskDirs(GetTestTempPath("sandbox")));
    ICEBOX_ASSERT_OK_AND_ASSIGN(testee_,
                                 InstallTestcase("testee", dirs_.in, "/in"));
    sandbox_ = std::make_unique<Sandbox>(
        SandboxOptions{dirs_.root, dirs_.in, dirs_.out, HostLayout()});
  }

  void TearDown() override {
    if (!dirs_.root.empty()) {
      EXPECT_THAT(fileops::DeleteRecursively(TaskDir(dirs_)), IsTrue());
    }
  }

  // Runs testee with args, stdout going to /out/stdout.
  Result RunTestee(const std::vector<std::string>& args) {
    Command command;
    command.path = testee_;
    command.argv = {testee_};
    command.argv.insert(command.argv.end(), args.begin(), args.end());
    command.stdout_path = absl::StrCat("/out/", kStdout);
    return sandbox_->Run(command);
  }

  // Runs testee and returns what it printed, expecting it to exit with 0.
  std::string TesteeOutput(const std::vector<std::string>& args) {
    Result result = RunTestee(args);
    EXPECT_THAT(result.final_status(), Eq(Result::OK)) << result.ToString();
    EXPECT_THAT(result.reason_code(), Eq(0)) << result.ToString();
    return OutFile(kStdout);
  }

  std::string OutFile(absl::string_view name) {
    absl::StatusOr<std::string> contents =
        file::GetContents(file::JoinPath(dirs_.out, name));
    EXPECT_THAT(contents, IsOk());
    return contents.ok() ? *contents : "";
  }

  TaskDirs dirs_;
  std::string testee_;
  std::unique_ptr<Sandbox> sandbox_;
};

TEST_F(SandboxTest, ExitCodeIsReported) {
  Result result = RunTestee({});
  EXPECT_THAT(result.final_status(), Eq(Result::OK));
  EXPECT_THAT(result.ToStatus(), IsOk());

  // Unknown mode.
  result = RunTestee({"99"});
  EXPECT_THAT(result.final_status(), Eq(Result::OK));
  EXPECT_THAT(result.ExitStatus(), IsOk());
  EXPECT_THAT(*result.ExitStatus(), Eq(1));
  EXPECT_THAT(sandbox_->pid(), Eq(-1));
}

TEST_F(SandboxTest, SignalIsReportedAsNegativeStatus) {
  Result result = RunTestee({"10", absl::StrCat(SIGKILL)});
  EXPECT_THAT(result.final_status(), Eq(Result::SIGNALED));
  ICEBOX_ASSERT_OK_AND_ASSIGN(int exit_status, result.ExitStatus());
  EXPECT_THAT(exit_status, Eq(-SIGKILL));
}

TEST_F(SandboxTest, ProgramRunsUnderSandboxInit) {
  EXPECT_THAT(Lines(TesteeOutput({"2"})), ElementsAre("2"));
}

TEST_F(SandboxTest, IdentityIsFixed) {
  EXPECT_THAT(Lines(TesteeOutput({"3"})),
              ElementsAre("1000", "1000", "1000", "1000"));
}

TEST_F(SandboxTest, HostnameIsFixed) {
  EXPECT_THAT(Lines(TesteeOutput({"7"})), ElementsAre("icebox"));
}

TEST_F(SandboxTest, TrustedPathsAreReadOnly) {
  std::vector<std::string> args = {"4", "/icebox_write_test",
                                   "/etc/icebox_write_test"};
  for (const TrustedPath& entry : sandbox_->options().layout.trusted_paths()) {
    if (fileops::IsDirectory(entry.path())) {
      args.push_back(file::JoinPath(TargetOf(entry), "icebox_write_test"));
    }
  }
  std::vector<std::string> lines = Lines(TesteeOutput(args));
  ASSERT_THAT(lines.size(), Eq(args.size() - 1));
  ExpectReadOnlyErrors(lines);

  // Existing files cannot be opened for writing either.
  lines = Lines(TesteeOutput({"1", "/etc/passwd", "/bin/sh"}));
  ASSERT_THAT(lines.size(), Eq(2));
  for (const std::string& line : lines) {
    EXPECT_THAT(line, AnyOf(HasSubstr(absl::StrCat(" ", EROFS)),
                            HasSubstr(absl::StrCat(" ", EACCES))));
  }
}

TEST_F(SandboxTest, OutIsWriteThrough) {
  const std::string content(100000, 'x');
  EXPECT_THAT(Lines(TesteeOutput({"9", "/out/result.txt", content})),
              ElementsAre("/out/result.txt 0"));
  EXPECT_THAT(OutFile("result.txt"), Eq(content));

  // /in is writable too.
  EXPECT_THAT(Lines(TesteeOutput({"4", "/in/scratch"})),
              ElementsAre("/in/scratch 0"));
  ICEBOX_ASSERT_OK_AND_ASSIGN(
      std::string scratch,
      file::GetContents(file::JoinPath(dirs_.in, "scratch")));
  EXPECT_THAT(scratch, StrEq("icebox\n"));
}

TEST_F(SandboxTest, HostRootIsUnreachable) {
  const std::string enoent = absl::StrCat(ENOENT);
  std::vector<std::string> paths = {"/old_root", "/home", "/boot",
                                    "/etc/shadow", "/etc/hostname",
                                    "/var/log", dirs_.in};
  std::vector<std::string> args = {"6"};
  args.insert(args.end(), paths.begin(), paths.end());
  std::vector<std::string> expected;
  for (const std::string& path : paths) {
    expected.push_back(absl::StrCat(path, " ", enoent));
  }
  EXPECT_THAT(Lines(TesteeOutput(args)), testing::ElementsAreArray(expected));
}

TEST_F(SandboxTest, PasswdNamesSandboxUser) {
  EXPECT_THAT(Lines(TesteeOutput({"0", "/etc/passwd"})),
              ElementsAre("/etc/passwd"));
  Command command;
  command.path = "/bin/cat";
  command.argv = {"cat", "/etc/passwd"};
  command.stdout_path = "/out/passwd";
  Result result = sandbox_->Run(command);
  ASSERT_THAT(result.final_status(), Eq(Result::OK)) << result.ToString();
  EXPECT_THAT(OutFile("passwd"), StrEq(kPasswdEntry));
}

TEST_F(SandboxTest, TmpIsLimited) {
  const int enospc = ENOSPC;
  // More than the 16 MiB cap.
  std::vector<std::string> fields =
      absl::StrSplit(TesteeOutput({"8", "/tmp/big", "20971520"}), ' ');
  ASSERT_THAT(fields.size(), Eq(2));
  EXPECT_THAT(std::stoull(fields[0]), Le(16ULL << 20));
  EXPECT_THAT(std::stoi(fields[1]), Eq(enospc));

  // Each run gets a fresh /tmp, so this fits.
  EXPECT_THAT(Lines(TesteeOutput({"8", "/tmp/small", "8388608"})),
              ElementsAre("8388608 0"));
}

TEST_F(SandboxTest, TmpLimitIsConfigurable) {
  SandboxOptions options = sandbox_->options();
  options.layout.set_tmp_size_bytes(1 << 20);
  sandbox_ = std::make_unique<Sandbox>(options);
  std::vector<std::string> fields =
      absl::StrSplit(TesteeOutput({"8", "/tmp/big", "2097152"}), ' ');
  ASSERT_THAT(fields.size(), Eq(2));
  EXPECT_THAT(std::stoull(fields[0]), Le(1ULL << 20));
  EXPECT_THAT(std::stoi(fields[1]), Eq(ENOSPC));
}

TEST_F(SandboxTest, OnlyAllowedDevices) {
  EXPECT_THAT(Lines(TesteeOutput({"5", "/dev"})),
              ElementsAre("null", "urandom"));
  EXPECT_THAT(Lines(TesteeOutput({"0", "/dev/null", "/dev/urandom"})),
              ElementsAre("/dev/null", "/dev/urandom"));
  const std::string enoent = absl::StrCat(ENOENT);
  EXPECT_THAT(Lines(TesteeOutput({"6", "/dev/zero", "/dev/tty", "/dev/full",
                                  "/dev/shm", "/dev/random"})),
              ElementsAre("/dev/zero " + enoent, "/dev/tty " + enoent,
                          "/dev/full " + enoent, "/dev/shm " + enoent,
                          "/dev/random " + enoent));
}

TEST_F(SandboxTest, WorkingDirectoryAndStdin) {
  ICEBOX_ASSERT_OK(
      file::SetContents(file::JoinPath(dirs_.in, "input.txt"), "1 2 3\n"));

  Command command;
  command.path = "/bin/cat";
  command.argv = {"cat"};
  command.stdin_path = "/in/input.txt";
  command.stdout_path = "copy.txt";
  command.cwd = "/out";
  Result result = sandbox_->Run(command);
  ASSERT_THAT(result.final_status(), Eq(Result::OK)) << result.ToString();
  EXPECT_THAT(OutFile("copy.txt"), StrEq("1 2 3\n"));
}

TEST_F(SandboxTest, ExecFailure) {
  Command command;
  command.path = "/in/no_such_program";
  Result result = sandbox_->Run(command);
  EXPECT_THAT(result.final_status(), Eq(Result::SETUP_ERROR));
  EXPECT_THAT(result.reason_code(), Eq(Result::FAILED_EXEC));
  EXPECT_THAT(result.setup_status(), StatusIs(absl::StatusCode::kNotFound));
  EXPECT_THAT(result.IsRetryable(), IsFalse());

  command.path = "relative/program";
  result = sandbox_->Run(command);
  EXPECT_THAT(result.reason_code(), Eq(Result::FAILED_EXEC));
  EXPECT_THAT(result.setup_status(),
              StatusIs(absl::StatusCode::kInvalidArgument));

  command.path = testee_;
  command.cwd = "/nonexistent";
  result = sandbox_->Run(command);
  EXPECT_THAT(result.reason_code(), Eq(Result::FAILED_EXEC));
  EXPECT_THAT(result.setup_status(), StatusIs(absl::StatusCode::kNotFound));
}

TEST_F(SandboxTest, MissingTrustedPathIsSetupError) {
  SandboxOptions options = sandbox_->options();
  options.layout.add_trusted_paths()->set_path("/nonexistent/icebox/jdk");
  Sandbox sandbox(options);
  Command command;
  command.path = testee_;
  Result result = sandbox.Run(command);
  EXPECT_THAT(result.final_status(), Eq(Result::SETUP_ERROR));
  EXPECT_THAT(result.reason_code(), Eq(Result::FAILED_ROOT));
  EXPECT_THAT(result.setup_status(),
              StatusIs(absl::StatusCode::kNotFound, HasSubstr("jdk")));
  EXPECT_THAT(result.IsRetryable(), IsTrue());
  EXPECT_THAT(result.ToString(), HasSubstr("MISSING_PATH"));
}

TEST_F(SandboxTest, Reset) {
  ICEBOX_ASSERT_OK(file::SetContents(file::JoinPath(dirs_.in, "input"), "x"));
  EXPECT_THAT(Lines(TesteeOutput({"4", "/out/a", "/out/b"})),
              ElementsAre("/out/a 0", "/out/b 0"));
  ASSERT_THAT(fileops::CreateDirectoryRecursively(
                  file::JoinPath(dirs_.out, "nested/dir"), 0755),
              IsTrue());

  ICEBOX_ASSERT_OK(sandbox_->Reset());
  for (const std::string& dir : {dirs_.in, dirs_.out}) {
    EXPECT_THAT(fileops::IsDirectory(dir), IsTrue());
    std::vector<std::string> entries;
    std::string error;
    ASSERT_THAT(fileops::ListDirectoryEntries(dir, &entries, &error),
                IsTrue());
    EXPECT_THAT(entries, IsEmpty()) << dir;
  }
}

TEST_F(SandboxTest, ArgvReachesProgram) {
  Command echo;
  echo.path = "/bin/echo";
  echo.argv = {"echo", "first-argument", "second-argument", "a", "b c"};
  echo.stdout_path = "/out/echo";
  Result result = sandbox_->Run(echo);
  ASSERT_THAT(result.final_status(), Eq(Result::OK)) << result.ToString();
  EXPECT_THAT(OutFile("echo"), StrEq("first-argument second-argument a b c\n"));

  // argv[0] is passed as given, not replaced by the path.
  Command shell;
  shell.path = "/bin/sh";
  shell.argv = {"judge", "-c", "echo \"$0\" \"$1\"; exit 7", "x"};
  shell.stdout_path = "/out/shell";
  result = sandbox_->Run(shell);
  ASSERT_THAT(result.final_status(), Eq(Result::OK)) << result.ToString();
  EXPECT_THAT(result.reason_code(), Eq(7));
  EXPECT_THAT(OutFile("shell"), StrEq("judge x\n"));
}

TEST_F(SandboxTest, TrustedSymlinkIsRecreated) {
  const std::string link = file::JoinPath(TaskDir(dirs_), "etc_link");
  ASSERT_THAT(symlink("/etc", link.c_str()), Eq(0));
  SandboxOptions options = sandbox_->options();
  TrustedPath* entry = options.layout.add_trusted_paths();
  entry->set_path(link);
  entry->set_target("/opt/icebox/etc_link");
  sandbox_ = std::make_unique<Sandbox>(options);

  Command command;
  command.path = "/bin/readlink";
  command.argv = {"readlink", "/opt/icebox/etc_link"};
  command.stdout_path = "/out/link";
  Result result = sandbox_->Run(command);
  ASSERT_THAT(result.final_status(), Eq(Result::OK)) << result.ToString();
  ASSERT_THAT(result.reason_code(), Eq(0));
  EXPECT_THAT(OutFile("link"), StrEq("/etc\n"));

  // Resolved inside the sandbox, where /etc only holds passwd.
  EXPECT_THAT(Lines(TesteeOutput({"0", "/opt/icebox/etc_link/passwd"})),
              ElementsAre("/opt/icebox/etc_link/passwd"));
  EXPECT_THAT(Lines(TesteeOutput({"6", "/opt/icebox/etc_link/hostname"})),
              ElementsAre(absl::StrCat("/opt/icebox/etc_link/hostname ",
                                       ENOENT)));
}

TEST_F(SandboxTest, AuxiliaryPathIsReadOnly) {
  const std::string opam = file::JoinPath(TaskDir(dirs_), "home/.opam");
  if (absl::StartsWith(opam, "/tmp/")) {
    GTEST_SKIP() << "Auxiliary paths keep their host path, which would "
                    "collide with /tmp";
  }
  ASSERT_THAT(fileops::CreateDirectoryRecursively(opam, 0755), IsTrue());
  ICEBOX_ASSERT_OK(
      file::SetContents(file::JoinPath(opam, "config"), "switch: 4.14\n"));
  SandboxOptions options = sandbox_->options();
  options.layout.add_auxiliary_paths(opam);
  sandbox_ = std::make_unique<Sandbox>(options);

  Command command;
  command.path = "/bin/cat";
  command.argv = {"cat", file::JoinPath(opam, "config")};
  command.stdout_path = "/out/config";
  Result result = sandbox_->Run(command);
  ASSERT_THAT(result.final_status(), Eq(Result::OK)) << result.ToString();
  EXPECT_THAT(OutFile("config"), StrEq("switch: 4.14\n"));

  std::vector<std::string> lines = Lines(
      TesteeOutput({"4", file::JoinPath(opam, "new"),
                    file::JoinPath(opam, "config.d")}));
  ASSERT_THAT(lines.size(), Eq(2));
  ExpectReadOnlyErrors(lines);
  lines = Lines(TesteeOutput({"1", file::JoinPath(opam, "config")}));
  ASSERT_THAT(lines.size(), Eq(1));
  ExpectReadOnlyErrors(lines);
}

TEST_F(SandboxTest, NestedMountsOfRecursivePathsAreReadOnly) {
  const std::string toolchain = file::JoinPath(TaskDir(dirs_), "toolchain");
  const std::string nested = file::JoinPath(toolchain, "nested");
  ASSERT_THAT(fileops::CreateDirectoryRecursively(nested, 0755), IsTrue());
  SandboxOptions options = sandbox_->options();
  TrustedPath* entry = options.layout.add_trusted_paths();
  entry->set_path(toolchain);
  entry->set_target("/opt/toolchain");
  entry->set_recursive(true);

  Command create;
  create.path = testee_;
  create.argv = {testee_, "4", "/opt/toolchain/top",
                 "/opt/toolchain/nested/inner"};
  create.stdout_path = "/out/create";
  Command read = create;
  read.argv = {testee_, "0", "/opt/toolchain/nested/marker"};
  read.stdout_path = "/out/read";

  pid_t pid = fork();
  ASSERT_THAT(pid, testing::Ne(-1));
  if (pid == 0) {
    if (absl::Status status = EnterPrivateMountNamespace(); !status.ok()) {
      fprintf(stderr, "%s\n", status.ToString().c_str());
      _exit(2);
    }
    // Only visible in this mount namespace and the sandboxes it starts.
    if (mount("tmpfs", nested.c_str(), "tmpfs", 0, "size=1m") == -1 ||
        !file::SetContents(file::JoinPath(nested, "marker"), "x").ok()) {
      _exit(3);
    }
    Sandbox sandbox(options);
    for (const Command* command : {&create, &read}) {
      Result result = sandbox.Run(*command);
      if (!result.ToStatus().ok()) {
        fprintf(stderr, "%s\n", result.ToString().c_str());
        _exit(4);
      }
    }
    _exit(0);
  }
  int status;
  ASSERT_THAT(TEMP_FAILURE_RETRY(waitpid(pid, &status, 0)), Eq(pid));
  ASSERT_THAT(WIFEXITED(status), IsTrue());
  ASSERT_THAT(WEXITSTATUS(status), Eq(0));

  // The nested tmpfs was exposed, not the empty directory below it.
  EXPECT_THAT(Lines(OutFile("read")),
              ElementsAre("/opt/toolchain/nested/marker"));
  std::vector<std::string> lines = Lines(OutFile("create"));
  ASSERT_THAT(lines.size(), Eq(2));
  ExpectReadOnlyErrors(lines);
}

TEST_F(SandboxTest, CompileAndRunEndToEnd) {
  if (access("/usr/bin/gcc", X_OK) != 0) {
    GTEST_SKIP() << "/usr/bin/gcc is not installed";
  }
  // gcc is readable but not writable.
  EXPECT_THAT(Lines(TesteeOutput({"0", "/usr/bin/gcc"})),
              ElementsAre("/usr/bin/gcc"));
  std::vector<std::string> fields =
      absl::StrSplit(TesteeOutput({"1", "/usr/bin/gcc"}), ' ');
  ASSERT_THAT(fields.size(), Eq(2));
  EXPECT_THAT(std::stoi(fields[1]), AnyOf(Eq(EROFS), Eq(EACCES)));

  ICEBOX_ASSERT_OK(file::SetContents(
      file::JoinPath(dirs_.in, "main.c"),
      "#include <stdio.h>\nint main(void) { puts(\"42\"); return 0; }\n"));
  Command compile;
  compile.path = "/usr/bin/gcc";
  compile.argv = {"gcc", "-o", "/out/main", "/in/main.c"};
  compile.stderr_path = "/out/compile.log";
  Result result = sandbox_->Run(compile);
  ASSERT_THAT(result.final_status(), Eq(Result::OK)) << result.ToString();
  ASSERT_THAT(result.reason_code(), Eq(0)) << OutFile("compile.log");

  Command run;
  run.path = "/out/main";
  run.stdout_path = "/out/result.txt";
  result = sandbox_->Run(run);
  ASSERT_THAT(result.final_status(), Eq(Result::OK)) << result.ToString();
  EXPECT_THAT(OutFile("result.txt"), StrEq("42\n"));
}

// Runs `id <flag>` in a sandbox as host_uid and returns what it printed.
// Must be called as root.
absl::StatusOr<std::string> RunIdAs(uid_t host_uid, const char* flag) {
  ICEBOX_ASSIGN_OR_RETURN(TaskDirs dirs, CreateTaskDirs("/tmp/icebox_ids"));
  for (const std::string* dir : {&dirs.root, &dirs.in, &dirs.out}) {
    if (chown(dir->c_str(), host_uid, host_uid) == -1) {
      return absl::ErrnoToStatus(errno, "chown()");
    }
  }

  pid_t pid = fork();
  if (pid == -1) {
    return absl::ErrnoToStatus(errno, "fork()");
  }
  if (pid == 0) {
    if (host_uid != 0 &&
        (setgroups(0, nullptr) == -1 ||
         setresgid(host_uid, host_uid, host_uid) == -1 ||
         setresuid(host_uid, host_uid, host_uid) == -1)) {
      _exit(2);
    }
    Sandbox sandbox(
        SandboxOptions{dirs.root, dirs.in, dirs.out, HostLayout()});
    Command command;
    command.path = "/usr/bin/id";
    command.argv = {"id", flag};
    command.stdout_path = "/out/id";
    Result result = sandbox.Run(command);
    if (!result.ToStatus().ok()) {
      fprintf(stderr, "%s\n", result.ToString().c_str());
      _exit(1);
    }
    _exit(0);
  }
  int status;
  if (TEMP_FAILURE_RETRY(waitpid(pid, &status, 0)) != pid ||
      !WIFEXITED(status)) {
    return absl::InternalError("sandbox runner crashed");
  }
  if (WEXITSTATUS(status) != 0) {
    return absl::InternalError(
        absl::StrCat("sandbox runner failed with ", WEXITSTATUS(status)));
  }
  ICEBOX_ASSIGN_OR_RETURN(std::string output,
                          file::GetContents(file::JoinPath(dirs.out, "id")));
  if (!fileops::DeleteRecursively(TaskDir(dirs))) {
    return absl::InternalError("cleanup failed");
  }
  return output;
}

TEST(SandboxIdentityTest, SameIdentityForDifferentHostUsers) {
  ICEBOX_SKIP_IF_SANDBOXES_UNSUPPORTED;
  if (geteuid() != 0) {
    GTEST_SKIP() << "Needs root to act as two host users";
  }
  for (uid_t host_uid : {0u, 2000u}) {
    for (const char* flag : {"-u", "-g"}) {
      absl::StatusOr<std::string> output = RunIdAs(host_uid, flag);
      ASSERT_THAT(output, IsOk());
      EXPECT_THAT(*output, StrEq("1000\n")) << host_uid << " " << flag;
    }
  }
}

}  // namespace
}  // namespace icebox
