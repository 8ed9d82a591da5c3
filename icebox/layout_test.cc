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

#include "icebox/layout.h"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "icebox/testing.h"
#include "icebox/util/file_helpers.h"
#include "icebox/util/fileops.h"
#include "icebox/util/status_matchers.h"

namespace icebox {
namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;
using ::testing::IsFalse;
using ::testing::IsTrue;
using ::testing::StrEq;

TEST(LayoutTest, DefaultLayout) {
  SandboxLayout layout = DefaultLayout();
  std::vector<std::string> paths;
  for (const TrustedPath& entry : layout.trusted_paths()) {
    paths.push_back(entry.path());
    EXPECT_THAT(entry.has_target(), IsFalse());
    EXPECT_THAT(entry.recursive(), Eq(entry.path() == "/usr/local"));
    EXPECT_THAT(entry.optional(), Eq(entry.path() == "/var/lib/ghc"));
  }
  EXPECT_THAT(paths,
              ElementsAre("/bin", "/etc/alternatives", "/lib", "/lib64",
                          "/usr/bin", "/usr/include", "/usr/lib", "/usr/lib64",
                          "/usr/libexec", "/usr/share", "/usr/local",
                          "/var/lib/ghc"));
  EXPECT_THAT(layout.auxiliary_paths(),
              ElementsAre("/root/.octave", "/root/.opam"));
  EXPECT_THAT(layout.tmp_size_bytes(), Eq(16 << 20));
  EXPECT_THAT(layout.tmp_inodes(), Eq(4096));
  EXPECT_THAT(ValidateLayout(layout), IsOk());
}

TEST(LayoutTest, TargetOf) {
  TrustedPath entry;
  entry.set_path("/opt/jdk/");
  EXPECT_THAT(TargetOf(entry), StrEq("/opt/jdk"));
  entry.set_target("/usr/lib/jvm");
  EXPECT_THAT(TargetOf(entry), StrEq("/usr/lib/jvm"));
}

TEST(LayoutTest, ParseLayout) {
  ICEBOX_ASSERT_OK_AND_ASSIGN(SandboxLayout layout, ParseLayout(R"pb(
    trusted_paths { path: "/usr/bin" }
    trusted_paths { path: "/opt/jdk" target: "/usr/lib/jvm" recursive: true }
    trusted_paths { path: "/var/lib/ghc" optional: true }
    auxiliary_paths: "/root/.opam"
    tmp_size_bytes: 1048576
  )pb"));
  ASSERT_THAT(layout.trusted_paths_size(), Eq(3));
  EXPECT_THAT(TargetOf(layout.trusted_paths(1)), StrEq("/usr/lib/jvm"));
  EXPECT_THAT(layout.trusted_paths(1).recursive(), IsTrue());
  EXPECT_THAT(layout.trusted_paths(2).optional(), IsTrue());
  EXPECT_THAT(layout.tmp_size_bytes(), Eq(1 << 20));
  // Unset limits keep their defaults.
  EXPECT_THAT(layout.tmp_inodes(), Eq(4096));
}

TEST(LayoutTest, ParseLayoutRejectsBadSyntax) {
  EXPECT_THAT(ParseLayout("trusted_paths { bogus: 1 }"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       "Could not parse sandbox layout"));
}

TEST(LayoutTest, RejectsMalformedPaths) {
  EXPECT_THAT(ParseLayout(R"pb(trusted_paths { path: "" })pb"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ParseLayout(R"pb(trusted_paths { path: "usr/bin" })pb"),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("not absolute")));
  EXPECT_THAT(ParseLayout(R"pb(trusted_paths { path: "/usr/../etc" })pb"),
              StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("..")));
  EXPECT_THAT(ParseLayout(R"pb(trusted_paths {
                                 path: "/usr/bin"
                                 target: "relative"
                               })pb"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ParseLayout(R"pb(auxiliary_paths: "home/.opam")pb"),
              StatusIs(absl::StatusCode::kInvalidArgument));

  SandboxLayout layout;
  layout.add_trusted_paths()->set_path(std::string("/usr\0/bin", 9));
  EXPECT_THAT(ValidateLayout(layout),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("NUL byte")));
}

TEST(LayoutTest, RejectsReservedTargets) {
  for (const char* target :
       {"/", "/proc", "/proc/self", "/dev", "/dev/sda", "/tmp", "/tmp/x",
        "/in", "/out/sub", "/etc", "/etc/passwd", "/old_root"}) {
    SandboxLayout layout;
    TrustedPath* entry = layout.add_trusted_paths();
    entry->set_path("/usr/share");
    entry->set_target(target);
    EXPECT_THAT(ValidateLayout(layout),
                StatusIs(absl::StatusCode::kInvalidArgument))
        << target;
  }

  SandboxLayout layout;
  layout.add_trusted_paths()->set_path("/tmp");
  EXPECT_THAT(ValidateLayout(layout),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("reserved")));

  // Siblings sharing a prefix are fine.
  layout.Clear();
  layout.add_trusted_paths()->set_path("/etc/alternatives");
  layout.add_trusted_paths()->set_path("/input");
  layout.add_trusted_paths()->set_path("/tmpdata");
  EXPECT_THAT(ValidateLayout(layout), IsOk());
}

TEST(LayoutTest, RejectsZeroTmpLimits) {
  EXPECT_THAT(ParseLayout("tmp_size_bytes: 0"),
              StatusIs(absl::StatusCode::kInvalidArgument));
  EXPECT_THAT(ParseLayout("tmp_inodes: 0"),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(LayoutTest, LoadLayout) {
  ICEBOX_ASSERT_OK_AND_ASSIGN(std::string dir,
                              CreateTempDir(GetTestTempPath("layout_")));
  const std::string good = dir + "/good.textproto";
  const std::string bad = dir + "/bad.textproto";
  ICEBOX_ASSERT_OK(file::SetContents(good, R"pb(
    trusted_paths { path: "/usr" recursive: true }
  )pb"));
  ICEBOX_ASSERT_OK(file::SetContents(bad, R"pb(
    trusted_paths { path: "/proc" }
  )pb"));

  ICEBOX_ASSERT_OK_AND_ASSIGN(SandboxLayout layout, LoadLayout(good));
  ASSERT_THAT(layout.trusted_paths_size(), Eq(1));
  EXPECT_THAT(layout.trusted_paths(0).recursive(), IsTrue());

  EXPECT_THAT(LoadLayout(bad), StatusIs(absl::StatusCode::kInvalidArgument,
                                        HasSubstr(bad)));
  EXPECT_THAT(LoadLayout(dir + "/missing"),
              StatusIs(absl::StatusCode::kNotFound));
  EXPECT_THAT(file_util::fileops::DeleteRecursively(dir), IsTrue());
}

}  // namespace
}  // namespace icebox
