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

#include "icebox/flags.h"

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/flags/flag.h"
#include "absl/status/status.h"
#include "icebox/layout.h"
#include "icebox/testing.h"
#include "icebox/util/file_helpers.h"
#include "icebox/util/fileops.h"
#include "icebox/util/path.h"
#include "icebox/util/status_matchers.h"

namespace icebox {
namespace {

using ::testing::Eq;
using ::testing::IsTrue;

class LayoutFlagTest : public testing::Test {
 protected:
  void TearDown() override { absl::SetFlag(&FLAGS_icebox_layout, ""); }
};

TEST_F(LayoutFlagTest, EmptyFlagUsesDefaultLayout) {
  ICEBOX_ASSERT_OK_AND_ASSIGN(SandboxLayout layout, LayoutFromFlags());
  EXPECT_THAT(layout.SerializeAsString(),
              Eq(DefaultLayout().SerializeAsString()));
}

TEST_F(LayoutFlagTest, LoadsNamedFile) {
  ICEBOX_ASSERT_OK_AND_ASSIGN(std::string dir,
                              CreateTempDir(GetTestTempPath("flags_")));
  const std::string path = file::JoinPath(dir, "layout.textproto");
  ICEBOX_ASSERT_OK(file::SetContents(path, R"pb(
    trusted_paths { path: "/usr" }
    tmp_inodes: 128
  )pb"));

  absl::SetFlag(&FLAGS_icebox_layout, path);
  ICEBOX_ASSERT_OK_AND_ASSIGN(SandboxLayout layout, LayoutFromFlags());
  ASSERT_THAT(layout.trusted_paths_size(), Eq(1));
  EXPECT_THAT(layout.tmp_inodes(), Eq(128));

  absl::SetFlag(&FLAGS_icebox_layout, file::JoinPath(dir, "missing"));
  EXPECT_THAT(LayoutFromFlags(), StatusIs(absl::StatusCode::kNotFound));
  EXPECT_THAT(file_util::fileops::DeleteRecursively(dir), IsTrue());
}

}  // namespace
}  // namespace icebox
