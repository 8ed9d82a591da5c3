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

#include "google/protobuf/text_format.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "icebox/util/file_helpers.h"
#include "icebox/util/path.h"
#include "icebox/util/status_macros.h"

namespace icebox {

namespace {

struct DefaultEntry {
  const char* path;
  bool recursive;
  bool optional;
};

constexpr DefaultEntry kDefaultTrustedPaths[] = {
    {"/bin", false, false},
    {"/etc/alternatives", false, false},
    {"/lib", false, false},
    {"/lib64", false, false},
    {"/usr/bin", false, false},
    {"/usr/include", false, false},
    {"/usr/lib", false, false},
    {"/usr/lib64", false, false},
    {"/usr/libexec", false, false},
    {"/usr/share", false, false},
    {"/usr/local", true, false},
    // Haskell package store.
    {"/var/lib/ghc", false, true},
};

constexpr const char* kDefaultAuxiliaryPaths[] = {
    // Octave per-user configuration.
    "/root/.octave",
    // opam state.
    "/root/.opam",
};

bool PathContainsNullByte(absl::string_view path) {
  return absl::StrContains(path, '\0');
}

absl::Status ValidateHostPath(absl::string_view kind, absl::string_view path) {
  if (path.empty() || PathContainsNullByte(path)) {
    return absl::InvalidArgumentError(
        absl::StrCat(kind, " path is empty or contains a NUL byte"));
  }
  if (!file::IsAbsolutePath(path)) {
    return absl::InvalidArgumentError(
        absl::StrCat(kind, " path is not absolute: ", path));
  }
  if (file::HasParentReference(path)) {
    return absl::InvalidArgumentError(
        absl::StrCat(kind, " path contains '..': ", path));
  }
  return absl::OkStatus();
}

absl::Status ValidateTarget(absl::string_view target) {
  const std::string clean = file::CleanPath(target);
  if (clean == "/") {
    return absl::InvalidArgumentError("Cannot expose a path at the root");
  }
  for (absl::string_view reserved : kReservedTargets) {
    // Neither the reserved entry, anything inside it, nor a parent of it.
    if (clean == reserved ||
        absl::StartsWith(clean, absl::StrCat(reserved, "/")) ||
        absl::StartsWith(reserved, absl::StrCat(clean, "/"))) {
      return absl::InvalidArgumentError(
          absl::StrCat("Target collides with reserved entry ", reserved, ": ",
                       target));
    }
  }
  return absl::OkStatus();
}

}  // namespace

SandboxLayout DefaultLayout() {
  SandboxLayout layout;
  for (const DefaultEntry& entry : kDefaultTrustedPaths) {
    TrustedPath* trusted = layout.add_trusted_paths();
    trusted->set_path(entry.path);
    if (entry.recursive) {
      trusted->set_recursive(true);
    }
    if (entry.optional) {
      trusted->set_optional(true);
    }
  }
  for (const char* path : kDefaultAuxiliaryPaths) {
    layout.add_auxiliary_paths(path);
  }
  return layout;
}

std::string TargetOf(const TrustedPath& entry) {
  return file::CleanPath(entry.has_target() ? entry.target() : entry.path());
}

absl::Status ValidateLayout(const SandboxLayout& layout) {
  for (const TrustedPath& entry : layout.trusted_paths()) {
    ICEBOX_RETURN_IF_ERROR(ValidateHostPath("Trusted", entry.path()));
    if (entry.has_target()) {
      ICEBOX_RETURN_IF_ERROR(ValidateHostPath("Target", entry.target()));
    }
    ICEBOX_RETURN_IF_ERROR(ValidateTarget(TargetOf(entry)));
  }
  for (const std::string& path : layout.auxiliary_paths()) {
    ICEBOX_RETURN_IF_ERROR(ValidateHostPath("Auxiliary", path));
    ICEBOX_RETURN_IF_ERROR(ValidateTarget(path));
  }
  if (layout.tmp_size_bytes() == 0 || layout.tmp_inodes() == 0) {
    return absl::InvalidArgumentError("tmp size and inode limits must be > 0");
  }
  return absl::OkStatus();
}

absl::StatusOr<SandboxLayout> ParseLayout(absl::string_view text) {
  SandboxLayout layout;
  if (!google::protobuf::TextFormat::ParseFromString(std::string(text),
                                                     &layout)) {
    return absl::InvalidArgumentError("Could not parse sandbox layout");
  }
  ICEBOX_RETURN_IF_ERROR(ValidateLayout(layout));
  return layout;
}

absl::StatusOr<SandboxLayout> LoadLayout(const std::string& path) {
  ICEBOX_ASSIGN_OR_RETURN(std::string text, file::GetContents(path));
  absl::StatusOr<SandboxLayout> layout = ParseLayout(text);
  if (!layout.ok()) {
    return absl::Status(layout.status().code(),
                        absl::StrCat(path, ": ", layout.status().message()));
  }
  return layout;
}

}  // namespace icebox
