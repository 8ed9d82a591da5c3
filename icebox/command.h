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

// A program to run inside a sandbox.

#ifndef ICEBOX_COMMAND_H_
#define ICEBOX_COMMAND_H_

#include <string>
#include <vector>

namespace icebox {

inline constexpr char kDefaultPathEnv[] = "PATH=/usr/bin:/bin";

struct Command {
  // Absolute path inside the sandbox.
  std::string path;
  // Includes argv[0].
  std::vector<std::string> argv;
  std::vector<std::string> envp = {kDefaultPathEnv};
  std::string cwd = "/";
  // Paths inside the sandbox. Empty means the stream is inherited.
  std::string stdin_path;
  std::string stdout_path;
  std::string stderr_path;
};

}  // namespace icebox

#endif  // ICEBOX_COMMAND_H_
