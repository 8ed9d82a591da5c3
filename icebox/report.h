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

// Framing of SetupReport messages on the pipe between the sandbox processes
// and the supervisor. Each message is a tag, a length and the serialized
// proto, the same TLV layout for every report.

#ifndef ICEBOX_REPORT_H_
#define ICEBOX_REPORT_H_

#include <cstddef>
#include <cstdint>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "icebox/report.pb.h"

namespace icebox {

inline constexpr uint32_t kTagSetupReport = 0x80000102;
inline constexpr size_t kMaxReportSize = 64 << 10;

// Writes one report. Safe to call between fork() and execve(); logs and
// returns false on failure.
bool SendReport(int fd, const SetupReport& report);

// Reads one report. Returns false if the pipe was closed before the first
// byte of a report, and an error for truncated or malformed reports.
absl::StatusOr<bool> RecvReport(int fd, SetupReport* report);

// Builds a report for a failed stage.
SetupReport MakeFailureReport(SetupReport::Stage stage,
                              const absl::Status& status);

void SaveStatusToProto(const absl::Status& status, StatusProto* out);
absl::Status MakeStatusFromProto(const StatusProto& proto);

}  // namespace icebox

#endif  // ICEBOX_REPORT_H_
