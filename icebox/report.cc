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

#include "icebox/report.h"

#include <unistd.h>

#include <cerrno>
#include <string>

#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "icebox/util/fileops.h"
#include "icebox/util/os_error.h"
#include "icebox/util/raw_logging.h"

namespace icebox {

namespace fileops = ::icebox::file_util::fileops;

namespace {

struct InternalTLV {
  uint32_t tag;
  uint64_t len;
} __attribute__((packed));

}  // namespace

bool SendReport(int fd, const SetupReport& report) {
  std::string str;
  if (!report.SerializeToString(&str)) {
    ICEBOX_RAW_LOG(ERROR, "Couldn't serialize the setup report");
    return false;
  }
  if (str.size() > kMaxReportSize) {
    ICEBOX_RAW_LOG(ERROR, "Maximum report size exceeded: (%zu > %zu)",
                   str.size(), kMaxReportSize);
    return false;
  }
  const InternalTLV tl = {
      .tag = kTagSetupReport,
      .len = str.size(),
  };
  // A single write keeps reports from concurrent writers apart.
  std::string buffer(reinterpret_cast<const char*>(&tl), sizeof(tl));
  buffer.append(str);
  if (!fileops::WriteToFD(fd, buffer.data(), buffer.size())) {
    ICEBOX_RAW_PLOG(ERROR, "Sending setup report failed");
    return false;
  }
  return true;
}

absl::StatusOr<bool> RecvReport(int fd, SetupReport* report) {
  InternalTLV tl;
  char* dst = reinterpret_cast<char*>(&tl);
  ssize_t first = TEMP_FAILURE_RETRY(read(fd, dst, sizeof(tl)));
  if (first == 0) {
    return false;
  }
  if (first < 0) {
    return ErrnoStatus(errno, "reading setup report");
  }
  if (static_cast<size_t>(first) < sizeof(tl) &&
      !fileops::ReadFromFD(fd, dst + first, sizeof(tl) - first)) {
    return errno != 0 ? ErrnoStatus(errno, "reading setup report")
                      : absl::DataLossError("Truncated setup report header");
  }
  if (tl.tag != kTagSetupReport) {
    return absl::DataLossError(
        absl::StrCat("Expected tag: 0x", absl::Hex(kTagSetupReport),
                     ", got: 0x", absl::Hex(tl.tag)));
  }
  if (tl.len > kMaxReportSize) {
    return absl::DataLossError(
        absl::StrCat("Setup report too large: ", tl.len));
  }
  std::string bytes(tl.len, '\0');
  if (tl.len > 0 && !fileops::ReadFromFD(fd, &bytes[0], bytes.size())) {
    return errno != 0 ? ErrnoStatus(errno, "reading setup report")
                      : absl::DataLossError("Truncated setup report");
  }
  if (!report->ParseFromString(bytes)) {
    return absl::DataLossError("Could not parse setup report");
  }
  return true;
}

SetupReport MakeFailureReport(SetupReport::Stage stage,
                              const absl::Status& status) {
  SetupReport report;
  report.set_stage(stage);
  SaveStatusToProto(status, report.mutable_status());
  return report;
}

void SaveStatusToProto(const absl::Status& status, StatusProto* out) {
  out->set_code(static_cast<int32_t>(status.code()));
  out->set_message(std::string(status.message()));
  auto* payloads = out->mutable_payloads();
  status.ForEachPayload(
      [payloads](absl::string_view type_url, const absl::Cord& payload) {
        (*payloads)[std::string(type_url)] = static_cast<std::string>(payload);
      });
}

absl::Status MakeStatusFromProto(const StatusProto& proto) {
  absl::Status status(static_cast<absl::StatusCode>(proto.code()),
                      proto.message());
  for (const auto& entry : proto.payloads()) {
    status.SetPayload(entry.first, absl::Cord(entry.second));
  }
  return status;
}

}  // namespace icebox
