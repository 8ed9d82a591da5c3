// Copyright 2019 Google LLC
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

// Raw logging for code running between fork() and execve(). Forked from
// Abseil's version.

#ifndef ICEBOX_UTIL_RAW_LOGGING_H_
#define ICEBOX_UTIL_RAW_LOGGING_H_

#include <cerrno>
#include <cstddef>

#include "absl/base/attributes.h"
#include "absl/base/log_severity.h"
#include "absl/base/optimization.h"
#include "absl/strings/str_format.h"
#include "icebox/util/os_error.h"

// This is similar to LOG(severity) << format..., but
// * it does not allocate any memory and does not need any locks, so it is safe
//   to use in a freshly forked child of a multi-threaded supervisor
// * it logs straight and ONLY to STDERR w/o buffering
// * it uses an explicit printf-format and arguments list
// * it tags every line with the pid, as a single task spans several processes
// * it will silently chop off really long message strings
// Usage example:
//   ICEBOX_RAW_LOG(ERROR, "Failed foo with %i: %s", status, error);
// This will print a log line like this to stderr only:
//   E 4242 root_assembler.cc:123] RAW: Failed foo with 22: bad_file
#define ICEBOX_RAW_LOG(severity, ...)                                         \
  do {                                                                        \
    constexpr const char* icebox_raw_logging_internal_basename =              \
        ::icebox::raw_logging_internal::Basename(__FILE__,                    \
                                                 sizeof(__FILE__) - 1);       \
    ::icebox::raw_logging_internal::RawLog(                                   \
        ICEBOX_RAW_LOGGING_INTERNAL_##severity,                               \
        icebox_raw_logging_internal_basename, __LINE__, __VA_ARGS__);         \
  } while (0)

// Similar to CHECK(condition) << message, but for low-level modules:
// we use only ICEBOX_RAW_LOG that does not allocate memory.
#define ICEBOX_RAW_CHECK(condition, message)                             \
  do {                                                                   \
    if (ABSL_PREDICT_FALSE(!(condition))) {                              \
      ICEBOX_RAW_LOG(FATAL, "Check %s failed: %s", #condition, message); \
    }                                                                    \
  } while (0)

#define ICEBOX_RAW_LOGGING_INTERNAL_INFO ::absl::LogSeverity::kInfo
#define ICEBOX_RAW_LOGGING_INTERNAL_WARNING ::absl::LogSeverity::kWarning
#define ICEBOX_RAW_LOGGING_INTERNAL_ERROR ::absl::LogSeverity::kError
#define ICEBOX_RAW_LOGGING_INTERNAL_FATAL ::absl::LogSeverity::kFatal

// Returns whether verbose logging is enabled, as determined by the
// ICEBOX_VLOG_LEVEL environment variable.
#define ICEBOX_VLOG_IS_ON(verbose_level) \
  ::icebox::raw_logging_internal::VLogIsOn(verbose_level)

// Like ICEBOX_RAW_LOG(), but also logs the current value of errno and its
// corresponding error message.
#define ICEBOX_RAW_PLOG(severity, format, ...)                              \
  do {                                                                      \
    const int icebox_raw_plog_errno = errno;                                \
    char icebox_raw_plog_errno_buffer[100];                                 \
    const char* icebox_raw_plog_errno_str = ::icebox::RawStrError(          \
        icebox_raw_plog_errno, icebox_raw_plog_errno_buffer,                \
        sizeof(icebox_raw_plog_errno_buffer));                              \
    char icebox_raw_plog_buffer[::icebox::raw_logging_internal::kLogBufSize]; \
    absl::SNPrintF(icebox_raw_plog_buffer, sizeof(icebox_raw_plog_buffer),  \
                   (format), ##__VA_ARGS__);                                \
    ICEBOX_RAW_LOG(severity, "%s: %s [%d]", icebox_raw_plog_buffer,         \
                   icebox_raw_plog_errno_str, icebox_raw_plog_errno);       \
  } while (0)

// If verbose logging is enabled, uses ICEBOX_RAW_LOG() to log.
#define ICEBOX_RAW_VLOG(verbose_level, format, ...)               \
  do {                                                            \
    if (::icebox::raw_logging_internal::VLogIsOn(verbose_level)) { \
      ICEBOX_RAW_LOG(INFO, (format), ##__VA_ARGS__);              \
    }                                                             \
  } while (0)

// Like ICEBOX_RAW_CHECK(), but also logs errno and a message (similar to
// ICEBOX_RAW_PLOG()).
#define ICEBOX_RAW_PCHECK(condition, format, ...)                             \
  do {                                                                        \
    if (ABSL_PREDICT_FALSE(!(condition))) {                                   \
      const int icebox_raw_plog_errno = errno;                                \
      char icebox_raw_plog_errno_buffer[100];                                 \
      const char* icebox_raw_plog_errno_str = ::icebox::RawStrError(          \
          icebox_raw_plog_errno, icebox_raw_plog_errno_buffer,                \
          sizeof(icebox_raw_plog_errno_buffer));                              \
      char icebox_raw_plog_buffer                                             \
          [::icebox::raw_logging_internal::kLogBufSize];                      \
      absl::SNPrintF(icebox_raw_plog_buffer, sizeof(icebox_raw_plog_buffer),  \
                     (format), ##__VA_ARGS__);                                \
      ICEBOX_RAW_LOG(FATAL, "Check %s failed: %s: %s [%d]", #condition,       \
                     icebox_raw_plog_buffer, icebox_raw_plog_errno_str,       \
                     icebox_raw_plog_errno);                                  \
    }                                                                         \
  } while (0)

namespace icebox::raw_logging_internal {

constexpr int kLogBufSize = 3000;

// Logs format... at "severity" level, reporting it as called from file:line.
// This does not allocate memory or acquire locks. FATAL messages abort the
// process after being written.
void RawLog(absl::LogSeverity severity, const char* file, int line,
            const char* format, ...) ABSL_PRINTF_ATTRIBUTE(4, 5);

// Writes the provided buffer directly to stderr using the write syscall, which
// is async-signal safe and does not malloc.
void SafeWriteToStderr(const char* s, size_t len);

// compile-time function to get the "base" filename, that is, the part of
// a filename after the last "/" path separator.  The search starts at
// the end of the string; the second parameter is the length of the string.
constexpr const char* Basename(const char* fname, int offset) {
  return offset == 0 || fname[offset - 1] == '/'
             ? fname + offset
             : Basename(fname, offset - 1);
}

bool VLogIsOn(int verbose_level);

}  // namespace icebox::raw_logging_internal

#endif  // ICEBOX_UTIL_RAW_LOGGING_H_
