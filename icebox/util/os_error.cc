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

#include "icebox/util/os_error.h"

#include <string.h>  // strerror_r

#include <cerrno>
#include <cstddef>

namespace icebox {

const char* RawStrError(int errnum, char* buf, size_t buflen) {
  const int saved_errno = errno;
  // GNU strerror_r(), which C++ builds get. It fills buf with "Unknown error
  // nnn" for codes it does not know.
  const char* str = strerror_r(errnum, buf, buflen);
  errno = saved_errno;
  return str;
}

}  // namespace icebox
