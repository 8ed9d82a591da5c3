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

#include "icebox/util/fileops.h"

#include <dirent.h>
#include <fcntl.h>
#include <limits.h>  // PATH_MAX
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <memory>

#include "absl/strings/str_cat.h"
#include "icebox/util/os_error.h"
#include "icebox/util/path.h"

namespace icebox::file_util::fileops {

FDCloser::~FDCloser() { Close(); }

bool FDCloser::Close() {
  int fd = Release();
  if (fd == kCanonicalInvalidFd) {
    return false;
  }
  return close(fd) == 0 || errno == EINTR;
}

int FDCloser::Release() {
  int ret = fd_;
  fd_ = kCanonicalInvalidFd;
  return ret;
}

std::string ReadLink(const std::string& filename) {
  std::string result(PATH_MAX, '\0');
  const auto size = readlink(filename.c_str(), &result[0], PATH_MAX);
  if (size < 0) {
    return "";
  }
  result.resize(size);
  return result;
}

bool IsDirectory(const std::string& filename) {
  struct stat64 st;
  return stat64(filename.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool ListDirectoryEntries(const std::string& directory,
                          std::vector<std::string>* entries,
                          std::string* error) {
  errno = 0;
  std::unique_ptr<DIR, void (*)(DIR*)> dir{opendir(directory.c_str()),
                                           [](DIR* d) { closedir(d); }};
  if (!dir) {
    *error = OsErrorMessage(errno, "opendir(", directory, ")");
    return false;
  }

  errno = 0;
  struct dirent* entry;
  while ((entry = readdir(dir.get())) != nullptr) {
    const std::string name(entry->d_name);
    if (name != "." && name != "..") {
      entries->push_back(name);
    }
  }
  if (errno != 0) {
    *error = OsErrorMessage(errno, "readdir(", directory, ")");
    return false;
  }
  return true;
}

bool CreateDirectoryRecursively(const std::string& path, mode_t mode) {
  if (path.empty()) {
    errno = ENOENT;
    return false;
  }
  if (mkdir(path.c_str(), mode) == 0) {
    return true;
  }
  if (errno == EEXIST) {
    if (IsDirectory(path)) {
      return true;
    }
    errno = ENOTDIR;
    return false;
  }
  if (errno != ENOENT) {
    return false;
  }
  const auto [parent, base] = file::SplitPath(path);
  if (parent.empty() || parent == path || base.empty()) {
    errno = ENOENT;
    return false;
  }
  if (!CreateDirectoryRecursively(std::string(parent), mode)) {
    return false;
  }
  return mkdir(path.c_str(), mode) == 0 ||
         (errno == EEXIST && IsDirectory(path));
}

bool DeleteRecursively(const std::string& filename) {
  std::vector<std::string> to_delete;
  to_delete.push_back(filename);

  while (!to_delete.empty()) {
    const std::string delfile = to_delete.back();

    struct stat64 st;
    if (lstat64(delfile.c_str(), &st) == -1) {
      if (errno == ENOENT) {
        // Someone else removed it in the meantime.
        to_delete.pop_back();
        continue;
      }
      return false;
    }

    if (S_ISDIR(st.st_mode)) {
      if (rmdir(delfile.c_str()) != 0 && errno != ENOENT) {
        if (errno != ENOTEMPTY) {
          return false;
        }
        std::string error;
        std::vector<std::string> entries;
        if (!ListDirectoryEntries(delfile, &entries, &error)) {
          return false;
        }
        for (const auto& entry : entries) {
          to_delete.push_back(file::JoinPath(delfile, entry));
        }
      } else {
        to_delete.pop_back();
      }
    } else {
      if (unlink(delfile.c_str()) != 0 && errno != ENOENT) {
        return false;
      }
      to_delete.pop_back();
    }
  }
  return true;
}

bool DeleteDirectoryContents(const std::string& directory) {
  std::string error;
  std::vector<std::string> entries;
  if (!ListDirectoryEntries(directory, &entries, &error)) {
    return false;
  }
  for (const auto& entry : entries) {
    if (!DeleteRecursively(file::JoinPath(directory, entry))) {
      return false;
    }
  }
  return true;
}

bool WriteToFD(int fd, const char* data, size_t size) {
  while (size > 0) {
    ssize_t result = TEMP_FAILURE_RETRY(write(fd, data, size));
    if (result <= 0) {
      return false;
    }
    size -= result;
    data += result;
  }
  return true;
}

bool ReadFromFD(int fd, char* data, size_t size) {
  while (size > 0) {
    ssize_t result = TEMP_FAILURE_RETRY(read(fd, data, size));
    if (result == 0) {
      errno = 0;
      return false;
    }
    if (result < 0) {
      return false;
    }
    size -= result;
    data += result;
  }
  return true;
}

}  // namespace icebox::file_util::fileops
