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

#ifndef ICEBOX_UTIL_FILEOPS_H_
#define ICEBOX_UTIL_FILEOPS_H_

#include <sys/types.h>

#include <cstddef>
#include <string>
#include <vector>


namespace icebox::file_util::fileops {

// RAII helper class to automatically close file descriptors.
class FDCloser {
 public:
  explicit FDCloser(int fd = kCanonicalInvalidFd) : fd_{fd} {}
  FDCloser(const FDCloser&) = delete;
  FDCloser& operator=(const FDCloser&) = delete;
  FDCloser(FDCloser&& other) : fd_(other.Release()) {}
  FDCloser& operator=(FDCloser&& other) {
    if (this != &other) {
      Close();
      fd_ = other.Release();
    }
    return *this;
  }
  ~FDCloser();

  int get() const { return fd_; }
  bool Close();
  int Release();

 private:
  static constexpr int kCanonicalInvalidFd = -1;

  int fd_;
};

// Returns the target of a symlink. Returns an empty string on failure.
std::string ReadLink(const std::string& filename);

// Returns true if filename resolves to a directory.
bool IsDirectory(const std::string& filename);

// Reads a directory and fills entries with all the files in that directory.
// On error, false is returned and error is set to a description of the
// error. The filenames in entries are just the basenames of the
// files found.
bool ListDirectoryEntries(const std::string& directory,
                          std::vector<std::string>* entries,
                          std::string* error);

// Creates a directory and all of its missing parents. Existing segments are
// skipped. Returns false and leaves errno set on failure.
bool CreateDirectoryRecursively(const std::string& path, mode_t mode);

// Deletes the specified file or directory, including any sub-directories.
bool DeleteRecursively(const std::string& filename);

// Deletes everything below directory but keeps the directory itself.
bool DeleteDirectoryContents(const std::string& directory);

// Writes data to a file descriptor. The file descriptor should be blocking.
// Returns true on success.
bool WriteToFD(int fd, const char* data, size_t size);

// Reads exactly size bytes from a blocking file descriptor. Returns false on
// error or if end of file is reached first; in the latter case errno is 0.
bool ReadFromFD(int fd, char* data, size_t size);

}  // namespace icebox::file_util::fileops

#endif  // ICEBOX_UTIL_FILEOPS_H_
