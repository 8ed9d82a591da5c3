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

// Reports what the sandbox looks like from the inside, depending on the first
// argument. Results go to stdout, one line per entry:
// ./testee 0 <file1> <file2> ... <fileN>
//    Prints the files that are readable.
// ./testee 1 <file1> <file2> ... <fileN>
//    Opens each existing file for writing, prints "<file> <errno>".
// ./testee 2
//    Prints getpid().
// ./testee 3
//    Prints getuid(), getgid(), geteuid() and getegid().
// ./testee 4 <file1> <file2> ... <fileN>
//    Creates each file, prints "<file> <errno>".
// ./testee 5 <dir>
//    Prints the entries of dir, sorted.
// ./testee 6 <path1> <path2> ... <pathN>
//    lstat()s each path, prints "<path> <errno>".
// ./testee 7
//    Prints the hostname.
// ./testee 8 <file> <bytes>
//    Writes up to bytes zero bytes to file, prints "<written> <errno>".
// ./testee 9 <file> <content>
//    Writes content to file, prints "<file> <errno>".
// ./testee 10 <signal>
//    Kills itself with signal.
// errno is 0 on success.

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <csignal>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace {

// Writes all of data, returns 0 or the errno of the failed write.
int WriteAll(int fd, const char* data, size_t size, size_t* written) {
  *written = 0;
  while (*written < size) {
    ssize_t n = write(fd, data + *written, size - *written);
    if (n == -1) {
      if (errno == EINTR) {
        continue;
      }
      return errno;
    }
    *written += n;
  }
  return 0;
}

int CreateWithContent(const char* path, const std::string& content) {
  int fd = open(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd == -1) {
    return errno;
  }
  size_t written;
  int error = WriteAll(fd, content.data(), content.size(), &written);
  if (close(fd) == -1 && error == 0) {
    error = errno;
  }
  return error;
}

int ListDirectory(const char* path, std::vector<std::string>* entries) {
  DIR* dir = opendir(path);
  if (dir == nullptr) {
    return errno;
  }
  while (struct dirent* entry = readdir(dir)) {
    if (strcmp(entry->d_name, ".") != 0 && strcmp(entry->d_name, "..") != 0) {
      entries->push_back(entry->d_name);
    }
  }
  closedir(dir);
  std::sort(entries->begin(), entries->end());
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    return 0;
  }

  int mode = atoi(argv[1]);  // NOLINT(runtime/deprecated_fn)
  switch (mode) {
    case 0:
      for (int i = 2; i < argc; ++i) {
        if (access(argv[i], R_OK) == 0) {
          printf("%s\n", argv[i]);
        }
      }
      break;

    case 1:
      for (int i = 2; i < argc; ++i) {
        int fd = open(argv[i], O_WRONLY | O_CLOEXEC);
        printf("%s %d\n", argv[i], fd == -1 ? errno : 0);
        if (fd != -1) {
          close(fd);
        }
      }
      break;

    case 2:
      printf("%d\n", static_cast<int>(getpid()));
      break;

    case 3:
      printf("%d\n%d\n%d\n%d\n", static_cast<int>(getuid()),
             static_cast<int>(getgid()), static_cast<int>(geteuid()),
             static_cast<int>(getegid()));
      break;

    case 4:
      for (int i = 2; i < argc; ++i) {
        printf("%s %d\n", argv[i], CreateWithContent(argv[i], "icebox\n"));
      }
      break;

    case 5: {
      if (argc < 3) {
        return 1;
      }
      std::vector<std::string> entries;
      int error = ListDirectory(argv[2], &entries);
      if (error != 0) {
        printf("error %d\n", error);
        break;
      }
      for (const std::string& entry : entries) {
        printf("%s\n", entry.c_str());
      }
      break;
    }

    case 6:
      for (int i = 2; i < argc; ++i) {
        struct stat st;
        printf("%s %d\n", argv[i], lstat(argv[i], &st) == -1 ? errno : 0);
      }
      break;

    case 7: {
      char hostname[256] = {};
      if (gethostname(hostname, sizeof(hostname) - 1) == -1) {
        return 1;
      }
      printf("%s\n", hostname);
      break;
    }

    case 8: {
      if (argc < 4) {
        return 1;
      }
      const size_t limit = strtoull(argv[3], nullptr, 10);
      int fd = open(argv[2], O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
      if (fd == -1) {
        printf("0 %d\n", errno);
        break;
      }
      static char chunk[1 << 20];
      size_t total = 0;
      int error = 0;
      while (total < limit && error == 0) {
        size_t written;
        error = WriteAll(fd, chunk, std::min(sizeof(chunk), limit - total),
                         &written);
        total += written;
      }
      close(fd);
      printf("%zu %d\n", total, error);
      break;
    }

    case 9:
      if (argc < 4) {
        return 1;
      }
      printf("%s %d\n", argv[2], CreateWithContent(argv[2], argv[3]));
      break;

    case 10:
      if (argc < 3) {
        return 1;
      }
      fflush(stdout);
      raise(atoi(argv[2]));  // NOLINT(runtime/deprecated_fn)
      return 1;

    default:
      return 1;
  }
  return fflush(stdout) == 0 ? 0 : 1;
}
