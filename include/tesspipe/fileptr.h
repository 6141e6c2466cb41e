///////////////////////////////////////////////////////////////////////
// File:        fileptr.h
// Description: RAII wrappers for C stdio handles and POSIX descriptors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
// http://www.apache.org/licenses/LICENSE-2.0
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
///////////////////////////////////////////////////////////////////////

#pragma once

#include <stdio.h>
#include <memory>

namespace tesspipe
{

// FileHandle owns a FILE* and must be passed by reference only, never by value.

using __file_handle = std::unique_ptr<FILE, void(*)(FILE*)>;

class FileHandle final : public __file_handle {
  // Second argument is the deleter function: a pointer to the type of
  // std::fclose.
public:
  FileHandle() : __file_handle(nullptr, deleter) {}
  FileHandle(FILE *handle) : __file_handle(handle, deleter) {}

  ~FileHandle() = default;

protected:
  static void deleter(FILE *f) {
    if (f) {
      std::fclose(f);
    }
  }
};

// FdHandle owns a raw file descriptor (pipe end) and closes it on destruction.
class FdHandle final {
public:
  FdHandle() = default;
  explicit FdHandle(int fd) : fd_(fd) {}
  ~FdHandle() {
    reset();
  }

  FdHandle(FdHandle &&other) noexcept : fd_(other.release()) {}
  FdHandle &operator=(FdHandle &&other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }

  FdHandle(const FdHandle &) = delete;
  FdHandle &operator=(const FdHandle &) = delete;

  int get() const {
    return fd_;
  }
  explicit operator bool() const {
    return fd_ >= 0;
  }
  int release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }
  // Closes the current descriptor (if any) and takes `fd`.
  void reset(int fd = -1);

private:
  int fd_{-1};
};

}
