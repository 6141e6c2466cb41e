// SPDX-License-Identifier: Apache-2.0
// File:        imageinput.cpp
// Description: Image argument accepted by every recognition call.
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

#include <tesspipe/imageinput.h>

#include <tesspipe/errors.h>
#include <tesspipe/fileptr.h>
#include <tesspipe/tprintf.h>

#include <cerrno>  // for errno
#include <cstring> // for strerror
#include <system_error>

namespace tesspipe {

ImageInput ImageInput::FromFile(const std::filesystem::path &path) {
  ImageInput input;
  input.value_ = path;
  return input;
}

ImageInput ImageInput::FromBytes(std::string bytes) {
  ImageInput input;
  input.value_ = std::move(bytes);
  return input;
}

ImageInput ImageInput::FromBytes(const void *data, size_t size) {
  return FromBytes(std::string(static_cast<const char *>(data), size));
}

std::filesystem::path ImageInput::path() const {
  if (const auto *p = std::get_if<std::filesystem::path>(&value_)) {
    return *p;
  }
  return {};
}

static std::string ReadWholeFile(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw ImageNotFoundError("No such file: " + path.string());
  }

  FileHandle fp(fopen(path.c_str(), "rb"));
  if (!fp) {
    throw ImageNotFoundError("Cannot open " + path.string() + ": " + strerror(errno));
  }

  std::string data;
  char buf[65536];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), fp.get())) > 0) {
    data.append(buf, n);
  }
  if (ferror(fp.get())) {
    throw std::runtime_error("Error reading " + path.string() + ": " + strerror(errno));
  }
  tprintTrace("Read {} bytes from {}\n", data.size(), path.string());
  return data;
}

std::string ImageInput::ReadBytes() const {
  if (const auto *p = std::get_if<std::filesystem::path>(&value_)) {
    return ReadWholeFile(*p);
  }
  if (const auto *b = std::get_if<std::string>(&value_)) {
    return *b;
  }
  throw UnsupportedInputError("Image input type not supported: expected a file path or image bytes");
}

} // namespace tesspipe
