// SPDX-License-Identifier: Apache-2.0
// File:        imageinput.h
// Description: Image argument accepted by every recognition call: either
//              a file path or the encoded image bytes.
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

#ifndef TESSPIPE_IMAGEINPUT_H_
#define TESSPIPE_IMAGEINPUT_H_

#include "export.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <variant>

namespace tesspipe {

/**
 * A tagged image argument. The engine always receives the image through
 * its standard input, so a path is resolved to the file's bytes first.
 *
 * A default-constructed ImageInput holds nothing; every operation rejects
 * it with UnsupportedInputError before any process is spawned.
 */
class TESSPIPE_API ImageInput {
public:
  ImageInput() = default;

  static ImageInput FromFile(const std::filesystem::path &path);
  // `bytes` is treated as opaque binary data (PNG, TIFF, ...).
  static ImageInput FromBytes(std::string bytes);
  static ImageInput FromBytes(const void *data, size_t size);

  bool empty() const {
    return std::holds_alternative<std::monostate>(value_);
  }
  bool is_file() const {
    return std::holds_alternative<std::filesystem::path>(value_);
  }
  bool is_bytes() const {
    return std::holds_alternative<std::string>(value_);
  }

  // Path of a file input; empty path otherwise.
  std::filesystem::path path() const;

  /**
   * Returns the bytes to feed to the engine.
   * Throws UnsupportedInputError for an empty input and ImageNotFoundError
   * when a file input does not name an existing regular file.
   */
  std::string ReadBytes() const;

private:
  std::variant<std::monostate, std::filesystem::path, std::string> value_;
};

} // namespace tesspipe

#endif // TESSPIPE_IMAGEINPUT_H_
