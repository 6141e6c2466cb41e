// SPDX-License-Identifier: Apache-2.0
// File:        errors.h
// Description: Exception types raised by the tesspipe API.
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

#ifndef TESSPIPE_ERRORS_H_
#define TESSPIPE_ERRORS_H_

#include "export.h"

#include <stdexcept>
#include <string>

namespace tesspipe {

/**
 * Base class for failures of the external engine process itself.
 */
class TESSPIPE_API TesseractError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * The engine exited with a nonzero status. what() is the engine's
 * captured standard error output.
 */
class TESSPIPE_API TesseractRuntimeError : public TesseractError {
public:
  TesseractRuntimeError(const std::string &stderr_text, int return_code)
      : TesseractError(stderr_text), return_code_(return_code) {}

  int return_code() const {
    return return_code_;
  }

private:
  int return_code_;
};

/// The engine did not finish within the caller's timeout and was killed.
class TESSPIPE_API ProcessTimeoutError : public TesseractError {
public:
  ProcessTimeoutError() : TesseractError("Tesseract process timeout") {}
};

/// The engine executable could not be started.
class TESSPIPE_API EngineNotFoundError : public TesseractError {
public:
  using TesseractError::TesseractError;
};

/// A file path image input does not name an existing file.
class TESSPIPE_API ImageNotFoundError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// The image input holds neither a path nor bytes.
class TESSPIPE_API UnsupportedInputError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class TESSPIPE_API InvalidPsmError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class TESSPIPE_API InvalidOemError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class TESSPIPE_API InvalidLanguageError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

} // namespace tesspipe

#endif // TESSPIPE_ERRORS_H_
