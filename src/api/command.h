///////////////////////////////////////////////////////////////////////
// File:        command.h
// Description: Engine argument vectors and option validation.
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

#ifndef TESSPIPE_API_COMMAND_H_
#define TESSPIPE_API_COMMAND_H_

#include <tesspipe/export.h>
#include <tesspipe/ocroptions.h>
#include <tesspipe/publictypes.h>

#include <string>
#include <vector>

namespace tesspipe {

// The engine's names for its standard streams when used as input / output base.
constexpr const char *kStdinName = "stdin";
constexpr const char *kStdoutName = "stdout";

// Throws InvalidPsmError unless 0 <= psm < PSM_COUNT.
TESSPIPE_API void ValidatePsm(int psm);

// Throws InvalidOemError unless 0 <= oem < OEM_COUNT.
TESSPIPE_API void ValidateOem(int oem);

// Throws InvalidLanguageError when any '+'-separated part of `lang` is
// not a known language code. An empty `lang` is accepted.
TESSPIPE_API void ValidateLanguage(const std::string &lang);

/**
 * Validates every field of `options` before anything is spawned.
 * The language check is skipped when `tesspipe_validate_languages` is off,
 * which allows custom traineddata names.
 */
TESSPIPE_API void ValidateOptions(const OcrOptions &options);

// True for the codes of the traineddata files distributed with the engine,
// plus "osd" and "equ".
TESSPIPE_API bool IsKnownLanguage(const std::string &code);

// Name of the config file that selects `format`, or nullptr for formats
// that need none (OSD).
TESSPIPE_API const char *FileFormatConfigName(FileFormat format);

// File name extension the engine uses for `format` ("xml" for ALTO).
// nullptr for OSD, which writes no file.
TESSPIPE_API const char *FileFormatExtension(FileFormat format);

// Inverse of FileFormatConfigName() plus "osd". Returns false for an
// unknown name.
TESSPIPE_API bool ParseFileFormat(const std::string &name, FileFormat *format);

/**
 * Produces
 *   cmd input output [--user-words P] [--user-patterns P] [--tessdata-dir P]
 *       [-l LANG] [--dpi N] --psm N --oem N [configs...]
 * Empty optional values and a zero dpi are omitted.
 */
TESSPIPE_API std::vector<std::string> BuildCommandArgs(const std::string &cmd,
                                                       const std::string &input,
                                                       const std::string &output,
                                                       const OcrOptions &options,
                                                       const std::vector<std::string> &configs);

} // namespace tesspipe

#endif // TESSPIPE_API_COMMAND_H_
