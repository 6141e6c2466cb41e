/**********************************************************************
 * File:        global_params.cpp
 * Description: Process-wide tesspipe configuration parameters.
 *
 ** Licensed under the Apache License, Version 2.0 (the "License");
 ** you may not use this file except in compliance with the License.
 ** You may obtain a copy of the License at
 ** http://www.apache.org/licenses/LICENSE-2.0
 ** Unless required by applicable law or agreed to in writing, software
 ** distributed under the License is distributed on an "AS IS" BASIS,
 ** WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 ** See the License for the specific language governing permissions and
 ** limitations under the License.
 *
 **********************************************************************/

#include "global_params.h"

#include <cstdlib> // for std::getenv

namespace tesspipe {

// The TESSERACT_CMD environment variable overrides the compiled-in engine name.
static const char *DefaultTesseractCmd() {
  const char *env = std::getenv("TESSERACT_CMD");
  if (env != nullptr && env[0] != '\0') {
    return env;
  }
  return "tesseract";
}

STRING_VAR(tesseract_cmd, DefaultTesseractCmd(),
           "Name or path of the tesseract executable. Searched in PATH when it has no '/'.");
INT_VAR(tesspipe_default_dpi, 300, "Default --dpi passed to the engine. 0 omits the argument.");
STRING_VAR(tesspipe_default_lang, "eng", "Default -l language(s), e.g. eng or eng+por.");
INT_VAR(tesspipe_default_psm, 3, "Default page segmentation mode (0..13).");
INT_VAR(tesspipe_default_oem, 3, "Default OCR engine mode (0..3).");
DOUBLE_VAR(tesspipe_default_timeout, 30.0, "Default engine timeout in seconds.");
BOOL_VAR(tesspipe_validate_languages, true,
         "Reject language codes that are not known tesseract languages before spawning.");

} // namespace tesspipe
