///////////////////////////////////////////////////////////////////////
// File:        ocroptions.h
// Description: Per-call engine options.
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

#ifndef TESSPIPE_OCROPTIONS_H_
#define TESSPIPE_OCROPTIONS_H_

#include "export.h"
#include "publictypes.h"

#include <string>

namespace tesspipe {

/**
 * Options passed to the engine on one invocation.
 *
 * A default-constructed OcrOptions takes its values from the global
 * parameters `tesspipe_default_dpi`, `tesspipe_default_lang`,
 * `tesspipe_default_psm`, `tesspipe_default_oem` and
 * `tesspipe_default_timeout` at the time of construction.
 */
struct TESSPIPE_API OcrOptions {
  OcrOptions();

  int dpi;          // 0: let the engine decide (no --dpi argument)
  std::string lang; // "eng", "eng+fra", ...; empty: no -l argument
  int psm;          // PageSegMode
  int oem;          // OcrEngineMode
  double timeout;   // seconds

  // Optional files and directories; empty means "not given".
  std::string user_words;
  std::string user_patterns;
  std::string tessdata_dir;
};

} // namespace tesspipe

#endif // TESSPIPE_OCROPTIONS_H_
