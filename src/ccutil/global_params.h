/**********************************************************************
 * File:        global_params.h
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

#ifndef TESSPIPE_GLOBAL_PARAMS_H
#define TESSPIPE_GLOBAL_PARAMS_H

#include <tesspipe/params.h>

namespace tesspipe {

// Defined in tprintf.cpp.
extern TESSPIPE_API INT_VAR_H(log_level);
extern TESSPIPE_API STRING_VAR_H(debug_file);

// Defined in global_params.cpp.
extern TESSPIPE_API STRING_VAR_H(tesseract_cmd);
extern TESSPIPE_API INT_VAR_H(tesspipe_default_dpi);
extern TESSPIPE_API STRING_VAR_H(tesspipe_default_lang);
extern TESSPIPE_API INT_VAR_H(tesspipe_default_psm);
extern TESSPIPE_API INT_VAR_H(tesspipe_default_oem);
extern TESSPIPE_API DOUBLE_VAR_H(tesspipe_default_timeout);
extern TESSPIPE_API BOOL_VAR_H(tesspipe_validate_languages);

} // namespace tesspipe

#endif
