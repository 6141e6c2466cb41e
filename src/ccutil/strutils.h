/**********************************************************************
 * File:        strutils.h
 * Description: Number parsing and tokenizing shared by params, the
 *              output parsers and the command line.
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

#ifndef TESSPIPE_CCUTIL_STRUTILS_H_
#define TESSPIPE_CCUTIL_STRUTILS_H_

#include <tesspipe/export.h>

#include <string>
#include <vector>

namespace tesspipe {

// The whole of `str` must be a base 10 int32. `*val` is untouched on failure.
TESSPIPE_API bool SafeAtoi(const char *str, int *val);

// The whole of `str` must be a number in the "C" locale (engine output and
// config files always use '.'). NaN is rejected.
TESSPIPE_API bool SafeAtod(const char *str, double *val);

// true/1/T/t or false/0/F/f.
TESSPIPE_API bool SafeAtob(const char *str, bool *val);

TESSPIPE_API std::string Trim(const std::string &str);

TESSPIPE_API std::vector<std::string> SplitWhitespace(const std::string &text);

} // namespace tesspipe

#endif // TESSPIPE_CCUTIL_STRUTILS_H_
