/**********************************************************************
 * File:        strutils.cpp
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

#include "strutils.h"

#include <cerrno>  // for errno
#include <cmath>   // for std::isnan, NAN
#include <cstdint> // for INT32_MIN, INT32_MAX
#include <cstdlib> // for strtol
#include <cstring> // for strcmp
#include <locale>  // for std::locale::classic
#include <sstream> // for std::stringstream

namespace tesspipe {

bool SafeAtoi(const char *str, int *val) {
  char *endptr = nullptr;
  errno = 0;
  long v = strtol(str, &endptr, 10);
  if (errno != 0 || endptr == str || v < INT32_MIN || v > INT32_MAX) {
    return false;
  }
  if (*endptr != '\0') {
    return false;
  }
  *val = static_cast<int>(v);
  return true;
}

bool SafeAtod(const char *str, double *val) {
  double d = NAN;
  std::stringstream stream(str);
  stream.imbue(std::locale::classic());
  stream >> d;
  bool success = !std::isnan(d) && !stream.fail() && stream.eof();
  if (success) {
    *val = d;
  }
  return success;
}

bool SafeAtob(const char *str, bool *val) {
  if (!strcmp(str, "true") || !strcmp(str, "1") || !strcmp(str, "T") || !strcmp(str, "t")) {
    *val = true;
    return true;
  }
  if (!strcmp(str, "false") || !strcmp(str, "0") || !strcmp(str, "F") || !strcmp(str, "f")) {
    *val = false;
    return true;
  }
  return false;
}

std::string Trim(const std::string &str) {
  const char *ws = " \t\r\n";
  size_t begin = str.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return std::string();
  }
  size_t end = str.find_last_not_of(ws);
  return str.substr(begin, end - begin + 1);
}

std::vector<std::string> SplitWhitespace(const std::string &text) {
  std::vector<std::string> tokens;
  std::istringstream stream(text);
  std::string token;
  while (stream >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

} // namespace tesspipe
