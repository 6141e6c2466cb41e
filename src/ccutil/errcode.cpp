/**********************************************************************
 * File:        errcode.cpp
 * Description: Generic error handler function
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

#include "errcode.h"

#include <cstdlib> // for abort
#include <stdexcept>
#include <string>

namespace tesspipe {

static std::string compose(const char *caller, const char *message, const std::string &detail) {
  if (caller != nullptr) {
    return detail.empty() ? fmt::format("{}:{}", caller, message)
                          : fmt::format("{}:{}:{}", caller, message, detail);
  }
  return detail.empty() ? std::string(message) : fmt::format("{}:{}", message, detail);
}

static void error_action(TessErrorLogCode action, const std::string &text) {
  switch (action) {
    case TESSLOG:
      tprintError("{}\n", text);
      return;
    case TESSTHROW:
      tprintError("{}\n", text);
      throw std::runtime_error(text);
  }
}

/**********************************************************************
 * error
 *
 * Print an error message and continue or throw according to action.
 * Makes use of error messages and numbers in a common place.
 *
 **********************************************************************/
void ERRCODE::verror(const char *caller, TessErrorLogCode action, fmt::string_view format,
                     fmt::format_args args) const {
  error_action(action, compose(caller, message, fmt::vformat(format, args)));
}

// Internal invariant violations only: the library cannot continue.
[[noreturn]] void ERRCODE::vabort(const char *caller, fmt::string_view format,
                                  fmt::format_args args) const {
  tprintError("{}\n", compose(caller, message, fmt::vformat(format, args)));
  ::abort();
}

} // namespace tesspipe
