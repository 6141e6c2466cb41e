/**********************************************************************
 * File:        errcode.h
 * Description: Header file for generic error handler class
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

#ifndef TESSPIPE_ERRCODE_H
#define TESSPIPE_ERRCODE_H

#include <fmt/format.h>        // for fmt
#include <tesspipe/export.h>   // for TESSPIPE_API
#include <tesspipe/tprintf.h>

namespace tesspipe {

/*Control parameters for error()*/
enum TessErrorLogCode {
  TESSLOG = 0,   /*alert user */
  TESSTHROW = 1, /*alert user, then throw std::runtime_error */
};

class TESSPIPE_API ERRCODE { // error handler class
  const char *message;       // error message

public:
  void verror(const char *caller, TessErrorLogCode action, fmt::string_view format,
              fmt::format_args args) const;

  template <typename S, typename... Args>
  void error(                  // error print function
      const char *caller,      // function location
      TessErrorLogCode action, // action to take
      const S *format,
      Args &&...args
  ) const {
    verror(caller, action, format, fmt::make_format_args(args...));
  }

  [[noreturn]] void vabort(const char *caller, fmt::string_view format, fmt::format_args args) const;

  template <typename S, typename... Args>
  [[noreturn]] void abort(     // print function for fatal errors
      const char *caller,      // function location
      const S *format,
      Args &&...args
  ) const {
    vabort(caller, format, fmt::make_format_args(args...));
  }

  constexpr ERRCODE(const char *string) : message(string) {} // initialize with string
};

constexpr ERRCODE ASSERT_FAILED("Assert failed");

#define DO_NOTHING static_cast<void>(0)

#define ASSERT_HOST(x) \
  (x) ? DO_NOTHING : ASSERT_FAILED.abort(#x, "in file {}, line {} @ {}()", __FILE__, __LINE__, __FUNCTION__)

} // namespace tesspipe

#endif
