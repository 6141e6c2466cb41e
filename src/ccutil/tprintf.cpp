/**********************************************************************
 * File:        tprintf.cpp
 * Description: Leveled trace printing for the tesspipe library.
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

#include <tesspipe/tprintf.h>

#include "global_params.h"

#include <cstdio>
#include <mutex>
#include <string>

namespace tesspipe {

INT_VAR(log_level, T_LOG_WARN,
        "Highest message level to emit: 0 = errors, 1 = +warnings, 2 = +info, 3 = +debug, 4 = +trace.");
STRING_VAR(debug_file, "", "File to send tesspipe::tprintf output to");

// Async operations log from worker threads: one message at a time.
static std::mutex tprintf_mutex;

bool TessPrintEnabled(int level) {
  return level <= log_level;
}

// Trace printf
void vTessPrint(int level, fmt::string_view format, fmt::format_args args) {
  if (!TessPrintEnabled(level)) {
    return;
  }

  static FILE *debugfp = nullptr; // debug file
  static std::string debugfp_name;

  std::lock_guard<std::mutex> lock(tprintf_mutex);

  const std::string &debug_file_name = debug_file.value();
  if (debugfp != nullptr && debug_file_name != debugfp_name) {
    fclose(debugfp);
    debugfp = nullptr;
    debugfp_name.clear();
  }
  if (debugfp == nullptr && !debug_file_name.empty()) {
    debugfp = fopen(debug_file_name.c_str(), "a+b");
    if (debugfp != nullptr) {
      debugfp_name = debug_file_name;
    }
  }

  FILE *out = (debugfp != nullptr) ? debugfp : stderr;
  switch (level) {
    case T_LOG_ERROR:
      fmt::print(out, "ERROR: ");
      break;
    case T_LOG_WARN:
      fmt::print(out, "WARNING: ");
      break;
    default:
      break;
  }
  fmt::vprint(out, format, args);
  fflush(out);
}

} // namespace tesspipe
