/**********************************************************************
 * File:        tprintf.h
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

#ifndef TESSPIPE_CCUTIL_TPRINTF_H
#define TESSPIPE_CCUTIL_TPRINTF_H

#include <fmt/format.h>        // for fmt
#include <tesspipe/export.h>   // for TESSPIPE_API

namespace tesspipe {

// Note: messages with a level above the `log_level` parameter are dropped.

enum LogLevel : int {
  T_LOG_ERROR,
  T_LOG_WARN,
  T_LOG_INFO,
  T_LOG_DEBUG,
  T_LOG_TRACE,
};

// Helper function for tprintf.
extern TESSPIPE_API void vTessPrint(int level, fmt::string_view format, fmt::format_args args);

// Returns true when a message at `level` would currently be emitted.
extern TESSPIPE_API bool TessPrintEnabled(int level);

// Main logging functions.

template <typename S, typename... Args>
void tprintError(const S *format, Args &&...args) {
  vTessPrint(T_LOG_ERROR, format, fmt::make_format_args(args...));
}

template <typename S, typename... Args>
void tprintWarn(const S *format, Args &&...args) {
  vTessPrint(T_LOG_WARN, format, fmt::make_format_args(args...));
}

template <typename S, typename... Args>
void tprintInfo(const S *format, Args &&...args) {
  vTessPrint(T_LOG_INFO, format, fmt::make_format_args(args...));
}

template <typename S, typename... Args>
void tprintDebug(const S *format, Args &&...args) {
  vTessPrint(T_LOG_DEBUG, format, fmt::make_format_args(args...));
}

template <typename S, typename... Args>
void tprintTrace(const S *format, Args &&...args) {
  vTessPrint(T_LOG_TRACE, format, fmt::make_format_args(args...));
}

} // namespace tesspipe

#endif // define TESSPIPE_CCUTIL_TPRINTF_H
