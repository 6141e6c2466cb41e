// SPDX-License-Identifier: Apache-2.0
// File:        export.h
// Description: Symbol visibility macros for the tesspipe library.
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

#ifndef TESSPIPE_PLATFORM_H_
#define TESSPIPE_PLATFORM_H_

#ifndef TESSPIPE_API
#  if defined(_WIN32) || defined(__CYGWIN__)
#    if defined(TESSPIPE_EXPORTS)
#      define TESSPIPE_API __declspec(dllexport)
#    elif defined(TESSPIPE_IMPORTS)
#      define TESSPIPE_API __declspec(dllimport)
#    else
#      define TESSPIPE_API
#    endif
#  else
#    if defined(TESSPIPE_EXPORTS) || defined(TESSPIPE_IMPORTS)
#      define TESSPIPE_API __attribute__((visibility("default")))
#    else
#      define TESSPIPE_API
#    endif
#  endif
#endif

#endif // TESSPIPE_PLATFORM_H_
