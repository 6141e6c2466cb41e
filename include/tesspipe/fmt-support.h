// SPDX-License-Identifier: Apache-2.0
// File:        fmt-support.h
// Description: Support code for FMT library usage within and without tesspipe.
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

#ifndef TESSPIPE_FMT_SUPPORT_H_
#define TESSPIPE_FMT_SUPPORT_H_

#include <tesspipe/export.h>
#include <tesspipe/results.h>

#include <fmt/format.h>

#include <string_view>

// Records print as their fields in declaration order, tab separated.
#define DECL_FMT_FORMAT_TESSPIPETYPE(Type)                                                   \
                                                                                             \
} /* close current namespace tesspipe */                                                     \
                                                                                             \
namespace fmt {                                                                              \
                                                                                             \
  template <>                                                                                \
  struct TESSPIPE_API formatter<tesspipe::Type> : formatter<std::string_view> {              \
    /* parse is inherited from formatter<string_view>. */                                    \
                                                                                             \
    auto format(const tesspipe::Type &c, format_context &ctx) const -> decltype(ctx.out());  \
  };                                                                                         \
                                                                                             \
}                                                                                            \
                                                                                             \
namespace tesspipe {                                                                         \
  /* re-open namespace tesspipe */

namespace tesspipe {

DECL_FMT_FORMAT_TESSPIPETYPE(Box)
DECL_FMT_FORMAT_TESSPIPETYPE(Data)
DECL_FMT_FORMAT_TESSPIPETYPE(OSD)
DECL_FMT_FORMAT_TESSPIPETYPE(Parameter)

} // namespace tesspipe

#endif // TESSPIPE_FMT_SUPPORT_H_
