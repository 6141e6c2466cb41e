// SPDX-License-Identifier: Apache-2.0
// File:        fmt-support.cpp
// Description: fmt formatters for the tesspipe result records.
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

#include <tesspipe/fmt-support.h>

namespace fmt {

auto formatter<tesspipe::Box>::format(const tesspipe::Box &c, format_context &ctx) const
    -> decltype(ctx.out()) {
  return fmt::format_to(ctx.out(), "{}\t{}\t{}\t{}\t{}\t{}", c.character, c.left, c.bottom,
                        c.right, c.top, c.page);
}

auto formatter<tesspipe::Data>::format(const tesspipe::Data &c, format_context &ctx) const
    -> decltype(ctx.out()) {
  return fmt::format_to(ctx.out(), "{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}\t{}", c.level,
                        c.page_num, c.block_num, c.par_num, c.line_num, c.word_num, c.left,
                        c.top, c.width, c.height, c.conf, c.text);
}

auto formatter<tesspipe::OSD>::format(const tesspipe::OSD &c, format_context &ctx) const
    -> decltype(ctx.out()) {
  return fmt::format_to(ctx.out(), "{}\t{}\t{}\t{}\t{}\t{}", c.page_number,
                        c.orientation_in_degrees, c.rotate, c.orientation_confidence, c.script,
                        c.script_confidence);
}

auto formatter<tesspipe::Parameter>::format(const tesspipe::Parameter &c,
                                            format_context &ctx) const -> decltype(ctx.out()) {
  return fmt::format_to(ctx.out(), "{}\t{}\t{}", c.name, c.value, c.description);
}

} // namespace fmt
