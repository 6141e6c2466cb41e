// SPDX-License-Identifier: Apache-2.0
// File:        results.h
// Description: Records parsed from the engine's textual output.
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

#ifndef TESSPIPE_RESULTS_H_
#define TESSPIPE_RESULTS_H_

#include <string>

namespace tesspipe {

// One line of `makebox` output. Coordinates have their origin at the
// bottom-left corner of the page.
struct Box {
  std::string character;
  int left = 0;
  int bottom = 0;
  int right = 0;
  int top = 0;
  int page = 0;

  bool operator==(const Box &other) const = default;
};

// One row of the engine's TSV output. `conf` is -1 for rows that are not
// words (page, block, paragraph and line levels), and `text` is empty there.
struct Data {
  int level = 0;
  int page_num = 0;
  int block_num = 0;
  int par_num = 0;
  int line_num = 0;
  int word_num = 0;
  int left = 0;
  int top = 0;
  int width = 0;
  int height = 0;
  float conf = -1.0f;
  std::string text;

  bool operator==(const Data &other) const = default;
};

// Orientation and script detection report (--psm 0).
struct OSD {
  int page_number = 0;
  int orientation_in_degrees = 0;
  int rotate = 0;
  float orientation_confidence = 0.0f;
  std::string script;
  float script_confidence = 0.0f;

  bool operator==(const OSD &other) const = default;
};

// One engine parameter from --print-parameters.
struct Parameter {
  std::string name;
  std::string value;
  std::string description;

  bool operator==(const Parameter &other) const = default;
};

} // namespace tesspipe

#endif // TESSPIPE_RESULTS_H_
