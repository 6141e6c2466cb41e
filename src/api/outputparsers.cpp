///////////////////////////////////////////////////////////////////////
// File:        outputparsers.cpp
// Description: Turn captured engine output into result records.
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
///////////////////////////////////////////////////////////////////////

#include "outputparsers.h"

#include <tesspipe/tprintf.h>

#include "command.h" // for IsKnownLanguage
#include "strutils.h"

#include <regex>

namespace tesspipe {

static std::vector<std::string> SplitTabs(const std::string &line) {
  std::vector<std::string> fields;
  size_t start = 0;
  for (;;) {
    size_t tab = line.find('\t', start);
    if (tab == std::string::npos) {
      fields.push_back(line.substr(start));
      return fields;
    }
    fields.push_back(line.substr(start, tab - start));
    start = tab + 1;
  }
}

std::vector<std::string> SplitLines(const std::string &text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t nl = text.find('\n', start);
    size_t end = (nl == std::string::npos) ? text.size() : nl;
    std::string line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    if (nl == std::string::npos) {
      break;
    }
    start = nl + 1;
  }
  return lines;
}

std::vector<Box> ParseBoxes(const std::string &text) {
  std::vector<Box> boxes;
  for (const auto &line : SplitLines(text)) {
    auto fields = SplitWhitespace(line);
    if (fields.empty()) {
      continue;
    }
    Box box;
    if (fields.size() != 6 || !SafeAtoi(fields[1].c_str(), &box.left) ||
        !SafeAtoi(fields[2].c_str(), &box.bottom) || !SafeAtoi(fields[3].c_str(), &box.right) ||
        !SafeAtoi(fields[4].c_str(), &box.top) || !SafeAtoi(fields[5].c_str(), &box.page)) {
      tprintTrace("Skipping malformed box line: `{}`\n", line);
      continue;
    }
    box.character = fields[0];
    boxes.push_back(std::move(box));
  }
  return boxes;
}

std::vector<Data> ParseData(const std::string &text) {
  std::vector<Data> rows;
  for (const auto &line : SplitLines(text)) {
    if (Trim(line).empty()) {
      continue;
    }
    auto fields = SplitTabs(line);
    if (fields[0] == "level") {
      continue; // header
    }
    if (fields.size() != 11 && fields.size() != 12) {
      tprintTrace("Skipping TSV row with {} fields: `{}`\n", fields.size(), line);
      continue;
    }
    Data row;
    int *ints[] = {&row.level,    &row.page_num, &row.block_num, &row.par_num, &row.line_num,
                   &row.word_num, &row.left,     &row.top,       &row.width,   &row.height};
    bool ok = true;
    for (size_t i = 0; ok && i < 10; ++i) {
      ok = SafeAtoi(fields[i].c_str(), ints[i]);
    }
    double conf = -1.0;
    if (ok) {
      ok = SafeAtod(fields[10].c_str(), &conf);
    }
    if (!ok) {
      tprintTrace("Skipping malformed TSV row: `{}`\n", line);
      continue;
    }
    row.conf = static_cast<float>(conf);
    if (fields.size() == 12) {
      row.text = fields[11];
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

OSD ParseOsd(const std::string &text) {
  OSD osd;
  for (const auto &line : SplitLines(text)) {
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    std::string key = Trim(line.substr(0, colon));
    std::string value = Trim(line.substr(colon + 1));
    double d = 0.0;
    bool ok = true;
    if (key == "Page number") {
      ok = SafeAtoi(value.c_str(), &osd.page_number);
    } else if (key == "Orientation in degrees") {
      ok = SafeAtoi(value.c_str(), &osd.orientation_in_degrees);
    } else if (key == "Rotate") {
      ok = SafeAtoi(value.c_str(), &osd.rotate);
    } else if (key == "Orientation confidence") {
      ok = SafeAtod(value.c_str(), &d);
      if (ok) {
        osd.orientation_confidence = static_cast<float>(d);
      }
    } else if (key == "Script") {
      osd.script = value;
    } else if (key == "Script confidence") {
      ok = SafeAtod(value.c_str(), &d);
      if (ok) {
        osd.script_confidence = static_cast<float>(d);
      }
    }
    if (!ok) {
      tprintTrace("Skipping malformed OSD line: `{}`\n", line);
    }
  }
  return osd;
}

std::vector<Parameter> ParseParameters(const std::string &text) {
  static const std::regex kWord("\\w+");
  static const std::regex kNumericLine("^(\\w+)\\s+(-?\\d+\\.?\\d*)\\s+(.*\\S)");

  std::vector<Parameter> params;
  for (const auto &line : SplitLines(text)) {
    if (Trim(line).empty() || line.rfind("Tesseract parameters:", 0) == 0) {
      continue;
    }
    auto fields = SplitTabs(line);
    if (fields.size() >= 2 && std::regex_match(fields[0], kWord)) {
      Parameter p;
      p.name = fields[0];
      p.value = fields[1];
      for (size_t i = 2; i < fields.size(); ++i) {
        if (i > 2) {
          p.description += '\t';
        }
        p.description += fields[i];
      }
      p.description = Trim(p.description);
      params.push_back(std::move(p));
      continue;
    }
    std::smatch m;
    if (std::regex_search(line, m, kNumericLine)) {
      params.push_back(Parameter{m[1].str(), m[2].str(), m[3].str()});
      continue;
    }
    tprintTrace("Skipping parameter line: `{}`\n", line);
  }
  return params;
}

std::vector<std::string> ParseLanguages(const std::string &text) {
  std::vector<std::string> langs;
  for (auto &token : SplitWhitespace(text)) {
    if (IsKnownLanguage(token)) {
      langs.push_back(std::move(token));
    }
  }
  return langs;
}

std::string ParseVersion(const std::string &text) {
  for (const auto &line : SplitLines(text)) {
    auto tokens = SplitWhitespace(line);
    if (tokens.empty()) {
      continue;
    }
    return tokens.size() >= 2 ? tokens[1] : std::string();
  }
  return std::string();
}

static double SearchNumber(const std::string &text, const std::regex &re) {
  std::smatch m;
  double value = 0.0;
  if (std::regex_search(text, m, re) && SafeAtod(m[1].str().c_str(), &value)) {
    return value;
  }
  return 0.0;
}

double ParseScriptConfidence(const std::string &text) {
  static const std::regex kScriptConfidence("Script confidence:\\s*(\\d+(?:\\.\\d+)?)");
  return SearchNumber(text, kScriptConfidence);
}

double ParseDeskewAngle(const std::string &text) {
  static const std::regex kDeskewAngle("Deskew angle:\\s*(-?\\d+(?:\\.\\d+)?)");
  return SearchNumber(text, kDeskewAngle);
}

} // namespace tesspipe
