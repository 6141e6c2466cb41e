///////////////////////////////////////////////////////////////////////
// File:        outputparsers.h
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

#ifndef TESSPIPE_API_OUTPUTPARSERS_H_
#define TESSPIPE_API_OUTPUTPARSERS_H_

#include <tesspipe/export.h>
#include <tesspipe/results.h>

#include <string>
#include <vector>

// None of these throw on malformed input: lines that do not have the
// expected shape are skipped (and reported at trace log level).

namespace tesspipe {

// `makebox` output: "<char> <left> <bottom> <right> <top> <page>" per line.
TESSPIPE_API std::vector<Box> ParseBoxes(const std::string &text);

// TSV output (tessedit_create_tsv=1). The header row is skipped.
TESSPIPE_API std::vector<Data> ParseData(const std::string &text);

// `--psm 0` report. Unknown keys are ignored; missing keys keep defaults.
TESSPIPE_API OSD ParseOsd(const std::string &text);

// `--print-parameters` listing.
TESSPIPE_API std::vector<Parameter> ParseParameters(const std::string &text);

// `--list-langs` listing, filtered to known language codes.
TESSPIPE_API std::vector<std::string> ParseLanguages(const std::string &text);

// "tesseract 5.3.0\n leptonica-..." -> "5.3.0". Empty when absent.
TESSPIPE_API std::string ParseVersion(const std::string &text);

// "Script confidence: 4.14" -> 4.14; 0.0 when absent.
TESSPIPE_API double ParseScriptConfidence(const std::string &text);

// "Deskew angle: -0.0123" -> -0.0123; 0.0 when absent.
TESSPIPE_API double ParseDeskewAngle(const std::string &text);

// Splits on '\n', dropping a trailing '\r' from each line. A final empty
// line after the last '\n' is not returned.
TESSPIPE_API std::vector<std::string> SplitLines(const std::string &text);

} // namespace tesspipe

#endif // TESSPIPE_API_OUTPUTPARSERS_H_
