///////////////////////////////////////////////////////////////////////
// File:        command.cpp
// Description: Engine argument vectors and option validation.
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

#include "command.h"

#include <tesspipe/errors.h>
#include <tesspipe/tprintf.h>

#include "global_params.h"

#include <algorithm> // for std::binary_search
#include <cmath>     // for std::isfinite
#include <iterator>  // for std::begin, std::end
#include <stdexcept> // for std::invalid_argument
#include <string_view>

namespace tesspipe {

// Sorted; searched with std::binary_search.
static const std::string_view kKnownLanguages[] = {
    "afr",      "amh",          "ara",      "asm",          "aze",      "aze_cyrl", "bel",
    "ben",      "bod",          "bos",      "bre",          "bul",      "cat",      "ceb",
    "ces",      "chi_sim",      "chi_sim_vert", "chi_tra",  "chi_tra_vert", "chr", "cos",
    "cym",      "dan",          "deu",      "deu_latf",     "div",      "dzo",      "ell",
    "eng",      "enm",          "epo",      "equ",          "est",      "eus",      "fao",
    "fas",      "fil",          "fin",      "fra",          "frk",      "frm",      "fry",
    "gla",      "gle",          "glg",      "grc",          "guj",      "hat",      "heb",
    "hin",      "hrv",          "hun",      "hye",          "iku",      "ind",      "isl",
    "ita",      "ita_old",      "jav",      "jpn",          "jpn_vert", "kan",      "kat",
    "kat_old",  "kaz",          "khm",      "kir",          "kmr",      "kor",      "kor_vert",
    "lao",      "lat",          "lav",      "lit",          "ltz",      "mal",      "mar",
    "mkd",      "mlt",          "mon",      "mri",          "msa",      "mya",      "nep",
    "nld",      "nor",          "oci",      "ori",          "osd",      "pan",      "pol",
    "por",      "pus",          "que",      "ron",          "rus",      "san",      "sin",
    "slk",      "slv",          "snd",      "spa",          "spa_old",  "sqi",      "srp",
    "srp_latn", "sun",          "swa",      "swe",          "syr",      "tam",      "tat",
    "tel",      "tgk",          "tha",      "tir",          "ton",      "tur",      "uig",
    "ukr",      "urd",          "uzb",      "uzb_cyrl",     "vie",      "yid",      "yor",
};

OcrOptions::OcrOptions()
    : dpi(tesspipe_default_dpi)
    , lang(tesspipe_default_lang.value())
    , psm(tesspipe_default_psm)
    , oem(tesspipe_default_oem)
    , timeout(tesspipe_default_timeout) {}

bool IsKnownLanguage(const std::string &code) {
  return std::binary_search(std::begin(kKnownLanguages), std::end(kKnownLanguages),
                            std::string_view(code));
}

void ValidatePsm(int psm) {
  if (psm < 0 || psm >= PSM_COUNT) {
    tprintError("Invalid PSM value {}, please enter a number between 0-{}\n", psm,
                PSM_COUNT - 1);
    throw InvalidPsmError(fmt::format("Invalid PSM value {}", psm));
  }
}

void ValidateOem(int oem) {
  if (oem < 0 || oem >= OEM_COUNT) {
    tprintError("Invalid OEM value {}, please enter a number between 0-{}\n", oem,
                OEM_COUNT - 1);
    throw InvalidOemError(fmt::format("Invalid OEM value {}", oem));
  }
}

void ValidateLanguage(const std::string &lang) {
  if (lang.empty()) {
    return;
  }
  size_t start = 0;
  for (;;) {
    size_t plus = lang.find('+', start);
    std::string code = lang.substr(start, plus == std::string::npos ? std::string::npos : plus - start);
    if (!IsKnownLanguage(code)) {
      tprintError("Invalid language code `{}` in `{}`\n", code, lang);
      throw InvalidLanguageError(fmt::format("Invalid language code `{}`", code));
    }
    if (plus == std::string::npos) {
      break;
    }
    start = plus + 1;
  }
}

void ValidateOptions(const OcrOptions &options) {
  ValidatePsm(options.psm);
  ValidateOem(options.oem);
  if (tesspipe_validate_languages) {
    ValidateLanguage(options.lang);
  }
  if (!(options.timeout > 0) || !std::isfinite(options.timeout)) {
    tprintError("Invalid timeout {}, must be a positive number of seconds\n", options.timeout);
    throw std::invalid_argument(fmt::format("Invalid timeout {}", options.timeout));
  }
  if (options.dpi < 0) {
    throw std::invalid_argument(fmt::format("Invalid DPI {}", options.dpi));
  }
}

const char *FileFormatConfigName(FileFormat format) {
  switch (format) {
    case FILE_FORMAT_TXT:
      return "txt";
    case FILE_FORMAT_HOCR:
      return "hocr";
    case FILE_FORMAT_PDF:
      return "pdf";
    case FILE_FORMAT_TSV:
      return "tsv";
    case FILE_FORMAT_ALTO:
      return "alto";
    case FILE_FORMAT_OSD:
      return nullptr;
  }
  return nullptr;
}

const char *FileFormatExtension(FileFormat format) {
  if (format == FILE_FORMAT_ALTO) {
    return "xml";
  }
  return FileFormatConfigName(format);
}

bool ParseFileFormat(const std::string &name, FileFormat *format) {
  static const FileFormat kFormats[] = {FILE_FORMAT_TXT, FILE_FORMAT_HOCR, FILE_FORMAT_PDF,
                                        FILE_FORMAT_TSV, FILE_FORMAT_ALTO};
  for (auto f : kFormats) {
    if (name == FileFormatConfigName(f)) {
      *format = f;
      return true;
    }
  }
  if (name == "osd") {
    *format = FILE_FORMAT_OSD;
    return true;
  }
  return false;
}

std::vector<std::string> BuildCommandArgs(const std::string &cmd, const std::string &input,
                                          const std::string &output, const OcrOptions &options,
                                          const std::vector<std::string> &configs) {
  std::vector<std::string> args{cmd, input, output};
  if (!options.user_words.empty()) {
    args.insert(args.end(), {"--user-words", options.user_words});
  }
  if (!options.user_patterns.empty()) {
    args.insert(args.end(), {"--user-patterns", options.user_patterns});
  }
  if (!options.tessdata_dir.empty()) {
    args.insert(args.end(), {"--tessdata-dir", options.tessdata_dir});
  }
  if (!options.lang.empty()) {
    args.insert(args.end(), {"-l", options.lang});
  }
  if (options.dpi > 0) {
    args.insert(args.end(), {"--dpi", std::to_string(options.dpi)});
  }
  args.insert(args.end(), {"--psm", std::to_string(options.psm)});
  args.insert(args.end(), {"--oem", std::to_string(options.oem)});
  for (const auto &config : configs) {
    if (!config.empty()) {
      args.push_back(config);
    }
  }
  return args;
}

} // namespace tesspipe
