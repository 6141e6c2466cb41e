// SPDX-License-Identifier: Apache-2.0
/**********************************************************************
 * File:        baseapi.cpp
 * Description: Simple API for running the tesseract executable.
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

#include <tesspipe/baseapi.h>

#include <tesspipe/errors.h>
#include <tesspipe/fileptr.h>
#include <tesspipe/tprintf.h>
#include <tesspipe/version.h>

#include "command.h"
#include "errcode.h"
#include "global_params.h"
#include "outputparsers.h"
#include "strutils.h"
#include "subprocess.h"

#include <cerrno>
#include <cstdlib> // for mkdtemp
#include <cstring> // for strerror
#include <stdexcept>
#include <system_error>

namespace tesspipe {

constexpr ERRCODE CANT_CREATE_TEMPDIR("Can't create temporary directory");
constexpr ERRCODE CANT_REMOVE_TEMPDIR("Can't remove temporary directory");

static std::filesystem::path MakeTempDir() {
  std::string pattern = (std::filesystem::temp_directory_path() / "tesspipe-XXXXXX").string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    CANT_CREATE_TEMPDIR.error("TessPipeAPI::Run", TESSTHROW, "{}: {}", pattern, strerror(errno));
  }
  return std::filesystem::path(buf.data());
}

MultiOutput::~MultiOutput() {
  Remove();
}

MultiOutput::MultiOutput(MultiOutput &&other) noexcept
    : dir_(std::move(other.dir_)), files_(std::move(other.files_)) {
  other.dir_.clear();
  other.files_.clear();
}

MultiOutput &MultiOutput::operator=(MultiOutput &&other) noexcept {
  if (this != &other) {
    Remove();
    dir_ = std::move(other.dir_);
    files_ = std::move(other.files_);
    other.dir_.clear();
    other.files_.clear();
  }
  return *this;
}

void MultiOutput::Remove() {
  if (dir_.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(dir_, ec);
  if (ec) {
    CANT_REMOVE_TEMPDIR.error("MultiOutput::Remove", TESSLOG, "{}: {}", dir_.string(),
                              ec.message());
  }
  dir_.clear();
  files_.clear();
}

std::string MultiOutput::ReadFile(size_t index) const {
  const auto &path = files_.at(index);
  FileHandle fp(fopen(path.string().c_str(), "rb"));
  if (!fp) {
    throw std::runtime_error("Engine did not write " + path.string());
  }
  std::string data;
  char buf[8192];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), fp.get())) > 0) {
    data.append(buf, n);
  }
  if (ferror(fp.get())) {
    throw std::runtime_error("Read error on " + path.string());
  }
  return data;
}

TessPipeAPI::TessPipeAPI() : tesseract_cmd_(tesseract_cmd.value()) {}

TessPipeAPI::TessPipeAPI(std::string cmd) : tesseract_cmd_(std::move(cmd)) {}

TessPipeAPI::~TessPipeAPI() = default;

const char *TessPipeAPI::Version() {
  return TESSPIPE_VERSION_STR;
}

std::string TessPipeAPI::RunInfoCommand(const std::vector<std::string> &extra_args) const {
  std::vector<std::string> argv{tesseract_cmd_};
  argv.insert(argv.end(), extra_args.begin(), extra_args.end());
  CommandResult result = RunCommand(argv, std::string(), options_.timeout);
  CheckReturnCode(result);
  return result.out;
}

std::pair<std::string, std::string> TessPipeAPI::RunImageCommand(
    const ImageInput &image, const std::vector<std::string> &argv, double timeout,
    bool check) const {
  // Resolved before spawning: a missing file never starts a process.
  std::string bytes = image.ReadBytes();
  CommandResult result = RunCommand(argv, bytes, timeout);
  if (check) {
    CheckReturnCode(result);
  } else if (result.return_code != 0) {
    tprintDebug("Ignoring engine return code {}\n", result.return_code);
  }
  return {std::move(result.out), std::move(result.err)};
}

std::string TessPipeAPI::TesseractVersion() const {
  std::vector<std::string> argv{tesseract_cmd_, "--version"};
  CommandResult result = RunCommand(argv, std::string(), options_.timeout);
  CheckReturnCode(result);
  // Old engines print their version on stderr.
  std::string version = ParseVersion(result.out);
  if (version.empty()) {
    version = ParseVersion(result.err);
  }
  return version;
}

std::vector<std::string> TessPipeAPI::Languages(const std::string &config) const {
  std::vector<std::string> args{"--list-langs"};
  for (auto &arg : SplitWhitespace(config)) {
    args.push_back(std::move(arg));
  }
  return ParseLanguages(RunInfoCommand(args));
}

std::vector<Parameter> TessPipeAPI::TesseractParameters() const {
  return ParseParameters(RunInfoCommand({"--print-parameters"}));
}

double TessPipeAPI::Confidence(const ImageInput &image, const OcrOptions *options) const {
  OcrOptions opts = Resolve(options);
  opts.psm = PSM_OSD_ONLY;
  ValidateOptions(opts);
  auto argv = BuildCommandArgs(tesseract_cmd_, kStdinName, kStdoutName, opts, {});
  auto output = RunImageCommand(image, argv, opts.timeout, false);
  return ParseScriptConfidence(output.first);
}

double TessPipeAPI::Deskew(const ImageInput &image, const OcrOptions *options) const {
  OcrOptions opts = Resolve(options);
  opts.psm = PSM_AUTO_ONLY;
  ValidateOptions(opts);
  auto argv = BuildCommandArgs(tesseract_cmd_, kStdinName, kStdoutName, opts, {});
  auto output = RunImageCommand(image, argv, opts.timeout, false);
  // The angle is a diagnostic, normally written to stderr.
  if (output.second.find("Deskew angle") != std::string::npos) {
    return ParseDeskewAngle(output.second);
  }
  return ParseDeskewAngle(output.first);
}

std::string TessPipeAPI::ImageToString(const ImageInput &image, const OcrOptions *options) const {
  const OcrOptions &opts = Resolve(options);
  ValidateOptions(opts);
  auto argv = BuildCommandArgs(tesseract_cmd_, kStdinName, kStdoutName, opts,
                               {FileFormatConfigName(FILE_FORMAT_TXT)});
  return RunImageCommand(image, argv, opts.timeout, true).first;
}

std::string TessPipeAPI::ImageToHocr(const ImageInput &image, const OcrOptions *options) const {
  const OcrOptions &opts = Resolve(options);
  ValidateOptions(opts);
  auto argv = BuildCommandArgs(tesseract_cmd_, kStdinName, kStdoutName, opts,
                               {FileFormatConfigName(FILE_FORMAT_HOCR)});
  return RunImageCommand(image, argv, opts.timeout, true).first;
}

std::string TessPipeAPI::ImageToPdf(const ImageInput &image, const OcrOptions *options) const {
  const OcrOptions &opts = Resolve(options);
  ValidateOptions(opts);
  auto argv = BuildCommandArgs(tesseract_cmd_, kStdinName, kStdoutName, opts,
                               {FileFormatConfigName(FILE_FORMAT_PDF)});
  return RunImageCommand(image, argv, opts.timeout, true).first;
}

std::vector<Box> TessPipeAPI::ImageToBoxes(const ImageInput &image,
                                           const OcrOptions *options) const {
  const OcrOptions &opts = Resolve(options);
  ValidateOptions(opts);
  std::vector<std::string> argv{tesseract_cmd_, kStdinName, kStdoutName, "batch.nochop",
                                "makebox"};
  return ParseBoxes(RunImageCommand(image, argv, opts.timeout, true).first);
}

std::vector<Data> TessPipeAPI::ImageToData(const ImageInput &image,
                                           const OcrOptions *options) const {
  const OcrOptions &opts = Resolve(options);
  ValidateOptions(opts);
  std::vector<std::string> argv{tesseract_cmd_, kStdinName, kStdoutName, "-c",
                                "tessedit_create_tsv=1"};
  if (opts.dpi > 0) {
    argv.insert(argv.end(), {"--dpi", std::to_string(opts.dpi)});
  }
  return ParseData(RunImageCommand(image, argv, opts.timeout, true).first);
}

OSD TessPipeAPI::ImageToOsd(const ImageInput &image, const OcrOptions *options) const {
  OcrOptions opts = Resolve(options);
  opts.psm = PSM_OSD_ONLY;
  opts.lang.clear();
  opts.user_words.clear();
  opts.user_patterns.clear();
  ValidateOptions(opts);
  auto argv = BuildCommandArgs(tesseract_cmd_, kStdinName, kStdoutName, opts, {});
  return ParseOsd(RunImageCommand(image, argv, opts.timeout, true).first);
}

MultiOutput TessPipeAPI::Run(const ImageInput &image, const std::string &output_name,
                             const std::string &formats, const OcrOptions *options) const {
  const OcrOptions &opts = Resolve(options);
  ValidateOptions(opts);
  if (output_name.empty() || output_name.find('/') != std::string::npos) {
    throw std::invalid_argument("Invalid output name `" + output_name + "`");
  }
  std::vector<std::string> configs = SplitWhitespace(formats);
  if (configs.empty()) {
    throw std::invalid_argument("No output format given");
  }
  std::vector<const char *> extensions;
  for (const auto &config : configs) {
    FileFormat format;
    if (!ParseFileFormat(config, &format) || FileFormatExtension(format) == nullptr) {
      throw std::invalid_argument("Unsupported output format `" + config + "`");
    }
    extensions.push_back(FileFormatExtension(format));
  }
  std::string bytes = image.ReadBytes();

  MultiOutput output;
  output.dir_ = MakeTempDir();
  std::filesystem::path base = output.dir_ / output_name;
  auto argv = BuildCommandArgs(tesseract_cmd_, kStdinName, base.string(), opts, configs);
  CommandResult result = RunCommand(argv, bytes, opts.timeout);
  CheckReturnCode(result);
  for (const char *ext : extensions) {
    std::filesystem::path file = base;
    file += ".";
    file += ext;
    output.files_.push_back(std::move(file));
  }
  return output;
}

// An empty input is rejected on the calling thread, like the blocking calls do.
static void RequireInput(const ImageInput &image) {
  if (image.empty()) {
    throw UnsupportedInputError("Unsupported image input: neither a file path nor bytes");
  }
}

template <typename Result, typename Method>
std::future<Result> TessPipeAPI::Launch(Method method, const ImageInput &image,
                                        const OcrOptions *options) const {
  RequireInput(image);
  return std::async(std::launch::async,
                    [api = *this, image, opts = Resolve(options), method]() -> Result {
                      return (api.*method)(image, &opts);
                    });
}

std::future<double> TessPipeAPI::ConfidenceAsync(const ImageInput &image,
                                                 const OcrOptions *options) const {
  return Launch<double>(&TessPipeAPI::Confidence, image, options);
}

std::future<double> TessPipeAPI::DeskewAsync(const ImageInput &image,
                                             const OcrOptions *options) const {
  return Launch<double>(&TessPipeAPI::Deskew, image, options);
}

std::future<std::string> TessPipeAPI::ImageToStringAsync(const ImageInput &image,
                                                         const OcrOptions *options) const {
  return Launch<std::string>(&TessPipeAPI::ImageToString, image, options);
}

std::future<std::string> TessPipeAPI::ImageToHocrAsync(const ImageInput &image,
                                                       const OcrOptions *options) const {
  return Launch<std::string>(&TessPipeAPI::ImageToHocr, image, options);
}

std::future<std::string> TessPipeAPI::ImageToPdfAsync(const ImageInput &image,
                                                      const OcrOptions *options) const {
  return Launch<std::string>(&TessPipeAPI::ImageToPdf, image, options);
}

std::future<std::vector<Box>> TessPipeAPI::ImageToBoxesAsync(const ImageInput &image,
                                                             const OcrOptions *options) const {
  return Launch<std::vector<Box>>(&TessPipeAPI::ImageToBoxes, image, options);
}

std::future<std::vector<Data>> TessPipeAPI::ImageToDataAsync(const ImageInput &image,
                                                             const OcrOptions *options) const {
  return Launch<std::vector<Data>>(&TessPipeAPI::ImageToData, image, options);
}

std::future<OSD> TessPipeAPI::ImageToOsdAsync(const ImageInput &image,
                                              const OcrOptions *options) const {
  return Launch<OSD>(&TessPipeAPI::ImageToOsd, image, options);
}

std::future<MultiOutput> TessPipeAPI::RunAsync(const ImageInput &image,
                                               const std::string &output_name,
                                               const std::string &formats,
                                               const OcrOptions *options) const {
  RequireInput(image);
  return std::async(std::launch::async,
                    [api = *this, image, output_name, formats, opts = Resolve(options)]() {
                      return api.Run(image, output_name, formats, &opts);
                    });
}

} // namespace tesspipe
