// SPDX-License-Identifier: Apache-2.0
// File:        baseapi.h
// Description: Simple API for running the tesseract executable.
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

#ifndef TESSPIPE_API_BASEAPI_H_
#define TESSPIPE_API_BASEAPI_H_

#include "export.h"
#include "imageinput.h"
#include "ocroptions.h"
#include "publictypes.h"
#include "results.h"

#include <filesystem>
#include <future>
#include <string>
#include <utility> // for std::pair
#include <vector>

namespace tesspipe {

/**
 * The files written by one multi-output run, together with the temporary
 * directory that holds them. The directory and everything in it is
 * removed when the MultiOutput is destroyed.
 */
class TESSPIPE_API MultiOutput {
public:
  MultiOutput() = default;
  ~MultiOutput();

  MultiOutput(MultiOutput &&other) noexcept;
  MultiOutput &operator=(MultiOutput &&other) noexcept;
  MultiOutput(const MultiOutput &) = delete;
  MultiOutput &operator=(const MultiOutput &) = delete;

  const std::filesystem::path &directory() const {
    return dir_;
  }
  // One `<directory>/<name>.<ext>` per requested format, in request order.
  const std::vector<std::filesystem::path> &files() const {
    return files_;
  }

  // Contents of files()[index]. Throws std::out_of_range for a bad index
  // and std::runtime_error when the engine did not write that file.
  std::string ReadFile(size_t index) const;

private:
  friend class TessPipeAPI;

  void Remove();

  std::filesystem::path dir_;
  std::vector<std::filesystem::path> files_;
};

/**
 * Runs one engine process per call. The image travels through the
 * engine's stdin; results are read back from its stdout (and stderr for
 * Deskew()).
 *
 * Every image operation validates its options and resolves its input
 * before spawning, so bad arguments never start a process. The
 * `options` argument may be nullptr, in which case the options given to
 * SetDefaultOptions() (initially OcrOptions()) apply.
 *
 * The *Async() variants run the same call on their own thread and
 * report results and exceptions through the returned future. They copy
 * the API object, the image and the options, so none of these needs to
 * outlive the call.
 */
class TESSPIPE_API TessPipeAPI {
public:
  // Uses the `tesseract_cmd` parameter as the engine command.
  TessPipeAPI();
  explicit TessPipeAPI(std::string tesseract_cmd);
  ~TessPipeAPI();

  /**
   * Returns the version identifier of this library as a static string.
   */
  static const char *Version();

  void SetTesseractCmd(const std::string &cmd) {
    tesseract_cmd_ = cmd;
  }
  const std::string &GetTesseractCmd() const {
    return tesseract_cmd_;
  }

  void SetDefaultOptions(const OcrOptions &options) {
    options_ = options;
  }
  const OcrOptions &GetDefaultOptions() const {
    return options_;
  }

  /**
   * Engine information. These use only the timeout of the default options.
   * @{
   */
  // Version reported by `--version`, e.g. "5.3.0".
  std::string TesseractVersion() const;
  // Installed language codes (`--list-langs`). `config` is passed through
  // as extra whitespace-separated arguments.
  std::vector<std::string> Languages(const std::string &config = std::string()) const;
  // All engine parameters (`--print-parameters`).
  std::vector<Parameter> TesseractParameters() const;
  /** @} */

  // Script confidence from an OSD pass (psm 0). 0.0 when the engine does
  // not report one; the engine's return code is ignored.
  double Confidence(const ImageInput &image, const OcrOptions *options = nullptr) const;

  // Deskew angle from a layout-only pass (psm 2). 0.0 when the engine
  // does not report one; the engine's return code is ignored.
  double Deskew(const ImageInput &image, const OcrOptions *options = nullptr) const;

  std::string ImageToString(const ImageInput &image, const OcrOptions *options = nullptr) const;
  std::string ImageToHocr(const ImageInput &image, const OcrOptions *options = nullptr) const;
  // Raw PDF bytes.
  std::string ImageToPdf(const ImageInput &image, const OcrOptions *options = nullptr) const;

  // Character boxes (`batch.nochop makebox`). Only the timeout is used.
  std::vector<Box> ImageToBoxes(const ImageInput &image, const OcrOptions *options = nullptr) const;

  // TSV rows. Only dpi and timeout are used.
  std::vector<Data> ImageToData(const ImageInput &image, const OcrOptions *options = nullptr) const;

  // Orientation and script detection. Only dpi, oem and timeout are used.
  OSD ImageToOsd(const ImageInput &image, const OcrOptions *options = nullptr) const;

  /**
   * One engine execution writing several outputs. `formats` is a
   * whitespace-separated list of txt, hocr, pdf, tsv and alto; each
   * produces `<name>.<ext>` in a fresh temporary directory owned by the
   * returned MultiOutput.
   * Throws std::invalid_argument for an empty or unknown format list or a
   * name containing '/'.
   */
  MultiOutput Run(const ImageInput &image, const std::string &output_name,
                  const std::string &formats, const OcrOptions *options = nullptr) const;

  std::future<double> ConfidenceAsync(const ImageInput &image,
                                      const OcrOptions *options = nullptr) const;
  std::future<double> DeskewAsync(const ImageInput &image,
                                  const OcrOptions *options = nullptr) const;
  std::future<std::string> ImageToStringAsync(const ImageInput &image,
                                              const OcrOptions *options = nullptr) const;
  std::future<std::string> ImageToHocrAsync(const ImageInput &image,
                                            const OcrOptions *options = nullptr) const;
  std::future<std::string> ImageToPdfAsync(const ImageInput &image,
                                           const OcrOptions *options = nullptr) const;
  std::future<std::vector<Box>> ImageToBoxesAsync(const ImageInput &image,
                                                  const OcrOptions *options = nullptr) const;
  std::future<std::vector<Data>> ImageToDataAsync(const ImageInput &image,
                                                  const OcrOptions *options = nullptr) const;
  std::future<OSD> ImageToOsdAsync(const ImageInput &image,
                                   const OcrOptions *options = nullptr) const;
  std::future<MultiOutput> RunAsync(const ImageInput &image, const std::string &output_name,
                                    const std::string &formats,
                                    const OcrOptions *options = nullptr) const;

private:
  const OcrOptions &Resolve(const OcrOptions *options) const {
    return options != nullptr ? *options : options_;
  }

  // Output of an information command (no image).
  std::string RunInfoCommand(const std::vector<std::string> &extra_args) const;

  // Runs `stdin stdout` + args with the image on stdin and, if `check` is
  // set, raises TesseractRuntimeError on a nonzero exit. Returns
  // {stdout, stderr}.
  std::pair<std::string, std::string> RunImageCommand(const ImageInput &image,
                                                      const std::vector<std::string> &argv,
                                                      double timeout, bool check) const;

  // The same call on a copy of this object, on its own thread.
  template <typename Result, typename Method>
  std::future<Result> Launch(Method method, const ImageInput &image,
                             const OcrOptions *options) const;

  std::string tesseract_cmd_;
  OcrOptions options_;
};

} // namespace tesspipe

#endif // TESSPIPE_API_BASEAPI_H_
