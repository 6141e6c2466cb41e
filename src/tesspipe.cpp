/**********************************************************************
 * File:        tesspipe.cpp
 * Description: Command line front end for the tesspipe library.
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

#include <algorithm> // for std::transform
#include <cctype>    // for std::toupper
#include <cstdio>    // for fread, fwrite
#include <cstring>   // for strcmp
#include <filesystem>
#include <iterator>  // for std::begin, std::end
#include <map>       // for std::map
#include <string>
#include <utility>   // for std::pair
#include <vector>

#include <tesspipe/baseapi.h>
#include <tesspipe/errors.h>
#include <tesspipe/fmt-support.h>
#include <tesspipe/params.h>
#include <tesspipe/tprintf.h>

#include "global_params.h"
#include "strutils.h"

using namespace tesspipe;

enum ExitCode {
  EXIT_OK = 0,
  EXIT_USAGE = 1,
  EXIT_ENGINE = 2,
};

// Everything ParseArgs() collects. Options that were not given stay at
// their "unset" value so that configuration files and -c settings can
// supply defaults first.
struct CommandLine {
  const char *command = nullptr;
  std::vector<const char *> positional;

  const char *lang = nullptr;
  const char *dpi = nullptr;
  const char *psm = nullptr;
  const char *oem = nullptr;
  const char *timeout = nullptr;
  const char *user_words = nullptr;
  const char *user_patterns = nullptr;
  const char *tessdata_dir = nullptr;
  const char *tesseract_cmd = nullptr;
  const char *loglevel = nullptr;
  const char *output_name = "out";
  const char *formats = "txt";

  std::vector<const char *> config_files;
  std::vector<std::pair<std::string, std::string>> vars;
};

static const char *Basename(const char *path) {
  const char *slash = strrchr(path, '/');
  return slash != nullptr ? slash + 1 : path;
}

static void PrintHelpForPSM() {
  const char *msg =
      "Page segmentation modes:\n"
      "  0    Orientation and script detection (OSD) only.\n"
      "  1    Automatic page segmentation with OSD.\n"
      "  2    Automatic page segmentation, but no OSD, nor OCR.\n"
      "  3    Fully automatic page segmentation, but no OSD. (Default)\n"
      "  4    Assume a single column of text of variable sizes.\n"
      "  5    Assume a single uniform block of vertically aligned text.\n"
      "  6    Assume a single uniform block of text.\n"
      "  7    Treat the image as a single text line.\n"
      "  8    Treat the image as a single word.\n"
      "  9    Treat the image as a single word in a circle.\n"
      " 10    Treat the image as a single character.\n"
      " 11    Sparse text. Find as much text as possible in no particular order.\n"
      " 12    Sparse text with OSD.\n"
      " 13    Raw line. Treat the image as a single text line,\n"
      "       bypassing hacks that are Tesseract-specific.\n";
  fmt::print("{}", msg);
}

static void PrintHelpForOEM() {
  const char *msg =
      "OCR Engine modes:\n"
      "  0    Legacy engine only.\n"
      "  1    Neural nets LSTM engine only.\n"
      "  2    Legacy + LSTM engines.\n"
      "  3    Default, based on what is available.\n";
  fmt::print("{}", msg);
}

static void PrintHelpMessage(const char *program) {
  program = Basename(program);
  fmt::print(
      "Usage:\n"
      "  {0} help [psm|oem]\n"
      "  {0} version | langs [<config>...] | parameters\n"
      "  {0} text|hocr|pdf|boxes|data|osd|confidence|deskew [options...] <image>|-\n"
      "  {0} run [options...] [--output NAME] [--formats \"txt pdf ...\"] <image>|-\n"
      "\n"
      "An image of `-` or `stdin` is read from standard input.\n"
      "\n"
      "OCR options:\n"
      "  -l LANG[+LANG]        Specify language(s) used for OCR.\n"
      "  --dpi VALUE           Specify DPI for input image.\n"
      "  --psm NUM             Specify page segmentation mode.\n"
      "  --oem NUM             Specify OCR Engine mode.\n"
      "  --timeout SECONDS     Kill the engine after this many seconds.\n"
      "  --user-words PATH     Specify the location of user words file.\n"
      "  --user-patterns PATH  Specify the location of user patterns file.\n"
      "  --tessdata-dir PATH   Specify the location of tessdata path.\n"
      "\n"
      "Single options:\n"
      "  --tesseract-cmd PATH  Engine executable (default: $TESSERACT_CMD or tesseract).\n"
      "  --loglevel LEVEL      ALL, TRACE, DEBUG, INFO, WARN, ERROR, FATAL or OFF.\n"
      "  --config FILE         Read `name value` parameter lines from FILE.\n"
      "  -c VAR=VALUE          Set value for config variables.\n"
      "                        Multiple -c arguments are allowed.\n"
      "  --output NAME         Base name of the files written by `run`.\n"
      "  --formats LIST        Outputs written by `run` (txt hocr pdf tsv alto).\n"
      "\n"
      "Exit status: 0 on success, 1 on a usage error, 2 when the engine fails.\n",
      program);
}

static bool ParseIntArg(const char *value, const char *what, int *result) {
  if (!SafeAtoi(value, result)) {
    tprintError("Invalid {} value `{}`, expected an integer\n", what, value);
    return false;
  }
  return true;
}

static bool ParseDoubleArg(const char *value, const char *what, double *result) {
  if (!SafeAtod(value, result)) {
    tprintError("Invalid {} value `{}`, expected a number\n", what, value);
    return false;
  }
  return true;
}

static bool SetLogLevel(const char *name) {
  std::string loglevel_string = name;
  std::transform(loglevel_string.cbegin(), loglevel_string.cend(), loglevel_string.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  static const std::map<const std::string, int> loglevels{
      {"ALL", T_LOG_TRACE},  {"TRACE", T_LOG_TRACE}, {"DEBUG", T_LOG_DEBUG},
      {"INFO", T_LOG_INFO},  {"WARN", T_LOG_WARN},   {"ERROR", T_LOG_ERROR},
      {"FATAL", T_LOG_ERROR}, {"OFF", -1},
  };
  auto it = loglevels.find(loglevel_string);
  if (it == loglevels.end()) {
    tprintError("Unsupported --loglevel {}\n", name);
    return false;
  }
  log_level = it->second;
  return true;
}

// NOTE: the command is the first argument; options and the image may
// follow in any order.
static bool ParseArgs(int argc, const char **argv, CommandLine *cl) {
  if (argc < 2) {
    PrintHelpMessage(argv[0]);
    return false;
  }
  cl->command = argv[1];
  if (strcmp(cl->command, "-h") == 0 || strcmp(cl->command, "--help") == 0) {
    cl->command = "help";
  } else if (strcmp(cl->command, "-v") == 0 || strcmp(cl->command, "--version") == 0) {
    cl->command = "version";
  }
  for (int i = 2; i < argc; i++) {
    const char *arg = argv[i];
    bool has_value = i + 1 < argc;
    if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
      cl->command = "help";
    } else if (strcmp(arg, "-l") == 0 && has_value) {
      cl->lang = argv[++i];
    } else if (strcmp(arg, "--dpi") == 0 && has_value) {
      cl->dpi = argv[++i];
    } else if (strcmp(arg, "--psm") == 0 && has_value) {
      cl->psm = argv[++i];
    } else if (strcmp(arg, "--oem") == 0 && has_value) {
      cl->oem = argv[++i];
    } else if (strcmp(arg, "--timeout") == 0 && has_value) {
      cl->timeout = argv[++i];
    } else if (strcmp(arg, "--user-words") == 0 && has_value) {
      cl->user_words = argv[++i];
    } else if (strcmp(arg, "--user-patterns") == 0 && has_value) {
      cl->user_patterns = argv[++i];
    } else if (strcmp(arg, "--tessdata-dir") == 0 && has_value) {
      cl->tessdata_dir = argv[++i];
    } else if (strcmp(arg, "--tesseract-cmd") == 0 && has_value) {
      cl->tesseract_cmd = argv[++i];
    } else if (strcmp(arg, "--loglevel") == 0 && has_value) {
      cl->loglevel = argv[++i];
    } else if (strcmp(arg, "--config") == 0 && has_value) {
      cl->config_files.push_back(argv[++i]);
    } else if (strcmp(arg, "--output") == 0 && has_value) {
      cl->output_name = argv[++i];
    } else if (strcmp(arg, "--formats") == 0 && has_value) {
      cl->formats = argv[++i];
    } else if (strcmp(arg, "-c") == 0 && has_value) {
      const char *assignment = argv[++i];
      const char *p = strchr(assignment, '=');
      if (p == nullptr) {
        tprintError("Missing '=' in configvar assignment for '{}'\n", assignment);
        return false;
      }
      cl->vars.emplace_back(std::string(assignment, p - assignment), std::string(p + 1));
    } else if (arg[0] == '-' && arg[1] != '\0') {
      tprintError("Unknown command line argument '{}'\n", arg);
      return false;
    } else {
      cl->positional.push_back(arg);
    }
  }
  return true;
}

// Applies configuration files, -c settings and --loglevel to the global
// parameters, then builds the per-call options.
static bool ApplySettings(const CommandLine &cl, OcrOptions *options) {
  for (const char *file : cl.config_files) {
    if (!ParamUtils::ReadParamsFile(file, nullptr)) {
      return false;
    }
  }
  for (const auto &var : cl.vars) {
    if (!ParamUtils::SetParam(var.first.c_str(), var.second.c_str(), nullptr)) {
      tprintError("Could not set the (obviously unknown) option `{}={}`\n", var.first,
                  var.second);
      return false;
    }
  }
  if (cl.loglevel != nullptr && !SetLogLevel(cl.loglevel)) {
    return false;
  }
  if (cl.tesseract_cmd != nullptr) {
    tesseract_cmd = std::string(cl.tesseract_cmd);
  }

  *options = OcrOptions();
  if (cl.lang != nullptr) {
    options->lang = cl.lang;
  }
  if (cl.dpi != nullptr && !ParseIntArg(cl.dpi, "DPI", &options->dpi)) {
    return false;
  }
  if (cl.psm != nullptr && !ParseIntArg(cl.psm, "PSM", &options->psm)) {
    return false;
  }
  if (cl.oem != nullptr && !ParseIntArg(cl.oem, "OEM", &options->oem)) {
    return false;
  }
  if (cl.timeout != nullptr && !ParseDoubleArg(cl.timeout, "timeout", &options->timeout)) {
    return false;
  }
  if (cl.user_words != nullptr) {
    options->user_words = cl.user_words;
  }
  if (cl.user_patterns != nullptr) {
    options->user_patterns = cl.user_patterns;
  }
  if (cl.tessdata_dir != nullptr) {
    options->tessdata_dir = cl.tessdata_dir;
  }
  return true;
}

static std::string ReadStdin() {
  std::string data;
  char buf[65536];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), stdin)) > 0) {
    data.append(buf, n);
  }
  return data;
}

static bool GetImage(const CommandLine &cl, ImageInput *image) {
  if (cl.positional.size() != 1) {
    tprintError("Command `{}` needs exactly one image argument\n", cl.command);
    return false;
  }
  const char *name = cl.positional[0];
  if (strcmp(name, "-") == 0 || strcmp(name, "stdin") == 0) {
    *image = ImageInput::FromBytes(ReadStdin());
  } else {
    *image = ImageInput::FromFile(name);
  }
  return true;
}

template <typename T>
static void PrintRecords(const std::vector<T> &records) {
  for (const auto &record : records) {
    fmt::print("{}\n", record);
  }
}

static void WriteRaw(const std::string &data) {
  fwrite(data.data(), 1, data.size(), stdout);
}

// Copies the files of a multi-output run into the current directory
// before the temporary directory goes away.
static void KeepRunOutputs(const MultiOutput &output) {
  for (const auto &file : output.files()) {
    if (!std::filesystem::exists(file)) {
      tprintWarn("The engine did not write {}\n", file.filename().string());
      continue;
    }
    auto target = std::filesystem::current_path() / file.filename();
    std::filesystem::copy_file(file, target, std::filesystem::copy_options::overwrite_existing);
    fmt::print("{}\n", target.string());
  }
}

static int RunCommandLine(const char *program, const CommandLine &cl, const OcrOptions &options) {
  TessPipeAPI api;
  api.SetDefaultOptions(options);
  const std::string command = cl.command;

  if (command == "help") {
    if (!cl.positional.empty() && strcmp(cl.positional[0], "psm") == 0) {
      PrintHelpForPSM();
    } else if (!cl.positional.empty() && strcmp(cl.positional[0], "oem") == 0) {
      PrintHelpForOEM();
    } else {
      PrintHelpMessage(program);
    }
    return EXIT_OK;
  }
  if (command == "version") {
    fmt::print("tesspipe {}\n", TessPipeAPI::Version());
    fmt::print("tesseract {}\n", api.TesseractVersion());
    return EXIT_OK;
  }
  if (command == "langs") {
    std::string config;
    for (const char *arg : cl.positional) {
      config += arg;
      config += ' ';
    }
    for (const auto &lang : api.Languages(config)) {
      fmt::print("{}\n", lang);
    }
    return EXIT_OK;
  }
  if (command == "parameters") {
    PrintRecords(api.TesseractParameters());
    return EXIT_OK;
  }

  static const char *kImageCommands[] = {"text", "hocr",       "pdf",    "boxes", "data",
                                         "osd",  "confidence", "deskew", "run"};
  if (std::find_if(std::begin(kImageCommands), std::end(kImageCommands), [&](const char *c) {
        return command == c;
      }) == std::end(kImageCommands)) {
    tprintError("Unknown action: {}\n", command);
    PrintHelpMessage(program);
    return EXIT_USAGE;
  }

  ImageInput image;
  if (!GetImage(cl, &image)) {
    return EXIT_USAGE;
  }
  if (command == "text") {
    WriteRaw(api.ImageToString(image));
  } else if (command == "hocr") {
    WriteRaw(api.ImageToHocr(image));
  } else if (command == "pdf") {
    WriteRaw(api.ImageToPdf(image));
  } else if (command == "boxes") {
    PrintRecords(api.ImageToBoxes(image));
  } else if (command == "data") {
    PrintRecords(api.ImageToData(image));
  } else if (command == "osd") {
    fmt::print("{}\n", api.ImageToOsd(image));
  } else if (command == "confidence") {
    fmt::print("{}\n", api.Confidence(image));
  } else if (command == "deskew") {
    fmt::print("{}\n", api.Deskew(image));
  } else {
    MultiOutput output = api.Run(image, cl.output_name, cl.formats);
    KeepRunOutputs(output);
  }
  return EXIT_OK;
}

/**********************************************************************
 *  main()
 *
 **********************************************************************/

int main(int argc, char **argv) {
  const char **args = const_cast<const char **>(argv);

  CommandLine cl;
  if (!ParseArgs(argc, args, &cl)) {
    return EXIT_USAGE;
  }

  OcrOptions options;
  if (!ApplySettings(cl, &options)) {
    return EXIT_USAGE;
  }

  try {
    int ret_val = RunCommandLine(args[0], cl, options);
    fflush(stdout);
    return ret_val;
  } catch (const std::invalid_argument &e) {
    tprintError("{}\n", e.what());
    return EXIT_USAGE;
  } catch (const ImageNotFoundError &e) {
    tprintError("{}\n", e.what());
    return EXIT_USAGE;
  } catch (const TesseractRuntimeError &e) {
    tprintError("Tesseract failed with return code {}:\n{}\n", e.return_code(), e.what());
    return EXIT_ENGINE;
  } catch (const TesseractError &e) {
    tprintError("{}\n", e.what());
    return EXIT_ENGINE;
  } catch (const std::exception &e) {
    tprintError("{}\n", e.what());
    return EXIT_ENGINE;
  }
}
