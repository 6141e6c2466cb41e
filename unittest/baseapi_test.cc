///////////////////////////////////////////////////////////////////////
// File:        baseapi_test.cc
// Description: Tests for TessPipeAPI, run against shell scripts that
//              stand in for the engine.
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

#include <tesspipe/baseapi.h>
#include <tesspipe/errors.h>
#include <tesspipe/version.h>

#include "global_params.h"
#include "include_gunit.h"
#include "outputparsers.h"

#include <algorithm>
#include <filesystem>
#include <future>
#include <string>
#include <vector>

namespace tesspipe {

using testing::ElementsAre;
using testing::HasSubstr;

class TessPipeAPITest : public testing::Test {
protected:
  void SetUp() override {
    tmpdir_ = file::MakeTmpdir();
    args_file_ = file::JoinPath(tmpdir_, "args.txt");
    stdin_file_ = file::JoinPath(tmpdir_, "stdin.bin");
  }
  void TearDown() override {
    file::RemoveTmpdir(tmpdir_);
  }

  // An engine that records its arguments and stdin, then runs `body`.
  std::string RecordingEngine(const std::string &body) {
    return file::WriteFakeEngine(tmpdir_, "tesseract",
                                 "printf '%s\\n' \"$@\" > '" + args_file_ + "'\n" +
                                     "cat > '" + stdin_file_ + "'\n" + body);
  }

  // Arguments of the last engine run, without the program name.
  std::vector<std::string> RecordedArgs() {
    std::string text;
    EXPECT_TRUE(file::GetContents(args_file_, &text));
    return SplitLines(text);
  }

  std::string RecordedStdin() {
    std::string text;
    EXPECT_TRUE(file::GetContents(stdin_file_, &text));
    return text;
  }

  bool EngineRan() const {
    return std::filesystem::exists(args_file_);
  }

  std::string tmpdir_;
  std::string args_file_;
  std::string stdin_file_;
};

TEST_F(TessPipeAPITest, VersionString) {
  EXPECT_STREQ(TESSPIPE_VERSION_STR, TessPipeAPI::Version());
  EXPECT_NE('\0', TessPipeAPI::Version()[0]);
}

TEST_F(TessPipeAPITest, DefaultCommandComesFromParams) {
  TessPipeAPI api;
  EXPECT_EQ(tesseract_cmd.value(), api.GetTesseractCmd());
  api.SetTesseractCmd("/opt/bin/tesseract");
  EXPECT_EQ("/opt/bin/tesseract", api.GetTesseractCmd());
}

TEST_F(TessPipeAPITest, ImageToString) {
  TessPipeAPI api(RecordingEngine("printf 'Hello world\\n\\f'\n"));
  EXPECT_EQ("Hello world\n\f", api.ImageToString(ImageInput::FromBytes(std::string("IMG\0DATA", 8))));
  EXPECT_THAT(RecordedArgs(), ElementsAre("stdin", "stdout", "-l", "eng", "--dpi", "300", "--psm",
                                          "3", "--oem", "3", "txt"));
  EXPECT_EQ(std::string("IMG\0DATA", 8), RecordedStdin());
}

TEST_F(TessPipeAPITest, ImageFromFileIsSentOnStdin) {
  std::string image = file::JoinPath(tmpdir_, "page.png");
  ASSERT_TRUE(file::WriteStringToFile("file bytes", image));
  TessPipeAPI api(RecordingEngine("echo ok\n"));
  EXPECT_EQ("ok\n", api.ImageToString(ImageInput::FromFile(image)));
  EXPECT_EQ("file bytes", RecordedStdin());
}

TEST_F(TessPipeAPITest, PerCallOptionsOverrideDefaults) {
  TessPipeAPI api(RecordingEngine("echo '<html/>'\n"));
  OcrOptions defaults;
  defaults.lang = "por";
  api.SetDefaultOptions(defaults);

  EXPECT_EQ("<html/>\n", api.ImageToHocr(ImageInput::FromBytes("x")));
  EXPECT_THAT(RecordedArgs(), ElementsAre("stdin", "stdout", "-l", "por", "--dpi", "300", "--psm",
                                          "3", "--oem", "3", "hocr"));

  OcrOptions options;
  options.lang = "eng+fra";
  options.psm = 6;
  options.tessdata_dir = "/data";
  EXPECT_EQ("<html/>\n", api.ImageToHocr(ImageInput::FromBytes("x"), &options));
  EXPECT_THAT(RecordedArgs(),
              ElementsAre("stdin", "stdout", "--tessdata-dir", "/data", "-l", "eng+fra", "--dpi",
                          "300", "--psm", "6", "--oem", "3", "hocr"));
}

TEST_F(TessPipeAPITest, ImageToPdfReturnsRawBytes) {
  TessPipeAPI api(RecordingEngine("printf '%%PDF-1.5\\n\\001\\002'\n"));
  EXPECT_EQ("%PDF-1.5\n\x01\x02", api.ImageToPdf(ImageInput::FromBytes("x")));
  EXPECT_EQ("pdf", RecordedArgs().back());
}

TEST_F(TessPipeAPITest, EngineFailure) {
  TessPipeAPI api(RecordingEngine("echo 'Error in pixReadMem: Unknown format' >&2\nexit 1\n"));
  try {
    api.ImageToString(ImageInput::FromBytes("not an image"));
    FAIL() << "expected TesseractRuntimeError";
  } catch (const TesseractRuntimeError &e) {
    EXPECT_THAT(e.what(), HasSubstr("Error in pixReadMem"));
    EXPECT_EQ(1, e.return_code());
  }
}

TEST_F(TessPipeAPITest, ImageToBoxes) {
  TessPipeAPI api(RecordingEngine("printf 'H 10 20 30 40 0\\ni 31 20 35 40 0\\n'\n"));
  auto boxes = api.ImageToBoxes(ImageInput::FromBytes("x"));
  EXPECT_THAT(boxes, ElementsAre(Box{"H", 10, 20, 30, 40, 0}, Box{"i", 31, 20, 35, 40, 0}));
  EXPECT_THAT(RecordedArgs(), ElementsAre("stdin", "stdout", "batch.nochop", "makebox"));
}

TEST_F(TessPipeAPITest, ImageToData) {
  TessPipeAPI api(RecordingEngine(
      "printf 'level\\tpage_num\\tblock_num\\tpar_num\\tline_num\\tword_num\\tleft\\ttop\\twidth\\t"
      "height\\tconf\\ttext\\n'\n"
      "printf '5\\t1\\t1\\t1\\t1\\t1\\t36\\t92\\t60\\t24\\t96.5\\tThe\\n'\n"));
  auto rows = api.ImageToData(ImageInput::FromBytes("x"));
  ASSERT_EQ(1u, rows.size());
  EXPECT_EQ("The", rows[0].text);
  EXPECT_FLOAT_EQ(96.5f, rows[0].conf);
  EXPECT_THAT(RecordedArgs(),
              ElementsAre("stdin", "stdout", "-c", "tessedit_create_tsv=1", "--dpi", "300"));

  OcrOptions options;
  options.dpi = 0;
  api.ImageToData(ImageInput::FromBytes("x"), &options);
  EXPECT_THAT(RecordedArgs(), ElementsAre("stdin", "stdout", "-c", "tessedit_create_tsv=1"));
}

TEST_F(TessPipeAPITest, ImageToOsd) {
  TessPipeAPI api(RecordingEngine("printf 'Page number: 0\\nOrientation in degrees: 90\\n"
                                  "Rotate: 270\\nOrientation confidence: 2.5\\n"
                                  "Script: Latin\\nScript confidence: 1.75\\n'\n"));
  OcrOptions options;
  options.user_words = "/words.txt";
  OSD osd = api.ImageToOsd(ImageInput::FromBytes("x"), &options);
  EXPECT_EQ(90, osd.orientation_in_degrees);
  EXPECT_EQ(270, osd.rotate);
  EXPECT_FLOAT_EQ(2.5f, osd.orientation_confidence);
  EXPECT_EQ("Latin", osd.script);
  EXPECT_FLOAT_EQ(1.75f, osd.script_confidence);
  // No language or word lists, and always psm 0.
  EXPECT_THAT(RecordedArgs(),
              ElementsAre("stdin", "stdout", "--dpi", "300", "--psm", "0", "--oem", "3"));
}

TEST_F(TessPipeAPITest, ConfidenceIgnoresReturnCode) {
  TessPipeAPI api(RecordingEngine("echo 'Script confidence: 4.14'\nexit 1\n"));
  EXPECT_DOUBLE_EQ(4.14, api.Confidence(ImageInput::FromBytes("x")));
  EXPECT_THAT(RecordedArgs(), testing::Contains("--psm"));
  auto args = RecordedArgs();
  auto psm = std::find(args.begin(), args.end(), "--psm");
  ASSERT_NE(args.end(), psm);
  EXPECT_EQ("0", *(psm + 1));
}

TEST_F(TessPipeAPITest, ConfidenceDefaultsToZero) {
  TessPipeAPI api(RecordingEngine("echo 'Too few characters. Skipping this page' >&2\nexit 1\n"));
  EXPECT_DOUBLE_EQ(0.0, api.Confidence(ImageInput::FromBytes("x")));
}

TEST_F(TessPipeAPITest, DeskewReadsDiagnostics) {
  TessPipeAPI api(RecordingEngine("echo 'Deskew angle: -0.2500' >&2\n"));
  EXPECT_DOUBLE_EQ(-0.25, api.Deskew(ImageInput::FromBytes("x")));
  auto args = RecordedArgs();
  auto psm = std::find(args.begin(), args.end(), "--psm");
  ASSERT_NE(args.end(), psm);
  EXPECT_EQ("2", *(psm + 1));

  TessPipeAPI on_stdout(RecordingEngine("echo 'Deskew angle: 1.5'\nexit 2\n"));
  EXPECT_DOUBLE_EQ(1.5, on_stdout.Deskew(ImageInput::FromBytes("x")));
}

TEST_F(TessPipeAPITest, Timeout) {
  TessPipeAPI api(file::WriteFakeEngine(tmpdir_, "slow", "exec sleep 10\n"));
  OcrOptions options;
  options.timeout = 0.2;
  EXPECT_THROW(api.ImageToString(ImageInput::FromBytes("x"), &options), ProcessTimeoutError);
}

TEST_F(TessPipeAPITest, ConfidenceAndDeskewStillTimeOut) {
  // Both ignore the return code, but never a timeout.
  TessPipeAPI api(file::WriteFakeEngine(tmpdir_, "slow", "exec sleep 10\n"));
  OcrOptions options;
  options.timeout = 0.2;
  EXPECT_THROW(api.Confidence(ImageInput::FromBytes("x"), &options), ProcessTimeoutError);
  EXPECT_THROW(api.Deskew(ImageInput::FromBytes("x"), &options), ProcessTimeoutError);
  EXPECT_THROW(api.ConfidenceAsync(ImageInput::FromBytes("x"), &options).get(),
               ProcessTimeoutError);
}

TEST_F(TessPipeAPITest, ConcurrentCallsAreIndependent) {
  // Each engine echoes its own stdin after a short delay, so all of them
  // are running at the same time.
  TessPipeAPI api(file::WriteFakeEngine(tmpdir_, "echo-engine", "sleep 0.3\nexec cat\n"));
  const int kCalls = 8;
  std::vector<std::future<std::string>> texts;
  std::vector<std::future<std::vector<Box>>> boxes;
  for (int i = 0; i < kCalls; ++i) {
    texts.push_back(api.ImageToStringAsync(ImageInput::FromBytes("page " + std::to_string(i))));
    boxes.push_back(api.ImageToBoxesAsync(
        ImageInput::FromBytes("c " + std::to_string(i) + " 0 1 1 0\n")));
  }
  for (int i = 0; i < kCalls; ++i) {
    EXPECT_EQ("page " + std::to_string(i), texts[i].get());
    auto result = boxes[i].get();
    ASSERT_EQ(1u, result.size());
    EXPECT_EQ(i, result[0].left);
  }
}

TEST_F(TessPipeAPITest, BadArgumentsNeverSpawn) {
  TessPipeAPI api(RecordingEngine("echo ok\n"));

  EXPECT_THROW(api.ImageToString(ImageInput()), UnsupportedInputError);
  EXPECT_THROW(api.ImageToString(ImageInput::FromFile(file::JoinPath(tmpdir_, "missing.png"))),
               ImageNotFoundError);

  OcrOptions options;
  options.psm = 14;
  EXPECT_THROW(api.ImageToString(ImageInput::FromBytes("x"), &options), InvalidPsmError);
  options = OcrOptions();
  options.oem = 7;
  EXPECT_THROW(api.ImageToHocr(ImageInput::FromBytes("x"), &options), InvalidOemError);
  options = OcrOptions();
  options.lang = "xx";
  EXPECT_THROW(api.ImageToPdf(ImageInput::FromBytes("x"), &options), InvalidLanguageError);

  EXPECT_FALSE(EngineRan());
}

TEST_F(TessPipeAPITest, EngineNotFound) {
  TessPipeAPI api(file::JoinPath(tmpdir_, "no-such-engine"));
  EXPECT_THROW(api.TesseractVersion(), EngineNotFoundError);
  EXPECT_THROW(api.ImageToString(ImageInput::FromBytes("x")), EngineNotFoundError);
}

TEST_F(TessPipeAPITest, TesseractVersion) {
  TessPipeAPI api(RecordingEngine("echo 'tesseract 5.3.0'\necho ' leptonica-1.82.0'\n"));
  EXPECT_EQ("5.3.0", api.TesseractVersion());
  EXPECT_THAT(RecordedArgs(), ElementsAre("--version"));

  TessPipeAPI old(RecordingEngine("echo 'tesseract 3.05.01' >&2\n"));
  EXPECT_EQ("3.05.01", old.TesseractVersion());
}

TEST_F(TessPipeAPITest, Languages) {
  TessPipeAPI api(RecordingEngine(
      "echo 'List of available languages in \"/usr/share/tessdata/\" (3):'\n"
      "echo eng\necho osd\necho por\n"));
  EXPECT_THAT(api.Languages(), ElementsAre("eng", "osd", "por"));
  EXPECT_THAT(RecordedArgs(), ElementsAre("--list-langs"));

  api.Languages("--tessdata-dir  /data");
  EXPECT_THAT(RecordedArgs(), ElementsAre("--list-langs", "--tessdata-dir", "/data"));
}

TEST_F(TessPipeAPITest, InformationCommandsCheckReturnCode) {
  TessPipeAPI api(RecordingEngine("echo 'read_params_file: Cannot open x' >&2\nexit 1\n"));
  EXPECT_THROW(api.Languages(), TesseractRuntimeError);
  EXPECT_THROW(api.TesseractParameters(), TesseractRuntimeError);
  EXPECT_THROW(api.TesseractVersion(), TesseractRuntimeError);
}

TEST_F(TessPipeAPITest, TesseractParameters) {
  TessPipeAPI api(RecordingEngine(
      "printf 'Tesseract parameters:\\nlog_level\\t2147483647\\tLogging level\\n"
      "page_separator\\t\\tPage separator\\n'\n"));
  auto params = api.TesseractParameters();
  EXPECT_THAT(params, ElementsAre(Parameter{"log_level", "2147483647", "Logging level"},
                                  Parameter{"page_separator", "", "Page separator"}));
  EXPECT_THAT(RecordedArgs(), ElementsAre("--print-parameters"));
}

TEST_F(TessPipeAPITest, RunWritesEveryFormat) {
  TessPipeAPI api(RecordingEngine("echo text > \"$2.txt\"\n"
                                  "echo '<html/>' > \"$2.hocr\"\n"
                                  "echo '<alto/>' > \"$2.xml\"\n"));
  std::filesystem::path dir;
  {
    MultiOutput output = api.Run(ImageInput::FromBytes("x"), "page", "txt hocr alto");
    dir = output.directory();
    EXPECT_TRUE(std::filesystem::is_directory(dir));
    ASSERT_EQ(3u, output.files().size());
    EXPECT_EQ(dir / "page.txt", output.files()[0]);
    EXPECT_EQ(dir / "page.hocr", output.files()[1]);
    EXPECT_EQ(dir / "page.xml", output.files()[2]);
    EXPECT_EQ("text\n", output.ReadFile(0));
    EXPECT_EQ("<alto/>\n", output.ReadFile(2));
    EXPECT_THROW(output.ReadFile(3), std::out_of_range);

    auto args = RecordedArgs();
    ASSERT_GE(args.size(), 5u);
    EXPECT_EQ("stdin", args[0]);
    EXPECT_EQ((dir / "page").string(), args[1]);
    EXPECT_THAT(std::vector<std::string>(args.end() - 3, args.end()),
                ElementsAre("txt", "hocr", "alto"));
  }
  EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST_F(TessPipeAPITest, RunOutputCanBeMoved) {
  TessPipeAPI api(RecordingEngine("echo text > \"$2.txt\"\n"));
  MultiOutput outer;
  std::filesystem::path dir;
  {
    MultiOutput output = api.Run(ImageInput::FromBytes("x"), "out", "txt");
    dir = output.directory();
    outer = std::move(output);
    EXPECT_TRUE(output.directory().empty());
  }
  EXPECT_TRUE(std::filesystem::exists(dir));
  EXPECT_EQ("text\n", outer.ReadFile(0));
  outer = MultiOutput();
  EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST_F(TessPipeAPITest, RunMissingOutputFile) {
  TessPipeAPI api(RecordingEngine("echo text > \"$2.txt\"\n"));
  MultiOutput output = api.Run(ImageInput::FromBytes("x"), "out", "txt pdf");
  EXPECT_EQ("text\n", output.ReadFile(0));
  EXPECT_THROW(output.ReadFile(1), std::runtime_error);
}

TEST_F(TessPipeAPITest, RunRejectsBadRequests) {
  TessPipeAPI api(RecordingEngine("true\n"));
  auto image = ImageInput::FromBytes("x");
  EXPECT_THROW(api.Run(image, "out", ""), std::invalid_argument);
  EXPECT_THROW(api.Run(image, "out", "  "), std::invalid_argument);
  EXPECT_THROW(api.Run(image, "out", "txt docx"), std::invalid_argument);
  EXPECT_THROW(api.Run(image, "out", "osd"), std::invalid_argument);
  EXPECT_THROW(api.Run(image, "", "txt"), std::invalid_argument);
  EXPECT_THROW(api.Run(image, "../out", "txt"), std::invalid_argument);
  EXPECT_FALSE(EngineRan());
}

TEST_F(TessPipeAPITest, RunEngineFailureLeavesNoDirectory) {
  TessPipeAPI api(RecordingEngine("echo broken >&2\nexit 1\n"));
  EXPECT_THROW(api.Run(ImageInput::FromBytes("x"), "out", "txt"), TesseractRuntimeError);
  auto args = RecordedArgs();
  ASSERT_GE(args.size(), 2u);
  EXPECT_FALSE(std::filesystem::exists(std::filesystem::path(args[1]).parent_path()));
}

TEST_F(TessPipeAPITest, AsyncResults) {
  TessPipeAPI api(RecordingEngine("echo 'Script confidence: 3.5'\n"));
  std::future<std::string> text = api.ImageToStringAsync(ImageInput::FromBytes("x"));
  EXPECT_EQ("Script confidence: 3.5\n", text.get());
  EXPECT_DOUBLE_EQ(3.5, api.ConfidenceAsync(ImageInput::FromBytes("x")).get());
}

TEST_F(TessPipeAPITest, AsyncCopiesItsArguments) {
  TessPipeAPI api(RecordingEngine("echo done\n"));
  std::future<std::string> result;
  {
    OcrOptions options;
    options.lang = "deu";
    ImageInput image = ImageInput::FromBytes("scoped bytes");
    result = api.ImageToStringAsync(image, &options);
  }
  EXPECT_EQ("done\n", result.get());
  EXPECT_EQ("scoped bytes", RecordedStdin());
  EXPECT_THAT(RecordedArgs(), testing::Contains("deu"));
}

TEST_F(TessPipeAPITest, AsyncErrorsArriveThroughTheFuture) {
  TessPipeAPI api(RecordingEngine("echo failed >&2\nexit 3\n"));
  auto result = api.ImageToBoxesAsync(ImageInput::FromBytes("x"));
  EXPECT_THROW(result.get(), TesseractRuntimeError);

  OcrOptions options;
  options.psm = 42;
  auto invalid = api.ImageToHocrAsync(ImageInput::FromBytes("x"), &options);
  EXPECT_THROW(invalid.get(), InvalidPsmError);
}

TEST_F(TessPipeAPITest, AsyncRejectsEmptyInputImmediately) {
  TessPipeAPI api(RecordingEngine("echo ok\n"));
  EXPECT_THROW(api.ImageToStringAsync(ImageInput()), UnsupportedInputError);
  EXPECT_THROW(api.ImageToOsdAsync(ImageInput()), UnsupportedInputError);
  EXPECT_THROW(api.RunAsync(ImageInput(), "out", "txt"), UnsupportedInputError);
  EXPECT_FALSE(EngineRan());
}

TEST_F(TessPipeAPITest, RunAsync) {
  TessPipeAPI api(RecordingEngine("echo text > \"$2.txt\"\n"));
  MultiOutput output = api.RunAsync(ImageInput::FromBytes("x"), "out", "txt").get();
  ASSERT_EQ(1u, output.files().size());
  EXPECT_EQ("text\n", output.ReadFile(0));
}

} // namespace tesspipe
