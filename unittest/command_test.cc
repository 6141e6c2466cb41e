///////////////////////////////////////////////////////////////////////
// File:        command_test.cc
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

#include <tesspipe/errors.h>
#include <tesspipe/params.h>

#include "command.h"
#include "global_params.h"
#include "include_gunit.h"

#include <cmath> // for INFINITY, NAN
#include <stdexcept>

namespace tesspipe {

using testing::ElementsAre;

class CommandTest : public testing::Test {
protected:
  void TearDown() override {
    ParamUtils::ResetToDefaults(nullptr);
  }
};

TEST_F(CommandTest, OptionsTakeGlobalDefaults) {
  OcrOptions options;
  EXPECT_EQ(300, options.dpi);
  EXPECT_EQ("eng", options.lang);
  EXPECT_EQ(PSM_AUTO, options.psm);
  EXPECT_EQ(OEM_DEFAULT, options.oem);
  EXPECT_DOUBLE_EQ(30.0, options.timeout);
  EXPECT_TRUE(options.user_words.empty());
  EXPECT_TRUE(options.user_patterns.empty());
  EXPECT_TRUE(options.tessdata_dir.empty());

  ASSERT_TRUE(ParamUtils::SetParam("tesspipe_default_dpi", "150", nullptr));
  ASSERT_TRUE(ParamUtils::SetParam("tesspipe_default_lang", "deu", nullptr));
  OcrOptions changed;
  EXPECT_EQ(150, changed.dpi);
  EXPECT_EQ("deu", changed.lang);
}

TEST_F(CommandTest, DefaultCommandShape) {
  OcrOptions options;
  EXPECT_THAT(BuildCommandArgs("tesseract", "stdin", "stdout", options, {"txt"}),
              ElementsAre("tesseract", "stdin", "stdout", "-l", "eng", "--dpi", "300", "--psm",
                          "3", "--oem", "3", "txt"));
}

TEST_F(CommandTest, OptionalArgumentsInOrder) {
  OcrOptions options;
  options.user_words = "/w.txt";
  options.user_patterns = "/p.txt";
  options.tessdata_dir = "/tessdata";
  options.lang = "eng+fra";
  options.dpi = 72;
  options.psm = 6;
  options.oem = 1;
  EXPECT_THAT(BuildCommandArgs("/opt/tesseract", "stdin", "/tmp/x/out", options,
                               {"txt", "pdf"}),
              ElementsAre("/opt/tesseract", "stdin", "/tmp/x/out", "--user-words", "/w.txt",
                          "--user-patterns", "/p.txt", "--tessdata-dir", "/tessdata", "-l",
                          "eng+fra", "--dpi", "72", "--psm", "6", "--oem", "1", "txt", "pdf"));
}

TEST_F(CommandTest, EmptyValuesAreOmitted) {
  OcrOptions options;
  options.lang.clear();
  options.dpi = 0;
  options.psm = 0;
  EXPECT_THAT(BuildCommandArgs("tesseract", "stdin", "stdout", options, {}),
              ElementsAre("tesseract", "stdin", "stdout", "--psm", "0", "--oem", "3"));
}

TEST_F(CommandTest, ValidatePsm) {
  for (int psm = 0; psm <= 13; ++psm) {
    EXPECT_NO_THROW(ValidatePsm(psm)) << psm;
  }
  EXPECT_THROW(ValidatePsm(-1), InvalidPsmError);
  EXPECT_THROW(ValidatePsm(14), InvalidPsmError);
}

TEST_F(CommandTest, ValidateOem) {
  for (int oem = 0; oem <= 3; ++oem) {
    EXPECT_NO_THROW(ValidateOem(oem)) << oem;
  }
  EXPECT_THROW(ValidateOem(-1), InvalidOemError);
  EXPECT_THROW(ValidateOem(4), InvalidOemError);
}

TEST_F(CommandTest, ValidateLanguage) {
  EXPECT_NO_THROW(ValidateLanguage(""));
  EXPECT_NO_THROW(ValidateLanguage("eng"));
  EXPECT_NO_THROW(ValidateLanguage("eng+por+fra"));
  EXPECT_NO_THROW(ValidateLanguage("chi_sim_vert"));
  EXPECT_THROW(ValidateLanguage("english"), InvalidLanguageError);
  EXPECT_THROW(ValidateLanguage("eng+xx"), InvalidLanguageError);
  EXPECT_THROW(ValidateLanguage("eng+"), InvalidLanguageError);
}

TEST_F(CommandTest, ValidationErrorsAreInvalidArguments) {
  OcrOptions options;
  options.psm = 99;
  EXPECT_THROW(ValidateOptions(options), std::invalid_argument);
  options = OcrOptions();
  options.timeout = 0;
  EXPECT_THROW(ValidateOptions(options), std::invalid_argument);
  options = OcrOptions();
  options.timeout = INFINITY;
  EXPECT_THROW(ValidateOptions(options), std::invalid_argument);
  options = OcrOptions();
  options.timeout = NAN;
  EXPECT_THROW(ValidateOptions(options), std::invalid_argument);
  options = OcrOptions();
  options.lang = "klingon";
  EXPECT_THROW(ValidateOptions(options), InvalidLanguageError);
}

TEST_F(CommandTest, LanguageCheckCanBeDisabled) {
  OcrOptions options;
  options.lang = "my_custom_model";
  ASSERT_TRUE(ParamUtils::SetParam("tesspipe_validate_languages", "false", nullptr));
  EXPECT_NO_THROW(ValidateOptions(options));
}

TEST_F(CommandTest, KnownLanguages) {
  EXPECT_TRUE(IsKnownLanguage("eng"));
  EXPECT_TRUE(IsKnownLanguage("osd"));
  EXPECT_TRUE(IsKnownLanguage("equ"));
  EXPECT_TRUE(IsKnownLanguage("yor"));
  EXPECT_FALSE(IsKnownLanguage(""));
  EXPECT_FALSE(IsKnownLanguage("ENG"));
  EXPECT_FALSE(IsKnownLanguage("List"));
}

TEST_F(CommandTest, FileFormats) {
  EXPECT_STREQ("txt", FileFormatConfigName(FILE_FORMAT_TXT));
  EXPECT_STREQ("hocr", FileFormatConfigName(FILE_FORMAT_HOCR));
  EXPECT_STREQ("pdf", FileFormatConfigName(FILE_FORMAT_PDF));
  EXPECT_STREQ("tsv", FileFormatConfigName(FILE_FORMAT_TSV));
  EXPECT_STREQ("alto", FileFormatConfigName(FILE_FORMAT_ALTO));
  EXPECT_EQ(nullptr, FileFormatConfigName(FILE_FORMAT_OSD));
  EXPECT_STREQ("xml", FileFormatExtension(FILE_FORMAT_ALTO));

  FileFormat format;
  EXPECT_TRUE(ParseFileFormat("hocr", &format));
  EXPECT_EQ(FILE_FORMAT_HOCR, format);
  EXPECT_TRUE(ParseFileFormat("osd", &format));
  EXPECT_EQ(FILE_FORMAT_OSD, format);
  EXPECT_FALSE(ParseFileFormat("docx", &format));
}

} // namespace tesspipe
