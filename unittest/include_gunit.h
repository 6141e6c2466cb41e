///////////////////////////////////////////////////////////////////////
// File:        include_gunit.h
// Description: Helpers shared by the unit tests.
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

#ifndef TESSPIPE_UNITTEST_INCLUDE_GUNIT_H_
#define TESSPIPE_UNITTEST_INCLUDE_GUNIT_H_

#include <tesspipe/fileptr.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <cstdlib> // for mkdtemp
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <sys/stat.h> // for chmod

namespace tesspipe {

class file {
public:
  // Creates a fresh, empty directory below the system temp directory.
  static std::string MakeTmpdir() {
    std::string pattern =
        (std::filesystem::temp_directory_path() / "tesspipe_test-XXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
      ADD_FAILURE() << "mkdtemp failed for " << pattern;
      return std::string();
    }
    return std::string(buf.data());
  }

  static void RemoveTmpdir(const std::string &dir) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }

  // Create a file and write a string to it.
  static bool WriteStringToFile(const std::string &contents, const std::string &filename) {
    FileHandle fp(fopen(filename.c_str(), "wb"));
    if (!fp) {
      return false;
    }
    return fwrite(contents.data(), 1, contents.size(), fp.get()) == contents.size();
  }

  static bool GetContents(const std::string &filename, std::string *out) {
    FileHandle fp(fopen(filename.c_str(), "rb"));
    if (!fp) {
      return false;
    }
    out->clear();
    char buf[4096];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), fp.get())) > 0) {
      out->append(buf, n);
    }
    return true;
  }

  static std::string JoinPath(const std::string &s1, const std::string &s2) {
    return (std::filesystem::path(s1) / s2).string();
  }

  // Writes an executable /bin/sh script standing in for the engine.
  // `body` is the script without the #! line.
  static std::string WriteFakeEngine(const std::string &dir, const std::string &name,
                                     const std::string &body) {
    std::string path = JoinPath(dir, name);
    EXPECT_TRUE(WriteStringToFile("#!/bin/sh\n" + body, path)) << path;
    EXPECT_EQ(0, chmod(path.c_str(), 0755)) << path;
    return path;
  }
};

} // namespace tesspipe

#endif // TESSPIPE_UNITTEST_INCLUDE_GUNIT_H_
