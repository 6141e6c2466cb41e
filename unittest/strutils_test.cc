///////////////////////////////////////////////////////////////////////
// File:        strutils_test.cc
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

#include "include_gunit.h"
#include "strutils.h"

namespace tesspipe {

using testing::ElementsAre;
using testing::IsEmpty;

TEST(StrutilsTest, SafeAtoi) {
  int val = 42;
  EXPECT_TRUE(SafeAtoi("-17", &val));
  EXPECT_EQ(-17, val);
  EXPECT_TRUE(SafeAtoi("2147483647", &val));
  EXPECT_EQ(2147483647, val);

  val = 42;
  EXPECT_FALSE(SafeAtoi("", &val));
  EXPECT_FALSE(SafeAtoi("12x", &val));
  EXPECT_FALSE(SafeAtoi("1.5", &val));
  EXPECT_FALSE(SafeAtoi("2147483648", &val));
  EXPECT_FALSE(SafeAtoi("99999999999999999999", &val));
  EXPECT_EQ(42, val);
}

TEST(StrutilsTest, SafeAtod) {
  double val = 0;
  EXPECT_TRUE(SafeAtod("96.5", &val));
  EXPECT_DOUBLE_EQ(96.5, val);
  EXPECT_TRUE(SafeAtod("-1", &val));
  EXPECT_DOUBLE_EQ(-1.0, val);
  EXPECT_TRUE(SafeAtod("2e3", &val));
  EXPECT_DOUBLE_EQ(2000.0, val);

  val = 7;
  EXPECT_FALSE(SafeAtod("", &val));
  EXPECT_FALSE(SafeAtod("abc", &val));
  EXPECT_FALSE(SafeAtod("1,5", &val));
  EXPECT_FALSE(SafeAtod("1.5 ", &val));
  EXPECT_DOUBLE_EQ(7.0, val);
}

TEST(StrutilsTest, SafeAtob) {
  bool val = false;
  EXPECT_TRUE(SafeAtob("T", &val));
  EXPECT_TRUE(val);
  EXPECT_TRUE(SafeAtob("0", &val));
  EXPECT_FALSE(val);
  EXPECT_FALSE(SafeAtob("yes", &val));
}

TEST(StrutilsTest, Trim) {
  EXPECT_EQ("a b", Trim(" \ta b\r\n"));
  EXPECT_EQ("", Trim(" \n"));
  EXPECT_EQ("x", Trim("x"));
}

TEST(StrutilsTest, SplitWhitespace) {
  EXPECT_THAT(SplitWhitespace("  --psm 6\t-l\neng  "), ElementsAre("--psm", "6", "-l", "eng"));
  EXPECT_THAT(SplitWhitespace(" \t "), IsEmpty());
}

} // namespace tesspipe
