/** \brief Test cases for StringUtil
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "StringUtil.h"
#include "UnitTest.h"


TEST(Trimming) {
    CHECK_EQ(StringUtil::TrimWhite("  \tabc \n"), "abc");
    CHECK_EQ(StringUtil::Trim("xy", "xyabcyx"), "abc");
    CHECK_EQ(StringUtil::CollapseAndTrimWhitespace("  a \t b\n\nc  "), "a b c");
    CHECK_EQ(StringUtil::CollapseAndTrimWhitespace(" \t "), "");
}


TEST(CaseConversion) {
    CHECK_EQ(StringUtil::ToLower("AbC"), "abc");
    CHECK_EQ(StringUtil::ToUpper("AbC"), "ABC");
}


TEST(Conversions) {
    unsigned n;
    CHECK_TRUE(StringUtil::ToUnsigned("42", &n));
    CHECK_EQ(n, 42u);
    CHECK_FALSE(StringUtil::ToUnsigned("-1", &n));
    CHECK_FALSE(StringUtil::ToUnsigned("12abc", &n));
    CHECK_THROWS(StringUtil::ToUnsigned("x"), std::runtime_error);

    double d;
    CHECK_TRUE(StringUtil::ToDouble("0.75", &d));
    CHECK_NEAR(d, 0.75, 1e-12);
    CHECK_FALSE(StringUtil::ToDouble("", &d));

    CHECK_TRUE(StringUtil::ToBool("Yes"));
    CHECK_FALSE(StringUtil::ToBool("off"));
    CHECK_THROWS(StringUtil::ToBool("maybe"), std::runtime_error);
}


TEST(Predicates) {
    CHECK_TRUE(StringUtil::StartsWith("IGNORE:year-format", "IGNORE:"));
    CHECK_TRUE(StringUtil::EndsWith("Rai, Arun ET AL.", "et al.", /* ignore_case = */ true));
    CHECK_FALSE(StringUtil::EndsWith("Rai, Arun ET AL.", "et al."));
    CHECK_TRUE(StringUtil::EndsWith("Rai,", ','));
    CHECK_TRUE(StringUtil::IsUnsignedNumber("2023"));
    CHECK_FALSE(StringUtil::IsUnsignedNumber("20a3"));
    CHECK_FALSE(StringUtil::IsUnsignedNumber(""));
    CHECK_TRUE(StringUtil::IsAsciiLetter('q'));
    CHECK_FALSE(StringUtil::IsAsciiLetter('_'));
}


TEST(ReplaceString) {
    CHECK_EQ(StringUtil::ReplaceString(" and ", " ", "A and B and C"), "A B C");
    CHECK_EQ(StringUtil::ReplaceString("a", "aa", "aba", /* global = */ false), "aaba");
    CHECK_EQ(StringUtil::ReplaceString("a", "aa", "aba"), "aabaa");
}


TEST(Split) {
    std::vector<std::string> components;
    CHECK_EQ(StringUtil::Split("a,,b", ',', &components), 2u);
    CHECK_EQ(components[1], "b");

    CHECK_EQ(StringUtil::Split("a,,b", ',', &components, /* suppress_empty_components = */ false), 3u);
    CHECK_TRUE(components[1].empty());

    CHECK_EQ(StringUtil::Split("Rai, Arun and Straub, Detmar", " and ", &components), 2u);
    CHECK_EQ(components[0], "Rai, Arun");

    CHECK_EQ(StringUtil::SplitOnAnyOf("Rai, PhD. Arun", " ,;.", &components), 3u);
    CHECK_EQ(components[1], "PhD");

    CHECK_EQ(StringUtil::SplitThenTrimWhite(" AIDS | BMJ |", '|', &components), 2u);
    CHECK_EQ(components[1], "BMJ");

    CHECK_THROWS(StringUtil::Split("abc", "", &components), std::runtime_error);
}


TEST(Join) {
    const std::set<std::string> codes{ "year-format", "mostly-all-caps" };
    CHECK_EQ(StringUtil::Join(codes, ','), "mostly-all-caps,year-format");
    CHECK_EQ(StringUtil::Join(std::vector<std::string>{}, ", "), "");
}


TEST(CStyleUnescape) {
    CHECK_EQ(StringUtil::CStyleUnescape("a\\tb\\n"), "a\tb\n");
    CHECK_EQ(StringUtil::CStyleUnescape("\\x41\\101"), "AA");
}


TEST_MAIN(StringUtilTest)
