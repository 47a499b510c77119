/** \brief Test cases for IniFile and the configuration sections read from it
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
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdio>
#include "ConsistencyChecker.h"
#include "IniFile.h"
#include "QualityModel.h"
#include "RecordSimilarity.h"
#include "UnitTest.h"


namespace {


void WriteFile(const std::string &path, const std::string &contents) {
    std::ofstream output(path);
    output << contents;
}


} // unnamed namespace


TEST(BasicParsing) {
    WriteFile("IniFileTest_basic.conf",
              "# leading comment\n"
              "[General]\n"
              "name = \"quoted # not a comment\"\n"
              "count = 17 # trailing comment\n"
              "ratio = 0.25\n"
              "verbose\n"
              "enabled = off\n"
              "long_value = first \\\n"
              "    second\n"
              "\n"
              "[Lists]\n"
              "codes = a | b |c\n"
              "empty =\n");
    const IniFile ini_file("IniFileTest_basic.conf");

    CHECK_TRUE(ini_file.sectionIsDefined("General"));
    CHECK_FALSE(ini_file.sectionIsDefined("Missing"));
    CHECK_EQ(ini_file.getString("General", "name"), "quoted # not a comment");
    CHECK_EQ(ini_file.getUnsigned("General", "count"), 17u);
    CHECK_NEAR(ini_file.getDouble("General", "ratio"), 0.25, 1e-12);
    CHECK_TRUE(ini_file.getBool("General", "verbose"));
    CHECK_FALSE(ini_file.getBool("General", "enabled"));
    CHECK_EQ(ini_file.getString("General", "long_value"), "firstsecond");

    CHECK_EQ(ini_file.getUnsigned("General", "undefined", 3u), 3u);
    CHECK_EQ(ini_file.getString("Missing", "undefined", "fallback"), "fallback");

    const auto codes(ini_file.getList("Lists", "codes", '|'));
    CHECK_EQ(codes.size(), 3u);
    CHECK_EQ(codes[0], "a");
    CHECK_EQ(codes[2], "c");
    CHECK_TRUE(ini_file.getList("Lists", "empty", '|').empty());
    CHECK_TRUE(ini_file.variableIsDefined("Lists", "empty"));

    std::remove("IniFileTest_basic.conf");
}


TEST(IncludeAndInherit) {
    WriteFile("IniFileTest_included.conf",
              "[Base]\n"
              "threshold = 0.5\n"
              "label = base\n");
    WriteFile("IniFileTest_main.conf",
              "include \"IniFileTest_included.conf\"\n"
              "[Derived]\n"
              "@inherit \"Base\"\n"
              "label = derived\n");
    const IniFile ini_file("IniFileTest_main.conf");

    CHECK_NEAR(ini_file.getDouble("Base", "threshold"), 0.5, 1e-12);
    CHECK_NEAR(ini_file.getDouble("Derived", "threshold"), 0.5, 1e-12);
    CHECK_EQ(ini_file.getString("Derived", "label"), "derived");
    CHECK_EQ(ini_file.getString("Base", "label"), "base");

    std::remove("IniFileTest_main.conf");
    std::remove("IniFileTest_included.conf");
}


TEST(SyntaxErrors) {
    CHECK_THROWS(IniFile("IniFileTest_does_not_exist.conf"), std::runtime_error);

    WriteFile("IniFileTest_bad.conf", "[Section]\n1abc = 2\n");
    CHECK_THROWS(IniFile("IniFileTest_bad.conf"), std::runtime_error);

    WriteFile("IniFileTest_bad.conf", "[Section]\n[Section]\n");
    CHECK_THROWS(IniFile("IniFileTest_bad.conf"), std::runtime_error);

    WriteFile("IniFileTest_bad.conf", "[Section]\n@inherit \"Nowhere\"\n");
    CHECK_THROWS(IniFile("IniFileTest_bad.conf"), std::runtime_error);

    WriteFile("IniFileTest_bad.conf", "[Section]\nvalue = \"unterminated\n");
    CHECK_THROWS(IniFile("IniFileTest_bad.conf"), std::runtime_error);

    std::remove("IniFileTest_bad.conf");
}


TEST(DefaultConfigs) {
    const IniFile empty_ini_file;

    const auto quality_config(QualityModel::Config::FromIniFile(empty_ini_file));
    CHECK_NEAR(quality_config.rule_config_.caps_ratio_threshold_, FieldRules::Config::DEFAULT_CAPS_RATIO_THRESHOLD, 1e-12);
    CHECK_EQ(quality_config.default_provenance_source_, "original");
    CHECK_EQ(quality_config.missing_field_provenance_source_, "generic_field_requirements");
    CHECK_EQ(quality_config.rule_config_.known_short_container_names_.count("JAMA"), 1u);

    const auto similarity_config(RecordSimilarity::Config::FromIniFile(empty_ini_file));
    CHECK_NEAR(similarity_config.title_weight_, 0.75, 1e-12);
    CHECK_NEAR(similarity_config.author_weight_, 0.15, 1e-12);

    const auto checker_config(ConsistencyChecker::Config::FromIniFile(empty_ini_file));
    CHECK_FALSE(checker_config.strict_mode_);
    CHECK_EQ(checker_config.max_threads_, ConsistencyChecker::Config::DEFAULT_MAX_THREADS);
    CHECK_TRUE(checker_config.screening_criteria_.empty());
}


TEST(ConfigOverrides) {
    WriteFile("IniFileTest_overrides.conf",
              "[QualityModel]\n"
              "caps_ratio_threshold = 0.9\n"
              "known_short_container_names = BMJ | Cell\n"
              "default_provenance_source = \"import\"\n"
              "\n"
              "[Similarity]\n"
              "title_weight = 0.5\n"
              "\n"
              "[ConsistencyChecker]\n"
              "strict_mode = true\n"
              "max_threads = 2\n"
              "screening_criteria = fit | language\n");
    const IniFile ini_file("IniFileTest_overrides.conf");

    const auto quality_config(QualityModel::Config::FromIniFile(ini_file));
    CHECK_NEAR(quality_config.rule_config_.caps_ratio_threshold_, 0.9, 1e-12);
    CHECK_EQ(quality_config.rule_config_.known_short_container_names_.size(), 2u);
    CHECK_EQ(quality_config.rule_config_.known_short_container_names_.count("Cell"), 1u);
    CHECK_EQ(quality_config.default_provenance_source_, "import");

    const auto similarity_config(RecordSimilarity::Config::FromIniFile(ini_file));
    CHECK_NEAR(similarity_config.title_weight_, 0.5, 1e-12);
    CHECK_NEAR(similarity_config.year_weight_, 0.05, 1e-12);

    const auto checker_config(ConsistencyChecker::Config::FromIniFile(ini_file));
    CHECK_TRUE(checker_config.strict_mode_);
    CHECK_EQ(checker_config.max_threads_, 2u);
    CHECK_EQ(checker_config.screening_criteria_.size(), 2u);
    CHECK_EQ(checker_config.screening_criteria_.count("language"), 1u);

    std::remove("IniFileTest_overrides.conf");
}


TEST(InvalidConfigValues) {
    WriteFile("IniFileTest_invalid.conf",
              "[QualityModel]\n"
              "caps_ratio_threshold = 1.5\n"
              "\n"
              "[Similarity]\n"
              "volume_weight = -0.1\n"
              "\n"
              "[ConsistencyChecker]\n"
              "max_threads = 0\n");
    const IniFile ini_file("IniFileTest_invalid.conf");

    CHECK_THROWS(QualityModel::Config::FromIniFile(ini_file), std::runtime_error);
    CHECK_THROWS(RecordSimilarity::Config::FromIniFile(ini_file), std::runtime_error);
    CHECK_THROWS(ConsistencyChecker::Config::FromIniFile(ini_file), std::runtime_error);

    std::remove("IniFileTest_invalid.conf");
}


TEST_MAIN(IniFileTest)
