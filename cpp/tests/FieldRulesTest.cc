/** \brief Test cases for the field rules
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
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include "Bib.h"
#include "DefectCodes.h"
#include "FieldRules.h"
#include "UnitTest.h"


namespace {


const FieldRules::Config default_config;


std::set<std::string> GetFieldDefects(const std::string &field_name, const std::string &value,
                                      const std::string &entry_type = "article")
{
    Bib::Record record("Test2020", entry_type, RecordState::MD_IMPORTED);
    record.setField(field_name, value);
    const auto defects(FieldRules::GetDefaultRegistry().apply(record, default_config));
    const auto field_name_and_defects(defects.find(field_name));
    return (field_name_and_defects == defects.cend()) ? std::set<std::string>() : field_name_and_defects->second;
}


bool HasDefect(const std::string &field_name, const std::string &value, const std::string &defect_code,
               const std::string &entry_type = "article")
{
    return GetFieldDefects(field_name, value, entry_type).count(defect_code) == 1;
}


class CustomYearRule : public FieldRules::Rule {
    const std::string name_;

public:
    explicit CustomYearRule(const std::string &name): name_(name) { }

    virtual const std::string &getName() const { return name_; }

    virtual void check(const Bib::Record &record, const FieldRules::Config &/*config*/,
                       FieldRules::DefectMap * const defects) const
    {
        if (record.getField("year") == "1900")
            (*defects)["year"].emplace(name_);
    }
};


} // unnamed namespace


TEST(AuthorRules) {
    CHECK_TRUE(HasDefect("author", "RAI", DefectCodes::MOSTLY_ALL_CAPS));
    CHECK_TRUE(HasDefect("author", "Rai, Arun and B,", DefectCodes::INCOMPLETE_FIELD));
    CHECK_TRUE(HasDefect("author", "Rai, Arun and B", DefectCodes::NAME_FORMAT_SEPARATORS));
    CHECK_TRUE(HasDefect("author", "Rai, PhD, Arun", DefectCodes::NAME_FORMAT_TITLES));
    CHECK_TRUE(HasDefect("author", "Rai, Phd, Arun", DefectCodes::NAME_FORMAT_TITLES));
    CHECK_TRUE(GetFieldDefects("author", "GuyPhD, Arun").empty());
    CHECK_TRUE(HasDefect("author", "Rai, Arun; Straub, Detmar", DefectCodes::NAME_FORMAT_SEPARATORS));
    CHECK_TRUE(HasDefect("author", "Mathiassen, Lars and jonsson, katrin", DefectCodes::NAME_FORMAT_SEPARATORS));
    CHECK_TRUE(HasDefect("author", "University, Villanova and Sipior, Janice", DefectCodes::ERRONEOUS_TERM_IN_FIELD));
    CHECK_TRUE(GetFieldDefects("author", "Mourato, In\xC3\xAAs and Dias, \xC3\x81lvaro and Pereira, Leandro").empty());
    CHECK_TRUE(HasDefect("author", "DUTTON, JANE E. and ROBERTS, LAURA", DefectCodes::MOSTLY_ALL_CAPS));
    CHECK_TRUE(HasDefect("author", "Rai, Arun et al.", DefectCodes::INCOMPLETE_FIELD));
    CHECK_TRUE(HasDefect("author", "Rai, Arun, and others", DefectCodes::NAME_ABBREVIATED));
    CHECK_TRUE(GetFieldDefects("author", "Rai, Arun and Straub, Detmar").empty());

    // Letter case beyond the Latin, Greek and Cyrillic scripts:
    CHECK_TRUE(GetFieldDefects("author", "\xD5\x8A\xD5\xA5\xD5\xBF\xD6\x80\xD5\xB8\xD5\xBD\xD5\xB5\xD5\xA1\xD5\xB6, \xD4\xB1\xD6\x80\xD5\xA1\xD5\xB4").empty()); // Armenian
    CHECK_TRUE(HasDefect("author", "\xD5\x8A\xD4\xB5\xD5\x8F\xD5\x90\xD5\x88\xD5\x8D\xD5\x85\xD4\xB1\xD5\x86, \xD4\xB1\xD5\x90\xD4\xB1\xD5\x84", DefectCodes::MOSTLY_ALL_CAPS));
    CHECK_TRUE(GetFieldDefects("author", "Nguy\xE1\xBB\x85n, \xE1\xBA\xA0nh and Tr\xE1\xBA\xA7n, Minh").empty());
}


TEST(TitleRules) {
    CHECK_TRUE(HasDefect("title", "EDITORIAL", DefectCodes::MOSTLY_ALL_CAPS));
    CHECK_TRUE(HasDefect("title", "SAMJ\xEF\xBF\xBD", DefectCodes::ERRONEOUS_SYMBOL_IN_FIELD));
    CHECK_TRUE(HasDefect("title", "\xE2\x84\xA2", DefectCodes::ERRONEOUS_SYMBOL_IN_FIELD));
    CHECK_TRUE(HasDefect("title", "Some_Other_Title", DefectCodes::ERRONEOUS_TITLE_FIELD));
    CHECK_TRUE(HasDefect("title", "Some Other_Title", DefectCodes::ERRONEOUS_TITLE_FIELD));
    CHECK_TRUE(HasDefect("title", "Some 0th3r Title", DefectCodes::ERRONEOUS_TITLE_FIELD));
    CHECK_TRUE(GetFieldDefects("title", "Some other title").empty());
    CHECK_TRUE(HasDefect("title", "Some ...", DefectCodes::INCOMPLETE_FIELD));

    // Short words in capitals are no reason for complaint.
    CHECK_TRUE(GetFieldDefects("title", "IT governance in SMEs").empty());
}


TEST(ContainerRules) {
    CHECK_TRUE(HasDefect("journal", "A U-ARCHIT URBAN", DefectCodes::MOSTLY_ALL_CAPS));
    CHECK_TRUE(HasDefect("journal", "SOS", DefectCodes::CONTAINER_TITLE_ABBREVIATED));
    CHECK_TRUE(HasDefect("journal", "SAMJ", DefectCodes::CONTAINER_TITLE_ABBREVIATED));
    CHECK_TRUE(HasDefect("journal", "SAMJ\xEF\xBF\xBD", DefectCodes::ERRONEOUS_SYMBOL_IN_FIELD));
    CHECK_TRUE(HasDefect("journal", "A Journal, Conference", DefectCodes::INCONSISTENT_CONTENT));
    CHECK_TRUE(HasDefect("journal", "Manag. Sci.", DefectCodes::CONTAINER_TITLE_ABBREVIATED));
    CHECK_FALSE(HasDefect("journal", "JAMA", DefectCodes::CONTAINER_TITLE_ABBREVIATED));
    CHECK_TRUE(GetFieldDefects("journal", "MIS Quarterly").empty());

    CHECK_TRUE(HasDefect("booktitle", "Journal of Things", DefectCodes::INCONSISTENT_CONTENT, "inproceedings"));
    CHECK_FALSE(HasDefect("booktitle", "Proceedings of the Conference on Things", DefectCodes::INCONSISTENT_CONTENT,
                          "inproceedings"));
}


TEST(RecordLevelRules) {
    CHECK_TRUE(HasDefect("author", "Author, Name and Other, Author", DefectCodes::THESIS_WITH_MULTIPLE_AUTHORS, "thesis"));
    CHECK_FALSE(HasDefect("author", "Author, Name and Other, Author", DefectCodes::THESIS_WITH_MULTIPLE_AUTHORS));
    CHECK_FALSE(HasDefect("author", "Author, Name", DefectCodes::THESIS_WITH_MULTIPLE_AUTHORS, "phdthesis"));

    Bib::Record record("Test2020", "article", RecordState::MD_IMPORTED);
    record.setField("title", "Test title");
    record.setField("journal", "Test title");
    auto defects(FieldRules::GetDefaultRegistry().apply(record, default_config));
    CHECK_EQ(defects["title"].count(DefectCodes::IDENTICAL_VALUES_BETWEEN_TITLE_AND_CONTAINER), 1u);

    record.setField("journal", "Test Journal");
    defects = FieldRules::GetDefaultRegistry().apply(record, default_config);
    CHECK_EQ(defects.count("title"), 0u);

    Bib::Record proceedings_paper("Test2021", "inproceedings", RecordState::MD_IMPORTED);
    proceedings_paper.setField("journal", "Journal of Things");
    proceedings_paper.setField("number", "3");
    proceedings_paper.setField("volume", "12");
    defects = FieldRules::GetDefaultRegistry().apply(proceedings_paper, default_config);
    CHECK_EQ(defects["journal"].count(DefectCodes::INCONSISTENT_WITH_ENTRYTYPE), 1u);
    CHECK_EQ(defects["number"].count(DefectCodes::INCONSISTENT_WITH_ENTRYTYPE), 1u);
    CHECK_EQ(defects.count("volume"), 0u);
}


TEST(FormatRules) {
    CHECK_TRUE(HasDefect("year", "204", DefectCodes::YEAR_FORMAT));
    CHECK_TRUE(HasDefect("year", "2004a", DefectCodes::YEAR_FORMAT));
    CHECK_TRUE(GetFieldDefects("year", "2004").empty());
    CHECK_TRUE(GetFieldDefects("year", "forthcoming").empty());
    CHECK_TRUE(GetFieldDefects("year", " forthcoming").empty());
    CHECK_TRUE(GetFieldDefects("year", "2004 ").empty());
    CHECK_TRUE(HasDefect("year", " 20 04", DefectCodes::YEAR_FORMAT));

    CHECK_TRUE(GetFieldDefects("language", "eng").empty());
    CHECK_TRUE(GetFieldDefects("language", "arb").empty());
    CHECK_TRUE(GetFieldDefects("language", "zsm").empty());
    CHECK_TRUE(HasDefect("language", "cend", DefectCodes::LANGUAGE_FORMAT_ERROR));
    CHECK_TRUE(HasDefect("language", "en", DefectCodes::LANGUAGE_FORMAT_ERROR));
}


TEST(MalformedUTF8) {
    CHECK_TRUE(HasDefect("author", "Smith, John \xF7\xBF\xBF\xBF", DefectCodes::ERRONEOUS_SYMBOL_IN_FIELD));
    CHECK_TRUE(HasDefect("author", "Rai, Arun and Smith, John\xF4\x90\x80\x80", DefectCodes::ERRONEOUS_SYMBOL_IN_FIELD));
    CHECK_TRUE(HasDefect("title", "Smith\xC3", DefectCodes::ERRONEOUS_SYMBOL_IN_FIELD));
    CHECK_TRUE(HasDefect("title", "Over\xED\xA0\x80long", DefectCodes::ERRONEOUS_SYMBOL_IN_FIELD));
    CHECK_TRUE(HasDefect("journal", "Journal of \xF7\xBF\xBF\xBF", DefectCodes::ERRONEOUS_SYMBOL_IN_FIELD));
    CHECK_TRUE(HasDefect("booktitle", "Conference on \xF4\x90\x80\x80", DefectCodes::ERRONEOUS_SYMBOL_IN_FIELD,
                         "inproceedings"));

    Bib::Record record("Smith2020", "article", RecordState::MD_IMPORTED);
    record.setField("author", "Smith, John \xF7\xBF\xBF\xBF");
    record.setField("title", "Information systems\xF4\x90\x80\x80");
    record.setField("journal", "MIS Quarterly\xC3");
    const auto defects(FieldRules::GetDefaultRegistry().apply(record, default_config));
    for (const auto &field_name : { "author", "title", "journal" }) {
        const auto field_name_and_defects(defects.find(field_name));
        CHECK_TRUE(field_name_and_defects != defects.cend());
        if (field_name_and_defects != defects.cend())
            CHECK_EQ(field_name_and_defects->second.count(DefectCodes::ERRONEOUS_SYMBOL_IN_FIELD), 1u);
    }
}


TEST(UnusableValuesAreSkipped) {
    CHECK_TRUE(GetFieldDefects("year", Bib::UNKNOWN_VALUE).empty());
    CHECK_TRUE(GetFieldDefects("title", "   ").empty());
}


TEST(ConfigThresholds) {
    Bib::Record record("Test2020", "article", RecordState::MD_IMPORTED);
    record.setField("title", "ABCd");

    FieldRules::Config config;
    CHECK_EQ(FieldRules::GetDefaultRegistry().apply(record, config).count("title"), 0u);
    config.caps_ratio_threshold_ = 0.7;
    CHECK_EQ(FieldRules::GetDefaultRegistry().apply(record, config)["title"].count(DefectCodes::MOSTLY_ALL_CAPS), 1u);

    Bib::Record short_journal("Test2021", "article", RecordState::MD_IMPORTED);
    short_journal.setField("journal", "MISQ");
    CHECK_EQ(FieldRules::GetDefaultRegistry().apply(short_journal, config)["journal"].count(DefectCodes::CONTAINER_TITLE_ABBREVIATED),
             1u);
    config.known_short_container_names_.emplace("MISQ");
    CHECK_EQ(FieldRules::GetDefaultRegistry().apply(short_journal, config)["journal"].count(DefectCodes::CONTAINER_TITLE_ABBREVIATED),
             0u);
}


TEST(Registry) {
    const auto &default_registry(FieldRules::GetDefaultRegistry());
    CHECK_EQ(default_registry.size(), DefectCodes::GetAllDefectCodes().size());
    for (const auto &rule_name : default_registry.getRuleNames())
        CHECK_TRUE(DefectCodes::IsValidDefectCode(rule_name));

    auto registry(FieldRules::CreateDefaultRegistry());
    CHECK_THROWS(registry->add(std::unique_ptr<const FieldRules::Rule>(new CustomYearRule("no-such-code"))), std::runtime_error);
    CHECK_THROWS(registry->add(std::unique_ptr<const FieldRules::Rule>(new CustomYearRule(DefectCodes::YEAR_FORMAT))),
                 std::runtime_error);
    CHECK_EQ(registry->size(), default_registry.size());

    FieldRules::Registry custom_registry;
    custom_registry.add(std::unique_ptr<const FieldRules::Rule>(new CustomYearRule(DefectCodes::YEAR_FORMAT)));
    Bib::Record record("Test2020", "article", RecordState::MD_IMPORTED);
    record.setField("year", "1900");
    auto defects(custom_registry.apply(record, default_config));
    CHECK_EQ(defects["year"].count(DefectCodes::YEAR_FORMAT), 1u);
    record.setField("year", "1901");
    CHECK_TRUE(custom_registry.apply(record, default_config).empty());
}


TEST_MAIN(FieldRulesTest)
