/** \brief Test cases for the record model, defect codes and language codes
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
#include <nlohmann/json.hpp>
#include "Bib.h"
#include "DefectCodes.h"
#include "LanguageCodes.h"
#include "StringUtil.h"
#include "UnitTest.h"


TEST(RecordConstruction) {
    CHECK_THROWS(Bib::Record("", "article", RecordState::MD_IMPORTED), Bib::RecordError);
    CHECK_THROWS(Bib::Record("  ", "article", RecordState::MD_IMPORTED), Bib::RecordError);
    CHECK_THROWS(Bib::Record("Smith2020", "pamphlet", RecordState::MD_IMPORTED), Bib::RecordError);

    Bib::Record record("Smith2020", "article", RecordState::MD_IMPORTED);
    CHECK_EQ(record.getID(), "Smith2020");
    CHECK_EQ(record.getEntryType(), "article");
    CHECK_EQ(record.getStatus(), RecordState::MD_IMPORTED);

    CHECK_THROWS(record.setEntryType("unknown"), Bib::RecordError);
    CHECK_EQ(record.getEntryType(), "article");
    record.setEntryType("inproceedings");
    CHECK_EQ(record.getEntryType(), "inproceedings");

    record.setStatus(RecordState::MD_PREPARED);
    CHECK_EQ(record.getStatus(), RecordState::MD_PREPARED);
}


TEST(Fields) {
    Bib::Record record("Smith2020", "article", RecordState::MD_IMPORTED);
    record.setField("title", "A title");
    record.setField("volume", Bib::UNKNOWN_VALUE);
    record.setField("number", "   ");

    CHECK_TRUE(record.hasField("title"));
    CHECK_TRUE(record.hasUsableField("title"));
    CHECK_TRUE(record.hasField("volume"));
    CHECK_FALSE(record.hasUsableField("volume"));
    CHECK_FALSE(record.hasUsableField("number"));
    CHECK_FALSE(record.hasUsableField("pages"));
    CHECK_EQ(record.getField("pages"), "");

    CHECK_THROWS(record.setField(Bib::ID_KEY, "x"), Bib::RecordError);
    CHECK_THROWS(record.setField(Bib::MASTERDATA_PROVENANCE_KEY, "x"), Bib::RecordError);
    CHECK_FALSE(Bib::IsReservedKey(Bib::SCREENING_CRITERIA_KEY));

    CHECK_TRUE(record.removeField("number"));
    CHECK_FALSE(record.removeField("number"));

    unsigned field_count(0);
    for (const auto &field_name_and_value : record) {
        (void)field_name_and_value;
        ++field_count;
    }
    CHECK_EQ(field_count, 2u);
}


TEST(Origins) {
    std::string source_filename, record_id;
    CHECK_TRUE(Bib::ParseOrigin("data/search/scopus.bib/000123", &source_filename, &record_id));
    CHECK_EQ(source_filename, "data/search/scopus.bib");
    CHECK_EQ(record_id, "000123");
    CHECK_FALSE(Bib::ParseOrigin("scopus.bib", &source_filename, &record_id));
    CHECK_FALSE(Bib::ParseOrigin("/000123", &source_filename, &record_id));
    CHECK_FALSE(Bib::ParseOrigin("scopus.bib/", &source_filename, &record_id));

    Bib::Record record("Smith2020", "article", RecordState::MD_IMPORTED);
    record.addOrigin("scopus.bib/000123");
    CHECK_THROWS(record.addOrigin("no-separator"), Bib::RecordError);
    CHECK_EQ(record.getOrigins().size(), 1u);
    CHECK_TRUE(record.hasOrigin("scopus.bib/000123"));
    CHECK_FALSE(record.hasOrigin("scopus.bib/000124"));
}


TEST(EntryTypeTables) {
    CHECK_TRUE(Bib::IsKnownEntryType("article"));
    CHECK_TRUE(Bib::IsKnownEntryType("other"));
    CHECK_FALSE(Bib::IsKnownEntryType("Article"));
    CHECK_EQ(Bib::GetKnownEntryTypes().size(), 17u);

    CHECK_EQ(Bib::GetRequiredFields("article").count("journal"), 1u);
    CHECK_EQ(Bib::GetRequiredFields("article").count("booktitle"), 0u);
    CHECK_EQ(Bib::GetInconsistentFields("article").count("booktitle"), 1u);
    CHECK_EQ(Bib::GetRequiredFields("inproceedings").count("booktitle"), 1u);
    CHECK_EQ(Bib::GetInconsistentFields("inproceedings").count("journal"), 1u);
    CHECK_EQ(Bib::GetRequiredFields("phdthesis").count("school"), 1u);
    CHECK_EQ(Bib::GetInconsistentFields("techreport").count("volume"), 1u);
    CHECK_TRUE(Bib::GetInconsistentFields("other").empty());
    CHECK_THROWS(Bib::GetRequiredFields("pamphlet"), Bib::RecordError);
    CHECK_THROWS(Bib::GetInconsistentFields("pamphlet"), Bib::RecordError);

    CHECK_TRUE(Bib::IsThesisType("mastersthesis"));
    CHECK_FALSE(Bib::IsThesisType("techreport"));

    CHECK_TRUE(Bib::IsMasterdataField("author"));
    CHECK_FALSE(Bib::IsMasterdataField("abstract"));
}


TEST(StateCounts) {
    std::vector<Bib::Record> records;
    records.emplace_back("a", "article", RecordState::MD_PROCESSED);
    records.emplace_back("b", "book", RecordState::MD_PROCESSED);
    records.emplace_back("c", "misc", RecordState::REV_INCLUDED);

    const auto state_counts(Bib::GetStateCounts(records));
    CHECK_EQ(state_counts.size(), 2u);
    CHECK_EQ(state_counts.at(RecordState::MD_PROCESSED), 2u);
    CHECK_EQ(state_counts.at(RecordState::REV_INCLUDED), 1u);
    CHECK_TRUE(Bib::GetStateCounts(std::vector<Bib::Record>()).empty());
}


TEST(ScreeningCriteria) {
    std::vector<Bib::ScreeningCriterion> criteria;
    std::string err_msg;

    CHECK_TRUE(Bib::ParseScreeningCriteria("", &criteria, &err_msg));
    CHECK_TRUE(criteria.empty());

    CHECK_TRUE(Bib::ParseScreeningCriteria("fit=in;language_en=out", &criteria, &err_msg));
    CHECK_EQ(criteria.size(), 2u);
    CHECK_EQ(criteria[0].name_, "fit");
    CHECK_TRUE(criteria[0].included_);
    CHECK_EQ(criteria[1].name_, "language_en");
    CHECK_FALSE(criteria[1].included_);

    CHECK_FALSE(Bib::ParseScreeningCriteria("fit", &criteria, &err_msg));
    CHECK_FALSE(err_msg.empty());
    CHECK_FALSE(Bib::ParseScreeningCriteria("fit=maybe", &criteria, &err_msg));
    CHECK_FALSE(Bib::ParseScreeningCriteria("bad name=in", &criteria, &err_msg));
    CHECK_FALSE(Bib::ParseScreeningCriteria("fit=in;", &criteria, &err_msg));
}


TEST(RecordJSON) {
    const auto json(nlohmann::json::parse(R"({
        "ID": "Smith2020",
        "ENTRYTYPE": "article",
        "colrev_status": "md_processed",
        "colrev_origin": ["scopus.bib/000123", "wos.bib/42"],
        "colrev_masterdata_provenance": {
            "title": {"source": "original", "note": ""},
            "volume": {"source": "generic_field_requirements", "note": "missing"}
        },
        "title": "A title",
        "year": 2020
    })"));

    const auto record(Bib::RecordFromJSON(json));
    CHECK_EQ(record.getID(), "Smith2020");
    CHECK_EQ(record.getStatus(), RecordState::MD_PROCESSED);
    CHECK_EQ(record.getOrigins().size(), 2u);
    CHECK_EQ(record.getField("year"), "2020");
    CHECK_EQ(record.getMasterdataProvenance().size(), 2u);
    const auto volume_provenance(record.findMasterdataProvenance("volume"));
    CHECK_TRUE(volume_provenance != nullptr);
    CHECK_EQ(volume_provenance->note_, DefectCodes::MISSING);
    CHECK_TRUE(record.findMasterdataProvenance("author") == nullptr);

    const auto reparsed_record(Bib::RecordFromJSON(Bib::RecordToJSON(record)));
    CHECK_EQ(reparsed_record.getID(), record.getID());
    CHECK_EQ(reparsed_record.getField("title"), "A title");
    CHECK_TRUE(reparsed_record.getOrigins() == record.getOrigins());
    CHECK_TRUE(reparsed_record.getMasterdataProvenance() == record.getMasterdataProvenance());
}


TEST(MalformedRecordJSON) {
    const auto missing_status(nlohmann::json::parse(R"({"ID": "a", "ENTRYTYPE": "article"})"));
    CHECK_THROWS(Bib::RecordFromJSON(missing_status), Bib::RecordError);

    const auto unknown_status(nlohmann::json::parse(R"({"ID": "a", "ENTRYTYPE": "article", "colrev_status": "done"})"));
    CHECK_THROWS(Bib::RecordFromJSON(unknown_status), RecordState::UnknownStateError);

    const auto bad_origin(
        nlohmann::json::parse(R"({"ID": "a", "ENTRYTYPE": "article", "colrev_status": "md_imported", "colrev_origin": "x/1"})"));
    CHECK_THROWS(Bib::RecordFromJSON(bad_origin), Bib::RecordError);

    const auto bad_provenance(nlohmann::json::parse(
        R"({"ID": "a", "ENTRYTYPE": "article", "colrev_status": "md_imported", "colrev_masterdata_provenance": {"title": {"source": "x", "extra": "y"}}})"));
    CHECK_THROWS(Bib::RecordFromJSON(bad_provenance), Bib::RecordError);

    const auto nested_field(
        nlohmann::json::parse(R"({"ID": "a", "ENTRYTYPE": "article", "colrev_status": "md_imported", "keywords": ["x"]})"));
    CHECK_THROWS(Bib::RecordFromJSON(nested_field), Bib::RecordError);
}


TEST(SourceJSON) {
    const auto json(nlohmann::json::parse(
        R"({"filename": "data/search/scopus.bib", "search_type": "DB", "record_ids": ["000123", "000124"]})"));
    const auto source(Bib::SourceFromJSON(json));
    CHECK_EQ(source.filename_, "data/search/scopus.bib");
    CHECK_EQ(source.search_type_, Bib::DB);
    CHECK_TRUE(source.available_);
    CHECK_EQ(source.record_ids_.size(), 2u);

    const auto reparsed_source(Bib::SourceFromJSON(Bib::SourceToJSON(source)));
    CHECK_TRUE(reparsed_source.record_ids_ == source.record_ids_);

    const auto bad_search_type(nlohmann::json::parse(R"({"filename": "x.bib", "search_type": "WEB"})"));
    CHECK_THROWS(Bib::SourceFromJSON(bad_search_type), std::runtime_error);

    // Wrongly typed members are reported as std::runtime_error rather than as JSON library errors.
    const auto numeric_source_identifier(nlohmann::json::parse(R"({"filename": "x.bib", "source_identifier": 42})"));
    CHECK_THROWS(Bib::SourceFromJSON(numeric_source_identifier), std::runtime_error);
    const auto string_availability(nlohmann::json::parse(R"({"filename": "x.bib", "available": "yes"})"));
    CHECK_THROWS(Bib::SourceFromJSON(string_availability), std::runtime_error);
    const auto numeric_record_id(nlohmann::json::parse(R"({"filename": "x.bib", "record_ids": ["000123", 124]})"));
    CHECK_THROWS(Bib::SourceFromJSON(numeric_record_id), std::runtime_error);
    try {
        Bib::SourceFromJSON(numeric_record_id);
    } catch (const std::runtime_error &x) {
        CHECK_TRUE(StringUtil::StartsWith(x.what(), "in Bib::SourceFromJSON: "));
    }

    const auto unavailable_source(nlohmann::json::parse(R"({"filename": "x.bib", "available": false, "source_identifier": "ref"})"));
    CHECK_FALSE(Bib::SourceFromJSON(unavailable_source).available_);
    CHECK_EQ(Bib::SourceFromJSON(unavailable_source).source_identifier_, "ref");

    Bib::SearchType search_type;
    CHECK_TRUE(Bib::StringToSearchType("BACKWARD_SEARCH", &search_type));
    CHECK_EQ(Bib::SearchTypeToString(search_type), "BACKWARD_SEARCH");
}


TEST(DefectNotes) {
    CHECK_EQ(DefectCodes::GetAllDefectCodes().size(), 15u);
    CHECK_TRUE(DefectCodes::IsValidDefectCode("year-format"));
    CHECK_FALSE(DefectCodes::IsValidDefectCode(DefectCodes::MISSING));
    CHECK_TRUE(DefectCodes::IsIgnoreToken("IGNORE:mostly-all-caps"));
    CHECK_FALSE(DefectCodes::IsIgnoreToken("IGNORE:missing"));
    CHECK_TRUE(DefectCodes::IsValidNoteToken(DefectCodes::NOT_MISSING));

    const std::set<std::string> tokens{ "year-format", "mostly-all-caps" };
    CHECK_EQ(DefectCodes::JoinNote(tokens), "mostly-all-caps,year-format");
    CHECK_EQ(DefectCodes::SplitNote("mostly-all-caps,year-format").size(), 2u);
    CHECK_TRUE(DefectCodes::SplitNote("").empty());

    std::string err_msg;
    CHECK_TRUE(DefectCodes::IsWellFormedNote("", &err_msg));
    CHECK_TRUE(DefectCodes::IsWellFormedNote("missing", &err_msg));
    CHECK_TRUE(DefectCodes::IsWellFormedNote("IGNORE:mostly-all-caps,mostly-all-caps", &err_msg));
    CHECK_FALSE(DefectCodes::IsWellFormedNote("year-format,mostly-all-caps", &err_msg));
    CHECK_FALSE(DefectCodes::IsWellFormedNote("missing,year-format", &err_msg));
    CHECK_FALSE(DefectCodes::IsWellFormedNote("year-format,year-format", &err_msg));
    CHECK_FALSE(DefectCodes::IsWellFormedNote("year-format,", &err_msg));
    CHECK_FALSE(DefectCodes::IsWellFormedNote("bad-code", &err_msg));
    CHECK_FALSE(err_msg.empty());

    const auto active_defects(DefectCodes::GetActiveDefects("IGNORE:mostly-all-caps,mostly-all-caps,year-format"));
    CHECK_EQ(active_defects.size(), 1u);
    CHECK_EQ(active_defects.count("year-format"), 1u);
    CHECK_TRUE(DefectCodes::GetActiveDefects(DefectCodes::MISSING).empty());
}


TEST(LanguageCodesTest) {
    CHECK_TRUE(LanguageCodes::IsValidISO639_3Code("eng"));
    CHECK_TRUE(LanguageCodes::IsValidISO639_3Code("deu"));
    CHECK_TRUE(LanguageCodes::IsValidISO639_3Code("grc"));
    CHECK_TRUE(LanguageCodes::IsValidISO639_3Code("und"));
    CHECK_TRUE(LanguageCodes::IsValidISO639_3Code("aaa"));
    CHECK_TRUE(LanguageCodes::IsValidISO639_3Code("zzj"));

    // Individual languages of macrolanguages:
    CHECK_TRUE(LanguageCodes::IsValidISO639_3Code("arb"));
    CHECK_TRUE(LanguageCodes::IsValidISO639_3Code("swh"));
    CHECK_TRUE(LanguageCodes::IsValidISO639_3Code("pes"));
    CHECK_TRUE(LanguageCodes::IsValidISO639_3Code("zsm"));
    CHECK_TRUE(LanguageCodes::IsValidISO639_3Code("ekk"));
    CHECK_TRUE(LanguageCodes::IsValidISO639_3Code("ara"));

    CHECK_FALSE(LanguageCodes::IsValidISO639_3Code("qaa"));
    CHECK_FALSE(LanguageCodes::IsValidISO639_3Code("xyz"));
    CHECK_FALSE(LanguageCodes::IsValidISO639_3Code(""));
    CHECK_FALSE(LanguageCodes::IsValidISO639_3Code("en"));
    CHECK_FALSE(LanguageCodes::IsValidISO639_3Code("ENG"));
    CHECK_FALSE(LanguageCodes::IsValidISO639_3Code("english"));

    std::string iso639_3_code;
    CHECK_TRUE(LanguageCodes::MapISO639_1ToISO639_3("DE", &iso639_3_code));
    CHECK_EQ(iso639_3_code, "deu");
    CHECK_FALSE(LanguageCodes::MapISO639_1ToISO639_3("xx", &iso639_3_code));
}


TEST_MAIN(BibTest)
