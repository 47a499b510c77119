/** \brief Test cases for QualityModel
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
#include <algorithm>
#include <string>
#include <vector>
#include "Bib.h"
#include "DefectCodes.h"
#include "QualityModel.h"
#include "UnitTest.h"


namespace {


const QualityModel &GetQualityModel() {
    static const QualityModel quality_model;
    return quality_model;
}


Bib::Record MakeArticle() {
    Bib::Record record("Rai2021", "article", RecordState::MD_PREPARED);
    record.setField("author", "Rai, Arun and Straub, Detmar");
    record.setField("title", "Information systems research");
    record.setField("journal", "MIS Quarterly");
    record.setField("year", "2021");
    record.setField("volume", "45");
    record.setField("number", "1");
    return record;
}


std::string GetNote(const Bib::Record &record, const std::string &field_name) {
    const auto provenance(record.findMasterdataProvenance(field_name));
    return (provenance == nullptr) ? "<none>" : provenance->note_;
}


std::string GetSource(const Bib::Record &record, const std::string &field_name) {
    const auto provenance(record.findMasterdataProvenance(field_name));
    return (provenance == nullptr) ? "<none>" : provenance->source_;
}


} // unnamed namespace


TEST(CleanRecord) {
    auto record(MakeArticle());
    GetQualityModel().evaluate(&record);

    CHECK_FALSE(QualityModel::HasQualityDefects(record));
    CHECK_EQ(record.getMasterdataProvenance().size(), 6u);
    CHECK_EQ(GetNote(record, "author"), "");
    CHECK_EQ(GetSource(record, "author"), "original");
    CHECK_TRUE(QualityModel::GetDefects(record, "title").empty());
}


TEST(FieldDefects) {
    auto record(MakeArticle());
    record.setField("author", "RAI");
    GetQualityModel().evaluate(&record);
    const auto author_defects(QualityModel::GetDefects(record, "author"));
    CHECK_FALSE(author_defects.empty());
    CHECK_EQ(author_defects.front(), DefectCodes::MOSTLY_ALL_CAPS);
    CHECK_TRUE(QualityModel::HasQualityDefects(record));

    record = MakeArticle();
    record.setField("author", "Rai, Arun et al.");
    GetQualityModel().evaluate(&record);
    CHECK_EQ(GetNote(record, "author"), DefectCodes::INCOMPLETE_FIELD);

    record = MakeArticle();
    record.setField("title", "Some_Other_Title");
    GetQualityModel().evaluate(&record);
    CHECK_EQ(GetNote(record, "title"), DefectCodes::ERRONEOUS_TITLE_FIELD);

    record = MakeArticle();
    record.setField("journal", "SAMJ");
    GetQualityModel().evaluate(&record);
    CHECK_EQ(GetNote(record, "journal"), "container-title-abbreviated,mostly-all-caps");

    record = MakeArticle();
    record.setField("year", "204");
    GetQualityModel().evaluate(&record);
    CHECK_EQ(GetNote(record, "year"), DefectCodes::YEAR_FORMAT);
    CHECK_TRUE(QualityModel::HasQualityDefects(record));

    record = MakeArticle();
    record.setField("language", "cend");
    GetQualityModel().evaluate(&record);
    CHECK_EQ(GetNote(record, "language"), DefectCodes::LANGUAGE_FORMAT_ERROR);

    record = MakeArticle();
    record.setField("language", "eng");
    GetQualityModel().evaluate(&record);
    CHECK_EQ(GetNote(record, "language"), "");
    CHECK_FALSE(QualityModel::HasQualityDefects(record));
}


TEST(MalformedUTF8) {
    auto record(MakeArticle());
    record.setField("author", "Smith, John \xF7\xBF\xBF\xBF");
    record.setField("title", "Information systems research\xC3");
    GetQualityModel().evaluate(&record);

    CHECK_TRUE(QualityModel::HasQualityDefects(record));
    for (const auto &field_name : { "author", "title" }) {
        const auto defects(QualityModel::GetDefects(record, field_name));
        CHECK_TRUE(std::find(defects.cbegin(), defects.cend(), DefectCodes::ERRONEOUS_SYMBOL_IN_FIELD) != defects.cend());
    }
}


TEST(MissingAndInconsistentFields) {
    auto record(MakeArticle());
    record.setEntryType("inproceedings");
    GetQualityModel().evaluate(&record);

    CHECK_EQ(GetNote(record, "booktitle"), DefectCodes::MISSING);
    CHECK_EQ(GetSource(record, "booktitle"), "generic_field_requirements");
    CHECK_EQ(GetNote(record, "journal"), DefectCodes::INCONSISTENT_WITH_ENTRYTYPE);
    CHECK_EQ(GetNote(record, "number"), DefectCodes::INCONSISTENT_WITH_ENTRYTYPE);
    CHECK_EQ(GetNote(record, "volume"), "");
    CHECK_TRUE(QualityModel::HasQualityDefects(record));

    // UNKNOWN counts as absent:
    record = MakeArticle();
    record.setField("volume", Bib::UNKNOWN_VALUE);
    GetQualityModel().evaluate(&record);
    CHECK_EQ(GetNote(record, "volume"), DefectCodes::MISSING);

    record = MakeArticle();
    record.setEntryType("incollection");
    record.removeField("journal");
    record.removeField("volume");
    record.removeField("number");
    record.setField("booktitle", "Information systems research");
    record.setField("publisher", "Springer");
    GetQualityModel().evaluate(&record);
    CHECK_EQ(GetNote(record, "title"), DefectCodes::IDENTICAL_VALUES_BETWEEN_TITLE_AND_CONTAINER);
}


TEST(ForthcomingPublications) {
    auto record(MakeArticle());
    record.setField("year", "forthcoming");
    record.removeField("volume");
    record.removeField("number");
    GetQualityModel().evaluate(&record);

    CHECK_EQ(GetNote(record, "volume"), DefectCodes::NOT_MISSING);
    CHECK_EQ(GetNote(record, "number"), DefectCodes::NOT_MISSING);
    CHECK_EQ(GetNote(record, "year"), "");
    CHECK_FALSE(QualityModel::HasQualityDefects(record));

    // Surrounding whitespace is not a year format error.
    record.setField("year", " forthcoming ");
    GetQualityModel().evaluate(&record);
    CHECK_EQ(GetNote(record, "volume"), DefectCodes::NOT_MISSING);
    CHECK_EQ(GetNote(record, "year"), "");
    CHECK_FALSE(QualityModel::HasQualityDefects(record));
}


TEST(Idempotence) {
    auto record(MakeArticle());
    record.setField("author", "RAI");
    record.setEntryType("inproceedings");
    GetQualityModel().evaluate(&record);
    const auto first_provenance(record.getMasterdataProvenance());
    GetQualityModel().evaluate(&record);
    CHECK_TRUE(record.getMasterdataProvenance() == first_provenance);
}


TEST(IgnoredDefects) {
    auto record(MakeArticle());
    record.setField("title", "EDITORIAL");
    GetQualityModel().evaluate(&record);
    CHECK_EQ(GetNote(record, "title"), DefectCodes::MOSTLY_ALL_CAPS);

    record.getMasterdataProvenance()["title"].note_ = "IGNORE:mostly-all-caps,mostly-all-caps";
    CHECK_FALSE(QualityModel::HasQualityDefects(record));
    GetQualityModel().evaluate(&record);
    CHECK_EQ(GetNote(record, "title"), "IGNORE:mostly-all-caps,mostly-all-caps");
    CHECK_FALSE(QualityModel::HasQualityDefects(record));

    // The ignore token outlives the defect as long as the field is present.
    record.setField("title", "Editorial");
    GetQualityModel().evaluate(&record);
    CHECK_EQ(GetNote(record, "title"), "IGNORE:mostly-all-caps");

    record.removeField("title");
    GetQualityModel().evaluate(&record);
    CHECK_EQ(GetNote(record, "title"), DefectCodes::MISSING);
}


TEST(ProvenanceSources) {
    auto record(MakeArticle());
    record.getMasterdataProvenance()["title"] = Bib::Provenance("crossref", "");
    record.getMasterdataProvenance()["pages"] = Bib::Provenance("crossref", "");
    GetQualityModel().evaluate(&record);

    CHECK_EQ(GetSource(record, "title"), "crossref");
    CHECK_EQ(GetSource(record, "author"), "original");
    CHECK_TRUE(record.findMasterdataProvenance("pages") == nullptr);

    QualityModel::Config config;
    config.default_provenance_source_ = "import";
    config.missing_field_provenance_source_ = "requirements";
    const QualityModel custom_quality_model(config);
    record = MakeArticle();
    record.removeField("number");
    custom_quality_model.evaluate(&record);
    CHECK_EQ(GetSource(record, "title"), "import");
    CHECK_EQ(GetSource(record, "number"), "requirements");
}


TEST_MAIN(QualityModelTest)
