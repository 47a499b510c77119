/** \brief Test cases for ConsistencyChecker and SnapshotIO
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
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdio>
#include "Bib.h"
#include "ConsistencyChecker.h"
#include "SnapshotIO.h"
#include "StringUtil.h"
#include "UnitTest.h"


namespace {


const std::string SCOPUS_FILENAME("data/search/scopus.bib");


Bib::Record MakeRecord(const std::string &id, const RecordState::State status, const std::string &source_record_id,
                       const std::string &title = "Information systems research")
{
    Bib::Record record(id, "article", status);
    record.addOrigin(SCOPUS_FILENAME + "/" + source_record_id);
    record.setField("title", title);
    record.getMasterdataProvenance()["title"] = Bib::Provenance("original", "");
    return record;
}


Bib::Source MakeScopusSource() {
    Bib::Source source(SCOPUS_FILENAME, Bib::DB, "TITLE-ABS-KEY(information systems)");
    for (const auto record_id : { "000001", "000002", "000003", "000004", "000005" })
        source.record_ids_.emplace(record_id);
    return source;
}


// Two persisted records, one of them already included.
ConsistencyChecker::Snapshot MakePriorSnapshot() {
    ConsistencyChecker::Snapshot prior;
    prior.sources_.emplace_back(MakeScopusSource());
    prior.records_.emplace_back(MakeRecord("Smith2020", RecordState::MD_PROCESSED, "000001"));
    prior.records_.emplace_back(MakeRecord("Jones2021", RecordState::REV_INCLUDED, "000002", "Design science"));
    return prior;
}


} // unnamed namespace


TEST(CleanSnapshots) {
    const ConsistencyChecker checker;
    const auto prior(MakePriorSnapshot());
    auto current(prior);
    current.records_[0].setStatus(RecordState::REV_PRESCREEN_INCLUDED);

    const auto result(checker.check(prior, current, ConsistencyChecker::ChangeLog()));
    CHECK_TRUE(result.passed());
    CHECK_EQ(result.status_, ConsistencyChecker::PASS);
    CHECK_EQ(result.toString(), "Everything ok.");

    // Without a prior snapshot the history-based checks have nothing to compare against.
    const auto result_without_prior(checker.check(ConsistencyChecker::Snapshot(), current, ConsistencyChecker::ChangeLog()));
    CHECK_TRUE(result_without_prior.passed());
}


TEST(DuplicateIDAndIllegalTransition) {
    const auto prior(MakePriorSnapshot());
    auto current(prior);
    current.records_[1].setStatus(RecordState::MD_PREPARED);
    current.records_.emplace_back(MakeRecord("Smith2020", RecordState::MD_IMPORTED, "000003", "Information system research"));

    const ConsistencyChecker checker;
    const auto result(checker.check(prior, current, ConsistencyChecker::ChangeLog()));
    CHECK_FALSE(result.passed());
    CHECK_EQ(result.failures_.size(), 2u);
    CHECK_EQ(result.getFailureCount(ConsistencyChecker::DUPLICATE_IDS_ERROR), 1u);
    CHECK_EQ(result.getFailureCount(ConsistencyChecker::STATUS_TRANSITION_ERROR), 1u);
    if (result.failures_.size() == 2) {
        CHECK_EQ(result.failures_[0].kind_, ConsistencyChecker::DUPLICATE_IDS_ERROR);
        CHECK_EQ(result.failures_[0].record_ids_.front(), "Smith2020");
        CHECK_EQ(result.failures_[1].toString(), "StatusTransitionError: \"Jones2021\": rev_included -> md_prepared");
    }
    CHECK_TRUE(StringUtil::StartsWith(result.toString(), "DuplicateIDsError: ID \"Smith2020\" occurs 2 times"));

    // The checker must not touch its input.
    CHECK_EQ(current.records_[1].getStatus(), RecordState::MD_PREPARED);
    CHECK_EQ(current.records_.size(), 3u);
}


TEST(StrictMode) {
    const auto prior(MakePriorSnapshot());
    auto current(prior);
    current.records_[1].setStatus(RecordState::MD_PREPARED);

    ConsistencyChecker::Config config;
    config.strict_mode_ = true;
    const ConsistencyChecker strict_checker(config);
    CHECK_THROWS(strict_checker.check(prior, current, ConsistencyChecker::ChangeLog()), ConsistencyChecker::StatusTransitionError);

    try {
        strict_checker.check(prior, current, ConsistencyChecker::ChangeLog());
    } catch (const ConsistencyChecker::StatusTransitionError &x) {
        CHECK_EQ(x.getRecordID(), "Jones2021");
        CHECK_EQ(x.getFrom(), RecordState::REV_INCLUDED);
        CHECK_EQ(x.getTo(), RecordState::MD_PREPARED);
    }

    // Legal transitions never throw.
    current.records_[1].setStatus(RecordState::REV_SYNTHESIZED);
    CHECK_TRUE(strict_checker.check(prior, current, ConsistencyChecker::ChangeLog()).passed());
}


TEST(ManualOverride) {
    const auto prior(MakePriorSnapshot());
    auto current(prior);
    current.records_[1].setStatus(RecordState::MD_PREPARED);

    ConsistencyChecker::ChangeLog change_log;
    change_log.manual_overrides_["Jones2021"] = "reopened after the authors published a correction";
    CHECK_TRUE(change_log.getTransitionRequest("Jones2021").isManualOverride());
    CHECK_FALSE(change_log.getTransitionRequest("Smith2020").isManualOverride());

    ConsistencyChecker::Config config;
    config.strict_mode_ = true;
    CHECK_TRUE(ConsistencyChecker(config).check(prior, current, change_log).passed());
}


TEST(ManualOverrideWithoutReason) {
    const auto prior(MakePriorSnapshot());
    auto current(prior);
    current.records_[1].setStatus(RecordState::MD_PREPARED);
    current.records_.emplace_back(MakeRecord("Smith2020", RecordState::MD_IMPORTED, "000003", "Information system research"));

    ConsistencyChecker::ChangeLog change_log;
    change_log.manual_overrides_["Jones2021"] = "";
    CHECK_FALSE(change_log.getTransitionRequest("Jones2021").isManualOverride());

    // The illegal transition is reported like any other and the remaining checks still contribute their failures.
    const auto result(ConsistencyChecker().check(prior, current, change_log));
    CHECK_FALSE(result.passed());
    CHECK_EQ(result.failures_.size(), 2u);
    CHECK_EQ(result.getFailureCount(ConsistencyChecker::DUPLICATE_IDS_ERROR), 1u);
    CHECK_EQ(result.getFailureCount(ConsistencyChecker::STATUS_TRANSITION_ERROR), 1u);
    if (result.failures_.size() == 2)
        CHECK_EQ(result.failures_[1].toString(),
                 "StatusTransitionError: \"Jones2021\": rev_included -> md_prepared (the manual override has no reason)");
}


TEST(PersistedIDs) {
    const auto prior(MakePriorSnapshot());
    auto current(prior);
    current.records_[0].setID("Smith2020a");

    const ConsistencyChecker checker;
    const auto result(checker.check(prior, current, ConsistencyChecker::ChangeLog()));
    CHECK_EQ(result.failures_.size(), 1u);
    CHECK_EQ(result.getFailureCount(ConsistencyChecker::PROPAGATED_ID_CHANGE), 1u);
    if (not result.failures_.empty()) {
        CHECK_EQ(result.failures_[0].message_, "Smith2020 -> Smith2020a");
        CHECK_EQ(result.failures_[0].record_ids_.size(), 2u);
    }

    ConsistencyChecker::ChangeLog change_log;
    change_log.renames_["Smith2020"] = "Smith2020a";
    CHECK_TRUE(checker.check(prior, current, change_log).passed());

    change_log.renames_["Smith2020"] = "Smith2020b";
    CHECK_FALSE(checker.check(prior, current, change_log).passed());

    // IDs of records that have not been processed yet may still change.
    auto unprocessed_prior(prior);
    unprocessed_prior.records_[0].setStatus(RecordState::MD_PREPARED);
    current.records_[0].setStatus(RecordState::MD_PROCESSED);
    CHECK_TRUE(checker.check(unprocessed_prior, current, ConsistencyChecker::ChangeLog()).passed());
}


TEST(RemovedOrigin) {
    const auto prior(MakePriorSnapshot());
    auto current(prior);
    current.records_[0] = MakeRecord("Smith2020", RecordState::MD_PROCESSED, "000004");

    const auto result(ConsistencyChecker().check(prior, current, ConsistencyChecker::ChangeLog()));
    CHECK_EQ(result.failures_.size(), 1u);
    CHECK_EQ(result.getFailureCount(ConsistencyChecker::ORIGIN_ERROR), 1u);
}


TEST(Origins) {
    ConsistencyChecker::Snapshot current;
    current.sources_.emplace_back(MakeScopusSource());
    current.sources_.emplace_back("data/search/wos.bib", Bib::DB, "", /* available = */ false);

    current.records_.emplace_back(MakeRecord("a", RecordState::MD_PREPARED, "000001"));
    current.records_.emplace_back(MakeRecord("b", RecordState::MD_PREPARED, "000001"));   // shared
    current.records_.emplace_back(MakeRecord("c", RecordState::MD_PREPARED, "999999"));   // not in the source
    current.records_.emplace_back("d", "misc", RecordState::MD_PREPARED);                  // no origin
    current.records_.back().addOrigin("data/search/other.bib/1");                            // undeclared source
    current.records_.emplace_back("e", "misc", RecordState::MD_PREPARED);
    current.records_.back().addOrigin("data/search/wos.bib/1");                              // unavailable source
    current.records_.emplace_back("f", "misc", RecordState::MD_PREPARED);

    const auto result(ConsistencyChecker().check(ConsistencyChecker::Snapshot(), current, ConsistencyChecker::ChangeLog()));
    CHECK_EQ(result.getFailureCount(ConsistencyChecker::ORIGIN_ERROR), 5u);
    CHECK_EQ(result.getFailureCount(ConsistencyChecker::SOURCE_ERROR), 1u);
    CHECK_EQ(result.failures_.size(), 6u);
}


TEST(Sources) {
    ConsistencyChecker::Snapshot current;
    current.sources_.emplace_back(MakeScopusSource());
    current.sources_.emplace_back(MakeScopusSource());
    current.sources_.emplace_back("", Bib::OTHER);

    const auto result(ConsistencyChecker().check(ConsistencyChecker::Snapshot(), current, ConsistencyChecker::ChangeLog()));
    CHECK_EQ(result.getFailureCount(ConsistencyChecker::SOURCE_ERROR), 2u);
    CHECK_EQ(result.failures_.size(), 2u);
}


TEST(Provenance) {
    ConsistencyChecker::Snapshot current;
    current.sources_.emplace_back(MakeScopusSource());

    auto without_provenance(MakeRecord("a", RecordState::MD_PREPARED, "000001"));
    without_provenance.getMasterdataProvenance().clear();
    current.records_.emplace_back(without_provenance);

    auto unsorted_note(MakeRecord("b", RecordState::MD_PREPARED, "000002", "EDITORIAL"));
    unsorted_note.getMasterdataProvenance()["title"].note_ = "mostly-all-caps,incomplete-field";
    current.records_.emplace_back(unsorted_note);

    auto absent_field_with_defect(MakeRecord("c", RecordState::MD_PREPARED, "000003"));
    absent_field_with_defect.getMasterdataProvenance()["journal"] = Bib::Provenance("original", "mostly-all-caps");
    current.records_.emplace_back(absent_field_with_defect);

    auto missing_field(MakeRecord("d", RecordState::MD_PREPARED, "000004"));
    missing_field.getMasterdataProvenance()["journal"] = Bib::Provenance("generic_field_requirements", "missing");
    missing_field.getMasterdataProvenance()["volume"] = Bib::Provenance("generic_field_requirements", "IGNORE:year-format");
    current.records_.emplace_back(missing_field);

    auto empty_source(MakeRecord("e", RecordState::MD_PREPARED, "000005"));
    empty_source.getMasterdataProvenance()["title"].source_.clear();
    current.records_.emplace_back(empty_source);

    const auto result(ConsistencyChecker().check(ConsistencyChecker::Snapshot(), current, ConsistencyChecker::ChangeLog()));
    CHECK_EQ(result.getFailureCount(ConsistencyChecker::FIELD_VALUE_ERROR), 4u);
    CHECK_EQ(result.failures_.size(), 4u);
    for (const auto &failure : result.failures_)
        CHECK_NE(failure.record_ids_.front(), "d");
}


TEST(ScreeningCriteria) {
    ConsistencyChecker::Snapshot current;
    current.sources_.emplace_back(MakeScopusSource());

    current.records_.emplace_back(MakeRecord("excluded_ok", RecordState::REV_EXCLUDED, "000001"));
    current.records_.back().setField(Bib::SCREENING_CRITERIA_KEY, "fit=out;language=in");
    current.records_.emplace_back(MakeRecord("excluded_bad", RecordState::REV_EXCLUDED, "000002"));
    current.records_.back().setField(Bib::SCREENING_CRITERIA_KEY, "fit=in");
    current.records_.emplace_back(MakeRecord("included_bad", RecordState::REV_INCLUDED, "000003"));
    current.records_.back().setField(Bib::SCREENING_CRITERIA_KEY, "fit=out");
    current.records_.emplace_back(MakeRecord("malformed", RecordState::REV_INCLUDED, "000004"));
    current.records_.back().setField(Bib::SCREENING_CRITERIA_KEY, "fit");
    current.records_.emplace_back(MakeRecord("included_ok", RecordState::REV_SYNTHESIZED, "000005"));
    current.records_.back().setField(Bib::SCREENING_CRITERIA_KEY, "fit=in;language=in");

    const auto result(ConsistencyChecker().check(ConsistencyChecker::Snapshot(), current, ConsistencyChecker::ChangeLog()));
    CHECK_EQ(result.getFailureCount(ConsistencyChecker::SCREEN_CRITERIA_ERROR), 3u);
    CHECK_EQ(result.failures_.size(), 3u);

    ConsistencyChecker::Config config;
    config.screening_criteria_ = { "fit" };
    const auto strict_criteria_result(ConsistencyChecker(config).check(ConsistencyChecker::Snapshot(), current,
                                                                        ConsistencyChecker::ChangeLog()));
    CHECK_EQ(strict_criteria_result.getFailureCount(ConsistencyChecker::SCREEN_CRITERIA_ERROR), 5u);
}


TEST(SingleThread) {
    const auto prior(MakePriorSnapshot());
    auto current(prior);
    current.records_[1].setStatus(RecordState::MD_PREPARED);
    current.records_.emplace_back(MakeRecord("Smith2020", RecordState::MD_IMPORTED, "000003"));

    ConsistencyChecker::Config config;
    config.max_threads_ = 1;
    const auto single_threaded_result(ConsistencyChecker(config).check(prior, current, ConsistencyChecker::ChangeLog()));
    const auto multi_threaded_result(ConsistencyChecker().check(prior, current, ConsistencyChecker::ChangeLog()));
    CHECK_EQ(single_threaded_result.toString(), multi_threaded_result.toString());
}


TEST(SnapshotIOTest) {
    auto snapshot(MakePriorSnapshot());
    snapshot.records_[0].getMasterdataProvenance()["journal"] = Bib::Provenance("generic_field_requirements", "missing");
    ConsistencyChecker::ChangeLog change_log;
    change_log.renames_["Smith2019"] = "Smith2020";
    change_log.manual_overrides_["Jones2021"] = "reopened";

    SnapshotIO::Write("ConsistencyCheckerTest_snapshot.json", snapshot, change_log);

    ConsistencyChecker::Snapshot loaded_snapshot;
    ConsistencyChecker::ChangeLog loaded_change_log;
    SnapshotIO::Load("ConsistencyCheckerTest_snapshot.json", &loaded_snapshot, &loaded_change_log);
    std::remove("ConsistencyCheckerTest_snapshot.json");

    CHECK_EQ(loaded_snapshot.records_.size(), 2u);
    CHECK_EQ(loaded_snapshot.sources_.size(), 1u);
    CHECK_TRUE(loaded_change_log.renames_ == change_log.renames_);
    CHECK_TRUE(loaded_change_log.manual_overrides_ == change_log.manual_overrides_);
    CHECK_TRUE(ConsistencyChecker().check(snapshot, loaded_snapshot, loaded_change_log).passed());
    if (loaded_snapshot.records_.size() == 2) {
        CHECK_EQ(loaded_snapshot.records_[1].getStatus(), RecordState::REV_INCLUDED);
        CHECK_TRUE(loaded_snapshot.records_[0].getMasterdataProvenance() == snapshot.records_[0].getMasterdataProvenance());
    }

    // The change log is optional.
    ConsistencyChecker::Snapshot snapshot_only;
    SnapshotIO::FromJSON(SnapshotIO::ToJSON(snapshot, change_log), &snapshot_only, nullptr);
    CHECK_EQ(snapshot_only.records_.size(), 2u);

    CHECK_THROWS(SnapshotIO::Load("ConsistencyCheckerTest_does_not_exist.json", &loaded_snapshot, &loaded_change_log),
                 std::runtime_error);
    auto override_without_reason(SnapshotIO::ToJSON(snapshot, change_log));
    override_without_reason["manual_overrides"]["Jones2021"] = "";
    CHECK_THROWS(SnapshotIO::FromJSON(override_without_reason, &loaded_snapshot, &loaded_change_log), std::runtime_error);
    override_without_reason["manual_overrides"]["Jones2021"] = "  ";
    CHECK_THROWS(SnapshotIO::FromJSON(override_without_reason, &loaded_snapshot, &loaded_change_log), std::runtime_error);

    const auto not_an_object(nlohmann::json::array());
    CHECK_THROWS(SnapshotIO::FromJSON(not_an_object, &loaded_snapshot, nullptr), std::runtime_error);
}


TEST_MAIN(ConsistencyCheckerTest)
