/** \file   ConsistencyChecker.cc
 *  \brief  Implementation of class ConsistencyChecker.
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
#include "ConsistencyChecker.h"
#include <algorithm>
#include <exception>
#include <functional>
#include <iomanip>
#include <iterator>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>
#include "DefectCodes.h"
#include "RecordSimilarity.h"
#include "StringUtil.h"
#include "util.h"


ConsistencyChecker::Config ConsistencyChecker::Config::FromIniFile(const IniFile &ini_file, const std::string &section_name) {
    Config config;
    config.strict_mode_ = ini_file.getBool(section_name, "strict_mode", config.strict_mode_);
    config.max_threads_ = ini_file.getUnsigned(section_name, "max_threads", config.max_threads_);
    if (config.max_threads_ == 0)
        throw std::runtime_error("in ConsistencyChecker::Config::FromIniFile: max_threads must be at least 1!");

    const auto screening_criteria(ini_file.getList(section_name, "screening_criteria", '|'));
    config.screening_criteria_ = std::set<std::string>(screening_criteria.cbegin(), screening_criteria.cend());

    return config;
}


RecordState::TransitionRequest ConsistencyChecker::ChangeLog::getTransitionRequest(const std::string &record_id) const {
    const auto record_id_and_reason(manual_overrides_.find(record_id));
    if (record_id_and_reason == manual_overrides_.cend() or StringUtil::TrimWhite(record_id_and_reason->second).empty())
        return RecordState::TransitionRequest::Automatic();
    return RecordState::TransitionRequest::ManualOverride(record_id_and_reason->second);
}


std::string ConsistencyChecker::FailureKindToString(const FailureKind failure_kind) {
    switch (failure_kind) {
    case SOURCE_ERROR:
        return "SourceError";
    case DUPLICATE_IDS_ERROR:
        return "DuplicateIDsError";
    case PROPAGATED_ID_CHANGE:
        return "PropagatedIDChange";
    case ORIGIN_ERROR:
        return "OriginError";
    case FIELD_VALUE_ERROR:
        return "FieldValueError";
    case STATUS_TRANSITION_ERROR:
        return "StatusTransitionError";
    case SCREEN_CRITERIA_ERROR:
        return "ScreenCriteriaError";
    }

    LOG_ERROR("unexpected failure kind " + std::to_string(failure_kind) + "!");
}


unsigned ConsistencyChecker::Result::getFailureCount(const FailureKind failure_kind) const {
    return std::count_if(failures_.cbegin(), failures_.cend(),
                         [failure_kind](const Failure &failure) { return failure.kind_ == failure_kind; });
}


std::string ConsistencyChecker::Result::toString() const {
    if (failures_.empty())
        return "Everything ok.";

    std::string result;
    for (const auto &failure : failures_) {
        if (not result.empty())
            result += '\n';
        result += failure.toString();
    }
    return result;
}


ConsistencyChecker::StatusTransitionError::StatusTransitionError(const std::string &record_id, const RecordState::State from,
                                                                 const RecordState::State to)
    : std::runtime_error("in ConsistencyChecker: illegal status transition of \"" + record_id + "\" from "
                         + RecordState::StateToString(from) + " to " + RecordState::StateToString(to) + "!"),
      record_id_(record_id), from_(from), to_(to) { }


const std::vector<ConsistencyChecker::Check> ConsistencyChecker::CHECKS{
    { "checkSources", &ConsistencyChecker::checkSources },
    { "checkDuplicateIDs", &ConsistencyChecker::checkDuplicateIDs },
    { "checkPersistedIDs", &ConsistencyChecker::checkPersistedIDs },
    { "checkOrigins", &ConsistencyChecker::checkOrigins },
    { "checkProvenance", &ConsistencyChecker::checkProvenance },
    { "checkStatusTransitions", &ConsistencyChecker::checkStatusTransitions },
    { "checkScreeningCriteria", &ConsistencyChecker::checkScreeningCriteria },
};


namespace {


void CheckWorker(const std::vector<std::function<void()>> * const tasks, size_t * const next_task, std::mutex * const next_task_mutex) {
    for (;;) {
        size_t task_index;
        {
            std::lock_guard<std::mutex> next_task_mutex_locker(*next_task_mutex);
            if (*next_task >= tasks->size())
                return;
            task_index = (*next_task)++;
        }
        (*tasks)[task_index]();
    }
}


} // unnamed namespace


ConsistencyChecker::Result ConsistencyChecker::check(const Snapshot &prior, const Snapshot &current, const ChangeLog &change_log) const {
    std::vector<std::vector<Failure>> check_failures(CHECKS.size());
    std::vector<std::exception_ptr> check_exceptions(CHECKS.size());

    std::vector<std::function<void()>> tasks;
    for (size_t check_index(0); check_index < CHECKS.size(); ++check_index) {
        tasks.emplace_back([this, check_index, &prior, &current, &change_log, &check_failures, &check_exceptions]() {
            const auto &check(CHECKS[check_index]);
            LOG_DEBUG(check.name_ + " called");
            try {
                (this->*check.function_)(prior, current, change_log, &check_failures[check_index]);
            } catch (...) {
                check_exceptions[check_index] = std::current_exception();
                return;
            }
            LOG_DEBUG(check.name_ + ": " + (check_failures[check_index].empty() ? "passed" : "failed"));
        });
    }

    const unsigned thread_count(std::max(1u, std::min(config_.max_threads_, static_cast<unsigned>(tasks.size()))));
    size_t next_task(0);
    std::mutex next_task_mutex;
    std::vector<std::thread> thread_pool;
    for (unsigned i(0); i < thread_count; ++i)
        thread_pool.emplace_back(CheckWorker, &tasks, &next_task, &next_task_mutex);
    for (auto &worker_thread : thread_pool)
        worker_thread.join();

    for (const auto &check_exception : check_exceptions) {
        if (check_exception != nullptr)
            std::rethrow_exception(check_exception);
    }

    Result result;
    for (auto &failures : check_failures)
        std::move(failures.begin(), failures.end(), std::back_inserter(result.failures_));
    result.status_ = result.failures_.empty() ? PASS : FAIL;

    return result;
}


void ConsistencyChecker::checkSources(const Snapshot &/*prior*/, const Snapshot &current, const ChangeLog &/*change_log*/,
                                      std::vector<Failure> * const failures) const
{
    std::set<std::string> seen_filenames;
    for (const auto &source : current.sources_) {
        if (source.filename_.empty()) {
            failures->emplace_back(SOURCE_ERROR, std::vector<std::string>{}, "source with an empty filename");
            continue;
        }

        if (not seen_filenames.emplace(source.filename_).second)
            failures->emplace_back(SOURCE_ERROR, std::vector<std::string>{}, "duplicate source filename \"" + source.filename_ + "\"");
        if (not source.available_)
            failures->emplace_back(SOURCE_ERROR, std::vector<std::string>{}, "source \"" + source.filename_ + "\" is not available");
    }
}


void ConsistencyChecker::checkDuplicateIDs(const Snapshot &/*prior*/, const Snapshot &current, const ChangeLog &/*change_log*/,
                                           std::vector<Failure> * const failures) const
{
    std::map<std::string, std::vector<const Bib::Record *>> ids_to_records;
    for (const auto &record : current.records_)
        ids_to_records[record.getID()].emplace_back(&record);

    for (const auto &id_and_records : ids_to_records) {
        const auto &records(id_and_records.second);
        if (records.size() < 2)
            continue;

        std::ostringstream message;
        message << "ID \"" << id_and_records.first << "\" occurs " << records.size()
                << " times (similarity of the first two records: " << std::fixed << std::setprecision(2)
                << RecordSimilarity::Similarity(*records[0], *records[1]) << ")";
        failures->emplace_back(DUPLICATE_IDS_ERROR, std::vector<std::string>{ id_and_records.first }, message.str());
    }
}


namespace {


// Maps each origin to the first record that lists it.
std::unordered_map<std::string, const Bib::Record *> GetOriginsToRecordsMap(const std::vector<Bib::Record> &records) {
    std::unordered_map<std::string, const Bib::Record *> origins_to_records;
    for (const auto &record : records) {
        for (const auto &origin : record.getOrigins())
            origins_to_records.emplace(origin, &record);
    }
    return origins_to_records;
}


// Pairs up prior and current records, primarily via shared origins and via IDs otherwise.
std::vector<std::pair<const Bib::Record *, const Bib::Record *>> AlignRecords(const std::vector<Bib::Record> &prior_records,
                                                                              const std::vector<Bib::Record> &current_records)
{
    const auto origins_to_current_records(GetOriginsToRecordsMap(current_records));
    std::unordered_map<std::string, const Bib::Record *> ids_to_current_records;
    for (const auto &current_record : current_records)
        ids_to_current_records.emplace(current_record.getID(), &current_record);

    std::vector<std::pair<const Bib::Record *, const Bib::Record *>> aligned_records;
    for (const auto &prior_record : prior_records) {
        const Bib::Record *current_record(nullptr);
        for (const auto &origin : prior_record.getOrigins()) {
            const auto origin_and_record(origins_to_current_records.find(origin));
            if (origin_and_record != origins_to_current_records.cend()) {
                current_record = origin_and_record->second;
                break;
            }
        }

        if (current_record == nullptr) {
            const auto id_and_record(ids_to_current_records.find(prior_record.getID()));
            if (id_and_record != ids_to_current_records.cend())
                current_record = id_and_record->second;
        }

        if (current_record != nullptr)
            aligned_records.emplace_back(&prior_record, current_record);
    }

    return aligned_records;
}


} // unnamed namespace


void ConsistencyChecker::checkPersistedIDs(const Snapshot &prior, const Snapshot &current, const ChangeLog &change_log,
                                           std::vector<Failure> * const failures) const
{
    if (prior.records_.empty())
        return;

    const auto origins_to_current_records(GetOriginsToRecordsMap(current.records_));
    std::set<std::pair<std::string, std::string>> reported_id_changes;
    for (const auto &prior_record : prior.records_) {
        if (not RecordState::IsPersisted(prior_record.getStatus()))
            continue;

        for (const auto &origin : prior_record.getOrigins()) {
            const auto origin_and_current_record(origins_to_current_records.find(origin));
            if (origin_and_current_record == origins_to_current_records.cend()) {
                failures->emplace_back(ORIGIN_ERROR, std::vector<std::string>{ prior_record.getID() },
                                       "origin \"" + origin + "\" of \"" + prior_record.getID() + "\" was removed");
                continue;
            }

            const auto &old_id(prior_record.getID());
            const auto &new_id(origin_and_current_record->second->getID());
            if (old_id == new_id or not reported_id_changes.emplace(old_id, new_id).second)
                continue;

            const auto old_and_new_id(change_log.renames_.find(old_id));
            if (old_and_new_id != change_log.renames_.cend() and old_and_new_id->second == new_id)
                LOG_INFO("accepted the logged renaming of \"" + old_id + "\" to \"" + new_id + "\".");
            else
                failures->emplace_back(PROPAGATED_ID_CHANGE, std::vector<std::string>{ old_id, new_id }, old_id + " -> " + new_id);
        }
    }
}


void ConsistencyChecker::checkOrigins(const Snapshot &/*prior*/, const Snapshot &current, const ChangeLog &/*change_log*/,
                                      std::vector<Failure> * const failures) const
{
    std::unordered_map<std::string, const Bib::Source *> filenames_to_sources;
    for (const auto &source : current.sources_)
        filenames_to_sources.emplace(source.filename_, &source);

    std::unordered_map<std::string, std::string> origins_to_record_ids;
    for (const auto &record : current.records_) {
        if (record.getOrigins().empty()) {
            failures->emplace_back(ORIGIN_ERROR, std::vector<std::string>{ record.getID() }, "\"" + record.getID() + "\" has no origin");
            continue;
        }

        for (const auto &origin : record.getOrigins()) {
            const auto origin_and_record_id(origins_to_record_ids.find(origin));
            if (origin_and_record_id != origins_to_record_ids.cend()) {
                failures->emplace_back(ORIGIN_ERROR, std::vector<std::string>{ origin_and_record_id->second, record.getID() },
                                       "origin \"" + origin + "\" is shared by \"" + origin_and_record_id->second + "\" and \""
                                           + record.getID() + "\"");
                continue;
            }
            origins_to_record_ids.emplace(origin, record.getID());

            std::string source_filename, source_record_id;
            if (not Bib::ParseOrigin(origin, &source_filename, &source_record_id)) {
                failures->emplace_back(ORIGIN_ERROR, std::vector<std::string>{ record.getID() },
                                       "malformed origin \"" + origin + "\" in \"" + record.getID() + "\"");
                continue;
            }

            const auto filename_and_source(filenames_to_sources.find(source_filename));
            if (filename_and_source == filenames_to_sources.cend())
                failures->emplace_back(ORIGIN_ERROR, std::vector<std::string>{ record.getID() },
                                       "origin \"" + origin + "\" of \"" + record.getID() + "\" refers to the undeclared source \""
                                           + source_filename + "\"");
            else if (not filename_and_source->second->available_)
                failures->emplace_back(ORIGIN_ERROR, std::vector<std::string>{ record.getID() },
                                       "origin \"" + origin + "\" of \"" + record.getID() + "\" refers to the unavailable source \""
                                           + source_filename + "\"");
            else if (filename_and_source->second->record_ids_.find(source_record_id) == filename_and_source->second->record_ids_.cend())
                failures->emplace_back(ORIGIN_ERROR, std::vector<std::string>{ record.getID() },
                                       "origin \"" + origin + "\" of \"" + record.getID() + "\" does not exist in \"" + source_filename
                                           + "\"");
        }
    }
}


namespace {


// Absent fields may only be annotated as (not-)missing or carry ignore tokens.
bool IsValidNoteForAbsentField(const std::string &note) {
    if (note == DefectCodes::MISSING or note == DefectCodes::NOT_MISSING)
        return true;

    const auto tokens(DefectCodes::SplitNote(note));
    if (tokens.empty())
        return false;

    for (const auto &token : tokens) {
        if (not DefectCodes::IsIgnoreToken(token))
            return false;
    }
    return true;
}


} // unnamed namespace


void ConsistencyChecker::checkProvenance(const Snapshot &/*prior*/, const Snapshot &current, const ChangeLog &/*change_log*/,
                                         std::vector<Failure> * const failures) const
{
    for (const auto &record : current.records_) {
        const auto &record_id(record.getID());
        for (const auto &field_name : Bib::GetMasterdataFields()) {
            if (not record.hasUsableField(field_name))
                continue;

            const auto provenance(record.findMasterdataProvenance(field_name));
            if (provenance == nullptr)
                failures->emplace_back(FIELD_VALUE_ERROR, std::vector<std::string>{ record_id },
                                       "\"" + field_name + "\" of \"" + record_id + "\" has no provenance");
            else if (provenance->source_.empty())
                failures->emplace_back(FIELD_VALUE_ERROR, std::vector<std::string>{ record_id },
                                       "the provenance of \"" + field_name + "\" of \"" + record_id + "\" has no source");
        }

        for (const auto &field_name_and_provenance : record.getMasterdataProvenance()) {
            const auto &field_name(field_name_and_provenance.first);
            const auto &note(field_name_and_provenance.second.note_);

            std::string err_msg;
            if (not DefectCodes::IsWellFormedNote(note, &err_msg))
                failures->emplace_back(FIELD_VALUE_ERROR, std::vector<std::string>{ record_id },
                                       "bad note for \"" + field_name + "\" of \"" + record_id + "\": " + err_msg);
            else if (not record.hasUsableField(field_name) and not IsValidNoteForAbsentField(note))
                failures->emplace_back(FIELD_VALUE_ERROR, std::vector<std::string>{ record_id },
                                       "\"" + field_name + "\" of \"" + record_id + "\" is absent but its note is \"" + note + "\"");
        }
    }
}


void ConsistencyChecker::checkStatusTransitions(const Snapshot &prior, const Snapshot &current, const ChangeLog &change_log,
                                                std::vector<Failure> * const failures) const
{
    if (prior.records_.empty())
        return;

    for (const auto &prior_and_current_record : AlignRecords(prior.records_, current.records_)) {
        const auto from(prior_and_current_record.first->getStatus());
        const auto to(prior_and_current_record.second->getStatus());
        if (from == to or RecordState::IsValidTransition(from, to))
            continue;

        const auto &record_id(prior_and_current_record.second->getID());
        const auto transition_request(change_log.getTransitionRequest(record_id));
        if (RecordState::Validate(from, to, transition_request)) {
            LOG_WARNING("manual override for \"" + record_id + "\" (" + RecordState::StateToString(from) + " -> "
                        + RecordState::StateToString(to) + "): " + transition_request.getReason());
            continue;
        }

        if (config_.strict_mode_)
            throw StatusTransitionError(record_id, from, to);
        std::string message("\"" + record_id + "\": " + RecordState::StateToString(from) + " -> " + RecordState::StateToString(to));
        if (change_log.manual_overrides_.find(record_id) != change_log.manual_overrides_.cend())
            message += " (the manual override has no reason)";
        failures->emplace_back(STATUS_TRANSITION_ERROR, std::vector<std::string>{ record_id }, message);
    }
}


void ConsistencyChecker::checkScreeningCriteria(const Snapshot &/*prior*/, const Snapshot &current, const ChangeLog &/*change_log*/,
                                                std::vector<Failure> * const failures) const
{
    for (const auto &record : current.records_) {
        const auto &record_id(record.getID());

        std::vector<Bib::ScreeningCriterion> criteria;
        std::string err_msg;
        if (not Bib::ParseScreeningCriteria(record.getField(Bib::SCREENING_CRITERIA_KEY), &criteria, &err_msg)) {
            failures->emplace_back(SCREEN_CRITERIA_ERROR, std::vector<std::string>{ record_id },
                                   "malformed screening criteria in \"" + record_id + "\": " + err_msg);
            continue;
        }

        bool has_exclusion_criterion(false);
        for (const auto &criterion : criteria) {
            if (not config_.screening_criteria_.empty()
                and config_.screening_criteria_.find(criterion.name_) == config_.screening_criteria_.cend())
                failures->emplace_back(SCREEN_CRITERIA_ERROR, std::vector<std::string>{ record_id },
                                       "unknown screening criterion \"" + criterion.name_ + "\" in \"" + record_id + "\"");
            if (not criterion.included_)
                has_exclusion_criterion = true;
        }

        const auto status(record.getStatus());
        if (status == RecordState::REV_EXCLUDED and not has_exclusion_criterion)
            failures->emplace_back(SCREEN_CRITERIA_ERROR, std::vector<std::string>{ record_id },
                                   "\"" + record_id + "\" was excluded without an exclusion criterion");
        else if ((status == RecordState::REV_INCLUDED or status == RecordState::REV_SYNTHESIZED) and has_exclusion_criterion)
            failures->emplace_back(SCREEN_CRITERIA_ERROR, std::vector<std::string>{ record_id },
                                   "\"" + record_id + "\" was included despite an exclusion criterion");
    }
}
