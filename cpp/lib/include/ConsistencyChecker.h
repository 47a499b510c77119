/** \file   ConsistencyChecker.h
 *  \brief  Validates a pair of record snapshots against the integrity rules of the review pipeline.
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
#pragma once


#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "Bib.h"
#include "IniFile.h"
#include "RecordState.h"


class ConsistencyChecker {
public:
    struct Config {
        static constexpr unsigned DEFAULT_MAX_THREADS = 4;

        // If true, the first illegal status transition throws a StatusTransitionError.
        bool strict_mode_;
        unsigned max_threads_;

        // The known screening criteria, if empty all well-formed names are accepted.
        std::set<std::string> screening_criteria_;

    public:
        Config(): strict_mode_(false), max_threads_(DEFAULT_MAX_THREADS) { }
        static Config FromIniFile(const IniFile &ini_file, const std::string &section_name = "ConsistencyChecker");
    };

    // The records and sources of one point in time.
    struct Snapshot {
        std::vector<Bib::Record> records_;
        std::vector<Bib::Source> sources_;
    };

    // The explicitly logged changes between two snapshots.
    struct ChangeLog {
        std::map<std::string, std::string> renames_;          // old ID -> new ID
        std::map<std::string, std::string> manual_overrides_; // record ID -> reason

    public:
        // An override without a reason does not authorise anything and yields an automatic request.
        RecordState::TransitionRequest getTransitionRequest(const std::string &record_id) const;
    };

    enum FailureKind {
        SOURCE_ERROR,
        DUPLICATE_IDS_ERROR,
        PROPAGATED_ID_CHANGE,
        ORIGIN_ERROR,
        FIELD_VALUE_ERROR,
        STATUS_TRANSITION_ERROR,
        SCREEN_CRITERIA_ERROR
    };

    static std::string FailureKindToString(const FailureKind failure_kind);

    struct Failure {
        FailureKind kind_;
        std::vector<std::string> record_ids_;
        std::string message_;

    public:
        Failure(const FailureKind kind, const std::vector<std::string> &record_ids, const std::string &message)
            : kind_(kind), record_ids_(record_ids), message_(message) { }

        std::string toString() const { return FailureKindToString(kind_) + ": " + message_; }
    };

    enum Status { PASS, FAIL };

    struct Result {
        Status status_;
        std::vector<Failure> failures_;

    public:
        Result(): status_(PASS) { }

        inline bool passed() const { return status_ == PASS; }
        unsigned getFailureCount(const FailureKind failure_kind) const;
        std::string toString() const;
    };

    class StatusTransitionError : public std::runtime_error {
        std::string record_id_;
        RecordState::State from_, to_;

    public:
        StatusTransitionError(const std::string &record_id, const RecordState::State from, const RecordState::State to);

        inline const std::string &getRecordID() const { return record_id_; }
        inline RecordState::State getFrom() const { return from_; }
        inline RecordState::State getTo() const { return to_; }
    };

private:
    typedef void (ConsistencyChecker::*CheckFunction)(const Snapshot &prior, const Snapshot &current, const ChangeLog &change_log,
                                                      std::vector<Failure> * const failures) const;

    struct Check {
        std::string name_;
        CheckFunction function_;
    };

    static const std::vector<Check> CHECKS;

    const Config config_;

public:
    explicit ConsistencyChecker(const Config &config = Config()): config_(config) { }

    inline const Config &getConfig() const { return config_; }

    /** \brief  Runs all checks, concurrently on up to config.max_threads_ threads.
     *  \return The failures of all checks, in check order.
     *  \throws StatusTransitionError in strict mode.
     *  \note   Neither snapshot is modified.  "prior" may be empty.
     */
    Result check(const Snapshot &prior, const Snapshot &current, const ChangeLog &change_log) const;

private:
    void checkSources(const Snapshot &prior, const Snapshot &current, const ChangeLog &change_log,
                      std::vector<Failure> * const failures) const;
    void checkDuplicateIDs(const Snapshot &prior, const Snapshot &current, const ChangeLog &change_log,
                           std::vector<Failure> * const failures) const;
    void checkPersistedIDs(const Snapshot &prior, const Snapshot &current, const ChangeLog &change_log,
                           std::vector<Failure> * const failures) const;
    void checkOrigins(const Snapshot &prior, const Snapshot &current, const ChangeLog &change_log,
                      std::vector<Failure> * const failures) const;
    void checkProvenance(const Snapshot &prior, const Snapshot &current, const ChangeLog &change_log,
                         std::vector<Failure> * const failures) const;
    void checkStatusTransitions(const Snapshot &prior, const Snapshot &current, const ChangeLog &change_log,
                                std::vector<Failure> * const failures) const;
    void checkScreeningCriteria(const Snapshot &prior, const Snapshot &current, const ChangeLog &change_log,
                                std::vector<Failure> * const failures) const;
};
