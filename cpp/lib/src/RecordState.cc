/** \file   RecordState.cc
 *  \brief  Implementation of the record lifecycle functions.
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
#include "RecordState.h"
#include <map>
#include "util.h"


namespace RecordState {


namespace {


const std::map<std::string, State> string_to_state_map{
    { "md_retrieved", MD_RETRIEVED },
    { "md_imported", MD_IMPORTED },
    { "md_needs_manual_preparation", MD_NEEDS_MANUAL_PREPARATION },
    { "md_prepared", MD_PREPARED },
    { "md_needs_manual_deduplication", MD_NEEDS_MANUAL_DEDUPLICATION },
    { "md_processed", MD_PROCESSED },
    { "rev_prescreen_excluded", REV_PRESCREEN_EXCLUDED },
    { "rev_prescreen_included", REV_PRESCREEN_INCLUDED },
    { "pdf_needs_manual_retrieval", PDF_NEEDS_MANUAL_RETRIEVAL },
    { "pdf_imported", PDF_IMPORTED },
    { "pdf_not_available", PDF_NOT_AVAILABLE },
    { "pdf_needs_manual_preparation", PDF_NEEDS_MANUAL_PREPARATION },
    { "pdf_prepared", PDF_PREPARED },
    { "rev_excluded", REV_EXCLUDED },
    { "rev_included", REV_INCLUDED },
    { "rev_synthesized", REV_SYNTHESIZED },
};


const std::map<std::string, Operation> string_to_operation_map{
    { "load", LOAD },       { "prep", PREP },           { "prep_man", PREP_MAN }, { "dedupe", DEDUPE },
    { "dedupe_man", DEDUPE_MAN }, { "prescreen", PRESCREEN }, { "pdf_get", PDF_GET },   { "pdf_get_man", PDF_GET_MAN },
    { "pdf_prep", PDF_PREP }, { "pdf_prep_man", PDF_PREP_MAN }, { "screen", SCREEN },   { "data", DATA },
};


const std::vector<Transition> transitions{
    { MD_RETRIEVED, MD_IMPORTED, LOAD },
    { MD_IMPORTED, MD_NEEDS_MANUAL_PREPARATION, PREP },
    { MD_IMPORTED, MD_PREPARED, PREP },
    { MD_NEEDS_MANUAL_PREPARATION, MD_PREPARED, PREP_MAN },
    { MD_PREPARED, MD_NEEDS_MANUAL_PREPARATION, PREP_MAN, /* reverting = */ true },
    { MD_PREPARED, MD_NEEDS_MANUAL_DEDUPLICATION, DEDUPE },
    { MD_PREPARED, MD_PROCESSED, DEDUPE },
    { MD_NEEDS_MANUAL_DEDUPLICATION, MD_PROCESSED, DEDUPE_MAN },
    { MD_PROCESSED, MD_NEEDS_MANUAL_DEDUPLICATION, DEDUPE_MAN, /* reverting = */ true },
    { MD_PROCESSED, REV_PRESCREEN_EXCLUDED, PRESCREEN },
    { MD_PROCESSED, REV_PRESCREEN_INCLUDED, PRESCREEN },
    { REV_PRESCREEN_INCLUDED, PDF_IMPORTED, PDF_GET },
    { REV_PRESCREEN_INCLUDED, PDF_NEEDS_MANUAL_RETRIEVAL, PDF_GET },
    { PDF_NEEDS_MANUAL_RETRIEVAL, PDF_IMPORTED, PDF_GET_MAN },
    { PDF_NEEDS_MANUAL_RETRIEVAL, PDF_NOT_AVAILABLE, PDF_GET_MAN },
    { PDF_IMPORTED, PDF_NEEDS_MANUAL_RETRIEVAL, PDF_GET_MAN, /* reverting = */ true },
    { PDF_IMPORTED, PDF_NEEDS_MANUAL_PREPARATION, PDF_PREP },
    { PDF_IMPORTED, PDF_PREPARED, PDF_PREP },
    { PDF_NEEDS_MANUAL_PREPARATION, PDF_PREPARED, PDF_PREP_MAN },
    { PDF_PREPARED, PDF_NEEDS_MANUAL_PREPARATION, PDF_PREP_MAN, /* reverting = */ true },
    { PDF_PREPARED, REV_EXCLUDED, SCREEN },
    { PDF_PREPARED, REV_INCLUDED, SCREEN },
    { REV_INCLUDED, REV_SYNTHESIZED, DATA },
};


} // unnamed namespace


bool StringToState(const std::string &state_string, State * const state) {
    const auto string_and_state(string_to_state_map.find(state_string));
    if (string_and_state == string_to_state_map.cend())
        return false;

    *state = string_and_state->second;
    return true;
}


State StringToState(const std::string &state_string) {
    State state;
    if (unlikely(not StringToState(state_string, &state)))
        throw UnknownStateError(state_string);

    return state;
}


std::string StateToString(const State state) {
    switch (state) {
    case MD_RETRIEVED:
        return "md_retrieved";
    case MD_IMPORTED:
        return "md_imported";
    case MD_NEEDS_MANUAL_PREPARATION:
        return "md_needs_manual_preparation";
    case MD_PREPARED:
        return "md_prepared";
    case MD_NEEDS_MANUAL_DEDUPLICATION:
        return "md_needs_manual_deduplication";
    case MD_PROCESSED:
        return "md_processed";
    case REV_PRESCREEN_EXCLUDED:
        return "rev_prescreen_excluded";
    case REV_PRESCREEN_INCLUDED:
        return "rev_prescreen_included";
    case PDF_NEEDS_MANUAL_RETRIEVAL:
        return "pdf_needs_manual_retrieval";
    case PDF_IMPORTED:
        return "pdf_imported";
    case PDF_NOT_AVAILABLE:
        return "pdf_not_available";
    case PDF_NEEDS_MANUAL_PREPARATION:
        return "pdf_needs_manual_preparation";
    case PDF_PREPARED:
        return "pdf_prepared";
    case REV_EXCLUDED:
        return "rev_excluded";
    case REV_INCLUDED:
        return "rev_included";
    case REV_SYNTHESIZED:
        return "rev_synthesized";
    }

    LOG_ERROR("we should *never* get here!");
}


const std::vector<State> &GetAllStates() {
    static const std::vector<State> all_states{
        MD_RETRIEVED,           MD_IMPORTED,       MD_NEEDS_MANUAL_PREPARATION, MD_PREPARED,
        MD_NEEDS_MANUAL_DEDUPLICATION, MD_PROCESSED, REV_PRESCREEN_EXCLUDED,   REV_PRESCREEN_INCLUDED,
        PDF_NEEDS_MANUAL_RETRIEVAL, PDF_IMPORTED,   PDF_NOT_AVAILABLE,           PDF_NEEDS_MANUAL_PREPARATION,
        PDF_PREPARED,           REV_EXCLUDED,      REV_INCLUDED,                REV_SYNTHESIZED,
    };
    return all_states;
}


bool StringToOperation(const std::string &operation_string, Operation * const operation) {
    const auto string_and_operation(string_to_operation_map.find(operation_string));
    if (string_and_operation == string_to_operation_map.cend())
        return false;

    *operation = string_and_operation->second;
    return true;
}


std::string OperationToString(const Operation operation) {
    for (const auto &string_and_operation : string_to_operation_map) {
        if (string_and_operation.second == operation)
            return string_and_operation.first;
    }

    LOG_ERROR("unknown operation " + std::to_string(operation) + "!");
}


const std::vector<Transition> &GetTransitions() {
    return transitions;
}


bool IsValidTransition(const State from, const State to) {
    Operation dummy;
    return GetOperationForTransition(from, to, &dummy);
}


std::set<State> GetAllowedNextStates(const State from) {
    std::set<State> next_states;
    for (const auto &transition : transitions) {
        if (transition.from_ == from)
            next_states.emplace(transition.to_);
    }

    return next_states;
}


bool IsTerminal(const State state) {
    return GetAllowedNextStates(state).empty();
}


bool IsExcluded(const State state) {
    return state == REV_PRESCREEN_EXCLUDED or state == PDF_NOT_AVAILABLE or state == REV_EXCLUDED;
}


bool IsManualState(const State state) {
    return state == MD_NEEDS_MANUAL_PREPARATION or state == MD_NEEDS_MANUAL_DEDUPLICATION or state == PDF_NEEDS_MANUAL_RETRIEVAL
           or state == PDF_NEEDS_MANUAL_PREPARATION;
}


bool GetOperationForTransition(const State from, const State to, Operation * const operation) {
    for (const auto &transition : transitions) {
        if (transition.from_ == from and transition.to_ == to) {
            *operation = transition.operation_;
            return true;
        }
    }

    return false;
}


std::set<State> GetOperationSourceStates(const Operation operation) {
    std::set<State> source_states;
    for (const auto &transition : transitions) {
        if (transition.operation_ == operation and not transition.reverting_)
            source_states.emplace(transition.from_);
    }

    return source_states;
}


std::set<State> GetPrecedingStates(const Operation operation) {
    const auto source_states(GetOperationSourceStates(operation));

    // Walk the forward edges backwards, starting at the source states:
    std::set<State> preceding_states;
    std::vector<State> work_list(source_states.cbegin(), source_states.cend());
    while (not work_list.empty()) {
        const State state(work_list.back());
        work_list.pop_back();
        for (const auto &transition : transitions) {
            if (transition.to_ != state or transition.reverting_)
                continue;
            if (source_states.find(transition.from_) != source_states.cend())
                continue;
            if (preceding_states.emplace(transition.from_).second)
                work_list.emplace_back(transition.from_);
        }
    }

    return preceding_states;
}


std::set<State> CheckOperationPrecondition(const Operation operation, const std::set<State> &states_present) {
    std::set<State> violating_states;
    for (const auto state : GetPrecedingStates(operation)) {
        if (states_present.find(state) != states_present.cend())
            violating_states.emplace(state);
    }

    return violating_states;
}


TransitionRequest TransitionRequest::ManualOverride(const std::string &reason) {
    if (unlikely(reason.empty()))
        throw std::runtime_error("in RecordState::TransitionRequest::ManualOverride: a manual override requires a reason!");

    return TransitionRequest(MANUAL_OVERRIDE, reason);
}


bool Validate(const State from, const State to, const TransitionRequest &request) {
    if (request.isManualOverride())
        return true;

    return IsValidTransition(from, to);
}


} // namespace RecordState
