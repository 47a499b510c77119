/** \file   RecordState.h
 *  \brief  The record lifecycle: status vocabulary, legal transitions and operation preconditions.
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


#include <set>
#include <stdexcept>
#include <string>
#include <vector>


namespace RecordState {


// In pipeline order.  IsPersisted() and the operation preconditions rely on this order!
enum State {
    MD_RETRIEVED,
    MD_IMPORTED,
    MD_NEEDS_MANUAL_PREPARATION,
    MD_PREPARED,
    MD_NEEDS_MANUAL_DEDUPLICATION,
    MD_PROCESSED,
    REV_PRESCREEN_EXCLUDED,
    REV_PRESCREEN_INCLUDED,
    PDF_NEEDS_MANUAL_RETRIEVAL,
    PDF_IMPORTED,
    PDF_NOT_AVAILABLE,
    PDF_NEEDS_MANUAL_PREPARATION,
    PDF_PREPARED,
    REV_EXCLUDED,
    REV_INCLUDED,
    REV_SYNTHESIZED
};


// The operations that move records between states.
enum Operation { LOAD, PREP, PREP_MAN, DEDUPE, DEDUPE_MAN, PRESCREEN, PDF_GET, PDF_GET_MAN, PDF_PREP, PDF_PREP_MAN, SCREEN, DATA };


// Thrown for status strings outside of our vocabulary.
class UnknownStateError : public std::runtime_error {
public:
    explicit UnknownStateError(const std::string &state_string)
        : std::runtime_error("in RecordState::StringToState: unknown record status \"" + state_string + "\"!") { }
};


bool StringToState(const std::string &state_string, State * const state);

/** \throws UnknownStateError */
State StringToState(const std::string &state_string);

std::string StateToString(const State state);

const std::vector<State> &GetAllStates();

bool StringToOperation(const std::string &operation_string, Operation * const operation);
std::string OperationToString(const Operation operation);


struct Transition {
    State from_, to_;
    Operation operation_;

    // True for the edges that send a record from an automatic state back to the corresponding manual state.
    bool reverting_;

public:
    Transition(const State from, const State to, const Operation operation, const bool reverting = false)
        : from_(from), to_(to), operation_(operation), reverting_(reverting) { }
};


// The complete adjacency table.
const std::vector<Transition> &GetTransitions();


// A self-edge is never a valid transition.
bool IsValidTransition(const State from, const State to);


std::set<State> GetAllowedNextStates(const State from);


// Terminal states have no outgoing edges.
bool IsTerminal(const State state);


// True for the states on one of the rejection branches, i.e. REV_PRESCREEN_EXCLUDED, PDF_NOT_AVAILABLE and REV_EXCLUDED.
bool IsExcluded(const State state);


// True for the *_NEEDS_MANUAL_* states.
bool IsManualState(const State state);


// A record is considered persisted once it has reached MD_PROCESSED, from then on its ID must not change.
inline bool IsPersisted(const State state) {
    return state >= MD_PROCESSED;
}


/** \brief  Determines the operation that owns the from -> to edge.
 *  \return False if there is no such edge.
 */
bool GetOperationForTransition(const State from, const State to, Operation * const operation);


// The states that "operation" acts on.
std::set<State> GetOperationSourceStates(const Operation operation);


// All states from which a source state of "operation" can still be reached via forward edges.
std::set<State> GetPrecedingStates(const Operation operation);


/** \brief  Checks whether "operation" may start on a collection whose records are in "states_present".
 *  \return The present states that still precede the operation's source states.  The operation may start iff the result
 *          is empty.
 */
std::set<State> CheckOperationPrecondition(const Operation operation, const std::set<State> &states_present);


/** \class TransitionRequest
 *  \brief Distinguishes ordinary, automatic status changes from explicitly authorised manual overrides.
 */
class TransitionRequest {
public:
    enum Kind { AUTOMATIC, MANUAL_OVERRIDE };

private:
    Kind kind_;
    std::string reason_;

    TransitionRequest(const Kind kind, const std::string &reason): kind_(kind), reason_(reason) { }

public:
    static TransitionRequest Automatic() { return TransitionRequest(AUTOMATIC, ""); }

    /** \throws std::runtime_error if "reason" is empty. */
    static TransitionRequest ManualOverride(const std::string &reason);

    inline Kind getKind() const { return kind_; }
    inline bool isManualOverride() const { return kind_ == MANUAL_OVERRIDE; }
    inline const std::string &getReason() const { return reason_; }
};


/** \brief  Validates a requested status change.
 *  \return IsValidTransition(from, to) for automatic requests.  Manual overrides are always accepted, it is the caller's
 *          responsibility to audit them.
 */
bool Validate(const State from, const State to, const TransitionRequest &request);


} // namespace RecordState
