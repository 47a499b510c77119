/** \file   DefectCodes.h
 *  \brief  The vocabulary of field defect codes and the helpers that read and write provenance notes.
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
#include <string>
#include <vector>


namespace DefectCodes {


const std::string MOSTLY_ALL_CAPS("mostly-all-caps");
const std::string INCOMPLETE_FIELD("incomplete-field");
const std::string NAME_FORMAT_SEPARATORS("name-format-separators");
const std::string NAME_FORMAT_TITLES("name-format-titles");
const std::string NAME_ABBREVIATED("name-abbreviated");
const std::string ERRONEOUS_TERM_IN_FIELD("erroneous-term-in-field");
const std::string ERRONEOUS_SYMBOL_IN_FIELD("erroneous-symbol-in-field");
const std::string ERRONEOUS_TITLE_FIELD("erroneous-title-field");
const std::string CONTAINER_TITLE_ABBREVIATED("container-title-abbreviated");
const std::string INCONSISTENT_CONTENT("inconsistent-content");
const std::string IDENTICAL_VALUES_BETWEEN_TITLE_AND_CONTAINER("identical-values-between-title-and-container");
const std::string INCONSISTENT_WITH_ENTRYTYPE("inconsistent-with-entrytype");
const std::string THESIS_WITH_MULTIPLE_AUTHORS("thesis-with-multiple-authors");
const std::string YEAR_FORMAT("year-format");
const std::string LANGUAGE_FORMAT_ERROR("language-format-error");

// Sentinels, these never appear together with other tokens.
const std::string MISSING("missing");
const std::string NOT_MISSING("not-missing");

// "IGNORE:<code>" marks a defect that a curator has accepted.
const std::string IGNORE_PREFIX("IGNORE:");


const std::set<std::string> &GetAllDefectCodes();
bool IsValidDefectCode(const std::string &code);


inline bool IsSentinel(const std::string &token) {
    return token == MISSING or token == NOT_MISSING;
}


// True for "IGNORE:<code>" where <code> is a valid defect code.
bool IsIgnoreToken(const std::string &token);


// True if "token" is a defect code, a sentinel or an ignore token.
bool IsValidNoteToken(const std::string &token);


// Splits a note into its tokens.  An empty note yields no tokens.
std::vector<std::string> SplitNote(const std::string &note);


// Produces the canonical note: unique tokens, sorted, comma-joined.
std::string JoinNote(const std::set<std::string> &tokens);


/** \brief  Checks a note for well-formedness.
 *  \param  err_msg  Receives an explanation if the note is malformed.
 *  \return True if every token is valid, sentinels stand alone and the tokens are unique and sorted.
 */
bool IsWellFormedNote(const std::string &note, std::string * const err_msg);


// Returns the defect codes of "note" that have not been marked as ignored, sentinels excluded.
std::set<std::string> GetActiveDefects(const std::string &note);


} // namespace DefectCodes
