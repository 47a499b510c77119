/** \file   DefectCodes.cc
 *  \brief  Implementation of the defect code vocabulary helpers.
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
#include "DefectCodes.h"
#include "StringUtil.h"


namespace DefectCodes {


const std::set<std::string> &GetAllDefectCodes() {
    static const std::set<std::string> all_defect_codes{
        MOSTLY_ALL_CAPS,
        INCOMPLETE_FIELD,
        NAME_FORMAT_SEPARATORS,
        NAME_FORMAT_TITLES,
        NAME_ABBREVIATED,
        ERRONEOUS_TERM_IN_FIELD,
        ERRONEOUS_SYMBOL_IN_FIELD,
        ERRONEOUS_TITLE_FIELD,
        CONTAINER_TITLE_ABBREVIATED,
        INCONSISTENT_CONTENT,
        IDENTICAL_VALUES_BETWEEN_TITLE_AND_CONTAINER,
        INCONSISTENT_WITH_ENTRYTYPE,
        THESIS_WITH_MULTIPLE_AUTHORS,
        YEAR_FORMAT,
        LANGUAGE_FORMAT_ERROR,
    };
    return all_defect_codes;
}


bool IsValidDefectCode(const std::string &code) {
    return GetAllDefectCodes().find(code) != GetAllDefectCodes().cend();
}


bool IsIgnoreToken(const std::string &token) {
    return StringUtil::StartsWith(token, IGNORE_PREFIX) and IsValidDefectCode(token.substr(IGNORE_PREFIX.length()));
}


bool IsValidNoteToken(const std::string &token) {
    return IsValidDefectCode(token) or IsSentinel(token) or IsIgnoreToken(token);
}


std::vector<std::string> SplitNote(const std::string &note) {
    std::vector<std::string> tokens;
    StringUtil::Split(note, ',', &tokens, /* suppress_empty_components = */ true);
    return tokens;
}


std::string JoinNote(const std::set<std::string> &tokens) {
    return StringUtil::Join(tokens, ',');
}


bool IsWellFormedNote(const std::string &note, std::string * const err_msg) {
    err_msg->clear();
    if (note.empty())
        return true;

    std::vector<std::string> tokens;
    StringUtil::Split(note, ',', &tokens, /* suppress_empty_components = */ false);
    for (const auto &token : tokens) {
        if (token.empty()) {
            *err_msg = "empty token in note \"" + note + "\"";
            return false;
        }
        if (not IsValidNoteToken(token)) {
            *err_msg = "unknown defect code \"" + token + "\"";
            return false;
        }
        if (IsSentinel(token) and tokens.size() > 1) {
            *err_msg = "\"" + token + "\" must not be combined with other codes";
            return false;
        }
    }

    const std::set<std::string> unique_tokens(tokens.cbegin(), tokens.cend());
    if (unique_tokens.size() != tokens.size()) {
        *err_msg = "duplicate codes in note \"" + note + "\"";
        return false;
    }

    if (JoinNote(unique_tokens) != note) {
        *err_msg = "codes are not sorted in note \"" + note + "\"";
        return false;
    }

    return true;
}


std::set<std::string> GetActiveDefects(const std::string &note) {
    std::set<std::string> defects, ignored_defects;
    for (const auto &token : SplitNote(note)) {
        if (StringUtil::StartsWith(token, IGNORE_PREFIX))
            ignored_defects.emplace(token.substr(IGNORE_PREFIX.length()));
        else if (not IsSentinel(token))
            defects.emplace(token);
    }

    for (const auto &ignored_defect : ignored_defects)
        defects.erase(ignored_defect);

    return defects;
}


} // namespace DefectCodes
