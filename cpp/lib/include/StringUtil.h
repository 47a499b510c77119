/** \file   StringUtil.h
 *  \brief  String utility functions.
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


#include <stdexcept>
#include <string>
#include <cstring>
#include <strings.h>
#include "util.h"


namespace StringUtil {


const std::string WHITE_SPACE(" \t\n\v\r\f");


/** \brief  Convert a string to lowercase (modifies its argument).  Only ASCII letters are affected. */
std::string ToLower(std::string * const s);


/** \brief  Convert a string to lowercase (does not modify its argument).  Only ASCII letters are affected. */
std::string ToLower(const std::string &s);


/** \brief  Convert a string to uppercase (does not modify its argument).  Only ASCII letters are affected. */
std::string ToUpper(const std::string &s);


/** \brief   Remove all occurences of a set of characters from the end of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string RightTrim(const std::string &trim_set, std::string * const s);


/** \brief   Remove all occurences of a set of characters from the beginning of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string LeftTrim(const std::string &trim_set, std::string * const s);


/** \brief   Remove all occurences of a set of characters from either end of a string.
 *  \param   trim_set  The set of characters to remove.
 *  \param   s         The string to trim.
 *  \return  The trimmed string.
 */
std::string Trim(const std::string &trim_set, std::string * const s);


inline std::string Trim(const std::string &trim_set, const std::string &s) {
    std::string temp_s(s);
    return Trim(trim_set, &temp_s);
}


inline std::string TrimWhite(std::string * const s) {
    return Trim(WHITE_SPACE, s);
}


inline std::string TrimWhite(const std::string &s) {
    std::string temp_s(s);
    return TrimWhite(&temp_s);
}


/** \brief  Collapses multiple occurrences of whitespace into a single space and removes leading and trailing whitespace.
 *  \param  s The input string that will be "collapsed."
 *  \return A reference to the modified string "s".
 */
std::string &CollapseAndTrimWhitespace(std::string * const s);


inline std::string CollapseAndTrimWhitespace(const std::string &s) {
    std::string temp_s(s);
    return CollapseAndTrimWhitespace(&temp_s);
}


/** \brief  Convert a string to an unsigned number.
 *  \return True if the entire string "s" was a valid unsigned number, else false.
 */
bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base = 10);


/** \throws std::runtime_error if "s" is not a valid unsigned number. */
unsigned ToUnsigned(const std::string &s, const unsigned base = 10);


bool ToDouble(const std::string &s, double * const n);


/** \throws std::runtime_error if "s" is not a valid floating point number. */
double ToDouble(const std::string &s);


/** \brief Accepts "true", "yes", "on", "false", "no" and "off", ignoring case. */
bool ToBool(const std::string &value, bool * const b);


/** \throws std::runtime_error if "value" is not one of the strings accepted by the two-argument version. */
bool ToBool(const std::string &value);


/** \brief  Replaces occurrences of "old_text" in "*s".
 *  \param  global  If false only the first occurrence is replaced.
 */
std::string &ReplaceString(const std::string &old_text, const std::string &new_text, std::string * const s, const bool global = true);


inline std::string ReplaceString(const std::string &old_text, const std::string &new_text, const std::string &s,
                                 const bool global = true) {
    std::string temp_s(s);
    return ReplaceString(old_text, new_text, &temp_s, global);
}


// Converts C-style escapes like \n, \t, \x41 or \101 back to the characters they represent.
std::string CStyleUnescape(const std::string &escaped_text);


inline bool IsDigit(const char ch) {
    return ch >= '0' and ch <= '9';
}


// Assumes a character set where a-z and A-Z are consecutive, e.g. ASCII.
inline bool IsAsciiLetter(const char ch) {
    return (ch >= 'a' and ch <= 'z') or (ch >= 'A' and ch <= 'Z');
}


// Returns true if "s" is non-empty and consists of ASCII digits only.
bool IsUnsignedNumber(const std::string &s);


/** \brief   Does the given string start with the suggested prefix?
 *  \param   s            The string to test.
 *  \param   prefix       The prefix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or starts with the prefix "prefix."
 */
inline bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false) {
    return prefix.empty()
           or (s.length() >= prefix.length()
               and (ignore_case ? (::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)
                                : (std::strncmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)));
}


/** \brief   Does the given string end with the suggested suffix?
 *  \param   s            The string to test.
 *  \param   suffix       The suffix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or ends with the suffix "suffix."
 */
inline bool EndsWith(const std::string &s, const std::string &suffix, const bool ignore_case = false) {
    return suffix.empty()
           or (s.length() >= suffix.length()
               and (ignore_case ? (::strncasecmp(s.c_str() + (s.length() - suffix.length()), suffix.c_str(), suffix.length()) == 0)
                                : (std::strncmp(s.c_str() + (s.length() - suffix.length()), suffix.c_str(), suffix.length()) == 0)));
}


/** Returns true if "s" ends with "possible_last_char", else returns false. */
inline bool EndsWith(const std::string &s, const char possible_last_char) {
    return not s.empty() and s[s.length() - 1] == possible_last_char;
}


inline bool Contains(const std::string &s, const std::string &needle) {
    return s.find(needle) != std::string::npos;
}


/** \brief  Split a string around a delimiter string.
 *  \param  source                     The string to split.
 *  \param  delimiter_string           The string to split around.
 *  \param  container                  A list to return the resulting fields in.
 *  \param  suppress_empty_components  If true we will not return empty fields.
 *  \return The number of extracted "fields".
 */
template <typename InsertableContainer>
unsigned Split(const std::string &source, const std::string &delimiter_string, InsertableContainer * const container,
               const bool suppress_empty_components = true) {
    if (unlikely(delimiter_string.empty()))
        throw std::runtime_error("in StringUtil::Split: empty delimiter string!");

    container->clear();
    if (source.empty())
        return 0;

    unsigned count(0);
    std::string::size_type start(0);
    for (;;) {
        const auto next_delimiter(source.find(delimiter_string, start));
        const std::string component(next_delimiter == std::string::npos ? source.substr(start)
                                                                        : source.substr(start, next_delimiter - start));
        if (not suppress_empty_components or not component.empty()) {
            container->insert(container->end(), component);
            ++count;
        }

        if (next_delimiter == std::string::npos)
            return count;
        start = next_delimiter + delimiter_string.length();
    }
}


/** \brief  Split a string around a delimiter character.
 *  \param  source                     The string to split.
 *  \param  delimiter                  The character to split around.
 *  \param  container                  A list to return the resulting fields in.
 *  \param  suppress_empty_components  If true we will not return empty fields.
 *  \return The number of extracted "fields".
 */
template <typename InsertableContainer>
inline unsigned Split(const std::string &source, const char delimiter, InsertableContainer * const container,
                      const bool suppress_empty_components = true) {
    return Split(source, std::string(1, delimiter), container, suppress_empty_components);
}


/** \brief  Split a string around any of the characters in "delimiters".
 *  \return The number of extracted "fields".
 */
template <typename InsertableContainer>
unsigned SplitOnAnyOf(const std::string &source, const std::string &delimiters, InsertableContainer * const container,
                      const bool suppress_empty_components = true) {
    container->clear();
    if (source.empty())
        return 0;

    unsigned count(0);
    std::string::size_type start(0);
    for (;;) {
        const auto next_delimiter(source.find_first_of(delimiters, start));
        const std::string component(next_delimiter == std::string::npos ? source.substr(start)
                                                                        : source.substr(start, next_delimiter - start));
        if (not suppress_empty_components or not component.empty()) {
            container->insert(container->end(), component);
            ++count;
        }

        if (next_delimiter == std::string::npos)
            return count;
        start = next_delimiter + 1;
    }
}


/** \brief  Splits "s" around "field_separator" and then trims whitespace from both ends of each of the resulting fields.
 *  \return The number of extracted "fields".
 */
template <typename InsertableContainer>
unsigned SplitThenTrimWhite(const std::string &s, const char field_separator, InsertableContainer * const container,
                            const bool suppress_empty_words = true) {
    InsertableContainer untrimmed;
    Split(s, field_separator, &untrimmed, /* suppress_empty_components = */ false);

    container->clear();
    for (auto component : untrimmed) {
        TrimWhite(&component);
        if (not suppress_empty_words or not component.empty())
            container->insert(container->end(), component);
    }

    return static_cast<unsigned>(container->size());
}


/** \brief  Join a list of words to form a single string and return that string
 *  \param  source     A container of strings.
 *  \param  separator  The text to insert between the list elements.
 */
template <typename StringContainer>
std::string Join(const StringContainer &source, const std::string &separator) {
    std::string dest;
    for (auto element(source.cbegin()); element != source.cend(); ++element) {
        if (element != source.cbegin())
            dest += separator;
        dest += *element;
    }

    return dest;
}


template <typename StringContainer>
inline std::string Join(const StringContainer &source, const char separator) {
    return Join(source, std::string(1, separator));
}


} // namespace StringUtil
