/** \file    StringUtil.cc
 *  \brief   Implementation of string utility functions.
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
#include "StringUtil.h"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>


namespace StringUtil {


std::string ToLower(std::string * const s) {
    for (auto &ch : *s)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));

    return *s;
}


std::string ToLower(const std::string &s) {
    std::string result(s);
    return ToLower(&result);
}


std::string ToUpper(const std::string &s) {
    std::string result(s);
    for (auto &ch : result)
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));

    return result;
}


std::string RightTrim(const std::string &trim_set, std::string * const s) {
    const auto last_non_trim_char(s->find_last_not_of(trim_set));
    if (last_non_trim_char == std::string::npos)
        s->clear();
    else
        s->erase(last_non_trim_char + 1);

    return *s;
}


std::string LeftTrim(const std::string &trim_set, std::string * const s) {
    const auto first_non_trim_char(s->find_first_not_of(trim_set));
    if (first_non_trim_char == std::string::npos)
        s->clear();
    else
        s->erase(0, first_non_trim_char);

    return *s;
}


std::string Trim(const std::string &trim_set, std::string * const s) {
    RightTrim(trim_set, s);
    return LeftTrim(trim_set, s);
}


// CollapseAndTrimWhitespace -- Collapses multiple occurrences of whitespace into a single space and removes leading
// and trailing whitespace.
std::string &CollapseAndTrimWhitespace(std::string * const s) {
    std::string result;
    result.reserve(s->size());

    bool last_char_was_space(true);
    for (const char ch : *s) {
        if (WHITE_SPACE.find(ch) != std::string::npos) {
            if (not last_char_was_space) {
                result += ' ';
                last_char_was_space = true;
            }
        } else {
            result += ch;
            last_char_was_space = false;
        }
    }

    // Trim a trailing space, if necessary:
    if (not result.empty() and result.back() == ' ')
        result.pop_back();

    return *s = result;
}


// ToUnsigned -- convert a string to an unsigned number.
//
bool ToUnsigned(const std::string &s, unsigned * const n, const unsigned base) {
    std::string::const_iterator ch(s.begin());
    while (ch != s.end() and std::isspace(static_cast<unsigned char>(*ch)))
        ++ch;
    if (unlikely(ch == s.end() or *ch == '-'))
        return false;

    char *end_ptr;
    errno = 0;
    const unsigned long ul(std::strtoul(s.c_str(), &end_ptr, static_cast<int>(base)));
    *n = static_cast<unsigned>(ul);

    return (*end_ptr == '\0') and (errno == 0) and (ul <= UINT_MAX);
}


unsigned ToUnsigned(const std::string &s, const unsigned base) {
    unsigned n;
    if (unlikely(not ToUnsigned(s, &n, base)))
        throw std::runtime_error("in StringUtil::ToUnsigned: can't convert \"" + s + "\" to an unsigned!");

    return n;
}


// ToDouble -- convert a string to a double-precision number.
//
bool ToDouble(const std::string &s, double * const n) {
    if (unlikely(s.empty()))
        return false;

    char *end_ptr;
    errno = 0;
    *n = std::strtod(s.c_str(), &end_ptr);

    return (*end_ptr == '\0') and (errno == 0);
}


double ToDouble(const std::string &s) {
    double n;
    if (unlikely(not ToDouble(s, &n)))
        throw std::runtime_error("in StringUtil::ToDouble: can't convert \"" + s + "\"!");

    return n;
}


bool ToBool(const std::string &value, bool * const b) {
    if (::strcasecmp(value.c_str(), "true") == 0 or ::strcasecmp(value.c_str(), "yes") == 0
        or ::strcasecmp(value.c_str(), "on") == 0)
    {
        *b = true;
        return true;
    }

    if (::strcasecmp(value.c_str(), "false") == 0 or ::strcasecmp(value.c_str(), "off") == 0
        or ::strcasecmp(value.c_str(), "no") == 0)
    {
        *b = false;
        return true;
    }

    return false;
}


bool ToBool(const std::string &value) {
    bool b;
    if (likely(ToBool(value, &b)))
        return b;

    throw std::runtime_error("in StringUtil::ToBool: can't convert \"" + value + "\" to a bool!");
}


bool IsUnsignedNumber(const std::string &s) {
    if (s.empty())
        return false;

    for (const char ch : s) {
        if (not IsDigit(ch))
            return false;
    }

    return true;
}


std::string &ReplaceString(const std::string &old_text, const std::string &new_text, std::string * const s, const bool global) {
    if (old_text.empty())
        return *s;

    std::string::size_type old_text_start_pos(s->find(old_text));
    while (old_text_start_pos != std::string::npos) {
        s->replace(old_text_start_pos, old_text.length(), new_text);
        if (not global)
            break;
        old_text_start_pos = s->find(old_text, old_text_start_pos + new_text.length());
    }

    return *s;
}


std::string CStyleUnescape(const std::string &escaped_text) {
    std::string unescaped_text;
    for (std::string::const_iterator ch(escaped_text.begin()); ch != escaped_text.end(); ++ch) {
        if (*ch != '\\') {
            unescaped_text += *ch;
            continue;
        }

        ++ch;
        if (unlikely(ch == escaped_text.end()))
            throw std::runtime_error("in StringUtil::CStyleUnescape: unexpected end of escaped string!");

        if (*ch == 'x' or *ch == 'X') { // Hexadecimal escape.
            std::string hex_digits;
            for (unsigned i(0); i < 2; ++i) {
                ++ch;
                if (unlikely(ch == escaped_text.end()))
                    throw std::runtime_error("in StringUtil::CStyleUnescape: unexpected end of hex escape!");
                hex_digits += *ch;
            }
            unsigned char_value;
            if (unlikely(not ToUnsigned(hex_digits, &char_value, 16)))
                throw std::runtime_error("in StringUtil::CStyleUnescape: bad hex escape!");
            unescaped_text += static_cast<char>(char_value);
        } else if (*ch >= '0' and *ch <= '7') { // Octal escape.
            std::string octal_digits(1, *ch);
            for (unsigned i(0); i < 2; ++i) {
                ++ch;
                if (unlikely(ch == escaped_text.end()))
                    throw std::runtime_error("in StringUtil::CStyleUnescape: unexpected end of octal escape!");
                octal_digits += *ch;
            }
            unsigned char_value;
            if (unlikely(not ToUnsigned(octal_digits, &char_value, 8)))
                throw std::runtime_error("in StringUtil::CStyleUnescape: bad octal escape (\\" + octal_digits + ")!");
            unescaped_text += static_cast<char>(char_value);
        } else {
            switch (*ch) {
            case 'n':
                unescaped_text += '\n';
                break;
            case 't':
                unescaped_text += '\t';
                break;
            case 'r':
                unescaped_text += '\r';
                break;
            case 'f':
                unescaped_text += '\f';
                break;
            case 'v':
                unescaped_text += '\v';
                break;
            case '\\':
                unescaped_text += '\\';
                break;
            case '\'':
                unescaped_text += '\'';
                break;
            case '"':
                unescaped_text += '"';
                break;
            default:
                throw std::runtime_error("in StringUtil::CStyleUnescape: unknown escape '\\" + std::string(1, *ch) + "'!");
            }
        }
    }

    return unescaped_text;
}


} // namespace StringUtil
