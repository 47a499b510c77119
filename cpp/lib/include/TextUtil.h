/** \file   TextUtil.h
 *  \brief  Declarations of UTF-8 and code point utility functions.
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


#include <string>
#include <vector>
#include <cinttypes>


namespace TextUtil {


constexpr uint32_t REPLACEMENT_CHARACTER(0xFFFDu);
constexpr uint32_t MAX_CODE_POINT(0x10FFFFu);


class UTF8ToUTF32Decoder {
    int required_count_;
    uint32_t utf32_char_;
    uint32_t min_code_point_;
    bool permissive_;

public:
    /** \param permissive  If false, we throw a std::runtime_error on encoding errors, if true we return Unicode replacement
     *                     characters.  Overlong forms, surrogates and values above MAX_CODE_POINT count as encoding errors.
     */
    explicit UTF8ToUTF32Decoder(const bool permissive = true)
        : required_count_(-1), utf32_char_(0), min_code_point_(0), permissive_(permissive) { }

    /** \return True if more bytes are needed to complete the current code point, else false.  In the latter case you
     *          should call getUTF32Char().
     */
    bool addByte(const char ch);

    bool isCharacterIncomplete() const { return required_count_ > 0; }

    // Abandons a partially decoded character.
    void reset() { required_count_ = -1; }

    uint32_t getUTF32Char() {
        required_count_ = -1;
        return utf32_char_;
    }
};


/** \brief Converts "utf8_string" to a sequence of code points.  Invalid byte sequences, including a truncated trailing
 *         sequence, are decoded as REPLACEMENT_CHARACTER so that the result only holds valid code points.
 *  \return False if "utf8_string" ended in the middle of a multibyte sequence, else true.
 */
bool UTF8ToUTF32(const std::string &utf8_string, std::vector<uint32_t> * const utf32_chars);


// Never fails.
std::vector<uint32_t> UTF8ToUTF32(const std::string &utf8_string);


/** \throws std::runtime_error if "code_point" is not a valid Unicode code point. */
std::string UTF32ToUTF8(const uint32_t code_point);


std::string UTF32ToUTF8(const std::vector<uint32_t> &code_points);


// Returns the number of code points in "utf8_string", counting every invalid sequence as one.
size_t CodePointCount(const std::string &utf8_string);


/* The following classification and case-mapping functions use the character classes of the "C.UTF-8" locale,
 * independent of the process' locale settings.  A missing "C.UTF-8" locale is fatal.
 */
bool IsUppercase(const uint32_t code_point);
bool IsLowercase(const uint32_t code_point);

// Includes the caseless scripts.
bool IsLetter(const uint32_t code_point);

uint32_t UTF32ToLower(const uint32_t code_point);

bool IsControlCharacter(const uint32_t code_point);

// Invalid UTF-8 sequences become REPLACEMENT_CHARACTERs.
std::string UTF8ToLower(const std::string &utf8_string);


/** \brief Replaces characters with diacritical marks with their unmarked base letters and drops combining marks.
 *  \note  Invalid UTF-8 sequences are passed through as REPLACEMENT_CHARACTERs.
 */
std::string RemoveDiacritics(const std::string &utf8_string);


} // namespace TextUtil
