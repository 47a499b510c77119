/** \file   TextUtil.cc
 *  \brief  Implementation of UTF-8 and code point utility functions.
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
#include "TextUtil.h"
#include <locale>
#include <stdexcept>
#include <unordered_map>
#include "util.h"


namespace TextUtil {


namespace {


inline bool IsContinuationByte(const char ch) {
    return (static_cast<unsigned char>(ch) & 0b11000000) == 0b10000000;
}


} // unnamed namespace


bool UTF8ToUTF32Decoder::addByte(const char ch) {
    const unsigned char uch(static_cast<unsigned char>(ch));
    if (required_count_ > 0) {
        if (unlikely(not IsContinuationByte(ch))) {
            if (not permissive_)
                throw std::runtime_error("in TextUtil::UTF8ToUTF32Decoder::addByte: bad UTF-8 continuation byte!");
            utf32_char_ = REPLACEMENT_CHARACTER;
            required_count_ = 0;
            return false;
        }
        --required_count_;
        utf32_char_ <<= 6u;
        utf32_char_ |= (uch & 0b00111111);
        if (required_count_ > 0)
            return true;

        // Overlong encodings, surrogates and values beyond the Unicode range:
        if (unlikely(utf32_char_ < min_code_point_ or (utf32_char_ >= 0xD800u and utf32_char_ <= 0xDFFFu)
                     or utf32_char_ > MAX_CODE_POINT))
        {
            if (not permissive_)
                throw std::runtime_error("in TextUtil::UTF8ToUTF32Decoder::addByte: invalid code point "
                                         + std::to_string(utf32_char_) + "!");
            utf32_char_ = REPLACEMENT_CHARACTER;
        }
        return false;
    }

    if (uch <= 0x7Fu) {
        utf32_char_ = uch;
        required_count_ = 0;
    } else if (uch >= 0xC2u and uch <= 0xDFu) {
        utf32_char_ = uch & 0b11111;
        required_count_ = 1;
        min_code_point_ = 0x80u;
    } else if (uch >= 0xE0u and uch <= 0xEFu) {
        utf32_char_ = uch & 0b1111;
        required_count_ = 2;
        min_code_point_ = 0x800u;
    } else if (uch >= 0xF0u and uch <= 0xF4u) {
        utf32_char_ = uch & 0b111;
        required_count_ = 3;
        min_code_point_ = 0x10000u;
    } else if (permissive_) { // Stray continuation bytes, C0, C1 and F5 through FF.
        utf32_char_ = REPLACEMENT_CHARACTER;
        required_count_ = 0;
    } else
        throw std::runtime_error("in TextUtil::UTF8ToUTF32Decoder::addByte: bad UTF-8 lead byte!");

    return required_count_ != 0;
}


bool UTF8ToUTF32(const std::string &utf8_string, std::vector<uint32_t> * const utf32_chars) {
    utf32_chars->clear();
    utf32_chars->reserve(utf8_string.size());

    UTF8ToUTF32Decoder decoder;
    for (const char ch : utf8_string) {
        // A sequence cut short by a new lead or ASCII byte: the new byte still starts a character of its own.
        if (decoder.isCharacterIncomplete() and not IsContinuationByte(ch)) {
            decoder.reset();
            utf32_chars->emplace_back(REPLACEMENT_CHARACTER);
        }

        if (not decoder.addByte(ch))
            utf32_chars->emplace_back(decoder.getUTF32Char());
    }

    if (decoder.isCharacterIncomplete()) {
        utf32_chars->emplace_back(REPLACEMENT_CHARACTER);
        return false;
    }

    return true;
}


std::vector<uint32_t> UTF8ToUTF32(const std::string &utf8_string) {
    std::vector<uint32_t> utf32_chars;
    UTF8ToUTF32(utf8_string, &utf32_chars);
    return utf32_chars;
}


std::string UTF32ToUTF8(const uint32_t code_point) {
    std::string utf8;

    if (code_point <= 0x7Fu)
        utf8 += static_cast<char>(code_point);
    else if (code_point <= 0x7FFu) {
        utf8 += static_cast<char>(0b11000000u | (code_point >> 6u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= 0xFFFFu) {
        utf8 += static_cast<char>(0b11100000u | (code_point >> 12u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else if (code_point <= MAX_CODE_POINT) {
        utf8 += static_cast<char>(0b11110000u | (code_point >> 18u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 12u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | ((code_point >> 6u) & 0b00111111u));
        utf8 += static_cast<char>(0b10000000u | (code_point & 0b00111111u));
    } else
        throw std::runtime_error("in TextUtil::UTF32ToUTF8: invalid Unicode code point " + std::to_string(code_point) + "!");

    return utf8;
}


std::string UTF32ToUTF8(const std::vector<uint32_t> &code_points) {
    std::string utf8;
    for (const auto code_point : code_points)
        utf8 += UTF32ToUTF8(code_point);
    return utf8;
}


size_t CodePointCount(const std::string &utf8_string) {
    return UTF8ToUTF32(utf8_string).size();
}


namespace {


const char * const STANDARD_LOCALE_NAME("C.UTF-8");


const std::ctype<wchar_t> &GetCTypeFacet() {
    static const std::locale standard_locale([]() {
        try {
            return std::locale(STANDARD_LOCALE_NAME);
        } catch (const std::runtime_error &x) {
            LOG_ERROR("the \"" + std::string(STANDARD_LOCALE_NAME) + "\" locale is not available: " + std::string(x.what()));
        }
    }());
    static const std::ctype<wchar_t> &ctype_facet(std::use_facet<std::ctype<wchar_t>>(standard_locale));
    return ctype_facet;
}


} // unnamed namespace


bool IsUppercase(const uint32_t code_point) {
    return GetCTypeFacet().is(std::ctype_base::upper, static_cast<wchar_t>(code_point));
}


bool IsLowercase(const uint32_t code_point) {
    return GetCTypeFacet().is(std::ctype_base::lower, static_cast<wchar_t>(code_point));
}


bool IsLetter(const uint32_t code_point) {
    return GetCTypeFacet().is(std::ctype_base::alpha, static_cast<wchar_t>(code_point));
}


uint32_t UTF32ToLower(const uint32_t code_point) {
    return static_cast<uint32_t>(GetCTypeFacet().tolower(static_cast<wchar_t>(code_point)));
}


bool IsControlCharacter(const uint32_t code_point) {
    return code_point < 0x20u or (code_point >= 0x7Fu and code_point <= 0x9Fu);
}


std::string UTF8ToLower(const std::string &utf8_string) {
    std::string lowercase_utf8_string;
    lowercase_utf8_string.reserve(utf8_string.size());
    for (const auto code_point : UTF8ToUTF32(utf8_string))
        lowercase_utf8_string += UTF32ToUTF8(UTF32ToLower(code_point));

    return lowercase_utf8_string;
}


namespace {


const std::unordered_map<uint32_t, const char *> char_with_diacritics_to_base_letters_map{
    { U'À', "A" },  { U'Á', "A" },  { U'Â', "A" },  { U'Ã', "A" },  { U'Ä', "A" },  { U'Å', "A" },  { U'Æ', "AE" }, { U'Ç', "C" },
    { U'È', "E" },  { U'É', "E" },  { U'Ê', "E" },  { U'Ë', "E" },  { U'Ì', "I" },  { U'Í', "I" },  { U'Î', "I" },  { U'Ï', "I" },
    { U'Ð', "D" },  { U'Ñ', "N" },  { U'Ò', "O" },  { U'Ó', "O" },  { U'Ô', "O" },  { U'Õ', "O" },  { U'Ö', "O" },  { U'Ø', "O" },
    { U'Ù', "U" },  { U'Ú', "U" },  { U'Û', "U" },  { U'Ü', "U" },  { U'Ý', "Y" },  { U'Þ', "TH" }, { U'ß', "ss" }, { U'à', "a" },
    { U'á', "a" },  { U'â', "a" },  { U'ã', "a" },  { U'ä', "a" },  { U'å', "a" },  { U'æ', "ae" }, { U'ç', "c" },  { U'è', "e" },
    { U'é', "e" },  { U'ê', "e" },  { U'ë', "e" },  { U'ì', "i" },  { U'í', "i" },  { U'î', "i" },  { U'ï', "i" },  { U'ð', "d" },
    { U'ñ', "n" },  { U'ò', "o" },  { U'ó', "o" },  { U'ô', "o" },  { U'õ', "o" },  { U'ö', "o" },  { U'ø', "o" },  { U'ù', "u" },
    { U'ú', "u" },  { U'û', "u" },  { U'ü', "u" },  { U'ý', "y" },  { U'þ', "th" }, { U'ÿ', "y" },  { U'Ā', "A" },  { U'ā', "a" },
    { U'Ă', "A" },  { U'ă', "a" },  { U'Ą', "A" },  { U'ą', "a" },  { U'Ć', "C" },  { U'ć', "c" },  { U'Č', "C" },  { U'č', "c" },
    { U'Ď', "D" },  { U'ď', "d" },  { U'Đ', "D" },  { U'đ', "d" },  { U'Ē', "E" },  { U'ē', "e" },  { U'Ė', "E" },  { U'ė', "e" },
    { U'Ę', "E" },  { U'ę', "e" },  { U'Ě', "E" },  { U'ě', "e" },  { U'Ğ', "G" },  { U'ğ', "g" },  { U'Ī', "I" },  { U'ī', "i" },
    { U'İ', "I" },  { U'ı', "i" },  { U'Ł', "L" },  { U'ł', "l" },  { U'Ń', "N" },  { U'ń', "n" },  { U'Ň', "N" },  { U'ň', "n" },
    { U'Ō', "O" },  { U'ō', "o" },  { U'Ő', "O" },  { U'ő', "o" },  { U'Œ', "OE" }, { U'œ', "oe" }, { U'Ř', "R" },  { U'ř', "r" },
    { U'Ś', "S" },  { U'ś', "s" },  { U'Ş', "S" },  { U'ş', "s" },  { U'Š', "S" },  { U'š', "s" },  { U'Ţ', "T" },  { U'ţ', "t" },
    { U'Ť', "T" },  { U'ť', "t" },  { U'Ū', "U" },  { U'ū', "u" },  { U'Ů', "U" },  { U'ů', "u" },  { U'Ű', "U" },  { U'ű', "u" },
    { U'Ÿ', "Y" },  { U'Ź', "Z" },  { U'ź', "z" },  { U'Ż', "Z" },  { U'ż', "z" },  { U'Ž', "Z" },  { U'ž', "z" },
};


inline bool IsCombiningDiacriticalMark(const uint32_t code_point) {
    return code_point >= 0x0300u and code_point <= 0x036Fu;
}


} // unnamed namespace


std::string RemoveDiacritics(const std::string &utf8_string) {
    std::string utf8_without_diacritics;
    utf8_without_diacritics.reserve(utf8_string.size());
    for (const auto code_point : UTF8ToUTF32(utf8_string)) {
        if (IsCombiningDiacriticalMark(code_point))
            continue;

        const auto char_with_and_without_diacritics(char_with_diacritics_to_base_letters_map.find(code_point));
        if (likely(char_with_and_without_diacritics == char_with_diacritics_to_base_letters_map.cend()))
            utf8_without_diacritics += UTF32ToUTF8(code_point);
        else
            utf8_without_diacritics += char_with_and_without_diacritics->second;
    }

    return utf8_without_diacritics;
}


} // namespace TextUtil
