/** \file   LanguageCodes.h
 *  \brief  ISO 639 language code lookups.
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


namespace LanguageCodes {


// Recognises every code of the ISO 639-3 code table (individual languages, macrolanguages and the special codes).
bool IsValidISO639_3Code(const std::string &code);


/** \brief  Maps a two-letter ISO 639-1 code to its ISO 639-3 equivalent.
 *  \return False if "iso639_1_code" is unknown.  The comparison is case-insensitive.
 */
bool MapISO639_1ToISO639_3(const std::string &iso639_1_code, std::string * const iso639_3_code);


} // namespace LanguageCodes
