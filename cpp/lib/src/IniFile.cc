/** \file    IniFile.cc
 *  \brief   Implementation of class IniFile.
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
#include "IniFile.h"
#include <fstream>
#include <stdexcept>
#include <cctype>
#include <cerrno>
#include <cstring>
#include "StringUtil.h"
#include "util.h"


void IniFile::Section::insert(const std::string &variable_name, const std::string &value, const std::string &comment) {
    // Handle comment-only lines first:
    if (variable_name.empty() and value.empty()) {
        entries_.emplace_back("", "", comment);
        return;
    }

    const auto existing_entry(std::find_if(entries_.begin(), entries_.end(),
                                           [&variable_name](const Entry &entry) { return entry.name_ == variable_name; }));
    if (existing_entry == entries_.end())
        entries_.emplace_back(variable_name, value, comment);
    else {
        existing_entry->value_ = value;
        existing_entry->comment_ = comment;
    }
}


bool IniFile::Section::lookup(const std::string &variable_name, std::string * const s) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end()) {
        s->clear();
        return false;
    }

    *s = existing_entry->value_;
    return true;
}


double IniFile::Section::getDouble(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        LOG_ERROR("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    double number;
    if (not StringUtil::ToDouble(existing_entry->value_, &number))
        LOG_ERROR("invalid double entry \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return number;
}


double IniFile::Section::getDouble(const std::string &variable_name, const double default_value) const {
    return hasEntry(variable_name) ? getDouble(variable_name) : default_value;
}


std::string IniFile::Section::getString(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        LOG_ERROR("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return existing_entry->value_;
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const auto existing_entry(find(variable_name));
    if (existing_entry == end())
        return default_value;

    return existing_entry->value_;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        LOG_ERROR("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    unsigned number;
    if (not StringUtil::ToUnsigned(existing_entry->value_, &number))
        LOG_ERROR("invalid unsigned entry \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    return number;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name, const unsigned default_value) const {
    return hasEntry(variable_name) ? getUnsigned(variable_name) : default_value;
}


bool IniFile::Section::getBool(const std::string &variable_name) const {
    const auto existing_entry(find(variable_name));
    if (unlikely(existing_entry == end()))
        LOG_ERROR("can't find \"" + variable_name + "\" in section \"" + section_name_ + "\"!");

    bool retval;
    if (not StringUtil::ToBool(existing_entry->value_, &retval))
        LOG_ERROR("invalid boolean value in section \"" + section_name_ + "\", entry \"" + variable_name + "\" (bad value is \""
                  + existing_entry->value_ + "\")!");

    return retval;
}


bool IniFile::Section::getBool(const std::string &variable_name, const bool default_value) const {
    return hasEntry(variable_name) ? getBool(variable_name) : default_value;
}


std::vector<std::string> IniFile::Section::getList(const std::string &variable_name, const char separator,
                                                   const std::vector<std::string> &default_value) const
{
    const auto existing_entry(find(variable_name));
    if (existing_entry == end())
        return default_value;

    std::vector<std::string> items;
    StringUtil::SplitThenTrimWhite(existing_entry->value_, separator, &items);
    return items;
}


IniFile::IniFile(const std::string &ini_file_name, const bool ignore_failed_includes)
    : ini_file_name_(ini_file_name), ignore_failed_includes_(ignore_failed_includes)
{
    processFile(ini_file_name_);
}


void IniFile::processSectionHeader(const std::string &line) {
    if (line[line.length() - 1] != ']')
        throw std::runtime_error("in IniFile::processSectionHeader: garbled section header on line " + std::to_string(getCurrentLineNo())
                                 + " in file \"" + getCurrentFile() + "\"!");

    current_section_name_ = line.substr(1, line.length() - 2);
    StringUtil::Trim(" \t", &current_section_name_);
    if (current_section_name_.empty())
        throw std::runtime_error("in IniFile::processSectionHeader: empty section name on line " + std::to_string(getCurrentLineNo())
                                 + " in file \"" + getCurrentFile() + "\"!");

    if (sectionIsDefined(current_section_name_))
        throw std::runtime_error("in IniFile::processSectionHeader: duplicate section \"" + current_section_name_ + "\" on line "
                                 + std::to_string(getCurrentLineNo()) + " in file \"" + getCurrentFile() + "\"!");
    sections_.emplace_back(current_section_name_);
}


void IniFile::processInclude(const std::string &line) {
    if (unlikely(line.find('=') != std::string::npos))
        throw std::runtime_error("in IniFile::processInclude: unexpected '=' on line " + std::to_string(getCurrentLineNo()) + " in file \""
                                 + getCurrentFile() + "\"!");

    std::string include_filename(line.substr(__builtin_strlen("include")));
    StringUtil::Trim(" \t", &include_filename);
    if (include_filename[0] == '"') {
        if (include_filename.length() < 3 or include_filename[include_filename.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processInclude: garbled include file name on line " + std::to_string(getCurrentLineNo())
                                     + " in file \"" + getCurrentFile() + "\"!");
        include_filename = include_filename.substr(1, include_filename.length() - 2);
    }

    if (include_filename[0] != '/') {
        const auto last_slash_pos(getCurrentFile().rfind('/'));
        if (last_slash_pos != std::string::npos)
            include_filename = getCurrentFile().substr(0, last_slash_pos + 1) + include_filename;
    }

    processFile(include_filename);
}


void IniFile::processInherit(const std::string &line, Section * const current_section) {
    if (not StringUtil::StartsWith(line, "@inherit "))
        throw std::runtime_error("in IniFile::processInherit: malformed @inherit statement on line " + std::to_string(getCurrentLineNo())
                                 + " in file \"" + getCurrentFile() + "\"!");

    const auto quoted_section_name(StringUtil::TrimWhite(line.substr(__builtin_strlen("@inherit "))));
    if (quoted_section_name.length() < 3 or quoted_section_name.front() != '"' or quoted_section_name.back() != '"')
        throw std::runtime_error("in IniFile::processInherit: malformed @inherit statement on line " + std::to_string(getCurrentLineNo())
                                 + " in file \"" + getCurrentFile() + "\"! (2)");

    const auto section_name(quoted_section_name.substr(1, quoted_section_name.length() - 2));
    const auto section(getSection(section_name));
    if (unlikely(section == sections_.cend()))
        throw std::runtime_error("in IniFile::processInherit: unknown section name \"" + section_name + "\" in @inherit statement on line "
                                 + std::to_string(getCurrentLineNo()) + " in file \"" + getCurrentFile() + "\"!");

    const Section inherited_section(*section); // "current_section" may alias a vector element.
    for (const auto &entry : inherited_section)
        current_section->insert(entry.name_, entry.value_, entry.comment_);
}


namespace {


// IsValidVariableName -- only allow names that start with a letter followed by letters, digits,
// hyphens, underscores and periods.
//
bool IsValidVariableName(const std::string &possible_variable_name) {
    if (unlikely(possible_variable_name.empty()))
        return false;

    auto ch(possible_variable_name.cbegin());
    if (not std::isalpha(static_cast<unsigned char>(*ch)))
        return false;

    for (++ch; ch != possible_variable_name.cend(); ++ch) {
        if (not std::isalnum(static_cast<unsigned char>(*ch)) and *ch != '-' and *ch != '_' and *ch != '.')
            return false;
    }

    return true;
}


std::string StripComment(std::string * const line, std::string * const comment) {
    comment->clear();

    bool inside_string_literal(false);
    for (auto character(line->begin()); character != line->end(); ++character) {
        if (*character == '"')
            inside_string_literal = not inside_string_literal;
        else if (*character == '#') {
            if (character != line->begin() and *(character - 1) == '\\')
                continue; // skip escaped hash characters
            if (inside_string_literal)
                continue;

            size_t comment_start_pos(std::distance(line->begin(), character));
            while (comment_start_pos > 0 and (*line)[comment_start_pos - 1] == ' ')
                --comment_start_pos;
            *comment = line->substr(comment_start_pos);
            line->resize(comment_start_pos);
            return *line;
        }
    }

    return *line;
}


} // unnamed namespace


void IniFile::processSectionEntry(const std::string &line, const std::string &comment) {
    const size_t equal_sign(line.find('='));
    if (equal_sign == std::string::npos) { // A bare variable name means "true".
        const std::string trimmed_line(StringUtil::Trim(" \t", line));
        if (unlikely(not IsValidVariableName(trimmed_line)))
            throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + trimmed_line + "\" on line "
                                     + std::to_string(getCurrentLineNo()) + " in file \"" + getCurrentFile() + "\"!");

        sections_.back().insert(trimmed_line, "true");
        return;
    }

    const std::string variable_name(StringUtil::Trim(" \t", line.substr(0, equal_sign)));
    if (variable_name.empty())
        throw std::runtime_error("in IniFile::processSectionEntry: missing variable name on line " + std::to_string(getCurrentLineNo())
                                 + " in file \"" + getCurrentFile() + "\"!");
    if (not IsValidVariableName(variable_name))
        throw std::runtime_error("in IniFile::processSectionEntry: invalid variable name \"" + variable_name + "\" on line "
                                 + std::to_string(getCurrentLineNo()) + " in file \"" + getCurrentFile() + "\"!");

    std::string value(StringUtil::Trim(" \t", line.substr(equal_sign + 1)));
    if (not value.empty() and value[0] == '"') { // double-quoted string
        if (value.length() == 1 or value[value.length() - 1] != '"')
            throw std::runtime_error("in IniFile::processSectionEntry: improperly quoted value on line "
                                     + std::to_string(getCurrentLineNo()) + " in file \"" + getCurrentFile() + "\"!");

        try {
            value = StringUtil::CStyleUnescape(value.substr(1, value.length() - 2));
        } catch (const std::runtime_error &x) {
            throw std::runtime_error("in IniFile::processSectionEntry: bad escape on line " + std::to_string(getCurrentLineNo())
                                     + " in file \"" + getCurrentFile() + "\"! (" + std::string(x.what()) + ")");
        }
    }

    sections_.back().insert(variable_name, value, comment);
}


void IniFile::processFile(const std::string &filename) {
    std::ifstream ini_file(filename.c_str());
    if (ini_file.fail()) {
        if (ignore_failed_includes_ and filename != ini_file_name_)
            return;
        throw std::runtime_error("in IniFile::processFile: can't open \"" + filename + "\"! (" + std::string(std::strerror(errno)) + ")");
    }

    include_file_infos_.push(IncludeFileInfo(filename));

    std::string buf;
    while (std::getline(ini_file, buf)) {
        ++getCurrentLineNo();
        std::string line(StringUtil::Trim(" \t\r", buf));

        // Join lines as long as they end in a backslash:
        while (not line.empty() and line.back() == '\\' and std::getline(ini_file, buf)) {
            ++getCurrentLineNo();
            line = StringUtil::Trim(" \t", line.substr(0, line.length() - 1)) + StringUtil::Trim(" \t\r", buf);
        }

        std::string comment;
        StripComment(&line, &comment);
        StringUtil::Trim(" \t", &line);
        if (line.empty()) {
            if (sections_.empty())
                sections_.emplace_back("");
            sections_.back().insert("", "", comment);
            continue;
        }

        if (line[0] == '[') // should be a section header!
            processSectionHeader(line);
        else if (line.length() > 7 and line.substr(0, 7) == "include" and (line[7] == ' ' or line[7] == '\t'))
            processInclude(line);
        else if (StringUtil::StartsWith(line, "@inherit")) {
            if (unlikely(sections_.empty()))
                throw std::runtime_error("in IniFile::processFile: file \"" + filename + "\": @inherit in global section!");
            processInherit(line, &(sections_.back()));
        } else { // should be a new setting!
            if (sections_.empty())
                sections_.emplace_back("");
            processSectionEntry(line, comment);
        }
    }

    include_file_infos_.pop();
}


bool IniFile::lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        return false;

    return section->lookup(variable_name, s);
}


double IniFile::getDouble(const std::string &section_name, const std::string &variable_name) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        LOG_ERROR("no such section: \"" + section_name + "\"! (variable: \"" + variable_name + "\")");

    return section->getDouble(variable_name);
}


double IniFile::getDouble(const std::string &section_name, const std::string &variable_name, const double default_value) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        return default_value;

    return section->getDouble(variable_name, default_value);
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        LOG_ERROR("no such section: \"" + section_name + "\"! (variable: \"" + variable_name + "\")");

    return section->getString(variable_name);
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        return default_value;

    return section->getString(variable_name, default_value);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        LOG_ERROR("no such section: \"" + section_name + "\"! (variable: \"" + variable_name + "\")");

    return section->getUnsigned(variable_name);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        return default_value;

    return section->getUnsigned(variable_name, default_value);
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        LOG_ERROR("no such section: \"" + section_name + "\"! (variable: \"" + variable_name + "\")");

    return section->getBool(variable_name);
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const {
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        return default_value;

    return section->getBool(variable_name, default_value);
}


std::vector<std::string> IniFile::getList(const std::string &section_name, const std::string &variable_name, const char separator,
                                          const std::vector<std::string> &default_value) const
{
    const auto section(getSection(section_name));
    if (section == sections_.cend())
        return default_value;

    return section->getList(variable_name, separator, default_value);
}


bool IniFile::sectionIsDefined(const std::string &section_name) const {
    return getSection(section_name) != sections_.cend();
}


bool IniFile::variableIsDefined(const std::string &section_name, const std::string &variable_name) const {
    std::string temp;
    return lookup(section_name, variable_name, &temp);
}
