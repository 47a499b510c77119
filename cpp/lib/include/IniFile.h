/** \file   IniFile.h
 *  \brief  Declaration of class IniFile which reads our .ini-style configuration files.
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


#include <algorithm>
#include <stack>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Read a configuration file in our .ini format.
 *
 *  This class allows access to the contents of an ini file.  It is initialised with the name of the file, and the
 *  settings stored in the file can then be accessed through the lookup and get* methods.  String constants can use
 *  C-style character backslash escapes like \\n.  If you want to embed a hash mark in a string you must preceede it with
 *  a single backslash.  In order to extend a string constant over multiple lines, put backslashes just before the line
 *  ends on all but the last line.
 *  Entries in one section can be inherited by later sections by using a '@inherit "section_name"' directive.  The name of
 *  the section whose values will be inherited must be a double-quoted string.  Other files can be pulled in with
 *  'include "filename"', relative names are resolved against the directory of the including file.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_, comment_;

    public:
        Entry(const std::string &name, const std::string &value, const std::string &comment)
            : name_(name), value_(value), comment_(comment) { }
    };

    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;

    public:
        typedef std::vector<Entry>::const_iterator const_iterator;

    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }
        Section() = default;
        Section(const Section &other) = default;

        inline bool operator==(const std::string &section_name) const { return section_name == section_name_; }

        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }

        // Replaces the value of an existing entry with the same name.
        void insert(const std::string &variable_name, const std::string &value, const std::string &comment = "");

        bool lookup(const std::string &variable_name, std::string * const s) const;

        /** \note  All getters without a default abort if "variable_name" is not defined.  All getters abort if the value
         *         can't be converted to the requested type.
         */
        double getDouble(const std::string &variable_name) const;
        double getDouble(const std::string &variable_name, const double default_value) const;
        std::string getString(const std::string &variable_name) const;
        std::string getString(const std::string &variable_name, const std::string &default_value) const;
        unsigned getUnsigned(const std::string &variable_name) const;
        unsigned getUnsigned(const std::string &variable_name, const unsigned default_value) const;

        /** \note  The accepted values are case insensitive and can be any of "true", "yes", "on", "false", "no" or
         *         "off".
         */
        bool getBool(const std::string &variable_name) const;
        bool getBool(const std::string &variable_name, const bool default_value) const;

        /** \brief  Splits the value of "variable_name" on "separator" and trims whitespace from the resulting items.
         *  \return "default_value" if the variable is not defined.
         */
        std::vector<std::string> getList(const std::string &variable_name, const char separator,
                                         const std::vector<std::string> &default_value = {}) const;

        inline size_t size() const { return entries_.size(); }

        // \return An iterator referencing the found entry or end() if no matching entry was found.
        inline const_iterator find(const std::string &variable_name) const {
            return std::find_if(entries_.cbegin(), entries_.cend(),
                                [&variable_name](const Entry &entry) { return entry.name_ == variable_name; });
        }

        inline bool hasEntry(const std::string &variable_name) const { return find(variable_name) != end(); }
    };

public:
    typedef std::vector<Section> Sections;
    typedef Sections::const_iterator const_iterator;

protected:
    Sections sections_;
    std::string ini_file_name_;
    std::string current_section_name_;

    struct IncludeFileInfo {
        std::string filename_;
        unsigned current_lineno_;

    public:
        explicit IncludeFileInfo(const std::string &filename): filename_(filename), current_lineno_(0) { }
    };
    std::stack<IncludeFileInfo> include_file_infos_;
    bool ignore_failed_includes_;

public:
    /** \brief  Construct an IniFile based on the named file.
     *  \param  ini_file_name           The name of the .ini file.
     *  \param  ignore_failed_includes  If "true", don't throw an exception if an "include" directive can't be honoured.
     *  \throws std::runtime_error if the file can't be read or is syntactically invalid.
     */
    explicit IniFile(const std::string &ini_file_name, const bool ignore_failed_includes = false);

    // Constructs an IniFile w/o any sections.  All lookups with defaults will return those defaults.
    IniFile(): ignore_failed_includes_(false) { }

    inline const_iterator begin() const { return sections_.cbegin(); }
    inline const_iterator end() const { return sections_.cend(); }

    bool lookup(const std::string &section_name, const std::string &variable_name, std::string * const s) const;

    double getDouble(const std::string &section_name, const std::string &variable_name) const;
    double getDouble(const std::string &section_name, const std::string &variable_name, const double default_value) const;
    std::string getString(const std::string &section_name, const std::string &variable_name) const;
    std::string getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const;
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name) const;
    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const;
    bool getBool(const std::string &section_name, const std::string &variable_name) const;
    bool getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const;
    std::vector<std::string> getList(const std::string &section_name, const std::string &variable_name, const char separator,
                                     const std::vector<std::string> &default_value = {}) const;

    inline const_iterator getSection(const std::string &section_name) const {
        return std::find(sections_.cbegin(), sections_.cend(), section_name);
    }

    bool sectionIsDefined(const std::string &section_name) const;
    bool variableIsDefined(const std::string &section_name, const std::string &variable_name) const;

private:
    void processSectionHeader(const std::string &line);
    void processInclude(const std::string &line);
    void processInherit(const std::string &line, Section * const current_section);
    void processSectionEntry(const std::string &line, const std::string &comment);
    void processFile(const std::string &filename);

    inline unsigned &getCurrentLineNo() { return include_file_infos_.top().current_lineno_; }
    inline const std::string &getCurrentFile() const { return include_file_infos_.top().filename_; }
};
