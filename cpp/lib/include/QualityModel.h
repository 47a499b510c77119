/** \file   QualityModel.h
 *  \brief  Annotates the masterdata provenance of records with the defects that the field rules detect.
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
#include "Bib.h"
#include "FieldRules.h"
#include "IniFile.h"


class QualityModel {
public:
    struct Config {
        FieldRules::Config rule_config_;

        // Assigned to present fields that do not have a provenance entry yet.
        std::string default_provenance_source_;

        // Assigned to new entries that record a missing field.
        std::string missing_field_provenance_source_;

    public:
        Config();

        // Missing entries fall back to the defaults.
        static Config FromIniFile(const IniFile &ini_file, const std::string &section_name = "QualityModel");
    };

private:
    const Config config_;
    const FieldRules::Registry &registry_;

public:
    explicit QualityModel(const Config &config = Config(), const FieldRules::Registry &registry = FieldRules::GetDefaultRegistry())
        : config_(config), registry_(registry) { }

    inline const Config &getConfig() const { return config_; }

    /** \brief  Recomputes the masterdata provenance notes of "record".
     *  \return "*record".
     *  \throws Bib::RecordError if the record's entry type is unknown.
     *  \note   Idempotent.  "IGNORE:" tokens of fields that are still present survive the reevaluation.
     */
    Bib::Record &evaluate(Bib::Record * const record) const;

    // \return True if some masterdata note, disregarding ignored defects, is neither empty nor "not-missing".
    static bool HasQualityDefects(const Bib::Record &record);

    // \return The tokens of the masterdata note of "field_name", empty if there is no such note.
    static std::vector<std::string> GetDefects(const Bib::Record &record, const std::string &field_name);
};
