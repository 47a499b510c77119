/** \file   QualityModel.cc
 *  \brief  Implementation of class QualityModel.
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
#include "QualityModel.h"
#include <set>
#include "DefectCodes.h"
#include "StringUtil.h"


QualityModel::Config::Config(): default_provenance_source_("original"), missing_field_provenance_source_("generic_field_requirements") {
}


QualityModel::Config QualityModel::Config::FromIniFile(const IniFile &ini_file, const std::string &section_name) {
    Config config;
    auto &rule_config(config.rule_config_);

    rule_config.caps_ratio_threshold_ = ini_file.getDouble(section_name, "caps_ratio_threshold", rule_config.caps_ratio_threshold_);
    if (rule_config.caps_ratio_threshold_ <= 0.0 or rule_config.caps_ratio_threshold_ > 1.0)
        throw std::runtime_error("in QualityModel::Config::FromIniFile: caps_ratio_threshold must be in (0, 1]!");
    rule_config.min_caps_letters_ = ini_file.getUnsigned(section_name, "min_caps_letters", rule_config.min_caps_letters_);
    rule_config.max_abbreviated_container_length_ =
        ini_file.getUnsigned(section_name, "max_abbreviated_container_length", rule_config.max_abbreviated_container_length_);

    if (ini_file.variableIsDefined(section_name, "known_short_container_names")) {
        const auto known_short_container_names(ini_file.getList(section_name, "known_short_container_names", '|'));
        rule_config.known_short_container_names_ =
            std::set<std::string>(known_short_container_names.cbegin(), known_short_container_names.cend());
    }

    config.default_provenance_source_ = ini_file.getString(section_name, "default_provenance_source", config.default_provenance_source_);
    config.missing_field_provenance_source_ =
        ini_file.getString(section_name, "missing_field_provenance_source", config.missing_field_provenance_source_);

    return config;
}


namespace {


std::set<std::string> GetIgnoreTokens(const Bib::Provenance * const provenance) {
    std::set<std::string> ignore_tokens;
    if (provenance == nullptr)
        return ignore_tokens;

    for (const auto &token : DefectCodes::SplitNote(provenance->note_)) {
        if (StringUtil::StartsWith(token, DefectCodes::IGNORE_PREFIX))
            ignore_tokens.emplace(token);
    }
    return ignore_tokens;
}


inline std::string GetSourceOrDefault(const Bib::Provenance * const provenance, const std::string &default_source) {
    return (provenance == nullptr or provenance->source_.empty()) ? default_source : provenance->source_;
}


} // unnamed namespace


Bib::Record &QualityModel::evaluate(Bib::Record * const record) const {
    if (not Bib::IsKnownEntryType(record->getEntryType()))
        throw Bib::RecordError("in QualityModel::evaluate: unknown entry type \"" + record->getEntryType() + "\" in record \""
                               + record->getID() + "\"!");

    auto defects(registry_.apply(*record, config_.rule_config_));
    const auto &required_fields(Bib::GetRequiredFields(record->getEntryType()));
    const bool is_forthcoming(StringUtil::TrimWhite(record->getField("year")) == "forthcoming");

    std::set<std::string> field_names(Bib::GetMasterdataFields());
    for (const auto &field_name_and_defects : defects)
        field_names.emplace(field_name_and_defects.first);
    const auto &old_provenance(record->getMasterdataProvenance());
    for (const auto &field_name_and_provenance : old_provenance)
        field_names.emplace(field_name_and_provenance.first);

    Bib::ProvenanceMap new_provenance;
    for (const auto &field_name : field_names) {
        const auto old_field_provenance(record->findMasterdataProvenance(field_name));
        if (record->hasUsableField(field_name)) {
            if (not Bib::IsMasterdataField(field_name) and old_field_provenance == nullptr and defects[field_name].empty())
                continue;

            auto tokens(defects[field_name]);
            const auto ignore_tokens(GetIgnoreTokens(old_field_provenance));
            tokens.insert(ignore_tokens.cbegin(), ignore_tokens.cend());
            new_provenance[field_name] = Bib::Provenance(GetSourceOrDefault(old_field_provenance, config_.default_provenance_source_),
                                                         DefectCodes::JoinNote(tokens));
        } else if (is_forthcoming and (field_name == "volume" or field_name == "number")) {
            // Not yet assigned for forthcoming publications.
            new_provenance[field_name] = Bib::Provenance(
                GetSourceOrDefault(old_field_provenance, config_.missing_field_provenance_source_), DefectCodes::NOT_MISSING);
        } else if (required_fields.find(field_name) != required_fields.cend())
            new_provenance[field_name] = Bib::Provenance(
                GetSourceOrDefault(old_field_provenance, config_.missing_field_provenance_source_), DefectCodes::MISSING);
    }

    record->getMasterdataProvenance().swap(new_provenance);
    return *record;
}


bool QualityModel::HasQualityDefects(const Bib::Record &record) {
    for (const auto &field_name_and_provenance : record.getMasterdataProvenance()) {
        const auto &note(field_name_and_provenance.second.note_);
        if (note == DefectCodes::MISSING or not DefectCodes::GetActiveDefects(note).empty())
            return true;
    }

    return false;
}


std::vector<std::string> QualityModel::GetDefects(const Bib::Record &record, const std::string &field_name) {
    const auto provenance(record.findMasterdataProvenance(field_name));
    if (provenance == nullptr)
        return {};
    return DefectCodes::SplitNote(provenance->note_);
}
