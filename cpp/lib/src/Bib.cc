/** \file   Bib.cc
 *  \brief  Implementation of the bibliographic record model.
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
#include "Bib.h"
#include <algorithm>
#include <unordered_map>
#include "StringUtil.h"
#include "util.h"


namespace Bib {


bool IsReservedKey(const std::string &key) {
    return key == ID_KEY or key == ENTRYTYPE_KEY or key == STATUS_KEY or key == ORIGIN_KEY or key == MASTERDATA_PROVENANCE_KEY
           or key == DATA_PROVENANCE_KEY;
}


const std::set<std::string> &GetMasterdataFields() {
    static const std::set<std::string> masterdata_fields{
        "address", "author", "booktitle", "chapter", "edition", "editor", "institution", "journal", "language",
        "number",  "pages",  "publisher", "school",  "series",  "title",  "url",    "volume",      "year",
    };
    return masterdata_fields;
}


bool IsMasterdataField(const std::string &field_name) {
    return GetMasterdataFields().find(field_name) != GetMasterdataFields().cend();
}


namespace {


struct EntryTypeFields {
    std::set<std::string> required_;
    std::set<std::string> inconsistent_;
};


const std::unordered_map<std::string, EntryTypeFields> &GetEntryTypeTable() {
    static const std::set<std::string> THESIS_INCONSISTENT_FIELDS{ "volume", "number", "journal", "booktitle" };
    static const std::set<std::string> THESIS_REQUIRED_FIELDS{ "author", "title", "school", "year" };
    static const std::set<std::string> GENERIC_REQUIRED_FIELDS{ "author", "title", "year" };

    static const std::unordered_map<std::string, EntryTypeFields> entry_type_table{
        { "article", { { "author", "title", "journal", "year", "volume", "number" }, { "booktitle" } } },
        { "inproceedings", { { "author", "title", "booktitle", "year" }, { "issue", "number", "journal" } } },
        { "incollection", { { "author", "title", "booktitle", "publisher", "year" }, {} } },
        { "inbook", { { "author", "title", "chapter", "publisher", "year" }, { "journal" } } },
        { "proceedings", { { "booktitle", "editor", "year" }, {} } },
        { "conference", { { "booktitle", "editor", "year" }, {} } },
        { "book", { { "author", "title", "publisher", "year" }, { "journal", "booktitle" } } },
        { "phdthesis", { THESIS_REQUIRED_FIELDS, THESIS_INCONSISTENT_FIELDS } },
        { "bachelorthesis", { THESIS_REQUIRED_FIELDS, THESIS_INCONSISTENT_FIELDS } },
        { "mastersthesis", { THESIS_REQUIRED_FIELDS, THESIS_INCONSISTENT_FIELDS } },
        { "thesis", { THESIS_REQUIRED_FIELDS, THESIS_INCONSISTENT_FIELDS } },
        { "techreport", { { "author", "title", "institution", "year" }, THESIS_INCONSISTENT_FIELDS } },
        { "unpublished", { GENERIC_REQUIRED_FIELDS, THESIS_INCONSISTENT_FIELDS } },
        { "misc", { GENERIC_REQUIRED_FIELDS, { "booktitle" } } },
        { "other", { GENERIC_REQUIRED_FIELDS, {} } },
        { "software", { { "author", "title", "url" }, {} } },
        { "online", { { "author", "title", "url" }, { "journal", "booktitle" } } },
    };
    return entry_type_table;
}


const EntryTypeFields &GetEntryTypeFields(const std::string &entry_type) {
    const auto entry_type_and_fields(GetEntryTypeTable().find(entry_type));
    if (entry_type_and_fields == GetEntryTypeTable().cend())
        throw RecordError("in Bib::GetEntryTypeFields: unknown entry type \"" + entry_type + "\"!");
    return entry_type_and_fields->second;
}


} // unnamed namespace


const std::set<std::string> &GetKnownEntryTypes() {
    static const std::set<std::string> known_entry_types([]() {
        std::set<std::string> entry_types;
        for (const auto &entry_type_and_fields : GetEntryTypeTable())
            entry_types.emplace(entry_type_and_fields.first);
        return entry_types;
    }());
    return known_entry_types;
}


bool IsKnownEntryType(const std::string &entry_type) {
    return GetEntryTypeTable().find(entry_type) != GetEntryTypeTable().cend();
}


bool IsThesisType(const std::string &entry_type) {
    return entry_type == "thesis" or entry_type == "phdthesis" or entry_type == "mastersthesis" or entry_type == "bachelorthesis";
}


const std::set<std::string> &GetRequiredFields(const std::string &entry_type) {
    return GetEntryTypeFields(entry_type).required_;
}


const std::set<std::string> &GetInconsistentFields(const std::string &entry_type) {
    return GetEntryTypeFields(entry_type).inconsistent_;
}


bool ParseOrigin(const std::string &origin, std::string * const source_filename, std::string * const record_id) {
    const auto last_slash_pos(origin.rfind('/'));
    if (last_slash_pos == std::string::npos or last_slash_pos == 0 or last_slash_pos == origin.length() - 1)
        return false;

    *source_filename = origin.substr(0, last_slash_pos);
    *record_id = origin.substr(last_slash_pos + 1);
    return true;
}


Record::Record(const std::string &id, const std::string &entry_type, const RecordState::State status): status_(status) {
    setID(id);
    setEntryType(entry_type);
}


void Record::setID(const std::string &new_id) {
    if (StringUtil::TrimWhite(new_id).empty())
        throw RecordError("in Bib::Record::setID: record ID must not be empty!");
    id_ = new_id;
}


void Record::setEntryType(const std::string &new_entry_type) {
    if (not IsKnownEntryType(new_entry_type))
        throw RecordError("in Bib::Record::setEntryType: unknown entry type \"" + new_entry_type + "\" in record \"" + id_ + "\"!");
    entry_type_ = new_entry_type;
}


void Record::addOrigin(const std::string &origin) {
    std::string source_filename, record_id;
    if (not ParseOrigin(origin, &source_filename, &record_id))
        throw RecordError("in Bib::Record::addOrigin: malformed origin \"" + origin + "\" in record \"" + id_ + "\"!");
    origins_.emplace_back(origin);
}


bool Record::hasOrigin(const std::string &origin) const {
    return std::find(origins_.cbegin(), origins_.cend(), origin) != origins_.cend();
}


bool Record::hasUsableField(const std::string &field_name) const {
    const auto field_name_and_value(fields_.find(field_name));
    if (field_name_and_value == fields_.cend())
        return false;

    const auto trimmed_value(StringUtil::TrimWhite(field_name_and_value->second));
    return not trimmed_value.empty() and trimmed_value != UNKNOWN_VALUE;
}


std::string Record::getField(const std::string &field_name) const {
    const auto field_name_and_value(fields_.find(field_name));
    return (field_name_and_value == fields_.cend()) ? "" : field_name_and_value->second;
}


void Record::setField(const std::string &field_name, const std::string &value) {
    if (IsReservedKey(field_name))
        throw RecordError("in Bib::Record::setField: \"" + field_name + "\" is a reserved key!");
    fields_[field_name] = value;
}


bool Record::removeField(const std::string &field_name) {
    return fields_.erase(field_name) > 0;
}


const Provenance *Record::findMasterdataProvenance(const std::string &field_name) const {
    const auto field_name_and_provenance(masterdata_provenance_.find(field_name));
    return (field_name_and_provenance == masterdata_provenance_.cend()) ? nullptr : &field_name_and_provenance->second;
}


std::map<RecordState::State, unsigned> GetStateCounts(const std::vector<Record> &records) {
    std::map<RecordState::State, unsigned> state_counts;
    for (const auto &record : records)
        ++state_counts[record.getStatus()];
    return state_counts;
}


namespace {


bool IsValidCriterionName(const std::string &name) {
    if (name.empty())
        return false;

    for (const char ch : name) {
        if (not (StringUtil::IsAsciiLetter(ch) or StringUtil::IsDigit(ch) or ch == '_'))
            return false;
    }

    return true;
}


} // unnamed namespace


bool ParseScreeningCriteria(const std::string &value, std::vector<ScreeningCriterion> * const criteria, std::string * const err_msg) {
    criteria->clear();
    err_msg->clear();
    if (value.empty())
        return true;

    std::vector<std::string> items;
    StringUtil::Split(value, ';', &items, /* suppress_empty_components = */ false);
    for (const auto &item : items) {
        const auto equal_pos(item.find('='));
        if (equal_pos == std::string::npos) {
            *err_msg = "missing \"=\" in \"" + item + "\"";
            return false;
        }

        const std::string name(item.substr(0, equal_pos));
        if (not IsValidCriterionName(name)) {
            *err_msg = "invalid criterion name \"" + name + "\"";
            return false;
        }

        const std::string decision(item.substr(equal_pos + 1));
        if (decision == "in")
            criteria->emplace_back(name, true);
        else if (decision == "out")
            criteria->emplace_back(name, false);
        else {
            *err_msg = "decision for \"" + name + "\" must be \"in\" or \"out\" but is \"" + decision + "\"";
            return false;
        }
    }

    return true;
}


static const std::map<std::string, SearchType> STRING_TO_SEARCH_TYPE_MAP{
    { "DB", DB }, { "TOC", TOC }, { "BACKWARD_SEARCH", BACKWARD_SEARCH }, { "FORWARD_SEARCH", FORWARD_SEARCH }, { "PDFS", PDFS },
    { "OTHER", OTHER },
};


bool StringToSearchType(const std::string &search_type_string, SearchType * const search_type) {
    const auto string_and_search_type(STRING_TO_SEARCH_TYPE_MAP.find(search_type_string));
    if (string_and_search_type == STRING_TO_SEARCH_TYPE_MAP.cend())
        return false;

    *search_type = string_and_search_type->second;
    return true;
}


std::string SearchTypeToString(const SearchType search_type) {
    switch (search_type) {
    case DB:
        return "DB";
    case TOC:
        return "TOC";
    case BACKWARD_SEARCH:
        return "BACKWARD_SEARCH";
    case FORWARD_SEARCH:
        return "FORWARD_SEARCH";
    case PDFS:
        return "PDFS";
    case OTHER:
        return "OTHER";
    }

    LOG_ERROR("unexpected search type " + std::to_string(search_type) + "!");
}


namespace {


std::string GetMandatoryString(const nlohmann::json &json, const std::string &key) {
    const auto key_and_value(json.find(key));
    if (key_and_value == json.cend() or not key_and_value->is_string())
        throw RecordError("in Bib::RecordFromJSON: missing or non-string \"" + key + "\"!");
    return key_and_value->get<std::string>();
}


void ProvenanceFromJSON(const nlohmann::json &json, const std::string &record_id, ProvenanceMap * const provenance_map) {
    if (not json.is_object())
        throw RecordError("in Bib::ProvenanceFromJSON: provenance of \"" + record_id + "\" is not an object!");

    for (const auto &field_and_provenance : json.items()) {
        const auto &provenance(field_and_provenance.value());
        if (not provenance.is_object())
            throw RecordError("in Bib::ProvenanceFromJSON: malformed provenance for \"" + field_and_provenance.key() + "\" in \""
                              + record_id + "\"!");

        Provenance new_provenance;
        for (const auto &key_and_value : provenance.items()) {
            if (not key_and_value.value().is_string())
                throw RecordError("in Bib::ProvenanceFromJSON: non-string \"" + key_and_value.key() + "\" in the provenance of \""
                                  + field_and_provenance.key() + "\" in \"" + record_id + "\"!");
            if (key_and_value.key() == "source")
                new_provenance.source_ = key_and_value.value().get<std::string>();
            else if (key_and_value.key() == "note")
                new_provenance.note_ = key_and_value.value().get<std::string>();
            else
                throw RecordError("in Bib::ProvenanceFromJSON: unexpected key \"" + key_and_value.key() + "\" in the provenance of \""
                                  + field_and_provenance.key() + "\" in \"" + record_id + "\"!");
        }

        (*provenance_map)[field_and_provenance.key()] = new_provenance;
    }
}


nlohmann::json ProvenanceToJSON(const ProvenanceMap &provenance_map) {
    nlohmann::json json(nlohmann::json::object());
    for (const auto &field_and_provenance : provenance_map)
        json[field_and_provenance.first] = { { "source", field_and_provenance.second.source_ },
                                             { "note", field_and_provenance.second.note_ } };
    return json;
}


} // unnamed namespace


Record RecordFromJSON(const nlohmann::json &json) {
    if (not json.is_object())
        throw RecordError("in Bib::RecordFromJSON: record is not a JSON object!");

    Record record(GetMandatoryString(json, ID_KEY), GetMandatoryString(json, ENTRYTYPE_KEY),
                  RecordState::StringToState(GetMandatoryString(json, STATUS_KEY)));

    for (const auto &key_and_value : json.items()) {
        const auto &key(key_and_value.key());
        const auto &value(key_and_value.value());
        if (key == ID_KEY or key == ENTRYTYPE_KEY or key == STATUS_KEY)
            continue;

        if (key == ORIGIN_KEY) {
            if (not value.is_array())
                throw RecordError("in Bib::RecordFromJSON: \"" + ORIGIN_KEY + "\" of \"" + record.getID() + "\" is not an array!");
            for (const auto &origin : value) {
                if (not origin.is_string())
                    throw RecordError("in Bib::RecordFromJSON: non-string origin in \"" + record.getID() + "\"!");
                record.addOrigin(origin.get<std::string>());
            }
        } else if (key == MASTERDATA_PROVENANCE_KEY)
            ProvenanceFromJSON(value, record.getID(), &record.getMasterdataProvenance());
        else if (key == DATA_PROVENANCE_KEY)
            ProvenanceFromJSON(value, record.getID(), &record.getDataProvenance());
        else if (value.is_string())
            record.setField(key, value.get<std::string>());
        else if (value.is_number())
            record.setField(key, value.dump());
        else
            throw RecordError("in Bib::RecordFromJSON: field \"" + key + "\" of \"" + record.getID() + "\" has an unsupported type!");
    }

    return record;
}


nlohmann::json RecordToJSON(const Record &record) {
    nlohmann::json json(nlohmann::json::object());
    json[ID_KEY] = record.getID();
    json[ENTRYTYPE_KEY] = record.getEntryType();
    json[STATUS_KEY] = RecordState::StateToString(record.getStatus());
    json[ORIGIN_KEY] = record.getOrigins();
    json[MASTERDATA_PROVENANCE_KEY] = ProvenanceToJSON(record.getMasterdataProvenance());
    if (not record.getDataProvenance().empty())
        json[DATA_PROVENANCE_KEY] = ProvenanceToJSON(record.getDataProvenance());

    for (const auto &field_name_and_value : record)
        json[field_name_and_value.first] = field_name_and_value.second;

    return json;
}


Source SourceFromJSON(const nlohmann::json &json) {
    if (not json.is_object() or not json.contains("filename") or not json["filename"].is_string())
        throw std::runtime_error("in Bib::SourceFromJSON: a source needs a string \"filename\"!");

    SearchType search_type(OTHER);
    if (json.contains("search_type")) {
        if (not json["search_type"].is_string() or not StringToSearchType(json["search_type"].get<std::string>(), &search_type))
            throw std::runtime_error("in Bib::SourceFromJSON: bad search type in source \"" + json["filename"].get<std::string>()
                                     + "\"!");
    }

    const auto filename(json["filename"].get<std::string>());
    std::string source_identifier;
    if (json.contains("source_identifier")) {
        if (not json["source_identifier"].is_string())
            throw std::runtime_error("in Bib::SourceFromJSON: non-string \"source_identifier\" in source \"" + filename + "\"!");
        source_identifier = json["source_identifier"].get<std::string>();
    }

    bool available(true);
    if (json.contains("available")) {
        if (not json["available"].is_boolean())
            throw std::runtime_error("in Bib::SourceFromJSON: non-boolean \"available\" in source \"" + filename + "\"!");
        available = json["available"].get<bool>();
    }

    Source source(filename, search_type, source_identifier, available);

    if (json.contains("record_ids")) {
        if (not json["record_ids"].is_array())
            throw std::runtime_error("in Bib::SourceFromJSON: \"record_ids\" of \"" + filename + "\" is not an array!");
        for (const auto &record_id : json["record_ids"]) {
            if (not record_id.is_string())
                throw std::runtime_error("in Bib::SourceFromJSON: non-string record ID in source \"" + filename + "\"!");
            source.record_ids_.emplace(record_id.get<std::string>());
        }
    }

    return source;
}


nlohmann::json SourceToJSON(const Source &source) {
    return { { "filename", source.filename_ },
             { "search_type", SearchTypeToString(source.search_type_) },
             { "source_identifier", source.source_identifier_ },
             { "available", source.available_ },
             { "record_ids", source.record_ids_ } };
}


} // namespace Bib
