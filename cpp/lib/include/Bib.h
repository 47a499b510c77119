/** \file   Bib.h
 *  \brief  The bibliographic record model: records, their provenance annotations and the sources they stem from.
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


#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "RecordState.h"


namespace Bib {


// Thrown when a record violates the data model, e.g. an unknown entry type or a malformed origin.
class RecordError : public std::runtime_error {
public:
    explicit RecordError(const std::string &message): std::runtime_error(message) { }
};


// Placeholder value for fields whose content could not be determined.  Treated as absent.
const std::string UNKNOWN_VALUE("UNKNOWN");


const std::string ID_KEY("ID");
const std::string ENTRYTYPE_KEY("ENTRYTYPE");
const std::string STATUS_KEY("colrev_status");
const std::string ORIGIN_KEY("colrev_origin");
const std::string MASTERDATA_PROVENANCE_KEY("colrev_masterdata_provenance");
const std::string DATA_PROVENANCE_KEY("colrev_data_provenance");
const std::string SCREENING_CRITERIA_KEY("screening_criteria");


bool IsReservedKey(const std::string &key);


// The bibliographic fields whose quality is tracked in the masterdata provenance.
const std::set<std::string> &GetMasterdataFields();
bool IsMasterdataField(const std::string &field_name);


const std::set<std::string> &GetKnownEntryTypes();
bool IsKnownEntryType(const std::string &entry_type);
bool IsThesisType(const std::string &entry_type);


/** \throws RecordError for an unknown entry type. */
const std::set<std::string> &GetRequiredFields(const std::string &entry_type);

/** \brief  The fields that must not be present for "entry_type".
 *  \throws RecordError for an unknown entry type.
 */
const std::set<std::string> &GetInconsistentFields(const std::string &entry_type);


/** \brief  Splits an origin of the form "<source filename>/<record ID in the source>" at the last slash.
 *  \return False if the origin is malformed, i.e. one of the two parts would be empty.
 */
bool ParseOrigin(const std::string &origin, std::string * const source_filename, std::string * const record_id);


struct Provenance {
    std::string source_;
    std::string note_;

public:
    Provenance() = default;
    Provenance(const std::string &source, const std::string &note): source_(source), note_(note) { }

    inline bool operator==(const Provenance &rhs) const { return source_ == rhs.source_ and note_ == rhs.note_; }
    inline bool operator!=(const Provenance &rhs) const { return not operator==(rhs); }
};


using ProvenanceMap = std::map<std::string, Provenance>;


class Record {
    std::string id_;
    std::string entry_type_;
    RecordState::State status_;
    std::vector<std::string> origins_;
    ProvenanceMap masterdata_provenance_;
    ProvenanceMap data_provenance_;
    std::map<std::string, std::string> fields_;

public:
    using const_iterator = std::map<std::string, std::string>::const_iterator;

    /** \throws RecordError if "id" is empty or "entry_type" is unknown. */
    Record(const std::string &id, const std::string &entry_type, const RecordState::State status);

    inline const std::string &getID() const { return id_; }
    void setID(const std::string &new_id);

    inline const std::string &getEntryType() const { return entry_type_; }
    void setEntryType(const std::string &new_entry_type);

    inline RecordState::State getStatus() const { return status_; }
    inline void setStatus(const RecordState::State new_status) { status_ = new_status; }

    inline const std::vector<std::string> &getOrigins() const { return origins_; }

    /** \throws RecordError if "origin" is malformed. */
    void addOrigin(const std::string &origin);
    bool hasOrigin(const std::string &origin) const;

    // The non-reserved fields.
    inline const_iterator begin() const { return fields_.cbegin(); }
    inline const_iterator end() const { return fields_.cend(); }
    inline bool hasField(const std::string &field_name) const { return fields_.find(field_name) != fields_.cend(); }

    // True if the field is present, not blank and not UNKNOWN_VALUE.
    bool hasUsableField(const std::string &field_name) const;

    // Returns the empty string for absent fields.
    std::string getField(const std::string &field_name) const;

    /** \throws RecordError if "field_name" is one of the reserved keys. */
    void setField(const std::string &field_name, const std::string &value);

    // \return True if the field existed.
    bool removeField(const std::string &field_name);

    inline const ProvenanceMap &getMasterdataProvenance() const { return masterdata_provenance_; }
    inline ProvenanceMap &getMasterdataProvenance() { return masterdata_provenance_; }
    inline const ProvenanceMap &getDataProvenance() const { return data_provenance_; }
    inline ProvenanceMap &getDataProvenance() { return data_provenance_; }

    /** \brief  Looks up the masterdata provenance of a field.
     *  \return NULL if the field has no masterdata provenance entry.
     */
    const Provenance *findMasterdataProvenance(const std::string &field_name) const;
};


std::map<RecordState::State, unsigned> GetStateCounts(const std::vector<Record> &records);


struct ScreeningCriterion {
    std::string name_;
    bool included_;

public:
    ScreeningCriterion(const std::string &name, const bool included): name_(name), included_(included) { }
};


/** \brief  Parses a value like "topic=in;method=out".
 *  \param  err_msg  Set to a description of the problem if the value is malformed.
 *  \return True if "value" is empty or well-formed.
 */
bool ParseScreeningCriteria(const std::string &value, std::vector<ScreeningCriterion> * const criteria, std::string * const err_msg);


enum SearchType { DB, TOC, BACKWARD_SEARCH, FORWARD_SEARCH, PDFS, OTHER };


bool StringToSearchType(const std::string &search_type_string, SearchType * const search_type);
std::string SearchTypeToString(const SearchType search_type);


// A search result file that records originate from.
struct Source {
    std::string filename_;
    SearchType search_type_;
    std::string source_identifier_;

    // False if the file could not be materialized.
    bool available_;
    std::set<std::string> record_ids_;

public:
    Source(const std::string &filename, const SearchType search_type, const std::string &source_identifier = "",
           const bool available = true)
        : filename_(filename), search_type_(search_type), source_identifier_(source_identifier), available_(available) { }
};


/** \throws RecordError if a mandatory key is missing, the entry type is unknown, an origin or the provenance is malformed.
 *  \throws RecordState::UnknownStateError for an unknown "colrev_status".
 */
Record RecordFromJSON(const nlohmann::json &json);

nlohmann::json RecordToJSON(const Record &record);


/** \throws std::runtime_error if "json" does not describe a source. */
Source SourceFromJSON(const nlohmann::json &json);

nlohmann::json SourceToJSON(const Source &source);


} // namespace Bib
