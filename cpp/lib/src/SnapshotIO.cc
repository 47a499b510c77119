/** \file   SnapshotIO.cc
 *  \brief  Implementation of the JSON snapshot (de)serialization.
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
#include "SnapshotIO.h"
#include <fstream>
#include "StringUtil.h"
#include "util.h"


namespace SnapshotIO {


namespace {


void StringMapFromJSON(const nlohmann::json &json, const std::string &member_name, std::map<std::string, std::string> * const map) {
    map->clear();
    if (not json.contains(member_name))
        return;

    const auto &member(json[member_name]);
    if (not member.is_object())
        throw std::runtime_error("in SnapshotIO::StringMapFromJSON: \"" + member_name + "\" is not an object!");

    for (const auto &key_and_value : member.items()) {
        if (not key_and_value.value().is_string())
            throw std::runtime_error("in SnapshotIO::StringMapFromJSON: non-string value for \"" + key_and_value.key() + "\" in \""
                                     + member_name + "\"!");
        (*map)[key_and_value.key()] = key_and_value.value().get<std::string>();
    }
}


const nlohmann::json &GetArray(const nlohmann::json &json, const std::string &member_name) {
    static const nlohmann::json empty_array(nlohmann::json::array());
    if (not json.contains(member_name))
        return empty_array;

    const auto &member(json[member_name]);
    if (not member.is_array())
        throw std::runtime_error("in SnapshotIO::GetArray: \"" + member_name + "\" is not an array!");
    return member;
}


} // unnamed namespace


void FromJSON(const nlohmann::json &json, ConsistencyChecker::Snapshot * const snapshot, ConsistencyChecker::ChangeLog * const change_log) {
    if (not json.is_object())
        throw std::runtime_error("in SnapshotIO::FromJSON: a snapshot must be a JSON object!");

    snapshot->sources_.clear();
    for (const auto &source : GetArray(json, "sources"))
        snapshot->sources_.emplace_back(Bib::SourceFromJSON(source));

    snapshot->records_.clear();
    for (const auto &record : GetArray(json, "records"))
        snapshot->records_.emplace_back(Bib::RecordFromJSON(record));

    if (change_log != nullptr) {
        StringMapFromJSON(json, "renames", &change_log->renames_);
        StringMapFromJSON(json, "manual_overrides", &change_log->manual_overrides_);
        for (const auto &record_id_and_reason : change_log->manual_overrides_) {
            if (StringUtil::TrimWhite(record_id_and_reason.second).empty())
                throw std::runtime_error("in SnapshotIO::FromJSON: the manual override for \"" + record_id_and_reason.first
                                         + "\" has no reason!");
        }
    }
}


nlohmann::json ToJSON(const ConsistencyChecker::Snapshot &snapshot, const ConsistencyChecker::ChangeLog &change_log) {
    nlohmann::json json(nlohmann::json::object());

    json["sources"] = nlohmann::json::array();
    for (const auto &source : snapshot.sources_)
        json["sources"].emplace_back(Bib::SourceToJSON(source));

    json["records"] = nlohmann::json::array();
    for (const auto &record : snapshot.records_)
        json["records"].emplace_back(Bib::RecordToJSON(record));

    json["renames"] = change_log.renames_;
    json["manual_overrides"] = change_log.manual_overrides_;

    return json;
}


void Load(const std::string &path, ConsistencyChecker::Snapshot * const snapshot, ConsistencyChecker::ChangeLog * const change_log) {
    std::ifstream input(path);
    if (not input)
        throw std::runtime_error("in SnapshotIO::Load: can't open \"" + path + "\" for reading!");

    nlohmann::json json;
    try {
        input >> json;
    } catch (const nlohmann::json::parse_error &x) {
        throw std::runtime_error("in SnapshotIO::Load: failed to parse \"" + path + "\": " + std::string(x.what()));
    }

    FromJSON(json, snapshot, change_log);
    LOG_DEBUG("loaded " + std::to_string(snapshot->records_.size()) + " record(s) and " + std::to_string(snapshot->sources_.size())
              + " source(s) from \"" + path + "\".");
}


void Write(const std::string &path, const ConsistencyChecker::Snapshot &snapshot, const ConsistencyChecker::ChangeLog &change_log) {
    std::ofstream output(path);
    if (not output)
        throw std::runtime_error("in SnapshotIO::Write: can't open \"" + path + "\" for writing!");

    output << ToJSON(snapshot, change_log).dump(4) << '\n';
    if (not output)
        throw std::runtime_error("in SnapshotIO::Write: failed to write \"" + path + "\"!");
}


} // namespace SnapshotIO
