/** \file   SnapshotIO.h
 *  \brief  Reading and writing of JSON record snapshots.
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
#include <nlohmann/json.hpp>
#include "ConsistencyChecker.h"


namespace SnapshotIO {


/** \brief  Converts a JSON document with "sources", "records", "renames" and "manual_overrides" members.
 *  \param  change_log  May be NULL if the caller is not interested in the logged changes.
 *  \throws Bib::RecordError, RecordState::UnknownStateError or std::runtime_error for malformed documents.  A manual
 *          override without a reason counts as malformed.
 */
void FromJSON(const nlohmann::json &json, ConsistencyChecker::Snapshot * const snapshot, ConsistencyChecker::ChangeLog * const change_log);

nlohmann::json ToJSON(const ConsistencyChecker::Snapshot &snapshot, const ConsistencyChecker::ChangeLog &change_log);


/** \brief  Loads a snapshot file.
 *  \throws std::runtime_error if the file can't be read or parsed.
 */
void Load(const std::string &path, ConsistencyChecker::Snapshot * const snapshot, ConsistencyChecker::ChangeLog * const change_log);

/** \throws std::runtime_error if the file can't be written. */
void Write(const std::string &path, const ConsistencyChecker::Snapshot &snapshot, const ConsistencyChecker::ChangeLog &change_log);


} // namespace SnapshotIO
