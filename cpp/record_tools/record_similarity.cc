/** \file   record_similarity.cc
 *  \brief  Lists duplicate candidates in a snapshot or explains the similarity of two records.
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
#include <iostream>
#include <cstdlib>
#include "ConsistencyChecker.h"
#include "IniFile.h"
#include "RecordSimilarity.h"
#include "SnapshotIO.h"
#include "StringUtil.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--config=path] [--threshold=t] [--worker-threads=N] snapshot [ID1 ID2]\n"
            "Without IDs all pairs with a similarity of at least the threshold are listed.");
}


const Bib::Record &FindRecord(const std::vector<Bib::Record> &records, const std::string &id) {
    for (const auto &record : records) {
        if (record.getID() == id)
            return record;
    }

    LOG_ERROR("no record with ID \"" + id + "\"!");
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    std::string config_path, threshold_string;
    unsigned worker_thread_count(ConsistencyChecker::Config::DEFAULT_MAX_THREADS);
    while (argc > 1 and StringUtil::StartsWith(argv[1], "--")) {
        const std::string flag(argv[1]);
        if (StringUtil::StartsWith(flag, "--config="))
            config_path = flag.substr(__builtin_strlen("--config="));
        else if (StringUtil::StartsWith(flag, "--threshold="))
            threshold_string = flag.substr(__builtin_strlen("--threshold="));
        else if (StringUtil::StartsWith(flag, "--worker-threads=")) {
            if (not StringUtil::ToUnsigned(flag.substr(__builtin_strlen("--worker-threads=")), &worker_thread_count)
                or worker_thread_count == 0)
                LOG_ERROR("bad worker thread count in \"" + flag + "\"!");
        } else
            Usage();
        --argc, ++argv;
    }

    if (argc != 2 and argc != 4)
        Usage();

    const IniFile ini_file(config_path.empty() ? IniFile() : IniFile(config_path));
    const auto similarity_config(RecordSimilarity::Config::FromIniFile(ini_file));

    double threshold(ini_file.getDouble("Tools", "duplicate_threshold", 0.9));
    if (not threshold_string.empty() and not StringUtil::ToDouble(threshold_string, &threshold))
        LOG_ERROR("bad threshold \"" + threshold_string + "\"!");
    if (threshold < 0.0 or threshold > 1.0)
        LOG_ERROR("the threshold must be in [0, 1]!");

    ConsistencyChecker::Snapshot snapshot;
    SnapshotIO::Load(argv[1], &snapshot, /* change_log = */ nullptr);

    if (argc == 4) {
        const auto details(RecordSimilarity::GetDetails(FindRecord(snapshot.records_, argv[2]), FindRecord(snapshot.records_, argv[3]),
                                                        similarity_config));
        std::cout << details.toString() << '\n';
        return EXIT_SUCCESS;
    }

    const auto candidate_pairs(RecordSimilarity::FindCandidatePairs(snapshot.records_, similarity_config, threshold, worker_thread_count));
    for (const auto &candidate_pair : candidate_pairs)
        std::cout << candidate_pair.id1_ << '\t' << candidate_pair.id2_ << '\t' << candidate_pair.similarity_ << '\n';

    LOG_INFO("found " + std::to_string(candidate_pairs.size()) + " duplicate candidate(s) among "
             + std::to_string(snapshot.records_.size()) + " record(s).");

    return EXIT_SUCCESS;
}
