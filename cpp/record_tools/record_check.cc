/** \file   record_check.cc
 *  \brief  Annotates the records of a snapshot and checks the snapshot against its predecessor.
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
#include <deque>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <cstdlib>
#include "ConsistencyChecker.h"
#include "IniFile.h"
#include "QualityModel.h"
#include "SnapshotIO.h"
#include "StringUtil.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--config=path] [--strict] [--worker-threads=N] [--write-annotated=path] current_snapshot [prior_snapshot]\n"
            "Exits with a zero exit code if, and only if, all consistency checks passed.");
}


void EvaluationWorker(const QualityModel * const quality_model, std::deque<Bib::Record *> * const task_queue,
                      std::mutex * const task_queue_mutex)
{
    for (;;) {
        Bib::Record *record;
        {
            std::lock_guard<std::mutex> task_queue_mutex_locker(*task_queue_mutex);
            if (task_queue->empty())
                return;
            record = task_queue->front();
            task_queue->pop_front();
        }

        try {
            quality_model->evaluate(record);
        } catch (const std::exception &x) {
            LOG_ERROR("failed to evaluate \"" + record->getID() + "\": " + std::string(x.what()));
        }
    }
}


void EvaluateRecords(const QualityModel &quality_model, const unsigned worker_thread_count, std::vector<Bib::Record> * const records) {
    std::deque<Bib::Record *> task_queue;
    for (auto &record : *records)
        task_queue.emplace_back(&record);
    std::mutex task_queue_mutex;

    std::vector<std::thread> thread_pool;
    for (unsigned i(0); i < worker_thread_count; ++i)
        thread_pool.emplace_back(EvaluationWorker, &quality_model, &task_queue, &task_queue_mutex);
    for (auto &worker_thread : thread_pool)
        worker_thread.join();
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    std::string config_path, annotated_snapshot_path;
    bool strict_mode(false);
    unsigned worker_thread_count(0);
    while (argc > 1 and StringUtil::StartsWith(argv[1], "--")) {
        const std::string flag(argv[1]);
        if (StringUtil::StartsWith(flag, "--config="))
            config_path = flag.substr(__builtin_strlen("--config="));
        else if (flag == "--strict")
            strict_mode = true;
        else if (StringUtil::StartsWith(flag, "--worker-threads=")) {
            if (not StringUtil::ToUnsigned(flag.substr(__builtin_strlen("--worker-threads=")), &worker_thread_count)
                or worker_thread_count == 0)
                LOG_ERROR("bad worker thread count in \"" + flag + "\"!");
        } else if (StringUtil::StartsWith(flag, "--write-annotated="))
            annotated_snapshot_path = flag.substr(__builtin_strlen("--write-annotated="));
        else
            Usage();
        --argc, ++argv;
    }

    if (argc != 2 and argc != 3)
        Usage();

    const IniFile ini_file(config_path.empty() ? IniFile() : IniFile(config_path));
    const QualityModel quality_model(QualityModel::Config::FromIniFile(ini_file));
    auto checker_config(ConsistencyChecker::Config::FromIniFile(ini_file));
    if (strict_mode)
        checker_config.strict_mode_ = true;
    if (worker_thread_count == 0)
        worker_thread_count = checker_config.max_threads_;

    ConsistencyChecker::Snapshot current_snapshot, prior_snapshot;
    ConsistencyChecker::ChangeLog change_log;
    SnapshotIO::Load(argv[1], &current_snapshot, &change_log);
    if (argc == 3)
        SnapshotIO::Load(argv[2], &prior_snapshot, /* change_log = */ nullptr);

    EvaluateRecords(quality_model, worker_thread_count, &current_snapshot.records_);
    unsigned defective_record_count(0);
    for (const auto &record : current_snapshot.records_) {
        if (QualityModel::HasQualityDefects(record))
            ++defective_record_count;
    }

    if (not annotated_snapshot_path.empty())
        SnapshotIO::Write(annotated_snapshot_path, current_snapshot, change_log);

    const ConsistencyChecker checker(checker_config);
    const auto result(checker.check(prior_snapshot, current_snapshot, change_log));
    std::cout << result.toString() << '\n';

    LOG_INFO("checked " + std::to_string(current_snapshot.records_.size()) + " record(s), " + std::to_string(defective_record_count)
             + " with quality defects, verdict: " + (result.passed() ? "PASS" : "FAIL"));

    return result.passed() ? EXIT_SUCCESS : EXIT_FAILURE;
}
