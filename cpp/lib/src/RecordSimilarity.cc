/** \file   RecordSimilarity.cc
 *  \brief  Implementation of the record similarity scorer.
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
#include "RecordSimilarity.h"
#include <algorithm>
#include <mutex>
#include <sstream>
#include <thread>
#include <cstdint>
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


namespace RecordSimilarity {


Config::Config()
    : author_weight_(0.15), title_weight_(0.75), year_weight_(0.05), container_weight_(0.02), volume_weight_(0.02), number_weight_(0.01),
      container_weight_without_journal_(0.05) { }


namespace {


double GetWeight(const IniFile &ini_file, const std::string &section_name, const std::string &weight_name, const double default_weight) {
    const double weight(ini_file.getDouble(section_name, weight_name, default_weight));
    if (weight < 0.0)
        throw std::runtime_error("in RecordSimilarity::Config::FromIniFile: " + weight_name + " must not be negative!");
    return weight;
}


} // unnamed namespace


Config Config::FromIniFile(const IniFile &ini_file, const std::string &section_name) {
    Config config;
    config.author_weight_ = GetWeight(ini_file, section_name, "author_weight", config.author_weight_);
    config.title_weight_ = GetWeight(ini_file, section_name, "title_weight", config.title_weight_);
    config.year_weight_ = GetWeight(ini_file, section_name, "year_weight", config.year_weight_);
    config.container_weight_ = GetWeight(ini_file, section_name, "container_weight", config.container_weight_);
    config.volume_weight_ = GetWeight(ini_file, section_name, "volume_weight", config.volume_weight_);
    config.number_weight_ = GetWeight(ini_file, section_name, "number_weight", config.number_weight_);
    config.container_weight_without_journal_ =
        GetWeight(ini_file, section_name, "container_weight_without_journal", config.container_weight_without_journal_);
    return config;
}


std::string Normalize(const std::string &value) {
    std::string normalised_value(TextUtil::RemoveDiacritics(TextUtil::UTF8ToLower(value)));
    for (auto &ch : normalised_value) {
        if (static_cast<unsigned char>(ch) < 0x80u and not StringUtil::IsAsciiLetter(ch) and not StringUtil::IsDigit(ch))
            ch = ' ';
    }

    return StringUtil::CollapseAndTrimWhitespace(&normalised_value);
}


namespace {


// The length of the longest common subsequence, the indel distance is |s1| + |s2| - 2 * LCS.
size_t LongestCommonSubsequenceLength(const std::vector<uint32_t> &s1, const size_t s1_start, const size_t s1_length,
                                      const std::vector<uint32_t> &s2)
{
    std::vector<size_t> row(s2.size() + 1, 0), previous_row(s2.size() + 1, 0);
    for (size_t i(0); i < s1_length; ++i) {
        for (size_t j(0); j < s2.size(); ++j)
            row[j + 1] = (s1[s1_start + i] == s2[j]) ? previous_row[j] + 1 : std::max(previous_row[j + 1], row[j]);
        row.swap(previous_row);
    }

    return previous_row[s2.size()];
}


double Ratio(const std::vector<uint32_t> &s1, const size_t s1_start, const size_t s1_length, const std::vector<uint32_t> &s2) {
    const size_t total_length(s1_length + s2.size());
    if (total_length == 0)
        return 1.0;

    return 2.0 * LongestCommonSubsequenceLength(s1, s1_start, s1_length, s2) / total_length;
}


} // unnamed namespace


double Ratio(const std::string &s1, const std::string &s2) {
    const auto code_points1(TextUtil::UTF8ToUTF32(s1));
    return Ratio(code_points1, 0, code_points1.size(), TextUtil::UTF8ToUTF32(s2));
}


double PartialRatio(const std::string &s1, const std::string &s2) {
    auto shorter(TextUtil::UTF8ToUTF32(s1)), longer(TextUtil::UTF8ToUTF32(s2));
    if (shorter.size() > longer.size())
        shorter.swap(longer);

    if (shorter.empty())
        return longer.empty() ? 1.0 : 0.0;

    double best_ratio(0.0);
    for (size_t window_start(0); window_start + shorter.size() <= longer.size(); ++window_start) {
        best_ratio = std::max(best_ratio, Ratio(longer, window_start, shorter.size(), shorter));
        if (best_ratio == 1.0)
            break;
    }

    return best_ratio;
}


namespace {


inline std::string GetNormalisedField(const Bib::Record &record, const std::string &field_name) {
    return record.hasUsableField(field_name) ? Normalize(record.getField(field_name)) : "";
}


inline std::string GetContainer(const Bib::Record &record) {
    return record.hasUsableField("journal") ? GetNormalisedField(record, "journal") : GetNormalisedField(record, "booktitle");
}


} // unnamed namespace


std::string Details::toString() const {
    std::ostringstream output;
    for (const auto &field_score : field_scores_)
        output << field_score.field_name_ << ": " << field_score.score_ << " (weight " << field_score.weight_ << ")\n";
    output << "similarity: " << similarity_;
    return output.str();
}


Details GetDetails(const Bib::Record &record1, const Bib::Record &record2, const Config &config) {
    Details details;
    details.field_scores_.emplace_back("author", PartialRatio(GetNormalisedField(record1, "author"), GetNormalisedField(record2, "author")),
                                       config.author_weight_);
    details.field_scores_.emplace_back("title", Ratio(GetNormalisedField(record1, "title"), GetNormalisedField(record2, "title")),
                                       config.title_weight_);
    details.field_scores_.emplace_back("year", PartialRatio(GetNormalisedField(record1, "year"), GetNormalisedField(record2, "year")),
                                       config.year_weight_);

    const double container_score(Ratio(GetContainer(record1), GetContainer(record2)));
    if (record1.hasUsableField("journal") and record2.hasUsableField("journal")) {
        details.field_scores_.emplace_back("container", container_score, config.container_weight_);
        details.field_scores_.emplace_back("volume", Ratio(GetNormalisedField(record1, "volume"), GetNormalisedField(record2, "volume")),
                                           config.volume_weight_);
        details.field_scores_.emplace_back("number", Ratio(GetNormalisedField(record1, "number"), GetNormalisedField(record2, "number")),
                                           config.number_weight_);
    } else
        details.field_scores_.emplace_back("container", container_score, config.container_weight_without_journal_);

    double weighted_score_sum(0.0), weight_sum(0.0);
    for (const auto &field_score : details.field_scores_) {
        weighted_score_sum += field_score.weight_ * field_score.score_;
        weight_sum += field_score.weight_;
    }

    if (weight_sum == 0.0)
        details.similarity_ = 0.0;
    else
        details.similarity_ = std::min(1.0, std::max(0.0, weighted_score_sum / weight_sum));

    return details;
}


double Similarity(const Bib::Record &record1, const Bib::Record &record2, const Config &config) {
    return GetDetails(record1, record2, config).similarity_;
}


namespace {


void WorkerThread(const std::vector<Bib::Record> * const records, const Config * const config, const double threshold,
                  size_t * const next_row, std::mutex * const next_row_mutex, std::vector<CandidatePair> * const candidate_pairs,
                  std::mutex * const candidate_pairs_mutex)
{
    for (;;) {
        size_t row;
        {
            std::lock_guard<std::mutex> next_row_mutex_locker(*next_row_mutex);
            if (*next_row >= records->size())
                return;
            row = (*next_row)++;
        }

        std::vector<CandidatePair> row_candidates;
        const auto &record1((*records)[row]);
        for (size_t column(row + 1); column < records->size(); ++column) {
            const auto &record2((*records)[column]);
            const double similarity(Similarity(record1, record2, *config));
            if (similarity < threshold)
                continue;

            if (record1.getID() <= record2.getID())
                row_candidates.emplace_back(record1.getID(), record2.getID(), similarity);
            else
                row_candidates.emplace_back(record2.getID(), record1.getID(), similarity);
        }

        if (not row_candidates.empty()) {
            std::lock_guard<std::mutex> candidate_pairs_mutex_locker(*candidate_pairs_mutex);
            candidate_pairs->insert(candidate_pairs->end(), row_candidates.cbegin(), row_candidates.cend());
        }
    }
}


} // unnamed namespace


std::vector<CandidatePair> FindCandidatePairs(const std::vector<Bib::Record> &records, const Config &config, const double threshold,
                                              const unsigned thread_count)
{
    if (thread_count == 0)
        throw std::runtime_error("in RecordSimilarity::FindCandidatePairs: we need at least one worker thread!");

    std::vector<CandidatePair> candidate_pairs;
    size_t next_row(0);
    std::mutex next_row_mutex, candidate_pairs_mutex;

    std::vector<std::thread> thread_pool;
    for (unsigned i(0); i < thread_count; ++i)
        thread_pool.emplace_back(WorkerThread, &records, &config, threshold, &next_row, &next_row_mutex, &candidate_pairs,
                                 &candidate_pairs_mutex);
    for (auto &worker_thread : thread_pool)
        worker_thread.join();

    std::sort(candidate_pairs.begin(), candidate_pairs.end(), [](const CandidatePair &lhs, const CandidatePair &rhs) {
        if (lhs.similarity_ != rhs.similarity_)
            return lhs.similarity_ > rhs.similarity_;
        if (lhs.id1_ != rhs.id1_)
            return lhs.id1_ < rhs.id1_;
        return lhs.id2_ < rhs.id2_;
    });

    LOG_DEBUG("found " + std::to_string(candidate_pairs.size()) + " candidate pair(s) among " + std::to_string(records.size())
              + " record(s).");

    return candidate_pairs;
}


} // namespace RecordSimilarity
