/** \file   RecordSimilarity.h
 *  \brief  Weighted string similarity of bibliographic records, used to explain and find duplicates.
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
#include "IniFile.h"


namespace RecordSimilarity {


struct Config {
    double author_weight_;
    double title_weight_;
    double year_weight_;

    // Only used if both records have a journal.
    double container_weight_;
    double volume_weight_;
    double number_weight_;

    double container_weight_without_journal_;

public:
    Config();

    /** \throws std::runtime_error if a weight is negative. */
    static Config FromIniFile(const IniFile &ini_file, const std::string &section_name = "Similarity");
};


// Lowercases, strips diacritics, replaces punctuation with spaces and collapses whitespace.
std::string Normalize(const std::string &value);


/** \brief  An indel-distance based similarity over code points.
 *  \return (|s1| + |s2| - indel_distance) / (|s1| + |s2|), 1.0 if both strings are empty.
 */
double Ratio(const std::string &s1, const std::string &s2);


// The best Ratio() of the shorter string against all equally long substrings of the longer one.
double PartialRatio(const std::string &s1, const std::string &s2);


struct FieldScore {
    std::string field_name_;
    double score_;
    double weight_;

public:
    FieldScore(const std::string &field_name, const double score, const double weight)
        : field_name_(field_name), score_(score), weight_(weight) { }
};


struct Details {
    std::vector<FieldScore> field_scores_;
    double similarity_;

public:
    Details(): similarity_(0.0) { }
    std::string toString() const;
};


Details GetDetails(const Bib::Record &record1, const Bib::Record &record2, const Config &config = Config());


// Symmetric, in [0, 1], exactly 1.0 if all compared fields are identical after normalisation.
double Similarity(const Bib::Record &record1, const Bib::Record &record2, const Config &config = Config());


struct CandidatePair {
    std::string id1_, id2_;
    double similarity_;

public:
    CandidatePair(const std::string &id1, const std::string &id2, const double similarity)
        : id1_(id1), id2_(id2), similarity_(similarity) { }
};


/** \brief  Compares all pairs of "records" on "thread_count" worker threads.
 *  \return The pairs with a similarity of at least "threshold", best matches first, ties ordered by ID.  Within a pair id1_ is
 *          the lexicographically smaller ID.
 */
std::vector<CandidatePair> FindCandidatePairs(const std::vector<Bib::Record> &records, const Config &config, const double threshold,
                                              const unsigned thread_count);


} // namespace RecordSimilarity
