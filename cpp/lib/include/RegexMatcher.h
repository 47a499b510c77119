/** \file   RegexMatcher.h
 *  \brief  Interface for the ThreadSafeRegexMatcher class, a thin wrapper around PCRE.
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


#include <memory>
#include <string>
#include <stdexcept>
#include <vector>
#include <pcre.h>


/** \brief A compiled PCRE pattern that may be shared between threads.
 *  \note  Copies share the compiled pattern, all state that a match produces lives in the returned MatchResult.
 */
class ThreadSafeRegexMatcher {
public:
    class MatchResult {
        friend class ThreadSafeRegexMatcher;

        std::string subject_;
        bool matched_;
        unsigned match_count_;
        std::vector<int> substr_indices_;
        std::string error_message_;

    public:
        explicit MatchResult(const std::string &subject);
        MatchResult(const MatchResult &) = default;
        MatchResult(MatchResult &&) = default;
        MatchResult &operator=(const MatchResult &) = default;

        inline operator bool() const { return matched_; }
        inline unsigned size() const { return match_count_; }

        // Non-empty if PCRE reported an error other than "no match", e.g. for invalid UTF-8 in the subject.
        inline const std::string &getErrorMessage() const { return error_message_; }

        /** \brief Returns either the full match or a matched substring.
         *  \param group  When "group" is 0, the full match will be returned, o/w the n-th substring match.
         *  \throws std::out_of_range when "group" is not less than size().
         */
        std::string operator[](const unsigned group) const;
    };

    // We need this wrapper class to use the incomplete
    // PCRE types with the STL smart pointers
    struct PcreData {
        ::pcre *pcre_;
        ::pcre_extra *pcre_extra_;

    public:
        PcreData(): pcre_(nullptr), pcre_extra_(nullptr) { }
        ~PcreData() {
            if (pcre_extra_ != nullptr)
                ::pcre_free_study(pcre_extra_);

            if (pcre_ != nullptr)
                ::pcre_free(pcre_);
        }
    };

    enum Option { ENABLE_UTF8 = 1, CASE_INSENSITIVE = 2, MULTILINE = 4, ENABLE_UCP = 8 }; // These need to be powers of 2.

private:
    static constexpr size_t MAX_SUBSTRING_MATCHES = 40;

    std::string pattern_;
    unsigned options_;
    std::shared_ptr<PcreData> pcre_data_;

public:
    /** \note Aborts via LOG_ERROR if "pattern" can't be compiled. */
    explicit ThreadSafeRegexMatcher(const std::string &pattern, const unsigned options = ENABLE_UTF8);
    ThreadSafeRegexMatcher(const ThreadSafeRegexMatcher &rhs) = default;

    /** In the case of a successful match, "start_pos" and "end_pos" will point to the first and last+1 byte of the
     *  matched part of "subject" respectively.
     */
    MatchResult match(const std::string &subject, const size_t subject_start_offset = 0, size_t * const start_pos = nullptr,
                      size_t * const end_pos = nullptr) const;
};
