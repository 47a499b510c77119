/** \file   FieldRules.h
 *  \brief  The field-level quality rules that detect defects in bibliographic records.
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
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "Bib.h"


namespace FieldRules {


// Maps field names to the defect codes detected for them.
using DefectMap = std::map<std::string, std::set<std::string>>;


// The tunable thresholds of the heuristic rules.
struct Config {
    static constexpr double DEFAULT_CAPS_RATIO_THRESHOLD = 0.8;
    static constexpr unsigned DEFAULT_MIN_CAPS_LETTERS = 3;
    static constexpr unsigned DEFAULT_MAX_ABBREVIATED_CONTAINER_LENGTH = 5;

    // A value is mostly in capitals if at least this share of its letters is uppercase.
    double caps_ratio_threshold_;

    // Values with fewer letters are never considered to be mostly in capitals.
    unsigned min_caps_letters_;

    // In code points.
    unsigned max_abbreviated_container_length_;

    // Short container titles that are not abbreviations, e.g. "BMJ".
    std::set<std::string> known_short_container_names_;

public:
    Config();
};


/** \class Rule
 *  \brief The interface that all rules implement.
 *  \note  Rules must never throw and must never look at provenance notes.
 */
class Rule {
public:
    virtual ~Rule() { }

    // The defect code that this rule reports.
    virtual const std::string &getName() const = 0;

    // Adds getName() to the entries of "defects" for every defective field of "record".
    virtual void check(const Bib::Record &record, const Config &config, DefectMap * const defects) const = 0;
};


/** \class Registry
 *  \brief An ordered collection of rules.
 */
class Registry {
    std::vector<std::unique_ptr<const Rule>> rules_;

public:
    Registry() = default;
    Registry(const Registry &) = delete;
    Registry &operator=(const Registry &) = delete;

    /** \throws std::runtime_error if the rule's name is not a known defect code or a rule with the same name has already been
     *          registered.
     */
    void add(std::unique_ptr<const Rule> rule);

    inline size_t size() const { return rules_.size(); }
    std::vector<std::string> getRuleNames() const;

    // Runs all rules in registration order.
    DefectMap apply(const Bib::Record &record, const Config &config) const;
};


// Creates a registry holding all built-in rules, to which custom rules may be added.
std::unique_ptr<Registry> CreateDefaultRegistry();


// A shared, immutable instance of what CreateDefaultRegistry() returns.
const Registry &GetDefaultRegistry();


} // namespace FieldRules
