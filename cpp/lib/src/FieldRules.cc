/** \file   FieldRules.cc
 *  \brief  Implementation of the built-in field rules.
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
#include "FieldRules.h"
#include <unordered_set>
#include "DefectCodes.h"
#include "LanguageCodes.h"
#include "RegexMatcher.h"
#include "StringUtil.h"
#include "TextUtil.h"


namespace FieldRules {


Config::Config()
    : caps_ratio_threshold_(DEFAULT_CAPS_RATIO_THRESHOLD), min_caps_letters_(DEFAULT_MIN_CAPS_LETTERS),
      max_abbreviated_container_length_(DEFAULT_MAX_ABBREVIATED_CONTAINER_LENGTH),
      known_short_container_names_{ "AIDS", "BMJ", "JAMA", "NBER" } { }


namespace {


const std::string ELLIPSIS("\xE2\x80\xA6");
const std::string AUTHOR_SEPARATOR(" and ");
const std::string TOKEN_DELIMITERS(" ,;.");


bool HasUppercaseLetter(const std::vector<uint32_t> &code_points) {
    for (const auto code_point : code_points) {
        if (TextUtil::IsUppercase(code_point))
            return true;
    }
    return false;
}


bool HasLowercaseLetter(const std::vector<uint32_t> &code_points) {
    for (const auto code_point : code_points) {
        if (TextUtil::IsLowercase(code_point))
            return true;
    }
    return false;
}


std::vector<std::string> SplitAuthors(const std::string &author_field) {
    std::vector<std::string> names;
    StringUtil::Split(author_field, AUTHOR_SEPARATOR, &names, /* suppress_empty_components = */ false);
    return names;
}


// Lowercased tokens, split on spaces and punctuation.
std::vector<std::string> GetLowercaseTokens(const std::string &value) {
    std::vector<std::string> tokens;
    StringUtil::SplitOnAnyOf(TextUtil::UTF8ToLower(value), TOKEN_DELIMITERS, &tokens);
    return tokens;
}


// Base class for rules that judge each of their fields in isolation.
class PerFieldRule : public Rule {
    const std::string name_;
    const std::vector<std::string> field_names_;

public:
    PerFieldRule(const std::string &name, const std::vector<std::string> &field_names): name_(name), field_names_(field_names) { }

    virtual const std::string &getName() const final { return name_; }
    virtual void check(const Bib::Record &record, const Config &config, DefectMap * const defects) const final;

protected:
    virtual bool isDefective(const std::string &field_name, const std::string &value, const Config &config) const = 0;
};


void PerFieldRule::check(const Bib::Record &record, const Config &config, DefectMap * const defects) const {
    for (const auto &field_name : field_names_) {
        if (record.hasUsableField(field_name) and isDefective(field_name, record.getField(field_name), config))
            (*defects)[field_name].emplace(name_);
    }
}


class MostlyAllCaps final : public PerFieldRule {
public:
    MostlyAllCaps(): PerFieldRule(DefectCodes::MOSTLY_ALL_CAPS, { "title", "author", "journal", "booktitle" }) { }

protected:
    virtual bool isDefective(const std::string &field_name, const std::string &value, const Config &config) const final;
};


bool MostlyAllCaps::isDefective(const std::string &field_name, const std::string &value, const Config &config) const {
    const std::string text(field_name == "author" ? StringUtil::ReplaceString(AUTHOR_SEPARATOR, " ", value) : value);

    unsigned letter_count(0), uppercase_count(0);
    for (const auto code_point : TextUtil::UTF8ToUTF32(text)) {
        if (not TextUtil::IsLetter(code_point))
            continue;
        ++letter_count;
        if (TextUtil::IsUppercase(code_point))
            ++uppercase_count;
    }

    if (letter_count < config.min_caps_letters_ or letter_count == 0)
        return false;
    return static_cast<double>(uppercase_count) / letter_count >= config.caps_ratio_threshold_;
}


class IncompleteField final : public PerFieldRule {
public:
    IncompleteField()
        : PerFieldRule(DefectCodes::INCOMPLETE_FIELD,
                       { "title", "author", "journal", "booktitle", "publisher", "editor", "series", "school", "institution" }) { }

protected:
    virtual bool isDefective(const std::string &field_name, const std::string &value, const Config &config) const final;
};


bool IncompleteField::isDefective(const std::string &field_name, const std::string &value, const Config &/*config*/) const {
    const auto trimmed_value(StringUtil::TrimWhite(value));
    if (StringUtil::EndsWith(trimmed_value, "...") or StringUtil::EndsWith(trimmed_value, ELLIPSIS))
        return true;

    if (field_name != "author")
        return false;

    return StringUtil::EndsWith(trimmed_value, "et al.", /* ignore_case = */ true)
           or StringUtil::EndsWith(trimmed_value, "et al", /* ignore_case = */ true) or StringUtil::EndsWith(trimmed_value, ',')
           or StringUtil::EndsWith(trimmed_value, " and");
}


class NameFormatSeparators final : public PerFieldRule {
    const ThreadSafeRegexMatcher name_matcher_;
    const ThreadSafeRegexMatcher initials_matcher_;

public:
    NameFormatSeparators()
        : PerFieldRule(DefectCodes::NAME_FORMAT_SEPARATORS, { "author" }),
          name_matcher_("^[\\w .'\xE2\x80\x99-]*, [\\w .'\xE2\x80\x99-]*$",
                        ThreadSafeRegexMatcher::ENABLE_UTF8 | ThreadSafeRegexMatcher::ENABLE_UCP),
          initials_matcher_("[A-Z] [A-Z] [A-Z] [A-Z]") { }

protected:
    virtual bool isDefective(const std::string &field_name, const std::string &value, const Config &config) const final;
};


bool NameFormatSeparators::isDefective(const std::string &/*field_name*/, const std::string &value,
                                       const Config &/*config*/) const {
    if (initials_matcher_.match(value))
        return true;

    for (const auto &name : SplitAuthors(value)) {
        const auto match_result(name_matcher_.match(name));
        if (not match_result.getErrorMessage().empty())
            return false; // Most likely invalid UTF-8 which is reported by the symbol rule.
        if (not match_result or not HasUppercaseLetter(TextUtil::UTF8ToUTF32(name)))
            return true;
    }

    return false;
}


class NameFormatTitles final : public PerFieldRule {
public:
    NameFormatTitles(): PerFieldRule(DefectCodes::NAME_FORMAT_TITLES, { "author" }) { }

protected:
    virtual bool isDefective(const std::string &field_name, const std::string &value, const Config &config) const final;
};


bool NameFormatTitles::isDefective(const std::string &/*field_name*/, const std::string &value, const Config &/*config*/) const {
    static const std::unordered_set<std::string> ACADEMIC_TITLES{ "phd", "dr", "prof", "mba", "msc", "bsc", "mphil", "dphil" };

    for (const auto &token : GetLowercaseTokens(value)) {
        if (ACADEMIC_TITLES.find(token) != ACADEMIC_TITLES.cend())
            return true;
    }

    return false;
}


class NameAbbreviated final : public PerFieldRule {
public:
    NameAbbreviated(): PerFieldRule(DefectCodes::NAME_ABBREVIATED, { "author" }) { }

protected:
    virtual bool isDefective(const std::string &/*field_name*/, const std::string &value, const Config &/*config*/) const final {
        const auto normalised_value(StringUtil::ToLower(StringUtil::TrimWhite(value)));
        return StringUtil::EndsWith(normalised_value, "and others") or StringUtil::EndsWith(normalised_value, "and others.");
    }
};


class ErroneousTermInField final : public PerFieldRule {
public:
    ErroneousTermInField(): PerFieldRule(DefectCodes::ERRONEOUS_TERM_IN_FIELD, { "author" }) { }

protected:
    virtual bool isDefective(const std::string &field_name, const std::string &value, const Config &config) const final;
};


bool ErroneousTermInField::isDefective(const std::string &/*field_name*/, const std::string &value, const Config &/*config*/) const {
    static const std::unordered_set<std::string> INSTITUTIONAL_TERMS{
        "university", "universit\xC3\xA4t", "universidad", "universit\xC3\xA9", "institute", "institut",  "department",
        "faculty",    "laboratory",         "corporation", "committee",         "association", "staff",
    };

    if (StringUtil::Contains(value, "http"))
        return true;

    for (const auto &token : GetLowercaseTokens(value)) {
        if (INSTITUTIONAL_TERMS.find(token) != INSTITUTIONAL_TERMS.cend())
            return true;
    }

    return false;
}


class ErroneousSymbolInField final : public PerFieldRule {
public:
    ErroneousSymbolInField(): PerFieldRule(DefectCodes::ERRONEOUS_SYMBOL_IN_FIELD, { "title", "author", "journal", "booktitle" }) { }

protected:
    virtual bool isDefective(const std::string &field_name, const std::string &value, const Config &config) const final;
};


bool ErroneousSymbolInField::isDefective(const std::string &/*field_name*/, const std::string &value,
                                         const Config &/*config*/) const {
    static constexpr uint32_t TRADE_MARK_SIGN(0x2122u);
    static constexpr uint32_t REGISTERED_SIGN(0xAEu);

    for (const auto code_point : TextUtil::UTF8ToUTF32(value)) {
        if (code_point == TextUtil::REPLACEMENT_CHARACTER or code_point == TRADE_MARK_SIGN or code_point == REGISTERED_SIGN
            or TextUtil::IsControlCharacter(code_point))
            return true;
    }

    return false;
}


class ErroneousTitleField final : public PerFieldRule {
    const ThreadSafeRegexMatcher digit_substitution_matcher_;

public:
    ErroneousTitleField()
        : PerFieldRule(DefectCodes::ERRONEOUS_TITLE_FIELD, { "title" }), digit_substitution_matcher_("[a-z]\\d+[a-z]|\\d[a-z]+\\d") { }

protected:
    virtual bool isDefective(const std::string &/*field_name*/, const std::string &value, const Config &/*config*/) const final {
        return value.find('_') != std::string::npos or digit_substitution_matcher_.match(value);
    }
};


class ContainerTitleAbbreviated final : public PerFieldRule {
    const ThreadSafeRegexMatcher dotted_abbreviation_matcher_;

public:
    ContainerTitleAbbreviated()
        : PerFieldRule(DefectCodes::CONTAINER_TITLE_ABBREVIATED, { "journal", "booktitle" }),
          dotted_abbreviation_matcher_("^[A-Z][a-z]*\\.$") { }

protected:
    virtual bool isDefective(const std::string &field_name, const std::string &value, const Config &config) const final;
};


bool ContainerTitleAbbreviated::isDefective(const std::string &/*field_name*/, const std::string &value, const Config &config) const {
    const auto trimmed_value(StringUtil::TrimWhite(value));
    if (config.known_short_container_names_.find(trimmed_value) != config.known_short_container_names_.cend())
        return false;

    const auto code_points(TextUtil::UTF8ToUTF32(trimmed_value));
    if (code_points.size() <= config.max_abbreviated_container_length_ and HasUppercaseLetter(code_points)
        and not HasLowercaseLetter(code_points))
        return true;

    std::vector<std::string> tokens;
    StringUtil::Split(trimmed_value, ' ', &tokens);
    unsigned dotted_abbreviation_count(0);
    for (const auto &token : tokens) {
        if (dotted_abbreviation_matcher_.match(token))
            ++dotted_abbreviation_count;
    }

    return dotted_abbreviation_count >= 2;
}


class InconsistentContent final : public PerFieldRule {
public:
    InconsistentContent(): PerFieldRule(DefectCodes::INCONSISTENT_CONTENT, { "journal", "booktitle" }) { }

protected:
    virtual bool isDefective(const std::string &field_name, const std::string &value, const Config &config) const final;
};


bool InconsistentContent::isDefective(const std::string &field_name, const std::string &value, const Config &/*config*/) const {
    const auto lowercase_value(TextUtil::UTF8ToLower(value));
    if (field_name == "booktitle")
        return StringUtil::Contains(lowercase_value, "journal");

    for (const auto &conference_term : { "conference", "workshop", "proceedings", "symposium" }) {
        if (StringUtil::Contains(lowercase_value, conference_term))
            return true;
    }

    return false;
}


class YearFormat final : public PerFieldRule {
public:
    YearFormat(): PerFieldRule(DefectCodes::YEAR_FORMAT, { "year" }) { }

protected:
    virtual bool isDefective(const std::string &/*field_name*/, const std::string &value, const Config &/*config*/) const final {
        const auto trimmed_value(StringUtil::TrimWhite(value));
        return not ((trimmed_value.length() == 4 and StringUtil::IsUnsignedNumber(trimmed_value)) or trimmed_value == "forthcoming");
    }
};


class LanguageFormat final : public PerFieldRule {
public:
    LanguageFormat(): PerFieldRule(DefectCodes::LANGUAGE_FORMAT_ERROR, { "language" }) { }

protected:
    virtual bool isDefective(const std::string &/*field_name*/, const std::string &value, const Config &/*config*/) const final {
        return not LanguageCodes::IsValidISO639_3Code(value);
    }
};


class IdenticalValuesBetweenTitleAndContainer final : public Rule {
public:
    virtual const std::string &getName() const final { return DefectCodes::IDENTICAL_VALUES_BETWEEN_TITLE_AND_CONTAINER; }
    virtual void check(const Bib::Record &record, const Config &config, DefectMap * const defects) const final;
};


void IdenticalValuesBetweenTitleAndContainer::check(const Bib::Record &record, const Config &/*config*/,
                                                    DefectMap * const defects) const {
    if (not record.hasUsableField("title"))
        return;

    const auto title(StringUtil::TrimWhite(record.getField("title")));
    for (const auto &container_field : { "journal", "booktitle" }) {
        if (record.hasUsableField(container_field) and StringUtil::TrimWhite(record.getField(container_field)) == title) {
            (*defects)["title"].emplace(getName());
            return;
        }
    }
}


class ThesisWithMultipleAuthors final : public Rule {
public:
    virtual const std::string &getName() const final { return DefectCodes::THESIS_WITH_MULTIPLE_AUTHORS; }

    virtual void check(const Bib::Record &record, const Config &/*config*/, DefectMap * const defects) const final {
        if (Bib::IsThesisType(record.getEntryType()) and record.hasUsableField("author")
            and StringUtil::Contains(record.getField("author"), AUTHOR_SEPARATOR))
            (*defects)["author"].emplace(getName());
    }
};


class InconsistentWithEntryType final : public Rule {
public:
    virtual const std::string &getName() const final { return DefectCodes::INCONSISTENT_WITH_ENTRYTYPE; }

    virtual void check(const Bib::Record &record, const Config &/*config*/, DefectMap * const defects) const final {
        if (not Bib::IsKnownEntryType(record.getEntryType()))
            return;

        for (const auto &field_name : Bib::GetInconsistentFields(record.getEntryType())) {
            if (record.hasUsableField(field_name))
                (*defects)[field_name].emplace(getName());
        }
    }
};


} // unnamed namespace


void Registry::add(std::unique_ptr<const Rule> rule) {
    const auto &rule_name(rule->getName());
    if (not DefectCodes::IsValidDefectCode(rule_name))
        throw std::runtime_error("in FieldRules::Registry::add: \"" + rule_name + "\" is not a known defect code!");

    for (const auto &registered_rule : rules_) {
        if (registered_rule->getName() == rule_name)
            throw std::runtime_error("in FieldRules::Registry::add: a rule named \"" + rule_name + "\" is already registered!");
    }

    rules_.emplace_back(std::move(rule));
}


std::vector<std::string> Registry::getRuleNames() const {
    std::vector<std::string> rule_names;
    for (const auto &rule : rules_)
        rule_names.emplace_back(rule->getName());
    return rule_names;
}


DefectMap Registry::apply(const Bib::Record &record, const Config &config) const {
    DefectMap defects;
    for (const auto &rule : rules_)
        rule->check(record, config, &defects);
    return defects;
}


std::unique_ptr<Registry> CreateDefaultRegistry() {
    std::unique_ptr<Registry> registry(new Registry);
    registry->add(std::unique_ptr<const Rule>(new MostlyAllCaps));
    registry->add(std::unique_ptr<const Rule>(new IncompleteField));
    registry->add(std::unique_ptr<const Rule>(new NameFormatSeparators));
    registry->add(std::unique_ptr<const Rule>(new NameFormatTitles));
    registry->add(std::unique_ptr<const Rule>(new NameAbbreviated));
    registry->add(std::unique_ptr<const Rule>(new ErroneousTermInField));
    registry->add(std::unique_ptr<const Rule>(new ErroneousSymbolInField));
    registry->add(std::unique_ptr<const Rule>(new ErroneousTitleField));
    registry->add(std::unique_ptr<const Rule>(new ContainerTitleAbbreviated));
    registry->add(std::unique_ptr<const Rule>(new InconsistentContent));
    registry->add(std::unique_ptr<const Rule>(new IdenticalValuesBetweenTitleAndContainer));
    registry->add(std::unique_ptr<const Rule>(new ThesisWithMultipleAuthors));
    registry->add(std::unique_ptr<const Rule>(new YearFormat));
    registry->add(std::unique_ptr<const Rule>(new LanguageFormat));
    registry->add(std::unique_ptr<const Rule>(new InconsistentWithEntryType));
    return registry;
}


const Registry &GetDefaultRegistry() {
    static const std::unique_ptr<Registry> default_registry(CreateDefaultRegistry());
    return *default_registry;
}


} // namespace FieldRules
