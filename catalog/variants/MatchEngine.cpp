#include "MatchEngine.h"

#include <algorithm>
#include <string_view>

namespace Catalog::Variants {

namespace {
using nlohmann::json;

std::string_view normalize(std::string_view value, const MatchOptions& opts) {
    return opts.stripSourceSuffix ? stripSourceSuffix(value) : value;
}

bool textMatches(std::string_view actual, const RequirementValue& value, const MatchOptions& opts, bool normalizeBoth) {
    const auto cmp = [&](std::string_view expected) {
        return normalizeBoth ? normalize(actual, opts) == normalize(expected, opts) : actual == expected;
    };
    if (const auto* s = std::get_if<std::string>(&value)) return cmp(*s);
    if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
        return std::any_of(list->begin(), list->end(), [&](const std::string& e) { return cmp(e); });
    }
    return false;
}

bool propertyMatches(const BaseItem& item, const RequirementValue& value, const MatchOptions& opts) {
    return std::any_of(item.properties.begin(), item.properties.end(),
                       [&](const std::string& p) { return textMatches(p, value, opts, true); });
}

std::string_view typeField(const BaseItem& item, const MatchOptions& opts) {
    if (!opts.stripSourceSuffix) {
        auto it = item.raw.find("type");
        if (it != item.raw.end() && it->is_string()) return it->get_ref<const std::string&>();
    }
    return item.typeCode;
}

// Fallback for keys without a typed field: compare against the raw compendium value.
bool rawFieldMatches(const BaseItem& item, const std::string& key, const RequirementValue& value) {
    auto it = item.raw.find(key);
    const bool present = it != item.raw.end();
    if (const auto* b = std::get_if<bool>(&value)) {
        const bool actual = present && it->is_boolean() && it->get<bool>();
        return actual == *b;
    }
    if (!present) return false;
    if (const auto* d = std::get_if<double>(&value)) {
        return it->is_number() && it->get<double>() == *d;
    }
    const auto inValues = [&](const std::string& actual) {
        if (const auto* s = std::get_if<std::string>(&value)) return actual == *s;
        if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
            return std::find(list->begin(), list->end(), actual) != list->end();
        }
        return false;
    };
    if (it->is_string()) return inValues(it->get<std::string>());
    if (it->is_array()) {
        return std::any_of(it->begin(), it->end(),
                           [&](const json& e) { return e.is_string() && inValues(e.get<std::string>()); });
    }
    return false;
}

bool flagValue(const BaseItem& item, const std::string& key) {
    if (auto flag = parseItemFlagKey(key)) return item.flag(*flag);
    auto it = item.raw.find(key);
    return it != item.raw.end() && it->is_boolean() && it->get<bool>();
}
}  // namespace

bool clauseMatches(const RequirementClause& clause, const BaseItem& item, const MatchOptions& opts) {
    const auto& key = clause.key;
    const auto& value = clause.value;
    if (std::holds_alternative<UnsupportedValue>(value)) return false;

    if (auto flag = parseItemFlagKey(key)) {
        const auto* b = std::get_if<bool>(&value);
        return b != nullptr && item.flag(*flag) == *b;
    }
    if (key == "type") return textMatches(typeField(item, opts), value, opts, true);
    if (key == "property") return propertyMatches(item, value, opts);
    if (key == "weaponCategory" || key == "weapon_category") {
        return textMatches(item.weaponCategory, value, opts, false);
    }
    if (key == "name") return textMatches(item.name, value, opts, false);
    if (key == "source") return textMatches(item.source, value, opts, false);
    if (key == "dmgType" || key == "dmg_type") return textMatches(item.dmgType, value, opts, false);
    if (key == "scfType" || key == "scf_type") return textMatches(item.scfType, value, opts, false);
    if (key == "dmg1") return textMatches(item.dmg1, value, opts, false);
    return rawFieldMatches(item, key, value);
}

bool requirementMatches(const Requirement& requirement, const BaseItem& item, const MatchOptions& opts) {
    return std::all_of(requirement.clauses.begin(), requirement.clauses.end(),
                       [&](const RequirementClause& c) { return clauseMatches(c, item, opts); });
}

bool itemExcluded(const BaseItem& item, const std::vector<RequirementClause>& excludes, const MatchOptions& opts) {
    for (const auto& clause : excludes) {
        if (const auto* b = std::get_if<bool>(&clause.value)) {
            if (*b && flagValue(item, clause.key)) return true;
        } else if (const auto* s = std::get_if<std::string>(&clause.value)) {
            if (item.name == *s) return true;
        } else if (const auto* list = std::get_if<std::vector<std::string>>(&clause.value)) {
            if (std::find(list->begin(), list->end(), item.name) != list->end()) return true;
            if (propertyMatches(item, clause.value, opts)) return true;
        }
    }
    return false;
}

bool itemMatchesTemplate(const BaseItem& item, const VariantTemplate& tmpl, const MatchOptions& opts) {
    const bool required = std::any_of(tmpl.requirements.begin(), tmpl.requirements.end(),
                                      [&](const Requirement& r) { return requirementMatches(r, item, opts); });
    return required && !itemExcluded(item, tmpl.excludes, opts);
}

}  // namespace Catalog::Variants
