// Pure predicates deciding whether a base item satisfies a variant template.
#pragma once

#include <vector>

#include "VariantTypes.h"

namespace Catalog::Variants {

struct MatchOptions {
    // Compare "type"/"property" values without their "|SOURCE" suffix.
    bool stripSourceSuffix{true};
};

// One key of a requirement object against one item. Unsupported values never match.
bool clauseMatches(const RequirementClause& clause, const BaseItem& item, const MatchOptions& opts = {});

// Every clause must hold.
bool requirementMatches(const Requirement& requirement, const BaseItem& item, const MatchOptions& opts = {});

// True when any exclusion clause rules the item out.
bool itemExcluded(const BaseItem& item, const std::vector<RequirementClause>& excludes,
                  const MatchOptions& opts = {});

// Any requirement holds and no exclusion applies.
bool itemMatchesTemplate(const BaseItem& item, const VariantTemplate& tmpl, const MatchOptions& opts = {});

}  // namespace Catalog::Variants
