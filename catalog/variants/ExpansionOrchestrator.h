// Cross product of variant templates and base items, deduplicated and persisted as one batch.
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "VariantTypes.h"
#include "../ExpansionConfig.h"

namespace Catalog {
class CatalogStore;
}

namespace Catalog::Variants {

// The catalog write failed and was rolled back; the previous catalog state is intact.
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};

struct ExpansionRun {
    ExpansionResult result;
    // One entry per (name, source), ordered by that key.
    std::vector<ExpandedItem> items;
};

// Pure phase: validation, matching and dedup. Identical output for any worker count.
ExpansionRun runExpansion(const std::vector<VariantTemplate>& templates, const std::vector<BaseItem>& baseItems,
                          const ExpansionConfig& config = {});

// Runs the expansion and replaces every generated catalog row in one transaction.
// Throws PersistenceError when the write fails.
ExpansionResult expandVariants(CatalogStore& store, const std::vector<VariantTemplate>& templates,
                               const std::vector<BaseItem>& baseItems, const ExpansionConfig& config = {});

}  // namespace Catalog::Variants
