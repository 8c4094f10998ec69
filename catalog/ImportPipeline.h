// Two-stage import: ingest every requested source, then expand variants once across all of them.
#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "CatalogTypes.h"
#include "ExpansionConfig.h"
#include "variants/VariantTypes.h"

namespace Catalog {

class CatalogStore;

class ImportPipeline {
public:
    explicit ImportPipeline(CatalogStore& store, ExpansionConfig config = {});

    // Stage one. Registers the source and stages its base items and templates.
    // Re-ingesting a source replaces everything staged for it.
    void ingest(const CatalogSource& source, std::vector<Variants::BaseItem> baseItems,
                std::vector<Variants::VariantTemplate> templates);
    // Same, decoding compendium documents ({"baseitem": [...]}, {"magicvariant": [...]}).
    void ingestJson(const CatalogSource& source, const nlohmann::json& baseItemsDoc,
                    const nlohmann::json& variantsDoc);

    // Stage two, the barrier: expands all staged templates against all staged base
    // items, regardless of which source contributed them. Throws Variants::PersistenceError.
    Variants::ExpansionResult expandVariants();

    std::size_t sourceCount() const { return staged_.size(); }
    std::size_t baseItemCount() const;
    std::size_t templateCount() const;
    const ExpansionConfig& config() const { return config_; }

private:
    struct StagedSource {
        CatalogSource source;
        std::vector<Variants::BaseItem> baseItems;
        std::vector<Variants::VariantTemplate> templates;
    };

    CatalogStore& store_;
    ExpansionConfig config_;
    std::map<std::string, StagedSource> staged_;  // keyed by source code
};

}  // namespace Catalog
