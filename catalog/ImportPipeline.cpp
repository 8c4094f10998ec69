#include "ImportPipeline.h"

#include <utility>

#include "CatalogStore.h"
#include "variants/ExpansionOrchestrator.h"
#include "../engine/core/Logger.h"

namespace Catalog {

ImportPipeline::ImportPipeline(CatalogStore& store, ExpansionConfig config)
    : store_(store), config_(std::move(config)) {}

void ImportPipeline::ingest(const CatalogSource& source, std::vector<Variants::BaseItem> baseItems,
                            std::vector<Variants::VariantTemplate> templates) {
    // Templates that omit inherits.source produce items under the source that shipped them.
    for (auto& t : templates) {
        if (t.inherits.source.empty()) {
            t.inherits.source = source.code;
            if (t.inherits.fields.is_object()) t.inherits.fields["source"] = source.code;
        }
    }
    store_.upsertSource(source);

    StagedSource& slot = staged_[source.code];
    const bool replacing = !slot.source.code.empty();
    slot.source = source;
    slot.baseItems = std::move(baseItems);
    slot.templates = std::move(templates);
    Engine::logInfo(std::string(replacing ? "Re-ingested " : "Ingested ") + source.code + ": " +
                    std::to_string(slot.baseItems.size()) + " base items, " + std::to_string(slot.templates.size()) +
                    " variant templates");
}

void ImportPipeline::ingestJson(const CatalogSource& source, const nlohmann::json& baseItemsDoc,
                                const nlohmann::json& variantsDoc) {
    ingest(source, Variants::decodeBaseItems(baseItemsDoc), Variants::decodeVariantTemplates(variantsDoc));
}

std::size_t ImportPipeline::baseItemCount() const {
    std::size_t n = 0;
    for (const auto& kv : staged_) n += kv.second.baseItems.size();
    return n;
}

std::size_t ImportPipeline::templateCount() const {
    std::size_t n = 0;
    for (const auto& kv : staged_) n += kv.second.templates.size();
    return n;
}

Variants::ExpansionResult ImportPipeline::expandVariants() {
    std::vector<Variants::BaseItem> baseItems;
    std::vector<Variants::VariantTemplate> templates;
    baseItems.reserve(baseItemCount());
    templates.reserve(templateCount());
    for (const auto& kv : staged_) {
        baseItems.insert(baseItems.end(), kv.second.baseItems.begin(), kv.second.baseItems.end());
        templates.insert(templates.end(), kv.second.templates.begin(), kv.second.templates.end());
    }
    if (templates.empty() || baseItems.empty()) {
        Engine::logInfo("No variant templates or base items staged; clearing generated items only");
    }
    return Variants::expandVariants(store_, templates, baseItems, config_);
}

}  // namespace Catalog
