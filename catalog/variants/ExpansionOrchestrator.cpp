#include "ExpansionOrchestrator.h"

#include <algorithm>
#include <map>
#include <thread>
#include <tuple>
#include <utility>

#include "BlobMerger.h"
#include "MatchEngine.h"
#include "NameComposer.h"
#include "../CatalogStore.h"
#include "../../engine/core/Logger.h"
#include "../../engine/core/WorkerThreads.h"

namespace Catalog::Variants {

namespace {
struct TemplateOutput {
    std::vector<ExpandedItem> items;
    std::string failure;
};

void addWarning(ExpansionResult& result, std::string warning) {
    Engine::logWarn(warning);
    result.warnings.push_back(std::move(warning));
}

// Returns false (and records why) when the template cannot take part in the run.
bool admitTemplate(const VariantTemplate& tmpl, ExpansionResult& result) {
    bool admitted = !tmpl.hasValidationIssue();
    for (const auto& issue : tmpl.issues) {
        if (issue.kind == IssueKind::TemplateValidation) addWarning(result, issue.describe());
    }
    if (admitted) {
        if (auto reason = validateNaming(tmpl.inherits)) {
            addWarning(result, ExpansionIssue{IssueKind::TemplateValidation, tmpl.name, *reason}.describe());
            admitted = false;
        } else if (tmpl.inherits.source.empty()) {
            addWarning(result,
                       ExpansionIssue{IssueKind::TemplateValidation, tmpl.name, "inherits.source is missing"}.describe());
            admitted = false;
        }
    }
    if (!admitted) return false;
    for (const auto& issue : tmpl.issues) {
        if (issue.kind == IssueKind::MatchEvaluation) addWarning(result, issue.describe());
    }
    return true;
}

ExpandedItem buildItem(const VariantTemplate& tmpl, const BaseItem& base, const ExpansionConfig& config) {
    ExpandedItem item{};
    item.name = computeName(tmpl.inherits, base.name);
    item.source = tmpl.inherits.source;
    item.itemType = base.typeCode;
    MergeOptions mergeOpts{};
    mergeOpts.resolveTemplateVariables = config.resolveTemplateVariables;
    item.data = mergeBlob(base, tmpl, item.name, mergeOpts);
    item.rarity = tmpl.inherits.rarity;
    if (item.rarity.empty() && item.data.contains("rarity") && item.data["rarity"].is_string()) {
        item.rarity = item.data["rarity"].get<std::string>();
    }
    item.variantOf = tmpl.name;
    item.baseItem = base.key();
    return item;
}

void expandTemplate(const VariantTemplate& tmpl, const std::vector<const BaseItem*>& bases,
                    const ExpansionConfig& config, TemplateOutput& out) {
    MatchOptions matchOpts{};
    matchOpts.stripSourceSuffix = config.stripSourceSuffix;
    try {
        for (const BaseItem* base : bases) {
            if (itemMatchesTemplate(*base, tmpl, matchOpts)) out.items.push_back(buildItem(tmpl, *base, config));
        }
    } catch (const std::exception& e) {
        out.items.clear();
        out.failure = e.what();
    }
}

std::size_t resolveWorkerCount(const ExpansionConfig& config, std::size_t jobs) {
    std::size_t workers = config.workerCount > 0 ? static_cast<std::size_t>(config.workerCount)
                                                 : static_cast<std::size_t>(std::thread::hardware_concurrency());
    workers = std::max<std::size_t>(1, workers);
    return std::min(workers, std::max<std::size_t>(1, jobs));
}
}  // namespace

ExpansionRun runExpansion(const std::vector<VariantTemplate>& templates, const std::vector<BaseItem>& baseItems,
                          const ExpansionConfig& config) {
    ExpansionRun run{};
    run.result.baseItemsConsidered = baseItems.size();

    std::vector<const VariantTemplate*> orderedTemplates;
    orderedTemplates.reserve(templates.size());
    for (const auto& t : templates) orderedTemplates.push_back(&t);
    std::stable_sort(orderedTemplates.begin(), orderedTemplates.end(),
                     [](const VariantTemplate* a, const VariantTemplate* b) {
                         return std::tie(a->name, a->inherits.source) < std::tie(b->name, b->inherits.source);
                     });

    std::vector<const BaseItem*> orderedBases;
    orderedBases.reserve(baseItems.size());
    for (const auto& b : baseItems) orderedBases.push_back(&b);
    std::stable_sort(orderedBases.begin(), orderedBases.end(), [](const BaseItem* a, const BaseItem* b) {
        return std::tie(a->name, a->source) < std::tie(b->name, b->source);
    });

    std::vector<const VariantTemplate*> admitted;
    for (const VariantTemplate* t : orderedTemplates) {
        if (admitTemplate(*t, run.result)) {
            admitted.push_back(t);
        } else {
            ++run.result.templatesSkipped;
        }
    }

    // Read-only fan-out: each worker fills the output slots of its own templates.
    std::vector<TemplateOutput> outputs(admitted.size());
    const std::size_t workers = resolveWorkerCount(config, admitted.size());
    Engine::runStrided(admitted.size(), workers, [&](std::size_t i) {
        expandTemplate(*admitted[i], orderedBases, config, outputs[i]);
    });

    std::map<std::pair<std::string, std::string>, ExpandedItem> byKey;
    for (std::size_t i = 0; i < admitted.size(); ++i) {
        if (!outputs[i].failure.empty()) {
            addWarning(run.result,
                       ExpansionIssue{IssueKind::TemplateValidation, admitted[i]->name, outputs[i].failure}.describe());
            ++run.result.templatesSkipped;
            continue;
        }
        ++run.result.templatesProcessed;
        for (auto& item : outputs[i].items) {
            auto key = std::make_pair(item.name, item.source);
            auto it = byKey.find(key);
            if (it == byKey.end()) {
                byKey.emplace(std::move(key), std::move(item));
                continue;
            }
            ++run.result.itemsSkipped;
            if (config.warnOnDuplicates) {
                addWarning(run.result, "duplicate '" + item.name + "|" + item.source + "': '" + item.variantOf +
                                           "' on " + item.baseItem + " replaces '" + it->second.variantOf + "' on " +
                                           it->second.baseItem);
            }
            it->second = std::move(item);
        }
    }

    run.items.reserve(byKey.size());
    for (auto& kv : byKey) run.items.push_back(std::move(kv.second));
    run.result.itemsGenerated = run.items.size();
    return run;
}

ExpansionResult expandVariants(CatalogStore& store, const std::vector<VariantTemplate>& templates,
                               const std::vector<BaseItem>& baseItems, const ExpansionConfig& config) {
    Engine::logInfo("Expanding " + std::to_string(templates.size()) + " variant templates against " +
                    std::to_string(baseItems.size()) + " base items");
    ExpansionRun run = runExpansion(templates, baseItems, config);

    CatalogStore::ReplaceOutcome outcome{};
    try {
        outcome = store.replaceGeneratedItems(run.items);
    } catch (const Engine::SqliteError& e) {
        Engine::logError(std::string("Variant expansion rolled back: ") + e.what());
        throw PersistenceError(std::string("variant persistence failed: ") + e.what());
    }

    ExpansionResult result = std::move(run.result);
    result.itemsGenerated = outcome.inserted;
    result.itemsSkipped += outcome.shadowed.size();
    for (const auto& key : outcome.shadowed) {
        addWarning(result, "generated '" + key + "' collides with a hand-authored item; kept the existing row");
    }
    Engine::logInfo("Variant expansion: " + summarize(result));
    return result;
}

}  // namespace Catalog::Variants
