#include <cassert>
#include <string>

#include <nlohmann/json.hpp>

#include "../catalog/CatalogStore.h"
#include "../catalog/ImportPipeline.h"
#include "../engine/core/Logger.h"
#include "../engine/storage/SqliteDatabase.h"

using namespace Catalog;
using nlohmann::json;

int main() {
    Engine::Logger::setMinimumLevel(Engine::LogLevel::Warning);

    const json phbItems = json::parse(R"({"baseitem": [
        {"name": "Dagger", "source": "PHB", "type": "M", "weapon": true, "dagger": true, "dmgType": "P"},
        {"name": "Longbow", "source": "PHB", "type": "R", "weapon": true, "bow": true},
        {"name": "Net", "source": "PHB", "type": "R", "weapon": true, "net": true},
        {"name": "Plate Armor", "source": "PHB", "type": "HA", "armor": true}]})");
    const json dmgVariants = json::parse(R"({"magicvariant": [
        {"name": "+1 Weapon", "requires": [{"weapon": true}], "excludes": {"net": true},
         "inherits": {"namePrefix": "+1 ", "source": "DMG", "rarity": "uncommon", "bonusWeapon": "+1"}},
        {"name": "Armor of Resistance", "requires": [{"armor": true}],
         "inherits": {"nameSuffix": " of Resistance", "source": "DMG", "rarity": "rare"}}]})");
    const json tceItems = json::parse(R"({"baseitem": [
        {"name": "Hoopak", "source": "TCE", "type": "M", "weapon": true, "weaponCategory": "simple"}]})");

    // Templates from one source expand against base items from another, and vice versa.
    {
        Engine::SqliteDatabase db;
        assert(db.open(":memory:"));
        CatalogStore store(db);
        store.createSchema();
        ImportPipeline pipeline(store);

        pipeline.ingestJson({"DMG", "Dungeon Master's Guide", true}, json::object(), dmgVariants);
        pipeline.ingestJson({"PHB", "Player's Handbook", true}, phbItems, json::object());
        pipeline.ingestJson({"TCE", "Tasha's Cauldron of Everything", true}, tceItems, json::array());
        assert(pipeline.sourceCount() == 3);
        assert(pipeline.baseItemCount() == 5);
        assert(pipeline.templateCount() == 2);
        assert(store.listSources().size() == 3);

        // Nothing is generated until the barrier runs.
        assert(store.countGeneratedItems() == 0);
        auto result = pipeline.expandVariants();
        assert(result.itemsGenerated == 4);
        assert(result.templatesProcessed == 2);
        assert(store.findItem("+1 Dagger", "DMG").has_value());
        assert(store.findItem("+1 Longbow", "DMG").has_value());
        assert(store.findItem("+1 Hoopak", "DMG").has_value());
        assert(store.findItem("Plate Armor of Resistance", "DMG").has_value());
        assert(!store.findItem("+1 Net", "DMG").has_value());
    }

    // Re-ingesting a source replaces its staged content.
    {
        Engine::SqliteDatabase db;
        assert(db.open(":memory:"));
        CatalogStore store(db);
        store.createSchema();
        ImportPipeline pipeline(store);

        pipeline.ingestJson({"PHB", "Player's Handbook", true}, phbItems, json::object());
        pipeline.ingestJson({"DMG", "Dungeon Master's Guide", true}, json::object(), dmgVariants);
        pipeline.expandVariants();
        assert(store.countGeneratedItems() == 3);

        const json fewer = json::parse(R"([{"name": "Dagger", "source": "PHB", "weapon": true}])");
        pipeline.ingestJson({"PHB", "Player's Handbook (2014)", true}, fewer, json::object());
        assert(pipeline.sourceCount() == 2);
        assert(pipeline.baseItemCount() == 1);

        auto result = pipeline.expandVariants();
        assert(result.itemsGenerated == 1);
        assert(store.countGeneratedItems() == 1);
        assert(store.findItem("+1 Dagger", "DMG").has_value());
        assert(!store.findItem("+1 Longbow", "DMG").has_value());
        auto sources = store.listSources();
        assert(sources.size() == 2);
        assert(sources[1].name == "Player's Handbook (2014)");
    }

    // Templates without inherits.source produce items under the ingesting source.
    {
        Engine::SqliteDatabase db;
        assert(db.open(":memory:"));
        CatalogStore store(db);
        store.createSchema();
        ExpansionConfig config{};
        config.workerCount = 2;
        ImportPipeline pipeline(store, config);
        assert(pipeline.config().workerCount == 2);

        const json homebrew = json::parse(R"([{"name": "Moonlit Weapon", "requires": [{"weapon": true}],
            "excludes": {"name": "Net"}, "inherits": {"namePrefix": "Moonlit ", "rarity": "rare"}}])");
        pipeline.ingestJson({"PHB", "Player's Handbook", true}, phbItems, json::object());
        pipeline.ingestJson({"HB", "Homebrew", true}, json::object(), homebrew);

        auto result = pipeline.expandVariants();
        assert(result.itemsGenerated == 2);
        assert(result.warnings.empty());
        auto dagger = store.findItem("Moonlit Dagger", "HB");
        assert(dagger.has_value());
        assert(json::parse(dagger->data)["source"] == "HB");
        assert(!store.findItem("Moonlit Net", "HB").has_value());
    }

    // An empty pipeline still clears stale generated rows.
    {
        Engine::SqliteDatabase db;
        assert(db.open(":memory:"));
        CatalogStore store(db);
        store.createSchema();
        {
            ImportPipeline pipeline(store);
            pipeline.ingestJson({"PHB", "Player's Handbook", true}, phbItems, dmgVariants);
            pipeline.expandVariants();
        }
        assert(store.countGeneratedItems() == 3);

        ImportPipeline empty(store);
        auto result = empty.expandVariants();
        assert(result.itemsGenerated == 0);
        assert(store.countGeneratedItems() == 0);
    }
    return 0;
}
