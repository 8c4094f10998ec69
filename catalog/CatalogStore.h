// SQLite-backed item catalog: directly-ingested rows and generated variant rows.
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "CatalogTypes.h"
#include "variants/VariantTypes.h"
#include "../engine/storage/SqliteDatabase.h"

namespace Catalog {

class CatalogStore {
public:
    explicit CatalogStore(Engine::SqliteDatabase& db);

    // Creates the items and catalog_sources tables if missing. Throws Engine::SqliteError.
    void createSchema();

    void upsertSource(const CatalogSource& source);
    std::vector<CatalogSource> listSources();

    // Inserts a hand-authored or directly-ingested row; variantOf/baseItem are ignored.
    int64_t insertItem(const CatalogItemRow& row);
    std::optional<CatalogItemRow> findItem(const std::string& name, const std::string& source);
    // Ordered by (name, source).
    std::vector<CatalogItemRow> listItems();
    std::vector<CatalogItemRow> listGeneratedItems();
    std::size_t countItems();
    std::size_t countGeneratedItems();

    struct ReplaceOutcome {
        std::size_t deleted{0};
        std::size_t inserted{0};
        // name|source of generated rows that collided with a hand-authored row.
        std::vector<std::string> shadowed;
    };

    // Deletes every generated row and inserts `items` in one transaction.
    // Rows without variant_of are never touched. Throws Engine::SqliteError after rolling back.
    ReplaceOutcome replaceGeneratedItems(const std::vector<Variants::ExpandedItem>& items);

private:
    std::vector<CatalogItemRow> queryItems(const char* sql);
    std::size_t countWhere(const char* sql);

    Engine::SqliteDatabase& db_;
};

}  // namespace Catalog
