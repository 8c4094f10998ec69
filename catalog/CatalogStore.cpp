#include "CatalogStore.h"

#include "../engine/core/Logger.h"

namespace Catalog {

namespace {
constexpr const char* kItemColumns =
    "SELECT id, name, source, item_type, rarity, data, fluff, variant_of, base_item FROM items ";

std::optional<std::string> nullIfEmpty(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

CatalogItemRow readRow(const Engine::SqliteStatement& stmt) {
    CatalogItemRow row{};
    row.id = stmt.columnInt64(0);
    row.name = stmt.columnText(1);
    row.source = stmt.columnText(2);
    row.itemType = stmt.columnOptionalText(3);
    row.rarity = stmt.columnOptionalText(4);
    row.data = stmt.columnText(5);
    row.fluff = stmt.columnOptionalText(6);
    row.variantOf = stmt.columnOptionalText(7);
    row.baseItem = stmt.columnOptionalText(8);
    return row;
}
}  // namespace

CatalogStore::CatalogStore(Engine::SqliteDatabase& db) : db_(db) {}

void CatalogStore::createSchema() {
    db_.exec(R"(
        CREATE TABLE IF NOT EXISTS catalog_sources (
            code TEXT PRIMARY KEY NOT NULL,
            name TEXT NOT NULL,
            enabled INTEGER NOT NULL DEFAULT 1,
            imported_at TEXT NOT NULL DEFAULT ''
        );
        CREATE TABLE IF NOT EXISTS items (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL,
            source TEXT NOT NULL,
            item_type TEXT,
            rarity TEXT,
            data TEXT NOT NULL,
            fluff TEXT,
            variant_of TEXT,
            base_item TEXT,
            UNIQUE(name, source)
        );
        CREATE INDEX IF NOT EXISTS idx_items_variant_of ON items(variant_of);
    )");
}

void CatalogStore::upsertSource(const CatalogSource& source) {
    Engine::SqliteStatement stmt(db_, R"(
        INSERT INTO catalog_sources (code, name, enabled, imported_at)
        VALUES (?1, ?2, ?3, datetime('now'))
        ON CONFLICT(code) DO UPDATE SET
            name = excluded.name,
            enabled = excluded.enabled,
            imported_at = excluded.imported_at
    )");
    stmt.bindText(1, source.code);
    stmt.bindText(2, source.name);
    stmt.bindInt64(3, source.enabled ? 1 : 0);
    stmt.step();
}

std::vector<CatalogSource> CatalogStore::listSources() {
    std::vector<CatalogSource> out;
    Engine::SqliteStatement stmt(db_, "SELECT code, name, enabled FROM catalog_sources ORDER BY code");
    while (stmt.step()) {
        out.push_back({stmt.columnText(0), stmt.columnText(1), stmt.columnInt64(2) != 0});
    }
    return out;
}

int64_t CatalogStore::insertItem(const CatalogItemRow& row) {
    Engine::SqliteStatement stmt(db_, R"(
        INSERT INTO items (name, source, item_type, rarity, data, fluff)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6)
    )");
    stmt.bindText(1, row.name);
    stmt.bindText(2, row.source);
    stmt.bindOptionalText(3, row.itemType);
    stmt.bindOptionalText(4, row.rarity);
    stmt.bindText(5, row.data);
    stmt.bindOptionalText(6, row.fluff);
    stmt.step();
    return db_.lastInsertRowId();
}

std::optional<CatalogItemRow> CatalogStore::findItem(const std::string& name, const std::string& source) {
    Engine::SqliteStatement stmt(db_, std::string(kItemColumns) + "WHERE name = ?1 AND source = ?2");
    stmt.bindText(1, name);
    stmt.bindText(2, source);
    if (!stmt.step()) return std::nullopt;
    return readRow(stmt);
}

std::vector<CatalogItemRow> CatalogStore::queryItems(const char* where) {
    std::vector<CatalogItemRow> out;
    Engine::SqliteStatement stmt(db_, std::string(kItemColumns) + where);
    while (stmt.step()) out.push_back(readRow(stmt));
    return out;
}

std::vector<CatalogItemRow> CatalogStore::listItems() { return queryItems("ORDER BY name, source"); }

std::vector<CatalogItemRow> CatalogStore::listGeneratedItems() {
    return queryItems("WHERE variant_of IS NOT NULL ORDER BY name, source");
}

std::size_t CatalogStore::countWhere(const char* sql) {
    Engine::SqliteStatement stmt(db_, sql);
    if (!stmt.step()) return 0;
    return static_cast<std::size_t>(stmt.columnInt64(0));
}

std::size_t CatalogStore::countItems() { return countWhere("SELECT COUNT(*) FROM items"); }

std::size_t CatalogStore::countGeneratedItems() {
    return countWhere("SELECT COUNT(*) FROM items WHERE variant_of IS NOT NULL");
}

CatalogStore::ReplaceOutcome CatalogStore::replaceGeneratedItems(const std::vector<Variants::ExpandedItem>& items) {
    ReplaceOutcome outcome{};
    Engine::SqliteTransaction tx(db_);

    db_.exec("DELETE FROM items WHERE variant_of IS NOT NULL");
    outcome.deleted = static_cast<std::size_t>(db_.changes());

    // Hand-authored rows own their (name, source); a colliding generated row is dropped.
    Engine::SqliteStatement insert(db_, R"(
        INSERT INTO items (name, source, item_type, rarity, data, variant_of, base_item)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
        ON CONFLICT(name, source) DO NOTHING
    )");
    for (const auto& item : items) {
        insert.bindText(1, item.name);
        insert.bindText(2, item.source);
        insert.bindOptionalText(3, nullIfEmpty(item.itemType));
        insert.bindOptionalText(4, nullIfEmpty(item.rarity));
        insert.bindText(5, item.data.dump());
        insert.bindText(6, item.variantOf);
        insert.bindText(7, item.baseItem);
        insert.step();
        if (db_.changes() > 0) {
            ++outcome.inserted;
        } else {
            outcome.shadowed.push_back(item.name + "|" + item.source);
        }
        insert.reset();
    }

    tx.commit();
    Engine::logDebug("[DB] Replaced generated items: " + std::to_string(outcome.deleted) + " deleted, " +
                     std::to_string(outcome.inserted) + " inserted");
    return outcome;
}

}  // namespace Catalog
