// Rows of the shared item catalog and its source registry.
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace Catalog {

struct CatalogSource {
    std::string code;  // e.g. "PHB", "DMG"
    std::string name;
    bool enabled{true};
};

// One row of the items table. variantOf/baseItem are set only on generated rows.
struct CatalogItemRow {
    int64_t id{0};
    std::string name;
    std::string source;
    std::optional<std::string> itemType;
    std::optional<std::string> rarity;
    std::string data;  // serialized JSON blob
    std::optional<std::string> fluff;
    std::optional<std::string> variantOf;
    std::optional<std::string> baseItem;

    bool isGenerated() const { return variantOf.has_value(); }
};

}  // namespace Catalog
