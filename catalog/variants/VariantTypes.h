// Typed model for generic variant expansion: base items, templates, results.
#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace Catalog::Variants {

// Boolean capability flags carried by base items.
enum class ItemFlag {
    Weapon = 0,
    Armor,
    Sword,
    Axe,
    Bow,
    Crossbow,
    Spear,
    Polearm,
    Arrow,
    Bolt,
    Net,
    Dagger,
    Mace,
    Hammer,
    Lance,
    Rapier,
    Staff,
    Club,
    Firearm,
    BulletFirearm,
    CellEnergy,
    NeedleBlowgun,
    BulletSling,
    Count
};

constexpr std::size_t kItemFlagCount = static_cast<std::size_t>(ItemFlag::Count);

// Accepts the compendium's camelCase key ("bulletFirearm") and the snake_case alias.
std::optional<ItemFlag> parseItemFlagKey(std::string_view key);
// Canonical compendium key for a flag.
std::string_view itemFlagKey(ItemFlag flag);

// "M|XPHB" -> "M". Strings without a pipe are returned unchanged.
std::string_view stripSourceSuffix(std::string_view value);

struct BaseItem {
    std::string name;
    std::string source;
    std::string typeCode;  // without any |SOURCE suffix
    std::string weaponCategory;
    std::array<bool, kItemFlagCount> flags{};
    std::string dmg1;
    std::string dmgType;
    std::optional<double> weight;
    std::vector<std::string> properties;
    std::string scfType;
    nlohmann::json raw = nlohmann::json::object();

    bool flag(ItemFlag f) const { return flags[static_cast<std::size_t>(f)]; }
    // "name|source", as stored in the base_item provenance column.
    std::string key() const { return name + "|" + source; }
};

// A requirement value whose JSON shape the engine cannot evaluate (object, null, mixed list).
struct UnsupportedValue {
    std::string shape;
};

// Decoded once at ingestion; matching never re-inspects raw JSON shapes.
using RequirementValue = std::variant<UnsupportedValue, bool, double, std::string, std::vector<std::string>>;

struct RequirementClause {
    std::string key;
    RequirementValue value;
};

// All clauses must hold (logical AND).
struct Requirement {
    std::vector<RequirementClause> clauses;
};

struct VariantInherits {
    std::optional<std::string> namePrefix;
    std::optional<std::string> nameSuffix;
    std::optional<std::string> nameRemove;
    std::string source;
    std::string rarity;
    std::optional<std::string> bonusWeapon;
    std::optional<std::string> bonusAc;
    // The complete inherits object, passthrough fields included.
    nlohmann::json fields = nlohmann::json::object();
};

enum class IssueKind { TemplateValidation, MatchEvaluation };

struct ExpansionIssue {
    IssueKind kind{IssueKind::TemplateValidation};
    std::string templateName;
    std::string message;

    std::string describe() const;
};

struct VariantTemplate {
    std::string name;
    std::vector<Requirement> requirements;  // any one may hold (logical OR)
    std::vector<RequirementClause> excludes;
    VariantInherits inherits;
    nlohmann::json entries;  // template-level description, used when the item has none
    // Problems found while decoding; TemplateValidation issues disqualify the template.
    std::vector<ExpansionIssue> issues;

    bool hasValidationIssue() const;
};

struct ExpandedItem {
    std::string name;
    std::string source;
    std::string itemType;
    std::string rarity;
    nlohmann::json data;
    std::string variantOf;
    std::string baseItem;
};

struct ExpansionResult {
    std::size_t templatesProcessed{0};
    std::size_t templatesSkipped{0};
    std::size_t baseItemsConsidered{0};
    std::size_t itemsGenerated{0};
    std::size_t itemsSkipped{0};
    std::vector<std::string> warnings;
};

// "N generated, M warnings" line for the import report.
std::string summarize(const ExpansionResult& result);

// Decoding from compendium JSON (VariantLoaders.cpp).
std::optional<BaseItem> decodeBaseItem(const nlohmann::json& j);
VariantTemplate decodeVariantTemplate(const nlohmann::json& j);
// Accepts {"baseitem": [...]}, {"item": [...]} or a bare array.
std::vector<BaseItem> decodeBaseItems(const nlohmann::json& doc);
// Accepts {"magicvariant": [...]} or a bare array.
std::vector<VariantTemplate> decodeVariantTemplates(const nlohmann::json& doc);
// File readers; a missing or unparsable file yields an empty list.
std::vector<BaseItem> loadBaseItems(const std::string& path);
std::vector<VariantTemplate> loadVariantTemplates(const std::string& path);

}  // namespace Catalog::Variants
