#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "../catalog/ExpansionConfig.h"
#include "../catalog/variants/VariantTypes.h"

using namespace Catalog::Variants;
using nlohmann::json;

namespace {
std::string writeTempFile(const std::string& name, const std::string& contents) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path.string();
}
}  // namespace

int main() {
    // Flag keys accept both spellings; the canonical key is camelCase.
    {
        assert(parseItemFlagKey("bulletFirearm") == ItemFlag::BulletFirearm);
        assert(parseItemFlagKey("bullet_firearm") == ItemFlag::BulletFirearm);
        assert(parseItemFlagKey("needleBlowgun") == ItemFlag::NeedleBlowgun);
        assert(!parseItemFlagKey("shield").has_value());
        assert(itemFlagKey(ItemFlag::CellEnergy) == "cellEnergy");
        assert(stripSourceSuffix("M|XPHB") == "M");
        assert(stripSourceSuffix("LA") == "LA");
    }

    // Base items: suffix stripped from type, flags and property uids collected.
    {
        auto decoded = decodeBaseItem(json::parse(R"({"name": "Crossbow, Hand", "source": "PHB",
            "type": "R|XPHB", "weapon": true, "crossbow": true, "weaponCategory": "martial",
            "property": ["AF|XPHB", {"uid": "L|XPHB", "note": "light"}, 7], "weight": 3,
            "dmg1": "1d6", "dmgType": "P", "bulletFirearm": "yes"})"));
        assert(decoded.has_value());
        const auto& it = *decoded;
        assert(it.typeCode == "R");
        assert(it.flag(ItemFlag::Weapon));
        assert(it.flag(ItemFlag::Crossbow));
        assert(!it.flag(ItemFlag::BulletFirearm));
        assert(it.properties.size() == 2);
        assert(it.properties[1] == "L|XPHB");
        assert(it.weight.has_value() && *it.weight == 3.0);
        assert(it.key() == "Crossbow, Hand|PHB");
        assert(it.raw["type"] == "R|XPHB");

        assert(!decodeBaseItem(json::parse(R"({"name": "Nameless"})")).has_value());
        assert(!decodeBaseItem(json::parse(R"({"name": 5, "source": "PHB"})")).has_value());
        assert(!decodeBaseItem(json::array()).has_value());
    }

    // Templates decode requirements, mixed exclusion shapes and inherits.
    {
        auto t = decodeVariantTemplate(json::parse(R"({"name": "Dragon Slayer",
            "requires": [{"sword": true}, {"type": ["M", "R"], "weaponCategory": "martial"}],
            "excludes": {"net": true, "name": "Whip", "property": ["2H", "S"]},
            "inherits": {"nameSuffix": " of Dragon Slaying", "source": "DMG", "rarity": "rare",
                         "bonusWeapon": "+1", "tier": "major"},
            "entries": ["Glows near dragons."]})"));
        assert(t.issues.empty());
        assert(t.name == "Dragon Slayer");
        assert(t.requirements.size() == 2);
        assert(t.requirements[1].clauses.size() == 2);
        assert(std::holds_alternative<std::vector<std::string>>(t.requirements[1].clauses[0].value) ||
               std::holds_alternative<std::vector<std::string>>(t.requirements[1].clauses[1].value));
        assert(t.excludes.size() == 3);
        int bools = 0;
        int strings = 0;
        int lists = 0;
        for (const auto& c : t.excludes) {
            if (std::holds_alternative<bool>(c.value)) ++bools;
            if (std::holds_alternative<std::string>(c.value)) ++strings;
            if (std::holds_alternative<std::vector<std::string>>(c.value)) ++lists;
        }
        assert(bools == 1 && strings == 1 && lists == 1);
        assert(t.inherits.nameSuffix == std::string(" of Dragon Slaying"));
        assert(!t.inherits.namePrefix.has_value());
        assert(t.inherits.source == "DMG");
        assert(t.inherits.rarity == "rare");
        assert(t.inherits.bonusWeapon == std::string("+1"));
        assert(t.inherits.fields["tier"] == "major");
        assert(t.entries.is_array());
    }

    // Structural problems disqualify a template; odd value shapes only warn.
    {
        auto noRequires = decodeVariantTemplate(json::parse(R"({"name": "A", "inherits": {"namePrefix": "x"}})"));
        assert(noRequires.hasValidationIssue());

        auto emptyRequires = decodeVariantTemplate(
            json::parse(R"({"name": "B", "requires": [], "inherits": {"namePrefix": "x"}})"));
        assert(emptyRequires.hasValidationIssue());

        auto emptyClause = decodeVariantTemplate(
            json::parse(R"({"name": "C", "requires": [{}], "inherits": {"namePrefix": "x"}})"));
        assert(emptyClause.hasValidationIssue());

        auto scalarClause = decodeVariantTemplate(
            json::parse(R"({"name": "D", "requires": ["weapon"], "inherits": {"namePrefix": "x"}})"));
        assert(scalarClause.hasValidationIssue());

        auto noInherits = decodeVariantTemplate(json::parse(R"({"name": "E", "requires": [{"weapon": true}]})"));
        assert(noInherits.hasValidationIssue());

        auto unnamed = decodeVariantTemplate(
            json::parse(R"({"requires": [{"weapon": true}], "inherits": {"namePrefix": "x"}})"));
        assert(unnamed.hasValidationIssue());
        assert(unnamed.name == "<unnamed>");

        auto notObject = decodeVariantTemplate(json("just a string"));
        assert(notObject.hasValidationIssue());

        auto oddExcludes = decodeVariantTemplate(json::parse(R"({"name": "F", "requires": [{"weapon": true}],
            "excludes": {"ac": 12, "net": {"x": 1}}, "inherits": {"namePrefix": "x"}})"));
        assert(!oddExcludes.hasValidationIssue());
        assert(oddExcludes.issues.size() == 2);
        assert(oddExcludes.issues[0].describe().find("clause never matches") != std::string::npos);

        auto listExcludes = decodeVariantTemplate(json::parse(R"({"name": "G", "requires": [{"weapon": true}],
            "excludes": ["net"], "inherits": {"namePrefix": "x"}})"));
        assert(!listExcludes.hasValidationIssue());
        assert(listExcludes.excludes.empty());
        assert(listExcludes.issues.size() == 1);

        assert(noInherits.issues[0].describe() == "'E': missing inherits (template skipped)");
    }

    // Documents: wrapped or bare arrays; broken entries are dropped or flagged.
    {
        auto items = decodeBaseItems(json::parse(R"({"baseitem": [
            {"name": "Club", "source": "PHB", "weapon": true},
            {"source": "PHB"},
            {"name": "Lance", "source": "PHB", "lance": true}]})"));
        assert(items.size() == 2);
        assert(decodeBaseItems(json::parse(R"([{"name": "Club", "source": "PHB"}])")).size() == 1);
        assert(decodeBaseItems(json::parse(R"({"spell": []})")).empty());

        auto templates = decodeVariantTemplates(json::parse(R"({"magicvariant": [
            {"name": "+1 Weapon", "requires": [{"weapon": true}], "inherits": {"namePrefix": "+1 "}},
            {"name": "Broken"}]})"));
        assert(templates.size() == 2);
        assert(!templates[0].hasValidationIssue());
        assert(templates[1].hasValidationIssue());
    }

    // Files: well-formed, malformed and missing.
    {
        const auto good = writeTempFile("codex_variants_good.json",
            R"({"magicvariant": [{"name": "+1 Armor", "requires": [{"armor": true}],
                "inherits": {"namePrefix": "+1 ", "source": "DMG", "bonusAc": "+1"}}]})");
        auto loaded = loadVariantTemplates(good);
        assert(loaded.size() == 1);
        assert(loaded[0].inherits.bonusAc == std::string("+1"));

        const auto bad = writeTempFile("codex_items_bad.json", R"({"baseitem": [ {"name": )");
        assert(loadBaseItems(bad).empty());
        assert(loadBaseItems("/nonexistent/codex/items.json").empty());

        std::filesystem::remove(good);
        std::filesystem::remove(bad);
    }

    // Expansion config: defaults, overrides, clamping and rejection.
    {
        using Catalog::ExpansionConfigLoader;
        const auto partial = writeTempFile("codex_config_partial.json",
            R"({"workerCount": 3, "stripSourceSuffix": false, "warnOnDuplicates": "no"})");
        auto cfg = ExpansionConfigLoader::load(partial);
        assert(cfg.has_value());
        assert(cfg->workerCount == 3);
        assert(!cfg->stripSourceSuffix);
        assert(cfg->resolveTemplateVariables);
        assert(cfg->warnOnDuplicates);

        const auto negative = writeTempFile("codex_config_negative.json", R"({"workerCount": -4})");
        auto clamped = ExpansionConfigLoader::load(negative);
        assert(clamped.has_value() && clamped->workerCount == 0);

        const auto broken = writeTempFile("codex_config_broken.json", "{ workerCount");
        assert(!ExpansionConfigLoader::load(broken).has_value());
        const auto notObject = writeTempFile("codex_config_array.json", "[1, 2]");
        assert(!ExpansionConfigLoader::load(notObject).has_value());
        assert(!ExpansionConfigLoader::load("/nonexistent/codex/expansion.json").has_value());

        for (const auto& p : {partial, negative, broken, notObject}) std::filesystem::remove(p);
    }
    return 0;
}
