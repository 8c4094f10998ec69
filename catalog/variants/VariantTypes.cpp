#include "VariantTypes.h"

#include <algorithm>

namespace Catalog::Variants {

namespace {
struct FlagKeys {
    ItemFlag flag;
    std::string_view camel;
    std::string_view snake;
};

constexpr std::array<FlagKeys, kItemFlagCount> kFlagKeys = {{
    {ItemFlag::Weapon, "weapon", "weapon"},
    {ItemFlag::Armor, "armor", "armor"},
    {ItemFlag::Sword, "sword", "sword"},
    {ItemFlag::Axe, "axe", "axe"},
    {ItemFlag::Bow, "bow", "bow"},
    {ItemFlag::Crossbow, "crossbow", "crossbow"},
    {ItemFlag::Spear, "spear", "spear"},
    {ItemFlag::Polearm, "polearm", "polearm"},
    {ItemFlag::Arrow, "arrow", "arrow"},
    {ItemFlag::Bolt, "bolt", "bolt"},
    {ItemFlag::Net, "net", "net"},
    {ItemFlag::Dagger, "dagger", "dagger"},
    {ItemFlag::Mace, "mace", "mace"},
    {ItemFlag::Hammer, "hammer", "hammer"},
    {ItemFlag::Lance, "lance", "lance"},
    {ItemFlag::Rapier, "rapier", "rapier"},
    {ItemFlag::Staff, "staff", "staff"},
    {ItemFlag::Club, "club", "club"},
    {ItemFlag::Firearm, "firearm", "firearm"},
    {ItemFlag::BulletFirearm, "bulletFirearm", "bullet_firearm"},
    {ItemFlag::CellEnergy, "cellEnergy", "cell_energy"},
    {ItemFlag::NeedleBlowgun, "needleBlowgun", "needle_blowgun"},
    {ItemFlag::BulletSling, "bulletSling", "bullet_sling"},
}};
}  // namespace

std::optional<ItemFlag> parseItemFlagKey(std::string_view key) {
    for (const auto& entry : kFlagKeys) {
        if (key == entry.camel || key == entry.snake) return entry.flag;
    }
    return std::nullopt;
}

std::string_view itemFlagKey(ItemFlag flag) {
    const auto idx = static_cast<std::size_t>(flag);
    if (idx >= kFlagKeys.size()) return {};
    return kFlagKeys[idx].camel;
}

std::string_view stripSourceSuffix(std::string_view value) {
    const auto pipe = value.find('|');
    if (pipe == std::string_view::npos) return value;
    return value.substr(0, pipe);
}

std::string ExpansionIssue::describe() const {
    const char* label = (kind == IssueKind::TemplateValidation) ? "template skipped" : "clause never matches";
    return "'" + templateName + "': " + message + " (" + label + ")";
}

bool VariantTemplate::hasValidationIssue() const {
    return std::any_of(issues.begin(), issues.end(),
                       [](const ExpansionIssue& i) { return i.kind == IssueKind::TemplateValidation; });
}

std::string summarize(const ExpansionResult& result) {
    return std::to_string(result.itemsGenerated) + " generated, " + std::to_string(result.warnings.size()) +
           " warnings";
}

}  // namespace Catalog::Variants
