#include "BlobMerger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_map>

namespace Catalog::Variants {

using nlohmann::json;

namespace {
constexpr std::array<std::string_view, 7> kSkippedInheritKeys = {
    "namePrefix", "nameSuffix", "nameRemove", "propertyAdd", "propertyRemove", "reprintedAs", "lootTables"};

bool isSkippedInheritKey(std::string_view key) {
    for (auto skipped : kSkippedInheritKeys) {
        if (key == skipped) return true;
    }
    return false;
}

// propertyAdd appends tags not already present; propertyRemove drops tags and
// removes "property" entirely once it is empty.
void applyPropertyEdits(json& blob, const json& inherits) {
    auto add = inherits.find("propertyAdd");
    if (add != inherits.end() && add->is_array()) {
        json props = json::array();
        auto current = blob.find("property");
        if (current != blob.end() && current->is_array()) props = *current;
        for (const auto& tag : *add) {
            if (std::find(props.begin(), props.end(), tag) == props.end()) props.push_back(tag);
        }
        blob["property"] = std::move(props);
    }

    auto remove = inherits.find("propertyRemove");
    if (remove == inherits.end() || !remove->is_array()) return;
    auto current = blob.find("property");
    if (current == blob.end() || !current->is_array()) return;
    json kept = json::array();
    for (const auto& tag : *current) {
        const bool dropped = tag.is_string() && std::find(remove->begin(), remove->end(), tag) != remove->end();
        if (!dropped) kept.push_back(tag);
    }
    if (kept.empty()) {
        blob.erase("property");
    } else {
        *current = std::move(kept);
    }
}

// "Arrows (20)" -> "Arrows"
std::string withoutQuantity(const std::string& name) {
    const auto paren = name.find(" (");
    return paren == std::string::npos ? name : name.substr(0, paren);
}

std::string toLower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string articleFor(const std::string& word) {
    if (word.empty()) return "a";
    switch (std::tolower(static_cast<unsigned char>(word.front()))) {
        case 'a':
        case 'e':
        case 'i':
        case 'o':
        case 'u':
            return "an";
        default:
            return "a";
    }
}

std::string replacePlaceholders(const std::string& text, const std::unordered_map<std::string, std::string>& lookup) {
    if (text.find("{=") == std::string::npos) return text;
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find("{=", pos);
        if (open == std::string::npos) break;
        const auto close = text.find('}', open + 2);
        if (close == std::string::npos) break;
        out.append(text, pos, open - pos);
        auto it = lookup.find(text.substr(open + 2, close - open - 2));
        if (it != lookup.end()) {
            out += it->second;
        } else {
            out.append(text, open, close - open + 1);
        }
        pos = close + 1;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

void resolveInPlace(json& value, const std::unordered_map<std::string, std::string>& lookup) {
    if (value.is_string()) {
        value = replacePlaceholders(value.get<std::string>(), lookup);
    } else if (value.is_array() || value.is_object()) {
        for (auto& child : value) resolveInPlace(child, lookup);
    }
}
}  // namespace

std::string_view damageTypeName(std::string_view code) {
    if (code == "A") return "acid";
    if (code == "B") return "bludgeoning";
    if (code == "C") return "cold";
    if (code == "F") return "fire";
    if (code == "O") return "force";
    if (code == "L") return "lightning";
    if (code == "N") return "necrotic";
    if (code == "P") return "piercing";
    if (code == "I") return "poison";
    if (code == "Y") return "psychic";
    if (code == "R") return "radiant";
    if (code == "S") return "slashing";
    if (code == "T") return "thunder";
    return code;
}

void resolveTemplateVariables(json& blob, const std::string& baseName) {
    if (!blob.is_object()) return;
    std::unordered_map<std::string, std::string> lookup;
    for (const auto& kv : blob.items()) {
        if (!kv.value().is_string()) continue;
        const auto& s = kv.value().get_ref<const std::string&>();
        lookup[kv.key()] = (kv.key() == "dmgType") ? std::string(damageTypeName(s)) : s;
    }
    const std::string clean = withoutQuantity(baseName);
    const std::string article = articleFor(clean);
    lookup["baseName"] = clean;
    lookup["baseName/l"] = toLower(clean);
    lookup["baseName/a"] = article;
    lookup["baseName/at"] = article == "an" ? "An" : "A";
    resolveInPlace(blob, lookup);
}

json mergeBlob(const BaseItem& base, const VariantTemplate& tmpl, const std::string& expandedName,
               const MergeOptions& opts) {
    json blob = base.raw.is_object() ? base.raw : json::object();

    if (tmpl.inherits.fields.is_object()) {
        for (const auto& kv : tmpl.inherits.fields.items()) {
            if (isSkippedInheritKey(kv.key())) continue;
            blob[kv.key()] = kv.value();
        }
        applyPropertyEdits(blob, tmpl.inherits.fields);
    }
    // Typed inherits are authoritative even when the passthrough object lacks them.
    if (!tmpl.inherits.source.empty()) blob["source"] = tmpl.inherits.source;
    if (!tmpl.inherits.rarity.empty()) blob["rarity"] = tmpl.inherits.rarity;
    if (tmpl.inherits.bonusWeapon.has_value()) blob["bonusWeapon"] = *tmpl.inherits.bonusWeapon;
    if (tmpl.inherits.bonusAc.has_value()) blob["bonusAc"] = *tmpl.inherits.bonusAc;

    if (!blob.contains("entries") && !tmpl.entries.is_null()) blob["entries"] = tmpl.entries;

    blob["name"] = expandedName;
    blob["variantOf"] = tmpl.name;
    blob["baseItem"] = base.key();
    blob.erase("_isBaseItem");

    if (opts.resolveTemplateVariables) resolveTemplateVariables(blob, base.name);
    return blob;
}

}  // namespace Catalog::Variants
