// Decoders from compendium JSON into the typed variant model.
#include "VariantTypes.h"

#include <filesystem>
#include <fstream>

#include "../../engine/core/Logger.h"

namespace Catalog::Variants {

using nlohmann::json;

namespace {
enum class KeyKind { Flag, Text, Other };

KeyKind classifyKey(const std::string& key) {
    if (parseItemFlagKey(key).has_value()) return KeyKind::Flag;
    if (key == "type" || key == "property" || key == "name" || key == "source" || key == "weaponCategory" ||
        key == "weapon_category" || key == "dmgType" || key == "dmg_type" || key == "scfType" ||
        key == "scf_type" || key == "dmg1") {
        return KeyKind::Text;
    }
    return KeyKind::Other;
}

std::string shapeName(const json& v) {
    if (v.is_null()) return "null";
    if (v.is_object()) return "object";
    if (v.is_array()) return "list";
    if (v.is_string()) return "string";
    if (v.is_boolean()) return "boolean";
    if (v.is_number()) return "number";
    return "unknown";
}

RequirementValue decodeValue(const json& v) {
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) return v.get<std::string>();
    if (v.is_array()) {
        std::vector<std::string> items;
        items.reserve(v.size());
        for (const auto& e : v) {
            if (!e.is_string()) return UnsupportedValue{"list with " + shapeName(e) + " element"};
            items.push_back(e.get<std::string>());
        }
        return items;
    }
    return UnsupportedValue{shapeName(v)};
}

// Decodes one clause and checks that the value shape suits the key.
RequirementClause decodeClause(const std::string& key, const json& v, const std::string& where,
                               VariantTemplate& out) {
    RequirementClause clause{key, decodeValue(v)};
    std::string problem;
    if (const auto* bad = std::get_if<UnsupportedValue>(&clause.value)) {
        problem = bad->shape;
    } else {
        switch (classifyKey(key)) {
            case KeyKind::Flag:
                if (!std::holds_alternative<bool>(clause.value)) problem = shapeName(v);
                break;
            case KeyKind::Text:
                if (!std::holds_alternative<std::string>(clause.value) &&
                    !std::holds_alternative<std::vector<std::string>>(clause.value)) {
                    problem = shapeName(v);
                }
                break;
            case KeyKind::Other:
                break;
        }
        if (!problem.empty()) clause.value = UnsupportedValue{problem};
    }
    if (!problem.empty()) {
        out.issues.push_back({IssueKind::MatchEvaluation, out.name,
                              where + " key '" + key + "' has unexpected " + problem + " value"});
    }
    return clause;
}

std::optional<std::string> optionalString(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

const json* findArray(const json& doc, std::initializer_list<const char*> keys) {
    if (doc.is_array()) return &doc;
    if (!doc.is_object()) return nullptr;
    for (const char* key : keys) {
        auto it = doc.find(key);
        if (it != doc.end() && it->is_array()) return &*it;
    }
    return nullptr;
}

std::optional<json> readJsonFile(const std::string& path) {
    if (!std::filesystem::exists(path)) return std::nullopt;
    std::ifstream f(path);
    if (!f.is_open()) return std::nullopt;
    try {
        json j;
        f >> j;
        return j;
    } catch (const json::exception& e) {
        Engine::logError("Failed to parse " + path + ": " + e.what());
        return std::nullopt;
    }
}
}  // namespace

std::optional<BaseItem> decodeBaseItem(const json& j) {
    if (!j.is_object()) return std::nullopt;
    BaseItem item{};
    item.name = optionalString(j, "name").value_or("");
    item.source = optionalString(j, "source").value_or("");
    if (item.name.empty() || item.source.empty()) return std::nullopt;

    if (j.contains("type") && j["type"].is_string()) {
        item.typeCode = std::string(stripSourceSuffix(j["type"].get<std::string>()));
    }
    item.weaponCategory = optionalString(j, "weaponCategory").value_or("");
    for (std::size_t i = 0; i < kItemFlagCount; ++i) {
        const auto key = std::string(itemFlagKey(static_cast<ItemFlag>(i)));
        auto it = j.find(key);
        item.flags[i] = it != j.end() && it->is_boolean() && it->get<bool>();
    }
    item.dmg1 = optionalString(j, "dmg1").value_or("");
    item.dmgType = optionalString(j, "dmgType").value_or("");
    item.scfType = optionalString(j, "scfType").value_or("");
    if (j.contains("weight") && j["weight"].is_number()) item.weight = j["weight"].get<double>();
    if (j.contains("property") && j["property"].is_array()) {
        for (const auto& p : j["property"]) {
            if (p.is_string()) {
                item.properties.push_back(p.get<std::string>());
            } else if (p.is_object() && p.contains("uid") && p["uid"].is_string()) {
                item.properties.push_back(p["uid"].get<std::string>());
            }
        }
    }
    item.raw = j;
    return item;
}

VariantTemplate decodeVariantTemplate(const json& j) {
    VariantTemplate t{};
    if (!j.is_object()) {
        t.name = "<unnamed>";
        t.issues.push_back({IssueKind::TemplateValidation, t.name, "entry is not an object"});
        return t;
    }
    t.name = optionalString(j, "name").value_or("");
    if (t.name.empty()) {
        t.name = "<unnamed>";
        t.issues.push_back({IssueKind::TemplateValidation, t.name, "missing name"});
    }

    auto req = j.find("requires");
    if (req == j.end() || !req->is_array() || req->empty()) {
        t.issues.push_back({IssueKind::TemplateValidation, t.name, "missing or empty requires list"});
    } else {
        std::size_t idx = 0;
        for (const auto& r : *req) {
            const std::string where = "requires[" + std::to_string(idx++) + "]";
            if (!r.is_object()) {
                t.issues.push_back({IssueKind::TemplateValidation, t.name, where + " is not an object"});
                continue;
            }
            if (r.empty()) {
                t.issues.push_back({IssueKind::TemplateValidation, t.name, where + " is empty"});
                continue;
            }
            Requirement requirement{};
            for (const auto& kv : r.items()) {
                requirement.clauses.push_back(decodeClause(kv.key(), kv.value(), where, t));
            }
            t.requirements.push_back(std::move(requirement));
        }
    }

    if (j.contains("excludes")) {
        const auto& ex = j["excludes"];
        if (ex.is_object()) {
            for (const auto& kv : ex.items()) {
                RequirementClause clause{kv.key(), decodeValue(kv.value())};
                if (std::holds_alternative<double>(clause.value)) {
                    clause.value = UnsupportedValue{"number"};
                }
                if (const auto* bad = std::get_if<UnsupportedValue>(&clause.value)) {
                    t.issues.push_back({IssueKind::MatchEvaluation, t.name,
                                        "excludes key '" + kv.key() + "' has unexpected " + bad->shape + " value"});
                }
                t.excludes.push_back(std::move(clause));
            }
        } else if (!ex.is_null()) {
            t.issues.push_back({IssueKind::MatchEvaluation, t.name, "excludes is a " + shapeName(ex) + ", ignored"});
        }
    }

    auto inh = j.find("inherits");
    if (inh == j.end() || !inh->is_object()) {
        t.issues.push_back({IssueKind::TemplateValidation, t.name, "missing inherits"});
    } else {
        t.inherits.fields = *inh;
        t.inherits.namePrefix = optionalString(*inh, "namePrefix");
        t.inherits.nameSuffix = optionalString(*inh, "nameSuffix");
        t.inherits.nameRemove = optionalString(*inh, "nameRemove");
        t.inherits.source = optionalString(*inh, "source").value_or("");
        t.inherits.rarity = optionalString(*inh, "rarity").value_or("");
        t.inherits.bonusWeapon = optionalString(*inh, "bonusWeapon");
        t.inherits.bonusAc = optionalString(*inh, "bonusAc");
    }

    if (j.contains("entries")) t.entries = j["entries"];
    return t;
}

std::vector<BaseItem> decodeBaseItems(const json& doc) {
    std::vector<BaseItem> out;
    const json* arr = findArray(doc, {"baseitem", "item"});
    if (!arr) return out;
    out.reserve(arr->size());
    for (const auto& entry : *arr) {
        auto item = decodeBaseItem(entry);
        if (!item.has_value()) {
            Engine::logWarn("Skipping base item without name or source");
            continue;
        }
        out.push_back(std::move(*item));
    }
    return out;
}

std::vector<VariantTemplate> decodeVariantTemplates(const json& doc) {
    std::vector<VariantTemplate> out;
    const json* arr = findArray(doc, {"magicvariant", "variant"});
    if (!arr) return out;
    out.reserve(arr->size());
    for (const auto& entry : *arr) out.push_back(decodeVariantTemplate(entry));
    return out;
}

std::vector<BaseItem> loadBaseItems(const std::string& path) {
    auto doc = readJsonFile(path);
    if (!doc.has_value()) return {};
    return decodeBaseItems(*doc);
}

std::vector<VariantTemplate> loadVariantTemplates(const std::string& path) {
    auto doc = readJsonFile(path);
    if (!doc.has_value()) return {};
    return decodeVariantTemplates(*doc);
}

}  // namespace Catalog::Variants
