// Builds the stored JSON blob of a generated item from its base item and template.
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "VariantTypes.h"

namespace Catalog::Variants {

struct MergeOptions {
    bool resolveTemplateVariables{true};
};

// Clone of the base blob, overlaid with the template's inherits (naming-only keys
// and loot metadata excluded), with propertyAdd/propertyRemove applied to
// "property", renamed and stamped with variantOf/baseItem.
nlohmann::json mergeBlob(const BaseItem& base, const VariantTemplate& tmpl, const std::string& expandedName,
                         const MergeOptions& opts = {});

// Replaces {=key} in every string of the blob with the blob's own top-level string
// field, plus {=baseName}, {=baseName/l}, {=baseName/a} and {=baseName/at}.
void resolveTemplateVariables(nlohmann::json& blob, const std::string& baseName);

// "S" -> "slashing"; unknown codes come back unchanged.
std::string_view damageTypeName(std::string_view code);

}  // namespace Catalog::Variants
