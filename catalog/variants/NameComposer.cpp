#include "NameComposer.h"

namespace Catalog::Variants {

std::string computeName(const VariantInherits& inherits, const std::string& baseName) {
    std::string stem = baseName;
    if (inherits.nameRemove.has_value() && !inherits.nameRemove->empty()) {
        const auto pos = stem.find(*inherits.nameRemove);
        if (pos != std::string::npos) stem.erase(pos, inherits.nameRemove->size());
    }
    return inherits.namePrefix.value_or("") + stem + inherits.nameSuffix.value_or("");
}

std::optional<std::string> validateNaming(const VariantInherits& inherits) {
    const bool hasPrefix = inherits.namePrefix.has_value() && !inherits.namePrefix->empty();
    const bool hasSuffix = inherits.nameSuffix.has_value() && !inherits.nameSuffix->empty();
    if (!hasPrefix && !hasSuffix) {
        return std::string("no namePrefix or nameSuffix; names would collide with base items");
    }
    return std::nullopt;
}

}  // namespace Catalog::Variants
