// Display-name rules for generated variant items.
#pragma once

#include <optional>
#include <string>

#include "VariantTypes.h"

namespace Catalog::Variants {

// prefix + (base name without the first nameRemove occurrence) + suffix.
std::string computeName(const VariantInherits& inherits, const std::string& baseName);

// Returns a reason when the template's naming directives cannot produce distinct names.
std::optional<std::string> validateNaming(const VariantInherits& inherits);

}  // namespace Catalog::Variants
