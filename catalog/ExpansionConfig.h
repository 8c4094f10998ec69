// Tunables for the variant expansion pass.
#pragma once

#include <optional>
#include <string>

namespace Catalog {

struct ExpansionConfig {
    // Matching threads; 0 uses std::thread::hardware_concurrency().
    int workerCount{0};
    // Compare "type"/"property" requirement values without their "|SOURCE" suffix.
    bool stripSourceSuffix{true};
    // Resolve {=bonusWeapon}, {=dmgType}, {=baseName/l}... inside generated blobs.
    bool resolveTemplateVariables{true};
    // Record a warning for every (name, source) produced by more than one pair.
    bool warnOnDuplicates{true};
};

class ExpansionConfigLoader {
public:
    // Missing keys keep their defaults; a missing or malformed file yields nullopt.
    static std::optional<ExpansionConfig> load(const std::string& path);
};

}  // namespace Catalog
