#include "ExpansionConfig.h"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

#include "../engine/core/Logger.h"

namespace Catalog {

std::optional<ExpansionConfig> ExpansionConfigLoader::load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        Engine::logWarn("Ignoring malformed expansion config " + path + ": " + e.what());
        return std::nullopt;
    }
    if (!j.is_object()) {
        return std::nullopt;
    }

    ExpansionConfig config{};
    if (j.contains("workerCount") && j["workerCount"].is_number_integer()) {
        config.workerCount = std::max(0, j["workerCount"].get<int>());
    }
    if (j.contains("stripSourceSuffix") && j["stripSourceSuffix"].is_boolean()) {
        config.stripSourceSuffix = j["stripSourceSuffix"].get<bool>();
    }
    if (j.contains("resolveTemplateVariables") && j["resolveTemplateVariables"].is_boolean()) {
        config.resolveTemplateVariables = j["resolveTemplateVariables"].get<bool>();
    }
    if (j.contains("warnOnDuplicates") && j["warnOnDuplicates"].is_boolean()) {
        config.warnOnDuplicates = j["warnOnDuplicates"].get<bool>();
    }

    return config;
}

}  // namespace Catalog
