/**
 * XmlGuard - Validation Config Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ValidationConfig.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace xmlguard {

bool ValidationConfig::isRuleDisabled(const std::string& name) const {
    return std::find(disabledRules.begin(), disabledRules.end(), name) != disabledRules.end();
}

ValidationConfig ValidationConfig::fromJson(const std::string& json) {
    ValidationConfig config;

    try {
        auto j = nlohmann::json::parse(json);

        if (j.contains("loaderThreads")) {
            config.loaderThreads = j["loaderThreads"].get<int>();
        }
        if (j.contains("ruleThreads")) {
            config.ruleThreads = j["ruleThreads"].get<int>();
        }
        if (j.contains("fileLoadTimeoutMs")) {
            config.fileLoadTimeoutMs = j["fileLoadTimeoutMs"].get<int>();
        }
        if (j.contains("ruleTimeoutMs")) {
            config.ruleTimeoutMs = j["ruleTimeoutMs"].get<int>();
        }
        if (j.contains("experienceTolerance")) {
            config.experienceTolerance = j["experienceTolerance"].get<double>();
        }
        if (j.contains("balanceHighMultiplier")) {
            config.balanceHighMultiplier = j["balanceHighMultiplier"].get<double>();
        }
        if (j.contains("balanceLowMultiplier")) {
            config.balanceLowMultiplier = j["balanceLowMultiplier"].get<double>();
        }
        if (j.contains("balanceMinGroupSize")) {
            config.balanceMinGroupSize = j["balanceMinGroupSize"].get<int>();
        }
        if (j.contains("suggestedLowFactor")) {
            config.suggestedLowFactor = j["suggestedLowFactor"].get<double>();
        }
        if (j.contains("suggestedHighFactor")) {
            config.suggestedHighFactor = j["suggestedHighFactor"].get<double>();
        }
        if (j.contains("disabledRules") && j["disabledRules"].is_array()) {
            config.disabledRules = j["disabledRules"].get<std::vector<std::string>>();
        }

    } catch (const std::exception& e) {
        spdlog::warn("Invalid validation config, using defaults: {}", e.what());
        return ValidationConfig{};
    }

    config.loaderThreads = std::max(1, config.loaderThreads);
    config.ruleThreads = std::max(1, config.ruleThreads);

    return config;
}

std::string ValidationConfig::toJson() const {
    nlohmann::json j;

    j["loaderThreads"] = loaderThreads;
    j["ruleThreads"] = ruleThreads;
    j["fileLoadTimeoutMs"] = fileLoadTimeoutMs;
    j["ruleTimeoutMs"] = ruleTimeoutMs;
    j["experienceTolerance"] = experienceTolerance;
    j["balanceHighMultiplier"] = balanceHighMultiplier;
    j["balanceLowMultiplier"] = balanceLowMultiplier;
    j["balanceMinGroupSize"] = balanceMinGroupSize;
    j["suggestedLowFactor"] = suggestedLowFactor;
    j["suggestedHighFactor"] = suggestedHighFactor;
    j["disabledRules"] = disabledRules;

    return j.dump(2);
}

} // namespace xmlguard
