/**
 * XmlGuard - Validation Configuration
 *
 * Pool sizes, timeouts and rule thresholds of the validation engine.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <string>
#include <vector>

namespace xmlguard {

/**
 * Validation engine settings
 */
struct ValidationConfig {
    // Worker pools
    int loaderThreads = 8;
    int ruleThreads = 8;

    // Timeouts
    int fileLoadTimeoutMs = 30000;
    int ruleTimeoutMs = 60000;

    // npc-level-consistency
    double experienceTolerance = 0.10;

    // balance-check
    double balanceHighMultiplier = 1.5;
    double balanceLowMultiplier = 0.5;
    int balanceMinGroupSize = 3;
    double suggestedLowFactor = 0.8;
    double suggestedHighFactor = 1.2;

    // Rules left out of the default registry
    std::vector<std::string> disabledRules;

    bool isRuleDisabled(const std::string& name) const;

    // Serialization
    static ValidationConfig fromJson(const std::string& json);
    std::string toJson() const;
};

} // namespace xmlguard
