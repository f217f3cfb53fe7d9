/**
 * XmlGuard - Rule Registry Implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "RuleRegistry.hpp"
#include "BalanceRules.hpp"
#include "ExperienceRules.hpp"
#include "OrphanRules.hpp"
#include "ReferenceRules.hpp"

#include <spdlog/spdlog.h>

namespace xmlguard::rules {

std::vector<ValidationRule> defaultRules(const ValidationConfig& config) {
    const double tolerance = config.experienceTolerance;

    BalanceThresholds thresholds;
    thresholds.high = config.balanceHighMultiplier;
    thresholds.low = config.balanceLowMultiplier;
    thresholds.minGroupSize = config.balanceMinGroupSize;
    thresholds.suggestedLow = config.suggestedLowFactor;
    thresholds.suggestedHigh = config.suggestedHighFactor;

    std::vector<ValidationRule> all = {
        {
            "item-drop-consistency",
            "Drop tables only reference items that exist",
            {"item", "drop"},
            checkItemDrops
        },
        {
            "npc-level-consistency",
            "NPC experience matches the experience table for its level",
            {"npc", "exp", "level"},
            [tolerance](const DocumentMap& documents, const ReferenceIndex& index) {
                return checkNpcExperience(documents, index, tolerance);
            },
            npcFilesForExperienceTable
        },
        {
            "skill-learn-consistency",
            "Learn entries only reference skills that exist",
            {"skill", "learn", "class"},
            checkSkillLearns
        },
        {
            "quest-reward-consistency",
            "Quest rewards only reference items that exist",
            {"quest", "item"},
            checkQuestRewards
        },
        {
            "orphaned-data",
            "Items that nothing references",
            {},
            findOrphanedItems
        },
        {
            "balance-check",
            "Stats far from the average of their level",
            {"item", "npc", "skill"},
            [thresholds](const DocumentMap& documents, const ReferenceIndex& index) {
                return checkBalance(documents, index, thresholds);
            }
        },
        {
            "reference-integrity",
            "Primary identifiers are unique within their kind",
            {"item", "npc", "skill", "quest"},
            checkDuplicateIds,
            filesSharingIds
        },
    };

    std::vector<ValidationRule> enabled;
    for (auto& rule : all) {
        if (config.isRuleDisabled(rule.name)) {
            spdlog::info("Rule {} disabled by configuration", rule.name);
            continue;
        }
        enabled.push_back(std::move(rule));
    }
    return enabled;
}

} // namespace xmlguard::rules
