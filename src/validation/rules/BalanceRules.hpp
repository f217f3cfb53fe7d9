/**
 * XmlGuard - Balance Rules
 *
 * Statistical outlier detection within level groups.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <vector>

#include "validation/ReferenceIndex.hpp"
#include "validation/ValidationResult.hpp"

namespace xmlguard::rules {

/**
 * Outlier thresholds, as multiples of the group mean
 */
struct BalanceThresholds {
    double high = 1.5;
    double low = 0.5;
    int minGroupSize = 3;
    double suggestedLow = 0.8;
    double suggestedHigh = 1.2;
};

/**
 * Group items (attack, defense), NPCs (hp, attack) and skills (damage) by
 * level and flag members far above or below their group's mean
 *
 * Zero values are never flagged as too low: the attribute is usually just
 * not applicable to that entity.
 */
std::vector<ValidationResult> checkBalance(const DocumentMap& documents,
                                           const ReferenceIndex& index,
                                           const BalanceThresholds& thresholds);

} // namespace xmlguard::rules
