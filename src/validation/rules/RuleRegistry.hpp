/**
 * XmlGuard - Rule Registry
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <vector>

#include "core/config/ValidationConfig.hpp"
#include "validation/ValidationRule.hpp"

namespace xmlguard::rules {

/**
 * The built-in rules, in registration order, minus those disabled in config
 *
 *   item-drop-consistency, npc-level-consistency, skill-learn-consistency,
 *   quest-reward-consistency, orphaned-data, balance-check,
 *   reference-integrity
 */
std::vector<ValidationRule> defaultRules(const ValidationConfig& config);

} // namespace xmlguard::rules
