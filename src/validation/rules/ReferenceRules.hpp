/**
 * XmlGuard - Reference Rules
 *
 * Existence checks (every reference must point at a defined entity) and
 * the duplicate identifier check.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <set>
#include <string>
#include <vector>

#include "validation/ReferenceIndex.hpp"
#include "validation/ValidationResult.hpp"

namespace xmlguard::rules {

/**
 * drop@item_id in drop tables must name a defined item
 */
std::vector<ValidationResult> checkItemDrops(const DocumentMap& documents,
                                             const ReferenceIndex& index);

/**
 * learn@skill_id in learn/class files must name a defined skill
 */
std::vector<ValidationResult> checkSkillLearns(const DocumentMap& documents,
                                               const ReferenceIndex& index);

/**
 * reward@item_id in quest files must name a defined item
 */
std::vector<ValidationResult> checkQuestRewards(const DocumentMap& documents,
                                                const ReferenceIndex& index);

/**
 * A primary identifier defined more than once within its entity kind
 * makes every reference to it ambiguous
 */
std::vector<ValidationResult> checkDuplicateIds(const DocumentMap& documents,
                                                const ReferenceIndex& index);

/**
 * Other documents defining an identifier that changedKey also defines
 */
std::set<std::string> filesSharingIds(const std::string& changedKey,
                                      const DocumentMap& documents,
                                      const ReferenceIndex& index);

} // namespace xmlguard::rules
