/**
 * XmlGuard - Experience Rules
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "validation/ReferenceIndex.hpp"
#include "validation/ValidationResult.hpp"

namespace xmlguard::rules {

/**
 * Experience per level from <level num="" exp=""/> entries in files whose
 * name contains "exp" or "level"
 */
std::map<int, long long> loadExperienceTable(const DocumentMap& documents);

/**
 * NPCs whose exp deviates from the experience table entry of their level
 * by more than tolerance (a fraction of the expected value)
 */
std::vector<ValidationResult> checkNpcExperience(const DocumentMap& documents,
                                                 const ReferenceIndex& index,
                                                 double tolerance);

/**
 * NPC documents whose level lookups go through the experience table, when
 * changedKey is an experience table document; empty otherwise
 */
std::set<std::string> npcFilesForExperienceTable(const std::string& changedKey,
                                                 const DocumentMap& documents,
                                                 const ReferenceIndex& index);

} // namespace xmlguard::rules
