/**
 * XmlGuard - Orphan Rules
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <vector>

#include "validation/ReferenceIndex.hpp"
#include "validation/ValidationResult.hpp"

namespace xmlguard::rules {

/**
 * Items that no drop table, shop or quest reward points at
 *
 * Reported as INFO: unused, not necessarily wrong.
 */
std::vector<ValidationResult> findOrphanedItems(const DocumentMap& documents,
                                                const ReferenceIndex& index);

} // namespace xmlguard::rules
